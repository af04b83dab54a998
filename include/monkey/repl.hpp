#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"


inline namespace monkey {

struct LineResult {
    std::vector<ParseError> errors; // when not empty, the line wasn't evaluated
    Result value;
};


// a line-at-a-time session. Bindings from earlier lines stay visible to later ones
class Repl {
    Evaluator evaluator;

public:
    static constexpr const char* prompt = ">> ";


    LineResult evaluate(std::string line) {
        Parser parser{Lexer{std::move(line)}};

        const Program program = parser.parseProgram();

        if (not parser.errors().empty()) return {parser.errors(), {}};

        return {{}, evaluator.eval(program)};
    }


    [[nodiscard]] const Environment& environment() const noexcept { return *evaluator.environment(); }


    void run(std::istream& in, std::ostream& out) {
        out << "Hello! This is the Monkey programming language!\n"
            << "Feel free to type in commands\n\n";

        std::string line;

        while (out << prompt << std::flush and std::getline(in, line)) {
            const auto [errors, value] = evaluate(std::move(line));

            for (const auto& err : errors) out << err << '\n';

            if (value) out << *value << "\n\n";
        }

        out << std::endl;
    }
};

} // namespace monkey
