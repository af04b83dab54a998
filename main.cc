#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "monkey/evaluator.hpp"
#include "monkey/lexer.hpp"
#include "monkey/parser.hpp"
#include "monkey/repl.hpp"
#include "monkey/utils/utils.hpp"



[[nodiscard]] inline std::string readFile(const std::string& fname) {
    const std::ifstream fin{fname};

    if (not fin.is_open()) error("File \"" + fname + "\" not found!");

    std::stringstream ss;
    ss << fin.rdbuf();

    return ss.str();
}


int runFile(const std::string& fname, const bool print_tokens, const bool print_parsed, const bool print_env, const bool run) {
    auto src = readFile(fname);

    if (print_tokens) std::clog << lex(src) << '\n';


    Parser p{Lexer{std::move(src)}};

    const Program program = p.parseProgram();

    if (print_parsed) std::clog << stringify(program) << '\n';

    if (not p.errors().empty()) {
        for (const auto& err : p.errors()) std::cerr << fname << ": " << err << '\n';
        return 1;
    }

    if (not run) return 0;


    Evaluator evaluator;
    const auto result = evaluator.eval(program);

    if (print_env) std::clog << *evaluator.environment();

    if (not result) return 0;

    if (isError(*result)) {
        std::cerr << fname << ": " << *result << '\n';
        return 1;
    }

    std::cout << *result << '\n';
    return 0;
}


int main(int argc, char *argv[]) try {
    using std::operator""sv;

    bool print_tokens{};
    bool print_parsed{};
    bool print_env{};
    bool run = true;

    std::string fname;

    for (int i = 1; i < argc; ++i) {
             if (argv[i] == "-token"sv) print_tokens = true;
        else if (argv[i] == "-ast"sv)   print_parsed = true;
        else if (argv[i] == "-env"sv)   print_env    = true;
        else if (argv[i] == "-run"sv)   run          = false;
        else if (argv[i][0] == '-')     error("Unknown flag \"" + std::string{argv[i]} + "\"!");
        else if (fname.empty())         fname = argv[i];
        else error("Please pass only one file name!");
    }


    if (fname.empty()) {
        Repl repl;
        repl.run(std::cin, std::cout);
        return 0;
    }

    return runFile(fname, print_tokens, print_parsed, print_env, run);
}
catch (const std::runtime_error&) {
    // error() already reported it
    return 1;
}
catch (const std::exception& e) {
    std::cerr << "\033[31merror:\033[0m " << e.what() << std::endl;
    return 1;
}
