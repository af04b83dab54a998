#pragma once

#include "token.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>


inline namespace monkey {

inline TokenKind keyword(const std::string_view word) noexcept {
    using enum TokenKind;
         if (word == "fn"    ) return FUNCTION;
    else if (word == "let"   ) return LET;
    else if (word == "if"    ) return IF;
    else if (word == "else"  ) return ELSE;
    else if (word == "return") return RETURN;

    else if (word == "true"  ) return BOOL;
    else if (word == "false" ) return BOOL;

    return NAME;
}


inline bool validNameStart(const char c) noexcept { return std::isalpha(static_cast<unsigned char>(c)) or c == '_'; }
inline bool validNameChar (const char c) noexcept { return std::isalnum(static_cast<unsigned char>(c)) or c == '_'; }


// hands out one token per call. Once END was returned it keeps returning END
class Lexer {
    std::string src;
    size_t index{};

public:
    explicit Lexer(std::string source) noexcept : src{std::move(source)} {}


    Token next() {
        skipWhitespace();

        if (index >= src.length()) return {TokenKind::END, ""};

        switch (const char c = src[index]) {
            using enum TokenKind;

            #pragma GCC diagnostic push
            #pragma GCC diagnostic ignored "-Wpedantic"
            case '0' ... '9':
            #pragma GCC diagnostic pop
                return number();

            case '=': return twoChar('=', EQ    , ASSIGN);
            case '!': return twoChar('=', NOT_EQ, BANG  );
            case '<': return twoChar('=', LT_EQ , LT    );
            case '>': return twoChar('=', GT_EQ , GT    );

            case '+': return single(PLUS);
            case '-': return single(MINUS);
            case '*': return single(ASTERISK);
            case '/': return single(SLASH);

            case ',': return single(COMMA);
            case ';': return single(SEMI);
            case '(': return single(L_PAREN);
            case ')': return single(R_PAREN);
            case '{': return single(L_BRACE);
            case '}': return single(R_BRACE);

            default:
                if (validNameStart(c)) return name();

                return single(ILLEGAL);
        }
    }

private:
    void skipWhitespace() noexcept {
        while (index < src.length() and std::isspace(static_cast<unsigned char>(src[index]))) ++index;
    }

    [[nodiscard]] char peekChar() const noexcept {
        return index + 1 < src.length() ? src[index + 1] : '\0';
    }

    Token single(const TokenKind kind) {
        return {kind, {src[index++]}};
    }

    // `first` followed by `second`? otherwise fall back to the one char token
    Token twoChar(const char second, const TokenKind both, const TokenKind one) {
        if (peekChar() != second) return single(one);

        Token token{both, src.substr(index, 2)};
        index += 2;
        return token;
    }

    Token name() {
        const auto beginning = index;
        while (index < src.length() and validNameChar(src[index])) ++index;

        auto word = src.substr(beginning, index - beginning);
        const TokenKind kind = keyword(word);

        return {kind, std::move(word)};
    }

    Token number() {
        const auto beginning = index;
        while (index < src.length() and std::isdigit(static_cast<unsigned char>(src[index]))) ++index;

        auto digits = src.substr(beginning, index - beginning);

        std::int64_t value{};
        const auto [_, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);

        // doesn't fit in 64 bits
        if (ec != std::errc{}) return {TokenKind::ILLEGAL, std::move(digits)};

        return {TokenKind::INT, std::move(digits), value};
    }
};


[[nodiscard]] inline Tokens lex(std::string src) {
    Lexer lexer{std::move(src)};

    Tokens tokens;
    do tokens.push_back(lexer.next()); while (tokens.back().kind != TokenKind::END);

    return tokens;
}

} // namespace monkey
