#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>


inline namespace monkey {

enum class TokenKind {
    END,
    ILLEGAL,

    NAME,
    INT,
    BOOL,

// Operators
    ASSIGN,
    PLUS,
    MINUS,
    BANG,
    ASTERISK,
    SLASH,

    EQ,
    NOT_EQ,
    LT,
    LT_EQ,
    GT,
    GT_EQ,

// Delimiters
    COMMA,
    SEMI,

    L_PAREN,
    R_PAREN,
    L_BRACE,
    R_BRACE,

// Keywords
    FUNCTION,
    LET,
    IF,
    ELSE,
    RETURN,
};


constexpr const char* stringify(const TokenKind token) noexcept {
    switch (token) {
        using enum TokenKind;
        case END:       return "END";
        case ILLEGAL:   return "ILLEGAL";
        case NAME:      return "NAME";
        case INT:       return "INT";
        case BOOL:      return "BOOL";

        // operators
        case ASSIGN:    return "ASSIGN";
        case PLUS:      return "PLUS";
        case MINUS:     return "MINUS";
        case BANG:      return "BANG";
        case ASTERISK:  return "ASTERISK";
        case SLASH:     return "SLASH";
        case EQ:        return "EQ";
        case NOT_EQ:    return "NOT_EQ";
        case LT:        return "LT";
        case LT_EQ:     return "LT_EQ";
        case GT:        return "GT";
        case GT_EQ:     return "GT_EQ";

        // punctuation
        case COMMA  :   return "COMMA";
        case SEMI   :   return "SEMI";
        case L_PAREN:   return "L_PAREN";
        case R_PAREN:   return "R_PAREN";
        case L_BRACE:   return "L_BRACE";
        case R_BRACE:   return "R_BRACE";

        // keywords
        case FUNCTION:  return "FUNCTION";
        case LET:       return "LET";
        case IF:        return "IF";
        case ELSE:      return "ELSE";
        case RETURN:    return "RETURN";
    }

    return "<UNNAMED>";
}


struct Token {
    TokenKind kind;
    std::string text;
    std::int64_t value{}; // only meaningful for INT

    bool operator==(const Token&) const = default;
};

using Tokens = std::vector<Token>;


inline std::ostream& operator<<(std::ostream& os, const Token& token) {
    return os << "Token{" << stringify(token.kind) << ", '" << token.text << "'}";
}

inline std::ostream& operator<<(std::ostream& os, const Tokens& tokens) {
    os << '[';

    const char* comma = "";
    for (const auto& token : tokens) {
        os << comma << token;
        comma = ", ";
    }

    return os << ']';
}

} // namespace monkey
