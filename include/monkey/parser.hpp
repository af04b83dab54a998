#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "ast.hpp"
#include "lexer.hpp"
#include "precedence.hpp"
#include "token.hpp"


inline namespace monkey {

inline namespace parse {

enum class ParseErrorKind {
    UNEXPECTED_TOKEN,
};

constexpr const char* stringify(const ParseErrorKind kind) noexcept {
    switch (kind) {
        case ParseErrorKind::UNEXPECTED_TOKEN: return "Unexpected Token";
    }

    return "<UNNAMED>";
}


struct ParseError {
    ParseErrorKind kind;
    TokenKind expected;
    Token found;
    std::string message;
};

inline std::ostream& operator<<(std::ostream& os, const ParseError& err) {
    return os << stringify(err.kind) << ": " << err.message;
}


class Parser {
    Lexer lexer;

    Token current{TokenKind::END, ""};
    Token peek   {TokenKind::END, ""};

    std::vector<ParseError> errs;

public:

    explicit Parser(Lexer l) : lexer{std::move(l)} {
        // fills both current and peek
        advance();
        advance();
    }


    [[nodiscard]] const std::vector<ParseError>& errors() const noexcept { return errs; }


    // a statement that fails to parse is dropped and parsing carries on with the next token
    Program parseProgram() {
        Program program;

        while (current.kind != TokenKind::END) {
            if (auto statement = parseStatement()) program.push_back(std::move(statement));

            advance();
        }

        return program;
    }


    stmt::StmtPtr parseStatement() {
        switch (current.kind) {
            using enum TokenKind;

            case LET:    return let();
            case RETURN: return ret();
            default:     return expressionStatement();
        }
    }


    expr::ExprPtr parseExpr(const prec::Precedence precedence = prec::Precedence::LOWEST) {
        expr::ExprPtr left = prefix();
        if (not left) return nullptr;

        while (peek.kind != TokenKind::SEMI and precedence < prec::precedenceOf(peek.kind)) {
            switch (peek.kind) {
                using enum TokenKind;

                case PLUS:
                case MINUS:
                case ASTERISK:
                case SLASH:
                case EQ:
                case NOT_EQ:
                case LT:
                case LT_EQ:
                case GT:
                case GT_EQ:
                    advance();
                    left = infix(std::move(left));
                    break;

                case L_PAREN:
                    advance();
                    left = call(std::move(left));
                    break;

                default: return left;
            }

            if (not left) return nullptr;
        }

        return left;
    }

private:

    void advance() {
        current = std::move(peek);
        peek = lexer.next();
    }

    // moves onto the next token only when it's the expected one. Records an error otherwise
    [[nodiscard]] bool expectPeek(const TokenKind exp) {
        if (peek.kind == exp) {
            advance();
            return true;
        }

        expected(exp);
        return false;
    }

    void expected(const TokenKind exp) {
        errs.push_back({
            ParseErrorKind::UNEXPECTED_TOKEN,
            exp,
            peek,
            std::string{"expected next token to be "} + stringify(exp) + ", got " + describe(peek) + " instead"
        });
    }

    // INT(5), NAME(x), END
    static std::string describe(const Token& token) {
        std::string s = stringify(token.kind);

        if (not token.text.empty()) s += '(' + token.text + ')';

        return s;
    }

    void skipSemi() {
        if (peek.kind == TokenKind::SEMI) advance();
    }


    stmt::StmtPtr let() {
        if (not expectPeek(TokenKind::NAME)) return nullptr;

        expr::Identifier name{current.text};

        if (not expectPeek(TokenKind::ASSIGN)) return nullptr;

        advance();

        auto value = parseExpr();
        if (not value) return nullptr;

        skipSemi();

        return std::make_shared<stmt::Let>(std::move(name), std::move(value));
    }

    stmt::StmtPtr ret() {
        advance();

        auto value = parseExpr();
        if (not value) return nullptr;

        skipSemi();

        return std::make_shared<stmt::Return>(std::move(value));
    }

    stmt::StmtPtr expressionStatement() {
        auto expr = parseExpr();
        if (not expr) return nullptr;

        skipSemi();

        return std::make_shared<stmt::Expression>(std::move(expr));
    }

    // '{' is current. Stops on the matching '}', or at the end of input if it never shows up
    stmt::BlockPtr block() {
        advance();

        std::vector<stmt::StmtPtr> statements;

        while (current.kind != TokenKind::R_BRACE and current.kind != TokenKind::END) {
            if (auto statement = parseStatement()) statements.push_back(std::move(statement));

            advance();
        }

        return std::make_shared<const stmt::Block>(std::move(statements));
    }


    expr::ExprPtr prefix() {
        switch (current.kind) {
            using enum TokenKind;

            case NAME: return std::make_shared<expr::Identifier>(current.text);
            case INT : return std::make_shared<expr::Int>(current.value);
            case BOOL: return std::make_shared<expr::Bool>(current.text == "true");

            case BANG:
            case MINUS: {
                auto op = current.text;
                advance();

                auto operand = parseExpr(prec::Precedence::PREFIX);
                if (not operand) return nullptr;

                return std::make_shared<expr::Prefix>(std::move(op), std::move(operand));
            }

            // just a grouping `(x)`
            case L_PAREN: {
                advance();

                auto expr = parseExpr();
                if (not expr or not expectPeek(R_PAREN)) return nullptr;

                return expr;
            }

            case IF:       return conditional();
            case FUNCTION: return function();

            // no prefix rule for this token
            default: return nullptr;
        }
    }


    // the operator is current
    expr::ExprPtr infix(expr::ExprPtr left) {
        auto op = current.text;
        const auto precedence = prec::precedenceOf(current.kind);

        advance();

        // same precedence on the right keeps equal operators left associative
        auto right = parseExpr(precedence);
        if (not right) return nullptr;

        return std::make_shared<expr::Infix>(std::move(left), std::move(op), std::move(right));
    }


    // '(' is current
    expr::ExprPtr call(expr::ExprPtr callee) {
        std::vector<expr::ExprPtr> args;

        if (peek.kind == TokenKind::R_PAREN) {
            advance();
            return std::make_shared<expr::Call>(std::move(callee), std::move(args));
        }

        advance();

        auto arg = parseExpr();
        if (not arg) return nullptr;
        args.push_back(std::move(arg));

        while (peek.kind == TokenKind::COMMA) {
            advance();
            advance();

            arg = parseExpr();
            if (not arg) return nullptr;
            args.push_back(std::move(arg));
        }

        if (not expectPeek(TokenKind::R_PAREN)) return nullptr;

        return std::make_shared<expr::Call>(std::move(callee), std::move(args));
    }


    expr::ExprPtr conditional() {
        using enum TokenKind;

        if (not expectPeek(L_PAREN)) return nullptr;

        advance();

        auto condition = parseExpr();
        if (not condition) return nullptr;

        if (not expectPeek(R_PAREN) or not expectPeek(L_BRACE)) return nullptr;

        auto consequence = block();
        stmt::BlockPtr alternative;

        if (peek.kind == ELSE) {
            advance();

            if (not expectPeek(L_BRACE)) return nullptr;

            alternative = block();
        }

        return std::make_shared<expr::If>(std::move(condition), std::move(consequence), std::move(alternative));
    }


    expr::ExprPtr function() {
        using enum TokenKind;

        if (not expectPeek(L_PAREN)) return nullptr;

        std::vector<expr::Identifier> params;

        if (peek.kind == R_PAREN) advance();
        else {
            if (not expectPeek(NAME)) return nullptr;
            params.emplace_back(current.text);

            while (peek.kind == COMMA) {
                advance();

                if (not expectPeek(NAME)) return nullptr;
                params.emplace_back(current.text);
            }

            if (not expectPeek(R_PAREN)) return nullptr;
        }

        if (not expectPeek(L_BRACE)) return nullptr;

        return std::make_shared<expr::Function>(std::move(params), block());
    }
};

} // namespace parse
} // namespace monkey
