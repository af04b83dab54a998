#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "declarations.hpp"


inline namespace monkey {

namespace stmt {

struct Block {
    std::vector<StmtPtr> statements;

    explicit Block(std::vector<StmtPtr> s) noexcept : statements{std::move(s)} {}


    std::string stringify(const size_t indent = 0) const {
        if (statements.empty()) return "{ }";

        std::string s = "{\n";

        for (const std::string space(indent + 4, ' '); const auto& statement : statements)
            s += space + statement->stringify(indent + 4) + '\n';

        return s + std::string(indent, ' ') + "}";
    }
};

} // namespace stmt


namespace expr {

struct Identifier : Expr {
    std::string name;

    explicit Identifier(std::string n) noexcept : name{std::move(n)} {}

    std::string stringify(const size_t = 0) const override { return name; }

    Node variant() const override { return this; }
};


struct Int : Expr {
    std::int64_t value;

    explicit Int(const std::int64_t v) noexcept : value{v} {}

    std::string stringify(const size_t = 0) const override { return std::to_string(value); }

    Node variant() const override { return this; }
};


struct Bool : Expr {
    bool boo;

    explicit Bool(const bool b) noexcept : boo{b} {}

    std::string stringify(const size_t = 0) const override { return boo ? "true" : "false"; }

    Node variant() const override { return this; }
};


struct Prefix : Expr {
    std::string op;
    ExprPtr operand;

    Prefix(std::string o, ExprPtr e) noexcept
    : op{std::move(o)}, operand{std::move(e)}
    {}

    std::string stringify(const size_t indent = 0) const override {
        return '(' + op + operand->stringify(indent) + ')';
    }

    Node variant() const override { return this; }
};


struct Infix : Expr {
    ExprPtr lhs;
    std::string op;
    ExprPtr rhs;

    Infix(ExprPtr e1, std::string o, ExprPtr e2) noexcept
    : lhs{std::move(e1)}, op{std::move(o)}, rhs{std::move(e2)}
    {}

    std::string stringify(const size_t indent = 0) const override {
        return '(' + lhs->stringify(indent) + ' ' + op + ' ' + rhs->stringify(indent) + ')';
    }

    Node variant() const override { return this; }
};


struct If : Expr {
    ExprPtr condition;
    stmt::BlockPtr consequence;
    stmt::BlockPtr alternative; // null when there is no else

    If(ExprPtr c, stmt::BlockPtr thn, stmt::BlockPtr els) noexcept
    : condition{std::move(c)}, consequence{std::move(thn)}, alternative{std::move(els)}
    {}

    std::string stringify(const size_t indent = 0) const override {
        std::string s = "if " + condition->stringify(indent) + ' ' + consequence->stringify(indent);

        if (alternative) s += " else " + alternative->stringify(indent);

        return s;
    }

    Node variant() const override { return this; }
};


struct Function : Expr {
    std::vector<Identifier> params;
    stmt::BlockPtr body;

    Function(std::vector<Identifier> ps, stmt::BlockPtr b) noexcept
    : params{std::move(ps)}, body{std::move(b)}
    {}

    std::string stringify(const size_t indent = 0) const override {
        std::string s = "fn(";

        for (std::string_view comma = ""; const auto& param : params) {
            s += comma;
            s += param.name;
            comma = ", ";
        }

        return s + ") " + body->stringify(indent);
    }

    Node variant() const override { return this; }
};


struct Call : Expr {
    ExprPtr func;
    std::vector<ExprPtr> args;

    Call(ExprPtr function, std::vector<ExprPtr> a) noexcept
    : func{std::move(function)}, args{std::move(a)}
    {}

    std::string stringify(const size_t indent = 0) const override {
        std::string s = func->stringify(indent) + '(';

        for (std::string_view comma = ""; const auto& arg : args) {
            s += comma;
            s += arg->stringify(indent);
            comma = ", ";
        }

        return s + ')';
    }

    Node variant() const override { return this; }
};

} // namespace expr


namespace stmt {

struct Let : Stmt {
    expr::Identifier name;
    expr::ExprPtr value;

    Let(expr::Identifier n, expr::ExprPtr v) noexcept
    : name{std::move(n)}, value{std::move(v)}
    {}

    std::string stringify(const size_t indent = 0) const override {
        return "let " + name.stringify() + " = " + value->stringify(indent) + ';';
    }

    Node variant() const override { return this; }
};


struct Return : Stmt {
    expr::ExprPtr value;

    explicit Return(expr::ExprPtr v) noexcept : value{std::move(v)} {}

    std::string stringify(const size_t indent = 0) const override {
        return "return " + value->stringify(indent) + ';';
    }

    Node variant() const override { return this; }
};


struct Expression : Stmt {
    expr::ExprPtr expr;

    explicit Expression(expr::ExprPtr e) noexcept : expr{std::move(e)} {}

    std::string stringify(const size_t indent = 0) const override { return expr->stringify(indent); }

    Node variant() const override { return this; }
};

} // namespace stmt


inline std::string stringify(const Program& program) {
    std::string s;

    for (std::string_view newline = ""; const auto& statement : program) {
        s += newline;
        s += statement->stringify();
        newline = "\n";
    }

    return s;
}

} // namespace monkey
