#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "environment.hpp"
#include "object.hpp"
#include "utils/utils.hpp"


inline namespace monkey {

// an empty result means "no value", e.g. an `if` without `else` whose condition was falsy
using Result = std::optional<Object>;


class Evaluator {
    std::shared_ptr<Environment> env; // the active scope, swapped for the duration of a call

public:
    explicit Evaluator(std::shared_ptr<Environment> e = std::make_shared<Environment>()) noexcept
    : env{std::move(e)} {}


    [[nodiscard]] const std::shared_ptr<Environment>& environment() const noexcept { return env; }


    // the only place a ReturnValue gets unwrapped, calls and blocks pass it through
    Result eval(const Program& program) {
        Result result;

        for (const auto& statement : program) {
            result = std::visit(*this, statement->variant());

            if (result and isReturn(*result)) return std::get<ReturnValue>(*result).boxed->value;
            if (result and isError (*result)) return result;
        }

        return result;
    }

    // ReturnValue and Error stop the block and are handed up as is
    Result evalBlock(const stmt::Block& block) {
        Result result;

        for (const auto& statement : block.statements) {
            result = std::visit(*this, statement->variant());

            if (result and (isReturn(*result) or isError(*result))) return result;
        }

        return result;
    }


    Result operator()(const stmt::Let *let) {
        auto value = std::visit(*this, let->value->variant());

        // nothing to bind
        if (not value or isError(*value)) return value;

        env->set(let->name.name, std::move(*value));
        return {};
    }

    Result operator()(const stmt::Return *ret) {
        auto value = std::visit(*this, ret->value->variant());

        if (not value or isError(*value)) return value;

        return makeReturn(std::move(*value));
    }

    Result operator()(const stmt::Expression *e) {
        return std::visit(*this, e->expr->variant());
    }


    Result operator()(const expr::Identifier *id) {
        if (auto value = env->get(id->name)) return value;

        return Error{"identifier not found: " + id->name};
    }

    Result operator()(const expr::Int *i) { return Object{i->value}; }

    Result operator()(const expr::Bool *b) { return Object{b->boo}; }


    Result operator()(const expr::Prefix *p) {
        auto operand = std::visit(*this, p->operand->variant());

        if (not operand or isError(*operand)) return operand;

        if (p->op == "!") return Object{not isTruthy(*operand)};

        if (p->op == "-") {
            if (not std::holds_alternative<std::int64_t>(*operand))
                return Error{"unknown operator: -" + stringify(*operand)};

            // wraps around for the smallest value instead of overflowing
            return Object{static_cast<std::int64_t>(std::uint64_t{0} - static_cast<std::uint64_t>(std::get<std::int64_t>(*operand)))};
        }

        error("Unknown prefix operator '" + p->op + "'. This should never happen, please file a bug report!");
    }


    Result operator()(const expr::Infix *in) {
        auto left = std::visit(*this, in->lhs->variant());
        if (left and isError(*left)) return left;

        auto right = std::visit(*this, in->rhs->variant());
        if (right and isError(*right)) return right;

        if (not left or not right) return {};

        return infix(in->op, *left, *right);
    }


    Result operator()(const expr::If *cond) {
        auto condition = std::visit(*this, cond->condition->variant());

        if (not condition or isError(*condition)) return condition;

        if (isTruthy(*condition)) return evalBlock(*cond->consequence);
        if (cond->alternative)    return evalBlock(*cond->alternative);

        return {};
    }


    Result operator()(const expr::Function *func) {
        std::vector<std::string> params;
        for (const auto& param : func->params) params.push_back(param.name);

        // the environment is shared, not copied. That's what makes closures work
        return Function{std::move(params), func->body, env};
    }


    Result operator()(const expr::Call *call) {
        // arguments first, left to right, in the caller's scope
        std::vector<Object> args;

        for (const auto& arg : call->args) {
            auto value = std::visit(*this, arg->variant());

            if (value and isError(*value)) return value;

            args.push_back(value ? std::move(*value) : Null{});
        }


        auto callee = std::visit(*this, call->func->variant());

        if (not callee) return Null{};
        if (isError(*callee)) return callee;

        if (not std::holds_alternative<Function>(*callee))
            return Error{stringify(*callee) + " is not valid function"};


        // copy, so the closure and its body outlive the call even if the callee gets rebound
        const Function func = std::get<Function>(*callee);

        if (func.params.size() != args.size())
            return Error{
                "wrong number of arguments: " + std::to_string(func.params.size()) +
                " expected but " + std::to_string(args.size()) + " given"
            };


        // parent is the captured scope, not the caller's
        auto scope = std::make_shared<Environment>(func.env);
        for (size_t i{}; i < args.size(); ++i)
            scope->set(func.params[i], std::move(args[i]));


        auto caller = std::exchange(env, std::move(scope));
        Deferred restore{[this, &caller] { env = std::move(caller); }};

        // a ReturnValue is handed to the caller still wrapped
        auto result = evalBlock(*func.body);

        if (not result) return Null{};

        return result;
    }

private:

    static Result infix(const std::string& op, const Object& left, const Object& right) {
        if (std::holds_alternative<std::int64_t>(left) and std::holds_alternative<std::int64_t>(right))
            return integerInfix(op, std::get<std::int64_t>(left), std::get<std::int64_t>(right));

        if (std::holds_alternative<bool>(left) and std::holds_alternative<bool>(right)) {
            if (op == "==") return Object{left == right};
            if (op == "!=") return Object{left != right};

            return Error{"unknown operator: " + stringify(left) + ' ' + op + ' ' + stringify(right)};
        }

        return Error{"type mismatch: " + stringify(left) + ' ' + op + ' ' + stringify(right)};
    }


    // arithmetic wraps around on overflow (two's complement)
    static Result integerInfix(const std::string& op, const std::int64_t a, const std::int64_t b) {
        const auto ua = static_cast<std::uint64_t>(a);
        const auto ub = static_cast<std::uint64_t>(b);

        if (op == "+") return Object{static_cast<std::int64_t>(ua + ub)};
        if (op == "-") return Object{static_cast<std::int64_t>(ua - ub)};
        if (op == "*") return Object{static_cast<std::int64_t>(ua * ub)};

        if (op == "/") {
            if (b == 0)
                return Error{"division by zero: " + std::to_string(a) + " / " + std::to_string(b)};

            // the one quotient that doesn't fit
            if (a == std::numeric_limits<std::int64_t>::min() and b == -1) return Object{a};

            return Object{a / b};
        }

        if (op == "<" ) return Object{a <  b};
        if (op == "<=") return Object{a <= b};
        if (op == ">" ) return Object{a >  b};
        if (op == ">=") return Object{a >= b};
        if (op == "==") return Object{a == b};
        if (op == "!=") return Object{a != b};

        error("Unknown infix operator '" + op + "'. This should never happen, please file a bug report!");
    }
};

} // namespace monkey
