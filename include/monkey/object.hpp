#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "declarations.hpp"


inline namespace monkey {

class Environment;

inline namespace value {

struct Null {
    bool operator==(const Null&) const = default;
};

struct Function {
    std::vector<std::string> params;
    stmt::BlockPtr body;
    std::shared_ptr<Environment> env; // captured where the literal was evaluated

    bool operator==(const Function&) const = default;
};

struct Boxed;
struct ReturnValue {
    std::shared_ptr<const Boxed> boxed;

    bool operator==(const ReturnValue& other) const;
};

struct Error {
    std::string message;

    bool operator==(const Error&) const = default;
};


// ReturnValue and Error only travel upwards through the evaluator, a program can't bind them
using Object = std::variant<
    std::int64_t,
    bool,
    Null,
    Function,
    ReturnValue,
    Error
>;

struct Boxed { Object value; };


inline bool ReturnValue::operator==(const ReturnValue& other) const {
    return boxed->value == other.boxed->value;
}


[[nodiscard]] inline ReturnValue makeReturn(Object value) {
    return {std::make_shared<const Boxed>(std::move(value))};
}

[[nodiscard]] inline bool isError (const Object& object) noexcept { return std::holds_alternative<Error>(object); }
[[nodiscard]] inline bool isReturn(const Object& object) noexcept { return std::holds_alternative<ReturnValue>(object); }

[[nodiscard]] inline bool isTruthy(const Object& object) noexcept {
    if (std::holds_alternative<Null>(object)) return false;
    if (std::holds_alternative<bool>(object)) return std::get<bool>(object);

    return true;
}


inline std::string stringify(const Object& object) {
    std::string s;

    if (std::holds_alternative<bool>(object)) {
        s = std::get<bool>(object) ? "true" : "false";
    }

    else if (std::holds_alternative<std::int64_t>(object)) {
        s = std::to_string(std::get<std::int64_t>(object));
    }

    else if (std::holds_alternative<Null>(object)) {
        s = "null";
    }

    else if (std::holds_alternative<Function>(object)) {
        s = "fn(";

        for (std::string_view comma = ""; const auto& param : std::get<Function>(object).params) {
            s += comma;
            s += param;
            comma = ", ";
        }

        s += ") { ... }";
    }

    else if (std::holds_alternative<ReturnValue>(object)) {
        s = stringify(std::get<ReturnValue>(object).boxed->value);
    }

    else if (std::holds_alternative<Error>(object)) {
        s = std::get<Error>(object).message;
    }

    return s;
}


inline std::ostream& operator<<(std::ostream& os, const Object& object) {
    return os << stringify(object);
}

} // namespace value
} // namespace monkey
