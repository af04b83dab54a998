#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>

#include "object.hpp"


inline namespace monkey {

// one scope of the chain. Shared by every closure that captured it and every call frame running in it
class Environment {
    std::unordered_map<std::string, Object> store;
    std::shared_ptr<Environment> outer;

public:
    Environment() = default;

    explicit Environment(std::shared_ptr<Environment> parent) noexcept : outer{std::move(parent)} {}


    // innermost binding wins
    [[nodiscard]] std::optional<Object> get(const std::string& name) const {
        for (const Environment* scope = this; scope; scope = scope->outer.get())
            if (const auto it = scope->store.find(name); it != scope->store.end()) return it->second;

        return {};
    }

    // never touches an outer scope, shadows instead
    const Object& set(const std::string& name, Object value) {
        return store.insert_or_assign(name, std::move(value)).first->second;
    }


    [[nodiscard]] const std::shared_ptr<Environment>& parent() const noexcept { return outer; }

    friend std::ostream& operator<<(std::ostream& os, const Environment& env) {
        for (const auto& [name, value] : env.store)
            os << name << " = " << value << '\n';

        return os;
    }
};

} // namespace monkey
