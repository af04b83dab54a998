#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>


inline namespace monkey {

namespace expr {

// has to be pointers since the node types are only forward declared here
using Node = std::variant<
    const struct Identifier *,
    const struct Int        *,
    const struct Bool       *,
    const struct Prefix     *,
    const struct Infix      *,
    const struct If         *,
    const struct Function   *,
    const struct Call       *
>;


struct Expr {
    virtual ~Expr() = default;
    virtual std::string stringify(const size_t indent = 0) const = 0;

    virtual Node variant() const = 0;
};

using ExprPtr = std::shared_ptr<Expr>;

} // namespace expr


namespace stmt {

using Node = std::variant<
    const struct Let        *,
    const struct Return     *,
    const struct Expression *
>;


struct Stmt {
    virtual ~Stmt() = default;
    virtual std::string stringify(const size_t indent = 0) const = 0;

    virtual Node variant() const = 0;
};

using StmtPtr = std::shared_ptr<Stmt>;

struct Block;
using BlockPtr = std::shared_ptr<const Block>;

} // namespace stmt


using Program = std::vector<stmt::StmtPtr>;

} // namespace monkey
