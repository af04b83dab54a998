#pragma once

#include "token.hpp"


inline namespace monkey {
namespace prec {

  // binding power, weakest first. Only ever compared, never stored in the tree
  enum class Precedence {
    LOWEST,
    EQUALS,       // == !=
    LESS_GREATER, // < <= > >=
    SUM,          // + -
    PRODUCT,      // * /
    PREFIX,       // -x !x
    CALL,         // f(x)
  };


  constexpr Precedence precedenceOf(const TokenKind token) noexcept {
    switch (token) {
      using enum TokenKind;

      case EQ:
      case NOT_EQ:
        return Precedence::EQUALS;

      case LT:
      case LT_EQ:
      case GT:
      case GT_EQ:
        return Precedence::LESS_GREATER;

      case PLUS:
      case MINUS:
        return Precedence::SUM;

      case ASTERISK:
      case SLASH:
        return Precedence::PRODUCT;

      case L_PAREN:
        return Precedence::CALL;

      default:
        return Precedence::LOWEST;
    }
  }

} // namespace prec
} // namespace monkey
