#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <variant>

#include "TestSuite.hpp"


namespace {

// stringified program, fails the test on parse errors
std::string ast(std::string src) {
    const auto [program, errors] = parseSource(std::move(src));

    for (const auto& err : errors) FAIL(err.message);

    return stringify(program);
}

} // namespace



TEST_CASE("Operator precedence", "[Parser]") {
    REQUIRE(ast("a + b - c") == "((a + b) - c)");
    REQUIRE(ast("a * b / c") == "((a * b) / c)");
    REQUIRE(ast("a + b * c") == "(a + (b * c))");
    REQUIRE(ast("a + b * c + d / e - f") == "(((a + (b * c)) + (d / e)) - f)");
    REQUIRE(ast("-a * b") == "((-a) * b)");
    REQUIRE(ast("!-a") == "(!(-a))");
    REQUIRE(ast("5 > 4 == 3 < 4") == "((5 > 4) == (3 < 4))");
    REQUIRE(ast("5 >= 4 != 3 <= 4") == "((5 >= 4) != (3 <= 4))");
    REQUIRE(ast("3 + 4 * 5 == 3 * 1 + 4 * 5") == "((3 + (4 * 5)) == ((3 * 1) + (4 * 5)))");
    REQUIRE(ast("true != false == true") == "((true != false) == true)");
}



TEST_CASE("Grouping overrides precedence", "[Parser]") {
    REQUIRE(ast("1 + (2 + 3) + 4") == "((1 + (2 + 3)) + 4)");
    REQUIRE(ast("(5 + 5) * 2") == "((5 + 5) * 2)");
    REQUIRE(ast("-(5 + 5)") == "(-(5 + 5))");
    REQUIRE(ast("!(true == true)") == "(!(true == true))");
}



TEST_CASE("Calls bind tightest", "[Parser]") {
    REQUIRE(ast("a + add(b * c) + d") == "((a + add((b * c))) + d)");
    REQUIRE(ast("add(a, b, 1, 2 * 3, 4 + 5, add(6, 7 * 8))") == "add(a, b, 1, (2 * 3), (4 + 5), add(6, (7 * 8)))");
    REQUIRE(ast("f()()") == "f()()");
    REQUIRE(ast("fn(x) { x }(5)") == "fn(x) {\n    x\n}(5)");
}



TEST_CASE("Statements", "[Parser]") {
    const auto [program, errors] = parseSource("let x = 5; return x + 1; x;");

    REQUIRE(errors.empty());
    REQUIRE(program.size() == 3);

    REQUIRE(std::holds_alternative<const stmt::Let*>(program[0]->variant()));
    REQUIRE(std::holds_alternative<const stmt::Return*>(program[1]->variant()));
    REQUIRE(std::holds_alternative<const stmt::Expression*>(program[2]->variant()));

    const auto let = std::get<const stmt::Let*>(program[0]->variant());
    REQUIRE(let->name.name == "x");
    REQUIRE(let->value->stringify() == "5");

    REQUIRE(stringify(program) == "let x = 5;\nreturn (x + 1);\nx");
}



TEST_CASE("Semicolons are optional", "[Parser]") {
    REQUIRE(ast("let x = 1 let y = 2 x") == "let x = 1;\nlet y = 2;\nx");
}



TEST_CASE("If expressions", "[Parser]") {
    REQUIRE(ast("if (x < y) { x }") == "if (x < y) {\n    x\n}");
    REQUIRE(ast("if (x < y) { x } else { y }") == "if (x < y) {\n    x\n} else {\n    y\n}");
    REQUIRE(ast("if (x) { }") == "if x { }");

    const auto [program, errors] = parseSource("if (x) { 1 }");
    REQUIRE(errors.empty());

    const auto e = std::get<const stmt::Expression*>(program[0]->variant());
    const auto cond = std::get<const expr::If*>(e->expr->variant());

    REQUIRE(cond->alternative == nullptr);
    REQUIRE(cond->consequence->statements.size() == 1);
}



TEST_CASE("Function literals", "[Parser]") {
    REQUIRE(ast("fn() { }") == "fn() { }");
    REQUIRE(ast("fn(x, y) { x + y; }") == "fn(x, y) {\n    (x + y)\n}");
    REQUIRE(ast("fn(x) { fn(y) { x + y } }") == "fn(x) {\n    fn(y) {\n        (x + y)\n    }\n}");

    const auto [program, errors] = parseSource("fn(a, b, c) { }");
    REQUIRE(errors.empty());

    const auto e = std::get<const stmt::Expression*>(program[0]->variant());
    const auto func = std::get<const expr::Function*>(e->expr->variant());

    REQUIRE(func->params.size() == 3);
    REQUIRE(func->params[2].name == "c");
    REQUIRE(func->body->statements.empty());
}



TEST_CASE("Missing assignment in let", "[Parser]") {
    const auto [program, errors] = parseSource("let x 5;");

    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].kind == ParseErrorKind::UNEXPECTED_TOKEN);
    REQUIRE(errors[0].expected == TokenKind::ASSIGN);
    REQUIRE(errors[0].found.kind == TokenKind::INT);
    REQUIRE(errors[0].message == "expected next token to be ASSIGN, got INT(5) instead");

    for (const auto& statement : program)
        REQUIRE_FALSE(std::holds_alternative<const stmt::Let*>(statement->variant()));
}



TEST_CASE("Errors are collected and parsing goes on", "[Parser]") {
    const auto [program, errors] = parseSource("let = 10; let y = 2; let 838383;");

    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].expected == TokenKind::NAME);
    REQUIRE(errors[0].found.kind == TokenKind::ASSIGN);
    REQUIRE(errors[1].expected == TokenKind::NAME);
    REQUIRE(errors[1].found.text == "838383");

    bool found_y = false;
    for (const auto& statement : program) {
        const auto node = statement->variant();

        if (const auto let = std::get_if<const stmt::Let*>(&node))
            found_y = found_y or (*let)->name.name == "y";
    }

    REQUIRE(found_y);
}



TEST_CASE("Unclosed grouping", "[Parser]") {
    const auto [program, errors] = parseSource("(1 + 2");

    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].expected == TokenKind::R_PAREN);
    REQUIRE(errors[0].found.kind == TokenKind::END);
    REQUIRE(errors[0].message == "expected next token to be R_PAREN, got END instead");
}



TEST_CASE("Parse error textual form", "[Parser]") {
    const auto [program, errors] = parseSource("fn(x y) { }");

    REQUIRE_FALSE(errors.empty());

    std::ostringstream ss;
    ss << errors[0];

    REQUIRE(ss.str() == "Unexpected Token: expected next token to be R_PAREN, got NAME(y) instead");
}
