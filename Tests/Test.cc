#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "TestSuite.hpp"




TEST_CASE("Arithmetic precedence", "[General]") {
    REQUIRE(integer(run("2 * (5 + 10)")) == 30);
    REQUIRE(integer(run("(5 + 10 * 2 + 15 / 3) * 2 + -10")) == 50);
    REQUIRE(integer(run("50 / 2 * 2 + 10 - 5")) == 55);
}



TEST_CASE("Recursive fibonacci", "[General]") {
    const auto src = R"(
let fib = fn(n) {
    if (n < 2) { n } else { fib(n - 1) + fib(n - 2) }
};

fib(15);
)";

    REQUIRE(integer(run(src)) == 610);
}



TEST_CASE("Closures over closures", "[General]") {
    const auto src = R"(
let newAdder = fn(x) { fn(y) { x + y } };
let addTwo = newAdder(2);
addTwo(2);
)";

    REQUIRE(integer(run(src)) == 4);
}



TEST_CASE("Higher order functions", "[General]") {
    const auto src = R"(
let twice = fn(f, x) { f(f(x)) };
let compose = fn(f, g) { fn(x) { g(f(x)) } };

let inc = fn(x) { x + 1 };
let dbl = fn(x) { x * 2 };

twice(compose(inc, dbl), 3);
)";

    // (3 + 1) * 2 = 8, (8 + 1) * 2 = 18
    REQUIRE(integer(run(src)) == 18);
}



TEST_CASE("Accumulating with recursion", "[General]") {
    const auto src = R"(
let sum = fn(n, acc) {
    if (n == 0) { acc } else { sum(n - 1, acc + n) }
};

sum(100, 0);
)";

    REQUIRE(integer(run(src)) == 5050);
}



TEST_CASE("Early return from a loop-like recursion", "[General]") {
    const auto src = R"(
let find = fn(n, limit) {
    if (n * n > limit) { return n; }
    find(n + 1, limit)
};

find(1, 50);
let unreachable = 0;
)";

    // the return leaves every pending call and the program itself
    REQUIRE(integer(run(src)) == 8);
}



TEST_CASE("Runtime error stops the program", "[General]") {
    const auto src = R"(
let a = 5;
let b = a + true;
let c = 10;
c;
)";

    REQUIRE(errorMessage(run(src)) == "type mismatch: 5 + true");
}



TEST_CASE("Empty program has no value", "[General]") {
    REQUIRE_FALSE(run("").has_value());
    REQUIRE_FALSE(run("let x = 1;").has_value());
}
