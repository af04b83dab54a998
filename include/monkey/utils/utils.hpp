#pragma once

#include <concepts>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>


inline namespace monkey {

// host-level failures only (bad command line, unreadable file, broken invariants).
// Errors of the interpreted program are values, see object.hpp
[[noreturn]] inline void error(
    const std::string_view msg = "[no diagnostic]. If you see this, please file a bug report!",
    const std::source_location& location = std::source_location::current(),
    bool print_loc = true
) {
    if (print_loc)
        std::cerr << "\033[1m" << location.file_name() << ':' << location.line() << ':' << location.column()
                  << ": \033[31merror:\033[0m ";

    std::cerr << msg << std::endl;

    throw std::runtime_error{std::string{msg}};
}


template <typename F>
struct Deferred {
    F f;

    Deferred(std::invocable auto func) : f{std::move(func)} {};
    ~Deferred() { f(); }

    Deferred(const Deferred&) = delete;
    Deferred& operator=(const Deferred&) = delete;
};

template <typename F>
Deferred(F) -> Deferred<F>;

} // namespace monkey
