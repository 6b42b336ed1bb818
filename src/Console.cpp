#include "SchemaKit/Console.hpp"

#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace {

constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kReset = "\033[0m";

void write_line(std::ostream& os, FILE* stream, const char* color, const std::string& message) {
    static const bool out_tty = ::isatty(::fileno(stdout)) != 0;
    static const bool err_tty = ::isatty(::fileno(stderr)) != 0;
    const bool tty = (stream == stdout) ? out_tty : err_tty;
    if (tty) {
        os << color << message << kReset << std::endl;
    } else {
        os << message << std::endl;
    }
}

} // namespace

namespace SchemaKit {

void Console::info(const std::string& message) {
    write_line(std::cout, stdout, kGreen, message);
}

void Console::debug(const std::string& message) {
    write_line(std::cout, stdout, kYellow, message);
}

void Console::error(const std::string& message) {
    write_line(std::cerr, stderr, kRed, message);
}

} // namespace SchemaKit
