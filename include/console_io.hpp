#pragma once
#include <climits>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <termios.h>
  #include <unistd.h>
#endif

inline std::string prompt_line(const std::string& message) {
    std::cout << message << std::flush;
    std::string s;
    std::getline(std::cin, s);
    return s;
}

// Reads a line with terminal echo off (plain getline when stdin is not a terminal)
inline std::string prompt_hidden(const std::string& message) {
    std::cout << message << std::flush;
    std::string out;

#if defined(_WIN32)
    HANDLE hStdin = GetStdHandle(STD_INPUT_HANDLE);
    DWORD mode = 0;
    const bool console = GetConsoleMode(hStdin, &mode) != 0;
    const DWORD oldMode = mode;
    if (console) {
        SetConsoleMode(hStdin, mode & ~ENABLE_ECHO_INPUT);
    }
    std::getline(std::cin, out);
    if (console) {
        SetConsoleMode(hStdin, oldMode);
    }
#else
    termios oldt{};
    const bool tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        termios newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }
    std::getline(std::cin, out);
    if (tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    }
#endif

    std::cout << "\n";
    return out;
}

// Blank input -> nullopt; unparsable or non-finite input -> nullopt with a notice
inline std::optional<double> prompt_optional_number(const std::string& message) {
    std::string s = prompt_line(message);
    if (s.empty()) return std::nullopt;
    try {
        std::size_t used = 0;
        const double value = std::stod(s, &used);
        if (used == s.size() && std::isfinite(value)) {
            return value;
        }
    } catch (const std::logic_error&) {
    }
    std::cout << "Not a number, leaving it empty.\n";
    return std::nullopt;
}

// Whole numbers in [0, INT_MAX]; anything else is reported and treated as blank
inline std::optional<int> prompt_optional_count(const std::string& message) {
    std::string s = prompt_line(message);
    if (s.empty()) return std::nullopt;
    try {
        std::size_t used = 0;
        const long long value = std::stoll(s, &used);
        if (used == s.size() && value >= 0 && value <= INT_MAX) {
            return static_cast<int>(value);
        }
    } catch (const std::logic_error&) {
    }
    std::cout << "Not a whole number between 0 and " << INT_MAX << ", leaving it empty.\n";
    return std::nullopt;
}

inline std::optional<std::string> prompt_optional_text(const std::string& message) {
    std::string s = prompt_line(message);
    if (s.empty()) return std::nullopt;
    return s;
}
