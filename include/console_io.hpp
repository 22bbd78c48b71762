#pragma once
#include <iostream>
#include <optional>
#include <string>

#include <termios.h>
#include <unistd.h>

// Prompts go to stderr so stdout stays clean for `show` output.

// nullopt on EOF (Ctrl-D), i.e. the user cancelled
inline std::optional<std::string> prompt_line(const std::string& message) {
    std::cerr << message << std::flush;
    std::string s;
    if (!std::getline(std::cin, s)) return std::nullopt;
    return s;
}

// No-echo read when stdin is a terminal; a plain line read otherwise, so
// secrets can be piped in.
inline std::optional<std::string> prompt_hidden(const std::string& message) {
    if (!::isatty(STDIN_FILENO)) {
        std::string s;
        if (!std::getline(std::cin, s)) return std::nullopt;
        return s;
    }

    std::cerr << message << std::flush;

    termios oldt{};
    const bool haveTerm = (tcgetattr(STDIN_FILENO, &oldt) == 0);
    if (haveTerm) {
        termios newt = oldt;
        newt.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }

    std::string out;
    const bool ok = static_cast<bool>(std::getline(std::cin, out));

    if (haveTerm) tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    std::cerr << "\n";

    if (!ok) return std::nullopt;
    return out;
}

// Asks twice; nullopt when cancelled, empty or the two entries differ.
inline std::optional<std::string> prompt_hidden_confirmed(const std::string& message,
                                                          const std::string& again) {
    auto first = prompt_hidden(message);
    if (!first || first->empty()) return std::nullopt;
    if (!::isatty(STDIN_FILENO)) return first;

    auto second = prompt_hidden(again);
    if (!second || *second != *first) {
        std::cerr << "Entries do not match.\n";
        return std::nullopt;
    }
    return first;
}

inline bool confirm(const std::string& question) {
    auto answer = prompt_line(question + " Type 'YES' to confirm: ");
    return answer && *answer == "YES";
}
