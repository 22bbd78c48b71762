#pragma once
#include <iostream>
#include <string>

// Tagged stderr logging. Info lines only show up in verbose mode; warnings
// and errors always do. Never pass secrets, keys or token responses here.
namespace Log {

inline bool& verboseFlag() {
    static bool verbose = false;
    return verbose;
}

inline std::string& tag() {
    static std::string t = "yksec";
    return t;
}

inline void setVerbose(bool on) { verboseFlag() = on; }
inline void setTag(const std::string& t) { tag() = t; }

inline void info(const std::string& msg) {
    if (verboseFlag()) std::cerr << "[" << tag() << "] info: " << msg << "\n";
}

inline void warn(const std::string& msg) {
    std::cerr << "[" << tag() << "] warning: " << msg << "\n";
}

inline void error(const std::string& msg) {
    std::cerr << "[" << tag() << "] error: " << msg << "\n";
}

} // namespace Log
