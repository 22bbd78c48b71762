#include "Config.hpp"
#include "VaultError.hpp"
#include "Log.hpp"

#include <cstdlib>
#include <fstream>
#include <string>

namespace {
    std::string trim(const std::string& s) {
        const auto b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return {};
        const auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    std::string unquote(const std::string& v) {
        if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
            return v.substr(1, v.size() - 2);
        }
        return v;
    }

    // Value part up to an unquoted '#'
    std::string stripComment(const std::string& v) {
        char quote = 0;
        for (std::size_t i = 0; i < v.size(); ++i) {
            char c = v[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#') {
                return v.substr(0, i);
            }
        }
        return v;
    }

    int parseInt(const std::string& key, const std::string& value, const std::string& where) {
        std::size_t used = 0;
        int n = 0;
        try {
            n = std::stoi(value, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != value.size()) {
            throw VaultError(ErrorCode::InvalidInput, where + ": " + key + " must be an integer");
        }
        return n;
    }

    std::string envOr(const char* name, const std::string& fallback) {
        const char* v = std::getenv(name);
        return (v && *v) ? std::string(v) : fallback;
    }

    std::string home() {
        return envOr("HOME", ".");
    }
}

std::string expandHome(const std::string& path) {
    if (path == "~") return home();
    if (path.rfind("~/", 0) == 0) return home() + path.substr(1);
    return path;
}

AppConfig parseConfig(std::istream& in, AppConfig base, const std::string& sourceName) {
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string where = sourceName + ":" + std::to_string(lineNo);
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        if (t.rfind("export ", 0) == 0) t = trim(t.substr(7));

        const auto eq = t.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw VaultError(ErrorCode::InvalidInput, where + ": expected KEY=VALUE");
        }
        const std::string key   = trim(t.substr(0, eq));
        const std::string value = unquote(trim(stripComment(t.substr(eq + 1))));

        if (key == "STORE_PATH") {
            base.storePath = expandHome(value);
        } else if (key == "YUBIKEY_SLOT") {
            base.slot = parseInt(key, value, where);
            if (base.slot != 1 && base.slot != 2) {
                throw VaultError(ErrorCode::InvalidInput, where + ": YUBIKEY_SLOT must be 1 or 2");
            }
        } else if (key == "TOUCH_TIMEOUT") {
            base.touchTimeoutSec = parseInt(key, value, where);
            if (base.touchTimeoutSec < 1 || base.touchTimeoutSec > 600) {
                throw VaultError(ErrorCode::InvalidInput, where + ": TOUCH_TIMEOUT must be 1..600 seconds");
            }
        } else if (key == "YKCHALRESP") {
            base.ykchalresp = value;
        } else if (key == "YKINFO") {
            base.ykinfo = value;
        } else if (key == "BW") {
            base.bw = value;
        } else if (key == "VERBOSE") {
            base.verbose = (value == "1" || value == "yes" || value == "true");
        } else {
            Log::warn(where + ": unknown setting " + key + " ignored");
        }
    }
    return base;
}

AppConfig loadConfigFile(const std::string& path, AppConfig base, bool required) {
    std::ifstream f(path);
    if (!f) {
        if (required) {
            throw VaultError(ErrorCode::InvalidInput, "cannot open config file " + path);
        }
        return base;
    }
    Log::info("reading config " + path);
    return parseConfig(f, std::move(base), path);
}

std::string defaultConfigPath(const std::string& tool) {
    return envOr("XDG_CONFIG_HOME", home() + "/.config") + "/yksec/" + tool + ".cfg";
}

std::string defaultStorePath(const std::string& tool) {
    return envOr("XDG_DATA_HOME", home() + "/.local/share") + "/yksec/" + tool + ".db";
}
