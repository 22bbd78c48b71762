#pragma once
#include <istream>
#include <string>

// Runtime settings, resolved once at startup and passed down explicitly.
struct AppConfig {
    std::string storePath;
    int         slot = 2;               // YubiKey slot with HMAC-SHA1 challenge-response
    int         touchTimeoutSec = 15;
    std::string ykchalresp = "ykchalresp";
    std::string ykinfo     = "ykinfo";
    std::string bw         = "bw";      // Bitwarden CLI, ykbw only
    bool        verbose = false;
};

// Parses KEY=VALUE lines (shell-style, like ykluks.cfg): '#' comments,
// optional single/double quotes. Keys:
//   STORE_PATH, YUBIKEY_SLOT, TOUCH_TIMEOUT, YKCHALRESP, YKINFO, BW, VERBOSE
// Throws VaultError(InvalidInput) on a malformed line or out-of-range value.
AppConfig parseConfig(std::istream& in, AppConfig base, const std::string& sourceName = "config");

// Reads `path` on top of `base`. A missing file is an error only when `required`.
AppConfig loadConfigFile(const std::string& path, AppConfig base, bool required);

// $XDG_CONFIG_HOME/yksec/<tool>.cfg, falling back to ~/.config
std::string defaultConfigPath(const std::string& tool);

// $XDG_DATA_HOME/yksec/<tool>.db, falling back to ~/.local/share
std::string defaultStorePath(const std::string& tool);

// Leading "~/" -> $HOME/
std::string expandHome(const std::string& path);
