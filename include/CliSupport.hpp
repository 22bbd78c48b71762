#pragma once
#include "BundleStore.hpp"
#include "Config.hpp"
#include "YubiKeyProvider.hpp"

#include <optional>
#include <string>
#include <vector>

class VaultError;

// Flags every front end accepts before or after the command word.
struct CommonArgs {
    std::optional<std::string> configPath;
    std::optional<std::string> storePath;
    bool verbose = false;
    std::vector<std::string> rest;   // command word and its own arguments
};

// Splits out --config/--store/-v. Throws VaultError(InvalidInput) on a
// flag missing its value.
CommonArgs parseCommonArgs(int argc, char** argv);

// Defaults, then the config file, then command line overrides.
AppConfig resolveConfig(const std::string& tool, const CommonArgs& args);

// Creates the store's parent directory. Only commands that write call this.
void prepareStoreDir(const AppConfig& cfg);

YubiKeyProvider::Options providerOptions(const AppConfig& cfg);

void printDevices(const std::vector<DeviceSummary>& devices);

// One line on stderr naming the failed step; returns the exit code to use.
int reportFailure(const std::string& tool, const std::string& step, const VaultError& err);
