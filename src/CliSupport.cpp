#include "CliSupport.hpp"
#include "VaultError.hpp"
#include "Log.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

CommonArgs parseCommonArgs(int argc, char** argv) {
    CommonArgs out;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw VaultError(ErrorCode::InvalidInput, flag + " needs a value");
            }
            return argv[++i];
        };

        if (a == "--config")                  out.configPath = value(a);
        else if (a == "--store")              out.storePath  = value(a);
        else if (a == "-v" || a == "--verbose") out.verbose  = true;
        else                                  out.rest.push_back(a);
    }
    return out;
}

AppConfig resolveConfig(const std::string& tool, const CommonArgs& args) {
    AppConfig cfg;
    cfg.storePath = defaultStorePath(tool);

    if (args.configPath) {
        cfg = loadConfigFile(*args.configPath, cfg, true);
    } else if (const char* env = std::getenv("YKSEC_CONFIG"); env && *env) {
        cfg = loadConfigFile(env, cfg, true);
    } else {
        cfg = loadConfigFile(defaultConfigPath(tool), cfg, false);
    }

    if (args.storePath) cfg.storePath = expandHome(*args.storePath);
    if (args.verbose) cfg.verbose = true;
    return cfg;
}

void prepareStoreDir(const AppConfig& cfg) {
    const auto parent = std::filesystem::path(cfg.storePath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw VaultError(ErrorCode::PersistenceError,
                             "cannot create " + parent.string() + ": " + ec.message());
        }
    }
}

YubiKeyProvider::Options providerOptions(const AppConfig& cfg) {
    YubiKeyProvider::Options opts;
    opts.ykinfo       = cfg.ykinfo;
    opts.ykchalresp   = cfg.ykchalresp;
    opts.touchTimeout = std::chrono::seconds(cfg.touchTimeoutSec);
    return opts;
}

void printDevices(const std::vector<DeviceSummary>& devices) {
    if (devices.empty()) {
        std::cout << "No tokens registered.\n";
        return;
    }
    for (const auto& d : devices) {
        std::cout << d.deviceId << "\n";
        for (std::size_t i = 0; i < d.contexts.size(); ++i) {
            const auto& ctx = d.contexts[i];
            std::cout << "  " << (ctx.empty() ? "(default)" : ctx)
                      << "  created=" << d.createdAt[i] << "\n";
        }
    }
}

int reportFailure(const std::string& tool, const std::string& step, const VaultError& err) {
    std::cerr << tool << ": " << step << ": " << errorCodeName(err.code())
              << ": " << err.what() << "\n";
    return exitCodeFor(err.code());
}
