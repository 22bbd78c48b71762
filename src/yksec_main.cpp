// src/yksec_main.cpp
#include "BundleDatabase.hpp"
#include "CliSupport.hpp"
#include "SecretManager.hpp"
#include "VaultError.hpp"
#include "YubiKeyProvider.hpp"
#include "console_io.hpp"
#include "Log.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

const char* kUsage =
    "usage: yksec [--config FILE] [--store FILE] [-v] <command> [options]\n"
    "\n"
    "commands:\n"
    "  enroll [-c CONTEXT] [--replace] [--passphrase]   protect a secret with the connected token\n"
    "  show   [-c CONTEXT]                              print the secret for the connected token\n"
    "  remove [SERIAL] [-c CONTEXT] [-y]                forget a token (or one of its contexts)\n"
    "  list                                             registered tokens and contexts\n";

struct CommandArgs {
    std::string context;
    std::optional<std::string> serial;
    bool replace = false;
    bool passphrase = false;
    bool yes = false;
};

CommandArgs parseCommandArgs(const std::vector<std::string>& args) {
    CommandArgs out;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "-c" || a == "--context") {
            if (i + 1 >= args.size()) throw VaultError(ErrorCode::InvalidInput, a + " needs a value");
            out.context = args[++i];
        } else if (a == "--replace") {
            out.replace = true;
        } else if (a == "--passphrase") {
            out.passphrase = true;
        } else if (a == "-y" || a == "--yes") {
            out.yes = true;
        } else if (!a.empty() && a[0] != '-' && !out.serial) {
            out.serial = a;
        } else {
            throw VaultError(ErrorCode::InvalidInput, "unexpected argument " + a);
        }
    }
    return out;
}

std::optional<std::string> askPassphrase() {
    return prompt_hidden("Passphrase: ");
}

// ----- Commands -----

int cmd_enroll(SecretManager& secrets, const CommandArgs& a) {
    if (a.serial) throw VaultError(ErrorCode::InvalidInput, "enroll uses the connected token, not a serial");

    SecretManager::EnrollOptions opts;
    opts.replace = a.replace;
    if (a.passphrase) {
        opts.askPassphrase = [] { return prompt_hidden_confirmed("Passphrase: ", "Repeat passphrase: "); };
    }

    // Prompted only after the token answered and the context is free
    auto askSecret = [] {
        auto secret = prompt_hidden_confirmed("Secret to protect: ", "Repeat secret: ");
        if (secret) std::cerr << "Touch the token if it blinks.\n";
        return secret;
    };
    const auto serial = secrets.enroll(a.context, askSecret, opts);

    std::cout << "Enrolled token " << serial
              << (a.context.empty() ? std::string() : " for context '" + a.context + "'") << ".\n";
    return 0;
}

int cmd_show(SecretManager& secrets, const CommandArgs& a) {
    if (a.serial || a.replace || a.passphrase || a.yes) {
        throw VaultError(ErrorCode::InvalidInput, "show only takes -c CONTEXT");
    }
    auto secret = secrets.recover(a.context, askPassphrase);
    if (!secret) {
        throw VaultError(ErrorCode::NotFound, "nothing enrolled for this token"
                         + (a.context.empty() ? std::string() : " and context '" + a.context + "'"));
    }
    std::cout << *secret << "\n";
    std::fill(secret->begin(), secret->end(), '\0');
    return 0;
}

int cmd_remove(SecretManager& secrets, const CommandArgs& a) {
    const std::optional<std::string> context =
        a.context.empty() ? std::nullopt : std::optional<std::string>(a.context);

    if (a.serial) {
        if (context) {
            secrets.removeContext(*a.serial, *context);
            std::cout << "Removed context '" << *context << "' from token " << *a.serial << ".\n";
        } else {
            secrets.removeDevice(*a.serial);
            std::cout << "Removed token " << *a.serial << ".\n";
        }
        return 0;
    }

    auto ask = [&](const std::string& serial) {
        if (a.yes) return true;
        return confirm(context ? "Remove context '" + *context + "' from token " + serial + "?"
                               : "Remove every secret bound to token " + serial + "?");
    };
    const auto removed = secrets.removeConnected(context, ask);
    if (!removed) {
        std::cout << "Aborted.\n";
    } else if (context) {
        std::cout << "Removed context '" << *context << "' from token " << *removed << ".\n";
    } else {
        std::cout << "Removed token " << *removed << ".\n";
    }
    return 0;
}

} // namespace

// ----- Main -----

int main(int argc, char** argv) {
    Log::setTag("yksec");
    std::string step = "startup";
    try {
        CommonArgs common = parseCommonArgs(argc, argv);
        if (common.rest.empty() || common.rest[0] == "help" || common.rest[0] == "-h"
            || common.rest[0] == "--help") {
            std::cout << kUsage;
            return common.rest.empty() ? 1 : 0;
        }

        AppConfig cfg = resolveConfig("yksec", common);
        Log::setVerbose(cfg.verbose);
        Log::info("store " + cfg.storePath);

        const std::string command = common.rest[0];
        const CommandArgs args = parseCommandArgs(common.rest);
        const bool writes = (command == "enroll" || command == "remove");

        step = "open store";
        if (writes) prepareStoreDir(cfg);
        BundleDatabase db(cfg.storePath, writes ? BundleDatabase::OpenMode::ReadWrite
                                                : BundleDatabase::OpenMode::ReadOnly);
        db.init();

        YubiKeyProvider token(providerOptions(cfg));
        SecretManager secrets(token, db, cfg.slot);
        step = command;

        if (command == "enroll") return cmd_enroll(secrets, args);
        if (command == "show")   return cmd_show(secrets, args);
        if (command == "remove") return cmd_remove(secrets, args);
        if (command == "list") {
            printDevices(secrets.list());
            return 0;
        }

        std::cerr << "yksec: unknown command " << command << "\n" << kUsage;
        return 1;
    } catch (const VaultError& err) {
        return reportFailure("yksec", step, err);
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
