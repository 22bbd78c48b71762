// src/ykbw_main.cpp
// Bitwarden front end: one master password per token, handed to `bw unlock`
// and then to a shell with BW_SESSION set.
#include "BundleDatabase.hpp"
#include "CliSupport.hpp"
#include "SecretManager.hpp"
#include "Subprocess.hpp"
#include "VaultError.hpp"
#include "YubiKeyProvider.hpp"
#include "console_io.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

const char* kUsage =
    "usage: ykbw [--config FILE] [--store FILE] [-v] <command>\n"
    "\n"
    "commands:\n"
    "  enroll [--replace]   bind the Bitwarden master password to the connected token\n"
    "  unlock               unlock the vault and start a shell with BW_SESSION set\n"
    "  show                 print the master password\n"
    "  remove [SERIAL] [-y] forget a token\n"
    "  list                 registered tokens\n";

const std::string kContext = "bitwarden";
const char* kPasswordEnv = "YKBW_MASTER_PASSWORD";
constexpr std::chrono::seconds kBwTimeout{120};

std::string recoverMasterPassword(SecretManager& secrets) {
    auto pw = secrets.recover(kContext);
    if (!pw) {
        throw VaultError(ErrorCode::NotFound, "no master password enrolled for this token (run: ykbw enroll)");
    }
    return *pw;
}

// ----- Commands -----

int cmd_enroll(SecretManager& secrets, bool replace) {
    SecretManager::EnrollOptions opts;
    opts.replace = replace;

    // Prompted only after the token answered and nothing is enrolled yet
    auto askPassword = [] {
        auto pw = prompt_hidden_confirmed("Bitwarden master password: ", "Repeat master password: ");
        if (pw) std::cerr << "Touch the token if it blinks.\n";
        return pw;
    };
    const auto serial = secrets.enroll(kContext, askPassword, opts);
    std::cout << "Master password bound to token " << serial << ".\n";
    return 0;
}

int cmd_show(SecretManager& secrets) {
    auto pw = recoverMasterPassword(secrets);
    std::cout << pw << "\n";
    std::fill(pw.begin(), pw.end(), '\0');
    return 0;
}

int cmd_unlock(SecretManager& secrets, const AppConfig& cfg) {
    auto pw = recoverMasterPassword(secrets);

    ProcessResult r;
    try {
        r = runProcess({cfg.bw, "unlock", "--raw", "--passwordenv", kPasswordEnv},
                       kBwTimeout, {{kPasswordEnv, pw}});
    } catch (const std::system_error& ex) {
        std::fill(pw.begin(), pw.end(), '\0');
        throw VaultError(ErrorCode::ExternalCommand, ex.what());
    }
    std::fill(pw.begin(), pw.end(), '\0');

    if (r.timedOut) throw VaultError(ErrorCode::ExternalCommand, "bw unlock timed out");
    std::string session = r.out;
    session.erase(std::remove_if(session.begin(), session.end(),
                                 [](char c) { return c == '\n' || c == '\r'; }),
                  session.end());
    if (r.exitCode != 0 || session.empty()) {
        throw VaultError(ErrorCode::ExternalCommand, "bw unlock failed: " + r.err);
    }

    const char* shellEnv = std::getenv("SHELL");
    const std::string shell = (shellEnv && *shellEnv) ? shellEnv : "/bin/sh";
    std::cerr << "Vault unlocked; starting " << shell << " with BW_SESSION set. Exit the shell to lock it again.\n";
    try {
        execReplacing({shell}, {{"BW_SESSION", session}});
    } catch (const std::system_error& ex) {
        throw VaultError(ErrorCode::ExternalCommand, ex.what());
    }
}

int cmd_remove(SecretManager& secrets, const std::optional<std::string>& explicitSerial, bool yes) {
    if (explicitSerial) {
        secrets.removeDevice(*explicitSerial);
        std::cout << "Removed token " << *explicitSerial << ".\n";
        return 0;
    }

    const auto removed = secrets.removeConnected(std::nullopt, [yes](const std::string& serial) {
        return yes || confirm("Forget the master password bound to token " + serial + "?");
    });
    if (removed) {
        std::cout << "Removed token " << *removed << ".\n";
    } else {
        std::cout << "Aborted.\n";
    }
    return 0;
}

} // namespace

// ----- Main -----

int main(int argc, char** argv) {
    Log::setTag("ykbw");
    std::string step = "startup";
    try {
        CommonArgs common = parseCommonArgs(argc, argv);
        if (common.rest.empty() || common.rest[0] == "help" || common.rest[0] == "-h"
            || common.rest[0] == "--help") {
            std::cout << kUsage;
            return common.rest.empty() ? 1 : 0;
        }

        AppConfig cfg = resolveConfig("ykbw", common);
        Log::setVerbose(cfg.verbose);
        Log::info("store " + cfg.storePath);

        const std::vector<std::string>& args = common.rest;
        const std::string command = args[0];
        const bool writes = (command == "enroll" || command == "remove");

        step = "open store";
        if (writes) prepareStoreDir(cfg);
        BundleDatabase db(cfg.storePath, writes ? BundleDatabase::OpenMode::ReadWrite
                                                : BundleDatabase::OpenMode::ReadOnly);
        db.init();

        YubiKeyProvider token(providerOptions(cfg));
        SecretManager secrets(token, db, cfg.slot);
        step = command;

        if (command == "enroll" && args.size() <= 2) {
            if (args.size() == 2 && args[1] != "--replace") {
                throw VaultError(ErrorCode::InvalidInput, "unexpected argument " + args[1]);
            }
            return cmd_enroll(secrets, args.size() == 2);
        }
        if (command == "remove" && args.size() <= 3) {
            std::optional<std::string> serial;
            bool yes = false;
            for (std::size_t i = 1; i < args.size(); ++i) {
                if (args[i] == "-y" || args[i] == "--yes") yes = true;
                else if (!serial && args[i][0] != '-') serial = args[i];
                else throw VaultError(ErrorCode::InvalidInput, "unexpected argument " + args[i]);
            }
            return cmd_remove(secrets, serial, yes);
        }
        if (args.size() == 1) {
            if (command == "unlock") return cmd_unlock(secrets, cfg);
            if (command == "show")   return cmd_show(secrets);
            if (command == "list") {
                printDevices(secrets.list());
                return 0;
            }
        }

        std::cerr << "ykbw: bad command line\n" << kUsage;
        return 1;
    } catch (const VaultError& err) {
        return reportFailure("ykbw", step, err);
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
