#include "YubiKeyProvider.hpp"
#include "Subprocess.hpp"
#include "VaultError.hpp"
#include "Log.hpp"
#include "hex.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace {
    // ykinfo answers immediately; only the challenge may wait for a touch
    constexpr std::chrono::seconds kInfoTimeout{5};

    std::string trim(const std::string& s) {
        auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return (b < e) ? std::string(b, e) : std::string{};
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // ykpers prints "Yubikey core error: no yubikey present" when nothing is plugged in
    bool reportsNoToken(const ProcessResult& r) {
        const auto text = lower(r.err + r.out);
        return text.find("no yubikey present") != std::string::npos
            || text.find("no yubikey found") != std::string::npos;
    }

    ProcessResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
        try {
            return runProcess(argv, timeout);
        } catch (const std::system_error& ex) {
            throw VaultError(ErrorCode::ProviderError, ex.what());
        }
    }
}

YubiKeyProvider::YubiKeyProvider(Options opts)
: m_opts(std::move(opts))
{}

std::string YubiKeyProvider::identity() {
    auto r = run({m_opts.ykinfo, "-s", "-q"}, kInfoTimeout);
    if (r.timedOut) {
        throw VaultError(ErrorCode::ProviderError, "ykinfo timed out");
    }
    if (r.exitCode != 0) {
        if (reportsNoToken(r)) {
            throw VaultError(ErrorCode::ProviderUnavailable, "no YubiKey present");
        }
        throw VaultError(ErrorCode::ProviderError, "ykinfo failed: " + trim(r.err));
    }

    // Older ykinfo ignores -q and prints "serial: 123"
    std::string serial = trim(r.out);
    if (serial.rfind("serial:", 0) == 0) serial = trim(serial.substr(7));

    if (serial.empty() || !std::all_of(serial.begin(), serial.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        throw VaultError(ErrorCode::ProviderError, "ykinfo returned an unreadable serial");
    }
    Log::info("token serial " + serial);
    return serial;
}

std::vector<std::uint8_t> YubiKeyProvider::challengeResponse(
    int slot, const std::vector<std::uint8_t>& challenge
) {
    // The token itself would refuse these; report them the same way
    if (slot != 1 && slot != 2) {
        throw VaultError(ErrorCode::ProviderError, "slot must be 1 or 2");
    }
    if (challenge.empty() || challenge.size() > MAX_CHALLENGE_LEN) {
        throw VaultError(ErrorCode::ProviderError, "challenge must be 1..64 bytes");
    }

    Log::info("sending challenge to slot " + std::to_string(slot) + ", touch the token if it blinks");
    auto r = run({m_opts.ykchalresp, "-" + std::to_string(slot), "-x", to_hex(challenge)},
                 std::chrono::duration_cast<std::chrono::milliseconds>(m_opts.touchTimeout));
    if (r.timedOut) {
        throw VaultError(ErrorCode::ProviderError,
                         "no touch within " + std::to_string(m_opts.touchTimeout.count()) + "s");
    }
    if (r.exitCode != 0) {
        if (reportsNoToken(r)) {
            throw VaultError(ErrorCode::ProviderUnavailable, "no YubiKey present");
        }
        throw VaultError(ErrorCode::ProviderError, "ykchalresp failed: " + trim(r.err));
    }

    auto response = from_hex(trim(r.out));
    if (!response || response->size() != RESPONSE_LEN) {
        throw VaultError(ErrorCode::ProviderError, "ykchalresp returned a malformed response");
    }
    return *response;
}
