#pragma once
#include "ChallengeResponseProvider.hpp"

#include <chrono>
#include <string>

// Talks to a YubiKey through the yubikey-personalization command line tools:
//   ykinfo -s -q              -> serial number
//   ykchalresp -<slot> -x HEX -> 20-byte HMAC-SHA1 response, hex encoded
// The slot must be programmed for HMAC-SHA1 challenge-response.
class YubiKeyProvider : public ChallengeResponseProvider {
public:
    struct Options {
        std::string ykinfo     = "ykinfo";
        std::string ykchalresp = "ykchalresp";
        std::chrono::seconds touchTimeout{15};
    };

    explicit YubiKeyProvider(Options opts);

    std::string identity() override;
    std::vector<std::uint8_t> challengeResponse(
        int slot, const std::vector<std::uint8_t>& challenge) override;

private:
    Options m_opts;
};
