#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Anything that can answer an HMAC-SHA1 challenge with a secret it never
// reveals. Implementations throw VaultError(ProviderUnavailable) when no
// token is reachable and VaultError(ProviderError) for every other failure.
class ChallengeResponseProvider {
public:
    virtual ~ChallengeResponseProvider() = default;

    // Serial number of the connected token.
    virtual std::string identity() = 0;

    // May block until the user touches the token (bounded by a timeout).
    virtual std::vector<std::uint8_t> challengeResponse(
        int slot, const std::vector<std::uint8_t>& challenge) = 0;

    static constexpr std::size_t RESPONSE_LEN      = 20;
    static constexpr std::size_t MAX_CHALLENGE_LEN = 64;
};
