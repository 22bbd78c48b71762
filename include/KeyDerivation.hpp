#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class ChallengeResponseProvider;

// Turns a token response into a 32-byte AES key.
//   challenge = DOMAIN_TAG || salt
//   ikm       = response [|| Argon2id(passphrase, salt)]
//   key       = HKDF-SHA256(ikm, salt, info = context || 0x00 || deviceId)
class KeyDerivation {
public:
    static std::vector<std::uint8_t> deriveKey(
        ChallengeResponseProvider& provider,
        int slot,
        const std::string& deviceId,
        const std::string& context,
        const std::vector<std::uint8_t>& salt,
        const std::optional<std::string>& passphrase = std::nullopt
    );

    static std::vector<std::uint8_t> buildChallenge(const std::vector<std::uint8_t>& salt);

    // Pure part of deriveKey: no provider, same bytes for the same inputs.
    static std::vector<std::uint8_t> expandResponse(
        const std::vector<std::uint8_t>& response,
        const std::vector<std::uint8_t>& salt,
        const std::string& context,
        const std::string& deviceId,
        const std::optional<std::string>& passphrase = std::nullopt
    );

    static std::vector<std::uint8_t> randomSalt();

    static constexpr std::size_t SALT_LEN = 32;
    static constexpr std::size_t KEY_LEN  = 32;
    static constexpr char DOMAIN_TAG[] = "yksec/envelope/v1";

private:
    static std::vector<std::uint8_t> stretchPassphrase(const std::string& passphrase,
                                                       const std::vector<std::uint8_t>& salt);

    // Argon2id params for the optional passphrase factor
    static constexpr std::uint32_t T_COST      = 3;
    static constexpr std::uint32_t M_COST_KiB  = 64 * 1024;
    static constexpr std::uint32_t PARALLELISM = 1;
};
