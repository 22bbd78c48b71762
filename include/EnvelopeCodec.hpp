#pragma once
#include <cstdint>
#include <vector>

// AES-256-GCM over a single secret. Holds the derived key only for the
// lifetime of the object and wipes it on destruction.
class EnvelopeCodec {
public:
    // Construct with a 32-byte key from KeyDerivation.
    explicit EnvelopeCodec(const std::vector<std::uint8_t>& key);
    ~EnvelopeCodec();

    EnvelopeCodec(const EnvelopeCodec&) = delete;
    EnvelopeCodec& operator=(const EnvelopeCodec&) = delete;

    struct Sealed {
        std::vector<std::uint8_t> nonce;      // 12-byte random nonce
        std::vector<std::uint8_t> ciphertext; // same length as plaintext
        std::vector<std::uint8_t> tag;        // 16 bytes
    };

    // Fresh nonce on every call; no AAD.
    Sealed encrypt(const std::vector<std::uint8_t>& plaintext) const;

    // Throws VaultError(AuthenticationFailed) for any mismatch or malformed
    // input. No plaintext bytes escape unless the tag verified.
    std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& ciphertext,
                                      const std::vector<std::uint8_t>& nonce,
                                      const std::vector<std::uint8_t>& tag) const;

    static constexpr std::size_t KEY_LEN   = 32;
    static constexpr std::size_t NONCE_LEN = 12;
    static constexpr std::size_t TAG_LEN   = 16;

private:
    std::vector<std::uint8_t> m_key;
};
