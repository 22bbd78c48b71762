#pragma once
#include <cstdint>
#include <string>
#include <vector>

// One protected secret. Immutable once persisted; re-enrollment writes a new one.
struct Envelope {
    std::string context;                   // may be empty
    std::vector<std::uint8_t> salt;        // 32 bytes, fresh per envelope
    std::vector<std::uint8_t> nonce;       // 12 bytes, fresh per encryption
    std::vector<std::uint8_t> ciphertext;  // same length as the plaintext
    std::vector<std::uint8_t> tag;         // 16 bytes
    bool passphrase = false;               // Argon2id passphrase mixed into the key
    std::string createdAt;                 // ISO-8601 (UTC)
};

inline bool operator==(const Envelope& a, const Envelope& b) {
    return a.context == b.context && a.salt == b.salt && a.nonce == b.nonce
        && a.ciphertext == b.ciphertext && a.tag == b.tag
        && a.passphrase == b.passphrase && a.createdAt == b.createdAt;
}

inline bool operator!=(const Envelope& a, const Envelope& b) { return !(a == b); }
