#include "KeyDerivation.hpp"
#include "ChallengeResponseProvider.hpp"
#include "VaultError.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <argon2.h>
#include <memory>
#include <stdexcept>

std::vector<std::uint8_t> KeyDerivation::randomSalt() {
    std::vector<std::uint8_t> salt(SALT_LEN);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed for envelope salt");
    }
    return salt;
}

std::vector<std::uint8_t> KeyDerivation::buildChallenge(const std::vector<std::uint8_t>& salt) {
    if (salt.size() != SALT_LEN) {
        throw VaultError(ErrorCode::InvalidInput, "buildChallenge: salt must be 32 bytes");
    }
    const std::size_t tagLen = sizeof(DOMAIN_TAG) - 1; // no NUL
    std::vector<std::uint8_t> challenge(DOMAIN_TAG, DOMAIN_TAG + tagLen);
    challenge.insert(challenge.end(), salt.begin(), salt.end());
    return challenge;
}

std::vector<std::uint8_t> KeyDerivation::stretchPassphrase(
    const std::string& passphrase,
    const std::vector<std::uint8_t>& salt
) {
    std::vector<std::uint8_t> out(KEY_LEN);
    int rc = argon2id_hash_raw(
        T_COST,
        M_COST_KiB,
        PARALLELISM,
        passphrase.data(), passphrase.size(),
        salt.data(), salt.size(),
        out.data(), out.size()
    );
    if (rc != ARGON2_OK) {
        throw std::runtime_error(std::string("argon2id_hash_raw failed: ")
                                 + argon2_error_message(rc));
    }
    return out;
}

std::vector<std::uint8_t> KeyDerivation::expandResponse(
    const std::vector<std::uint8_t>& response,
    const std::vector<std::uint8_t>& salt,
    const std::string& context,
    const std::string& deviceId,
    const std::optional<std::string>& passphrase
) {
    if (response.size() != ChallengeResponseProvider::RESPONSE_LEN) {
        throw VaultError(ErrorCode::ProviderError,
                         "token response has unexpected length " + std::to_string(response.size()));
    }
    if (salt.size() != SALT_LEN) {
        throw VaultError(ErrorCode::InvalidInput, "expandResponse: salt must be 32 bytes");
    }
    // A NUL inside the context would make the info framing ambiguous
    if (context.find('\0') != std::string::npos) {
        throw VaultError(ErrorCode::InvalidInput, "expandResponse: context contains a NUL byte");
    }

    std::vector<std::uint8_t> ikm(response);
    if (passphrase) {
        auto stretched = stretchPassphrase(*passphrase, salt);
        ikm.insert(ikm.end(), stretched.begin(), stretched.end());
        OPENSSL_cleanse(stretched.data(), stretched.size());
    }

    // info = context || 0x00 || deviceId
    std::vector<std::uint8_t> info(context.begin(), context.end());
    info.push_back(0x00);
    info.insert(info.end(), deviceId.begin(), deviceId.end());

    EVP_PKEY_CTX* raw = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!raw) throw std::runtime_error("EVP_PKEY_CTX_new_id(HKDF) failed");
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> pctx(raw, &EVP_PKEY_CTX_free);

    if (EVP_PKEY_derive_init(pctx.get()) != 1)
        throw std::runtime_error("HKDF derive_init failed");
    if (EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) != 1)
        throw std::runtime_error("HKDF set_md failed");
    if (EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt.data(), static_cast<int>(salt.size())) != 1)
        throw std::runtime_error("HKDF set salt failed");
    if (EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), ikm.data(), static_cast<int>(ikm.size())) != 1)
        throw std::runtime_error("HKDF set key failed");
    if (EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), info.data(), static_cast<int>(info.size())) != 1)
        throw std::runtime_error("HKDF add info failed");

    std::vector<std::uint8_t> key(KEY_LEN);
    std::size_t keyLen = key.size();
    if (EVP_PKEY_derive(pctx.get(), key.data(), &keyLen) != 1 || keyLen != KEY_LEN) {
        throw std::runtime_error("HKDF derive failed");
    }

    OPENSSL_cleanse(ikm.data(), ikm.size());
    return key;
}

std::vector<std::uint8_t> KeyDerivation::deriveKey(
    ChallengeResponseProvider& provider,
    int slot,
    const std::string& deviceId,
    const std::string& context,
    const std::vector<std::uint8_t>& salt,
    const std::optional<std::string>& passphrase
) {
    const auto challenge = buildChallenge(salt);
    auto response = provider.challengeResponse(slot, challenge);
    auto key = expandResponse(response, salt, context, deviceId, passphrase);
    OPENSSL_cleanse(response.data(), response.size());
    return key;
}
