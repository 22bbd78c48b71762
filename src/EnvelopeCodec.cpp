#include "EnvelopeCodec.hpp"
#include "VaultError.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <memory>

namespace {
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    CipherCtx newCipherCtx() {
        EVP_CIPHER_CTX* raw = EVP_CIPHER_CTX_new();
        if (!raw) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        return CipherCtx(raw, &EVP_CIPHER_CTX_free);
    }

    [[noreturn]] void authFailed() {
        throw VaultError(ErrorCode::AuthenticationFailed, "envelope authentication failed");
    }
}

EnvelopeCodec::EnvelopeCodec(const std::vector<std::uint8_t>& key)
: m_key(key)
{
    if (m_key.size() != KEY_LEN) {
        throw std::invalid_argument("EnvelopeCodec: key must be 32 bytes");
    }
}

EnvelopeCodec::~EnvelopeCodec() {
    OPENSSL_cleanse(m_key.data(), m_key.size());
}

EnvelopeCodec::Sealed EnvelopeCodec::encrypt(const std::vector<std::uint8_t>& plaintext) const {
    Sealed out;
    out.nonce.resize(NONCE_LEN);
    if (RAND_bytes(out.nonce.data(), static_cast<int>(out.nonce.size())) != 1) {
        throw std::runtime_error("encrypt: RAND_bytes(nonce) failed");
    }

    // GCM is a stream mode: ciphertext is exactly as long as the plaintext
    out.ciphertext.resize(plaintext.size());
    out.tag.resize(TAG_LEN);

    auto ctx = newCipherCtx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EncryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), out.nonce.data()) != 1)
        throw std::runtime_error("EncryptInit key/nonce failed");

    int outLen1 = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(),
                              out.ciphertext.data(), &outLen1,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("EncryptUpdate data failed");
        }
    }

    // GCM emits nothing at Final; pass a scratch buffer so an empty
    // plaintext never hands OpenSSL a null output pointer
    unsigned char finalBuf[16];
    int outLen2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), finalBuf, &outLen2) != 1) {
        throw std::runtime_error("EncryptFinal failed");
    }
    if (static_cast<std::size_t>(outLen1 + outLen2) != plaintext.size() || outLen2 != 0) {
        throw std::runtime_error("encrypt: unexpected ciphertext length");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN, out.tag.data()) != 1)
        throw std::runtime_error("GET_TAG failed");

    return out;
}

std::vector<std::uint8_t> EnvelopeCodec::decrypt(
    const std::vector<std::uint8_t>& ciphertext,
    const std::vector<std::uint8_t>& nonce,
    const std::vector<std::uint8_t>& tag
) const {
    // Malformed envelopes are indistinguishable from forged ones.
    if (nonce.size() != NONCE_LEN || tag.size() != TAG_LEN) {
        authFailed();
    }

    // Decrypt into scratch space; only handed out after the tag verifies.
    std::vector<std::uint8_t> scratch(ciphertext.size());

    auto ctx = newCipherCtx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("DecryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), nonce.data()) != 1)
        throw std::runtime_error("DecryptInit key/nonce failed");

    int pLen1 = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), scratch.data(), &pLen1,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            OPENSSL_cleanse(scratch.data(), scratch.size());
            authFailed();
        }
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN,
                            const_cast<std::uint8_t*>(tag.data())) != 1) {
        OPENSSL_cleanse(scratch.data(), scratch.size());
        throw std::runtime_error("SET_TAG failed");
    }

    unsigned char finalBuf[16];
    int pLen2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), finalBuf, &pLen2) != 1) {
        OPENSSL_cleanse(scratch.data(), scratch.size());
        authFailed();
    }

    scratch.resize(static_cast<std::size_t>(pLen1));
    return scratch;
}
