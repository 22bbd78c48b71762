#include "SecretManager.hpp"
#include "BundleDatabase.hpp"
#include "ChallengeResponseProvider.hpp"
#include "EnvelopeCodec.hpp"
#include "KeyDerivation.hpp"
#include "VaultError.hpp"
#include "Log.hpp"

#include <openssl/crypto.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
    // UTC now in ISO-8601 "YYYY-MM-DDTHH:MM:SSZ"
    std::string now_utc_iso8601() {
        using namespace std::chrono;
        auto now  = system_clock::now();
        auto secs = time_point_cast<seconds>(now);
        std::time_t t = system_clock::to_time_t(secs);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string describe(const std::string& deviceId, const std::string& context) {
        return "token " + deviceId + (context.empty() ? std::string(" (default context)")
                                                      : " context '" + context + "'");
    }

    void scrub(std::vector<std::uint8_t>& v) { OPENSSL_cleanse(v.data(), v.size()); }
    void scrub(std::string& s) { OPENSSL_cleanse(&s[0], s.size()); }

    // The KDF info separates context and serial with a 0x00
    void checkContext(const std::string& context) {
        if (context.find('\0') != std::string::npos) {
            throw VaultError(ErrorCode::InvalidInput, "context must not contain NUL bytes");
        }
    }
}

SecretManager::SecretManager(ChallengeResponseProvider& provider, BundleDatabase& db, int slot)
: m_provider(provider), m_db(db), m_slot(slot)
{
    if (m_slot != 1 && m_slot != 2) {
        throw VaultError(ErrorCode::InvalidInput, "slot must be 1 or 2");
    }
}

std::string SecretManager::detectDevice() {
    return m_provider.identity();
}

std::string SecretManager::enroll(const std::string& context,
                                  const std::string& secret,
                                  const EnrollOptions& opts) {
    return enroll(context, SecretSource([&secret] { return std::optional<std::string>(secret); }), opts);
}

std::string SecretManager::enroll(const std::string& context,
                                  const SecretSource& secretSource,
                                  const EnrollOptions& opts) {
    checkContext(context);
    const std::string deviceId = m_provider.identity();

    // Fail before asking for the secret or a touch; re-checked under the lock below
    if (!opts.replace && m_db.load().countContext(deviceId, context) > 0) {
        throw VaultError(ErrorCode::AlreadyEnrolled, describe(deviceId, context) + " is already enrolled");
    }

    std::optional<std::string> secret;
    if (secretSource) secret = secretSource();
    if (!secret) {
        throw VaultError(ErrorCode::InvalidInput, "no secret entered");
    }
    if (secret->empty()) {
        throw VaultError(ErrorCode::InvalidInput, "refusing to enroll an empty secret");
    }

    std::optional<std::string> passphrase = opts.passphrase;
    if (!passphrase && opts.askPassphrase) {
        passphrase = opts.askPassphrase();
        if (!passphrase) {
            scrub(*secret);
            throw VaultError(ErrorCode::InvalidInput, "no passphrase entered");
        }
    }
    if (passphrase && passphrase->empty()) {
        scrub(*secret);
        throw VaultError(ErrorCode::InvalidInput, "passphrase must not be empty");
    }

    Envelope env;
    env.context    = context;
    env.salt       = KeyDerivation::randomSalt();
    env.passphrase = passphrase.has_value();
    env.createdAt  = now_utc_iso8601();

    {
        auto key = KeyDerivation::deriveKey(m_provider, m_slot, deviceId, context, env.salt, passphrase);
        if (passphrase) scrub(*passphrase);
        EnvelopeCodec codec(key);
        scrub(key);

        std::vector<std::uint8_t> plaintext(secret->begin(), secret->end());
        scrub(*secret);
        auto sealed = codec.encrypt(plaintext);
        scrub(plaintext);

        env.nonce      = std::move(sealed.nonce);
        env.ciphertext = std::move(sealed.ciphertext);
        env.tag        = std::move(sealed.tag);
    }

    BundleDatabase::Transaction tx(m_db);
    BundleStore store = m_db.load();
    const auto existing = store.countContext(deviceId, context);
    if (existing > 0) {
        if (!opts.replace) {
            throw VaultError(ErrorCode::AlreadyEnrolled, describe(deviceId, context) + " is already enrolled");
        }
        store.removeContext(deviceId, context);
        Log::info("replacing " + std::to_string(existing) + " earlier envelope(s) for " + describe(deviceId, context));
    }
    store.insert(deviceId, std::move(env));
    m_db.save(store);
    tx.commit();

    Log::info("enrolled " + describe(deviceId, context));
    return deviceId;
}

std::optional<std::string> SecretManager::recover(const std::string& context,
                                                  const PassphraseSource& passphrase) {
    checkContext(context);
    const std::string deviceId = m_provider.identity();

    const auto env = m_db.load().lookup(deviceId, context);
    if (!env) {
        Log::info("nothing enrolled for " + describe(deviceId, context));
        return std::nullopt;
    }

    std::optional<std::string> secondFactor;
    if (env->passphrase) {
        if (passphrase) secondFactor = passphrase();
        if (!secondFactor) {
            throw VaultError(ErrorCode::InvalidInput, describe(deviceId, context) + " needs its passphrase");
        }
    }

    auto key = KeyDerivation::deriveKey(m_provider, m_slot, deviceId, context, env->salt, secondFactor);
    if (secondFactor) scrub(*secondFactor);
    EnvelopeCodec codec(key);
    scrub(key);

    auto plaintext = codec.decrypt(env->ciphertext, env->nonce, env->tag);
    std::string secret(plaintext.begin(), plaintext.end());
    scrub(plaintext);
    return secret;
}

void SecretManager::removeDevice(const std::string& deviceId) {
    BundleDatabase::Transaction tx(m_db);
    BundleStore store = m_db.load();
    if (!store.remove(deviceId)) {
        throw VaultError(ErrorCode::NotFound, "token " + deviceId + " is not registered");
    }
    m_db.save(store);
    tx.commit();
    Log::info("removed token " + deviceId);
}

std::size_t SecretManager::removeContext(const std::string& deviceId, const std::string& context) {
    BundleDatabase::Transaction tx(m_db);
    BundleStore store = m_db.load();
    const auto removed = store.removeContext(deviceId, context);
    if (removed == 0) {
        throw VaultError(ErrorCode::NotFound, describe(deviceId, context) + " is not enrolled");
    }
    m_db.save(store);
    tx.commit();
    Log::info("removed " + std::to_string(removed) + " envelope(s) for " + describe(deviceId, context));
    return removed;
}

std::optional<std::string> SecretManager::removeConnected(const std::optional<std::string>& context,
                                                          const ConfirmRemoval& confirm) {
    const std::string deviceId = m_provider.identity();

    const BundleStore store = m_db.load();
    if (context ? store.countContext(deviceId, *context) == 0 : !store.contains(deviceId)) {
        throw VaultError(ErrorCode::NotFound,
                         (context ? describe(deviceId, *context) : "token " + deviceId)
                         + " is not registered");
    }

    if (!confirm || !confirm(deviceId)) {
        Log::info("removal of token " + deviceId + " declined");
        return std::nullopt;
    }

    if (context) {
        removeContext(deviceId, *context);
    } else {
        removeDevice(deviceId);
    }
    return deviceId;
}

std::vector<DeviceSummary> SecretManager::list() const {
    return m_db.load().enumerate();
}
