#pragma once
#include "BundleStore.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

class ChallengeResponseProvider;
class BundleDatabase;

// Enroll / recover / remove / list on top of the provider, key derivation,
// codec and store. Every call is one short transaction; nothing is cached
// between calls.
//
// Duplicate policy: enrolling a (token, context) pair that already exists is
// rejected with AlreadyEnrolled unless `replace` is set, in which case the old
// generations for that context are dropped in the same transaction. Stores
// that still hold several generations (written by older tools) resolve to
// the most recently inserted one; recovery decrypts only that one and never
// falls back to an older generation after an authentication failure.
// Declared outside SecretManager so its default member initializers are
// usable in SecretManager's default arguments.
struct SecretManagerEnrollOptions {
    bool replace = false;
    std::optional<std::string> passphrase;
    std::function<std::optional<std::string>()> askPassphrase;   // used after the secret when `passphrase` is unset
};

class SecretManager {
public:
    // Asked only when the stored envelope needs a passphrase; nullopt = cancelled
    using PassphraseSource = std::function<std::optional<std::string>()>;

    // Asked for the secret once the token and the target context check out
    using SecretSource = std::function<std::optional<std::string>()>;

    // Shown the serial of the connected token; false keeps everything
    using ConfirmRemoval = std::function<bool(const std::string& deviceId)>;

    using EnrollOptions = SecretManagerEnrollOptions;

    SecretManager(ChallengeResponseProvider& provider, BundleDatabase& db, int slot);

    // Returns the serial of the token the secret is now bound to. The token
    // and the duplicate check come first; `secret` is only asked after both
    // pass. Contexts may not contain NUL bytes.
    std::string enroll(const std::string& context,
                       const SecretSource& secret,
                       const EnrollOptions& opts = {});

    std::string enroll(const std::string& context,
                       const std::string& secret,
                       const EnrollOptions& opts = {});

    // nullopt when nothing is enrolled for (connected token, context).
    // Throws VaultError(AuthenticationFailed) if the envelope does not verify.
    std::optional<std::string> recover(const std::string& context,
                                       const PassphraseSource& passphrase = {});

    // Serial of the connected token
    std::string detectDevice();

    // Throws VaultError(NotFound) if the device has no entry.
    void removeDevice(const std::string& deviceId);

    // Returns the number of envelopes dropped; NotFound if none matched.
    std::size_t removeContext(const std::string& deviceId, const std::string& context);

    // Removes the connected token's entry (or one context of it when given)
    // after `confirm` agrees. Returns the serial, or nullopt if declined.
    // NotFound is raised before anything is asked.
    std::optional<std::string> removeConnected(const std::optional<std::string>& context,
                                               const ConfirmRemoval& confirm);

    std::vector<DeviceSummary> list() const;

private:
    ChallengeResponseProvider& m_provider;
    BundleDatabase&            m_db;
    int                        m_slot;
};
