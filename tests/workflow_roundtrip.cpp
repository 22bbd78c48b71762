// tests/workflow_roundtrip.cpp
#include <catch2/catch_all.hpp>
#include "BundleDatabase.hpp"
#include "EnvelopeCodec.hpp"
#include "KeyDerivation.hpp"
#include "ScriptedProvider.hpp"
#include "SecretManager.hpp"
#include "VaultError.hpp"

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace {
    const std::string kSerial = "16166389";
    const std::string kSecret = "correct horse battery staple";

    ErrorCode codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const VaultError& e) {
            return e.code();
        }
        FAIL("expected a VaultError");
        return ErrorCode::InvalidInput;
    }

    // Envelope sealed the way enroll() would, for building multi-generation stores
    Envelope sealFor(ChallengeResponseProvider& token, const std::string& serial,
                     const std::string& context, const std::string& secret) {
        Envelope e;
        e.context = context;
        e.salt = KeyDerivation::randomSalt();
        e.createdAt = "2025-01-01T00:00:00Z";
        EnvelopeCodec codec(KeyDerivation::deriveKey(token, 2, serial, context, e.salt));
        auto sealed = codec.encrypt(std::vector<std::uint8_t>(secret.begin(), secret.end()));
        e.nonce = sealed.nonce;
        e.ciphertext = sealed.ciphertext;
        e.tag = sealed.tag;
        return e;
    }
}

TEST_CASE("Workflow: enroll and recover with an all-zero token response", "[workflow][scenario]") {
    ScriptedProvider token(kSerial);   // responds with 20 zero bytes
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    REQUIRE(secrets.enroll("", kSecret) == kSerial);

    SECTION("recovery returns the secret") {
        auto pt = secrets.recover("");
        REQUIRE(pt.has_value());
        REQUIRE(*pt == kSecret);
    }

    SECTION("unenrolled context is not found") {
        REQUIRE_FALSE(secrets.recover("mail").has_value());
    }

    SECTION("corrupted tag fails authentication") {
        BundleStore store = db.load();
        Envelope env = *store.lookup(kSerial, "");
        env.tag.back() ^= 0x01;
        store.remove(kSerial);
        store.insert(kSerial, env);
        db.save(store);

        REQUIRE(codeOf([&] { secrets.recover(""); }) == ErrorCode::AuthenticationFailed);
    }
}

TEST_CASE("Workflow: recovery is repeatable and read-only", "[workflow]") {
    auto token = ScriptedProvider::hmac(kSerial, std::vector<std::uint8_t>(20, 0x5C));
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    secrets.enroll("vault", kSecret);
    const BundleStore before = db.load();

    auto first = secrets.recover("vault");
    auto second = secrets.recover("vault");
    REQUIRE(first.has_value());
    REQUIRE(first == second);
    REQUIRE(db.load() == before);
}

TEST_CASE("Workflow: duplicate enrollment policy", "[workflow]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    secrets.enroll("mail", "first secret");

    SECTION("second enroll for the same context is rejected before touching the token") {
        const int touches = token.challengeCalls;
        REQUIRE(codeOf([&] { secrets.enroll("mail", "second secret"); }) == ErrorCode::AlreadyEnrolled);
        REQUIRE(token.challengeCalls == touches);
        REQUIRE(*secrets.recover("mail") == "first secret");
    }

    SECTION("replace swaps the generation in one step") {
        SecretManager::EnrollOptions opts;
        opts.replace = true;
        secrets.enroll("mail", "second secret", opts);

        REQUIRE(db.load().countContext(kSerial, "mail") == 1);
        REQUIRE(*secrets.recover("mail") == "second secret");
    }

    SECTION("other contexts on the same token are independent") {
        secrets.enroll("bank", "bank secret");
        REQUIRE(*secrets.recover("mail") == "first secret");
        REQUIRE(*secrets.recover("bank") == "bank secret");
    }
}

TEST_CASE("Workflow: several stored generations resolve to the newest only", "[workflow]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    SECTION("newest valid wins over an older broken one") {
        BundleStore store;
        auto older = sealFor(token, kSerial, "mail", "old secret");
        older.tag[0] ^= 0xFF;
        store.insert(kSerial, older);
        store.insert(kSerial, sealFor(token, kSerial, "mail", "new secret"));
        db.save(store);

        REQUIRE(*secrets.recover("mail") == "new secret");
    }

    SECTION("newest broken fails even though an older one would decrypt") {
        BundleStore store;
        store.insert(kSerial, sealFor(token, kSerial, "mail", "old secret"));
        auto newer = sealFor(token, kSerial, "mail", "new secret");
        newer.ciphertext[0] ^= 0x01;
        store.insert(kSerial, newer);
        db.save(store);

        REQUIRE(codeOf([&] { secrets.recover("mail"); }) == ErrorCode::AuthenticationFailed);
    }
}

TEST_CASE("Workflow: token problems abort without touching the store", "[workflow]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);
    secrets.enroll("", kSecret);
    const BundleStore before = db.load();

    SECTION("no token on enroll") {
        token.present = false;
        REQUIRE(codeOf([&] { secrets.enroll("mail", "x"); }) == ErrorCode::ProviderUnavailable);
    }
    SECTION("no token on recover") {
        token.present = false;
        REQUIRE(codeOf([&] { secrets.recover(""); }) == ErrorCode::ProviderUnavailable);
    }
    SECTION("touch refused on enroll") {
        token.refuseTouch = true;
        REQUIRE(codeOf([&] { secrets.enroll("mail", "x"); }) == ErrorCode::ProviderError);
    }
    SECTION("touch refused on recover") {
        token.refuseTouch = true;
        REQUIRE(codeOf([&] { secrets.recover(""); }) == ErrorCode::ProviderError);
    }
    SECTION("empty secret") {
        REQUIRE(codeOf([&] { secrets.enroll("mail", ""); }) == ErrorCode::InvalidInput);
    }

    REQUIRE(db.load() == before);
}

TEST_CASE("Workflow: envelopes are bound to the token that made them", "[workflow]") {
    auto tokenA = ScriptedProvider::hmac(kSerial, std::vector<std::uint8_t>(20, 0x01));
    BundleDatabase db(":memory:");
    db.init();
    SecretManager::EnrollOptions none;
    SecretManager(tokenA, db, 2).enroll("", kSecret, none);

    SECTION("a different token has nothing enrolled") {
        auto tokenB = ScriptedProvider::hmac("20000001", std::vector<std::uint8_t>(20, 0x01));
        SecretManager secretsB(tokenB, db, 2);
        REQUIRE_FALSE(secretsB.recover("").has_value());
    }
    SECTION("a token reporting the same serial with another secret cannot decrypt") {
        auto impostor = ScriptedProvider::hmac(kSerial, std::vector<std::uint8_t>(20, 0x02));
        SecretManager secretsX(impostor, db, 2);
        REQUIRE(codeOf([&] { secretsX.recover(""); }) == ErrorCode::AuthenticationFailed);
    }
}

TEST_CASE("Workflow: passphrase-protected envelope", "[workflow][argon2]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    SecretManager::EnrollOptions opts;
    opts.passphrase = std::string("Tr0ub4dor&3");
    secrets.enroll("", kSecret, opts);
    REQUIRE(db.load().lookup(kSerial, "")->passphrase);

    SECTION("right passphrase") {
        auto pt = secrets.recover("", [] { return std::optional<std::string>("Tr0ub4dor&3"); });
        REQUIRE(pt == kSecret);
    }
    SECTION("wrong passphrase") {
        REQUIRE(codeOf([&] {
            secrets.recover("", [] { return std::optional<std::string>("guess"); });
        }) == ErrorCode::AuthenticationFailed);
    }
    SECTION("no passphrase source") {
        REQUIRE(codeOf([&] { secrets.recover(""); }) == ErrorCode::InvalidInput);
    }
}

TEST_CASE("Workflow: remove and list", "[workflow]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    secrets.enroll("", kSecret);
    secrets.enroll("mail", "mail secret");

    auto listing = secrets.list();
    REQUIRE(listing.size() == 1);
    REQUIRE(listing[0].deviceId == kSerial);
    REQUIRE(listing[0].contexts == std::vector<std::string>{"", "mail"});

    SECTION("device removal takes every context") {
        REQUIRE(secrets.detectDevice() == kSerial);
        secrets.removeDevice(kSerial);
        REQUIRE_FALSE(secrets.recover("").has_value());
        REQUIRE_FALSE(secrets.recover("mail").has_value());
        REQUIRE(secrets.list().empty());
        REQUIRE(codeOf([&] { secrets.removeDevice(kSerial); }) == ErrorCode::NotFound);
    }
    SECTION("context removal keeps the rest") {
        REQUIRE(secrets.removeContext(kSerial, "mail") == 1);
        REQUIRE_FALSE(secrets.recover("mail").has_value());
        REQUIRE(*secrets.recover("") == kSecret);
        REQUIRE(codeOf([&] { secrets.removeContext(kSerial, "mail"); }) == ErrorCode::NotFound);
    }
    SECTION("removing an unknown serial needs no token") {
        token.present = false;
        REQUIRE(codeOf([&] { secrets.removeDevice("99999999"); }) == ErrorCode::NotFound);
    }
}

TEST_CASE("Workflow: two connections to one store file do not lose updates", "[workflow][db]") {
    const std::string path = "tmp_workflow_shared.sqlite";
    std::filesystem::remove(path);

    ScriptedProvider token(kSerial);
    BundleDatabase dbA(path);
    BundleDatabase dbB(path);
    dbA.init();
    dbB.init();
    SecretManager a(token, dbA, 2);
    SecretManager b(token, dbB, 2);

    a.enroll("one", "1");
    b.enroll("two", "2");
    a.enroll("three", "3");

    REQUIRE(*b.recover("one") == "1");
    REQUIRE(*a.recover("two") == "2");
    REQUIRE(dbB.load().enumerate()[0].contexts.size() == 3);
}

TEST_CASE("Workflow: 1000 enrollments never reuse a salt or nonce", "[workflow][slow]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    for (int i = 0; i < 1000; ++i) {
        secrets.enroll("ctx-" + std::to_string(i), "secret");
    }

    std::set<std::vector<std::uint8_t>> salts, nonces;
    for (const auto& [serial, envs] : db.load().devices()) {
        for (const auto& e : envs) {
            salts.insert(e.salt);
            nonces.insert(e.nonce);
        }
    }
    REQUIRE(salts.size() == 1000);
    REQUIRE(nonces.size() == 1000);
}

TEST_CASE("Workflow: enroll asks for the secret only after token and context check out", "[workflow][enroll]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);
    secrets.enroll("mail", "first secret");
    const BundleStore before = db.load();

    int asked = 0;
    SecretManager::SecretSource source = [&asked] {
        ++asked;
        return std::optional<std::string>("typed secret");
    };

    SECTION("no token: nothing is asked") {
        token.present = false;
        REQUIRE(codeOf([&] { secrets.enroll("bank", source); }) == ErrorCode::ProviderUnavailable);
        REQUIRE(asked == 0);
        REQUIRE(db.load() == before);
    }
    SECTION("context already enrolled: nothing is asked") {
        REQUIRE(codeOf([&] { secrets.enroll("mail", source); }) == ErrorCode::AlreadyEnrolled);
        REQUIRE(asked == 0);
        REQUIRE(token.challengeCalls == 1);
        REQUIRE(db.load() == before);
    }
    SECTION("prompt cancelled") {
        SecretManager::SecretSource cancelled = [] { return std::optional<std::string>(); };
        REQUIRE(codeOf([&] { secrets.enroll("bank", cancelled); }) == ErrorCode::InvalidInput);
        REQUIRE(db.load() == before);
    }
    SECTION("token present and context free: asked once, then sealed") {
        REQUIRE(secrets.enroll("bank", source) == kSerial);
        REQUIRE(asked == 1);
        REQUIRE(*secrets.recover("bank") == "typed secret");
    }
    SECTION("passphrase is asked after the secret") {
        std::vector<std::string> order;
        SecretManager::EnrollOptions opts;
        opts.askPassphrase = [&order] {
            order.push_back("passphrase");
            return std::optional<std::string>("pass");
        };
        SecretManager::SecretSource ordered = [&order] {
            order.push_back("secret");
            return std::optional<std::string>("typed secret");
        };
        secrets.enroll("bank", ordered, opts);
        REQUIRE(order == std::vector<std::string>{"secret", "passphrase"});
        REQUIRE(*secrets.recover("bank", [] { return std::optional<std::string>("pass"); }) == "typed secret");
    }
}

TEST_CASE("Workflow: removing the connected token needs confirmation", "[workflow][remove]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);
    secrets.enroll("", kSecret);
    secrets.enroll("mail", "mail secret");
    const BundleStore before = db.load();

    std::string shown;
    auto answer = [&shown](bool yes) {
        return SecretManager::ConfirmRemoval([&shown, yes](const std::string& serial) {
            shown = serial;
            return yes;
        });
    };

    SECTION("declined leaves the store unchanged") {
        REQUIRE_FALSE(secrets.removeConnected(std::nullopt, answer(false)).has_value());
        REQUIRE(shown == kSerial);
        REQUIRE(db.load() == before);
    }
    SECTION("confirmed removes the whole entry") {
        REQUIRE(secrets.removeConnected(std::nullopt, answer(true)) == kSerial);
        REQUIRE(shown == kSerial);
        REQUIRE(secrets.list().empty());
    }
    SECTION("confirmed with a context removes only that context") {
        REQUIRE(secrets.removeConnected(std::string("mail"), answer(true)) == kSerial);
        REQUIRE_FALSE(secrets.recover("mail").has_value());
        REQUIRE(*secrets.recover("") == kSecret);
    }
    SECTION("unregistered token is reported before asking") {
        token.setSerial("20000001");
        REQUIRE(codeOf([&] { secrets.removeConnected(std::nullopt, answer(true)); }) == ErrorCode::NotFound);
        REQUIRE(shown.empty());
        REQUIRE(db.load() == before);
    }
    SECTION("no token present") {
        token.present = false;
        REQUIRE(codeOf([&] { secrets.removeConnected(std::nullopt, answer(true)); })
                == ErrorCode::ProviderUnavailable);
        REQUIRE(shown.empty());
    }
    SECTION("an explicit serial needs neither token nor confirmation") {
        token.present = false;
        const int calls = token.identityCalls;
        secrets.removeDevice(kSerial);
        REQUIRE(token.identityCalls == calls);
        REQUIRE(secrets.list().empty());
    }
}

TEST_CASE("Workflow: contexts with NUL bytes are refused", "[workflow]") {
    ScriptedProvider token(kSerial);
    BundleDatabase db(":memory:");
    db.init();
    SecretManager secrets(token, db, 2);

    const std::string context("mail\0x", 6);
    REQUIRE(codeOf([&] { secrets.enroll(context, kSecret); }) == ErrorCode::InvalidInput);
    REQUIRE(codeOf([&] { secrets.recover(context); }) == ErrorCode::InvalidInput);
    REQUIRE(token.challengeCalls == 0);
    REQUIRE(db.load().empty());
}

TEST_CASE("Workflow: read-only store serves list and recover without creating files", "[workflow][readonly]") {
    const std::string path = "tmp_workflow_absent.sqlite";
    std::filesystem::remove(path);

    ScriptedProvider token(kSerial);
    BundleDatabase db(path, BundleDatabase::OpenMode::ReadOnly);
    db.init();
    SecretManager secrets(token, db, 2);

    REQUIRE(secrets.list().empty());
    REQUIRE_FALSE(secrets.recover("").has_value());
    REQUIRE_FALSE(std::filesystem::exists(path));
}
