// tests/bundle_store.cpp
#include <catch2/catch_all.hpp>
#include "BundleStore.hpp"

static Envelope makeEnvelope(const std::string& context, std::uint8_t marker) {
    Envelope e;
    e.context    = context;
    e.salt       = std::vector<std::uint8_t>(32, marker);
    e.nonce      = std::vector<std::uint8_t>(12, marker);
    e.ciphertext = std::vector<std::uint8_t>(5, marker);
    e.tag        = std::vector<std::uint8_t>(16, marker);
    e.createdAt  = "2025-01-01T00:00:00Z";
    return e;
}

TEST_CASE("BundleStore: lookup by device and context", "[store]") {
    BundleStore store;
    REQUIRE(store.empty());
    REQUIRE_FALSE(store.lookup("16166389", "").has_value());

    store.insert("16166389", makeEnvelope("", 0x01));
    store.insert("16166389", makeEnvelope("mail", 0x02));
    store.insert("20000001", makeEnvelope("", 0x03));

    auto a = store.lookup("16166389", "");
    REQUIRE(a.has_value());
    REQUIRE(a->salt[0] == 0x01);

    auto b = store.lookup("16166389", "mail");
    REQUIRE(b.has_value());
    REQUIRE(b->salt[0] == 0x02);

    REQUIRE_FALSE(store.lookup("16166389", "bank").has_value());
    REQUIRE_FALSE(store.lookup("99999999", "").has_value());
    REQUIRE(store.lookup("20000001", "")->salt[0] == 0x03);
}

TEST_CASE("BundleStore: duplicate contexts resolve to the newest generation", "[store]") {
    BundleStore store;
    store.insert("16166389", makeEnvelope("mail", 0x01));
    store.insert("16166389", makeEnvelope("other", 0x02));
    store.insert("16166389", makeEnvelope("mail", 0x03));

    REQUIRE(store.countContext("16166389", "mail") == 2);
    REQUIRE(store.lookup("16166389", "mail")->salt[0] == 0x03);
}

TEST_CASE("BundleStore: removal is device-granular, with a per-context variant", "[store]") {
    BundleStore store;
    store.insert("16166389", makeEnvelope("", 0x01));
    store.insert("16166389", makeEnvelope("mail", 0x02));
    store.insert("16166389", makeEnvelope("mail", 0x03));
    store.insert("20000001", makeEnvelope("mail", 0x04));

    SECTION("remove device") {
        REQUIRE(store.remove("16166389"));
        REQUIRE_FALSE(store.contains("16166389"));
        REQUIRE(store.contains("20000001"));
        REQUIRE_FALSE(store.remove("16166389"));
    }
    SECTION("remove one context") {
        REQUIRE(store.removeContext("16166389", "mail") == 2);
        REQUIRE_FALSE(store.lookup("16166389", "mail").has_value());
        REQUIRE(store.lookup("16166389", "").has_value());
        REQUIRE(store.lookup("20000001", "mail").has_value());
        REQUIRE(store.removeContext("16166389", "mail") == 0);
    }
    SECTION("last context takes the device entry with it") {
        REQUIRE(store.removeContext("20000001", "mail") == 1);
        REQUIRE_FALSE(store.contains("20000001"));
    }
}

TEST_CASE("BundleStore: enumerate lists devices and contexts in order", "[store]") {
    BundleStore store;
    store.insert("20000001", makeEnvelope("vpn", 0x01));
    store.insert("16166389", makeEnvelope("", 0x02));
    store.insert("16166389", makeEnvelope("mail", 0x03));

    auto listing = store.enumerate();
    REQUIRE(listing.size() == 2);
    REQUIRE(listing[0].deviceId == "16166389");
    REQUIRE(listing[0].contexts == std::vector<std::string>{"", "mail"});
    REQUIRE(listing[0].createdAt.size() == 2);
    REQUIRE(listing[1].deviceId == "20000001");
    REQUIRE(listing[1].contexts == std::vector<std::string>{"vpn"});
}
