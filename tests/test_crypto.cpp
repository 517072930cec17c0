#include <catch2/catch.hpp>
#include "crypto.hpp"
#include "errors.hpp"
#include <cstdio>
#include <string>

using namespace pbrelay;

static std::string hex(const unsigned char* data, size_t len) {
    std::string out;
    char buf[3];
    for (size_t i = 0; i < len; i++) {
        std::snprintf(buf, sizeof(buf), "%02x", data[i]);
        out += buf;
    }
    return out;
}

static const std::string kNonce = "0123456789ab";

// ── Key derivation ──────────────────────────────────────────────

TEST_CASE("derive_key: PBKDF2-HMAC-SHA256 reference vector", "[crypto]") {
    // RFC 7914 section 11, first 32 bytes
    Key key = derive_key("passwd", "salt", 1);
    REQUIRE_FALSE(key.empty());
    REQUIRE(hex(key.data(), kKeySize) ==
            "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc");
}

TEST_CASE("derive_key: deterministic and salt dependent", "[crypto]") {
    Key a = derive_key("hunter2", "ujabc", 1000);
    Key b = derive_key("hunter2", "ujabc", 1000);
    Key c = derive_key("hunter2", "ujxyz", 1000);
    REQUIRE(hex(a.data(), kKeySize) == hex(b.data(), kKeySize));
    REQUIRE(hex(a.data(), kKeySize) != hex(c.data(), kKeySize));
}

TEST_CASE("Key: moved-from key is empty", "[crypto]") {
    Key a = derive_key("pw", "salt", 1);
    Key b = std::move(a);
    REQUIRE(a.empty());
    REQUIRE_FALSE(b.empty());
}

// ── Seal and open ───────────────────────────────────────────────

TEST_CASE("decrypt_message: opens what encrypt sealed", "[crypto]") {
    Key key = derive_key("pw", "ujabc", 1);
    std::string blob = encrypt(key, R"({"type":"mirror"})", kNonce);

    REQUIRE(blob[0] == '1');
    REQUIRE(blob.size() == 1 + kTagSize + kNonceSize + 17);
    REQUIRE(decrypt_message(key, blob) == R"({"type":"mirror"})");
}

TEST_CASE("decrypt_message: empty plaintext", "[crypto]") {
    Key key = derive_key("pw", "ujabc", 1);
    REQUIRE(decrypt_message(key, encrypt(key, "", kNonce)).empty());
}

TEST_CASE("decrypt_message: tampered ciphertext fails authentication", "[crypto]") {
    Key key = derive_key("pw", "ujabc", 1);
    std::string blob = encrypt(key, "secret body", kNonce);
    blob.back() ^= 0x01;

    try {
        decrypt_message(key, blob);
        FAIL("expected DecryptionFailure");
    } catch (const DecryptionFailure& e) {
        REQUIRE(e.reason() == DecryptionFailure::Reason::AuthenticationFailed);
    }
}

TEST_CASE("decrypt_message: wrong password fails authentication", "[crypto]") {
    Key right = derive_key("right", "ujabc", 1);
    Key wrong = derive_key("wrong", "ujabc", 1);
    std::string blob = encrypt(right, "secret body", kNonce);

    try {
        decrypt_message(wrong, blob);
        FAIL("expected DecryptionFailure");
    } catch (const DecryptionFailure& e) {
        REQUIRE(e.reason() == DecryptionFailure::Reason::AuthenticationFailed);
    }
}

TEST_CASE("decrypt_message: bad envelope is a key problem", "[crypto]") {
    Key key = derive_key("pw", "ujabc", 1);
    std::string blob = encrypt(key, "x", kNonce);

    std::string wrong_version = blob;
    wrong_version[0] = '2';
    try {
        decrypt_message(key, wrong_version);
        FAIL("expected DecryptionFailure");
    } catch (const DecryptionFailure& e) {
        REQUIRE(e.reason() == DecryptionFailure::Reason::BadKey);
    }

    REQUIRE_THROWS_AS(decrypt_message(key, "1short"), DecryptionFailure);
}

TEST_CASE("decrypt: empty key or bad sizes", "[crypto]") {
    Key none;
    std::string tag(kTagSize, '\0');
    try {
        decrypt(none, "abc", kNonce, tag);
        FAIL("expected DecryptionFailure");
    } catch (const DecryptionFailure& e) {
        REQUIRE(e.reason() == DecryptionFailure::Reason::BadKey);
    }

    Key key = derive_key("pw", "salt", 1);
    REQUIRE_THROWS_AS(decrypt(key, "abc", "short", tag), DecryptionFailure);
    REQUIRE_THROWS_AS(decrypt(key, "abc", kNonce, "short"), DecryptionFailure);
}

TEST_CASE("encrypt: rejects missing key and bad nonce", "[crypto]") {
    Key none;
    REQUIRE_THROWS_AS(encrypt(none, "x", kNonce), std::invalid_argument);
    Key key = derive_key("pw", "salt", 1);
    REQUIRE_THROWS_AS(encrypt(key, "x", "short"), std::invalid_argument);
}

// ── secure_clear ────────────────────────────────────────────────

TEST_CASE("secure_clear: empties the buffer", "[crypto]") {
    std::string secret = "plaintext body";
    secure_clear(secret);
    REQUIRE(secret.empty());

    std::string empty;
    secure_clear(empty);
    REQUIRE(empty.empty());
}
