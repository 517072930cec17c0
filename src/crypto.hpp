#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pbrelay {

constexpr size_t kKeySize = 32;
constexpr size_t kNonceSize = 12;
constexpr size_t kTagSize = 16;
constexpr uint32_t kPbkdf2Iterations = 30000;

// Symmetric key held in memory only. Cleansed on destruction, move-only.
class Key {
public:
    Key() = default;
    explicit Key(const std::array<unsigned char, kKeySize>& bytes);
    ~Key();

    Key(const Key&) = delete;
    Key& operator=(const Key&) = delete;
    Key(Key&& other) noexcept;
    Key& operator=(Key&& other) noexcept;

    bool empty() const { return !set_; }
    const unsigned char* data() const { return bytes_.data(); }

private:
    void wipe();

    std::array<unsigned char, kKeySize> bytes_{};
    bool set_ = false;
};

// PBKDF2-HMAC-SHA256 with a 32-byte output. Pure and deterministic.
Key derive_key(const std::string& secret, const std::string& salt,
               uint32_t iterations = kPbkdf2Iterations);

// AES-256-GCM open. Throws DecryptionFailure:
//   BadKey               - empty key, wrong nonce or tag size
//   AuthenticationFailed - tag mismatch (wrong password or tampered data)
std::string decrypt(const Key& key,
                    const std::string& ciphertext,
                    const std::string& nonce,
                    const std::string& tag);

// Envelope used by the push service: '1' | tag(16) | nonce(12) | ciphertext.
std::string decrypt_message(const Key& key, const std::string& blob);

// Seal plaintext into the same envelope. nonce must be kNonceSize bytes.
std::string encrypt(const Key& key, const std::string& plaintext, const std::string& nonce);

// Overwrite and empty a buffer that held secret material.
void secure_clear(std::string& s);

} // namespace pbrelay
