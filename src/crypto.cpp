#include "crypto.hpp"
#include "errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace pbrelay {

static constexpr char kEnvelopeVersion = '1';

Key::Key(const std::array<unsigned char, kKeySize>& bytes)
    : bytes_(bytes), set_(true) {}

Key::~Key() { wipe(); }

Key::Key(Key&& other) noexcept : bytes_(other.bytes_), set_(other.set_) {
    other.wipe();
}

Key& Key::operator=(Key&& other) noexcept {
    if (this != &other) {
        wipe();
        bytes_ = other.bytes_;
        set_ = other.set_;
        other.wipe();
    }
    return *this;
}

void Key::wipe() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
    set_ = false;
}

void secure_clear(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
    s.clear();
}

// ── RAII cipher context ───────────────────────────────────────

struct CipherCtx {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();

    CipherCtx() = default;
    ~CipherCtx() { if (ctx) EVP_CIPHER_CTX_free(ctx); }
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;

    explicit operator bool() const { return ctx != nullptr; }
};

static const unsigned char* bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

Key derive_key(const std::string& secret, const std::string& salt, uint32_t iterations) {
    std::array<unsigned char, kKeySize> out{};
    int rc = PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()),
                               bytes(salt), static_cast<int>(salt.size()),
                               static_cast<int>(iterations), EVP_sha256(),
                               static_cast<int>(out.size()), out.data());
    if (rc != 1) {
        throw std::runtime_error("PBKDF2 key derivation failed");
    }
    Key key(out);
    OPENSSL_cleanse(out.data(), out.size());
    return key;
}

std::string decrypt(const Key& key,
                    const std::string& ciphertext,
                    const std::string& nonce,
                    const std::string& tag) {
    using Reason = DecryptionFailure::Reason;
    if (key.empty())
        throw DecryptionFailure(Reason::BadKey, "no decryption key available");
    if (nonce.size() != kNonceSize)
        throw DecryptionFailure(Reason::BadKey, "invalid nonce size");
    if (tag.size() != kTagSize)
        throw DecryptionFailure(Reason::BadKey, "invalid tag size");

    CipherCtx c;
    if (!c) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_DecryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(c.ctx, nullptr, nullptr, key.data(), bytes(nonce)) != 1) {
        throw DecryptionFailure(Reason::BadKey, "cipher initialisation failed");
    }

    std::string plaintext(ciphertext.size(), '\0');
    int len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(c.ctx, reinterpret_cast<unsigned char*>(&plaintext[0]), &len,
                          bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
        secure_clear(plaintext);
        throw DecryptionFailure(Reason::AuthenticationFailed, "decrypt update failed");
    }
    size_t total = static_cast<size_t>(len);

    // The tag is only read by EVP; the const_cast matches the C API signature.
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            const_cast<char*>(tag.data())) != 1) {
        secure_clear(plaintext);
        throw DecryptionFailure(Reason::BadKey, "could not set authentication tag");
    }

    int final_len = 0;
    unsigned char tail[16];
    if (EVP_DecryptFinal_ex(c.ctx, tail, &final_len) <= 0) {
        secure_clear(plaintext);
        throw DecryptionFailure(Reason::AuthenticationFailed,
                                "authentication tag mismatch");
    }
    plaintext.resize(total);
    return plaintext;
}

std::string decrypt_message(const Key& key, const std::string& blob) {
    if (blob.size() < 1 + kTagSize + kNonceSize || blob[0] != kEnvelopeVersion) {
        throw DecryptionFailure(DecryptionFailure::Reason::BadKey,
                                "unsupported encryption envelope");
    }
    std::string tag = blob.substr(1, kTagSize);
    std::string nonce = blob.substr(1 + kTagSize, kNonceSize);
    std::string ciphertext = blob.substr(1 + kTagSize + kNonceSize);
    return decrypt(key, ciphertext, nonce, tag);
}

std::string encrypt(const Key& key, const std::string& plaintext, const std::string& nonce) {
    if (key.empty() || nonce.size() != kNonceSize) {
        throw std::invalid_argument("encrypt: missing key or bad nonce size");
    }

    CipherCtx c;
    if (!c) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

    if (EVP_EncryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(c.ctx, nullptr, nullptr, key.data(), bytes(nonce)) != 1) {
        throw std::runtime_error("encrypt: cipher initialisation failed");
    }

    std::string ciphertext(plaintext.size(), '\0');
    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(c.ctx, reinterpret_cast<unsigned char*>(&ciphertext[0]), &len,
                          bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("encrypt: update failed");
    }

    int final_len = 0;
    unsigned char tail[16];
    if (EVP_EncryptFinal_ex(c.ctx, tail, &final_len) != 1) {
        throw std::runtime_error("encrypt: finalisation failed");
    }

    unsigned char tag[kTagSize];
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag) != 1) {
        throw std::runtime_error("encrypt: could not read tag");
    }

    std::string blob;
    blob.reserve(1 + kTagSize + kNonceSize + ciphertext.size());
    blob += kEnvelopeVersion;
    blob.append(reinterpret_cast<const char*>(tag), kTagSize);
    blob += nonce;
    blob += ciphertext;
    return blob;
}

} // namespace pbrelay
