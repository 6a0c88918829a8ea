/// @file crypto_primitives.cpp
/// @brief OpenSSL 3.x EVP implementation of the crypto primitives.

#include "latchkey/security/crypto_primitives.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

#include "latchkey/foundation/auth_logger.hpp"
#include "latchkey/security/encoding.hpp"

namespace latchkey::security::crypto {

using foundation::AuthError;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

struct Sealed {
    std::string ciphertext;
    std::string tag;
};

const unsigned char* asBytes(std::string_view s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

std::vector<std::string_view> splitFields(std::string_view text) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto sep = text.find(':', start);
        if (sep == std::string_view::npos) {
            fields.push_back(text.substr(start));
            return fields;
        }
        fields.push_back(text.substr(start, sep - start));
        start = sep + 1;
    }
}

AuthError malformed(std::string message) {
    return AuthError(ErrorCode::CryptoMalformedInput, std::move(message));
}

/// AES-256-GCM encryption with an explicit IV length.
std::optional<Sealed> gcmSeal(const uint8_t* key, std::string_view iv, std::string_view plaintext) {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::nullopt;
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, asBytes(iv)) != 1) {
        return std::nullopt;
    }

    Sealed sealed;
    sealed.ciphertext.resize(plaintext.size());
    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(sealed.ciphertext.data()),
                          &len, asBytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
        return std::nullopt;
    }
    int total = len;

    // GCM is a stream mode; final never emits extra bytes.
    unsigned char trailer[16];
    if (EVP_EncryptFinal_ex(ctx.get(), trailer, &len) != 1) {
        return std::nullopt;
    }
    sealed.ciphertext.resize(static_cast<std::size_t>(total));

    sealed.tag.resize(kGcmTagBytes);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagBytes),
                            sealed.tag.data()) != 1) {
        return std::nullopt;
    }
    return sealed;
}

/// AES-256-GCM decryption. Returns nullopt on any failure, including a
/// tag mismatch, so no unauthenticated plaintext escapes.
std::optional<std::string> gcmOpen(const uint8_t* key, std::string_view iv,
                                   std::string_view tag, std::string_view ciphertext) {
    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        return std::nullopt;
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, asBytes(iv)) != 1) {
        return std::nullopt;
    }

    std::string plaintext(ciphertext.size(), '\0');
    int len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len,
                          asBytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
        return std::nullopt;
    }
    int total = len;

    std::string tagCopy(tag);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tagCopy.size()),
                            tagCopy.data()) != 1) {
        return std::nullopt;
    }

    unsigned char trailer[16];
    if (EVP_DecryptFinal_ex(ctx.get(), trailer, &len) <= 0) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        return std::nullopt;
    }
    plaintext.resize(static_cast<std::size_t>(total));
    return plaintext;
}

} // namespace

// ---------------------------------------------------------------------------
// Random / hash / compare
// ---------------------------------------------------------------------------

std::string randomBytes(std::size_t count) {
    std::string buf(count, '\0');
    if (count > 0 &&
        RAND_bytes(reinterpret_cast<unsigned char*>(buf.data()), static_cast<int>(count)) != 1) {
        LATCHKEY_LOG_ERROR(LogCategory::Crypto, "system CSPRNG failed");
        throw CryptoException("RAND_bytes failed: " +
                              std::to_string(ERR_get_error()));
    }
    return buf;
}

std::string generateToken() {
    auto raw = randomBytes(kTokenBytes);
    auto token = encoding::toHex(raw);
    OPENSSL_cleanse(raw.data(), raw.size());
    return token;
}

std::string hash(std::string_view input) {
    DigestCtx ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        // Only reachable on allocation failure inside OpenSSL.
        throw CryptoException("SHA-256 digest failed");
    }
    return encoding::toHex(digest, digestLen);
}

bool constantTimeEquals(std::string_view a, std::string_view b) noexcept {
    const std::size_t length = a.size() > b.size() ? a.size() : b.size();
    volatile uint8_t diff = a.size() == b.size() ? 0 : 1;
    for (std::size_t i = 0; i < length; ++i) {
        auto x = i < a.size() ? static_cast<uint8_t>(a[i]) : uint8_t{0};
        auto y = i < b.size() ? static_cast<uint8_t>(b[i]) : uint8_t{0};
        diff = static_cast<uint8_t>(diff | (x ^ y));
    }
    return diff == 0;
}

// ---------------------------------------------------------------------------
// EncryptionKey
// ---------------------------------------------------------------------------

AuthResult<EncryptionKey> EncryptionKey::fromHex(std::string_view hex) {
    if (hex.size() != kKeyBytes * 2) {
        return AuthResult<EncryptionKey>::err(
            AuthError(ErrorCode::CryptoInvalidKey, "key must be 64 hex characters"));
    }
    auto raw = encoding::fromHex(hex);
    if (!raw) {
        return AuthResult<EncryptionKey>::err(
            AuthError(ErrorCode::CryptoInvalidKey, "key contains non-hex characters"));
    }
    auto key = fromBytes(*raw);
    OPENSSL_cleanse(raw->data(), raw->size());
    return key;
}

AuthResult<EncryptionKey> EncryptionKey::fromBytes(std::string_view bytes) {
    if (bytes.size() != kKeyBytes) {
        return AuthResult<EncryptionKey>::err(
            AuthError(ErrorCode::CryptoInvalidKey,
                      "key must be " + std::to_string(kKeyBytes) + " bytes"));
    }
    EncryptionKey key;
    std::copy(bytes.begin(), bytes.end(), key.bytes_.begin());
    return AuthResult<EncryptionKey>::ok(key);
}

EncryptionKey EncryptionKey::generate() {
    auto raw = randomBytes(kKeyBytes);
    EncryptionKey key;
    std::copy(raw.begin(), raw.end(), key.bytes_.begin());
    OPENSSL_cleanse(raw.data(), raw.size());
    return key;
}

EncryptionKey::~EncryptionKey() {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

std::string EncryptionKey::toHex() const {
    return encoding::toHex(bytes_.data(), bytes_.size());
}

// ---------------------------------------------------------------------------
// Keyed encryption
// ---------------------------------------------------------------------------

AuthResult<std::string> encrypt(std::string_view plaintext, const EncryptionKey& key) {
    std::string iv;
    try {
        iv = randomBytes(kGcmIvBytes);
    } catch (const CryptoException& e) {
        return AuthResult<std::string>::err(AuthError(ErrorCode::CryptoRandomFailed, e.what()));
    }

    auto sealed = gcmSeal(key.bytes().data(), iv, plaintext);
    if (!sealed) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoError, "AES-256-GCM encryption failed"));
    }

    std::string out;
    out.reserve((iv.size() + sealed->tag.size() + sealed->ciphertext.size()) * 2 + 2);
    out += encoding::toHex(iv);
    out += ':';
    out += encoding::toHex(sealed->tag);
    out += ':';
    out += encoding::toHex(sealed->ciphertext);
    return AuthResult<std::string>::ok(std::move(out));
}

AuthResult<std::string> decrypt(std::string_view ciphertext, const EncryptionKey& key) {
    auto fields = splitFields(ciphertext);
    if (fields.size() != 3) {
        return AuthResult<std::string>::err(malformed("expected iv:tag:ciphertext"));
    }

    auto iv = encoding::fromHex(fields[0]);
    auto tag = encoding::fromHex(fields[1]);
    auto body = encoding::fromHex(fields[2]);
    if (!iv || !tag || !body) {
        return AuthResult<std::string>::err(malformed("ciphertext field is not hex"));
    }
    if (iv->size() != kGcmIvBytes || tag->size() != kGcmTagBytes) {
        return AuthResult<std::string>::err(malformed("unexpected IV or tag length"));
    }

    auto plaintext = gcmOpen(key.bytes().data(), *iv, *tag, *body);
    if (!plaintext) {
        LATCHKEY_LOG_WARN(LogCategory::Crypto, "AES-256-GCM authentication failed");
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoDecryptFailed, "decryption failed"));
    }
    return AuthResult<std::string>::ok(std::move(*plaintext));
}

// ---------------------------------------------------------------------------
// Passphrase encryption
// ---------------------------------------------------------------------------

namespace {

std::optional<std::array<uint8_t, kKeyBytes>> deriveKey(std::string_view passphrase,
                                                        std::string_view salt) {
    std::array<uint8_t, kKeyBytes> key{};
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          asBytes(salt), static_cast<int>(salt.size()), kPbkdf2Iterations,
                          EVP_sha256(), static_cast<int>(key.size()), key.data()) != 1) {
        return std::nullopt;
    }
    return key;
}

} // namespace

AuthResult<std::string> encryptWithPassphrase(std::string_view plaintext,
                                              std::string_view passphrase) {
    if (passphrase.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoInvalidKey, "passphrase must not be empty"));
    }

    std::string salt;
    std::string iv;
    try {
        salt = randomBytes(kPbkdf2SaltBytes);
        iv = randomBytes(kPassphraseIvBytes);
    } catch (const CryptoException& e) {
        return AuthResult<std::string>::err(AuthError(ErrorCode::CryptoRandomFailed, e.what()));
    }

    auto key = deriveKey(passphrase, salt);
    if (!key) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoError, "PBKDF2 key derivation failed"));
    }
    auto sealed = gcmSeal(key->data(), iv, plaintext);
    OPENSSL_cleanse(key->data(), key->size());
    if (!sealed) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoError, "AES-256-GCM encryption failed"));
    }

    return AuthResult<std::string>::ok(encoding::base64Encode(salt) + ':' +
                                       encoding::base64Encode(iv) + ':' +
                                       encoding::base64Encode(sealed->tag) + ':' +
                                       encoding::base64Encode(sealed->ciphertext));
}

AuthResult<std::string> decryptWithPassphrase(std::string_view ciphertext,
                                              std::string_view passphrase) {
    if (passphrase.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoInvalidKey, "passphrase must not be empty"));
    }

    auto fields = splitFields(ciphertext);
    if (fields.size() != 4) {
        return AuthResult<std::string>::err(malformed("expected salt:iv:tag:ciphertext"));
    }

    auto salt = encoding::base64Decode(fields[0]);
    auto iv = encoding::base64Decode(fields[1]);
    auto tag = encoding::base64Decode(fields[2]);
    auto body = encoding::base64Decode(fields[3]);
    if (!salt || !iv || !tag || !body) {
        return AuthResult<std::string>::err(malformed("ciphertext field is not base64"));
    }
    if (salt->size() != kPbkdf2SaltBytes || iv->size() != kPassphraseIvBytes ||
        tag->size() != kGcmTagBytes) {
        return AuthResult<std::string>::err(malformed("unexpected salt, IV or tag length"));
    }

    auto key = deriveKey(passphrase, *salt);
    if (!key) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoError, "PBKDF2 key derivation failed"));
    }
    auto plaintext = gcmOpen(key->data(), *iv, *tag, *body);
    OPENSSL_cleanse(key->data(), key->size());
    if (!plaintext) {
        LATCHKEY_LOG_WARN(LogCategory::Crypto, "passphrase decryption failed");
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CryptoDecryptFailed, "decryption failed"));
    }
    return AuthResult<std::string>::ok(std::move(*plaintext));
}

} // namespace latchkey::security::crypto
