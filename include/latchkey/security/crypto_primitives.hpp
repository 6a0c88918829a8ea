#pragma once

/// @file crypto_primitives.hpp
/// @brief Random tokens, SHA-256 digests, AES-256-GCM field encryption and
///        constant-time comparison on top of OpenSSL 3.x.
///
/// All functions are stateless and safe to call from any thread. Keys are
/// passed per call and never cached.

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "latchkey/foundation/auth_result.hpp"

namespace latchkey::security::crypto {

using foundation::AuthResult;

/// Raw bytes in a freshly generated token.
inline constexpr std::size_t kTokenBytes = 32;

/// AES-256 key size in bytes.
inline constexpr std::size_t kKeyBytes = 32;

/// GCM nonce size used by encrypt().
inline constexpr std::size_t kGcmIvBytes = 12;

/// GCM authentication tag size.
inline constexpr std::size_t kGcmTagBytes = 16;

/// Passphrase encryption parameters.
inline constexpr int kPbkdf2Iterations = 100000;
inline constexpr std::size_t kPbkdf2SaltBytes = 64;
inline constexpr std::size_t kPassphraseIvBytes = 16;

/// Thrown when the system CSPRNG cannot produce bytes.
///
/// A host without entropy cannot issue credentials, so this is the one
/// failure the library raises as an exception instead of a Result.
class CryptoException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Fill a string with @p count bytes from the system CSPRNG.
/// @throws CryptoException on CSPRNG failure.
[[nodiscard]] std::string randomBytes(std::size_t count);

/// Generate a new opaque token: 32 random bytes, hex-encoded (64 chars).
/// @throws CryptoException on CSPRNG failure.
[[nodiscard]] std::string generateToken();

/// SHA-256 of @p input as 64 lowercase hex characters.
[[nodiscard]] std::string hash(std::string_view input);

/// Compare two byte strings without early exit.
///
/// Running time depends only on the length of the longer input.
/// ("", "") is equal; ("", "x") is not.
[[nodiscard]] bool constantTimeEquals(std::string_view a, std::string_view b) noexcept;

/// A 256-bit symmetric key. Key bytes are wiped on destruction.
class EncryptionKey {
public:
    /// Parse a 64-character hex key.
    /// @return The key or CryptoInvalidKey.
    [[nodiscard]] static AuthResult<EncryptionKey> fromHex(std::string_view hex);

    /// Wrap exactly 32 raw bytes.
    /// @return The key or CryptoInvalidKey.
    [[nodiscard]] static AuthResult<EncryptionKey> fromBytes(std::string_view bytes);

    /// Generate a random key.
    /// @throws CryptoException on CSPRNG failure.
    [[nodiscard]] static EncryptionKey generate();

    EncryptionKey(const EncryptionKey& other) = default;
    EncryptionKey& operator=(const EncryptionKey& other) = default;
    ~EncryptionKey();

    [[nodiscard]] const std::array<uint8_t, kKeyBytes>& bytes() const noexcept { return bytes_; }

    /// Hex form, for writing a generated key to a secrets store.
    [[nodiscard]] std::string toHex() const;

private:
    EncryptionKey() = default;

    std::array<uint8_t, kKeyBytes> bytes_{};
};

/// Encrypt with AES-256-GCM under a fresh random 12-byte IV.
///
/// Output format: hex(iv):hex(tag):hex(ciphertext). The separator never
/// occurs in hex, so plaintext may contain ':' freely. Empty plaintext is
/// valid and yields an empty ciphertext field.
[[nodiscard]] AuthResult<std::string> encrypt(std::string_view plaintext,
                                              const EncryptionKey& key);

/// Reverse encrypt().
///
/// Malformed framing gives CryptoMalformedInput; a wrong key or any
/// altered byte gives CryptoDecryptFailed. Partial plaintext is never
/// returned.
[[nodiscard]] AuthResult<std::string> decrypt(std::string_view ciphertext,
                                              const EncryptionKey& key);

/// Encrypt with a key derived from @p passphrase.
///
/// PBKDF2-HMAC-SHA256 (100000 iterations) over a random 64-byte salt,
/// then AES-256-GCM with a random 16-byte IV. Output format:
/// b64(salt):b64(iv):b64(tag):b64(ciphertext).
[[nodiscard]] AuthResult<std::string> encryptWithPassphrase(std::string_view plaintext,
                                                            std::string_view passphrase);

/// Reverse encryptWithPassphrase().
[[nodiscard]] AuthResult<std::string> decryptWithPassphrase(std::string_view ciphertext,
                                                            std::string_view passphrase);

} // namespace latchkey::security::crypto
