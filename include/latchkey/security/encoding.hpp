#pragma once

/// @file encoding.hpp
/// @brief Hex and Base64 codecs for tokens, digests and ciphertext framing.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace latchkey::security::encoding {

/// Encode bytes to lowercase hex.
[[nodiscard]] std::string toHex(const uint8_t* data, std::size_t length);

/// Encode the bytes of a string to lowercase hex.
[[nodiscard]] std::string toHex(std::string_view bytes);

/// Decode hex (either case). Returns nullopt on odd length or a non-hex digit.
[[nodiscard]] std::optional<std::string> fromHex(std::string_view hex);

/// Encode bytes to standard, padded Base64 (RFC 4648 §4).
[[nodiscard]] std::string base64Encode(std::string_view bytes);

/// Decode standard, padded Base64. Returns nullopt on malformed input.
[[nodiscard]] std::optional<std::string> base64Decode(std::string_view text);

} // namespace latchkey::security::encoding
