/// @file encoding.cpp
/// @brief Hex codec and OpenSSL-backed Base64 codec.

#include "latchkey/security/encoding.hpp"

#include <openssl/evp.h>

#include <vector>

namespace latchkey::security::encoding {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

std::string toHex(std::string_view bytes) {
    return toHex(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

std::optional<std::string> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::string result;
    result.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<char>((hi << 4) | lo));
    }
    return result;
}

std::string base64Encode(std::string_view bytes) {
    if (bytes.empty()) {
        return {};
    }
    // EVP_EncodeBlock writes 4 chars per 3-byte group plus a NUL.
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<std::size_t>(written));
}

std::optional<std::string> base64Decode(std::string_view text) {
    if (text.empty()) {
        return std::string{};
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<unsigned char> out(3 * (text.size() / 4));
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes; drop them.
    std::size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    auto length = static_cast<std::size_t>(decoded);
    if (padding > length) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(out.data()), length - padding);
}

} // namespace latchkey::security::encoding
