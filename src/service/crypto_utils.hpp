#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic helpers over OpenSSL: HMAC-SHA256, SHA-256,
///        secure random bytes, constant-time comparison, Base64URL and hex.
///
/// Used internally by CredentialHasher, TokenSigner and SessionAuthenticator.

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace warden::service::detail {

using Digest = std::array<uint8_t, 32>;

// =============================================================================
// Digests
// =============================================================================

/// Compute HMAC-SHA256(key, message). Returns false on OpenSSL failure.
[[nodiscard]] inline bool hmacSha256(std::string_view key, std::string_view message, Digest& out) {
    unsigned int len = 0;
    auto* md = HMAC(EVP_sha256(),
                    key.data(), static_cast<int>(key.size()),
                    reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                    out.data(), &len);
    return md != nullptr && len == out.size();
}

/// Compute SHA-256(message). Returns false on OpenSSL failure.
[[nodiscard]] inline bool sha256(std::string_view message, Digest& out) {
    unsigned int len = 0;
    if (EVP_Digest(message.data(), message.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
        return false;
    }
    return len == out.size();
}

// =============================================================================
// Secure random generation
// =============================================================================

/// Fill buf with bytes from the OpenSSL CSPRNG. Returns false on failure.
[[nodiscard]] inline bool secureRandomBytes(std::vector<uint8_t>& buf) {
    return RAND_bytes(buf.data(), static_cast<int>(buf.size())) == 1;
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two byte strings in constant time with respect to their contents.
/// The length check is not secret: both sides have a fixed public length.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 section 5, no padding)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Decode unpadded base64url. Returns false on any character outside the
/// alphabet or an impossible length.
[[nodiscard]] inline bool base64urlDecode(std::string_view input, std::vector<uint8_t>& out) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    if (input.size() % 4 == 1) {
        return false;
    }

    out.clear();
    out.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return false;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    return true;
}

[[nodiscard]] inline bool base64urlDecode(std::string_view input, std::string& out) {
    std::vector<uint8_t> bytes;
    if (!base64urlDecode(input, bytes)) {
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

// =============================================================================
// Hex encoding
// =============================================================================

/// Encode bytes to lowercase hex string.
[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

[[nodiscard]] inline std::string toHex(const Digest& data) {
    return toHex(data.data(), data.size());
}

}  // namespace warden::service::detail
