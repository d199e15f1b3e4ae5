/// @file credential_hasher.cpp
/// @brief CredentialHasher implementation over OpenSSL EVP_PBE_scrypt.

#include "warden/service/credential_hasher.hpp"

#include "warden/foundation/warden_logger.hpp"

#include "crypto_utils.hpp"

#include <array>
#include <charconv>
#include <optional>
#include <vector>

namespace warden::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::WardenError;
using foundation::WardenResult;

namespace {

constexpr std::string_view kPrefix = "$scrypt$";
constexpr std::size_t kSaltBytes = 16;
constexpr std::size_t kKeyBytes = 32;

// Bounds for parameters read back from storage.
constexpr uint32_t kMaxLogN = 20;
constexpr uint32_t kMaxR = 32;
constexpr uint32_t kMaxP = 16;
constexpr uint64_t kMaxMemoryBytes = uint64_t{1} << 30;  // 1 GiB

struct ParsedHash {
    ScryptParams params;
    std::vector<uint8_t> salt;
    std::string key;
};

uint64_t requiredMemory(const ScryptParams& p) {
    const uint64_t n = uint64_t{1} << p.logN;
    return 128ull * p.r * (n + 2) + 128ull * p.r * p.p;
}

bool paramsWithinBounds(const ScryptParams& p) {
    if (p.logN < 1 || p.logN > kMaxLogN || p.r < 1 || p.r > kMaxR || p.p < 1 || p.p > kMaxP) {
        return false;
    }
    return requiredMemory(p) <= kMaxMemoryBytes;
}

bool derive(std::string_view password,
            const std::vector<uint8_t>& salt,
            const ScryptParams& p,
            std::array<uint8_t, kKeyBytes>& out) {
    const uint64_t n = uint64_t{1} << p.logN;
    // Headroom over the working set so OpenSSL's own accounting never trips.
    const uint64_t maxMem = requiredMemory(p) + (uint64_t{1} << 20);
    return EVP_PBE_scrypt(password.data(), password.size(),
                          salt.data(), salt.size(),
                          n, p.r, p.p, maxMem,
                          out.data(), out.size()) == 1;
}

/// Read "<name>=<uint>" from the front of s and advance past it.
bool readParam(std::string_view& s, std::string_view name, uint32_t& value) {
    if (s.substr(0, name.size()) != name || s.size() <= name.size() || s[name.size()] != '=') {
        return false;
    }
    s.remove_prefix(name.size() + 1);
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr == s.data()) {
        return false;
    }
    s.remove_prefix(static_cast<std::size_t>(ptr - s.data()));
    return true;
}

std::optional<ParsedHash> parse(std::string_view encoded) {
    if (encoded.substr(0, kPrefix.size()) != kPrefix) {
        return std::nullopt;
    }
    encoded.remove_prefix(kPrefix.size());

    auto paramsEnd = encoded.find('$');
    if (paramsEnd == std::string_view::npos) {
        return std::nullopt;
    }
    auto paramText = encoded.substr(0, paramsEnd);
    auto rest = encoded.substr(paramsEnd + 1);

    ParsedHash parsed;
    if (!readParam(paramText, "ln", parsed.params.logN) || paramText.empty() ||
        paramText.front() != ',') {
        return std::nullopt;
    }
    paramText.remove_prefix(1);
    if (!readParam(paramText, "r", parsed.params.r) || paramText.empty() ||
        paramText.front() != ',') {
        return std::nullopt;
    }
    paramText.remove_prefix(1);
    if (!readParam(paramText, "p", parsed.params.p) || !paramText.empty()) {
        return std::nullopt;
    }
    if (!paramsWithinBounds(parsed.params)) {
        return std::nullopt;
    }

    auto saltEnd = rest.find('$');
    if (saltEnd == std::string_view::npos) {
        return std::nullopt;
    }
    if (!detail::base64urlDecode(rest.substr(0, saltEnd), parsed.salt) ||
        parsed.salt.size() < 8) {
        return std::nullopt;
    }
    if (!detail::base64urlDecode(rest.substr(saltEnd + 1), parsed.key) ||
        parsed.key.size() != kKeyBytes) {
        return std::nullopt;
    }
    return parsed;
}

}  // anonymous namespace

CredentialHasher::CredentialHasher(const AuthConfig& config)
    : params_{config.scryptLogN, config.scryptR, config.scryptP} {}

CredentialHasher::CredentialHasher(ScryptParams params) : params_(params) {}

WardenResult<HashedCredential> CredentialHasher::hash(std::string_view password) const {
    std::vector<uint8_t> salt(kSaltBytes);
    if (!detail::secureRandomBytes(salt)) {
        return WardenResult<HashedCredential>::err(
            WardenError(ErrorCode::CryptoFailure, "failed to generate salt"));
    }

    std::array<uint8_t, kKeyBytes> key{};
    if (!derive(password, salt, params_, key)) {
        WARDEN_LOG_ERROR(LogCategory::Credential, "scrypt derivation failed");
        return WardenResult<HashedCredential>::err(
            WardenError(ErrorCode::CryptoFailure, "scrypt derivation failed"));
    }

    std::string encoded(kPrefix);
    encoded += "ln=" + std::to_string(params_.logN);
    encoded += ",r=" + std::to_string(params_.r);
    encoded += ",p=" + std::to_string(params_.p);
    encoded += '$';
    encoded += detail::base64urlEncode(salt.data(), salt.size());
    encoded += '$';
    encoded += detail::base64urlEncode(key.data(), key.size());
    return WardenResult<HashedCredential>::ok(HashedCredential{std::move(encoded)});
}

bool CredentialHasher::verify(std::string_view password, std::string_view encoded) const {
    std::array<uint8_t, kKeyBytes> computed{};

    auto parsed = parse(encoded);
    if (!parsed) {
        // Spend the same work as a real check before rejecting.
        static const std::vector<uint8_t> dummySalt(kSaltBytes, 0);
        static_cast<void>(derive(password, dummySalt, params_, computed));
        return false;
    }

    if (!derive(password, parsed->salt, parsed->params, computed)) {
        return false;
    }
    return detail::constantTimeEqual(
        std::string_view(reinterpret_cast<const char*>(computed.data()), computed.size()),
        parsed->key);
}

bool CredentialHasher::withinBounds(const ScryptParams& params) {
    return paramsWithinBounds(params);
}

bool CredentialHasher::needsRehash(std::string_view encoded) const {
    auto parsed = parse(encoded);
    return !parsed || !(parsed->params == params_);
}

}  // namespace warden::service
