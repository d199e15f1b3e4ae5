/// @file token_signer.cpp
/// @brief TokenSigner implementation: HMAC-SHA256 over a base64url JSON body.
///
/// Body: {"exp":N,"iat":N,"pl":{"key":value,...}}
/// Values are 64-bit integers, strings or booleans.

#include "warden/service/token_signer.hpp"

#include "warden/foundation/error_code.hpp"
#include "warden/foundation/warden_error.hpp"
#include "warden/foundation/warden_logger.hpp"
#include "warden/service/clock.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <optional>
#include <string>

namespace warden::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::WardenError;
using foundation::WardenResult;

// ---------------------------------------------------------------------------
// Minimal JSON helpers (flat objects with one nested payload object)
// ---------------------------------------------------------------------------
namespace {

/// Escape a string for JSON output.
std::string jsonEscape(std::string_view s) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hexChars[(c >> 4) & 0x0F]);
                    out.push_back(hexChars[c & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

std::string jsonValue(const TokenValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    return jsonEscape(std::get<std::string>(value));
}

int64_t toEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// Recursive-descent reader for the body format written by issue().
class BodyReader {
public:
    explicit BodyReader(std::string_view text) : text_(text) {}

    struct Body {
        int64_t iat = 0;
        int64_t exp = 0;
        TokenPayload payload;
    };

    std::optional<Body> read() {
        Body body;
        bool haveExp = false;
        bool haveIat = false;
        bool havePayload = false;

        if (!consume('{')) {
            return std::nullopt;
        }
        if (!peekIs('}')) {
            do {
                auto key = readString();
                if (!key || !consume(':')) {
                    return std::nullopt;
                }
                if (*key == "pl") {
                    if (havePayload || !readPayload(body.payload)) {
                        return std::nullopt;
                    }
                    havePayload = true;
                } else {
                    auto value = readScalar();
                    auto* num = value ? std::get_if<int64_t>(&*value) : nullptr;
                    if (num == nullptr) {
                        return std::nullopt;
                    }
                    if (*key == "exp") {
                        body.exp = *num;
                        haveExp = true;
                    } else if (*key == "iat") {
                        body.iat = *num;
                        haveIat = true;
                    }
                }
            } while (consume(','));
        }
        if (!consume('}') || pos_ != text_.size()) {
            return std::nullopt;
        }
        if (!haveExp || !haveIat || !havePayload) {
            return std::nullopt;
        }
        return body;
    }

private:
    bool peekIs(char c) const { return pos_ < text_.size() && text_[pos_] == c; }

    bool consume(char c) {
        if (!peekIs(c)) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool readPayload(TokenPayload& payload) {
        if (!consume('{')) {
            return false;
        }
        if (consume('}')) {
            return true;
        }
        do {
            auto key = readString();
            if (!key || !consume(':')) {
                return false;
            }
            auto value = readScalar();
            if (!value) {
                return false;
            }
            payload.insert_or_assign(std::move(*key), std::move(*value));
        } while (consume(','));
        return consume('}');
    }

    std::optional<TokenValue> readScalar() {
        if (peekIs('"')) {
            auto s = readString();
            if (!s) {
                return std::nullopt;
            }
            return TokenValue(std::move(*s));
        }
        if (text_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return TokenValue(true);
        }
        if (text_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return TokenValue(false);
        }
        int64_t number = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_, text_.data() + text_.size(), number);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
        pos_ = static_cast<std::size_t>(ptr - text_.data());
        return TokenValue(number);
    }

    std::optional<std::string> readString() {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    // Only the \u00XX form written by jsonEscape().
                    if (pos_ + 4 > text_.size() || text_.substr(pos_, 2) != "00") {
                        return std::nullopt;
                    }
                    unsigned value = 0;
                    auto hex = text_.substr(pos_ + 2, 2);
                    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
                    if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
                        return std::nullopt;
                    }
                    out.push_back(static_cast<char>(value));
                    pos_ += 4;
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // anonymous namespace

// ---------------------------------------------------------------------------
// TokenSigner
// ---------------------------------------------------------------------------

TokenSigner::TokenSigner(const AuthConfig& config, std::shared_ptr<const IClock> clock)
    : signingKey_(config.signingKey),
      previousKeys_(config.previousSigningKeys),
      clock_(std::move(clock)) {}

WardenResult<std::string> TokenSigner::issue(const TokenPayload& payload,
                                             std::chrono::seconds ttl) const {
    if (ttl > kMaxLifetime || ttl < -kMaxLifetime) {
        return WardenResult<std::string>::err(
            WardenError(ErrorCode::TokenLifetimeOutOfRange, "token lifetime out of range"));
    }
    auto now = clock_->now();

    std::string body = "{\"exp\":" + std::to_string(toEpoch(now + ttl)) +
                       ",\"iat\":" + std::to_string(toEpoch(now)) + ",\"pl\":{";
    bool first = true;
    for (const auto& [key, value] : payload) {
        if (!first) {
            body += ',';
        }
        body += jsonEscape(key);
        body += ':';
        body += jsonValue(value);
        first = false;
    }
    body += "}}";

    auto encodedBody = detail::base64urlEncode(body);

    detail::Digest mac{};
    if (!detail::hmacSha256(signingKey_, encodedBody, mac)) {
        WARDEN_LOG_ERROR(LogCategory::Token, "HMAC computation failed while issuing token");
        return WardenResult<std::string>::err(
            WardenError(ErrorCode::CryptoFailure, "failed to sign token"));
    }
    return WardenResult<std::string>::ok(encodedBody + "." +
                                         detail::base64urlEncode(mac.data(), mac.size()));
}

TokenResult TokenSigner::redeem(std::string_view token) const {
    // 1. Structure: body.signature, both non-empty.
    auto dot = token.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= token.size() ||
        token.find('.', dot + 1) != std::string_view::npos) {
        return TokenResult::err(TokenError::Malformed);
    }
    auto encodedBody = token.substr(0, dot);
    auto signature = token.substr(dot + 1);

    // 2. Integrity, before anything in the body is interpreted.
    if (!signatureMatches(encodedBody, signature)) {
        return TokenResult::err(TokenError::BadSignature);
    }

    // 3. Decode the authenticated body.
    std::string bodyJson;
    if (!detail::base64urlDecode(encodedBody, bodyJson)) {
        return TokenResult::err(TokenError::Malformed);
    }
    auto body = BodyReader(bodyJson).read();
    if (!body) {
        return TokenResult::err(TokenError::Malformed);
    }

    // 4. Expiry.
    if (toEpoch(clock_->now()) > body->exp) {
        return TokenResult::err(TokenError::Expired);
    }
    return TokenResult::ok(std::move(body->payload));
}

bool TokenSigner::signatureMatches(std::string_view body, std::string_view signature) const {
    // Every key is tried so the work done does not depend on which one matches.
    bool matched = false;
    auto check = [&](const std::string& key) {
        detail::Digest mac{};
        if (!detail::hmacSha256(key, body, mac)) {
            WARDEN_LOG_ERROR(LogCategory::Token, "HMAC computation failed while verifying token");
            return;
        }
        auto expected = detail::base64urlEncode(mac.data(), mac.size());
        matched = detail::constantTimeEqual(expected, signature) || matched;
    };

    check(signingKey_);
    for (const auto& key : previousKeys_) {
        check(key);
    }
    return matched;
}

}  // namespace warden::service
