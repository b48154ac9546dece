#include "ghost/token_signer.hpp"
#include "platform/platform_abi.hpp"
#include "utils/text_encoding.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>

namespace token_signer {

using ghost_api::ErrorKind;
using ghost_api::make_error;

static const char *INVALID_KEY_MESSAGE = "Invalid API key format. Expected 'ID:SECRET'";

static IssuedAtClock process_clock;

static bool hmac_sha256(const std::string &key_bytes, const std::string &message, std::string &out_mac) {
    unsigned int mac_length = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char *digest = HMAC(EVP_sha256(),
                                 key_bytes.data(), static_cast<int>(key_bytes.size()),
                                 reinterpret_cast<const unsigned char *>(message.data()),
                                 message.size(),
                                 mac, &mac_length);
    if (digest == nullptr || mac_length != 32) {
        return false;
    }
    out_mac.assign(reinterpret_cast<const char *>(mac), mac_length);
    return true;
}

CredentialResult parse_credential(const std::string &admin_api_key) {
    CredentialResult result;

    auto separator = admin_api_key.find(':');
    if (separator == std::string::npos || admin_api_key.find(':', separator + 1) != std::string::npos) {
        result.error = make_error(ErrorKind::kInvalidCredentialFormat, INVALID_KEY_MESSAGE);
        return result;
    }

    result.credential.key_id = admin_api_key.substr(0, separator);
    result.credential.secret_hex = admin_api_key.substr(separator + 1);
    if (result.credential.key_id.empty() || result.credential.secret_hex.empty()) {
        result.credential = Credential();
        result.error = make_error(ErrorKind::kInvalidCredentialFormat, INVALID_KEY_MESSAGE);
        return result;
    }

    result.success = true;
    return result;
}

TokenResult issue_token_at(const std::string &admin_api_key, const std::string &api_version,
                           std::int64_t issued_at) {
    TokenResult result;

    CredentialResult parsed = parse_credential(admin_api_key);
    if (!parsed.success) {
        result.error = parsed.error;
        return result;
    }

    std::string key_bytes;
    if (!text_encoding::hex_to_bytes(parsed.credential.secret_hex, key_bytes)) {
        result.error = make_error(ErrorKind::kSigningError,
                                  "Failed to generate JWT token: secret is not valid hex");
        return result;
    }

    // nlohmann::json keeps keys sorted, which gives alg, kid, typ.
    nlohmann::json header;
    header["alg"] = "HS256";
    header["typ"] = "JWT";
    header["kid"] = parsed.credential.key_id;

    nlohmann::ordered_json claims;
    claims["iat"] = issued_at;
    claims["exp"] = issued_at + kTokenLifetimeSeconds;
    claims["aud"] = "/" + api_version + "/admin/";

    std::string signing_input;
    try {
        signing_input = text_encoding::base64url_encode(header.dump()) + "." +
                        text_encoding::base64url_encode(claims.dump());
    } catch (const nlohmann::json::exception &error) {
        // Only reachable with a key id that is not valid UTF-8.
        OPENSSL_cleanse(&key_bytes[0], key_bytes.size());
        result.error = make_error(ErrorKind::kSigningError,
                                  "Failed to generate JWT token: " + std::string(error.what()));
        return result;
    }

    std::string signature;
    bool signed_ok = hmac_sha256(key_bytes, signing_input, signature);
    OPENSSL_cleanse(&key_bytes[0], key_bytes.size());
    if (!signed_ok) {
        result.error = make_error(ErrorKind::kSigningError,
                                  "Failed to generate JWT token: HMAC-SHA256 failed");
        return result;
    }

    result.token = signing_input + "." + text_encoding::base64url_encode(signature);
    result.issued_at = issued_at;
    result.expires_at = issued_at + kTokenLifetimeSeconds;
    result.success = true;
    return result;
}

std::int64_t IssuedAtClock::next(std::int64_t now) {
    std::int64_t previous = last_issued_at_.load();
    std::int64_t issued_at = std::max(now, previous);
    while (!last_issued_at_.compare_exchange_weak(previous, issued_at)) {
        issued_at = std::max(now, previous);
    }
    return issued_at;
}

TokenResult issue_token(const std::string &admin_api_key, const std::string &api_version,
                        IssuedAtClock &clock, std::int64_t now) {
    return issue_token_at(admin_api_key, api_version, clock.next(now));
}

TokenResult issue_token(const std::string &admin_api_key, const std::string &api_version) {
    return issue_token(admin_api_key, api_version, process_clock, platform::unix_time_seconds());
}

} // namespace token_signer
