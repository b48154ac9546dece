// Tests for the Ghost Admin API token signer: credential parsing, the JWT
// header/claims layout and the HS256 signature, without any network I/O.

#include "ghost/token_signer.hpp"
#include "utils/text_encoding.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <string>
#include <vector>

using json = nlohmann::json;
using test_helpers::expect;
using test_helpers::expect_equal;

namespace test_token_signer {

static std::string base64url_decode(std::string text) {
    for (char &character : text) {
        if (character == '-') {
            character = '+';
        } else if (character == '_') {
            character = '/';
        }
    }
    size_t padding = (4 - text.size() % 4) % 4;
    text.append(padding, '=');

    std::vector<unsigned char> decoded(text.size());
    int decoded_length = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                         static_cast<int>(text.size()));
    if (decoded_length < 0) {
        return "";
    }
    return std::string(reinterpret_cast<const char *>(decoded.data()),
                       static_cast<size_t>(decoded_length) - padding);
}

static std::vector<std::string> split_token(const std::string &token) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t dot = 0;
    while ((dot = token.find('.', start)) != std::string::npos) {
        parts.push_back(token.substr(start, dot - start));
        start = dot + 1;
    }
    parts.push_back(token.substr(start));
    return parts;
}

static bool test_credential_split() {
    token_signer::CredentialResult parsed = token_signer::parse_credential(test_helpers::TEST_ADMIN_API_KEY);
    bool success = expect(parsed.success, "Well-formed ID:SECRET parses");
    success &= expect_equal(parsed.credential.key_id, test_helpers::TEST_KEY_ID, "Key id is the part before ':'");
    success &= expect_equal(parsed.credential.secret_hex, test_helpers::TEST_SECRET_HEX, "Secret is the part after ':'");
    return success;
}

static bool test_malformed_credentials_rejected() {
    const std::vector<std::string> malformed = {
        "", "no-separator", "a:b:c", ":abcd", "abcd:", ":", "id::secret"
    };
    bool success = true;
    for (const auto &key : malformed) {
        token_signer::TokenResult token = token_signer::issue_token_at(key, "v4", 1700000000);
        success &= expect(!token.success && token.error.kind == ghost_api::ErrorKind::kInvalidCredentialFormat,
                          "Key '" + key + "' is rejected as InvalidCredentialFormat");
    }
    return success;
}

static bool test_non_hex_secret_is_signing_error() {
    token_signer::TokenResult odd_length = token_signer::issue_token_at("id:abc", "v4", 1700000000);
    token_signer::TokenResult not_hex = token_signer::issue_token_at("id:zz11", "v4", 1700000000);
    bool success = expect(!odd_length.success && odd_length.error.kind == ghost_api::ErrorKind::kSigningError,
                          "Odd-length secret is a SigningError");
    success &= expect(!not_hex.success && not_hex.error.kind == ghost_api::ErrorKind::kSigningError,
                      "Non-hex secret is a SigningError");
    success &= expect(test_helpers::starts_with(not_hex.error.message, "Failed to generate JWT token"),
                      "SigningError message names the token step");
    return success;
}

static bool test_header_and_claims_layout() {
    token_signer::TokenResult token = token_signer::issue_token_at(test_helpers::TEST_ADMIN_API_KEY, "v4", 1700000000);
    if (!expect(token.success, "Token issued for a valid key")) {
        return false;
    }

    std::vector<std::string> parts = split_token(token.token);
    if (!expect(parts.size() == 3, "Token has three dot-separated parts")) {
        return false;
    }

    json header = json::parse(base64url_decode(parts[0]));
    json claims = json::parse(base64url_decode(parts[1]));

    bool success = expect(header["alg"] == "HS256", "Header alg is HS256");
    success &= expect(header["typ"] == "JWT", "Header typ is JWT");
    success &= expect(header["kid"] == test_helpers::TEST_KEY_ID, "Header kid is the key id");
    success &= expect(header.size() == 3, "Header carries exactly alg, kid, typ");
    success &= expect(claims["iat"] == 1700000000, "iat is the issue time");
    success &= expect(claims["exp"] == 1700000000 + 300, "exp is iat + 300");
    success &= expect(claims["aud"] == "/v4/admin/", "aud is /v4/admin/");
    success &= expect(token.expires_at - token.issued_at == token_signer::kTokenLifetimeSeconds,
                      "Result reports a 300 second lifetime");
    success &= expect(parts[0].find('=') == std::string::npos && parts[2].find('=') == std::string::npos,
                      "Segments are unpadded base64url");
    return success;
}

static bool test_signature_matches_hmac_of_decoded_secret() {
    token_signer::TokenResult token = token_signer::issue_token_at(test_helpers::TEST_ADMIN_API_KEY, "v4", 1700000123);
    std::vector<std::string> parts = split_token(token.token);
    if (!expect(parts.size() == 3, "Token has three parts")) {
        return false;
    }

    std::string key_bytes;
    text_encoding::hex_to_bytes(test_helpers::TEST_SECRET_HEX, key_bytes);
    std::string signing_input = parts[0] + "." + parts[1];

    unsigned int mac_length = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key_bytes.data(), static_cast<int>(key_bytes.size()),
         reinterpret_cast<const unsigned char *>(signing_input.data()), signing_input.size(), mac, &mac_length);
    std::string expected_signature = text_encoding::base64url_encode(
        std::string(reinterpret_cast<const char *>(mac), mac_length));

    return expect_equal(parts[2], expected_signature, "Signature is HMAC-SHA256 over header.claims with the hex-decoded secret");
}

static bool test_issued_at_never_decreases() {
    token_signer::TokenResult first = token_signer::issue_token(test_helpers::TEST_ADMIN_API_KEY, "v4");
    token_signer::TokenResult second = token_signer::issue_token(test_helpers::TEST_ADMIN_API_KEY, "v4");
    bool success = expect(first.success && second.success, "Tokens issued from the clock");
    success &= expect(second.issued_at >= first.issued_at, "Issued-at is non-decreasing across calls");
    success &= expect(second.expires_at == second.issued_at + 300, "Clock-issued token expires 300 s after issue");
    return success;
}

static bool test_clock_step_back_reuses_last_issued_at() {
    token_signer::IssuedAtClock clock;
    const std::int64_t issue_time = 1700000000;

    token_signer::TokenResult first = token_signer::issue_token(test_helpers::TEST_ADMIN_API_KEY, "v4",
                                                                clock, issue_time);
    token_signer::TokenResult stepped_back = token_signer::issue_token(test_helpers::TEST_ADMIN_API_KEY, "v4",
                                                                       clock, issue_time - 10);
    token_signer::TokenResult later = token_signer::issue_token(test_helpers::TEST_ADMIN_API_KEY, "v4",
                                                                clock, issue_time + 5);

    bool success = expect(first.success && stepped_back.success && later.success, "Tokens issued at fixed times");
    success &= expect(first.issued_at == issue_time, "First token uses the given time");
    success &= expect(stepped_back.issued_at == issue_time, "Clock stepping back keeps the previous issued-at");
    success &= expect(stepped_back.expires_at == issue_time + 300, "Stepped-back token still expires 300 s after issue");
    success &= expect(later.issued_at == issue_time + 5, "Clock moving forward is followed");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_credential_split();
    all_passed &= test_malformed_credentials_rejected();
    all_passed &= test_non_hex_secret_is_signing_error();
    all_passed &= test_header_and_claims_layout();
    all_passed &= test_signature_matches_hmac_of_decoded_secret();
    all_passed &= test_issued_at_never_decreases();
    all_passed &= test_clock_step_back_reuses_last_issued_at();
    return all_passed;
}

} // namespace test_token_signer
