#ifndef GMCPS_TOKEN_SIGNER_HPP
#define GMCPS_TOKEN_SIGNER_HPP

// Ghost Admin API token signer.
//
// Ghost admin keys are "ID:SECRET" where SECRET is hex. Every request carries
// a fresh HS256 JWT:
//   header  {"alg":"HS256","kid":ID,"typ":"JWT"}
//   claims  {"iat":now,"exp":now+300,"aud":"/<version>/admin/"}
//   signed with the hex-decoded SECRET.
// Tokens are never cached.

#include <atomic>
#include <cstdint>
#include <string>

#include "ghost/api_result.hpp"

namespace token_signer {

constexpr std::int64_t kTokenLifetimeSeconds = 300;

struct Credential {
    std::string key_id;
    std::string secret_hex;
};

struct CredentialResult {
    bool success = false;
    Credential credential;
    ghost_api::ApiError error;
};

struct TokenResult {
    bool success = false;
    std::string token;
    std::int64_t issued_at = 0;
    std::int64_t expires_at = 0;
    ghost_api::ApiError error;
};

// Split "ID:SECRET" on its single ':'. Anything but exactly two non-empty
// parts is kInvalidCredentialFormat.
CredentialResult parse_credential(const std::string &admin_api_key);

// Sign a token issued at the given Unix time.
TokenResult issue_token_at(const std::string &admin_api_key, const std::string &api_version,
                           std::int64_t issued_at);

// Hands out issued-at values that never go backwards, even if the wall
// clock does. Safe to share between threads.
class IssuedAtClock {
public:
    // Returns max(now, highest value returned so far).
    std::int64_t next(std::int64_t now);

private:
    std::atomic<std::int64_t> last_issued_at_{0};
};

// Sign a token at clock.next(now).
TokenResult issue_token(const std::string &admin_api_key, const std::string &api_version,
                        IssuedAtClock &clock, std::int64_t now);

// Sign a token issued now, using the process-wide clock.
TokenResult issue_token(const std::string &admin_api_key, const std::string &api_version);

} // namespace token_signer

#endif // GMCPS_TOKEN_SIGNER_HPP
