#ifndef GMCPS_TEXT_ENCODING_HPP
#define GMCPS_TEXT_ENCODING_HPP

// Small text/byte encoding helpers shared by the token signer,
// request builder and configuration loader.

#include <cstddef>
#include <string>

namespace text_encoding {

// Decode a hex string into raw bytes. Returns false on odd length or a
// non-hex character; out_bytes is left in an unspecified state then.
bool hex_to_bytes(const std::string &hex, std::string &out_bytes);

// Lower-case hex of raw bytes.
std::string bytes_to_hex(const std::string &bytes);

// Base64url (RFC 4648 section 5) without padding, as used by JWS.
std::string base64url_encode(const std::string &bytes);

// Percent-encode everything outside the RFC 3986 unreserved set, plus any
// characters listed in keep_literal.
std::string percent_encode(const std::string &text, const std::string &keep_literal = "");

std::string to_lower(const std::string &input);
std::string to_upper(const std::string &input);

// Strip leading and trailing ASCII whitespace.
std::string trim(const std::string &input);

// Replace malformed UTF-8 (stray continuation bytes, truncated or overlong
// sequences, surrogates) with U+FFFD so the text can be embedded in JSON.
std::string sanitize_utf8(const std::string &text);

// Cut text to at most max_code_points UTF-8 code points.
std::string truncate_utf8(const std::string &text, std::size_t max_code_points);

} // namespace text_encoding

#endif // GMCPS_TEXT_ENCODING_HPP
