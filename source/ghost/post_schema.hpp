#ifndef GMCPS_POST_SCHEMA_HPP
#define GMCPS_POST_SCHEMA_HPP

// Typed decode of Ghost "posts" envelopes: {"posts":[{...}, ...]}.
// Each caller names the fields it needs; a missing or mistyped field is a
// ResponseShapeError instead of a lookup exception.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "ghost/api_result.hpp"

namespace post_schema {

using json = nlohmann::json;

enum PostField : unsigned {
    kPostId = 1u << 0,
    kPostTitle = 1u << 1,
    kPostUrl = 1u << 2,
    kPostStatus = 1u << 3,
    kPostCreatedAt = 1u << 4,
    kPostUpdatedAt = 1u << 5,
    kPostHtml = 1u << 6
};

struct PostRecord {
    std::string id;
    std::string title;
    std::string url;
    std::string status;
    std::string created_at;
    std::string updated_at;
    json html; // string, or null for posts without content
};

struct DecodeResult {
    bool success = false;
    std::vector<PostRecord> posts;
    ghost_api::ApiError error;
};

// Decode every post in the envelope. required_fields is a PostField mask;
// with require_one set, an empty list is also a shape error.
DecodeResult decode_posts(const json &payload, unsigned required_fields, bool require_one);

} // namespace post_schema

#endif // GMCPS_POST_SCHEMA_HPP
