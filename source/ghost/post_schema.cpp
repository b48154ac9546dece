#include "ghost/post_schema.hpp"

namespace post_schema {

using ghost_api::ErrorKind;
using ghost_api::make_error;

struct StringField {
    PostField flag;
    const char *key;
    std::string PostRecord::*member;
};

static const StringField STRING_FIELDS[] = {
    {kPostId, "id", &PostRecord::id},
    {kPostTitle, "title", &PostRecord::title},
    {kPostUrl, "url", &PostRecord::url},
    {kPostStatus, "status", &PostRecord::status},
    {kPostCreatedAt, "created_at", &PostRecord::created_at},
    {kPostUpdatedAt, "updated_at", &PostRecord::updated_at},
};

static bool decode_post(const json &entry, unsigned required_fields, PostRecord &out_post,
                        std::string &error_detail) {
    if (!entry.is_object()) {
        error_detail = "post entry is not an object";
        return false;
    }

    for (const auto &field : STRING_FIELDS) {
        bool required = (required_fields & field.flag) != 0;
        auto iterator = entry.find(field.key);
        if (iterator == entry.end()) {
            if (required) {
                error_detail = "missing key '" + std::string(field.key) + "'";
                return false;
            }
            continue;
        }
        if (iterator->is_string()) {
            out_post.*field.member = iterator->get<std::string>();
        } else if (required) {
            error_detail = "key '" + std::string(field.key) + "' is not a string";
            return false;
        }
    }

    auto html_iterator = entry.find("html");
    if (html_iterator == entry.end()) {
        if ((required_fields & kPostHtml) != 0) {
            error_detail = "missing key 'html'";
            return false;
        }
    } else if (html_iterator->is_string() || html_iterator->is_null()) {
        out_post.html = *html_iterator;
    } else if ((required_fields & kPostHtml) != 0) {
        error_detail = "key 'html' is not a string";
        return false;
    }

    return true;
}

DecodeResult decode_posts(const json &payload, unsigned required_fields, bool require_one) {
    DecodeResult result;

    if (!payload.is_object() || !payload.contains("posts")) {
        result.error = make_error(ErrorKind::kResponseShapeError, "missing key 'posts'");
        return result;
    }
    const json &posts = payload["posts"];
    if (!posts.is_array()) {
        result.error = make_error(ErrorKind::kResponseShapeError, "key 'posts' is not a list");
        return result;
    }
    if (require_one && posts.empty()) {
        result.error = make_error(ErrorKind::kResponseShapeError, "'posts' list is empty");
        return result;
    }

    for (size_t index = 0; index < posts.size(); index++) {
        PostRecord post;
        std::string error_detail;
        if (!decode_post(posts[index], required_fields, post, error_detail)) {
            result.posts.clear();
            result.error = make_error(ErrorKind::kResponseShapeError,
                                      "posts[" + std::to_string(index) + "]: " + error_detail);
            return result;
        }
        result.posts.push_back(std::move(post));
    }

    result.success = true;
    return result;
}

} // namespace post_schema
