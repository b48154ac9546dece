#include "ghost/post_operations.hpp"
#include "ghost/post_schema.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

namespace post_operations {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;
using ghost_api::ApiResult;
using ghost_api::describe_error;

static json tag_list(const std::vector<std::string> &tags) {
    json tag_objects = json::array();
    for (const auto &tag : tags) {
        json tag_object;
        tag_object["name"] = tag;
        tag_objects.push_back(tag_object);
    }
    return tag_objects;
}

// "Unexpected response format: " followed by the error and the raw payload.
static std::string unexpected_format(const ghost_api::ApiError &error, const json &payload) {
    json report;
    report["error"] = error.message;
    report["response"] = payload;
    return "Unexpected response format: " + report.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string create_post(const request_dispatcher::ApiContext &context, const CreatePostArguments &arguments) {
    json post;
    post["title"] = arguments.title;
    post["html"] = arguments.content;
    post["status"] = arguments.status;
    if (!arguments.tags.empty()) {
        post["tags"] = tag_list(arguments.tags);
    }

    api_request::ApiRequest request = api_request::posts_collection("POST");
    request.body = json{{"posts", json::array({post})}};

    debug_log::log("create_post: title='" + arguments.title + "' status=" + arguments.status);
    ApiResult response = request_dispatcher::dispatch(context, request);
    if (!response.success) {
        return "Error creating post: " + describe_error(response.error);
    }

    post_schema::DecodeResult decoded = post_schema::decode_posts(
        response.payload,
        post_schema::kPostId | post_schema::kPostTitle | post_schema::kPostUrl |
            post_schema::kPostStatus | post_schema::kPostCreatedAt,
        true);
    if (!decoded.success) {
        return unexpected_format(decoded.error, response.payload);
    }

    const post_schema::PostRecord &created = decoded.posts.front();
    ordered_json summary;
    summary["id"] = created.id;
    summary["title"] = created.title;
    summary["url"] = created.url;
    summary["status"] = created.status;
    summary["created_at"] = created.created_at;
    return summary.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string list_posts(const request_dispatcher::ApiContext &context, const ListPostsArguments &arguments) {
    api_request::ApiRequest request = api_request::posts_collection("GET");
    request.query.emplace_back("limit", std::to_string(arguments.limit));
    if (arguments.status != "all") {
        request.query.emplace_back("filter", "status:" + arguments.status);
    }

    ApiResult response = request_dispatcher::dispatch(context, request);
    if (!response.success) {
        return "Error listing posts: " + describe_error(response.error);
    }

    post_schema::DecodeResult decoded = post_schema::decode_posts(
        response.payload,
        post_schema::kPostId | post_schema::kPostTitle | post_schema::kPostStatus |
            post_schema::kPostCreatedAt | post_schema::kPostUpdatedAt,
        false);
    if (!decoded.success) {
        return unexpected_format(decoded.error, response.payload);
    }
    if (decoded.posts.empty()) {
        return "No posts found matching the criteria.";
    }

    ordered_json listing = ordered_json::array();
    for (const auto &post : decoded.posts) {
        ordered_json entry;
        entry["id"] = post.id;
        entry["title"] = post.title;
        entry["status"] = post.status;
        entry["created_at"] = post.created_at;
        entry["updated_at"] = post.updated_at;
        listing.push_back(entry);
    }
    debug_log::log("list_posts: " + std::to_string(decoded.posts.size()) + " post(s)");
    return listing.dump(2, ' ', false, json::error_handler_t::replace);
}

std::string edit_post(const request_dispatcher::ApiContext &context, const EditPostArguments &arguments) {
    ApiResult current = request_dispatcher::dispatch(context, api_request::post_by_id("GET", arguments.post_id));
    if (!current.success) {
        return "Error retrieving post: " + describe_error(current.error);
    }

    // Stored values are only needed for fields the caller leaves unset.
    unsigned required_fields = post_schema::kPostUpdatedAt;
    if (!arguments.title.has_value()) {
        required_fields |= post_schema::kPostTitle;
    }
    if (!arguments.content.has_value()) {
        required_fields |= post_schema::kPostHtml;
    }
    if (!arguments.status.has_value()) {
        required_fields |= post_schema::kPostStatus;
    }

    post_schema::DecodeResult stored = post_schema::decode_posts(current.payload, required_fields, true);
    if (!stored.success) {
        return "Error processing post data: " + stored.error.message;
    }
    const post_schema::PostRecord &existing = stored.posts.front();

    json post;
    post["id"] = arguments.post_id;
    post["title"] = arguments.title.has_value() ? json(*arguments.title) : json(existing.title);
    post["html"] = arguments.content.has_value() ? json(*arguments.content) : existing.html;
    post["status"] = arguments.status.has_value() ? json(*arguments.status) : json(existing.status);
    post["updated_at"] = existing.updated_at;
    if (arguments.tags.has_value() && !arguments.tags->empty()) {
        post["tags"] = tag_list(*arguments.tags);
    }

    api_request::ApiRequest request = api_request::post_by_id("PUT", arguments.post_id);
    request.body = json{{"posts", json::array({post})}};

    debug_log::log("edit_post: id=" + arguments.post_id + " updated_at=" + existing.updated_at);
    ApiResult response = request_dispatcher::dispatch(context, request);
    if (!response.success) {
        return "Error updating post: " + describe_error(response.error);
    }

    post_schema::DecodeResult updated = post_schema::decode_posts(
        response.payload,
        post_schema::kPostId | post_schema::kPostTitle | post_schema::kPostUrl |
            post_schema::kPostStatus | post_schema::kPostUpdatedAt,
        true);
    if (!updated.success) {
        return "Error processing post data: " + updated.error.message;
    }

    const post_schema::PostRecord &saved = updated.posts.front();
    ordered_json summary;
    summary["id"] = saved.id;
    summary["title"] = saved.title;
    summary["url"] = saved.url;
    summary["status"] = saved.status;
    summary["updated_at"] = saved.updated_at;
    return summary.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace post_operations
