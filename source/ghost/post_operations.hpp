#ifndef GMCPS_POST_OPERATIONS_HPP
#define GMCPS_POST_OPERATIONS_HPP

// Post operations behind the create_post, list_posts and edit_post tools.
// Each takes typed arguments, talks to the Admin API through the request
// dispatcher and returns the text handed back to the MCP client: formatted
// JSON on success, an "Error ..." line otherwise.

#include <optional>
#include <string>
#include <vector>

#include "ghost/request_dispatcher.hpp"

namespace post_operations {

struct CreatePostArguments {
    std::string title;
    std::string content; // HTML
    std::string status = "draft";
    std::vector<std::string> tags;
};

struct ListPostsArguments {
    int limit = 10;
    std::string status = "all";
};

// Unset optionals keep the value currently stored in Ghost.
struct EditPostArguments {
    std::string post_id;
    std::optional<std::string> title;
    std::optional<std::string> content;
    std::optional<std::string> status;
    std::optional<std::vector<std::string>> tags;
};

std::string create_post(const request_dispatcher::ApiContext &context, const CreatePostArguments &arguments);

std::string list_posts(const request_dispatcher::ApiContext &context, const ListPostsArguments &arguments);

// Reads the post first (for its updated_at, which Ghost uses to reject
// conflicting edits) and only then sends the update.
std::string edit_post(const request_dispatcher::ApiContext &context, const EditPostArguments &arguments);

} // namespace post_operations

#endif // GMCPS_POST_OPERATIONS_HPP
