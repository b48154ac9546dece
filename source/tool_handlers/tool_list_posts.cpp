#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "ghost/post_operations.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_list_posts(const request_dispatcher::ApiContext &context, const json &arguments) {
    post_operations::ListPostsArguments list_arguments;
    std::optional<int> limit;
    std::optional<std::string> status;
    std::string error_message;

    if (!tool_arguments::read_optional_integer(arguments, "limit", limit, error_message) ||
        !tool_arguments::read_optional_string(arguments, "status", status, error_message)) {
        return mcp_tools::build_text_result(error_message, true);
    }

    if (limit.has_value()) {
        if (*limit < 1) {
            return mcp_tools::build_text_result("Parameter 'limit' must be at least 1.", true);
        }
        list_arguments.limit = *limit;
    }
    if (status.has_value()) {
        std::vector<std::string> allowed = {"all"};
        allowed.insert(allowed.end(), tool_arguments::POST_STATUSES.begin(), tool_arguments::POST_STATUSES.end());
        if (!tool_arguments::check_one_of(*status, allowed, "status", error_message)) {
            return mcp_tools::build_text_result(error_message, true);
        }
        list_arguments.status = *status;
    }

    return mcp_tools::build_text_result(post_operations::list_posts(context, list_arguments), false);
}

namespace tool_list_posts {

void register_tool(const request_dispatcher::ApiContext &context) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["limit"] = {
        {"type", "integer"},
        {"minimum", 1},
        {"default", 10},
        {"description", "Maximum number of posts to retrieve (default: 10)"}
    };
    input_schema["properties"]["status"] = {
        {"type", "string"},
        {"enum", {"all", "draft", "published", "scheduled"}},
        {"default", "all"},
        {"description", "Filter by post status (all, draft, published, scheduled)"}
    };
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "list_posts",
        "List posts from Ghost, newest first as returned by the Admin API. "
        "Returns id, title, status, created_at and updated_at for each post.",
        input_schema,
        [&context](const json &arguments) { return handle_list_posts(context, arguments); }
    });
}

} // namespace tool_list_posts
