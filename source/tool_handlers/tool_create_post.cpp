#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "ghost/post_operations.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "create_post".
// Creates a post from HTML content via POST posts/?source=html.

static json handle_create_post(const request_dispatcher::ApiContext &context, const json &arguments) {
    post_operations::CreatePostArguments create_arguments;
    std::optional<std::string> status;
    std::optional<std::vector<std::string>> tags;
    std::string error_message;

    if (!tool_arguments::read_required_string(arguments, "title", create_arguments.title, error_message) ||
        !tool_arguments::read_required_string(arguments, "content", create_arguments.content, error_message) ||
        !tool_arguments::read_optional_string(arguments, "status", status, error_message) ||
        !tool_arguments::read_optional_string_list(arguments, "tags", tags, error_message)) {
        return mcp_tools::build_text_result(error_message, true);
    }

    if (status.has_value()) {
        if (!tool_arguments::check_one_of(*status, tool_arguments::POST_STATUSES, "status", error_message)) {
            return mcp_tools::build_text_result(error_message, true);
        }
        create_arguments.status = *status;
    }
    if (tags.has_value()) {
        create_arguments.tags = *tags;
    }

    return mcp_tools::build_text_result(post_operations::create_post(context, create_arguments), false);
}

namespace tool_create_post {

void register_tool(const request_dispatcher::ApiContext &context) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["title"] = {
        {"type", "string"},
        {"description", "The title of the post"}
    };
    input_schema["properties"]["content"] = {
        {"type", "string"},
        {"description", "The content/body of the post in HTML format"}
    };
    input_schema["properties"]["status"] = {
        {"type", "string"},
        {"enum", tool_arguments::POST_STATUSES},
        {"default", "draft"},
        {"description", "Post status (draft, published, scheduled)"}
    };
    input_schema["properties"]["tags"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Optional list of tag names to associate with the post"}
    };
    input_schema["required"] = json::array({"title", "content"});

    mcp_tools::register_tool({
        "create_post",
        "Create a new post in Ghost. Returns the new post's id, title, url, status "
        "and created_at as JSON.",
        input_schema,
        [&context](const json &arguments) { return handle_create_post(context, arguments); }
    });
}

} // namespace tool_create_post
