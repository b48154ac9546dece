#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "mcp/mcp_tools.hpp"
#include "ghost/post_operations.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "edit_post".
// Fields the caller omits keep their stored values; tags are only replaced
// when a non-empty list is given.

static json handle_edit_post(const request_dispatcher::ApiContext &context, const json &arguments) {
    post_operations::EditPostArguments edit_arguments;
    std::string error_message;

    if (!tool_arguments::read_required_string(arguments, "post_id", edit_arguments.post_id, error_message) ||
        !tool_arguments::read_optional_string(arguments, "title", edit_arguments.title, error_message) ||
        !tool_arguments::read_optional_string(arguments, "content", edit_arguments.content, error_message) ||
        !tool_arguments::read_optional_string(arguments, "status", edit_arguments.status, error_message) ||
        !tool_arguments::read_optional_string_list(arguments, "tags", edit_arguments.tags, error_message)) {
        return mcp_tools::build_text_result(error_message, true);
    }

    if (edit_arguments.post_id.empty()) {
        return mcp_tools::build_text_result("Parameter 'post_id' must not be empty.", true);
    }
    if (edit_arguments.status.has_value() &&
        !tool_arguments::check_one_of(*edit_arguments.status, tool_arguments::POST_STATUSES, "status", error_message)) {
        return mcp_tools::build_text_result(error_message, true);
    }

    return mcp_tools::build_text_result(post_operations::edit_post(context, edit_arguments), false);
}

namespace tool_edit_post {

void register_tool(const request_dispatcher::ApiContext &context) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["post_id"] = {
        {"type", "string"},
        {"description", "The ID of the post to edit"}
    };
    input_schema["properties"]["title"] = {
        {"type", "string"},
        {"description", "New title for the post (optional)"}
    };
    input_schema["properties"]["content"] = {
        {"type", "string"},
        {"description", "New content/body for the post in HTML format (optional)"}
    };
    input_schema["properties"]["status"] = {
        {"type", "string"},
        {"enum", tool_arguments::POST_STATUSES},
        {"description", "New post status (draft, published, scheduled) (optional)"}
    };
    input_schema["properties"]["tags"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "New list of tag names to associate with the post (optional)"}
    };
    input_schema["required"] = json::array({"post_id"});

    mcp_tools::register_tool({
        "edit_post",
        "Edit an existing post in Ghost. Only the fields given are changed. "
        "Returns the post's id, title, url, status and updated_at as JSON.",
        input_schema,
        [&context](const json &arguments) { return handle_edit_post(context, arguments); }
    });
}

} // namespace tool_edit_post
