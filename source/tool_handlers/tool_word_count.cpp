#include "tool_handlers/tool_handlers.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

static mcp_tools::ToolResults handle_word_count(const json &arguments) {
    const std::string text = arguments["text"].get<std::string>();

    long long word_count = 0;
    bool inside_word = false;
    for (unsigned char character : text) {
        if (std::isspace(character)) {
            inside_word = false;
        } else if (!inside_word) {
            inside_word = true;
            ++word_count;
        }
    }
    return {word_count};
}

namespace tool_word_count {

mcp_tools::ToolDefinition make_tool() {
    return mcp_tools::ToolBuilder("word_count", "Counts whitespace-separated words in a text.")
        .parameter("text", mcp_tools::ParameterType::Text, "Text to count words in.")
        .handler(handle_word_count)
        .build();
}

} // namespace tool_word_count
