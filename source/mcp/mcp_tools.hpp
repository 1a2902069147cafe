#ifndef TOOLWIRE_MCP_TOOLS_HPP
#define TOOLWIRE_MCP_TOOLS_HPP

// MCP tool definitions and the tool registry: construction, lookup and listing.

#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// Declared type of a tool parameter. Text is a string meant for longer content.
enum class ParameterType {
    String,
    Number,
    Text
};

const char *to_string(ParameterType type);

// Parses "string", "number" or "text". Returns nullopt for anything else.
std::optional<ParameterType> parse_parameter_type(const std::string &text);

struct Parameter {
    std::string name;
    std::string doc;
    ParameterType type = ParameterType::String;
    bool required = true;
    std::optional<json> default_value;
};

// Values returned by a tool handler. Each becomes one text content item.
using ToolResults = std::vector<json>;

// A tool handler: receives the validated arguments object and returns its results.
// Throwing from a handler reports a tool-level error; it never fails the request.
using ToolHandler = std::function<ToolResults(const json &arguments)>;

struct ToolDefinition {
    std::string name;
    std::string doc;
    std::vector<Parameter> parameters;
    ToolHandler handler;
};

// Builds a ToolDefinition one parameter at a time:
//
//   auto add = ToolBuilder("add", "Adds two numbers.")
//                  .parameter("a", ParameterType::Number, "First addend.")
//                  .parameter("b", ParameterType::Number, "Second addend.")
//                  .handler(handle_add)
//                  .build();
class ToolBuilder {
public:
    ToolBuilder(std::string name, std::string doc = "");

    // Required parameter (no default).
    ToolBuilder &parameter(const std::string &name, ParameterType type, const std::string &doc = "");

    // Optional parameter carrying a default value.
    ToolBuilder &optional_parameter(const std::string &name, ParameterType type,
                                    const std::string &doc, json default_value);

    // Optional parameter without a default.
    ToolBuilder &optional_parameter(const std::string &name, ParameterType type, const std::string &doc = "");

    ToolBuilder &handler(ToolHandler tool_handler);

    // Throws std::invalid_argument on an empty name, a missing handler or a repeated parameter name.
    ToolDefinition build() const;

private:
    ToolDefinition definition_;
};

// Names of the required parameters, in declaration order.
std::vector<std::string> required_parameter_names(const ToolDefinition &tool);

// {type: "object", required: [...], properties: {name: {type, doc, required[, default]}}}
json input_schema(const ToolDefinition &tool);

// {name, description, inputSchema} as listed by tools/list.
json tool_to_json_schema(const ToolDefinition &tool);

// The supplied argument, else the parameter's declared default, else null.
json argument_or_default(const ToolDefinition &tool, const json &arguments, const std::string &name);

// Immutable name -> ToolDefinition map, built once at startup.
class ToolRegistry {
public:
    ToolRegistry() = default;

    // Throws std::invalid_argument if two tools share a name.
    explicit ToolRegistry(std::vector<ToolDefinition> definitions);

    // Returns nullptr when no tool has that name.
    const ToolDefinition *find(const std::string &name) const;

    // Payload of the tools array for tools/list, in declaration order.
    json list_tools() const;

    const std::vector<ToolDefinition> &tools() const { return definitions_; }
    size_t size() const { return definitions_.size(); }
    bool empty() const { return definitions_.empty(); }

private:
    std::vector<ToolDefinition> definitions_;
    std::unordered_map<std::string, size_t> index_by_name_;
};

} // namespace mcp_tools

#endif // TOOLWIRE_MCP_TOOLS_HPP
