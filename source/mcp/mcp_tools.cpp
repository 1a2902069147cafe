#include "mcp/mcp_tools.hpp"

#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace mcp_tools {

const char *to_string(ParameterType type) {
    switch (type) {
    case ParameterType::Number:
        return "number";
    case ParameterType::Text:
        return "text";
    default:
        return "string";
    }
}

std::optional<ParameterType> parse_parameter_type(const std::string &text) {
    if (text == "string") {
        return ParameterType::String;
    }
    if (text == "number") {
        return ParameterType::Number;
    }
    if (text == "text") {
        return ParameterType::Text;
    }
    return std::nullopt;
}

// --- ToolBuilder ---

ToolBuilder::ToolBuilder(std::string name, std::string doc) {
    definition_.name = std::move(name);
    definition_.doc = doc.empty() ? definition_.name : std::move(doc);
}

ToolBuilder &ToolBuilder::parameter(const std::string &name, ParameterType type, const std::string &doc) {
    Parameter entry;
    entry.name = name;
    entry.doc = doc.empty() ? name : doc;
    entry.type = type;
    entry.required = true;
    definition_.parameters.push_back(std::move(entry));
    return *this;
}

ToolBuilder &ToolBuilder::optional_parameter(const std::string &name, ParameterType type,
                                             const std::string &doc, json default_value) {
    Parameter entry;
    entry.name = name;
    entry.doc = doc.empty() ? name : doc;
    entry.type = type;
    entry.required = false;
    entry.default_value = std::move(default_value);
    definition_.parameters.push_back(std::move(entry));
    return *this;
}

ToolBuilder &ToolBuilder::optional_parameter(const std::string &name, ParameterType type, const std::string &doc) {
    Parameter entry;
    entry.name = name;
    entry.doc = doc.empty() ? name : doc;
    entry.type = type;
    entry.required = false;
    definition_.parameters.push_back(std::move(entry));
    return *this;
}

ToolBuilder &ToolBuilder::handler(ToolHandler tool_handler) {
    definition_.handler = std::move(tool_handler);
    return *this;
}

ToolDefinition ToolBuilder::build() const {
    if (definition_.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!definition_.handler) {
        throw std::invalid_argument("Tool '" + definition_.name + "' has no handler");
    }

    std::unordered_set<std::string> seen_names;
    for (const auto &entry : definition_.parameters) {
        if (entry.name.empty()) {
            throw std::invalid_argument("Tool '" + definition_.name + "' has a parameter without a name");
        }
        if (!seen_names.insert(entry.name).second) {
            throw std::invalid_argument("Tool '" + definition_.name + "' declares parameter '" +
                                        entry.name + "' more than once");
        }
    }
    return definition_;
}

// --- Schema ---

std::vector<std::string> required_parameter_names(const ToolDefinition &tool) {
    std::vector<std::string> names;
    for (const auto &entry : tool.parameters) {
        if (entry.required) {
            names.push_back(entry.name);
        }
    }
    return names;
}

json input_schema(const ToolDefinition &tool) {
    json properties = json::object();
    for (const auto &entry : tool.parameters) {
        json property;
        property["type"] = to_string(entry.type);
        property["doc"] = entry.doc;
        property["required"] = entry.required;
        if (entry.default_value) {
            property["default"] = *entry.default_value;
        }
        properties[entry.name] = property;
    }

    json schema;
    schema["type"] = "object";
    schema["required"] = required_parameter_names(tool);
    schema["properties"] = properties;
    return schema;
}

json tool_to_json_schema(const ToolDefinition &tool) {
    json tool_entry;
    tool_entry["name"] = tool.name;
    tool_entry["description"] = tool.doc;
    tool_entry["inputSchema"] = input_schema(tool);
    return tool_entry;
}

json argument_or_default(const ToolDefinition &tool, const json &arguments, const std::string &name) {
    if (arguments.is_object() && arguments.contains(name)) {
        return arguments[name];
    }
    for (const auto &entry : tool.parameters) {
        if (entry.name == name && entry.default_value) {
            return *entry.default_value;
        }
    }
    return nullptr;
}

// --- ToolRegistry ---

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> definitions) : definitions_(std::move(definitions)) {
    for (size_t position = 0; position < definitions_.size(); ++position) {
        const std::string &name = definitions_[position].name;
        if (!index_by_name_.emplace(name, position).second) {
            throw std::invalid_argument("Duplicate tool name: " + name);
        }
    }
}

const ToolDefinition *ToolRegistry::find(const std::string &name) const {
    auto found = index_by_name_.find(name);
    if (found == index_by_name_.end()) {
        return nullptr;
    }
    return &definitions_[found->second];
}

json ToolRegistry::list_tools() const {
    json tools_array = json::array();
    for (const auto &tool : definitions_) {
        tools_array.push_back(tool_to_json_schema(tool));
    }
    return tools_array;
}

} // namespace mcp_tools
