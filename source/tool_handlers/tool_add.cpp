#include "tool_handlers/tool_handlers.hpp"
#include "utils/mcp_log.hpp"

#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

static bool fits_long_long(const json &value) {
    if (value.is_number_unsigned()) {
        return value.get<unsigned long long>() <=
               static_cast<unsigned long long>(std::numeric_limits<long long>::max());
    }
    return value.is_number_integer();
}

static bool add_overflows(long long first, long long second) {
    if (second > 0) {
        return first > std::numeric_limits<long long>::max() - second;
    }
    return first < std::numeric_limits<long long>::min() - second;
}

static mcp_tools::ToolResults handle_add(const json &arguments) {
    const json &first = arguments["a"];
    const json &second = arguments["b"];

    mcp_log::debug("add invoked a=" + first.dump() + " b=" + second.dump());

    // Integer sums stay exact while they fit in long long; anything else is summed as double.
    if (fits_long_long(first) && fits_long_long(second)) {
        long long first_value = first.get<long long>();
        long long second_value = second.get<long long>();
        if (!add_overflows(first_value, second_value)) {
            return {first_value + second_value};
        }
    }
    return {first.get<double>() + second.get<double>()};
}

namespace tool_add {

mcp_tools::ToolDefinition make_tool() {
    return mcp_tools::ToolBuilder("add", "Adds two numbers and returns the sum.")
        .parameter("a", mcp_tools::ParameterType::Number, "First addend.")
        .parameter("b", mcp_tools::ParameterType::Number, "Second addend.")
        .handler(handle_add)
        .build();
}

} // namespace tool_add
