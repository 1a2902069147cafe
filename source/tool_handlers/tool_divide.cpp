#include "tool_handlers/tool_handlers.hpp"
#include "utils/mcp_log.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

static mcp_tools::ToolResults handle_divide(const json &arguments) {
    double dividend = arguments["dividend"].get<double>();
    double divisor = arguments["divisor"].get<double>();

    mcp_log::debug("divide invoked dividend=" + std::to_string(dividend) + " divisor=" + std::to_string(divisor));

    if (divisor == 0.0) {
        throw std::domain_error("Division by zero");
    }
    return {dividend / divisor};
}

namespace tool_divide {

mcp_tools::ToolDefinition make_tool() {
    return mcp_tools::ToolBuilder("divide", "Divides dividend by divisor. Fails on a zero divisor.")
        .parameter("dividend", mcp_tools::ParameterType::Number, "Number to divide.")
        .parameter("divisor", mcp_tools::ParameterType::Number, "Number to divide by; must not be zero.")
        .handler(handle_divide)
        .build();
}

} // namespace tool_divide
