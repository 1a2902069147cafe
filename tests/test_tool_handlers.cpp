// Tests for the bundled example tools, run through the same pipeline the server uses.

#include "mcp/mcp_invoke.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"

#include <iostream>
#include <limits>
#include <string>

using json = nlohmann::json;

namespace test_tool_handlers {

static bool report(bool success, const std::string &description) {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return success;
}

static const mcp_tools::ToolRegistry &registry() {
    static const mcp_tools::ToolRegistry tools = tool_handlers::build_registry();
    return tools;
}

static mcp_invoke::InvocationResult call(const std::string &tool_name, const json &arguments) {
    return mcp_invoke::invoke_tool(*registry().find(tool_name), arguments);
}

// Test: Every bundled tool is registered under its name.
static bool test_registry_contents() {
    bool success = registry().size() == 5;
    for (const char *name : {"add", "divide", "greet", "echo", "word_count"}) {
        success &= registry().find(name) != nullptr;
    }
    return report(success, "All example tools are registered");
}

// Test: add keeps integers exact and handles fractions.
static bool test_add() {
    mcp_invoke::InvocationResult integers = call("add", {{"a", 2}, {"b", 40}});
    mcp_invoke::InvocationResult fractions = call("add", {{"a", 0.5}, {"b", 1}});
    bool success = integers.success && integers.results[0] == 42 && integers.results[0].is_number_integer() &&
                   fractions.success && fractions.results[0] == 1.5;
    return report(success, "add");
}

// Test: add never wraps around at the edges of the integer range.
static bool test_add_integer_limits() {
    const long long max_value = std::numeric_limits<long long>::max();
    const long long min_value = std::numeric_limits<long long>::min();
    const unsigned long long max_unsigned = std::numeric_limits<unsigned long long>::max();

    mcp_invoke::InvocationResult largest = call("add", {{"a", max_value}, {"b", -1}});
    mcp_invoke::InvocationResult above = call("add", {{"a", max_value}, {"b", 1}});
    mcp_invoke::InvocationResult below = call("add", {{"a", min_value}, {"b", -1}});
    mcp_invoke::InvocationResult unsigned_sum = call("add", {{"a", max_unsigned}, {"b", 0}});

    bool success = largest.success && largest.results[0].is_number_integer() &&
                   largest.results[0].get<long long>() == max_value - 1;
    success &= above.success && above.results[0].is_number_float() &&
               above.results[0].get<double>() == static_cast<double>(max_value) + 1.0;
    success &= below.success && below.results[0].is_number_float() && below.results[0].get<double>() < 0.0;
    success &= unsigned_sum.success && unsigned_sum.results[0].is_number_float() &&
               unsigned_sum.results[0].get<double>() == static_cast<double>(max_unsigned);
    return report(success, "add falls back to double instead of overflowing");
}

// Test: divide by zero is a tool-level error.
static bool test_divide() {
    mcp_invoke::InvocationResult quotient = call("divide", {{"dividend", 9}, {"divisor", 2}});
    mcp_invoke::InvocationResult by_zero = call("divide", {{"dividend", 1}, {"divisor", 0}});
    bool success = quotient.success && quotient.results[0] == 4.5 && !by_zero.success &&
                   by_zero.errors[0] == "Division by zero";
    return report(success, "divide, including division by zero");
}

// Test: greet applies its own default greeting.
static bool test_greet() {
    mcp_invoke::InvocationResult plain = call("greet", {{"name", "Ada"}});
    mcp_invoke::InvocationResult custom = call("greet", {{"name", "Ada"}, {"greeting", "Hi"}});
    bool success = plain.success && plain.results[0] == "Hello, Ada!" && custom.results[0] == "Hi, Ada!";

    json schema = mcp_tools::input_schema(*registry().find("greet"));
    success &= schema["required"] == json::array({"name"}) && schema["properties"]["greeting"]["default"] == "Hello";
    return report(success, "greet with and without a greeting");
}

// Test: echo and word_count take text parameters.
static bool test_text_tools() {
    mcp_invoke::InvocationResult echoed = call("echo", {{"text", "same text"}});
    mcp_invoke::InvocationResult counted = call("word_count", {{"text", "  one two\tthree\nfour  "}});
    mcp_invoke::InvocationResult wrong_type = call("word_count", {{"text", 12}});
    bool success = echoed.success && echoed.results[0] == "same text" && counted.success &&
                   counted.results[0] == 4 && !wrong_type.success;
    return report(success, "echo and word_count");
}

// Test: Missing arguments for a bundled tool escape as a protocol error.
static bool test_missing_arguments() {
    try {
        call("divide", {{"dividend", 1}});
    } catch (const json_rpc::ProtocolError &error) {
        return report(error.code() == json_rpc::INVALID_PARAMS, "divide without divisor is -32602");
    }
    return report(false, "divide without divisor should throw");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_registry_contents();
    all_passed &= test_add();
    all_passed &= test_add_integer_limits();
    all_passed &= test_divide();
    all_passed &= test_greet();
    all_passed &= test_text_tools();
    all_passed &= test_missing_arguments();
    return all_passed;
}

} // namespace test_tool_handlers
