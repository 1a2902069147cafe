// Tests for line framing on the stdio transport, using string streams in place of stdin/stdout.

#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace test_stdio {

static bool report(bool success, const std::string &description) {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return success;
}

// Test: One message per line, blank lines skipped, then end of stream.
static bool test_read_lines() {
    std::istringstream input("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n\n   \n{\"a\":2}");
    mcp_stdio::ReadResult first = mcp_stdio::read_message(input);
    mcp_stdio::ReadResult second = mcp_stdio::read_message(input);
    mcp_stdio::ReadResult third = mcp_stdio::read_message(input);

    bool success = !first.end_of_stream && first.message["method"] == "ping" &&
                   !second.end_of_stream && second.message["a"] == 2 &&
                   third.end_of_stream;
    return report(success, "read_message frames one JSON value per line");
}

// Test: Unparseable lines become parse failure records and reading continues.
static bool test_parse_failure_record() {
    std::istringstream input("{not json\n{\"ok\":true}\n");
    mcp_stdio::ReadResult broken = mcp_stdio::read_message(input);
    mcp_stdio::ReadResult next = mcp_stdio::read_message(input);

    bool success = !broken.end_of_stream && broken.parse_failed &&
                   broken.message["error"]["code"] == json_rpc::PARSE_ERROR &&
                   !next.parse_failed && next.message["ok"] == true;
    return report(success, "Malformed line yields a parse failure record");
}

// Test: A well-formed line carrying only an error member is client data, not a parse failure.
static bool test_error_line_is_not_parse_failure() {
    std::istringstream input("{\"error\":{\"code\":-32000,\"message\":\"client-side failure\"}}\n");
    mcp_stdio::ReadResult result = mcp_stdio::read_message(input);
    bool success = !result.end_of_stream && !result.parse_failed && result.message["error"]["code"] == -32000;
    return report(success, "Parsed error-shaped line is not flagged as a parse failure");
}

// Test: Empty input is end of stream.
static bool test_empty_input() {
    std::istringstream input("");
    return report(mcp_stdio::read_message(input).end_of_stream, "Empty input is end of stream");
}

// Test: Writer emits compact single lines.
static bool test_write_line() {
    std::ostringstream output;
    mcp_stdio::MessageWriter writer(output);
    bool written = writer.write(json_rpc::build_response(1, {{"text", "multi\nline"}}));

    std::string text = output.str();
    bool success = written && !text.empty() && text.back() == '\n' &&
                   text.find('\n') == text.size() - 1 &&
                   json::parse(text)["result"]["text"] == "multi\nline";
    return report(success, "MessageWriter writes one compact line per message");
}

// Test: Invalid UTF-8 in a value is replaced rather than failing the write.
static bool test_write_invalid_utf8() {
    std::ostringstream output;
    mcp_stdio::MessageWriter writer(output);
    bool written = writer.write(json_rpc::build_response(1, {{"text", std::string("bad \xC3\x28 byte")}}));
    bool success = written && json::parse(output.str())["result"]["text"].get<std::string>().find("\xEF\xBF\xBD") !=
                                  std::string::npos;
    return report(success, "Invalid UTF-8 is replaced with U+FFFD");
}

// Test: Concurrent writers never interleave within a line.
static bool test_concurrent_writes() {
    std::ostringstream output;
    mcp_stdio::MessageWriter writer(output);

    const int thread_count = 8;
    const int messages_per_thread = 50;
    std::vector<std::thread> threads;
    for (int thread_index = 0; thread_index < thread_count; ++thread_index) {
        threads.emplace_back([&writer, thread_index, messages_per_thread]() {
            for (int message_index = 0; message_index < messages_per_thread; ++message_index) {
                writer.write(json_rpc::build_response(thread_index * 1000 + message_index,
                                                      {{"payload", std::string(200, 'a' + thread_index)}}));
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    std::istringstream lines(output.str());
    std::string line;
    int line_count = 0;
    bool all_parse = true;
    while (std::getline(lines, line)) {
        ++line_count;
        try {
            json parsed = json::parse(line);
            all_parse &= parsed["result"]["payload"].get<std::string>().size() == 200;
        } catch (const json::exception &) {
            all_parse = false;
        }
    }

    bool success = all_parse && line_count == thread_count * messages_per_thread;
    return report(success, "Concurrent writes produce whole lines only");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_read_lines();
    all_passed &= test_parse_failure_record();
    all_passed &= test_error_line_is_not_parse_failure();
    all_passed &= test_empty_input();
    all_passed &= test_write_line();
    all_passed &= test_write_invalid_utf8();
    all_passed &= test_concurrent_writes();
    return all_passed;
}

} // namespace test_stdio
