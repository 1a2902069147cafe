#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/mcp_log.hpp"

#include <istream>
#include <ostream>

namespace mcp_stdio {

namespace {

bool is_blank(const std::string &line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ReadResult read_message(std::istream &input) {
    ReadResult read_result;
    std::string line;

    while (true) {
        if (!std::getline(input, line)) {
            if (input.eof()) {
                read_result.end_of_stream = true;
                return read_result;
            }
            if (input.bad()) {
                mcp_log::error("Input stream is unusable, treating as end of stream");
                read_result.end_of_stream = true;
                return read_result;
            }
            // Stream failure without EOF: report it and keep the stream usable.
            input.clear();
            mcp_log::debug("Error reading message from input stream");
            read_result.parse_failed = true;
            read_result.message = json_rpc::make_parse_failure("Failed to read from input stream");
            return read_result;
        }
        if (!is_blank(line)) {
            break;
        }
    }

    mcp_log::debug("Received message: " + line);
    try {
        read_result.message = json::parse(line);
    } catch (const json::parse_error &error) {
        mcp_log::debug(std::string("Error parsing message: ") + error.what());
        read_result.parse_failed = true;
        read_result.message = json_rpc::make_parse_failure(error.what());
    }
    return read_result;
}

MessageWriter::MessageWriter(std::ostream &output) : output_(output) {}

bool MessageWriter::write(const json &message) {
    std::string json_string;
    try {
        json_string = message.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception &error) {
        mcp_log::error(std::string("Error serialising message: ") + error.what());
        return false;
    }

    mcp_log::debug("Sending message: " + json_string);

    std::lock_guard<std::mutex> lock(output_mutex_);
    output_ << json_string << "\n";
    output_.flush();
    if (!output_) {
        mcp_log::error("Error writing message to output stream");
        return false;
    }
    return true;
}

} // namespace mcp_stdio
