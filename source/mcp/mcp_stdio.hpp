#ifndef TOOLWIRE_MCP_STDIO_HPP
#define TOOLWIRE_MCP_STDIO_HPP

// MCP stdio transport: one JSON value per line in, one JSON value per line out.

#include <nlohmann/json.hpp>
#include <iosfwd>
#include <mutex>
#include <string>

namespace mcp_stdio {

using json = nlohmann::json;

struct ReadResult {
    bool end_of_stream = false;
    // Set when the line could not be read or parsed; message then holds a
    // json_rpc::make_parse_failure() record instead of client data.
    bool parse_failed = false;
    json message;
};

// Read the next non-blank line from input and parse it.
// Never throws; end_of_stream is set once input is exhausted.
ReadResult read_message(std::istream &input);

// Serialises writes to a shared output stream so concurrent responses never interleave.
class MessageWriter {
public:
    explicit MessageWriter(std::ostream &output);

    MessageWriter(const MessageWriter &) = delete;
    MessageWriter &operator=(const MessageWriter &) = delete;

    // Writes message as one compact line and flushes. Invalid UTF-8 is replaced with U+FFFD.
    // Returns false (and logs) if the message could not be serialised or written.
    bool write(const json &message);

private:
    std::ostream &output_;
    std::mutex output_mutex_;
};

} // namespace mcp_stdio

#endif // TOOLWIRE_MCP_STDIO_HPP
