#ifndef TOOLWIRE_MCP_LOOP_HPP
#define TOOLWIRE_MCP_LOOP_HPP

// MCP server loop: a single sequential reader that hands each message to its own worker.
// Responses may complete out of order; each is correlated to its request by id.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <mutex>

#include "mcp/mcp_server.hpp"

namespace mcp_loop {

// Runs each task on its own detached thread and tracks how many are still running.
// No limit on concurrency and no cancellation.
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup &) = delete;
    TaskGroup &operator=(const TaskGroup &) = delete;

    // Exceptions escaping a task are logged. If no thread can be started the task runs inline.
    void launch(std::function<void()> task);

    // Blocks until every launched task has finished.
    void wait_idle();

    size_t active_count() const;

private:
    void finish_one();

    mutable std::mutex state_mutex_;
    std::condition_variable idle_condition_;
    size_t active_count_ = 0;
};

// Reads messages from input until end of stream (or until *stop_requested is set),
// dispatching each on its own worker and writing responses to output.
// Waits for in-flight work before returning. Returns 0.
int run(const mcp_server::ServerConfig &config, std::istream &input, std::ostream &output,
        const std::atomic<bool> *stop_requested = nullptr);

} // namespace mcp_loop

#endif // TOOLWIRE_MCP_LOOP_HPP
