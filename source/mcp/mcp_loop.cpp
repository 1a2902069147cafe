#include "mcp/mcp_loop.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/mcp_log.hpp"

#include <istream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace mcp_loop {

using json = nlohmann::json;

namespace {

void call_hook(const std::function<void(const json &)> &hook, const json &message, const char *hook_name) {
    if (!hook) {
        return;
    }
    try {
        hook(message);
    } catch (const std::exception &error) {
        mcp_log::warn(std::string(hook_name) + " hook failed: " + error.what());
    }
}

// Worker body for one message: dispatch, write the response, then run any follow-up.
void process_message(const mcp_server::ServerConfig &config, const json &message, bool parse_failed,
                     const mcp_dispatch::NotificationSender &send_message) {
    try {
        mcp_dispatch::DispatchResult dispatched;
        if (parse_failed) {
            dispatched = mcp_dispatch::handle_parse_failure(message);
        } else {
            mcp_log::debug(std::string("Handling ") + json_rpc::to_string(json_rpc::classify_message(message)) +
                           " message: " + message.dump(-1, ' ', false, json::error_handler_t::replace));
            dispatched = mcp_dispatch::handle_message(config, message, send_message);
        }

        if (!dispatched.response.is_null()) {
            send_message(dispatched.response);
        }
        if (dispatched.after_response) {
            dispatched.after_response();
        }
    } catch (const std::exception &error) {
        mcp_log::error(std::string("Critical error handling message: ") + error.what());
        if (!parse_failed && json_rpc::classify_message(message) == json_rpc::MessageKind::Request) {
            send_message(json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INTERNAL_ERROR,
                                                        std::string("Internal error: ") + error.what()));
        }
    }
}

} // namespace

// --- TaskGroup ---

TaskGroup::~TaskGroup() {
    wait_idle();
}

void TaskGroup::launch(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++active_count_;
    }

    auto body = [this, task]() {
        try {
            task();
        } catch (const std::exception &error) {
            mcp_log::error(std::string("Unhandled exception in worker: ") + error.what());
        } catch (...) {
            mcp_log::error("Unhandled unknown exception in worker");
        }
        finish_one();
    };

    try {
        std::thread worker(body);
        worker.detach();
    } catch (const std::system_error &error) {
        mcp_log::warn(std::string("Could not start worker thread, running inline: ") + error.what());
        body();
    }
}

void TaskGroup::wait_idle() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    idle_condition_.wait(lock, [this]() { return active_count_ == 0; });
}

size_t TaskGroup::active_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_count_;
}

void TaskGroup::finish_one() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    --active_count_;
    if (active_count_ == 0) {
        idle_condition_.notify_all();
    }
}

// --- Server loop ---

int run(const mcp_server::ServerConfig &config, std::istream &input, std::ostream &output,
        const std::atomic<bool> *stop_requested) {
    mcp_log::debug("Starting MCP server loop for " + config.name);

    mcp_stdio::MessageWriter writer(output);
    TaskGroup tasks;

    mcp_dispatch::NotificationSender send_message = [&config, &writer](const json &message) {
        call_hook(config.on_send, message, "on_send");
        writer.write(message);
    };

    while (stop_requested == nullptr || !stop_requested->load()) {
        mcp_log::debug("Waiting for request...");
        mcp_stdio::ReadResult read_result = mcp_stdio::read_message(input);

        if (read_result.end_of_stream) {
            mcp_log::debug("End of input, client probably disconnected");
            break;
        }

        call_hook(config.on_receive, read_result.message, "on_receive");

        json message = std::move(read_result.message);
        bool parse_failed = read_result.parse_failed;
        tasks.launch([&config, &send_message, message, parse_failed]() {
            process_message(config, message, parse_failed, send_message);
        });
    }

    tasks.wait_idle();
    mcp_log::debug("Exiting MCP server loop.");
    return 0;
}

} // namespace mcp_loop
