#include "proxy/child_session.hpp"

#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <utility>

namespace proxy {

// Protocol version we announce in initialize.
static const char PROTOCOL_VERSION[] = "2024-11-05";
static const char CLIENT_NAME[] = "mcproxy";
static const char CLIENT_VERSION[] = "0.1.0";

// Reader poll interval; bounds how long shutdown waits for the reader to notice.
static const int READER_POLL_MILLISECONDS = 100;

static bool ends_with(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// now() + timeout, with timeout clamped to MAXIMUM_TIMEOUT so the sum never
// overflows the clock's representation.
static std::chrono::steady_clock::time_point deadline_after(std::chrono::milliseconds timeout) {
    if (timeout > MAXIMUM_TIMEOUT) {
        timeout = MAXIMUM_TIMEOUT;
    }
    return std::chrono::steady_clock::now() + timeout;
}

ChildSession::ChildSession(ServerSpec spec) : spec_(std::move(spec)) {}

ChildSession::~ChildSession() {
    shutdown();
}

LaunchResult ChildSession::launch() {
    LaunchResult result;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ServerState::Built || !accepting_requests_) {
            result.error_kind = ErrorKind::LaunchError;
            result.error_message = "Session for " + spec_.name + " was already launched";
            return result;
        }
        state_ = ServerState::Launching;
    }

    // Python servers are started through the interpreter.
    std::string executable = spec_.binary_path;
    std::vector<std::string> arguments = spec_.launch_args;
    bool search_path = false;
    if (ends_with(spec_.binary_path, ".py")) {
        std::string ignored;
        if (!platform::read_file_contents(spec_.binary_path, ignored)) {
            result.error_kind = ErrorKind::LaunchError;
            result.error_message = "Script not found: " + spec_.binary_path;
        }
        executable = "python3";
        arguments.insert(arguments.begin(), spec_.binary_path);
        search_path = true;
    } else if (!platform::is_executable_file(spec_.binary_path)) {
        result.error_kind = ErrorKind::LaunchError;
        result.error_message = "Binary not found or not executable: " + spec_.binary_path;
    }

    if (result.error_kind != ErrorKind::None) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mark_degraded_locked(ErrorKind::LaunchError, result.error_message);
        debug_log::error(result.error_message);
        return result;
    }

    platform::ignore_broken_pipe_signal();

    debug_log::log("Launching " + spec_.name + ": " + executable);
    platform::SpawnResult spawn_result = platform::spawn_piped_process(executable, arguments, search_path);
    if (!spawn_result.success) {
        result.error_kind = ErrorKind::LaunchError;
        result.error_message = "Failed to start " + spec_.name + ": " + spawn_result.error_message;
        std::lock_guard<std::mutex> lock(state_mutex_);
        mark_degraded_locked(ErrorKind::LaunchError, result.error_message);
        debug_log::error(result.error_message);
        return result;
    }

    process_id_ = spawn_result.process_id;
    stdout_fd_ = spawn_result.stdout_fd;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        stdin_fd_ = spawn_result.stdin_fd;
    }
    reader_thread_ = std::thread(&ChildSession::reader_loop, this);

    std::this_thread::sleep_for(LAUNCH_GRACE_PERIOD);
    if (reap_if_exited()) {
        result.error_kind = ErrorKind::LaunchError;
        result.error_message = spec_.name + " exited immediately (" +
                               platform::describe_wait_status(exit_status_) + ")";
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            // The reader may already have recorded ProcessExited; launch failure is more precise.
            state_ = ServerState::Launching;
            mark_degraded_locked(ErrorKind::LaunchError, result.error_message);
        }
        debug_log::error(result.error_message);
        return result;
    }

    debug_log::info("Launched " + spec_.name + " (pid=" + std::to_string(process_id_) + ")");
    result.success = true;
    return result;
}

DiscoveryResult ChildSession::discover(std::chrono::milliseconds timeout) {
    DiscoveryResult result;
    auto deadline = deadline_after(timeout);

    bool needs_handshake = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ServerState::Launching && state_ != ServerState::Ready) {
            result.error_kind = unavailable_kind_locked();
            result.error_message = unavailable_message_locked();
            return result;
        }
        needs_handshake = !initialized_;
    }

    // Translates a failed request into a discovery failure and degrades on timeout.
    auto fail = [&](const RequestOutcome &outcome, const std::string &method) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (outcome.error_kind == ErrorKind::CallTimeout) {
            result.error_kind = ErrorKind::DiscoveryTimeout;
            result.error_message = spec_.name + ": discovery timeout waiting for " + method;
            mark_degraded_locked(ErrorKind::DiscoveryTimeout, "discovery timeout");
        } else if (outcome.error_kind == ErrorKind::ToolError) {
            result.error_kind = ErrorKind::DiscoveryProtocolError;
            result.error_message = spec_.name + ": " + method + " failed: " + outcome.error_message;
            mark_degraded_locked(ErrorKind::DiscoveryProtocolError, method + " rejected");
        } else {
            result.error_kind = outcome.error_kind;
            result.error_message = spec_.name + ": " + outcome.error_message;
            if (outcome.error_kind == ErrorKind::TransportError) {
                mark_degraded_locked(ErrorKind::TransportError, outcome.error_message);
            }
        }
        debug_log::error(result.error_message);
    };

    if (needs_handshake) {
        json initialize_params;
        initialize_params["protocolVersion"] = PROTOCOL_VERSION;
        initialize_params["capabilities"] = json::object();
        initialize_params["clientInfo"]["name"] = CLIENT_NAME;
        initialize_params["clientInfo"]["version"] = CLIENT_VERSION;

        RequestOutcome initialize_outcome = send_request("initialize", initialize_params, deadline, nullptr);
        if (!initialize_outcome.success) {
            fail(initialize_outcome, "initialize");
            return result;
        }

        std::string write_error;
        if (!send_message(json_rpc::build_notification("notifications/initialized"), write_error)) {
            RequestOutcome write_failure;
            write_failure.error_kind = ErrorKind::TransportError;
            write_failure.error_message = write_error;
            fail(write_failure, "notifications/initialized");
            return result;
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        initialized_ = true;
    }

    // Follow nextCursor until the child reports the last page.
    json cursor = nullptr;
    while (true) {
        json list_params = json::object();
        if (!cursor.is_null()) {
            list_params["cursor"] = cursor;
        }

        RequestOutcome list_outcome = send_request("tools/list", list_params, deadline, nullptr);
        if (!list_outcome.success) {
            fail(list_outcome, "tools/list");
            result.tools.clear();
            return result;
        }

        const json &payload = list_outcome.response["result"];
        if (!payload.is_object() || !payload.contains("tools") || !payload["tools"].is_array()) {
            std::lock_guard<std::mutex> lock(state_mutex_);
            result.tools.clear();
            result.error_kind = ErrorKind::DiscoveryProtocolError;
            result.error_message = spec_.name + ": tools/list result has no 'tools' array";
            mark_degraded_locked(ErrorKind::DiscoveryProtocolError, "malformed tools/list response");
            debug_log::error(result.error_message);
            return result;
        }

        for (const auto &tool_entry : payload["tools"]) {
            if (!tool_entry.is_object() || !tool_entry.contains("name") || !tool_entry["name"].is_string()) {
                debug_log::warning(spec_.name + ": skipping tools/list entry without a name: " + tool_entry.dump());
                continue;
            }
            RemoteTool tool;
            tool.name = tool_entry["name"].get<std::string>();
            if (tool_entry.contains("description") && tool_entry["description"].is_string()) {
                tool.description = tool_entry["description"].get<std::string>();
            }
            if (tool_entry.contains("inputSchema") && tool_entry["inputSchema"].is_object()) {
                tool.input_schema = tool_entry["inputSchema"];
            } else {
                tool.input_schema = {{"type", "object"}, {"properties", json::object()}};
            }
            result.tools.push_back(std::move(tool));
        }

        if (payload.contains("nextCursor") && payload["nextCursor"].is_string() &&
            !payload["nextCursor"].get<std::string>().empty()) {
            cursor = payload["nextCursor"];
            continue;
        }
        break;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ServerState::Degraded || process_exited_) {
            result.tools.clear();
            result.error_kind = unavailable_kind_locked();
            result.error_message = unavailable_message_locked();
            return result;
        }
        state_ = ServerState::Ready;
    }

    debug_log::info("Discovered " + std::to_string(result.tools.size()) + " tools from " + spec_.name);
    result.success = true;
    return result;
}

CallResult ChildSession::call(const std::string &local_name, const json &arguments,
                              std::chrono::milliseconds timeout, const json &origin_id) {
    CallResult result;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ServerState::Ready) {
            result.error_kind = unavailable_kind_locked();
            result.error_message = unavailable_message_locked();
            return result;
        }
    }

    json params;
    params["name"] = local_name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;

    debug_log::log("Calling " + local_name + " on " + spec_.name);
    RequestOutcome outcome = send_request("tools/call", params,
                                          deadline_after(timeout), origin_id);
    if (!outcome.success) {
        result.error_kind = outcome.error_kind;
        result.error_message = outcome.error_message;
        if (outcome.error_kind == ErrorKind::ToolError) {
            result.remote_error = outcome.response["error"];
        }
        return result;
    }

    result.success = true;
    result.result = outcome.response.contains("result") ? outcome.response["result"] : json(nullptr);
    return result;
}

ChildSession::RequestOutcome ChildSession::send_request(const std::string &method, const json &params,
                                                         std::chrono::steady_clock::time_point deadline,
                                                         const json &origin_id) {
    RequestOutcome outcome;

    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!accepting_requests_ || process_exited_ || state_ == ServerState::Degraded) {
        outcome.error_kind = unavailable_kind_locked();
        outcome.error_message = unavailable_message_locked();
        return outcome;
    }

    int request_id = next_request_id_++;
    PendingCall pending;
    pending.origin_id = origin_id;
    pending.deadline = deadline;
    // std::map iterators stay valid while other entries come and go.
    auto pending_iterator = pending_calls_.emplace(request_id, std::move(pending)).first;
    lock.unlock();

    std::string write_error;
    if (!send_message(json_rpc::build_request(request_id, method, params), write_error)) {
        lock.lock();
        pending_calls_.erase(pending_iterator);
        pending_condition_.notify_all();
        if (!accepting_requests_ || process_exited_) {
            outcome.error_kind = ErrorKind::ProcessExited;
            outcome.error_message = unavailable_message_locked();
            return outcome;
        }
        mark_degraded_locked(ErrorKind::TransportError, write_error);
        outcome.error_kind = ErrorKind::TransportError;
        outcome.error_message = spec_.name + ": " + write_error;
        return outcome;
    }

    lock.lock();
    pending_condition_.wait_until(lock, deadline, [&] {
        return pending_iterator->second.completed || process_exited_;
    });

    PendingCall finished = std::move(pending_iterator->second);
    pending_calls_.erase(pending_iterator);
    pending_condition_.notify_all();

    if (finished.completed) {
        outcome.response = std::move(finished.response);
        if (outcome.response.contains("error")) {
            const json &error_object = outcome.response["error"];
            outcome.error_kind = ErrorKind::ToolError;
            if (error_object.is_object() && error_object.contains("message") && error_object["message"].is_string()) {
                outcome.error_message = error_object["message"].get<std::string>();
            } else {
                outcome.error_message = error_object.dump();
            }
            return outcome;
        }
        outcome.success = true;
        return outcome;
    }

    if (process_exited_) {
        outcome.error_kind = ErrorKind::ProcessExited;
        outcome.error_message = unavailable_message_locked();
        return outcome;
    }

    outcome.error_kind = ErrorKind::CallTimeout;
    outcome.error_message = spec_.name + ": timed out waiting for " + method + " response";
    std::string origin_label = finished.origin_id.is_null() ? "" : " (caller id " + finished.origin_id.dump() + ")";
    debug_log::warning(outcome.error_message + ", request id " + std::to_string(request_id) + origin_label);
    return outcome;
}

bool ChildSession::send_message(const json &message, std::string &error_message) {
    std::string line = message.dump(-1, ' ', false, json::error_handler_t::replace);
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        error_message = "stdin of " + spec_.name + " is closed";
        return false;
    }
    if (!platform::write_all(stdin_fd_, line)) {
        error_message = "failed to write to stdin of " + spec_.name;
        return false;
    }
    return true;
}

void ChildSession::reader_loop() {
    std::string buffer;

    while (!stop_reader_.load()) {
        platform::ReadStatus status = platform::read_available(stdout_fd_, READER_POLL_MILLISECONDS, buffer);

        if (status == platform::ReadStatus::Timeout) {
            continue;
        }
        if (status == platform::ReadStatus::EndOfStream || status == platform::ReadStatus::Error) {
            if (!buffer.empty()) {
                handle_line(utf8_sanitize::clean_line(buffer));
                buffer.clear();
            }
            handle_stream_end(status == platform::ReadStatus::Error ? "stdout read error" : "stdout closed");
            return;
        }

        size_t newline_position = buffer.find('\n');
        while (newline_position != std::string::npos) {
            std::string line = buffer.substr(0, newline_position);
            buffer.erase(0, newline_position + 1);
            handle_line(utf8_sanitize::clean_line(line));
            newline_position = buffer.find('\n');
        }
    }
}

void ChildSession::handle_line(const std::string &line) {
    if (line.empty()) {
        return;
    }

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error &) {
        if (debug_log::is_debug_enabled()) {
            debug_log::log(spec_.name + ": ignoring non-JSON output: " + line.substr(0, 200));
        }
        return;
    }

    if (!json_rpc::is_response(message)) {
        debug_log::log(spec_.name + ": ignoring message without response id: " + json_rpc::get_method(message));
        return;
    }

    int response_id = 0;
    if (!json_rpc::get_integer_id(message, response_id)) {
        debug_log::log(spec_.name + ": ignoring response with non-integer id: " + message["id"].dump());
        return;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    auto pending_iterator = pending_calls_.find(response_id);
    if (pending_iterator == pending_calls_.end() || pending_iterator->second.completed) {
        // Stale (timed out) or duplicate; the waiter, if any, is already gone.
        debug_log::log(spec_.name + ": discarding response for unknown or expired request id " +
                       std::to_string(response_id));
        return;
    }
    pending_iterator->second.response = std::move(message);
    pending_iterator->second.completed = true;
    pending_condition_.notify_all();
}

void ChildSession::handle_stream_end(const std::string &cause) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!accepting_requests_) {
            // shutdown() is ending the process; it sets the final state.
            return;
        }
    }

    std::string reason = "process exited";
    if (wait_until_reaped(std::chrono::milliseconds(200))) {
        reason += " (" + platform::describe_wait_status(exit_status_) + ")";
    } else {
        reason = cause;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    process_exited_ = true;
    mark_degraded_locked(ErrorKind::ProcessExited, reason);
    pending_condition_.notify_all();
    debug_log::warning(spec_.name + ": " + reason + ", " + std::to_string(pending_calls_.size()) +
                       " pending request(s) failed");
}

void ChildSession::shutdown() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        accepting_requests_ = false;
    }

    if (process_id_ > 0) {
        debug_log::log("Shutting down " + spec_.name + " (pid=" + std::to_string(process_id_) + ")");
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            platform::close_descriptor(stdin_fd_);
        }

        if (!wait_until_reaped(SHUTDOWN_GRACE_PERIOD)) {
            {
                std::lock_guard<std::mutex> lock(process_mutex_);
                if (!reaped_) {
                    platform::kill_process(process_id_);
                }
            }
            if (!wait_until_reaped(SHUTDOWN_GRACE_PERIOD)) {
                {
                    std::lock_guard<std::mutex> lock(process_mutex_);
                    if (!reaped_) {
                        debug_log::warning(spec_.name + " did not stop after SIGTERM, sending SIGKILL");
                        platform::force_kill_process(process_id_);
                    }
                }
                if (!wait_until_reaped(SHUTDOWN_GRACE_PERIOD * 4)) {
                    debug_log::error("Could not reap " + spec_.name + " (pid=" + std::to_string(process_id_) + ")");
                }
            }
        }
    }

    stop_reader_.store(true);
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    platform::close_descriptor(stdout_fd_);

    std::unique_lock<std::mutex> lock(state_mutex_);
    process_exited_ = true;
    if (state_ != ServerState::Degraded) {
        state_ = ServerState::Stopped;
    }
    pending_condition_.notify_all();
    pending_condition_.wait(lock, [&] { return pending_calls_.empty(); });
}

ServerState ChildSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string ChildSession::degraded_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return degraded_reason_;
}

ErrorKind ChildSession::degraded_kind() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return degraded_kind_;
}

size_t ChildSession::pending_call_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pending_calls_.size();
}

void ChildSession::mark_degraded_locked(ErrorKind kind, const std::string &reason) {
    if (state_ == ServerState::Degraded) {
        return;
    }
    state_ = ServerState::Degraded;
    degraded_kind_ = kind;
    degraded_reason_ = reason;
    debug_log::warning(spec_.name + " degraded: " + reason);
}

ErrorKind ChildSession::unavailable_kind_locked() const {
    if (state_ == ServerState::Degraded && degraded_kind_ == ErrorKind::TransportError) {
        return ErrorKind::TransportError;
    }
    return ErrorKind::ProcessExited;
}

std::string ChildSession::unavailable_message_locked() const {
    if (state_ == ServerState::Degraded) {
        return spec_.name + " is degraded: " + degraded_reason_;
    }
    if (state_ == ServerState::Stopped || !accepting_requests_) {
        return spec_.name + " is stopped";
    }
    if (process_exited_) {
        return spec_.name + ": process exited";
    }
    return spec_.name + " is not running (state " + std::string(to_string(state_)) + ")";
}

bool ChildSession::reap_if_exited() {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (reaped_) {
        return true;
    }
    int wait_status = 0;
    if (platform::try_reap_process(process_id_, wait_status)) {
        reaped_ = true;
        exit_status_ = wait_status;
    }
    return reaped_;
}

bool ChildSession::wait_until_reaped(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (reap_if_exited()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace proxy
