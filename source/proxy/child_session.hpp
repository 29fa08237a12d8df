#ifndef MCPROXY_CHILD_SESSION_HPP
#define MCPROXY_CHILD_SESSION_HPP

// One running child tool server and the line-delimited JSON-RPC conversation
// with it. A background reader demultiplexes responses by request id, so any
// number of callers may wait on the same session at once.

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "proxy/error_kind.hpp"
#include "proxy/server_spec.hpp"

namespace proxy {

using json = nlohmann::json;

// A child counts as "exited immediately" if it is gone after this long.
constexpr std::chrono::milliseconds LAUNCH_GRACE_PERIOD{100};

// How long shutdown() waits after closing stdin, and again after SIGTERM.
constexpr std::chrono::milliseconds SHUTDOWN_GRACE_PERIOD{500};

// A tool as reported by the child's tools/list.
struct RemoteTool {
    std::string name;
    std::string description;
    json input_schema;
};

struct LaunchResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct DiscoveryResult {
    bool success = false;
    std::vector<RemoteTool> tools;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct CallResult {
    bool success = false;
    json result;           // the child's result payload, verbatim
    json remote_error;     // the child's error object when error_kind is ToolError
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

class ChildSession {
public:
    explicit ChildSession(ServerSpec spec);
    ~ChildSession();

    ChildSession(const ChildSession &) = delete;
    ChildSession &operator=(const ChildSession &) = delete;

    // Start the binary and the reader. Only valid once per session.
    LaunchResult launch();

    // MCP handshake (first time only) followed by tools/list, all within
    // timeout. A timeout degrades the session.
    DiscoveryResult discover(std::chrono::milliseconds timeout);

    // tools/call with a fresh request id. origin_id is the caller-facing id,
    // used only for log correlation. Timeouts above MAXIMUM_TIMEOUT are
    // clamped to it, here and in discover().
    CallResult call(const std::string &local_name, const json &arguments,
                    std::chrono::milliseconds timeout, const json &origin_id = nullptr);

    // Stop accepting calls, end the process, fail in-flight calls with
    // ProcessExited and wait for them to be released. Idempotent.
    void shutdown();

    ServerState state() const;
    std::string degraded_reason() const;
    ErrorKind degraded_kind() const;
    const ServerSpec &spec() const { return spec_; }
    int process_id() const { return process_id_; }
    size_t pending_call_count() const;

private:
    struct PendingCall {
        json origin_id;
        std::chrono::steady_clock::time_point deadline;
        bool completed = false;
        json response;
    };

    struct RequestOutcome {
        bool success = false;
        json response;
        ErrorKind error_kind = ErrorKind::None;
        std::string error_message;
    };

    RequestOutcome send_request(const std::string &method, const json &params,
                                std::chrono::steady_clock::time_point deadline,
                                const json &origin_id);
    bool send_message(const json &message, std::string &error_message);

    void reader_loop();
    void handle_line(const std::string &line);
    void handle_stream_end(const std::string &cause);

    // Caller holds state_mutex_.
    void mark_degraded_locked(ErrorKind kind, const std::string &reason);
    ErrorKind unavailable_kind_locked() const;
    std::string unavailable_message_locked() const;

    bool reap_if_exited();
    bool wait_until_reaped(std::chrono::milliseconds timeout);

    ServerSpec spec_;

    int process_id_ = -1;
    int stdout_fd_ = -1;
    std::thread reader_thread_;
    std::atomic<bool> stop_reader_{false};

    // Guards stdin_fd_. Serializes bytes on the wire, not logical completion.
    std::mutex write_mutex_;
    int stdin_fd_ = -1;

    // Guards process reaping so the pid is waited on exactly once.
    std::mutex process_mutex_;
    bool reaped_ = false;
    int exit_status_ = 0;

    // Guards everything below.
    mutable std::mutex state_mutex_;
    std::condition_variable pending_condition_;
    std::map<int, PendingCall> pending_calls_;
    int next_request_id_ = 1;
    ServerState state_ = ServerState::Built;
    ErrorKind degraded_kind_ = ErrorKind::None;
    std::string degraded_reason_;
    bool process_exited_ = false;
    bool accepting_requests_ = true;
    bool initialized_ = false;

    std::mutex lifecycle_mutex_;
    bool shut_down_ = false;
};

} // namespace proxy

#endif // MCPROXY_CHILD_SESSION_HPP
