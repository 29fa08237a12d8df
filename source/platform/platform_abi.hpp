#ifndef MCPROXY_PLATFORM_ABI_HPP
#define MCPROXY_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>
#include <vector>

namespace platform {

// Result of spawning a child process wired to a pair of pipes.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;   // write end, connected to the child's stdin
    int stdout_fd = -1;  // read end, connected to the child's stdout
    std::string error_message;
};

// Spawn a child process with the given executable path and arguments.
// The child's stdin and stdout are pipes owned by the caller; stderr is
// inherited. When search_path is true the executable is looked up on PATH.
// Both returned descriptors are close-on-exec.
SpawnResult spawn_piped_process(const std::string &executable_path,
                                const std::vector<std::string> &arguments,
                                bool search_path = false);

// Result of running a shell command to completion.
struct CommandResult {
    bool started = false;
    int exit_code = -1;      // valid when the command exited normally
    int signal_number = 0;   // non-zero when the command was killed by a signal
    std::string output;      // combined stdout and stderr
    std::string error_message;
};

// Run command with /bin/sh -c in working_directory (empty = current),
// stdin redirected from /dev/null, capturing combined output. Blocks until
// the shell exits.
CommandResult run_shell_command(const std::string &command, const std::string &working_directory);

// Outcome of one read attempt on a pipe.
enum class ReadStatus {
    Data,
    Timeout,
    EndOfStream,
    Error,
};

// Wait up to timeout_milliseconds for data on fd and append what is available
// to buffer.
ReadStatus read_available(int fd, int timeout_milliseconds, std::string &buffer);

// Write all of data to fd, retrying on partial writes and EINTR.
bool write_all(int fd, const std::string &data);

// Close fd if it is valid and reset it to -1.
void close_descriptor(int &fd);

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// True if path names a regular file the current user may execute.
bool is_executable_file(const std::string &path);

// True if path names an existing directory.
bool is_directory(const std::string &path);

// Reap the process if it has exited. Returns true when it has, storing the
// raw wait status.
bool try_reap_process(int process_id, int &wait_status);

// Describe a raw wait status, e.g. "exit code 1" or "signal 9".
std::string describe_wait_status(int wait_status);

// Send SIGTERM to a process.
bool kill_process(int process_id);

// Send SIGKILL to a process.
bool force_kill_process(int process_id);

// Make writes to a closed pipe fail with EPIPE instead of killing us.
void ignore_broken_pipe_signal();

} // namespace platform

#endif // MCPROXY_PLATFORM_ABI_HPP
