#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <spawn.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>

extern char **environ;

namespace platform {

static std::string errno_text(const std::string &what, int error_number) {
    return what + ": " + std::string(strerror(error_number));
}

SpawnResult spawn_piped_process(const std::string &executable_path,
                                const std::vector<std::string> &arguments,
                                bool search_path) {
    SpawnResult result;

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    if (pipe2(to_child, O_CLOEXEC) != 0) {
        result.error_message = errno_text("pipe2 failed", errno);
        return result;
    }
    if (pipe2(from_child, O_CLOEXEC) != 0) {
        result.error_message = errno_text("pipe2 failed", errno);
        close(to_child[0]);
        close(to_child[1]);
        return result;
    }

    // dup2 onto 0/1 clears close-on-exec for the child's copies only.
    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, to_child[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, from_child[1], STDOUT_FILENO);

    pid_t child_pid = 0;
    int spawn_status = 0;
    if (search_path) {
        spawn_status = posix_spawnp(&child_pid, executable_path.c_str(), &file_actions, nullptr,
                                    argv_pointers.data(), environ);
    } else {
        spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, nullptr,
                                   argv_pointers.data(), environ);
    }
    posix_spawn_file_actions_destroy(&file_actions);

    close(to_child[0]);
    close(from_child[1]);

    if (spawn_status != 0) {
        close(to_child[1]);
        close(from_child[0]);
        result.error_message = errno_text("posix_spawn failed", spawn_status);
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = to_child[1];
    result.stdout_fd = from_child[0];
    return result;
}

CommandResult run_shell_command(const std::string &command, const std::string &working_directory) {
    CommandResult result;

    int output_pipe[2] = {-1, -1};
    if (pipe2(output_pipe, O_CLOEXEC) != 0) {
        result.error_message = errno_text("pipe2 failed", errno);
        return result;
    }

    // Everything the child needs is prepared before fork.
    const char *directory = working_directory.empty() ? nullptr : working_directory.c_str();
    const char *shell_command = command.c_str();

    pid_t child_pid = fork();
    if (child_pid < 0) {
        result.error_message = errno_text("fork failed", errno);
        close(output_pipe[0]);
        close(output_pipe[1]);
        return result;
    }

    if (child_pid == 0) {
        // Child: only async-signal-safe calls from here on.
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
        }
        dup2(output_pipe[1], STDOUT_FILENO);
        dup2(output_pipe[1], STDERR_FILENO);
        if (directory != nullptr && chdir(directory) != 0) {
            static const char message[] = "mcproxy: cannot change to build directory\n";
            ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
            (void)ignored;
            _exit(126);
        }
        execl("/bin/sh", "sh", "-c", shell_command, static_cast<char *>(nullptr));
        _exit(127);
    }

    close(output_pipe[1]);
    result.started = true;

    std::array<char, 4096> buffer{};
    while (true) {
        ssize_t bytes = read(output_pipe[0], buffer.data(), buffer.size());
        if (bytes > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(bytes));
            continue;
        }
        if (bytes < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(output_pipe[0]);

    int wait_status = 0;
    while (waitpid(child_pid, &wait_status, 0) < 0) {
        if (errno != EINTR) {
            result.error_message = errno_text("waitpid failed", errno);
            return result;
        }
    }

    if (WIFEXITED(wait_status)) {
        result.exit_code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        result.signal_number = WTERMSIG(wait_status);
    }
    return result;
}

ReadStatus read_available(int fd, int timeout_milliseconds, std::string &buffer) {
    if (fd < 0) {
        return ReadStatus::Error;
    }

    struct pollfd poll_descriptor{};
    poll_descriptor.fd = fd;
    poll_descriptor.events = POLLIN;

    int poll_result = poll(&poll_descriptor, 1, timeout_milliseconds);
    if (poll_result == 0) {
        return ReadStatus::Timeout;
    }
    if (poll_result < 0) {
        return (errno == EINTR) ? ReadStatus::Timeout : ReadStatus::Error;
    }

    // POLLHUP without POLLIN still means a final read returns 0.
    std::array<char, 4096> chunk{};
    ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
        buffer.append(chunk.data(), static_cast<size_t>(bytes));
        return ReadStatus::Data;
    }
    if (bytes == 0) {
        return ReadStatus::EndOfStream;
    }
    if (errno == EINTR || errno == EAGAIN) {
        return ReadStatus::Timeout;
    }
    return ReadStatus::Error;
}

bool write_all(int fd, const std::string &data) {
    if (fd < 0) {
        return false;
    }
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

void close_descriptor(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

bool is_executable_file(const std::string &path) {
    struct stat file_status{};
    if (stat(path.c_str(), &file_status) != 0) {
        return false;
    }
    if (!S_ISREG(file_status.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

bool is_directory(const std::string &path) {
    struct stat file_status{};
    if (stat(path.c_str(), &file_status) != 0) {
        return false;
    }
    return S_ISDIR(file_status.st_mode);
}

bool try_reap_process(int process_id, int &wait_status) {
    if (process_id <= 0) {
        return false;
    }
    pid_t reaped = waitpid(static_cast<pid_t>(process_id), &wait_status, WNOHANG);
    return reaped == static_cast<pid_t>(process_id);
}

std::string describe_wait_status(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return "exit code " + std::to_string(WEXITSTATUS(wait_status));
    }
    if (WIFSIGNALED(wait_status)) {
        return "signal " + std::to_string(WTERMSIG(wait_status));
    }
    return "status " + std::to_string(wait_status);
}

bool kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), SIGTERM);
    return (kill_result == 0);
}

bool force_kill_process(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), SIGKILL) == 0;
}

void ignore_broken_pipe_signal() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action{};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, nullptr);
    });
}

} // namespace platform
