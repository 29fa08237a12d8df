#include "proxy/builder.hpp"

#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

namespace proxy {

BuildResult build(const ServerSpec &spec) {
    BuildResult result;

    if (!spec.has_build_command()) {
        debug_log::log("No build command for " + spec.name + ", skipping build.");
        result.success = true;
        result.exit_code = 0;
        return result;
    }

    std::string directory_label = spec.build_working_directory.empty() ? "." : spec.build_working_directory;
    debug_log::info("Building " + spec.name + ": command=" + spec.build_command + ", cwd=" + directory_label);

    platform::CommandResult command_result =
        platform::run_shell_command(spec.build_command, spec.build_working_directory);
    result.output = command_result.output;

    if (!command_result.started) {
        result.error_kind = ErrorKind::BuildError;
        result.error_message = "Could not start build for " + spec.name + ": " + command_result.error_message;
        debug_log::error(result.error_message);
        return result;
    }

    result.executed = true;
    result.exit_code = command_result.exit_code;

    if (command_result.signal_number != 0) {
        result.error_kind = ErrorKind::BuildError;
        result.error_message = "Build of " + spec.name + " killed by signal " +
                               std::to_string(command_result.signal_number);
        debug_log::error(result.error_message);
        return result;
    }

    if (command_result.exit_code != 0) {
        result.error_kind = ErrorKind::BuildError;
        result.error_message = "Build of " + spec.name + " failed with exit code " +
                               std::to_string(command_result.exit_code);
        debug_log::error(result.error_message + ": " + result.output);
        return result;
    }

    result.success = true;
    debug_log::info("Build of " + spec.name + " finished successfully.");
    if (!result.output.empty()) {
        debug_log::log("Build output: " + result.output);
    }
    return result;
}

} // namespace proxy
