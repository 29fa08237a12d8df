#include "proxy/server_spec.hpp"

#include "platform/platform_abi.hpp"

namespace proxy {

const char *to_string(ServerState state) {
    switch (state) {
    case ServerState::NotBuilt:
        return "NotBuilt";
    case ServerState::Building:
        return "Building";
    case ServerState::Built:
        return "Built";
    case ServerState::Launching:
        return "Launching";
    case ServerState::Ready:
        return "Ready";
    case ServerState::Degraded:
        return "Degraded";
    case ServerState::Stopped:
        return "Stopped";
    }
    return "Unknown";
}

static std::string check_spec(const ServerSpec &spec) {
    if (spec.name.empty()) {
        return "server name is empty";
    }
    if (spec.name.find('.') != std::string::npos) {
        return "server name must not contain '.' (used to qualify tool names)";
    }
    if (spec.binary_path.empty()) {
        return "binary path is empty";
    }
    if (spec.discovery_timeout.count() <= 0 || spec.discovery_timeout > MAXIMUM_TIMEOUT) {
        return "discovery timeout must be positive and at most one day";
    }
    if (spec.call_timeout.count() <= 0 || spec.call_timeout > MAXIMUM_TIMEOUT) {
        return "call timeout must be positive and at most one day";
    }
    if (spec.has_build_command() && !spec.build_working_directory.empty() &&
        !platform::is_directory(spec.build_working_directory)) {
        return "build directory does not exist: " + spec.build_working_directory;
    }
    return "";
}

ValidatedSpecs validate_specs(const std::vector<ServerSpec> &specs) {
    ValidatedSpecs result;
    std::set<std::string> seen_names;

    for (const auto &spec : specs) {
        std::string problem = check_spec(spec);
        if (problem.empty() && seen_names.count(spec.name) != 0) {
            problem = "duplicate server name";
        }
        if (!problem.empty()) {
            result.rejected.push_back({spec.name, problem});
            continue;
        }
        seen_names.insert(spec.name);
        result.accepted.push_back(spec);
    }
    return result;
}

} // namespace proxy
