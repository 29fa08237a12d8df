#include "config/proxy_config.hpp"

#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <filesystem>

namespace config {

using json = nlohmann::json;

static std::string resolve_path(const std::string &path, const std::string &base_directory) {
    if (path.empty() || base_directory.empty()) {
        return path;
    }
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return path;
    }
    return (std::filesystem::path(base_directory) / candidate).lexically_normal().string();
}

static bool read_string_list(const json &entry, const char *key, std::vector<std::string> &output,
                             std::string &error_message) {
    if (!entry.contains(key) || entry[key].is_null()) {
        return true;
    }
    const json &value = entry[key];
    if (!value.is_array()) {
        error_message = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    for (const auto &item : value) {
        if (!item.is_string()) {
            error_message = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        output.push_back(item.get<std::string>());
    }
    return true;
}

static bool read_optional_string(const json &entry, const char *key, std::string &output,
                                 std::string &error_message) {
    if (!entry.contains(key) || entry[key].is_null()) {
        return true;
    }
    if (!entry[key].is_string()) {
        error_message = std::string("'") + key + "' must be a string";
        return false;
    }
    output = entry[key].get<std::string>();
    return true;
}

// Seconds in the file, milliseconds in ServerSpec.
static bool read_seconds(const json &entry, const char *key, std::chrono::milliseconds &output,
                         std::string &error_message) {
    if (!entry.contains(key) || entry[key].is_null()) {
        return true;
    }
    if (!entry[key].is_number()) {
        error_message = std::string("'") + key + "' must be a number of seconds";
        return false;
    }
    // Checked before the conversion so it cannot overflow.
    double seconds = entry[key].get<double>();
    double maximum_seconds = static_cast<double>(proxy::MAXIMUM_TIMEOUT.count()) / 1000.0;
    if (!std::isfinite(seconds) || seconds > maximum_seconds || seconds < -maximum_seconds) {
        error_message = std::string("'") + key + "' must be at most " +
                        std::to_string(static_cast<long long>(maximum_seconds)) + " seconds";
        return false;
    }
    output = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    return true;
}

static bool parse_server_entry(const json &entry, const std::string &base_directory,
                               proxy::ServerSpec &spec, std::string &error_message) {
    if (!entry.is_object()) {
        error_message = "server entry must be an object";
        return false;
    }
    if (!read_optional_string(entry, "name", spec.name, error_message) ||
        !read_optional_string(entry, "binary", spec.binary_path, error_message) ||
        !read_optional_string(entry, "build_command", spec.build_command, error_message) ||
        !read_optional_string(entry, "build_cwd", spec.build_working_directory, error_message) ||
        !read_string_list(entry, "args", spec.launch_args, error_message) ||
        !read_seconds(entry, "timeout", spec.discovery_timeout, error_message) ||
        !read_seconds(entry, "call_timeout", spec.call_timeout, error_message)) {
        return false;
    }

    std::vector<std::string> enabled;
    if (!read_string_list(entry, "enabled_tools", enabled, error_message)) {
        return false;
    }
    spec.enabled_tools.insert(enabled.begin(), enabled.end());

    spec.binary_path = resolve_path(spec.binary_path, base_directory);
    spec.build_working_directory = resolve_path(spec.build_working_directory, base_directory);
    return true;
}

ConfigLoadResult parse_proxy_config(const std::string &contents, const std::string &base_directory) {
    ConfigLoadResult result;
    result.file_found = true;

    json document;
    try {
        document = json::parse(contents);
    } catch (const json::parse_error &error) {
        result.error_message = std::string("Invalid JSON in config: ") + error.what();
        debug_log::error(result.error_message);
        return result;
    }

    if (!document.is_object()) {
        result.error_message = "Config must be a JSON object";
        debug_log::error(result.error_message);
        return result;
    }

    std::vector<std::string> global_enabled;
    std::string list_error;
    if (!read_string_list(document, "enabled_tools", global_enabled, list_error)) {
        result.error_message = "Config: " + list_error;
        debug_log::error(result.error_message);
        return result;
    }
    result.config.enabled_tools.insert(global_enabled.begin(), global_enabled.end());

    std::vector<proxy::ServerSpec> parsed;
    if (document.contains("servers") && !document["servers"].is_null()) {
        const json &servers = document["servers"];
        if (!servers.is_array()) {
            result.error_message = "Config: 'servers' must be an array";
            debug_log::error(result.error_message);
            return result;
        }
        size_t position = 0;
        for (const auto &entry : servers) {
            proxy::ServerSpec spec;
            std::string entry_error;
            if (!parse_server_entry(entry, base_directory, spec, entry_error)) {
                proxy::SpecError rejected;
                rejected.server_name = spec.name.empty() ? "#" + std::to_string(position) : spec.name;
                rejected.message = entry_error;
                debug_log::warning("Skipping server " + rejected.server_name + ": " + entry_error);
                result.rejected.push_back(rejected);
            } else {
                parsed.push_back(spec);
            }
            ++position;
        }
    }

    proxy::ValidatedSpecs validated = proxy::validate_specs(parsed);
    result.config.servers = validated.accepted;
    result.rejected.insert(result.rejected.end(), validated.rejected.begin(), validated.rejected.end());
    result.success = true;
    return result;
}

ConfigLoadResult load_proxy_config(const std::string &config_path) {
    std::string contents;
    if (!platform::read_file_contents(config_path, contents)) {
        ConfigLoadResult result;
        result.success = true;
        debug_log::warning("Config file not found: " + config_path + ", no servers configured");
        return result;
    }

    std::string base_directory = std::filesystem::path(config_path).parent_path().string();
    debug_log::log("Loaded config from " + config_path);
    return parse_proxy_config(contents, base_directory);
}

} // namespace config
