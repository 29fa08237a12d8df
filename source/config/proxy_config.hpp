#ifndef MCPROXY_PROXY_CONFIG_HPP
#define MCPROXY_PROXY_CONFIG_HPP

// Loads proxy_config.json into validated server specs.
//
// {
//   "servers": [
//     {"name": "alpha", "binary": "bin/alpha", "build_command": "make",
//      "build_cwd": "alpha", "args": ["--stdio"], "timeout": 30,
//      "call_timeout": 300, "enabled_tools": ["search"]}
//   ],
//   "enabled_tools": ["alpha.search", "fetch"]
// }
//
// timeout and call_timeout are in seconds. Relative binary and build_cwd
// paths are resolved against the directory of the config file.

#include <set>
#include <string>
#include <vector>

#include "proxy/server_spec.hpp"

namespace config {

struct ProxyConfig {
    std::vector<proxy::ServerSpec> servers;
    std::set<std::string> enabled_tools;  // global allow-list, empty = all
};

struct ConfigLoadResult {
    bool success = false;
    bool file_found = false;
    ProxyConfig config;
    std::vector<proxy::SpecError> rejected;  // entries dropped with ConfigError
    std::string error_message;               // set when success is false
};

// A missing file is not an error: the result is an empty config. Malformed
// JSON or a non-object document fails the whole load; a bad server entry only
// drops that entry.
ConfigLoadResult load_proxy_config(const std::string &config_path);

// Same as load_proxy_config() for an in-memory document. base_directory
// resolves relative paths.
ConfigLoadResult parse_proxy_config(const std::string &contents, const std::string &base_directory);

} // namespace config

#endif // MCPROXY_PROXY_CONFIG_HPP
