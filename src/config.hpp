#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rproxy {

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Upstream {
    std::string id;
    std::string address; // host, host:port or http://host[:port]
};

struct HeaderKV {
    std::string key;
    std::string value;
};

struct Rule {
    std::string path_prefix;
    std::vector<std::string> upstream_ids; // only the head is used for selection
};

struct Listener {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
};

enum class WorkerPolicy {
    Degrade,
    Respawn
};

struct Timeouts {
    std::chrono::milliseconds reply{30000};
    std::chrono::milliseconds connect{5000};
    std::chrono::milliseconds upstream{15000};
};

struct AppConfig {
    Listener listener;
    unsigned int workers = 0; // 0 means hardware concurrency
    unsigned int dispatcher_threads = 1;
    WorkerPolicy worker_policy = WorkerPolicy::Degrade;
    std::size_t max_body_bytes = 8 * 1024 * 1024;
    Timeouts timeouts;
    struct Metrics {
        bool enable = false;
        uint16_t port = 0; // 0 means disabled
    } metrics;
    std::vector<Upstream> upstreams;
    std::vector<HeaderKV> headers;
    std::vector<Rule> rules;
};

// Load and validate configuration from a JSON file. Throws ConfigError when the
// file is missing, unparsable or fails validation.
AppConfig load_config(const std::string& config_path, std::ostream& log);

// Same as load_config but reads the JSON document from a string.
AppConfig parse_config(const std::string& json_text, std::ostream& log);

// Checks the invariants a RoutingTable relies on. Throws ConfigError.
void validate_config(const AppConfig& config);

const char* to_string(WorkerPolicy policy);

} // namespace rproxy
