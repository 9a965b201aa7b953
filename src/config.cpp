#include "config.hpp"

#include "routing_table.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <unordered_set>

namespace pt = boost::property_tree;

namespace rproxy {

namespace {

WorkerPolicy parse_policy(std::string_view value) {
    if (value == "degrade") return WorkerPolicy::Degrade;
    if (value == "respawn") return WorkerPolicy::Respawn;
    throw ConfigError("unknown worker_policy '" + std::string(value) + "'");
}

std::chrono::milliseconds parse_timeout(const pt::ptree& node, const char* key, std::chrono::milliseconds fallback) {
    const auto ms = node.get<long long>(key, fallback.count());
    if (ms <= 0) {
        throw ConfigError(std::string("timeout '") + key + "' must be positive");
    }
    return std::chrono::milliseconds(ms);
}

constexpr long long kMaxWorkers = 1024;
constexpr long long kMaxDispatcherThreads = 256;

// Signed read so that "-1" is rejected instead of wrapping around.
long long parse_bounded(const pt::ptree& node, const char* key, long long fallback, long long min, long long max) {
    const auto value = node.get<long long>(key, fallback);
    if (value < min || value > max) {
        throw ConfigError(std::string("'") + key + "' must be within [" + std::to_string(min) + ", " +
                          std::to_string(max) + "], got " + std::to_string(value));
    }
    return value;
}

std::vector<std::string> parse_string_list(const pt::ptree& node) {
    std::vector<std::string> list;
    for (const auto& item : node) {
        list.push_back(item.second.get_value<std::string>());
    }
    return list;
}

AppConfig parse_tree(const pt::ptree& tree, std::ostream& log) {
    auto server_node = tree.get_child_optional("server");
    if (!server_node) {
        throw ConfigError("missing 'server' section");
    }
    const auto& server = *server_node;

    AppConfig config;
    try {
        config.listener.address = server.get<std::string>("listen.address", config.listener.address);
        config.listener.port = server.get<uint16_t>("listen.port", config.listener.port);
        config.workers = static_cast<unsigned int>(
            parse_bounded(server, "workers", config.workers, 0, kMaxWorkers));
        config.dispatcher_threads = static_cast<unsigned int>(
            parse_bounded(server, "dispatcher_threads", config.dispatcher_threads, 1, kMaxDispatcherThreads));
        config.worker_policy = parse_policy(server.get<std::string>("worker_policy", to_string(config.worker_policy)));
        config.max_body_bytes = static_cast<std::size_t>(parse_bounded(
            server, "max_body_bytes", static_cast<long long>(config.max_body_bytes), 1,
            std::numeric_limits<long long>::max()));
        config.metrics.enable = server.get<bool>("metrics.enable", config.metrics.enable);
        config.metrics.port = server.get<uint16_t>("metrics.port", config.metrics.port);
    } catch (const pt::ptree_bad_data& ex) {
        throw ConfigError(std::string("invalid value: ") + ex.what());
    }

    if (auto timeouts = server.get_child_optional("timeouts")) {
        config.timeouts.reply = parse_timeout(*timeouts, "reply_ms", config.timeouts.reply);
        config.timeouts.connect = parse_timeout(*timeouts, "connect_ms", config.timeouts.connect);
        config.timeouts.upstream = parse_timeout(*timeouts, "upstream_ms", config.timeouts.upstream);
    }

    if (auto upstreams = server.get_child_optional("upstreams")) {
        for (const auto& entry : *upstreams) {
            Upstream up;
            up.id = entry.second.get<std::string>("id", "");
            up.address = entry.second.get<std::string>("url", "");
            config.upstreams.push_back(std::move(up));
        }
    }

    if (auto headers = server.get_child_optional("headers")) {
        for (const auto& entry : *headers) {
            HeaderKV kv;
            kv.key = entry.second.get<std::string>("key", "");
            kv.value = entry.second.get<std::string>("value", "");
            if (kv.key.empty()) {
                log << "[config] Skip header without key.\n";
                continue;
            }
            config.headers.push_back(std::move(kv));
        }
    }

    if (auto rules = server.get_child_optional("rules")) {
        for (const auto& entry : *rules) {
            Rule rule;
            rule.path_prefix = entry.second.get<std::string>("path", "");
            if (auto ids = entry.second.get_child_optional("upstreams")) {
                rule.upstream_ids = parse_string_list(*ids);
            }
            config.rules.push_back(std::move(rule));
        }
    }

    validate_config(config);
    log << "[config] Loaded " << config.upstreams.size() << " upstream(s), "
        << config.rules.size() << " rule(s), worker_policy=" << to_string(config.worker_policy) << "\n";
    return config;
}

} // namespace

const char* to_string(WorkerPolicy policy) {
    switch (policy) {
        case WorkerPolicy::Degrade: return "degrade";
        case WorkerPolicy::Respawn: return "respawn";
    }
    return "degrade";
}

void validate_config(const AppConfig& config) {
    if (config.workers > kMaxWorkers) {
        throw ConfigError("too many workers: " + std::to_string(config.workers));
    }
    if (config.dispatcher_threads == 0 || config.dispatcher_threads > kMaxDispatcherThreads) {
        throw ConfigError("dispatcher_threads out of range: " + std::to_string(config.dispatcher_threads));
    }
    if (config.max_body_bytes == 0) {
        throw ConfigError("max_body_bytes must be positive");
    }
    if (config.upstreams.empty()) {
        throw ConfigError("no upstreams defined");
    }
    std::unordered_set<std::string> ids;
    for (const auto& up : config.upstreams) {
        if (up.id.empty()) {
            throw ConfigError("upstream without id");
        }
        if (!ids.insert(up.id).second) {
            throw ConfigError("duplicate upstream id '" + up.id + "'");
        }
        try {
            parse_upstream_address(up.address);
        } catch (const std::invalid_argument& ex) {
            throw ConfigError("upstream '" + up.id + "': " + ex.what());
        }
    }

    if (config.rules.empty()) {
        throw ConfigError("no rules defined");
    }
    for (std::size_t i = 0; i < config.rules.size(); ++i) {
        const auto& rule = config.rules[i];
        if (rule.upstream_ids.empty()) {
            throw ConfigError("rule #" + std::to_string(i) + " ('" + rule.path_prefix + "') has no upstreams");
        }
        for (const auto& id : rule.upstream_ids) {
            if (!ids.count(id)) {
                throw ConfigError("rule '" + rule.path_prefix + "' references unknown upstream '" + id + "'");
            }
        }
    }
}

AppConfig parse_config(const std::string& json_text, std::ostream& log) {
    pt::ptree tree;
    std::istringstream in(json_text);
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& ex) {
        throw ConfigError(std::string("failed to parse JSON: ") + ex.what());
    }
    return parse_tree(tree, log);
}

AppConfig load_config(const std::string& config_path, std::ostream& log) {
    if (config_path.empty()) {
        throw ConfigError("no config path provided");
    }

    std::ifstream in(config_path);
    if (!in) {
        throw ConfigError("cannot open config file at " + config_path);
    }

    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& ex) {
        throw ConfigError(std::string("failed to parse JSON: ") + ex.what());
    }
    log << "[config] Reading " << config_path << "\n";
    return parse_tree(tree, log);
}

} // namespace rproxy
