#pragma once

#include "config.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rproxy {

struct UpstreamAddress {
    std::string host;
    uint16_t port = 80;
};

// Accepts "host", "host:port" and "http://host[:port][/]".
// Throws std::invalid_argument on anything else.
UpstreamAddress parse_upstream_address(const std::string& address);

enum class ResolveStatus {
    Matched,
    RuleNotFound,
    UpstreamNotFound
};

struct Resolution {
    ResolveStatus status = ResolveStatus::RuleNotFound;
    const Rule* rule = nullptr;
    const Upstream* upstream = nullptr;
};

// Immutable after construction; shared read-only by every worker.
class RoutingTable {
public:
    RoutingTable(std::vector<Upstream> upstreams, std::vector<Rule> rules);

    // Validates the configuration first; throws ConfigError.
    static std::shared_ptr<const RoutingTable> from_config(const AppConfig& config);

    // First rule whose prefix starts `path` wins. An empty path is treated as "/".
    Resolution resolve(std::string_view path) const;

    const Upstream* find_upstream(std::string_view id) const;

    const std::vector<Upstream>& upstreams() const { return upstreams_; }
    const std::vector<Rule>& rules() const { return rules_; }

private:
    std::vector<Upstream> upstreams_;
    std::vector<Rule> rules_;
    std::unordered_map<std::string, std::size_t> index_;
};

using RoutingTablePtr = std::shared_ptr<const RoutingTable>;

} // namespace rproxy
