#include "routing_table.hpp"

#include <algorithm>
#include <stdexcept>

namespace rproxy {

UpstreamAddress parse_upstream_address(const std::string& address) {
    std::string_view rest(address);
    constexpr std::string_view scheme = "http://";
    if (rest.substr(0, scheme.size()) == scheme) {
        rest.remove_prefix(scheme.size());
    } else if (rest.find("://") != std::string_view::npos) {
        throw std::invalid_argument("unsupported scheme in '" + address + "'");
    }
    while (!rest.empty() && rest.back() == '/') rest.remove_suffix(1);
    if (rest.find('/') != std::string_view::npos) {
        throw std::invalid_argument("address must not carry a path: '" + address + "'");
    }

    UpstreamAddress result;
    const auto colon = rest.rfind(':');
    if (colon != std::string_view::npos) {
        const auto port_text = rest.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            throw std::invalid_argument("invalid port in '" + address + "'");
        }
        const auto port = std::stoul(std::string(port_text));
        if (port == 0 || port > 65535) {
            throw std::invalid_argument("port out of range in '" + address + "'");
        }
        result.port = static_cast<uint16_t>(port);
        rest = rest.substr(0, colon);
    }
    if (rest.empty()) {
        throw std::invalid_argument("empty host in '" + address + "'");
    }
    result.host = std::string(rest);
    return result;
}

RoutingTable::RoutingTable(std::vector<Upstream> upstreams, std::vector<Rule> rules)
    : upstreams_(std::move(upstreams)),
      rules_(std::move(rules)) {
    index_.reserve(upstreams_.size());
    for (std::size_t i = 0; i < upstreams_.size(); ++i) {
        index_.emplace(upstreams_[i].id, i);
    }
}

std::shared_ptr<const RoutingTable> RoutingTable::from_config(const AppConfig& config) {
    validate_config(config);
    return std::make_shared<const RoutingTable>(config.upstreams, config.rules);
}

Resolution RoutingTable::resolve(std::string_view path) const {
    if (path.empty()) path = "/";
    for (const auto& rule : rules_) {
        if (path.substr(0, rule.path_prefix.size()) != rule.path_prefix) continue;

        Resolution res;
        res.rule = &rule;
        res.upstream = rule.upstream_ids.empty() ? nullptr : find_upstream(rule.upstream_ids.front());
        res.status = res.upstream ? ResolveStatus::Matched : ResolveStatus::UpstreamNotFound;
        return res;
    }
    return Resolution{};
}

const Upstream* RoutingTable::find_upstream(std::string_view id) const {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) return nullptr;
    return &upstreams_[it->second];
}

} // namespace rproxy
