#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio.hpp>

namespace rproxy {

// Process-wide counters. Every field is touched from several threads.
struct MetricsRegistry {
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> active_sessions{0};
    std::atomic<uint64_t> requests_dispatched{0};
    std::atomic<uint64_t> replies_ok{0};
    std::atomic<uint64_t> replies_error{0};
    std::atomic<uint64_t> reply_timeouts{0};
    std::atomic<uint64_t> requests_abandoned{0};
    std::atomic<uint64_t> worker_deaths{0};
};

using MetricsPtr = std::shared_ptr<MetricsRegistry>;

MetricsPtr make_metrics();

// Text exposition of the registry, one "rproxy_<name> <value>" line per counter.
std::string render_metrics(const MetricsRegistry& metrics);

// Plain HTTP endpoint answering GET /metrics; anything else is a 404.
class MetricsServer {
public:
    MetricsServer(boost::asio::io_context& io, MetricsPtr metrics, uint16_t port);
    void start();
    void stop();
    uint16_t bound_port() const;

private:
    using tcp = boost::asio::ip::tcp;
    void do_accept();

    boost::asio::io_context& io_;
    tcp::acceptor acceptor_;
    MetricsPtr metrics_;
};

} // namespace rproxy
