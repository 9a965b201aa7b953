#pragma once

#include "config.hpp"
#include "metrics.hpp"
#include "worker_pool.hpp"

#include <cstdint>
#include <memory>

#include <boost/asio.hpp>

namespace rproxy {

// Owns the inbound listener. Every accepted connection becomes an HttpSession
// on its own strand; no connection waits on another one's reply.
class Dispatcher {
public:
    Dispatcher(boost::asio::io_context& io,
               const AppConfig& config,
               std::shared_ptr<WorkerPool> pool,
               MetricsPtr metrics);
    void start();
    void stop();
    uint16_t bound_port() const;

private:
    void do_accept();

    using tcp = boost::asio::ip::tcp;

    boost::asio::io_context& io_;
    tcp::acceptor acceptor_;
    std::shared_ptr<WorkerPool> pool_;
    MetricsPtr metrics_;
    std::size_t max_body_bytes_;
};

} // namespace rproxy
