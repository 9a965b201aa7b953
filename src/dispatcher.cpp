#include "dispatcher.hpp"

#include "http_session.hpp"

#include <boost/asio/ip/address.hpp>

#include <iostream>

namespace rproxy {

Dispatcher::Dispatcher(boost::asio::io_context& io,
                       const AppConfig& config,
                       std::shared_ptr<WorkerPool> pool,
                       MetricsPtr metrics)
    : io_(io),
      acceptor_(io, tcp::endpoint(boost::asio::ip::make_address(config.listener.address), config.listener.port)),
      pool_(std::move(pool)),
      metrics_(std::move(metrics)),
      max_body_bytes_(config.max_body_bytes) {
    std::cout << "[dispatcher] Listening on " << config.listener.address << ":" << bound_port() << "\n";
    for (const auto& rule : config.rules) {
        std::cout << "[dispatcher] Rule '" << rule.path_prefix << "' ->";
        for (const auto& id : rule.upstream_ids) {
            std::cout << " " << id;
        }
        std::cout << "\n";
    }
    for (const auto& up : config.upstreams) {
        std::cout << "[dispatcher] Upstream '" << up.id << "' at " << up.address << "\n";
    }
}

void Dispatcher::start() {
    do_accept();
}

void Dispatcher::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

uint16_t Dispatcher::bound_port() const {
    return acceptor_.local_endpoint().port();
}

void Dispatcher::do_accept() {
    acceptor_.async_accept(boost::asio::make_strand(io_), [this](auto ec, auto socket) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), pool_, metrics_, max_body_bytes_)->start();
        } else {
            std::cerr << "[dispatcher] Accept error: " << ec.message() << "\n";
        }
        do_accept();
    });
}

} // namespace rproxy
