#include "metrics.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <iostream>
#include <sstream>

namespace rproxy {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

struct CounterLine {
    const char* name;
    const char* type;
    const std::atomic<uint64_t> MetricsRegistry::*field;
};

const CounterLine kCounters[] = {
    {"total_connections", "counter", &MetricsRegistry::total_connections},
    {"active_sessions", "gauge", &MetricsRegistry::active_sessions},
    {"requests_dispatched", "counter", &MetricsRegistry::requests_dispatched},
    {"replies_ok", "counter", &MetricsRegistry::replies_ok},
    {"replies_error", "counter", &MetricsRegistry::replies_error},
    {"reply_timeouts", "counter", &MetricsRegistry::reply_timeouts},
    {"requests_abandoned", "counter", &MetricsRegistry::requests_abandoned},
    {"worker_deaths", "counter", &MetricsRegistry::worker_deaths},
};

// Serves a single request, then closes.
class ScrapeSession : public std::enable_shared_from_this<ScrapeSession> {
public:
    ScrapeSession(tcp::socket socket, MetricsPtr metrics)
        : stream_(std::move(socket)), metrics_(std::move(metrics)) {}

    void start() {
        stream_.expires_after(std::chrono::seconds(5));
        http::async_read(stream_, buffer_, request_, [self = shared_from_this()](auto ec, auto) {
            if (ec) return;
            self->respond();
        });
    }

private:
    void respond() {
        const bool found = request_.target() == "/metrics";
        response_ = http::response<http::string_body>(found ? http::status::ok : http::status::not_found,
                                                      request_.version());
        response_.set(http::field::content_type, "text/plain; version=0.0.4");
        response_.keep_alive(false);
        response_.body() = found ? render_metrics(*metrics_) : std::string("Not Found");
        response_.prepare_payload();
        http::async_write(stream_, response_, [self = shared_from_this()](auto, auto) {
            boost::system::error_code ignored;
            self->stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        });
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::empty_body> request_;
    http::response<http::string_body> response_;
    MetricsPtr metrics_;
};

} // namespace

MetricsPtr make_metrics() {
    return std::make_shared<MetricsRegistry>();
}

std::string render_metrics(const MetricsRegistry& metrics) {
    std::ostringstream os;
    for (const auto& line : kCounters) {
        os << "# TYPE rproxy_" << line.name << " " << line.type << "\n";
        os << "rproxy_" << line.name << " " << (metrics.*line.field).load() << "\n";
    }
    return os.str();
}

MetricsServer::MetricsServer(boost::asio::io_context& io, MetricsPtr metrics, uint16_t port)
    : io_(io),
      acceptor_(io, tcp::endpoint(tcp::v4(), port)),
      metrics_(std::move(metrics)) {
    std::cout << "[metrics] Exposing metrics on 0.0.0.0:" << bound_port() << "/metrics\n";
}

void MetricsServer::start() {
    do_accept();
}

void MetricsServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

uint16_t MetricsServer::bound_port() const {
    return acceptor_.local_endpoint().port();
}

void MetricsServer::do_accept() {
    acceptor_.async_accept(boost::asio::make_strand(io_), [this](auto ec, auto socket) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (!ec) {
            std::make_shared<ScrapeSession>(std::move(socket), metrics_)->start();
        } else {
            std::cerr << "[metrics] Accept error: " << ec.message() << "\n";
        }
        do_accept();
    });
}

} // namespace rproxy
