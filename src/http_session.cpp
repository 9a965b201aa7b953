#include "http_session.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace rproxy {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;

constexpr auto kIdleTimeout = std::chrono::seconds(60);
constexpr std::size_t kPipelineLimit = 64 * 1024;

std::string lowercase(beast::string_view text) {
    std::string out(text.data(), text.size());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket,
                         std::shared_ptr<WorkerPool> pool,
                         MetricsPtr metrics,
                         std::size_t max_body_bytes)
    : stream_(std::move(socket)),
      pool_(std::move(pool)),
      metrics_(std::move(metrics)),
      max_body_bytes_(max_body_bytes) {
    boost::system::error_code ec;
    auto remote = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        remote_address_ = remote.address().to_string();
        remote_label_ = remote_address_ + ":" + std::to_string(remote.port());
    }
    if (metrics_) {
        metrics_->total_connections.fetch_add(1, std::memory_order_relaxed);
        metrics_->active_sessions.fetch_add(1, std::memory_order_relaxed);
    }
}

HttpSession::~HttpSession() {
    if (metrics_) {
        metrics_->active_sessions.fetch_sub(1, std::memory_order_relaxed);
    }
}

void HttpSession::start() {
    boost::asio::dispatch(stream_.get_executor(), [self = shared_from_this()]() {
        self->do_read();
    });
}

void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(max_body_bytes_);
    stream_.expires_after(kIdleTimeout);
    http::async_read(stream_, buffer_, *parser_, [self = shared_from_this()](auto ec, auto) {
        self->on_read(ec);
    });
}

void HttpSession::on_read(const boost::system::error_code& ec) {
    if (ec == http::error::end_of_stream) {
        close();
        return;
    }
    if (ec == http::error::body_limit) {
        std::cerr << "[dispatcher] Request body from " << remote_label_ << " exceeds "
                  << max_body_bytes_ << " bytes\n";
        respond(413, "Payload Too Large", false);
        return;
    }
    if (ec) {
        if (ec != beast::error::timeout && ec != boost::asio::error::operation_aborted) {
            std::cerr << "[dispatcher] Read error from " << remote_label_ << ": " << ec.message() << "\n";
        }
        close();
        return;
    }

    request_ = parser_->release();
    dispatch();
}

RequestDescriptor HttpSession::make_descriptor(CorrelationId id) const {
    RequestDescriptor desc;
    desc.correlation_id = id;
    desc.method = std::string(request_.method_string());
    desc.path = std::string(request_.target());
    for (const auto& field : request_) {
        desc.headers[lowercase(field.name_string())] = std::string(field.value());
    }
    auto& forwarded = desc.headers["x-forwarded-for"];
    forwarded = forwarded.empty() ? remote_address_ : forwarded + ", " + remote_address_;
    if (!request_.body().empty()) {
        desc.body = request_.body();
    }
    return desc;
}

void HttpSession::dispatch() {
    keep_alive_ = request_.keep_alive();
    handle_ = pool_->select();
    if (!handle_) {
        std::cerr << "[dispatcher] No ready worker for " << request_.method_string() << " "
                  << request_.target() << "\n";
        if (metrics_) metrics_->replies_error.fetch_add(1, std::memory_order_relaxed);
        respond(http_status(ErrorKind::WorkerUnavailable), "Internal Server Error", keep_alive_);
        return;
    }

    correlation_ = pool_->next_correlation_id();
    awaiting_reply_ = true;
    ++generation_;
    if (metrics_) metrics_->requests_dispatched.fetch_add(1, std::memory_order_relaxed);

    // The pool's reply timeout bounds the wait from here on.
    stream_.expires_never();
    auto executor = stream_.get_executor();
    pool_->send(handle_, make_descriptor(correlation_), [self = shared_from_this(), executor](ReplyDescriptor reply) {
        boost::asio::post(executor, [self, reply = std::move(reply)]() mutable {
            self->on_reply(std::move(reply));
        });
    });
    watch_client();
}

void HttpSession::watch_client() {
    stream_.socket().async_wait(
        tcp::socket::wait_read,
        [self = shared_from_this(), generation = generation_](const boost::system::error_code& ec) {
            self->on_client_readable(ec, generation);
        });
}

void HttpSession::on_client_readable(const boost::system::error_code& ec, std::uint64_t generation) {
    if (ec || generation != generation_ || !awaiting_reply_) return;

    // Readable while waiting: either a pipelined request or the client went away.
    // Pipelined bytes move into buffer_, where the next read parses them, and
    // the watch is re-armed so a later disconnect is still seen.
    boost::system::error_code read_ec;
    const auto available = stream_.socket().available(read_ec);
    if (!read_ec && available > 0) {
        if (buffer_.size() + available > kPipelineLimit) {
            // Past the limit the reply timeout bounds the wait instead.
            std::cerr << "[dispatcher] Client " << remote_label_ << " pipelined more than "
                      << kPipelineLimit << " bytes, no longer watching for disconnect\n";
            return;
        }
        const auto n = stream_.socket().read_some(buffer_.prepare(available), read_ec);
        if (!read_ec) {
            buffer_.commit(n);
            watch_client();
            return;
        }
    }

    awaiting_reply_ = false;
    if (pool_->cancel(handle_, correlation_)) {
        std::cout << "[dispatcher] Client " << remote_label_ << " disconnected, abandoned request "
                  << correlation_ << "\n";
    }
    close();
}

void HttpSession::on_reply(ReplyDescriptor reply) {
    if (!awaiting_reply_ || reply.correlation_id != correlation_) return;
    awaiting_reply_ = false;
    ++generation_;
    boost::system::error_code ignored;
    stream_.socket().cancel(ignored);

    unsigned int status = 200;
    if (reply.ok()) {
        if (metrics_) metrics_->replies_ok.fetch_add(1, std::memory_order_relaxed);
    } else {
        status = http_status(*reply.error);
        if (metrics_) metrics_->replies_error.fetch_add(1, std::memory_order_relaxed);
    }
    std::cout << "[dispatcher] " << request_.method_string() << " " << request_.target()
              << " from " << remote_label_ << " -> worker " << handle_->id() << " -> " << status;
    if (reply.error) {
        std::cout << " (" << to_string(*reply.error) << ")";
    }
    std::cout << "\n";

    handle_.reset();
    respond(status, std::move(reply.body), keep_alive_);
}

void HttpSession::respond(unsigned int status, std::string body, bool keep_alive) {
    response_ = http::response<http::string_body>(static_cast<http::status>(status), request_.version() ? request_.version() : 11);
    response_.set(http::field::server, "rproxy");
    if (status != 200) {
        response_.set(http::field::content_type, "text/plain");
    }
    response_.keep_alive(keep_alive);
    response_.body() = std::move(body);
    response_.prepare_payload();

    stream_.expires_after(kIdleTimeout);
    http::async_write(stream_, response_, [self = shared_from_this()](auto ec, auto) {
        self->on_write(ec, self->response_.need_eof());
    });
}

void HttpSession::on_write(const boost::system::error_code& ec, bool close_after) {
    if (ec) {
        std::cerr << "[dispatcher] Write error to " << remote_label_ << ": " << ec.message() << "\n";
        close();
        return;
    }
    if (close_after) {
        close();
        return;
    }
    do_read();
}

void HttpSession::close() {
    boost::system::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
    stream_.close();
}

} // namespace rproxy
