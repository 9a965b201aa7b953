#pragma once

#include "message.hpp"
#include "metrics.hpp"
#include "worker_pool.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace rproxy {

// One inbound connection. Requests are read sequentially (keep-alive), each
// one is handed to a worker and the reply is written back on this connection.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket,
                std::shared_ptr<WorkerPool> pool,
                MetricsPtr metrics,
                std::size_t max_body_bytes);
    ~HttpSession();

    void start();

private:
    using tcp = boost::asio::ip::tcp;

    void do_read();
    void on_read(const boost::system::error_code& ec);
    void dispatch();
    RequestDescriptor make_descriptor(CorrelationId id) const;
    void watch_client();
    void on_client_readable(const boost::system::error_code& ec, std::uint64_t generation);
    void on_reply(ReplyDescriptor reply);
    void respond(unsigned int status, std::string body, bool keep_alive);
    void on_write(const boost::system::error_code& ec, bool close_after);
    void close();

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    boost::beast::http::response<boost::beast::http::string_body> response_;

    std::shared_ptr<WorkerPool> pool_;
    MetricsPtr metrics_;
    std::size_t max_body_bytes_;
    std::string remote_address_;
    std::string remote_label_;

    WorkerHandlePtr handle_;
    CorrelationId correlation_ = 0;
    bool awaiting_reply_ = false;
    bool keep_alive_ = false;
    std::uint64_t generation_ = 0;
};

} // namespace rproxy
