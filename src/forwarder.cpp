#include "forwarder.hpp"

#include "routing_table.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <optional>
#include <string_view>

namespace rproxy {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

// Headers that describe the inbound hop and must not be relayed.
bool is_hop_header(std::string_view name) {
    static const std::array<std::string_view, 11> hop = {
        "connection", "keep-alive", "proxy-connection", "proxy-authenticate",
        "proxy-authorization", "te", "trailer", "transfer-encoding", "upgrade",
        "host", "content-length"
    };
    return std::any_of(hop.begin(), hop.end(), [name](std::string_view h) { return iequals(h, name); });
}

std::string client_address(const RequestDescriptor& request) {
    for (const auto& [name, value] : request.headers) {
        if (iequals(name, "x-forwarded-for")) {
            auto comma = value.rfind(',');
            auto last = comma == std::string::npos ? value : value.substr(comma + 1);
            last.erase(0, last.find_first_not_of(' '));
            return last;
        }
    }
    return {};
}

class ForwardCall : public std::enable_shared_from_this<ForwardCall> {
public:
    ForwardCall(boost::asio::any_io_executor executor,
                const ForwardOptions& options,
                UpstreamAddress target,
                UpstreamForwarder::Handler handler)
        : resolver_(executor),
          stream_(executor),
          options_(options),
          target_(std::move(target)),
          handler_(std::move(handler)) {}

    void start(const RequestDescriptor& request) {
        build_request(request);
        resolver_.async_resolve(
            target_.host,
            std::to_string(target_.port),
            [self = shared_from_this()](auto ec, auto results) {
                self->on_resolve(ec, results);
            });
    }

private:
    void build_request(const RequestDescriptor& request) {
        const auto verb = http::string_to_verb(request.method);
        if (verb == http::verb::unknown) {
            request_.method_string(request.method);
        } else {
            request_.method(verb);
        }
        request_.target(request.path.empty() ? "/" : request.path);
        request_.version(11);
        for (const auto& [name, value] : request.headers) {
            if (is_hop_header(name)) continue;
            request_.set(name, value);
        }
        const auto host = target_.port == 80 ? target_.host : target_.host + ":" + std::to_string(target_.port);
        request_.set(http::field::host, host);

        const auto ip = client_address(request);
        for (const auto& kv : options_.extra_headers) {
            request_.set(kv.key, kv.value == "$ip" ? ip : kv.value);
        }
        if (request.body) {
            request_.body() = *request.body;
        }
        request_.keep_alive(false);
        request_.prepare_payload();
    }

    void on_resolve(const boost::system::error_code& ec, const tcp::resolver::results_type& results) {
        if (ec) {
            fail("resolve " + target_.host + ": " + ec.message());
            return;
        }
        stream_.expires_after(options_.connect_timeout);
        stream_.async_connect(
            results,
            [self = shared_from_this()](auto connect_ec, auto) {
                self->on_connect(connect_ec);
            });
    }

    void on_connect(const boost::system::error_code& ec) {
        if (ec) {
            fail("connect " + target_.host + ":" + std::to_string(target_.port) + ": " + ec.message());
            return;
        }
        stream_.expires_after(options_.timeout);
        http::async_write(
            stream_,
            request_,
            [self = shared_from_this()](auto write_ec, auto) {
                self->on_write(write_ec);
            });
    }

    void on_write(const boost::system::error_code& ec) {
        if (ec) {
            fail("write: " + ec.message());
            return;
        }
        parser_.emplace();
        parser_->body_limit(options_.max_body_bytes);
        http::async_read(
            stream_,
            buffer_,
            *parser_,
            [self = shared_from_this()](auto read_ec, auto) {
                self->on_read(read_ec);
            });
    }

    void on_read(const boost::system::error_code& ec) {
        if (ec) {
            fail("read: " + ec.message());
            return;
        }
        auto response = parser_->release();
        ForwardResult result;
        result.ok = true;
        result.status = response.result_int();
        result.body = std::move(response.body());
        close();
        handler_(std::move(result));
    }

    void fail(std::string reason) {
        close();
        ForwardResult result;
        result.error = std::move(reason);
        handler_(std::move(result));
    }

    void close() {
        boost::system::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    std::optional<http::response_parser<http::string_body>> parser_;
    ForwardOptions options_;
    UpstreamAddress target_;
    UpstreamForwarder::Handler handler_;
};

} // namespace

UpstreamForwarder::UpstreamForwarder(boost::asio::any_io_executor executor, ForwardOptions options)
    : executor_(std::move(executor)),
      options_(std::move(options)) {}

void UpstreamForwarder::forward(const Upstream& upstream, const RequestDescriptor& request, Handler handler) {
    UpstreamAddress target;
    try {
        target = parse_upstream_address(upstream.address);
    } catch (const std::invalid_argument& ex) {
        ForwardResult result;
        result.error = ex.what();
        boost::asio::post(executor_, [handler = std::move(handler), result = std::move(result)]() mutable {
            handler(std::move(result));
        });
        return;
    }
    std::make_shared<ForwardCall>(executor_, options_, std::move(target), std::move(handler))->start(request);
}

} // namespace rproxy
