#pragma once

#include "config.hpp"
#include "message.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

namespace rproxy {

struct ForwardOptions {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds timeout{15000};
    std::size_t max_body_bytes = 8 * 1024 * 1024;
    std::vector<HeaderKV> extra_headers; // "$ip" expands to the client address
};

struct ForwardResult {
    bool ok = false;
    unsigned int status = 0;
    std::string body;
    std::string error; // set when !ok
};

// Issues one HTTP/1.1 request per call and buffers the whole response body.
// Completion handlers run on the executor given at construction.
class UpstreamForwarder {
public:
    using Handler = std::function<void(ForwardResult)>;

    UpstreamForwarder(boost::asio::any_io_executor executor, ForwardOptions options);

    void forward(const Upstream& upstream, const RequestDescriptor& request, Handler handler);

    const ForwardOptions& options() const { return options_; }

private:
    boost::asio::any_io_executor executor_;
    ForwardOptions options_;
};

} // namespace rproxy
