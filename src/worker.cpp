#include "worker.hpp"

#include <future>
#include <memory>
#include <iostream>

namespace rproxy {

Worker::Worker(std::size_t id,
               RoutingTablePtr table,
               ForwardOptions forward_options,
               ReplySink sink,
               ExitHandler on_exit)
    : id_(id),
      table_(std::move(table)),
      io_(1),
      work_(boost::asio::make_work_guard(io_)),
      forwarder_(io_.get_executor(), std::move(forward_options)),
      sink_(std::move(sink)),
      on_exit_(std::move(on_exit)) {}

Worker::~Worker() {
    stop();
}

void Worker::start() {
    auto ready = std::make_shared<std::promise<void>>();
    auto ready_future = ready->get_future();
    thread_ = std::thread([this, ready]() {
        run([ready]() { ready->set_value(); });
    });
    ready_future.wait();
    std::cout << "[worker " << id_ << "] Ready\n";
}

bool Worker::post(std::string frame) {
    if (stopping_.load()) return false;
    boost::asio::post(io_, [this, frame = std::move(frame)]() {
        handle_frame(frame);
    });
    return true;
}

void Worker::stop() {
    if (!stopping_.exchange(true)) {
        work_.reset();
        io_.stop();
    }
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void Worker::run(std::function<void()> on_ready) {
    std::string reason;
    try {
        boost::asio::post(io_, std::move(on_ready));
        io_.run();
    } catch (const std::exception& ex) {
        reason = ex.what();
    }
    if (stopping_.load()) return;

    if (reason.empty()) reason = "event loop exited";
    std::cerr << "[worker " << id_ << "] Terminated: " << reason << "\n";
    stopping_.store(true);
    if (on_exit_) on_exit_(reason);
}

void Worker::handle_frame(const std::string& frame) {
    RequestDescriptor request;
    try {
        request = decode_request(frame);
    } catch (const ProtocolError& ex) {
        std::cerr << "[worker " << id_ << "] Dropping frame: " << ex.what() << "\n";
        return;
    }

    const auto id = request.correlation_id;
    const auto resolution = table_->resolve(request.path);
    switch (resolution.status) {
        case ResolveStatus::RuleNotFound:
            reply(ReplyDescriptor::failure(id, ErrorKind::RuleNotFound, "Rule not found"));
            return;
        case ResolveStatus::UpstreamNotFound:
            std::cerr << "[worker " << id_ << "] Rule '" << resolution.rule->path_prefix
                      << "' references an unknown upstream\n";
            reply(ReplyDescriptor::failure(id, ErrorKind::UpstreamNotFound, "Upstream server not found"));
            return;
        case ResolveStatus::Matched:
            break;
    }

    in_flight_.fetch_add(1, std::memory_order_relaxed);
    const std::string upstream_id = resolution.upstream->id;
    forwarder_.forward(*resolution.upstream, request, [this, id, upstream_id](ForwardResult result) {
        in_flight_.fetch_sub(1, std::memory_order_relaxed);
        if (!result.ok) {
            std::cerr << "[worker " << id_ << "] Upstream '" << upstream_id << "' failed: " << result.error << "\n";
            reply(ReplyDescriptor::failure(id, ErrorKind::UpstreamUnreachable, "Bad Gateway"));
            return;
        }
        reply(ReplyDescriptor::success(id, std::move(result.body)));
    });
}

void Worker::reply(const ReplyDescriptor& reply) {
    sink_(encode_reply(reply));
}

} // namespace rproxy
