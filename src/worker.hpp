#pragma once

#include "forwarder.hpp"
#include "message.hpp"
#include "routing_table.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

#include <boost/asio.hpp>

namespace rproxy {

// One thread running a single-threaded event loop. Request frames arrive via
// post(); reply frames leave through the sink, from the worker's own thread.
class Worker {
public:
    using ReplySink = std::function<void(std::string frame)>;
    using ExitHandler = std::function<void(const std::string& reason)>;

    Worker(std::size_t id,
           RoutingTablePtr table,
           ForwardOptions forward_options,
           ReplySink sink,
           ExitHandler on_exit);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Spawns the thread and returns once its event loop runs.
    void start();

    // Thread-safe. Returns false once the worker is stopping.
    bool post(std::string frame);

    // Idempotent. Joins the thread unless called from it; the last owner must
    // therefore release the worker from another thread.
    void stop();

    std::size_t id() const { return id_; }
    std::size_t in_flight() const { return in_flight_.load(std::memory_order_relaxed); }

private:
    void run(std::function<void()> on_ready);
    void handle_frame(const std::string& frame);
    void reply(const ReplyDescriptor& reply);

    std::size_t id_;
    RoutingTablePtr table_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    UpstreamForwarder forwarder_;
    ReplySink sink_;
    ExitHandler on_exit_;
    std::thread thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> in_flight_{0};
};

} // namespace rproxy
