#pragma once

#include "config.hpp"
#include "forwarder.hpp"
#include "message.hpp"
#include "metrics.hpp"
#include "routing_table.hpp"
#include "worker.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio.hpp>

namespace rproxy {

enum class WorkerState {
    Starting,
    Ready,
    Dead
};

const char* to_string(WorkerState state);

class WorkerPool;

// Pool-owned view of one worker: its channel, its liveness and the requests
// still waiting for a reply from it.
class WorkerHandle {
    struct Key {
        explicit Key() = default;
    };

public:
    WorkerHandle(Key, std::size_t id) : id_(id) {}

    std::size_t id() const { return id_; }
    WorkerState state() const { return state_.load(); }
    std::size_t pending() const;

private:
    friend class WorkerPool;

    using ReplyHandler = std::function<void(ReplyDescriptor)>;

    struct Pending {
        ReplyHandler handler;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    std::size_t id_;
    std::atomic<WorkerState> state_{WorkerState::Starting};
    std::unique_ptr<Worker> worker_;

    // Guards pending_ and every transition into Dead.
    mutable std::mutex mutex_;
    std::unordered_map<CorrelationId, Pending> pending_;
};

using WorkerHandlePtr = std::shared_ptr<WorkerHandle>;

struct PoolOptions {
    unsigned int workers = 1;
    WorkerPolicy policy = WorkerPolicy::Degrade;
    std::chrono::milliseconds reply_timeout{30000};
    ForwardOptions forward;
    // Runs on the worker's thread for every reply frame before it is matched.
    // An exception escaping it terminates that worker.
    std::function<void(std::size_t worker_id, const std::string& frame)> on_reply_frame;
};

PoolOptions make_pool_options(const AppConfig& config);

// Fixed-size set of workers sharing one routing table. Reply handlers and
// timeouts run on the executor passed at construction; that executor must stop
// running before the pool is destroyed.
class WorkerPool {
public:
    using ReplyHandler = std::function<void(ReplyDescriptor)>;

    WorkerPool(boost::asio::any_io_executor executor,
               RoutingTablePtr table,
               PoolOptions options,
               MetricsPtr metrics = nullptr);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Spawns every worker and waits until each one is ready.
    void start();

    // Fails every pending request with WorkerUnavailable and joins the workers.
    void shutdown();

    // Uniformly random among ready workers; nullptr when none is ready.
    WorkerHandlePtr select();

    CorrelationId next_correlation_id();

    // The handler runs exactly once: with the worker's reply, with
    // WorkerUnavailable, or with ReplyTimeout.
    void send(const WorkerHandlePtr& handle, const RequestDescriptor& request, ReplyHandler handler);

    // Abandons a pending request without running its handler.
    bool cancel(const WorkerHandlePtr& handle, CorrelationId id);

    // Liveness transition to Dead. Pending requests fail with WorkerUnavailable;
    // under WorkerPolicy::Respawn a new worker takes the slot.
    void mark_dead(std::size_t worker_id, const std::string& reason);

    std::vector<WorkerHandlePtr> handles() const;
    std::size_t ready_count() const;
    const PoolOptions& options() const { return options_; }

private:
    WorkerHandlePtr spawn();
    void on_reply(const std::weak_ptr<WorkerHandle>& weak, const std::string& frame);
    void on_timeout(const std::weak_ptr<WorkerHandle>& weak, CorrelationId id);
    std::optional<WorkerHandle::Pending> take(WorkerHandle& handle, CorrelationId id);
    void fail_unavailable(ReplyHandler handler, CorrelationId id);
    void fail_all(WorkerHandle& handle);

    boost::asio::any_io_executor executor_;
    RoutingTablePtr table_;
    PoolOptions options_;
    MetricsPtr metrics_;

    mutable std::mutex mutex_;
    std::vector<WorkerHandlePtr> handles_;
    std::vector<WorkerHandlePtr> retired_;
    std::mt19937 rng_;
    bool shutting_down_ = false;

    std::atomic<std::size_t> next_worker_id_{0};
    std::atomic<CorrelationId> next_correlation_id_{0};
};

} // namespace rproxy
