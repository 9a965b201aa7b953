#include "worker_pool.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace rproxy {

const char* to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Starting: return "starting";
        case WorkerState::Ready: return "ready";
        case WorkerState::Dead: return "dead";
    }
    return "dead";
}

std::size_t WorkerHandle::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

PoolOptions make_pool_options(const AppConfig& config) {
    PoolOptions options;
    options.workers = config.workers != 0 ? config.workers : std::max(1u, std::thread::hardware_concurrency());
    options.policy = config.worker_policy;
    options.reply_timeout = config.timeouts.reply;
    options.forward.connect_timeout = config.timeouts.connect;
    options.forward.timeout = config.timeouts.upstream;
    options.forward.max_body_bytes = config.max_body_bytes;
    options.forward.extra_headers = config.headers;
    return options;
}

WorkerPool::WorkerPool(boost::asio::any_io_executor executor,
                       RoutingTablePtr table,
                       PoolOptions options,
                       MetricsPtr metrics)
    : executor_(std::move(executor)),
      table_(std::move(table)),
      options_(std::move(options)),
      metrics_(std::move(metrics)),
      rng_(std::random_device{}()) {}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::start() {
    for (unsigned int i = 0; i < options_.workers; ++i) {
        spawn();
    }
    std::cout << "[pool] " << ready_count() << " worker(s) ready, policy="
              << to_string(options_.policy) << "\n";
}

void WorkerPool::shutdown() {
    std::vector<WorkerHandlePtr> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return;
        shutting_down_ = true;
        all = handles_;
        all.insert(all.end(), retired_.begin(), retired_.end());
    }
    for (auto& handle : all) {
        fail_all(*handle);
    }
    for (auto& handle : all) {
        handle->worker_->stop();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.clear();
    retired_.clear();
}

WorkerHandlePtr WorkerPool::spawn() {
    auto handle = std::make_shared<WorkerHandle>(WorkerHandle::Key{}, next_worker_id_.fetch_add(1));
    const auto worker_id = handle->id_;
    std::weak_ptr<WorkerHandle> weak = handle;
    handle->worker_ = std::make_unique<Worker>(
        worker_id,
        table_,
        options_.forward,
        [this, weak, worker_id](std::string frame) {
            if (options_.on_reply_frame) options_.on_reply_frame(worker_id, frame);
            on_reply(weak, frame);
        },
        [this, worker_id](const std::string& reason) { mark_dead(worker_id, reason); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return nullptr;
        handles_.push_back(handle);
    }

    handle->worker_->start();
    auto expected = WorkerState::Starting;
    handle->state_.compare_exchange_strong(expected, WorkerState::Ready);
    return handle;
}

WorkerHandlePtr WorkerPool::select() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkerHandlePtr*> ready;
    ready.reserve(handles_.size());
    for (auto& handle : handles_) {
        if (handle->state() == WorkerState::Ready) ready.push_back(&handle);
    }
    if (ready.empty()) return nullptr;
    std::uniform_int_distribution<std::size_t> pick(0, ready.size() - 1);
    return *ready[pick(rng_)];
}

CorrelationId WorkerPool::next_correlation_id() {
    return next_correlation_id_.fetch_add(1, std::memory_order_relaxed) + 1;
}

void WorkerPool::send(const WorkerHandlePtr& handle, const RequestDescriptor& request, ReplyHandler handler) {
    const auto id = request.correlation_id;
    if (!handle || handle->state() != WorkerState::Ready) {
        fail_unavailable(std::move(handler), id);
        return;
    }

    // Armed before the entry becomes visible so a reply can never race the arming.
    auto timer = std::make_shared<boost::asio::steady_timer>(executor_, options_.reply_timeout);
    std::weak_ptr<WorkerHandle> weak = handle;
    timer->async_wait([this, weak, id](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        on_timeout(weak, id);
    });

    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(handle->mutex_);
        if (handle->state() == WorkerState::Ready && !handle->pending_.count(id)) {
            handle->pending_.emplace(id, WorkerHandle::Pending{std::move(handler), timer});
            accepted = true;
        }
    }
    if (!accepted) {
        boost::asio::post(executor_, [timer]() { timer->cancel(); });
        if (handler) {
            fail_unavailable(std::move(handler), id);
        }
        return;
    }

    if (!handle->worker_->post(encode_request(request))) {
        if (auto pending = take(*handle, id)) {
            boost::asio::post(executor_, [timer]() { timer->cancel(); });
            fail_unavailable(std::move(pending->handler), id);
        }
    }
}

bool WorkerPool::cancel(const WorkerHandlePtr& handle, CorrelationId id) {
    if (!handle) return false;
    auto pending = take(*handle, id);
    if (!pending) return false;
    boost::asio::post(executor_, [timer = pending->timer]() { timer->cancel(); });
    if (metrics_) {
        metrics_->requests_abandoned.fetch_add(1, std::memory_order_relaxed);
    }
    return true;
}

void WorkerPool::mark_dead(std::size_t worker_id, const std::string& reason) {
    WorkerHandlePtr handle;
    bool respawn = false;
    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) return;
        auto it = std::find_if(handles_.begin(), handles_.end(),
                               [worker_id](const WorkerHandlePtr& h) { return h->id_ == worker_id; });
        if (it == handles_.end()) return;
        handle = *it;
        handles_.erase(it);
        retired_.push_back(handle);
        respawn = options_.policy == WorkerPolicy::Respawn;
        remaining = handles_.size();
    }

    fail_all(*handle);
    if (metrics_) {
        metrics_->worker_deaths.fetch_add(1, std::memory_order_relaxed);
    }
    std::cerr << "[pool] Worker " << worker_id << " is dead (" << reason << ")";
    if (respawn) {
        std::cerr << ", respawning\n";
    } else {
        std::cerr << ", " << remaining << " worker(s) left\n";
    }

    handle->worker_->stop();
    if (respawn) {
        spawn();
    }
}

std::vector<WorkerHandlePtr> WorkerPool::handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_;
}

std::size_t WorkerPool::ready_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(handles_.begin(), handles_.end(), [](const WorkerHandlePtr& h) {
        return h->state() == WorkerState::Ready;
    }));
}

void WorkerPool::on_reply(const std::weak_ptr<WorkerHandle>& weak, const std::string& frame) {
    ReplyDescriptor reply;
    try {
        reply = decode_reply(frame);
    } catch (const ProtocolError& ex) {
        std::cerr << "[pool] Discarding reply frame: " << ex.what() << "\n";
        return;
    }

    auto handle = weak.lock();
    if (!handle) return;
    auto pending = take(*handle, reply.correlation_id);
    if (!pending) {
        // Timed out, cancelled or failed over already.
        std::cout << "[pool] Late reply for request " << reply.correlation_id
                  << " from worker " << handle->id_ << " dropped\n";
        return;
    }
    boost::asio::post(executor_, [timer = pending->timer,
                                  handler = std::move(pending->handler),
                                  reply = std::move(reply)]() mutable {
        timer->cancel();
        handler(std::move(reply));
    });
}

void WorkerPool::on_timeout(const std::weak_ptr<WorkerHandle>& weak, CorrelationId id) {
    auto handle = weak.lock();
    if (!handle) return;
    auto pending = take(*handle, id);
    if (!pending) return;

    if (metrics_) {
        metrics_->reply_timeouts.fetch_add(1, std::memory_order_relaxed);
    }
    std::cerr << "[pool] Request " << id << " timed out on worker " << handle->id_
              << " after " << options_.reply_timeout.count() << "ms\n";
    pending->handler(ReplyDescriptor::failure(id, ErrorKind::ReplyTimeout, "Gateway Timeout"));
}

std::optional<WorkerHandle::Pending> WorkerPool::take(WorkerHandle& handle, CorrelationId id) {
    std::lock_guard<std::mutex> lock(handle.mutex_);
    auto it = handle.pending_.find(id);
    if (it == handle.pending_.end()) return std::nullopt;
    WorkerHandle::Pending pending = std::move(it->second);
    handle.pending_.erase(it);
    return pending;
}

void WorkerPool::fail_unavailable(ReplyHandler handler, CorrelationId id) {
    boost::asio::post(executor_, [handler = std::move(handler), id]() {
        handler(ReplyDescriptor::failure(id, ErrorKind::WorkerUnavailable, "Internal Server Error"));
    });
}

void WorkerPool::fail_all(WorkerHandle& handle) {
    std::unordered_map<CorrelationId, WorkerHandle::Pending> orphans;
    {
        std::lock_guard<std::mutex> lock(handle.mutex_);
        handle.state_.store(WorkerState::Dead);
        orphans.swap(handle.pending_);
    }
    for (auto& [id, pending] : orphans) {
        boost::asio::post(executor_, [timer = pending.timer]() { timer->cancel(); });
        fail_unavailable(std::move(pending.handler), id);
    }
}

} // namespace rproxy
