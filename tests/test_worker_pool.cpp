#include "test_backend.hpp"
#include "test_common.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include <boost/asio.hpp>

using namespace rproxy;
using test_support::TestBackend;

namespace {

// Pool plus the loop its reply handlers run on. The loop stops before the
// pool goes away.
struct PoolHarness {
    PoolHarness(RoutingTablePtr table, PoolOptions options)
        : work(boost::asio::make_work_guard(io)),
          metrics(make_metrics()),
          pool(std::make_unique<WorkerPool>(io.get_executor(), std::move(table), std::move(options), metrics)) {
        pool->start();
        runner = std::thread([this]() { io.run(); });
    }

    ~PoolHarness() {
        io.stop();
        runner.join();
        pool.reset();
    }

    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    MetricsPtr metrics;
    std::unique_ptr<WorkerPool> pool;
    std::thread runner;
};

RoutingTablePtr single_upstream(const std::string& address) {
    return std::make_shared<const RoutingTable>(
        std::vector<Upstream>{Upstream{"backend", address}},
        std::vector<Rule>{Rule{"/api", {"backend"}}, Rule{"/", {"backend"}}});
}

PoolOptions pool_options(unsigned int workers, WorkerPolicy policy = WorkerPolicy::Degrade) {
    PoolOptions options;
    options.workers = workers;
    options.policy = policy;
    options.reply_timeout = std::chrono::milliseconds(5000);
    return options;
}

RequestDescriptor make_request(WorkerPool& pool, const std::string& path) {
    RequestDescriptor req;
    req.correlation_id = pool.next_correlation_id();
    req.path = path;
    return req;
}

// Single reply slot filled from the pool's loop.
struct ReplyCatcher {
    std::mutex mutex;
    std::optional<ReplyDescriptor> reply;
    std::atomic<int> calls{0};

    WorkerPool::ReplyHandler handler() {
        return [this](ReplyDescriptor r) {
            std::lock_guard<std::mutex> lock(mutex);
            reply = std::move(r);
            calls.fetch_add(1);
        };
    }

    ReplyDescriptor wait(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        if (!wait_until([this] { return calls.load() > 0; }, timeout)) {
            throw TestFailure("no reply delivered");
        }
        std::lock_guard<std::mutex> lock(mutex);
        return *reply;
    }
};

} // namespace

int main() {
    auto test_start_brings_workers_up = [] {
        TestBackend backend;
        PoolHarness h(single_upstream(backend.address()), pool_options(3));
        auto handles = h.pool->handles();
        EXPECT_EQ(handles.size(), 3u);
        for (const auto& handle : handles) {
            EXPECT_EQ(handle->state(), WorkerState::Ready);
        }
        EXPECT_EQ(h.pool->ready_count(), 3u);
        EXPECT_NE(h.pool->next_correlation_id(), h.pool->next_correlation_id());
    };

    auto test_concurrent_pairing_on_one_worker = [] {
        TestBackend backend;
        PoolHarness h(single_upstream(backend.address()), pool_options(1));
        auto handle = h.pool->select();
        EXPECT_TRUE(handle != nullptr);

        constexpr int kRequests = 100;
        std::mutex mutex;
        std::map<CorrelationId, int> seen;
        std::atomic<int> done{0};
        std::atomic<int> mismatched{0};
        for (int i = 0; i < kRequests; ++i) {
            // Varying delays make completion order differ from send order.
            const auto path = "/slow/" + std::to_string((i * 37) % 150) + "/" + std::to_string(i);
            auto req = make_request(*h.pool, path);
            h.pool->send(handle, req, [&, id = req.correlation_id, path](ReplyDescriptor reply) {
                std::lock_guard<std::mutex> lock(mutex);
                ++seen[reply.correlation_id];
                if (reply.correlation_id != id || !reply.ok() || reply.body != "GET " + path) {
                    mismatched.fetch_add(1);
                }
                done.fetch_add(1);
            });
        }

        EXPECT_TRUE(wait_until([&] { return done.load() >= kRequests; }, std::chrono::milliseconds(10000)));
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        EXPECT_EQ(done.load(), kRequests);
        EXPECT_EQ(mismatched.load(), 0);
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(seen.size(), static_cast<std::size_t>(kRequests));
        for (const auto& [id, count] : seen) {
            EXPECT_EQ(count, 1);
        }
        EXPECT_EQ(handle->pending(), 0u);
        EXPECT_EQ(backend.hits(), static_cast<std::size_t>(kRequests));
    };

    auto test_uniform_selection = [] {
        TestBackend backend;
        PoolHarness h(single_upstream(backend.address()), pool_options(4));
        std::map<std::size_t, int> share;
        for (int i = 0; i < 400; ++i) {
            auto handle = h.pool->select();
            EXPECT_TRUE(handle != nullptr);
            ++share[handle->id()];
        }
        EXPECT_EQ(share.size(), 4u);
        for (const auto& [id, count] : share) {
            EXPECT_TRUE(count > 0);
        }
    };

    auto test_rule_not_found = [] {
        auto table = std::make_shared<const RoutingTable>(
            std::vector<Upstream>{Upstream{"a", "127.0.0.1:1"}},
            std::vector<Rule>{Rule{"/api", {"a"}}});
        PoolHarness h(table, pool_options(1));
        ReplyCatcher catcher;
        auto req = make_request(*h.pool, "/unmatched");
        h.pool->send(h.pool->select(), req, catcher.handler());
        auto reply = catcher.wait();
        EXPECT_EQ(reply.correlation_id, req.correlation_id);
        EXPECT_EQ(*reply.error, ErrorKind::RuleNotFound);
        EXPECT_EQ(reply.body, "Rule not found");
    };

    auto test_missing_upstream = [] {
        auto table = std::make_shared<const RoutingTable>(
            std::vector<Upstream>{Upstream{"a", "127.0.0.1:1"}},
            std::vector<Rule>{Rule{"/", {"ghost"}}});
        PoolHarness h(table, pool_options(1));
        ReplyCatcher catcher;
        h.pool->send(h.pool->select(), make_request(*h.pool, "/x"), catcher.handler());
        auto reply = catcher.wait();
        EXPECT_EQ(*reply.error, ErrorKind::UpstreamNotFound);
        EXPECT_EQ(h.pool->ready_count(), 1u);
    };

    auto test_unreachable_upstream = [] {
        const auto port = test_support::closed_port();
        PoolHarness h(single_upstream("127.0.0.1:" + std::to_string(port)), pool_options(1));
        ReplyCatcher catcher;
        h.pool->send(h.pool->select(), make_request(*h.pool, "/api/x"), catcher.handler());
        auto reply = catcher.wait();
        EXPECT_EQ(*reply.error, ErrorKind::UpstreamUnreachable);
        EXPECT_EQ(http_status(*reply.error), 502u);
    };

    auto test_worker_death_mid_flight = [] {
        TestBackend backend;
        PoolHarness h(single_upstream(backend.address()), pool_options(2));
        auto handle = h.pool->select();
        ReplyCatcher catcher;
        h.pool->send(handle, make_request(*h.pool, "/slow/3000/x"), catcher.handler());
        EXPECT_EQ(handle->pending(), 1u);

        h.pool->mark_dead(handle->id(), "channel closed");
        auto reply = catcher.wait(std::chrono::milliseconds(1000));
        EXPECT_EQ(*reply.error, ErrorKind::WorkerUnavailable);
        EXPECT_EQ(handle->state(), WorkerState::Dead);
        EXPECT_EQ(handle->pending(), 0u);
        EXPECT_EQ(h.pool->ready_count(), 1u);
        EXPECT_EQ(h.metrics->worker_deaths.load(), 1u);
        for (int i = 0; i < 50; ++i) {
            EXPECT_NE(h.pool->select()->id(), handle->id());
        }

        ReplyCatcher late;
        h.pool->send(handle, make_request(*h.pool, "/x"), late.handler());
        EXPECT_EQ(*late.wait().error, ErrorKind::WorkerUnavailable);
        EXPECT_EQ(catcher.calls.load(), 1);
    };

    auto test_respawn_policy = [] {
        TestBackend backend;
        PoolHarness h(single_upstream(backend.address()), pool_options(2, WorkerPolicy::Respawn));
        std::set<std::size_t> before;
        for (const auto& handle : h.pool->handles()) before.insert(handle->id());

        h.pool->mark_dead(*before.begin(), "test");
        EXPECT_EQ(h.pool->ready_count(), 2u);
        std::set<std::size_t> after;
        for (const auto& handle : h.pool->handles()) after.insert(handle->id());
        EXPECT_FALSE(after.count(*before.begin()) != 0);
        EXPECT_TRUE(after.count(2) != 0);

        ReplyCatcher catcher;
        h.pool->send(h.pool->select(), make_request(*h.pool, "/api/alive"), catcher.handler());
        auto reply = catcher.wait();
        EXPECT_TRUE(reply.ok());
        EXPECT_EQ(reply.body, "GET /api/alive");
    };

    auto test_reply_timeout = [] {
        TestBackend backend;
        auto options = pool_options(1);
        options.reply_timeout = std::chrono::milliseconds(150);
        PoolHarness h(single_upstream(backend.address()), options);
        auto handle = h.pool->select();
        ReplyCatcher catcher;
        const auto started = std::chrono::steady_clock::now();
        h.pool->send(handle, make_request(*h.pool, "/slow/2000/x"), catcher.handler());
        auto reply = catcher.wait(std::chrono::milliseconds(1500));
        const auto elapsed = std::chrono::steady_clock::now() - started;
        EXPECT_EQ(*reply.error, ErrorKind::ReplyTimeout);
        EXPECT_EQ(http_status(*reply.error), 504u);
        EXPECT_TRUE(elapsed < std::chrono::milliseconds(1500));
        EXPECT_EQ(handle->pending(), 0u);
        EXPECT_EQ(h.metrics->reply_timeouts.load(), 1u);
        EXPECT_EQ(handle->state(), WorkerState::Ready);
    };

    auto test_cancel_abandons = [] {
        TestBackend backend;
        PoolHarness h(single_upstream(backend.address()), pool_options(1));
        auto handle = h.pool->select();
        ReplyCatcher catcher;
        auto req = make_request(*h.pool, "/slow/300/c");
        h.pool->send(handle, req, catcher.handler());
        EXPECT_TRUE(h.pool->cancel(handle, req.correlation_id));
        EXPECT_FALSE(h.pool->cancel(handle, req.correlation_id));
        EXPECT_EQ(handle->pending(), 0u);

        // The worker still answers; the reply finds no owner and is dropped.
        EXPECT_TRUE(wait_until([&] { return backend.hits() == 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        EXPECT_EQ(catcher.calls.load(), 0);
        EXPECT_EQ(h.metrics->requests_abandoned.load(), 1u);
        EXPECT_EQ(handle->state(), WorkerState::Ready);
    };

    auto test_shutdown_fails_pending = [] {
        TestBackend backend;
        PoolHarness h(single_upstream(backend.address()), pool_options(1));
        ReplyCatcher catcher;
        h.pool->send(h.pool->select(), make_request(*h.pool, "/slow/3000/x"), catcher.handler());
        h.pool->shutdown();
        EXPECT_EQ(*catcher.wait(std::chrono::milliseconds(1000)).error, ErrorKind::WorkerUnavailable);
        EXPECT_TRUE(h.pool->select() == nullptr);
        EXPECT_EQ(h.pool->ready_count(), 0u);
    };

    auto test_worker_loop_exception_reports_exit = [] {
        auto table = std::make_shared<const RoutingTable>(
            std::vector<Upstream>{Upstream{"a", "127.0.0.1:1"}},
            std::vector<Rule>{Rule{"/api", {"a"}}});
        std::promise<std::string> exited;
        auto exit_reason = exited.get_future();
        Worker worker(
            7, table, ForwardOptions{},
            [](std::string) { throw std::runtime_error("reply channel broken"); },
            [&exited](const std::string& reason) { exited.set_value(reason); });
        worker.start();

        RequestDescriptor req;
        req.correlation_id = 1;
        req.path = "/unmatched";
        EXPECT_TRUE(worker.post(encode_request(req)));
        EXPECT_TRUE(exit_reason.wait_for(std::chrono::seconds(3)) == std::future_status::ready);
        EXPECT_EQ(exit_reason.get(), "reply channel broken");
        EXPECT_FALSE(worker.post(encode_request(req)));
    };

    auto test_worker_exception_fails_pending = [] {
        TestBackend backend;
        auto options = pool_options(1);
        options.on_reply_frame = [](std::size_t, const std::string&) {
            throw std::runtime_error("reply channel broken");
        };
        PoolHarness h(single_upstream(backend.address()), options);
        auto handle = h.pool->select();
        ReplyCatcher slow;
        ReplyCatcher fast;
        h.pool->send(handle, make_request(*h.pool, "/slow/2000/x"), slow.handler());
        h.pool->send(handle, make_request(*h.pool, "/api/fast"), fast.handler());

        // The first reply frame kills the worker on its own thread.
        EXPECT_EQ(*fast.wait().error, ErrorKind::WorkerUnavailable);
        EXPECT_EQ(*slow.wait(std::chrono::milliseconds(1000)).error, ErrorKind::WorkerUnavailable);
        EXPECT_EQ(handle->state(), WorkerState::Dead);
        EXPECT_EQ(h.pool->ready_count(), 0u);
        EXPECT_TRUE(h.pool->select() == nullptr);
        EXPECT_EQ(h.metrics->worker_deaths.load(), 1u);
    };

    auto test_worker_exception_respawns = [] {
        TestBackend backend;
        auto options = pool_options(1, WorkerPolicy::Respawn);
        options.on_reply_frame = [](std::size_t worker_id, const std::string&) {
            if (worker_id == 0) throw std::runtime_error("reply channel broken");
        };
        PoolHarness h(single_upstream(backend.address()), options);
        auto first = h.pool->select();
        EXPECT_EQ(first->id(), 0u);
        ReplyCatcher lost;
        h.pool->send(first, make_request(*h.pool, "/api/x"), lost.handler());
        EXPECT_EQ(*lost.wait().error, ErrorKind::WorkerUnavailable);

        EXPECT_TRUE(wait_until([&] {
            auto next = h.pool->select();
            return next && next->id() == 1 && next->state() == WorkerState::Ready;
        }));
        EXPECT_EQ(h.pool->ready_count(), 1u);
        EXPECT_EQ(first->state(), WorkerState::Dead);

        ReplyCatcher served;
        h.pool->send(h.pool->select(), make_request(*h.pool, "/api/again"), served.handler());
        auto reply = served.wait();
        EXPECT_TRUE(reply.ok());
        EXPECT_EQ(reply.body, "GET /api/again");
    };

    return run_tests({
        {"start_brings_workers_up", test_start_brings_workers_up},
        {"concurrent_pairing_on_one_worker", test_concurrent_pairing_on_one_worker},
        {"uniform_selection", test_uniform_selection},
        {"rule_not_found", test_rule_not_found},
        {"missing_upstream", test_missing_upstream},
        {"unreachable_upstream", test_unreachable_upstream},
        {"worker_death_mid_flight", test_worker_death_mid_flight},
        {"respawn_policy", test_respawn_policy},
        {"reply_timeout", test_reply_timeout},
        {"cancel_abandons", test_cancel_abandons},
        {"shutdown_fails_pending", test_shutdown_fails_pending},
        {"worker_loop_exception_reports_exit", test_worker_loop_exception_reports_exit},
        {"worker_exception_fails_pending", test_worker_exception_fails_pending},
        {"worker_exception_respawns", test_worker_exception_respawns},
    });
}
