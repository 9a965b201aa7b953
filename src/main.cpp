#include "config.hpp"
#include "dispatcher.hpp"
#include "metrics.hpp"
#include "routing_table.hpp"
#include "worker_pool.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace rproxy;

namespace {
constexpr auto kDrainTimeout = std::chrono::seconds(2);
}

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " -c|--config path\n";
            return 0;
        } else {
            std::cerr << "[fatal] unknown argument '" << arg << "'\n";
            return 1;
        }
    }

    AppConfig config;
    RoutingTablePtr table;
    try {
        config = load_config(config_path, std::cout);
        table = RoutingTable::from_config(config);
    } catch (const ConfigError& ex) {
        std::cerr << "[fatal] invalid configuration: " << ex.what() << "\n";
        return 1;
    }

    try {
        boost::asio::io_context io;
        auto metrics = make_metrics();

        auto pool = std::make_shared<WorkerPool>(io.get_executor(), table, make_pool_options(config), metrics);
        pool->start();
        if (pool->ready_count() == 0) {
            std::cerr << "[fatal] no worker came up\n";
            return 1;
        }

        Dispatcher dispatcher(io, config, pool, metrics);
        dispatcher.start();

        std::unique_ptr<MetricsServer> metrics_server;
        if (config.metrics.enable && config.metrics.port != 0) {
            metrics_server = std::make_unique<MetricsServer>(io, metrics, config.metrics.port);
            metrics_server->start();
        }

        // Pending requests are failed while the loop still runs so their 500
        // replies get written; the drain timer bounds how long that may take.
        boost::asio::steady_timer drain(io);
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            std::cout << "[main] Caught signal " << signo << ", shutting down\n";
            dispatcher.stop();
            if (metrics_server) metrics_server->stop();
            pool->shutdown();
            drain.expires_after(kDrainTimeout);
            drain.async_wait([&io](const boost::system::error_code&) { io.stop(); });
        });

        std::vector<std::thread> threads;
        threads.reserve(config.dispatcher_threads);
        for (unsigned int i = 0; i < config.dispatcher_threads; ++i) {
            threads.emplace_back([&io]() { io.run(); });
        }

        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
        pool->shutdown();
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
