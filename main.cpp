// API
#include "api/EventsApi.hpp"
#include "api/WebhookApi.hpp"
#include "webhook/Dispatcher.hpp"

// Storage
#include "database/PgEventStore.hpp"
#include "storage/MemoryEventStore.hpp"

// HTTP
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <boost/asio.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <vector>

using namespace gp;
using namespace gp::config;
using namespace gp::log;

namespace {

std::atomic shouldExit = false;

void signalHandler(const int signum) {
    (void)signum;
    shouldExit = true;
}

std::filesystem::path configPathFromArgs(const int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--config") {
            if (i + 1 >= argc) throw std::invalid_argument("--config requires a path");
            return argv[i + 1];
        }
        if (arg.starts_with("--config=")) return std::string(arg.substr(9));
    }
    return DEFAULT_CONFIG_PATH;
}

std::shared_ptr<storage::EventStore> makeStore(const DatabaseConfig& cfg) {
    if (!cfg.enabled) {
        Registry::gitping()->warn("[!] Database disabled, events are kept in memory only");
        return std::make_shared<storage::MemoryEventStore>();
    }
    auto store = database::PgEventStore::connect(cfg);
    if (store->isConnected()) Registry::gitping()->info("[✓] Event store ready on database '{}'", cfg.name);
    return store;
}

}

int main(const int argc, char** argv) {
    try {
        ConfigRegistry::init(configPathFromArgs(argc, argv));
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging.log_dir);

        Registry::gitping()->info("[*] Initializing {} v{}...", api::SERVICE_NAME, api::SERVICE_VERSION);

        const auto store = makeStore(cfg.database);
        const auto dispatcher = std::make_shared<webhook::Dispatcher>(store);
        const auto router = std::make_shared<const protocols::http::Router>(
            std::make_shared<api::EventsApi>(store, cfg.api),
            std::make_shared<api::WebhookApi>(store, dispatcher));

        const auto threads = std::max(1u, cfg.http_server.threads);
        boost::asio::io_context ioc{static_cast<int>(threads)};

        const boost::asio::ip::tcp::endpoint endpoint{
            boost::asio::ip::make_address(cfg.http_server.host), cfg.http_server.port};

        std::make_shared<protocols::http::Server>(ioc, endpoint, router, cfg.http_server.max_body_size_bytes)->run();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::vector<std::thread> runners;
        runners.reserve(threads);
        for (unsigned int i = 0; i < threads; ++i) runners.emplace_back([&ioc] { ioc.run(); });

        Registry::gitping()->info("[✓] {} started with {} thread(s)", api::SERVICE_NAME, threads);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        Registry::gitping()->info("[*] Shutdown signal received, stopping {}...", api::SERVICE_NAME);
        ioc.stop();
        for (auto& t : runners) t.join();

        Registry::gitping()->info("[✓] {} shut down cleanly.", api::SERVICE_NAME);
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::gitping()->error("[-] Failed to run {}: {}", api::SERVICE_NAME, e.what());
        else std::cerr << "[-] Failed to start " << api::SERVICE_NAME << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
