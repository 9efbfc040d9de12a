#include "config/config_loader.hpp"
#include "core/clock.hpp"
#include "core/event_bus.hpp"
#include "core/task_scheduler.hpp"
#include "core/utils.hpp"
#include "gateway/backend_registry.hpp"
#include "gateway/echo_backend.hpp"
#include "gateway/gateway.hpp"
#include "gateway/http_backend.hpp"
#include "pool/pool_manager.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "session/credential_directory.hpp"
#include "session/session_authenticator.hpp"
#include "session/session_registry.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <memory>
#include <thread>

using namespace mcpgate;

namespace {

volatile std::sig_atomic_t g_signal = 0;

void signal_handler(int signal) {
    g_signal = signal;
}

std::shared_ptr<IBackend> make_backend(const BackendConfig& cfg, const PoolManager::Config& pool) {
    if (cfg.type == "echo") {
        return std::make_shared<EchoBackend>(cfg.name);
    }
    HttpBackend::Config http_cfg;
    http_cfg.name = cfg.name;
    http_cfg.url = cfg.url;
    http_cfg.path = cfg.path;
    http_cfg.connect_timeout = pool.connection_timeout;
    http_cfg.request_timeout = cfg.timeout.count() > 0 ? cfg.timeout : pool.request_timeout;
    return std::make_shared<HttpBackend>(std::move(http_cfg));
}

std::shared_ptr<ICredentialDirectory> make_directory(const GatewayConfig& cfg,
                                                     std::shared_ptr<IClock> clock) {
    auto directory = std::make_shared<StaticCredentialDirectory>();
    for (const auto& user : cfg.users) {
        if (!user.api_key_sha256.empty()) {
            directory->add_user_hashed(user.id, user.api_key_sha256, user.backends);
        } else {
            directory->add_user(user.id, user.api_key, user.backends);
        }
    }
    utils::log::info(std::format("Credential directory: {} users, cache ttl {}ms",
                                 directory->size(), cfg.sessions.credential_cache_ttl.count()));
    return std::make_shared<CachingCredentialDirectory>(
        std::move(directory), cfg.sessions.credential_cache_ttl, std::move(clock));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("MCP gateway starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "gateway.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/6] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const GatewayConfig cfg = std::move(config_result.config);
        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        auto clock = std::make_shared<SteadyClock>();
        auto scheduler = std::make_shared<ThreadTaskScheduler>();
        auto events = std::make_shared<EventBus>();
        EventLogger event_logger(*events);

        // =====================================================================
        // [2/6] Backends
        // =====================================================================
        utils::log::info("[2/6] Registering backends...");
        auto backends = std::make_shared<BackendRegistry>();
        for (const auto& backend_cfg : cfg.backends) {
            if (!backend_cfg.enabled) {
                utils::log::info(std::format("Backend '{}' disabled, skipping", backend_cfg.name));
                continue;
            }
            backends->add(make_backend(backend_cfg, cfg.pool));
        }
        if (backends->initialize_all() == 0) {
            utils::log::warn("No healthy backends; every request will be rejected");
        }

        // =====================================================================
        // [3/6] Connection pools
        // =====================================================================
        utils::log::info("[3/6] Initializing connection pools...");
        auto pool = std::make_shared<PoolManager>(cfg.pool, backends, clock, scheduler, events);
        for (const auto& name : backends->names()) {
            pool->initialize_pool(name);
        }
        pool->start_cleanup();

        // =====================================================================
        // [4/6] Rate limiter
        // =====================================================================
        utils::log::info(std::format("[4/6] Rate limiter: {}",
                                     cfg.rate_limiting.enabled ? "enabled" : "disabled"));
        auto limiter = std::make_shared<RateLimiter>(cfg.rate_limiting, clock, scheduler, events);
        limiter->start_cleanup();

        // =====================================================================
        // [5/6] Sessions and authentication
        // =====================================================================
        utils::log::info("[5/6] Session registry initializing...");
        auto authenticator = std::make_shared<SessionAuthenticator>(
            cfg.server.service_secret, make_directory(cfg, clock));
        auto sessions = std::make_shared<SessionRegistry>(
            cfg.sessions.registry, pool, clock, scheduler, events);
        sessions->start_sweep();

        // =====================================================================
        // [6/6] Gateway + HTTP server
        // =====================================================================
        utils::log::info("[6/6] HTTP server initializing...");
        auto gateway = std::make_shared<Gateway>(backends, limiter, authenticator, sessions);

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = cfg.server.shutdown_timeout;
        auto shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);

        auto server = std::make_shared<HttpServer>(cfg.server, HttpServer::Components{
            gateway, backends, pool, limiter, sessions, events, shutdown});

        // Signal watcher: drain in-flight requests, then stop the listener
        std::atomic<bool> server_exited{false};
        std::thread signal_watcher([&] {
            while (g_signal == 0 && !server_exited.load(std::memory_order_acquire)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (g_signal == 0) {
                return;
            }
            utils::log::info(std::format("Received signal {}, shutting down...",
                                         static_cast<int>(g_signal)));
            shutdown->initiate_shutdown();
            if (shutdown->wait_for_drain()) {
                utils::log::info("All in-flight requests drained");
            }
            server->stop();
        });

        try {
            server->start();
        } catch (const std::exception&) {
            server_exited.store(true, std::memory_order_release);
            signal_watcher.join();
            throw;
        }
        server_exited.store(true, std::memory_order_release);
        signal_watcher.join();

        // Ordered teardown: sessions give their connections back before pools close
        sessions->shutdown();
        pool->shutdown();
        limiter->stop_cleanup();
        scheduler->stop();
        utils::log::info("MCP gateway stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
