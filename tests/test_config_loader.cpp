#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace mcpgate;

namespace {

constexpr const char* kEchoBackend = R"(
[[backends]]
name = "echo"
type = "echo"
)";

bool mentions(const ConfigLoader::LoadResult& result, const std::string& needle) {
    return result.error_message.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Config: defaults when sections are absent", "[config]") {
    auto result = ConfigLoader::load_from_string(kEchoBackend);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.service_secret.empty());
    CHECK(cfg.logging.level == "info");

    CHECK(cfg.pool.max_connections_per_backend == 50);
    CHECK(cfg.pool.max_concurrent_requests_per_user == 10);
    CHECK(cfg.pool.max_total_connections == 500);
    CHECK(cfg.pool.request_timeout == std::chrono::milliseconds(60000));
    CHECK(cfg.pool.queue_max_size == 1000);
    CHECK(cfg.pool.circuit_breaker_threshold == 5);

    CHECK(cfg.rate_limiting.enabled);
    CHECK(cfg.rate_limiting.tokens_per_window == 100);
    CHECK(cfg.rate_limiting.max_burst_size == 150);
    CHECK(cfg.rate_limiting.per_user_limit == 10);
    CHECK(cfg.rate_limiting.per_backend_limit == 50);

    CHECK(cfg.sessions.registry.session_timeout == std::chrono::milliseconds(1800000));
    CHECK(cfg.sessions.credential_cache_ttl == std::chrono::milliseconds(300000));

    REQUIRE(cfg.backends.size() == 1);
    CHECK(cfg.backends[0].type == "echo");
    CHECK(cfg.backends[0].enabled);
}

TEST_CASE("Config: every section is read", "[config]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 9090
thread_pool_size = 4
service_secret = "s3cret"
max_request_bytes = 4096
shutdown_timeout_ms = 5000

[server.tls]
enabled = true
cert_file = "/etc/gw/cert.pem"
key_file = "/etc/gw/key.pem"

[logging]
level = "warn"

[pool]
max_connections_per_backend = 2
max_concurrent_requests_per_user = 3
max_total_connections = 4
connection_timeout_ms = 1000
request_timeout_ms = 2000
idle_timeout_ms = 3000
queue_max_size = 0
cleanup_interval_ms = 500
circuit_breaker_threshold = 7
circuit_breaker_timeout_ms = 8000

[rate_limiting]
enabled = true
tokens_per_window = 5
window_size_ms = 1000
max_burst_size = 5
sliding_window_size_ms = 2000
sliding_window_segments = 10
per_user_limit = 1
per_user_window_ms = 60000
per_backend_limit = 20
per_backend_window_ms = 30000
enable_adaptive = false
adaptive_threshold = 0.9
adaptive_reduction = 0.25
adaptive_recovery_rate = 0.2
cleanup_interval_ms = 10000

[sessions]
session_timeout_ms = 120000
sweep_interval_ms = 15000
credential_cache_ttl_ms = 1000

[[users]]
id = "alice"
api_key = "alice-key"
backends = ["tools"]

[[users]]
id = "bob"
api_key_sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"

[[backends]]
name = "tools"
type = "HTTP"
url = "http://localhost:9000"
path = "/rpc"
timeout_ms = 15000

[[backends]]
name = "echo"
type = "echo"
enabled = false
)";

    auto result = ConfigLoader::load_from_string(toml);
    INFO(result.error_message);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK(cfg.server.service_secret == "s3cret");
    CHECK(cfg.server.max_request_bytes == 4096);
    CHECK(cfg.server.shutdown_timeout == std::chrono::milliseconds(5000));
    CHECK(cfg.server.tls.enabled);
    CHECK(cfg.server.tls.key_file == "/etc/gw/key.pem");
    CHECK(cfg.logging.level == "warn");

    CHECK(cfg.pool.max_connections_per_backend == 2);
    CHECK(cfg.pool.max_concurrent_requests_per_user == 3);
    CHECK(cfg.pool.max_total_connections == 4);
    CHECK(cfg.pool.connection_timeout == std::chrono::milliseconds(1000));
    CHECK(cfg.pool.idle_timeout == std::chrono::milliseconds(3000));
    CHECK(cfg.pool.queue_max_size == 0);
    CHECK(cfg.pool.circuit_breaker_threshold == 7);
    CHECK(cfg.pool.circuit_breaker_timeout == std::chrono::milliseconds(8000));

    CHECK(cfg.rate_limiting.tokens_per_window == 5);
    CHECK(cfg.rate_limiting.sliding_window_size == std::chrono::milliseconds(2000));
    CHECK(cfg.rate_limiting.sliding_window_segments == 10);
    CHECK(cfg.rate_limiting.per_user_limit == 1);
    CHECK(cfg.rate_limiting.per_backend_window == std::chrono::milliseconds(30000));
    CHECK_FALSE(cfg.rate_limiting.enable_adaptive);
    CHECK(cfg.rate_limiting.adaptive_reduction == 0.25);

    CHECK(cfg.sessions.registry.sweep_interval == std::chrono::milliseconds(15000));
    CHECK(cfg.sessions.credential_cache_ttl == std::chrono::milliseconds(1000));

    REQUIRE(cfg.users.size() == 2);
    CHECK(cfg.users[0].backends == std::vector<std::string>{"tools"});
    CHECK(cfg.users[1].api_key.empty());
    CHECK(cfg.users[1].api_key_sha256.size() == 64);

    REQUIRE(cfg.backends.size() == 2);
    CHECK(cfg.backends[0].type == "http");
    CHECK(cfg.backends[0].path == "/rpc");
    CHECK(cfg.backends[0].timeout == std::chrono::milliseconds(15000));
    CHECK_FALSE(cfg.backends[1].enabled);
}

TEST_CASE("Config: env vars expand in strings and arrays", "[config][env]") {
    ::setenv("MCPGATE_TEST_SECRET", "from-env", 1);
    ::setenv("MCPGATE_TEST_BACKEND", "tools", 1);

    const std::string toml = R"(
[server]
service_secret = "${MCPGATE_TEST_SECRET}"

[[users]]
id = "alice"
api_key = "k-${MCPGATE_TEST_SECRET}-${MCPGATE_TEST_UNSET_XYZ}"
backends = ["${MCPGATE_TEST_BACKEND}"]

[[backends]]
name = "${MCPGATE_TEST_BACKEND}"
type = "echo"
)";

    ::unsetenv("MCPGATE_TEST_UNSET_XYZ");
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.server.service_secret == "from-env");
    CHECK(result.config.users[0].api_key == "k-from-env-");
    CHECK(result.config.users[0].backends[0] == "tools");
    CHECK(result.config.backends[0].name == "tools");

    ::unsetenv("MCPGATE_TEST_SECRET");
    ::unsetenv("MCPGATE_TEST_BACKEND");
}

TEST_CASE("Config: unclosed env substitution is an error", "[config][env]") {
    const std::string toml = std::string(R"(
[server]
service_secret = "${UNCLOSED"
)") + kEchoBackend;

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Unclosed"));
}

TEST_CASE("Config: malformed TOML reports a parse error", "[config]") {
    auto result = ConfigLoader::load_from_string("[server\nport = ");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Failed to parse"));
}

TEST_CASE("Config: negative counts are rejected", "[config][validation]") {
    const std::string toml = std::string(R"(
[pool]
max_total_connections = -1
)") + kEchoBackend;

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "pool.max_total_connections"));
}

TEST_CASE("Config: validation collects every violation", "[config][validation]") {
    const std::string toml = R"(
[server]
port = 70000

[logging]
level = "verbose"

[pool]
max_connections_per_backend = 0
circuit_breaker_threshold = 0

[rate_limiting]
tokens_per_window = 0
adaptive_threshold = 1.5

[[users]]
id = "alice"

[[users]]
id = "alice"
api_key = "a"
api_key_sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"

[[backends]]
name = "tools"
type = "http"

[[backends]]
name = "tools"
type = "grpc"

[[backends]]
name = ""
type = "echo"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(mentions(result, "server.port"));
    CHECK(mentions(result, "logging.level"));
    CHECK(mentions(result, "pool.max_connections_per_backend"));
    CHECK(mentions(result, "pool.circuit_breaker_threshold"));
    CHECK(mentions(result, "rate_limiting.tokens_per_window"));
    CHECK(mentions(result, "adaptive_threshold"));
    CHECK(mentions(result, "users[0]: exactly one of api_key"));
    CHECK(mentions(result, "duplicate user id 'alice'"));
    CHECK(mentions(result, "backends[0].url required"));
    CHECK(mentions(result, "duplicate backend name 'tools'"));
    CHECK(mentions(result, "type must be http or echo"));
    CHECK(mentions(result, "backends[2].name must not be empty"));
}

TEST_CASE("Config: a config needs at least one backend", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server]\nport = 8080\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "[[backends]]"));
}

TEST_CASE("Config: TLS requires cert and key", "[config][validation]") {
    const std::string toml = std::string(R"(
[server.tls]
enabled = true
)") + kEchoBackend;

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "server.tls.cert_file"));
    CHECK(mentions(result, "server.tls.key_file"));
}

TEST_CASE("Config: rate limiter thresholds are not checked when disabled", "[config][validation]") {
    const std::string toml = std::string(R"(
[rate_limiting]
enabled = false
tokens_per_window = 0
)") + kEchoBackend;

    auto result = ConfigLoader::load_from_string(toml);
    INFO(result.error_message);
    CHECK(result.success);
}

TEST_CASE("Config: load from file", "[config]") {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "mcpgate_test_config.toml";
    {
        std::ofstream out(path);
        out << "[server]\nport = 8181\n" << kEchoBackend;
    }

    auto result = ConfigLoader::load_from_file(path.string());
    REQUIRE(result.success);
    CHECK(result.config.server.port == 8181);
    fs::remove(path);

    auto missing = ConfigLoader::load_from_file((fs::temp_directory_path() / "mcpgate_missing.toml").string());
    CHECK_FALSE(missing.success);
    CHECK_FALSE(missing.error_message.empty());
}
