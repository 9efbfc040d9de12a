#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

#include <toml++/toml.hpp>

using namespace std::string_literals;

namespace mcpgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

/// Non-negative integer option; throws on a negative value.
template<typename T>
T toml_count(const toml::table& tbl, std::string_view section, std::string_view key, T fallback) {
    const int64_t v = tbl[key].value_or(static_cast<int64_t>(fallback));
    if (v < 0) {
        throw std::runtime_error(std::format("{}.{} must not be negative, got {}", section, key, v));
    }
    return static_cast<T>(v);
}

std::chrono::milliseconds toml_ms(const toml::table& tbl, std::string_view section,
                                  std::string_view key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(toml_count<int64_t>(tbl, section, key, fallback.count()));
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = static_cast<int>(s["port"].value_or(int64_t{8080}));
    cfg.thread_pool_size = toml_count<size_t>(s, "server", "thread_pool_size", cfg.thread_pool_size);
    cfg.service_secret = s["service_secret"].value_or(""s);
    cfg.max_request_bytes = toml_count<size_t>(s, "server", "max_request_bytes", cfg.max_request_bytes);
    cfg.shutdown_timeout = toml_ms(s, "server", "shutdown_timeout_ms", cfg.shutdown_timeout);

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

PoolManager::Config extract_pool(const toml::table& root) {
    PoolManager::Config cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;
    constexpr std::string_view section = "pool";

    cfg.max_connections_per_backend = toml_count<uint32_t>(p, section, "max_connections_per_backend",
                                                           cfg.max_connections_per_backend);
    cfg.max_concurrent_requests_per_user = toml_count<uint32_t>(
        p, section, "max_concurrent_requests_per_user", cfg.max_concurrent_requests_per_user);
    cfg.max_total_connections = toml_count<uint32_t>(p, section, "max_total_connections",
                                                     cfg.max_total_connections);
    cfg.connection_timeout = toml_ms(p, section, "connection_timeout_ms", cfg.connection_timeout);
    cfg.request_timeout = toml_ms(p, section, "request_timeout_ms", cfg.request_timeout);
    cfg.idle_timeout = toml_ms(p, section, "idle_timeout_ms", cfg.idle_timeout);
    cfg.queue_max_size = toml_count<uint32_t>(p, section, "queue_max_size", cfg.queue_max_size);
    cfg.cleanup_interval = toml_ms(p, section, "cleanup_interval_ms", cfg.cleanup_interval);
    cfg.circuit_breaker_threshold = toml_count<uint32_t>(p, section, "circuit_breaker_threshold",
                                                         cfg.circuit_breaker_threshold);
    cfg.circuit_breaker_timeout = toml_ms(p, section, "circuit_breaker_timeout_ms",
                                          cfg.circuit_breaker_timeout);
    return cfg;
}

RateLimiter::Config extract_rate_limiting(const toml::table& root) {
    RateLimiter::Config cfg;
    const auto* rl = root["rate_limiting"].as_table();
    if (!rl) return cfg;
    const auto& r = *rl;
    constexpr std::string_view section = "rate_limiting";

    cfg.enabled = r["enabled"].value_or(cfg.enabled);
    cfg.tokens_per_window = toml_count<uint32_t>(r, section, "tokens_per_window", cfg.tokens_per_window);
    cfg.window_size = toml_ms(r, section, "window_size_ms", cfg.window_size);
    cfg.max_burst_size = toml_count<uint32_t>(r, section, "max_burst_size", cfg.max_burst_size);
    cfg.sliding_window_size = toml_ms(r, section, "sliding_window_size_ms", cfg.sliding_window_size);
    cfg.sliding_window_segments = toml_count<uint32_t>(r, section, "sliding_window_segments",
                                                       cfg.sliding_window_segments);
    cfg.per_user_limit = toml_count<uint32_t>(r, section, "per_user_limit", cfg.per_user_limit);
    cfg.per_user_window = toml_ms(r, section, "per_user_window_ms", cfg.per_user_window);
    cfg.per_backend_limit = toml_count<uint32_t>(r, section, "per_backend_limit", cfg.per_backend_limit);
    cfg.per_backend_window = toml_ms(r, section, "per_backend_window_ms", cfg.per_backend_window);
    cfg.enable_adaptive = r["enable_adaptive"].value_or(cfg.enable_adaptive);
    cfg.adaptive_threshold = r["adaptive_threshold"].value_or(cfg.adaptive_threshold);
    cfg.adaptive_reduction = r["adaptive_reduction"].value_or(cfg.adaptive_reduction);
    cfg.adaptive_recovery_rate = r["adaptive_recovery_rate"].value_or(cfg.adaptive_recovery_rate);
    cfg.cleanup_interval = toml_ms(r, section, "cleanup_interval_ms", cfg.cleanup_interval);
    return cfg;
}

SessionsConfig extract_sessions(const toml::table& root) {
    SessionsConfig cfg;
    const auto* sessions = root["sessions"].as_table();
    if (!sessions) return cfg;
    const auto& s = *sessions;

    cfg.registry.session_timeout = toml_ms(s, "sessions", "session_timeout_ms",
                                           cfg.registry.session_timeout);
    cfg.registry.sweep_interval = toml_ms(s, "sessions", "sweep_interval_ms",
                                          cfg.registry.sweep_interval);
    cfg.credential_cache_ttl = toml_ms(s, "sessions", "credential_cache_ttl_ms",
                                       cfg.credential_cache_ttl);
    return cfg;
}

std::vector<UserConfig> extract_users(const toml::table& root) {
    std::vector<UserConfig> result;
    const auto* arr = root["users"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* u = elem.as_table();
        if (!u) continue;

        UserConfig user;
        user.id = (*u)["id"].value_or(""s);
        user.api_key = (*u)["api_key"].value_or(""s);
        user.api_key_sha256 = (*u)["api_key_sha256"].value_or(""s);
        user.backends = toml_string_array(*u, "backends");
        result.push_back(std::move(user));
    }
    return result;
}

std::vector<BackendConfig> extract_backends(const toml::table& root) {
    std::vector<BackendConfig> result;
    const auto* arr = root["backends"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* b = elem.as_table();
        if (!b) continue;

        BackendConfig backend;
        backend.name = (*b)["name"].value_or(""s);
        backend.type = utils::to_lower((*b)["type"].value_or(backend.type));
        backend.url = (*b)["url"].value_or(""s);
        backend.path = (*b)["path"].value_or(""s);
        backend.enabled = (*b)["enabled"].value_or(true);
        backend.timeout = toml_ms(*b, "backends", "timeout_ms", backend.timeout);
        result.push_back(std::move(backend));
    }
    return result;
}

GatewayConfig extract_all_sections(const toml::table& tbl) {
    GatewayConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.pool = extract_pool(tbl);
    config.rate_limiting = extract_rate_limiting(tbl);
    config.sessions = extract_sessions(tbl);
    config.users = extract_users(tbl);
    config.backends = extract_backends(tbl);
    return config;
}

bool in_unit_interval(double v) {
    return v > 0.0 && v <= 1.0;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse {}: {} (line {})", config_path,
                                             e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {} (line {})",
                                             e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    // ---- server ----
    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.thread_pool_size must be > 0");
    }
    if (config.server.max_request_bytes == 0) {
        errors.push_back("server.max_request_bytes must be > 0");
    }
    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn, or error, got '{}'",
                                     config.logging.level));
    }

    // ---- pool ----
    const auto& pool = config.pool;
    if (pool.max_connections_per_backend == 0) {
        errors.push_back("pool.max_connections_per_backend must be > 0");
    }
    if (pool.max_concurrent_requests_per_user == 0) {
        errors.push_back("pool.max_concurrent_requests_per_user must be > 0");
    }
    if (pool.max_total_connections == 0) {
        errors.push_back("pool.max_total_connections must be > 0");
    }
    if (pool.circuit_breaker_threshold == 0) {
        errors.push_back("pool.circuit_breaker_threshold must be > 0");
    }
    if (pool.request_timeout.count() == 0) {
        errors.push_back("pool.request_timeout_ms must be > 0");
    }
    if (pool.idle_timeout.count() == 0) {
        errors.push_back("pool.idle_timeout_ms must be > 0");
    }
    if (pool.cleanup_interval.count() == 0) {
        errors.push_back("pool.cleanup_interval_ms must be > 0");
    }

    // ---- rate_limiting ----
    const auto& rl = config.rate_limiting;
    if (rl.enabled) {
        if (rl.tokens_per_window == 0) {
            errors.push_back("rate_limiting.tokens_per_window must be > 0 when enabled");
        }
        if (rl.window_size.count() == 0) {
            errors.push_back("rate_limiting.window_size_ms must be > 0 when enabled");
        }
        if (rl.max_burst_size == 0) {
            errors.push_back("rate_limiting.max_burst_size must be > 0 when enabled");
        }
        if (rl.sliding_window_segments == 0) {
            errors.push_back("rate_limiting.sliding_window_segments must be > 0 when enabled");
        }
        if (rl.per_user_limit == 0 || rl.per_user_window.count() == 0) {
            errors.push_back("rate_limiting.per_user_limit and per_user_window_ms must be > 0");
        }
        if (rl.per_backend_limit == 0 || rl.per_backend_window.count() == 0) {
            errors.push_back("rate_limiting.per_backend_limit and per_backend_window_ms must be > 0");
        }
        if (rl.cleanup_interval.count() == 0) {
            errors.push_back("rate_limiting.cleanup_interval_ms must be > 0");
        }
    }
    if (!in_unit_interval(rl.adaptive_threshold)) {
        errors.push_back(std::format("rate_limiting.adaptive_threshold must be in (0,1], got {}",
                                     rl.adaptive_threshold));
    }
    if (!in_unit_interval(rl.adaptive_reduction)) {
        errors.push_back(std::format("rate_limiting.adaptive_reduction must be in (0,1], got {}",
                                     rl.adaptive_reduction));
    }
    if (!in_unit_interval(rl.adaptive_recovery_rate)) {
        errors.push_back(std::format("rate_limiting.adaptive_recovery_rate must be in (0,1], got {}",
                                     rl.adaptive_recovery_rate));
    }

    // ---- sessions ----
    if (config.sessions.registry.session_timeout.count() == 0) {
        errors.push_back("sessions.session_timeout_ms must be > 0");
    }
    if (config.sessions.registry.sweep_interval.count() == 0) {
        errors.push_back("sessions.sweep_interval_ms must be > 0");
    }

    // ---- users ----
    std::unordered_set<std::string> user_ids;
    for (size_t i = 0; i < config.users.size(); ++i) {
        const auto& user = config.users[i];
        if (user.id.empty()) {
            errors.push_back(std::format("users[{}].id must not be empty", i));
        } else if (!user_ids.insert(user.id).second) {
            errors.push_back(std::format("users[{}]: duplicate user id '{}'", i, user.id));
        }
        if (user.api_key.empty() == user.api_key_sha256.empty()) {
            errors.push_back(std::format("users[{}]: exactly one of api_key or api_key_sha256 required", i));
        }
        if (!user.api_key_sha256.empty() && user.api_key_sha256.size() != 64) {
            errors.push_back(std::format("users[{}].api_key_sha256 must be 64 hex characters", i));
        }
    }

    // ---- backends ----
    if (config.backends.empty()) {
        errors.push_back("at least one [[backends]] entry is required");
    }
    std::unordered_set<std::string> backend_names;
    for (size_t i = 0; i < config.backends.size(); ++i) {
        const auto& backend = config.backends[i];
        if (backend.name.empty()) {
            errors.push_back(std::format("backends[{}].name must not be empty", i));
        } else if (!backend_names.insert(backend.name).second) {
            errors.push_back(std::format("backends[{}]: duplicate backend name '{}'", i, backend.name));
        }
        if (backend.type == "http") {
            if (backend.url.empty()) {
                errors.push_back(std::format("backends[{}].url required for http backends", i));
            }
        } else if (backend.type != "echo") {
            errors.push_back(std::format("backends[{}].type must be http or echo, got '{}'",
                                         i, backend.type));
        }
    }

    return errors;
}

} // namespace mcpgate
