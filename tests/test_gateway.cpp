#include <catch2/catch_test_macros.hpp>
#include "gateway/echo_backend.hpp"
#include "gateway/gateway.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/manual_scheduler.hpp"
#include "mocks/mock_backend.hpp"

#include <algorithm>
#include <chrono>
#include <future>

#include <nlohmann/json.hpp>

using namespace mcpgate;
using namespace mcpgate::testing;
using json = nlohmann::json;

namespace {

constexpr const char* kInitBody =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-03-26"}})";
constexpr const char* kSecret = "s3cret";

struct GatewayFixture {
    explicit GatewayFixture(RateLimiter::Config limits = generous_limits(),
                            PoolManager::Config pool_cfg = small_pool())
        : clock(std::make_shared<ManualClock>()),
          scheduler(std::make_shared<ManualTaskScheduler>(clock)),
          events(std::make_shared<EventBus>()),
          backends(std::make_shared<BackendRegistry>()),
          mock(std::make_shared<MockBackend>("mock")) {
        auto broken = std::make_shared<MockBackend>("broken");
        broken->set_fail_initialize(true);
        backends->add(std::make_shared<EchoBackend>("echo"));
        backends->add(mock);
        backends->add(broken);
        backends->initialize_all();

        pool = std::make_shared<PoolManager>(pool_cfg, backends, clock, scheduler, events);
        for (const auto& name : backends->names()) {
            pool->initialize_pool(name);
        }

        limiter = std::make_shared<RateLimiter>(limits, clock, scheduler, events);

        auto directory = std::make_shared<StaticCredentialDirectory>();
        directory->add_user("alice", "alice-key");
        directory->add_user("bob", "bob-key", {"echo"});
        auto authenticator = std::make_shared<SessionAuthenticator>(kSecret, directory);

        sessions = std::make_shared<SessionRegistry>(
            SessionRegistry::Config{}, pool, clock, scheduler, events);
        gateway = std::make_shared<Gateway>(backends, limiter, authenticator, sessions);
    }

    static RateLimiter::Config generous_limits() {
        RateLimiter::Config cfg;
        cfg.per_user_limit = 1000;
        cfg.per_backend_limit = 1000;
        cfg.tokens_per_window = 1000;
        cfg.max_burst_size = 1000;
        cfg.enable_adaptive = false;
        return cfg;
    }

    static PoolManager::Config small_pool() {
        PoolManager::Config cfg;
        cfg.max_connections_per_backend = 2;
        cfg.queue_max_size = 0;
        return cfg;
    }

    GatewayResponse init(const std::string& backend,
                         const std::string& user = "alice",
                         const std::string& key = "alice-key",
                         const std::string& secret = kSecret) {
        GatewayRequest req;
        req.backend = backend;
        req.body = kInitBody;
        req.credentials = InitCredentials{secret, user, key};
        return gateway->handle(req);
    }

    GatewayResponse call(const std::string& backend, const std::string& session_id,
                         const std::string& body) {
        GatewayRequest req;
        req.backend = backend;
        req.session_id = session_id;
        req.body = body;
        return gateway->handle(req);
    }

    GatewayResponse remove(const std::string& backend, const std::string& session_id) {
        GatewayRequest req;
        req.method = GatewayMethod::DELETE;
        req.backend = backend;
        req.session_id = session_id;
        return gateway->handle(req);
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<ManualTaskScheduler> scheduler;
    std::shared_ptr<EventBus> events;
    std::shared_ptr<BackendRegistry> backends;
    std::shared_ptr<MockBackend> mock;
    std::shared_ptr<PoolManager> pool;
    std::shared_ptr<RateLimiter> limiter;
    std::shared_ptr<SessionRegistry> sessions;
    std::shared_ptr<Gateway> gateway;
};

ErrorCode code_of(const GatewayResponse& resp) {
    return resp.error ? resp.error->code : ErrorCode::NONE;
}

} // namespace

TEST_CASE("Gateway: initialize opens a session on the echo backend", "[gateway]") {
    GatewayFixture f;
    auto resp = f.init("echo");

    REQUIRE(resp.ok());
    CHECK(resp.status == 200);
    CHECK_FALSE(resp.session_id.empty());

    const auto body = json::parse(resp.body);
    CHECK(body["id"] == 1);
    CHECK(body["result"]["serverInfo"]["name"] == "echo");
    CHECK(body["result"]["protocolVersion"] == "2025-03-26");

    CHECK(f.sessions->size() == 1);
    CHECK(f.pool->total_active() == 1);
    CHECK(f.gateway->get_stats().sessions_initialized == 1);
}

TEST_CASE("Gateway: continuing calls route to the bound session", "[gateway]") {
    GatewayFixture f;
    const auto session_id = f.init("echo").session_id;
    REQUIRE_FALSE(session_id.empty());

    auto resp = f.call("echo", session_id,
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})");
    REQUIRE(resp.ok());
    CHECK(resp.session_id == session_id);
    const auto body = json::parse(resp.body);
    CHECK(body["result"]["content"][0]["text"] == "hi");
    CHECK(body["result"]["_meta"]["user"] == "alice");

    // Notifications produce no body
    auto note = f.call("echo", session_id, R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(note.ok());
    CHECK(note.status == 202);
    CHECK(note.body.empty());

    // Mid-session calls keep the same connection checked out
    CHECK(f.pool->total_active() == 1);
    CHECK(f.sessions->peek(session_id)->call_count() == 3);
}

TEST_CASE("Gateway: request classification", "[gateway]") {
    GatewayFixture f;

    SECTION("unparseable body") {
        auto resp = f.call("echo", "", "{not json");
        CHECK(code_of(resp) == ErrorCode::BAD_REQUEST);
        CHECK(resp.status == 400);
    }

    SECTION("no session and not an initialize request") {
        auto resp = f.call("echo", "", R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
        CHECK(code_of(resp) == ErrorCode::BAD_REQUEST);
    }

    SECTION("unknown session") {
        auto resp = f.call("echo", "no-such-session", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
        CHECK(code_of(resp) == ErrorCode::INVALID_SESSION);
        CHECK(f.sessions->get_stats().invalid_lookups == 1);
    }

    SECTION("initialize without a user id") {
        auto resp = f.init("echo", "", "alice-key");
        CHECK(code_of(resp) == ErrorCode::AUTH_INVALID);
        CHECK(resp.status == 401);
    }

    SECTION("unknown backend") {
        auto resp = f.init("nope");
        CHECK(code_of(resp) == ErrorCode::BACKEND_NOT_FOUND);
        CHECK(resp.status == 404);
    }

    SECTION("backend that failed to initialize") {
        auto resp = f.init("broken");
        CHECK(code_of(resp) == ErrorCode::BACKEND_CRASHED);
        CHECK(resp.status == 503);
    }

    CHECK(f.sessions->size() == 0);
    CHECK(f.pool->total_active() == 0);
}

TEST_CASE("Gateway: session bound to another backend is rejected but kept", "[gateway]") {
    GatewayFixture f;
    const auto session_id = f.init("echo").session_id;

    auto resp = f.call("mock", session_id, R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    CHECK(code_of(resp) == ErrorCode::INVALID_SESSION);
    CHECK(f.sessions->size() == 1);

    auto again = f.call("echo", session_id, R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
    CHECK(again.ok());
}

TEST_CASE("Gateway: authentication failures open nothing", "[gateway][auth]") {
    GatewayFixture f;

    SECTION("wrong service secret") {
        CHECK(code_of(f.init("echo", "alice", "alice-key", "wrong")) == ErrorCode::AUTH_INVALID);
    }
    SECTION("wrong api key") {
        CHECK(code_of(f.init("echo", "alice", "bad-key")) == ErrorCode::AUTH_INVALID);
    }
    SECTION("user not permitted on backend") {
        CHECK(code_of(f.init("mock", "bob", "bob-key")) == ErrorCode::AUTH_INVALID);
        CHECK(f.init("echo", "bob", "bob-key").ok());
    }

    CHECK(f.mock->created().empty());
    CHECK(f.gateway->get_stats().rejected >= 1);
}

TEST_CASE("Gateway: per-user quota rejects the second call in the window", "[gateway][ratelimit]") {
    auto limits = GatewayFixture::generous_limits();
    limits.per_user_limit = 1;
    limits.per_user_window = std::chrono::milliseconds(60000);
    GatewayFixture f(limits);

    REQUIRE(f.init("echo").ok());

    // Different backend, plenty of bucket and window capacity: still the user gate
    auto resp = f.init("mock");
    REQUIRE(code_of(resp) == ErrorCode::USER_RATE_LIMITED);
    CHECK(resp.status == 429);
    REQUIRE(resp.error->retry_after);
    CHECK(resp.error->retry_after->count() >= 1);

    CHECK(f.sessions->size() == 1);
    CHECK(f.mock->created().empty());
    CHECK(f.gateway->get_stats().rate_limited == 1);

    // Another user is unaffected
    CHECK(f.init("echo", "bob", "bob-key").ok());
}

TEST_CASE("Gateway: backend-level limits report RATE_LIMITED", "[gateway][ratelimit]") {
    auto limits = GatewayFixture::generous_limits();
    limits.per_backend_limit = 1;
    GatewayFixture f(limits);

    REQUIRE(f.init("echo").ok());
    auto resp = f.init("echo", "bob", "bob-key");
    CHECK(code_of(resp) == ErrorCode::RATE_LIMITED);
    CHECK(resp.status == 429);
}

TEST_CASE("Gateway: DELETE ends the session and frees the connection", "[gateway]") {
    GatewayFixture f;
    const auto session_id = f.init("mock").session_id;
    REQUIRE(f.pool->total_active() == 1);

    auto resp = f.remove("mock", session_id);
    CHECK(resp.ok());
    CHECK(resp.status == 204);
    CHECK(f.sessions->size() == 0);
    CHECK(f.pool->total_active() == 0);

    CHECK(code_of(f.remove("mock", session_id)) == ErrorCode::INVALID_SESSION);
    CHECK(code_of(f.call("mock", session_id, R"({"jsonrpc":"2.0","id":5,"method":"ping"})"))
          == ErrorCode::INVALID_SESSION);
    CHECK(code_of(f.remove("mock", "")) == ErrorCode::BAD_REQUEST);
}

TEST_CASE("Gateway: DELETE during a running call waits, then hands back a clean connection", "[gateway][concurrency]") {
    GatewayFixture f;
    const auto first = f.init("mock");
    REQUIRE(first.ok());
    REQUIRE(f.mock->created().size() == 1);
    const auto transport = f.mock->created()[0];
    transport->hold_sends();

    auto call = std::async(std::launch::async, [&f, &first]() {
        return f.call("mock", first.session_id, R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    });
    transport->wait_for_send();

    auto deleted = std::async(std::launch::async, [&f, &first]() {
        return f.remove("mock", first.session_id);
    });
    CHECK(deleted.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    CHECK(f.pool->total_active() == 1);

    transport->release_sends();
    CHECK(call.get().ok());
    CHECK(deleted.get().status == 204);
    CHECK(f.pool->total_active() == 0);

    // Same pooled transport, none of the first conversation
    const auto second = f.init("mock");
    REQUIRE(second.ok());
    CHECK(f.mock->created().size() == 1);
    CHECK(transport->reset_count() == 1);
    REQUIRE(transport->conversation().size() == 1);
    CHECK(transport->conversation()[0] == kInitBody);
}

TEST_CASE("Gateway: backend close ends the session after delivering the reply", "[gateway]") {
    GatewayFixture f;
    const auto session_id = f.init("mock").session_id;
    REQUIRE(f.mock->created().size() == 1);
    f.mock->created()[0]->set_close_after_send(true);

    auto resp = f.call("mock", session_id, R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    CHECK(resp.ok());
    CHECK_FALSE(resp.body.empty());
    CHECK(resp.session_id.empty());

    CHECK(f.sessions->size() == 0);
    CHECK(f.sessions->get_stats().sessions_closed_by_backend == 1);
    CHECK(f.pool->total_active() == 0);

    CHECK(code_of(f.call("mock", session_id, R"({"jsonrpc":"2.0","id":3,"method":"ping"})"))
          == ErrorCode::INVALID_SESSION);
}

TEST_CASE("Gateway: a failed initialize releases its connection", "[gateway]") {
    GatewayFixture f;
    f.mock->set_fail_sends(true);

    auto resp = f.init("mock");
    CHECK(code_of(resp) == ErrorCode::BACKEND_ERROR);
    CHECK(resp.status == 502);
    CHECK(f.sessions->size() == 0);
    CHECK(f.pool->total_active() == 0);
    CHECK(f.pool->user_outstanding("alice") == 0);
    CHECK(f.gateway->get_stats().backend_errors == 1);

    const auto infos = f.backends->list();
    const auto it = std::find_if(infos.begin(), infos.end(),
                                 [](const BackendInfo& i) { return i.name == "mock"; });
    REQUIRE(it != infos.end());
    CHECK(it->error_count == 1);
}

TEST_CASE("Gateway: repeated backend failures open the circuit", "[gateway][circuit]") {
    auto pool_cfg = GatewayFixture::small_pool();
    pool_cfg.circuit_breaker_threshold = 2;
    GatewayFixture f(GatewayFixture::generous_limits(), pool_cfg);
    f.mock->set_fail_sends(true);

    CHECK(code_of(f.init("mock")) == ErrorCode::BACKEND_ERROR);
    CHECK(code_of(f.init("mock")) == ErrorCode::BACKEND_ERROR);

    auto resp = f.init("mock");
    CHECK(code_of(resp) == ErrorCode::CIRCUIT_OPEN);
    CHECK(resp.status == 503);
    REQUIRE(resp.error->retry_after);
    CHECK(f.sessions->size() == 0);

    // Other backends are unaffected
    CHECK(f.init("echo").ok());
}

TEST_CASE("Gateway: a full pool with no queue rejects immediately", "[gateway][pool]") {
    GatewayFixture f;
    REQUIRE(f.init("mock").ok());
    REQUIRE(f.init("mock").ok());

    auto resp = f.init("mock");
    CHECK(code_of(resp) == ErrorCode::QUEUE_FULL);
    CHECK(resp.status == 503);
    CHECK(f.sessions->size() == 2);
}

TEST_CASE("Gateway: helpers", "[gateway]") {
    CHECK(Gateway::rate_limit_key("alice", "tools") == "alice-tools");
    CHECK(Gateway::is_initialize_request(kInitBody));
    CHECK_FALSE(Gateway::is_initialize_request(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
    CHECK_FALSE(Gateway::is_initialize_request("[1,2]"));
    CHECK_FALSE(Gateway::is_initialize_request("garbage"));
}
