#include <catch2/catch_test_macros.hpp>
#include "pool/connection_pool.hpp"
#include "pool/wait_queue.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/mock_transport.hpp"

using namespace mcpgate;
using mcpgate::testing::ManualClock;
using mcpgate::testing::MockTransport;

namespace {

std::shared_ptr<Connection> make_conn(const std::string& id, TimePoint now,
                                      std::shared_ptr<MockTransport> transport = nullptr) {
    if (!transport) {
        transport = std::make_shared<MockTransport>();
    }
    return std::make_shared<Connection>(id, "s1", std::move(transport), now);
}

/// Both halves of a return with nothing between them
ConnectionPool::ReleaseOutcome give_back(ConnectionPool& pool,
                                         const std::shared_ptr<Connection>& conn,
                                         TimePoint now,
                                         std::vector<std::shared_ptr<Connection>>& retired,
                                         bool* idle = nullptr) {
    auto outcome = pool.begin_return(conn, now);
    if (outcome.was_active) {
        const bool parked = pool.complete_return(conn, now, true, retired);
        if (idle) {
            *idle = parked;
        }
    }
    return outcome;
}

QueuedRequest make_request(uint64_t ticket, const std::string& request_id, TimePoint at) {
    QueuedRequest r;
    r.ticket = ticket;
    r.request_id = request_id;
    r.user_id = "u1";
    r.enqueued_at = at;
    return r;
}

} // namespace

// ============================================================================
// Connection
// ============================================================================

TEST_CASE("Connection: validity follows state, idle age, and transport", "[pool][connection]") {
    ManualClock clock;
    auto transport = std::make_shared<MockTransport>();
    auto conn = make_conn("c1", clock.now(), transport);
    const auto idle_timeout = std::chrono::milliseconds(1000);

    CHECK(conn->is_valid(clock.now(), idle_timeout));
    CHECK_FALSE(conn->is_valid(clock.now() + idle_timeout, idle_timeout));

    conn->mark_active("r1", "u1", clock.now());
    CHECK(conn->is_active());
    // Held connections do not age out
    CHECK(conn->is_valid(clock.now() + std::chrono::hours(1), idle_timeout));

    transport->set_open(false);
    CHECK_FALSE(conn->is_valid(clock.now(), idle_timeout));
}

TEST_CASE("Connection: discarded is terminal", "[pool][connection]") {
    ManualClock clock;
    auto conn = make_conn("c1", clock.now());

    conn->mark_discarded();
    conn->mark_idle(clock.now());
    conn->mark_active("r1", "u1", clock.now());

    CHECK(conn->is_discarded());
    CHECK_FALSE(conn->is_valid(clock.now(), std::chrono::milliseconds(1000)));
}

TEST_CASE("Connection: close failure is swallowed", "[pool][connection]") {
    ManualClock clock;
    auto transport = std::make_shared<MockTransport>();
    transport->set_throw_on_close(true);
    auto conn = make_conn("c1", clock.now(), transport);

    conn->close_transport();
    CHECK(transport->close_count() == 1);
}

// ============================================================================
// ConnectionPool
// ============================================================================

TEST_CASE("ConnectionPool: reservations count against max_connections", "[pool]") {
    ManualClock clock;
    ConnectionPool pool("s1", {2, std::chrono::milliseconds(1000)});

    REQUIRE(pool.reserve_slot());
    REQUIRE(pool.reserve_slot());
    CHECK_FALSE(pool.reserve_slot());
    CHECK(pool.total() == 2);

    pool.commit_created(make_conn("c1", clock.now()), "r1", "u1", clock.now());
    pool.cancel_reservation();

    CHECK(pool.active_count() == 1);
    CHECK(pool.reserved_count() == 0);
    CHECK(pool.has_capacity());
}

TEST_CASE("ConnectionPool: release returns to idle and reuse is FIFO", "[pool]") {
    ManualClock clock;
    ConnectionPool pool("s1", {4, std::chrono::milliseconds(1000)});
    std::vector<std::shared_ptr<Connection>> retired;

    auto c1 = make_conn("c1", clock.now());
    auto c2 = make_conn("c2", clock.now());
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c1, "r1", "u1", clock.now());
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c2, "r2", "u2", clock.now());

    clock.advance(std::chrono::milliseconds(40));
    bool parked = false;
    auto outcome = give_back(pool, c1, clock.now(), retired, &parked);
    CHECK(outcome.was_active);
    CHECK(parked);
    CHECK(outcome.user_id == "u1");
    CHECK(outcome.latency == std::chrono::milliseconds(40));
    (void)give_back(pool, c2, clock.now(), retired);

    CHECK(pool.idle_count() == 2);
    CHECK(pool.active_count() == 0);

    auto reused = pool.take_idle("r3", "u3", clock.now(), retired);
    REQUIRE(reused);
    CHECK(reused->id() == "c1");
    CHECK(retired.empty());
}

TEST_CASE("ConnectionPool: double release is a no-op", "[pool]") {
    ManualClock clock;
    ConnectionPool pool("s1", {2, std::chrono::milliseconds(1000)});
    std::vector<std::shared_ptr<Connection>> retired;

    auto c1 = make_conn("c1", clock.now());
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c1, "r1", "u1", clock.now());

    CHECK(give_back(pool, c1, clock.now(), retired).was_active);
    CHECK_FALSE(give_back(pool, c1, clock.now(), retired).was_active);
    CHECK(pool.idle_count() == 1);
}

TEST_CASE("ConnectionPool: stale idle connections are never reused", "[pool]") {
    ManualClock clock;
    ConnectionPool pool("s1", {2, std::chrono::milliseconds(1000)});
    std::vector<std::shared_ptr<Connection>> retired;

    auto c1 = make_conn("c1", clock.now());
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c1, "r1", "u1", clock.now());
    (void)give_back(pool, c1, clock.now(), retired);

    clock.advance(std::chrono::milliseconds(1000));
    auto conn = pool.take_idle("r2", "u1", clock.now(), retired);

    CHECK(conn == nullptr);
    REQUIRE(retired.size() == 1);
    CHECK(retired[0]->is_discarded());
    CHECK(pool.total() == 0);
}

TEST_CASE("ConnectionPool: released connection with dead transport is retired", "[pool]") {
    ManualClock clock;
    ConnectionPool pool("s1", {2, std::chrono::milliseconds(1000)});
    std::vector<std::shared_ptr<Connection>> retired;

    auto transport = std::make_shared<MockTransport>();
    auto c1 = make_conn("c1", clock.now(), transport);
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c1, "r1", "u1", clock.now());

    transport->set_open(false);
    bool parked = true;
    auto outcome = give_back(pool, c1, clock.now(), retired, &parked);

    CHECK(outcome.was_active);
    CHECK_FALSE(parked);
    CHECK(retired.size() == 1);
    CHECK(pool.idle_count() == 0);
}

TEST_CASE("ConnectionPool: reap_idle only removes expired entries", "[pool]") {
    ManualClock clock;
    ConnectionPool pool("s1", {3, std::chrono::milliseconds(1000)});
    std::vector<std::shared_ptr<Connection>> retired;

    auto c1 = make_conn("c1", clock.now());
    auto c2 = make_conn("c2", clock.now());
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c1, "r1", "u1", clock.now());
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c2, "r2", "u1", clock.now());

    (void)give_back(pool, c1, clock.now(), retired);
    clock.advance(std::chrono::milliseconds(600));
    (void)give_back(pool, c2, clock.now(), retired);
    clock.advance(std::chrono::milliseconds(600));

    CHECK(pool.reap_idle(clock.now(), retired) == 1);
    CHECK(pool.idle_count() == 1);
    CHECK(retired.size() == 1);
    CHECK(retired[0]->id() == "c1");
}

TEST_CASE("ConnectionPool: a returning connection keeps its slot", "[pool]") {
    ManualClock clock;
    ConnectionPool pool("s1", {1, std::chrono::milliseconds(1000)});
    std::vector<std::shared_ptr<Connection>> retired;

    auto c1 = make_conn("c1", clock.now());
    REQUIRE(pool.reserve_slot());
    pool.commit_created(c1, "r1", "u1", clock.now());

    REQUIRE(pool.begin_return(c1, clock.now()).was_active);
    CHECK(pool.active_count() == 0);
    CHECK(pool.idle_count() == 0);
    CHECK_FALSE(pool.has_capacity());
    CHECK_FALSE(pool.reserve_slot());

    SECTION("reusable goes idle") {
        CHECK(pool.complete_return(c1, clock.now(), true, retired));
        CHECK(pool.idle_count() == 1);
        CHECK(pool.reserved_count() == 0);
    }

    SECTION("not reusable is retired and frees the slot") {
        CHECK_FALSE(pool.complete_return(c1, clock.now(), false, retired));
        REQUIRE(retired.size() == 1);
        CHECK(c1->is_discarded());
        CHECK(pool.total() == 0);
    }
}

// ============================================================================
// BoundedWaitQueue
// ============================================================================

TEST_CASE("BoundedWaitQueue: FIFO and bounded", "[pool][queue]") {
    ManualClock clock;
    BoundedWaitQueue queue(2);

    CHECK(queue.push(make_request(1, "r1", clock.now())));
    CHECK(queue.push(make_request(2, "r2", clock.now())));
    CHECK_FALSE(queue.push(make_request(3, "r3", clock.now())));
    CHECK(queue.size() == 2);

    CHECK(queue.front().request_id == "r1");
    CHECK(queue.pop_front()->request_id == "r1");
    CHECK(queue.pop_front()->request_id == "r2");
    CHECK_FALSE(queue.pop_front().has_value());
}

TEST_CASE("BoundedWaitQueue: zero capacity rejects everything", "[pool][queue]") {
    ManualClock clock;
    BoundedWaitQueue queue(0);
    CHECK_FALSE(queue.push(make_request(1, "r1", clock.now())));
    CHECK(queue.empty());
}

TEST_CASE("BoundedWaitQueue: remove by ticket and expiry", "[pool][queue]") {
    ManualClock clock;
    BoundedWaitQueue queue(10);

    REQUIRE(queue.push(make_request(1, "r1", clock.now())));
    clock.advance(std::chrono::milliseconds(500));
    REQUIRE(queue.push(make_request(2, "r2", clock.now())));
    REQUIRE(queue.push(make_request(3, "r3", clock.now())));

    auto removed = queue.remove(2);
    REQUIRE(removed.has_value());
    CHECK(removed->request_id == "r2");
    CHECK_FALSE(queue.remove(2).has_value());

    clock.advance(std::chrono::milliseconds(500));
    auto expired = queue.remove_expired(clock.now(), std::chrono::milliseconds(1000));
    REQUIRE(expired.size() == 1);
    CHECK(expired[0].request_id == "r1");
    CHECK(queue.size() == 1);

    auto rest = queue.drain();
    CHECK(rest.size() == 1);
    CHECK(queue.empty());
}
