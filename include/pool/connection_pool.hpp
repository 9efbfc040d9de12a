#pragma once

#include "core/types.hpp"
#include "pool/connection.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpgate {

/**
 * @brief Bounded set of connections for one backend
 *
 * Tracks disjoint idle and active sets plus slots reserved for connections
 * being created or being returned. Invariant: active + idle + reserved <= max_connections.
 *
 * Not thread-safe; the PoolManager's per-backend lock protects it.
 * Connections removed from the pool are returned as "retired" so the
 * caller can close their transports after unlocking.
 */
class ConnectionPool {
public:
    struct Config {
        uint32_t max_connections = 50;
        std::chrono::milliseconds idle_timeout{300000};
    };

    struct ReleaseOutcome {
        bool was_active = false;        // false: unknown or already released (no-op)
        std::string user_id;
        std::string request_id;
        std::chrono::milliseconds latency{0};
    };

    ConnectionPool(std::string backend, const Config& config);

    /**
     * @brief Pop a reusable idle connection and mark it active
     *
     * Invalid idle connections found along the way are moved to `retired`.
     * @return nullptr if no valid idle connection exists
     */
    [[nodiscard]] std::shared_ptr<Connection> take_idle(
        const std::string& request_id,
        const std::string& user_id,
        TimePoint now,
        std::vector<std::shared_ptr<Connection>>& retired);

    /**
     * @brief Reserve a slot for a connection about to be created
     * @return false if the pool is at max_connections
     */
    [[nodiscard]] bool reserve_slot();

    /**
     * @brief Give back a reservation whose creation failed
     */
    void cancel_reservation();

    /**
     * @brief Fill a reservation with a newly created connection (becomes active)
     */
    void commit_created(const std::shared_ptr<Connection>& conn,
                        const std::string& request_id,
                        const std::string& user_id,
                        TimePoint now);

    /**
     * @brief First half of a return: take the connection out of the active set
     *
     * The connection keeps its slot (counted as reserved) until
     * complete_return(), so the caller can reset the transport unlocked.
     * Unknown or already returned connections give was_active == false.
     */
    [[nodiscard]] ReleaseOutcome begin_return(const std::shared_ptr<Connection>& conn,
                                              TimePoint now);

    /**
     * @brief Second half of a return: idle if reusable and still valid, otherwise retired
     * @return true if the connection went back to the idle set
     */
    bool complete_return(const std::shared_ptr<Connection>& conn,
                         TimePoint now,
                         bool reusable,
                         std::vector<std::shared_ptr<Connection>>& retired);

    /**
     * @brief Retire idle connections older than idle_timeout
     * @return Number of connections retired
     */
    size_t reap_idle(TimePoint now, std::vector<std::shared_ptr<Connection>>& retired);

    /**
     * @brief Retire every connection (idle and active)
     */
    [[nodiscard]] std::vector<std::shared_ptr<Connection>> drain();

    [[nodiscard]] bool has_capacity() const {
        return total() < config_.max_connections;
    }

    [[nodiscard]] size_t active_count() const { return active_.size(); }
    [[nodiscard]] size_t idle_count() const { return idle_.size(); }
    [[nodiscard]] size_t reserved_count() const { return reserved_; }
    [[nodiscard]] size_t total() const { return active_.size() + idle_.size() + reserved_; }
    [[nodiscard]] uint32_t max_connections() const { return config_.max_connections; }
    [[nodiscard]] const std::string& backend() const { return backend_; }

    [[nodiscard]] uint64_t connections_created() const { return connections_created_; }
    [[nodiscard]] uint64_t connections_discarded() const { return connections_discarded_; }

private:
    void retire(const std::shared_ptr<Connection>& conn,
                std::vector<std::shared_ptr<Connection>>& retired);

    std::string backend_;
    Config config_;

    std::deque<std::shared_ptr<Connection>> idle_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> active_;
    size_t reserved_ = 0;

    uint64_t connections_created_ = 0;
    uint64_t connections_discarded_ = 0;
};

} // namespace mcpgate
