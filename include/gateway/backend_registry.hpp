#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "gateway/ibackend.hpp"
#include "pool/itransport_factory.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpgate {

/**
 * @brief Status snapshot of one registered backend
 */
struct BackendInfo {
    std::string name;
    std::string type;
    BackendStatus status = BackendStatus::HEALTHY;
    std::string crash_reason;
    uint64_t request_count = 0;
    uint64_t error_count = 0;
    std::chrono::system_clock::time_point registered_at;
    std::optional<std::chrono::system_clock::time_point> last_activity;
    std::optional<std::chrono::system_clock::time_point> crashed_at;
    std::chrono::milliseconds init_duration{0};
};

/**
 * @brief Registry of configured backends and their health
 *
 * A backend whose initialize() throws is kept but marked CRASHED; resolving
 * it fails with BACKEND_CRASHED rather than BACKEND_NOT_FOUND. Also serves
 * as the pool manager's transport factory.
 *
 * Thread-safety: registration happens at startup; everything else is
 * thread-safe.
 */
class BackendRegistry : public ITransportFactory {
public:
    /**
     * @brief Register a backend
     * @throws std::invalid_argument on an empty or duplicate name
     */
    void add(std::shared_ptr<IBackend> backend);

    /**
     * @brief Initialize every backend; failures mark the backend CRASHED
     * @return Number of healthy backends
     */
    size_t initialize_all();

    /**
     * @brief Resolve a backend for a request
     */
    [[nodiscard]] Result<std::shared_ptr<IBackend>> resolve(const std::string& name) const;

    /**
     * @throws std::runtime_error if the backend is unknown or crashed
     */
    [[nodiscard]] std::shared_ptr<IBackendTransport> create_transport(
        const std::string& backend) override;

    void mark_crashed(const std::string& name, const std::string& reason);

    /**
     * @brief Count one completed request (and an error when !success)
     */
    void record_request(const std::string& name, bool success);

    [[nodiscard]] std::vector<BackendInfo> list() const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] size_t healthy_count() const;
    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::shared_ptr<IBackend> backend;

        mutable std::mutex mutex;       // status fields below
        BackendStatus status = BackendStatus::HEALTHY;
        std::string crash_reason;
        std::chrono::system_clock::time_point registered_at;
        std::optional<std::chrono::system_clock::time_point> last_activity;
        std::optional<std::chrono::system_clock::time_point> crashed_at;
        std::chrono::milliseconds init_duration{0};

        std::atomic<uint64_t> request_count{0};
        std::atomic<uint64_t> error_count{0};
    };

    [[nodiscard]] std::shared_ptr<Entry> find(const std::string& name) const;

    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::vector<std::string> order_;                // Registration order for listing
    mutable std::shared_mutex mutex_;
};

} // namespace mcpgate
