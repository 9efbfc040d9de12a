#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcpgate {

/**
 * @brief Resolved per-user credential bound to a session
 */
struct CredentialRecord {
    std::string user_id;
    std::vector<std::string> allowed_backends;     // Empty = every backend

    [[nodiscard]] bool allows(const std::string& backend) const;
};

/**
 * @brief Lookup of a user's API key against the user directory
 */
class ICredentialDirectory {
public:
    virtual ~ICredentialDirectory() = default;

    /**
     * @return The credential when (user_id, api_key) is valid, nullopt otherwise
     */
    [[nodiscard]] virtual std::optional<CredentialRecord> lookup(const std::string& user_id,
                                                                 const std::string& api_key) = 0;
};

/// Lowercase hex SHA-256 digest
[[nodiscard]] std::string sha256_hex(std::string_view input);

/**
 * @brief Directory built from configured users; stores only key digests
 */
class StaticCredentialDirectory : public ICredentialDirectory {
public:
    /**
     * @brief Register a user with a plaintext key (hashed on insert)
     */
    void add_user(const std::string& user_id,
                  const std::string& api_key,
                  std::vector<std::string> allowed_backends = {});

    /**
     * @brief Register a user with a precomputed SHA-256 hex digest
     */
    void add_user_hashed(const std::string& user_id,
                         const std::string& api_key_sha256,
                         std::vector<std::string> allowed_backends = {});

    [[nodiscard]] std::optional<CredentialRecord> lookup(const std::string& user_id,
                                                         const std::string& api_key) override;

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::string key_digest;
        std::vector<std::string> allowed_backends;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> users_;
};

/**
 * @brief TTL cache in front of a slower directory
 *
 * Both valid and invalid lookups are cached for `ttl`. Entries are keyed by
 * user id and key digest; plaintext keys are never retained.
 */
class CachingCredentialDirectory : public ICredentialDirectory {
public:
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        size_t entries = 0;
    };

    CachingCredentialDirectory(std::shared_ptr<ICredentialDirectory> inner,
                               std::chrono::milliseconds ttl,
                               std::shared_ptr<IClock> clock);

    [[nodiscard]] std::optional<CredentialRecord> lookup(const std::string& user_id,
                                                         const std::string& api_key) override;

    void clear();

    [[nodiscard]] Stats get_stats() const;

private:
    struct CacheEntry {
        std::optional<CredentialRecord> result;
        TimePoint cached_at;
    };

    std::shared_ptr<ICredentialDirectory> inner_;
    std::chrono::milliseconds ttl_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace mcpgate
