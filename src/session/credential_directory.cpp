#include "session/credential_directory.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace mcpgate {

bool CredentialRecord::allows(const std::string& backend) const {
    return allowed_backends.empty() ||
           std::find(allowed_backends.begin(), allowed_backends.end(), backend) !=
               allowed_backends.end();
}

std::string sha256_hex(std::string_view input) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

// ============================================================================
// StaticCredentialDirectory
// ============================================================================

void StaticCredentialDirectory::add_user(const std::string& user_id,
                                         const std::string& api_key,
                                         std::vector<std::string> allowed_backends) {
    add_user_hashed(user_id, sha256_hex(api_key), std::move(allowed_backends));
}

void StaticCredentialDirectory::add_user_hashed(const std::string& user_id,
                                                const std::string& api_key_sha256,
                                                std::vector<std::string> allowed_backends) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_.insert_or_assign(user_id, Entry{utils::to_lower(api_key_sha256),
                                           std::move(allowed_backends)});
}

std::optional<CredentialRecord> StaticCredentialDirectory::lookup(const std::string& user_id,
                                                                  const std::string& api_key) {
    if (user_id.empty() || api_key.empty()) {
        return std::nullopt;
    }

    const std::string digest = sha256_hex(api_key);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }

    const auto& expected = it->second.key_digest;
    if (expected.size() != digest.size() ||
        CRYPTO_memcmp(expected.data(), digest.data(), digest.size()) != 0) {
        return std::nullopt;
    }
    return CredentialRecord{user_id, it->second.allowed_backends};
}

size_t StaticCredentialDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

// ============================================================================
// CachingCredentialDirectory
// ============================================================================

CachingCredentialDirectory::CachingCredentialDirectory(std::shared_ptr<ICredentialDirectory> inner,
                                                       std::chrono::milliseconds ttl,
                                                       std::shared_ptr<IClock> clock)
    : inner_(std::move(inner)),
      ttl_(ttl),
      clock_(std::move(clock)) {}

std::optional<CredentialRecord> CachingCredentialDirectory::lookup(const std::string& user_id,
                                                                   const std::string& api_key) {
    const std::string cache_key = std::format("{}\n{}", user_id, sha256_hex(api_key));
    const TimePoint now = clock_->now();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = cache_.find(cache_key);
        if (it != cache_.end()) {
            if (now - it->second.cached_at < ttl_) {
                hits_.fetch_add(1, std::memory_order_relaxed);
                return it->second.result;
            }
            cache_.erase(it);
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    auto result = inner_->lookup(user_id, api_key);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.insert_or_assign(cache_key, CacheEntry{result, now});
    }
    return result;
}

void CachingCredentialDirectory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

CachingCredentialDirectory::Stats CachingCredentialDirectory::get_stats() const {
    Stats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    stats.entries = cache_.size();
    return stats;
}

} // namespace mcpgate
