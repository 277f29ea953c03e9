/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Thread-Safe Response Cache - Caches LLM responses keyed by request fingerprint
 *
 * Features:
 * - Thread-safe with std::shared_mutex (concurrent reads, exclusive writes)
 * - Entry-count bound with oldest-insertion-first eviction
 * - No expiry: entries leave only through eviction or clear()
 * - Cache statistics for monitoring
 */

#ifndef LLMGATE_CACHE_RESPONSE_CACHE_HPP
#define LLMGATE_CACHE_RESPONSE_CACHE_HPP

#include "cache/cache_key.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace llmgate::cache {

/**
 * Cache statistics for monitoring
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};

    std::size_t entries{0};
    std::size_t capacity{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Response cache configuration
 */
struct ResponseCacheConfig {
    std::size_t capacity{1000};  // Maximum number of entries
};

/**
 * Bounded response cache
 *
 * Eviction follows insertion order, not access order: when a new key arrives
 * at capacity the entry inserted longest ago is dropped, however often it has
 * been read. Replacing the value of a resident key keeps its position.
 *
 * Cached responses are immutable and shared between callers.
 */
class ResponseCache {
public:
    explicit ResponseCache(const ResponseCacheConfig& config);
    ~ResponseCache() = default;

    // Non-copyable, non-movable
    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;
    ResponseCache(ResponseCache&&) = delete;
    ResponseCache& operator=(ResponseCache&&) = delete;

    /**
     * Look up a cached response
     *
     * @param key Request fingerprint
     * @return Shared cached response, nullptr when absent
     */
    std::shared_ptr<const Response> lookup(const CacheKey& key);

    /**
     * Store a response; never fails
     *
     * @param key Request fingerprint
     * @param response Response to cache
     */
    void insert(const CacheKey& key, Response response);

    /**
     * Check presence without touching hit/miss statistics
     */
    bool contains(const CacheKey& key) const;

    void clear();

    std::size_t size() const;

    std::size_t capacity() const noexcept { return config_.capacity; }

    CacheStats get_stats() const;

private:
    struct Slot {
        std::shared_ptr<const Response> response;
        std::list<CacheKey>::iterator position;
    };

    using CacheMap = std::unordered_map<CacheKey, Slot, CacheKeyHash>;

    /**
     * Drop the oldest-inserted entry
     * Must be called with exclusive lock held
     */
    void evict_oldest();

    mutable std::shared_mutex mutex_;
    const ResponseCacheConfig config_;

    std::list<CacheKey> insertion_order_;  // Front = oldest, back = newest
    CacheMap cache_map_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> evictions_{0};
};

} // namespace llmgate::cache

#endif // LLMGATE_CACHE_RESPONSE_CACHE_HPP
