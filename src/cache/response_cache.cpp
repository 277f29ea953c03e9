/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Response Cache Implementation
 */

#include "cache/response_cache.hpp"
#include "util/logger.hpp"

#include <iterator>
#include <mutex>
#include <stdexcept>

namespace llmgate::cache {

using util::log_component::Cache;

ResponseCache::ResponseCache(const ResponseCacheConfig& config)
    : config_(config) {
    if (config_.capacity == 0) {
        throw std::invalid_argument("ResponseCache capacity must be positive");
    }
    LLMGATE_LOG_DEBUG(Cache, "Response cache initialized: capacity={}", config_.capacity);
}

std::shared_ptr<const Response> ResponseCache::lookup(const CacheKey& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
        ++misses_;
        return nullptr;
    }

    ++hits_;
    return it->second.response;
}

void ResponseCache::insert(const CacheKey& key, Response response) {
    auto shared = std::make_shared<const Response>(std::move(response));

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        it->second.response = std::move(shared);
        LLMGATE_LOG_DEBUG(Cache, "Cache entry replaced: key={}", key.to_string());
        return;
    }

    if (cache_map_.size() >= config_.capacity) {
        evict_oldest();
    }

    insertion_order_.push_back(key);
    cache_map_.emplace(key, Slot{std::move(shared), std::prev(insertion_order_.end())});

    LLMGATE_LOG_TRACE(Cache, "Cache entry added: key={}, entries={}", key.to_string(), cache_map_.size());
}

bool ResponseCache::contains(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_map_.find(key) != cache_map_.end();
}

void ResponseCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t count = cache_map_.size();
    cache_map_.clear();
    insertion_order_.clear();

    LLMGATE_LOG_INFO(Cache, "Cache cleared: {} entries removed", count);
}

std::size_t ResponseCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_map_.size();
}

CacheStats ResponseCache::get_stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.entries = cache_map_.size();
    stats.capacity = config_.capacity;

    return stats;
}

void ResponseCache::evict_oldest() {
    if (insertion_order_.empty()) {
        return;
    }

    const CacheKey oldest = insertion_order_.front();
    LLMGATE_LOG_DEBUG(Cache, "Evicting cache entry: key={}", oldest.to_string());

    cache_map_.erase(oldest);
    insertion_order_.pop_front();
    ++evictions_;
}

} // namespace llmgate::cache
