/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Cache Key - XXHash-based request fingerprints
 *
 * Creates cache keys from the request fields that affect the response:
 * - Prompt text
 * - Maximum tokens to generate
 * - Sampling temperature
 *
 * Provider preferences and metadata are deliberately not part of the key.
 */

#ifndef LLMGATE_CACHE_CACHE_KEY_HPP
#define LLMGATE_CACHE_CACHE_KEY_HPP

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace llmgate::cache {

/**
 * Cache key - 128-bit hash of the cacheable request fields
 */
struct CacheKey {
    std::uint64_t high{0};
    std::uint64_t low{0};

    bool operator==(const CacheKey& other) const {
        return high == other.high && low == other.low;
    }

    bool operator<(const CacheKey& other) const {
        return high != other.high ? high < other.high : low < other.low;
    }

    /**
     * Convert to 32-digit hex string for logging/debugging
     */
    std::string to_string() const;
};

/**
 * Hash functor for use with std::unordered_map
 */
struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept {
        return static_cast<std::size_t>(key.low ^ (key.high * 0x9E3779B97F4A7C15ULL));
    }
};

/**
 * Generate a cache key from the raw fields
 *
 * The fields are joined as "prompt:max_tokens:temperature" before hashing.
 * Temperature uses its shortest round-trip decimal form.
 */
CacheKey generate_cache_key(std::string_view prompt, std::uint32_t max_tokens, double temperature);

/**
 * Generate a cache key for a request
 */
CacheKey generate_cache_key(const Request& request);

} // namespace llmgate::cache

#endif // LLMGATE_CACHE_CACHE_KEY_HPP
