/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Cache Key Implementation - XXH3 128-bit request hashing
 */

#include "cache/cache_key.hpp"

#include <spdlog/fmt/fmt.h>
#include <xxhash.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace llmgate::cache {

std::string CacheKey::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << high
        << std::setw(16) << low;
    return oss.str();
}

CacheKey generate_cache_key(std::string_view prompt, std::uint32_t max_tokens, double temperature) {
    // fmt's default double formatting is the shortest round-trip form
    auto tokens = fmt::format("{}", max_tokens);
    auto temp = fmt::format("{}", temperature);

    std::unique_ptr<XXH3_state_t, decltype(&XXH3_freeState)> state(
        XXH3_createState(), &XXH3_freeState);
    if (!state) {
        throw std::bad_alloc();
    }
    XXH3_128bits_reset(state.get());

    XXH3_128bits_update(state.get(), prompt.data(), prompt.size());
    XXH3_128bits_update(state.get(), ":", 1);
    XXH3_128bits_update(state.get(), tokens.data(), tokens.size());
    XXH3_128bits_update(state.get(), ":", 1);
    XXH3_128bits_update(state.get(), temp.data(), temp.size());

    XXH128_hash_t digest = XXH3_128bits_digest(state.get());

    CacheKey key;
    key.high = digest.high64;
    key.low = digest.low64;
    return key;
}

CacheKey generate_cache_key(const Request& request) {
    return generate_cache_key(request.prompt, request.max_tokens, request.temperature);
}

} // namespace llmgate::cache
