/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Provider Pool - Round-robin distribution across instances of one kind
 */

#ifndef LLMGATE_BALANCER_PROVIDER_POOL_HPP
#define LLMGATE_BALANCER_PROVIDER_POOL_HPP

#include "core/types.hpp"
#include "provider/provider.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace llmgate::balancer {

/**
 * Provider pool configuration
 */
struct ProviderPoolConfig {
    std::size_t max_pool_size{10};  // Max instances per kind
};

/**
 * Provider Pool
 *
 * Holds up to max_pool_size instances per kind and hands them out in
 * round-robin order. The per-kind cursor advances on every get() and wraps
 * modulo the current pool length.
 *
 * The pool performs no health checks; health-aware selection stays with
 * ProviderRegistry.
 */
class ProviderPool {
public:
    explicit ProviderPool(const ProviderPoolConfig& config = {});

    ProviderPool(const ProviderPool&) = delete;
    ProviderPool& operator=(const ProviderPool&) = delete;

    /**
     * Append an instance to a kind's pool
     * @return false if the pool is full and the instance was dropped
     */
    bool add(ProviderKind kind, std::shared_ptr<provider::Provider> provider);

    /**
     * Next instance for a kind in round-robin order
     * @return nullptr if the kind has no instances
     */
    std::shared_ptr<provider::Provider> get(ProviderKind kind);

    std::size_t size(ProviderKind kind) const;

    std::size_t max_pool_size() const noexcept { return config_.max_pool_size; }

private:
    struct KindPool {
        std::vector<std::shared_ptr<provider::Provider>> instances;
        std::uint64_t cursor{0};
    };

    ProviderPoolConfig config_;

    mutable std::mutex mutex_;  // Protects pools_
    std::map<ProviderKind, KindPool> pools_;
};

} // namespace llmgate::balancer

#endif // LLMGATE_BALANCER_PROVIDER_POOL_HPP
