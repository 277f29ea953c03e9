/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Provider Registry - Health-aware provider selection with failover
 */

#ifndef LLMGATE_BALANCER_PROVIDER_REGISTRY_HPP
#define LLMGATE_BALANCER_PROVIDER_REGISTRY_HPP

#include "core/types.hpp"
#include "provider/provider.hpp"

#include <memory>
#include <shared_mutex>
#include <vector>

namespace llmgate::balancer {

/**
 * Result of provider selection
 */
struct ProviderSelection {
    ProviderKind kind;
    std::shared_ptr<provider::Provider> provider;
};

/**
 * Provider Registry
 *
 * Features:
 * - One active instance per provider kind, kept in registration order
 * - Preference-ordered selection, falling back to registration order
 * - Health is probed on every selection and never cached
 * - Thread-safe: registration may interleave with selection
 *
 * Health probes run on a snapshot of the table, outside the lock.
 */
class ProviderRegistry {
public:
    ProviderRegistry();
    ~ProviderRegistry();

    // Non-copyable
    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /**
     * Store (or replace) the instance for a kind and probe its health
     *
     * A failed probe is logged but does not prevent registration.
     * Replacing an instance keeps the kind's registration position.
     *
     * @throws ConfigurationError if provider is null
     */
    void register_provider(ProviderKind kind, std::shared_ptr<provider::Provider> provider);

    /**
     * Remove a kind from the registry
     * @return true if the kind was registered
     */
    bool unregister_provider(ProviderKind kind);

    /**
     * Select a healthy provider
     *
     * @param preferences Kinds to try first, in order (may be empty)
     * @return First healthy preferred provider, else first healthy in registration order
     * @throws NoHealthyProviderError when no registered provider is healthy
     */
    ProviderSelection select(const std::vector<ProviderKind>& preferences) const;

    /**
     * Get the registered instance for a kind (nullptr if none)
     */
    std::shared_ptr<provider::Provider> get(ProviderKind kind) const;

    bool contains(ProviderKind kind) const;

    std::size_t size() const;

    /**
     * Registered kinds in registration order
     */
    std::vector<ProviderKind> kinds() const;

private:
    using Entry = std::pair<ProviderKind, std::shared_ptr<provider::Provider>>;

    std::vector<Entry> snapshot() const;

    mutable std::shared_mutex mutex_;  // Protects providers_
    std::vector<Entry> providers_;
};

} // namespace llmgate::balancer

#endif // LLMGATE_BALANCER_PROVIDER_REGISTRY_HPP
