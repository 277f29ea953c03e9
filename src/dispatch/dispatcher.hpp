/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Dispatcher - Cache, selection, retry and batching composed into one entry point
 */

#ifndef LLMGATE_DISPATCH_DISPATCHER_HPP
#define LLMGATE_DISPATCH_DISPATCHER_HPP

#include "balancer/provider_pool.hpp"
#include "balancer/provider_registry.hpp"
#include "cache/response_cache.hpp"
#include "config/config.hpp"
#include "core/types.hpp"
#include "dispatch/request_batcher.hpp"
#include "dispatch/retry_governor.hpp"
#include "provider/provider.hpp"
#include "util/metrics.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace llmgate::dispatch {

/**
 * Point-in-time copy of the dispatcher counters
 */
struct DispatcherStats {
    std::uint64_t requests_total{0};
    std::uint64_t cache_hits{0};
    std::uint64_t errors{0};
    std::string cache_hit_rate{"0.00%"};  // hits / max(total, 1) * 100, two decimals
    std::size_t active_providers{0};
    std::size_t cache_size{0};

    nlohmann::json to_json() const;
};

/**
 * Dispatcher
 *
 * generate() flow:
 * 1. Count the request and look up its fingerprint; a hit is returned as is
 * 2. Select a healthy provider, preferred kinds first
 * 3. With pooling enabled, swap in the kind's next pool instance
 * 4. Run the call through the retry governor on the worker pool, or through
 *    the batcher when batching is enabled
 * 5. Stamp latency, cache the response and return it
 *
 * A terminal failure is counted once and rethrown. Failures are never cached.
 *
 * The dispatcher owns its worker pool. generate() blocks the calling thread,
 * so it must not be called from one of the dispatcher's own workers.
 */
class Dispatcher {
public:
    explicit Dispatcher(const config::DispatchSettings& settings = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * Dispatch one request
     *
     * @throws NoHealthyProviderError when nothing registered is healthy
     * @throws ProviderError when every attempt failed
     */
    Response generate(const Request& request);

    void register_provider(ProviderKind kind, std::shared_ptr<provider::Provider> provider);

    /**
     * Add an instance to a kind's pool
     * @return false if the pool is full
     */
    bool add_pool_instance(ProviderKind kind, std::shared_ptr<provider::Provider> provider);

    bool unregister_provider(ProviderKind kind);

    DispatcherStats get_stats() const;

    util::MetricsSnapshot get_metrics() const { return metrics_.snapshot(); }

    const config::DispatchSettings& get_settings() const noexcept { return settings_; }

    // Components, exposed for monitoring and tests
    const cache::ResponseCache& cache() const noexcept { return cache_; }
    const balancer::ProviderRegistry& registry() const noexcept { return registry_; }
    const RetryGovernor& governor() const noexcept { return governor_; }
    const RequestBatcher* batcher() const noexcept { return batcher_.get(); }

private:
    /**
     * Run the call on the worker pool (or via the batcher) and wait for it
     */
    Response execute(const Request& request, balancer::ProviderSelection selection);

    static std::size_t worker_count(const config::DispatchSettings& settings);

    config::DispatchSettings settings_;

    asio::thread_pool pool_;
    cache::ResponseCache cache_;
    balancer::ProviderRegistry registry_;
    balancer::ProviderPool provider_pool_;
    RetryGovernor governor_;
    std::unique_ptr<RequestBatcher> batcher_;  // Present when batching is enabled
    util::Metrics metrics_;

    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> errors_{0};
};

} // namespace llmgate::dispatch

#endif // LLMGATE_DISPATCH_DISPATCHER_HPP
