/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Metrics - Thread-safe statistics collection for monitoring
 *
 * Provides:
 * - Request counters (total, active, errors)
 * - Cache hit/miss statistics
 * - Per-provider metrics (requests, errors, latency)
 * - Uptime
 * - Thread-safe collection using atomics
 */

#ifndef LLMGATE_UTIL_METRICS_HPP
#define LLMGATE_UTIL_METRICS_HPP

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace llmgate::util {

/**
 * Per-provider metrics
 */
struct ProviderMetrics {
    std::atomic<std::uint64_t> requests_total{0};
    std::atomic<std::uint64_t> requests_success{0};
    std::atomic<std::uint64_t> requests_error{0};
    std::atomic<std::uint64_t> tokens_total{0};

    std::atomic<std::uint64_t> latency_sum_ms{0};
    std::atomic<std::uint64_t> latency_count{0};

    double latency_avg_ms() const {
        auto count = latency_count.load(std::memory_order_relaxed);
        if (count == 0) return 0.0;
        return static_cast<double>(latency_sum_ms.load(std::memory_order_relaxed)) / count;
    }

    double error_rate() const {
        auto total = requests_total.load(std::memory_order_relaxed);
        if (total == 0) return 0.0;
        return static_cast<double>(requests_error.load(std::memory_order_relaxed)) / total;
    }
};

/**
 * Metrics snapshot (plain values, safe to copy around)
 */
struct MetricsSnapshot {
    std::uint64_t requests_total{0};
    std::uint64_t requests_active{0};
    std::uint64_t requests_success{0};
    std::uint64_t requests_error{0};

    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};

    std::uint64_t uptime_seconds{0};

    struct ProviderSnapshot {
        ProviderKind kind{ProviderKind::local};
        std::uint64_t requests{0};
        std::uint64_t errors{0};
        std::uint64_t tokens{0};
        double latency_avg_ms{0.0};
        double error_rate{0.0};
    };
    std::vector<ProviderSnapshot> providers;  // Only kinds that saw traffic

    nlohmann::json to_json() const;
};

/**
 * Metrics collector
 *
 * Lock-free counters; one instance per dispatcher.
 */
class Metrics {
public:
    Metrics();

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    // Request tracking
    void request_started();
    void request_completed(bool success);

    // Cache tracking
    void cache_hit();
    void cache_miss();

    // Provider-specific tracking
    void provider_request(ProviderKind kind, bool success,
                          std::chrono::milliseconds latency, std::uint64_t tokens = 0);

    MetricsSnapshot snapshot() const;

    std::uint64_t uptime_seconds() const;

private:
    static std::size_t index_of(ProviderKind kind);

    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> requests_active_{0};
    std::atomic<std::uint64_t> requests_success_{0};
    std::atomic<std::uint64_t> requests_error_{0};

    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};

    // Indexed like kProviderKinds; the kind set is closed
    std::array<ProviderMetrics, kProviderKinds.size()> providers_;

    std::chrono::steady_clock::time_point start_time_;
};

} // namespace llmgate::util

#endif // LLMGATE_UTIL_METRICS_HPP
