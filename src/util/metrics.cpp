/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Metrics Implementation
 */

#include "util/metrics.hpp"

namespace llmgate::util {

Metrics::Metrics()
    : start_time_(std::chrono::steady_clock::now())
{
}

std::size_t Metrics::index_of(ProviderKind kind) {
    for (std::size_t i = 0; i < kProviderKinds.size(); ++i) {
        if (kProviderKinds[i] == kind) {
            return i;
        }
    }
    return 0;
}

void Metrics::request_started() {
    requests_total_.fetch_add(1, std::memory_order_relaxed);
    requests_active_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::request_completed(bool success) {
    requests_active_.fetch_sub(1, std::memory_order_relaxed);
    if (success) {
        requests_success_.fetch_add(1, std::memory_order_relaxed);
    } else {
        requests_error_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Metrics::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::provider_request(ProviderKind kind, bool success,
                               std::chrono::milliseconds latency, std::uint64_t tokens) {
    auto& metrics = providers_[index_of(kind)];

    metrics.requests_total.fetch_add(1, std::memory_order_relaxed);
    if (success) {
        metrics.requests_success.fetch_add(1, std::memory_order_relaxed);
        metrics.tokens_total.fetch_add(tokens, std::memory_order_relaxed);
    } else {
        metrics.requests_error.fetch_add(1, std::memory_order_relaxed);
    }
    metrics.latency_sum_ms.fetch_add(static_cast<std::uint64_t>(latency.count()), std::memory_order_relaxed);
    metrics.latency_count.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t Metrics::uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
}

MetricsSnapshot Metrics::snapshot() const {
    MetricsSnapshot snap;

    snap.requests_total = requests_total_.load(std::memory_order_relaxed);
    snap.requests_active = requests_active_.load(std::memory_order_relaxed);
    snap.requests_success = requests_success_.load(std::memory_order_relaxed);
    snap.requests_error = requests_error_.load(std::memory_order_relaxed);

    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);

    snap.uptime_seconds = uptime_seconds();

    for (std::size_t i = 0; i < kProviderKinds.size(); ++i) {
        const auto& metrics = providers_[i];
        auto requests = metrics.requests_total.load(std::memory_order_relaxed);
        if (requests == 0) {
            continue;
        }

        MetricsSnapshot::ProviderSnapshot provider_snap;
        provider_snap.kind = kProviderKinds[i];
        provider_snap.requests = requests;
        provider_snap.errors = metrics.requests_error.load(std::memory_order_relaxed);
        provider_snap.tokens = metrics.tokens_total.load(std::memory_order_relaxed);
        provider_snap.latency_avg_ms = metrics.latency_avg_ms();
        provider_snap.error_rate = metrics.error_rate();
        snap.providers.push_back(provider_snap);
    }

    return snap;
}

nlohmann::json MetricsSnapshot::to_json() const {
    nlohmann::json providers_json = nlohmann::json::array();
    for (const auto& p : providers) {
        providers_json.push_back({
            {"kind", to_string(p.kind)},
            {"requests", p.requests},
            {"errors", p.errors},
            {"tokens", p.tokens},
            {"latency_avg_ms", p.latency_avg_ms},
            {"error_rate", p.error_rate}
        });
    }

    return nlohmann::json{
        {"requests", {
            {"total", requests_total},
            {"active", requests_active},
            {"success", requests_success},
            {"error", requests_error}
        }},
        {"cache", {
            {"hits", cache_hits},
            {"misses", cache_misses}
        }},
        {"uptime_seconds", uptime_seconds},
        {"providers", providers_json}
    };
}

} // namespace llmgate::util
