/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Dispatcher implementation
 */

#include "dispatch/dispatcher.hpp"
#include "cache/cache_key.hpp"
#include "util/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <optional>
#include <thread>

namespace llmgate::dispatch {

namespace component = util::log_component;

namespace {

GovernorConfig governor_config(const config::DispatchSettings& settings) {
    GovernorConfig config;
    config.max_concurrent = settings.max_concurrent_requests;
    config.max_retries = settings.max_retries;
    config.backoff_unit = std::chrono::milliseconds(settings.backoff_unit_ms);
    return config;
}

} // namespace

nlohmann::json DispatcherStats::to_json() const {
    return nlohmann::json{
        {"requests_total", requests_total},
        {"cache_hits", cache_hits},
        {"errors", errors},
        {"cache_hit_rate", cache_hit_rate},
        {"active_providers", active_providers},
        {"cache_size", cache_size}
    };
}

std::size_t Dispatcher::worker_count(const config::DispatchSettings& settings) {
    if (settings.worker_threads > 0) {
        return settings.worker_threads;
    }
    std::size_t hardware = std::thread::hardware_concurrency();
    return std::max<std::size_t>({hardware, settings.max_concurrent_requests, 1});
}

Dispatcher::Dispatcher(const config::DispatchSettings& settings)
    : settings_(settings)
    , pool_(worker_count(settings))
    , cache_(cache::ResponseCacheConfig{settings.cache_capacity})
    , provider_pool_(balancer::ProviderPoolConfig{settings.pool_max_size})
    , governor_(governor_config(settings))
{
    if (settings_.enable_batching) {
        BatcherConfig batcher_config;
        batcher_config.batch_size = settings_.batch_size;
        batcher_config.batch_timeout = std::chrono::milliseconds(settings_.batch_timeout_ms);
        batcher_ = std::make_unique<RequestBatcher>(pool_, governor_, batcher_config);
    }

    LLMGATE_LOG_INFO(component::Dispatcher, "Dispatcher started: workers={}, cache_capacity={}, max_concurrent={}, "
                     "max_retries={}, batching={}, pooling={}",
                     worker_count(settings_), settings_.cache_capacity, settings_.max_concurrent_requests,
                     settings_.max_retries, settings_.enable_batching, settings_.enable_pooling);
}

Dispatcher::~Dispatcher() {
    // The batcher drains onto the pool, so it goes first
    batcher_.reset();
    pool_.join();

    LLMGATE_LOG_DEBUG(component::Dispatcher, "Dispatcher stopped after {} requests", requests_total_.load());
}

Response Dispatcher::generate(const Request& request) {
    util::RequestContext context;
    auto start_time = std::chrono::steady_clock::now();

    requests_total_.fetch_add(1, std::memory_order_relaxed);
    metrics_.request_started();

    util::DispatchLogEntry log_entry;
    log_entry.request_id = context.id();

    auto key = cache::generate_cache_key(request);
    if (auto cached = cache_.lookup(key)) {
        cache_hits_.fetch_add(1, std::memory_order_relaxed);
        metrics_.cache_hit();
        metrics_.request_completed(true);

        log_entry.provider = std::string(to_string(cached->provider));
        log_entry.cache_hit = true;
        log_entry.tokens_used = cached->tokens_used;
        log_entry.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        util::Logger::instance().dispatch(log_entry);

        return *cached;
    }
    metrics_.cache_miss();

    std::optional<ProviderKind> selected;
    try {
        auto selection = registry_.select(request.provider_preferences);
        selected = selection.kind;

        if (settings_.enable_pooling) {
            if (auto pooled = provider_pool_.get(selection.kind)) {
                selection.provider = std::move(pooled);
            }
        }

        auto response = execute(request, std::move(selection));

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        response.provider = *selected;
        response.latency_ms = std::chrono::duration<double, std::milli>(elapsed).count();

        cache_.insert(key, response);

        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
        metrics_.provider_request(*selected, true, latency, response.tokens_used);
        metrics_.request_completed(true);

        log_entry.provider = std::string(to_string(*selected));
        log_entry.latency = latency;
        log_entry.tokens_used = response.tokens_used;
        util::Logger::instance().dispatch(log_entry);

        return response;

    } catch (const std::exception& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);

        auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        if (selected) {
            metrics_.provider_request(*selected, false, latency);
            log_entry.provider = std::string(to_string(*selected));
        }
        metrics_.request_completed(false);

        log_entry.success = false;
        log_entry.latency = latency;
        log_entry.error = e.what();
        util::Logger::instance().dispatch(log_entry);

        LLMGATE_LOG_ERROR(component::Dispatcher, "Request {} failed: {}", context.id(), e.what());
        throw;
    }
}

Response Dispatcher::execute(const Request& request, balancer::ProviderSelection selection) {
    auto label = fmt::format("{} request", to_string(selection.kind));

    if (batcher_) {
        return batcher_->add_request(request, std::move(selection.provider), std::move(label));
    }

    auto promise = std::make_shared<std::promise<Response>>();
    auto result = promise->get_future();

    // The caller blocks here; attempts and backoff timers run on the pool
    governor_.async_execute_with_retry(
        pool_.get_executor(),
        [&request, provider = std::move(selection.provider)]() { return provider->generate(request); },
        std::move(label),
        [promise](std::exception_ptr error, Response response) {
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(response));
            }
        });

    return result.get();
}

void Dispatcher::register_provider(ProviderKind kind, std::shared_ptr<provider::Provider> provider) {
    registry_.register_provider(kind, std::move(provider));
}

bool Dispatcher::add_pool_instance(ProviderKind kind, std::shared_ptr<provider::Provider> provider) {
    return provider_pool_.add(kind, std::move(provider));
}

bool Dispatcher::unregister_provider(ProviderKind kind) {
    return registry_.unregister_provider(kind);
}

DispatcherStats Dispatcher::get_stats() const {
    DispatcherStats stats;
    stats.requests_total = requests_total_.load(std::memory_order_relaxed);
    stats.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    stats.errors = errors_.load(std::memory_order_relaxed);

    auto denominator = std::max<std::uint64_t>(stats.requests_total, 1);
    stats.cache_hit_rate = fmt::format("{:.2f}%",
        static_cast<double>(stats.cache_hits) / static_cast<double>(denominator) * 100.0);

    stats.active_providers = registry_.size();
    stats.cache_size = cache_.size();
    return stats;
}

} // namespace llmgate::dispatch
