/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Request Batcher - Coalesces requests into size/time-bounded dispatch waves
 */

#ifndef LLMGATE_DISPATCH_REQUEST_BATCHER_HPP
#define LLMGATE_DISPATCH_REQUEST_BATCHER_HPP

#include "core/types.hpp"
#include "dispatch/retry_governor.hpp"
#include "provider/provider.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace llmgate::dispatch {

namespace asio = boost::asio;

/**
 * Batcher configuration
 */
struct BatcherConfig {
    std::size_t batch_size{5};                    // Flush when this many are queued
    std::chrono::milliseconds batch_timeout{100};  // Flush this long after the first item
};

/**
 * Request batcher
 *
 * Queued requests are flushed as one wave when the queue reaches batch_size
 * or batch_timeout after the first item of the batch, whichever comes first.
 * The timer is armed once per batch, by its first item; later arrivals do not
 * push the deadline back.
 *
 * Every item of a wave is handed to the retry governor, which runs its
 * attempts on the worker pool, so batched traffic still respects the
 * concurrency ceiling.
 * Each caller receives its own response or its own failure.
 */
class RequestBatcher {
public:
    /**
     * @param pool Worker pool the waves run on
     * @param governor Governor every batched call goes through
     * @param config Batch size and timeout
     */
    RequestBatcher(asio::thread_pool& pool, RetryGovernor& governor, const BatcherConfig& config = {});
    ~RequestBatcher();

    RequestBatcher(const RequestBatcher&) = delete;
    RequestBatcher& operator=(const RequestBatcher&) = delete;

    /**
     * Enqueue and block until this request's result is available
     *
     * @throws Whatever the request's own dispatch raised
     */
    Response add_request(Request request, std::shared_ptr<provider::Provider> provider,
                         std::string label = "batched request");

    /**
     * Enqueue and return a future for the result
     */
    std::future<Response> submit(Request request, std::shared_ptr<provider::Provider> provider,
                                 std::string label = "batched request");

    /**
     * Dispatch whatever is queued right now
     */
    void flush();

    std::size_t pending() const;

    std::uint64_t batches_flushed() const { return batches_flushed_.load(std::memory_order_relaxed); }
    std::uint64_t items_dispatched() const { return items_dispatched_.load(std::memory_order_relaxed); }

    const BatcherConfig& get_config() const noexcept { return config_; }

private:
    struct PendingItem {
        Request request;
        std::shared_ptr<provider::Provider> provider;
        std::shared_ptr<std::promise<Response>> promise;
        std::string label;
    };

    /**
     * Arm the batch timer for the given batch generation
     * Must be called with mutex_ held
     */
    void arm_timer(std::uint64_t generation);

    /**
     * Take the queue and post each item to the pool
     * Must be called with mutex_ held
     */
    void flush_locked();

    /**
     * Run one item through the governor and fulfil its promise
     * The governor's attempts and backoff never park a pool thread
     */
    void dispatch_item(std::shared_ptr<PendingItem> item);

    asio::thread_pool& pool_;
    RetryGovernor& governor_;
    BatcherConfig config_;

    mutable std::mutex mutex_;       // Protects pending_, generation_ and timer_
    std::vector<PendingItem> pending_;
    std::uint64_t generation_{0};    // Incremented on each flush; stale timers compare against it
    asio::steady_timer timer_;
    std::size_t outstanding_{0};     // Timer waits and items posted but not finished
    std::condition_variable idle_;

    std::atomic<std::uint64_t> batches_flushed_{0};
    std::atomic<std::uint64_t> items_dispatched_{0};
};

} // namespace llmgate::dispatch

#endif // LLMGATE_DISPATCH_REQUEST_BATCHER_HPP
