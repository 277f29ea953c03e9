/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Request Batcher - Implementation
 */

#include "dispatch/request_batcher.hpp"
#include "util/logger.hpp"

#include <stdexcept>

namespace llmgate::dispatch {

using util::log_component::Batcher;

RequestBatcher::RequestBatcher(asio::thread_pool& pool, RetryGovernor& governor, const BatcherConfig& config)
    : pool_(pool)
    , governor_(governor)
    , config_(config)
    , timer_(pool)
{
    if (config_.batch_size == 0) {
        throw std::invalid_argument("RequestBatcher batch_size must be positive");
    }
    LLMGATE_LOG_DEBUG(Batcher, "RequestBatcher created: batch_size={}, batch_timeout={}ms",
                      config_.batch_size, config_.batch_timeout.count());
}

RequestBatcher::~RequestBatcher() {
    std::unique_lock<std::mutex> lock(mutex_);
    flush_locked();

    // Handlers posted to the pool refer to this object
    idle_.wait(lock, [this] { return outstanding_ == 0; });
}

Response RequestBatcher::add_request(Request request, std::shared_ptr<provider::Provider> provider,
                                     std::string label) {
    return submit(std::move(request), std::move(provider), std::move(label)).get();
}

std::future<Response> RequestBatcher::submit(Request request, std::shared_ptr<provider::Provider> provider,
                                             std::string label) {
    if (!provider) {
        throw std::invalid_argument("RequestBatcher requires a provider");
    }

    auto promise = std::make_shared<std::promise<Response>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);

    pending_.push_back(PendingItem{std::move(request), std::move(provider), std::move(promise), std::move(label)});

    if (pending_.size() >= config_.batch_size) {
        LLMGATE_LOG_DEBUG(Batcher, "Batch full ({} items), flushing", pending_.size());
        flush_locked();
    } else if (pending_.size() == 1) {
        arm_timer(generation_);
    }

    return future;
}

void RequestBatcher::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    flush_locked();
}

std::size_t RequestBatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void RequestBatcher::arm_timer(std::uint64_t generation) {
    ++outstanding_;
    timer_.expires_after(config_.batch_timeout);
    timer_.async_wait([this, generation](boost::system::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!ec && generation == generation_ && !pending_.empty()) {
            LLMGATE_LOG_DEBUG(Batcher, "Batch timeout after {}ms ({} items), flushing",
                              config_.batch_timeout.count(), pending_.size());
            flush_locked();
        } else if (ec && ec != asio::error::operation_aborted) {
            LLMGATE_LOG_WARN(Batcher, "Batch timer error: {}", ec.message());
        }

        if (--outstanding_ == 0) {
            idle_.notify_all();
        }
    });
}

void RequestBatcher::flush_locked() {
    ++generation_;
    timer_.cancel();

    if (pending_.empty()) {
        return;
    }

    std::vector<PendingItem> batch;
    batch.swap(pending_);

    batches_flushed_.fetch_add(1, std::memory_order_relaxed);
    items_dispatched_.fetch_add(batch.size(), std::memory_order_relaxed);
    outstanding_ += batch.size();

    LLMGATE_LOG_DEBUG(Batcher, "Dispatching wave of {} requests", batch.size());

    for (auto& item : batch) {
        dispatch_item(std::make_shared<PendingItem>(std::move(item)));
    }
}

void RequestBatcher::dispatch_item(std::shared_ptr<PendingItem> item) {
    auto work = [item]() { return item->provider->generate(item->request); };

    governor_.async_execute_with_retry(
        pool_.get_executor(), std::move(work), item->label,
        [this, item](std::exception_ptr error, Response response) {
            // Handed to this item's caller through its future
            if (error) {
                item->promise->set_exception(error);
            } else {
                item->promise->set_value(std::move(response));
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (--outstanding_ == 0) {
                idle_.notify_all();
            }
        });
}

} // namespace llmgate::dispatch
