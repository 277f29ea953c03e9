/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Retry Governor - Implementation
 */

#include "dispatch/retry_governor.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace llmgate::dispatch {

using util::log_component::Governor;

AdmissionGate::AdmissionGate(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("AdmissionGate capacity must be positive");
    }
}

void AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return in_flight_ < capacity_; });

    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
}

void AdmissionGate::async_acquire(asio::any_io_executor executor, std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (in_flight_ < capacity_ && waiters_.empty()) {
        ++in_flight_;
        peak_ = std::max(peak_, in_flight_);
        asio::post(executor, std::move(handler));
        return;
    }

    waiters_.push_back(Waiter{std::move(executor), std::move(handler)});
}

void AdmissionGate::release() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!waiters_.empty()) {
        // The slot passes to the waiter, so in_flight_ is unchanged
        auto waiter = std::move(waiters_.front());
        waiters_.pop_front();
        lock.unlock();
        asio::post(waiter.executor, std::move(waiter.handler));
        return;
    }

    --in_flight_;
    lock.unlock();
    available_.notify_one();
}

std::size_t AdmissionGate::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t AdmissionGate::peak_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

RetryGovernor::RetryGovernor(const GovernorConfig& config)
    : config_(config)
    , gate_(config.max_concurrent)
{
    if (config_.max_retries == 0) {
        throw std::invalid_argument("RetryGovernor max_retries must be positive");
    }
    LLMGATE_LOG_DEBUG(Governor, "RetryGovernor created: max_concurrent={}, max_retries={}, backoff_unit={}ms",
                      config_.max_concurrent, config_.max_retries, config_.backoff_unit.count());
}

std::chrono::milliseconds RetryGovernor::backoff_delay(std::uint32_t attempt) const {
    // Cap the shift; the attempt count is small in practice
    auto factor = std::int64_t{1} << std::min<std::uint32_t>(attempt, 30);
    return config_.backoff_unit * factor;
}

std::optional<std::chrono::milliseconds> RetryGovernor::on_attempt_failed(std::string_view label,
                                                                          std::uint32_t attempt,
                                                                          const std::string& error) {
    LLMGATE_LOG_WARN(Governor, "{} attempt {}/{} failed: {}",
                     label, attempt + 1, config_.max_retries, error);

    if (attempt + 1 >= config_.max_retries) {
        return std::nullopt;
    }

    retries_.fetch_add(1, std::memory_order_relaxed);

    auto delay = backoff_delay(attempt);
    LLMGATE_LOG_DEBUG(Governor, "{} retrying in {}ms", label, delay.count());
    return delay;
}

} // namespace llmgate::dispatch
