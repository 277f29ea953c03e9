/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Retry Governor - Concurrency ceiling plus retry with exponential backoff
 */

#ifndef LLMGATE_DISPATCH_RETRY_GOVERNOR_HPP
#define LLMGATE_DISPATCH_RETRY_GOVERNOR_HPP

#include "core/errors.hpp"

#include <utility>  // must precede boost/asio: Boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace llmgate::dispatch {

namespace asio = boost::asio;

/**
 * Governor configuration
 */
struct GovernorConfig {
    std::size_t max_concurrent{10};              // In-flight ceiling
    std::uint32_t max_retries{3};                // Attempts per call
    std::chrono::milliseconds backoff_unit{1000};  // Wait after attempt n is 2^n units
};

/**
 * Counting admission gate bounding simultaneous in-flight calls
 */
class AdmissionGate {
public:
    explicit AdmissionGate(std::size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    /**
     * RAII slot: released on every exit path, exceptions included
     */
    class Slot {
    public:
        explicit Slot(AdmissionGate& gate) : gate_(&gate) { gate_->acquire(); }

        /**
         * Take ownership of a slot already granted by async_acquire
         */
        Slot(AdmissionGate& gate, std::adopt_lock_t) : gate_(&gate) {}
        ~Slot() { if (gate_) gate_->release(); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        AdmissionGate* gate_;
    };

    /**
     * Block until a slot is free, then take it
     */
    void acquire();

    /**
     * Queue handler until a slot is free; the slot is taken on its behalf
     * and the handler is posted to executor. Nothing blocks while waiting.
     */
    void async_acquire(asio::any_io_executor executor, std::function<void()> handler);

    /**
     * Return a slot, handing it straight to the oldest queued async waiter
     */
    void release();

    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t in_flight() const;
    std::size_t peak_in_flight() const;

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::size_t in_flight_{0};
    std::size_t peak_{0};

    struct Waiter {
        asio::any_io_executor executor;
        std::function<void()> handler;
    };
    std::deque<Waiter> waiters_;
};

/**
 * Retry governor
 *
 * Every attempt runs inside its own admission slot. The slot is returned
 * before the backoff wait, so a retrying call never holds capacity while it
 * waits.
 *
 * execute_with_retry waits on the calling thread. async_execute_with_retry
 * waits on a steady_timer and runs each attempt on the given executor, so
 * pool threads are never parked by a backoff or a full gate.
 *
 * ConfigurationError and NoHealthyProviderError pass straight through; any
 * other exception counts as a failed attempt.
 */
class RetryGovernor {
public:
    explicit RetryGovernor(const GovernorConfig& config = {});

    RetryGovernor(const RetryGovernor&) = delete;
    RetryGovernor& operator=(const RetryGovernor&) = delete;

    /**
     * Run work with up to max_retries attempts
     *
     * @param work Callable invoked once per attempt
     * @param label Tag for logs and for the final error
     * @return Whatever work returns on its first successful attempt
     * @throws ProviderError once every attempt has failed
     */
    template<typename Work>
    std::invoke_result_t<Work&> execute_with_retry(Work&& work, std::string_view label) {
        std::string last_error = "no attempt made";

        for (std::uint32_t attempt = 0; attempt < config_.max_retries; ++attempt) {
            try {
                AdmissionGate::Slot slot(gate_);
                attempts_.fetch_add(1, std::memory_order_relaxed);
                return work();
            } catch (const ConfigurationError&) {
                throw;
            } catch (const NoHealthyProviderError&) {
                throw;
            } catch (const std::exception& e) {
                last_error = e.what();
            }

            if (auto delay = on_attempt_failed(label, attempt, last_error)) {
                std::this_thread::sleep_for(*delay);
            }
        }

        exhausted_.fetch_add(1, std::memory_order_relaxed);
        throw ProviderError(std::string(label), config_.max_retries, last_error);
    }

    /**
     * Run work with up to max_retries attempts without blocking any thread
     *
     * Attempts are posted to executor once a slot is free; backoff waits run
     * on a timer. handler is invoked exactly once, on executor, as
     * handler(nullptr, result) on success or handler(error, Result{}) with
     * the ProviderError (or pass-through error) otherwise.
     *
     * The governor must outlive the operation.
     */
    template<typename Work, typename Handler>
    void async_execute_with_retry(asio::any_io_executor executor, Work work, std::string label, Handler handler) {
        auto op = std::make_shared<AsyncRetry<Work, Handler>>(
            executor, std::move(work), std::move(label), std::move(handler));
        start_attempt(std::move(op));
    }

    /**
     * Backoff before the attempt following `attempt` (0-based): 2^attempt units
     */
    std::chrono::milliseconds backoff_delay(std::uint32_t attempt) const;

    const GovernorConfig& get_config() const noexcept { return config_; }

    AdmissionGate& gate() noexcept { return gate_; }
    const AdmissionGate& gate() const noexcept { return gate_; }

    std::uint64_t attempts_issued() const { return attempts_.load(std::memory_order_relaxed); }
    std::uint64_t retries() const { return retries_.load(std::memory_order_relaxed); }
    std::uint64_t exhausted() const { return exhausted_.load(std::memory_order_relaxed); }

private:
    template<typename Work, typename Handler>
    struct AsyncRetry {
        AsyncRetry(asio::any_io_executor ex, Work w, std::string l, Handler h)
            : executor(ex), timer(ex), work(std::move(w)), label(std::move(l)), handler(std::move(h)) {}

        asio::any_io_executor executor;
        asio::steady_timer timer;
        Work work;
        std::string label;
        Handler handler;
        std::uint32_t attempt{0};
        std::string last_error{"no attempt made"};
    };

    template<typename Op>
    void start_attempt(std::shared_ptr<Op> op) {
        auto executor = op->executor;
        gate_.async_acquire(executor, [this, op]() { run_attempt(op); });
    }

    template<typename Op>
    void run_attempt(std::shared_ptr<Op> op) {
        using Result = std::invoke_result_t<decltype(op->work)&>;

        std::optional<Result> result;
        std::exception_ptr error;
        {
            AdmissionGate::Slot slot(gate_, std::adopt_lock);
            attempts_.fetch_add(1, std::memory_order_relaxed);
            try {
                result.emplace(op->work());
            } catch (const ConfigurationError&) {
                error = std::current_exception();
            } catch (const NoHealthyProviderError&) {
                error = std::current_exception();
            } catch (const std::exception& e) {
                op->last_error = e.what();
            } catch (...) {
                // Not a provider failure; the caller gets it as is
                error = std::current_exception();
            }
        }

        if (result) {
            op->handler(nullptr, std::move(*result));
            return;
        }
        if (error) {
            op->handler(error, Result{});
            return;
        }

        auto delay = on_attempt_failed(op->label, op->attempt, op->last_error);
        if (!delay) {
            exhausted_.fetch_add(1, std::memory_order_relaxed);
            op->handler(std::make_exception_ptr(ProviderError(op->label, config_.max_retries, op->last_error)),
                        Result{});
            return;
        }

        ++op->attempt;
        op->timer.expires_after(*delay);
        op->timer.async_wait([this, op](boost::system::error_code ec) {
            if (ec) {
                op->handler(std::make_exception_ptr(ProviderError(op->label, op->attempt,
                                                                  "backoff interrupted: " + ec.message())),
                            Result{});
                return;
            }
            start_attempt(op);
        });
    }

    /**
     * Log the failure and return the backoff before the next attempt,
     * or nothing when the attempt was the last one
     */
    std::optional<std::chrono::milliseconds> on_attempt_failed(std::string_view label, std::uint32_t attempt,
                                                               const std::string& error);

    GovernorConfig config_;
    AdmissionGate gate_;

    std::atomic<std::uint64_t> attempts_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> exhausted_{0};
};

} // namespace llmgate::dispatch

#endif // LLMGATE_DISPATCH_RETRY_GOVERNOR_HPP
