/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Retry governor tests
 */

#include "dispatch/retry_governor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace llmgate;
using namespace llmgate::dispatch;
using namespace std::chrono_literals;

namespace {

GovernorConfig fast_config(std::size_t concurrent = 10, std::uint32_t retries = 3) {
    GovernorConfig config;
    config.max_concurrent = concurrent;
    config.max_retries = retries;
    config.backoff_unit = 20ms;
    return config;
}

template<typename Result, typename Work>
std::future<Result> run_on_pool(RetryGovernor& governor, asio::thread_pool& pool, Work work, std::string label) {
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    governor.async_execute_with_retry(pool.get_executor(), std::move(work), std::move(label),
        [promise](std::exception_ptr error, Result result) {
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(result));
            }
        });
    return future;
}

} // namespace

TEST(RetryGovernorTest, FirstSuccessReturnsImmediately) {
    RetryGovernor governor(fast_config());
    int calls = 0;
    auto result = governor.execute_with_retry([&]() { ++calls; return 42; }, "answer");
    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(governor.retries(), 0u);
}

TEST(RetryGovernorTest, FailFailSucceedBacksOffExponentially) {
    RetryGovernor governor(fast_config());
    int calls = 0;

    auto start = std::chrono::steady_clock::now();
    auto result = governor.execute_with_retry([&]() {
        if (++calls < 3) {
            throw std::runtime_error("transient");
        }
        return std::string("ok");
    }, "flaky");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result, "ok");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(governor.attempts_issued(), 3u);
    EXPECT_EQ(governor.retries(), 2u);
    // 1 unit after the first failure, 2 after the second
    EXPECT_GE(elapsed, 3 * 20ms);
}

TEST(RetryGovernorTest, ExhaustionRaisesProviderError) {
    RetryGovernor governor(fast_config());
    int calls = 0;

    try {
        governor.execute_with_retry([&]() -> int {
            ++calls;
            throw std::runtime_error("boom " + std::to_string(calls));
        }, "openai request");
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_EQ(e.label(), "openai request");
        EXPECT_EQ(e.attempts(), 3u);
        EXPECT_NE(std::string(e.what()).find("boom 3"), std::string::npos);
    }

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(governor.exhausted(), 1u);
}

TEST(RetryGovernorTest, ConfigurationErrorIsNotRetried) {
    RetryGovernor governor(fast_config());
    int calls = 0;
    EXPECT_THROW(governor.execute_with_retry([&]() -> int {
        ++calls;
        throw ConfigurationError("bad key");
    }, "cfg"), ConfigurationError);
    EXPECT_EQ(calls, 1);
}

TEST(RetryGovernorTest, NoHealthyProviderIsNotRetried) {
    RetryGovernor governor(fast_config());
    int calls = 0;
    EXPECT_THROW(governor.execute_with_retry([&]() -> int {
        ++calls;
        throw NoHealthyProviderError();
    }, "select"), NoHealthyProviderError);
    EXPECT_EQ(calls, 1);
}

TEST(RetryGovernorTest, BackoffDelayDoubles) {
    RetryGovernor governor(fast_config());
    EXPECT_EQ(governor.backoff_delay(0), 20ms);
    EXPECT_EQ(governor.backoff_delay(1), 40ms);
    EXPECT_EQ(governor.backoff_delay(2), 80ms);
}

TEST(RetryGovernorTest, ZeroRetriesIsRejected) {
    EXPECT_THROW({ RetryGovernor governor(fast_config(10, 0)); }, std::invalid_argument);
}

TEST(RetryGovernorTest, ConcurrencyCeilingIsHonored) {
    RetryGovernor governor(fast_config(2));
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            governor.execute_with_retry([&]() {
                auto now = ++in_flight;
                auto seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(15ms);
                --in_flight;
                return 0;
            }, "bounded");
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_LE(governor.gate().peak_in_flight(), 2u);
    EXPECT_EQ(governor.gate().in_flight(), 0u);
}

TEST(RetryGovernorTest, SlotIsReleasedDuringBackoff) {
    GovernorConfig config = fast_config(1);
    config.backoff_unit = 200ms;
    RetryGovernor governor(config);

    std::atomic<bool> failed_once{false};
    std::thread retrying([&]() {
        governor.execute_with_retry([&]() {
            if (!failed_once.exchange(true)) {
                throw std::runtime_error("transient");
            }
            return 0;
        }, "retrying");
    });

    while (!failed_once.load()) {
        std::this_thread::sleep_for(1ms);
    }

    // The only slot is free while the first caller sleeps
    auto start = std::chrono::steady_clock::now();
    governor.execute_with_retry([]() { return 1; }, "other");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 150ms);

    retrying.join();
}

TEST(AdmissionGateTest, ZeroCapacityIsRejected) {
    EXPECT_THROW({ AdmissionGate gate(0); }, std::invalid_argument);
}

TEST(AdmissionGateTest, SlotReleasesOnException) {
    AdmissionGate gate(1);
    try {
        AdmissionGate::Slot slot(gate);
        EXPECT_EQ(gate.in_flight(), 1u);
        throw std::runtime_error("unwind");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(gate.in_flight(), 0u);
}

TEST(RetryGovernorAsyncTest, RetriesUntilSuccess) {
    asio::thread_pool pool(2);
    RetryGovernor governor(fast_config());
    std::atomic<int> calls{0};

    auto start = std::chrono::steady_clock::now();
    auto result = run_on_pool<std::string>(governor, pool, [&]() {
        if (++calls < 3) {
            throw std::runtime_error("transient");
        }
        return std::string("ok");
    }, "flaky");

    EXPECT_EQ(result.get(), "ok");
    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(governor.retries(), 2u);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 3 * 20ms);
    pool.join();
}

TEST(RetryGovernorAsyncTest, ExhaustionDeliversProviderError) {
    asio::thread_pool pool(2);
    RetryGovernor governor(fast_config());

    auto result = run_on_pool<int>(governor, pool, []() -> int {
        throw std::runtime_error("down");
    }, "cohere request");

    try {
        result.get();
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_EQ(e.label(), "cohere request");
        EXPECT_EQ(e.attempts(), 3u);
    }
    EXPECT_EQ(governor.exhausted(), 1u);
    EXPECT_EQ(governor.gate().in_flight(), 0u);
    pool.join();
}

TEST(RetryGovernorAsyncTest, ConfigurationErrorPassesThrough) {
    asio::thread_pool pool(1);
    RetryGovernor governor(fast_config());
    std::atomic<int> calls{0};

    auto result = run_on_pool<int>(governor, pool, [&]() -> int {
        ++calls;
        throw ConfigurationError("bad key");
    }, "cfg");

    EXPECT_THROW(result.get(), ConfigurationError);
    EXPECT_EQ(calls.load(), 1);
    pool.join();
}

TEST(RetryGovernorAsyncTest, BackoffDoesNotOccupyWorkers) {
    // As many workers as slots: sleeping retries would starve the pool
    asio::thread_pool pool(2);
    GovernorConfig config = fast_config(2);
    config.backoff_unit = 400ms;
    RetryGovernor governor(config);

    std::vector<std::future<int>> failing;
    for (int i = 0; i < 2; ++i) {
        failing.push_back(run_on_pool<int>(governor, pool, []() -> int {
            throw std::runtime_error("backend unavailable");
        }, "failing"));
    }
    std::this_thread::sleep_for(50ms);

    auto start = std::chrono::steady_clock::now();
    auto healthy = run_on_pool<int>(governor, pool, []() { return 7; }, "healthy");
    ASSERT_EQ(healthy.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(healthy.get(), 7);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 200ms);

    for (auto& future : failing) {
        EXPECT_THROW(future.get(), ProviderError);
    }
    pool.join();
}

TEST(RetryGovernorAsyncTest, QueuedAttemptsRespectCeiling) {
    asio::thread_pool pool(4);
    RetryGovernor governor(fast_config(1));
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    std::vector<std::future<int>> results;
    for (int i = 0; i < 6; ++i) {
        results.push_back(run_on_pool<int>(governor, pool, [&]() {
            auto now = ++in_flight;
            auto seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --in_flight;
            return 0;
        }, "queued"));
    }
    for (auto& result : results) {
        EXPECT_EQ(result.get(), 0);
    }

    EXPECT_EQ(peak.load(), 1);
    EXPECT_EQ(governor.gate().peak_in_flight(), 1u);
    EXPECT_EQ(governor.gate().in_flight(), 0u);
    pool.join();
}
