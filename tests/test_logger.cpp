/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Logger tests
 */

#include "util/logger.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using namespace llmgate::util;

TEST(LoggerTest, ParsesLevels) {
    EXPECT_EQ(Logger::parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parse_level("err"), LogLevel::Error);
    EXPECT_EQ(Logger::parse_level("off"), LogLevel::Off);
    EXPECT_FALSE(Logger::parse_level("chatty").has_value());
}

TEST(LoggerTest, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(Logger::parse_level(Logger::level_to_string(level)), level);
    }
}

TEST(LoggerTest, SetLevelIsObserved) {
    auto& logger = Logger::instance();
    auto previous = logger.get_level();

    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.get_level(), LogLevel::Error);

    logger.set_level(previous);
}

TEST(LoggerTest, DispatchRecordDoesNotThrow) {
    DispatchLogEntry entry;
    entry.request_id = "abc";
    entry.provider = "local";
    entry.success = false;
    entry.error = "boom";
    EXPECT_NO_THROW(Logger::instance().dispatch(entry));
}

TEST(RequestContextTest, ScopesIdToThread) {
    EXPECT_TRUE(RequestContext::current_id().empty());
    {
        RequestContext context("req-1");
        EXPECT_EQ(RequestContext::current_id(), "req-1");

        std::string other_thread_id = "unset";
        std::thread([&]() { other_thread_id = RequestContext::current_id(); }).join();
        EXPECT_TRUE(other_thread_id.empty());
    }
    EXPECT_TRUE(RequestContext::current_id().empty());
}

TEST(RequestContextTest, GeneratesDistinctIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = RequestContext::generate_id();
        EXPECT_EQ(id.size(), 16u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}
