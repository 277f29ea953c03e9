/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Cache key tests
 */

#include "cache/cache_key.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace llmgate;
using namespace llmgate::cache;

TEST(CacheKeyTest, SameFieldsSameKey) {
    auto a = generate_cache_key("What is C++?", 1000, 0.7);
    auto b = generate_cache_key("What is C++?", 1000, 0.7);
    EXPECT_EQ(a, b);
}

TEST(CacheKeyTest, EachFieldChangesTheKey) {
    auto base = generate_cache_key("prompt", 1000, 0.7);
    EXPECT_FALSE(base == generate_cache_key("prompt!", 1000, 0.7));
    EXPECT_FALSE(base == generate_cache_key("prompt", 999, 0.7));
    EXPECT_FALSE(base == generate_cache_key("prompt", 1000, 0.8));
}

TEST(CacheKeyTest, PreferencesAndMetadataAreIgnored) {
    Request a;
    a.prompt = "hello";

    Request b = a;
    b.provider_preferences = {ProviderKind::openai, ProviderKind::local};
    b.metadata["user"] = "alice";

    EXPECT_EQ(generate_cache_key(a), generate_cache_key(b));
}

TEST(CacheKeyTest, HexStringIs32Digits) {
    auto key = generate_cache_key("prompt", 100, 0.1);
    auto hex = key.to_string();
    EXPECT_EQ(hex.size(), 32u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(CacheKeyTest, DistinctPromptsDistinctKeys) {
    std::set<CacheKey> keys;
    for (int i = 0; i < 500; ++i) {
        keys.insert(generate_cache_key("prompt " + std::to_string(i), 1000, 0.7));
    }
    EXPECT_EQ(keys.size(), 500u);
}
