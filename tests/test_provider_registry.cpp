/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Provider registry tests
 */

#include "balancer/provider_registry.hpp"
#include "core/errors.hpp"
#include "mock_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace llmgate;
using namespace llmgate::balancer;
using llmgate::testing::MockProvider;

namespace {

class ThrowingHealthCheckProvider : public provider::Provider {
public:
    Response generate(const Request&) override { return Response{}; }
    bool health_check() const override { throw std::runtime_error("health endpoint unreachable"); }
};

} // namespace

TEST(ProviderRegistryTest, EmptyRegistryHasNoHealthyProvider) {
    ProviderRegistry registry;
    EXPECT_THROW(registry.select({}), NoHealthyProviderError);
}

TEST(ProviderRegistryTest, NullProviderIsRejected) {
    ProviderRegistry registry;
    EXPECT_THROW(registry.register_provider(ProviderKind::openai, nullptr), ConfigurationError);
}

TEST(ProviderRegistryTest, RegistrationProbesHealth) {
    ProviderRegistry registry;
    auto provider = std::make_shared<MockProvider>("local");
    registry.register_provider(ProviderKind::local, provider);
    EXPECT_GE(provider->health_checks(), 1u);
}

TEST(ProviderRegistryTest, UnhealthyProviderIsStillRegistered) {
    ProviderRegistry registry;
    auto provider = std::make_shared<MockProvider>("local");
    provider->set_healthy(false);

    registry.register_provider(ProviderKind::local, provider);
    EXPECT_TRUE(registry.contains(ProviderKind::local));
    EXPECT_THROW(registry.select({}), NoHealthyProviderError);
}

TEST(ProviderRegistryTest, PreferredKindWins) {
    ProviderRegistry registry;
    auto openai = std::make_shared<MockProvider>("openai", ProviderKind::openai);
    auto anthropic = std::make_shared<MockProvider>("anthropic", ProviderKind::anthropic);
    registry.register_provider(ProviderKind::openai, openai);
    registry.register_provider(ProviderKind::anthropic, anthropic);

    auto selection = registry.select({ProviderKind::anthropic});
    EXPECT_EQ(selection.kind, ProviderKind::anthropic);
    EXPECT_EQ(selection.provider, anthropic);
}

TEST(ProviderRegistryTest, FallsBackToRegistrationOrder) {
    ProviderRegistry registry;
    auto local = std::make_shared<MockProvider>("local");
    auto cohere = std::make_shared<MockProvider>("cohere", ProviderKind::cohere);
    registry.register_provider(ProviderKind::local, local);
    registry.register_provider(ProviderKind::cohere, cohere);

    // Unregistered preference is skipped
    auto selection = registry.select({ProviderKind::openai});
    EXPECT_EQ(selection.kind, ProviderKind::local);

    local->set_healthy(false);
    selection = registry.select({});
    EXPECT_EQ(selection.kind, ProviderKind::cohere);
}

TEST(ProviderRegistryTest, UnhealthyPreferenceFailsOver) {
    ProviderRegistry registry;
    auto openai = std::make_shared<MockProvider>("openai", ProviderKind::openai);
    auto local = std::make_shared<MockProvider>("local");
    registry.register_provider(ProviderKind::openai, openai);
    registry.register_provider(ProviderKind::local, local);

    openai->set_healthy(false);
    auto selection = registry.select({ProviderKind::openai});
    EXPECT_EQ(selection.kind, ProviderKind::local);
}

TEST(ProviderRegistryTest, HealthIsProbedOnEverySelection) {
    ProviderRegistry registry;
    auto local = std::make_shared<MockProvider>("local");
    registry.register_provider(ProviderKind::local, local);

    auto before = local->health_checks();
    registry.select({});
    registry.select({});
    EXPECT_EQ(local->health_checks(), before + 2);

    local->set_healthy(false);
    EXPECT_THROW(registry.select({}), NoHealthyProviderError);
    local->set_healthy(true);
    EXPECT_NO_THROW(registry.select({}));
}

TEST(ProviderRegistryTest, ReplacementKeepsPosition) {
    ProviderRegistry registry;
    registry.register_provider(ProviderKind::openai, std::make_shared<MockProvider>("a", ProviderKind::openai));
    registry.register_provider(ProviderKind::local, std::make_shared<MockProvider>("b"));

    auto replacement = std::make_shared<MockProvider>("c", ProviderKind::openai);
    registry.register_provider(ProviderKind::openai, replacement);

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.get(ProviderKind::openai), replacement);
    auto kinds = registry.kinds();
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds[0], ProviderKind::openai);
    EXPECT_EQ(kinds[1], ProviderKind::local);
}

TEST(ProviderRegistryTest, UnregisterRemovesKind) {
    ProviderRegistry registry;
    registry.register_provider(ProviderKind::local, std::make_shared<MockProvider>("local"));

    EXPECT_TRUE(registry.unregister_provider(ProviderKind::local));
    EXPECT_FALSE(registry.unregister_provider(ProviderKind::local));
    EXPECT_FALSE(registry.contains(ProviderKind::local));
    EXPECT_EQ(registry.get(ProviderKind::local), nullptr);
    EXPECT_THROW(registry.select({}), NoHealthyProviderError);
}

TEST(ProviderRegistryTest, ThrowingHealthCheckDoesNotPreventRegistration) {
    ProviderRegistry registry;
    EXPECT_NO_THROW(registry.register_provider(ProviderKind::local, std::make_shared<ThrowingHealthCheckProvider>()));
    EXPECT_TRUE(registry.contains(ProviderKind::local));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ProviderRegistryTest, RegistrationInterleavedWithSelection) {
    ProviderRegistry registry;
    const std::vector<ProviderKind> churned = {ProviderKind::openai, ProviderKind::cohere};
    registry.register_provider(ProviderKind::local, std::make_shared<MockProvider>("local"));

    std::atomic<bool> stop{false};
    std::atomic<int> bad_selections{0};
    std::atomic<int> selections{0};

    std::vector<std::thread> writers;
    for (auto kind : churned) {
        writers.emplace_back([&, kind]() {
            while (!stop.load()) {
                registry.register_provider(kind, std::make_shared<MockProvider>("churn", kind));
                registry.unregister_provider(kind);
            }
        });
    }

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&]() {
            for (int n = 0; n < 2000; ++n) {
                try {
                    auto selection = registry.select({ProviderKind::openai, ProviderKind::cohere});
                    bool known = selection.kind == ProviderKind::local ||
                                 std::find(churned.begin(), churned.end(), selection.kind) != churned.end();
                    if (!selection.provider || !known) {
                        ++bad_selections;
                    }
                    ++selections;
                } catch (const NoHealthyProviderError&) {
                    // local stays registered, so this must not happen
                    ++bad_selections;
                }
            }
        });
    }

    for (auto& reader : readers) {
        reader.join();
    }
    stop.store(true);
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(bad_selections.load(), 0);
    EXPECT_EQ(selections.load(), 4 * 2000);
    EXPECT_TRUE(registry.contains(ProviderKind::local));
    EXPECT_EQ(registry.size(), 1u);
}
