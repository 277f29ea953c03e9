/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Provider Registry - Implementation
 */

#include "balancer/provider_registry.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <mutex>

namespace llmgate::balancer {

using util::log_component::Registry;

ProviderRegistry::ProviderRegistry() {
    LLMGATE_LOG_DEBUG(Registry, "ProviderRegistry created");
}

ProviderRegistry::~ProviderRegistry() {
    LLMGATE_LOG_DEBUG(Registry, "ProviderRegistry destroyed");
}

void ProviderRegistry::register_provider(ProviderKind kind, std::shared_ptr<provider::Provider> provider) {
    if (!provider) {
        throw ConfigurationError("cannot register a null provider for " + std::string(to_string(kind)));
    }

    auto registered = provider;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = std::find_if(providers_.begin(), providers_.end(),
                               [kind](const Entry& entry) { return entry.first == kind; });
        if (it != providers_.end()) {
            it->second = std::move(provider);
        } else {
            providers_.emplace_back(kind, std::move(provider));
        }
    }

    // Probe outside the lock: a provider may be slow to answer
    try {
        if (!registered->health_check()) {
            LLMGATE_LOG_WARN(Registry, "Provider {} failed health check at registration", to_string(kind));
        }
    } catch (const std::exception& e) {
        LLMGATE_LOG_WARN(Registry, "Provider {} health check raised at registration: {}", to_string(kind), e.what());
    }

    LLMGATE_LOG_INFO(Registry, "Provider {} registered", to_string(kind));
}

bool ProviderRegistry::unregister_provider(ProviderKind kind) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = std::find_if(providers_.begin(), providers_.end(),
                           [kind](const Entry& entry) { return entry.first == kind; });
    if (it == providers_.end()) {
        return false;
    }

    providers_.erase(it);
    LLMGATE_LOG_INFO(Registry, "Provider {} unregistered", to_string(kind));
    return true;
}

ProviderSelection ProviderRegistry::select(const std::vector<ProviderKind>& preferences) const {
    auto providers = snapshot();

    for (auto preferred : preferences) {
        auto it = std::find_if(providers.begin(), providers.end(),
                               [preferred](const Entry& entry) { return entry.first == preferred; });
        if (it == providers.end()) {
            LLMGATE_LOG_DEBUG(Registry, "Preferred provider {} is not registered", to_string(preferred));
            continue;
        }
        if (it->second->health_check()) {
            return ProviderSelection{it->first, it->second};
        }
        LLMGATE_LOG_DEBUG(Registry, "Preferred provider {} is unhealthy", to_string(preferred));
    }

    for (const auto& [kind, provider] : providers) {
        if (provider->health_check()) {
            LLMGATE_LOG_DEBUG(Registry, "Selected provider {} by registration order", to_string(kind));
            return ProviderSelection{kind, provider};
        }
    }

    LLMGATE_LOG_WARN(Registry, "No healthy providers among {} registered", providers.size());
    throw NoHealthyProviderError();
}

std::shared_ptr<provider::Provider> ProviderRegistry::get(ProviderKind kind) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    for (const auto& entry : providers_) {
        if (entry.first == kind) {
            return entry.second;
        }
    }
    return nullptr;
}

bool ProviderRegistry::contains(ProviderKind kind) const {
    return get(kind) != nullptr;
}

std::size_t ProviderRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return providers_.size();
}

std::vector<ProviderKind> ProviderRegistry::kinds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ProviderKind> result;
    result.reserve(providers_.size());
    for (const auto& entry : providers_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<ProviderRegistry::Entry> ProviderRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return providers_;
}

} // namespace llmgate::balancer
