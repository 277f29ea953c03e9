/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Provider Pool - Implementation
 */

#include "balancer/provider_pool.hpp"
#include "util/logger.hpp"

namespace llmgate::balancer {

using util::log_component::Pool;

ProviderPool::ProviderPool(const ProviderPoolConfig& config)
    : config_(config) {
    LLMGATE_LOG_DEBUG(Pool, "ProviderPool created with max_pool_size={}", config_.max_pool_size);
}

bool ProviderPool::add(ProviderKind kind, std::shared_ptr<provider::Provider> provider) {
    if (!provider) {
        return false;
    }

    std::lock_guard lock(mutex_);

    auto& pool = pools_[kind];
    if (pool.instances.size() >= config_.max_pool_size) {
        LLMGATE_LOG_DEBUG(Pool, "{} pool is full ({}), instance dropped",
                          to_string(kind), pool.instances.size());
        return false;
    }

    pool.instances.push_back(std::move(provider));
    LLMGATE_LOG_INFO(Pool, "Added provider to {} pool, size: {}", to_string(kind), pool.instances.size());
    return true;
}

std::shared_ptr<provider::Provider> ProviderPool::get(ProviderKind kind) {
    std::lock_guard lock(mutex_);

    auto it = pools_.find(kind);
    if (it == pools_.end() || it->second.instances.empty()) {
        return nullptr;
    }

    auto& pool = it->second;
    auto index = static_cast<std::size_t>(pool.cursor % pool.instances.size());
    ++pool.cursor;

    return pool.instances[index];
}

std::size_t ProviderPool::size(ProviderKind kind) const {
    std::lock_guard lock(mutex_);

    auto it = pools_.find(kind);
    return it == pools_.end() ? 0 : it->second.instances.size();
}

} // namespace llmgate::balancer
