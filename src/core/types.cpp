/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Core Types Implementation
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace llmgate {

std::string_view to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::openai:    return "openai";
        case ProviderKind::anthropic: return "anthropic";
        case ProviderKind::cohere:    return "cohere";
        case ProviderKind::local:     return "local";
    }
    return "unknown";
}

std::optional<ProviderKind> parse_provider_kind(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (auto kind : kProviderKinds) {
        if (lower == to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

bool is_remote_kind(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::openai:
        case ProviderKind::anthropic:
        case ProviderKind::cohere:
            return true;
        case ProviderKind::local:
            return false;
    }
    return false;
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json{
        {"content", r.content},
        {"provider", to_string(r.provider)},
        {"tokens_used", r.tokens_used},
        {"latency_ms", r.latency_ms},
        {"metadata", r.metadata}
    };
}

} // namespace llmgate
