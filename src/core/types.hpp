/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Core Types - Requests, responses and provider kinds
 */

#ifndef LLMGATE_CORE_TYPES_HPP
#define LLMGATE_CORE_TYPES_HPP

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmgate {

/**
 * Backend kinds a provider can be registered under.
 * Adding a backend means extending this enumeration and kProviderKinds.
 */
enum class ProviderKind {
    openai,
    anthropic,
    cohere,
    local
};

inline constexpr std::array<ProviderKind, 4> kProviderKinds{
    ProviderKind::openai,
    ProviderKind::anthropic,
    ProviderKind::cohere,
    ProviderKind::local
};

std::string_view to_string(ProviderKind kind);

/**
 * Parse a kind name (case-insensitive)
 * @return nullopt for unknown names
 */
std::optional<ProviderKind> parse_provider_kind(std::string_view name);

/**
 * True for kinds reached over a vendor's remote API (these need credentials)
 */
bool is_remote_kind(ProviderKind kind);

/**
 * A single generation request
 *
 * Only prompt, max_tokens and temperature take part in the cache fingerprint;
 * preferences and metadata do not.
 */
struct Request {
    std::string prompt;
    std::uint32_t max_tokens{1000};
    double temperature{0.7};
    std::vector<ProviderKind> provider_preferences;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * Result of a completed dispatch
 */
struct Response {
    std::string content;
    ProviderKind provider{ProviderKind::local};
    std::uint64_t tokens_used{0};
    double latency_ms{0.0};    // Stamped by the dispatcher
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const Response&) const = default;
};

// JSON serialization support
void to_json(nlohmann::json& j, const Response& r);

} // namespace llmgate

#endif // LLMGATE_CORE_TYPES_HPP
