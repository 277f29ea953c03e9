/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Error types raised by the dispatch engine
 */

#ifndef LLMGATE_CORE_ERRORS_HPP
#define LLMGATE_CORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace llmgate {

/**
 * Unknown provider kind, missing credential or invalid settings.
 * Never retried.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error("Configuration error: " + what) {}
};

/**
 * No registered provider is currently healthy. Never retried.
 */
class NoHealthyProviderError : public std::runtime_error {
public:
    NoHealthyProviderError()
        : std::runtime_error("No healthy providers available") {}
};

/**
 * A provider call failed on every permitted attempt
 */
class ProviderError : public std::runtime_error {
public:
    ProviderError(std::string label, std::uint32_t attempts, const std::string& cause)
        : std::runtime_error(label + " failed after " + std::to_string(attempts) +
                             " attempt" + (attempts == 1 ? "" : "s") + ": " + cause)
        , label_(std::move(label))
        , attempts_(attempts) {}

    const std::string& label() const noexcept { return label_; }
    std::uint32_t attempts() const noexcept { return attempts_; }

private:
    std::string label_;
    std::uint32_t attempts_;
};

} // namespace llmgate

#endif // LLMGATE_CORE_ERRORS_HPP
