/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (LLMGATE_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef LLMGATE_CONFIG_CONFIG_HPP
#define LLMGATE_CONFIG_CONFIG_HPP

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace llmgate::config {

/**
 * Dispatch engine settings
 */
struct DispatchSettings {
    std::size_t cache_capacity{1000};
    std::size_t max_concurrent_requests{10};
    std::uint32_t max_retries{3};
    std::uint32_t backoff_unit_ms{1000};
    std::size_t worker_threads{0};  // 0 = max(hardware_concurrency, max_concurrent_requests)

    bool enable_batching{false};
    std::size_t batch_size{5};
    std::uint32_t batch_timeout_ms{100};

    bool enable_pooling{false};
    std::size_t pool_max_size{10};
};

/**
 * One configured backend
 */
struct ProviderSettings {
    std::string kind{"local"};
    std::string host{"localhost"};
    std::uint16_t port{8001};
    std::string target{"/v1/generate"};
    std::string model;
    std::string api_key;            // Literal or ${ENV_VAR}
    std::size_t instances{1};       // Pool instances when pooling is enabled
    std::uint32_t timeout_ms{30000};

    bool operator==(const ProviderSettings&) const = default;
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Per-invocation options for the CLI (not part of the file format)
 */
struct RunOptions {
    std::vector<std::string> prompts;
    std::vector<ProviderKind> preferences;
    std::uint32_t max_tokens{1000};
    double temperature{0.7};
};

/**
 * Complete application configuration
 */
struct Config {
    DispatchSettings dispatch;
    std::vector<ProviderSettings> providers;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     * @throws ConfigurationError
     */
    void validate() const;
};

/**
 * Resolve a secret reference
 *
 * "${NAME}" is replaced by the value of environment variable NAME; any other
 * value is returned unchanged.
 *
 * @throws ConfigurationError if the referenced variable is not set
 */
std::string resolve_secret(const std::string& value);

/**
 * Configuration manager - handles loading and parsing
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws ConfigurationError on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Prompts, preferences and generation options given on the command line
     */
    RunOptions get_run_options() const;

    std::filesystem::path get_config_path() const;

    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);

    void apply_environment_overrides();

    void apply_cli_overrides(int argc, char* argv[]);

    /**
     * Replace ${ENV} references in provider credentials
     */
    void resolve_secrets();

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    RunOptions run_options_;
    std::filesystem::path config_path_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const DispatchSettings& d);
void from_json(const nlohmann::json& j, DispatchSettings& d);
void to_json(nlohmann::json& j, const ProviderSettings& p);
void from_json(const nlohmann::json& j, ProviderSettings& p);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace llmgate::config

#endif // LLMGATE_CONFIG_CONFIG_HPP
