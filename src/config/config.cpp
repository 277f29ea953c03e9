/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Configuration System Implementation
 */

#include "config/config.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace llmgate::config {

namespace component = util::log_component;

namespace {

std::uint64_t parse_unsigned(const std::string& name, const std::string& value) {
    // stoull accepts a sign and wraps negatives
    if (value.empty() || value.find_first_of("+-") != std::string::npos) {
        throw ConfigurationError("invalid " + name + " value: " + value);
    }
    try {
        std::size_t consumed = 0;
        auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError("invalid " + name + " value: " + value);
    }
}

std::uint32_t parse_u32(const std::string& name, const std::string& value) {
    auto parsed = parse_unsigned(name, value);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw ConfigurationError(name + " value out of range: " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

double parse_double(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        auto parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError("invalid " + name + " value: " + value);
    }
}

bool parse_flag(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

/**
 * Match "--name VALUE" or "--name=VALUE"; advances i past a separate value
 */
std::optional<std::string> option_value(const std::string& arg, const std::string& name,
                                        int& i, int argc, char* argv[]) {
    if (arg == name) {
        if (i + 1 >= argc) {
            throw ConfigurationError("missing value for " + name);
        }
        return std::string(argv[++i]);
    }
    if (arg.starts_with(name + "=")) {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const DispatchSettings& d) {
    j = nlohmann::json{
        {"cache_capacity", d.cache_capacity},
        {"max_concurrent_requests", d.max_concurrent_requests},
        {"max_retries", d.max_retries},
        {"backoff_unit_ms", d.backoff_unit_ms},
        {"worker_threads", d.worker_threads},
        {"enable_batching", d.enable_batching},
        {"batch_size", d.batch_size},
        {"batch_timeout_ms", d.batch_timeout_ms},
        {"enable_pooling", d.enable_pooling},
        {"pool_max_size", d.pool_max_size}
    };
}

void from_json(const nlohmann::json& j, DispatchSettings& d) {
    if (j.contains("cache_capacity")) j.at("cache_capacity").get_to(d.cache_capacity);
    if (j.contains("max_concurrent_requests")) j.at("max_concurrent_requests").get_to(d.max_concurrent_requests);
    if (j.contains("max_retries")) j.at("max_retries").get_to(d.max_retries);
    if (j.contains("backoff_unit_ms")) j.at("backoff_unit_ms").get_to(d.backoff_unit_ms);
    if (j.contains("worker_threads")) j.at("worker_threads").get_to(d.worker_threads);
    if (j.contains("enable_batching")) j.at("enable_batching").get_to(d.enable_batching);
    if (j.contains("batch_size")) j.at("batch_size").get_to(d.batch_size);
    if (j.contains("batch_timeout_ms")) j.at("batch_timeout_ms").get_to(d.batch_timeout_ms);
    if (j.contains("enable_pooling")) j.at("enable_pooling").get_to(d.enable_pooling);
    if (j.contains("pool_max_size")) j.at("pool_max_size").get_to(d.pool_max_size);
}

void to_json(nlohmann::json& j, const ProviderSettings& p) {
    j = nlohmann::json{
        {"kind", p.kind},
        {"host", p.host},
        {"port", p.port},
        {"target", p.target},
        {"model", p.model},
        {"api_key", p.api_key.empty() ? "" : "***"},  // Never echo credentials
        {"instances", p.instances},
        {"timeout_ms", p.timeout_ms}
    };
}

void from_json(const nlohmann::json& j, ProviderSettings& p) {
    if (j.contains("kind")) j.at("kind").get_to(p.kind);
    if (j.contains("host")) j.at("host").get_to(p.host);
    if (j.contains("port")) j.at("port").get_to(p.port);
    if (j.contains("target")) j.at("target").get_to(p.target);
    if (j.contains("model")) j.at("model").get_to(p.model);
    if (j.contains("api_key")) j.at("api_key").get_to(p.api_key);
    if (j.contains("instances")) j.at("instances").get_to(p.instances);
    if (j.contains("timeout_ms")) j.at("timeout_ms").get_to(p.timeout_ms);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"dispatch", c.dispatch},
        {"providers", c.providers},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("dispatch")) j.at("dispatch").get_to(c.dispatch);
    if (j.contains("providers")) j.at("providers").get_to(c.providers);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Config validation
void Config::validate() const {
    if (dispatch.cache_capacity == 0) {
        throw ConfigurationError("dispatch.cache_capacity must be non-zero");
    }
    if (dispatch.max_concurrent_requests == 0) {
        throw ConfigurationError("dispatch.max_concurrent_requests must be non-zero");
    }
    if (dispatch.max_retries == 0) {
        throw ConfigurationError("dispatch.max_retries must be non-zero");
    }
    if (dispatch.backoff_unit_ms == 0) {
        throw ConfigurationError("dispatch.backoff_unit_ms must be non-zero");
    }
    if (dispatch.batch_size == 0) {
        throw ConfigurationError("dispatch.batch_size must be non-zero");
    }
    if (dispatch.batch_timeout_ms == 0) {
        throw ConfigurationError("dispatch.batch_timeout_ms must be non-zero");
    }
    if (dispatch.pool_max_size == 0) {
        throw ConfigurationError("dispatch.pool_max_size must be non-zero");
    }

    for (std::size_t i = 0; i < providers.size(); ++i) {
        const auto& provider = providers[i];
        const auto prefix = "providers[" + std::to_string(i) + "]";

        auto kind = parse_provider_kind(provider.kind);
        if (!kind) {
            throw ConfigurationError(prefix + ".kind: unknown provider kind '" + provider.kind + "'");
        }
        if (provider.host.empty()) {
            throw ConfigurationError(prefix + ".host cannot be empty");
        }
        if (provider.port == 0) {
            throw ConfigurationError(prefix + ".port must be non-zero");
        }
        if (provider.instances == 0) {
            throw ConfigurationError(prefix + ".instances must be non-zero");
        }
        if (is_remote_kind(*kind) && provider.api_key.empty()) {
            throw ConfigurationError(prefix + ": missing api_key for " + provider.kind);
        }
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw ConfigurationError("logging.level: unknown level '" + logging.level + "'");
    }

    LLMGATE_LOG_DEBUG(component::Config, "Configuration validated successfully");
}

std::string resolve_secret(const std::string& value) {
    if (value.size() < 3 || !value.starts_with("${") || !value.ends_with("}")) {
        return value;
    }

    auto name = value.substr(2, value.size() - 3);
    const char* resolved = std::getenv(name.c_str());
    if (!resolved) {
        throw ConfigurationError("environment variable " + name + " not found");
    }
    return resolved;
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    config_ = Config{};
    run_options_ = RunOptions{};

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    apply_cli_overrides(argc, argv);

    resolve_secrets();

    config_.validate();

    LLMGATE_LOG_INFO(component::Config, "Configuration loaded: {} providers, cache_capacity={}, max_concurrent={}",
                     config_.providers.size(), config_.dispatch.cache_capacity,
                     config_.dispatch.max_concurrent_requests);
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

RunOptions ConfigManager::get_run_options() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return run_options_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "LLMGATE - Multi-Provider LLM Dispatch Engine\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS] [PROMPT...]\n"
              << "\n"
              << "Dispatches each PROMPT (or each line of stdin when none is given)\n"
              << "to the configured providers and prints the responses.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  --prefer KIND           Preferred provider kind (can be repeated)\n"
              << "  --max-tokens NUM        Generation size bound (default: 1000)\n"
              << "  --temperature NUM       Sampling temperature (default: 0.7)\n"
              << "  --cache-capacity NUM    Response cache entries (default: 1000)\n"
              << "  --concurrency NUM       Max in-flight provider calls (default: 10)\n"
              << "  --max-retries NUM       Attempts per provider call (default: 3)\n"
              << "  --backoff-ms NUM        Backoff unit in milliseconds (default: 1000)\n"
              << "  -t, --threads NUM       Worker threads (default: auto)\n"
              << "  --batching              Enable request batching\n"
              << "  --pooling               Enable provider pooling\n"
              << "  --log-level LEVEL       trace/debug/info/warn/error/critical/off\n"
              << "\n"
              << "Provider kinds: openai, anthropic, cohere, local\n"
              << "\n"
              << "Environment Variables:\n"
              << "  LLMGATE_CONFIG            Path to configuration file\n"
              << "  LLMGATE_CACHE_CAPACITY    Response cache entries\n"
              << "  LLMGATE_MAX_CONCURRENT    Max in-flight provider calls\n"
              << "  LLMGATE_MAX_RETRIES       Attempts per provider call\n"
              << "  LLMGATE_BACKOFF_MS        Backoff unit in milliseconds\n"
              << "  LLMGATE_WORKER_THREADS    Worker threads\n"
              << "  LLMGATE_BATCHING          Enable batching (true/false)\n"
              << "  LLMGATE_BATCH_SIZE        Requests per batch\n"
              << "  LLMGATE_BATCH_TIMEOUT_MS  Batch window in milliseconds\n"
              << "  LLMGATE_POOLING           Enable pooling (true/false)\n"
              << "  LLMGATE_POOL_MAX_SIZE     Max pool instances per kind\n"
              << "  LLMGATE_LOG_LEVEL         Log level\n"
              << "  LLMGATE_LOG_FILE          Log file path (stderr if not set)\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"dispatch\": {\n"
              << "      \"cache_capacity\": 1000,\n"
              << "      \"max_concurrent_requests\": 10,\n"
              << "      \"max_retries\": 3,\n"
              << "      \"enable_batching\": false,\n"
              << "      \"batch_size\": 5,\n"
              << "      \"batch_timeout_ms\": 100\n"
              << "    },\n"
              << "    \"providers\": [\n"
              << "      {\"kind\": \"local\", \"host\": \"localhost\", \"port\": 8001},\n"
              << "      {\"kind\": \"openai\", \"host\": \"gateway.internal\", \"port\": 80,\n"
              << "       \"model\": \"gpt-4-turbo\", \"api_key\": \"${OPENAI_API_KEY}\"}\n"
              << "    ],\n"
              << "    \"logging\": {\n"
              << "      \"level\": \"info\",\n"
              << "      \"file\": \"\"\n"
              << "    }\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<llmgate::config::Config>();
        LLMGATE_LOG_DEBUG(component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    if (config_path_.empty()) {
        if (auto env = get_env("LLMGATE_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    auto& d = config_.dispatch;

    if (auto env = get_env("LLMGATE_CACHE_CAPACITY")) {
        d.cache_capacity = parse_unsigned("LLMGATE_CACHE_CAPACITY", *env);
    }
    if (auto env = get_env("LLMGATE_MAX_CONCURRENT")) {
        d.max_concurrent_requests = parse_unsigned("LLMGATE_MAX_CONCURRENT", *env);
    }
    if (auto env = get_env("LLMGATE_MAX_RETRIES")) {
        d.max_retries = parse_u32("LLMGATE_MAX_RETRIES", *env);
    }
    if (auto env = get_env("LLMGATE_BACKOFF_MS")) {
        d.backoff_unit_ms = parse_u32("LLMGATE_BACKOFF_MS", *env);
    }
    if (auto env = get_env("LLMGATE_WORKER_THREADS")) {
        d.worker_threads = parse_unsigned("LLMGATE_WORKER_THREADS", *env);
    }
    if (auto env = get_env("LLMGATE_BATCHING")) {
        d.enable_batching = parse_flag(*env);
    }
    if (auto env = get_env("LLMGATE_BATCH_SIZE")) {
        d.batch_size = parse_unsigned("LLMGATE_BATCH_SIZE", *env);
    }
    if (auto env = get_env("LLMGATE_BATCH_TIMEOUT_MS")) {
        d.batch_timeout_ms = parse_u32("LLMGATE_BATCH_TIMEOUT_MS", *env);
    }
    if (auto env = get_env("LLMGATE_POOLING")) {
        d.enable_pooling = parse_flag(*env);
    }
    if (auto env = get_env("LLMGATE_POOL_MAX_SIZE")) {
        d.pool_max_size = parse_unsigned("LLMGATE_POOL_MAX_SIZE", *env);
    }

    if (auto env = get_env("LLMGATE_LOG_LEVEL")) {
        config_.logging.level = *env;
    }
    if (auto env = get_env("LLMGATE_LOG_FILE")) {
        config_.logging.file = *env;
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    auto& d = config_.dispatch;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=")) continue;

        if (auto v = option_value(arg, "--cache-capacity", i, argc, argv)) {
            d.cache_capacity = parse_unsigned("--cache-capacity", *v);
            continue;
        }
        if (auto v = option_value(arg, "--concurrency", i, argc, argv)) {
            d.max_concurrent_requests = parse_unsigned("--concurrency", *v);
            continue;
        }
        if (auto v = option_value(arg, "--max-retries", i, argc, argv)) {
            d.max_retries = parse_u32("--max-retries", *v);
            continue;
        }
        if (auto v = option_value(arg, "--backoff-ms", i, argc, argv)) {
            d.backoff_unit_ms = parse_u32("--backoff-ms", *v);
            continue;
        }
        if (auto v = option_value(arg, "--threads", i, argc, argv)) {
            d.worker_threads = parse_unsigned("--threads", *v);
            continue;
        }
        if (auto v = option_value(arg, "-t", i, argc, argv)) {
            d.worker_threads = parse_unsigned("-t", *v);
            continue;
        }
        if (arg == "--batching") {
            d.enable_batching = true;
            continue;
        }
        if (arg == "--pooling") {
            d.enable_pooling = true;
            continue;
        }
        if (auto v = option_value(arg, "--log-level", i, argc, argv)) {
            config_.logging.level = *v;
            continue;
        }
        if (auto v = option_value(arg, "--prefer", i, argc, argv)) {
            auto kind = parse_provider_kind(*v);
            if (!kind) {
                throw ConfigurationError("unknown provider kind for --prefer: " + *v);
            }
            run_options_.preferences.push_back(*kind);
            continue;
        }
        if (auto v = option_value(arg, "--max-tokens", i, argc, argv)) {
            run_options_.max_tokens = parse_u32("--max-tokens", *v);
            continue;
        }
        if (auto v = option_value(arg, "--temperature", i, argc, argv)) {
            run_options_.temperature = parse_double("--temperature", *v);
            continue;
        }

        if (arg.starts_with("-")) {
            throw ConfigurationError("unknown option: " + arg);
        }
        run_options_.prompts.push_back(arg);
    }
}

void ConfigManager::resolve_secrets() {
    for (auto& provider : config_.providers) {
        provider.api_key = resolve_secret(provider.api_key);
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace llmgate::config
