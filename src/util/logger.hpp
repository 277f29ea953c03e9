/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Logger - Structured logging with spdlog
 *
 * Provides:
 * - Structured logging with levels (DEBUG, INFO, WARN, ERROR)
 * - Log format: timestamp, level, component, message
 * - Dispatch log: request id, provider, cache hit/miss, latency, outcome
 * - Configurable log level via config/environment
 * - Log rotation support (or stdout only)
 * - Request tracing with per-thread request ids
 */

#ifndef LLMGATE_UTIL_LOGGER_HPP
#define LLMGATE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace llmgate::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for stdout only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * One record per completed (or failed) dispatch
 */
struct DispatchLogEntry {
    std::string request_id;
    std::string provider;              // Empty when no provider was selected
    bool cache_hit{false};
    bool success{true};
    std::chrono::milliseconds latency{0};
    std::uint64_t tokens_used{0};
    std::string error;
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton that manages application-wide logging.
 *
 * Note: Destructor is public to allow std::unique_ptr to clean up the singleton.
 * The singleton pattern is maintained by keeping the constructor private.
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration
     * Must be called before any logging occurs
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    /**
     * Set the global log level
     */
    void set_level(LogLevel level);

    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    // Component-tagged logging methods
    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Log a dispatch record (dedicated dispatch log format)
     */
    void dispatch(const DispatchLogEntry& entry);

    /**
     * Flush all logs
     */
    void shutdown();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_) return;

        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        auto full_msg = fmt::format("[{}] {}", component, msg);

        switch (level) {
            case LogLevel::Trace:    logger_->trace(full_msg); break;
            case LogLevel::Debug:    logger_->debug(full_msg); break;
            case LogLevel::Info:     logger_->info(full_msg); break;
            case LogLevel::Warn:     logger_->warn(full_msg); break;
            case LogLevel::Error:    logger_->error(full_msg); break;
            case LogLevel::Critical: logger_->critical(full_msg); break;
            default: break;
        }
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> dispatch_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

/**
 * Request context for request id propagation
 *
 * Thread-local storage for request-scoped context.
 * Use RAII-style RequestContext to automatically manage scope.
 */
class RequestContext {
public:
    /**
     * Create a new request context (generates ID if not provided)
     */
    explicit RequestContext(std::string request_id = "");

    /**
     * Destructor clears the thread-local context
     */
    ~RequestContext();

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    const std::string& id() const { return request_id_; }

    /**
     * Get the current thread's request ID (empty if no context)
     */
    static std::string current_id();

    /**
     * Generate a unique request ID
     */
    static std::string generate_id();

private:
    std::string request_id_;
};

// Convenience macros for logging with automatic component tagging
#define LLMGATE_LOG_TRACE(component, ...) \
    ::llmgate::util::Logger::instance().trace(component, __VA_ARGS__)
#define LLMGATE_LOG_DEBUG(component, ...) \
    ::llmgate::util::Logger::instance().debug(component, __VA_ARGS__)
#define LLMGATE_LOG_INFO(component, ...) \
    ::llmgate::util::Logger::instance().info(component, __VA_ARGS__)
#define LLMGATE_LOG_WARN(component, ...) \
    ::llmgate::util::Logger::instance().warn(component, __VA_ARGS__)
#define LLMGATE_LOG_ERROR(component, ...) \
    ::llmgate::util::Logger::instance().error(component, __VA_ARGS__)
#define LLMGATE_LOG_CRITICAL(component, ...) \
    ::llmgate::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Dispatcher = "dispatcher";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Registry = "registry";
    constexpr std::string_view Pool = "pool";
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Governor = "governor";
    constexpr std::string_view Batcher = "batcher";
    constexpr std::string_view Provider = "provider";
}

} // namespace llmgate::util

#endif // LLMGATE_UTIL_LOGGER_HPP
