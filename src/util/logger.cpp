/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <cctype>
#include <random>
#include <vector>

namespace llmgate::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

static thread_local std::string tl_request_id;

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
        created = true;
    });
    if (!created) {
        // Already initialized with defaults by an early instance() call
        instance_->configure(config);
    }
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        // stderr keeps stdout free for CLI output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("llmgate", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    // Dispatch records follow the main level
    dispatch_logger_ = std::make_shared<spdlog::logger>("dispatch", sinks.begin(), sinks.end());
    dispatch_logger_->set_level(to_spdlog_level(config.level));

    current_level_.store(config.level, std::memory_order_relaxed);

    spdlog::drop("llmgate");
    spdlog::drop("dispatch");
    spdlog::register_logger(logger_);
    spdlog::register_logger(dispatch_logger_);
    spdlog::set_default_logger(logger_);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    if (dispatch_logger_) {
        dispatch_logger_->set_level(to_spdlog_level(level));
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower;
    lower.reserve(level_str.size());
    for (char c : level_str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical" || lower == "crit" || lower == "fatal") return LogLevel::Critical;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "unknown";
    }
}

void Logger::dispatch(const DispatchLogEntry& entry) {
    if (!dispatch_logger_) return;

    // Format: request_id provider HIT|MISS latency_ms tokens OK|FAIL [error]
    // Example: 3f9a0c1d2e4b5a67 openai MISS 412ms 96 OK
    dispatch_logger_->info(
        "{} {} {} {}ms {} {}{}",
        entry.request_id.empty() ? "-" : entry.request_id,
        entry.provider.empty() ? "-" : entry.provider,
        entry.cache_hit ? "HIT" : "MISS",
        entry.latency.count(),
        entry.tokens_used,
        entry.success ? "OK" : "FAIL",
        entry.error.empty() ? "" : fmt::format(" \"{}\"", entry.error)
    );
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (dispatch_logger_) {
        dispatch_logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

// RequestContext implementation

RequestContext::RequestContext(std::string request_id)
    : request_id_(request_id.empty() ? generate_id() : std::move(request_id))
{
    tl_request_id = request_id_;
}

RequestContext::~RequestContext() {
    tl_request_id.clear();
}

std::string RequestContext::current_id() {
    return tl_request_id;
}

std::string RequestContext::generate_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    static constexpr char hex_chars[] = "0123456789abcdef";

    std::uint64_t value = rng();
    std::string id;
    id.reserve(16);

    for (int i = 0; i < 16; ++i) {
        id.push_back(hex_chars[(value >> (i * 4)) & 0xF]);
    }

    return id;
}

} // namespace llmgate::util
