/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 *
 * Command-line front end: dispatches prompts to the configured providers.
 */

#include "config/config.hpp"
#include "core/errors.hpp"
#include "dispatch/dispatcher.hpp"
#include "provider/http_provider.hpp"
#include "util/logger.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

llmgate::util::LogConfig make_log_config(const llmgate::config::LogSettings& settings) {
    llmgate::util::LogConfig log_config;
    log_config.level = llmgate::util::Logger::parse_level(settings.level).value_or(llmgate::util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

void register_providers(llmgate::dispatch::Dispatcher& dispatcher,
                        const llmgate::config::Config& config) {
    namespace component = llmgate::util::log_component;

    if (config.providers.empty()) {
        LLMGATE_LOG_WARN(component::Config, "No providers configured - every request will fail");
    }

    for (const auto& settings : config.providers) {
        // validate() has already rejected unknown kinds
        auto kind = *llmgate::parse_provider_kind(settings.kind);
        auto http_config = llmgate::provider::make_http_provider_config(settings);

        auto primary = std::make_shared<llmgate::provider::HttpProvider>(kind, http_config);
        dispatcher.register_provider(kind, primary);

        if (config.dispatch.enable_pooling) {
            // The registered instance doubles as pool member 0
            for (std::size_t i = 0; i < settings.instances; ++i) {
                auto instance = i == 0 ? primary : std::make_shared<llmgate::provider::HttpProvider>(kind, http_config);
                if (!dispatcher.add_pool_instance(kind, std::move(instance))) {
                    LLMGATE_LOG_WARN(component::Config, "Pool for {} is full, dropping remaining instances", settings.kind);
                    break;
                }
            }
        }

        LLMGATE_LOG_INFO(component::Config, "  - {} at {}:{}{} (instances={})",
                         settings.kind, settings.host, settings.port, settings.target, settings.instances);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        llmgate::config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();
        auto options = config_manager.get_run_options();

        llmgate::util::Logger::init(make_log_config(config.logging));
        LLMGATE_LOG_INFO(llmgate::util::log_component::Dispatcher, "LLMGATE dispatch engine v0.1.0");

        if (options.prompts.empty()) {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (!line.empty()) {
                    options.prompts.push_back(line);
                }
            }
        }

        int exit_code = 0;
        {
            llmgate::dispatch::Dispatcher dispatcher(config.dispatch);
            register_providers(dispatcher, config);

            // Enough submitters to fill the concurrency ceiling and a whole batch
            std::size_t submitter_count = config.dispatch.max_concurrent_requests;
            if (config.dispatch.enable_batching) {
                submitter_count = std::max(submitter_count, config.dispatch.batch_size);
            }
            boost::asio::thread_pool submitters(submitter_count);

            std::vector<std::future<llmgate::Response>> results;
            results.reserve(options.prompts.size());
            for (const auto& prompt : options.prompts) {
                llmgate::Request request;
                request.prompt = prompt;
                request.max_tokens = options.max_tokens;
                request.temperature = options.temperature;
                request.provider_preferences = options.preferences;

                auto task = std::make_shared<std::packaged_task<llmgate::Response()>>(
                    [&dispatcher, request = std::move(request)]() { return dispatcher.generate(request); });
                results.push_back(task->get_future());
                boost::asio::post(submitters, [task]() { (*task)(); });
            }

            for (std::size_t i = 0; i < results.size(); ++i) {
                try {
                    auto response = results[i].get();
                    std::cout << "[" << llmgate::to_string(response.provider) << "] "
                              << response.content << "\n";
                } catch (const std::exception& e) {
                    std::cerr << "Request " << (i + 1) << " failed: " << e.what() << "\n";
                    exit_code = 1;
                }
            }

            submitters.join();
            std::cout << dispatcher.get_stats().to_json().dump(2) << std::endl;
        }

        llmgate::util::Logger::instance().shutdown();
        return exit_code;

    } catch (const llmgate::ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
