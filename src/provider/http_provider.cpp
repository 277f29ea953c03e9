/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * HTTP Provider implementation
 */

#include "provider/http_provider.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace llmgate::provider {

namespace component = util::log_component;

HttpProviderConfig make_http_provider_config(const config::ProviderSettings& settings) {
    HttpProviderConfig config;
    config.host = settings.host;
    config.port = settings.port;
    config.target = settings.target;
    config.model = settings.model;
    config.api_key = settings.api_key;
    config.timeout = std::chrono::milliseconds(settings.timeout_ms);
    return config;
}

HttpProvider::HttpProvider(ProviderKind kind, const HttpProviderConfig& config)
    : kind_(kind)
    , config_(config)
{
    LLMGATE_LOG_DEBUG(component::Provider, "HttpProvider created: kind={}, endpoint={}:{}{}",
                      to_string(kind_), config_.host, config_.port, config_.target);
}

Response HttpProvider::generate(const Request& request) {
    auto http_request = build_http_request(request);

    try {
        auto http_response = exchange(http_request);

        auto status = static_cast<unsigned>(http_response.result_int());
        if (status < 200 || status >= 300) {
            throw std::runtime_error(std::string(to_string(kind_)) + " backend returned HTTP " +
                                     std::to_string(status));
        }

        auto response = parse_response_body(http_response.body(), kind_);
        record_success();
        return response;

    } catch (const beast::system_error& e) {
        record_failure();
        if (e.code() == beast::error::timeout) {
            LLMGATE_LOG_WARN(component::Provider, "Timeout communicating with {}:{}", config_.host, config_.port);
        } else {
            LLMGATE_LOG_WARN(component::Provider, "Connection error with {}:{}: {}",
                             config_.host, config_.port, e.code().message());
        }
        throw;
    } catch (const std::exception& e) {
        record_failure();
        LLMGATE_LOG_WARN(component::Provider, "Request to {}:{} failed: {}", config_.host, config_.port, e.what());
        throw;
    }
}

bool HttpProvider::health_check() const {
    if (consecutive_failures_.load(std::memory_order_relaxed) < config_.unhealthy_threshold) {
        return true;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    return std::chrono::steady_clock::now() - last_failure_ >= config_.recovery_interval;
}

std::string HttpProvider::build_request_body(const Request& request, std::string_view model) {
    nlohmann::json body{
        {"model", model},
        {"prompt", request.prompt},
        {"max_tokens", request.max_tokens},
        {"temperature", request.temperature}
    };
    return body.dump();
}

Response HttpProvider::parse_response_body(std::string_view body, ProviderKind kind) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw std::runtime_error("backend response is not a JSON object");
    }

    auto content = json.find("content");
    if (content == json.end() || !content->is_string()) {
        throw std::runtime_error("backend response has no \"content\" string");
    }

    Response response;
    response.content = content->get<std::string>();
    response.provider = kind;

    auto tokens = json.find("tokens_used");
    if (tokens != json.end() && tokens->is_number_unsigned()) {
        response.tokens_used = tokens->get<std::uint64_t>();
    }

    auto model = json.find("model");
    if (model != json.end() && model->is_string()) {
        response.metadata["model"] = *model;
    }

    return response;
}

http::request<http::string_body> HttpProvider::build_http_request(const Request& request) const {
    http::request<http::string_body> http_request{http::verb::post, config_.target, 11};

    http_request.set(http::field::host, config_.host + ":" + std::to_string(config_.port));
    http_request.set(http::field::user_agent, "llmgate");
    http_request.set(http::field::content_type, "application/json");
    http_request.set(http::field::accept, "application/json");
    if (!config_.api_key.empty()) {
        http_request.set(http::field::authorization, "Bearer " + config_.api_key);
    }

    http_request.body() = build_request_body(request, config_.model);
    http_request.prepare_payload();
    return http_request;
}

http::response<http::string_body> HttpProvider::exchange(http::request<http::string_body>& request) {
    asio::io_context io_context;
    tcp::resolver resolver(io_context);
    beast::tcp_stream stream(io_context);

    auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port));

    beast::error_code result;
    beast::flat_buffer buffer;
    http::response<http::string_body> response;

    // The stream timeout covers the whole exchange
    stream.expires_after(config_.timeout);
    stream.async_connect(endpoints, [&](beast::error_code ec, const tcp::endpoint&) {
        if (ec) {
            result = ec;
            return;
        }
        http::async_write(stream, request, [&](beast::error_code ec, std::size_t) {
            if (ec) {
                result = ec;
                return;
            }
            http::async_read(stream, buffer, response, [&](beast::error_code ec, std::size_t) {
                result = ec;
            });
        });
    });

    io_context.run();

    if (result) {
        throw beast::system_error(result);
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    // not_connected happens sometimes, so don't bother reporting it

    return response;
}

void HttpProvider::record_success() {
    auto previous = consecutive_failures_.exchange(0, std::memory_order_relaxed);
    if (previous >= config_.unhealthy_threshold) {
        LLMGATE_LOG_INFO(component::Provider, "{} backend {}:{} recovered", to_string(kind_), config_.host, config_.port);
    }
}

void HttpProvider::record_failure() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_failure_ = std::chrono::steady_clock::now();
    }

    auto failures = consecutive_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (failures == config_.unhealthy_threshold) {
        LLMGATE_LOG_WARN(component::Provider, "{} backend {}:{} marked unhealthy after {} consecutive failures",
                         to_string(kind_), config_.host, config_.port, failures);
    }
}

} // namespace llmgate::provider
