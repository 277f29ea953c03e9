/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * HTTP Provider - Generation backend reached over plain HTTP/1.1
 */

#ifndef LLMGATE_PROVIDER_HTTP_PROVIDER_HPP
#define LLMGATE_PROVIDER_HTTP_PROVIDER_HPP

#include "config/config.hpp"
#include "provider/provider.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace llmgate::provider {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * HTTP provider configuration
 */
struct HttpProviderConfig {
    std::string host{"localhost"};
    std::uint16_t port{8001};
    std::string target{"/v1/generate"};
    std::string model;
    std::string api_key;                                // Sent as a bearer token when set
    std::chrono::milliseconds timeout{30000};           // Whole exchange: connect, write, read
    std::uint32_t unhealthy_threshold{3};               // Consecutive failures before tripping
    std::chrono::milliseconds recovery_interval{5000};  // Time tripped before a probe is allowed
};

/**
 * Build an HttpProviderConfig from one configured backend
 */
HttpProviderConfig make_http_provider_config(const config::ProviderSettings& settings);

/**
 * HTTP provider
 *
 * POSTs {"model","prompt","max_tokens","temperature"} to host:port/target and
 * reads {"content","tokens_used"} back. Each call opens its own connection and
 * blocks the calling worker thread until the exchange completes or times out.
 *
 * Health is tracked passively from call outcomes, circuit breaker style:
 * after unhealthy_threshold consecutive failures the provider reports
 * unhealthy. Once recovery_interval has passed since the last failure it
 * reports healthy again so that one request can probe the backend; a
 * success closes the circuit, another failure restarts the interval.
 */
class HttpProvider : public Provider {
public:
    HttpProvider(ProviderKind kind, const HttpProviderConfig& config);
    ~HttpProvider() override = default;

    HttpProvider(const HttpProvider&) = delete;
    HttpProvider& operator=(const HttpProvider&) = delete;

    /**
     * @throws beast::system_error on transport failure or timeout
     * @throws std::runtime_error on a non-2xx status or an unreadable body
     */
    Response generate(const Request& request) override;

    bool health_check() const override;

    ProviderKind kind() const noexcept { return kind_; }
    const HttpProviderConfig& get_config() const noexcept { return config_; }

    std::uint32_t consecutive_failures() const {
        return consecutive_failures_.load(std::memory_order_relaxed);
    }

    /**
     * Serialize the request body sent to the backend
     */
    static std::string build_request_body(const Request& request, std::string_view model);

    /**
     * Parse a backend response body into a Response
     * @throws std::runtime_error if the body is not JSON or lacks "content"
     */
    static Response parse_response_body(std::string_view body, ProviderKind kind);

private:
    http::request<http::string_body> build_http_request(const Request& request) const;

    /**
     * Perform one exchange; the caller's thread runs a private io_context
     */
    http::response<http::string_body> exchange(http::request<http::string_body>& request);

    void record_success();
    void record_failure();

    ProviderKind kind_;
    HttpProviderConfig config_;

    std::atomic<std::uint32_t> consecutive_failures_{0};
    mutable std::mutex state_mutex_;  // Protects last_failure_
    std::chrono::steady_clock::time_point last_failure_;
};

} // namespace llmgate::provider

#endif // LLMGATE_PROVIDER_HTTP_PROVIDER_HPP
