/**
 * LLMGATE - Multi-Provider LLM Dispatch Engine
 * HTTP provider tests
 */

#include "provider/http_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace llmgate;
using namespace llmgate::provider;
using namespace std::chrono_literals;

namespace {

/**
 * Loopback server answering exactly one request with a canned response
 */
class OneShotServer {
public:
    OneShotServer(http::status status, std::string body)
        : acceptor_(io_context_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
    {
        thread_ = std::thread([this, status, body = std::move(body)]() {
            tcp::socket socket(io_context_);
            acceptor_.accept(socket);

            beast::flat_buffer buffer;
            http::request<http::string_body> request;
            http::read(socket, buffer, request);

            received_body_ = request.body();
            received_target_ = std::string(request.target());
            received_authorization_ = std::string(request[http::field::authorization]);

            http::response<http::string_body> response{status, request.version()};
            response.set(http::field::content_type, "application/json");
            response.body() = body;
            response.prepare_payload();
            http::write(socket, response);

            beast::error_code ec;
            socket.shutdown(tcp::socket::shutdown_send, ec);
        });
    }

    ~OneShotServer() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::uint16_t port() const { return acceptor_.local_endpoint().port(); }

    // Valid once the exchange is over
    void wait() { thread_.join(); }
    const std::string& received_body() const { return received_body_; }
    const std::string& received_target() const { return received_target_; }
    const std::string& received_authorization() const { return received_authorization_; }

private:
    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread thread_;

    std::string received_body_;
    std::string received_target_;
    std::string received_authorization_;
};

HttpProviderConfig loopback_config(std::uint16_t port) {
    HttpProviderConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.timeout = 2000ms;
    return config;
}

Request make_request(const std::string& prompt) {
    Request request;
    request.prompt = prompt;
    request.max_tokens = 64;
    request.temperature = 0.5;
    return request;
}

} // namespace

TEST(HttpProviderTest, BuildsRequestBody) {
    auto body = nlohmann::json::parse(HttpProvider::build_request_body(make_request("hello"), "gpt-4-turbo"));
    EXPECT_EQ(body["model"], "gpt-4-turbo");
    EXPECT_EQ(body["prompt"], "hello");
    EXPECT_EQ(body["max_tokens"], 64);
    EXPECT_DOUBLE_EQ(body["temperature"].get<double>(), 0.5);
}

TEST(HttpProviderTest, ParsesResponseBody) {
    auto response = HttpProvider::parse_response_body(
        R"({"content": "generated text", "tokens_used": 42, "model": "claude-3"})", ProviderKind::anthropic);
    EXPECT_EQ(response.content, "generated text");
    EXPECT_EQ(response.tokens_used, 42u);
    EXPECT_EQ(response.provider, ProviderKind::anthropic);
    EXPECT_EQ(response.metadata["model"], "claude-3");
}

TEST(HttpProviderTest, TokensAreOptional) {
    auto response = HttpProvider::parse_response_body(R"({"content": "x"})", ProviderKind::local);
    EXPECT_EQ(response.tokens_used, 0u);
}

TEST(HttpProviderTest, RejectsMalformedBodies) {
    EXPECT_THROW(HttpProvider::parse_response_body("not json", ProviderKind::local), std::runtime_error);
    EXPECT_THROW(HttpProvider::parse_response_body("[1, 2]", ProviderKind::local), std::runtime_error);
    EXPECT_THROW(HttpProvider::parse_response_body(R"({"text": "x"})", ProviderKind::local), std::runtime_error);
    EXPECT_THROW(HttpProvider::parse_response_body(R"({"content": 5})", ProviderKind::local), std::runtime_error);
}

TEST(HttpProviderTest, GeneratesAgainstLiveBackend) {
    OneShotServer server(http::status::ok, R"({"content": "hi there", "tokens_used": 7})");

    auto config = loopback_config(server.port());
    config.target = "/api/generate";
    config.model = "llama3";
    config.api_key = "sk-test";
    HttpProvider provider(ProviderKind::openai, config);

    auto response = provider.generate(make_request("hello"));
    server.wait();

    EXPECT_EQ(response.content, "hi there");
    EXPECT_EQ(response.tokens_used, 7u);
    EXPECT_EQ(response.provider, ProviderKind::openai);

    EXPECT_EQ(server.received_target(), "/api/generate");
    EXPECT_EQ(server.received_authorization(), "Bearer sk-test");
    auto sent = nlohmann::json::parse(server.received_body());
    EXPECT_EQ(sent["prompt"], "hello");
    EXPECT_EQ(sent["model"], "llama3");

    EXPECT_TRUE(provider.health_check());
    EXPECT_EQ(provider.consecutive_failures(), 0u);
}

TEST(HttpProviderTest, NoAuthorizationWithoutKey) {
    OneShotServer server(http::status::ok, R"({"content": "ok"})");
    HttpProvider provider(ProviderKind::local, loopback_config(server.port()));

    provider.generate(make_request("hello"));
    server.wait();
    EXPECT_TRUE(server.received_authorization().empty());
}

TEST(HttpProviderTest, ErrorStatusIsFailure) {
    OneShotServer server(http::status::internal_server_error, R"({"error": "overloaded"})");
    HttpProvider provider(ProviderKind::local, loopback_config(server.port()));

    EXPECT_THROW(provider.generate(make_request("hello")), std::runtime_error);
    EXPECT_EQ(provider.consecutive_failures(), 1u);
}

TEST(HttpProviderTest, RepeatedFailuresTripHealth) {
    auto config = loopback_config(1);  // Nothing listens on port 1
    config.unhealthy_threshold = 2;
    config.recovery_interval = 60s;
    HttpProvider provider(ProviderKind::local, config);

    EXPECT_THROW(provider.generate(make_request("a")), std::exception);
    EXPECT_TRUE(provider.health_check());

    EXPECT_THROW(provider.generate(make_request("b")), std::exception);
    EXPECT_FALSE(provider.health_check());
    EXPECT_EQ(provider.consecutive_failures(), 2u);
}

TEST(HttpProviderTest, ProbeAllowedAfterRecoveryInterval) {
    auto config = loopback_config(1);
    config.unhealthy_threshold = 1;
    config.recovery_interval = 50ms;
    HttpProvider provider(ProviderKind::local, config);

    EXPECT_THROW(provider.generate(make_request("a")), std::exception);
    EXPECT_FALSE(provider.health_check());

    std::this_thread::sleep_for(80ms);
    EXPECT_TRUE(provider.health_check());
}

TEST(HttpProviderTest, ConfigFromSettings) {
    config::ProviderSettings settings;
    settings.kind = "cohere";
    settings.host = "gateway.internal";
    settings.port = 8080;
    settings.target = "/generate";
    settings.model = "command-r";
    settings.api_key = "key";
    settings.timeout_ms = 1500;

    auto config = make_http_provider_config(settings);
    EXPECT_EQ(config.host, "gateway.internal");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.target, "/generate");
    EXPECT_EQ(config.model, "command-r");
    EXPECT_EQ(config.api_key, "key");
    EXPECT_EQ(config.timeout, 1500ms);
}
