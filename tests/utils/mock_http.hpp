#pragma once

#include "net/HttpClient.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace test_utils {

// Mock HTTP response structure
struct MockResponse {
    int status_code = 200;
    std::string body;
    std::string error_message;
    bool has_error = false;

    // Streaming behaviour for download()
    bool omit_content_length = false;
    bool length_known_at_end = false; // sink sees -1, the final response carries the length
    std::size_t chunk_size = 16 * 1024;
    std::size_t fail_after_bytes = static_cast<std::size_t>(-1); // transport error once this much was sent
};

// In-memory IHttpClient for tests
class MockHttpClient : public net::IHttpClient {
public:
    // Set response for a specific URL
    void setResponse(const std::string& url, const MockResponse& response);

    // Simulate a network error for all requests
    void simulateNetworkError(const std::string& error_msg);

    // Clear all mocked responses
    void clearResponses();

    int requestCount() const { return request_count_.load(); }
    net::RequestConfig lastConfig() const;

    net::HttpResponse get(const std::string& url, const net::RequestConfig& cfg) override;
    net::HttpResponse download(const std::string& url, const net::RequestConfig& cfg,
                               const net::ChunkSink& sink) override;

private:
    MockResponse lookup(const std::string& url, const net::RequestConfig& cfg);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MockResponse> url_responses_;
    bool simulate_error_ = false;
    std::string error_message_;
    net::RequestConfig last_config_;
    std::atomic<int> request_count_{0};
};

// Common mock responses for testing
class MockResponses {
public:
    static MockResponse text(const std::string& body);
    static MockResponse status(int code);
    static MockResponse network_error();
    static MockResponse timeout_error();
};

// Header value from a request config, empty when absent
std::string headerValue(const net::RequestConfig& cfg, const std::string& name);

}  // namespace test_utils
