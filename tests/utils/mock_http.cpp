#include "mock_http.hpp"

#include <algorithm>
#include <string_view>

namespace test_utils {

void MockHttpClient::setResponse(const std::string& url, const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    url_responses_[url] = response;
}

void MockHttpClient::simulateNetworkError(const std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulate_error_ = true;
    error_message_ = error_msg;
}

void MockHttpClient::clearResponses() {
    std::lock_guard<std::mutex> lock(mutex_);
    url_responses_.clear();
    simulate_error_ = false;
    error_message_.clear();
}

net::RequestConfig MockHttpClient::lastConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_config_;
}

MockResponse MockHttpClient::lookup(const std::string& url, const net::RequestConfig& cfg) {
    ++request_count_;
    std::lock_guard<std::mutex> lock(mutex_);
    last_config_ = cfg;

    if (simulate_error_) {
        MockResponse error_resp;
        error_resp.has_error = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }

    auto url_it = url_responses_.find(url);
    if (url_it != url_responses_.end()) {
        return url_it->second;
    }

    // Default 404 response
    MockResponse not_found;
    not_found.status_code = 404;
    not_found.body = "Not Found";
    return not_found;
}

net::HttpResponse MockHttpClient::get(const std::string& url, const net::RequestConfig& cfg) {
    MockResponse mock = lookup(url, cfg);
    net::HttpResponse response;
    if (mock.has_error) {
        response.error = mock.error_message;
        return response;
    }
    response.status_code = mock.status_code;
    response.text = mock.body;
    response.bytes_received = mock.body.size();
    return response;
}

net::HttpResponse MockHttpClient::download(const std::string& url, const net::RequestConfig& cfg,
                                           const net::ChunkSink& sink) {
    MockResponse mock = lookup(url, cfg);
    net::HttpResponse response;
    if (mock.has_error && mock.fail_after_bytes == static_cast<std::size_t>(-1)) {
        response.error = mock.error_message;
        return response;
    }

    response.status_code = mock.status_code;
    response.content_length = mock.omit_content_length ? -1 : static_cast<int64_t>(mock.body.size());
    if (response.status_code < 200 || response.status_code >= 300) {
        return response;
    }

    std::string_view remaining(mock.body);
    while (!remaining.empty()) {
        std::size_t n = std::min(mock.chunk_size, remaining.size());
        if (response.bytes_received + n > mock.fail_after_bytes) {
            n = mock.fail_after_bytes - response.bytes_received;
        }
        if (n > 0) {
            response.bytes_received += n;
            int64_t announced = mock.length_known_at_end ? -1 : response.content_length;
            if (sink && !sink(remaining.substr(0, n), announced)) {
                response.error = "Failure writing output to destination";
                return response;
            }
            remaining.remove_prefix(n);
        }
        if (response.bytes_received >= mock.fail_after_bytes) {
            response.error = mock.error_message.empty() ? "Connection reset by peer" : mock.error_message;
            return response;
        }
    }
    return response;
}

MockResponse MockResponses::text(const std::string& body) {
    MockResponse response;
    response.status_code = 200;
    response.body = body;
    return response;
}

MockResponse MockResponses::status(int code) {
    MockResponse response;
    response.status_code = code;
    response.body = "error page";
    return response;
}

MockResponse MockResponses::network_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Network connection failed";
    return response;
}

MockResponse MockResponses::timeout_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Request timeout";
    return response;
}

std::string headerValue(const net::RequestConfig& cfg, const std::string& name) {
    for (const auto& h : cfg.headers) {
        if (h.name == name) {
            return h.value;
        }
    }
    return {};
}

}  // namespace test_utils
