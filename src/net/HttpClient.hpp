#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace net
{

struct Header
{
    std::string name;
    std::string value;
};

struct RequestConfig
{
    int connect_timeout_ms = 10000;
    int timeout_ms = 10000;
    std::vector<Header> headers;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text; // empty for streamed downloads
    std::string error; // non-empty on network/transport errors
    int64_t content_length = -1; // -1 when the server omitted it
    std::size_t bytes_received = 0; // body bytes handed to the sink

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Receives the body of a successful response piece by piece.
// contentLength is -1 while unknown; a transport may learn it only after the
// first chunks. Returning false aborts the transfer.
using ChunkSink = std::function<bool(std::string_view chunk, int64_t contentLength)>;

// Blocking HTTP client. Redirects are followed by every implementation.
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // GET with the whole body buffered into HttpResponse::text
    virtual HttpResponse get(const std::string& url, const RequestConfig& cfg) = 0;

    // GET streaming the body into sink. Bodies of non-2xx responses are
    // discarded and never reach the sink.
    virtual HttpResponse download(const std::string& url, const RequestConfig& cfg, const ChunkSink& sink) = 0;
};

} // namespace net
