#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace torfetch {

struct ResponseHead {
    long status{0};
    std::optional<std::uint64_t> content_length;
    std::string location;
};

class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    // Called once when the final response headers are known. Returning false
    // ends the transfer without reading the body.
    virtual bool onHead(const ResponseHead& head) = 0;
    // Called for every piece of body in arrival order. Returning false ends
    // the transfer.
    virtual bool onData(const char* data, std::size_t size) = 0;
    // Polled while the transfer is idle or running.
    [[nodiscard]] virtual bool cancelled() const { return false; }
};

// One HTTP context bound to a proxy circuit. Failures are reported as
// ProxyUnavailableError (proxy layer) or TransportError (everything else).
// A transfer ended by the handler returns normally.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Redirects are not followed.
    [[nodiscard]] virtual ResponseHead head(const std::string& url) = 0;
    // range_header is a complete Range value such as "bytes=1024-", or empty.
    virtual void get(const std::string& url, const std::string& range_header, ResponseHandler& handler) = 0;
};

struct Page {
    long status{0};
    std::string body;
};

// Reads a whole response body; meant for small pages only.
[[nodiscard]] Page fetchPage(HttpClient& client, const std::string& url, std::size_t max_bytes = 8 * 1024 * 1024);

} // namespace torfetch
