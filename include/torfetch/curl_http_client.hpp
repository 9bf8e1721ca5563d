#pragma once

#include "http_client.hpp"

#include <memory>
#include <string>

namespace torfetch {

struct HttpClientOptions {
    // Empty means a direct connection, e.g. "socks5h://127.0.0.1:9050".
    std::string proxy_url;
    std::string proxy_username;
    std::string proxy_password;
    long connect_timeout_seconds{60};
    // A transfer slower than 1 byte/s for this long is aborted as a timeout.
    long stall_timeout_seconds{120};
    std::string user_agent{"Mozilla/5.0 (Windows NT 10.0; rv:115.0) Gecko/20100101 Firefox/115.0"};
};

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientOptions options);
    ~CurlHttpClient() override;

    [[nodiscard]] ResponseHead head(const std::string& url) override;
    void get(const std::string& url, const std::string& range_header, ResponseHandler& handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace torfetch
