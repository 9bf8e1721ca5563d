#pragma once

#include "curl_http_client.hpp"
#include "http_client.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace torfetch {

struct Session {
    std::unique_ptr<HttpClient> client;
    std::uint64_t id{0};
};

// Hands out proxy-bound HTTP clients. Each attempt checks out its own session;
// sessions are never shared between concurrent attempts.
class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    // Throws ProxyUnavailableError when no usable proxy session can be made.
    [[nodiscard]] virtual Session acquire() = 0;
    // healthy=false reports that the session failed at the proxy layer.
    virtual void release(Session session, bool healthy) = 0;
};

// Checks a session out and hands it back when the lease goes out of scope.
class SessionLease {
public:
    explicit SessionLease(SessionProvider& provider) : provider_(provider), session_(provider.acquire()) {}
    ~SessionLease() { provider_.release(std::move(session_), healthy_); }

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    [[nodiscard]] HttpClient& client() { return *session_.client; }
    [[nodiscard]] std::uint64_t id() const noexcept { return session_.id; }
    void markUnhealthy() noexcept { healthy_ = false; }

private:
    SessionProvider& provider_;
    Session session_;
    bool healthy_{true};
};

struct TorSettings {
    std::string socks_host{"127.0.0.1"};
    int socks_port{9050};
    int max_checks{5};
    std::string check_url{"https://check.torproject.org/"};
    long connect_timeout_seconds{60};
    long stall_timeout_seconds{120};
};

// Every session gets its own SOCKS credentials, which Tor isolates onto a
// separate circuit. The proxy is verified before the first session and again
// after a session is released unhealthy.
class TorSessionProvider final : public SessionProvider {
public:
    explicit TorSessionProvider(TorSettings settings);

    [[nodiscard]] Session acquire() override;
    void release(Session session, bool healthy) override;

private:
    [[nodiscard]] HttpClientOptions optionsFor(std::uint64_t id) const;
    // Called with mutex_ held so only one check runs at a time.
    void verifyProxy();

    TorSettings settings_;
    std::mutex mutex_;
    std::uint64_t next_id_{1};
    bool verified_{false};
};

class DirectSessionProvider final : public SessionProvider {
public:
    explicit DirectSessionProvider(HttpClientOptions options);

    [[nodiscard]] Session acquire() override;
    void release(Session session, bool healthy) override;

private:
    HttpClientOptions options_;
    std::mutex mutex_;
    std::uint64_t next_id_{1};
};

[[nodiscard]] bool isTorCheckPage(const std::string& body);

} // namespace torfetch
