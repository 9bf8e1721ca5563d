#include "torfetch/session_provider.hpp"

#include "torfetch/errors.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace torfetch {

bool isTorCheckPage(const std::string& body) {
    return body.find("Congratulations. This browser is configured to use Tor.") != std::string::npos;
}

TorSessionProvider::TorSessionProvider(TorSettings settings) : settings_(std::move(settings)) {}

Session TorSessionProvider::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!verified_) {
        verifyProxy();
    }

    Session session;
    session.id = next_id_++;
    session.client = std::make_unique<CurlHttpClient>(optionsFor(session.id));
    spdlog::debug("Issued Tor session #{}", session.id);
    return session;
}

void TorSessionProvider::release(Session session, bool healthy) {
    if (healthy) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    verified_ = false;
    spdlog::warn("Session #{} failed at the proxy layer, the proxy will be checked again", session.id);
}

HttpClientOptions TorSessionProvider::optionsFor(std::uint64_t id) const {
    HttpClientOptions options;
    options.proxy_url = fmt::format("socks5h://{}:{}", settings_.socks_host, settings_.socks_port);
    // Distinct SOCKS credentials put each session on its own circuit.
    options.proxy_username = fmt::format("torfetch-{}", id);
    options.proxy_password = "torfetch";
    options.connect_timeout_seconds = settings_.connect_timeout_seconds;
    options.stall_timeout_seconds = settings_.stall_timeout_seconds;
    return options;
}

void TorSessionProvider::verifyProxy() {
    const int max_checks = std::max(1, settings_.max_checks);
    for (int check = 1; check <= max_checks; ++check) {
        CurlHttpClient client{optionsFor(0)};
        try {
            const auto page = fetchPage(client, settings_.check_url);
            if (isTorCheckPage(page.body)) {
                verified_ = true;
                spdlog::info("Tor proxy at {}:{} is working", settings_.socks_host, settings_.socks_port);
                return;
            }
            spdlog::warn("Tor check {}/{}: traffic is not routed through Tor (HTTP {})", check, max_checks,
                         page.status);
        } catch (const DownloadError& ex) {
            spdlog::warn("Tor check {}/{} failed: {}", check, max_checks, ex.what());
        }

        if (check < max_checks) {
            std::this_thread::sleep_for(std::chrono::seconds(check));
        }
    }

    throw ProxyUnavailableError(fmt::format("Tor proxy at {}:{} failed {} checks", settings_.socks_host,
                                            settings_.socks_port, max_checks));
}

DirectSessionProvider::DirectSessionProvider(HttpClientOptions options) : options_(std::move(options)) {}

Session DirectSessionProvider::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    Session session;
    session.id = next_id_++;
    session.client = std::make_unique<CurlHttpClient>(options_);
    return session;
}

void DirectSessionProvider::release(Session session, bool healthy) {
    if (!healthy) {
        spdlog::warn("Direct session #{} reported a proxy failure", session.id);
    }
}

} // namespace torfetch
