#include "fake_http.hpp"

#include "torfetch/errors.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

namespace torfetch::testing {

namespace {

std::string lastSegment(const std::string& url) {
    const auto end = url.find_first_of("?#");
    const auto path = url.substr(0, end);
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

void FakeServer::put(const std::string& url, FakeResource resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    resources_[url] = std::move(resource);
}

FakeResource& FakeServer::resource(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.at(url);
}

int FakeServer::getCount(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = gets_.find(url);
    return it == gets_.end() ? 0 : it->second;
}

int FakeServer::headCount(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = heads_.find(url);
    return it == heads_.end() ? 0 : it->second;
}

std::vector<std::string> FakeServer::rangesSeen(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = ranges_.find(url);
    return it == ranges_.end() ? std::vector<std::string>{} : it->second;
}

int FakeServer::maxConcurrentGets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_active_;
}

int FakeServer::maxConcurrentPerFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_active_by_name_;
}

ResponseHead FakeHttpClient::head(const std::string& url) {
    std::lock_guard<std::mutex> lock(server_.mutex_);
    ++server_.heads_[url];

    ResponseHead head;
    const auto it = server_.resources_.find(url);
    if (it == server_.resources_.end()) {
        head.status = 404;
        return head;
    }
    const auto& resource = it->second;
    head.status = resource.location.empty() ? 200 : 302;
    head.location = resource.location;
    if (resource.send_length) {
        head.content_length = resource.body.size();
    }
    return head;
}

void FakeHttpClient::get(const std::string& url, const std::string& range_header, ResponseHandler& handler) {
    const std::string name = lastSegment(url);
    FakeResource snapshot;
    bool exists = false;
    {
        std::lock_guard<std::mutex> lock(server_.mutex_);
        ++server_.gets_[url];
        server_.ranges_[url].push_back(range_header);

        const auto it = server_.resources_.find(url);
        exists = it != server_.resources_.end();
        if (exists) {
            auto& resource = it->second;
            if (resource.proxy_failures > 0) {
                --resource.proxy_failures;
                throw ProxyUnavailableError("fake proxy refused the connection");
            }
            if (resource.transport_failures > 0) {
                --resource.transport_failures;
                throw TransportError("fake connection reset by peer");
            }
            snapshot = resource;
            resource.truncate_after = 0;
            resource.short_by = 0;
        }

        ++server_.active_;
        server_.max_active_ = std::max(server_.max_active_, server_.active_);
        const int by_name = ++server_.active_by_name_[name];
        server_.max_active_by_name_ = std::max(server_.max_active_by_name_, by_name);
    }

    struct ActiveGuard {
        FakeServer& server;
        std::string name;
        ~ActiveGuard() {
            std::lock_guard<std::mutex> lock(server.mutex_);
            --server.active_;
            --server.active_by_name_[name];
        }
    } guard{server_, name};

    // An interrupt while connecting ends the transfer before any headers.
    if (handler.cancelled()) {
        return;
    }

    if (!exists) {
        ResponseHead head;
        head.status = 404;
        handler.onHead(head);
        return;
    }

    std::size_t offset = 0;
    long status = 200;
    if (!range_header.empty() && snapshot.honor_range) {
        const auto dash = range_header.find('-');
        offset = static_cast<std::size_t>(std::stoull(range_header.substr(6, dash - 6)));
        if (offset >= snapshot.body.size()) {
            ResponseHead head;
            head.status = 416;
            handler.onHead(head);
            return;
        }
        status = 206;
    }
    if (snapshot.status != 0) {
        status = snapshot.status;
    }

    const std::string payload = snapshot.body.substr(offset);
    ResponseHead head;
    head.status = status;
    if (snapshot.send_length) {
        head.content_length = payload.size();
    }
    if (!handler.onHead(head)) {
        return;
    }

    std::size_t limit = payload.size();
    bool fail_after = false;
    if (snapshot.truncate_after > 0 && snapshot.truncate_after < limit) {
        limit = snapshot.truncate_after;
        fail_after = true;
    }
    if (snapshot.short_by > 0) {
        limit = payload.size() > snapshot.short_by ? payload.size() - snapshot.short_by : 0;
    }

    const std::size_t piece = std::max<std::size_t>(1, server_.piece_size);
    for (std::size_t pos = 0; pos < limit; pos += piece) {
        if (handler.cancelled()) {
            return;
        }
        const std::size_t size = std::min(piece, limit - pos);
        if (!handler.onData(payload.data() + pos, size)) {
            return;
        }
        if (snapshot.piece_delay.count() > 0) {
            std::this_thread::sleep_for(snapshot.piece_delay);
        }
    }

    if (fail_after) {
        throw TransportError("fake connection reset in the middle of the body");
    }
}

Session FakeSessionProvider::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_acquires_ > 0) {
        --fail_acquires_;
        throw ProxyUnavailableError("fake Tor proxy is down");
    }
    ++acquired_;
    Session session;
    session.id = next_id_++;
    session.client = std::make_unique<FakeHttpClient>(server_);
    return session;
}

void FakeSessionProvider::release(Session session, bool healthy) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++released_;
    if (!healthy) {
        ++released_unhealthy_;
    }
    session.client.reset();
}

void FakeSessionProvider::failNextAcquires(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_acquires_ = count;
}

int FakeSessionProvider::acquired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquired_;
}

int FakeSessionProvider::released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

int FakeSessionProvider::releasedUnhealthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_unhealthy_;
}

int FakeSessionProvider::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquired_ - released_;
}

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    std::random_device device;
    path_ = std::filesystem::temp_directory_path() /
            ("torfetch-test-" + std::to_string(device()) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::string patternBody(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        body[i] = static_cast<char>((i * 31 + i / 7) % 251);
    }
    return body;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void writeFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

} // namespace torfetch::testing
