#include "torfetch/http_client.hpp"

#include "torfetch/errors.hpp"

#include <fmt/format.h>

namespace torfetch {

namespace {

class PageCollector final : public ResponseHandler {
public:
    PageCollector(Page& page, std::size_t max_bytes) : page_(page), max_bytes_(max_bytes) {}

    bool onHead(const ResponseHead& head) override {
        page_.status = head.status;
        return true;
    }

    bool onData(const char* data, std::size_t size) override {
        if (page_.body.size() + size > max_bytes_) {
            overflow_ = true;
            return false;
        }
        page_.body.append(data, size);
        return true;
    }

    [[nodiscard]] bool overflowed() const noexcept { return overflow_; }

private:
    Page& page_;
    std::size_t max_bytes_;
    bool overflow_{false};
};

} // namespace

Page fetchPage(HttpClient& client, const std::string& url, std::size_t max_bytes) {
    Page page;
    PageCollector collector{page, max_bytes};
    client.get(url, {}, collector);
    if (collector.overflowed()) {
        throw TransportError(fmt::format("Page larger than {} bytes | URL: {}", max_bytes, url));
    }
    return page;
}

} // namespace torfetch
