#include "torfetch/curl_http_client.hpp"

#include "torfetch/detail/curl_utils.hpp"
#include "torfetch/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace torfetch {

class CurlHttpClient::Impl {
public:
    explicit Impl(HttpClientOptions options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    [[nodiscard]] ResponseHead head(const std::string& url) const {
        ErrorBuffer errors{};
        CurlHandle curl = makeHandle(url, errors);

        std::string location;
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::locationCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &location);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            raiseTransferError(curl.get(), res, errors, url);
        }

        ResponseHead head = readHead(curl.get());
        head.location = std::move(location);
        return head;
    }

    void get(const std::string& url, const std::string& range_header, ResponseHandler& handler) const {
        ErrorBuffer errors{};
        CurlHandle curl = makeHandle(url, errors);

        SlistHandle headers{nullptr, &curl_slist_free_all};
        if (!range_header.empty()) {
            const std::string line = "Range: " + range_header;
            headers.reset(curl_slist_append(nullptr, line.c_str()));
            if (!headers) {
                throw TransportError("Failed to build request headers");
            }
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        }

        TransferContext ctx{&handler, curl.get()};
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }
        if (ctx.stopped) {
            return;
        }
        if (res != CURLE_OK) {
            raiseTransferError(curl.get(), res, errors, url);
        }
        // Responses without a body never reach the write callback.
        if (!ctx.head_delivered) {
            ctx.head_delivered = true;
            handler.onHead(readHead(curl.get()));
        }
    }

private:
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using SlistHandle = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
    using ErrorBuffer = std::array<char, CURL_ERROR_SIZE>;

    struct TransferContext {
        ResponseHandler* handler{nullptr};
        CURL* curl{nullptr};
        bool head_delivered{false};
        bool stopped{false};
        std::exception_ptr error{};
    };

    [[nodiscard]] CurlHandle makeHandle(const std::string& url, ErrorBuffer& errors) const {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransportError("Failed to allocate curl handle");
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errors.data());
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.stall_timeout_seconds);
        // The exit relay terminates the real connection and onion services mostly
        // run self-signed certificates, so peer verification is disabled on purpose.
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);

        if (!options_.proxy_url.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_PROXY, options_.proxy_url.c_str());
            if (!options_.proxy_username.empty()) {
                curl_easy_setopt(curl.get(), CURLOPT_PROXYUSERNAME, options_.proxy_username.c_str());
                curl_easy_setopt(curl.get(), CURLOPT_PROXYPASSWORD, options_.proxy_password.c_str());
            }
        }
        return curl;
    }

    [[nodiscard]] static ResponseHead readHead(CURL* curl) {
        ResponseHead head;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &head.status);

        curl_off_t length = -1;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        // -1 when the server sent no Content-Length
        if (length >= 0) {
            head.content_length = static_cast<std::uint64_t>(length);
        }
        return head;
    }

    [[noreturn]] void raiseTransferError(CURL* curl, CURLcode res, const ErrorBuffer& errors,
                                         const std::string& url) const {
        const std::string reason = errors[0] != '\0' ? std::string{errors.data()} : curl_easy_strerror(res);
        const std::string message = fmt::format("{} (curl error {}) | URL: {}", reason, static_cast<int>(res), url);
        const bool proxied = !options_.proxy_url.empty();

        switch (res) {
        case CURLE_COULDNT_RESOLVE_PROXY:
            throw ProxyUnavailableError(message);
        case CURLE_COULDNT_CONNECT:
            // Behind a SOCKS proxy the only direct connection is the one to the proxy.
            if (proxied) {
                throw ProxyUnavailableError(message);
            }
            break;
        case CURLE_PROXY: {
            long proxy_code = 0;
            curl_easy_getinfo(curl, CURLINFO_PROXY_ERROR, &proxy_code);
            if (isTargetSideProxyError(proxy_code)) {
                throw TransportError(message);
            }
            throw ProxyUnavailableError(message);
        }
        default:
            break;
        }
        throw TransportError(message);
    }

    // SOCKS replies describing the far end; the proxy itself is working.
    [[nodiscard]] static bool isTargetSideProxyError(long code) {
        switch (static_cast<CURLproxycode>(code)) {
        case CURLPX_REPLY_CONNECTION_REFUSED:
        case CURLPX_REPLY_GENERAL_SERVER_FAILURE:
        case CURLPX_REPLY_HOST_UNREACHABLE:
        case CURLPX_REPLY_NETWORK_UNREACHABLE:
        case CURLPX_REPLY_NOT_ALLOWED:
        case CURLPX_REPLY_TTL_EXPIRED:
        case CURLPX_REPLY_UNASSIGNED:
            return true;
        default:
            return false;
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->handler) {
            return 0;
        }

        const size_t total = size * nmemb;
        // Exceptions must not unwind through libcurl; they are rethrown after perform.
        try {
            if (!ctx->head_delivered) {
                ctx->head_delivered = true;
                if (!ctx->handler->onHead(readHead(ctx->curl))) {
                    ctx->stopped = true;
                    return 0;
                }
            }
            if (!ctx->handler->onData(ptr, total)) {
                ctx->stopped = true;
                return 0;
            }
        } catch (...) {
            ctx->error = std::current_exception();
            return 0;
        }
        return total;
    }

    static int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (ctx && ctx->handler && ctx->handler->cancelled()) {
            ctx->stopped = true;
            return 1;
        }
        return 0;
    }

    static size_t locationCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* location = static_cast<std::string*>(userdata);
        const size_t total = size * nitems;
        std::string line(buffer, total);

        constexpr std::string_view prefix = "location:";
        if (line.size() > prefix.size()) {
            std::string name = line.substr(0, prefix.size());
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (name == prefix) {
                std::string value = line.substr(prefix.size());
                const auto first = value.find_first_not_of(" \t");
                const auto last = value.find_last_not_of(" \t\r\n");
                *location = first == std::string::npos ? std::string{} : value.substr(first, last - first + 1);
            }
        }
        return total;
    }

    HttpClientOptions options_;
};

CurlHttpClient::CurlHttpClient(HttpClientOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlHttpClient::~CurlHttpClient() = default;

ResponseHead CurlHttpClient::head(const std::string& url) { return impl_->head(url); }

void CurlHttpClient::get(const std::string& url, const std::string& range_header, ResponseHandler& handler) {
    impl_->get(url, range_header, handler);
}

} // namespace torfetch
