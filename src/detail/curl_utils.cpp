#include "torfetch/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace torfetch::detail {

namespace {

void cleanupCurl() { curl_global_cleanup(); }

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            throw std::runtime_error(std::string{"Failed to initialize libcurl: "} + curl_easy_strerror(res));
        }
        std::atexit(cleanupCurl);

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info == nullptr) {
            return;
        }
        spdlog::debug("Using libcurl {} ({})", info->version, info->ssl_version ? info->ssl_version : "no TLS");
        // check.torproject.org and most clearnet mirrors are HTTPS only.
        if ((info->features & CURL_VERSION_SSL) == 0) {
            spdlog::warn("libcurl was built without TLS support, https URLs will fail");
        }
    });
}

} // namespace torfetch::detail
