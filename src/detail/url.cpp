#include "torfetch/detail/url.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>

namespace torfetch::detail {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
using CurlString = std::unique_ptr<char, decltype(&curl_free)>;

std::string getPart(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, flags) != CURLUE_OK || raw == nullptr) {
        return {};
    }
    CurlString owned{raw, &curl_free};
    return std::string{owned.get()};
}

std::string lastSegment(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

bool isValidUrl(const std::string& url) {
    if (url.empty() || std::any_of(url.begin(), url.end(), [](unsigned char c) { return std::isspace(c); })) {
        return false;
    }

    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        return false;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return false;
    }

    std::string scheme = getPart(handle.get(), CURLUPART_SCHEME);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https") {
        return false;
    }
    return !getPart(handle.get(), CURLUPART_HOST).empty();
}

std::string filenameFromUrl(const std::string& url) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    return lastSegment(getPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE));
}

std::string filenameFromLocation(const std::string& location) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        return {};
    }
    // Relative locations resolve against a placeholder base; only the path matters.
    if (curl_url_set(handle.get(), CURLUPART_URL, "http://location.invalid/", 0) != CURLUE_OK ||
        curl_url_set(handle.get(), CURLUPART_URL, location.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    return lastSegment(getPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE));
}

bool hasExtension(const std::string& filename) {
    return std::filesystem::path{filename}.has_extension();
}

bool isSafeFilename(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") {
        return false;
    }
    return filename.find('/') == std::string::npos && filename.find('\0') == std::string::npos;
}

} // namespace torfetch::detail
