#pragma once

#include <string>

namespace torfetch::detail {

// http(s) URL with a host, as parsed by libcurl's URL API.
[[nodiscard]] bool isValidUrl(const std::string& url);

// Last segment of the URL path, percent-decoded; empty if the path ends in '/'.
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

// Last path segment of a Location header value (absolute or relative).
[[nodiscard]] std::string filenameFromLocation(const std::string& location);

[[nodiscard]] bool hasExtension(const std::string& filename);

// Rejects names that would escape the target directory.
[[nodiscard]] bool isSafeFilename(const std::string& filename);

} // namespace torfetch::detail
