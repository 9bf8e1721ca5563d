#pragma once

#include "http_client.hpp"
#include "session_provider.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace torfetch {

// Reads a JSON list of URL strings; blank entries and duplicates are dropped.
// Throws std::runtime_error if the file cannot be read, is not a list of
// strings, or lists nothing.
[[nodiscard]] std::vector<std::string> readLinksFile(const std::filesystem::path& path);

// Fetches page_url and returns every match of pattern, using capture group 1
// when the pattern has one.
[[nodiscard]] std::vector<std::string> scrapeLinks(HttpClient& client, const std::string& page_url,
                                                   const std::string& pattern);

// Same as above on a session checked out from sessions for the duration of
// the scrape.
[[nodiscard]] std::vector<std::string> scrapeLinks(SessionProvider& sessions, const std::string& page_url,
                                                   const std::string& pattern);

// Order-preserving de-duplication.
[[nodiscard]] std::vector<std::string> uniqueLinks(const std::vector<std::string>& links);

} // namespace torfetch
