#include "torfetch/link_source.hpp"

#include "torfetch/errors.hpp"

#include <fstream>
#include <regex>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace torfetch {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::vector<std::string> uniqueLinks(const std::vector<std::string>& links) {
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& link : links) {
        if (seen.insert(link).second) {
            unique.push_back(link);
        }
    }
    return unique;
}

std::vector<std::string> readLinksFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open links file: " + path.string());
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error(fmt::format("Links file '{}' is not valid JSON: {}", path.string(), ex.what()));
    }
    if (!document.is_array()) {
        throw std::runtime_error(fmt::format("Links file '{}' must hold a JSON list of URLs", path.string()));
    }

    std::vector<std::string> links;
    for (const auto& entry : document) {
        if (!entry.is_string()) {
            throw std::runtime_error(
                fmt::format("Links file '{}' contains a non-string entry: {}", path.string(), entry.dump()));
        }
        auto link = trim(entry.get<std::string>());
        if (!link.empty()) {
            links.push_back(std::move(link));
        }
    }

    links = uniqueLinks(links);
    if (links.empty()) {
        spdlog::error("JSON file '{}' is empty.", path.string());
        throw std::runtime_error(fmt::format("Links file '{}' is empty.", path.string()));
    }
    spdlog::info("Found {} link(s) in file '{}'", links.size(), path.string());
    spdlog::debug("Link list: {}", fmt::join(links, ", "));
    return links;
}

std::vector<std::string> scrapeLinks(HttpClient& client, const std::string& page_url, const std::string& pattern) {
    std::regex expression;
    try {
        expression = std::regex(pattern);
    } catch (const std::regex_error& ex) {
        throw ConfigError(fmt::format("Invalid link pattern '{}': {}", pattern, ex.what()));
    }

    const auto page = fetchPage(client, page_url);
    if (page.status >= 400) {
        throw LinkError(fmt::format("HTTP {} while fetching link page {}", page.status, page_url));
    }

    std::vector<std::string> links;
    for (auto it = std::sregex_iterator(page.body.begin(), page.body.end(), expression); it != std::sregex_iterator();
         ++it) {
        const auto& match = *it;
        links.push_back(match.size() > 1 && match[1].matched ? match[1].str() : match[0].str());
    }

    links = uniqueLinks(links);
    spdlog::info("Found {} links through url '{}'.", links.size(), page_url);
    return links;
}

std::vector<std::string> scrapeLinks(SessionProvider& sessions, const std::string& page_url,
                                     const std::string& pattern) {
    SessionLease session{sessions};
    try {
        return scrapeLinks(session.client(), page_url, pattern);
    } catch (const ProxyUnavailableError&) {
        session.markUnhealthy();
        throw;
    }
}

} // namespace torfetch
