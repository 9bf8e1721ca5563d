#pragma once

#include "download_coordinator.hpp"
#include "session_provider.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace torfetch {

struct Config {
    std::string socks_host{"127.0.0.1"};
    int socks_port{9050};
    bool use_tor{true};
    int max_downloads{7};
    int max_retries{5};
    std::size_t chunk_size{1024};
    int max_tor_checks{5};
    int max_proxy_requeues{5};
    int max_batch_restarts{1};
    long connect_timeout{60};
    long stall_timeout{120};
    std::filesystem::path links_file;
    std::string scrape_url;
    std::string scrape_pattern;
    std::filesystem::path log_file{"torfetch.log"};
    std::filesystem::path output_dir{"output"};
    bool verbose{false};
    bool show_progress{true};
    bool show_help{false};
    std::vector<std::string> urls;
};

// Applies a JSON object of settings onto config; empty strings and nulls are
// skipped. Throws ConfigError on malformed JSON, unknown keys or bad values.
void applyConfigFile(Config& config, const std::filesystem::path& path);

// Defaults, then the file named by -c, then the remaining flags. Throws
// ConfigError on invalid input.
[[nodiscard]] Config parseArguments(int argc, const char* const* argv);

[[nodiscard]] std::string usage(const std::string& program_name);

[[nodiscard]] CoordinatorConfig coordinatorConfig(const Config& config);
[[nodiscard]] TorSettings torSettings(const Config& config);
[[nodiscard]] HttpClientOptions directClientOptions(const Config& config);

// One-line summary for the log.
[[nodiscard]] std::string describe(const Config& config);

} // namespace torfetch
