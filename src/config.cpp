#include "torfetch/config.hpp"

#include "torfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace torfetch {

namespace {

long long parseNumber(const std::string& key, const std::string& value, long long min, long long max) {
    std::size_t consumed = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(fmt::format("Invalid value for {}: '{}'", key, value));
    }
    if (consumed != value.size()) {
        throw ConfigError(fmt::format("Invalid value for {}: '{}'", key, value));
    }
    if (number < min || number > max) {
        throw ConfigError(fmt::format("{} must be between {} and {}, got {}", key, min, max, number));
    }
    return number;
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "1" || lowered == "yes") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no") {
        return false;
    }
    throw ConfigError(fmt::format("Invalid value for {}: '{}' (expected true or false)", key, value));
}

using Setter = std::function<void(Config&, const std::string&)>;

const std::map<std::string, Setter>& settersByKey() {
    static const std::map<std::string, Setter> setters = {
        {"socks_host", [](Config& c, const std::string& v) { c.socks_host = v; }},
        {"socks_port", [](Config& c, const std::string& v) { c.socks_port = static_cast<int>(parseNumber("socks_port", v, 1, 65535)); }},
        {"use_tor", [](Config& c, const std::string& v) { c.use_tor = parseBool("use_tor", v); }},
        {"max_downloads", [](Config& c, const std::string& v) { c.max_downloads = static_cast<int>(parseNumber("max_downloads", v, 1, 64)); }},
        {"max_retries", [](Config& c, const std::string& v) { c.max_retries = static_cast<int>(parseNumber("max_retries", v, 1, 1000)); }},
        {"chunk_size", [](Config& c, const std::string& v) { c.chunk_size = static_cast<std::size_t>(parseNumber("chunk_size", v, 1, 64LL * 1024 * 1024)); }},
        {"max_tor_checks", [](Config& c, const std::string& v) { c.max_tor_checks = static_cast<int>(parseNumber("max_tor_checks", v, 1, 100)); }},
        {"max_proxy_requeues", [](Config& c, const std::string& v) { c.max_proxy_requeues = static_cast<int>(parseNumber("max_proxy_requeues", v, 0, 100)); }},
        {"max_batch_restarts", [](Config& c, const std::string& v) { c.max_batch_restarts = static_cast<int>(parseNumber("max_batch_restarts", v, 0, 10)); }},
        {"connect_timeout", [](Config& c, const std::string& v) { c.connect_timeout = static_cast<long>(parseNumber("connect_timeout", v, 1, 3600)); }},
        {"stall_timeout", [](Config& c, const std::string& v) { c.stall_timeout = static_cast<long>(parseNumber("stall_timeout", v, 1, 3600)); }},
        {"links_file", [](Config& c, const std::string& v) { c.links_file = v; }},
        {"scrape_url", [](Config& c, const std::string& v) { c.scrape_url = v; }},
        {"scrape_pattern", [](Config& c, const std::string& v) { c.scrape_pattern = v; }},
        {"log_file", [](Config& c, const std::string& v) { c.log_file = v; }},
        {"output_dir", [](Config& c, const std::string& v) { c.output_dir = v; }},
        {"verbose", [](Config& c, const std::string& v) { c.verbose = parseBool("verbose", v); }},
        {"show_progress", [](Config& c, const std::string& v) { c.show_progress = parseBool("show_progress", v); }},
    };
    return setters;
}

void applySetting(Config& config, const std::string& key, const std::string& value) {
    const auto& setters = settersByKey();
    const auto it = setters.find(key);
    if (it == setters.end()) {
        throw ConfigError("Unknown configuration key: " + key);
    }
    it->second(config, value);
}

// Flags that take a value, mapped to the configuration key they set.
const std::map<std::string, std::string>& valueFlags() {
    static const std::map<std::string, std::string> flags = {
        {"-d", "output_dir"},       {"-t", "max_downloads"},   {"-r", "max_retries"},
        {"-s", "chunk_size"},       {"-p", "socks_port"},      {"--socks-host", "socks_host"},
        {"-l", "links_file"},       {"--log", "log_file"},     {"--scrape", "scrape_url"},
        {"--pattern", "scrape_pattern"},
    };
    return flags;
}

// Setters take text, so scalars are rendered the way they would be typed as flags.
std::string settingText(const std::string& key, const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    throw ConfigError(fmt::format("Invalid value for {}: {}", key, value.dump()));
}

} // namespace

void applyConfigFile(Config& config, const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path.string());
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError(fmt::format("Config file {} is not valid JSON: {}", path.string(), ex.what()));
    }
    if (!document.is_object()) {
        throw ConfigError(fmt::format("Config file {} must hold a single JSON object", path.string()));
    }

    for (const auto& [key, value] : document.items()) {
        // Empty strings and nulls keep the default.
        if (value.is_null() || (value.is_string() && value.get<std::string>().empty())) {
            continue;
        }
        applySetting(config, key, settingText(key, value));
    }
}

Config parseArguments(int argc, const char* const* argv) {
    Config config;
    std::vector<std::pair<std::string, std::string>> settings;
    std::filesystem::path config_file;

    int arg_index = 1;
    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            config.show_help = true;
            return config;
        }
        if (option == "-v") {
            settings.emplace_back("verbose", "true");
            ++arg_index;
            continue;
        }
        if (option == "-q") {
            settings.emplace_back("show_progress", "false");
            ++arg_index;
            continue;
        }
        if (option == "--no-tor") {
            settings.emplace_back("use_tor", "false");
            ++arg_index;
            continue;
        }

        const auto& flags = valueFlags();
        if (option == "-c" || flags.count(option) != 0) {
            if (arg_index + 1 >= argc) {
                throw ConfigError("Missing value for " + option);
            }
            const std::string value = argv[arg_index + 1];
            if (option == "-c") {
                config_file = value;
            } else {
                settings.emplace_back(flags.at(option), value);
            }
            arg_index += 2;
            continue;
        }

        if (!option.empty() && option.front() == '-') {
            throw ConfigError("Unknown option: " + option);
        }
        config.urls.push_back(option);
        ++arg_index;
    }

    if (!config_file.empty()) {
        applyConfigFile(config, config_file);
    }
    for (const auto& [key, value] : settings) {
        applySetting(config, key, value);
    }
    return config;
}

std::string usage(const std::string& program_name) {
    return fmt::format(
        "Usage: {} [options] [<url> ...]\n"
        "Options:\n"
        "  -d <directory>    Download directory (default: output)\n"
        "  -l <file>         JSON file with a list of URLs\n"
        "  -t <downloads>    Maximum simultaneous downloads (default: 7)\n"
        "  -r <retries>      Attempts per file (default: 5)\n"
        "  -s <bytes>        Chunk size (default: 1024)\n"
        "  -p <port>         Tor SOCKS port (default: 9050)\n"
        "  --socks-host <h>  Tor SOCKS host (default: 127.0.0.1)\n"
        "  -c <file>         JSON config file\n"
        "  --log <file>      Log file (default: torfetch.log)\n"
        "  --scrape <url>    Page to collect links from\n"
        "  --pattern <re>    Link pattern used with --scrape\n"
        "  --no-tor          Connect directly instead of through Tor\n"
        "  -v                Verbose console logging\n"
        "  -q                No progress panel\n"
        "  -h, --help        Show this message\n",
        program_name);
}

CoordinatorConfig coordinatorConfig(const Config& config) {
    CoordinatorConfig coordinator;
    coordinator.worker_limit = static_cast<std::size_t>(config.max_downloads);
    coordinator.max_proxy_requeues = config.max_proxy_requeues;
    coordinator.max_batch_restarts = config.max_batch_restarts;
    coordinator.download.max_retries = config.max_retries;
    return coordinator;
}

TorSettings torSettings(const Config& config) {
    TorSettings settings;
    settings.socks_host = config.socks_host;
    settings.socks_port = config.socks_port;
    settings.max_checks = config.max_tor_checks;
    settings.connect_timeout_seconds = config.connect_timeout;
    settings.stall_timeout_seconds = config.stall_timeout;
    return settings;
}

HttpClientOptions directClientOptions(const Config& config) {
    HttpClientOptions options;
    options.connect_timeout_seconds = config.connect_timeout;
    options.stall_timeout_seconds = config.stall_timeout;
    return options;
}

std::string describe(const Config& config) {
    return fmt::format("socks={}:{} use_tor={} max_downloads={} max_retries={} chunk_size={} max_tor_checks={} "
                       "max_proxy_requeues={} max_batch_restarts={} links_file='{}' scrape_url='{}' output_dir='{}' "
                       "log_file='{}' urls={}",
                       config.socks_host, config.socks_port, config.use_tor, config.max_downloads, config.max_retries,
                       config.chunk_size, config.max_tor_checks, config.max_proxy_requeues, config.max_batch_restarts,
                       config.links_file.string(), config.scrape_url, config.output_dir.string(),
                       config.log_file.string(), config.urls.size());
}

} // namespace torfetch
