#include "torfetch/logging.hpp"

#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace torfetch {

namespace {

constexpr std::size_t kMaxLogBytes = 100 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 5;

} // namespace

void setupLogging(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(config.verbose ? spdlog::level::info : spdlog::level::warn);
    console->set_pattern("(%m-%d-%y %H:%M) %^[%l]%$ %v");
    sinks.push_back(console);

    if (!config.log_file.empty()) {
        const auto parent = config.log_file.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw std::system_error(ec, "Cannot create log directory " + parent.string());
            }
        }
        // Blank line between runs.
        std::ofstream(config.log_file, std::ios::app) << '\n';

        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.log_file.string(), kMaxLogBytes,
                                                                           kMaxLogFiles);
        file->set_level(spdlog::level::debug);
        file->set_pattern("%Y-%m-%d %H:%M:%S:%l:%n:%v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("torfetch", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void logSummary(const std::map<std::string, DownloadResult>& results) {
    spdlog::info("{}", std::string(25, '-'));
    spdlog::info("All Downloads Finished:");
    for (const auto& [url, result] : results) {
        if (result.ok()) {
            spdlog::info("\t- {}: {}", url, result.path.string());
        } else {
            spdlog::warn("\t- {}: {} ({})", url, toString(result.error_kind), result.detail);
        }
    }
}

} // namespace torfetch
