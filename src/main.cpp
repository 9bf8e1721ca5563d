#include "torfetch/cancellation.hpp"
#include "torfetch/config.hpp"
#include "torfetch/console_progress.hpp"
#include "torfetch/detail/curl_utils.hpp"
#include "torfetch/download_coordinator.hpp"
#include "torfetch/errors.hpp"
#include "torfetch/link_source.hpp"
#include "torfetch/logging.hpp"
#include "torfetch/session_provider.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic<bool>* g_interrupted = nullptr;

// First signal asks for a graceful stop; the second one kills the process.
extern "C" void handleInterrupt(int) {
    if (g_interrupted) {
        g_interrupted->store(true);
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

std::vector<std::string> collectUrls(const torfetch::Config& config, torfetch::SessionProvider& sessions) {
    std::vector<std::string> urls = config.urls;

    if (!config.links_file.empty()) {
        const auto from_file = torfetch::readLinksFile(config.links_file);
        urls.insert(urls.end(), from_file.begin(), from_file.end());
    }

    if (!config.scrape_url.empty()) {
        if (config.scrape_pattern.empty()) {
            throw torfetch::ConfigError("--scrape needs a link --pattern");
        }
        const auto scraped = torfetch::scrapeLinks(sessions, config.scrape_url, config.scrape_pattern);
        urls.insert(urls.end(), scraped.begin(), scraped.end());
    }

    return torfetch::uniqueLinks(urls);
}

} // namespace

int main(int argc, char** argv) {
    try {
        const torfetch::Config config = torfetch::parseArguments(argc, argv);
        if (config.show_help) {
            std::cout << torfetch::usage(argv[0]);
            return 0;
        }

        torfetch::detail::ensureCurlInitialized();
        torfetch::setupLogging(config);
        spdlog::info("Starting torfetch");
        spdlog::debug("Using config options: {}", torfetch::describe(config));

        torfetch::CancellationToken cancel;
        g_interrupted = cancel.flag();
        std::signal(SIGINT, handleInterrupt);
        std::signal(SIGTERM, handleInterrupt);

        std::unique_ptr<torfetch::SessionProvider> sessions;
        if (config.use_tor) {
            sessions = std::make_unique<torfetch::TorSessionProvider>(torfetch::torSettings(config));
        } else {
            spdlog::warn("Tor is disabled, connecting directly");
            sessions = std::make_unique<torfetch::DirectSessionProvider>(torfetch::directClientOptions(config));
        }

        const auto urls = collectUrls(config, *sessions);
        if (urls.empty()) {
            spdlog::error("No URLs to download.");
            std::cerr << torfetch::usage(argv[0]);
            return 1;
        }

        torfetch::LoggingProgressSink log_sink;
        torfetch::ConsoleProgressSink console{std::cout};
        std::vector<torfetch::ProgressSink*> sinks{&log_sink};
        if (config.show_progress) {
            sinks.push_back(&console);
            console.start();
        }
        torfetch::FanoutProgressSink sink{sinks};

        torfetch::DownloadCoordinator coordinator{torfetch::coordinatorConfig(config), *sessions, sink, cancel};
        const auto results = coordinator.run(torfetch::makeJobs(urls, config.output_dir, config.chunk_size));
        console.stop();

        torfetch::logSummary(results);
        for (const auto& [url, result] : results) {
            if (result.ok()) {
                std::cout << fmt::format("{} -> {}\n", url, result.path.string());
            } else {
                std::cout << fmt::format("{} -> FAILED ({}): {}\n", url, torfetch::toString(result.error_kind),
                                         result.detail);
            }
        }
        std::cout << std::flush;

        if (cancel.cancelled()) {
            spdlog::warn("Interrupted, {} of {} files finished", coordinator.completedCount(), results.size());
            return 130;
        }
        const bool all_ok = std::all_of(results.begin(), results.end(),
                                        [](const auto& entry) { return entry.second.ok(); });
        return all_ok ? 0 : 1;
    } catch (const torfetch::ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << '\n' << torfetch::usage(argv[0]);
        return 1;
    } catch (const std::exception& ex) {
        spdlog::critical("Fatal error: {}", ex.what());
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
