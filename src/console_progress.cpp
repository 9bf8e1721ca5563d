#include "torfetch/console_progress.hpp"

#include <algorithm>
#include <array>
#include <chrono>

#include <fmt/format.h>

namespace torfetch {

namespace {

constexpr std::size_t kNameWidth = 20;
constexpr std::size_t kBarWidth = 30;
const std::string kHeavyRule(60, '=');
const std::string kLightRule(60, '-');

std::string displayName(const Progress& progress) {
    std::string name = progress.filename;
    if (name.empty()) {
        const auto end = progress.url.find_first_of("?#");
        const auto path = progress.url.substr(0, end);
        name = path.substr(path.find_last_of('/') + 1);
    }
    if (name.empty()) {
        return "(unnamed)";
    }
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth - 1) + "~";
    }
    return name;
}

} // namespace

ConsoleProgressSink::ConsoleProgressSink(std::ostream& out) : out_(out) {}

ConsoleProgressSink::~ConsoleProgressSink() { stop(); }

void ConsoleProgressSink::start() {
    if (running_.exchange(true)) {
        return;
    }
    renderer_ = std::thread([this]() { renderProgressLoop(); });
}

void ConsoleProgressSink::stop() {
    running_ = false;
    if (renderer_.joinable()) {
        renderer_.join();
    }
}

void ConsoleProgressSink::onEvent(const std::string& url, JobEvent event, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[url];
    auto& progress = entry.progress;
    progress.url = url;

    switch (event) {
    case JobEvent::Started:
        progress.is_running = true;
        progress.has_error = false;
        progress.error_message.clear();
        entry.state = "connecting";
        break;
    case JobEvent::FilenameResolved:
        progress.filename = detail;
        break;
    case JobEvent::Resuming:
        entry.state = "resuming";
        break;
    case JobEvent::Streaming:
        entry.state.clear();
        break;
    case JobEvent::Verifying:
        entry.state = "verifying";
        break;
    case JobEvent::Retrying:
        entry.state = fmt::format("retry {}", ++entry.retries);
        break;
    case JobEvent::Requeued:
        entry.state = "new circuit";
        break;
    case JobEvent::Completed:
        progress.is_running = false;
        entry.state.clear();
        // Small and already complete files never report chunk progress.
        progress.total_chunks = std::max<std::uint64_t>(1, progress.total_chunks);
        progress.chunks_done = progress.total_chunks;
        progress.downloaded_bytes = std::max(progress.downloaded_bytes, progress.total_bytes);
        break;
    case JobEvent::Failed:
    case JobEvent::Cancelled:
        progress.is_running = false;
        progress.has_error = true;
        progress.error_message = detail;
        entry.state.clear();
        break;
    }
}

void ConsoleProgressSink::onProgress(const Progress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = entries_[progress.url].progress;
    // Errors and the resolved name come from events, not from chunk updates.
    const bool has_error = current.has_error;
    std::string error_message = std::move(current.error_message);
    std::string filename = progress.filename.empty() ? std::move(current.filename) : progress.filename;
    current = progress;
    current.has_error = has_error;
    current.error_message = std::move(error_message);
    current.filename = std::move(filename);
}

void ConsoleProgressSink::renderProgressLoop() {
    std::size_t previous_lines = 0;
    while (running_) {
        redrawPanel(buildProgressPanel(), previous_lines);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    redrawPanel(buildProgressPanel(), previous_lines);
}

std::string ConsoleProgressSink::buildProgressPanel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    std::size_t finished = 0;
    std::size_t failed = 0;

    std::string body;
    for (const auto& [url, entry] : entries_) {
        const auto& progress = entry.progress;
        body += formatTaskLine(progress, progress.is_running ? entry.state : std::string{});
        body.push_back('\n');

        total_all += progress.total_bytes;
        downloaded_all += progress.downloaded_bytes;
        if (progress.has_error) {
            ++failed;
        } else if (!progress.is_running && progress.total_chunks > 0) {
            ++finished;
        }
    }

    std::string panel;
    panel.reserve(body.size() + 4 * kHeavyRule.size() + 128);
    panel += kHeavyRule + '\n';
    panel += fmt::format("torfetch ({} files, {} done, {} failed)\n", entries_.size(), finished, failed);
    panel += kLightRule + '\n';
    panel += body;
    panel += kLightRule + '\n';
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}% of {}\n", static_cast<int>(ratio * 100.0), formatSize(total_all));
    } else {
        panel += "Overall: N/A\n";
    }
    panel += kHeavyRule + '\n';
    return panel;
}

std::string ConsoleProgressSink::formatTaskLine(const Progress& progress, const std::string& state) {
    const std::string name = displayName(progress);

    if (progress.total_chunks == 0) {
        const std::string waiting = !state.empty() ? state : (progress.is_running ? "connecting" : "waiting");
        std::string line = fmt::format("{:<20} [{}]", name, waiting);
        if (progress.has_error) {
            line += fmt::format("  FAILED {}", progress.error_message);
        }
        return line;
    }

    const double ratio =
        std::min(1.0, static_cast<double>(progress.chunks_done) / static_cast<double>(progress.total_chunks));
    const auto filled = static_cast<std::size_t>(ratio * static_cast<double>(kBarWidth));
    std::string bar(filled, '#');
    bar.resize(kBarWidth, '-');

    std::string line = fmt::format("{:<20} [{}] {:>3}% {}/{} chunks ({}/{})", name, bar,
                                   static_cast<int>(ratio * 100.0), progress.chunks_done, progress.total_chunks,
                                   formatSize(progress.downloaded_bytes), formatSize(progress.total_bytes));
    if (progress.has_error) {
        line += fmt::format("  FAILED {}", progress.error_message);
    } else if (!progress.is_running) {
        line += "  Done";
    } else if (!state.empty()) {
        line += fmt::format("  {}", state);
    }
    return line;
}

std::string ConsoleProgressSink::formatSize(std::uint64_t bytes) {
    static constexpr std::array<const char*, 4> units{"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

void ConsoleProgressSink::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    // Move the cursor back over the previous panel and clear to the end of the screen.
    if (previous_lines > 0) {
        out_ << "\033[" << previous_lines << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

} // namespace torfetch
