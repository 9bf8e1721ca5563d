#pragma once

#include "progress.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace torfetch {

// Redraws a multi-line progress panel on a terminal from its own thread.
class ConsoleProgressSink final : public ProgressSink {
public:
    explicit ConsoleProgressSink(std::ostream& out);
    ~ConsoleProgressSink() override;

    void start();
    void stop();

    void onEvent(const std::string& url, JobEvent event, const std::string& detail) override;
    void onProgress(const Progress& progress) override;

    [[nodiscard]] std::string buildProgressPanel() const;
    // state is a short label such as "retry 2", shown while the job runs.
    static std::string formatTaskLine(const Progress& progress, const std::string& state = {});
    static std::string formatSize(std::uint64_t bytes);

private:
    struct Entry {
        Progress progress;
        std::string state;
        int retries{0};
    };

    void renderProgressLoop();
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    std::ostream& out_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::atomic<bool> running_{false};
    std::thread renderer_;
};

} // namespace torfetch
