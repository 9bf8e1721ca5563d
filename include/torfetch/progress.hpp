#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace torfetch {

struct Progress {
    std::string url;
    std::string filename;
    std::uint64_t total_chunks{0};
    std::uint64_t chunks_done{0};
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
};

enum class JobEvent {
    Started,
    FilenameResolved,
    Resuming,
    Streaming,
    Verifying,
    Retrying,
    Requeued,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] std::string_view toString(JobEvent event) noexcept;

// Receives lifecycle transitions and chunk progress from worker threads.
// Implementations must be thread-safe.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void onEvent(const std::string& url, JobEvent event, const std::string& detail) = 0;
    virtual void onProgress(const Progress& progress) = 0;
};

class NullProgressSink final : public ProgressSink {
public:
    void onEvent(const std::string&, JobEvent, const std::string&) override {}
    void onProgress(const Progress&) override {}
};

class LoggingProgressSink final : public ProgressSink {
public:
    void onEvent(const std::string& url, JobEvent event, const std::string& detail) override;
    void onProgress(const Progress& progress) override;
};

class FanoutProgressSink final : public ProgressSink {
public:
    explicit FanoutProgressSink(std::vector<ProgressSink*> sinks);

    void onEvent(const std::string& url, JobEvent event, const std::string& detail) override;
    void onProgress(const Progress& progress) override;

private:
    std::vector<ProgressSink*> sinks_;
};

namespace detail {

// Forwards to a sink; a throwing sink is logged and otherwise ignored so that
// reporting can never abort a transfer.
void notifyEvent(ProgressSink& sink, const std::string& url, JobEvent event, const std::string& detail = {});
void notifyProgress(ProgressSink& sink, const Progress& progress);

} // namespace detail

} // namespace torfetch
