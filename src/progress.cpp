#include "torfetch/progress.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace torfetch {

std::string_view toString(JobEvent event) noexcept {
    switch (event) {
    case JobEvent::Started:
        return "started";
    case JobEvent::FilenameResolved:
        return "filename resolved";
    case JobEvent::Resuming:
        return "resuming";
    case JobEvent::Streaming:
        return "streaming";
    case JobEvent::Verifying:
        return "verifying";
    case JobEvent::Retrying:
        return "retrying";
    case JobEvent::Requeued:
        return "requeued";
    case JobEvent::Completed:
        return "completed";
    case JobEvent::Failed:
        return "failed";
    case JobEvent::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

void LoggingProgressSink::onEvent(const std::string& url, JobEvent event, const std::string& detail) {
    switch (event) {
    case JobEvent::Retrying:
    case JobEvent::Requeued:
    case JobEvent::Cancelled:
        spdlog::warn("{}: {} | URL: {}", toString(event), detail, url);
        break;
    case JobEvent::Failed:
        spdlog::error("Download failed! Reason: {} | URL: {}", detail, url);
        break;
    case JobEvent::Completed:
        spdlog::info("Download finished! Filepath: {} | URL: {}", detail, url);
        break;
    default:
        if (detail.empty()) {
            spdlog::debug("{} | URL: {}", toString(event), url);
        } else {
            spdlog::info("{}: {} | URL: {}", toString(event), detail, url);
        }
        break;
    }
}

void LoggingProgressSink::onProgress(const Progress& progress) {
    spdlog::trace("{}: {}/{} chunks", progress.filename, progress.chunks_done, progress.total_chunks);
}

FanoutProgressSink::FanoutProgressSink(std::vector<ProgressSink*> sinks) : sinks_(std::move(sinks)) {}

void FanoutProgressSink::onEvent(const std::string& url, JobEvent event, const std::string& detail) {
    for (auto* sink : sinks_) {
        if (sink) {
            detail::notifyEvent(*sink, url, event, detail);
        }
    }
}

void FanoutProgressSink::onProgress(const Progress& progress) {
    for (auto* sink : sinks_) {
        if (sink) {
            detail::notifyProgress(*sink, progress);
        }
    }
}

namespace detail {

void notifyEvent(ProgressSink& sink, const std::string& url, JobEvent event, const std::string& detail) {
    try {
        sink.onEvent(url, event, detail);
    } catch (const std::exception& ex) {
        spdlog::warn("Progress sink failed on '{}' event: {}", toString(event), ex.what());
    }
}

void notifyProgress(ProgressSink& sink, const Progress& progress) {
    try {
        sink.onProgress(progress);
    } catch (const std::exception& ex) {
        spdlog::warn("Progress sink failed for '{}': {}", progress.filename, ex.what());
    }
}

} // namespace detail

} // namespace torfetch
