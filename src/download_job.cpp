#include "torfetch/download_job.hpp"

#include <utility>

namespace torfetch {

std::string_view toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::InvalidTarget:
        return "invalid target";
    case ErrorKind::Link:
        return "link error";
    case ErrorKind::ProxyUnavailable:
        return "proxy unavailable";
    case ErrorKind::RetriesExceeded:
        return "retries exceeded";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Unexpected:
        return "unexpected error";
    }
    return "unknown";
}

DownloadResult DownloadResult::completed(std::string url, std::filesystem::path path) {
    DownloadResult result;
    result.status = Status::Completed;
    result.url = std::move(url);
    result.path = std::move(path);
    return result;
}

DownloadResult DownloadResult::failed(std::string url, ErrorKind kind, std::string detail) {
    DownloadResult result;
    result.status = Status::Failed;
    result.url = std::move(url);
    result.error_kind = kind;
    result.detail = std::move(detail);
    return result;
}

std::vector<DownloadJob> makeJobs(const std::vector<std::string>& urls,
                                  const std::filesystem::path& target_directory,
                                  std::size_t chunk_size) {
    std::vector<DownloadJob> jobs;
    jobs.reserve(urls.size());
    for (const auto& url : urls) {
        jobs.push_back(DownloadJob{url, target_directory, std::nullopt, chunk_size});
    }
    return jobs;
}

} // namespace torfetch
