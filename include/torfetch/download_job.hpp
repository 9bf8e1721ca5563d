#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace torfetch {

struct DownloadJob {
    std::string url;
    std::filesystem::path target_directory;
    std::optional<std::string> filename;
    std::size_t chunk_size{1024};
};

enum class ErrorKind {
    None,
    InvalidTarget,
    Link,
    ProxyUnavailable,
    RetriesExceeded,
    Cancelled,
    Unexpected,
};

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

struct DownloadResult {
    enum class Status { Completed, Failed };

    Status status{Status::Failed};
    std::string url;
    std::filesystem::path path;
    ErrorKind error_kind{ErrorKind::None};
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return status == Status::Completed; }

    static DownloadResult completed(std::string url, std::filesystem::path path);
    static DownloadResult failed(std::string url, ErrorKind kind, std::string detail);
};

// Builds one job per URL sharing the same destination and chunking.
[[nodiscard]] std::vector<DownloadJob> makeJobs(const std::vector<std::string>& urls,
                                                const std::filesystem::path& target_directory,
                                                std::size_t chunk_size);

} // namespace torfetch
