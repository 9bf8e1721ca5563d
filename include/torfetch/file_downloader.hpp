#pragma once

#include "cancellation.hpp"
#include "destination_registry.hpp"
#include "download_job.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "resume_planner.hpp"
#include "session_provider.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace torfetch {

struct DownloadOptions {
    // Attempts per job, shared by transport failures and size mismatches.
    int max_retries{5};
};

// Per-job state, alive only while the job is being downloaded.
struct DownloadState {
    std::string resolved_filename;
    std::filesystem::path destination_path;
    std::uint64_t bytes_already_present{0};
    std::uint64_t expected_total_bytes{0};
    int attempt_count{0};
};

// Downloads one URL into one file, resuming partial files with range requests
// and retrying transient failures with a fresh session per attempt. Attempts
// run strictly one after another.
class FileDownloader {
public:
    FileDownloader(SessionProvider& sessions, ProgressSink& sink, DestinationRegistry& destinations,
                   DownloadOptions options = {}, CancellationToken cancel = {});

    // Never throws for download failures; they are reported in the result.
    [[nodiscard]] DownloadResult download(const DownloadJob& job);

private:
    enum class AttemptOutcome { Completed, Cancelled };

    [[nodiscard]] DownloadResult run(const DownloadJob& job, DownloadState& state);
    [[nodiscard]] AttemptOutcome runAttempt(const DownloadJob& job, DownloadState& state, HttpClient& client,
                                          std::optional<DestinationLease>& lease);
    void resolveFilename(const DownloadJob& job, DownloadState& state, HttpClient& client);

    static void ensureTargetDirectory(const std::filesystem::path& directory);

    SessionProvider& sessions_;
    ProgressSink& sink_;
    DestinationRegistry& destinations_;
    DownloadOptions options_;
    CancellationToken cancel_;
};

} // namespace torfetch
