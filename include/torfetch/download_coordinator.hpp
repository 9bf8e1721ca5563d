#pragma once

#include "cancellation.hpp"
#include "download_job.hpp"
#include "file_downloader.hpp"
#include "progress.hpp"
#include "session_provider.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace torfetch {

struct CoordinatorConfig {
    std::size_t worker_limit{7};
    // Resubmissions per URL after ProxyUnavailable before the failure is final.
    int max_proxy_requeues{5};
    // Restarts of the unfinished part of a batch after unexpected errors.
    int max_batch_restarts{1};
    DownloadOptions download;
};

// Runs jobs on a bounded worker pool and accounts for every URL.
class DownloadCoordinator {
public:
    DownloadCoordinator(CoordinatorConfig config, SessionProvider& sessions, ProgressSink& sink,
                        CancellationToken cancel = {});

    // Returns one final result per distinct URL in jobs.
    [[nodiscard]] std::map<std::string, DownloadResult> run(const std::vector<DownloadJob>& jobs);

    [[nodiscard]] std::size_t completedCount() const noexcept { return completed_; }

private:
    // Records results as they arrive so a failed batch keeps what finished.
    void runBatch(const std::vector<DownloadJob>& jobs, std::map<std::string, DownloadResult>& results);

    CoordinatorConfig config_;
    SessionProvider& sessions_;
    ProgressSink& sink_;
    CancellationToken cancel_;
    DestinationRegistry destinations_;
    std::size_t completed_{0};
};

} // namespace torfetch
