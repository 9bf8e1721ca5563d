#include "torfetch/download_coordinator.hpp"

#include "torfetch/detail/thread_safe_queue.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace torfetch {

namespace {

struct Outcome {
    DownloadJob job;
    DownloadResult result;
};

// Closes the job queue and joins the workers on every exit path.
class WorkerPool {
public:
    explicit WorkerPool(detail::ThreadSafeQueue<DownloadJob>& jobs) : jobs_(jobs) {}

    ~WorkerPool() {
        jobs_.close();
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

private:
    detail::ThreadSafeQueue<DownloadJob>& jobs_;
    std::vector<std::thread> threads_;
};

} // namespace

DownloadCoordinator::DownloadCoordinator(CoordinatorConfig config, SessionProvider& sessions, ProgressSink& sink,
                                         CancellationToken cancel)
    : config_(std::move(config)), sessions_(sessions), sink_(sink), cancel_(std::move(cancel)) {}

std::map<std::string, DownloadResult> DownloadCoordinator::run(const std::vector<DownloadJob>& jobs) {
    std::vector<DownloadJob> batch;
    std::set<std::string> seen;
    for (const auto& job : jobs) {
        if (seen.insert(job.url).second) {
            batch.push_back(job);
        } else {
            spdlog::warn("Skipping duplicate URL: {}", job.url);
        }
    }

    std::map<std::string, DownloadResult> results;
    int restarts = 0;
    while (!batch.empty()) {
        std::string abort_reason;
        try {
            runBatch(batch, results);
        } catch (const std::exception& ex) {
            abort_reason = ex.what();
            spdlog::error("Fatal Error while downloading: {}", ex.what());
        }

        std::vector<DownloadJob> unfinished;
        for (const auto& job : batch) {
            const auto it = results.find(job.url);
            if (it == results.end() || it->second.error_kind == ErrorKind::Unexpected) {
                unfinished.push_back(job);
            }
        }
        if (unfinished.empty()) {
            break;
        }

        if (restarts >= config_.max_batch_restarts || cancel_.cancelled()) {
            for (const auto& job : unfinished) {
                if (results.count(job.url) == 0) {
                    results.emplace(job.url, cancel_.cancelled()
                                                 ? DownloadResult::failed(job.url, ErrorKind::Cancelled,
                                                                          "interrupted before a result was produced")
                                                 : DownloadResult::failed(job.url, ErrorKind::Unexpected,
                                                                          "batch aborted: " + abort_reason));
                }
            }
            break;
        }

        ++restarts;
        spdlog::error("Restarting {} unfinished downloads ({}/{})", unfinished.size(), restarts,
                      config_.max_batch_restarts);
        for (const auto& job : unfinished) {
            results.erase(job.url);
        }
        batch = std::move(unfinished);
    }
    return results;
}

void DownloadCoordinator::runBatch(const std::vector<DownloadJob>& jobs,
                                   std::map<std::string, DownloadResult>& results) {
    if (jobs.empty()) {
        return;
    }

    detail::ThreadSafeQueue<DownloadJob> queue;
    detail::ThreadSafeQueue<Outcome> outcomes;
    for (const auto& job : jobs) {
        queue.push(job);
    }
    spdlog::info("Submitted {} jobs to the executor.", jobs.size());

    const std::size_t worker_count = std::max<std::size_t>(1, std::min(config_.worker_limit, jobs.size()));
    WorkerPool pool{queue};
    for (std::size_t i = 0; i < worker_count; ++i) {
        pool.spawn([this, &queue, &outcomes]() {
            FileDownloader downloader{sessions_, sink_, destinations_, config_.download, cancel_};
            DownloadJob job;
            while (queue.waitPop(job)) {
                DownloadResult result = cancel_.cancelled()
                                            ? DownloadResult::failed(job.url, ErrorKind::Cancelled,
                                                                     "interrupted before the download started")
                                            : downloader.download(job);
                outcomes.push(Outcome{std::move(job), std::move(result)});
            }
        });
    }

    std::map<std::string, int> requeues;
    std::size_t in_flight = jobs.size();
    while (in_flight > 0) {
        Outcome outcome;
        outcomes.waitPop(outcome);
        --in_flight;

        const std::string url = outcome.job.url;
        if (outcome.result.error_kind == ErrorKind::ProxyUnavailable && !cancel_.cancelled()) {
            int& count = requeues[url];
            if (count < config_.max_proxy_requeues) {
                ++count;
                spdlog::error("Could not connect to Tor for URL '{}', re-adding the URL to the queue ({}/{}).", url,
                              count, config_.max_proxy_requeues);
                detail::notifyEvent(sink_, url, JobEvent::Requeued,
                                    fmt::format("proxy unavailable, resubmission {}/{}", count,
                                                config_.max_proxy_requeues));
                // A fresh job; the downloader acquires a new session for it.
                queue.push(DownloadJob{outcome.job});
                ++in_flight;
                continue;
            }
        }

        if (outcome.result.ok()) {
            ++completed_;
            spdlog::info("{} files finished so far.", completed_);
        }
        results[url] = std::move(outcome.result);
    }
}

} // namespace torfetch
