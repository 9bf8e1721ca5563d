#include "fake_http.hpp"

#include "torfetch/destination_registry.hpp"
#include "torfetch/file_downloader.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <utility>
#include <vector>

using namespace torfetch;
using torfetch::testing::FakeResource;
using torfetch::testing::FakeServer;
using torfetch::testing::FakeSessionProvider;
using torfetch::testing::patternBody;
using torfetch::testing::readFile;
using torfetch::testing::TempDir;
using torfetch::testing::writeFile;

namespace {

const std::string kUrl = "http://files2xyzexample.onion/data/archive.zip";

class RecordingSink final : public ProgressSink {
public:
    void onEvent(const std::string&, JobEvent event, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    void onProgress(const Progress& progress) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_progress_ = progress;
        if (progress.chunks_done > progress.total_chunks) {
            overshoot_ = true;
        }
    }

    [[nodiscard]] bool saw(JobEvent event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::find(events_.begin(), events_.end(), event) != events_.end();
    }

    [[nodiscard]] Progress lastProgress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_progress_;
    }

    // True if any update reported more chunks done than the total.
    [[nodiscard]] bool overshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overshoot_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<JobEvent> events_;
    Progress last_progress_;
    bool overshoot_{false};
};

// Requests cancellation once the given number of chunks is on disk.
class CancelAfterChunks final : public ProgressSink {
public:
    CancelAfterChunks(CancellationToken cancel, std::uint64_t chunks) : cancel_(std::move(cancel)), chunks_(chunks) {}

    void onEvent(const std::string&, JobEvent, const std::string&) override {}
    void onProgress(const Progress& progress) override {
        if (progress.chunks_done >= chunks_) {
            cancel_.cancel();
        }
    }

private:
    CancellationToken cancel_;
    std::uint64_t chunks_;
};

// Requests cancellation when the given lifecycle event is reported.
class CancelOnEvent final : public ProgressSink {
public:
    CancelOnEvent(CancellationToken cancel, JobEvent trigger) : cancel_(std::move(cancel)), trigger_(trigger) {}

    void onEvent(const std::string&, JobEvent event, const std::string&) override {
        if (event == trigger_) {
            cancel_.cancel();
        }
        if (event == JobEvent::Retrying) {
            retried_ = true;
        }
    }
    void onProgress(const Progress&) override {}

    [[nodiscard]] bool retried() const noexcept { return retried_; }

private:
    CancellationToken cancel_;
    JobEvent trigger_;
    std::atomic<bool> retried_{false};
};

struct Fixture {
    FakeServer server;
    FakeSessionProvider sessions{server};
    RecordingSink sink;
    DestinationRegistry destinations;
    TempDir dir;

    DownloadResult download(const DownloadJob& job, int max_retries = 5, CancellationToken cancel = {}) {
        DownloadOptions options;
        options.max_retries = max_retries;
        FileDownloader downloader{sessions, sink, destinations, options, std::move(cancel)};
        return downloader.download(job);
    }

    DownloadJob job(const std::string& url = kUrl) const { return DownloadJob{url, dir.path(), std::nullopt, 1024}; }
};

} // namespace

TEST_CASE("Fresh download writes the whole body", "[downloader]") {
    Fixture f;
    const auto body = patternBody(2500);
    f.server.put(kUrl, FakeResource{body});

    const auto result = f.download(f.job());

    REQUIRE(result.ok());
    CHECK(result.url == kUrl);
    CHECK(result.path == f.dir.path() / "archive.zip");
    CHECK(readFile(result.path) == body);
    CHECK(f.server.rangesSeen(kUrl) == std::vector<std::string>{""});
    CHECK(f.server.headCount(kUrl) == 0);
    CHECK(f.sessions.outstanding() == 0);
    CHECK(f.sink.saw(JobEvent::Started));
    CHECK(f.sink.saw(JobEvent::Verifying));
    CHECK(f.sink.saw(JobEvent::Completed));

    const auto progress = f.sink.lastProgress();
    CHECK(progress.total_chunks == 3);
    CHECK(progress.chunks_done == 3);
    CHECK(progress.total_bytes == 2500);
    CHECK(progress.downloaded_bytes == 2500);
    CHECK_FALSE(f.sink.overshot());
    CHECK_FALSE(progress.is_running);
}

TEST_CASE("Partial file is resumed with a range request", "[downloader]") {
    Fixture f;
    const auto body = patternBody(2500);
    f.server.put(kUrl, FakeResource{body});
    writeFile(f.dir.path() / "archive.zip", body.substr(0, 1024));

    const auto result = f.download(f.job());

    REQUIRE(result.ok());
    CHECK(readFile(result.path) == body);
    CHECK(f.server.rangesSeen(kUrl) == std::vector<std::string>{"bytes=1024-"});
    CHECK(f.sink.saw(JobEvent::Resuming));

    const auto progress = f.sink.lastProgress();
    CHECK(progress.total_chunks == 3);
    CHECK(progress.chunks_done == 3);
    CHECK(progress.downloaded_bytes == 2500);
    CHECK_FALSE(f.sink.overshot());
}

TEST_CASE("Complete file answered with 416 is left untouched", "[downloader]") {
    Fixture f;
    const auto body = patternBody(2500);
    f.server.put(kUrl, FakeResource{body});
    writeFile(f.dir.path() / "archive.zip", body);

    const auto result = f.download(f.job());

    REQUIRE(result.ok());
    CHECK(readFile(result.path) == body);
    CHECK(f.server.getCount(kUrl) == 1);
}

TEST_CASE("Server ignoring the range rewrites the file", "[downloader]") {
    Fixture f;
    const auto body = patternBody(2500);
    FakeResource resource{body};
    resource.honor_range = false;
    f.server.put(kUrl, resource);
    writeFile(f.dir.path() / "archive.zip", std::string(1024, 'x'));

    const auto result = f.download(f.job());

    REQUIRE(result.ok());
    CHECK(readFile(result.path) == body);
}

TEST_CASE("Bodies smaller than one chunk and empty bodies", "[downloader]") {
    Fixture f;

    SECTION("small body") {
        const auto body = patternBody(100);
        f.server.put(kUrl, FakeResource{body});
        const auto result = f.download(f.job());
        REQUIRE(result.ok());
        CHECK(readFile(result.path) == body);
    }

    SECTION("empty body") {
        f.server.put(kUrl, FakeResource{""});
        const auto result = f.download(f.job());
        REQUIRE(result.ok());
        CHECK(readFile(result.path).empty());
    }
}

TEST_CASE("Link problems are not retried", "[downloader]") {
    Fixture f;

    SECTION("404") {
        const auto result = f.download(f.job());
        CHECK(result.error_kind == ErrorKind::Link);
        CHECK(f.server.getCount(kUrl) == 1);
    }

    SECTION("gone") {
        FakeResource resource{patternBody(10)};
        resource.status = 410;
        f.server.put(kUrl, resource);
        CHECK(f.download(f.job()).error_kind == ErrorKind::Link);
        CHECK(f.server.getCount(kUrl) == 1);
    }

    SECTION("missing Content-Length") {
        FakeResource resource{patternBody(2500)};
        resource.send_length = false;
        f.server.put(kUrl, resource);
        CHECK(f.download(f.job()).error_kind == ErrorKind::Link);
        CHECK(f.server.getCount(kUrl) == 1);
    }

    SECTION("malformed URL") {
        const auto result = f.download(f.job("not a url"));
        CHECK(result.error_kind == ErrorKind::Link);
        CHECK(f.sessions.acquired() == 0);
    }

    CHECK_FALSE(f.sink.saw(JobEvent::Retrying));
    CHECK(f.sink.saw(JobEvent::Failed));
    CHECK(f.sessions.outstanding() == 0);
}

TEST_CASE("Target directory that is a file is rejected", "[downloader]") {
    Fixture f;
    f.server.put(kUrl, FakeResource{patternBody(10)});
    const auto blocker = f.dir.path() / "blocker";
    writeFile(blocker, "x");

    auto job = f.job();
    job.target_directory = blocker;
    const auto result = f.download(job);

    CHECK(result.error_kind == ErrorKind::InvalidTarget);
    CHECK(f.sessions.acquired() == 0);
}

TEST_CASE("Missing target directory is created", "[downloader]") {
    Fixture f;
    const auto body = patternBody(1500);
    f.server.put(kUrl, FakeResource{body});

    auto job = f.job();
    job.target_directory = f.dir.path() / "nested" / "out";
    const auto result = f.download(job);

    REQUIRE(result.ok());
    CHECK(readFile(job.target_directory / "archive.zip") == body);
}

TEST_CASE("File name resolution", "[downloader]") {
    Fixture f;
    const auto body = patternBody(2000);

    SECTION("name without extension follows the redirect target") {
        const std::string url = "http://files2xyzexample.onion/download/42";
        FakeResource resource{body};
        resource.location = "http://cdn2xyzexample.onion/store/report.pdf";
        f.server.put(url, resource);

        const auto result = f.download(f.job(url));
        REQUIRE(result.ok());
        CHECK(result.path == f.dir.path() / "report.pdf");
        CHECK(f.server.headCount(url) == 1);
        CHECK(f.sink.saw(JobEvent::FilenameResolved));
    }

    SECTION("explicit name wins") {
        f.server.put(kUrl, FakeResource{body});
        auto job = f.job();
        job.filename = "renamed.bin";

        const auto result = f.download(job);
        REQUIRE(result.ok());
        CHECK(result.path == f.dir.path() / "renamed.bin");
        CHECK(readFile(result.path) == body);
    }

    SECTION("unsafe explicit name") {
        f.server.put(kUrl, FakeResource{body});
        auto job = f.job();
        job.filename = "../escape.bin";
        CHECK(f.download(job).error_kind == ErrorKind::InvalidTarget);
    }
}

TEST_CASE("Transient failures are retried up to the limit", "[downloader]") {
    Fixture f;
    const auto body = patternBody(2500);

    SECTION("every attempt fails") {
        FakeResource resource{body};
        resource.transport_failures = 100;
        f.server.put(kUrl, resource);

        const auto result = f.download(f.job(), 3);
        CHECK(result.error_kind == ErrorKind::RetriesExceeded);
        CHECK(f.server.getCount(kUrl) == 3);
        CHECK(f.sessions.acquired() == 3);
        CHECK(f.sink.saw(JobEvent::Retrying));
    }

    SECTION("server errors are transient") {
        FakeResource resource{body};
        resource.status = 503;
        f.server.put(kUrl, resource);

        CHECK(f.download(f.job(), 2).error_kind == ErrorKind::RetriesExceeded);
        CHECK(f.server.getCount(kUrl) == 2);
    }

    SECTION("connection reset mid-body resumes from whole chunks") {
        FakeResource resource{body};
        resource.truncate_after = 1500;
        f.server.put(kUrl, resource);

        const auto result = f.download(f.job());
        REQUIRE(result.ok());
        CHECK(readFile(result.path) == body);
        CHECK(f.server.rangesSeen(kUrl) == std::vector<std::string>{"", "bytes=1024-"});
    }

    CHECK(f.sessions.outstanding() == 0);
}

TEST_CASE("Short transfer fails verification and is resumed", "[downloader]") {
    Fixture f;
    const auto body = patternBody(2500);
    FakeResource resource{body};
    resource.short_by = 100;

    SECTION("resumed on the next attempt") {
        f.server.put(kUrl, resource);
        const auto result = f.download(f.job());
        REQUIRE(result.ok());
        CHECK(readFile(result.path) == body);
        CHECK(f.server.rangesSeen(kUrl) == std::vector<std::string>{"", "bytes=2400-"});
    }

    SECTION("mismatch counts against the retry limit") {
        resource.transport_failures = 1;
        f.server.put(kUrl, resource);
        CHECK(f.download(f.job(), 2).error_kind == ErrorKind::RetriesExceeded);
    }

    SECTION("limit large enough to finish") {
        resource.transport_failures = 1;
        f.server.put(kUrl, resource);
        const auto result = f.download(f.job(), 3);
        REQUIRE(result.ok());
        CHECK(readFile(result.path) == body);
    }
}

TEST_CASE("Proxy failures are escalated", "[downloader]") {
    Fixture f;
    f.server.put(kUrl, FakeResource{patternBody(2500)});

    SECTION("no session available") {
        f.sessions.failNextAcquires(1);
        CHECK(f.download(f.job()).error_kind == ErrorKind::ProxyUnavailable);
        CHECK(f.server.getCount(kUrl) == 0);
    }

    SECTION("proxy refuses the request") {
        f.server.resource(kUrl).proxy_failures = 1;
        CHECK(f.download(f.job()).error_kind == ErrorKind::ProxyUnavailable);
        CHECK(f.server.getCount(kUrl) == 1);
        CHECK(f.sessions.releasedUnhealthy() == 1);
    }

    CHECK(f.sessions.outstanding() == 0);
}

TEST_CASE("Cancellation keeps a resumable partial file", "[downloader]") {
    Fixture f;
    const auto body = patternBody(10000);
    f.server.put(kUrl, FakeResource{body});

    SECTION("cancelled before the first attempt") {
        CancellationToken cancel;
        cancel.cancel();
        CHECK(f.download(f.job(), 5, cancel).error_kind == ErrorKind::Cancelled);
        CHECK(f.sessions.acquired() == 0);
    }

    SECTION("cancelled before the response headers") {
        CancellationToken cancel;
        CancelOnEvent cancelling{cancel, JobEvent::FilenameResolved};
        FileDownloader downloader{f.sessions, cancelling, f.destinations, {}, cancel};

        const auto result = downloader.download(f.job());
        CHECK(result.error_kind == ErrorKind::Cancelled);
        CHECK_FALSE(cancelling.retried());
        CHECK(f.server.getCount(kUrl) == 1);
        CHECK(f.sessions.acquired() == 1);
    }

    SECTION("cancelled mid-stream") {
        CancellationToken cancel;
        CancelAfterChunks cancelling{cancel, 2};
        FileDownloader downloader{f.sessions, cancelling, f.destinations, {}, cancel};

        const auto result = downloader.download(f.job());
        CHECK(result.error_kind == ErrorKind::Cancelled);

        const auto partial = readFile(f.dir.path() / "archive.zip");
        CHECK(partial.size() == 2048);
        CHECK(partial == body.substr(0, 2048));

        const auto resumed = f.download(f.job());
        REQUIRE(resumed.ok());
        CHECK(readFile(resumed.path) == body);
        CHECK(f.server.rangesSeen(kUrl).back() == "bytes=2048-");
    }

    CHECK(f.sessions.outstanding() == 0);
}
