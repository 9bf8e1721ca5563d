#include "torfetch/file_downloader.hpp"

#include "torfetch/detail/url.hpp"
#include "torfetch/errors.hpp"
#include "torfetch/stream_writer.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace torfetch {

namespace {

// Interprets the response of one attempt and routes its body to disk.
class AttemptHandler final : public ResponseHandler {
public:
    enum class Verdict {
        NoResponse,
        BadLink,
        RangeNotSatisfiable,
        HttpError,
        MissingLength,
        NothingLeft,
        SmallBody,
        Streaming,
    };

    AttemptHandler(const DownloadJob& job, DownloadState& state, const ResumePlan& plan, ProgressSink& sink,
                   CancellationToken cancel)
        : job_(job), state_(state), plan_(plan), sink_(sink), cancel_(std::move(cancel)) {}

    bool onHead(const ResponseHead& head) override {
        head_ = head;
        if (head.status == 404 || head.status == 410) {
            verdict_ = Verdict::BadLink;
            return false;
        }
        if (head.status == 416) {
            verdict_ = Verdict::RangeNotSatisfiable;
            return false;
        }
        if (head.status >= 400) {
            verdict_ = Verdict::HttpError;
            return false;
        }
        if (!head.content_length) {
            verdict_ = Verdict::MissingLength;
            return false;
        }

        length_ = *head.content_length;
        // A 200 answer to a range request carries the whole file.
        append_ = plan_.resuming() && head.status == 206;
        if (plan_.resuming() && !append_) {
            spdlog::warn("Server ignored the range request, restarting '{}' from the beginning",
                         state_.resolved_filename);
        }
        state_.expected_total_bytes = append_ ? plan_.bytes_present + length_ : length_;

        if (length_ == 0) {
            verdict_ = Verdict::NothingLeft;
            return false;
        }
        if (length_ < job_.chunk_size) {
            verdict_ = Verdict::SmallBody;
            body_.reserve(static_cast<std::size_t>(length_));
            return true;
        }

        verdict_ = Verdict::Streaming;
        const std::uint64_t initial_chunks = append_ ? plan_.chunks_present : 0;
        const std::uint64_t initial_bytes = append_ ? plan_.bytes_present : 0;
        // The trailing partial chunk is written by finish() and counted too.
        const std::uint64_t new_chunks = (length_ + job_.chunk_size - 1) / job_.chunk_size;
        progress_.url = job_.url;
        progress_.filename = state_.resolved_filename;
        progress_.total_chunks = initial_chunks + new_chunks;
        progress_.chunks_done = initial_chunks;
        progress_.total_bytes = state_.expected_total_bytes;
        progress_.downloaded_bytes = initial_bytes;
        progress_.is_running = true;
        detail::notifyEvent(sink_, job_.url, JobEvent::Streaming,
                            fmt::format("{} of {} chunks left", new_chunks, progress_.total_chunks));
        detail::notifyProgress(sink_, progress_);

        writer_.emplace(state_.destination_path, append_, job_.chunk_size, cancel_,
                        [this, initial_chunks, initial_bytes](std::uint64_t chunks_written) {
                            progress_.chunks_done = initial_chunks + chunks_written;
                            progress_.downloaded_bytes = initial_bytes + writer_->bytesWritten();
                            detail::notifyProgress(sink_, progress_);
                        });
        return true;
    }

    bool onData(const char* data, std::size_t size) override {
        received_ += size;
        if (verdict_ == Verdict::SmallBody) {
            body_.append(data, size);
            return true;
        }
        if (verdict_ == Verdict::Streaming && writer_) {
            return writer_->consume(data, size);
        }
        return false;
    }

    [[nodiscard]] bool cancelled() const override { return cancel_.cancelled(); }

    // Writes what is buffered and closes the file; returns bytes written.
    std::uint64_t finish() {
        if (verdict_ == Verdict::SmallBody) {
            return StreamWriter::writeAll(state_.destination_path, append_, body_);
        }
        if (writer_) {
            const auto written = writer_->finish();
            progress_.is_running = false;
            detail::notifyProgress(sink_, progress_);
            return written;
        }
        return 0;
    }

    // The transfer stopped before the advertised body arrived because of an interrupt.
    [[nodiscard]] bool interrupted() const { return received_ < length_ && cancel_.cancelled(); }

    [[nodiscard]] Verdict verdict() const noexcept { return verdict_; }
    [[nodiscard]] const ResponseHead& head() const noexcept { return head_; }
    [[nodiscard]] bool appending() const noexcept { return append_; }

private:
    const DownloadJob& job_;
    DownloadState& state_;
    const ResumePlan& plan_;
    ProgressSink& sink_;
    CancellationToken cancel_;

    Verdict verdict_{Verdict::NoResponse};
    ResponseHead head_{};
    std::uint64_t length_{0};
    std::uint64_t received_{0};
    bool append_{false};
    std::string body_;
    Progress progress_{};
    std::optional<StreamWriter> writer_{};
};

} // namespace

FileDownloader::FileDownloader(SessionProvider& sessions, ProgressSink& sink, DestinationRegistry& destinations,
                               DownloadOptions options, CancellationToken cancel)
    : sessions_(sessions),
      sink_(sink),
      destinations_(destinations),
      options_(options),
      cancel_(std::move(cancel)) {}

DownloadResult FileDownloader::download(const DownloadJob& job) {
    DownloadJob normalized = job;
    if (normalized.target_directory.empty()) {
        normalized.target_directory = std::filesystem::current_path();
    }

    spdlog::debug("Starting download from URL: {}", job.url);
    detail::notifyEvent(sink_, job.url, JobEvent::Started);

    DownloadState state;
    DownloadResult result;
    try {
        result = run(normalized, state);
    } catch (const InvalidTargetError& ex) {
        result = DownloadResult::failed(job.url, ErrorKind::InvalidTarget, ex.what());
    } catch (const LinkError& ex) {
        result = DownloadResult::failed(job.url, ErrorKind::Link, ex.what());
    } catch (const ProxyUnavailableError& ex) {
        result = DownloadResult::failed(job.url, ErrorKind::ProxyUnavailable, ex.what());
    } catch (const std::exception& ex) {
        result = DownloadResult::failed(job.url, ErrorKind::Unexpected, ex.what());
    }

    if (result.ok()) {
        detail::notifyEvent(sink_, job.url, JobEvent::Completed, result.path.string());
    } else if (result.error_kind == ErrorKind::Cancelled) {
        detail::notifyEvent(sink_, job.url, JobEvent::Cancelled, result.detail);
    } else {
        detail::notifyEvent(sink_, job.url, JobEvent::Failed,
                            fmt::format("{}: {}", toString(result.error_kind), result.detail));
    }
    return result;
}

DownloadResult FileDownloader::run(const DownloadJob& job, DownloadState& state) {
    if (job.chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    ensureTargetDirectory(job.target_directory);

    if (!detail::isValidUrl(job.url)) {
        spdlog::error("Invalid URL: {}", job.url);
        throw LinkError("Invalid URL: " + job.url);
    }
    if (job.filename) {
        if (!detail::isSafeFilename(*job.filename)) {
            throw InvalidTargetError("Invalid file name: " + *job.filename);
        }
        state.resolved_filename = *job.filename;
    }

    const auto started = std::chrono::steady_clock::now();
    std::optional<DestinationLease> lease;
    std::string last_error = "none";

    while (state.attempt_count < options_.max_retries) {
        if (cancel_.cancelled()) {
            return DownloadResult::failed(job.url, ErrorKind::Cancelled, "interrupted before the next attempt");
        }
        ++state.attempt_count;

        SessionLease session{sessions_};
        spdlog::debug("Attempt {}/{} using session #{} | URL: {}", state.attempt_count, options_.max_retries,
                      session.id(), job.url);
        try {
            if (runAttempt(job, state, session.client(), lease) == AttemptOutcome::Cancelled) {
                return DownloadResult::failed(job.url, ErrorKind::Cancelled,
                                              "interrupted, partial file kept for resuming");
            }
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
            spdlog::info("File downloaded! Elapsed Time: {:.1f}s | URL: {} | Filepath: {}", elapsed.count(), job.url,
                         state.destination_path.string());
            return DownloadResult::completed(job.url, state.destination_path);
        } catch (const ProxyUnavailableError&) {
            session.markUnhealthy();
            throw;
        } catch (const TransportError& ex) {
            last_error = ex.what();
            spdlog::warn("Request error, trying again. Attempt {}/{} | URL: {} | Error: {}", state.attempt_count,
                         options_.max_retries, job.url, ex.what());
            detail::notifyEvent(sink_, job.url, JobEvent::Retrying, ex.what());
        } catch (const SizeMismatchError& ex) {
            last_error = ex.what();
            spdlog::warn("Target file size ({}) does not match expected file size ({}), resuming. URL: {}",
                         ex.actual(), ex.expected(), job.url);
            detail::notifyEvent(sink_, job.url, JobEvent::Retrying, ex.what());
        }
    }

    spdlog::error("Max retries (#{}) exceeded for URL: {}", state.attempt_count, job.url);
    return DownloadResult::failed(job.url, ErrorKind::RetriesExceeded,
                                  fmt::format("gave up after {} attempts, last error: {}", state.attempt_count,
                                              last_error));
}

FileDownloader::AttemptOutcome FileDownloader::runAttempt(const DownloadJob& job, DownloadState& state,
                                                          HttpClient& client,
                                                          std::optional<DestinationLease>& lease) {
    if (state.resolved_filename.empty()) {
        resolveFilename(job, state, client);
    }
    state.destination_path = job.target_directory / state.resolved_filename;

    if (!lease) {
        lease = destinations_.acquire(state.destination_path, cancel_);
        if (!lease) {
            return AttemptOutcome::Cancelled;
        }
    }

    const ResumePlan plan = planResume(state.destination_path, job.chunk_size);
    state.bytes_already_present = plan.bytes_present;
    state.expected_total_bytes = 0;
    if (plan.resuming()) {
        detail::notifyEvent(sink_, job.url, JobEvent::Resuming,
                            fmt::format("{} bytes already present", plan.bytes_present));
    } else {
        spdlog::info("File not found in output directory, creating new file: {}", state.destination_path.string());
    }

    AttemptHandler handler{job, state, plan, sink_, cancel_};
    client.get(job.url, plan.range_header, handler);

    switch (handler.verdict()) {
    case AttemptHandler::Verdict::NoResponse:
        if (cancel_.cancelled()) {
            spdlog::info("Interrupted before a response arrived | URL: {}", job.url);
            return AttemptOutcome::Cancelled;
        }
        throw TransportError("Transfer ended without a response | URL: " + job.url);
    case AttemptHandler::Verdict::BadLink:
        spdlog::error("Received {}, recheck download links. Bad link: {}", handler.head().status, job.url);
        throw LinkError(fmt::format("HTTP {} for URL: {}", handler.head().status, job.url));
    case AttemptHandler::Verdict::RangeNotSatisfiable:
        if (!plan.resuming()) {
            throw TransportError("HTTP 416 without a range request | URL: " + job.url);
        }
        spdlog::info("Received 416 response, assuming download is done for file: {}", state.resolved_filename);
        return AttemptOutcome::Completed;
    case AttemptHandler::Verdict::HttpError:
        throw TransportError(fmt::format("HTTP {} | URL: {}", handler.head().status, job.url));
    case AttemptHandler::Verdict::MissingLength:
        throw LinkError("Content-Length missing for URL: " + job.url);
    case AttemptHandler::Verdict::NothingLeft:
        if (!handler.appending()) {
            StreamWriter::writeAll(state.destination_path, false, {});
        }
        spdlog::info("No more bytes left to download! URL: {} | Filepath: {}", job.url,
                     state.destination_path.string());
        return AttemptOutcome::Completed;
    case AttemptHandler::Verdict::SmallBody:
    case AttemptHandler::Verdict::Streaming:
        break;
    }

    if (handler.interrupted()) {
        spdlog::info("Interrupted, keeping partial file for later: {}", state.destination_path.string());
        return AttemptOutcome::Cancelled;
    }

    const auto written = handler.finish();
    detail::notifyEvent(sink_, job.url, JobEvent::Verifying,
                        fmt::format("{} bytes written, expecting {} in total", written, state.expected_total_bytes));

    std::error_code ec;
    const auto on_disk = std::filesystem::file_size(state.destination_path, ec);
    if (ec) {
        throw std::system_error(ec, "Cannot read size of " + state.destination_path.string());
    }
    spdlog::debug("Finalizing file: URL: {} | File size: {} | Expected file size: {}", job.url, on_disk,
                  state.expected_total_bytes);
    if (static_cast<std::uint64_t>(on_disk) != state.expected_total_bytes) {
        throw SizeMismatchError(state.expected_total_bytes, static_cast<std::uint64_t>(on_disk));
    }
    return AttemptOutcome::Completed;
}

void FileDownloader::resolveFilename(const DownloadJob& job, DownloadState& state, HttpClient& client) {
    std::string filename = detail::filenameFromUrl(job.url);
    if (!detail::hasExtension(filename)) {
        const auto head = client.head(job.url);
        if (!head.location.empty()) {
            auto redirected = detail::filenameFromLocation(head.location);
            if (!redirected.empty()) {
                filename = std::move(redirected);
            }
        }
    }

    if (!detail::isSafeFilename(filename)) {
        throw LinkError("Cannot derive a file name from URL: " + job.url);
    }
    state.resolved_filename = filename;
    detail::notifyEvent(sink_, job.url, JobEvent::FilenameResolved, filename);
}

void FileDownloader::ensureTargetDirectory(const std::filesystem::path& directory) {
    std::error_code ec;
    if (std::filesystem::is_directory(directory, ec)) {
        return;
    }
    if (std::filesystem::exists(directory, ec)) {
        throw InvalidTargetError(fmt::format("Invalid target_dir={} specified, target_dir is a file.",
                                             directory.string()));
    }

    spdlog::warn("Directory '{}' does not exist, attempting to create it.", directory.string());
    std::filesystem::create_directories(directory, ec);
    if (ec && !std::filesystem::is_directory(directory)) {
        throw InvalidTargetError(fmt::format("Invalid target_dir={} specified: {}", directory.string(), ec.message()));
    }
    spdlog::info("Directory '{}' successfully created.", directory.string());
}

} // namespace torfetch
