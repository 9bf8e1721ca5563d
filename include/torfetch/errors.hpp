#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace torfetch {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The destination directory is unusable (e.g. the path is a regular file).
class InvalidTargetError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Malformed URL, 404/410, or a response without size metadata. Never retried.
class LinkError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// The anonymizing proxy could not be used at all. Escalated to the coordinator.
class ProxyUnavailableError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Connection refused/reset, timeouts and other request failures.
class TransportError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class SizeMismatchError : public DownloadError {
public:
    SizeMismatchError(std::uint64_t expected, std::uint64_t actual)
        : DownloadError("file size " + std::to_string(actual) + " does not match expected " +
                        std::to_string(expected)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::uint64_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::uint64_t actual() const noexcept { return actual_; }

private:
    std::uint64_t expected_;
    std::uint64_t actual_;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace torfetch
