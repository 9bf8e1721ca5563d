#pragma once

#include "cancellation.hpp"

#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace torfetch {

class DestinationRegistry;

// Exclusive right to write one destination path; released on destruction.
class DestinationLease {
public:
    DestinationLease() = default;
    DestinationLease(DestinationRegistry* registry, std::string key);
    ~DestinationLease();

    DestinationLease(DestinationLease&& other) noexcept;
    DestinationLease& operator=(DestinationLease&& other) noexcept;
    DestinationLease(const DestinationLease&) = delete;
    DestinationLease& operator=(const DestinationLease&) = delete;

    [[nodiscard]] bool held() const noexcept { return registry_ != nullptr; }
    void release() noexcept;

private:
    DestinationRegistry* registry_{nullptr};
    std::string key_;
};

class DestinationRegistry {
public:
    // Blocks while another lease holds the same path. Returns nullopt if
    // cancellation is observed while waiting.
    [[nodiscard]] std::optional<DestinationLease> acquire(const std::filesystem::path& destination,
                                                          const CancellationToken& cancel);

    [[nodiscard]] bool isHeld(const std::filesystem::path& destination) const;

private:
    friend class DestinationLease;

    [[nodiscard]] static std::string keyFor(const std::filesystem::path& destination);
    void releaseKey(const std::string& key) noexcept;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> held_;
};

} // namespace torfetch
