#include "torfetch/destination_registry.hpp"

#include <chrono>
#include <utility>

namespace torfetch {

DestinationLease::DestinationLease(DestinationRegistry* registry, std::string key)
    : registry_(registry), key_(std::move(key)) {}

DestinationLease::~DestinationLease() { release(); }

DestinationLease::DestinationLease(DestinationLease&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), key_(std::move(other.key_)) {}

DestinationLease& DestinationLease::operator=(DestinationLease&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = std::exchange(other.registry_, nullptr);
        key_ = std::move(other.key_);
    }
    return *this;
}

void DestinationLease::release() noexcept {
    if (registry_) {
        registry_->releaseKey(key_);
        registry_ = nullptr;
    }
}

std::optional<DestinationLease> DestinationRegistry::acquire(const std::filesystem::path& destination,
                                                             const CancellationToken& cancel) {
    auto key = keyFor(destination);
    std::unique_lock<std::mutex> lock(mutex_);
    // Cancellation is a plain flag, so waiting polls it.
    while (held_.count(key) != 0) {
        if (cancel.cancelled()) {
            return std::nullopt;
        }
        released_.wait_for(lock, std::chrono::milliseconds(200));
    }
    held_.insert(key);
    return DestinationLease{this, std::move(key)};
}

bool DestinationRegistry::isHeld(const std::filesystem::path& destination) const {
    const auto key = keyFor(destination);
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(key) != 0;
}

std::string DestinationRegistry::keyFor(const std::filesystem::path& destination) {
    return std::filesystem::absolute(destination).lexically_normal().string();
}

void DestinationRegistry::releaseKey(const std::string& key) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(key);
    }
    released_.notify_all();
}

} // namespace torfetch
