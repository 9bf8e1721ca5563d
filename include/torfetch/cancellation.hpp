#pragma once

#include <atomic>
#include <memory>

namespace torfetch {

// Copies share one flag; once cancelled it stays cancelled.
class CancellationToken {
public:
    CancellationToken();

    void cancel() noexcept;
    [[nodiscard]] bool cancelled() const noexcept;

    // Raw flag for async-signal handlers; stays valid while any copy lives.
    [[nodiscard]] std::atomic<bool>* flag() const noexcept { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace torfetch
