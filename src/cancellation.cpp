#include "torfetch/cancellation.hpp"

namespace torfetch {

static_assert(std::atomic<bool>::is_always_lock_free, "signal handlers need a lock-free flag");

CancellationToken::CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationToken::cancel() noexcept { flag_->store(true); }

bool CancellationToken::cancelled() const noexcept { return flag_->load(); }

} // namespace torfetch
