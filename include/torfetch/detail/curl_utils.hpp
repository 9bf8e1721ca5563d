#pragma once

namespace torfetch::detail {

// Process-wide curl_global_init, performed once.
void ensureCurlInitialized();

} // namespace torfetch::detail
