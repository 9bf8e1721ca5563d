#pragma once

#include "config.hpp"
#include "download_job.hpp"

#include <map>
#include <string>

namespace torfetch {

// Installs the default "torfetch" logger: rotating file sink plus a colored
// stderr sink.
void setupLogging(const Config& config);

void logSummary(const std::map<std::string, DownloadResult>& results);

} // namespace torfetch
