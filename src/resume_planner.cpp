#include "torfetch/resume_planner.hpp"

#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace torfetch {

ResumePlan planResume(const std::filesystem::path& destination, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    ResumePlan plan;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(destination, ec)) {
        return plan;
    }

    const auto size = std::filesystem::file_size(destination, ec);
    if (ec) {
        throw std::system_error(ec, "Cannot read size of " + destination.string());
    }

    plan.bytes_present = static_cast<std::uint64_t>(size);
    plan.chunks_present = plan.bytes_present / chunk_size;
    plan.range_header = fmt::format("bytes={}-", plan.bytes_present);
    spdlog::info("Found file '{}' in output directory, resuming download after {} chunks",
                 destination.filename().string(), plan.chunks_present);
    return plan;
}

} // namespace torfetch
