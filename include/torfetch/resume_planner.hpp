#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace torfetch {

struct ResumePlan {
    // Open-ended range ("bytes=<offset>-"), empty for a fresh download.
    std::string range_header;
    std::uint64_t bytes_present{0};
    // Whole chunks already on disk, for progress totals only.
    std::uint64_t chunks_present{0};

    [[nodiscard]] bool resuming() const noexcept { return !range_header.empty(); }
};

// Inspects the bytes already at destination and derives the resume request.
// Throws std::invalid_argument for a zero chunk size.
[[nodiscard]] ResumePlan planResume(const std::filesystem::path& destination, std::size_t chunk_size);

} // namespace torfetch
