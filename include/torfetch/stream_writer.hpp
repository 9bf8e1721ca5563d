#pragma once

#include "cancellation.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace torfetch {

// Writes a body to the destination in fixed-size chunks, in arrival order.
// Opens in append mode when resuming and truncates otherwise. At most one
// partial chunk is held in memory; it is written by finish() only, so an
// abandoned writer leaves a file made of whole chunks.
class StreamWriter {
public:
    // Called with the number of chunks written by this writer so far.
    using ChunkCallback = std::function<void(std::uint64_t chunks_written)>;

    StreamWriter(std::filesystem::path destination, bool append, std::size_t chunk_size,
                 CancellationToken cancel = {}, ChunkCallback on_chunk = {});
    ~StreamWriter();

    StreamWriter(const StreamWriter&) = delete;
    StreamWriter& operator=(const StreamWriter&) = delete;

    // Returns false once cancellation is observed at a chunk boundary; the
    // remaining input is then dropped.
    bool consume(const char* data, std::size_t size);
    // Writes the trailing partial chunk, flushes and closes.
    std::uint64_t finish();

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytes_written_; }
    [[nodiscard]] std::uint64_t chunksWritten() const noexcept { return chunks_written_; }

    // Single-write path used for bodies smaller than one chunk.
    static std::uint64_t writeAll(const std::filesystem::path& destination, bool append, std::string_view data);

private:
    struct FileDeleter {
        void operator()(std::FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    void writeChunk(const char* data, std::size_t size);

    std::filesystem::path destination_;
    std::size_t chunk_size_;
    CancellationToken cancel_;
    ChunkCallback on_chunk_;
    std::unique_ptr<std::FILE, FileDeleter> file_{};
    std::string pending_;
    std::uint64_t bytes_written_{0};
    std::uint64_t chunks_written_{0};
};

} // namespace torfetch
