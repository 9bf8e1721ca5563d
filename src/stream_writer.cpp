#include "torfetch/stream_writer.hpp"

#include <algorithm>
#include <cerrno>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace torfetch {

namespace {

std::FILE* openDestination(const std::filesystem::path& destination, bool append) {
    std::FILE* fp = std::fopen(destination.c_str(), append ? "ab" : "wb");
    if (!fp) {
        throw std::system_error(errno, std::generic_category(), "Cannot open " + destination.string());
    }
    return fp;
}

} // namespace

StreamWriter::StreamWriter(std::filesystem::path destination, bool append, std::size_t chunk_size,
                           CancellationToken cancel, ChunkCallback on_chunk)
    : destination_(std::move(destination)),
      chunk_size_(chunk_size),
      cancel_(std::move(cancel)),
      on_chunk_(std::move(on_chunk)) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    file_.reset(openDestination(destination_, append));
    pending_.reserve(chunk_size_);
}

StreamWriter::~StreamWriter() = default;

bool StreamWriter::consume(const char* data, std::size_t size) {
    if (!file_) {
        return false;
    }

    while (size > 0) {
        const std::size_t wanted = chunk_size_ - pending_.size();
        const std::size_t take = std::min(wanted, size);

        if (pending_.empty() && take == chunk_size_) {
            writeChunk(data, take);
        } else {
            pending_.append(data, take);
            if (pending_.size() == chunk_size_) {
                writeChunk(pending_.data(), pending_.size());
                pending_.clear();
            }
        }
        data += take;
        size -= take;

        if (pending_.empty() && cancel_.cancelled()) {
            spdlog::debug("Stopping '{}' at chunk {}", destination_.filename().string(), chunks_written_);
            return false;
        }
    }
    return true;
}

std::uint64_t StreamWriter::finish() {
    if (!file_) {
        return bytes_written_;
    }
    if (!pending_.empty()) {
        writeChunk(pending_.data(), pending_.size());
        pending_.clear();
    }
    if (std::fflush(file_.get()) != 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot flush " + destination_.string());
    }
    std::FILE* fp = file_.release();
    if (std::fclose(fp) != 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot close " + destination_.string());
    }
    return bytes_written_;
}

void StreamWriter::writeChunk(const char* data, std::size_t size) {
    const std::size_t written = std::fwrite(data, 1, size, file_.get());
    bytes_written_ += written;
    if (written != size) {
        throw std::system_error(errno, std::generic_category(), "Cannot write " + destination_.string());
    }
    ++chunks_written_;

    if (on_chunk_) {
        try {
            on_chunk_(chunks_written_);
        } catch (const std::exception& ex) {
            spdlog::warn("Progress report for '{}' failed: {}", destination_.filename().string(), ex.what());
        }
    }
}

std::uint64_t StreamWriter::writeAll(const std::filesystem::path& destination, bool append, std::string_view data) {
    std::unique_ptr<std::FILE, FileDeleter> file{openDestination(destination, append)};
    if (!data.empty() && std::fwrite(data.data(), 1, data.size(), file.get()) != data.size()) {
        throw std::system_error(errno, std::generic_category(), "Cannot write " + destination.string());
    }
    std::FILE* fp = file.release();
    if (std::fclose(fp) != 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot close " + destination.string());
    }
    return data.size();
}

} // namespace torfetch
