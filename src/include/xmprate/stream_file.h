#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file stream_file.h
 * \brief Read-only, seekable file handle for chunked streaming reads.
 */

namespace xmprate {

/// Status code for \ref StreamFile operations.
enum class StreamFileStatus : uint8_t {
    Ok,
    OpenFailed,
    StatFailed,
    SeekFailed,
    ReadFailed,
};

/**
 * \brief Read-only file handle that never holds more than one caller buffer
 * of file data in memory.
 *
 * The handle is closed by the destructor, so it is released on every exit
 * path of a scan. Move-only.
 */
class StreamFile final {
public:
    StreamFile() noexcept;
    ~StreamFile() noexcept;

    StreamFile(const StreamFile&)            = delete;
    StreamFile& operator=(const StreamFile&) = delete;

    StreamFile(StreamFile&& other) noexcept;
    StreamFile& operator=(StreamFile&& other) noexcept;

    /// Opens \p path read-only and records its size.
    StreamFileStatus open(const char* path) noexcept;

    /// Closes the file (idempotent).
    void close() noexcept;

    /// Moves the read position to the absolute byte \p offset.
    StreamFileStatus seek(uint64_t offset) noexcept;

    /**
     * \brief Reads up to `buffer.size()` bytes at the current position.
     *
     * \p n_read is set to the number of bytes stored; 0 with
     * \ref StreamFileStatus::Ok means end of file.
     */
    StreamFileStatus read(std::span<std::byte> buffer,
                          size_t* n_read) noexcept;

    bool is_open() const noexcept;
    uint64_t size() const noexcept;
    uint64_t position() const noexcept;

private:
#if defined(_WIN32)
    void* file_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
    uint64_t size_     = 0;
    uint64_t position_ = 0;
};

}  // namespace xmprate
