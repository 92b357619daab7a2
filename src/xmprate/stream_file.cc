#include "xmprate/stream_file.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

#if defined(_WIN32)
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/stat.h>
#    include <sys/types.h>
#    include <unistd.h>
#endif

namespace xmprate {

StreamFile::StreamFile() noexcept = default;


StreamFile::~StreamFile() noexcept
{
    close();
}


StreamFile::StreamFile(StreamFile&& other) noexcept
{
    *this = std::move(other);
}


StreamFile&
StreamFile::operator=(StreamFile&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();

#if defined(_WIN32)
    file_handle_       = other.file_handle_;
    other.file_handle_ = nullptr;
#else
    fd_       = other.fd_;
    other.fd_ = -1;
#endif

    size_           = other.size_;
    position_       = other.position_;
    other.size_     = 0;
    other.position_ = 0;
    return *this;
}


StreamFileStatus
StreamFile::open(const char* path) noexcept
{
    close();

    if (!path || !*path) {
        return StreamFileStatus::OpenFailed;
    }

#if defined(_WIN32)
    HANDLE h = ::CreateFileA(path, GENERIC_READ, FILE_SHARE_READ, nullptr,
                             OPEN_EXISTING, FILE_FLAG_SEQUENTIAL_SCAN,
                             nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return StreamFileStatus::OpenFailed;
    }

    LARGE_INTEGER sz;
    if (!::GetFileSizeEx(h, &sz) || sz.QuadPart < 0) {
        ::CloseHandle(h);
        return StreamFileStatus::StatFailed;
    }

    file_handle_ = static_cast<void*>(h);
    size_        = static_cast<uint64_t>(sz.QuadPart);
    position_    = 0;
    return StreamFileStatus::Ok;
#else
    const int fd = ::open(path, O_RDONLY);
    if (fd < 0) {
        return StreamFileStatus::OpenFailed;
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0 || st.st_size < 0) {
        ::close(fd);
        return StreamFileStatus::StatFailed;
    }

    fd_       = fd;
    size_     = static_cast<uint64_t>(st.st_size);
    position_ = 0;
    return StreamFileStatus::Ok;
#endif
}


void
StreamFile::close() noexcept
{
#if defined(_WIN32)
    if (file_handle_) {
        ::CloseHandle(static_cast<HANDLE>(file_handle_));
    }
    file_handle_ = nullptr;
#else
    if (fd_ >= 0) {
        (void)::close(fd_);
    }
    fd_ = -1;
#endif

    size_     = 0;
    position_ = 0;
}


StreamFileStatus
StreamFile::seek(uint64_t offset) noexcept
{
    if (!is_open()) {
        return StreamFileStatus::SeekFailed;
    }

#if defined(_WIN32)
    if (offset > static_cast<uint64_t>(
                     std::numeric_limits<LONGLONG>::max())) {
        return StreamFileStatus::SeekFailed;
    }
    LARGE_INTEGER dist;
    dist.QuadPart = static_cast<LONGLONG>(offset);
    if (!::SetFilePointerEx(static_cast<HANDLE>(file_handle_), dist, nullptr,
                            FILE_BEGIN)) {
        return StreamFileStatus::SeekFailed;
    }
#else
    if (offset > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
        return StreamFileStatus::SeekFailed;
    }
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        return StreamFileStatus::SeekFailed;
    }
#endif

    position_ = offset;
    return StreamFileStatus::Ok;
}


StreamFileStatus
StreamFile::read(std::span<std::byte> buffer, size_t* n_read) noexcept
{
    if (n_read) {
        *n_read = 0;
    }
    if (!is_open()) {
        return StreamFileStatus::ReadFailed;
    }
    if (buffer.empty()) {
        return StreamFileStatus::Ok;
    }

#if defined(_WIN32)
    const DWORD want = (buffer.size() > 0x7FFFFFFFu)
                           ? 0x7FFFFFFFu
                           : static_cast<DWORD>(buffer.size());
    DWORD got        = 0;
    if (!::ReadFile(static_cast<HANDLE>(file_handle_), buffer.data(), want,
                    &got, nullptr)) {
        return StreamFileStatus::ReadFailed;
    }
    const size_t n = static_cast<size_t>(got);
#else
    ssize_t got = 0;
    for (;;) {
        got = ::read(fd_, buffer.data(), buffer.size());
        if (got >= 0 || errno != EINTR) {
            break;
        }
    }
    if (got < 0) {
        return StreamFileStatus::ReadFailed;
    }
    const size_t n = static_cast<size_t>(got);
#endif

    position_ += static_cast<uint64_t>(n);
    if (n_read) {
        *n_read = n;
    }
    return StreamFileStatus::Ok;
}


bool
StreamFile::is_open() const noexcept
{
#if defined(_WIN32)
    return file_handle_ != nullptr;
#else
    return fd_ >= 0;
#endif
}


uint64_t
StreamFile::size() const noexcept
{
    return size_;
}


uint64_t
StreamFile::position() const noexcept
{
    return position_;
}

}  // namespace xmprate
