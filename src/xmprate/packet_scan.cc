#include "xmprate/packet_scan.h"

#include "xmprate/ring_matcher.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace xmprate {
namespace {

    static constexpr uint32_t kDefaultChunkBytes = 128U * 1024U;

    static PacketScanStatus
    scan_status_from_file(StreamFileStatus status) noexcept
    {
        switch (status) {
        case StreamFileStatus::Ok: return PacketScanStatus::Found;
        case StreamFileStatus::OpenFailed: return PacketScanStatus::OpenFailed;
        case StreamFileStatus::StatFailed: return PacketScanStatus::StatFailed;
        case StreamFileStatus::SeekFailed: return PacketScanStatus::SeekFailed;
        case StreamFileStatus::ReadFailed: return PacketScanStatus::ReadFailed;
        }
        return PacketScanStatus::ReadFailed;
    }


    static uint64_t tail_start_offset(uint64_t file_size,
                                      uint64_t tail_window) noexcept
    {
        return (file_size > tail_window) ? file_size - tail_window : 0U;
    }


    static PacketScanResult finish(PacketScanResult result,
                                   PacketScanStatus status,
                                   std::vector<std::byte>* packet) noexcept
    {
        result.status = status;
        if (status != PacketScanStatus::Found) {
            packet->clear();
        }
        return result;
    }

}  // namespace

PacketScanResult
scan_packet(StreamFile& file, ScanStart start,
            const PacketScanOptions& options,
            std::vector<std::byte>* out) noexcept
{
    std::vector<std::byte> scratch;
    std::vector<std::byte>* packet = out ? out : &scratch;
    packet->clear();

    PacketScanResult result;
    result.phase = (start == ScanStart::Tail) ? PacketScanPhase::Tail
                                              : PacketScanPhase::Head;
    result.start_offset
        = (start == ScanStart::Tail)
              ? tail_start_offset(file.size(), options.tail_window_bytes)
              : 0U;

    const StreamFileStatus seek_st = file.seek(result.start_offset);
    if (seek_st != StreamFileStatus::Ok) {
        return finish(result, scan_status_from_file(seek_st), packet);
    }

    if (options.open_delimiter.empty() || options.close_delimiter.empty()) {
        return finish(result, PacketScanStatus::NotFound, packet);
    }

    RingMatcher open_matcher(options.open_delimiter);
    RingMatcher close_matcher(options.close_delimiter);
    bool open_found = false;

    const uint32_t chunk_bytes = (options.chunk_bytes != 0U)
                                     ? options.chunk_bytes
                                     : kDefaultChunkBytes;
    std::vector<std::byte> chunk(chunk_bytes);

    for (;;) {
        size_t n                       = 0;
        const StreamFileStatus read_st = file.read(chunk, &n);
        if (read_st != StreamFileStatus::Ok) {
            return finish(result, scan_status_from_file(read_st), packet);
        }
        if (n == 0U) {
            break;
        }

        for (size_t i = 0; i < n; ++i) {
            const std::byte b = chunk[i];

            result.bytes_examined += 1;
            if (options.max_scan_bytes != 0U
                && result.bytes_examined > options.max_scan_bytes) {
                result.budget_exhausted = true;
                return finish(result, PacketScanStatus::NotFound, packet);
            }

            if (!open_found) {
                open_matcher.push(b);
                if (open_matcher.matches()) {
                    open_found           = true;
                    result.packet_offset = result.start_offset
                                           + result.bytes_examined
                                           - open_matcher.capacity();
                    const std::span<const std::byte> open
                        = open_matcher.delimiter();
                    packet->assign(open.begin(), open.end());
                }
                continue;
            }

            close_matcher.push(b);
            packet->push_back(b);
            if (options.max_packet_bytes != 0U
                && packet->size() > options.max_packet_bytes) {
                result.budget_exhausted = true;
                return finish(result, PacketScanStatus::NotFound, packet);
            }
            if (close_matcher.matches()) {
                return finish(result, PacketScanStatus::Found, packet);
            }
        }
    }

    return finish(result, PacketScanStatus::NotFound, packet);
}


PacketScanResult
locate_packet(StreamFile& file, const PacketScanOptions& options,
              std::vector<std::byte>* out) noexcept
{
    const PacketScanResult tail = scan_packet(file, ScanStart::Tail, options,
                                              out);
    if (tail.status != PacketScanStatus::NotFound) {
        return tail;
    }
    // The tail pass already covered the whole file.
    if (tail.start_offset == 0U && !tail.budget_exhausted) {
        return tail;
    }
    return scan_packet(file, ScanStart::Head, options, out);
}


PacketScanResult
locate_packet(const char* path, const PacketScanOptions& options,
              std::vector<std::byte>* out) noexcept
{
    if (out) {
        out->clear();
    }

    StreamFile file;
    const StreamFileStatus st = file.open(path);
    if (st != StreamFileStatus::Ok) {
        PacketScanResult r;
        r.status = scan_status_from_file(st);
        return r;
    }
    return locate_packet(file, options, out);
}

}  // namespace xmprate
