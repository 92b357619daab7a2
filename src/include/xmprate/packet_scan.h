#pragma once

#include "xmprate/stream_file.h"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

/**
 * \file packet_scan.h
 * \brief Streaming locator for delimiter-bracketed XMP packets in raw files.
 *
 * Used for files whose metadata is not reachable through a container parser
 * (for example MOV/MP4/AVI with an embedded `<x:xmpmeta>` block). The file is
 * read in fixed-size chunks; delimiters split across chunks are still found.
 */

namespace xmprate {

inline constexpr std::string_view kXmpPacketOpen  = "<x:xmpmeta";
inline constexpr std::string_view kXmpPacketClose = "</x:xmpmeta>";

/// Packet scan result status.
enum class PacketScanStatus : uint8_t {
    Found,
    /// No packet in the searched range, or the scan budget was exhausted.
    NotFound,
    OpenFailed,
    StatFailed,
    SeekFailed,
    ReadFailed,
};

/// Where a single scan pass starts.
enum class ScanStart : uint8_t {
    /// `tail_window_bytes` before end of file (clamped to 0).
    Tail,
    /// Byte 0.
    Head,
};

/// Which pass of \ref locate_packet produced the result.
enum class PacketScanPhase : uint8_t {
    Tail,
    Head,
};

struct PacketScanOptions final {
    /// Read size per chunk (0 = default).
    uint32_t chunk_bytes = 128U * 1024U;

    /// Bytes before end of file searched by the tail pass.
    uint64_t tail_window_bytes = 1024ULL * 1024ULL;

    /// Max bytes examined per pass (0 = unlimited).
    uint64_t max_scan_bytes = 1024ULL * 1024ULL * 1024ULL;

    /// Max accumulated packet size, delimiters included (0 = unlimited).
    uint64_t max_packet_bytes = 64ULL * 1024ULL * 1024ULL;

    std::string_view open_delimiter  = kXmpPacketOpen;
    std::string_view close_delimiter = kXmpPacketClose;
};

struct PacketScanResult final {
    PacketScanStatus status = PacketScanStatus::NotFound;
    PacketScanPhase phase   = PacketScanPhase::Tail;

    /// Bytes consumed by the pass that produced this result.
    uint64_t bytes_examined = 0;

    /// Absolute file offset where the pass started.
    uint64_t start_offset = 0;

    /// Absolute file offset of the open delimiter (valid when found).
    uint64_t packet_offset = 0;

    /// True if `max_scan_bytes` or `max_packet_bytes` stopped the pass.
    bool budget_exhausted = false;
};

/// True for statuses that indicate an I/O failure (as opposed to not found).
constexpr bool
is_io_error(PacketScanStatus status) noexcept
{
    return status != PacketScanStatus::Found
           && status != PacketScanStatus::NotFound;
}

/**
 * \brief Runs one forward scan pass over \p file.
 *
 * On \ref PacketScanStatus::Found, \p out holds the packet bytes from the
 * first byte of the open delimiter through the last byte of the close
 * delimiter. On any other status \p out is left empty; a dangling open
 * delimiter never yields a partial packet.
 *
 * The first packet in the scanned range wins.
 */
PacketScanResult
scan_packet(StreamFile& file, ScanStart start,
            const PacketScanOptions& options,
            std::vector<std::byte>* out) noexcept;

/**
 * \brief Tail pass first, then a full pass from byte 0 if the tail pass did
 * not find a packet.
 *
 * I/O failures are returned immediately without running the other pass.
 */
PacketScanResult
locate_packet(StreamFile& file, const PacketScanOptions& options,
              std::vector<std::byte>* out) noexcept;

/// Opens \p path and runs \ref locate_packet on it.
PacketScanResult
locate_packet(const char* path, const PacketScanOptions& options,
              std::vector<std::byte>* out) noexcept;

}  // namespace xmprate
