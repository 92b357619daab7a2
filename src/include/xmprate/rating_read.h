#pragma once

#include "xmprate/packet_scan.h"
#include "xmprate/rating_extract.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * \file rating_read.h
 * \brief High-level "read the rating of this file" helper.
 */

namespace xmprate {

/// Outcome of \ref read_rating.
enum class RatingReadStatus : uint8_t {
    Ok,
    /// Open, stat, seek or read failed; see `scan.status`.
    IoError,
    /// No packet in either pass (including budget aborts).
    NotFound,
    /// Packet found, rating line unparseable; see `extract.line`.
    Malformed,
};

struct RatingReadOptions final {
    PacketScanOptions scan;
    RatingExtractOptions extract;
};

struct RatingReadResult final {
    RatingReadStatus status = RatingReadStatus::Ok;
    int32_t rating          = 0;
    PacketScanResult scan;
    RatingResult extract;
};

/**
 * \brief Locates the embedded XMP packet of \p path and extracts its rating.
 *
 * Runs \ref locate_packet (tail pass, then full pass) followed by
 * \ref extract_rating. A packet without a rating line reads as rating 0.
 *
 * \param packet_out Optional; receives the packet bytes when one was found.
 */
RatingReadResult
read_rating(const char* path, const RatingReadOptions& options,
            std::vector<std::byte>* packet_out = nullptr) noexcept;

/// Same as \ref read_rating for an already opened file.
RatingReadResult
read_rating(StreamFile& file, const RatingReadOptions& options,
            std::vector<std::byte>* packet_out = nullptr) noexcept;

}  // namespace xmprate
