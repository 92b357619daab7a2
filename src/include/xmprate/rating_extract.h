#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file rating_extract.h
 * \brief Line-oriented rating and label lookup in raw XMP packet text.
 *
 * This is not an XMP/RDF decoder: it finds the first line mentioning a
 * property and reads its value from that line, which is enough for
 * packets written by cameras and photo managers and works on packets an XML
 * parser would reject.
 */

namespace xmprate {

inline constexpr std::string_view kXmpRatingMarker = "xmp:Rating";
inline constexpr std::string_view kXmpLabelMarker  = "xmp:Label";

/// Rating extraction status.
enum class RatingStatus : uint8_t {
    Ok,
    /// The rating line exists but holds no usable number.
    Malformed,
};

struct RatingExtractOptions final {
    /// Token identifying the rating line.
    std::string_view marker = kXmpRatingMarker;
};

struct RatingResult final {
    RatingStatus status = RatingStatus::Ok;

    /// Parsed rating. 0 when no rating line exists.
    int32_t rating = 0;

    bool marker_found = false;

    /// 1-based line number of the rating line (0 if none).
    uint32_t line_number = 0;

    /// The rating line, UTF-8 (invalid input sequences replaced by U+FFFD).
    std::string line;
};

struct LabelResult final {
    /// A label value was read (it may be empty).
    bool found = false;

    /// 1-based line number of the label line (0 if none).
    uint32_t line_number = 0;

    /// Label text, UTF-8, with the predefined XML entities decoded.
    std::string value;
};

/**
 * \brief Extracts the rating value from XMP packet bytes.
 *
 * The packet is decoded as UTF-8 (lossy) and split into lines. The first line
 * containing `options.marker` is parsed:
 * - attribute form (`marker="4"`): the text after the `=` up to the next `=`
 * - element form (`<marker>4</marker>`): the text between the next `>` and
 *   the following `<`
 *
 * Only ASCII digits of that text are kept. A packet without a rating line
 * yields rating 0 with \ref RatingStatus::Ok.
 */
RatingResult
extract_rating(std::span<const std::byte> packet,
               const RatingExtractOptions& options
               = RatingExtractOptions {}) noexcept;

/**
 * \brief Extracts the color label (`xmp:Label`) from XMP packet bytes.
 *
 * The first line containing \p marker as a whole name is parsed:
 * - attribute form (`marker="Red"`, single or double quotes): the quoted text
 * - element form (`<marker>Red</marker>`): the text between the next `>` and
 *   the following `<`; `<marker/>` reads as an empty label
 *
 * A line whose value cannot be read (unterminated quote, missing `>`) leaves
 * `found` false, as does a packet without the marker.
 */
LabelResult
extract_label(std::span<const std::byte> packet,
              std::string_view marker = kXmpLabelMarker) noexcept;

/**
 * \brief Appends \p bytes to \p out as UTF-8, replacing each invalid or
 * truncated sequence by U+FFFD.
 */
void
append_utf8_lossy(std::span<const std::byte> bytes, std::string* out) noexcept;

}  // namespace xmprate
