#pragma once

#include "xmprate/rating_extract.h"

#include <cstdint>
#include <string_view>

/**
 * \file rating_filter.h
 * \brief Threshold and label predicate used to select files.
 */

namespace xmprate {

enum class RatingComparison : uint8_t {
    MoreEqual,
    LessEqual,
    Equal,
};

struct RatingFilter final {
    int32_t threshold           = 5;
    RatingComparison comparison = RatingComparison::MoreEqual;

    /// Also require the file's label to equal \ref label.
    bool match_label = false;
    std::string_view label;

    /// Selects the files that fail the filter instead.
    bool inverse = false;
};

/// Comparison of \p rating against the threshold only (no label, no inverse).
bool
threshold_passes(int32_t rating, const RatingFilter& filter) noexcept;

/**
 * \brief True if a file with \p rating and \p label is selected by \p filter.
 *
 * The threshold check and (when enabled) the label check must both pass; a
 * file without a label fails the label check. \ref RatingFilter::inverse is
 * applied to the combined result.
 */
bool
rating_passes(int32_t rating, const LabelResult& label,
              const RatingFilter& filter) noexcept;

/// Same as above for a file without a label.
bool
rating_passes(int32_t rating, const RatingFilter& filter) noexcept;

/// Parses `more-equal`, `less-equal` or `equal`.
bool
parse_rating_comparison(std::string_view s, RatingComparison* out) noexcept;

const char*
rating_comparison_name(RatingComparison comparison) noexcept;

}  // namespace xmprate
