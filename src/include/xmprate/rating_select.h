#pragma once

#include "xmprate/rating_extract.h"
#include "xmprate/rating_filter.h"
#include "xmprate/rating_read.h"

#include <cstdint>

/**
 * \file rating_select.h
 * \brief Per-file selection decision: read rating and label, apply a filter.
 */

namespace xmprate {

enum class SelectAction : uint8_t {
    Selected,
    Rejected,
    /// Open, stat, seek or read failed.
    SkippedIoError,
    /// No packet, and missing packets are not read as rating 0.
    SkippedNotFound,
    /// The rating line could not be parsed.
    SkippedMalformed,
};

struct SelectOptions final {
    RatingReadOptions read;
    RatingFilter filter;
    /// Files without a packet read as rating 0 (and no label).
    bool missing_as_zero = false;
};

struct SelectResult final {
    SelectAction action = SelectAction::Rejected;

    /// Rating the filter was applied to.
    int32_t rating = 0;

    RatingReadResult read;
    LabelResult label;
};

/// True for the actions that carry a usable \ref SelectResult::rating.
constexpr bool
has_rating(SelectAction action) noexcept
{
    return action == SelectAction::Selected
           || action == SelectAction::Rejected;
}

/**
 * \brief Reads the rating and label of \p path and applies
 * `options.filter`.
 *
 * Never stops at a bad file: I/O errors, missing packets and malformed
 * ratings are reported through \ref SelectResult::action.
 */
SelectResult
select_file(const char* path, const SelectOptions& options) noexcept;

}  // namespace xmprate
