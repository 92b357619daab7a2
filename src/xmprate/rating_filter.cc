#include "xmprate/rating_filter.h"

namespace xmprate {

bool
threshold_passes(int32_t rating, const RatingFilter& filter) noexcept
{
    switch (filter.comparison) {
    case RatingComparison::MoreEqual: return rating >= filter.threshold;
    case RatingComparison::LessEqual: return rating <= filter.threshold;
    case RatingComparison::Equal: return rating == filter.threshold;
    }
    return false;
}


bool
rating_passes(int32_t rating, const LabelResult& label,
              const RatingFilter& filter) noexcept
{
    bool pass = threshold_passes(rating, filter);
    if (filter.match_label) {
        pass = pass && label.found && label.value == filter.label;
    }
    return filter.inverse ? !pass : pass;
}


bool
rating_passes(int32_t rating, const RatingFilter& filter) noexcept
{
    return rating_passes(rating, LabelResult {}, filter);
}


bool
parse_rating_comparison(std::string_view s, RatingComparison* out) noexcept
{
    if (s == "more-equal") {
        *out = RatingComparison::MoreEqual;
        return true;
    }
    if (s == "less-equal") {
        *out = RatingComparison::LessEqual;
        return true;
    }
    if (s == "equal") {
        *out = RatingComparison::Equal;
        return true;
    }
    return false;
}


const char*
rating_comparison_name(RatingComparison comparison) noexcept
{
    switch (comparison) {
    case RatingComparison::MoreEqual: return "more-equal";
    case RatingComparison::LessEqual: return "less-equal";
    case RatingComparison::Equal: return "equal";
    }
    return "unknown";
}

}  // namespace xmprate
