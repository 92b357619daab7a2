#include "xmprate/rating_select.h"

#include <cstddef>
#include <vector>

namespace xmprate {

SelectResult
select_file(const char* path, const SelectOptions& options) noexcept
{
    SelectResult r;

    std::vector<std::byte> packet;
    r.read = read_rating(path, options.read, &packet);
    switch (r.read.status) {
    case RatingReadStatus::Ok: r.rating = r.read.rating; break;
    case RatingReadStatus::IoError:
        r.action = SelectAction::SkippedIoError;
        return r;
    case RatingReadStatus::NotFound:
        if (!options.missing_as_zero) {
            r.action = SelectAction::SkippedNotFound;
            return r;
        }
        r.rating = 0;
        break;
    case RatingReadStatus::Malformed:
        r.action = SelectAction::SkippedMalformed;
        return r;
    }

    r.label  = extract_label(packet);
    r.action = rating_passes(r.rating, r.label, options.filter)
                   ? SelectAction::Selected
                   : SelectAction::Rejected;
    return r;
}

}  // namespace xmprate
