#include "xmprate/rating_extract.h"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace xmprate;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    const RatingResult r = extract_rating(bytes);
    if (r.status == RatingStatus::Ok && r.rating < 0) {
        __builtin_trap();
    }

    const LabelResult label = extract_label(bytes);
    if (!label.found && !label.value.empty()) {
        __builtin_trap();
    }
    return 0;
}
