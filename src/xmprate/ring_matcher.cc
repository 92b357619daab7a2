#include "xmprate/ring_matcher.h"

#include <algorithm>

namespace xmprate {

RingMatcher::RingMatcher(std::span<const std::byte> delimiter)
    : delimiter_(delimiter.begin(), delimiter.end())
    , window_(delimiter.size(), std::byte { 0 })
{
}


RingMatcher::RingMatcher(std::string_view delimiter)
    : RingMatcher(as_bytes(delimiter))
{
}


void
RingMatcher::push(std::byte b) noexcept
{
    const size_t cap = window_.size();
    if (cap == 0U) {
        return;
    }
    window_[cursor_] = b;
    cursor_          = (cursor_ + 1U == cap) ? 0U : cursor_ + 1U;
}


bool
RingMatcher::matches() const noexcept
{
    return matches(delimiter_);
}


bool
RingMatcher::matches(std::span<const std::byte> pattern) const noexcept
{
    const size_t cap = window_.size();
    if (cap == 0U || pattern.size() != cap) {
        return false;
    }

    // Newest byte first: most pushes are rejected on it.
    const size_t newest = (cursor_ == 0U) ? cap - 1U : cursor_ - 1U;
    if (window_[newest] != pattern[cap - 1U]) {
        return false;
    }

    // Logical position i lives at (cursor_ + i) % cap.
    const size_t head = cap - cursor_;
    if (!std::equal(window_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                    window_.end(), pattern.begin())) {
        return false;
    }
    return std::equal(window_.begin(),
                      window_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                      pattern.begin() + static_cast<std::ptrdiff_t>(head));
}


void
RingMatcher::reset() noexcept
{
    std::fill(window_.begin(), window_.end(), std::byte { 0 });
    cursor_ = 0;
}

}  // namespace xmprate
