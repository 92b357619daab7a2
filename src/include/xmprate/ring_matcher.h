#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file ring_matcher.h
 * \brief Fixed-window byte matcher for delimiters split across stream chunks.
 */

namespace xmprate {

/// Views the bytes of \p s as `std::byte`.
inline std::span<const std::byte>
as_bytes(std::string_view s) noexcept
{
    return std::span<const std::byte>(reinterpret_cast<const std::byte*>(
                                          s.data()),
                                      s.size());
}

/**
 * \brief Circular window over the most recent bytes of a stream.
 *
 * The window capacity is taken from the delimiter the matcher is bound to,
 * so the window and the pattern it is tested against always have the same
 * length. Bytes are pushed one at a time; \ref matches reports whether the
 * last `capacity()` bytes pushed equal the delimiter.
 *
 * The window starts zero-filled, so a delimiter with at least one non-zero
 * byte cannot match before `capacity()` bytes were pushed.
 */
class RingMatcher final {
public:
    explicit RingMatcher(std::span<const std::byte> delimiter);
    explicit RingMatcher(std::string_view delimiter);

    /// Overwrites the oldest byte with \p b.
    void push(std::byte b) noexcept;

    /// True if the window equals the bound delimiter.
    bool matches() const noexcept;

    /// True if the window equals \p pattern (false on length mismatch).
    bool matches(std::span<const std::byte> pattern) const noexcept;

    /// Clears the window back to zero bytes.
    void reset() noexcept;

    size_t capacity() const noexcept { return window_.size(); }
    std::span<const std::byte> delimiter() const noexcept { return delimiter_; }

private:
    std::vector<std::byte> delimiter_;
    std::vector<std::byte> window_;
    size_t cursor_ = 0;
};

}  // namespace xmprate
