#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace xmprate {

// Appends `s` to `out` as a double-quoted, ASCII-only string that is safe to
// print to a terminal or a log line.
//
// Behavior:
// - Escapes `"` and `\` with a backslash
// - Escapes `\n`, `\r`, `\t`; other control bytes and non-ASCII as `\xNN`
// - Truncates to `max_bytes` input bytes (0 = unlimited) and appends "..."
//   after the closing quote
void
append_console_quoted(std::string_view s, uint32_t max_bytes,
                      std::string* out) noexcept;

}  // namespace xmprate
