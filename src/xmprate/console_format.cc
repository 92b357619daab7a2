#include "xmprate/console_format.h"

#include <cstdio>

namespace xmprate {

void
append_console_quoted(std::string_view s, uint32_t max_bytes,
                      std::string* out) noexcept
{
    const size_t n = (max_bytes == 0U || s.size() < max_bytes)
                         ? s.size()
                         : static_cast<size_t>(max_bytes);

    out->reserve(out->size() + n + 2U);
    out->push_back('"');
    for (size_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '"':
        case '\\':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n': out->append("\\n"); continue;
        case '\r': out->append("\\r"); continue;
        case '\t': out->append("\\t"); continue;
        default: break;
        }
        if (c < 0x20U || c >= 0x7FU) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    out->push_back('"');
    if (n < s.size()) {
        out->append("...");
    }
}

}  // namespace xmprate
