#include "xmprate/rating_extract.h"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace xmprate {
namespace {

    static constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool is_ascii_digit(char c) noexcept
    {
        return c >= '0' && c <= '9';
    }


    static bool is_inline_ws(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }


    // XML NameChar subset that can continue a property name.
    static bool is_name_char(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
               || is_ascii_digit(c) || c == '_' || c == '-' || c == '.'
               || c == ':';
    }


    // Position of the first occurrence of `marker` that is not the prefix of
    // a longer name (`xmp:RatingPercent` is not `xmp:Rating`).
    static size_t find_marker(std::string_view line,
                              std::string_view marker) noexcept
    {
        size_t from = 0;
        for (;;) {
            const size_t pos = line.find(marker, from);
            if (pos == std::string_view::npos) {
                return pos;
            }
            const size_t end = pos + marker.size();
            if (end >= line.size() || !is_name_char(line[end])) {
                return pos;
            }
            from = pos + 1;
        }
    }


    // First line (split on '\n', trailing '\r' dropped) containing `marker`
    // as a whole name.
    static bool find_marker_line(std::string_view all, std::string_view marker,
                                 std::string_view* line, uint32_t* line_number,
                                 size_t* marker_pos) noexcept
    {
        uint32_t n = 0;
        size_t pos = 0;
        while (pos <= all.size()) {
            const size_t nl    = all.find('\n', pos);
            const size_t end   = (nl == std::string_view::npos) ? all.size() : nl;
            std::string_view l = all.substr(pos, end - pos);
            if (!l.empty() && l.back() == '\r') {
                l.remove_suffix(1);
            }
            n += 1;

            const size_t m = find_marker(l, marker);
            if (m != std::string_view::npos) {
                *line        = l;
                *line_number = n;
                *marker_pos  = m;
                return true;
            }

            if (nl == std::string_view::npos) {
                break;
            }
            pos = nl + 1;
        }
        return false;
    }


    static void append_xml_text(std::string_view s, std::string* out) noexcept
    {
        static constexpr struct {
            std::string_view entity;
            char c;
        } kEntities[] = {
            { "&amp;", '&' },  { "&lt;", '<' },   { "&gt;", '>' },
            { "&quot;", '"' }, { "&apos;", '\'' },
        };

        size_t i = 0;
        while (i < s.size()) {
            bool decoded = false;
            if (s[i] == '&') {
                for (const auto& e : kEntities) {
                    if (s.substr(i, e.entity.size()) == e.entity) {
                        out->push_back(e.c);
                        i += e.entity.size();
                        decoded = true;
                        break;
                    }
                }
            }
            if (!decoded) {
                out->push_back(s[i]);
                i += 1;
            }
        }
    }


    static bool label_text(std::string_view line, size_t after_marker,
                           std::string_view* out) noexcept
    {
        size_t i = after_marker;
        while (i < line.size() && is_inline_ws(line[i])) {
            i += 1;
        }

        if (i < line.size() && line[i] == '=') {
            i += 1;
            while (i < line.size() && is_inline_ws(line[i])) {
                i += 1;
            }
            if (i >= line.size() || (line[i] != '"' && line[i] != '\'')) {
                return false;
            }
            const char quote   = line[i];
            const size_t begin = i + 1;
            const size_t end   = line.find(quote, begin);
            if (end == std::string_view::npos) {
                return false;
            }
            *out = line.substr(begin, end - begin);
            return true;
        }

        const size_t gt = line.find('>', after_marker);
        if (gt == std::string_view::npos) {
            return false;
        }
        if (gt > after_marker && line[gt - 1] == '/') {
            *out = std::string_view {};
            return true;
        }
        const size_t begin = gt + 1;
        const size_t lt    = line.find('<', begin);
        *out = (lt == std::string_view::npos) ? line.substr(begin)
                                               : line.substr(begin, lt - begin);
        return true;
    }


    static bool value_text(std::string_view line, size_t after_marker,
                           std::string_view* out) noexcept
    {
        size_t i = after_marker;
        while (i < line.size() && is_inline_ws(line[i])) {
            i += 1;
        }

        if (i < line.size() && line[i] == '=') {
            const size_t begin = i + 1;
            const size_t end   = line.find('=', begin);
            *out = (end == std::string_view::npos)
                       ? line.substr(begin)
                       : line.substr(begin, end - begin);
            return true;
        }

        const size_t gt = line.find('>', after_marker);
        if (gt == std::string_view::npos) {
            return false;
        }
        const size_t begin = gt + 1;
        const size_t lt    = line.find('<', begin);
        *out = (lt == std::string_view::npos) ? line.substr(begin)
                                               : line.substr(begin, lt - begin);
        return true;
    }


    static bool parse_digits(std::string_view text, int32_t* out) noexcept
    {
        std::string digits;
        digits.reserve(text.size());
        for (char c : text) {
            if (is_ascii_digit(c)) {
                digits.push_back(c);
            }
        }
        if (digits.empty()) {
            return false;
        }

        int32_t v                      = 0;
        const char* first              = digits.data();
        const char* last               = digits.data() + digits.size();
        const std::from_chars_result r = std::from_chars(first, last, v);
        if (r.ec != std::errc() || r.ptr != last) {
            return false;
        }
        *out = v;
        return true;
    }

}  // namespace

void
append_utf8_lossy(std::span<const std::byte> bytes, std::string* out) noexcept
{
    out->reserve(out->size() + bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t c = u8(bytes[i]);
        if (c < 0x80U) {
            out->push_back(static_cast<char>(c));
            i += 1;
            continue;
        }

        // Continuation count and the valid range of the second byte
        // (excludes overlongs, surrogates and code points above U+10FFFF).
        uint32_t need = 0;
        uint8_t lo    = 0x80U;
        uint8_t hi    = 0xBFU;
        if (c >= 0xC2U && c <= 0xDFU) {
            need = 1;
        } else if (c == 0xE0U) {
            need = 2;
            lo   = 0xA0U;
        } else if (c >= 0xE1U && c <= 0xECU) {
            need = 2;
        } else if (c == 0xEDU) {
            need = 2;
            hi   = 0x9FU;
        } else if (c == 0xEEU || c == 0xEFU) {
            need = 2;
        } else if (c == 0xF0U) {
            need = 3;
            lo   = 0x90U;
        } else if (c >= 0xF1U && c <= 0xF3U) {
            need = 3;
        } else if (c == 0xF4U) {
            need = 3;
            hi   = 0x8FU;
        } else {
            out->append(kReplacementChar);
            i += 1;
            continue;
        }

        uint32_t k = 1;
        for (; k <= need; ++k) {
            if (i + k >= bytes.size()) {
                break;
            }
            const uint8_t cc  = u8(bytes[i + k]);
            const uint8_t klo = (k == 1U) ? lo : 0x80U;
            const uint8_t khi = (k == 1U) ? hi : 0xBFU;
            if (cc < klo || cc > khi) {
                break;
            }
        }

        if (k <= need) {
            // Maximal valid prefix becomes a single replacement.
            out->append(kReplacementChar);
            i += k;
            continue;
        }

        for (uint32_t j = 0; j <= need; ++j) {
            out->push_back(static_cast<char>(u8(bytes[i + j])));
        }
        i += need + 1U;
    }
}


RatingResult
extract_rating(std::span<const std::byte> packet,
               const RatingExtractOptions& options) noexcept
{
    RatingResult result;
    if (options.marker.empty()) {
        return result;
    }

    std::string text;
    append_utf8_lossy(packet, &text);

    std::string_view line;
    size_t marker_pos = 0;
    if (!find_marker_line(text, options.marker, &line, &result.line_number,
                          &marker_pos)) {
        return result;
    }
    result.marker_found = true;
    result.line.assign(line.data(), line.size());

    std::string_view value;
    int32_t rating = 0;
    if (!value_text(line, marker_pos + options.marker.size(), &value)
        || !parse_digits(value, &rating)) {
        result.status = RatingStatus::Malformed;
        return result;
    }
    result.rating = rating;
    return result;
}


LabelResult
extract_label(std::span<const std::byte> packet,
              std::string_view marker) noexcept
{
    LabelResult result;
    if (marker.empty()) {
        return result;
    }

    std::string text;
    append_utf8_lossy(packet, &text);

    std::string_view line;
    uint32_t line_number = 0;
    size_t marker_pos    = 0;
    if (!find_marker_line(text, marker, &line, &line_number, &marker_pos)) {
        return result;
    }

    std::string_view value;
    if (!label_text(line, marker_pos + marker.size(), &value)) {
        return result;
    }
    result.found       = true;
    result.line_number = line_number;
    append_xml_text(value, &result.value);
    return result;
}

}  // namespace xmprate
