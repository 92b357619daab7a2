#include "xmprate/build_info.h"
#include "xmprate/console_format.h"
#include "xmprate/packet_scan.h"
#include "xmprate/rating_filter.h"
#include "xmprate/rating_read.h"
#include "xmprate/rating_select.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace xmprate {
namespace {

    static const char* scan_status_name(PacketScanStatus status) noexcept
    {
        switch (status) {
        case PacketScanStatus::Found: return "found";
        case PacketScanStatus::NotFound: return "not_found";
        case PacketScanStatus::OpenFailed: return "open_failed";
        case PacketScanStatus::StatFailed: return "stat_failed";
        case PacketScanStatus::SeekFailed: return "seek_failed";
        case PacketScanStatus::ReadFailed: return "read_failed";
        }
        return "unknown";
    }

    static const char* phase_name(PacketScanPhase phase) noexcept
    {
        switch (phase) {
        case PacketScanPhase::Tail: return "tail";
        case PacketScanPhase::Head: return "head";
        }
        return "unknown";
    }

    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || *s == '-') {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    static bool parse_i32_arg(const char* s, int32_t* out)
    {
        if (!s || !*s) {
            return false;
        }
        char* end   = nullptr;
        long long v = std::strtoll(s, &end, 10);
        if (!end || *end != '\0' || v < INT32_MIN || v > INT32_MAX) {
            return false;
        }
        *out = static_cast<int32_t>(v);
        return true;
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file> [file...]\n", argv0);
        std::printf("prints the files whose embedded XMP rating passes the filter\n");
        std::printf("options:\n");
        std::printf("  --version              print build info and exit\n");
        std::printf("  --threshold N          rating threshold (default: 5)\n");
        std::printf(
            "  --comparison C         more-equal | less-equal | equal (default: more-equal)\n");
        std::printf("  --label TEXT           also require xmp:Label to equal TEXT\n");
        std::printf("  --inverse              select files failing the filter\n");
        std::printf("  --list                 print \"<rating>\\t<file>\" for every readable file\n");
        std::printf("  --missing-as-zero      treat files without a packet as rating 0\n");
        std::printf("  --marker TOKEN         rating field token (default: xmp:Rating)\n");
        std::printf("  --chunk-bytes N        read size per chunk (default: 131072)\n");
        std::printf("  --tail-window N        bytes before EOF searched first (default: 1048576)\n");
        std::printf(
            "  --max-scan-bytes N     max bytes examined per pass (default: 1073741824; 0=unlimited)\n");
        std::printf(
            "  --max-packet-bytes N   max packet size (default: 67108864; 0=unlimited)\n");
        std::printf("  --verbose              log scan details to stderr\n");
        std::printf("  --                     end of options\n");
    }

    static void print_build_info_header(std::FILE* f)
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::fprintf(f, "%s\n%s\n", line1.c_str(), line2.c_str());
    }

    static void log_scan(const char* path, const PacketScanResult& scan)
    {
        std::fprintf(
            stderr,
            "xmprate: `%s` scan=%s phase=%s start=%llu examined=%llu offset=%llu%s\n",
            path, scan_status_name(scan.status), phase_name(scan.phase),
            static_cast<unsigned long long>(scan.start_offset),
            static_cast<unsigned long long>(scan.bytes_examined),
            static_cast<unsigned long long>(scan.packet_offset),
            scan.budget_exhausted ? " budget_exhausted" : "");
    }

    static void log_skip(const char* path, const SelectResult& r)
    {
        switch (r.action) {
        case SelectAction::SkippedIoError:
            std::fprintf(stderr, "xmprate: skipping `%s` (%s)\n", path,
                         scan_status_name(r.read.scan.status));
            break;
        case SelectAction::SkippedNotFound:
            std::fprintf(stderr,
                         "xmprate: skipping `%s` (no XMP packet found)\n", path);
            break;
        case SelectAction::SkippedMalformed: {
            std::string quoted;
            append_console_quoted(r.read.extract.line, 256, &quoted);
            std::fprintf(stderr,
                         "xmprate: skipping `%s` (malformed rating at line %u: %s)\n",
                         path, static_cast<unsigned>(r.read.extract.line_number),
                         quoted.c_str());
            break;
        }
        case SelectAction::Selected:
        case SelectAction::Rejected: break;
        }
    }

    static bool is_long_option(const char* arg) noexcept
    {
        return arg[0] == '-' && arg[1] == '-';
    }

}  // namespace
}  // namespace xmprate

int
main(int argc, char** argv)
{
    using namespace xmprate;

    SelectOptions options;
    bool list_all = false;
    bool verbose  = false;
    std::vector<const char*> paths;

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg || !*arg) {
            continue;
        }
        if (options_done || !is_long_option(arg)) {
            paths.push_back(arg);
            continue;
        }
        if (std::strcmp(arg, "--") == 0) {
            options_done = true;
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header(stdout);
            return 0;
        }
        if (std::strcmp(arg, "--inverse") == 0) {
            options.filter.inverse = true;
            continue;
        }
        if (std::strcmp(arg, "--list") == 0) {
            list_all = true;
            continue;
        }
        if (std::strcmp(arg, "--missing-as-zero") == 0) {
            options.missing_as_zero = true;
            continue;
        }
        if (std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
            continue;
        }

        const bool takes_value = std::strcmp(arg, "--threshold") == 0
                                 || std::strcmp(arg, "--comparison") == 0
                                 || std::strcmp(arg, "--label") == 0
                                 || std::strcmp(arg, "--marker") == 0
                                 || std::strcmp(arg, "--chunk-bytes") == 0
                                 || std::strcmp(arg, "--tail-window") == 0
                                 || std::strcmp(arg, "--max-scan-bytes") == 0
                                 || std::strcmp(arg, "--max-packet-bytes") == 0;
        if (!takes_value) {
            std::fprintf(stderr, "xmprate: unknown option `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
        if (i + 1 >= argc || !argv[i + 1]) {
            std::fprintf(stderr, "xmprate: missing value for `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
        const char* value = argv[++i];

        bool ok = true;
        if (std::strcmp(arg, "--threshold") == 0) {
            ok = parse_i32_arg(value, &options.filter.threshold);
        } else if (std::strcmp(arg, "--comparison") == 0) {
            ok = parse_rating_comparison(value, &options.filter.comparison);
        } else if (std::strcmp(arg, "--label") == 0) {
            options.filter.match_label = true;
            options.filter.label       = value;
        } else if (std::strcmp(arg, "--marker") == 0) {
            ok                          = *value != '\0';
            options.read.extract.marker = value;
        } else if (std::strcmp(arg, "--chunk-bytes") == 0) {
            ok = parse_u32_arg(value, &options.read.scan.chunk_bytes)
                 && options.read.scan.chunk_bytes != 0U;
        } else if (std::strcmp(arg, "--tail-window") == 0) {
            ok = parse_u64_arg(value, &options.read.scan.tail_window_bytes);
        } else if (std::strcmp(arg, "--max-scan-bytes") == 0) {
            ok = parse_u64_arg(value, &options.read.scan.max_scan_bytes);
        } else {
            ok = parse_u64_arg(value, &options.read.scan.max_packet_bytes);
        }
        if (!ok) {
            std::fprintf(stderr, "xmprate: invalid %s value `%s`\n", arg, value);
            return 2;
        }
    }

    if (paths.empty()) {
        usage(argv[0]);
        return 2;
    }

    if (verbose) {
        print_build_info_header(stderr);
        std::fprintf(stderr, "xmprate: threshold=%d comparison=%s%s\n",
                     static_cast<int>(options.filter.threshold),
                     rating_comparison_name(options.filter.comparison),
                     options.filter.inverse ? " inverse" : "");
        if (options.filter.match_label) {
            std::fprintf(stderr, "xmprate: label=`%.*s`\n",
                         static_cast<int>(options.filter.label.size()),
                         options.filter.label.data());
        }
    }

    int exit_code = 0;
    for (const char* path : paths) {
        const SelectResult r = select_file(path, options);
        if (verbose) {
            log_scan(path, r.read.scan);
        }
        if (!has_rating(r.action)) {
            log_skip(path, r);
            if (r.action == SelectAction::SkippedIoError) {
                exit_code = 1;
            }
            continue;
        }

        if (list_all) {
            std::printf("%d\t%s\n", static_cast<int>(r.rating), path);
            continue;
        }
        if (r.action == SelectAction::Selected) {
            if (verbose) {
                std::fprintf(stderr, "xmprate: rated %d `%s`\n",
                             static_cast<int>(r.rating), path);
            }
            std::printf("%s\n", path);
        }
    }

    return exit_code;
}
