#include "xmprate/build_info.h"

#include "xmprate/build_info_generated.h"
#include "xmprate/packet_scan.h"

#include <cstdint>
#include <string>

namespace xmprate {
namespace {

    static constexpr bool linkage_shared() noexcept
    {
#if defined(XMPRATE_BUILD_LINKAGE_SHARED) && XMPRATE_BUILD_LINKAGE_SHARED
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/XMPRATE_BUILDINFO_VERSION,
        /*build_type=*/XMPRATE_BUILDINFO_BUILD_TYPE,
        /*system_name=*/XMPRATE_BUILDINFO_SYSTEM_NAME,
        /*cxx_compiler_id=*/XMPRATE_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/XMPRATE_BUILDINFO_CXX_COMPILER_VERSION,
        /*linkage_shared=*/linkage_shared(),
    };


    static void append_u64_field(std::string* out, const char* name,
                                 uint64_t v) noexcept
    {
        out->append(" ");
        out->append(name);
        out->append("=");
        out->append(std::to_string(v));
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    const BuildInfo& bi = build_info();

    if (line1) {
        line1->assign("XmpRate v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type.empty() ? std::string_view("unknown")
                                            : bi.build_type);
        line1->append(bi.linkage_shared ? " shared (" : " static (");
        line1->append(bi.cxx_compiler_id);
        line1->append("-");
        line1->append(bi.cxx_compiler_version);
        line1->append(" ");
        line1->append(bi.system_name);
        line1->append(")");
    }

    if (line2) {
        const PacketScanOptions defaults;
        line2->assign("scan defaults:");
        append_u64_field(line2, "chunk", defaults.chunk_bytes);
        append_u64_field(line2, "tail_window", defaults.tail_window_bytes);
        append_u64_field(line2, "max_scan", defaults.max_scan_bytes);
        append_u64_field(line2, "max_packet", defaults.max_packet_bytes);
    }
}

}  // namespace xmprate
