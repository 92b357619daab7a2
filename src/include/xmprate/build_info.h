#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version and build configuration reported by `xmprate --version`.
 */

namespace xmprate {

/// Values compiled in at configure time.
struct BuildInfo final {
    std::string_view version;
    std::string_view build_type;
    std::string_view system_name;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;
    bool linkage_shared = false;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats the two `--version` lines.
 *
 * - `XmpRate vX.Y.Z <build_type> <static|shared> (<compiler> <system>)`
 * - `scan defaults: chunk=N tail_window=N max_scan=N max_packet=N`
 *
 * The second line lists the \ref PacketScanOptions defaults in bytes.
 */
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace xmprate
