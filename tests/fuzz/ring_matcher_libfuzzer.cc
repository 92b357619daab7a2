#include "xmprate/packet_scan.h"
#include "xmprate/ring_matcher.h"

#include <cstddef>
#include <cstdint>
#include <cstring>

// Checks the matcher against a direct comparison of the trailing window.
extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace xmprate;

    RingMatcher m(kXmpPacketClose);
    const size_t n = kXmpPacketClose.size();
    for (size_t i = 0; i < size; ++i) {
        m.push(std::byte { data[i] });
        const bool expected = (i + 1U >= n)
                              && std::memcmp(data + (i + 1U - n),
                                             kXmpPacketClose.data(), n)
                                     == 0;
        if (m.matches() != expected) {
            __builtin_trap();
        }
    }
    return 0;
}
