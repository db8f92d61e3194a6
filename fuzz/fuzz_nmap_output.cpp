#include "scanners/NmapDiscoverer.h"
#include "scanners/NmapPortProbe.h"
#include <string>

// Feeds arbitrary text to every parser that consumes external output.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);
    auto hosts = lanprobe::NmapDiscoverer::parse_output(input);
    if (hosts) {
        for (const auto& h : *hosts) (void)h.ip.size();
    }
    auto ports = lanprobe::NmapPortProbe::parse_grepable(input);
    if (ports) {
        for (auto p : *ports) {
            if (p == 0) __builtin_trap();
        }
    }
    return 0;
}
