#pragma once
#include "PortProbe.h"
#include "../core/PortRegistry.h"
#include <map>

namespace lanprobe {

struct OpenPort {
    uint16_t port = 0;
    bool known = false;      // present in the port registry
    std::string keyword;     // registry keyword or PortRegistry::UNKNOWN
    std::string description; // registry description, may be empty
};

// Ascending by port number.
using OpenPortResult = std::map<uint16_t, OpenPort>;

class PortScanner {
public:
    PortScanner(PortProbePtr probe, const PortRegistry& registry, PortRange range = {});

    std::string name() const { return "portscan"; }
    std::string description() const { return "Finds TCP ports with a bound listener on one host"; }

    // Throws InvalidInput for a bad host or range, ScanFailure when the probe cannot run.
    OpenPortResult scan(const std::string& host);

    const PortRange& range() const { return range_; }

    static void validate_host(const std::string& host);
    // port -> service name view of a result.
    static std::map<uint16_t, std::string> service_names(const OpenPortResult& result);

private:
    PortProbePtr probe_;
    const PortRegistry& registry_;
    PortRange range_;
};

}
