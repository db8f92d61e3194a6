#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lanprobe {

struct Config;

// Inclusive TCP port range.
struct PortRange {
    int first = 1;
    int last = 1023;
    bool valid() const { return first >= 1 && first <= last && last <= 65535; }
    bool contains(int p) const { return p >= first && p <= last; }
    std::string to_string() const { return std::to_string(first) + "-" + std::to_string(last); }
};

// Finds listening TCP ports on one host. Implementations throw ScanFailure
// when the probe cannot run at all; closed or filtered ports are not errors.
class PortProbe {
public:
    virtual ~PortProbe() = default;
    virtual std::string name() const = 0;
    virtual std::vector<uint16_t> open_ports(const std::string& host, const PortRange& range) = 0;
};

using PortProbePtr = std::unique_ptr<PortProbe>;

// "connect" or "nmap"; anything else is InvalidInput.
PortProbePtr make_port_probe(const Config& cfg);

}
