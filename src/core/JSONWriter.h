#pragma once
#include "../scanners/PortScanner.h"
#include "../scanners/NetworkScanner.h"
#include <string>
#include <vector>

namespace lanprobe {

// Serializes scan results. Key order is the result's order (ports ascending, MACs sorted).
class JSONWriter {
public:
    explicit JSONWriter(bool pretty = false) : pretty_(pretty) {}

    // {"22":"ssh","8000":"unknown"}
    std::string write(const OpenPortResult& result) const;
    // [{"port":22,"status":"open","known":true,"keyword":"ssh","description":"..."}]
    std::string write_detailed(const OpenPortResult& result) const;
    // {"B8:27:EB:AC:14:3E":["192.168.123.4"]}
    std::string write(const HostRecord& record) const;
    // [{"ip":"192.168.123.4","mac":"B8:27:EB:AC:14:3E","comment":"(Raspberry Pi Foundation)"}]
    std::string write_detailed(const std::vector<DiscoveredHost>& hosts) const;
    // {"error":"message"}
    std::string write_error(const std::string& message) const;

private:
    bool pretty_;
};

}
