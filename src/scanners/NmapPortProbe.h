#pragma once
#include "PortProbe.h"
#include <chrono>
#include <optional>

namespace lanprobe {

// TCP connect scan through nmap (-sT, unprivileged), grepable output.
class NmapPortProbe : public PortProbe {
public:
    NmapPortProbe(std::string nmap_path, std::chrono::milliseconds timeout) : nmap_(std::move(nmap_path)), timeout_(timeout) {}
    std::string name() const override { return "nmap"; }
    std::vector<uint16_t> open_ports(const std::string& host, const PortRange& range) override;

    std::vector<std::string> command_line(const std::string& host, const PortRange& range) const;
    // Open ports from "-oG -" output; nullopt when the "# Nmap done" trailer is missing.
    static std::optional<std::vector<uint16_t>> parse_grepable(const std::string& text);
private:
    std::string nmap_;
    std::chrono::milliseconds timeout_;
};

}
