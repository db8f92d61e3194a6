#pragma once
#include "NetworkDiscoverer.h"
#include <chrono>
#include <optional>

namespace lanprobe {

// Ping sweep via nmap (default flags "-sn -T5"). MAC lines only appear when
// nmap runs with raw socket privilege on the local segment.
class NmapDiscoverer : public NetworkDiscoverer {
public:
    NmapDiscoverer(std::string nmap_path, std::vector<std::string> args, std::chrono::milliseconds timeout)
        : nmap_(std::move(nmap_path)), args_(std::move(args)), timeout_(timeout) {}

    std::string name() const override { return "nmap"; }
    bool has_required_privilege() const override;
    bool is_available() const override;
    std::vector<DiscoveredHost> discover(const std::string& target) override;

    std::vector<std::string> command_line(const std::string& target) const;

    // Parses the human readable report. nullopt if the "Nmap done:" trailer is absent.
    static std::optional<std::vector<DiscoveredHost>> parse_output(const std::string& text);

private:
    std::string nmap_;
    std::vector<std::string> args_;
    std::chrono::milliseconds timeout_;
};

}
