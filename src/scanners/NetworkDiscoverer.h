#pragma once
#include <memory>
#include <string>
#include <vector>

namespace lanprobe {

struct Config;

// One host reported by a discovery sweep.
struct DiscoveredHost {
    std::string ip;
    std::string hostname; // reverse DNS name if the tool printed one
    std::string mac;      // empty when the tool gave none
    std::string vendor;   // comment as printed, e.g. "(Raspberry Pi Foundation)"
};

// Runs a LAN discovery sweep over a target network. Implementations throw
// ScanFailure when the tool is missing, fails or prints unparseable output.
class NetworkDiscoverer {
public:
    virtual ~NetworkDiscoverer() = default;
    virtual std::string name() const = 0;
    // Whether this process may obtain hardware addresses at all.
    virtual bool has_required_privilege() const = 0;
    // Whether the backing tool can be started at all.
    virtual bool is_available() const { return true; }
    virtual std::vector<DiscoveredHost> discover(const std::string& target) = 0;
};

using NetworkDiscovererPtr = std::unique_ptr<NetworkDiscoverer>;

NetworkDiscovererPtr make_network_discoverer(const Config& cfg);

}
