#pragma once
#include "NetworkDiscoverer.h"
#include <map>
#include <optional>

namespace lanprobe {

// MAC (upper-case colon form) -> IPv4 addresses seen for it, in report order.
using HostRecord = std::map<std::string, std::vector<std::string>>;

// The scanning host itself: nmap never prints its own MAC address.
struct LocalHost {
    std::string ip;
    std::string mac;
    std::string comment;
};

class NetworkScanner {
public:
    // Without a LocalHost the primary interface is used to identify this machine.
    explicit NetworkScanner(NetworkDiscovererPtr discoverer, std::optional<LocalHost> local = std::nullopt);

    std::string name() const { return "scan"; }
    std::string description() const { return "Discovers IPv4/MAC pairs on the local network segment"; }

    // Throws InvalidInput for a malformed target, PrivilegeError when MAC
    // addresses cannot be obtained, ScanFailure when the sweep fails.
    // An empty target means the primary interface's subnet.
    HostRecord scan(const std::string& target = "");
    // Same sweep, as one record per host (MAC normalized, this host filled in).
    std::vector<DiscoveredHost> scan_hosts(const std::string& target = "");

    // Keeps every IPv4 under the first MAC it was reported with.
    static HostRecord group_by_mac(const std::vector<DiscoveredHost>& hosts);

private:
    LocalHost resolve_local();

    NetworkDiscovererPtr discoverer_;
    std::optional<LocalHost> local_;
};

}
