#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace lanprobe {

struct Ipv4Network {
    uint32_t address = 0; // host byte order
    int prefix = 32;
    std::string to_string() const; // "a.b.c.d/nn"
};

struct InterfaceInfo {
    std::string name;
    std::string ipv4;
    int prefix = 0;
    std::string mac; // upper-case colon form, empty if the link has none
    Ipv4Network network() const;
};

std::optional<uint32_t> parse_ipv4(const std::string& s);
std::string format_ipv4(uint32_t addr);
bool is_valid_hostname(const std::string& s); // RFC 1123
// Accepts "a.b.c.d" or "a.b.c.d/nn"; the address is masked down to the network.
std::optional<Ipv4Network> parse_network_spec(const std::string& s);
// "b8:27:eb:ac:14:3e" / "B8-27-EB-AC-14-3E" -> "B8:27:EB:AC:14:3E"
std::optional<std::string> normalize_mac(const std::string& s);
int netmask_to_prefix(uint32_t mask); // -1 for a non-contiguous mask

// Interface carrying the default route, read from a /proc/net/route formatted file.
std::optional<std::string> default_route_interface(const std::string& route_file = "/proc/net/route");
std::optional<InterfaceInfo> interface_info(const std::string& name);
// Default-route interface, else the first up non-loopback interface with IPv4.
std::optional<InterfaceInfo> primary_interface();

}
