// Linux privilege helpers (libcap parts compile-time gated)
#pragma once
#include <string>
namespace lanprobe {
// Root, or CAP_NET_RAW + CAP_NET_ADMIN effective: what nmap needs to report MAC addresses.
bool has_discovery_privilege();
// Clears every capability; used before unprivileged work such as portscan.
void drop_capabilities();
bool is_privilege_available(); // built with libcap
void log_capabilities(const std::string& context);
}
