#pragma once
#include <string>
#include <vector>

namespace lanprobe {

// Handy TCP port range constants
constexpr int TCP_PORT_MIN = 1;
constexpr int TCP_PORT_WELL_KNOWN_MAX = 1023;
constexpr int TCP_PORT_REGISTERED_MIN = 1024;
constexpr int TCP_PORT_REGISTERED_MAX = 49151;
constexpr int TCP_PORT_MAX = 65535;

enum class Command { None, Scan, PortScan };

struct Config {
    Command command = Command::None;
    std::string target; // scan: network spec (empty = local subnet); portscan: host
    // portscan
    int port_min = TCP_PORT_MIN;
    int port_max = TCP_PORT_WELL_KNOWN_MAX;
    std::string port_probe = "connect"; // "connect" | "nmap"
    int connect_timeout_ms = 500;
    std::string port_registry_file; // empty = env / compiled-in default
    // scan
    std::string nmap_path = "nmap";
    std::vector<std::string> discovery_args = {"-sn", "-T5"};
    std::string local_ip;  // empty = auto-detect from primary interface
    std::string local_mac;
    std::string local_comment;
    // shared
    int process_timeout_seconds = 0; // 0 = per-operation default
    bool detailed = false; // original record arrays instead of mappings
    bool pretty = false;
    std::string output_file;
    std::string log_level = "info";
    bool drop_priv = false;
};

Config& config();
void set_config(const Config& c);

// Picks up LANPROBE_* environment overrides for fields the command line left at their defaults.
void apply_env_overrides(Config& c);

}
