#include "ConfigValidator.h"
#include "Errors.h"
#include "Logging.h"
#include "NetUtil.h"
#include "PortRegistry.h"
#include <algorithm>

namespace lanprobe {

void ConfigValidator::validate(Config& cfg) const {
    if(cfg.port_min < TCP_PORT_MIN || cfg.port_max > TCP_PORT_MAX || cfg.port_min > cfg.port_max)
        throw InvalidInput("invalid port range " + std::to_string(cfg.port_min) + "-" + std::to_string(cfg.port_max) + " (ports are 1-65535, MIN <= MAX)");

    if(std::find(allowed_probes_.begin(), allowed_probes_.end(), cfg.port_probe) == allowed_probes_.end())
        throw InvalidInput("unknown port probe: " + cfg.port_probe);

    if(cfg.connect_timeout_ms < 1 || cfg.connect_timeout_ms > 60000)
        throw InvalidInput("--connect-timeout must be between 1 and 60000 ms");
    if(cfg.process_timeout_seconds < 0 || cfg.process_timeout_seconds > 86400)
        throw InvalidInput("--timeout must be between 0 and 86400 seconds");

    if(!parse_log_level(cfg.log_level)) throw InvalidInput("invalid log level: " + cfg.log_level);

    if(cfg.nmap_path.empty()) throw InvalidInput("nmap path must not be empty");
    // Extra operands would widen the sweep beyond the requested target.
    for(const auto& a : cfg.discovery_args){
        if(a.empty() || a[0] != '-') throw InvalidInput("discovery argument must be an option: '" + a + "'");
    }

    if(!cfg.local_ip.empty() && !parse_ipv4(cfg.local_ip)) throw InvalidInput("invalid local IP: " + cfg.local_ip);
    if(!cfg.local_mac.empty()){
        auto mac = normalize_mac(cfg.local_mac);
        if(!mac) throw InvalidInput("invalid local MAC address: " + cfg.local_mac);
        cfg.local_mac = *mac;
    }
    if(cfg.local_ip.empty() != cfg.local_mac.empty()) throw InvalidInput("--local-ip and --local-mac must be given together");
}

std::string ConfigValidator::port_registry_path(const Config& cfg) const {
    return cfg.port_registry_file.empty() ? default_port_registry_path() : cfg.port_registry_file;
}

}
