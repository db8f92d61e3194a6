#include "PortScanner.h"
#include "ConnectPortProbe.h"
#include "NmapPortProbe.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/NetUtil.h"

namespace lanprobe {

PortProbePtr make_port_probe(const Config& cfg){
    if(cfg.port_probe == "connect") return std::make_unique<ConnectPortProbe>(std::chrono::milliseconds(cfg.connect_timeout_ms));
    if(cfg.port_probe == "nmap"){
        int secs = cfg.process_timeout_seconds > 0 ? cfg.process_timeout_seconds : 300;
        return std::make_unique<NmapPortProbe>(cfg.nmap_path, std::chrono::seconds(secs));
    }
    throw InvalidInput("unknown port probe: " + cfg.port_probe);
}

PortScanner::PortScanner(PortProbePtr probe, const PortRegistry& registry, PortRange range)
    : probe_(std::move(probe)), registry_(registry), range_(range) {}

void PortScanner::validate_host(const std::string& host){
    if(host.empty()) throw InvalidInput("host must not be empty");
    if(host.front()=='-') throw InvalidInput("invalid host: " + host);
    if(parse_ipv4(host)) return;
    if(!is_valid_hostname(host)) throw InvalidInput("invalid host: " + host);
}

OpenPortResult PortScanner::scan(const std::string& host){
    validate_host(host);
    if(!range_.valid()) throw InvalidInput("invalid port range " + range_.to_string());
    if(!probe_) throw ScanFailure("no port probe configured");
    Logger::instance().info("portscan " + host + " ports " + range_.to_string() + " via " + probe_->name());

    OpenPortResult result;
    for(uint16_t port : probe_->open_ports(host, range_)){
        if(!range_.contains(port)){ Logger::instance().debug("ignoring out of range port " + std::to_string(port)); continue; }
        OpenPort op; op.port = port;
        if(const PortInfo* info = registry_.find(port); info && !info->keyword.empty()){
            op.known = true; op.keyword = info->keyword; op.description = info->description;
        } else {
            op.keyword = PortRegistry::UNKNOWN;
        }
        result[port] = std::move(op);
    }
    Logger::instance().info("portscan " + host + ": " + std::to_string(result.size()) + " open");
    return result;
}

std::map<uint16_t, std::string> PortScanner::service_names(const OpenPortResult& result){
    std::map<uint16_t, std::string> out;
    for(const auto& kv : result) out[kv.first] = kv.second.keyword;
    return out;
}

}
