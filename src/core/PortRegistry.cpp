#include "PortRegistry.h"
#include "Errors.h"
#include "Logging.h"
#include <fstream>
#include <cctype>

#ifndef LANPROBE_DATA_DIR
#define LANPROBE_DATA_DIR "/usr/share/lanprobe"
#endif

namespace lanprobe {

const std::string PortRegistry::UNKNOWN = "unknown";

bool PortRegistry::parse_line(const std::string& raw, uint16_t& port, PortInfo& info){
    std::string line = raw;
    if(!line.empty() && line.back()=='\r') line.pop_back();
    size_t start = line.find_first_not_of(" \t");
    if(start == std::string::npos || line[start]=='#') return false;
    size_t t1 = line.find('\t', start);
    if(t1 == std::string::npos) return false;
    std::string num = line.substr(start, t1-start);
    if(num.empty() || num.size() > 5) return false;
    for(char c: num) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
    unsigned long v = std::stoul(num);
    if(v < 1 || v > 65535) return false;
    size_t t2 = line.find('\t', t1+1);
    std::string keyword = line.substr(t1+1, t2==std::string::npos ? std::string::npos : t2-t1-1);
    if(keyword.empty()) return false;
    port = static_cast<uint16_t>(v);
    info.keyword = keyword;
    info.description = t2==std::string::npos ? "" : line.substr(t2+1);
    return true;
}

PortRegistry PortRegistry::load(const std::string& path){
    std::ifstream f(path);
    if(!f) throw ConfigurationError("port registry unavailable: " + path);
    std::map<uint16_t, PortInfo> entries;
    std::string line; size_t lineno=0, skipped=0;
    while(std::getline(f, line)){
        ++lineno;
        uint16_t port=0; PortInfo info;
        if(!parse_line(line, port, info)){
            size_t s = line.find_first_not_of(" \t\r");
            if(s != std::string::npos && line[s] != '#'){ ++skipped; Logger::instance().warn(path + ":" + std::to_string(lineno) + ": malformed port registry line skipped"); }
            continue;
        }
        entries[port] = std::move(info); // later lines win
    }
    if(entries.empty()) throw ConfigurationError("port registry has no entries: " + path);
    Logger::instance().debug("loaded " + std::to_string(entries.size()) + " port registry entries from " + path + (skipped ? " (" + std::to_string(skipped) + " skipped)" : ""));
    return PortRegistry(std::move(entries));
}

const PortInfo* PortRegistry::find(uint16_t port) const {
    auto it = entries_.find(port);
    return it == entries_.end() ? nullptr : &it->second;
}

const std::string& PortRegistry::service_name(uint16_t port) const {
    if(auto* p = find(port)) return p->keyword;
    return UNKNOWN;
}

std::string default_port_registry_path(){ return std::string(LANPROBE_DATA_DIR) + "/rfc1340_tcp_ports.tsv"; }

static std::unique_ptr<const PortRegistry> global_registry;

void load_port_registry(const std::string& path){
    global_registry = std::make_unique<const PortRegistry>(PortRegistry::load(path));
}

const PortRegistry& port_registry(){
    if(!global_registry) throw ConfigurationError("port registry not loaded");
    return *global_registry;
}

}
