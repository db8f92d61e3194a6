#include "NmapPortProbe.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Process.h"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace lanprobe {

std::vector<std::string> NmapPortProbe::command_line(const std::string& host, const PortRange& range) const {
    return {nmap_, "-sT", "-Pn", "-p", range.to_string(), "-oG", "-", host};
}

std::optional<std::vector<uint16_t>> NmapPortProbe::parse_grepable(const std::string& text){
    std::vector<uint16_t> ports; bool done=false;
    std::istringstream iss(text); std::string line;
    while(std::getline(iss, line)){
        if(line.rfind("# Nmap done", 0)==0){ done=true; continue; }
        if(line.rfind("Host: ", 0)!=0) continue;
        auto pos = line.find("Ports: ");
        if(pos == std::string::npos) continue;
        std::string field = line.substr(pos + 7);
        auto tab = field.find('\t'); if(tab != std::string::npos) field.resize(tab);
        // entries: "22/open/tcp//ssh///, 80/closed/tcp//http///"
        std::istringstream es(field); std::string entry;
        while(std::getline(es, entry, ',')){
            entry.erase(0, entry.find_first_not_of(' '));
            auto s1 = entry.find('/'); if(s1 == std::string::npos || s1 == 0) continue;
            auto s2 = entry.find('/', s1+1); if(s2 == std::string::npos) continue;
            std::string num = entry.substr(0, s1);
            if(num.size() > 5 || !std::all_of(num.begin(), num.end(), [](char c){ return std::isdigit(static_cast<unsigned char>(c)); })) continue;
            if(entry.compare(s1+1, s2-s1-1, "open") != 0) continue;
            unsigned long p = std::stoul(num);
            if(p >= 1 && p <= 65535) ports.push_back(static_cast<uint16_t>(p));
        }
    }
    if(!done) return std::nullopt;
    std::sort(ports.begin(), ports.end());
    ports.erase(std::unique(ports.begin(), ports.end()), ports.end());
    return ports;
}

std::vector<uint16_t> NmapPortProbe::open_ports(const std::string& host, const PortRange& range){
    auto res = run_process(command_line(host, range), timeout_);
    if(res.signaled) throw ScanFailure("nmap killed by signal " + std::to_string(res.signal));
    if(res.err.find("Failed to resolve") != std::string::npos) throw ScanFailure("Unable to resolve host \"" + host + "\"");
    if(res.exit_code != 0){
        std::string first = res.err.substr(0, res.err.find('\n'));
        throw ScanFailure("nmap exited with status " + std::to_string(res.exit_code) + (first.empty() ? "" : ": " + first));
    }
    auto ports = parse_grepable(res.out);
    if(!ports) throw ScanFailure("unparseable nmap output for host \"" + host + "\"");
    return *ports;
}

}
