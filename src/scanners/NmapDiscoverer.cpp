#include "NmapDiscoverer.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Privilege.h"
#include "../core/Process.h"
#include <sstream>

namespace lanprobe {

// Emitted by nmap; the parser keys off these.
static const std::string REPORT_PREFIX = "Nmap scan report for ";
static const std::string MAC_PREFIX = "MAC Address: ";
static const std::string DONE_PREFIX = "Nmap done:";

NetworkDiscovererPtr make_network_discoverer(const Config& cfg){
    int secs = cfg.process_timeout_seconds > 0 ? cfg.process_timeout_seconds : 120;
    return std::make_unique<NmapDiscoverer>(cfg.nmap_path, cfg.discovery_args, std::chrono::seconds(secs));
}

bool NmapDiscoverer::has_required_privilege() const { return has_discovery_privilege(); }

bool NmapDiscoverer::is_available() const { return find_executable(nmap_).has_value(); }

std::vector<std::string> NmapDiscoverer::command_line(const std::string& target) const {
    std::vector<std::string> argv{nmap_};
    argv.insert(argv.end(), args_.begin(), args_.end());
    argv.push_back(target);
    return argv;
}

std::optional<std::vector<DiscoveredHost>> NmapDiscoverer::parse_output(const std::string& text){
    std::vector<DiscoveredHost> hosts; bool done=false;
    std::istringstream iss(text); std::string line;
    while(std::getline(iss, line)){
        if(!line.empty() && line.back()=='\r') line.pop_back();
        if(line.rfind(REPORT_PREFIX, 0)==0){
            // "Nmap scan report for 10.0.0.1" or "Nmap scan report for name.lan (10.0.0.1)"
            std::string rest = line.substr(REPORT_PREFIX.size());
            DiscoveredHost h;
            auto open = rest.rfind(" (");
            if(open != std::string::npos && rest.back()==')'){
                h.hostname = rest.substr(0, open);
                h.ip = rest.substr(open+2, rest.size()-open-3);
            } else {
                h.ip = rest;
            }
            hosts.push_back(std::move(h));
        } else if(line.rfind(MAC_PREFIX, 0)==0){
            if(hosts.empty()) continue;
            // "MAC Address: B8:27:EB:AC:14:3E (Raspberry Pi Foundation)"
            std::string rest = line.substr(MAC_PREFIX.size());
            auto sp = rest.find(' ');
            hosts.back().mac = rest.substr(0, sp);
            // vendor kept verbatim, parentheses included
            if(sp != std::string::npos) hosts.back().vendor = rest.substr(sp+1);
        } else if(line.rfind(DONE_PREFIX, 0)==0){
            done = true;
        }
    }
    if(!done) return std::nullopt;
    return hosts;
}

std::vector<DiscoveredHost> NmapDiscoverer::discover(const std::string& target){
    auto res = run_process(command_line(target), timeout_);
    if(res.signaled) throw ScanFailure("nmap killed by signal " + std::to_string(res.signal));
    if(res.exit_code != 0){
        std::string first = res.err.substr(0, res.err.find('\n'));
        throw ScanFailure("nmap exited with status " + std::to_string(res.exit_code) + (first.empty() ? "" : ": " + first));
    }
    auto hosts = parse_output(res.out);
    if(!hosts) throw ScanFailure("unparseable nmap output for target " + target);
    Logger::instance().debug("nmap reported " + std::to_string(hosts->size()) + " hosts up on " + target);
    return *hosts;
}

}
