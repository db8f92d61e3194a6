#include "NetworkScanner.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/NetUtil.h"
#include <unordered_map>

namespace lanprobe {

NetworkScanner::NetworkScanner(NetworkDiscovererPtr discoverer, std::optional<LocalHost> local)
    : discoverer_(std::move(discoverer)), local_(std::move(local)) {}

LocalHost NetworkScanner::resolve_local(){
    if(!local_){
        LocalHost lh;
        if(auto pi = primary_interface()){ lh.ip = pi->ipv4; lh.mac = pi->mac; }
        else Logger::instance().debug("no primary interface; scanning host will not be supplemented");
        local_ = lh;
    }
    LocalHost lh = *local_;
    if(!lh.mac.empty()){
        auto m = normalize_mac(lh.mac);
        if(!m) throw InvalidInput("invalid local MAC address: " + lh.mac);
        lh.mac = *m;
    }
    return lh;
}

std::vector<DiscoveredHost> NetworkScanner::scan_hosts(const std::string& target){
    std::string spec = target;
    if(!spec.empty()){
        auto net = parse_network_spec(spec);
        if(!net) throw InvalidInput("invalid network specification: " + spec);
    }
    if(!discoverer_) throw ScanFailure("no discovery tool configured");
    if(!discoverer_->is_available()) throw ScanFailure("'" + discoverer_->name() + "' not found on PATH");
    if(!discoverer_->has_required_privilege())
        throw PrivilegeError("LAN discovery requires root or CAP_NET_RAW+CAP_NET_ADMIN to obtain MAC addresses");
    if(spec.empty()){
        auto pi = primary_interface();
        if(!pi) throw ScanFailure("unable to determine the local subnet; pass a target network");
        spec = pi->network().to_string();
        Logger::instance().info("defaulting to local subnet " + spec + " on " + pi->name);
    }

    Logger::instance().info("scan " + spec + " via " + discoverer_->name());
    auto raw = discoverer_->discover(spec);
    LocalHost local = resolve_local();

    std::vector<DiscoveredHost> hosts;
    size_t remote_up=0, remote_with_mac=0;
    for(auto& h : raw){
        if(!local.ip.empty() && h.ip == local.ip){
            if(local.mac.empty()){ Logger::instance().warn("scanning host " + h.ip + " has no known MAC address; omitted"); continue; }
            h.mac = local.mac; h.vendor = local.comment;
            hosts.push_back(std::move(h));
            continue;
        }
        ++remote_up;
        auto mac = normalize_mac(h.mac);
        if(!mac){ Logger::instance().debug("host " + h.ip + " reported without MAC address; omitted"); continue; }
        ++remote_with_mac;
        h.mac = *mac;
        hosts.push_back(std::move(h));
    }
    if(remote_up > 0 && remote_with_mac == 0)
        throw PrivilegeError("discovery returned " + std::to_string(remote_up) + " hosts but no MAC addresses; "
                             "MAC addresses need root or CAP_NET_RAW+CAP_NET_ADMIN and a target on a directly attached segment "
                             "(hosts behind a router never report one)");
    Logger::instance().info("scan " + spec + ": " + std::to_string(hosts.size()) + " hosts with MAC addresses");
    return hosts;
}

HostRecord NetworkScanner::scan(const std::string& target){
    return group_by_mac(scan_hosts(target));
}

HostRecord NetworkScanner::group_by_mac(const std::vector<DiscoveredHost>& hosts){
    HostRecord rec;
    std::unordered_map<std::string, std::string> owner; // ip -> mac
    for(const auto& h : hosts){
        if(h.mac.empty() || h.ip.empty()) continue;
        auto it = owner.find(h.ip);
        if(it != owner.end()){
            if(it->second != h.mac) Logger::instance().warn("IPv4 " + h.ip + " reported under " + it->second + " and " + h.mac + "; keeping " + it->second);
            continue;
        }
        owner.emplace(h.ip, h.mac);
        rec[h.mac].push_back(h.ip);
    }
    return rec;
}

}
