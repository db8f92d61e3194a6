#include "NetUtil.h"
#include "Logging.h"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ifaddrs.h>
#include <cerrno>
#include <net/if.h>
#include <net/route.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netpacket/packet.h>

namespace lanprobe {

std::string Ipv4Network::to_string() const { return format_ipv4(address) + "/" + std::to_string(prefix); }

Ipv4Network InterfaceInfo::network() const {
    Ipv4Network n; n.prefix = prefix;
    auto a = parse_ipv4(ipv4);
    uint32_t mask = prefix==0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    n.address = a ? (*a & mask) : 0;
    return n;
}

std::optional<uint32_t> parse_ipv4(const std::string& s){
    uint32_t out=0; int parts=0; size_t i=0;
    while(parts < 4){
        if(i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
        size_t start=i; unsigned v=0;
        while(i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))){ v = v*10 + (s[i]-'0'); ++i; if(i-start > 3) return std::nullopt; }
        if(v > 255) return std::nullopt;
        if(i-start > 1 && s[start]=='0') return std::nullopt; // no octal-looking octets
        out = (out<<8) | v; ++parts;
        if(parts < 4){ if(i >= s.size() || s[i] != '.') return std::nullopt; ++i; }
    }
    if(i != s.size()) return std::nullopt;
    return out;
}

std::string format_ipv4(uint32_t a){
    char buf[16]; std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", (a>>24)&0xFF, (a>>16)&0xFF, (a>>8)&0xFF, a&0xFF);
    return buf;
}

bool is_valid_hostname(const std::string& s){
    if(s.empty() || s.size() > 253) return false;
    std::string h = s; if(h.back()=='.') h.pop_back(); // fully qualified form
    if(h.empty()) return false;
    size_t start=0;
    while(true){
        size_t dot = h.find('.', start);
        std::string label = h.substr(start, dot==std::string::npos ? std::string::npos : dot-start);
        if(label.empty() || label.size() > 63) return false;
        if(label.front()=='-' || label.back()=='-') return false;
        for(char c: label){ if(!(std::isalnum(static_cast<unsigned char>(c)) || c=='-')) return false; }
        if(dot==std::string::npos) break;
        start = dot+1;
    }
    return true;
}

std::optional<Ipv4Network> parse_network_spec(const std::string& s){
    Ipv4Network n;
    auto slash = s.find('/');
    auto addr = parse_ipv4(s.substr(0, slash));
    if(!addr) return std::nullopt;
    if(slash != std::string::npos){
        std::string p = s.substr(slash+1);
        if(p.empty() || p.size() > 2) return std::nullopt;
        for(char c: p) if(!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        n.prefix = std::stoi(p);
        if(n.prefix > 32) return std::nullopt;
    }
    uint32_t mask = n.prefix==0 ? 0u : (0xFFFFFFFFu << (32 - n.prefix));
    n.address = *addr & mask;
    return n;
}

std::optional<std::string> normalize_mac(const std::string& s){
    if(s.size() != 17) return std::nullopt;
    std::string out; out.reserve(17);
    for(size_t i=0;i<s.size();++i){
        char c = s[i];
        if(i % 3 == 2){ if(c != ':' && c != '-') return std::nullopt; out.push_back(':'); continue; }
        if(!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

int netmask_to_prefix(uint32_t mask){
    int bits=0; while(bits < 32 && (mask & (0x80000000u >> bits))) ++bits;
    uint32_t rebuilt = bits==0 ? 0u : (0xFFFFFFFFu << (32 - bits));
    return rebuilt == mask ? bits : -1;
}

std::optional<std::string> default_route_interface(const std::string& route_file){
    std::ifstream f(route_file);
    if(!f){ Logger::instance().debug("route table unreadable: " + route_file); return std::nullopt; }
    std::string line; bool header=true;
    while(std::getline(f, line)){
        if(header){ header=false; continue; }
        std::istringstream iss(line);
        std::string iface, dest, gw, flags;
        if(!(iss >> iface >> dest >> gw >> flags)) continue;
        unsigned long fl = std::strtoul(flags.c_str(), nullptr, 16);
        if(dest == "00000000" && (fl & RTF_UP)) return iface;
    }
    return std::nullopt;
}

namespace {
std::string mac_from_ll(const sockaddr_ll* ll){
    if(ll->sll_halen != 6) return {};
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X", ll->sll_addr[0], ll->sll_addr[1], ll->sll_addr[2], ll->sll_addr[3], ll->sll_addr[4], ll->sll_addr[5]);
    return buf;
}

// Walks getifaddrs once; name empty means "first usable".
std::optional<InterfaceInfo> lookup_interface(const std::string& wanted){
    ifaddrs* ifap = nullptr;
    if(getifaddrs(&ifap) != 0){ Logger::instance().warn(std::string("getifaddrs failed: ") + std::strerror(errno)); return std::nullopt; }
    std::optional<InterfaceInfo> found;
    for(ifaddrs* ifa = ifap; ifa; ifa = ifa->ifa_next){
        if(!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET || !ifa->ifa_netmask) continue;
        if(!(ifa->ifa_flags & IFF_UP)) continue;
        if(wanted.empty() ? (ifa->ifa_flags & IFF_LOOPBACK) != 0 : wanted != ifa->ifa_name) continue;
        InterfaceInfo info; info.name = ifa->ifa_name;
        auto* sa = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        auto* nm = reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask);
        info.ipv4 = format_ipv4(ntohl(sa->sin_addr.s_addr));
        info.prefix = netmask_to_prefix(ntohl(nm->sin_addr.s_addr));
        if(info.prefix < 0) continue;
        found = info; break;
    }
    if(found){
        for(ifaddrs* ifa = ifap; ifa; ifa = ifa->ifa_next){
            if(!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_PACKET) continue;
            if(found->name != ifa->ifa_name) continue;
            found->mac = mac_from_ll(reinterpret_cast<sockaddr_ll*>(ifa->ifa_addr));
            break;
        }
    }
    freeifaddrs(ifap);
    return found;
}
}

std::optional<InterfaceInfo> interface_info(const std::string& name){
    if(name.empty()) return std::nullopt;
    return lookup_interface(name);
}

std::optional<InterfaceInfo> primary_interface(){
    if(auto iface = default_route_interface()){
        if(auto info = interface_info(*iface)) return info;
        Logger::instance().debug("default route interface " + *iface + " has no IPv4 address");
    }
    return lookup_interface("");
}

}
