#include "ArgumentParser.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>
#include <cctype>

namespace lanprobe {

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur; for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c);} if(!cur.empty()) out.push_back(cur); return out; }

bool parse_int(const std::string& s, int& out){
    if(s.empty() || s.size() > 9) return false;
    size_t i = (s[0]=='-') ? 1 : 0;
    if(i == s.size()) return false;
    for(; i<s.size(); ++i) if(!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    out = std::stoi(s);
    return true;
}

ArgumentParser::ArgumentParser(){
    auto int_flag = [](int Config::*field){
        return [field](const std::string& v, Config& c){ return parse_int(v, c.*field); };
    };
    specs_ = {
        {"--ports", ArgKind::String, "MIN-MAX", "TCP port range for portscan (default 1-1023)", [](const std::string& v, Config& c){
            auto dash = v.find('-'); if(dash==std::string::npos) return false;
            return parse_int(v.substr(0,dash), c.port_min) && parse_int(v.substr(dash+1), c.port_max); }},
        {"--probe", ArgKind::String, "connect|nmap", "Port probe backend", [](const std::string& v, Config& c){ c.port_probe = v; return true; }},
        {"--connect-timeout", ArgKind::Int, "MS", "Per-port connect timeout", int_flag(&Config::connect_timeout_ms)},
        {"--timeout", ArgKind::Int, "SEC", "External process timeout", int_flag(&Config::process_timeout_seconds)},
        {"--port-registry", ArgKind::String, "FILE", "Port registry data file", [](const std::string& v, Config& c){ c.port_registry_file = v; return true; }},
        {"--nmap", ArgKind::String, "PATH", "nmap executable (default: nmap on PATH)", [](const std::string& v, Config& c){ c.nmap_path = v; return true; }},
        {"--discovery-args", ArgKind::CSV, "a,b,c", "nmap flags for scan (default -sn,-T5)", [](const std::string& v, Config& c){ c.discovery_args = split_csv(v); return true; }},
        {"--local-ip", ArgKind::String, "IP", "This host's IPv4 on the LAN", [](const std::string& v, Config& c){ c.local_ip = v; return true; }},
        {"--local-mac", ArgKind::String, "MAC", "This host's MAC address", [](const std::string& v, Config& c){ c.local_mac = v; return true; }},
        {"--local-comment", ArgKind::String, "TEXT", "Comment recorded for this host", [](const std::string& v, Config& c){ c.local_comment = v; return true; }},
        {"--detailed", ArgKind::None, "", "Emit per-host / per-port records", [](const std::string&, Config& c){ c.detailed = true; return true; }},
        {"--pretty", ArgKind::None, "", "Pretty-print JSON", [](const std::string&, Config& c){ c.pretty = true; return true; }},
        {"--output", ArgKind::String, "FILE", "Write JSON to FILE (default stdout)", [](const std::string& v, Config& c){ c.output_file = v; return true; }},
        {"--log-level", ArgKind::String, "LEVEL", "error|warn|info|debug|trace", [](const std::string& v, Config& c){ c.log_level = v; return true; }},
        {"--drop-priv", ArgKind::None, "", "Drop Linux capabilities before portscan", [](const std::string&, Config& c){ c.drop_priv = true; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s: specs_) if(flag==s.name) return &s;
    return nullptr;
}

bool ArgumentParser::fail(const std::string& msg){
    error_ = msg; exit_code_ = 1;
    std::cerr << msg << "\n";
    return false;
}

void ArgumentParser::print_help() const {
    std::cout << "usage: lanprobe scan [TARGET [LOCAL_IP LOCAL_MAC [COMMENT]]] [options]\n"
                 "       lanprobe portscan HOST [MIN MAX] [options]\n\noptions:\n";
    for(const auto& s : specs_){
        std::string name = s.name; if(*s.metavar){ name += ' '; name += s.metavar; }
        std::cout << "  " << name; if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n  --help                        Show this help\n";
}

void ArgumentParser::print_version() const {
    std::cout << "lanprobe " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::apply_positionals(const std::vector<std::string>& pos, Config& cfg){
    if(pos.empty()) return fail("missing command (scan | portscan)");
    const std::string& cmd = pos[0];
    if(cmd == "scan"){
        cfg.command = Command::Scan;
        // scan [TARGET [LOCAL_IP LOCAL_MAC [COMMENT]]]
        if(pos.size() == 3 || pos.size() > 5) return fail("scan takes TARGET [LOCAL_IP LOCAL_MAC [COMMENT]]");
        if(pos.size() >= 2) cfg.target = pos[1];
        if(pos.size() >= 4){ cfg.local_ip = pos[2]; cfg.local_mac = pos[3]; }
        if(pos.size() == 5) cfg.local_comment = pos[4];
        return true;
    }
    if(cmd == "portscan"){
        cfg.command = Command::PortScan;
        if(pos.size() != 2 && pos.size() != 4) return fail("portscan takes HOST [MIN MAX]");
        cfg.target = pos[1];
        if(pos.size() == 4){
            if(!parse_int(pos[2], cfg.port_min) || !parse_int(pos[3], cfg.port_max)) return fail("invalid port range: " + pos[2] + " " + pos[3]);
        }
        return true;
    }
    return fail("unknown command: " + cmd);
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0; error_.clear();
    std::vector<std::string> positionals;
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        if(a.size() > 2 && a.compare(0, 2, "--")==0){
            const FlagSpec* spec = find_spec(a);
            if(!spec) return fail("Unknown arg: " + a);
            std::string val;
            if(spec->kind != ArgKind::None){
                if(i+1 >= argc) return fail("Missing value for " + a);
                val = argv[++i];
            }
            if(!spec->apply(val, cfg)) return fail("Invalid value for " + a + ": " + val);
            continue;
        }
        positionals.push_back(a);
    }
    return apply_positionals(positionals, cfg);
}

}
