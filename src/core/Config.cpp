#include "Config.h"
#include <cstdlib>

namespace lanprobe {
static Config global_cfg;
Config& config(){ return global_cfg; }
void set_config(const Config& c){ global_cfg = c; }

void apply_env_overrides(Config& c){
    auto get = [](const char* k)->const char*{ const char* v=std::getenv(k); return (v && *v)? v: nullptr; };
    if(c.nmap_path == "nmap"){ if(auto v=get("LANPROBE_NMAP")) c.nmap_path = v; }
    if(c.port_registry_file.empty()){ if(auto v=get("LANPROBE_PORT_REGISTRY")) c.port_registry_file = v; }
}
}
