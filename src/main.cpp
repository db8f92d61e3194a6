#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/NetUtil.h"
#include "core/PortRegistry.h"
#include "core/Privilege.h"
#include "scanners/NetworkScanner.h"
#include "scanners/PortScanner.h"
#include <fstream>
#include <iostream>

using namespace lanprobe;

namespace {

std::string run_portscan(const Config& cfg, const ConfigValidator& validator){
    if(cfg.drop_priv) drop_capabilities();
    load_port_registry(validator.port_registry_path(cfg));
    PortScanner scanner(make_port_probe(cfg), port_registry(), PortRange{cfg.port_min, cfg.port_max});
    auto result = scanner.scan(cfg.target);
    JSONWriter writer(cfg.pretty);
    return cfg.detailed ? writer.write_detailed(result) : writer.write(result);
}

std::string run_scan(const Config& cfg){
    std::optional<LocalHost> local;
    if(!cfg.local_ip.empty()){
        local = LocalHost{cfg.local_ip, cfg.local_mac, cfg.local_comment};
    } else if(auto pi = primary_interface()){
        local = LocalHost{pi->ipv4, pi->mac, cfg.local_comment};
    }
    NetworkScanner scanner(make_network_discoverer(cfg), local);
    JSONWriter writer(cfg.pretty);
    if(cfg.detailed) return writer.write_detailed(scanner.scan_hosts(cfg.target));
    return writer.write(scanner.scan(cfg.target));
}

bool emit(const Config& cfg, std::string json){
    if(json.empty() || json.back() != '\n') json.push_back('\n');
    if(cfg.output_file.empty()){ std::cout << json; return static_cast<bool>(std::cout); }
    std::ofstream ofs(cfg.output_file);
    if(!ofs){ Logger::instance().error("cannot open output file: " + cfg.output_file); return false; }
    ofs << json;
    return static_cast<bool>(ofs);
}

int fail(const Config& cfg, const std::exception& e){
    Logger::instance().error(describe_error(e));
    emit(cfg, JSONWriter(cfg.pretty).write_error(e.what()));
    return exit_code_for(e);
}

}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)){
        if(parser.exit_code() != 0) std::cerr << "try 'lanprobe --help'\n";
        return parser.exit_code();
    }
    apply_env_overrides(cfg);

    ConfigValidator validator;
    try {
        validator.validate(cfg);
        if(auto lvl = parse_log_level(cfg.log_level)) Logger::instance().set_level(*lvl);
        set_config(cfg);

        const Config& active = config();
        std::string json = active.command == Command::PortScan ? run_portscan(active, validator) : run_scan(active);
        return emit(active, std::move(json)) ? 0 : 1;
    } catch(const std::exception& e){
        return fail(cfg, e);
    }
}
