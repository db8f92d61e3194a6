#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace lanprobe {

class ConfigValidator {
public:
    // Normalizes cfg in place; throws InvalidInput on the first bad value.
    void validate(Config& cfg) const;
    // Registry file to load: explicit setting, else the installed default.
    std::string port_registry_path(const Config& cfg) const;

private:
    const std::vector<std::string> allowed_probes_ = {"connect", "nmap"};
};

}
