#include "Errors.h"

namespace lanprobe {

int exit_code_for(const std::exception& e) noexcept {
    if(dynamic_cast<const InvalidInput*>(&e)) return 2;
    if(dynamic_cast<const PrivilegeError*>(&e)) return 3;
    if(dynamic_cast<const ConfigurationError*>(&e)) return 5;
    return 4;
}

std::string describe_error(const std::exception& e){
    if(auto* se = dynamic_cast<const ScanError*>(&e)) return std::string(se->kind()) + ": " + e.what();
    return std::string("unexpected error: ") + e.what();
}

}
