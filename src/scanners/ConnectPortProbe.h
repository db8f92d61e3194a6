#pragma once
#include "PortProbe.h"
#include <chrono>

namespace lanprobe {

// Non-blocking connect(2) per port, polled in batches. Needs no privilege.
// A host where no port answers (open or refused) is a ScanFailure.
class ConnectPortProbe : public PortProbe {
public:
    explicit ConnectPortProbe(std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) : timeout_(timeout) {}
    std::string name() const override { return "connect"; }
    std::vector<uint16_t> open_ports(const std::string& host, const PortRange& range) override;
private:
    std::chrono::milliseconds timeout_;
};

}
