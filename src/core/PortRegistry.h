#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace lanprobe {

struct PortInfo {
    std::string keyword;
    std::string description;
};

// Immutable port -> service table. Loaded once, then only read.
class PortRegistry {
public:
    static const std::string UNKNOWN; // sentinel name for unregistered ports

    PortRegistry() = default;
    explicit PortRegistry(std::map<uint16_t, PortInfo> entries) : entries_(std::move(entries)) {}

    // Throws ConfigurationError if the file cannot be read or holds no entries.
    static PortRegistry load(const std::string& path);

    const PortInfo* find(uint16_t port) const;
    // Keyword, or UNKNOWN; never empty.
    const std::string& service_name(uint16_t port) const;
    size_t size() const { return entries_.size(); }

    // Parses one "port<TAB>keyword<TAB>description" line. Comments and blanks return false.
    static bool parse_line(const std::string& line, uint16_t& port, PortInfo& info);

private:
    std::map<uint16_t, PortInfo> entries_;
};

std::string default_port_registry_path();
// Process-wide registry; load_port_registry replaces it, port_registry throws ConfigurationError before any load.
void load_port_registry(const std::string& path);
const PortRegistry& port_registry();

}
