#pragma once
#include <stdexcept>
#include <string>

namespace lanprobe {

// Root of every error the scan operations raise. Nothing below the CLI catches these.
class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& what) : std::runtime_error(what) {}
    virtual const char* kind() const noexcept = 0;
};

// Malformed host / network argument or option value.
class InvalidInput : public ScanError {
public:
    using ScanError::ScanError;
    const char* kind() const noexcept override { return "InvalidInput"; }
};

// Not privileged enough to obtain hardware addresses.
class PrivilegeError : public ScanError {
public:
    using ScanError::ScanError;
    const char* kind() const noexcept override { return "PrivilegeError"; }
};

// External tool missing, crashed, timed out or produced unparseable output.
class ScanFailure : public ScanError {
public:
    using ScanError::ScanError;
    const char* kind() const noexcept override { return "ScanFailure"; }
};

// Port registry data unavailable (portscan only).
class ConfigurationError : public ScanError {
public:
    using ScanError::ScanError;
    const char* kind() const noexcept override { return "ConfigurationError"; }
};

// CLI exit status: 2 InvalidInput, 3 PrivilegeError, 4 ScanFailure and any
// other exception, 5 ConfigurationError.
int exit_code_for(const std::exception& e) noexcept;
// "ScanFailure: message" for ScanError, "unexpected error: message" otherwise.
std::string describe_error(const std::exception& e);

}
