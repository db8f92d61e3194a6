#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace lanprobe {

class ArgumentParser {
public:
    ArgumentParser();

    // False means "stop": --help / --version (exit_code 0) or a usage error (exit_code 1).
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }
    const std::string& error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* metavar;
        const char* help;
        std::function<bool(const std::string&, Config&)> apply;
    };

    bool fail(const std::string& msg);
    bool apply_positionals(const std::vector<std::string>& pos, Config& cfg);
    const FlagSpec* find_spec(const std::string& flag) const;

    std::vector<FlagSpec> specs_;
    int exit_code_ = 0;
    std::string error_;
};

std::vector<std::string> split_csv(const std::string& s);
bool parse_int(const std::string& s, int& out);

}
