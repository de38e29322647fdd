#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace link_scope {

class ArgumentParser {
public:
    ArgumentParser();

    // Fills cfg from argv. Returns false when the caller should exit instead of
    // scanning: --help / --version (had_error() == false) or a bad flag or value
    // (had_error() == true, message already printed to stderr).
    bool parse(int argc, char** argv, Config& cfg);

    bool had_error() const { return error_; }
    void print_help() const;

    static std::vector<std::string> split_csv(const std::string& s);

private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        const char* help;
        ArgKind kind;
        std::function<bool(const std::string&, Config&)> apply;
    };
    const FlagSpec* find_spec(const std::string& flag) const;

    std::vector<FlagSpec> specs_;
    bool error_ = false;
};

}
