#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/NetUtil.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // First token stands in for argv[0].
    std::vector<std::string> args{"link-scope"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));

    link_scope::ArgumentParser parser;
    link_scope::Config cfg;
    if (parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) {
        link_scope::ConfigValidator validator;
        if (!validator.validate(cfg)) return 0;
    }

    // The range parser sees the raw input as well.
    try {
        link_scope::parse_ip_range(input);
    } catch (const std::invalid_argument&) {
    }
    return 0;
}
