#include "util/cli_parser.hpp"

#include <cstdlib>
#include <stdexcept>

namespace fastxio {

CliParser::CliParser(int argc, char* argv[], const std::vector<std::string>& flags)
    : flags_(flags.begin(), flags.end()) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        // --key=value
        if (arg[1] == '-') {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                continue;
            }
        }

        if (flags_.count(arg) == 0 && i + 1 < argc &&
            (argv[i + 1][0] != '-' || std::string(argv[i + 1]) == "-")) {
            opts_[arg].push_back(argv[i + 1]);
            i++;
        } else {
            opts_[arg].push_back("1");
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    try {
        return std::stoi(it->second.back());
    } catch (const std::logic_error&) {
        return default_val;
    }
}

} // namespace fastxio
