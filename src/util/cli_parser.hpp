#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fastxio {

// Command-line parser for "-key value" and "--key=value" arguments.
// Keys listed in flags never take a value, so "-v file.fa" keeps
// file.fa positional. A lone "-" is positional (stdin).
class CliParser {
public:
    CliParser(int argc, char* argv[], const std::vector<std::string>& flags = {});

    bool has(const std::string& key) const;

    // Last value given for key, or default_val.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Returns default_val if not found or not an integer.
    int get_int(const std::string& key, int default_val = 0) const;

    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::unordered_set<std::string> flags_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace fastxio
