#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace genotrack {

// Command-line parser for "-key value", "--key=value" and bare flags.
// Anything not starting with '-' (and not consumed as a value) is positional.
// A lone "-" is positional (stdin). Keys listed in flags never consume
// the following argument.
class CliParser {
public:
    CliParser(int argc, char* argv[], const std::vector<std::string>& flags = {});

    bool has(const std::string& key) const;

    // Last value given for key, or default_val.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Every value given for a repeated key, in order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Returns default_val if key is absent or its value is not an integer.
    int get_int(const std::string& key, int default_val = 0) const;

    const std::string& program() const { return program_; }
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace genotrack
