#include "util/cli_parser.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace genotrack {

static bool is_option(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

CliParser::CliParser(int argc, char* argv[], const std::vector<std::string>& flags) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (!is_option(argv[i])) {
            positional_.push_back(arg);
            continue;
        }

        if (arg.compare(0, 2, "--") == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                continue;
            }
        }

        bool is_flag = std::find(flags.begin(), flags.end(), arg) != flags.end();

        // Flag unless followed by a value
        if (!is_flag && i + 1 < argc && !is_option(argv[i + 1])) {
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

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;

    const std::string& s = it->second.back();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE ||
        v < INT_MIN || v > INT_MAX)
        return default_val;
    return static_cast<int>(v);
}

} // namespace genotrack
