#include "util/cli_parser.hpp"

#include <cstdlib>

namespace fastaseek {

CliParser::CliParser(int argc, char* argv[],
                     const std::unordered_set<std::string>& flags) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            if (flags.count(arg)) {
                opts_[arg].push_back("1");
                continue;
            }

            // Key-value pair, or a trailing/unknown flag
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
        } else {
            positional_.push_back(arg);
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
    char* end = nullptr;
    const std::string& s = it->second.back();
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0') return default_val;
    return static_cast<int>(v);
}

} // namespace fastaseek
