#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fastaseek {

// Simple command-line argument parser for -key value style arguments.
// Keys listed in `flags` never take a value, so a positional argument
// may follow them.
class CliParser {
public:
    CliParser(int argc, char* argv[],
              const std::unordered_set<std::string>& flags = {});

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get string value for a key (last occurrence). Returns default_val
    // if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for a repeatable key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Get integer value for a key. Returns default_val if not found or invalid.
    int get_int(const std::string& key, int default_val = 0) const;

    // Get the program name (argv[0]).
    const std::string& program() const { return program_; }

    // Get positional arguments (those not preceded by a -key).
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace fastaseek
