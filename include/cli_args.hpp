#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Small argument parser:
//   --key value
//   --flag / -v        (registered boolean flags, value "true")
//   everything else    positional, in order
class CliArgs {
public:
    explicit CliArgs(std::unordered_set<std::string> bool_flags = {});

    void parse(int argc, char** argv);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Throws std::invalid_argument for non-numeric or out of range values.
    long get_int(const std::string& key, long def, long min_value, long max_value) const;

    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::unordered_set<std::string> bool_flags_;
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};
