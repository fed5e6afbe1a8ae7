#include "cli_args.hpp"

#include <stdexcept>
#include <utility>

CliArgs::CliArgs(std::unordered_set<std::string> bool_flags) : bool_flags_(std::move(bool_flags)) {}

void CliArgs::parse(int argc, char** argv) {
    kv_.clear();
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        std::string key;
        if (a.rfind("--", 0) == 0) {
            key = a.substr(2);
        } else if (a.size() == 2 && a[0] == '-') {
            key = a.substr(1);
        } else {
            positional_.push_back(a);
            continue;
        }

        if (bool_flags_.count(key)) {
            kv_[key] = "true";
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + a);
        }
        kv_[key] = argv[++i] ? argv[i] : "";
    }
}

bool CliArgs::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliArgs::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

long CliArgs::get_int(const std::string& key, long def, long min_value, long max_value) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;

    size_t used = 0;
    long v = 0;
    try {
        v = std::stol(it->second, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("--" + key + " expects a number, got '" + it->second + "'");
    }
    if (used != it->second.size()) {
        throw std::invalid_argument("--" + key + " expects a number, got '" + it->second + "'");
    }
    if (v < min_value || v > max_value) {
        throw std::invalid_argument("--" + key + " must be in [" + std::to_string(min_value) + ", "
                                    + std::to_string(max_value) + "]");
    }
    return v;
}
