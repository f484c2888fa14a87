#include "cli/cli_parser.hpp"

namespace stegbmp {

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            std::string key = a.substr(2);
            std::string val = "true";
            if (value_keys_.count(key) && i + 1 < argc) {
                val = argv[i + 1] ? argv[i + 1] : "";
                ++i;
            }
            kv_[key] = val;
        } else {
            positional_.push_back(a);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

} // namespace stegbmp
