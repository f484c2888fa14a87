#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace stegbmp {

// Very small CLI parser:
//   --key value   (only for keys passed to the constructor)
//   --flag        (treated as "true")
//   anything else is positional, in order
class CliParser {
public:
    explicit CliParser(std::unordered_set<std::string> value_keys = {})
        : value_keys_(std::move(value_keys)) {}

    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_set<std::string> value_keys_;
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace stegbmp
