#pragma once

#include <string>

namespace corral {
namespace state {

// Software stack a cluster intends to run, e.g. {"HDP", "1.3.0"}
struct StackId {
    std::string stack_name;
    std::string stack_version;

    // "HDP-1.3.0", or "" when unset
    std::string get_stack_id() const;

    bool empty() const { return stack_name.empty() && stack_version.empty(); }

    bool operator==(const StackId &other) const {
        return stack_name == other.stack_name && stack_version == other.stack_version;
    }
    bool operator!=(const StackId &other) const { return !(*this == other); }
};

// Persisted form: {"stackName":"HDP","stackVersion":"1.3.0"}
std::string encode_stack_id(const StackId &stack_id);

// Empty input decodes to the default (empty) StackId
bool decode_stack_id(const std::string &encoded, StackId &stack_id, std::string &error);

// Parses "HDP-1.3.0" (split at the last '-')
bool parse_stack_id(const std::string &text, StackId &stack_id, std::string &error);

}  // namespace state
}  // namespace corral
