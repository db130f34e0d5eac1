#include "stack_id.hpp"

#include <nlohmann/json.hpp>

namespace corral {
namespace state {

std::string StackId::get_stack_id() const {
    if (empty()) {
        return "";
    }
    return stack_name + "-" + stack_version;
}

std::string encode_stack_id(const StackId &stack_id) {
    nlohmann::json j = {{"stackName", stack_id.stack_name}, {"stackVersion", stack_id.stack_version}};
    return j.dump();
}

bool decode_stack_id(const std::string &encoded, StackId &stack_id, std::string &error) {
    if (encoded.empty()) {
        stack_id = StackId{};
        return true;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(encoded);
        if (!j.is_object()) {
            error = "Desired stack is not a JSON object: " + encoded;
            return false;
        }
        stack_id.stack_name = j.value("stackName", std::string());
        stack_id.stack_version = j.value("stackVersion", std::string());
        return true;
    } catch (const std::exception &e) {
        error = std::string("Desired stack parse error: ") + e.what();
        return false;
    }
}

bool parse_stack_id(const std::string &text, StackId &stack_id, std::string &error) {
    auto dash = text.rfind('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 == text.size()) {
        error = "Invalid stack id '" + text + "': expected NAME-VERSION";
        return false;
    }
    stack_id.stack_name = text.substr(0, dash);
    stack_id.stack_version = text.substr(dash + 1);
    return true;
}

}  // namespace state
}  // namespace corral
