#pragma once

#include <map>
#include <string>
#include <vector>

namespace corral {
namespace stack {

// Package repository serving one OS type for a stack version
struct RepositoryInfo {
    std::string os_type;
    std::string repo_id;
    std::string repo_name;
    std::string base_url;
};

// OS type -> repositories
using RepositoryMap = std::map<std::string, std::vector<RepositoryInfo>>;

// Interface for stack metadata lookups to enable mocking
class IStackMetadata {
public:
    virtual ~IStackMetadata() = default;

    // Unknown stacks yield an empty map, meaning no OS type is supported
    virtual RepositoryMap get_repositories(const std::string &stack_name, const std::string &stack_version) const = 0;
};

}  // namespace stack
}  // namespace corral
