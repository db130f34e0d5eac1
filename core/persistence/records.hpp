#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace corral {
namespace persistence {

// Persisted cluster row
struct ClusterRecord {
    int64_t cluster_id = 0;     // Assigned by the store on create (0 = unassigned)
    std::string cluster_name;   // Unique among live rows
    std::string desired_stack;  // JSON-encoded StackId
};

// Persisted host row. cluster_ids is the host's side of the join relation.
struct HostRecord {
    std::string host_name;
    std::string os_type;
    std::map<std::string, std::string> attributes;
    std::set<int64_t> cluster_ids;
};

}  // namespace persistence
}  // namespace corral
