#pragma once

#include <cstdint>
#include <string>

#include "common/status.hpp"

namespace corral {
namespace persistence {

// Join relation between host rows and cluster rows
class IClusterHostStore {
public:
    virtual ~IClusterHostStore() = default;

    /**
     * @brief Persist membership of a host in a cluster
     *
     * Both rows must already exist (NOT_FOUND otherwise).
     * ALREADY_EXISTS if the pair is already mapped.
     */
    virtual common::Status add_mapping(const std::string &host_name, int64_t cluster_id) = 0;
};

}  // namespace persistence
}  // namespace corral
