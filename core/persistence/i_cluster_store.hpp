#pragma once

#include <cstdint>
#include <vector>

#include "common/status.hpp"
#include "records.hpp"

namespace corral {
namespace persistence {

// Repository for cluster rows. Implementations must be thread-safe.
class IClusterStore {
public:
    virtual ~IClusterStore() = default;

    // Assigns record.cluster_id. ALREADY_EXISTS if the name is taken.
    virtual common::Status create(ClusterRecord &record) = 0;

    virtual common::Status find_all(std::vector<ClusterRecord> &records) const = 0;
    virtual common::Status find_by_id(int64_t cluster_id, ClusterRecord &record) const = 0;

    // Merge by id. NOT_FOUND if absent, ALREADY_EXISTS on a name collision.
    virtual common::Status update(const ClusterRecord &record) = 0;

    // Deletes the row and every host membership that references it
    virtual common::Status remove(int64_t cluster_id) = 0;
};

}  // namespace persistence
}  // namespace corral
