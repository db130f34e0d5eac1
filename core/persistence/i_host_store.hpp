#pragma once

#include <string>
#include <vector>

#include "common/status.hpp"
#include "records.hpp"

namespace corral {
namespace persistence {

// Repository for host rows. Implementations must be thread-safe.
class IHostStore {
public:
    virtual ~IHostStore() = default;

    // ALREADY_EXISTS if a row with the same host_name exists
    virtual common::Status create(const HostRecord &record) = 0;

    virtual common::Status find_all(std::vector<HostRecord> &records) const = 0;
    virtual common::Status find_by_name(const std::string &host_name, HostRecord &record) const = 0;

    // Merge by host_name. Memberships are owned by IClusterHostStore and are not touched.
    virtual common::Status update(const HostRecord &record) = 0;
};

}  // namespace persistence
}  // namespace corral
