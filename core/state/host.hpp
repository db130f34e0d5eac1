#ifndef CORRAL_STATE_HOST_HPP
#define CORRAL_STATE_HOST_HPP

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "persistence/i_host_store.hpp"
#include "persistence/records.hpp"

namespace corral {
namespace state {

enum class HostState { INIT, WAITING_FOR_HOST_STATUS_UPDATES, HEALTHY, HEARTBEAT_LOST, UNHEALTHY };

enum class HealthStatus { UNKNOWN, HEALTHY, ALERT, UNHEALTHY };

std::string host_state_to_string(HostState state);
std::string health_status_to_string(HealthStatus status);

struct HostHealth {
    HealthStatus status = HealthStatus::UNKNOWN;
    std::string health_report;
};

// One mounted disk as reported by the host agent
struct DiskInfo {
    std::string device;
    std::string mountpoint;
    std::string type;
    uint64_t size_kb = 0;
    uint64_t used_kb = 0;
    uint64_t available_kb = 0;
};

/**
 * @brief A named machine record
 *
 * A host built from a persisted row is "persisted". A host added at runtime
 * is transient until persist() writes its row.
 *
 * Thread Safety: all methods are safe to call concurrently.
 */
class Host {
public:
    Host(const persistence::HostRecord &record, bool persisted);

    Host(const Host &) = delete;
    Host &operator=(const Host &) = delete;

    const std::string &host_name() const { return host_name_; }

    std::string os_type() const;
    void set_os_type(const std::string &os_type);

    HostHealth health() const;
    void set_health(const HostHealth &health);

    HostState state() const;
    void set_state(HostState state);

    std::map<std::string, std::string> attributes() const;
    void set_attributes(const std::map<std::string, std::string> &attributes);
    void set_attribute(const std::string &key, const std::string &value);

    std::vector<DiskInfo> disks() const;
    void set_disks(const std::vector<DiskInfo> &disks);

    std::string agent_version() const;
    void set_agent_version(const std::string &version);

    bool is_persisted() const;

    // Writes the host row if transient. No-op for an already persisted host.
    common::Status persist(persistence::IHostStore &store);

    // Merges os type and attributes into the persisted row
    common::Status save(persistence::IHostStore &store) const;

    // Memberships are not tracked here; cluster_ids is left empty
    persistence::HostRecord to_record() const;

    std::string debug_dump() const;

private:
    const std::string host_name_;

    mutable std::shared_mutex mutex_;
    std::string os_type_;
    HostHealth health_;
    HostState state_ = HostState::INIT;
    std::map<std::string, std::string> attributes_;
    std::vector<DiskInfo> disks_;
    std::string agent_version_;
    bool persisted_;
};

}  // namespace state
}  // namespace corral

#endif  // CORRAL_STATE_HOST_HPP
