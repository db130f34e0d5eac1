#ifndef CORRAL_STATE_CLUSTER_HPP
#define CORRAL_STATE_CLUSTER_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "persistence/i_cluster_store.hpp"
#include "persistence/records.hpp"
#include "stack_id.hpp"

namespace corral {
namespace state {

// Lifecycle of a service installed on a cluster
enum class ServiceState { INIT, INSTALLING, INSTALLED, STARTED, UNKNOWN };

std::string service_state_to_string(ServiceState state);

/**
 * @brief A named, identified collection of hosts with a desired stack
 *
 * The id never changes. The name is changed only by the registry, which
 * calls rename() and then moves its own index entries.
 *
 * Services are the cluster's dependents: the cluster can be removed only
 * while every service is still INIT or UNKNOWN, i.e. nothing is installed.
 *
 * Thread Safety: all methods are safe to call concurrently.
 */
class Cluster {
public:
    Cluster(const persistence::ClusterRecord &record, persistence::IClusterStore &store);

    Cluster(const Cluster &) = delete;
    Cluster &operator=(const Cluster &) = delete;

    int64_t cluster_id() const { return cluster_id_; }
    std::string cluster_name() const;

    /**
     * @brief Persist and apply a new name
     *
     * Store write and name change happen under the cluster lock, so a
     * concurrent set_desired_stack() never writes a stale name or stack.
     * Callers go through ClusterRegistry::update_cluster_name.
     */
    common::Status rename(const std::string &new_name);

    StackId desired_stack() const;

    // Persists the new stack before applying it
    common::Status set_desired_stack(const StackId &stack_id);

    // Services
    common::Status add_service(const std::string &service_name);
    common::Status set_service_state(const std::string &service_name, ServiceState state);
    std::optional<ServiceState> service_state(const std::string &service_name) const;
    std::vector<std::string> service_names() const;

    bool can_be_removed() const;

    /**
     * @brief Tear the cluster down
     *
     * Deletes the persisted row, then drops all services. A store failure
     * leaves the cluster untouched. Fails with FAILED_PRECONDITION when
     * can_be_removed() is false.
     */
    common::Status delete_cluster();

    bool is_deleted() const;

    persistence::ClusterRecord to_record() const;
    std::string debug_dump() const;

private:
    bool can_be_removed_locked() const;

    const int64_t cluster_id_;
    persistence::IClusterStore &store_;

    mutable std::shared_mutex mutex_;
    std::string cluster_name_;
    StackId desired_stack_;
    std::map<std::string, ServiceState> services_;
    bool deleted_ = false;
};

}  // namespace state
}  // namespace corral

#endif  // CORRAL_STATE_CLUSTER_HPP
