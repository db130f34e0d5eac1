#ifndef CORRAL_REGISTRY_CLUSTER_REGISTRY_HPP
#define CORRAL_REGISTRY_CLUSTER_REGISTRY_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/status.hpp"
#include "compatibility_validator.hpp"
#include "entity_factory.hpp"
#include "persistence/i_cluster_host_store.hpp"
#include "persistence/i_cluster_store.hpp"
#include "persistence/i_host_store.hpp"
#include "stack/i_stack_metadata.hpp"
#include "state/cluster.hpp"
#include "state/host.hpp"

namespace corral {
namespace registry {

enum class LoadState { NOT_LOADED, LOADING, LOADED, FAILED };

std::string load_state_to_string(LoadState state);

// Backing stores the registry persists through
struct RegistryStores {
    persistence::IClusterStore &clusters;
    persistence::IHostStore &hosts;
    persistence::IClusterHostStore &cluster_hosts;
};

/**
 * @brief Authoritative in-memory registry of clusters, hosts and their mapping
 *
 * Indices:
 * - cluster name -> cluster, cluster id -> cluster
 * - host name -> host
 * - cluster name -> hosts, host name -> clusters (mirrored, always agree)
 *
 * Hydration:
 * - The first call to any public method loads every cluster row, host row and
 *   membership from the stores, exactly once (std::call_once)
 * - If the stores fail during hydration, or the factory throws, the indices
 *   are cleared, the registry is left FAILED and every call returns that
 *   PERSISTENCE_FAILURE
 *
 * Thread Safety:
 * - One shared_mutex guards all indices
 * - Lookups use shared_lock and return snapshots (shared_ptr copies)
 * - Mutations use unique_lock and persist before touching any index, so a
 *   store failure leaves the indices unchanged
 * - Store latency is lock-hold time for mutations
 * - The lock is not reentrant: public methods lock, *_locked helpers assume
 *   the caller holds the unique_lock
 *
 * Deleted clusters are removed from every index, including the id index.
 */
class ClusterRegistry {
public:
    ClusterRegistry(RegistryStores stores, IEntityFactory &factory, const stack::IStackMetadata &stacks);

    ClusterRegistry(const ClusterRegistry &) = delete;
    ClusterRegistry &operator=(const ClusterRegistry &) = delete;

    // Hydrate now instead of on first use
    common::Status load();
    LoadState load_state() const { return load_state_.load(); }
    bool is_loaded() const { return load_state() == LoadState::LOADED; }

    // Clusters
    common::Status add_cluster(const std::string &cluster_name, std::shared_ptr<state::Cluster> *out = nullptr);
    common::Status get_cluster(const std::string &cluster_name, std::shared_ptr<state::Cluster> &out);
    common::Status get_cluster_by_id(int64_t cluster_id, std::shared_ptr<state::Cluster> &out);
    common::Status get_clusters(std::map<std::string, std::shared_ptr<state::Cluster>> &out);

    // NOT_FOUND if old_name is absent, ALREADY_EXISTS if new_name is taken
    common::Status update_cluster_name(const std::string &old_name, const std::string &new_name);

    // FAILED_PRECONDITION while the cluster cannot be removed
    common::Status delete_cluster(const std::string &cluster_name);

    // Hosts
    common::Status add_host(const std::string &host_name, std::shared_ptr<state::Host> *out = nullptr);
    common::Status get_host(const std::string &host_name, std::shared_ptr<state::Host> &out);
    common::Status get_hosts(std::vector<std::shared_ptr<state::Host>> &out);

    // Host <-> cluster mapping
    common::Status map_host_to_cluster(const std::string &host_name, const std::string &cluster_name);

    /**
     * @brief Map several hosts under a single lock acquisition
     *
     * Hosts are mapped in name order. Grouped, not transactional: the first
     * failure is returned and the hosts mapped before it stay mapped.
     */
    common::Status map_hosts_to_cluster(const std::set<std::string> &host_names, const std::string &cluster_name);

    // Sorted by cluster id
    common::Status get_clusters_for_host(const std::string &host_name,
                                         std::vector<std::shared_ptr<state::Cluster>> &out);
    common::Status get_hosts_for_cluster(const std::string &cluster_name,
                                         std::map<std::string, std::shared_ptr<state::Host>> &out);

    // Status. The counts are 0 (and a warning is logged) when FAILED
    size_t cluster_count();
    size_t host_count();
    std::string debug_dump();

private:
    common::Status ensure_loaded();
    common::Status hydrate_locked();
    void clear_indices_locked();

    common::Status add_cluster_locked(const std::string &cluster_name, std::shared_ptr<state::Cluster> *out);
    common::Status add_host_locked(const std::string &host_name, std::shared_ptr<state::Host> *out);
    common::Status map_host_to_cluster_locked(const std::string &host_name, const std::string &cluster_name);
    common::Status persist_mapping_locked(state::Host &host, const state::Cluster &cluster);
    common::Status update_cluster_name_locked(const std::string &old_name, const std::string &new_name);
    common::Status delete_cluster_locked(const std::string &cluster_name);

    RegistryStores stores_;
    IEntityFactory &factory_;
    CompatibilityValidator validator_;

    // One-shot hydration guard
    std::once_flag load_once_;
    std::atomic<LoadState> load_state_{LoadState::NOT_LOADED};
    common::Status load_status_;  // Written once inside call_once

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<state::Cluster>> clusters_;
    std::unordered_map<int64_t, std::shared_ptr<state::Cluster>> clusters_by_id_;
    std::unordered_map<std::string, std::shared_ptr<state::Host>> hosts_;
    std::unordered_map<std::string, std::map<int64_t, std::shared_ptr<state::Cluster>>> host_clusters_;
    std::unordered_map<std::string, std::map<std::string, std::shared_ptr<state::Host>>> cluster_hosts_;
};

}  // namespace registry
}  // namespace corral

#endif  // CORRAL_REGISTRY_CLUSTER_REGISTRY_HPP
