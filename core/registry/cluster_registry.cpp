#include "cluster_registry.hpp"

#include <exception>
#include <sstream>

#include "logging/logger.hpp"

namespace corral {
namespace registry {

using common::Status;

std::string load_state_to_string(LoadState state) {
    switch (state) {
        case LoadState::NOT_LOADED:
            return "NOT_LOADED";
        case LoadState::LOADING:
            return "LOADING";
        case LoadState::LOADED:
            return "LOADED";
        case LoadState::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

ClusterRegistry::ClusterRegistry(RegistryStores stores, IEntityFactory &factory, const stack::IStackMetadata &stacks)
    : stores_(stores), factory_(factory), validator_(stacks) {
    LOG_INFO("[Registry] Initializing the cluster registry");
}

// ============================================================================
// Hydration
// ============================================================================

common::Status ClusterRegistry::load() { return ensure_loaded(); }

common::Status ClusterRegistry::ensure_loaded() {
    // Late callers block here until the first caller's hydration completes
    std::call_once(load_once_, [this]() {
        load_state_.store(LoadState::LOADING);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        try {
            load_status_ = hydrate_locked();
        } catch (const std::exception &e) {
            LOG_ERROR("[Registry] Hydration aborted: " << e.what());
            load_status_ = Status::PersistenceFailure(std::string("Hydration aborted: ") + e.what());
        }
        if (!load_status_.ok()) {
            clear_indices_locked();
        }
        load_state_.store(load_status_.ok() ? LoadState::LOADED : LoadState::FAILED);
    });

    if (load_state_.load() == LoadState::FAILED) {
        return load_status_;
    }
    return Status::Ok();
}

void ClusterRegistry::clear_indices_locked() {
    clusters_.clear();
    clusters_by_id_.clear();
    hosts_.clear();
    host_clusters_.clear();
    cluster_hosts_.clear();
}

common::Status ClusterRegistry::hydrate_locked() {
    std::vector<persistence::ClusterRecord> cluster_rows;
    Status status = stores_.clusters.find_all(cluster_rows);
    if (!status.ok()) {
        LOG_ERROR("[Registry] Unable to load clusters: " << status.message);
        return Status::PersistenceFailure("Unable to load clusters: " + status.message);
    }

    std::vector<persistence::HostRecord> host_rows;
    status = stores_.hosts.find_all(host_rows);
    if (!status.ok()) {
        LOG_ERROR("[Registry] Unable to load hosts: " << status.message);
        return Status::PersistenceFailure("Unable to load hosts: " + status.message);
    }

    for (const auto &row : cluster_rows) {
        auto cluster = factory_.create_cluster(row);
        clusters_[row.cluster_name] = cluster;
        clusters_by_id_[row.cluster_id] = cluster;
        cluster_hosts_[row.cluster_name];
    }

    size_t memberships = 0;
    for (const auto &row : host_rows) {
        auto host = factory_.create_host(row, true);
        hosts_[row.host_name] = host;
        auto &host_clusters = host_clusters_[row.host_name];

        for (int64_t cluster_id : row.cluster_ids) {
            auto it = clusters_by_id_.find(cluster_id);
            if (it == clusters_by_id_.end()) {
                LOG_WARN("[Registry] Host " << row.host_name << " is mapped to unknown cluster id=" << cluster_id);
                continue;
            }
            host_clusters[cluster_id] = it->second;
            cluster_hosts_[it->second->cluster_name()][row.host_name] = host;
            ++memberships;
        }
    }

    LOG_INFO("[Registry] Loaded " << clusters_.size() << " cluster(s), " << hosts_.size() << " host(s), "
                                  << memberships << " mapping(s)");
    return Status::Ok();
}

// ============================================================================
// Clusters
// ============================================================================

common::Status ClusterRegistry::add_cluster(const std::string &cluster_name, std::shared_ptr<state::Cluster> *out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }
    if (cluster_name.empty()) {
        return Status::InvalidArgument("Cluster name must not be empty");
    }

    // Cheap duplicate check before contending for the exclusive lock
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (clusters_.count(cluster_name) > 0) {
            return Status::AlreadyExists("Attempted to create a Cluster which already exists, clusterName=" +
                                         cluster_name);
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return add_cluster_locked(cluster_name, out);
}

common::Status ClusterRegistry::add_cluster_locked(const std::string &cluster_name,
                                                   std::shared_ptr<state::Cluster> *out) {
    if (clusters_.count(cluster_name) > 0) {
        return Status::AlreadyExists("Attempted to create a Cluster which already exists, clusterName=" +
                                     cluster_name);
    }

    persistence::ClusterRecord record;
    record.cluster_name = cluster_name;
    record.desired_stack = state::encode_stack_id(state::StackId{});

    Status status = stores_.clusters.create(record);
    if (!status.ok()) {
        LOG_WARN("[Registry] Unable to create cluster " << cluster_name << ": " << status.message);
        return Status::PersistenceFailure("Unable to create cluster " + cluster_name + ": " + status.message);
    }

    auto cluster = factory_.create_cluster(record);
    clusters_[cluster_name] = cluster;
    clusters_by_id_[record.cluster_id] = cluster;
    cluster_hosts_[cluster_name];

    LOG_INFO("[Registry] Added cluster " << cluster_name << " (id=" << record.cluster_id << ")");
    if (out != nullptr) {
        *out = cluster;
    }
    return Status::Ok();
}

common::Status ClusterRegistry::get_cluster(const std::string &cluster_name, std::shared_ptr<state::Cluster> &out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = clusters_.find(cluster_name);
    if (it == clusters_.end()) {
        return Status::NotFound("Cluster not found, clusterName=" + cluster_name);
    }
    out = it->second;
    return Status::Ok();
}

common::Status ClusterRegistry::get_cluster_by_id(int64_t cluster_id, std::shared_ptr<state::Cluster> &out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = clusters_by_id_.find(cluster_id);
    if (it == clusters_by_id_.end()) {
        return Status::NotFound("Cluster not found, clusterId=" + std::to_string(cluster_id));
    }
    out = it->second;
    return Status::Ok();
}

common::Status ClusterRegistry::get_clusters(std::map<std::string, std::shared_ptr<state::Cluster>> &out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.clear();
    for (const auto &[name, cluster] : clusters_) {
        out.emplace(name, cluster);
    }
    return Status::Ok();
}

common::Status ClusterRegistry::update_cluster_name(const std::string &old_name, const std::string &new_name) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return update_cluster_name_locked(old_name, new_name);
}

common::Status ClusterRegistry::update_cluster_name_locked(const std::string &old_name, const std::string &new_name) {
    if (new_name.empty()) {
        return Status::InvalidArgument("Cluster name must not be empty");
    }

    auto it = clusters_.find(old_name);
    if (it == clusters_.end()) {
        return Status::NotFound("Cluster not found, clusterName=" + old_name);
    }
    if (old_name == new_name) {
        return Status::Ok();
    }
    if (clusters_.count(new_name) > 0) {
        return Status::AlreadyExists("Cannot rename cluster " + old_name + ", clusterName=" + new_name +
                                     " already exists");
    }

    auto cluster = it->second;
    Status status = cluster->rename(new_name);
    if (!status.ok()) {
        LOG_ERROR("[Registry] " << status.message);
        return status;
    }

    clusters_.erase(it);
    clusters_[new_name] = cluster;

    auto hosts_node = cluster_hosts_.extract(old_name);
    if (hosts_node.empty()) {
        cluster_hosts_[new_name];
    } else {
        hosts_node.key() = new_name;
        cluster_hosts_.insert(std::move(hosts_node));
    }

    LOG_INFO("[Registry] Renamed cluster " << old_name << " -> " << new_name << " (id=" << cluster->cluster_id()
                                           << ")");
    return Status::Ok();
}

common::Status ClusterRegistry::delete_cluster(const std::string &cluster_name) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return delete_cluster_locked(cluster_name);
}

common::Status ClusterRegistry::delete_cluster_locked(const std::string &cluster_name) {
    auto it = clusters_.find(cluster_name);
    if (it == clusters_.end()) {
        return Status::NotFound("Cluster not found, clusterName=" + cluster_name);
    }

    auto cluster = it->second;
    if (!cluster->can_be_removed()) {
        return Status::FailedPrecondition("Could not delete cluster, clusterName=" + cluster_name);
    }

    LOG_INFO("[Registry] Deleting cluster " << cluster_name);
    Status status = cluster->delete_cluster();
    if (!status.ok()) {
        LOG_ERROR("[Registry] " << status.message);
        return status;
    }

    const int64_t cluster_id = cluster->cluster_id();
    for (auto &[host_name, host_clusters] : host_clusters_) {
        host_clusters.erase(cluster_id);
    }
    cluster_hosts_.erase(cluster_name);
    clusters_.erase(it);
    clusters_by_id_.erase(cluster_id);
    return Status::Ok();
}

// ============================================================================
// Hosts
// ============================================================================

common::Status ClusterRegistry::add_host(const std::string &host_name, std::shared_ptr<state::Host> *out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }
    if (host_name.empty()) {
        return Status::InvalidArgument("Host name must not be empty");
    }

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (hosts_.count(host_name) > 0) {
            return Status::AlreadyExists("Duplicate entry for Host, hostName=" + host_name);
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return add_host_locked(host_name, out);
}

common::Status ClusterRegistry::add_host_locked(const std::string &host_name, std::shared_ptr<state::Host> *out) {
    if (hosts_.count(host_name) > 0) {
        return Status::AlreadyExists("Duplicate entry for Host, hostName=" + host_name);
    }

    persistence::HostRecord record;
    record.host_name = host_name;

    // Not stored until it is first mapped to a cluster
    auto host = factory_.create_host(record, false);
    host->set_agent_version("");
    host->set_disks({});
    host->set_health(state::HostHealth{state::HealthStatus::UNKNOWN, ""});
    host->set_attributes({});
    host->set_state(state::HostState::INIT);

    hosts_[host_name] = host;
    host_clusters_[host_name];

    LOG_DEBUG("[Registry] Added host " << host_name);
    if (out != nullptr) {
        *out = host;
    }
    return Status::Ok();
}

common::Status ClusterRegistry::get_host(const std::string &host_name, std::shared_ptr<state::Host> &out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = hosts_.find(host_name);
    if (it == hosts_.end()) {
        return Status::NotFound("Host not found, hostName=" + host_name);
    }
    out = it->second;
    return Status::Ok();
}

common::Status ClusterRegistry::get_hosts(std::vector<std::shared_ptr<state::Host>> &out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.clear();
    out.reserve(hosts_.size());
    for (const auto &[name, host] : hosts_) {
        out.push_back(host);
    }
    return Status::Ok();
}

// ============================================================================
// Mapping
// ============================================================================

common::Status ClusterRegistry::map_host_to_cluster(const std::string &host_name, const std::string &cluster_name) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return map_host_to_cluster_locked(host_name, cluster_name);
}

common::Status ClusterRegistry::map_hosts_to_cluster(const std::set<std::string> &host_names,
                                                     const std::string &cluster_name) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t mapped = 0;
    for (const auto &host_name : host_names) {
        status = map_host_to_cluster_locked(host_name, cluster_name);
        if (!status.ok()) {
            LOG_WARN("[Registry] Batch mapping to " << cluster_name << " stopped at host " << host_name << " ("
                                                    << mapped << " of " << host_names.size() << " mapped)");
            return status;
        }
        ++mapped;
    }
    return Status::Ok();
}

common::Status ClusterRegistry::map_host_to_cluster_locked(const std::string &host_name,
                                                           const std::string &cluster_name) {
    auto host_it = hosts_.find(host_name);
    if (host_it == hosts_.end()) {
        return Status::NotFound("Host not found, hostName=" + host_name);
    }
    auto cluster_it = clusters_.find(cluster_name);
    if (cluster_it == clusters_.end()) {
        return Status::NotFound("Cluster not found, clusterName=" + cluster_name);
    }

    auto host = host_it->second;
    auto cluster = cluster_it->second;
    auto &host_clusters = host_clusters_[host_name];

    if (host_clusters.count(cluster->cluster_id()) > 0) {
        return Status::AlreadyExists("Attempted to create a host which already exists: clusterName=" + cluster_name +
                                     ", hostName=" + host_name);
    }

    Status status = validator_.check(*cluster, *host);
    if (!status.ok()) {
        LOG_WARN("[Registry] " << status.message);
        return status;
    }

    status = persist_mapping_locked(*host, *cluster);
    if (!status.ok()) {
        LOG_ERROR("[Registry] " << status.message);
        return status;
    }

    host_clusters[cluster->cluster_id()] = cluster;
    cluster_hosts_[cluster_name][host_name] = host;

    LOG_DEBUG("[Registry] Mapped host " << host_name << " to cluster " << cluster_name
                                        << " (id=" << cluster->cluster_id() << ")");
    return Status::Ok();
}

common::Status ClusterRegistry::persist_mapping_locked(state::Host &host, const state::Cluster &cluster) {
    Status status = host.persist(stores_.hosts);
    if (!status.ok()) {
        return Status::PersistenceFailure("Unable to persist host " + host.host_name() + ": " + status.message);
    }

    status = stores_.cluster_hosts.add_mapping(host.host_name(), cluster.cluster_id());
    if (!status.ok()) {
        return Status::PersistenceFailure("Unable to map host " + host.host_name() + " to cluster " +
                                          cluster.cluster_name() + ": " + status.message);
    }
    return Status::Ok();
}

common::Status ClusterRegistry::get_clusters_for_host(const std::string &host_name,
                                                      std::vector<std::shared_ptr<state::Cluster>> &out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = host_clusters_.find(host_name);
    if (it == host_clusters_.end()) {
        return Status::NotFound("Host not found, hostName=" + host_name);
    }

    LOG_DEBUG("[Registry] Looking up clusters for hostname " << host_name << ", mappedClusters="
                                                             << it->second.size());
    out.clear();
    out.reserve(it->second.size());
    for (const auto &[cluster_id, cluster] : it->second) {
        out.push_back(cluster);
    }
    return Status::Ok();
}

common::Status ClusterRegistry::get_hosts_for_cluster(const std::string &cluster_name,
                                                      std::map<std::string, std::shared_ptr<state::Host>> &out) {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return status;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cluster_hosts_.find(cluster_name);
    if (it == cluster_hosts_.end()) {
        return Status::NotFound("Cluster not found, clusterName=" + cluster_name);
    }
    out = it->second;
    return Status::Ok();
}

// ============================================================================
// Status
// ============================================================================

size_t ClusterRegistry::cluster_count() {
    Status status = ensure_loaded();
    if (!status.ok()) {
        LOG_WARN("[Registry] cluster_count unavailable: " << status.message);
        return 0;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return clusters_.size();
}

size_t ClusterRegistry::host_count() {
    Status status = ensure_loaded();
    if (!status.ok()) {
        LOG_WARN("[Registry] host_count unavailable: " << status.message);
        return 0;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return hosts_.size();
}

std::string ClusterRegistry::debug_dump() {
    Status status = ensure_loaded();
    if (!status.ok()) {
        return "Registry unavailable: " + status.to_string();
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    // Sorted output
    std::map<std::string, std::shared_ptr<state::Cluster>> clusters(clusters_.begin(), clusters_.end());
    std::map<std::string, std::shared_ptr<state::Host>> hosts(hosts_.begin(), hosts_.end());

    std::stringstream ss;
    ss << "Clusters=[";
    for (const auto &[name, cluster] : clusters) {
        ss << "\n  " << cluster->debug_dump() << " hosts=[";
        auto hosts_it = cluster_hosts_.find(name);
        if (hosts_it != cluster_hosts_.end()) {
            bool first = true;
            for (const auto &[host_name, host] : hosts_it->second) {
                ss << (first ? " " : ", ") << host_name;
                first = false;
            }
        }
        ss << " ]";
    }
    ss << "\n]\nHosts=[";
    for (const auto &[name, host] : hosts) {
        ss << "\n  " << host->debug_dump();
    }
    ss << "\n]";
    return ss.str();
}

}  // namespace registry
}  // namespace corral
