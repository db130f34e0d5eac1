#include "memory_store.hpp"

#include <mutex>

#include "logging/logger.hpp"

namespace corral {
namespace persistence {

using common::Status;

common::Status MemoryStore::commit(const State & /*next*/) { return Status::Ok(); }

void MemoryStore::reset_state(State state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_ = std::move(state);
}

common::Status MemoryStore::apply(const std::function<common::Status(State &)> &mutate) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    State next = state_;
    Status status = mutate(next);
    if (!status.ok()) {
        return status;
    }

    status = commit(next);
    if (!status.ok()) {
        LOG_ERROR("[Store] Commit failed: " << status.message);
        return status;
    }

    state_ = std::move(next);
    return Status::Ok();
}

bool MemoryStore::cluster_name_taken(const State &state, const std::string &name, int64_t except_id) {
    for (const auto &[id, row] : state.clusters) {
        if (id != except_id && row.cluster_name == name) {
            return true;
        }
    }
    return false;
}

common::Status MemoryStore::create(ClusterRecord &record) {
    int64_t assigned_id = 0;
    Status status = apply([&](State &state) {
        if (cluster_name_taken(state, record.cluster_name, 0)) {
            return Status::AlreadyExists("Unique constraint violated on cluster_name=" + record.cluster_name);
        }
        assigned_id = state.next_cluster_id++;
        ClusterRecord row = record;
        row.cluster_id = assigned_id;
        state.clusters[assigned_id] = row;
        return Status::Ok();
    });

    if (status.ok()) {
        record.cluster_id = assigned_id;
        LOG_DEBUG("[Store] Created cluster row id=" << assigned_id << " name=" << record.cluster_name);
    }
    return status;
}

common::Status MemoryStore::find_all(std::vector<ClusterRecord> &records) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    records.clear();
    records.reserve(state_.clusters.size());
    for (const auto &[id, row] : state_.clusters) {
        records.push_back(row);
    }
    return Status::Ok();
}

common::Status MemoryStore::find_by_id(int64_t cluster_id, ClusterRecord &record) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = state_.clusters.find(cluster_id);
    if (it == state_.clusters.end()) {
        return Status::NotFound("No cluster row with id=" + std::to_string(cluster_id));
    }
    record = it->second;
    return Status::Ok();
}

common::Status MemoryStore::update(const ClusterRecord &record) {
    return apply([&](State &state) {
        auto it = state.clusters.find(record.cluster_id);
        if (it == state.clusters.end()) {
            return Status::NotFound("No cluster row with id=" + std::to_string(record.cluster_id));
        }
        if (cluster_name_taken(state, record.cluster_name, record.cluster_id)) {
            return Status::AlreadyExists("Unique constraint violated on cluster_name=" + record.cluster_name);
        }
        it->second = record;
        return Status::Ok();
    });
}

common::Status MemoryStore::remove(int64_t cluster_id) {
    return apply([&](State &state) {
        if (state.clusters.erase(cluster_id) == 0) {
            return Status::NotFound("No cluster row with id=" + std::to_string(cluster_id));
        }
        // Cascade to the join relation
        for (auto &[name, host] : state.hosts) {
            host.cluster_ids.erase(cluster_id);
        }
        return Status::Ok();
    });
}

common::Status MemoryStore::create(const HostRecord &record) {
    return apply([&](State &state) {
        if (state.hosts.count(record.host_name) > 0) {
            return Status::AlreadyExists("Unique constraint violated on host_name=" + record.host_name);
        }
        for (int64_t cluster_id : record.cluster_ids) {
            if (state.clusters.count(cluster_id) == 0) {
                return Status::NotFound("Host row references unknown cluster id=" + std::to_string(cluster_id));
            }
        }
        state.hosts[record.host_name] = record;
        return Status::Ok();
    });
}

common::Status MemoryStore::find_all(std::vector<HostRecord> &records) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    records.clear();
    records.reserve(state_.hosts.size());
    for (const auto &[name, row] : state_.hosts) {
        records.push_back(row);
    }
    return Status::Ok();
}

common::Status MemoryStore::find_by_name(const std::string &host_name, HostRecord &record) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = state_.hosts.find(host_name);
    if (it == state_.hosts.end()) {
        return Status::NotFound("No host row with host_name=" + host_name);
    }
    record = it->second;
    return Status::Ok();
}

common::Status MemoryStore::update(const HostRecord &record) {
    return apply([&](State &state) {
        auto it = state.hosts.find(record.host_name);
        if (it == state.hosts.end()) {
            return Status::NotFound("No host row with host_name=" + record.host_name);
        }
        auto memberships = it->second.cluster_ids;
        it->second = record;
        it->second.cluster_ids = std::move(memberships);
        return Status::Ok();
    });
}

common::Status MemoryStore::add_mapping(const std::string &host_name, int64_t cluster_id) {
    return apply([&](State &state) {
        auto host_it = state.hosts.find(host_name);
        if (host_it == state.hosts.end()) {
            return Status::NotFound("No host row with host_name=" + host_name);
        }
        if (state.clusters.count(cluster_id) == 0) {
            return Status::NotFound("No cluster row with id=" + std::to_string(cluster_id));
        }
        if (!host_it->second.cluster_ids.insert(cluster_id).second) {
            return Status::AlreadyExists("Unique constraint violated on (host_name=" + host_name +
                                         ", cluster_id=" + std::to_string(cluster_id) + ")");
        }
        return Status::Ok();
    });
}

size_t MemoryStore::cluster_row_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_.clusters.size();
}

size_t MemoryStore::host_row_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_.hosts.size();
}

}  // namespace persistence
}  // namespace corral
