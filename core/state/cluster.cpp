#include "cluster.hpp"

#include <mutex>
#include <sstream>

#include "logging/logger.hpp"

namespace corral {
namespace state {

using common::Status;

std::string service_state_to_string(ServiceState state) {
    switch (state) {
        case ServiceState::INIT:
            return "INIT";
        case ServiceState::INSTALLING:
            return "INSTALLING";
        case ServiceState::INSTALLED:
            return "INSTALLED";
        case ServiceState::STARTED:
            return "STARTED";
        case ServiceState::UNKNOWN:
            return "UNKNOWN";
        default:
            return "UNKNOWN";
    }
}

Cluster::Cluster(const persistence::ClusterRecord &record, persistence::IClusterStore &store)
    : cluster_id_(record.cluster_id), store_(store), cluster_name_(record.cluster_name) {
    std::string error;
    if (!decode_stack_id(record.desired_stack, desired_stack_, error)) {
        LOG_WARN("[Cluster] " << record.cluster_name << ": " << error << ", using empty stack");
        desired_stack_ = StackId{};
    }
}

std::string Cluster::cluster_name() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cluster_name_;
}

common::Status Cluster::rename(const std::string &new_name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (deleted_) {
        return Status::NotFound("Cluster was deleted, clusterName=" + cluster_name_);
    }

    persistence::ClusterRecord record{cluster_id_, new_name, encode_stack_id(desired_stack_)};
    Status status = store_.update(record);
    if (!status.ok()) {
        return Status::PersistenceFailure("Unable to rename cluster " + cluster_name_ + " to " + new_name + ": " +
                                          status.message);
    }

    cluster_name_ = new_name;
    return Status::Ok();
}

StackId Cluster::desired_stack() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return desired_stack_;
}

common::Status Cluster::set_desired_stack(const StackId &stack_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (deleted_) {
        return Status::NotFound("Cluster was deleted, clusterName=" + cluster_name_);
    }

    persistence::ClusterRecord record{cluster_id_, cluster_name_, encode_stack_id(stack_id)};
    Status status = store_.update(record);
    if (!status.ok()) {
        return Status::PersistenceFailure("Unable to update desired stack of cluster " + cluster_name_ + ": " +
                                          status.message);
    }

    LOG_INFO("[Cluster] " << cluster_name_ << " desired stack " << desired_stack_.get_stack_id() << " -> "
                          << stack_id.get_stack_id());
    desired_stack_ = stack_id;
    return Status::Ok();
}

common::Status Cluster::add_service(const std::string &service_name) {
    if (service_name.empty()) {
        return Status::InvalidArgument("Service name must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!services_.emplace(service_name, ServiceState::INIT).second) {
        return Status::AlreadyExists("Service already exists, clusterName=" + cluster_name_ +
                                     ", serviceName=" + service_name);
    }
    return Status::Ok();
}

common::Status Cluster::set_service_state(const std::string &service_name, ServiceState state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = services_.find(service_name);
    if (it == services_.end()) {
        return Status::NotFound("Service not found, clusterName=" + cluster_name_ + ", serviceName=" + service_name);
    }
    it->second = state;
    return Status::Ok();
}

std::optional<ServiceState> Cluster::service_state(const std::string &service_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = services_.find(service_name);
    if (it == services_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Cluster::service_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(services_.size());
    for (const auto &[name, state] : services_) {
        names.push_back(name);
    }
    return names;
}

bool Cluster::can_be_removed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return can_be_removed_locked();
}

bool Cluster::can_be_removed_locked() const {
    for (const auto &[name, state] : services_) {
        if (state != ServiceState::INIT && state != ServiceState::UNKNOWN) {
            LOG_DEBUG("[Cluster] " << cluster_name_ << " blocked by service " << name << " in state "
                                   << service_state_to_string(state));
            return false;
        }
    }
    return true;
}

common::Status Cluster::delete_cluster() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (deleted_) {
        return Status::NotFound("Cluster already deleted, clusterName=" + cluster_name_);
    }
    if (!can_be_removed_locked()) {
        return Status::FailedPrecondition("Cluster has services that cannot be removed, clusterName=" +
                                          cluster_name_);
    }

    Status status = store_.remove(cluster_id_);
    if (!status.ok()) {
        return Status::PersistenceFailure("Unable to delete cluster " + cluster_name_ + ": " + status.message);
    }

    services_.clear();
    deleted_ = true;
    return Status::Ok();
}

bool Cluster::is_deleted() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return deleted_;
}

persistence::ClusterRecord Cluster::to_record() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return persistence::ClusterRecord{cluster_id_, cluster_name_, encode_stack_id(desired_stack_)};
}

std::string Cluster::debug_dump() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::stringstream ss;
    ss << "Cluster={ clusterName=" << cluster_name_ << ", clusterId=" << cluster_id_
       << ", desiredStackVersion=" << desired_stack_.get_stack_id() << ", services=[ ";
    bool first = true;
    for (const auto &[name, state] : services_) {
        if (!first) {
            ss << ", ";
        }
        first = false;
        ss << name << ":" << service_state_to_string(state);
    }
    ss << " ] }";
    return ss.str();
}

}  // namespace state
}  // namespace corral
