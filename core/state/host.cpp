#include "host.hpp"

#include <mutex>
#include <sstream>

namespace corral {
namespace state {

using common::Status;

std::string host_state_to_string(HostState state) {
    switch (state) {
        case HostState::INIT:
            return "INIT";
        case HostState::WAITING_FOR_HOST_STATUS_UPDATES:
            return "WAITING_FOR_HOST_STATUS_UPDATES";
        case HostState::HEALTHY:
            return "HEALTHY";
        case HostState::HEARTBEAT_LOST:
            return "HEARTBEAT_LOST";
        case HostState::UNHEALTHY:
            return "UNHEALTHY";
        default:
            return "INIT";
    }
}

std::string health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::UNKNOWN:
            return "UNKNOWN";
        case HealthStatus::HEALTHY:
            return "HEALTHY";
        case HealthStatus::ALERT:
            return "ALERT";
        case HealthStatus::UNHEALTHY:
            return "UNHEALTHY";
        default:
            return "UNKNOWN";
    }
}

Host::Host(const persistence::HostRecord &record, bool persisted)
    : host_name_(record.host_name),
      os_type_(record.os_type),
      attributes_(record.attributes),
      persisted_(persisted) {}

std::string Host::os_type() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return os_type_;
}

void Host::set_os_type(const std::string &os_type) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    os_type_ = os_type;
}

HostHealth Host::health() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return health_;
}

void Host::set_health(const HostHealth &health) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    health_ = health;
}

HostState Host::state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

void Host::set_state(HostState state) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_ = state;
}

std::map<std::string, std::string> Host::attributes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return attributes_;
}

void Host::set_attributes(const std::map<std::string, std::string> &attributes) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    attributes_ = attributes;
}

void Host::set_attribute(const std::string &key, const std::string &value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    attributes_[key] = value;
}

std::vector<DiskInfo> Host::disks() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return disks_;
}

void Host::set_disks(const std::vector<DiskInfo> &disks) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    disks_ = disks;
}

std::string Host::agent_version() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return agent_version_;
}

void Host::set_agent_version(const std::string &version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    agent_version_ = version;
}

bool Host::is_persisted() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return persisted_;
}

common::Status Host::persist(persistence::IHostStore &store) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (persisted_) {
        return Status::Ok();
    }

    persistence::HostRecord record;
    record.host_name = host_name_;
    record.os_type = os_type_;
    record.attributes = attributes_;

    Status status = store.create(record);
    if (!status.ok()) {
        return status;
    }
    persisted_ = true;
    return Status::Ok();
}

common::Status Host::save(persistence::IHostStore &store) const {
    persistence::HostRecord record = to_record();
    if (!is_persisted()) {
        return Status::FailedPrecondition("Host is not persisted, hostName=" + host_name_);
    }
    return store.update(record);
}

persistence::HostRecord Host::to_record() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    persistence::HostRecord record;
    record.host_name = host_name_;
    record.os_type = os_type_;
    record.attributes = attributes_;
    return record;
}

std::string Host::debug_dump() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::stringstream ss;
    ss << "Host={ hostName=" << host_name_ << ", osType=" << os_type_ << ", state=" << host_state_to_string(state_)
       << ", health=" << health_status_to_string(health_.status) << ", agentVersion=" << agent_version_
       << ", disks=" << disks_.size() << ", attributes=" << attributes_.size()
       << ", persisted=" << (persisted_ ? "true" : "false") << " }";
    return ss.str();
}

}  // namespace state
}  // namespace corral
