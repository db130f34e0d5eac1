#pragma once

#include <memory>

#include "persistence/i_cluster_store.hpp"
#include "persistence/records.hpp"
#include "state/cluster.hpp"
#include "state/host.hpp"

namespace corral {
namespace registry {

// Builds domain objects from persisted rows. Interface to enable mocking.
class IEntityFactory {
public:
    virtual ~IEntityFactory() = default;

    virtual std::shared_ptr<state::Cluster> create_cluster(const persistence::ClusterRecord &record) = 0;

    // persisted = false for hosts that have no row yet
    virtual std::shared_ptr<state::Host> create_host(const persistence::HostRecord &record, bool persisted) = 0;
};

class EntityFactory : public IEntityFactory {
public:
    explicit EntityFactory(persistence::IClusterStore &cluster_store) : cluster_store_(cluster_store) {}

    std::shared_ptr<state::Cluster> create_cluster(const persistence::ClusterRecord &record) override {
        return std::make_shared<state::Cluster>(record, cluster_store_);
    }

    std::shared_ptr<state::Host> create_host(const persistence::HostRecord &record, bool persisted) override {
        return std::make_shared<state::Host>(record, persisted);
    }

private:
    persistence::IClusterStore &cluster_store_;
};

}  // namespace registry
}  // namespace corral
