#pragma once

#include "common/status.hpp"
#include "stack/i_stack_metadata.hpp"
#include "state/cluster.hpp"
#include "state/host.hpp"

namespace corral {
namespace registry {

// Decides whether a host's OS type is served by a cluster's desired stack
class CompatibilityValidator {
public:
    explicit CompatibilityValidator(const stack::IStackMetadata &stacks) : stacks_(stacks) {}

    bool is_os_supported(const state::Cluster &cluster, const state::Host &host) const;

    // OK, or INCOMPATIBLE naming the cluster, its stack, the host and its OS type
    common::Status check(const state::Cluster &cluster, const state::Host &host) const;

private:
    const stack::IStackMetadata &stacks_;
};

}  // namespace registry
}  // namespace corral
