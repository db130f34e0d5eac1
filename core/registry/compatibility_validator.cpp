#include "compatibility_validator.hpp"

namespace corral {
namespace registry {

bool CompatibilityValidator::is_os_supported(const state::Cluster &cluster, const state::Host &host) const {
    const state::StackId stack_id = cluster.desired_stack();
    const stack::RepositoryMap repos = stacks_.get_repositories(stack_id.stack_name, stack_id.stack_version);
    if (repos.empty()) {
        return false;
    }
    return repos.find(host.os_type()) != repos.end();
}

common::Status CompatibilityValidator::check(const state::Cluster &cluster, const state::Host &host) const {
    if (is_os_supported(cluster, host)) {
        return common::Status::Ok();
    }
    return common::Status::Incompatible(
        "Trying to map host to cluster where stack does not support host's os type"
        ", clusterName=" + cluster.cluster_name() +
        ", clusterStackId=" + cluster.desired_stack().get_stack_id() +
        ", hostname=" + host.host_name() +
        ", hostOsType=" + host.os_type());
}

}  // namespace registry
}  // namespace corral
