#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "persistence/memory_store.hpp"
#include "registry/cluster_registry.hpp"
#include "registry/entity_factory.hpp"
#include "stack/stack_catalog.hpp"

namespace corral {
namespace runtime {

// Owns the process-wide registry and everything it depends on
class Runtime {
public:
    explicit Runtime(const CorralConfig &config);

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Build store, stack catalog and registry; hydrate if eager_load is set
    bool initialize(std::string &error);

    // Valid after a successful initialize()
    registry::ClusterRegistry &get_registry() { return *registry_; }
    stack::StackCatalog &get_stack_catalog() { return *stack_catalog_; }
    persistence::MemoryStore &get_store() { return *store_; }

    const CorralConfig &config() const { return config_; }

private:
    // Staged initialization helpers
    bool init_store(std::string &error);
    bool init_stacks(std::string &error);
    bool init_registry(std::string &error);

    CorralConfig config_;

    std::unique_ptr<persistence::MemoryStore> store_;
    std::unique_ptr<stack::StackCatalog> stack_catalog_;
    std::unique_ptr<registry::EntityFactory> entity_factory_;
    std::unique_ptr<registry::ClusterRegistry> registry_;
};

}  // namespace runtime
}  // namespace corral
