#include "runtime.hpp"

#include "logging/logger.hpp"
#include "persistence/json_file_store.hpp"

namespace corral {
namespace runtime {

Runtime::Runtime(const CorralConfig &config) : config_(config) {}

bool Runtime::initialize(std::string &error) {
    logging::Logger::set_level(logging::string_to_level(config_.logging.level));
    LOG_INFO("[Runtime] Initializing Corral");

    if (!init_store(error)) {
        return false;
    }

    if (!init_stacks(error)) {
        return false;
    }

    if (!init_registry(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_store(std::string &error) {
    switch (config_.store.backend) {
        case StoreBackend::JSON_FILE: {
            auto store = std::make_unique<persistence::JsonFileStore>(config_.store.path);
            common::Status status = store->open();
            if (!status.ok()) {
                error = "Store open failed: " + status.message;
                return false;
            }
            store_ = std::move(store);
            break;
        }
        case StoreBackend::MEMORY:
        default:
            store_ = std::make_unique<persistence::MemoryStore>();
            break;
    }

    LOG_INFO("[Runtime] Store backend: " << store_backend_to_string(config_.store.backend));
    return true;
}

bool Runtime::init_stacks(std::string &error) {
    stack_catalog_ = std::make_unique<stack::StackCatalog>();

    if (!config_.stacks.catalog.empty()) {
        if (!stack_catalog_->load_file(config_.stacks.catalog, error)) {
            error = "Stack catalog load failed: " + error;
            return false;
        }
    }

    LOG_INFO("[Runtime] Stack catalog ready (" << stack_catalog_->stack_count() << " stack(s))");
    return true;
}

bool Runtime::init_registry(std::string &error) {
    entity_factory_ = std::make_unique<registry::EntityFactory>(*store_);
    registry_ = std::make_unique<registry::ClusterRegistry>(registry::RegistryStores{*store_, *store_, *store_},
                                                            *entity_factory_, *stack_catalog_);

    if (config_.registry.eager_load) {
        common::Status status = registry_->load();
        if (!status.ok()) {
            error = "Registry hydration failed: " + status.message;
            return false;
        }
    }
    return true;
}

}  // namespace runtime
}  // namespace corral
