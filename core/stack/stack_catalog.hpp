#ifndef CORRAL_STACK_STACK_CATALOG_HPP
#define CORRAL_STACK_STACK_CATALOG_HPP

#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "i_stack_metadata.hpp"

namespace corral {
namespace stack {

/**
 * @brief Repository catalog keyed by (stack name, stack version)
 *
 * Populated programmatically or from a JSON file:
 *
 * {
 *   "stacks": [
 *     {"name": "HDP", "version": "1.3.0",
 *      "repositories": [{"os_type": "centos6", "repo_id": "HDP-1.3.0",
 *                        "repo_name": "HDP", "base_url": "http://..."}]}
 *   ]
 * }
 *
 * Thread Safety: reads use shared_lock, writes use unique_lock.
 */
class StackCatalog : public IStackMetadata {
public:
    StackCatalog() = default;

    StackCatalog(const StackCatalog &) = delete;
    StackCatalog &operator=(const StackCatalog &) = delete;

    RepositoryMap get_repositories(const std::string &stack_name, const std::string &stack_version) const override;

    void add_repository(const std::string &stack_name, const std::string &stack_version, const RepositoryInfo &repo);

    // Merges every stack in the file into the catalog
    bool load_file(const std::string &path, std::string &error);
    bool load_json(const std::string &json_text, std::string &error);

    size_t stack_count() const;

private:
    using Key = std::pair<std::string, std::string>;  // (name, version)

    mutable std::shared_mutex mutex_;
    std::map<Key, RepositoryMap> stacks_;
};

}  // namespace stack
}  // namespace corral

#endif  // CORRAL_STACK_STACK_CATALOG_HPP
