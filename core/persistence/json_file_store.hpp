#ifndef CORRAL_PERSISTENCE_JSON_FILE_STORE_HPP
#define CORRAL_PERSISTENCE_JSON_FILE_STORE_HPP

#include <string>

#include "memory_store.hpp"

namespace corral {
namespace persistence {

/**
 * @brief MemoryStore backed by a JSON document on disk
 *
 * open() loads the document (a missing file means an empty store). Every
 * successful write rewrites the whole document through a temp file and a
 * rename, so the file always holds the last committed state.
 *
 * Document layout:
 * {
 *   "next_cluster_id": 3,
 *   "clusters": [{"cluster_id": 1, "cluster_name": "c1", "desired_stack": "{...}"}],
 *   "hosts": [{"host_name": "h1", "os_type": "centos7", "attributes": {}, "cluster_ids": [1]}]
 * }
 */
class JsonFileStore : public MemoryStore {
public:
    explicit JsonFileStore(std::string path);

    common::Status open();

    const std::string &path() const { return path_; }

protected:
    common::Status commit(const State &next) override;

private:
    std::string path_;
};

}  // namespace persistence
}  // namespace corral

#endif  // CORRAL_PERSISTENCE_JSON_FILE_STORE_HPP
