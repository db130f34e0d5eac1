#ifndef CORRAL_PERSISTENCE_MEMORY_STORE_HPP
#define CORRAL_PERSISTENCE_MEMORY_STORE_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "i_cluster_host_store.hpp"
#include "i_cluster_store.hpp"
#include "i_host_store.hpp"

namespace corral {
namespace persistence {

/**
 * @brief In-process backing store for clusters, hosts and their join relation
 *
 * Thread Safety:
 * - Reads use shared_lock, writes use unique_lock
 * - Every write is applied to a copy of the state, handed to commit(), and only
 *   swapped in when commit() succeeds, so a failed write leaves no trace
 *
 * Cluster ids start at 1 and are never reused.
 */
class MemoryStore : public IClusterStore, public IHostStore, public IClusterHostStore {
public:
    MemoryStore() = default;
    virtual ~MemoryStore() = default;

    MemoryStore(const MemoryStore &) = delete;
    MemoryStore &operator=(const MemoryStore &) = delete;

    // IClusterStore
    common::Status create(ClusterRecord &record) override;
    common::Status find_all(std::vector<ClusterRecord> &records) const override;
    common::Status find_by_id(int64_t cluster_id, ClusterRecord &record) const override;
    common::Status update(const ClusterRecord &record) override;
    common::Status remove(int64_t cluster_id) override;

    // IHostStore
    common::Status create(const HostRecord &record) override;
    common::Status find_all(std::vector<HostRecord> &records) const override;
    common::Status find_by_name(const std::string &host_name, HostRecord &record) const override;
    common::Status update(const HostRecord &record) override;

    // IClusterHostStore
    common::Status add_mapping(const std::string &host_name, int64_t cluster_id) override;

    size_t cluster_row_count() const;
    size_t host_row_count() const;

protected:
    struct State {
        int64_t next_cluster_id = 1;
        std::map<int64_t, ClusterRecord> clusters;
        std::map<std::string, HostRecord> hosts;
    };

    // Durability hook, called under the write lock with the candidate state
    virtual common::Status commit(const State &next);

    // Replace the whole state (used when loading from durable storage)
    void reset_state(State state);

    mutable std::shared_mutex mutex_;

private:
    common::Status apply(const std::function<common::Status(State &)> &mutate);

    static bool cluster_name_taken(const State &state, const std::string &name, int64_t except_id);

    State state_;
};

}  // namespace persistence
}  // namespace corral

#endif  // CORRAL_PERSISTENCE_MEMORY_STORE_HPP
