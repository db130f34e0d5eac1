#include "json_file_store.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

#include "logging/logger.hpp"

namespace corral {
namespace persistence {

namespace fs = std::filesystem;
using common::Status;

JsonFileStore::JsonFileStore(std::string path) : path_(std::move(path)) {}

common::Status JsonFileStore::open() {
    if (!fs::exists(path_)) {
        LOG_INFO("[Store] " << path_ << " does not exist, starting empty");
        return Status::Ok();
    }

    State state;
    try {
        std::ifstream in(path_);
        if (!in) {
            return Status::Internal("Cannot open store file: " + path_);
        }
        nlohmann::json doc = nlohmann::json::parse(in);

        state.next_cluster_id = doc.value("next_cluster_id", static_cast<int64_t>(1));

        // Row uniqueness is enforced on write; a hand-edited file may break it
        std::set<std::string> cluster_names;

        for (const auto &row : doc.value("clusters", nlohmann::json::array())) {
            ClusterRecord record;
            record.cluster_id = row.at("cluster_id").get<int64_t>();
            record.cluster_name = row.at("cluster_name").get<std::string>();
            record.desired_stack = row.value("desired_stack", std::string());
            if (state.clusters.count(record.cluster_id) > 0) {
                return Status::Internal("Store file " + path_ + " is not valid: duplicate cluster id " +
                                        std::to_string(record.cluster_id));
            }
            if (!cluster_names.insert(record.cluster_name).second) {
                return Status::Internal("Store file " + path_ + " is not valid: duplicate cluster name " +
                                        record.cluster_name);
            }
            if (record.cluster_id >= state.next_cluster_id) {
                state.next_cluster_id = record.cluster_id + 1;
            }
            state.clusters[record.cluster_id] = record;
        }

        for (const auto &row : doc.value("hosts", nlohmann::json::array())) {
            HostRecord record;
            record.host_name = row.at("host_name").get<std::string>();
            record.os_type = row.value("os_type", std::string());
            if (row.contains("attributes")) {
                record.attributes = row.at("attributes").get<std::map<std::string, std::string>>();
            }
            for (const auto &id : row.value("cluster_ids", nlohmann::json::array())) {
                int64_t cluster_id = id.get<int64_t>();
                if (state.clusters.count(cluster_id) == 0) {
                    LOG_WARN("[Store] Host " << record.host_name << " references unknown cluster id=" << cluster_id
                                             << ", dropping membership");
                    continue;
                }
                record.cluster_ids.insert(cluster_id);
            }
            if (!state.hosts.emplace(record.host_name, record).second) {
                return Status::Internal("Store file " + path_ + " is not valid: duplicate host name " +
                                        record.host_name);
            }
        }
    } catch (const std::exception &e) {
        return Status::Internal("Store file " + path_ + " is not valid: " + e.what());
    }

    LOG_INFO("[Store] Loaded " << state.clusters.size() << " cluster(s) and " << state.hosts.size()
                               << " host(s) from " << path_);
    reset_state(std::move(state));
    return Status::Ok();
}

common::Status JsonFileStore::commit(const State &next) {
    nlohmann::json doc;
    doc["next_cluster_id"] = next.next_cluster_id;

    doc["clusters"] = nlohmann::json::array();
    for (const auto &[id, record] : next.clusters) {
        doc["clusters"].push_back({{"cluster_id", record.cluster_id},
                                   {"cluster_name", record.cluster_name},
                                   {"desired_stack", record.desired_stack}});
    }

    doc["hosts"] = nlohmann::json::array();
    for (const auto &[name, record] : next.hosts) {
        doc["hosts"].push_back({{"host_name", record.host_name},
                                {"os_type", record.os_type},
                                {"attributes", record.attributes},
                                {"cluster_ids", record.cluster_ids}});
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            return Status::Internal("Cannot write store file: " + tmp_path);
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            return Status::Internal("Short write to store file: " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        std::remove(tmp_path.c_str());
        return Status::Internal("Cannot replace store file " + path_ + ": " + ec.message());
    }
    return Status::Ok();
}

}  // namespace persistence
}  // namespace corral
