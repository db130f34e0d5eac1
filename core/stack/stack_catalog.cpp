#include "stack_catalog.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <sstream>

#include "logging/logger.hpp"

namespace corral {
namespace stack {

RepositoryMap StackCatalog::get_repositories(const std::string &stack_name, const std::string &stack_version) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = stacks_.find(Key(stack_name, stack_version));
    if (it == stacks_.end()) {
        return {};
    }
    return it->second;
}

void StackCatalog::add_repository(const std::string &stack_name, const std::string &stack_version,
                                  const RepositoryInfo &repo) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    stacks_[Key(stack_name, stack_version)][repo.os_type].push_back(repo);
}

bool StackCatalog::load_file(const std::string &path, std::string &error) {
    std::ifstream in(path);
    if (!in) {
        error = "Cannot open stack catalog: " + path;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    if (!load_json(buffer.str(), error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

bool StackCatalog::load_json(const std::string &json_text, std::string &error) {
    std::map<Key, RepositoryMap> parsed;

    try {
        nlohmann::json doc = nlohmann::json::parse(json_text);
        if (!doc.contains("stacks") || !doc["stacks"].is_array()) {
            error = "Stack catalog must contain a 'stacks' array";
            return false;
        }

        for (const auto &stack_node : doc["stacks"]) {
            std::string name = stack_node.at("name").get<std::string>();
            std::string version = stack_node.at("version").get<std::string>();
            if (name.empty() || version.empty()) {
                error = "Stack entry missing name or version";
                return false;
            }

            auto &repos = parsed[Key(name, version)];
            for (const auto &repo_node : stack_node.value("repositories", nlohmann::json::array())) {
                RepositoryInfo repo;
                repo.os_type = repo_node.at("os_type").get<std::string>();
                repo.repo_id = repo_node.value("repo_id", std::string());
                repo.repo_name = repo_node.value("repo_name", std::string());
                repo.base_url = repo_node.value("base_url", std::string());
                if (repo.os_type.empty()) {
                    error = "Repository of stack " + name + "-" + version + " has an empty os_type";
                    return false;
                }
                repos[repo.os_type].push_back(repo);
            }
        }
    } catch (const std::exception &e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto &[key, repos] : parsed) {
        LOG_INFO("[Stack] Loaded " << key.first << "-" << key.second << " (" << repos.size() << " OS type(s))");
        stacks_[key] = std::move(repos);
    }
    return true;
}

size_t StackCatalog::stack_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return stacks_.size();
}

}  // namespace stack
}  // namespace corral
