#include "stack/stack_catalog.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace corral::stack;

TEST(StackCatalogTest, UnknownStackHasNoRepositories) {
    StackCatalog catalog;
    EXPECT_TRUE(catalog.get_repositories("HDP", "1.3.0").empty());
    EXPECT_TRUE(catalog.get_repositories("", "").empty());
}

TEST(StackCatalogTest, AddRepositoryGroupsByOsType) {
    StackCatalog catalog;
    catalog.add_repository("HDP", "1.3.0", {"centos6", "HDP-1.3.0", "HDP", "http://repo/centos6"});
    catalog.add_repository("HDP", "1.3.0", {"centos6", "HDP-UTILS", "HDP-UTILS", "http://repo/utils"});
    catalog.add_repository("HDP", "1.3.0", {"suse11", "HDP-1.3.0", "HDP", "http://repo/suse11"});

    auto repos = catalog.get_repositories("HDP", "1.3.0");
    ASSERT_EQ(repos.size(), 2u);
    EXPECT_EQ(repos["centos6"].size(), 2u);
    EXPECT_EQ(repos["suse11"].size(), 1u);
    EXPECT_TRUE(catalog.get_repositories("HDP", "2.0.0").empty());
    EXPECT_EQ(catalog.stack_count(), 1u);
}

TEST(StackCatalogTest, LoadJson) {
    StackCatalog catalog;
    std::string error;
    ASSERT_TRUE(catalog.load_json(R"({
  "stacks": [
    {"name": "HDP", "version": "1.3.0",
     "repositories": [
       {"os_type": "centos6", "repo_id": "HDP-1.3.0", "repo_name": "HDP", "base_url": "http://a"},
       {"os_type": "ubuntu12", "repo_id": "HDP-1.3.0", "repo_name": "HDP", "base_url": "http://b"}
     ]},
    {"name": "HDP", "version": "2.0.0", "repositories": []}
  ]
})",
                                  error))
        << error;

    EXPECT_EQ(catalog.stack_count(), 2u);
    auto repos = catalog.get_repositories("HDP", "1.3.0");
    ASSERT_EQ(repos.count("ubuntu12"), 1u);
    EXPECT_EQ(repos["ubuntu12"][0].base_url, "http://b");
    EXPECT_TRUE(catalog.get_repositories("HDP", "2.0.0").empty());
}

TEST(StackCatalogTest, LoadJsonRejectsBadDocuments) {
    StackCatalog catalog;
    std::string error;

    EXPECT_FALSE(catalog.load_json("{", error));
    EXPECT_NE(error.find("JSON parse error"), std::string::npos);

    EXPECT_FALSE(catalog.load_json(R"({"stack": []})", error));
    EXPECT_NE(error.find("'stacks'"), std::string::npos);

    EXPECT_FALSE(catalog.load_json(R"({"stacks": [{"name": "HDP"}]})", error));

    EXPECT_FALSE(catalog.load_json(
        R"({"stacks": [{"name": "HDP", "version": "1", "repositories": [{"os_type": ""}]}]})", error));
    EXPECT_NE(error.find("empty os_type"), std::string::npos);

    // Nothing partially applied
    EXPECT_EQ(catalog.stack_count(), 0u);
}

TEST(StackCatalogTest, LoadFile) {
    fs::path path = fs::temp_directory_path() / "corral_stack_catalog_test.json";
    {
        std::ofstream file(path);
        file << R"({"stacks": [{"name": "HDP", "version": "1.3.0",
                     "repositories": [{"os_type": "centos6"}]}]})";
    }

    StackCatalog catalog;
    std::string error;
    ASSERT_TRUE(catalog.load_file(path.string(), error)) << error;
    EXPECT_EQ(catalog.get_repositories("HDP", "1.3.0").count("centos6"), 1u);
    fs::remove(path);

    EXPECT_FALSE(catalog.load_file(path.string(), error));
    EXPECT_NE(error.find("Cannot open"), std::string::npos);
}
