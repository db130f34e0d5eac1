#include "persistence/memory_store.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

using namespace corral;
using namespace corral::persistence;
using namespace testing;
using corral::common::StatusCode;

class MemoryStoreTest : public Test {
protected:
    ClusterRecord make_cluster(const std::string &name) {
        ClusterRecord record;
        record.cluster_name = name;
        EXPECT_TRUE(store.create(record).ok());
        return record;
    }

    MemoryStore store;
};

TEST_F(MemoryStoreTest, ClusterIdsAreAssignedInOrder) {
    auto c1 = make_cluster("c1");
    auto c2 = make_cluster("c2");
    EXPECT_EQ(c1.cluster_id, 1);
    EXPECT_EQ(c2.cluster_id, 2);

    std::vector<ClusterRecord> rows;
    ASSERT_TRUE(store.find_all(rows).ok());
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].cluster_name, "c1");
    EXPECT_EQ(rows[1].cluster_name, "c2");
}

TEST_F(MemoryStoreTest, DuplicateClusterNameIsUniquenessViolation) {
    make_cluster("c1");
    ClusterRecord dup;
    dup.cluster_name = "c1";
    auto status = store.create(dup);
    EXPECT_EQ(status.code, StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(dup.cluster_id, 0);
    EXPECT_EQ(store.cluster_row_count(), 1u);
}

TEST_F(MemoryStoreTest, IdsAreNotReusedAfterRemove) {
    auto c1 = make_cluster("c1");
    ASSERT_TRUE(store.remove(c1.cluster_id).ok());
    auto c2 = make_cluster("c1");
    EXPECT_EQ(c2.cluster_id, 2);
}

TEST_F(MemoryStoreTest, UpdateCluster) {
    auto c1 = make_cluster("c1");
    make_cluster("c2");

    c1.cluster_name = "renamed";
    ASSERT_TRUE(store.update(c1).ok());

    ClusterRecord row;
    ASSERT_TRUE(store.find_by_id(c1.cluster_id, row).ok());
    EXPECT_EQ(row.cluster_name, "renamed");

    c1.cluster_name = "c2";
    EXPECT_EQ(store.update(c1).code, StatusCode::ALREADY_EXISTS);

    ClusterRecord missing{99, "x", ""};
    EXPECT_EQ(store.update(missing).code, StatusCode::NOT_FOUND);
    EXPECT_EQ(store.find_by_id(99, row).code, StatusCode::NOT_FOUND);
}

TEST_F(MemoryStoreTest, HostsAndMappings) {
    auto c1 = make_cluster("c1");
    ASSERT_TRUE(store.create(HostRecord{"h1", "centos6", {}, {}}).ok());
    EXPECT_EQ(store.create(HostRecord{"h1", "centos6", {}, {}}).code, StatusCode::ALREADY_EXISTS);

    ASSERT_TRUE(store.add_mapping("h1", c1.cluster_id).ok());
    EXPECT_EQ(store.add_mapping("h1", c1.cluster_id).code, StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(store.add_mapping("h2", c1.cluster_id).code, StatusCode::NOT_FOUND);
    EXPECT_EQ(store.add_mapping("h1", 42).code, StatusCode::NOT_FOUND);

    HostRecord row;
    ASSERT_TRUE(store.find_by_name("h1", row).ok());
    EXPECT_THAT(row.cluster_ids, ElementsAre(c1.cluster_id));
}

TEST_F(MemoryStoreTest, HostUpdateKeepsMemberships) {
    auto c1 = make_cluster("c1");
    ASSERT_TRUE(store.create(HostRecord{"h1", "centos6", {}, {}}).ok());
    ASSERT_TRUE(store.add_mapping("h1", c1.cluster_id).ok());

    ASSERT_TRUE(store.update(HostRecord{"h1", "centos7", {{"rack", "r1"}}, {}}).ok());

    HostRecord row;
    ASSERT_TRUE(store.find_by_name("h1", row).ok());
    EXPECT_EQ(row.os_type, "centos7");
    EXPECT_EQ(row.attributes.at("rack"), "r1");
    EXPECT_THAT(row.cluster_ids, ElementsAre(c1.cluster_id));

    EXPECT_EQ(store.update(HostRecord{"nope", "", {}, {}}).code, StatusCode::NOT_FOUND);
}

TEST_F(MemoryStoreTest, RemoveClusterCascadesToMemberships) {
    auto c1 = make_cluster("c1");
    auto c2 = make_cluster("c2");
    ASSERT_TRUE(store.create(HostRecord{"h1", "centos6", {}, {}}).ok());
    ASSERT_TRUE(store.add_mapping("h1", c1.cluster_id).ok());
    ASSERT_TRUE(store.add_mapping("h1", c2.cluster_id).ok());

    ASSERT_TRUE(store.remove(c1.cluster_id).ok());
    EXPECT_EQ(store.remove(c1.cluster_id).code, StatusCode::NOT_FOUND);

    HostRecord row;
    ASSERT_TRUE(store.find_by_name("h1", row).ok());
    EXPECT_THAT(row.cluster_ids, ElementsAre(c2.cluster_id));
}

TEST_F(MemoryStoreTest, HostCreateRejectsUnknownClusterReference) {
    EXPECT_EQ(store.create(HostRecord{"h1", "centos6", {}, {7}}).code, StatusCode::NOT_FOUND);
    EXPECT_EQ(store.host_row_count(), 0u);
}

TEST_F(MemoryStoreTest, ConcurrentCreatesAssignUniqueIds) {
    constexpr int num_threads = 16;
    std::vector<std::thread> threads;
    std::vector<int64_t> ids(num_threads, 0);

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i]() {
            ClusterRecord record;
            record.cluster_name = "c" + std::to_string(i);
            if (store.create(record).ok()) {
                ids[i] = record.cluster_id;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    std::set<int64_t> unique(ids.begin(), ids.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(num_threads));
    EXPECT_EQ(unique.count(0), 0u);
    EXPECT_EQ(store.cluster_row_count(), static_cast<size_t>(num_threads));
}
