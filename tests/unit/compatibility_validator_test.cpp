#include "registry/compatibility_validator.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks/mock_stack_metadata.hpp"
#include "mocks/mock_stores.hpp"

using namespace corral;
using namespace testing;
using namespace corral::tests;

class CompatibilityValidatorTest : public Test {
protected:
    CompatibilityValidatorTest()
        : cluster(ClusterRecord{1, "c1", state::encode_stack_id({"HDP", "1.3.0"})}, cluster_store),
          host(HostRecord{"h1", "centos6", {}, {}}, false),
          validator(stacks) {}

    NiceMock<MockClusterStore> cluster_store;
    StrictMock<MockStackMetadata> stacks;
    state::Cluster cluster;
    state::Host host;
    registry::CompatibilityValidator validator;
};

TEST_F(CompatibilityValidatorTest, SupportedOsType) {
    stack::RepositoryMap repos;
    repos["centos6"].push_back({"centos6", "HDP-1.3.0", "HDP", "http://a"});
    EXPECT_CALL(stacks, get_repositories("HDP", "1.3.0")).WillOnce(Return(repos));

    EXPECT_TRUE(validator.check(cluster, host).ok());
}

TEST_F(CompatibilityValidatorTest, UnsupportedOsType) {
    stack::RepositoryMap repos;
    repos["suse11"].push_back({"suse11", "HDP-1.3.0", "HDP", "http://a"});
    EXPECT_CALL(stacks, get_repositories("HDP", "1.3.0")).WillRepeatedly(Return(repos));

    auto status = validator.check(cluster, host);
    EXPECT_EQ(status.code, common::StatusCode::INCOMPATIBLE);
    EXPECT_NE(status.message.find("clusterName=c1"), std::string::npos);
    EXPECT_NE(status.message.find("clusterStackId=HDP-1.3.0"), std::string::npos);
    EXPECT_NE(status.message.find("hostOsType=centos6"), std::string::npos);
}

TEST_F(CompatibilityValidatorTest, EmptyRepositoryMapSupportsNothing) {
    EXPECT_CALL(stacks, get_repositories(_, _)).WillOnce(Return(stack::RepositoryMap{}));
    EXPECT_FALSE(validator.is_os_supported(cluster, host));
}

TEST_F(CompatibilityValidatorTest, ClusterWithoutStackSupportsNothing) {
    state::Cluster bare(ClusterRecord{2, "bare", ""}, cluster_store);
    EXPECT_CALL(stacks, get_repositories("", "")).WillOnce(Return(stack::RepositoryMap{}));
    EXPECT_FALSE(validator.is_os_supported(bare, host));
}
