#include "common/status.hpp"

#include <gtest/gtest.h>

using namespace corral::common;

TEST(StatusTest, DefaultIsOk) {
    Status status;
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.code, StatusCode::OK);
    EXPECT_EQ(status.to_string(), "OK");
}

TEST(StatusTest, FactoriesSetCode) {
    EXPECT_EQ(Status::NotFound("x").code, StatusCode::NOT_FOUND);
    EXPECT_EQ(Status::AlreadyExists("x").code, StatusCode::ALREADY_EXISTS);
    EXPECT_EQ(Status::Incompatible("x").code, StatusCode::INCOMPATIBLE);
    EXPECT_EQ(Status::FailedPrecondition("x").code, StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(Status::PersistenceFailure("x").code, StatusCode::PERSISTENCE_FAILURE);
    EXPECT_EQ(Status::InvalidArgument("x").code, StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(Status::Internal("x").code, StatusCode::INTERNAL);
    EXPECT_FALSE(Status::NotFound("x").ok());
}

TEST(StatusTest, ToStringIncludesMessage) {
    Status status = Status::NotFound("Cluster not found, clusterName=c1");
    EXPECT_EQ(status.to_string(), "NOT_FOUND: Cluster not found, clusterName=c1");
    EXPECT_EQ(status_code_to_string(StatusCode::PERSISTENCE_FAILURE), "PERSISTENCE_FAILURE");
}
