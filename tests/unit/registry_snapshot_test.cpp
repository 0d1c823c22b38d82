#include "registry/registry_snapshot.hpp"
#include "test_balancer_utils.hpp"

#include <gtest/gtest.h>

#include <limits>

using testutils::MakeBackend;
using testutils::Snapshot;
using zonelb::common::StatusCode;

TEST(RegistrySnapshotTest, KeepsBackendOrder) {
    auto snapshot = Snapshot::Create({MakeBackend("x", "b"), MakeBackend("y", "a"), MakeBackend("z", "b", 2.5)});
    ASSERT_TRUE(snapshot.IsOk()) << snapshot.GetStatus().Message();

    const auto& backends = snapshot.Value()->Backends();
    ASSERT_EQ(backends.size(), 3u);
    EXPECT_EQ(backends[0].id, "x");
    EXPECT_EQ(backends[1].id, "y");
    EXPECT_EQ(backends[2].id, "z");
    EXPECT_DOUBLE_EQ(backends[2].capacity, 2.5);
}

TEST(RegistrySnapshotTest, FindById) {
    auto snapshot = testutils::MakeSnapshot({MakeBackend("x", "b"), MakeBackend("y", "a")});
    ASSERT_NE(snapshot, nullptr);

    const auto* found = snapshot->Find("y");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->zone, "a");
    EXPECT_EQ(snapshot->Find("missing"), nullptr);
}

TEST(RegistrySnapshotTest, RejectsEmptyRegistry) {
    auto snapshot = Snapshot::Create({});
    EXPECT_FALSE(snapshot.IsOk());
    EXPECT_EQ(snapshot.GetStatus().Code(), StatusCode::kFailedPrecondition);
}

TEST(RegistrySnapshotTest, RejectsNonPositiveCapacity) {
    auto zero = Snapshot::Create({MakeBackend("x", "a"), MakeBackend("y", "a", 0.0)});
    EXPECT_FALSE(zero.IsOk());
    EXPECT_EQ(zero.GetStatus().Code(), StatusCode::kInvalidArgument);

    auto negative = Snapshot::Create({MakeBackend("x", "a", -1.0)});
    EXPECT_FALSE(negative.IsOk());
    EXPECT_EQ(negative.GetStatus().Code(), StatusCode::kInvalidArgument);

    auto nan = Snapshot::Create({MakeBackend("x", "a", std::numeric_limits<double>::quiet_NaN())});
    EXPECT_FALSE(nan.IsOk());
    EXPECT_EQ(nan.GetStatus().Code(), StatusCode::kInvalidArgument);
}

TEST(RegistrySnapshotTest, RejectsDuplicateIds) {
    auto snapshot = Snapshot::Create({MakeBackend("x", "a"), MakeBackend("x", "b")});
    EXPECT_FALSE(snapshot.IsOk());
    EXPECT_EQ(snapshot.GetStatus().Code(), StatusCode::kAlreadyExists);
}
