// SPDX-License-Identifier: MIT

#include "bulkload/session.hpp"
#include "test_database.hpp"
#include <gtest/gtest.h>

namespace bulkload {
namespace {

using testing::BorrowedDatabase;
using testing::ScriptedDatabase;
using testing::run_sync;

TEST(VersionTest, ParsesComponents) {
    EXPECT_EQ(parse_version("3.40.1"), (Version{3, 40, 1}));
    EXPECT_EQ(parse_version("3.35"), (Version{3, 35, 0}));
    EXPECT_EQ(parse_version("3"), (Version{3, 0, 0}));
    EXPECT_EQ(parse_version("3.35rc1.2"), (Version{3, 35, 2}));
    EXPECT_EQ(parse_version(""), (Version{0, 0, 0}));
    EXPECT_EQ(parse_version("x.y.z"), (Version{0, 0, 0}));
}

TEST(VersionTest, ReturningThreshold) {
    EXPECT_LT(parse_version("3.34.1"), kMinReturningVersion);
    EXPECT_GE(parse_version("3.35.0"), kMinReturningVersion);
    EXPECT_GE(parse_version("4.0.0"), kMinReturningVersion);
    EXPECT_LT(parse_version("3.9.99"), kMinReturningVersion);
}

TEST(DetectReturningTest, ComparesReportedVersion) {
    ScriptedDatabase db;
    db.version = "3.35.5";
    EXPECT_TRUE(run_sync(detect_returning_support(db)));
    db.version = "3.31.1";
    EXPECT_FALSE(run_sync(detect_returning_support(db)));
    db.version = "garbage";
    EXPECT_FALSE(run_sync(detect_returning_support(db)));
}

TEST(DetectReturningTest, QueryFailureMeansUnsupported) {
    ScriptedDatabase db;
    db.fail_version_query = true;
    EXPECT_FALSE(run_sync(detect_returning_support(db)));
}

TEST(SessionTest, DetectionIsMemoized) {
    ScriptedDatabase db;
    Session session(std::make_unique<BorrowedDatabase>(db));

    EXPECT_FALSE(session.capability_known());
    EXPECT_TRUE(run_sync(session.supports_returning()));
    db.version = "3.20.0";
    EXPECT_TRUE(run_sync(session.supports_returning()));
    EXPECT_TRUE(session.capability_known());
    EXPECT_EQ(db.queries.size(), 1u);
}

TEST(SessionTest, CloseClearsCapabilityAndConnection) {
    ScriptedDatabase db;
    {
        Session session(std::make_unique<BorrowedDatabase>(db));
        run_sync(session.supports_returning());
        session.close();
        EXPECT_FALSE(session.capability_known());
        EXPECT_TRUE(db.closed);
    }
    EXPECT_TRUE(db.closed);
}

TEST(SessionTest, DestructorCloses) {
    ScriptedDatabase db;
    { Session session(std::make_unique<BorrowedDatabase>(db)); }
    EXPECT_TRUE(db.closed);
}

}  // namespace
}  // namespace bulkload
