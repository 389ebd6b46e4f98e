/// @file test_chunk_size_advisor.cpp
/// Unit tests for chunk_size_advisor.hpp.

#include "chunk_size_advisor.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <sstream>

using namespace query_stream;
using namespace std::chrono_literals;

class ChunkSizeAdvisorTest : public ::testing::Test {
protected:
    ChunkSizeAdvisorTest()
        : advisor(out, [this] { return now; }) {
        advisor.setEnabled(true);
    }

    std::chrono::steady_clock::time_point now{std::chrono::hours(1)};
    std::ostringstream out;
    ChunkSizeAdvisor   advisor;
};

TEST_F(ChunkSizeAdvisorTest, QuietAtOrBelowThreshold) {
    EXPECT_FALSE(advisor.observe(false, ChunkSizeAdvisor::kResultThreshold));
    EXPECT_TRUE(out.str().empty());
}

TEST_F(ChunkSizeAdvisorTest, QuietWhenChunkSizeConfigured) {
    EXPECT_FALSE(advisor.observe(true, 50000));
    EXPECT_EQ(advisor.warningsIssued(), 0);
}

TEST_F(ChunkSizeAdvisorTest, WarnsAboveThreshold) {
    EXPECT_TRUE(advisor.observe(false, 1001));
    EXPECT_NE(out.str().find("[ChunkSizeAdvisor]"), std::string::npos);
    EXPECT_NE(out.str().find(ChunkSizeAdvisor::kDisableEnvVar), std::string::npos);
}

TEST_F(ChunkSizeAdvisorTest, RateLimitedToOncePerInterval) {
    EXPECT_TRUE(advisor.observe(false, 1001));
    EXPECT_FALSE(advisor.observe(false, 2000));

    now += 4min;
    EXPECT_FALSE(advisor.observe(false, 3000));

    now += 1min;
    EXPECT_TRUE(advisor.observe(false, 4000));
    EXPECT_EQ(advisor.warningsIssued(), 2);
}

TEST_F(ChunkSizeAdvisorTest, DisabledAdvisorIsSilent) {
    advisor.setEnabled(false);
    EXPECT_FALSE(advisor.observe(false, 5000));
    EXPECT_TRUE(out.str().empty());
}
