#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "hexball/core/profile.hpp"

using Profiling::Profiler;

class ProfilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Profiler::reset();
    }

    void TearDown() override {
        Profiler::reset();
    }
};

TEST_F(ProfilerTest, UnknownSectionHasNoCalls) {
    auto s = Profiler::stats("never-entered");
    EXPECT_EQ(s.calls, 0u);
    EXPECT_EQ(s.total.count(), 0);
}

TEST_F(ProfilerTest, NestedScopesRecordCallsAndParent) {
    {
        PROFILE_SCOPE("tick");
        {
            PROFILE_SCOPE("collision");
        }
        {
            PROFILE_SCOPE("collision");
        }
    }

    auto tick = Profiler::stats("tick");
    auto collision = Profiler::stats("collision");
    EXPECT_EQ(tick.calls, 1u);
    EXPECT_EQ(collision.calls, 2u);
    EXPECT_TRUE(tick.parent.empty());
    EXPECT_EQ(collision.parent, "tick");
    EXPECT_LE(collision.min, collision.max);
    EXPECT_GE(tick.total, collision.total);
}

TEST_F(ProfilerTest, MismatchedEndSectionIsIgnored) {
    Profiler::startSection("outer");
    Profiler::endSection("other");
    EXPECT_EQ(Profiler::stats("outer").calls, 0u);

    Profiler::endSection("outer");
    EXPECT_EQ(Profiler::stats("outer").calls, 1u);
}

TEST_F(ProfilerTest, PrintStatsIndentsChildren) {
    {
        PROFILE_SCOPE("step");
        PROFILE_SCOPE("gravity");
    }

    std::ostringstream out;
    Profiler::printStats(out);
    std::string const text = out.str();

    EXPECT_NE(text.find("- step [1 calls]"), std::string::npos);
    EXPECT_NE(text.find("  - gravity [1 calls]"), std::string::npos);
}

TEST_F(ProfilerTest, ResetForgetsEverySection) {
    {
        PROFILE_SCOPE("step");
    }
    ASSERT_EQ(Profiler::stats("step").calls, 1u);

    Profiler::reset();

    EXPECT_EQ(Profiler::stats("step").calls, 0u);
}
