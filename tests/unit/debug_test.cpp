#include <gtest/gtest.h>
#include <string>

// Build this file with output on and the default level, whatever the
// library was configured with.
#undef HEXBALL_ENABLE_DEBUG
#undef HEXBALL_DEBUG_LEVEL
#define HEXBALL_ENABLE_DEBUG 1
#include "hexball/core/debug.hpp"

TEST(DebugMsgTest, DefaultLevelIsVerbose) {
    EXPECT_EQ(HEXBALL_DEBUG_LEVEL, DEBUG_LEVEL_VERBOSE);
}

TEST(DebugMsgTest, VerboseAndBasicMessagesPrint) {
    testing::internal::CaptureStdout();
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[ContainerCollision] edge=" << 1 << " vertex=" << 0 << "\n");
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "basic\n");
    std::string const out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[ContainerCollision] edge=1 vertex=0\nbasic\n");
}
