/**
 * @file main.cpp
 * @brief Entry point: opens the window and runs the rotating hexagon scenario.
 */

#include <iostream>

#include "hexball/core/profile.hpp"
#include "hexball/core/sim_manager.hpp"

int main() {
    {
        PROFILE_SCOPE("main");

        SimManager simManager;
        if (!simManager.init()) {
            return 1;
        }
        simManager.run();
    }

    Profiling::Profiler::printStats(std::cout);
    return 0;
}
