#pragma once

#include <cstdint>

namespace Components {
    /**
     * @brief Singleton component describing the current step
     *
     * Systems read the step duration from here instead of taking it as a
     * parameter, so every system sees the same dt within one tick.
     */
    struct SimulatorState {
        double dt = 0.0;           ///< Duration of the step in progress (seconds)
        double timeScale = 1.0;    ///< Multiplier applied by the shell to wall-clock dt
        double elapsed = 0.0;      ///< Simulated seconds since the scenario was loaded
        uint64_t stepCount = 0;

        SimulatorState(double ts = 1.0)
            : timeScale(ts) {}
    };
}

namespace Components {
    /**
     * @brief Per-tick contact counters, stored next to SimulatorState
     *
     * Reset at the start of every tick by the simulator and filled in by the
     * container collision system.
     */
    struct ContactStats {
        int edgeContacts = 0;        ///< Resolved edge contacts
        int vertexContacts = 0;      ///< Resolved vertex contacts
        int separatingContacts = 0;  ///< Overlaps skipped because the ball was leaving the wall

        void reset() {
            edgeContacts = 0;
            vertexContacts = 0;
            separatingContacts = 0;
        }

        int resolved() const { return edgeContacts + vertexContacts; }
    };
}
