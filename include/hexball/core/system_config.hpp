#pragma once

#include <vector>
#include "hexball/systems/systems.hpp"

/**
 * @enum ContactMode
 * @brief How the collision system treats the polygon's corners.
 */
enum class ContactMode {
    /// Each edge is checked, then each of its two endpoints as a point
    /// contact. A corner can be resolved several times in one frame.
    EdgeAndEndpoints,
    /// One contact per tick: the closest edge or corner over the whole
    /// polygon. A corner hit counts as a vertex contact.
    NearestFeature,
};

/**
 * @struct SystemConfig
 * @brief Holds all physics configuration parameters for the simulation.
 *
 * Fixed once a scenario is loaded.
 */
struct SystemConfig {
    double Gravity = 400.0;          ///< Downward acceleration, pixels/s^2
    double Damping = 0.1;            ///< Fraction of velocity removed per second
    double Restitution = 0.9;        ///< Fraction of closing speed kept on a bounce
    double ContactMargin = 0.1;      ///< Extra push-out after penetration correction, pixels

    bool ClampDampingFactor = false; ///< Clamp (1 - d*dt) to [0,1]
    ContactMode Contacts = ContactMode::EdgeAndEndpoints;

    std::vector<Systems::SystemType> activeSystems;
};
