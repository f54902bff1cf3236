/**
 * @fileoverview sim_manager.hpp
 * @brief High-level controller for the window loop and keyboard input.
 */

#pragma once

#include "hexball/core/simulator.hpp"
#include "hexball/rendering/renderer.hpp"
#include "hexball/scenarios/rotating_hexagon.hpp"

/**
 * @class SimManager
 * @brief Orchestrates the main loop: events, one simulation step per frame, drawing.
 *
 * Keys: Escape quits, P pauses, Space steps one frame while paused,
 * R resets, 1/2/3 select 0.25x/0.5x/1x time scale.
 */
class SimManager {
 public:
  explicit SimManager(RotatingHexagonConfig config = RotatingHexagonConfig());

  /**
   * @brief Opens the window and loads the scenario.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window is closed or Escape is pressed.
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Steps the simulation by the scaled frame time (unless paused).
   * @param frameSeconds Wall-clock duration of the last frame.
   */
  void tick(double frameSeconds);

  /**
   * @brief Draws the scene and overlay text.
   * @param fps The current frames-per-second.
   */
  void render(float fps);

  void togglePause();
  void resetSimulator();
  void stepOnce();
  void setTimeScale(double multiplier);

  Renderer renderer;
  Simulator simulator;
  RotatingHexagonConfig scenarioConfig;

  bool running;
  bool paused;
  bool stepFrame;
};
