#include "hexball/core/constants.hpp"

namespace SimulatorConstants {

    const double Pi = 3.14159265358979323846;

    // Display
    const unsigned int ScreenWidth    = 800;
    const unsigned int ScreenHeight   = 600;
    const unsigned int FrameRateLimit = 60;
    const std::string WindowTitle = "Bouncing Ball in a Rotating Hexagon";
    const std::string BannerText  = "Ball bouncing inside a spinning hexagon";

    const char* const FontPaths[] = {
        "assets/fonts/arial.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
    const unsigned int FontPathCount = sizeof(FontPaths) / sizeof(FontPaths[0]);

} // namespace SimulatorConstants
