#ifndef HEXBALL_SIMULATOR_CONSTANTS_H
#define HEXBALL_SIMULATOR_CONSTANTS_H

#include <string>

namespace SimulatorConstants {

    // Truly global constants
    extern const double Pi;

    // Display constants
    extern const unsigned int ScreenWidth;
    extern const unsigned int ScreenHeight;
    extern const unsigned int FrameRateLimit;
    extern const std::string WindowTitle;
    extern const std::string BannerText;

    // Fonts tried in order by the renderer
    extern const char* const FontPaths[];
    extern const unsigned int FontPathCount;
}

#endif // HEXBALL_SIMULATOR_CONSTANTS_H
