#pragma once

#include <iostream>

// Set to 1 (e.g. -DHEXBALL_ENABLE_DEBUG=1) to enable debug output
#ifndef HEXBALL_ENABLE_DEBUG
#define HEXBALL_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level (e.g. -DHEXBALL_DEBUG_LEVEL=1 for BASIC only)
#ifndef HEXBALL_DEBUG_LEVEL
#define HEXBALL_DEBUG_LEVEL DEBUG_LEVEL_VERBOSE
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (HEXBALL_ENABLE_DEBUG && level <= HEXBALL_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)
