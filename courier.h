#pragma once

// ============================================================================
// Courier Core Header
// ============================================================================
// Common includes and process-wide flags shared by the responder and the
// messenger. Include this in all .cpp files to get access to:
// - Global debug flags
// - Common logging facilities
// - Standard library headers used throughout the codebase
// ============================================================================

// Standard library headers (used in 50%+ of source files)
#include <string>
#include <iostream>
#include <vector>
#include <map>
#include <memory>
#include <chrono>

// Core Courier headers
#include "logger.h"
#include "debug.h"

// ============================================================================
// Global System Flags
// ============================================================================
// Defined in main.cpp (and tests/test_stubs.cpp for the unit tests)

// Debug level (0=off, 1-9=increasing verbosity) - used by dprintf() macro
extern int g_debug_level;

// ============================================================================
// Common Utilities
// ============================================================================

namespace courier {
    // Current UTC time as ISO-8601 with microseconds, e.g. 2024-02-04T12:00:00.000000+00:00
    std::string iso8601_now();

    // Round to a fixed number of decimal places (half away from zero)
    double round_to(double value, int decimals);
}
