/**
 * version.hpp - subforge version information
 */

#pragma once

// ============================================================================
// Version Information
// ============================================================================
#define SUBFORGE_VERSION "1.0.0"
#define SUBFORGE_MAJOR_VERSION 1
#define SUBFORGE_NAME "subforge"
