// File: include/jade/version.hpp
// Purpose: Project version constants shared by tools.
// Key invariants: Matches the version declared in CMakeLists.txt.
// Ownership/Lifetime: Constants only.
// Links: docs/codemap.md
#pragma once

#define JADE_VERSION_MAJOR 0
#define JADE_VERSION_MINOR 3
#define JADE_VERSION_PATCH 0
#define JADE_VERSION_STR "0.3.0"

/// @brief Listing format version accepted by the loader ("jbc 1").
#define JADE_JBC_FORMAT_VERSION 1
