// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_CORE_VERSION_H
#define CONTINUITY_CORE_VERSION_H

// Version is supplied by the build system; don't hardcode here

#include <string>

/**
 * Get version string from build info
 * Returns format: "vX.Y.Z" or "dev" if not set
 */
std::string GetVersionString();

/**
 * Get full version info for display
 * Returns: "Continuity Prover vX.Y.Z" or "Continuity Prover (dev build - <date>)"
 */
std::string GetFullVersionString();

#endif // CONTINUITY_CORE_VERSION_H
