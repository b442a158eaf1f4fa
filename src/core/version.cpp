// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <core/version.h>

// These are set by the build system (CMakeLists.txt)
// If not defined, fall back to "dev"
#ifndef CONTINUITY_VERSION
#define CONTINUITY_VERSION "dev"
#endif

#ifndef CONTINUITY_BUILD_DATE
#define CONTINUITY_BUILD_DATE __DATE__
#endif

std::string GetVersionString() {
    return CONTINUITY_VERSION;
}

std::string GetFullVersionString() {
    std::string version = GetVersionString();
    if (version == "dev") {
        return "Continuity Prover (dev build - " + std::string(CONTINUITY_BUILD_DATE) + ")";
    }
    return "Continuity Prover " + version;
}
