// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <core/protocol_config.h>

#include <consensus/params.h>
#include <util/config.h>
#include <util/strencodings.h>

#include <algorithm>
#include <cstdint>
#include <thread>

namespace Continuity {

namespace {

const uint64_t MIB = 1024ULL * 1024ULL;

// Largest scratch buffer accepted from configuration (16 GiB)
const int64_t MAX_VDF_MEMORY_MB = 16 * 1024;

} // anonymous namespace

CProtocolConfig::CProtocolConfig()
    : vdfIterations(Consensus::VDF_DEFAULT_ITERATIONS),
      vdfMinIterations(Consensus::VDF_MIN_ITERATIONS),
      vdfMemoryBytes(Consensus::VDF_MEMORY_BYTES),
      workers(std::max(1u, std::thread::hardware_concurrency())),
      chainsPerGroup(Consensus::CHAINS_PER_GROUP),
      groupsPerRegion(Consensus::GROUPS_PER_REGION),
      printToConsole(true),
      logLevel(LogLevel::LVL_INFO),
      logMaxSizeMb(10),
      logMaxFiles(10)
{
}

bool CProtocolConfig::Load(const CConfigParser& parser, std::string& error) {
    int64_t iterations = parser.GetInt64("vdfiterations", static_cast<int64_t>(vdfIterations));
    if (iterations < 1) {
        error = strprintf("vdfiterations must be positive (got %lld)", (long long)iterations);
        return false;
    }

    int64_t minIterations = parser.GetInt64("vdfminiterations", static_cast<int64_t>(vdfMinIterations));
    if (minIterations < 1) {
        error = strprintf("vdfminiterations must be positive (got %lld)", (long long)minIterations);
        return false;
    }

    int64_t memoryMb = parser.GetInt64("vdfmemorymb", static_cast<int64_t>(vdfMemoryBytes / MIB));
    if (memoryMb < 1 || memoryMb > MAX_VDF_MEMORY_MB) {
        error = strprintf("vdfmemorymb must be between 1 and %lld (got %lld)",
                          (long long)MAX_VDF_MEMORY_MB, (long long)memoryMb);
        return false;
    }

    int64_t threads = parser.GetInt64("workers", static_cast<int64_t>(workers));
    if (threads < 1 || threads > 1024) {
        error = strprintf("workers must be between 1 and 1024 (got %lld)", (long long)threads);
        return false;
    }

    int64_t perGroup = parser.GetInt64("chainspergroup", chainsPerGroup);
    int64_t perRegion = parser.GetInt64("groupsperregion", groupsPerRegion);
    if (perGroup < 1 || perGroup > UINT32_MAX || perRegion < 1 || perRegion > UINT32_MAX) {
        error = "chainspergroup and groupsperregion must be positive";
        return false;
    }

    int64_t maxSizeMb = parser.GetInt64("logmaxsizemb", static_cast<int64_t>(logMaxSizeMb));
    int64_t maxFiles = parser.GetInt64("logmaxfiles", static_cast<int64_t>(logMaxFiles));
    if (maxSizeMb < 1 || maxFiles < 1 || maxFiles > 100) {
        error = "logmaxsizemb must be positive and logmaxfiles between 1 and 100";
        return false;
    }

    LogLevel level = logLevel;
    const std::string levelName = parser.GetString("loglevel");
    if (!levelName.empty() && !LogLevelFromString(levelName, level)) {
        error = "unknown loglevel: " + levelName;
        return false;
    }

    std::vector<LogCategory> categories;
    for (const std::string& name : parser.GetList("debug")) {
        LogCategory cat = LogCategoryFromString(name);
        if (cat == LogCategory::NONE) {
            error = "unknown debug category: " + name;
            return false;
        }
        categories.push_back(cat);
    }

    vdfIterations = static_cast<uint64_t>(iterations);
    vdfMinIterations = static_cast<uint64_t>(minIterations);
    vdfMemoryBytes = static_cast<uint64_t>(memoryMb) * MIB;
    workers = static_cast<size_t>(threads);
    chainsPerGroup = static_cast<uint32_t>(perGroup);
    groupsPerRegion = static_cast<uint32_t>(perRegion);
    printToConsole = parser.GetBool("printtoconsole", printToConsole);
    logLevel = level;
    logFile = parser.GetString("logfile", logFile);
    logMaxSizeMb = static_cast<uint64_t>(maxSizeMb);
    logMaxFiles = static_cast<uint64_t>(maxFiles);
    if (!categories.empty()) {
        debugCategories = categories;
    }

    if (vdfMemoryBytes != Consensus::VDF_MEMORY_BYTES) {
        LogPrintf(CONFIG, WARN, "vdfmemorymb=%lld differs from the consensus buffer size; "
                  "proofs will not verify on other nodes", (long long)memoryMb);
    }
    if (vdfIterations < vdfMinIterations) {
        LogPrintf(CONFIG, WARN, "vdfiterations=%llu is below the verifier minimum of %llu; "
                  "proofs will be rejected", (unsigned long long)vdfIterations,
                  (unsigned long long)vdfMinIterations);
    }
    LogPrintf(CONFIG, DEBUG, "Config: iterations=%llu memory=%lluMiB workers=%zu group=%u region=%u",
              (unsigned long long)vdfIterations, (unsigned long long)(vdfMemoryBytes / MIB),
              workers, chainsPerGroup, groupsPerRegion);
    return true;
}

vdf::VDFConfig CProtocolConfig::GetVDFConfig() const {
    vdf::VDFConfig config;
    config.memory_bytes = vdfMemoryBytes;
    return config;
}

HierarchyConfig CProtocolConfig::GetHierarchyConfig() const {
    HierarchyConfig config;
    config.chains_per_group = chainsPerGroup;
    config.groups_per_region = groupsPerRegion;
    return config;
}

ProverConfig CProtocolConfig::GetProverConfig() const {
    ProverConfig config;
    config.vdf = GetVDFConfig();
    config.vdf_iterations = vdfIterations;
    return config;
}

VerifierConfig CProtocolConfig::GetVerifierConfig() const {
    VerifierConfig config;
    config.vdf = GetVDFConfig();
    config.min_iterations = vdfMinIterations;
    return config;
}

bool CProtocolConfig::ApplyLogging(const std::string& datadir) const {
    CLoggingConfig& logging = CLoggingConfig::GetInstance();
    logging.SetLogLevel(logLevel);
    logging.SetConsoleLogging(printToConsole);

    if (!debugCategories.empty()) {
        logging.DisableCategory(LogCategory::ALL);
        for (LogCategory cat : debugCategories) {
            logging.EnableCategory(cat);
        }
    }

    if (!logFile.empty()) {
        logging.SetLogFile(logFile);
    }
    logging.SetMaxLogSize(static_cast<size_t>(logMaxSizeMb * MIB));
    logging.SetMaxLogFiles(static_cast<size_t>(logMaxFiles));
    return CLogger::GetInstance().Initialize(datadir);
}

} // namespace Continuity
