// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_CORE_PROTOCOL_CONFIG_H
#define CONTINUITY_CORE_PROTOCOL_CONFIG_H

#include <aggregation/hierarchy.h>
#include <prover/prover.h>
#include <util/logging.h>
#include <vdf/memory_hard_vdf.h>
#include <verifier/proof_verifier.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class CConfigParser;

namespace Continuity {

/**
 * Node-local tunables read from continuity.conf / CONTINUITY_* variables.
 *
 * Keys:
 *   vdfiterations=<n>       VDF rounds per proof
 *   vdfminiterations=<n>    Fewest rounds the verifier accepts (consensus: 1000000)
 *   vdfmemorymb=<n>         VDF scratch buffer in MiB (consensus: 64)
 *   workers=<n>             Proving threads
 *   chainspergroup=<n>      Aggregation group capacity
 *   groupsperregion=<n>     Aggregation region capacity
 *   printtoconsole=<bool>   Echo log lines to stderr
 *   loglevel=<level>        error, warn, info, debug
 *   logfile=<path>          Log file (bare names go in the data dir)
 *   logmaxsizemb=<n>        Rotate the log file at this size
 *   logmaxfiles=<n>         Rotated log files kept
 *   debug=<cat>[,<cat>]     Restrict logging to these categories
 */
class CProtocolConfig {
public:
    uint64_t vdfIterations;
    uint64_t vdfMinIterations;
    uint64_t vdfMemoryBytes;
    size_t workers;
    uint32_t chainsPerGroup;
    uint32_t groupsPerRegion;
    bool printToConsole;
    LogLevel logLevel;
    std::string logFile;
    uint64_t logMaxSizeMb;
    uint64_t logMaxFiles;
    std::vector<LogCategory> debugCategories;  // Empty = all

    CProtocolConfig();

    /**
     * Read and validate every key. Unset keys keep their current value.
     * @return false (with error set) on an out-of-range or unknown value
     */
    bool Load(const CConfigParser& parser, std::string& error);

    vdf::VDFConfig GetVDFConfig() const;
    HierarchyConfig GetHierarchyConfig() const;
    ProverConfig GetProverConfig() const;
    VerifierConfig GetVerifierConfig() const;

    /** Push level, categories, log file and rotation into CLoggingConfig and open the log. */
    bool ApplyLogging(const std::string& datadir) const;
};

} // namespace Continuity

#endif // CONTINUITY_CORE_PROTOCOL_CONFIG_H
