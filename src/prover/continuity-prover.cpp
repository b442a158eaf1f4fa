// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * continuity-prover - prove possession of one file against a given block.
 *
 * Builds a storage commitment (entropy, chunk selection, memory-hard VDF),
 * verifies it the way a remote verifier would and prints the result.
 */

#include <aggregation/hierarchy.h>
#include <commitment/commitment.h>
#include <consensus/params.h>
#include <core/protocol_config.h>
#include <core/version.h>
#include <interfaces/blockchain_source.h>
#include <key.h>
#include <prover/prover.h>
#include <pubkey.h>
#include <selection/chunk_selector.h>
#include <storage/file_storage.h>
#include <uint256.h>
#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <vdf/memory_hard_vdf.h>
#include <verifier/proof_verifier.h>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_cancel{false};

void HandleSignal(int) {
    g_cancel.store(true);
}

/** Chain view pinned to one block supplied on the command line. */
class CStaticBlockchainSource : public IBlockchainSource {
public:
    CStaticBlockchainSource(uint64_t height, const uint256& hash) : m_height(height), m_hash(hash) {}

    uint64_t GetCurrentHeight() const override { return m_height; }

    bool GetBlockHash(uint64_t height, uint256& hash) const override {
        if (height != m_height) return false;
        hash = m_hash;
        return true;
    }

    std::vector<uint8_t> GetEntropySource() const override {
        return std::vector<uint8_t>(m_hash.begin(), m_hash.end());
    }

private:
    uint64_t m_height;
    uint256 m_hash;
};

class CStaticBeaconSource : public IBeaconSource {
public:
    explicit CStaticBeaconSource(const uint256& value) : m_value(value) {}

    std::optional<std::vector<uint8_t>> GetBeaconEntropy() const override {
        return std::vector<uint8_t>(m_value.begin(), m_value.end());
    }

private:
    uint256 m_value;
};

bool ParseUint64(const std::string& str, uint64_t& out) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = std::stoull(str);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

struct ProverArgs {
    std::string datadir;
    std::string conf;
    std::string file;
    std::string out;
    std::optional<uint256> blockhash;
    std::optional<uint256> beacon;
    std::optional<uint256> proverseed;
    uint64_t height = 0;
    std::string iterations;
    bool benchmark = false;
    uint64_t benchmark_rounds = 200'000;

    bool ParseHash(const std::string& arg, size_t prefix, std::optional<uint256>& target) {
        uint256 value;
        if (!value.SetHex(arg.substr(prefix))) {
            std::cerr << "Error: Expected 64 hex characters: " << arg << std::endl;
            return false;
        }
        target = value;
        return true;
    }

    bool ParseArgs(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg.find("--datadir=") == 0) {
                datadir = arg.substr(10);
            }
            else if (arg.find("--conf=") == 0) {
                conf = arg.substr(7);
            }
            else if (arg.find("--file=") == 0) {
                file = arg.substr(7);
            }
            else if (arg.find("--out=") == 0) {
                out = arg.substr(6);
            }
            else if (arg.find("--blockhash=") == 0) {
                if (!ParseHash(arg, 12, blockhash)) return false;
            }
            else if (arg.find("--beacon=") == 0) {
                if (!ParseHash(arg, 9, beacon)) return false;
            }
            else if (arg.find("--proverseed=") == 0) {
                if (!ParseHash(arg, 13, proverseed)) return false;
            }
            else if (arg.find("--height=") == 0) {
                if (!ParseUint64(arg.substr(9), height)) {
                    std::cerr << "Error: Invalid block height: " << arg << std::endl;
                    return false;
                }
            }
            else if (arg.find("--iterations=") == 0) {
                uint64_t n = 0;
                if (!ParseUint64(arg.substr(13), n) || n == 0) {
                    std::cerr << "Error: Invalid iteration count: " << arg << std::endl;
                    return false;
                }
                iterations = arg.substr(13);
            }
            else if (arg == "--benchmark") {
                benchmark = true;
            }
            else if (arg.find("--benchmark=") == 0) {
                benchmark = true;
                if (!ParseUint64(arg.substr(12), benchmark_rounds) || benchmark_rounds == 0) {
                    std::cerr << "Error: Invalid benchmark round count: " << arg << std::endl;
                    return false;
                }
            }
            else if (arg == "--version") {
                std::cout << GetFullVersionString() << std::endl;
                std::exit(0);
            }
            else if (arg == "--help" || arg == "-h") {
                return false;
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
        }

        if (!benchmark && (file.empty() || !blockhash)) {
            std::cerr << "Error: --file and --blockhash are required" << std::endl;
            return false;
        }
        return true;
    }

    void PrintUsage(const char* program) {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << std::endl;
        std::cout << "Usage: " << program << " --file=<path> --blockhash=<hex> [options]" << std::endl;
        std::cout << "       " << program << " --benchmark[=<rounds>]" << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --file=<path>         Data file to prove" << std::endl;
        std::cout << "  --blockhash=<hex>     Anchoring block hash (also the blockchain entropy)" << std::endl;
        std::cout << "  --height=<n>          Anchoring block height (default: 0)" << std::endl;
        std::cout << "  --beacon=<hex>        Optional beacon entropy" << std::endl;
        std::cout << "  --proverseed=<hex>    Ed25519 signing seed (default: random)" << std::endl;
        std::cout << "  --iterations=<n>      VDF rounds (overrides vdfiterations)" << std::endl;
        std::cout << "  --out=<path>          Write the serialized commitment as hex" << std::endl;
        std::cout << "  --benchmark[=<n>]     Measure VDF speed and suggest vdfiterations" << std::endl;
        std::cout << "  --datadir=<path>      Data directory (default: ~/.continuity)" << std::endl;
        std::cout << "  --conf=<path>         Configuration file (default: <datadir>/continuity.conf)" << std::endl;
        std::cout << "  --version             Print version" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
        std::cout << std::endl;
        std::cout << "Configuration:" << std::endl;
        std::cout << "  Keys: vdfiterations, vdfminiterations, vdfmemorymb, workers," << std::endl;
        std::cout << "        chainspergroup, groupsperregion, printtoconsole, loglevel, logfile," << std::endl;
        std::cout << "        logmaxsizemb, logmaxfiles, debug" << std::endl;
        std::cout << "  Environment variables: CONTINUITY_* (e.g., CONTINUITY_VDFITERATIONS=500000)" << std::endl;
        std::cout << "  Priority: Environment > Command-line > Config file > Default" << std::endl;
        std::cout << std::endl;
    }
};

int RunBenchmark(const Continuity::CProtocolConfig& config, uint64_t rounds) {
    std::cout << "Benchmarking " << rounds << " rounds over "
              << (config.vdfMemoryBytes / (1024 * 1024)) << " MiB..." << std::endl;

    const uint64_t ips = vdf::Benchmark(rounds, config.GetVDFConfig());
    if (ips == 0) {
        std::cerr << "ERROR: Benchmark failed" << std::endl;
        return 1;
    }
    const uint64_t suggested = vdf::CalculateIterations(Consensus::VDF_TARGET_SECONDS, ips);

    std::cout << "  Rounds/second:   " << ips << std::endl;
    std::cout << "  Target seconds:  " << Consensus::VDF_TARGET_SECONDS << std::endl;
    std::cout << "  Suggested:       vdfiterations=" << suggested << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    ProverArgs args;
    if (!args.ParseArgs(argc, argv)) {
        args.PrintUsage(argv[0]);
        return 1;
    }

    std::string datadir = args.datadir.empty() ? GetDefaultDataDir() : args.datadir;
    std::string config_file = args.conf.empty() ? GetConfigFilePath(datadir) : args.conf;

    CConfigParser config_parser;
    if (!config_parser.LoadConfigFile(config_file)) {
        std::cerr << "ERROR: Failed to load configuration file: " << config_file << std::endl;
        return 1;
    }
    if (!args.iterations.empty()) {
        config_parser.Set("vdfiterations", args.iterations);
    }

    Continuity::CProtocolConfig config;
    std::string error;
    if (!config.Load(config_parser, error)) {
        std::cerr << "ERROR: " << error << std::endl;
        return 1;
    }
    if (!config.ApplyLogging(datadir)) {
        std::cerr << "Warning: File logging disabled" << std::endl;
    }

    if (args.benchmark) {
        int rc = RunBenchmark(config, args.benchmark_rounds);
        CLogger::GetInstance().Shutdown();
        return rc;
    }

    CFileChunkStorage storage(args.file);
    if (!storage.IsOpen()) {
        std::cerr << "ERROR: Cannot open data file: " << args.file << std::endl;
        return 1;
    }

    CKey signingKey;
    if (args.proverseed) {
        signingKey.Set(args.proverseed->begin(), args.proverseed->end());
    } else if (!signingKey.MakeNewKey()) {
        std::cerr << "ERROR: Cannot generate prover key" << std::endl;
        return 1;
    }
    const CPubKey pubkey = signingKey.GetPubKey();
    if (!pubkey.IsValid()) {
        std::cerr << "ERROR: Cannot derive prover public key" << std::endl;
        return 1;
    }
    const uint256 proverKey = pubkey.GetKey();

    CStaticBlockchainSource blockchain(args.height, *args.blockhash);
    std::optional<CStaticBeaconSource> beacon;
    if (args.beacon) {
        beacon.emplace(*args.beacon);
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const uint64_t totalChunks = ChunkCountForSize(storage.GetFileSize(), Consensus::CHUNK_SIZE_BYTES);
    std::cout << "Proving " << args.file << " (" << storage.GetFileSize() << " bytes, "
              << totalChunks << " chunks) with " << config.vdfIterations << " VDF rounds" << std::endl;
    std::cout << "  Prover key: " << proverKey.GetHex() << std::endl;

    CStorageProver prover(signingKey, blockchain, storage, config.GetProverConfig(),
                          beacon ? &*beacon : nullptr);
    StorageCommitment commitment;
    ProverStatus status = prover.GenerateCommitment(commitment, error, &g_cancel);
    if (status != ProverStatus::OK) {
        std::cerr << "ERROR: " << ProverStatusToString(status) << ": " << error << std::endl;
        CLogger::GetInstance().Shutdown();
        return status == ProverStatus::CANCELLED ? 130 : 1;
    }

    std::cout << "Commitment: " << commitment.commitmentHash.GetHex() << std::endl;
    std::cout << "  Data hash:  " << commitment.dataHash.GetHex() << std::endl;
    std::cout << "  Entropy:    " << commitment.entropy.combinedHash.GetHex() << std::endl;
    std::cout << "  VDF output: " << commitment.vdfProof.outputState.GetHex()
              << " (" << commitment.vdfProof.computationTimeMs << " ms)" << std::endl;
    std::cout << "  Chunks:    ";
    for (uint64_t idx : commitment.selectedChunks) std::cout << " " << idx;
    std::cout << std::endl;

    // Verify as a remote verifier would
    CProofVerifier verifier(blockchain, config.GetVerifierConfig());
    VerificationResult result = verifier.VerifyFullProof(commitment, proverKey, totalChunks);
    bool chunksOk = VerifyChunkData(commitment, storage);
    std::cout << "Verification: " << result.ToString()
              << ", chunk data " << (chunksOk ? "matches" : "MISMATCH") << std::endl;

    // Single-chain rollup
    CHierarchicalNetworkManager manager(config.GetHierarchyConfig());
    InclusionProof inclusion;
    if (manager.RegisterChain(proverKey.GetHex(), commitment) == AggregationError::NONE &&
        manager.GetInclusionProof(proverKey.GetHex(), HierarchyLevel::GLOBAL, inclusion) == AggregationError::NONE) {
        std::cout << "Global root:  " << inclusion.aggregateRoot.GetHex() << " (compact proof "
                  << (verifier.VerifyCompactProof(inclusion, proverKey) ? "valid" : "INVALID") << ")" << std::endl;
    }

    if (!args.out.empty()) {
        std::ofstream out(args.out);
        out << HexStr(commitment.Serialize()) << std::endl;
        if (!out) {
            std::cerr << "ERROR: Cannot write " << args.out << std::endl;
            CLogger::GetInstance().Shutdown();
            return 1;
        }
        std::cout << "Wrote commitment to " << args.out << std::endl;
    }

    CLogger::GetInstance().Shutdown();
    return (result.valid && chunksOk) ? 0 : 2;
}
