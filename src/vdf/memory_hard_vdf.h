// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Memory-Hard VDF (Verifiable Delay Function)
 *
 * Sequential hash chain over a large pseudo-random scratch buffer. Each round
 * reads a word at a state-dependent offset, folds it into the chain state and
 * overwrites it, so the whole buffer must stay resident for the duration of
 * the proof.
 *
 * Every round is committed as a leaf of a Merkle tree over the whole trace.
 * The checkpoint windows are drawn from the trace root after the run
 * (Fiat-Shamir), so a prover cannot know which rounds will be opened until
 * it has committed to all of them.
 *
 * Key properties:
 * - Sequential: round r depends on the state of round r-1
 * - Memory-hard: offsets are unpredictable until the previous round finishes
 * - Spot-checkable: verification replays a fixed number of opened windows,
 *   O(sampleCount * (sampleWindow + log N)) hashes regardless of N
 */

#ifndef CONTINUITY_VDF_MEMORY_HARD_VDF_H
#define CONTINUITY_VDF_MEMORY_HARD_VDF_H

#include <consensus/params.h>
#include <uint256.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class CByteReader;

namespace vdf {

// VDF configuration
struct VDFConfig {
    // Scratch buffer size; must be identical for prover and verifier
    uint64_t memory_bytes = Consensus::VDF_MEMORY_BYTES;

    // Checkpoint windows (at least two) and rounds recorded per window
    uint32_t sample_count = Consensus::VDF_SAMPLE_COUNT;
    uint32_t sample_window = Consensus::VDF_SAMPLE_WINDOW;

    // Rounds between checks of the cancellation flag
    uint64_t cancel_check_interval = Consensus::VDF_CANCEL_CHECK_INTERVAL;

    // Progress callback interval (0 = no callbacks)
    uint64_t progress_interval = 1'000'000;

    uint64_t WordCount() const { return memory_bytes / Consensus::VDF_WORD_SIZE; }
    uint64_t BufferBytes() const { return WordCount() * Consensus::VDF_WORD_SIZE; }
};

// One opened round: the memory access at `iteration`, the state entering it
// and the authentication path of its trace leaf (bottom-up siblings)
struct MemoryAccessSample {
    uint64_t iteration{0};
    uint64_t offset{0};
    uint256 value;
    uint256 stateBefore;
    std::vector<uint256> path;

    bool operator==(const MemoryAccessSample& other) const {
        return iteration == other.iteration && offset == other.offset &&
               value == other.value && stateBefore == other.stateBefore &&
               path == other.path;
    }
    bool operator!=(const MemoryAccessSample& other) const { return !(*this == other); }
};

// VDF proof
struct MemoryHardVDFProof {
    uint256 inputState;
    uint256 outputState;
    uint256 traceRoot;               // Merkle root over every round's leaf
    uint64_t iterations{0};
    std::vector<MemoryAccessSample> memoryAccessSamples;
    uint64_t computationTimeMs{0};   // Informational
    uint64_t memoryUsageBytes{0};

    // Serialize to bytes (for commitments and storage)
    void SerializeTo(std::vector<uint8_t>& out) const;
    std::vector<uint8_t> Serialize() const;

    static bool Unserialize(CByteReader& reader, MemoryHardVDFProof& out);
    static std::optional<MemoryHardVDFProof> Deserialize(const std::vector<uint8_t>& data);

    bool operator==(const MemoryHardVDFProof& other) const;
};

enum class VDFStatus {
    OK,
    ZERO_ITERATIONS,
    CANCELLED
};

// Reason a proof was rejected
enum class VDFError {
    NONE,
    ZERO_ITERATIONS,
    MEMORY_MISMATCH,
    MALFORMED_SAMPLES,
    TRACE_MISMATCH,
    CHECKPOINT_MISMATCH,
    OUTPUT_MISMATCH
};

const char* VDFStatusToString(VDFStatus status);
const char* VDFErrorToString(VDFError error);

// Progress callback type
using ProgressCallback = std::function<void(uint64_t current, uint64_t total)>;

/**
 * Compute a memory-hard VDF proof.
 *
 * @param input Initial chain state (see DeriveVDFInput)
 * @param iterations Number of sequential rounds
 * @param config Buffer size and checkpoint layout
 * @param proof Filled on VDFStatus::OK, untouched otherwise
 * @param cancel Optional cooperative cancellation flag
 * @param progress Optional progress callback
 * The chain is run twice: once to commit to the trace, once to open the
 * windows the trace root selects. Progress is reported for the first run.
 *
 * @throws std::invalid_argument if the configuration is unusable
 *         (fewer than two words, fewer than two windows, zero window,
 *         zero check interval)
 */
VDFStatus Prove(
    const uint256& input,
    uint64_t iterations,
    const VDFConfig& config,
    MemoryHardVDFProof& proof,
    const std::atomic<bool>* cancel = nullptr,
    ProgressCallback progress = nullptr
);

/**
 * Verify a proof by opening and replaying its checkpoint windows.
 *
 * Checks that every sample's leaf folds to traceRoot, that each window is a
 * consistent slice of the chain, that round 1 starts from inputState and that
 * outputState = SHA3-256(finalState || traceRoot || LE64(N)).
 * Never throws on a malformed proof.
 */
VDFError VerifyDetailed(const MemoryHardVDFProof& proof, const VDFConfig& config);

inline bool Verify(const MemoryHardVDFProof& proof, const VDFConfig& config) {
    return VerifyDetailed(proof, config) == VDFError::NONE;
}

/**
 * First round of each checkpoint window, in window order.
 *
 * window 0 starts at round 1 and window K-1 at N - w' + 1, with
 * w' = min(sample_window, N). Window 0 < k < K-1 starts at
 *   1 + LE64(SHA3-256(input || traceRoot || "checkpoint" || LE32(k))) mod (N - w' + 1)
 */
std::vector<uint64_t> CheckpointWindowStarts(const uint256& input, const uint256& traceRoot,
                                             uint64_t iterations, const VDFConfig& config);

/** leaf = SHA3-256(0x00 || LE64(iteration) || stateBefore || value) */
uint256 TraceLeafHash(const MemoryAccessSample& sample);

/**
 * Benchmark VDF performance on this hardware.
 *
 * @param sample_iterations Number of rounds for the benchmark
 * @param config Buffer size to measure with
 * @return Estimated rounds per second (buffer initialization included)
 */
uint64_t Benchmark(uint64_t sample_iterations, const VDFConfig& config = VDFConfig());

/**
 * Calculate recommended iterations for a target proving time.
 *
 * @param target_seconds Desired VDF computation time
 * @param measured_ips Rounds per second from Benchmark()
 * @return Recommended iteration count (at least 1)
 */
uint64_t CalculateIterations(double target_seconds, uint64_t measured_ips);

} // namespace vdf

#endif // CONTINUITY_VDF_MEMORY_HARD_VDF_H
