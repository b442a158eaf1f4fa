// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_CONSENSUS_PARAMS_H
#define CONTINUITY_CONSENSUS_PARAMS_H

#include <cstddef>
#include <cstdint>

/**
 * Consensus Parameters
 *
 * This file contains all consensus-critical constants of the storage
 * continuity protocol.
 *
 * CRITICAL: Changing these values creates incompatible consensus rules.
 * Every prover and verifier must use identical values or proofs become
 * mutually unverifiable.
 */

namespace Consensus {

//==============================================================================
// Chunk Selection
//==============================================================================

/** Number of chunks selected and hashed per proving round */
static const uint16_t CHUNKS_PER_BLOCK = 16;

/** Size of one addressable chunk in bytes */
static const uint32_t CHUNK_SIZE_BYTES = 4096;

/** Minimum number of draws allowed before selection gives up on duplicates */
static const uint64_t MIN_SELECTION_DRAWS = 65536;

/** Draw budget per requested chunk (budget = max(MIN, count * this)) */
static const uint64_t SELECTION_DRAWS_PER_CHUNK = 64;

//==============================================================================
// Memory-Hard VDF
//==============================================================================

/** Target wall-clock duration of one VDF proof on reference hardware */
static const uint32_t VDF_TARGET_SECONDS = 25;

/** Scratch buffer size (64 MiB, independent of the iteration count) */
static const uint64_t VDF_MEMORY_BYTES = 64ULL * 1024 * 1024;

/** Bytes per scratch word (one SHA3-256 output) */
static const uint64_t VDF_WORD_SIZE = 32;

/** Number of pseudo-randomly placed checkpoint windows per proof */
static const uint32_t VDF_SAMPLE_COUNT = 16;

/** Consecutive rounds recorded per checkpoint window */
static const uint32_t VDF_SAMPLE_WINDOW = 4;

/** Rounds between cooperative cancellation checks (not consensus-critical) */
static const uint64_t VDF_CANCEL_CHECK_INTERVAL = 65536;

/** Default iteration count before local calibration */
static const uint64_t VDF_DEFAULT_ITERATIONS = 10'000'000;

/** Fewest rounds a verifier accepts (one tenth of the default) */
static const uint64_t VDF_MIN_ITERATIONS = VDF_DEFAULT_ITERATIONS / 10;

//==============================================================================
// Audit Sampling
//==============================================================================

/** Probability that a chain is selected for a full audit per block */
static const double CHALLENGE_PROBABILITY = 0.1;

//==============================================================================
// Hierarchical Aggregation
//==============================================================================

/** Target chains per group (split when exceeded) */
static const uint32_t CHAINS_PER_GROUP = 1000;

/** Target groups per region (a new region opens when reached) */
static const uint32_t GROUPS_PER_REGION = 100;

} // namespace Consensus

#endif // CONTINUITY_CONSENSUS_PARAMS_H
