// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Fuzz target: memory-hard VDF proof verification
 *
 * Tests:
 * - MemoryHardVDFProof::Deserialize on arbitrary bytes
 * - VerifyDetailed over a small buffer never crashes or over-reads
 * - Honest proofs for fuzzed inputs always verify, and any flipped
 *   sample bit breaks the trace opening
 *
 * Coverage:
 * - src/vdf/memory_hard_vdf.cpp
 *
 * Priority: HIGH (consensus)
 */

#include "fuzz.h"
#include "util.h"

#include <vdf/memory_hard_vdf.h>

#include <cassert>
#include <vector>

FUZZ_TARGET(vdf_proof)
{
    FuzzedDataProvider fuzzed_data(data, size);

    vdf::VDFConfig config;
    config.memory_bytes = 64 * 32;
    config.sample_count = static_cast<uint32_t>(fuzzed_data.ConsumeUint64InRange(2, 16));
    config.sample_window = static_cast<uint32_t>(fuzzed_data.ConsumeUint64InRange(1, 8));

    if (fuzzed_data.ConsumeBool()) {
        // Arbitrary encoded proof
        auto proof = vdf::MemoryHardVDFProof::Deserialize(fuzzed_data.ConsumeRemainingBytes());
        if (proof) {
            (void)vdf::VerifyDetailed(*proof, config);
        }
        return;
    }

    // Honest proof, then one flipped bit
    const uint256 input = fuzzed_data.ConsumeHash();
    const uint64_t iterations = fuzzed_data.ConsumeUint64InRange(1, 256);
    vdf::MemoryHardVDFProof proof;
    if (vdf::Prove(input, iterations, config, proof) != vdf::VDFStatus::OK) {
        return;
    }
    assert(vdf::Verify(proof, config));

    if (proof.memoryAccessSamples.empty()) {
        return;
    }
    const size_t index = fuzzed_data.ConsumeUint64InRange(0, proof.memoryAccessSamples.size() - 1);
    const uint8_t bit = fuzzed_data.ConsumeUint8();
    proof.memoryAccessSamples[index].value.data[(bit >> 3) % 32] ^= static_cast<uint8_t>(1 << (bit & 7));
    assert(!vdf::Verify(proof, config));
}
