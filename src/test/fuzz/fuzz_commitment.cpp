// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Fuzz target: storage commitment decoding and checks
 *
 * Tests:
 * - StorageCommitment::Deserialize on arbitrary bytes
 * - Canonical re-encoding of anything that decodes
 * - VerifyCommitment and signature checks never throw on decoded input
 *
 * Coverage:
 * - src/commitment/commitment.cpp
 * - src/pubkey.cpp (Ed25519 verification of arbitrary keys)
 * - src/entropy/entropy.cpp (embedded entropy record)
 * - src/vdf/memory_hard_vdf.cpp (embedded proof record)
 */

#include "fuzz.h"
#include "util.h"

#include <commitment/commitment.h>

#include <cassert>
#include <vector>

FUZZ_TARGET(commitment)
{
    FuzzBuffer buffer(data, size);
    const std::vector<uint8_t> bytes = buffer.toVector();

    auto commitment = StorageCommitment::Deserialize(bytes);
    if (!commitment) {
        return;
    }

    // Decoding is strict, so the encoding round-trips byte for byte
    assert(commitment->Serialize() == bytes);

    const CommitmentError error = VerifyCommitment(*commitment, commitment->blockHash,
                                                   commitment->selectedChunks.size() + 1);
    if (error == CommitmentError::NONE) {
        assert(VerifyIntegrity(*commitment));
        assert(commitment->entropy.IsConsistent());
    }

    // Fuzzed keys and signatures are almost never valid Ed25519 pairs
    if (VerifyCommitmentSignature(*commitment)) {
        assert(commitment->signature.size() == 64);
    }
}
