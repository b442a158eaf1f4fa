// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_COMMITMENT_COMMITMENT_H
#define CONTINUITY_COMMITMENT_COMMITMENT_H

#include <consensus/params.h>
#include <entropy/entropy.h>
#include <uint256.h>
#include <vdf/memory_hard_vdf.h>

#include <cstdint>
#include <optional>
#include <vector>

class CKey;
class IStorageAccess;

/**
 * Storage commitment for one proving epoch.
 *
 * Binds the prover, the file, the anchoring block, the selected chunks and
 * their hashes, the VDF proof and the entropy that drove selection. The
 * prover signs commitmentHash with the Ed25519 key whose public half is
 * proverKey; the signature is not part of the hash.
 */
struct StorageCommitment {
    uint256 proverKey;
    uint256 dataHash;                       // SHA3-256 of the full file
    uint64_t blockHeight{0};
    uint256 blockHash;
    std::vector<uint64_t> selectedChunks;   // Draw order
    std::vector<uint256> chunkHashes;       // Parallel to selectedChunks
    vdf::MemoryHardVDFProof vdfProof;
    MultiSourceEntropy entropy;
    uint256 commitmentHash;
    std::vector<unsigned char> signature;   // Ed25519 over commitmentHash

    std::vector<uint8_t> Serialize() const;
    static std::optional<StorageCommitment> Deserialize(const std::vector<uint8_t>& data);

    bool operator==(const StorageCommitment& other) const;
};

enum class CommitmentError {
    NONE,
    MALFORMED_FIELDS,       // Chunk/hash counts disagree or differ from the expected count
    INTEGRITY_MISMATCH,     // commitmentHash does not recompute
    SELECTION_MISMATCH      // Wrong block, inconsistent entropy or a different chunk selection
};

const char* CommitmentErrorToString(CommitmentError error);

/**
 * commitmentHash = SHA3-256( proverKey || dataHash || LE64(blockHeight) || blockHash
 *                            || LE32(n) || LE64(chunk)*n || LE32(m) || chunkHash*m
 *                            || vdfProof.Serialize() || entropy.Serialize() )
 */
uint256 ComputeCommitmentHash(const StorageCommitment& c);

/** Assemble a commitment and compute its hash. */
StorageCommitment BuildCommitment(const uint256& proverKey,
                                  const uint256& dataHash,
                                  uint64_t blockHeight,
                                  const uint256& blockHash,
                                  const std::vector<uint64_t>& selectedChunks,
                                  const std::vector<uint256>& chunkHashes,
                                  const vdf::MemoryHardVDFProof& vdfProof,
                                  const MultiSourceEntropy& entropy);

/** True if commitmentHash recomputes from the fields. */
bool VerifyIntegrity(const StorageCommitment& c);

/**
 * Sign commitmentHash.
 * @return false if key is invalid, its public key is not c.proverKey, or signing fails
 */
bool SignCommitment(StorageCommitment& c, const CKey& key);

/** True if signature is proverKey's Ed25519 signature over commitmentHash. */
bool VerifyCommitmentSignature(const StorageCommitment& c);

/**
 * Structural, integrity and selection checks.
 *
 * Checks run in that order; the first failure is reported. Never throws.
 *
 * @param c                  Commitment to check
 * @param expectedBlockHash  Block hash the verifier holds for c.blockHeight
 * @param totalChunks        Chunks in the committed file
 * @param count              Chunks a commitment must select
 */
CommitmentError VerifyCommitment(const StorageCommitment& c,
                                 const uint256& expectedBlockHash,
                                 uint64_t totalChunks,
                                 uint32_t count = Consensus::CHUNKS_PER_BLOCK);

/**
 * Re-read the selected chunks and compare their hashes (audit path).
 *
 * @return false on a read failure or any hash mismatch
 */
bool VerifyChunkData(const StorageCommitment& c, const IStorageAccess& storage,
                     uint64_t chunkSize = Consensus::CHUNK_SIZE_BYTES);

#endif // CONTINUITY_COMMITMENT_COMMITMENT_H
