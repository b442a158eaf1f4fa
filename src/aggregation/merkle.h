// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_AGGREGATION_MERKLE_H
#define CONTINUITY_AGGREGATION_MERKLE_H

#include <uint256.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Hashing for the aggregation hierarchy.
 *
 *   chain root = SHA3-256(proverKey || commitmentHash)
 *   leaf       = SHA3-256(0x00 || level || LE32(len(id)) || id || childRoot)
 *   node       = SHA3-256(0x01 || left || right)
 *
 * `level` is the level of the child the leaf stands for. Numeric ids are
 * encoded as LE32 (len 4). The 0x00/0x01 prefixes keep leaves and interior
 * nodes in separate domains. An odd node at any layer is promoted unchanged.
 */

enum class HierarchyLevel : uint8_t {
    CHAIN = 0,
    GROUP = 1,
    REGION = 2,
    GLOBAL = 3
};

const char* HierarchyLevelToString(HierarchyLevel level);

// One step of a Merkle path
struct MerkleStep {
    uint256 sibling;
    bool siblingOnLeft{false};

    bool operator==(const MerkleStep& other) const {
        return sibling == other.sibling && siblingOnLeft == other.siblingOnLeft;
    }
};

uint256 ComputeChainRoot(const uint256& proverKey, const uint256& commitmentHash);

uint256 ComputeLeafHash(HierarchyLevel level, const std::string& id, const uint256& childRoot);
uint256 ComputeLeafHash(HierarchyLevel level, uint32_t id, const uint256& childRoot);

uint256 ComputeNodeHash(const uint256& left, const uint256& right);

/** Root over leaves in the given order; null for an empty list. */
uint256 ComputeMerkleRoot(const std::vector<uint256>& leaves);

/**
 * Authentication path for leaves[index], leaf layer first.
 * Promoted layers contribute no step. Empty if index is out of range.
 */
std::vector<MerkleStep> ComputeMerklePath(const std::vector<uint256>& leaves, size_t index);

/** Fold a leaf up its path. */
uint256 FoldMerklePath(const uint256& leaf, const std::vector<MerkleStep>& path);

#endif // CONTINUITY_AGGREGATION_MERKLE_H
