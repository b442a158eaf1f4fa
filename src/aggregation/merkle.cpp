// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <aggregation/merkle.h>

#include <crypto/sha3.h>
#include <util/serialize.h>

#include <cstring>

namespace {

const uint8_t LEAF_PREFIX = 0x00;
const uint8_t NODE_PREFIX = 0x01;

uint256 LeafHash(HierarchyLevel level, const uint8_t* id, uint32_t idLen, const uint256& childRoot) {
    std::vector<uint8_t> preimage;
    preimage.reserve(1 + 1 + 4 + idLen + 32);
    preimage.push_back(LEAF_PREFIX);
    preimage.push_back(static_cast<uint8_t>(level));
    WriteLE32(preimage, idLen);
    preimage.insert(preimage.end(), id, id + idLen);
    WriteUint256(preimage, childRoot);
    return SHA3_256(preimage);
}

// Next layer up; an odd trailing node is promoted
std::vector<uint256> ReduceLayer(const std::vector<uint256>& layer) {
    std::vector<uint256> next;
    next.reserve((layer.size() + 1) / 2);
    for (size_t i = 0; i + 1 < layer.size(); i += 2) {
        next.push_back(ComputeNodeHash(layer[i], layer[i + 1]));
    }
    if (layer.size() % 2 == 1) {
        next.push_back(layer.back());
    }
    return next;
}

} // anonymous namespace

const char* HierarchyLevelToString(HierarchyLevel level) {
    switch (level) {
        case HierarchyLevel::CHAIN: return "chain";
        case HierarchyLevel::GROUP: return "group";
        case HierarchyLevel::REGION: return "region";
        case HierarchyLevel::GLOBAL: return "global";
    }
    return "unknown";
}

uint256 ComputeChainRoot(const uint256& proverKey, const uint256& commitmentHash) {
    uint8_t preimage[64];
    memcpy(preimage, proverKey.data, 32);
    memcpy(preimage + 32, commitmentHash.data, 32);
    uint256 root;
    SHA3_256(preimage, sizeof(preimage), root.data);
    return root;
}

uint256 ComputeLeafHash(HierarchyLevel level, const std::string& id, const uint256& childRoot) {
    return LeafHash(level, reinterpret_cast<const uint8_t*>(id.data()),
                    static_cast<uint32_t>(id.size()), childRoot);
}

uint256 ComputeLeafHash(HierarchyLevel level, uint32_t id, const uint256& childRoot) {
    uint8_t encoded[4];
    WriteLE32(encoded, id);
    return LeafHash(level, encoded, sizeof(encoded), childRoot);
}

uint256 ComputeNodeHash(const uint256& left, const uint256& right) {
    uint8_t preimage[65];
    preimage[0] = NODE_PREFIX;
    memcpy(preimage + 1, left.data, 32);
    memcpy(preimage + 33, right.data, 32);
    uint256 node;
    SHA3_256(preimage, sizeof(preimage), node.data);
    return node;
}

uint256 ComputeMerkleRoot(const std::vector<uint256>& leaves) {
    if (leaves.empty()) return uint256();

    std::vector<uint256> layer = leaves;
    while (layer.size() > 1) {
        layer = ReduceLayer(layer);
    }
    return layer[0];
}

std::vector<MerkleStep> ComputeMerklePath(const std::vector<uint256>& leaves, size_t index) {
    std::vector<MerkleStep> path;
    if (index >= leaves.size()) return path;

    std::vector<uint256> layer = leaves;
    while (layer.size() > 1) {
        const size_t sibling = index ^ 1;
        if (sibling < layer.size()) {
            MerkleStep step;
            step.sibling = layer[sibling];
            step.siblingOnLeft = (sibling < index);
            path.push_back(step);
        }
        layer = ReduceLayer(layer);
        index /= 2;
    }
    return path;
}

uint256 FoldMerklePath(const uint256& leaf, const std::vector<MerkleStep>& path) {
    uint256 acc = leaf;
    for (const MerkleStep& step : path) {
        acc = step.siblingOnLeft ? ComputeNodeHash(step.sibling, acc)
                                 : ComputeNodeHash(acc, step.sibling);
    }
    return acc;
}
