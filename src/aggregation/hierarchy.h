// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_AGGREGATION_HIERARCHY_H
#define CONTINUITY_AGGREGATION_HIERARCHY_H

#include <aggregation/merkle.h>
#include <commitment/commitment.h>
#include <consensus/params.h>
#include <uint256.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class AggregationError {
    NONE,
    DUPLICATE_CHAIN,
    NOT_FOUND,
    CAPACITY_EXCEEDED,      // Too many chains share a placement prefix to split further
    INVALID_COMMITMENT,     // Commitment fails VerifyIntegrity or changes prover
    INVALID_SIGNATURE,      // Commitment not signed by its prover key
    INVALID_LEVEL           // Level not valid for the request
};

const char* AggregationErrorToString(AggregationError error);

struct HierarchyConfig {
    uint32_t chains_per_group = Consensus::CHAINS_PER_GROUP;
    uint32_t groups_per_region = Consensus::GROUPS_PER_REGION;
};

/** Deepest placement trie level; node ids must fit in 32 bits. */
static const uint32_t PLACEMENT_MAX_DEPTH = 31;

/** Placement key of a chain: first four bytes of SHA3-256(chainId), big-endian. */
uint32_t ChainPlacementKey(const std::string& chainId);

/**
 * Id of the placement trie node at `depth` on the path of `key`:
 * (1 << depth) | top `depth` bits of key. The root is 1; the children of n
 * are 2n and 2n+1.
 */
uint32_t PlacementNodeId(uint32_t key, uint32_t depth);

/**
 * Aggregate node at GROUP, REGION or GLOBAL level with its direct children,
 * sorted by child id. Enough to recompute aggregateRoot.
 */
struct HierarchyNode {
    HierarchyLevel level{HierarchyLevel::GLOBAL};
    uint32_t id{0};                         // Group or region id; 0 for GLOBAL
    uint256 aggregateRoot;
    size_t childCount{0};
    std::vector<std::string> chainMembers;  // GROUP level
    std::vector<uint32_t> nodeMembers;      // REGION and GLOBAL level
    std::vector<uint256> memberRoots;       // Parallel to the member list
};

/** Recompute a node's root from its members. */
uint256 ComputeAggregateRoot(const HierarchyNode& node);

// Latest state of one chain
struct ChainProof {
    std::string chainId;
    uint256 proverKey;
    uint256 commitmentHash;
    uint256 chainRoot;
    uint64_t blockHeight{0};
    uint32_t groupId{0};
    uint32_t regionId{0};
};

/**
 * Path from a chain leaf to the root of `level`.
 *
 * segments[0] climbs the group, segments[1] the region and segments[2] the
 * global tree; only the segments up to `level` are present.
 */
struct InclusionProof {
    std::string chainId;
    uint256 proverKey;
    uint256 commitmentHash;
    HierarchyLevel level{HierarchyLevel::GROUP};
    uint32_t groupId{0};
    uint32_t regionId{0};
    std::vector<std::vector<MerkleStep>> segments;
    uint256 aggregateRoot;
};

/**
 * Fold an inclusion proof from the given chain root up to its level.
 * Returns a null hash if the proof has the wrong number of segments.
 */
uint256 ComputeInclusionRoot(const InclusionProof& proof, const uint256& chainRoot);

struct HierarchyStats {
    size_t chains{0};
    size_t groups{0};
    size_t regions{0};
    size_t largestGroup{0};
    size_t smallestGroup{0};
    size_t pendingGroups{0};    // Changed groups awaiting rollup
    uint256 globalRoot;
};

/**
 * CHierarchicalNetworkManager - chain -> group -> region -> global rollup.
 *
 * Placement is a binary trie over chain placement keys. A trie node is a
 * group when it holds at most chains_per_group chains and its parent holds
 * more; a region is the highest node whose subtree has at most
 * groups_per_region non-empty groups. Group and region ids are trie node
 * ids, so the whole tree is a function of the set of registered chain ids.
 * A group that overflows splits into its two children; when a subtree
 * shrinks back to capacity its groups collapse into one.
 *
 * Nodes live in id-keyed maps. Groups left empty by a split or deregistration
 * stay as trie leaves but are invisible to roots, stats and queries.
 *
 * Locking:
 *   m_rollupMutex -> m_topologyMutex -> Group::mutex -> m_dirtyMutex
 * Topology changes (register, deregister, split, collapse) hold the topology
 * mutex and lock the groups they touch. Updates lock only the chain's group,
 * recompute its root and queue the group. Region assignment and region and
 * global roots are refreshed under the rollup mutex before they are read.
 */
class CHierarchicalNetworkManager {
public:
    explicit CHierarchicalNetworkManager(const HierarchyConfig& config = HierarchyConfig());

    CHierarchicalNetworkManager(const CHierarchicalNetworkManager&) = delete;
    CHierarchicalNetworkManager& operator=(const CHierarchicalNetworkManager&) = delete;

    AggregationError RegisterChain(const std::string& chainId, const StorageCommitment& commitment);
    AggregationError UpdateChain(const std::string& chainId, const StorageCommitment& commitment);
    AggregationError DeregisterChain(const std::string& chainId);

    AggregationError GetChainProof(const std::string& chainId, ChainProof& out) const;

    /** Node at GROUP/REGION level by id, or GLOBAL (id ignored). */
    AggregationError GetAggregateProof(HierarchyLevel level, uint32_t id, HierarchyNode& out) const;

    AggregationError GetInclusionProof(const std::string& chainId, HierarchyLevel level,
                                       InclusionProof& out) const;

    /** Current global root (null when empty). */
    uint256 GetGlobalRoot() const;

    HierarchyStats GetStats() const;

    const HierarchyConfig& GetConfig() const { return m_config; }

private:
    struct ChainEntry {
        uint32_t placementKey{0};
        uint256 proverKey;
        uint256 commitmentHash;
        uint256 root;
        uint64_t blockHeight{0};
    };

    struct Group {
        uint32_t id{0};
        uint32_t regionId{0};                       // Guarded by m_topologyMutex
        std::mutex mutex;
        // Key set changes under m_topologyMutex and mutex; entries under mutex
        std::map<std::string, ChainEntry> members;
        uint256 root;                               // Guarded by mutex
    };
    using GroupRef = std::shared_ptr<Group>;
    using EntryList = std::vector<std::pair<std::string, ChainEntry>>;

    struct Region {
        uint32_t id{0};
        std::set<uint32_t> groups;                  // Non-empty groups only
        // Rollup snapshot, sorted by group id; guarded by m_rollupMutex
        mutable std::vector<uint256> groupRoots;
        mutable std::vector<uint256> groupLeaves;
        mutable uint256 root;
    };

    HierarchyConfig m_config;

    mutable std::mutex m_rollupMutex;
    mutable std::mutex m_topologyMutex;

    std::map<std::string, uint32_t> m_chainIndex;   // chain -> group
    std::map<uint32_t, GroupRef> m_groups;          // Trie leaves
    std::map<uint32_t, size_t> m_internal;          // Split trie nodes -> chain count

    // Region assignment; rebuilt under both mutexes when m_regionsStale
    mutable std::map<uint32_t, Region> m_regions;
    mutable bool m_regionsStale{false};

    // Rollup state, sorted by region id; guarded by m_rollupMutex
    mutable std::vector<uint256> m_globalLeaves;
    mutable uint256 m_globalRoot;

    mutable std::mutex m_dirtyMutex;
    mutable std::deque<uint32_t> m_dirtyGroups;
    mutable std::atomic<bool> m_dirty{false};

    /** Recompute a group's root. Caller must hold group.mutex. */
    static void RecomputeGroupRoot(Group& group);

    /** Sorted chain leaves of a group. Caller must hold group.mutex. */
    static std::vector<uint256> GroupLeaves(const Group& group);

    void MarkGroupDirty(uint32_t groupId) const;

    /**
     * Refresh region assignment if stale, dirty region roots and the global
     * root. Caller must hold m_rollupMutex and m_topologyMutex, and
     * optionally the mutex of `held`, which is then read without relocking.
     */
    void DrainRollup(const Group* held) const;

    /** Rebuild m_regions from the trie. Caller must hold both mutexes. */
    void AssignRegions() const;

    /** Non-empty groups below `node`, recorded per split node in `occupied`. */
    size_t CountOccupied(uint32_t node, std::map<uint32_t, size_t>& occupied) const;

    /** Place the region containing `node`, or descend. */
    void PlaceRegions(uint32_t node, const std::map<uint32_t, size_t>& occupied) const;

    /** Collect non-empty groups below `node` into `region`. */
    void CollectGroups(uint32_t node, Region& region) const;

    /**
     * Lay out `entries` as the subtree rooted at `node`: one group if they
     * fit, otherwise a split node with two subtrees. Caller must hold
     * m_topologyMutex and have checked that the keys can be separated.
     */
    void BuildSubtree(uint32_t node, uint32_t depth, EntryList entries);

    /**
     * Replace the subtree rooted at split node `node` by a single group.
     * Caller must hold m_topologyMutex and no group mutex.
     */
    void CollapseSubtree(uint32_t node);

    /** Move every chain below `node` into `out`, dropping the groups. */
    void DrainSubtree(uint32_t node, EntryList& out);
};

#endif // CONTINUITY_AGGREGATION_HIERARCHY_H
