// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <aggregation/hierarchy.h>

#include <crypto/sha3.h>
#include <util/logging.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>

const char* AggregationErrorToString(AggregationError error) {
    switch (error) {
        case AggregationError::NONE: return "none";
        case AggregationError::DUPLICATE_CHAIN: return "duplicate chain";
        case AggregationError::NOT_FOUND: return "not found";
        case AggregationError::CAPACITY_EXCEEDED: return "capacity exceeded";
        case AggregationError::INVALID_COMMITMENT: return "invalid commitment";
        case AggregationError::INVALID_SIGNATURE: return "invalid signature";
        case AggregationError::INVALID_LEVEL: return "invalid level";
    }
    return "unknown";
}

namespace {

uint32_t KeyBit(uint32_t key, uint32_t depth) {
    return (key >> (31 - depth)) & 1;
}

uint32_t NodeDepth(uint32_t node) {
    uint32_t depth = 0;
    while (node > 1) {
        node >>= 1;
        depth++;
    }
    return depth;
}

// True if splitting by key bits from `depth` down gets every part within cap
bool KeysSeparable(const std::vector<uint32_t>& keys, uint32_t depth, size_t cap) {
    if (keys.size() <= cap) return true;
    if (depth >= PLACEMENT_MAX_DEPTH) return false;
    std::vector<uint32_t> low, high;
    for (uint32_t key : keys) {
        (KeyBit(key, depth) ? high : low).push_back(key);
    }
    return KeysSeparable(low, depth + 1, cap) && KeysSeparable(high, depth + 1, cap);
}

AggregationError CheckCommitment(const char* op, const std::string& chainId,
                                 const StorageCommitment& commitment)
{
    if (!VerifyIntegrity(commitment)) {
        LogPrintAggregation(WARN, "%s %s: commitment fails integrity", op, chainId.c_str());
        return AggregationError::INVALID_COMMITMENT;
    }
    if (!VerifyCommitmentSignature(commitment)) {
        LogPrintAggregation(WARN, "%s %s: commitment not signed by prover %s", op, chainId.c_str(),
                            commitment.proverKey.GetHex().c_str());
        return AggregationError::INVALID_SIGNATURE;
    }
    return AggregationError::NONE;
}

} // anonymous namespace

uint32_t ChainPlacementKey(const std::string& chainId) {
    uint8_t hash[32];
    SHA3_256(reinterpret_cast<const uint8_t*>(chainId.data()), chainId.size(), hash);
    return (uint32_t(hash[0]) << 24) | (uint32_t(hash[1]) << 16) | (uint32_t(hash[2]) << 8) | hash[3];
}

uint32_t PlacementNodeId(uint32_t key, uint32_t depth) {
    if (depth == 0) return 1;
    return (1u << depth) | (key >> (32 - depth));
}

uint256 ComputeAggregateRoot(const HierarchyNode& node) {
    std::vector<uint256> leaves;
    switch (node.level) {
        case HierarchyLevel::GROUP:
            if (node.chainMembers.size() != node.memberRoots.size()) return uint256();
            for (size_t i = 0; i < node.chainMembers.size(); i++) {
                leaves.push_back(ComputeLeafHash(HierarchyLevel::CHAIN, node.chainMembers[i],
                                                 node.memberRoots[i]));
            }
            break;
        case HierarchyLevel::REGION:
        case HierarchyLevel::GLOBAL: {
            if (node.nodeMembers.size() != node.memberRoots.size()) return uint256();
            const HierarchyLevel child = node.level == HierarchyLevel::REGION
                                             ? HierarchyLevel::GROUP : HierarchyLevel::REGION;
            for (size_t i = 0; i < node.nodeMembers.size(); i++) {
                leaves.push_back(ComputeLeafHash(child, node.nodeMembers[i], node.memberRoots[i]));
            }
            break;
        }
        case HierarchyLevel::CHAIN:
            return uint256();
    }
    return ComputeMerkleRoot(leaves);
}

uint256 ComputeInclusionRoot(const InclusionProof& proof, const uint256& chainRoot) {
    size_t expected = 0;
    switch (proof.level) {
        case HierarchyLevel::GROUP: expected = 1; break;
        case HierarchyLevel::REGION: expected = 2; break;
        case HierarchyLevel::GLOBAL: expected = 3; break;
        case HierarchyLevel::CHAIN: return uint256();
    }
    if (proof.segments.size() != expected) return uint256();

    uint256 acc = FoldMerklePath(ComputeLeafHash(HierarchyLevel::CHAIN, proof.chainId, chainRoot),
                                 proof.segments[0]);
    if (expected >= 2) {
        acc = FoldMerklePath(ComputeLeafHash(HierarchyLevel::GROUP, proof.groupId, acc),
                             proof.segments[1]);
    }
    if (expected >= 3) {
        acc = FoldMerklePath(ComputeLeafHash(HierarchyLevel::REGION, proof.regionId, acc),
                             proof.segments[2]);
    }
    return acc;
}

CHierarchicalNetworkManager::CHierarchicalNetworkManager(const HierarchyConfig& config)
    : m_config(config)
{
    if (m_config.chains_per_group == 0 || m_config.groups_per_region == 0) {
        throw std::invalid_argument("hierarchy capacities must be non-zero");
    }

    // The trie starts as one empty group at the root
    auto root = std::make_shared<Group>();
    root->id = 1;
    m_groups.emplace(root->id, root);
}

std::vector<uint256> CHierarchicalNetworkManager::GroupLeaves(const Group& group) {
    std::vector<uint256> leaves;
    leaves.reserve(group.members.size());
    for (const auto& m : group.members) {
        leaves.push_back(ComputeLeafHash(HierarchyLevel::CHAIN, m.first, m.second.root));
    }
    return leaves;
}

void CHierarchicalNetworkManager::RecomputeGroupRoot(Group& group) {
    group.root = ComputeMerkleRoot(GroupLeaves(group));
}

void CHierarchicalNetworkManager::MarkGroupDirty(uint32_t groupId) const {
    std::lock_guard<std::mutex> lock(m_dirtyMutex);
    m_dirtyGroups.push_back(groupId);
    m_dirty.store(true);
}

size_t CHierarchicalNetworkManager::CountOccupied(uint32_t node,
                                                  std::map<uint32_t, size_t>& occupied) const
{
    auto git = m_groups.find(node);
    if (git != m_groups.end()) {
        return git->second->members.empty() ? 0 : 1;
    }
    if (!m_internal.count(node)) return 0;

    const size_t n = CountOccupied(node << 1, occupied) + CountOccupied((node << 1) | 1, occupied);
    occupied[node] = n;
    return n;
}

void CHierarchicalNetworkManager::CollectGroups(uint32_t node, Region& region) const {
    auto git = m_groups.find(node);
    if (git != m_groups.end()) {
        if (!git->second->members.empty()) {
            git->second->regionId = region.id;
            region.groups.insert(node);
        }
        return;
    }
    if (!m_internal.count(node)) return;
    CollectGroups(node << 1, region);
    CollectGroups((node << 1) | 1, region);
}

void CHierarchicalNetworkManager::PlaceRegions(uint32_t node,
                                               const std::map<uint32_t, size_t>& occupied) const
{
    size_t count = 0;
    auto git = m_groups.find(node);
    if (git != m_groups.end()) {
        count = git->second->members.empty() ? 0 : 1;
    } else {
        auto oit = occupied.find(node);
        if (oit != occupied.end()) count = oit->second;
    }
    if (count == 0) return;

    if (count <= m_config.groups_per_region) {
        Region& region = m_regions[node];
        region.id = node;
        CollectGroups(node, region);
        return;
    }
    PlaceRegions(node << 1, occupied);
    PlaceRegions((node << 1) | 1, occupied);
}

void CHierarchicalNetworkManager::AssignRegions() const {
    std::map<uint32_t, size_t> occupied;
    CountOccupied(1, occupied);

    m_regions.clear();
    for (const auto& g : m_groups) {
        g.second->regionId = 0;
    }
    PlaceRegions(1, occupied);
    m_regionsStale = false;

    LogPrintAggregation(DEBUG, "Reassigned regions: %zu region(s)", m_regions.size());
}

void CHierarchicalNetworkManager::DrainRollup(const Group* held) const {
    if (!m_dirty.load() && !m_regionsStale) return;

    std::deque<uint32_t> pending;
    {
        std::lock_guard<std::mutex> lock(m_dirtyMutex);
        pending.swap(m_dirtyGroups);
        m_dirty.store(false);
    }

    std::set<uint32_t> regions;
    if (m_regionsStale) {
        AssignRegions();
        for (const auto& r : m_regions) regions.insert(r.first);
    } else {
        for (uint32_t groupId : pending) {
            auto git = m_groups.find(groupId);
            if (git != m_groups.end() && git->second->regionId != 0) {
                regions.insert(git->second->regionId);
            }
        }
    }

    for (uint32_t regionId : regions) {
        const Region& region = m_regions.at(regionId);
        region.groupRoots.clear();
        region.groupLeaves.clear();
        for (uint32_t groupId : region.groups) {
            const GroupRef& group = m_groups.at(groupId);
            uint256 root;
            if (group.get() == held) {
                root = group->root;
            } else {
                std::lock_guard<std::mutex> lock(group->mutex);
                root = group->root;
            }
            region.groupRoots.push_back(root);
            region.groupLeaves.push_back(ComputeLeafHash(HierarchyLevel::GROUP, groupId, root));
        }
        region.root = ComputeMerkleRoot(region.groupLeaves);
    }

    m_globalLeaves.clear();
    for (const auto& r : m_regions) {
        m_globalLeaves.push_back(ComputeLeafHash(HierarchyLevel::REGION, r.first, r.second.root));
    }
    m_globalRoot = ComputeMerkleRoot(m_globalLeaves);

    LogPrintAggregation(DEBUG, "Rolled up %zu region(s), global root %s",
                        regions.size(), m_globalRoot.GetHex().c_str());
}

void CHierarchicalNetworkManager::BuildSubtree(uint32_t node, uint32_t depth, EntryList entries) {
    if (entries.size() <= m_config.chains_per_group) {
        auto group = std::make_shared<Group>();
        group->id = node;
        {
            std::lock_guard<std::mutex> lock(group->mutex);
            for (auto& e : entries) {
                m_chainIndex[e.first] = node;
                group->members.emplace(std::move(e.first), std::move(e.second));
            }
            RecomputeGroupRoot(*group);
        }
        m_groups[node] = group;
        MarkGroupDirty(node);
        return;
    }

    m_internal[node] = entries.size();
    EntryList low, high;
    for (auto& e : entries) {
        (KeyBit(e.second.placementKey, depth) ? high : low).push_back(std::move(e));
    }
    BuildSubtree(node << 1, depth + 1, std::move(low));
    BuildSubtree((node << 1) | 1, depth + 1, std::move(high));
}

void CHierarchicalNetworkManager::DrainSubtree(uint32_t node, EntryList& out) {
    auto git = m_groups.find(node);
    if (git != m_groups.end()) {
        GroupRef group = git->second;
        m_groups.erase(git);
        std::lock_guard<std::mutex> lock(group->mutex);
        for (const auto& m : group->members) {
            out.emplace_back(m.first, m.second);
        }
        group->members.clear();
        return;
    }
    if (m_internal.erase(node) == 0) return;
    DrainSubtree(node << 1, out);
    DrainSubtree((node << 1) | 1, out);
}

void CHierarchicalNetworkManager::CollapseSubtree(uint32_t node) {
    EntryList entries;
    DrainSubtree(node, entries);
    const size_t n = entries.size();
    BuildSubtree(node, NodeDepth(node), std::move(entries));
    LogPrintAggregation(INFO, "Collapsed %zu chain(s) into group %u", n, node);
}

AggregationError CHierarchicalNetworkManager::RegisterChain(const std::string& chainId,
                                                            const StorageCommitment& commitment)
{
    AggregationError error = CheckCommitment("RegisterChain", chainId, commitment);
    if (error != AggregationError::NONE) {
        return error;
    }

    ChainEntry entry;
    entry.placementKey = ChainPlacementKey(chainId);
    entry.proverKey = commitment.proverKey;
    entry.commitmentHash = commitment.commitmentHash;
    entry.root = ComputeChainRoot(commitment.proverKey, commitment.commitmentHash);
    entry.blockHeight = commitment.blockHeight;

    std::lock_guard<std::mutex> topology(m_topologyMutex);

    if (m_chainIndex.count(chainId)) {
        return AggregationError::DUPLICATE_CHAIN;
    }

    // Leaf of the trie on the chain's key path
    uint32_t node = 1;
    uint32_t depth = 0;
    while (m_internal.count(node)) {
        node = (node << 1) | KeyBit(entry.placementKey, depth);
        depth++;
    }
    GroupRef group = m_groups.at(node);
    std::unique_lock<std::mutex> glock(group->mutex);

    if (group->members.size() < m_config.chains_per_group) {
        group->members.emplace(chainId, entry);
        RecomputeGroupRoot(*group);
        glock.unlock();
        m_chainIndex[chainId] = node;
        MarkGroupDirty(node);
    } else {
        EntryList entries(group->members.begin(), group->members.end());
        entries.emplace_back(chainId, entry);

        std::vector<uint32_t> keys;
        keys.reserve(entries.size());
        for (const auto& e : entries) keys.push_back(e.second.placementKey);
        if (!KeysSeparable(keys, depth, m_config.chains_per_group)) {
            LogPrintAggregation(WARN, "RegisterChain %s: group %u cannot split further",
                                chainId.c_str(), node);
            return AggregationError::CAPACITY_EXCEEDED;
        }

        // Retire the full group; threads waiting on it find it empty and look up again
        group->members.clear();
        glock.unlock();
        m_groups.erase(node);
        BuildSubtree(node, depth, std::move(entries));
        LogPrintAggregation(INFO, "Split group %u at depth %u", node, depth);
    }

    for (uint32_t d = 0; d < depth; d++) {
        m_internal.at(PlacementNodeId(entry.placementKey, d))++;
    }
    m_regionsStale = true;

    LogPrintAggregation(DEBUG, "Registered chain %s", chainId.c_str());
    return AggregationError::NONE;
}

AggregationError CHierarchicalNetworkManager::UpdateChain(const std::string& chainId,
                                                          const StorageCommitment& commitment)
{
    AggregationError error = CheckCommitment("UpdateChain", chainId, commitment);
    if (error != AggregationError::NONE) {
        return error;
    }

    for (;;) {
        GroupRef group;
        {
            std::lock_guard<std::mutex> topology(m_topologyMutex);
            auto it = m_chainIndex.find(chainId);
            if (it == m_chainIndex.end()) {
                return AggregationError::NOT_FOUND;
            }
            group = m_groups.at(it->second);
        }

        std::lock_guard<std::mutex> glock(group->mutex);
        auto member = group->members.find(chainId);
        if (member == group->members.end()) {
            continue;  // Moved by a split or collapse; look it up again
        }

        // A chain stays bound to the prover that registered it
        if (member->second.proverKey != commitment.proverKey) {
            LogPrintAggregation(WARN, "UpdateChain %s: prover key changed", chainId.c_str());
            return AggregationError::INVALID_COMMITMENT;
        }

        member->second.commitmentHash = commitment.commitmentHash;
        member->second.root = ComputeChainRoot(commitment.proverKey, commitment.commitmentHash);
        member->second.blockHeight = commitment.blockHeight;

        RecomputeGroupRoot(*group);
        MarkGroupDirty(group->id);
        return AggregationError::NONE;
    }
}

AggregationError CHierarchicalNetworkManager::DeregisterChain(const std::string& chainId) {
    std::lock_guard<std::mutex> topology(m_topologyMutex);

    auto it = m_chainIndex.find(chainId);
    if (it == m_chainIndex.end()) {
        return AggregationError::NOT_FOUND;
    }
    GroupRef group = m_groups.at(it->second);
    m_chainIndex.erase(it);

    uint32_t key = 0;
    {
        std::lock_guard<std::mutex> glock(group->mutex);
        auto member = group->members.find(chainId);
        key = member->second.placementKey;
        group->members.erase(member);
        RecomputeGroupRoot(*group);
    }
    MarkGroupDirty(group->id);

    // The highest split node back within capacity becomes a single group
    uint32_t collapse = 0;
    const uint32_t depth = NodeDepth(group->id);
    for (uint32_t d = 0; d < depth; d++) {
        const uint32_t node = PlacementNodeId(key, d);
        size_t& count = m_internal.at(node);
        count--;
        if (collapse == 0 && count <= m_config.chains_per_group) {
            collapse = node;
        }
    }
    if (collapse != 0) {
        CollapseSubtree(collapse);
    }
    m_regionsStale = true;

    LogPrintAggregation(DEBUG, "Deregistered chain %s", chainId.c_str());
    return AggregationError::NONE;
}

AggregationError CHierarchicalNetworkManager::GetChainProof(const std::string& chainId,
                                                            ChainProof& out) const
{
    std::lock_guard<std::mutex> rollup(m_rollupMutex);
    std::lock_guard<std::mutex> topology(m_topologyMutex);

    auto it = m_chainIndex.find(chainId);
    if (it == m_chainIndex.end()) {
        return AggregationError::NOT_FOUND;
    }
    const GroupRef& group = m_groups.at(it->second);
    std::lock_guard<std::mutex> glock(group->mutex);

    // Region assignment must be current
    DrainRollup(group.get());

    auto member = group->members.find(chainId);
    if (member == group->members.end()) {
        return AggregationError::NOT_FOUND;
    }

    out.chainId = chainId;
    out.proverKey = member->second.proverKey;
    out.commitmentHash = member->second.commitmentHash;
    out.chainRoot = member->second.root;
    out.blockHeight = member->second.blockHeight;
    out.groupId = group->id;
    out.regionId = group->regionId;
    return AggregationError::NONE;
}

AggregationError CHierarchicalNetworkManager::GetAggregateProof(HierarchyLevel level, uint32_t id,
                                                                HierarchyNode& out) const
{
    out = HierarchyNode();
    out.level = level;

    if (level == HierarchyLevel::CHAIN) {
        return AggregationError::INVALID_LEVEL;
    }

    if (level == HierarchyLevel::GROUP) {
        std::lock_guard<std::mutex> topology(m_topologyMutex);
        auto git = m_groups.find(id);
        if (git == m_groups.end()) {
            return AggregationError::NOT_FOUND;
        }
        const Group& group = *git->second;
        std::lock_guard<std::mutex> glock(git->second->mutex);
        if (group.members.empty()) {
            return AggregationError::NOT_FOUND;
        }

        out.id = id;
        out.aggregateRoot = group.root;
        for (const auto& m : group.members) {
            out.chainMembers.push_back(m.first);
            out.memberRoots.push_back(m.second.root);
        }
        out.childCount = out.chainMembers.size();
        return AggregationError::NONE;
    }

    std::lock_guard<std::mutex> rollup(m_rollupMutex);
    std::lock_guard<std::mutex> topology(m_topologyMutex);
    DrainRollup(nullptr);

    if (level == HierarchyLevel::REGION) {
        auto rit = m_regions.find(id);
        if (rit == m_regions.end()) {
            return AggregationError::NOT_FOUND;
        }
        const Region& region = rit->second;
        out.id = id;
        out.aggregateRoot = region.root;
        out.nodeMembers.assign(region.groups.begin(), region.groups.end());
        out.memberRoots = region.groupRoots;
    } else {
        out.aggregateRoot = m_globalRoot;
        for (const auto& r : m_regions) {
            out.nodeMembers.push_back(r.first);
            out.memberRoots.push_back(r.second.root);
        }
    }
    out.childCount = out.nodeMembers.size();
    return AggregationError::NONE;
}

AggregationError CHierarchicalNetworkManager::GetInclusionProof(const std::string& chainId,
                                                                HierarchyLevel level,
                                                                InclusionProof& out) const
{
    if (level == HierarchyLevel::CHAIN) {
        return AggregationError::INVALID_LEVEL;
    }

    std::lock_guard<std::mutex> rollup(m_rollupMutex);
    std::lock_guard<std::mutex> topology(m_topologyMutex);

    auto it = m_chainIndex.find(chainId);
    if (it == m_chainIndex.end()) {
        return AggregationError::NOT_FOUND;
    }
    const GroupRef& group = m_groups.at(it->second);
    std::lock_guard<std::mutex> glock(group->mutex);

    // Refresh with this group held so the region snapshot matches its root
    DrainRollup(group.get());

    auto member = group->members.find(chainId);
    if (member == group->members.end()) {
        return AggregationError::NOT_FOUND;
    }

    out = InclusionProof();
    out.chainId = chainId;
    out.proverKey = member->second.proverKey;
    out.commitmentHash = member->second.commitmentHash;
    out.level = level;
    out.groupId = group->id;
    out.regionId = group->regionId;

    const size_t chainIndex = std::distance(group->members.begin(), member);
    out.segments.push_back(ComputeMerklePath(GroupLeaves(*group), chainIndex));
    out.aggregateRoot = group->root;

    if (level == HierarchyLevel::GROUP) {
        return AggregationError::NONE;
    }

    const Region& region = m_regions.at(group->regionId);
    const size_t groupIndex = std::distance(region.groups.begin(), region.groups.find(group->id));
    out.segments.push_back(ComputeMerklePath(region.groupLeaves, groupIndex));
    out.aggregateRoot = region.root;

    if (level == HierarchyLevel::REGION) {
        return AggregationError::NONE;
    }

    const size_t regionIndex = std::distance(m_regions.begin(), m_regions.find(group->regionId));
    out.segments.push_back(ComputeMerklePath(m_globalLeaves, regionIndex));
    out.aggregateRoot = m_globalRoot;
    return AggregationError::NONE;
}

uint256 CHierarchicalNetworkManager::GetGlobalRoot() const {
    std::lock_guard<std::mutex> rollup(m_rollupMutex);
    std::lock_guard<std::mutex> topology(m_topologyMutex);
    DrainRollup(nullptr);
    return m_globalRoot;
}

HierarchyStats CHierarchicalNetworkManager::GetStats() const {
    std::lock_guard<std::mutex> rollup(m_rollupMutex);
    std::lock_guard<std::mutex> topology(m_topologyMutex);

    HierarchyStats stats;
    {
        std::lock_guard<std::mutex> lock(m_dirtyMutex);
        std::set<uint32_t> pending(m_dirtyGroups.begin(), m_dirtyGroups.end());
        stats.pendingGroups = pending.size();
    }

    DrainRollup(nullptr);

    stats.chains = m_chainIndex.size();
    stats.regions = m_regions.size();
    stats.smallestGroup = std::numeric_limits<size_t>::max();
    for (const auto& g : m_groups) {
        std::lock_guard<std::mutex> glock(g.second->mutex);
        const size_t size = g.second->members.size();
        if (size == 0) continue;
        stats.groups++;
        stats.largestGroup = std::max(stats.largestGroup, size);
        stats.smallestGroup = std::min(stats.smallestGroup, size);
    }
    if (stats.groups == 0) {
        stats.smallestGroup = 0;
    }
    stats.globalRoot = m_globalRoot;
    return stats;
}
