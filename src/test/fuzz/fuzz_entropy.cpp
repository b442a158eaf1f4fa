// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Fuzz target: entropy records and chunk selection
 *
 * Tests:
 * - MultiSourceEntropy::Deserialize canonical encoding
 * - SelectChunks uniqueness and range for fuzzed seeds and file sizes
 * - VerifySelection accepts exactly the selection it reproduces
 *
 * Coverage:
 * - src/entropy/entropy.cpp
 * - src/selection/chunk_selector.cpp
 */

#include "fuzz.h"
#include "util.h"

#include <entropy/entropy.h>
#include <selection/chunk_selector.h>

#include <cassert>
#include <optional>
#include <set>
#include <vector>

FUZZ_TARGET(entropy)
{
    FuzzedDataProvider fuzzed_data(data, size);

    auto record = MultiSourceEntropy::Deserialize(fuzzed_data.ConsumeBytes(MultiSourceEntropy::SERIALIZED_SIZE));
    if (record) {
        auto again = MultiSourceEntropy::Deserialize(record->Serialize());
        assert(again && *again == *record);
    }

    const uint256 chainEntropy = fuzzed_data.ConsumeHash();
    std::optional<uint256> beacon;
    if (fuzzed_data.ConsumeBool()) {
        beacon = fuzzed_data.ConsumeHash();
    }
    const uint256 local = fuzzed_data.ConsumeHash();
    const MultiSourceEntropy entropy = CombineEntropyWithLocal(chainEntropy, beacon, local,
                                                               fuzzed_data.ConsumeUint64());
    assert(entropy.IsConsistent());

    const uint64_t totalChunks = fuzzed_data.ConsumeUint64InRange(0, 1ULL << 40);
    const uint32_t count = static_cast<uint32_t>(fuzzed_data.ConsumeUint64InRange(0, 64));

    std::vector<uint64_t> selected;
    SelectionError error;
    if (!SelectChunks(entropy, totalChunks, selected, error, count)) {
        assert(selected.empty());
        return;
    }

    assert(selected.size() == count);
    std::set<uint64_t> unique(selected.begin(), selected.end());
    assert(unique.size() == selected.size());
    for (uint64_t index : selected) {
        assert(index < totalChunks);
    }
    assert(VerifySelection(entropy, totalChunks, selected));
}
