// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <selection/chunk_selector.h>

#include <crypto/sha3.h>
#include <util/logging.h>
#include <util/serialize.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

const char* SelectionErrorToString(SelectionError error) {
    switch (error) {
        case SelectionError::NONE: return "none";
        case SelectionError::INSUFFICIENT_CHUNKS: return "insufficient chunks";
        case SelectionError::EXHAUSTED: return "selection draws exhausted";
    }
    return "unknown";
}

bool SelectChunks(const uint256& seed, uint64_t totalChunks, uint32_t count,
                  std::vector<uint64_t>& out, SelectionError& error)
{
    out.clear();

    if (count == 0 || totalChunks == 0 || totalChunks < count) {
        error = SelectionError::INSUFFICIENT_CHUNKS;
        LogPrintSelection(WARN, "SelectChunks: cannot select %u of %llu chunks",
                          count, (unsigned long long)totalChunks);
        return false;
    }

    const uint64_t maxDraws = std::max<uint64_t>(Consensus::MIN_SELECTION_DRAWS,
                                                 Consensus::SELECTION_DRAWS_PER_CHUNK * count);

    // Preimage: seed(32) || LE64(counter)
    uint8_t preimage[40];
    memcpy(preimage, seed.data, 32);

    std::unordered_set<uint64_t> chosen;
    chosen.reserve(count);
    out.reserve(count);

    for (uint64_t c = 0; c < maxDraws; c++) {
        WriteLE64(preimage + 32, c);
        uint256 h;
        SHA3_256(preimage, sizeof(preimage), h.data);

        const uint64_t index = h.GetUint64LE() % totalChunks;
        if (!chosen.insert(index).second) {
            continue;
        }
        out.push_back(index);
        if (out.size() == count) {
            error = SelectionError::NONE;
            return true;
        }
    }

    LogPrintSelection(WARN, "SelectChunks: %zu of %u unique chunks after %llu draws",
                      out.size(), count, (unsigned long long)maxDraws);
    out.clear();
    error = SelectionError::EXHAUSTED;
    return false;
}

bool SelectChunks(const MultiSourceEntropy& entropy, uint64_t totalChunks,
                  std::vector<uint64_t>& out, SelectionError& error, uint32_t count)
{
    return SelectChunks(entropy.combinedHash, totalChunks, count, out, error);
}

bool VerifySelection(const MultiSourceEntropy& entropy, uint64_t totalChunks,
                     const std::vector<uint64_t>& claimed)
{
    if (claimed.empty() || claimed.size() > UINT32_MAX) {
        return false;
    }

    std::vector<uint64_t> expected;
    SelectionError error;
    if (!SelectChunks(entropy.combinedHash, totalChunks, static_cast<uint32_t>(claimed.size()),
                      expected, error)) {
        return false;
    }
    return expected == claimed;
}

uint64_t ChunkCountForSize(uint64_t fileSize, uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be non-zero");
    }
    return fileSize / chunkSize + (fileSize % chunkSize != 0 ? 1 : 0);
}
