// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_SELECTION_CHUNK_SELECTOR_H
#define CONTINUITY_SELECTION_CHUNK_SELECTOR_H

#include <consensus/params.h>
#include <entropy/entropy.h>
#include <uint256.h>

#include <cstdint>
#include <vector>

enum class SelectionError {
    NONE,
    INSUFFICIENT_CHUNKS,    // Fewer chunks than requested (or nothing to select)
    EXHAUSTED               // Draw budget spent before enough unique indices
};

const char* SelectionErrorToString(SelectionError error);

/**
 * Deterministic chunk selection.
 *
 * For counter c = 0, 1, ... draw
 *   v = LE64(SHA3-256(seed || LE64(c))[0..8]) mod totalChunks
 * and keep v unless already selected. Indices are returned in draw order.
 * At most max(MIN_SELECTION_DRAWS, SELECTION_DRAWS_PER_CHUNK * count) draws
 * are made.
 *
 * @param seed         Selection seed (the epoch's combined entropy hash)
 * @param totalChunks  Chunks in the file
 * @param count        Unique indices wanted
 * @param out          Selected indices on success
 * @param error        Failure reason
 * @return true on success
 */
bool SelectChunks(const uint256& seed, uint64_t totalChunks, uint32_t count,
                  std::vector<uint64_t>& out, SelectionError& error);

/** Select with seed = entropy.combinedHash. */
bool SelectChunks(const MultiSourceEntropy& entropy, uint64_t totalChunks,
                  std::vector<uint64_t>& out, SelectionError& error,
                  uint32_t count = Consensus::CHUNKS_PER_BLOCK);

/**
 * Re-run selection for claimed.size() indices and compare the full ordered
 * sequence. A different order, a missing index or a foreign index all fail.
 */
bool VerifySelection(const MultiSourceEntropy& entropy, uint64_t totalChunks,
                     const std::vector<uint64_t>& claimed);

/**
 * Number of chunks covering fileSize bytes (the last one may be short).
 * @throws std::invalid_argument if chunkSize is zero
 */
uint64_t ChunkCountForSize(uint64_t fileSize, uint64_t chunkSize);

#endif // CONTINUITY_SELECTION_CHUNK_SELECTOR_H
