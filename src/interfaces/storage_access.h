// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_INTERFACES_STORAGE_ACCESS_H
#define CONTINUITY_INTERFACES_STORAGE_ACCESS_H

#include <cstdint>
#include <vector>

/**
 * Chunk-addressed read access to the stored file.
 *
 * Chunk i covers bytes [i * chunkSize, min((i + 1) * chunkSize, fileSize)).
 */
class IStorageAccess {
public:
    virtual ~IStorageAccess() = default;

    virtual uint64_t GetFileSize() const = 0;

    /** @return false if the chunk is out of range or cannot be read */
    virtual bool ReadChunk(uint64_t index, uint64_t chunkSize, std::vector<uint8_t>& out) const = 0;
};

#endif // CONTINUITY_INTERFACES_STORAGE_ACCESS_H
