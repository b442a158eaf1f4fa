// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_STORAGE_FILE_STORAGE_H
#define CONTINUITY_STORAGE_FILE_STORAGE_H

#include <interfaces/storage_access.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * IStorageAccess over a local file.
 *
 * The file is opened per read so a single instance can serve several threads.
 */
class CFileChunkStorage : public IStorageAccess {
public:
    explicit CFileChunkStorage(const std::string& path);

    /** True if the file exists and its size could be read. */
    bool IsOpen() const { return m_valid; }
    const std::string& GetPath() const { return m_path; }

    uint64_t GetFileSize() const override { return m_size; }
    bool ReadChunk(uint64_t index, uint64_t chunkSize, std::vector<uint8_t>& out) const override;

private:
    std::string m_path;
    uint64_t m_size{0};
    bool m_valid{false};
};

#endif // CONTINUITY_STORAGE_FILE_STORAGE_H
