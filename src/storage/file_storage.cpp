// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <storage/file_storage.h>

#include <util/logging.h>

#include <algorithm>
#include <fstream>
#include <sys/stat.h>

CFileChunkStorage::CFileChunkStorage(const std::string& path)
    : m_path(path)
{
    struct stat st;
    if (stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        m_size = static_cast<uint64_t>(st.st_size);
        m_valid = true;
    } else {
        LogPrintProver(ERROR, "Cannot open data file %s", path.c_str());
    }
}

bool CFileChunkStorage::ReadChunk(uint64_t index, uint64_t chunkSize, std::vector<uint8_t>& out) const {
    out.clear();
    if (!m_valid || chunkSize == 0) return false;

    // Overflow-safe range check: index * chunkSize < m_size
    if (index >= m_size / chunkSize + (m_size % chunkSize != 0 ? 1 : 0)) {
        return false;
    }

    const uint64_t start = index * chunkSize;
    const uint64_t len = std::min<uint64_t>(chunkSize, m_size - start);

    std::ifstream file(m_path, std::ios::binary);
    if (!file.is_open()) {
        LogPrintProver(ERROR, "ReadChunk: failed to open %s", m_path.c_str());
        return false;
    }
    file.seekg(static_cast<std::streamoff>(start));
    out.resize(len);
    file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(len));
    if (static_cast<uint64_t>(file.gcount()) != len) {
        LogPrintProver(ERROR, "ReadChunk: short read of chunk %llu from %s",
                       (unsigned long long)index, m_path.c_str());
        out.clear();
        return false;
    }
    return true;
}
