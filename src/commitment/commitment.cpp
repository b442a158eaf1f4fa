// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <commitment/commitment.h>

#include <crypto/sha3.h>
#include <interfaces/storage_access.h>
#include <key.h>
#include <pubkey.h>
#include <selection/chunk_selector.h>
#include <util/logging.h>
#include <util/serialize.h>

namespace {

// Prefix shared by the hash preimage and the serialized form
void SerializeHeader(std::vector<uint8_t>& out, const StorageCommitment& c) {
    WriteUint256(out, c.proverKey);
    WriteUint256(out, c.dataHash);
    WriteLE64(out, c.blockHeight);
    WriteUint256(out, c.blockHash);
    WriteLE32(out, static_cast<uint32_t>(c.selectedChunks.size()));
    for (uint64_t idx : c.selectedChunks) {
        WriteLE64(out, idx);
    }
    WriteLE32(out, static_cast<uint32_t>(c.chunkHashes.size()));
    for (const uint256& h : c.chunkHashes) {
        WriteUint256(out, h);
    }
    c.vdfProof.SerializeTo(out);
    c.entropy.SerializeTo(out);
}

} // anonymous namespace

const char* CommitmentErrorToString(CommitmentError error) {
    switch (error) {
        case CommitmentError::NONE: return "none";
        case CommitmentError::MALFORMED_FIELDS: return "malformed fields";
        case CommitmentError::INTEGRITY_MISMATCH: return "commitment hash mismatch";
        case CommitmentError::SELECTION_MISMATCH: return "selection mismatch";
    }
    return "unknown";
}

uint256 ComputeCommitmentHash(const StorageCommitment& c) {
    std::vector<uint8_t> preimage;
    SerializeHeader(preimage, c);
    return SHA3_256(preimage);
}

StorageCommitment BuildCommitment(const uint256& proverKey,
                                  const uint256& dataHash,
                                  uint64_t blockHeight,
                                  const uint256& blockHash,
                                  const std::vector<uint64_t>& selectedChunks,
                                  const std::vector<uint256>& chunkHashes,
                                  const vdf::MemoryHardVDFProof& vdfProof,
                                  const MultiSourceEntropy& entropy)
{
    StorageCommitment c;
    c.proverKey = proverKey;
    c.dataHash = dataHash;
    c.blockHeight = blockHeight;
    c.blockHash = blockHash;
    c.selectedChunks = selectedChunks;
    c.chunkHashes = chunkHashes;
    c.vdfProof = vdfProof;
    c.entropy = entropy;
    c.commitmentHash = ComputeCommitmentHash(c);

    LogPrintCommitment(DEBUG, "Built commitment %s at height %llu (%zu chunks)",
                       c.commitmentHash.GetHex().c_str(), (unsigned long long)blockHeight,
                       selectedChunks.size());
    return c;
}

bool VerifyIntegrity(const StorageCommitment& c) {
    return ComputeCommitmentHash(c) == c.commitmentHash;
}

bool SignCommitment(StorageCommitment& c, const CKey& key) {
    const CPubKey pubkey = key.GetPubKey();
    if (!pubkey.IsValid() || pubkey.GetKey() != c.proverKey) {
        LogPrintCommitment(WARN, "SignCommitment: key does not belong to prover %s",
                           c.proverKey.GetHex().c_str());
        return false;
    }
    return key.Sign(c.commitmentHash, c.signature);
}

bool VerifyCommitmentSignature(const StorageCommitment& c) {
    return CPubKey(c.proverKey).Verify(c.commitmentHash, c.signature);
}

CommitmentError VerifyCommitment(const StorageCommitment& c,
                                 const uint256& expectedBlockHash,
                                 uint64_t totalChunks,
                                 uint32_t count)
{
    if (c.chunkHashes.size() != c.selectedChunks.size() || c.selectedChunks.size() != count) {
        LogPrintCommitment(DEBUG, "VerifyCommitment: %zu chunks, %zu hashes, expected %u",
                           c.selectedChunks.size(), c.chunkHashes.size(), count);
        return CommitmentError::MALFORMED_FIELDS;
    }

    if (!VerifyIntegrity(c)) {
        LogPrintCommitment(DEBUG, "VerifyCommitment: hash mismatch for %s",
                           c.commitmentHash.GetHex().c_str());
        return CommitmentError::INTEGRITY_MISMATCH;
    }

    if (c.blockHash != expectedBlockHash) {
        LogPrintCommitment(DEBUG, "VerifyCommitment: block hash mismatch at height %llu",
                           (unsigned long long)c.blockHeight);
        return CommitmentError::SELECTION_MISMATCH;
    }

    if (!c.entropy.IsConsistent()) {
        LogPrintCommitment(DEBUG, "VerifyCommitment: entropy does not recompute");
        return CommitmentError::SELECTION_MISMATCH;
    }

    if (!VerifySelection(c.entropy, totalChunks, c.selectedChunks)) {
        LogPrintCommitment(DEBUG, "VerifyCommitment: selection differs from entropy %s",
                           c.entropy.combinedHash.GetHex().c_str());
        return CommitmentError::SELECTION_MISMATCH;
    }

    return CommitmentError::NONE;
}

bool VerifyChunkData(const StorageCommitment& c, const IStorageAccess& storage, uint64_t chunkSize) {
    if (c.chunkHashes.size() != c.selectedChunks.size()) {
        return false;
    }

    std::vector<uint8_t> chunk;
    for (size_t i = 0; i < c.selectedChunks.size(); i++) {
        if (!storage.ReadChunk(c.selectedChunks[i], chunkSize, chunk)) {
            LogPrintCommitment(WARN, "VerifyChunkData: cannot read chunk %llu",
                               (unsigned long long)c.selectedChunks[i]);
            return false;
        }
        if (SHA3_256(chunk) != c.chunkHashes[i]) {
            LogPrintCommitment(WARN, "VerifyChunkData: chunk %llu hash mismatch",
                               (unsigned long long)c.selectedChunks[i]);
            return false;
        }
    }
    return true;
}

// Format: hash preimage followed by [commitment_hash:32][sig_len:4][signature]
std::vector<uint8_t> StorageCommitment::Serialize() const {
    std::vector<uint8_t> out;
    SerializeHeader(out, *this);
    WriteUint256(out, commitmentHash);
    WriteLE32(out, static_cast<uint32_t>(signature.size()));
    out.insert(out.end(), signature.begin(), signature.end());
    return out;
}

std::optional<StorageCommitment> StorageCommitment::Deserialize(const std::vector<uint8_t>& data) {
    CByteReader reader(data);
    StorageCommitment c;
    uint32_t n = 0;
    uint32_t m = 0;
    uint32_t sigLen = 0;

    if (!reader.ReadHash(c.proverKey)) return std::nullopt;
    if (!reader.ReadHash(c.dataHash)) return std::nullopt;
    if (!reader.ReadU64(c.blockHeight)) return std::nullopt;
    if (!reader.ReadHash(c.blockHash)) return std::nullopt;

    if (!reader.ReadU32(n) || reader.Remaining() / 8 < n) return std::nullopt;
    c.selectedChunks.resize(n);
    for (uint32_t i = 0; i < n; i++) {
        if (!reader.ReadU64(c.selectedChunks[i])) return std::nullopt;
    }

    if (!reader.ReadU32(m) || reader.Remaining() / 32 < m) return std::nullopt;
    c.chunkHashes.resize(m);
    for (uint32_t i = 0; i < m; i++) {
        if (!reader.ReadHash(c.chunkHashes[i])) return std::nullopt;
    }

    if (!vdf::MemoryHardVDFProof::Unserialize(reader, c.vdfProof)) return std::nullopt;
    if (!MultiSourceEntropy::Unserialize(reader, c.entropy)) return std::nullopt;
    if (!reader.ReadHash(c.commitmentHash)) return std::nullopt;

    if (!reader.ReadU32(sigLen) || sigLen > CPubKey::SIGNATURE_SIZE || reader.Remaining() < sigLen) {
        return std::nullopt;
    }
    c.signature.resize(sigLen);
    for (uint32_t i = 0; i < sigLen; i++) {
        if (!reader.ReadU8(c.signature[i])) return std::nullopt;
    }

    if (!reader.AtEnd()) return std::nullopt;
    return c;
}

bool StorageCommitment::operator==(const StorageCommitment& other) const {
    return proverKey == other.proverKey &&
           dataHash == other.dataHash &&
           blockHeight == other.blockHeight &&
           blockHash == other.blockHash &&
           selectedChunks == other.selectedChunks &&
           chunkHashes == other.chunkHashes &&
           vdfProof == other.vdfProof &&
           entropy == other.entropy &&
           commitmentHash == other.commitmentHash &&
           signature == other.signature;
}
