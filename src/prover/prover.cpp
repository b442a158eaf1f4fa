// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <prover/prover.h>

#include <crypto/sha3.h>
#include <entropy/entropy.h>
#include <pubkey.h>
#include <selection/chunk_selector.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <optional>
#include <utility>
#include <vector>

const char* ProverStatusToString(ProverStatus status) {
    switch (status) {
        case ProverStatus::OK: return "ok";
        case ProverStatus::CHAIN_UNAVAILABLE: return "chain unavailable";
        case ProverStatus::ENTROPY_FAILED: return "entropy failed";
        case ProverStatus::SELECTION_FAILED: return "selection failed";
        case ProverStatus::STORAGE_FAILED: return "storage failed";
        case ProverStatus::VDF_FAILED: return "vdf failed";
        case ProverStatus::SIGNING_FAILED: return "signing failed";
        case ProverStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool ComputeDataHash(const IStorageAccess& storage, uint64_t chunkSize, uint256& hash) {
    const uint64_t chunks = ChunkCountForSize(storage.GetFileSize(), chunkSize);

    CSHA3_256 hasher;
    std::vector<uint8_t> chunk;
    for (uint64_t i = 0; i < chunks; i++) {
        if (!storage.ReadChunk(i, chunkSize, chunk)) {
            LogPrintProver(ERROR, "ComputeDataHash: failed to read chunk %llu of %llu",
                           (unsigned long long)i, (unsigned long long)chunks);
            return false;
        }
        hasher.Write(chunk);
    }
    hash = hasher.Finalize();
    return true;
}

CStorageProver::CStorageProver(const CKey& signingKey,
                               const IBlockchainSource& blockchain,
                               const IStorageAccess& storage,
                               const ProverConfig& config,
                               const IBeaconSource* beacon)
    : m_signingKey(signingKey),
      m_proverKey(signingKey.GetPubKey().GetKey()),
      m_blockchain(blockchain),
      m_storage(storage),
      m_beacon(beacon),
      m_config(config)
{
}

ProverStatus CStorageProver::GenerateCommitment(StorageCommitment& out, std::string& error,
                                                const std::atomic<bool>* cancel) const
{
    const uint64_t chunkSize = Consensus::CHUNK_SIZE_BYTES;

    if (!m_signingKey.IsValid()) {
        error = "prover key is not initialized";
        return ProverStatus::SIGNING_FAILED;
    }

    // Anchor block
    const uint64_t height = m_blockchain.GetCurrentHeight();
    uint256 blockHash;
    if (!m_blockchain.GetBlockHash(height, blockHash)) {
        error = strprintf("no block hash at height %llu", (unsigned long long)height);
        return ProverStatus::CHAIN_UNAVAILABLE;
    }

    // Entropy
    std::optional<std::vector<uint8_t>> beacon;
    if (m_beacon) {
        beacon = m_beacon->GetBeaconEntropy();
    }
    MultiSourceEntropy entropy;
    EntropyError entropyError;
    if (!CombineEntropy(m_blockchain.GetEntropySource(), beacon, entropy, entropyError)) {
        error = EntropyErrorToString(entropyError);
        return ProverStatus::ENTROPY_FAILED;
    }

    // Selection
    const uint64_t totalChunks = ChunkCountForSize(m_storage.GetFileSize(), chunkSize);
    std::vector<uint64_t> selected;
    SelectionError selectionError;
    if (!SelectChunks(entropy, totalChunks, selected, selectionError)) {
        error = strprintf("%s (%llu chunks)", SelectionErrorToString(selectionError),
                          (unsigned long long)totalChunks);
        return ProverStatus::SELECTION_FAILED;
    }

    // Chunk hashes
    std::vector<uint256> chunkHashes;
    chunkHashes.reserve(selected.size());
    std::vector<uint8_t> chunk;
    for (uint64_t index : selected) {
        if (!m_storage.ReadChunk(index, chunkSize, chunk)) {
            error = strprintf("cannot read chunk %llu", (unsigned long long)index);
            return ProverStatus::STORAGE_FAILED;
        }
        chunkHashes.push_back(SHA3_256(chunk));
    }

    // Delay proof
    const uint256 input = DeriveVDFInput(entropy, m_proverKey);
    vdf::MemoryHardVDFProof proof;
    vdf::VDFStatus vdfStatus = vdf::Prove(input, m_config.vdf_iterations, m_config.vdf, proof, cancel);
    if (vdfStatus == vdf::VDFStatus::CANCELLED) {
        error = "proving cancelled";
        return ProverStatus::CANCELLED;
    }
    if (vdfStatus != vdf::VDFStatus::OK) {
        error = vdf::VDFStatusToString(vdfStatus);
        return ProverStatus::VDF_FAILED;
    }

    uint256 dataHash;
    if (!ComputeDataHash(m_storage, chunkSize, dataHash)) {
        error = "cannot hash data file";
        return ProverStatus::STORAGE_FAILED;
    }

    StorageCommitment commitment = BuildCommitment(m_proverKey, dataHash, height, blockHash, selected,
                                                   chunkHashes, proof, entropy);
    if (!SignCommitment(commitment, m_signingKey)) {
        error = "cannot sign commitment";
        return ProverStatus::SIGNING_FAILED;
    }
    out = std::move(commitment);

    LogPrintProver(INFO, "Commitment %s at height %llu (vdf %llu ms)",
                   out.commitmentHash.GetHex().c_str(), (unsigned long long)height,
                   (unsigned long long)proof.computationTimeMs);
    return ProverStatus::OK;
}
