// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_PROVER_PROVER_H
#define CONTINUITY_PROVER_PROVER_H

#include <commitment/commitment.h>
#include <consensus/params.h>
#include <interfaces/blockchain_source.h>
#include <interfaces/storage_access.h>
#include <key.h>
#include <uint256.h>
#include <vdf/memory_hard_vdf.h>

#include <atomic>
#include <cstdint>
#include <string>

enum class ProverStatus {
    OK,
    CHAIN_UNAVAILABLE,  // No block hash for the current height
    ENTROPY_FAILED,
    SELECTION_FAILED,
    STORAGE_FAILED,
    VDF_FAILED,
    SIGNING_FAILED,     // Invalid prover key or Ed25519 signing error
    CANCELLED
};

const char* ProverStatusToString(ProverStatus status);

struct ProverConfig {
    vdf::VDFConfig vdf;
    uint64_t vdf_iterations = Consensus::VDF_DEFAULT_ITERATIONS;
};

/**
 * Stream the whole file through SHA3-256, chunk by chunk.
 * @return false if any chunk cannot be read
 */
bool ComputeDataHash(const IStorageAccess& storage, uint64_t chunkSize, uint256& hash);

/**
 * CStorageProver - produces one commitment per call for one stored file.
 *
 * Pipeline: blockchain entropy (+ beacon) -> CombineEntropy -> SelectChunks
 *   -> read and hash chunks -> DeriveVDFInput -> vdf::Prove
 *   -> ComputeDataHash -> BuildCommitment -> SignCommitment
 *
 * The signing key and the other collaborators are borrowed and must outlive
 * the prover. The prover key is the key's Ed25519 public key.
 */
class CStorageProver {
public:
    CStorageProver(const CKey& signingKey,
                   const IBlockchainSource& blockchain,
                   const IStorageAccess& storage,
                   const ProverConfig& config,
                   const IBeaconSource* beacon = nullptr);

    /**
     * Run the pipeline against the current chain tip.
     *
     * @param out     Commitment on ProverStatus::OK
     * @param error   Human-readable detail on failure
     * @param cancel  Optional flag; polled by the VDF
     */
    ProverStatus GenerateCommitment(StorageCommitment& out, std::string& error,
                                    const std::atomic<bool>* cancel = nullptr) const;

    const uint256& GetProverKey() const { return m_proverKey; }
    const ProverConfig& GetConfig() const { return m_config; }

private:
    const CKey& m_signingKey;
    uint256 m_proverKey;
    const IBlockchainSource& m_blockchain;
    const IStorageAccess& m_storage;
    const IBeaconSource* m_beacon;
    ProverConfig m_config;
};

#endif // CONTINUITY_PROVER_PROVER_H
