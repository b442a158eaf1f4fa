// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_VERIFIER_PROOF_VERIFIER_H
#define CONTINUITY_VERIFIER_PROOF_VERIFIER_H

#include <aggregation/hierarchy.h>
#include <commitment/commitment.h>
#include <consensus/params.h>
#include <interfaces/blockchain_source.h>
#include <uint256.h>
#include <vdf/memory_hard_vdf.h>

#include <string>
#include <vector>

enum class VerifyFailure {
    NONE,
    PROVER_KEY_MISMATCH,    // Commitment made under a different prover key
    BAD_SIGNATURE,          // Signature is not the prover's over commitmentHash
    VDF_INPUT_MISMATCH,     // VDF input not derived from this entropy and prover
    ITERATIONS_TOO_LOW,     // Fewer VDF rounds than the verifier's minimum
    VDF_INVALID,            // Memory-hard VDF proof rejected
    BLOCK_UNKNOWN,          // No block at the committed height
    MALFORMED_FIELDS,
    INTEGRITY_MISMATCH,
    SELECTION_MISMATCH
};

const char* VerifyFailureToString(VerifyFailure failure);

struct VerifierConfig {
    vdf::VDFConfig vdf;
    uint64_t min_iterations = Consensus::VDF_MIN_ITERATIONS;
};

struct VerificationResult {
    bool valid{false};
    VerifyFailure failure{VerifyFailure::NONE};
    vdf::VDFError vdfError{vdf::VDFError::NONE};
    CommitmentError commitmentError{CommitmentError::NONE};

    std::string ToString() const;
};

/**
 * CProofVerifier - checks full commitments and compact aggregation proofs.
 *
 * Holds no mutable state; one instance may be shared between threads if the
 * blockchain source is thread-safe.
 */
class CProofVerifier {
public:
    CProofVerifier(const IBlockchainSource& blockchain, const VerifierConfig& config);

    /**
     * Full verification of one commitment.
     *
     * Order: prover key, signature, VDF input binding, minimum iterations,
     * VDF replay, anchoring block, then VerifyCommitment. The first failure
     * is reported.
     *
     * @param commitment   Commitment to verify
     * @param proverKey    Prover the commitment must belong to
     * @param totalChunks  Chunks in the committed file
     */
    VerificationResult VerifyFullProof(const StorageCommitment& commitment,
                                       const uint256& proverKey,
                                       uint64_t totalChunks) const;

    /**
     * Recompute the chain root from the proof's commitment hash, fold the
     * path and compare with the presented aggregate root.
     */
    bool VerifyCompactProof(const InclusionProof& proof, const uint256& proverKey) const;

    /** As above, additionally requiring the aggregate root to equal trustedRoot. */
    bool VerifyCompactProof(const InclusionProof& proof, const uint256& proverKey,
                            const uint256& trustedRoot) const;

    /**
     * Deterministic audit sampling:
     *   LE64(SHA3-256(blockHash || chainId)) / 2^64 < probability
     */
    static bool ShouldChallenge(const std::string& chainId, const uint256& blockHash,
                                double probability = Consensus::CHALLENGE_PROBABILITY);

    /** Chains from chainIds picked for audit at blockHash, in input order. */
    static std::vector<std::string> SelectChainsForAudit(const std::vector<std::string>& chainIds,
                                                         const uint256& blockHash,
                                                         double probability = Consensus::CHALLENGE_PROBABILITY);

private:
    const IBlockchainSource& m_blockchain;
    VerifierConfig m_config;
};

#endif // CONTINUITY_VERIFIER_PROOF_VERIFIER_H
