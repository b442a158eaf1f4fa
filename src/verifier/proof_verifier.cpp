// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <verifier/proof_verifier.h>

#include <crypto/sha3.h>
#include <entropy/entropy.h>
#include <util/logging.h>
#include <util/serialize.h>
#include <util/strencodings.h>

const char* VerifyFailureToString(VerifyFailure failure) {
    switch (failure) {
        case VerifyFailure::NONE: return "none";
        case VerifyFailure::PROVER_KEY_MISMATCH: return "prover key mismatch";
        case VerifyFailure::BAD_SIGNATURE: return "bad signature";
        case VerifyFailure::VDF_INPUT_MISMATCH: return "vdf input mismatch";
        case VerifyFailure::ITERATIONS_TOO_LOW: return "too few vdf iterations";
        case VerifyFailure::VDF_INVALID: return "vdf proof invalid";
        case VerifyFailure::BLOCK_UNKNOWN: return "block unknown";
        case VerifyFailure::MALFORMED_FIELDS: return "malformed fields";
        case VerifyFailure::INTEGRITY_MISMATCH: return "integrity mismatch";
        case VerifyFailure::SELECTION_MISMATCH: return "selection mismatch";
    }
    return "unknown";
}

std::string VerificationResult::ToString() const {
    if (valid) return "valid";
    std::string s = strprintf("invalid: %s", VerifyFailureToString(failure));
    if (failure == VerifyFailure::VDF_INVALID) {
        s += strprintf(" (%s)", vdf::VDFErrorToString(vdfError));
    }
    return s;
}

namespace {

VerificationResult Reject(VerifyFailure failure) {
    VerificationResult r;
    r.valid = false;
    r.failure = failure;
    return r;
}

VerifyFailure FromCommitmentError(CommitmentError error) {
    switch (error) {
        case CommitmentError::NONE: return VerifyFailure::NONE;
        case CommitmentError::MALFORMED_FIELDS: return VerifyFailure::MALFORMED_FIELDS;
        case CommitmentError::INTEGRITY_MISMATCH: return VerifyFailure::INTEGRITY_MISMATCH;
        case CommitmentError::SELECTION_MISMATCH: return VerifyFailure::SELECTION_MISMATCH;
    }
    return VerifyFailure::MALFORMED_FIELDS;
}

} // anonymous namespace

CProofVerifier::CProofVerifier(const IBlockchainSource& blockchain, const VerifierConfig& config)
    : m_blockchain(blockchain), m_config(config)
{
}

VerificationResult CProofVerifier::VerifyFullProof(const StorageCommitment& commitment,
                                                   const uint256& proverKey,
                                                   uint64_t totalChunks) const
{
    if (commitment.proverKey != proverKey) {
        LogPrintVerify(DEBUG, "VerifyFullProof: prover key mismatch");
        return Reject(VerifyFailure::PROVER_KEY_MISMATCH);
    }

    if (!VerifyCommitmentSignature(commitment)) {
        LogPrintVerify(DEBUG, "VerifyFullProof: signature does not verify under %s",
                       proverKey.GetHex().c_str());
        return Reject(VerifyFailure::BAD_SIGNATURE);
    }

    if (commitment.vdfProof.inputState != DeriveVDFInput(commitment.entropy, proverKey)) {
        LogPrintVerify(DEBUG, "VerifyFullProof: VDF input not bound to entropy and prover");
        return Reject(VerifyFailure::VDF_INPUT_MISMATCH);
    }

    if (commitment.vdfProof.iterations < m_config.min_iterations) {
        LogPrintVerify(DEBUG, "VerifyFullProof: %llu VDF rounds, minimum %llu",
                       (unsigned long long)commitment.vdfProof.iterations,
                       (unsigned long long)m_config.min_iterations);
        return Reject(VerifyFailure::ITERATIONS_TOO_LOW);
    }

    vdf::VDFError vdfError = vdf::VerifyDetailed(commitment.vdfProof, m_config.vdf);
    if (vdfError != vdf::VDFError::NONE) {
        LogPrintVerify(DEBUG, "VerifyFullProof: VDF rejected (%s)", vdf::VDFErrorToString(vdfError));
        VerificationResult r = Reject(VerifyFailure::VDF_INVALID);
        r.vdfError = vdfError;
        return r;
    }

    uint256 blockHash;
    if (!m_blockchain.GetBlockHash(commitment.blockHeight, blockHash)) {
        LogPrintVerify(DEBUG, "VerifyFullProof: no block at height %llu",
                       (unsigned long long)commitment.blockHeight);
        return Reject(VerifyFailure::BLOCK_UNKNOWN);
    }

    CommitmentError cerr = VerifyCommitment(commitment, blockHash, totalChunks,
                                            Consensus::CHUNKS_PER_BLOCK);
    if (cerr != CommitmentError::NONE) {
        LogPrintVerify(DEBUG, "VerifyFullProof: commitment rejected (%s)",
                       CommitmentErrorToString(cerr));
        VerificationResult r = Reject(FromCommitmentError(cerr));
        r.commitmentError = cerr;
        return r;
    }

    LogPrintVerify(DEBUG, "VerifyFullProof: accepted %s", commitment.commitmentHash.GetHex().c_str());
    VerificationResult ok;
    ok.valid = true;
    return ok;
}

bool CProofVerifier::VerifyCompactProof(const InclusionProof& proof, const uint256& proverKey) const {
    if (proof.proverKey != proverKey) {
        return false;
    }
    const uint256 chainRoot = ComputeChainRoot(proverKey, proof.commitmentHash);
    const uint256 computed = ComputeInclusionRoot(proof, chainRoot);
    if (computed.IsNull() || computed != proof.aggregateRoot) {
        LogPrintVerify(DEBUG, "VerifyCompactProof: %s does not fold to the presented %s root",
                       proof.chainId.c_str(), HierarchyLevelToString(proof.level));
        return false;
    }
    return true;
}

bool CProofVerifier::VerifyCompactProof(const InclusionProof& proof, const uint256& proverKey,
                                        const uint256& trustedRoot) const
{
    return proof.aggregateRoot == trustedRoot && VerifyCompactProof(proof, proverKey);
}

bool CProofVerifier::ShouldChallenge(const std::string& chainId, const uint256& blockHash,
                                     double probability)
{
    if (probability <= 0.0) return false;
    if (probability >= 1.0) return true;

    std::vector<uint8_t> preimage;
    preimage.reserve(32 + chainId.size());
    WriteUint256(preimage, blockHash);
    preimage.insert(preimage.end(), chainId.begin(), chainId.end());

    // 2^-64 scaling of the first eight bytes
    const double draw = static_cast<double>(SHA3_256(preimage).GetUint64LE()) / 18446744073709551616.0;
    return draw < probability;
}

std::vector<std::string> CProofVerifier::SelectChainsForAudit(const std::vector<std::string>& chainIds,
                                                              const uint256& blockHash,
                                                              double probability)
{
    std::vector<std::string> selected;
    for (const auto& id : chainIds) {
        if (ShouldChallenge(id, blockHash, probability)) {
            selected.push_back(id);
        }
    }
    return selected;
}
