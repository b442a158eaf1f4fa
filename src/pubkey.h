// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_PUBKEY_H
#define CONTINUITY_PUBKEY_H

#include <uint256.h>

#include <cstddef>
#include <vector>

/**
 * CPubKey: an Ed25519 public key.
 *
 * The 32 raw key bytes are the prover key carried in commitments and chain
 * proofs, so the key is stored as a uint256.
 */
class CPubKey
{
public:
    //! Raw public key size
    static constexpr size_t SIZE = 32;

    //! Ed25519 signature size
    static constexpr size_t SIGNATURE_SIZE = 64;

    //! Construct an invalid public key
    CPubKey() : fValid(false) {}

    //! Wrap raw key bytes
    explicit CPubKey(const uint256& key) : vch(key), fValid(true) {}

    friend bool operator==(const CPubKey& a, const CPubKey& b) {
        return a.fValid == b.fValid && a.vch == b.vch;
    }

    friend bool operator!=(const CPubKey& a, const CPubKey& b) {
        return !(a == b);
    }

    //! Check validity
    bool IsValid() const { return fValid; }

    //! The raw key bytes
    const uint256& GetKey() const { return vch; }

    /**
     * Verify an Ed25519 signature over the 32 bytes of hash.
     * @return false for an invalid key, a wrong-sized or a bad signature
     */
    bool Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const;

private:
    uint256 vch;
    bool fValid;
};

#endif // CONTINUITY_PUBKEY_H
