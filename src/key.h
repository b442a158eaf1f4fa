// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_KEY_H
#define CONTINUITY_KEY_H

#include <cstddef>
#include <vector>

class CPubKey;
class uint256;

/**
 * CKey: an encapsulated Ed25519 secret key.
 *
 * Holds the 32-byte RFC 8032 seed; the public key is derived on demand.
 * Signing goes through OpenSSL's one-shot EVP_DigestSign. Key bytes are
 * cleansed on destruction.
 */
class CKey
{
private:
    //! Whether this private key is valid (initialized)
    bool fValid;

    //! The secret seed
    unsigned char keydata[32];

public:
    //! Seed size
    static constexpr size_t SIZE = 32;

    //! Construct an invalid private key
    CKey() : fValid(false) {}

    //! Destructor - securely clears key data
    ~CKey();

    //! Initialize from a 32-byte seed
    bool Set(const unsigned char* pbegin, const unsigned char* pend);

    //! Generate a new random private key
    bool MakeNewKey();

    //! Check whether this private key is valid
    bool IsValid() const { return fValid; }

    //! Get the corresponding public key (invalid if this key is)
    CPubKey GetPubKey() const;

    //! Create a 64-byte signature over the 32 bytes of hash
    bool Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const;

    //! Get pointer to key data (const)
    const unsigned char* data() const { return keydata; }

    //! Prevent copying (secret keys should not be copied)
    CKey(const CKey&) = delete;
    CKey& operator=(const CKey&) = delete;

    //! Allow moving
    CKey(CKey&& other) noexcept;
    CKey& operator=(CKey&& other) noexcept;
};

#endif // CONTINUITY_KEY_H
