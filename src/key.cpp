// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <key.h>

#include <crypto/random.h>
#include <pubkey.h>
#include <uint256.h>
#include <util/logging.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <cstring>
#include <memory>

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

struct MDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

PKeyPtr LoadPrivateKey(const unsigned char* seed) {
    return PKeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed, CKey::SIZE));
}

} // anonymous namespace

CKey::~CKey()
{
    OPENSSL_cleanse(keydata, sizeof(keydata));
}

CKey::CKey(CKey&& other) noexcept
    : fValid(other.fValid)
{
    memcpy(keydata, other.keydata, sizeof(keydata));
    OPENSSL_cleanse(other.keydata, sizeof(other.keydata));
    other.fValid = false;
}

CKey& CKey::operator=(CKey&& other) noexcept
{
    if (this != &other) {
        memcpy(keydata, other.keydata, sizeof(keydata));
        fValid = other.fValid;
        OPENSSL_cleanse(other.keydata, sizeof(other.keydata));
        other.fValid = false;
    }
    return *this;
}

bool CKey::Set(const unsigned char* pbegin, const unsigned char* pend)
{
    if (pend - pbegin != static_cast<std::ptrdiff_t>(SIZE)) {
        fValid = false;
        return false;
    }

    memcpy(keydata, pbegin, SIZE);
    fValid = true;
    return true;
}

bool CKey::MakeNewKey()
{
    fValid = GetStrongRandBytes(keydata, SIZE);
    return fValid;
}

CPubKey CKey::GetPubKey() const
{
    if (!fValid) {
        return CPubKey(); // Return invalid public key
    }

    PKeyPtr pkey = LoadPrivateKey(keydata);
    uint256 pub;
    size_t len = uint256::WIDTH;
    if (!pkey || EVP_PKEY_get_raw_public_key(pkey.get(), pub.begin(), &len) != 1 || len != CPubKey::SIZE) {
        LogPrintCommitment(ERROR, "CKey::GetPubKey: cannot derive Ed25519 public key");
        return CPubKey();
    }
    return CPubKey(pub);
}

bool CKey::Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const
{
    if (!fValid) {
        return false;
    }

    PKeyPtr pkey = LoadPrivateKey(keydata);
    std::unique_ptr<EVP_MD_CTX, MDCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        LogPrintCommitment(ERROR, "CKey::Sign: cannot initialize Ed25519 signer");
        return false;
    }

    // Resize signature buffer
    vchSig.resize(CPubKey::SIGNATURE_SIZE);
    size_t siglen = vchSig.size();
    if (EVP_DigestSign(ctx.get(), vchSig.data(), &siglen, hash.begin(), uint256::WIDTH) != 1 ||
        siglen != CPubKey::SIGNATURE_SIZE) {
        vchSig.clear();
        return false;
    }
    return true;
}
