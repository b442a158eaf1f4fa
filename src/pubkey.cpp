// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <pubkey.h>

#include <util/logging.h>

#include <openssl/evp.h>

#include <memory>

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};

struct MDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // anonymous namespace

bool CPubKey::Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const
{
    if (!fValid) {
        return false;
    }

    if (vchSig.size() != SIGNATURE_SIZE) {
        return false;
    }

    std::unique_ptr<EVP_PKEY, PKeyDeleter> pkey(
        EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, vch.begin(), SIZE));
    if (!pkey) {
        LogPrintCommitment(DEBUG, "CPubKey::Verify: cannot load public key %s", vch.GetHex().c_str());
        return false;
    }

    std::unique_ptr<EVP_MD_CTX, MDCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }

    return EVP_DigestVerify(ctx.get(), vchSig.data(), vchSig.size(), hash.begin(), uint256::WIDTH) == 1;
}
