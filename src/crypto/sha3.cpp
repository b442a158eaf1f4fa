// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <crypto/sha3.h>

#include <openssl/evp.h>

#include <stdexcept>

namespace {

void EVPDigest(const EVP_MD* md, const uint8_t* data, size_t len, uint8_t* out) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("SHA3: EVP_MD_CTX_new failed");
    }

    unsigned int out_len = 0;
    bool ok = EVP_DigestInit_ex(ctx, md, nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, out, &out_len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        throw std::runtime_error("SHA3: OpenSSL digest failed");
    }
}

} // anonymous namespace

void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    // Validate inputs
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("SHA3_256: data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument("SHA3_256: hash output buffer is NULL");
    }

    static const uint8_t empty = 0;
    EVPDigest(EVP_sha3_256(), data != nullptr ? data : &empty, len, hash);
}

void SHA3_512(const uint8_t* data, size_t len, uint8_t hash[64]) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("SHA3_512: data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument("SHA3_512: hash output buffer is NULL");
    }

    static const uint8_t empty = 0;
    EVPDigest(EVP_sha3_512(), data != nullptr ? data : &empty, len, hash);
}

struct CSHA3_256::Impl {
    EVP_MD_CTX* ctx{nullptr};
};

CSHA3_256::CSHA3_256() : m_impl(new Impl) {
    m_impl->ctx = EVP_MD_CTX_new();
    if (m_impl->ctx == nullptr || EVP_DigestInit_ex(m_impl->ctx, EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(m_impl->ctx);
        delete m_impl;
        throw std::runtime_error("CSHA3_256: OpenSSL digest init failed");
    }
}

CSHA3_256::~CSHA3_256() {
    EVP_MD_CTX_free(m_impl->ctx);
    delete m_impl;
}

CSHA3_256& CSHA3_256::Write(const uint8_t* data, size_t len) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("CSHA3_256::Write: data is NULL but len > 0");
    }
    if (m_finalized) {
        throw std::logic_error("CSHA3_256::Write: hasher already finalized");
    }
    if (len > 0 && EVP_DigestUpdate(m_impl->ctx, data, len) != 1) {
        throw std::runtime_error("CSHA3_256::Write: OpenSSL digest update failed");
    }
    return *this;
}

void CSHA3_256::Finalize(uint8_t hash[OUTPUT_SIZE]) {
    if (m_finalized) {
        throw std::logic_error("CSHA3_256::Finalize: hasher already finalized");
    }
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(m_impl->ctx, hash, &out_len) != 1) {
        throw std::runtime_error("CSHA3_256::Finalize: OpenSSL digest final failed");
    }
    m_finalized = true;
}

uint256 CSHA3_256::Finalize() {
    uint256 out;
    Finalize(out.data);
    return out;
}

CSHA3_256& CSHA3_256::Reset() {
    if (EVP_DigestInit_ex(m_impl->ctx, EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error("CSHA3_256::Reset: OpenSSL digest init failed");
    }
    m_finalized = false;
    return *this;
}
