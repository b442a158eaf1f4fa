// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_INTERFACES_BLOCKCHAIN_SOURCE_H
#define CONTINUITY_INTERFACES_BLOCKCHAIN_SOURCE_H

#include <uint256.h>

#include <cstdint>
#include <optional>
#include <vector>

/**
 * Read-only view of the anchoring blockchain.
 *
 * Implementations must be safe to call from several proving threads.
 */
class IBlockchainSource {
public:
    virtual ~IBlockchainSource() = default;

    virtual uint64_t GetCurrentHeight() const = 0;

    /** @return false if no block is known at height */
    virtual bool GetBlockHash(uint64_t height, uint256& hash) const = 0;

    /** Entropy for the current epoch; empty when unavailable. */
    virtual std::vector<uint8_t> GetEntropySource() const = 0;
};

/**
 * Optional secondary entropy (public randomness beacon).
 */
class IBeaconSource {
public:
    virtual ~IBeaconSource() = default;

    virtual std::optional<std::vector<uint8_t>> GetBeaconEntropy() const = 0;
};

#endif // CONTINUITY_INTERFACES_BLOCKCHAIN_SOURCE_H
