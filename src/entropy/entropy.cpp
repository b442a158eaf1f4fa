// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <entropy/entropy.h>

#include <crypto/random.h>
#include <crypto/sha3.h>
#include <util/logging.h>
#include <util/serialize.h>

#include <chrono>
#include <cstring>

namespace {

uint64_t NowMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // anonymous namespace

const char* EntropyErrorToString(EntropyError error) {
    switch (error) {
        case EntropyError::NONE: return "none";
        case EntropyError::MISSING_BLOCKCHAIN_SOURCE: return "missing blockchain entropy source";
        case EntropyError::MALFORMED_SOURCE: return "malformed entropy source";
        case EntropyError::RNG_FAILURE: return "local randomness unavailable";
    }
    return "unknown";
}

uint256 ComputeCombinedHash(const uint256& blockchainEntropy,
                            const std::optional<uint256>& beaconEntropy,
                            const uint256& localEntropy,
                            uint64_t timestamp)
{
    // Preimage: blockchain(32) || beaconOrZeros(32) || local(32) || timestamp_le64(8) = 104 bytes
    uint8_t preimage[104];
    std::memcpy(preimage, blockchainEntropy.data, 32);
    if (beaconEntropy) {
        std::memcpy(preimage + 32, beaconEntropy->data, 32);
    } else {
        std::memset(preimage + 32, 0, 32);
    }
    std::memcpy(preimage + 64, localEntropy.data, 32);
    WriteLE64(preimage + 96, timestamp);

    uint256 combined;
    SHA3_256(preimage, sizeof(preimage), combined.data);
    return combined;
}

bool MultiSourceEntropy::IsConsistent() const {
    return ComputeCombinedHash(*this) == combinedHash;
}

void MultiSourceEntropy::SerializeTo(std::vector<uint8_t>& out) const {
    WriteUint256(out, blockchainEntropy);
    out.push_back(beaconEntropy ? 1 : 0);
    WriteUint256(out, beaconEntropy ? *beaconEntropy : uint256());
    WriteUint256(out, localEntropy);
    WriteLE64(out, timestamp);
    WriteUint256(out, combinedHash);
}

std::vector<uint8_t> MultiSourceEntropy::Serialize() const {
    std::vector<uint8_t> out;
    out.reserve(SERIALIZED_SIZE);
    SerializeTo(out);
    return out;
}

bool MultiSourceEntropy::Unserialize(CByteReader& reader, MultiSourceEntropy& out) {
    uint8_t beaconFlag = 0;
    uint256 beacon;
    if (!reader.ReadHash(out.blockchainEntropy)) return false;
    if (!reader.ReadU8(beaconFlag)) return false;
    if (!reader.ReadHash(beacon)) return false;
    if (!reader.ReadHash(out.localEntropy)) return false;
    if (!reader.ReadU64(out.timestamp)) return false;
    if (!reader.ReadHash(out.combinedHash)) return false;

    // Canonical encoding only: flag is 0/1 and an absent beacon is all zeros.
    if (beaconFlag == 1) {
        out.beaconEntropy = beacon;
    } else if (beaconFlag == 0 && beacon.IsNull()) {
        out.beaconEntropy.reset();
    } else {
        return false;
    }
    return true;
}

std::optional<MultiSourceEntropy> MultiSourceEntropy::Deserialize(const std::vector<uint8_t>& data) {
    CByteReader reader(data);
    MultiSourceEntropy e;
    if (!Unserialize(reader, e) || !reader.AtEnd()) {
        return std::nullopt;
    }
    return e;
}

bool MultiSourceEntropy::operator==(const MultiSourceEntropy& other) const {
    return blockchainEntropy == other.blockchainEntropy &&
           beaconEntropy == other.beaconEntropy &&
           localEntropy == other.localEntropy &&
           timestamp == other.timestamp &&
           combinedHash == other.combinedHash;
}

bool CombineEntropy(const std::vector<uint8_t>& blockchainEntropy,
                    const std::optional<std::vector<uint8_t>>& beaconEntropy,
                    MultiSourceEntropy& out,
                    EntropyError& error)
{
    if (blockchainEntropy.empty()) {
        error = EntropyError::MISSING_BLOCKCHAIN_SOURCE;
        LogPrintEntropy(WARN, "CombineEntropy: blockchain entropy source is empty");
        return false;
    }
    if (blockchainEntropy.size() != 32) {
        error = EntropyError::MALFORMED_SOURCE;
        LogPrintEntropy(WARN, "CombineEntropy: blockchain entropy is %zu bytes, expected 32",
                        blockchainEntropy.size());
        return false;
    }
    if (beaconEntropy && beaconEntropy->size() != 32) {
        error = EntropyError::MALFORMED_SOURCE;
        LogPrintEntropy(WARN, "CombineEntropy: beacon entropy is %zu bytes, expected 32",
                        beaconEntropy->size());
        return false;
    }

    uint256 local;
    if (!GetStrongRandBytes(local.data, 32)) {
        error = EntropyError::RNG_FAILURE;
        LogPrintEntropy(ERROR, "CombineEntropy: failed to read OS randomness");
        return false;
    }

    std::optional<uint256> beacon;
    if (beaconEntropy) {
        beacon = uint256(beaconEntropy->data());
    }

    out = CombineEntropyWithLocal(uint256(blockchainEntropy.data()), beacon, local, NowMillis());
    error = EntropyError::NONE;

    LogPrintEntropy(DEBUG, "Combined entropy %s (beacon %s)",
                    out.combinedHash.GetHex().c_str(), beacon ? "present" : "absent");
    return true;
}

MultiSourceEntropy CombineEntropyWithLocal(const uint256& blockchainEntropy,
                                           const std::optional<uint256>& beaconEntropy,
                                           const uint256& localEntropy,
                                           uint64_t timestamp)
{
    MultiSourceEntropy e;
    e.blockchainEntropy = blockchainEntropy;
    e.beaconEntropy = beaconEntropy;
    e.localEntropy = localEntropy;
    e.timestamp = timestamp;
    e.combinedHash = ComputeCombinedHash(blockchainEntropy, beaconEntropy, localEntropy, timestamp);
    return e;
}

uint256 DeriveVDFInput(const MultiSourceEntropy& entropy, const uint256& proverKey) {
    uint8_t preimage[64];
    std::memcpy(preimage, entropy.combinedHash.data, 32);
    std::memcpy(preimage + 32, proverKey.data, 32);

    uint256 input;
    SHA3_256(preimage, sizeof(preimage), input.data);
    return input;
}
