// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Storage Commitment Tests
 *
 * Commitment hashing, structural and selection checks, the chunk audit path
 * and file-backed chunk access.
 */

#include <boost/test/unit_test.hpp>

#include <commitment/commitment.h>
#include <storage/file_storage.h>
#include <test/util/fakes.h>
#include <util/strencodings.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <functional>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

// 20 full chunks plus a short tail
const size_t TEST_FILE_SIZE = 20 * 4096 + 100;
const uint64_t TEST_TOTAL_CHUNKS = 21;

struct CommitmentFixture {
    CMemoryStorage storage{MakeTestData(TEST_FILE_SIZE)};
    CKey key = TestKey(0xA1);
    uint256 proverKey = key.GetPubKey().GetKey();
    uint256 blockHash = FilledHash(0xB2);
    StorageCommitment commitment = MakeTestCommitment(key, storage, 100, blockHash);
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(commitment_tests, CommitmentFixture)

BOOST_AUTO_TEST_CASE(valid_commitment_verifies) {
    BOOST_CHECK(VerifyIntegrity(commitment));
    BOOST_CHECK(VerifyCommitment(commitment, blockHash, TEST_TOTAL_CHUNKS) == CommitmentError::NONE);
    BOOST_CHECK(VerifyChunkData(commitment, storage));
    BOOST_CHECK_EQUAL(commitment.selectedChunks.size(), Consensus::CHUNKS_PER_BLOCK);
}

BOOST_AUTO_TEST_CASE(every_field_is_bound) {
    std::vector<std::function<void(StorageCommitment&)>> mutations = {
        [](StorageCommitment& c) { c.proverKey.data[0] ^= 1; },
        [](StorageCommitment& c) { c.dataHash.data[0] ^= 1; },
        [](StorageCommitment& c) { c.blockHeight++; },
        [](StorageCommitment& c) { c.blockHash.data[0] ^= 1; },
        [](StorageCommitment& c) { c.selectedChunks[3] ^= 1; },
        [](StorageCommitment& c) { c.chunkHashes[7].data[9] ^= 1; },
        [](StorageCommitment& c) { c.vdfProof.outputState.data[0] ^= 1; },
        [](StorageCommitment& c) { c.vdfProof.computationTimeMs++; },
        [](StorageCommitment& c) { c.vdfProof.memoryAccessSamples[0].offset++; },
        [](StorageCommitment& c) { c.entropy.localEntropy.data[0] ^= 1; },
        [](StorageCommitment& c) { c.entropy.beaconEntropy = FilledHash(0x01); },
        [](StorageCommitment& c) { c.entropy.timestamp++; },
    };

    for (size_t i = 0; i < mutations.size(); i++) {
        StorageCommitment c = commitment;
        mutations[i](c);
        BOOST_CHECK_MESSAGE(!VerifyIntegrity(c), "mutation " << i << " not detected");
    }

    StorageCommitment c = commitment;
    c.commitmentHash.data[31] ^= 1;
    BOOST_CHECK(!VerifyIntegrity(c));
}

BOOST_AUTO_TEST_CASE(malformed_fields) {
    StorageCommitment c = commitment;
    c.chunkHashes.pop_back();
    c.commitmentHash = ComputeCommitmentHash(c);
    BOOST_CHECK(VerifyCommitment(c, blockHash, TEST_TOTAL_CHUNKS) == CommitmentError::MALFORMED_FIELDS);

    // Consistent lengths, wrong count
    c = commitment;
    c.chunkHashes.pop_back();
    c.selectedChunks.pop_back();
    c.commitmentHash = ComputeCommitmentHash(c);
    BOOST_CHECK(VerifyCommitment(c, blockHash, TEST_TOTAL_CHUNKS) == CommitmentError::MALFORMED_FIELDS);
    BOOST_CHECK(VerifyCommitment(c, blockHash, TEST_TOTAL_CHUNKS, 15) == CommitmentError::NONE);
}

BOOST_AUTO_TEST_CASE(integrity_checked_before_selection) {
    StorageCommitment c = commitment;
    c.dataHash.data[0] ^= 1;
    BOOST_CHECK(VerifyCommitment(c, blockHash, TEST_TOTAL_CHUNKS) == CommitmentError::INTEGRITY_MISMATCH);

    // Tampered and against the wrong block: integrity is reported first
    BOOST_CHECK(VerifyCommitment(c, FilledHash(0), TEST_TOTAL_CHUNKS) == CommitmentError::INTEGRITY_MISMATCH);
}

BOOST_AUTO_TEST_CASE(selection_mismatch_cases) {
    // Verifier holds a different block for this height
    BOOST_CHECK(VerifyCommitment(commitment, FilledHash(0xB3), TEST_TOTAL_CHUNKS) ==
                CommitmentError::SELECTION_MISMATCH);

    // Selection re-run against another file size
    BOOST_CHECK(VerifyCommitment(commitment, blockHash, TEST_TOTAL_CHUNKS + 1) ==
                CommitmentError::SELECTION_MISMATCH);

    // Entropy whose combined hash does not recompute, rehashed commitment
    StorageCommitment c = commitment;
    c.entropy.timestamp++;
    c.commitmentHash = ComputeCommitmentHash(c);
    BOOST_CHECK(VerifyCommitment(c, blockHash, TEST_TOTAL_CHUNKS) == CommitmentError::SELECTION_MISMATCH);

    // Prover picked its own chunks and rehashed
    c = commitment;
    std::swap(c.selectedChunks[0], c.selectedChunks[1]);
    std::swap(c.chunkHashes[0], c.chunkHashes[1]);
    c.commitmentHash = ComputeCommitmentHash(c);
    BOOST_CHECK(VerifyIntegrity(c));
    BOOST_CHECK(VerifyCommitment(c, blockHash, TEST_TOTAL_CHUNKS) == CommitmentError::SELECTION_MISMATCH);
}

BOOST_AUTO_TEST_CASE(chunk_data_audit) {
    // Corrupt a byte inside the first selected chunk
    storage.Corrupt(commitment.selectedChunks[0] * 4096);
    BOOST_CHECK(!VerifyChunkData(commitment, storage));
    // Commitment structure is untouched by the data change
    BOOST_CHECK(VerifyCommitment(commitment, blockHash, TEST_TOTAL_CHUNKS) == CommitmentError::NONE);
}

BOOST_AUTO_TEST_CASE(chunk_data_read_failure) {
    storage.FailChunk(commitment.selectedChunks.back());
    BOOST_CHECK(!VerifyChunkData(commitment, storage));
}

BOOST_AUTO_TEST_CASE(unselected_corruption_not_detected_by_audit) {
    // Find a chunk outside the selection and corrupt it
    uint64_t unselected = 0;
    while (std::find(commitment.selectedChunks.begin(), commitment.selectedChunks.end(), unselected) !=
           commitment.selectedChunks.end()) {
        unselected++;
    }
    storage.Corrupt(unselected * 4096);
    BOOST_CHECK(VerifyChunkData(commitment, storage));
}

BOOST_AUTO_TEST_CASE(serialize_roundtrip_and_rejects) {
    std::vector<uint8_t> bytes = commitment.Serialize();
    auto decoded = StorageCommitment::Deserialize(bytes);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == commitment);
    BOOST_CHECK(VerifyIntegrity(*decoded));

    std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 1);
    BOOST_CHECK(!StorageCommitment::Deserialize(truncated));

    std::vector<uint8_t> trailing = bytes;
    trailing.push_back(0);
    BOOST_CHECK(!StorageCommitment::Deserialize(trailing));

    // Chunk count far beyond the buffer
    std::vector<uint8_t> huge = bytes;
    huge[104] = 0xff;
    huge[105] = 0xff;
    huge[106] = 0xff;
    BOOST_CHECK(!StorageCommitment::Deserialize(huge));

    // Signature longer than Ed25519 allows
    std::vector<uint8_t> longSig = bytes;
    const size_t sigLenAt = bytes.size() - CPubKey::SIGNATURE_SIZE - 4;
    BOOST_REQUIRE_EQUAL(longSig[sigLenAt], CPubKey::SIGNATURE_SIZE);
    longSig[sigLenAt] = CPubKey::SIGNATURE_SIZE + 1;
    longSig.push_back(0);
    BOOST_CHECK(!StorageCommitment::Deserialize(longSig));

    // Unsigned commitments still round trip
    StorageCommitment unsignedCommitment = commitment;
    unsignedCommitment.signature.clear();
    decoded = StorageCommitment::Deserialize(unsignedCommitment.Serialize());
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(decoded->signature.empty());
    BOOST_CHECK(!(*decoded == commitment));

    BOOST_CHECK(!StorageCommitment::Deserialize(std::vector<uint8_t>()));
}

BOOST_AUTO_TEST_CASE(signature_binds_hash_to_prover) {
    BOOST_CHECK_EQUAL(commitment.signature.size(), CPubKey::SIGNATURE_SIZE);
    BOOST_CHECK(VerifyCommitmentSignature(commitment));

    // Signature is outside the hash
    BOOST_CHECK_EQUAL(ComputeCommitmentHash(commitment), commitment.commitmentHash);

    // Any change to the hashed content needs a fresh signature
    StorageCommitment c = commitment;
    c.blockHeight++;
    c.commitmentHash = ComputeCommitmentHash(c);
    BOOST_CHECK(VerifyIntegrity(c));
    BOOST_CHECK(!VerifyCommitmentSignature(c));
    BOOST_REQUIRE(SignCommitment(c, key));
    BOOST_CHECK(VerifyCommitmentSignature(c));

    // Only the named prover's key can sign
    c = commitment;
    BOOST_CHECK(!SignCommitment(c, TestKey(0xA2)));
    BOOST_CHECK(c.signature == commitment.signature);
    CKey unset;
    BOOST_CHECK(!SignCommitment(c, unset));

    // Re-keying needs the new prover's signature
    c.proverKey = ChainKey(0xA2);
    c.commitmentHash = ComputeCommitmentHash(c);
    BOOST_CHECK(!VerifyCommitmentSignature(c));
    BOOST_REQUIRE(SignCommitment(c, TestKey(0xA2)));
    BOOST_CHECK(VerifyCommitmentSignature(c));

    c = commitment;
    c.signature.pop_back();
    BOOST_CHECK(!VerifyCommitmentSignature(c));
    c.signature.clear();
    BOOST_CHECK(!VerifyCommitmentSignature(c));
    c = commitment;
    c.signature[63] ^= 0x80;
    BOOST_CHECK(!VerifyCommitmentSignature(c));
}

BOOST_AUTO_TEST_CASE(ed25519_rfc8032_vector) {
    // RFC 8032 section 7.1, test 1 seed and public key
    const std::vector<uint8_t> seed = ParseHex("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    CKey rfcKey;
    BOOST_REQUIRE(rfcKey.Set(seed.data(), seed.data() + seed.size()));
    BOOST_CHECK_EQUAL(rfcKey.GetPubKey().GetKey().GetHex(),
                      "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

    std::vector<unsigned char> sig;
    const uint256 msg = FilledHash(0x42);
    BOOST_REQUIRE(rfcKey.Sign(msg, sig));
    BOOST_CHECK(rfcKey.GetPubKey().Verify(msg, sig));
    BOOST_CHECK(!rfcKey.GetPubKey().Verify(FilledHash(0x43), sig));
    BOOST_CHECK(!CPubKey().Verify(msg, sig));

    CKey shortKey;
    BOOST_CHECK(!shortKey.Set(seed.data(), seed.data() + 31));
    BOOST_CHECK(!shortKey.IsValid());
}

BOOST_AUTO_TEST_CASE(file_chunk_storage) {
    char name[] = "/tmp/continuity_data_XXXXXX";
    int fd = mkstemp(name);
    BOOST_REQUIRE(fd >= 0);
    close(fd);

    std::vector<uint8_t> data = MakeTestData(TEST_FILE_SIZE, 7);
    {
        std::ofstream out(name, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    CFileChunkStorage file(name);
    BOOST_REQUIRE(file.IsOpen());
    BOOST_CHECK_EQUAL(file.GetFileSize(), TEST_FILE_SIZE);

    std::vector<uint8_t> chunk;
    BOOST_REQUIRE(file.ReadChunk(3, 4096, chunk));
    BOOST_CHECK(std::equal(chunk.begin(), chunk.end(), data.begin() + 3 * 4096));
    BOOST_CHECK_EQUAL(chunk.size(), 4096u);

    BOOST_REQUIRE(file.ReadChunk(20, 4096, chunk));
    BOOST_CHECK_EQUAL(chunk.size(), 100u);

    BOOST_CHECK(!file.ReadChunk(21, 4096, chunk));
    BOOST_CHECK(chunk.empty());
    BOOST_CHECK(!file.ReadChunk(0, 0, chunk));

    // Same bytes as the in-memory double
    CMemoryStorage memory(data);
    StorageCommitment c = MakeTestCommitment(key, memory, 5, blockHash);
    BOOST_CHECK(VerifyChunkData(c, file));

    std::remove(name);

    CFileChunkStorage missing(name);
    BOOST_CHECK(!missing.IsOpen());
    BOOST_CHECK(!missing.ReadChunk(0, 4096, chunk));
}

BOOST_AUTO_TEST_SUITE_END() // commitment_tests
