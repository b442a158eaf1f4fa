// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Prover Tests
 *
 * End-to-end commitment generation, pipeline failure statuses and the
 * proving worker pool.
 */

#include <boost/test/unit_test.hpp>

#include <prover/prover.h>
#include <prover/proving_queue.h>
#include <test/util/fakes.h>
#include <verifier/proof_verifier.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Exactly CHUNKS_PER_BLOCK chunks
const size_t MIN_FILE_SIZE = 16 * 4096;

ProverConfig TestProverConfig(uint64_t iterations = 300) {
    ProverConfig config;
    config.vdf = TestVDFConfig();
    config.vdf_iterations = iterations;
    return config;
}

struct ProverFixture {
    CFakeBlockchainSource blockchain;
    CMemoryStorage storage{MakeTestData(MIN_FILE_SIZE + 5000, 9)};
    CKey key = TestKey(0xE7);
    uint256 proverKey = key.GetPubKey().GetKey();

    ProverFixture() {
        blockchain.AddBlock(7, FilledHash(0x70));
        blockchain.AddBlock(8, FilledHash(0x80));
        blockchain.SetEntropy(std::vector<uint8_t>(32, 0x88));
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(prover_tests, ProverFixture)

BOOST_AUTO_TEST_CASE(generate_commitment_verifies) {
    CStorageProver prover(key, blockchain, storage, TestProverConfig());
    StorageCommitment c;
    std::string error;
    BOOST_REQUIRE_MESSAGE(prover.GenerateCommitment(c, error) == ProverStatus::OK, error);

    BOOST_CHECK_EQUAL(c.proverKey, proverKey);
    BOOST_CHECK_EQUAL(c.blockHeight, 8u);
    BOOST_CHECK_EQUAL(c.blockHash, FilledHash(0x80));
    BOOST_CHECK_EQUAL(c.entropy.blockchainEntropy, FilledHash(0x88));
    BOOST_CHECK(!c.entropy.beaconEntropy);
    BOOST_CHECK_EQUAL(c.vdfProof.iterations, 300u);
    BOOST_CHECK(VerifyIntegrity(c));
    BOOST_CHECK_EQUAL(c.signature.size(), CPubKey::SIGNATURE_SIZE);
    BOOST_CHECK(VerifyCommitmentSignature(c));

    uint256 dataHash;
    BOOST_REQUIRE(ComputeDataHash(storage, 4096, dataHash));
    BOOST_CHECK_EQUAL(c.dataHash, dataHash);

    CProofVerifier verifier(blockchain, TestVerifierConfig());
    VerificationResult result = verifier.VerifyFullProof(c, proverKey, ChunkCountForSize(storage.GetFileSize(), 4096));
    BOOST_CHECK_MESSAGE(result.valid, result.ToString());
    BOOST_CHECK(VerifyChunkData(c, storage));
}

BOOST_AUTO_TEST_CASE(fresh_entropy_each_round) {
    CStorageProver prover(key, blockchain, storage, TestProverConfig());
    StorageCommitment a, b;
    std::string error;
    BOOST_REQUIRE(prover.GenerateCommitment(a, error) == ProverStatus::OK);
    BOOST_REQUIRE(prover.GenerateCommitment(b, error) == ProverStatus::OK);

    BOOST_CHECK(a.entropy.localEntropy != b.entropy.localEntropy);
    BOOST_CHECK(a.vdfProof.inputState != b.vdfProof.inputState);
    BOOST_CHECK(a.commitmentHash != b.commitmentHash);
    BOOST_CHECK_EQUAL(a.dataHash, b.dataHash);
}

BOOST_AUTO_TEST_CASE(beacon_entropy_is_mixed_in) {
    CFakeBeaconSource beacon(std::vector<uint8_t>(32, 0xbe));
    CStorageProver prover(key, blockchain, storage, TestProverConfig(), &beacon);
    StorageCommitment c;
    std::string error;
    BOOST_REQUIRE(prover.GenerateCommitment(c, error) == ProverStatus::OK);
    BOOST_REQUIRE(c.entropy.beaconEntropy);
    BOOST_CHECK_EQUAL(*c.entropy.beaconEntropy, FilledHash(0xbe));
    BOOST_CHECK(c.entropy.IsConsistent());

    // Beacon with nothing to offer this round
    CFakeBeaconSource silent(std::nullopt);
    CStorageProver fallback(key, blockchain, storage, TestProverConfig(), &silent);
    BOOST_REQUIRE(fallback.GenerateCommitment(c, error) == ProverStatus::OK);
    BOOST_CHECK(!c.entropy.beaconEntropy);
}

BOOST_AUTO_TEST_CASE(pipeline_failures) {
    StorageCommitment c;
    std::string error;

    CFakeBlockchainSource empty;
    CStorageProver noChain(key, empty, storage, TestProverConfig());
    BOOST_CHECK(noChain.GenerateCommitment(c, error) == ProverStatus::CHAIN_UNAVAILABLE);
    BOOST_CHECK(!error.empty());

    CFakeBlockchainSource noEntropy;
    noEntropy.AddBlock(1, FilledHash(1));
    CStorageProver missingEntropy(key, noEntropy, storage, TestProverConfig());
    BOOST_CHECK(missingEntropy.GenerateCommitment(c, error) == ProverStatus::ENTROPY_FAILED);
    BOOST_CHECK_EQUAL(error, "missing blockchain entropy source");

    CFakeBeaconSource badBeacon(std::vector<uint8_t>(31, 0));
    CStorageProver malformed(key, blockchain, storage, TestProverConfig(), &badBeacon);
    BOOST_CHECK(malformed.GenerateCommitment(c, error) == ProverStatus::ENTROPY_FAILED);

    CMemoryStorage small(MakeTestData(MIN_FILE_SIZE - 4096));
    CStorageProver tooSmall(key, blockchain, small, TestProverConfig());
    BOOST_CHECK(tooSmall.GenerateCommitment(c, error) == ProverStatus::SELECTION_FAILED);

    CMemoryStorage broken(MakeTestData(MIN_FILE_SIZE));
    for (uint64_t i = 0; i < 16; i++) broken.FailChunk(i);
    CStorageProver unreadable(key, blockchain, broken, TestProverConfig());
    BOOST_CHECK(unreadable.GenerateCommitment(c, error) == ProverStatus::STORAGE_FAILED);

    CStorageProver noRounds(key, blockchain, storage, TestProverConfig(0));
    BOOST_CHECK(noRounds.GenerateCommitment(c, error) == ProverStatus::VDF_FAILED);

    CKey unset;
    CStorageProver keyless(unset, blockchain, storage, TestProverConfig());
    BOOST_CHECK(keyless.GenerateCommitment(c, error) == ProverStatus::SIGNING_FAILED);
    BOOST_CHECK_EQUAL(ProverStatusToString(ProverStatus::SIGNING_FAILED), "signing failed");
}

BOOST_AUTO_TEST_CASE(cancelled_prover) {
    ProverConfig config = TestProverConfig(100000);
    config.vdf.cancel_check_interval = 100;
    CStorageProver prover(key, blockchain, storage, config);

    std::atomic<bool> cancel{true};
    StorageCommitment c;
    std::string error;
    BOOST_CHECK(prover.GenerateCommitment(c, error, &cancel) == ProverStatus::CANCELLED);
}

BOOST_AUTO_TEST_CASE(data_hash_covers_every_chunk) {
    std::vector<uint8_t> data = MakeTestData(3 * 4096 + 17, 4);
    CMemoryStorage memory(data);
    uint256 hash;
    BOOST_REQUIRE(ComputeDataHash(memory, 4096, hash));
    BOOST_CHECK_EQUAL(hash, SHA3_256(data));
    BOOST_CHECK_EQUAL(memory.ReadCount(), 4u);

    memory.FailChunk(3);
    BOOST_CHECK(!ComputeDataHash(memory, 4096, hash));
}

/**
 * Test Suite: Proving Queue
 */
BOOST_AUTO_TEST_CASE(queue_runs_jobs) {
    CProvingQueue queue(2);
    BOOST_REQUIRE(queue.Start());
    BOOST_CHECK(!queue.Start());
    BOOST_CHECK(queue.IsRunning());

    auto prover = std::make_shared<const CStorageProver>(key, blockchain, storage, TestProverConfig());
    std::vector<std::future<ProvingResult>> futures;
    for (int i = 0; i < 6; i++) {
        futures.push_back(queue.Submit("chain-" + std::to_string(i), prover));
    }

    CProofVerifier verifier(blockchain, TestVerifierConfig());
    for (size_t i = 0; i < futures.size(); i++) {
        ProvingResult result = futures[i].get();
        BOOST_CHECK_EQUAL(result.chainId, "chain-" + std::to_string(i));
        BOOST_REQUIRE_MESSAGE(result.status == ProverStatus::OK, result.error);
        BOOST_CHECK(verifier.VerifyFullProof(result.commitment, proverKey,
                                             ChunkCountForSize(storage.GetFileSize(), 4096)).valid);
    }

    queue.Stop();
    BOOST_CHECK(!queue.IsRunning());
    CProvingQueue::Stats stats = queue.GetStats();
    BOOST_CHECK_EQUAL(stats.total_submitted, 6u);
    BOOST_CHECK_EQUAL(stats.total_completed, 6u);
    BOOST_CHECK_EQUAL(stats.total_failed, 0u);
    BOOST_CHECK_EQUAL(queue.GetQueueDepth(), 0u);
}

BOOST_AUTO_TEST_CASE(queue_failures_reported) {
    CProvingQueue queue(1);
    BOOST_REQUIRE(queue.Start());

    CMemoryStorage small(MakeTestData(4096));
    auto failing = std::make_shared<const CStorageProver>(key, blockchain, small, TestProverConfig());
    ProvingResult result = queue.Submit("small", failing).get();
    BOOST_CHECK(result.status == ProverStatus::SELECTION_FAILED);
    BOOST_CHECK(!result.error.empty());

    // Invalid VDF configuration surfaces as an exception through the future
    ProverConfig bad = TestProverConfig();
    bad.vdf.memory_bytes = 16;
    auto throwing = std::make_shared<const CStorageProver>(key, blockchain, storage, bad);
    std::future<ProvingResult> future = queue.Submit("bad", throwing);
    BOOST_CHECK_THROW(future.get(), std::invalid_argument);

    // Null prover is never queued
    BOOST_CHECK(queue.Submit("null", nullptr).get().status == ProverStatus::CANCELLED);

    queue.Stop();
    BOOST_CHECK_EQUAL(queue.GetStats().total_failed, 2u);
}

BOOST_AUTO_TEST_CASE(queue_stop_cancels_work) {
    ProverConfig config = TestProverConfig(1000000000ULL);
    config.vdf.cancel_check_interval = 1000;
    auto slow = std::make_shared<const CStorageProver>(key, blockchain, storage, config);

    CProvingQueue queue(2);
    BOOST_REQUIRE(queue.Start());
    std::vector<std::future<ProvingResult>> futures;
    for (int i = 0; i < 5; i++) {
        futures.push_back(queue.Submit("slow-" + std::to_string(i), slow));
    }
    queue.Stop();

    for (auto& f : futures) {
        BOOST_REQUIRE(f.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        BOOST_CHECK(f.get().status == ProverStatus::CANCELLED);
    }
    BOOST_CHECK_EQUAL(queue.GetStats().total_cancelled, 5u);

    // Not running: submissions resolve at once
    BOOST_CHECK(queue.Submit("late", slow).get().status == ProverStatus::CANCELLED);
}

BOOST_AUTO_TEST_CASE(queue_requires_threads) {
    BOOST_CHECK_THROW(CProvingQueue(0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END() // prover_tests
