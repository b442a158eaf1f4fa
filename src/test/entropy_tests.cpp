// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Entropy Tests
 *
 * Multi-source combination, VDF input derivation and the entropy record
 * encoding.
 */

#include <boost/test/unit_test.hpp>

#include <entropy/entropy.h>
#include <test/util/fakes.h>

#include <optional>
#include <vector>

namespace {

const uint64_t TEST_TIMESTAMP = 1700000000000ULL;

MultiSourceEntropy FixtureEntropy(std::optional<uint256> beacon = std::nullopt) {
    return CombineEntropyWithLocal(FilledHash(0x01), beacon, FilledHash(0x02), TEST_TIMESTAMP);
}

} // namespace

BOOST_AUTO_TEST_SUITE(entropy_tests)

BOOST_AUTO_TEST_CASE(combined_hash_known_answer) {
    MultiSourceEntropy e = FixtureEntropy();
    BOOST_CHECK_EQUAL(e.combinedHash.GetHex(),
                      "15d78ed01877e90baaefc2c0991867707bad320d6139040477ebd439f812ca65");
    BOOST_CHECK(e.IsConsistent());
    BOOST_CHECK(!e.beaconEntropy);
}

BOOST_AUTO_TEST_CASE(combined_hash_with_beacon) {
    MultiSourceEntropy e = FixtureEntropy(FilledHash(0xbb));
    BOOST_CHECK_EQUAL(e.combinedHash.GetHex(),
                      "3b967d86608e4b660ef7b29058032bc0a6740b802f27a00c56ee4be76588a5dd");
    BOOST_CHECK(e.IsConsistent());
}

BOOST_AUTO_TEST_CASE(absent_beacon_equals_zero_layout) {
    // An absent beacon hashes as 32 zero bytes; the flag is not in the preimage
    uint256 absent = ComputeCombinedHash(FilledHash(1), std::nullopt, FilledHash(2), 5);
    uint256 zeros = ComputeCombinedHash(FilledHash(1), uint256(), FilledHash(2), 5);
    BOOST_CHECK_EQUAL(absent, zeros);
}

BOOST_AUTO_TEST_CASE(derive_vdf_input_known_answer) {
    MultiSourceEntropy e = FixtureEntropy();
    BOOST_CHECK_EQUAL(DeriveVDFInput(e, FilledHash(0x03)).GetHex(),
                      "b3b0e62c6ae5a3a0796a20c8e3e3f07296ac8c98ffe918be8af3b16fcf143e51");
    BOOST_CHECK(DeriveVDFInput(e, FilledHash(0x03)) != DeriveVDFInput(e, FilledHash(0x04)));
}

BOOST_AUTO_TEST_CASE(every_source_changes_the_hash) {
    uint256 base = FixtureEntropy().combinedHash;
    BOOST_CHECK(ComputeCombinedHash(FilledHash(0x09), std::nullopt, FilledHash(0x02), TEST_TIMESTAMP) != base);
    BOOST_CHECK(ComputeCombinedHash(FilledHash(0x01), FilledHash(0x09), FilledHash(0x02), TEST_TIMESTAMP) != base);
    BOOST_CHECK(ComputeCombinedHash(FilledHash(0x01), std::nullopt, FilledHash(0x09), TEST_TIMESTAMP) != base);
    BOOST_CHECK(ComputeCombinedHash(FilledHash(0x01), std::nullopt, FilledHash(0x02), TEST_TIMESTAMP + 1) != base);
}

BOOST_AUTO_TEST_CASE(tampered_field_is_inconsistent) {
    MultiSourceEntropy e = FixtureEntropy();
    e.localEntropy.data[0] ^= 1;
    BOOST_CHECK(!e.IsConsistent());

    e = FixtureEntropy();
    e.beaconEntropy = uint256();
    // Zero beacon present or absent hashes the same; still consistent
    BOOST_CHECK(e.IsConsistent());

    e = FixtureEntropy();
    e.timestamp++;
    BOOST_CHECK(!e.IsConsistent());
}

BOOST_AUTO_TEST_CASE(combine_entropy_uses_fresh_local_source) {
    std::vector<uint8_t> chain(32, 0x01);
    MultiSourceEntropy a, b;
    EntropyError error = EntropyError::RNG_FAILURE;

    BOOST_REQUIRE(CombineEntropy(chain, std::nullopt, a, error));
    BOOST_CHECK(error == EntropyError::NONE);
    BOOST_REQUIRE(CombineEntropy(chain, std::vector<uint8_t>(32, 0xbb), b, error));

    BOOST_CHECK(a.IsConsistent());
    BOOST_CHECK(b.IsConsistent());
    BOOST_CHECK(a.localEntropy != b.localEntropy);
    BOOST_CHECK(a.combinedHash != b.combinedHash);
    BOOST_CHECK(!a.beaconEntropy);
    BOOST_REQUIRE(b.beaconEntropy);
    BOOST_CHECK_EQUAL(*b.beaconEntropy, FilledHash(0xbb));
    BOOST_CHECK(a.timestamp > TEST_TIMESTAMP);
}

BOOST_AUTO_TEST_CASE(combine_entropy_rejects_bad_sources) {
    MultiSourceEntropy out;
    EntropyError error = EntropyError::NONE;

    BOOST_CHECK(!CombineEntropy(std::vector<uint8_t>(), std::nullopt, out, error));
    BOOST_CHECK(error == EntropyError::MISSING_BLOCKCHAIN_SOURCE);

    BOOST_CHECK(!CombineEntropy(std::vector<uint8_t>(31, 1), std::nullopt, out, error));
    BOOST_CHECK(error == EntropyError::MALFORMED_SOURCE);

    BOOST_CHECK(!CombineEntropy(std::vector<uint8_t>(32, 1), std::vector<uint8_t>(33, 2), out, error));
    BOOST_CHECK(error == EntropyError::MALFORMED_SOURCE);

    BOOST_CHECK_EQUAL(std::string(EntropyErrorToString(EntropyError::MISSING_BLOCKCHAIN_SOURCE)),
                      "missing blockchain entropy source");
}

BOOST_AUTO_TEST_CASE(serialize_layout) {
    MultiSourceEntropy e = FixtureEntropy(FilledHash(0xbb));
    std::vector<uint8_t> bytes = e.Serialize();
    BOOST_REQUIRE_EQUAL(bytes.size(), MultiSourceEntropy::SERIALIZED_SIZE);
    BOOST_CHECK_EQUAL(bytes[0], 0x01);
    BOOST_CHECK_EQUAL(bytes[32], 1);     // Beacon flag
    BOOST_CHECK_EQUAL(bytes[33], 0xbb);
    BOOST_CHECK_EQUAL(bytes[65], 0x02);

    auto decoded = MultiSourceEntropy::Deserialize(bytes);
    BOOST_REQUIRE(decoded);
    BOOST_CHECK(*decoded == e);
}

BOOST_AUTO_TEST_CASE(deserialize_rejects_non_canonical) {
    std::vector<uint8_t> bytes = FixtureEntropy().Serialize();
    BOOST_REQUIRE(MultiSourceEntropy::Deserialize(bytes));

    // Flag other than 0/1
    std::vector<uint8_t> bad = bytes;
    bad[32] = 2;
    BOOST_CHECK(!MultiSourceEntropy::Deserialize(bad));

    // Absent beacon with non-zero filler
    bad = bytes;
    bad[40] = 0x77;
    BOOST_CHECK(!MultiSourceEntropy::Deserialize(bad));

    // Truncated and oversized
    bad = bytes;
    bad.pop_back();
    BOOST_CHECK(!MultiSourceEntropy::Deserialize(bad));
    bad = bytes;
    bad.push_back(0);
    BOOST_CHECK(!MultiSourceEntropy::Deserialize(bad));
}

BOOST_AUTO_TEST_SUITE_END() // entropy_tests
