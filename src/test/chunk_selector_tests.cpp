// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Chunk Selection Tests
 */

#include <boost/test/unit_test.hpp>

#include <selection/chunk_selector.h>
#include <test/util/fakes.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(chunk_selector_tests)

BOOST_AUTO_TEST_CASE(select_known_answer) {
    std::vector<uint64_t> out;
    SelectionError error;
    BOOST_REQUIRE(SelectChunks(uint256(), 1000000, 16, out, error));
    BOOST_CHECK(error == SelectionError::NONE);

    std::vector<uint64_t> expected{525501, 251653, 375206, 495381, 64747, 451480, 227042, 15578,
                                   483101, 417325, 977836, 52702, 571585, 915580, 649918, 290934};
    BOOST_CHECK_EQUAL_COLLECTIONS(out.begin(), out.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(select_skips_duplicates) {
    // 16 of 16 needs many draws; the result is a permutation in draw order
    std::vector<uint64_t> out;
    SelectionError error;
    BOOST_REQUIRE(SelectChunks(uint256(), 16, 16, out, error));

    std::vector<uint64_t> expected{13, 5, 6, 11, 8, 2, 10, 12, 14, 1, 15, 4, 9, 7, 3, 0};
    BOOST_CHECK_EQUAL_COLLECTIONS(out.begin(), out.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(select_unique_and_in_range) {
    for (uint8_t b = 0; b < 20; b++) {
        std::vector<uint64_t> out;
        SelectionError error;
        BOOST_REQUIRE(SelectChunks(FilledHash(b), 40, 16, out, error));
        BOOST_CHECK_EQUAL(out.size(), 16u);
        std::set<uint64_t> unique(out.begin(), out.end());
        BOOST_CHECK_EQUAL(unique.size(), out.size());
        BOOST_CHECK(*std::max_element(out.begin(), out.end()) < 40u);
    }
}

BOOST_AUTO_TEST_CASE(select_prefix_property) {
    // Asking for fewer indices returns a prefix of the longer selection
    std::vector<uint64_t> three, sixteen;
    SelectionError error;
    BOOST_REQUIRE(SelectChunks(uint256(), 20, 3, three, error));
    BOOST_REQUIRE(SelectChunks(uint256(), 20, 16, sixteen, error));
    BOOST_CHECK(std::equal(three.begin(), three.end(), sixteen.begin()));

    std::vector<uint64_t> expected{1, 13, 6};
    BOOST_CHECK_EQUAL_COLLECTIONS(three.begin(), three.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(select_insufficient_chunks) {
    std::vector<uint64_t> out{99};
    SelectionError error = SelectionError::NONE;

    BOOST_CHECK(!SelectChunks(uint256(), 15, 16, out, error));
    BOOST_CHECK(error == SelectionError::INSUFFICIENT_CHUNKS);
    BOOST_CHECK(out.empty());

    BOOST_CHECK(!SelectChunks(uint256(), 0, 1, out, error));
    BOOST_CHECK(error == SelectionError::INSUFFICIENT_CHUNKS);

    BOOST_CHECK(!SelectChunks(uint256(), 100, 0, out, error));
    BOOST_CHECK(error == SelectionError::INSUFFICIENT_CHUNKS);
}

BOOST_AUTO_TEST_CASE(select_from_entropy) {
    MultiSourceEntropy e = CombineEntropyWithLocal(FilledHash(1), std::nullopt, FilledHash(2), 7);
    std::vector<uint64_t> fromEntropy, fromSeed;
    SelectionError error;
    BOOST_REQUIRE(SelectChunks(e, 5000, fromEntropy, error));
    BOOST_REQUIRE(SelectChunks(e.combinedHash, 5000, Consensus::CHUNKS_PER_BLOCK, fromSeed, error));
    BOOST_CHECK(fromEntropy == fromSeed);
    BOOST_CHECK_EQUAL(fromEntropy.size(), Consensus::CHUNKS_PER_BLOCK);
}

BOOST_AUTO_TEST_CASE(verify_selection_order_matters) {
    MultiSourceEntropy e = CombineEntropyWithLocal(FilledHash(1), std::nullopt, FilledHash(2), 7);
    std::vector<uint64_t> selected;
    SelectionError error;
    BOOST_REQUIRE(SelectChunks(e, 5000, selected, error));
    BOOST_CHECK(VerifySelection(e, 5000, selected));

    std::vector<uint64_t> swapped = selected;
    std::swap(swapped[0], swapped[1]);
    BOOST_CHECK(!VerifySelection(e, 5000, swapped));

    std::vector<uint64_t> foreign = selected;
    foreign[5] = (foreign[5] + 1) % 5000;
    BOOST_CHECK(!VerifySelection(e, 5000, foreign));

    // Same indices against a different file size
    BOOST_CHECK(!VerifySelection(e, 5001, selected));
    BOOST_CHECK(!VerifySelection(e, 5000, std::vector<uint64_t>()));

    MultiSourceEntropy other = e;
    other.combinedHash.data[0] ^= 1;
    BOOST_CHECK(!VerifySelection(other, 5000, selected));
}

BOOST_AUTO_TEST_CASE(chunk_count_for_size) {
    BOOST_CHECK_EQUAL(ChunkCountForSize(0, 4096), 0u);
    BOOST_CHECK_EQUAL(ChunkCountForSize(1, 4096), 1u);
    BOOST_CHECK_EQUAL(ChunkCountForSize(4096, 4096), 1u);
    BOOST_CHECK_EQUAL(ChunkCountForSize(4097, 4096), 2u);
    BOOST_CHECK_EQUAL(ChunkCountForSize(65536, 4096), 16u);
    BOOST_CHECK_THROW(ChunkCountForSize(100, 0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END() // chunk_selector_tests
