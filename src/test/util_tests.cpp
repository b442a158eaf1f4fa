// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Utility Tests
 *
 * Hex encoding, uint256, little-endian serialization and the bounds-checked
 * byte reader.
 */

#include <boost/test/unit_test.hpp>

#include <uint256.h>
#include <util/serialize.h>
#include <util/strencodings.h>

#include <sstream>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(util_tests)

/**
 * Test Suite 1: Hex Encoding
 */
BOOST_AUTO_TEST_SUITE(hex_tests)

BOOST_AUTO_TEST_CASE(hexstr_basic) {
    std::vector<uint8_t> data{0x00, 0x01, 0xab, 0xff};
    BOOST_CHECK_EQUAL(HexStr(data), "0001abff");
    BOOST_CHECK_EQUAL(HexStr(std::vector<uint8_t>()), "");
}

BOOST_AUTO_TEST_CASE(parsehex_roundtrip) {
    std::vector<uint8_t> parsed = ParseHex("DEADbeef00");
    std::vector<uint8_t> expected{0xde, 0xad, 0xbe, 0xef, 0x00};
    BOOST_CHECK_EQUAL_COLLECTIONS(parsed.begin(), parsed.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(parsehex_invalid) {
    BOOST_CHECK(ParseHex("abc").empty());       // Odd length
    BOOST_CHECK(ParseHex("zz").empty());        // Not hex
    BOOST_CHECK(ParseHex("").empty());
    BOOST_CHECK(!IsHex("0x12"));
    BOOST_CHECK(IsHex("0a1B"));
}

BOOST_AUTO_TEST_CASE(strprintf_formats) {
    BOOST_CHECK_EQUAL(strprintf("%s=%d", "n", 42), "n=42");
}

BOOST_AUTO_TEST_SUITE_END() // hex_tests

/**
 * Test Suite 2: uint256
 */
BOOST_AUTO_TEST_SUITE(uint256_tests)

BOOST_AUTO_TEST_CASE(uint256_default_null) {
    uint256 h;
    BOOST_CHECK(h.IsNull());
    h.data[31] = 1;
    BOOST_CHECK(!h.IsNull());
    h.SetNull();
    BOOST_CHECK(h.IsNull());
}

BOOST_AUTO_TEST_CASE(uint256_hex_byte_order) {
    const std::string hex = "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20";
    uint256 h = uint256::FromHex(hex);
    BOOST_CHECK_EQUAL(h.data[0], 0x01);
    BOOST_CHECK_EQUAL(h.data[31], 0x20);
    BOOST_CHECK_EQUAL(h.GetHex(), hex);

    std::ostringstream os;
    os << h;
    BOOST_CHECK_EQUAL(os.str(), hex);
}

BOOST_AUTO_TEST_CASE(uint256_sethex_prefix_and_errors) {
    uint256 h;
    BOOST_CHECK(h.SetHex("0x" + std::string(64, 'f')));
    BOOST_CHECK_EQUAL(h.data[0], 0xff);

    BOOST_CHECK(!h.SetHex(std::string(62, 'a')));
    BOOST_CHECK(h.IsNull());
    BOOST_CHECK(!h.SetHex(std::string(63, 'a') + "g"));
    BOOST_CHECK(h.IsNull());
}

BOOST_AUTO_TEST_CASE(uint256_uint64_le) {
    uint256 h;
    h.data[0] = 0x01;
    h.data[1] = 0x02;
    h.data[7] = 0x80;
    h.data[8] = 0xff;   // Outside the first word
    BOOST_CHECK_EQUAL(h.GetUint64LE(), 0x8000000000000201ULL);
}

BOOST_AUTO_TEST_CASE(uint256_ordering) {
    uint256 a, b;
    a.data[0] = 1;
    b.data[0] = 2;
    BOOST_CHECK(a < b);
    BOOST_CHECK(!(b < a));
    BOOST_CHECK(a != b);
}

BOOST_AUTO_TEST_SUITE_END() // uint256_tests

/**
 * Test Suite 3: Serialization
 */
BOOST_AUTO_TEST_SUITE(serialize_tests)

BOOST_AUTO_TEST_CASE(write_little_endian) {
    std::vector<uint8_t> out;
    WriteLE32(out, 0x04030201);
    WriteLE64(out, 0x0c0b0a0908070605ULL);
    BOOST_CHECK_EQUAL(HexStr(out), "0102030405060708090a0b0c");

    // In-place variant writes into a fixed preimage without touching neighbours
    uint8_t buf[6] = {0xff, 0, 0, 0, 0, 0xff};
    WriteLE32(buf + 1, 0xdeadbeef);
    BOOST_CHECK_EQUAL(HexStr(std::vector<uint8_t>(buf, buf + 6)), "ffefbeaddeff");
}

BOOST_AUTO_TEST_CASE(reader_reads_in_order) {
    std::vector<uint8_t> buf;
    buf.push_back(0x7f);
    WriteLE32(buf, 123456);
    WriteLE64(buf, 9876543210ULL);
    uint256 h = uint256::FromHex(std::string(64, 'c'));
    WriteUint256(buf, h);

    CByteReader reader(buf);
    uint8_t u8 = 0;
    uint32_t u32 = 0;
    uint64_t u64 = 0;
    uint256 hash;
    BOOST_CHECK(reader.ReadU8(u8));
    BOOST_CHECK(reader.ReadU32(u32));
    BOOST_CHECK(reader.ReadU64(u64));
    BOOST_CHECK(reader.ReadHash(hash));
    BOOST_CHECK(reader.AtEnd());

    BOOST_CHECK_EQUAL(u8, 0x7f);
    BOOST_CHECK_EQUAL(u32, 123456u);
    BOOST_CHECK_EQUAL(u64, 9876543210ULL);
    BOOST_CHECK_EQUAL(hash, h);
}

BOOST_AUTO_TEST_CASE(reader_truncation) {
    std::vector<uint8_t> buf{1, 2, 3};
    CByteReader reader(buf);
    uint32_t u32 = 0;
    BOOST_CHECK(!reader.ReadU32(u32));
    BOOST_CHECK_EQUAL(reader.Remaining(), 3u);

    uint8_t u8 = 0;
    BOOST_CHECK(reader.ReadU8(u8));
    uint256 hash;
    BOOST_CHECK(!reader.ReadHash(hash));
    BOOST_CHECK_EQUAL(reader.Position(), 1u);
}

BOOST_AUTO_TEST_SUITE_END() // serialize_tests

BOOST_AUTO_TEST_SUITE_END() // util_tests
