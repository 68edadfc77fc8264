/**
 * @file TestCbor.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include <boost/algorithm/hex.hpp>
#include "codec/Cbor.h"
#include <sstream>
#include <string>
#include <vector>

static std::vector<uint8_t> FromHex(const std::string & hexString) {
    std::vector<uint8_t> bytes;
    boost::algorithm::unhex(hexString, std::back_inserter(bytes));
    return bytes;
}

static std::string ToDiagnostic(const CborItem & item) {
    std::ostringstream oss;
    oss << item;
    return oss.str();
}

//encode, compare with the expected bytes, then decode and compare with the item
static void CheckEncodeDecode(const CborItem & item, const std::string & expectedHex) {
    const std::vector<uint8_t> expected = FromHex(expectedHex);
    const std::vector<uint8_t> encoded = Cbor::Encode(item);
    BOOST_REQUIRE_MESSAGE(encoded == expected, "encoding of " << ToDiagnostic(item) << " should be " << expectedHex);
    CborItem decoded;
    uint64_t numBytesTakenToDecode;
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(Cbor::Decode(encoded, decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(numBytesTakenToDecode, encoded.size());
    BOOST_REQUIRE_EQUAL(decoded, item);
}

static BP7_ERROR_CODE DecodeExpectingFailure(const std::string & hexString) {
    const std::vector<uint8_t> bytes = FromHex(hexString);
    CborItem decoded;
    uint64_t numBytesTakenToDecode;
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
    BOOST_REQUIRE_MESSAGE(!Cbor::Decode(bytes, decoded, numBytesTakenToDecode, errorCode), hexString << " should not decode");
    return errorCode;
}

BOOST_AUTO_TEST_CASE(CborIntegerTestCase)
{
    CheckEncodeDecode(CborItem::Uint(0), "00");
    CheckEncodeDecode(CborItem::Uint(23), "17");
    CheckEncodeDecode(CborItem::Uint(24), "1818");
    CheckEncodeDecode(CborItem::Uint(100), "1864");
    CheckEncodeDecode(CborItem::Uint(1000), "1903e8");
    CheckEncodeDecode(CborItem::Uint(1000000), "1a000f4240");
    CheckEncodeDecode(CborItem::Uint(1000000000000), "1b000000e8d4a51000");
    CheckEncodeDecode(CborItem::Uint(UINT64_MAX), "1bffffffffffffffff");
    CheckEncodeDecode(CborItem::Int(-1), "20");
    CheckEncodeDecode(CborItem::Int(-10), "29");
    CheckEncodeDecode(CborItem::Int(-100), "3863");
    CheckEncodeDecode(CborItem::Int(-1000), "3903e7");
    CheckEncodeDecode(CborItem::NegativeFromArgument(UINT64_MAX), "3bffffffffffffffff");

    BOOST_REQUIRE_EQUAL(Cbor::GetHeadSize(23), 1);
    BOOST_REQUIRE_EQUAL(Cbor::GetHeadSize(24), 2);
    BOOST_REQUIRE_EQUAL(Cbor::GetHeadSize(UINT16_MAX), 3);
    BOOST_REQUIRE_EQUAL(Cbor::GetHeadSize(UINT32_MAX), 5);
    BOOST_REQUIRE_EQUAL(Cbor::GetHeadSize(UINT64_MAX), 9);

    int64_t value;
    BOOST_REQUIRE(CborItem::Int(-1000).GetInt64(value));
    BOOST_REQUIRE_EQUAL(value, -1000);
    BOOST_REQUIRE(!CborItem::Uint(UINT64_MAX).GetInt64(value));
    BOOST_REQUIRE(!CborItem::TextString("1").GetInt64(value));
    BOOST_REQUIRE_EQUAL(ToDiagnostic(CborItem::NegativeFromArgument(UINT64_MAX)), "-18446744073709551616");
}

BOOST_AUTO_TEST_CASE(CborStringsAndSimpleValuesTestCase)
{
    CheckEncodeDecode(CborItem::Bool(false), "f4");
    CheckEncodeDecode(CborItem::Bool(true), "f5");
    CheckEncodeDecode(CborItem::Null(), "f6");
    CheckEncodeDecode(CborItem::Undefined(), "f7");
    CheckEncodeDecode(CborItem::Simple(255), "f8ff");
    CheckEncodeDecode(CborItem::ByteString(std::vector<uint8_t>()), "40");
    CheckEncodeDecode(CborItem::ByteString(FromHex("01020304")), "4401020304");
    CheckEncodeDecode(CborItem::TextString(""), "60");
    CheckEncodeDecode(CborItem::TextString("a"), "6161");
    CheckEncodeDecode(CborItem::TextString("IETF"), "6449455446");
    CheckEncodeDecode(CborItem::TextString("\xc3\xbc"), "62c3bc"); //u-umlaut
    CheckEncodeDecode(CborItem::Tag(1, CborItem::Uint(1363896240)), "c11a514b67b0");

    BOOST_REQUIRE(CborItem::Bool(true).IsBool());
    BOOST_REQUIRE(!CborItem::Null().IsBool());
    BOOST_REQUIRE(CborItem::Null().IsNull());
    BOOST_REQUIRE_EQUAL(ToDiagnostic(CborItem::ByteString(FromHex("0aff"))), "h'0aff'");
    BOOST_REQUIRE_EQUAL(ToDiagnostic(CborItem::TextString("IETF")), "\"IETF\"");
}

BOOST_AUTO_TEST_CASE(CborArraysAndMapsTestCase)
{
    CheckEncodeDecode(CborItem::Array(), "80");
    {
        CborItem a = CborItem::Array();
        a.Append(CborItem::Uint(1)).Append(CborItem::Uint(2)).Append(CborItem::Uint(3));
        CheckEncodeDecode(a, "83010203");
    }
    {
        //[1, [2, 3], [4, 5]]
        CborItem inner1 = CborItem::Array();
        inner1.Append(CborItem::Uint(2)).Append(CborItem::Uint(3));
        CborItem inner2 = CborItem::Array();
        inner2.Append(CborItem::Uint(4)).Append(CborItem::Uint(5));
        CborItem a = CborItem::Array();
        a.Append(CborItem::Uint(1)).Append(inner1).Append(inner2);
        CheckEncodeDecode(a, "8301820203820405");
        BOOST_REQUIRE_EQUAL(ToDiagnostic(a), "[1, [2, 3], [4, 5]]");
    }
    {
        //a 25 element array needs a one byte length argument
        CborItem a = CborItem::Array();
        std::string expectedHex("9819");
        for (unsigned int i = 1; i <= 25; ++i) {
            a.Append(CborItem::Uint(i));
            expectedHex += (i < 24) ? "" : "18";
            static const char * const hexDigits = "0123456789abcdef";
            expectedHex += hexDigits[i >> 4];
            expectedHex += hexDigits[i & 0xf];
        }
        CheckEncodeDecode(a, expectedHex);
    }
    CheckEncodeDecode(CborItem::Map(), "a0");
    {
        CborItem m = CborItem::Map();
        m.AddMapEntry(CborItem::Uint(1), CborItem::Uint(2));
        m.AddMapEntry(CborItem::Uint(3), CborItem::Uint(4));
        CheckEncodeDecode(m, "a201020304");
        BOOST_REQUIRE_EQUAL(m.GetMapSize(), 2);
    }
    {
        //{"a": 1, "b": [2, 3]}
        CborItem b = CborItem::Array();
        b.Append(CborItem::Uint(2)).Append(CborItem::Uint(3));
        CborItem m = CborItem::Map();
        m.AddMapEntry(CborItem::TextString("a"), CborItem::Uint(1));
        m.AddMapEntry(CborItem::TextString("b"), std::move(b));
        CheckEncodeDecode(m, "a26161016162820203");
    }
}

BOOST_AUTO_TEST_CASE(CborDeterministicMapOrderTestCase)
{
    //keys sorted bytewise by their encoded form regardless of insertion order: 1 (01) < 10 (0a) < -1 (20) < "a" (6161)
    CborItem m1 = CborItem::Map();
    m1.AddMapEntry(CborItem::TextString("a"), CborItem::Uint(4));
    m1.AddMapEntry(CborItem::Int(-1), CborItem::Uint(3));
    m1.AddMapEntry(CborItem::Uint(10), CborItem::Uint(2));
    m1.AddMapEntry(CborItem::Uint(1), CborItem::Uint(1));
    CborItem m2 = CborItem::Map();
    m2.AddMapEntry(CborItem::Uint(1), CborItem::Uint(1));
    m2.AddMapEntry(CborItem::Uint(10), CborItem::Uint(2));
    m2.AddMapEntry(CborItem::Int(-1), CborItem::Uint(3));
    m2.AddMapEntry(CborItem::TextString("a"), CborItem::Uint(4));
    BOOST_REQUIRE_EQUAL(m1, m2);
    BOOST_REQUIRE(Cbor::Encode(m1) == FromHex("a401010a0220036161" "04"));
    BOOST_REQUIRE(Cbor::Encode(m1) == Cbor::Encode(m2));

    //a received map in non-sorted order decodes to the same item
    CborItem decoded;
    uint64_t numBytesTakenToDecode;
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(Cbor::Decode(FromHex("a46161042003" "0a020101"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(decoded, m1);
}

BOOST_AUTO_TEST_CASE(CborLargeMapDecodeTestCase)
{
    //keys on the wire in descending order
    static constexpr uint64_t NUM_ENTRIES = 20000;
    std::vector<uint8_t> serialization;
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::MAP, NUM_ENTRIES, serialization);
    for (uint64_t i = 0; i < NUM_ENTRIES; ++i) {
        const uint64_t key = NUM_ENTRIES - 1 - i;
        Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, key, serialization);
        Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, key * 2, serialization);
    }
    CborItem decoded;
    uint64_t numBytesTakenToDecode;
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(Cbor::Decode(serialization, decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(numBytesTakenToDecode, serialization.size());
    BOOST_REQUIRE_EQUAL(decoded.GetMapSize(), NUM_ENTRIES);
    for (uint64_t i = 0; i < NUM_ENTRIES; ++i) {
        BOOST_REQUIRE_EQUAL(decoded.m_items[i * 2].m_value, i);
        BOOST_REQUIRE_EQUAL(decoded.m_items[(i * 2) + 1].m_value, i * 2);
    }

    //same item as one built entry by entry
    CborItem built = CborItem::Map();
    for (uint64_t i = 0; i < NUM_ENTRIES; ++i) {
        built.AddMapEntry(CborItem::Uint(i), CborItem::Uint(i * 2));
    }
    BOOST_REQUIRE_EQUAL(decoded, built);

    //repeated keys keep their wire order
    BOOST_REQUIRE(Cbor::Decode(FromHex("a3" "0201" "0103" "0104"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(decoded.GetMapSize(), 3);
    BOOST_REQUIRE_EQUAL(decoded.m_items[1].m_value, 3);
    BOOST_REQUIRE_EQUAL(decoded.m_items[3].m_value, 4);
    BOOST_REQUIRE_EQUAL(decoded.m_items[5].m_value, 1);
}

BOOST_AUTO_TEST_CASE(CborIndefiniteAndNonMinimalDecodeTestCase)
{
    CborItem decoded;
    uint64_t numBytesTakenToDecode;
    BP7_ERROR_CODE errorCode;

    //[_ 1, [2, 3], [_ 4, 5]] keeps its framing on re-encode
    const std::vector<uint8_t> indefiniteArray = FromHex("9f018202039f0405ffff");
    BOOST_REQUIRE(Cbor::Decode(indefiniteArray, decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(numBytesTakenToDecode, indefiniteArray.size());
    BOOST_REQUIRE(decoded.m_isIndefiniteLength);
    BOOST_REQUIRE_EQUAL(decoded.m_items.size(), 3);
    BOOST_REQUIRE(!decoded.m_items[1].m_isIndefiniteLength);
    BOOST_REQUIRE(decoded.m_items[2].m_isIndefiniteLength);
    BOOST_REQUIRE_EQUAL(ToDiagnostic(decoded), "[_ 1, [2, 3], [_ 4, 5]]");
    BOOST_REQUIRE(Cbor::Encode(decoded) == indefiniteArray);

    CborItem built = CborItem::IndefiniteArray();
    built.Append(CborItem::Uint(1));
    BOOST_REQUIRE(Cbor::Encode(built) == FromHex("9f01ff"));

    //(_ h'0102', h'030405')
    BOOST_REQUIRE(Cbor::Decode(FromHex("5f42010243030405ff"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(numBytesTakenToDecode, 9);
    BOOST_REQUIRE_EQUAL(decoded, CborItem::ByteString(FromHex("0102030405")));

    //(_ "strea", "ming")
    BOOST_REQUIRE(Cbor::Decode(FromHex("7f657374726561646d696e67ff"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(decoded.GetTextString(), "streaming");

    //{_ "a": 1}
    BOOST_REQUIRE(Cbor::Decode(FromHex("bf616101ff"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE(decoded.IsMap());
    BOOST_REQUIRE_EQUAL(decoded.GetMapSize(), 1);

    //non-minimal heads are accepted and re-encoded minimally
    BOOST_REQUIRE(Cbor::Decode(FromHex("1800"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(decoded, CborItem::Uint(0));
    BOOST_REQUIRE(Cbor::Encode(decoded) == FromHex("00"));
    BOOST_REQUIRE(Cbor::Decode(FromHex("1b0000000000000001"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE_EQUAL(decoded, CborItem::Uint(1));
    BOOST_REQUIRE(Cbor::Decode(FromHex("990001" "01"), decoded, numBytesTakenToDecode, errorCode));
    BOOST_REQUIRE(decoded.IsArrayOfSize(1));
}

BOOST_AUTO_TEST_CASE(CborMalformedDecodeTestCase)
{
    //floating point is not supported
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("f93c00"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("fa47c35000"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    //reserved additional information values
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("1c"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("5d"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    //stray break and indefinite length integers
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("ff"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("8201ff"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("1f"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    //two byte simple value below 32
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("f810"), BP7_ERROR_CODE::MALFORMED_ENCODING);
    //indefinite string chunk of the wrong major type
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("5f6161ff"), BP7_ERROR_CODE::MALFORMED_ENCODING);

    //truncated input
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure(""), BP7_ERROR_CODE::TRUNCATED_INPUT);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("1a0000"), BP7_ERROR_CODE::TRUNCATED_INPUT);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("6261"), BP7_ERROR_CODE::TRUNCATED_INPUT);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("830102"), BP7_ERROR_CODE::TRUNCATED_INPUT);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("9f0102"), BP7_ERROR_CODE::TRUNCATED_INPUT);
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure("5bffffffffffffffff00"), BP7_ERROR_CODE::TRUNCATED_INPUT);

    //excessive nesting
    std::string deeplyNested;
    for (unsigned int i = 0; i < (Cbor::MAX_NESTING_DEPTH + 2); ++i) {
        deeplyNested += "81";
    }
    deeplyNested += "00";
    BOOST_REQUIRE_EQUAL(DecodeExpectingFailure(deeplyNested), BP7_ERROR_CODE::MALFORMED_ENCODING);
}

BOOST_AUTO_TEST_CASE(CborDecodeAllTestCase)
{
    std::vector<CborItem> items;
    BP7_ERROR_CODE errorCode;
    const std::vector<uint8_t> sequence = FromHex("01" "6161" "820203");
    BOOST_REQUIRE(Cbor::DecodeAll(sequence.data(), sequence.size(), items, errorCode));
    BOOST_REQUIRE_EQUAL(items.size(), 3);
    BOOST_REQUIRE_EQUAL(items[0], CborItem::Uint(1));
    BOOST_REQUIRE_EQUAL(items[1].GetTextString(), "a");
    BOOST_REQUIRE(items[2].IsArrayOfSize(2));

    const std::vector<uint8_t> trailingPartial = FromHex("01" "6261");
    BOOST_REQUIRE(!Cbor::DecodeAll(trailingPartial.data(), trailingPartial.size(), items, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::TRUNCATED_INPUT);

    BOOST_REQUIRE(Cbor::DecodeAll(NULL, 0, items, errorCode));
    BOOST_REQUIRE(items.empty());
}
