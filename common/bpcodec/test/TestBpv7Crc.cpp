/**
 * @file TestBpv7Crc.cpp
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
#include "codec/Bpv7Crc.h"
#include <string>
#include <cstring>
#include <vector>

BOOST_AUTO_TEST_CASE(Bpv7CrcCheckValueTestCase)
{
    //standard catalogue check values for "123456789"
    static const std::string checkString("123456789");
    const uint8_t * data = reinterpret_cast<const uint8_t*>(checkString.data());
    BOOST_REQUIRE_EQUAL(Bpv7Crc::Crc16_X25_Unaligned(data, checkString.size()), 0x906E);
    BOOST_REQUIRE_EQUAL(Bpv7Crc::Crc32C_Unaligned(data, checkString.size()), 0xE3069283);
}

BOOST_AUTO_TEST_CASE(Bpv7CrcTestCase)
{
    static const std::vector<std::string> MESSAGE_STRINGS = { "TheQuickBrownFoxJumpsOverTheLazyDog.", "Short", "Length08" };
    //verified with https://crccalc.com/ (no spaces allowed on this site).. also verified with http://www.sunshine2k.de/coding/javascript/crc/crc_js.html
    static const std::vector<uint32_t> EXPECTED_CRC32C_VEC = { 0xAE76DF21 , 0x7B6BE32C, 0x73C00CF6 };
    static const std::vector<uint16_t> EXPECTED_CRC16_X25_VEC = { 0x2870 , 0x62B8, 0x46F5 };
    std::vector<uint8_t> cborSerialization(10); //need to be 3 bytes for crc16 or 5 bytes for crc32
    Crc32c_InOrderChunks crc32cTxInOrderChunks;

    for (std::size_t messageIndex = 0; messageIndex < MESSAGE_STRINGS.size(); ++messageIndex) {
        const std::string & messageStr = MESSAGE_STRINGS[messageIndex];
        std::vector<uint8_t> changedAlignmentMessageVec(messageStr.size() + 20);
        const uint32_t expectedCrc32C = EXPECTED_CRC32C_VEC[messageIndex];
        const uint16_t expectedCrc16_X25 = EXPECTED_CRC16_X25_VEC[messageIndex];
        for (std::size_t i = 0; i < 9; ++i) {
            uint8_t * dataStart = &changedAlignmentMessageVec[i];
            memcpy(dataStart, messageStr.data(), messageStr.length());
            const uint16_t crc16 = Bpv7Crc::Crc16_X25_Unaligned(dataStart, messageStr.length());
            BOOST_REQUIRE_EQUAL(expectedCrc16_X25, crc16);

            const uint32_t crc32 = Bpv7Crc::Crc32C_Unaligned(dataStart, messageStr.length());
            BOOST_REQUIRE_EQUAL(expectedCrc32C, crc32);

            crc32cTxInOrderChunks.Reset();
            crc32cTxInOrderChunks.AddUnalignedBytes(dataStart, messageStr.length());
            BOOST_REQUIRE_EQUAL(expectedCrc32C, crc32cTxInOrderChunks.FinalizeAndGet());
            crc32cTxInOrderChunks.Reset();
            crc32cTxInOrderChunks.AddUnalignedBytes(dataStart, 1);
            crc32cTxInOrderChunks.AddUnalignedBytes(dataStart + 1, messageStr.length() - 1);
            BOOST_REQUIRE_EQUAL(expectedCrc32C, crc32cTxInOrderChunks.FinalizeAndGet());
        }

        //cbor serialize then deserialize crc16
        BOOST_REQUIRE_EQUAL(Bpv7Crc::SerializeCrc16ForBpv7(&cborSerialization[0], expectedCrc16_X25), 3);
        BOOST_REQUIRE_EQUAL(cborSerialization[0], 0x42);
        BOOST_REQUIRE_EQUAL(cborSerialization[1], static_cast<uint8_t>(expectedCrc16_X25 >> 8));
        BOOST_REQUIRE_EQUAL(cborSerialization[2], static_cast<uint8_t>(expectedCrc16_X25));
        uint16_t deserializedCrc16;
        uint8_t numBytesTakenToDecode;
        BOOST_REQUIRE(Bpv7Crc::DeserializeCrc16ForBpv7(cborSerialization.data(), &numBytesTakenToDecode, deserializedCrc16));
        BOOST_REQUIRE_EQUAL(numBytesTakenToDecode, 3);
        BOOST_REQUIRE_EQUAL(deserializedCrc16, expectedCrc16_X25);

        //cbor serialize then deserialize crc32
        BOOST_REQUIRE_EQUAL(Bpv7Crc::SerializeCrc32ForBpv7(&cborSerialization[0], expectedCrc32C), 5);
        BOOST_REQUIRE_EQUAL(cborSerialization[0], 0x44);
        BOOST_REQUIRE_EQUAL(cborSerialization[1], static_cast<uint8_t>(expectedCrc32C >> 24));
        BOOST_REQUIRE_EQUAL(cborSerialization[4], static_cast<uint8_t>(expectedCrc32C));
        uint32_t deserializedCrc32;
        BOOST_REQUIRE(Bpv7Crc::DeserializeCrc32ForBpv7(cborSerialization.data(), &numBytesTakenToDecode, deserializedCrc32));
        BOOST_REQUIRE_EQUAL(numBytesTakenToDecode, 5);
        BOOST_REQUIRE_EQUAL(deserializedCrc32, expectedCrc32C);

        std::vector<uint8_t> appended;
        Bpv7Crc::AppendCrc16ForBpv7(appended, expectedCrc16_X25);
        Bpv7Crc::AppendCrc32ForBpv7(appended, expectedCrc32C);
        BOOST_REQUIRE_EQUAL(appended.size(), 8);
        BOOST_REQUIRE_EQUAL(appended[0], 0x42);
        BOOST_REQUIRE_EQUAL(appended[3], 0x44);
    }

    //wrong cbor head
    const uint8_t notACrc16[3] = { 0x44, 0, 0 };
    uint16_t crc16Unused;
    uint8_t numBytesUnused;
    BOOST_REQUIRE(!Bpv7Crc::DeserializeCrc16ForBpv7(notACrc16, &numBytesUnused, crc16Unused));
}

BOOST_AUTO_TEST_CASE(Bpv7CrcBlockPatchAndVerifyTestCase)
{
    for (unsigned int crcTypeInt = 1; crcTypeInt <= 2; ++crcTypeInt) {
        const BPV7_CRC_TYPE crcType = static_cast<BPV7_CRC_TYPE>(crcTypeInt);
        const unsigned int crcSize = Bpv7Crc::GetCrcSizeBytes(crcType);
        //[1, 2, h'0000'] or [1, 2, h'00000000']
        std::vector<uint8_t> block = { 0x83, 0x01, 0x02, static_cast<uint8_t>(0x40 | crcSize) };
        block.insert(block.end(), crcSize, 0);
        Bpv7Crc::ComputeAndPatchBlockCrc(block.data(), block.size(), crcType);

        BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
        BOOST_REQUIRE(Bpv7Crc::VerifyBlockCrc(block.data(), block.size(), false, crcType, errorCode));

        block[2] ^= 0x01;
        BOOST_REQUIRE(!Bpv7Crc::VerifyBlockCrc(block.data(), block.size(), false, crcType, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::CRC_MISMATCH);
    }
    BOOST_REQUIRE_EQUAL(Bpv7Crc::GetCrcSizeBytes(BPV7_CRC_TYPE::NONE), 0);
    BOOST_REQUIRE(Bpv7Crc::IsValidCrcType(0));
    BOOST_REQUIRE(Bpv7Crc::IsValidCrcType(2));
    BOOST_REQUIRE(!Bpv7Crc::IsValidCrcType(3));
}
