/**
 * @file TestBundleV7.cpp
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
#include "codec/BundleV7.h"
#include <map>
#include <string>
#include <vector>

static const std::string HELLO_STRING("Hello, DTN!");

static Bpv7Bundle CreateHelloBundle(BPV7_CRC_TYPE crcType) {
    Bpv7Bundle bundle;
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
    BOOST_REQUIRE(Bpv7Bundle::Create(EndpointId::Ipn(1, 1), EndpointId::Ipn(2, 1), EndpointId::Ipn(1, 0),
        std::vector<uint8_t>(HELLO_STRING.begin(), HELLO_STRING.end()), 3600000,
        BPV7_BUNDLEFLAG::NO_FLAGS_SET, bundle, errorCode, NULL, crcType));
    return bundle;
}

BOOST_AUTO_TEST_CASE(BundleV7CreateAndRoundTripTestCase)
{
    for (unsigned int crcTypeInt = 0; crcTypeInt <= 2; ++crcTypeInt) {
        const Bpv7Bundle bundle = CreateHelloBundle(static_cast<BPV7_CRC_TYPE>(crcTypeInt));
        BOOST_REQUIRE_EQUAL(bundle.m_canonicalBlocks.size(), 1);
        const Bpv7CanonicalBlock * payloadBlock = bundle.GetPayloadBlock();
        BOOST_REQUIRE(payloadBlock != NULL);
        BOOST_REQUIRE_EQUAL(payloadBlock->m_blockNumber, 1);
        BOOST_REQUIRE_EQUAL(bundle.GetPayloadLength(), HELLO_STRING.size());
        BOOST_REQUIRE(!bundle.m_primaryBlock.IsFragment());
        BOOST_REQUIRE_EQUAL(bundle.m_primaryBlock.m_lifetimeMilliseconds, 3600000);
        BOOST_REQUIRE_NE(bundle.m_primaryBlock.m_creationTimestamp.millisecondsSinceStartOfYear2000, 0);

        const std::vector<uint8_t> serialization = bundle.Serialize();
        BOOST_REQUIRE_EQUAL(serialization.front(), 0x9f);
        BOOST_REQUIRE_EQUAL(serialization.back(), 0xff);

        Bpv7Bundle decoded;
        BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
        BOOST_REQUIRE(Bpv7Bundle::Deserialize(serialization, decoded, errorCode));
        BOOST_REQUIRE_EQUAL(decoded, bundle);
        const Bpv7CanonicalBlock * decodedPayloadBlock = decoded.GetPayloadBlock();
        BOOST_REQUIRE(decodedPayloadBlock != NULL);
        BOOST_REQUIRE_EQUAL(std::string(decodedPayloadBlock->m_blockTypeSpecificData.begin(),
            decodedPayloadBlock->m_blockTypeSpecificData.end()), HELLO_STRING);
        BOOST_REQUIRE(decoded.Serialize() == serialization);
    }
}

BOOST_AUTO_TEST_CASE(BundleV7CreateInvalidTestCase)
{
    Bpv7Bundle bundle;
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
    const std::vector<uint8_t> payload(10, 0x55);
    BOOST_REQUIRE(!Bpv7Bundle::Create(EndpointId::Ipn(1, 1), EndpointId::Ipn(2, 1), EndpointId::DtnNone(),
        payload, 0, BPV7_BUNDLEFLAG::NO_FLAGS_SET, bundle, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_ARGUMENT);
    errorCode = BP7_ERROR_CODE::NONE;
    BOOST_REQUIRE(!Bpv7Bundle::Create(EndpointId::Ipn(1, 1), EndpointId::Ipn(2, 1), EndpointId::DtnNone(),
        payload, -5, BPV7_BUNDLEFLAG::NO_FLAGS_SET, bundle, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_ARGUMENT);
    errorCode = BP7_ERROR_CODE::NONE;
    BOOST_REQUIRE(!Bpv7Bundle::Create(EndpointId::Ipn(1, 1), EndpointId::Ipn(2, 1), EndpointId::DtnNone(),
        payload, 1000, static_cast<BPV7_BUNDLEFLAG>(0x8), bundle, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_ARGUMENT);

    //anonymous bundles carry a zero creation timestamp
    BOOST_REQUIRE(Bpv7Bundle::Create(EndpointId::DtnNone(), EndpointId::Ipn(2, 1), EndpointId::DtnNone(),
        payload, 1000, BPV7_BUNDLEFLAG::ISFRAGMENT, bundle, errorCode));
    BOOST_REQUIRE_EQUAL(bundle.m_primaryBlock.m_creationTimestamp, TimestampUtil::bpv7_creation_timestamp_t(0, 0));
    BOOST_REQUIRE(!bundle.m_primaryBlock.IsFragment());
}

BOOST_AUTO_TEST_CASE(BundleV7TimestampsIncreaseTestCase)
{
    TimestampUtil::Bpv7CreationTimestampGenerator generator;
    std::vector<Bpv7BundleId> ids;
    for (unsigned int i = 0; i < 100; ++i) {
        Bpv7Bundle bundle;
        BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
        BOOST_REQUIRE(Bpv7Bundle::Create(EndpointId::Ipn(1, 1), EndpointId::Ipn(2, 1), EndpointId::DtnNone(),
            std::vector<uint8_t>(1, static_cast<uint8_t>(i)), 1000, BPV7_BUNDLEFLAG::NO_FLAGS_SET, bundle, errorCode, &generator));
        ids.push_back(bundle.GetBundleId());
    }
    for (std::size_t i = 1; i < ids.size(); ++i) {
        BOOST_REQUIRE(ids[i - 1] < ids[i]);
        BOOST_REQUIRE(ids[i - 1] != ids[i]);
    }
}

BOOST_AUTO_TEST_CASE(BundleV7ExtensionBlocksTestCase)
{
    Bpv7Bundle bundle = CreateHelloBundle(BPV7_CRC_TYPE::CRC32C);
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
    BOOST_REQUIRE_EQUAL(bundle.GetNextFreeBlockNumber(), 2);
    BOOST_REQUIRE(bundle.AddExtensionBlock(Bpv7HopCountBlockData(10, 0).ToCanonicalBlock(), errorCode));
    BOOST_REQUIRE(bundle.AddExtensionBlock(Bpv7BundleAgeBlockData(0).ToCanonicalBlock(), errorCode));
    Bpv7CanonicalBlock previousNodeBlock = Bpv7PreviousNodeBlockData(EndpointId::Ipn(9, 0)).ToCanonicalBlock();
    previousNodeBlock.m_blockNumber = 10;
    BOOST_REQUIRE(bundle.AddExtensionBlock(std::move(previousNodeBlock), errorCode));

    BOOST_REQUIRE_EQUAL(bundle.m_canonicalBlocks.size(), 4);
    BOOST_REQUIRE_EQUAL(bundle.m_canonicalBlocks[0].m_blockNumber, 2);
    BOOST_REQUIRE_EQUAL(bundle.m_canonicalBlocks[1].m_blockNumber, 3);
    BOOST_REQUIRE_EQUAL(bundle.m_canonicalBlocks[2].m_blockNumber, 10);
    BOOST_REQUIRE(bundle.m_canonicalBlocks.back().IsPayloadBlock());
    BOOST_REQUIRE_EQUAL(bundle.GetNextFreeBlockNumber(), 11);
    BOOST_REQUIRE_EQUAL(bundle.GetCanonicalBlocksByType(BPV7_BLOCK_TYPE_CODE::HOP_COUNT).size(), 1);
    BOOST_REQUIRE(bundle.GetCanonicalBlocksByType(BPV7_BLOCK_TYPE_CODE::INTEGRITY).empty());

    //duplicate block number, payload block number, payload type
    Bpv7CanonicalBlock duplicate = Bpv7BundleAgeBlockData(5).ToCanonicalBlock();
    duplicate.m_blockNumber = 3;
    BOOST_REQUIRE(!bundle.AddExtensionBlock(std::move(duplicate), errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
    Bpv7CanonicalBlock numberOne = Bpv7BundleAgeBlockData(5).ToCanonicalBlock();
    numberOne.m_blockNumber = 1;
    BOOST_REQUIRE(!bundle.AddExtensionBlock(std::move(numberOne), errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
    BOOST_REQUIRE(!bundle.AddExtensionBlock(Bpv7CanonicalBlock(BPV7_BLOCK_TYPE_CODE::PAYLOAD, 0,
        BPV7_BLOCKFLAG::NO_FLAGS_SET, BPV7_CRC_TYPE::NONE, std::vector<uint8_t>()), errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_ARGUMENT);
    BOOST_REQUIRE_EQUAL(bundle.m_canonicalBlocks.size(), 4);

    //block order is preserved on the wire
    Bpv7Bundle decoded;
    BOOST_REQUIRE(Bpv7Bundle::Deserialize(bundle.Serialize(), decoded, errorCode));
    BOOST_REQUIRE_EQUAL(decoded, bundle);
    Bpv7HopCountBlockData hopCount;
    BOOST_REQUIRE(Bpv7HopCountBlockData::FromCanonicalBlock(*decoded.GetCanonicalBlocksByType(BPV7_BLOCK_TYPE_CODE::HOP_COUNT)[0], hopCount, errorCode));
    BOOST_REQUIRE_EQUAL(hopCount.m_hopLimit, 10);

    //an unregistered extension block with a large type code survives a decode
    BOOST_REQUIRE(bundle.AddExtensionBlock(Bpv7CanonicalBlock(static_cast<BPV7_BLOCK_TYPE_CODE>(300), 0,
        BPV7_BLOCKFLAG::NO_FLAGS_SET, BPV7_CRC_TYPE::NONE, std::vector<uint8_t>(1, 0x01)), errorCode));
    BOOST_REQUIRE(Bpv7Bundle::Deserialize(bundle.Serialize(), decoded, errorCode));
    BOOST_REQUIRE_EQUAL(decoded, bundle);
    BOOST_REQUIRE_EQUAL(decoded.GetCanonicalBlocksByType(static_cast<BPV7_BLOCK_TYPE_CODE>(300)).size(), 1);
}

BOOST_AUTO_TEST_CASE(BundleV7MalformedTestCase)
{
    const Bpv7Bundle bundle = CreateHelloBundle(BPV7_CRC_TYPE::CRC16_X25);
    const std::vector<uint8_t> serialization = bundle.Serialize();
    Bpv7Bundle decoded;
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;

    //a single flipped bit inside the primary block (the version field)
    {
        std::vector<uint8_t> corrupted(serialization);
        BOOST_REQUIRE_EQUAL(corrupted[2], 0x07);
        corrupted[2] ^= 0x01;
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(corrupted, decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::CRC_MISMATCH);
    }
    //a single flipped bit inside the payload
    {
        std::vector<uint8_t> corrupted(serialization);
        corrupted[corrupted.size() - 5] ^= 0x04; //last payload byte, ahead of the crc and break
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(corrupted, decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::CRC_MISMATCH);
    }
    //missing break stop code
    {
        std::vector<uint8_t> truncated(serialization.begin(), serialization.end() - 1);
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(truncated, decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::TRUNCATED_INPUT);
    }
    //trailing bytes
    {
        std::vector<uint8_t> extra(serialization);
        extra.push_back(0x00);
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(extra, decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_ENCODING);
    }
    //not an array
    {
        const std::vector<uint8_t> notAnArray({ 0xa0 });
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(notAnArray, decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
    }
    //primary block only
    {
        std::vector<uint8_t> primaryOnly;
        primaryOnly.push_back(0x9f);
        bundle.m_primaryBlock.AppendSerialization(primaryOnly);
        primaryOnly.push_back(0xff);
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(primaryOnly, decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
    }
    //two blocks with the same block number
    {
        Bpv7Bundle dup(bundle);
        dup.m_canonicalBlocks.insert(dup.m_canonicalBlocks.begin(), Bpv7BundleAgeBlockData(1).ToCanonicalBlock());
        dup.m_canonicalBlocks.insert(dup.m_canonicalBlocks.begin(), Bpv7HopCountBlockData(1, 0).ToCanonicalBlock());
        dup.m_canonicalBlocks[0].m_blockNumber = 5;
        dup.m_canonicalBlocks[1].m_blockNumber = 5;
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(dup.Serialize(), decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
    }
    //payload block not numbered 1
    {
        Bpv7Bundle badPayloadNumber(bundle);
        badPayloadNumber.GetPayloadBlock()->m_blockNumber = 2;
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(badPayloadNumber.Serialize(), decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
    }
    //extension block whose data its interpreter rejects
    {
        Bpv7Bundle badHopCount(bundle);
        BOOST_REQUIRE(badHopCount.AddExtensionBlock(Bpv7CanonicalBlock(BPV7_BLOCK_TYPE_CODE::HOP_COUNT, 0,
            BPV7_BLOCKFLAG::NO_FLAGS_SET, BPV7_CRC_TYPE::NONE, std::vector<uint8_t>({ 0x01 })), errorCode));
        BOOST_REQUIRE(!Bpv7Bundle::Deserialize(badHopCount.Serialize(), decoded, errorCode));
        BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
        //a registry that accepts any hop count data
        Bpv7BlockRegistry opaqueRegistry;
        opaqueRegistry.RegisterInterpreter(BPV7_BLOCK_TYPE_CODE::HOP_COUNT,
            [](const Bpv7CanonicalBlock &, BP7_ERROR_CODE &) { return true; });
        BOOST_REQUIRE(Bpv7Bundle::Deserialize(badHopCount.Serialize(), decoded, errorCode, &opaqueRegistry));
        BOOST_REQUIRE_EQUAL(decoded, badHopCount);
    }
}

BOOST_AUTO_TEST_CASE(BundleV7DefiniteArrayTestCase)
{
    const Bpv7Bundle bundle = CreateHelloBundle(BPV7_CRC_TYPE::CRC32C);
    std::vector<uint8_t> serialization = bundle.Serialize();
    //replace the indefinite head and break with a definite array of 2 blocks
    serialization.front() = 0x82;
    serialization.pop_back();
    Bpv7Bundle decoded;
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
    BOOST_REQUIRE(Bpv7Bundle::Deserialize(serialization, decoded, errorCode));
    BOOST_REQUIRE_EQUAL(decoded, bundle);
    //re-encoding is canonical
    BOOST_REQUIRE_EQUAL(decoded.Serialize().front(), 0x9f);

    serialization.front() = 0x81;
    BOOST_REQUIRE(!Bpv7Bundle::Deserialize(serialization, decoded, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
}

BOOST_AUTO_TEST_CASE(BundleV7IdAndExpirationTestCase)
{
    Bpv7Bundle bundle = CreateHelloBundle(BPV7_CRC_TYPE::NONE);
    bundle.m_primaryBlock.m_creationTimestamp = TimestampUtil::bpv7_creation_timestamp_t(5000, 3);
    BOOST_REQUIRE_EQUAL(bundle.GetBundleId().ToString(), "ipn:1.1/5000/3");
    BOOST_REQUIRE(!bundle.HasExpired(5000 + 3600000));
    BOOST_REQUIRE(bundle.HasExpired(5000 + 3600001));

    bundle.m_primaryBlock.m_bundleProcessingControlFlags |= BPV7_BUNDLEFLAG::ISFRAGMENT;
    bundle.m_primaryBlock.m_fragmentOffset = 20;
    bundle.m_primaryBlock.m_totalApplicationDataUnitLength = 100;
    const Bpv7BundleId fragmentId = bundle.GetBundleId();
    BOOST_REQUIRE_EQUAL(fragmentId.ToString(), "ipn:1.1/5000/3/20");

    std::map<Bpv7BundleId, int> idMap;
    idMap[fragmentId] = 1;
    idMap[Bpv7BundleId(EndpointId::Ipn(1, 1), TimestampUtil::bpv7_creation_timestamp_t(5000, 3), false, 0)] = 2;
    idMap[Bpv7BundleId(EndpointId::Ipn(1, 1), TimestampUtil::bpv7_creation_timestamp_t(5000, 3), true, 20)] = 3;
    BOOST_REQUIRE_EQUAL(idMap.size(), 2);
    BOOST_REQUIRE_EQUAL(idMap[fragmentId], 3);

    //a fragment whose payload runs past the total length
    bundle.m_primaryBlock.m_fragmentOffset = 95;
    Bpv7Bundle decoded;
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
    BOOST_REQUIRE(!Bpv7Bundle::Deserialize(bundle.Serialize(), decoded, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::MALFORMED_BLOCK);
}
