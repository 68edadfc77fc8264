/**
 * @file Bpv7ExtensionBlocks.cpp
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

#include "codec/bpv7.h"
#include "Logger.h"

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::codec;

//the block-type-specific data of every extension block is exactly one cbor item
static bool DecodeSingleItem(const Bpv7CanonicalBlock & block, BPV7_BLOCK_TYPE_CODE expectedType,
    CborItem & item, BP7_ERROR_CODE & errorCode)
{
    if (block.m_blockTypeCode != expectedType) {
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    uint64_t numBytesTakenToDecode;
    if ((!Cbor::Decode(block.m_blockTypeSpecificData, item, numBytesTakenToDecode, errorCode))
        || (numBytesTakenToDecode != block.m_blockTypeSpecificData.size()))
    {
        LOG_ERROR(subprocess) << "block type " << expectedType << " data is not a single cbor item";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    return true;
}

////////////////////////////////////
// PREVIOUS NODE EXTENSION BLOCK
////////////////////////////////////

//The Previous Node block, block type 6, identifies the node that
//forwarded this bundle to the local node; its block-type-specific data
//is the node ID of that forwarder node.  If the local node is the
//source of the bundle, then the bundle MUST NOT contain any Previous
//Node block.
Bpv7PreviousNodeBlockData::Bpv7PreviousNodeBlockData() { }
Bpv7PreviousNodeBlockData::Bpv7PreviousNodeBlockData(const EndpointId & previousNode) :
    m_previousNode(previousNode) { }
bool Bpv7PreviousNodeBlockData::operator==(const Bpv7PreviousNodeBlockData & o) const {
    return (m_previousNode == o.m_previousNode);
}
Bpv7CanonicalBlock Bpv7PreviousNodeBlockData::ToCanonicalBlock(BPV7_CRC_TYPE crcType) const {
    return Bpv7CanonicalBlock(BPV7_BLOCK_TYPE_CODE::PREVIOUS_NODE, 0, BPV7_BLOCKFLAG::NO_FLAGS_SET,
        crcType, Cbor::Encode(m_previousNode.ToCbor()));
}
bool Bpv7PreviousNodeBlockData::FromCanonicalBlock(const Bpv7CanonicalBlock & block, Bpv7PreviousNodeBlockData & data, BP7_ERROR_CODE & errorCode) {
    CborItem item;
    if (!DecodeSingleItem(block, BPV7_BLOCK_TYPE_CODE::PREVIOUS_NODE, item, errorCode)) {
        return false;
    }
    if (!EndpointId::FromCbor(item, data.m_previousNode, errorCode)) {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    return true;
}

////////////////////////////////////
// BUNDLE AGE EXTENSION BLOCK
////////////////////////////////////

//The block-type-specific data of this block is an unsigned integer
//containing the age of the bundle in milliseconds.
Bpv7BundleAgeBlockData::Bpv7BundleAgeBlockData() :
    m_bundleAgeMilliseconds(0) { }
Bpv7BundleAgeBlockData::Bpv7BundleAgeBlockData(uint64_t bundleAgeMilliseconds) :
    m_bundleAgeMilliseconds(bundleAgeMilliseconds) { }
bool Bpv7BundleAgeBlockData::operator==(const Bpv7BundleAgeBlockData & o) const {
    return (m_bundleAgeMilliseconds == o.m_bundleAgeMilliseconds);
}
Bpv7CanonicalBlock Bpv7BundleAgeBlockData::ToCanonicalBlock(BPV7_CRC_TYPE crcType) const {
    return Bpv7CanonicalBlock(BPV7_BLOCK_TYPE_CODE::BUNDLE_AGE, 0, BPV7_BLOCKFLAG::NO_FLAGS_SET,
        crcType, Cbor::Encode(CborItem::Uint(m_bundleAgeMilliseconds)));
}
bool Bpv7BundleAgeBlockData::FromCanonicalBlock(const Bpv7CanonicalBlock & block, Bpv7BundleAgeBlockData & data, BP7_ERROR_CODE & errorCode) {
    CborItem item;
    if (!DecodeSingleItem(block, BPV7_BLOCK_TYPE_CODE::BUNDLE_AGE, item, errorCode)) {
        return false;
    }
    if (!item.IsUint()) {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    data.m_bundleAgeMilliseconds = item.m_value;
    return true;
}

////////////////////////////////////
// HOP COUNT EXTENSION BLOCK
////////////////////////////////////

//The hop count SHALL be represented as a CBOR array comprising two
//items.  The first item of this array SHALL be the bundle's hop limit,
//and the second item of this array SHALL be the bundle's current hop count.
Bpv7HopCountBlockData::Bpv7HopCountBlockData() :
    m_hopLimit(0),
    m_hopCount(0) { }
Bpv7HopCountBlockData::Bpv7HopCountBlockData(uint64_t hopLimit, uint64_t hopCount) :
    m_hopLimit(hopLimit),
    m_hopCount(hopCount) { }
bool Bpv7HopCountBlockData::operator==(const Bpv7HopCountBlockData & o) const {
    return (m_hopLimit == o.m_hopLimit) && (m_hopCount == o.m_hopCount);
}
bool Bpv7HopCountBlockData::HasExceededLimit() const {
    return (m_hopCount > m_hopLimit);
}
Bpv7CanonicalBlock Bpv7HopCountBlockData::ToCanonicalBlock(BPV7_CRC_TYPE crcType) const {
    CborItem hopArray = CborItem::Array();
    hopArray.Append(CborItem::Uint(m_hopLimit));
    hopArray.Append(CborItem::Uint(m_hopCount));
    return Bpv7CanonicalBlock(BPV7_BLOCK_TYPE_CODE::HOP_COUNT, 0, BPV7_BLOCKFLAG::NO_FLAGS_SET,
        crcType, Cbor::Encode(hopArray));
}
bool Bpv7HopCountBlockData::FromCanonicalBlock(const Bpv7CanonicalBlock & block, Bpv7HopCountBlockData & data, BP7_ERROR_CODE & errorCode) {
    CborItem item;
    if (!DecodeSingleItem(block, BPV7_BLOCK_TYPE_CODE::HOP_COUNT, item, errorCode)) {
        return false;
    }
    if ((!item.IsArrayOfSize(2)) || (!item.m_items[0].IsUint()) || (!item.m_items[1].IsUint())) {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    data.m_hopLimit = item.m_items[0].m_value;
    data.m_hopCount = item.m_items[1].m_value;
    return true;
}

////////////////////////////////////
// BLOCK REGISTRY
////////////////////////////////////

template <typename BlockDataType>
static bool ValidateBlockData(const Bpv7CanonicalBlock & block, BP7_ERROR_CODE & errorCode) {
    BlockDataType data;
    return BlockDataType::FromCanonicalBlock(block, data, errorCode);
}

Bpv7BlockRegistry::Bpv7BlockRegistry() {
    RegisterInterpreter(BPV7_BLOCK_TYPE_CODE::PREVIOUS_NODE, &ValidateBlockData<Bpv7PreviousNodeBlockData>);
    RegisterInterpreter(BPV7_BLOCK_TYPE_CODE::BUNDLE_AGE, &ValidateBlockData<Bpv7BundleAgeBlockData>);
    RegisterInterpreter(BPV7_BLOCK_TYPE_CODE::HOP_COUNT, &ValidateBlockData<Bpv7HopCountBlockData>);
}

void Bpv7BlockRegistry::RegisterInterpreter(BPV7_BLOCK_TYPE_CODE blockTypeCode, const BlockInterpreterFunction_t & interpreter) {
    m_interpreters[blockTypeCode] = interpreter;
}

bool Bpv7BlockRegistry::HasInterpreter(BPV7_BLOCK_TYPE_CODE blockTypeCode) const {
    return (m_interpreters.count(blockTypeCode) != 0);
}

bool Bpv7BlockRegistry::Interpret(const Bpv7CanonicalBlock & block, BP7_ERROR_CODE & errorCode) const {
    std::map<BPV7_BLOCK_TYPE_CODE, BlockInterpreterFunction_t>::const_iterator it = m_interpreters.find(block.m_blockTypeCode);
    if (it == m_interpreters.cend()) {
        return true; //unknown block types stay opaque
    }
    if (!it->second(block, errorCode)) {
        LOG_ERROR(subprocess) << "block number " << block.m_blockNumber << " of type " << block.m_blockTypeCode << " failed validation";
        return false;
    }
    return true;
}

const Bpv7BlockRegistry & Bpv7BlockRegistry::GetDefaultRegistry() {
    static const Bpv7BlockRegistry defaultRegistry;
    return defaultRegistry;
}
