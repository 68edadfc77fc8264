/**
 * @file Bpv7PrimaryBlock.cpp
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

constexpr uint64_t Bpv7PrimaryBlock::BPV7_VERSION;

Bpv7PrimaryBlock::Bpv7PrimaryBlock() { //a default constructor: X()
    SetZero();
}
Bpv7PrimaryBlock::~Bpv7PrimaryBlock() { } //a destructor: ~X()
Bpv7PrimaryBlock::Bpv7PrimaryBlock(const Bpv7PrimaryBlock& o) :
    m_bundleProcessingControlFlags(o.m_bundleProcessingControlFlags),
    m_destinationEid(o.m_destinationEid),
    m_sourceNodeId(o.m_sourceNodeId),
    m_reportToEid(o.m_reportToEid),
    m_creationTimestamp(o.m_creationTimestamp),
    m_lifetimeMilliseconds(o.m_lifetimeMilliseconds),
    m_fragmentOffset(o.m_fragmentOffset),
    m_totalApplicationDataUnitLength(o.m_totalApplicationDataUnitLength),
    m_crcType(o.m_crcType) { } //a copy constructor: X(const X&)
Bpv7PrimaryBlock::Bpv7PrimaryBlock(Bpv7PrimaryBlock&& o) :
    m_bundleProcessingControlFlags(o.m_bundleProcessingControlFlags),
    m_destinationEid(std::move(o.m_destinationEid)),
    m_sourceNodeId(std::move(o.m_sourceNodeId)),
    m_reportToEid(std::move(o.m_reportToEid)),
    m_creationTimestamp(std::move(o.m_creationTimestamp)),
    m_lifetimeMilliseconds(o.m_lifetimeMilliseconds),
    m_fragmentOffset(o.m_fragmentOffset),
    m_totalApplicationDataUnitLength(o.m_totalApplicationDataUnitLength),
    m_crcType(o.m_crcType) { } //a move constructor: X(X&&)
Bpv7PrimaryBlock& Bpv7PrimaryBlock::operator=(const Bpv7PrimaryBlock& o) { //a copy assignment: operator=(const X&)
    m_bundleProcessingControlFlags = o.m_bundleProcessingControlFlags;
    m_destinationEid = o.m_destinationEid;
    m_sourceNodeId = o.m_sourceNodeId;
    m_reportToEid = o.m_reportToEid;
    m_creationTimestamp = o.m_creationTimestamp;
    m_lifetimeMilliseconds = o.m_lifetimeMilliseconds;
    m_fragmentOffset = o.m_fragmentOffset;
    m_totalApplicationDataUnitLength = o.m_totalApplicationDataUnitLength;
    m_crcType = o.m_crcType;
    return *this;
}
Bpv7PrimaryBlock& Bpv7PrimaryBlock::operator=(Bpv7PrimaryBlock && o) { //a move assignment: operator=(X&&)
    m_bundleProcessingControlFlags = o.m_bundleProcessingControlFlags;
    m_destinationEid = std::move(o.m_destinationEid);
    m_sourceNodeId = std::move(o.m_sourceNodeId);
    m_reportToEid = std::move(o.m_reportToEid);
    m_creationTimestamp = std::move(o.m_creationTimestamp);
    m_lifetimeMilliseconds = o.m_lifetimeMilliseconds;
    m_fragmentOffset = o.m_fragmentOffset;
    m_totalApplicationDataUnitLength = o.m_totalApplicationDataUnitLength;
    m_crcType = o.m_crcType;
    return *this;
}
bool Bpv7PrimaryBlock::operator==(const Bpv7PrimaryBlock & o) const {
    return (m_bundleProcessingControlFlags == o.m_bundleProcessingControlFlags)
        && (m_destinationEid == o.m_destinationEid)
        && (m_sourceNodeId == o.m_sourceNodeId)
        && (m_reportToEid == o.m_reportToEid)
        && (m_creationTimestamp == o.m_creationTimestamp)
        && (m_lifetimeMilliseconds == o.m_lifetimeMilliseconds)
        && (m_fragmentOffset == o.m_fragmentOffset)
        && (m_totalApplicationDataUnitLength == o.m_totalApplicationDataUnitLength)
        && (m_crcType == o.m_crcType);
}
bool Bpv7PrimaryBlock::operator!=(const Bpv7PrimaryBlock & o) const {
    return !(*this == o);
}
std::ostream& operator<<(std::ostream& os, const Bpv7PrimaryBlock& o) {
    os << "primary block: flags=" << o.m_bundleProcessingControlFlags
        << " crcType=" << o.m_crcType
        << " dest=" << o.m_destinationEid
        << " src=" << o.m_sourceNodeId
        << " reportTo=" << o.m_reportToEid
        << " created=" << o.m_creationTimestamp
        << " lifetimeMs=" << o.m_lifetimeMilliseconds;
    if (o.IsFragment()) {
        os << " fragmentOffset=" << o.m_fragmentOffset << " totalAduLength=" << o.m_totalApplicationDataUnitLength;
    }
    return os;
}
void Bpv7PrimaryBlock::SetZero() {
    m_bundleProcessingControlFlags = BPV7_BUNDLEFLAG::NO_FLAGS_SET;
    m_destinationEid = EndpointId();
    m_sourceNodeId = EndpointId();
    m_reportToEid = EndpointId();
    m_creationTimestamp.SetZero();
    m_lifetimeMilliseconds = 0;
    m_fragmentOffset = 0;
    m_totalApplicationDataUnitLength = 0;
    m_crcType = BPV7_CRC_TYPE::NONE;
}

bool Bpv7PrimaryBlock::IsFragment() const {
    return HasFlag(BPV7_BUNDLEFLAG::ISFRAGMENT);
}
bool Bpv7PrimaryBlock::IsAdminRecord() const {
    return HasFlag(BPV7_BUNDLEFLAG::ADMINRECORD);
}
bool Bpv7PrimaryBlock::HasFlag(BPV7_BUNDLEFLAG flag) const {
    return ::HasFlag(m_bundleProcessingControlFlags, flag);
}
uint64_t Bpv7PrimaryBlock::GetExpirationMilliseconds() const {
    const uint64_t creation = m_creationTimestamp.millisecondsSinceStartOfYear2000;
    if (m_lifetimeMilliseconds > (UINT64_MAX - creation)) {
        return UINT64_MAX; //saturate
    }
    return creation + m_lifetimeMilliseconds;
}
bool Bpv7PrimaryBlock::HasExpired(uint64_t nowMillisecondsSinceDtnEpoch) const {
    return nowMillisecondsSinceDtnEpoch > GetExpirationMilliseconds();
}

CborItem Bpv7PrimaryBlock::CreationTimestampToCbor(const TimestampUtil::bpv7_creation_timestamp_t & ts) {
    CborItem tsArray = CborItem::Array();
    tsArray.Append(CborItem::Uint(ts.millisecondsSinceStartOfYear2000));
    tsArray.Append(CborItem::Uint(ts.sequenceNumber));
    return tsArray;
}
bool Bpv7PrimaryBlock::CreationTimestampFromCbor(const CborItem & item, TimestampUtil::bpv7_creation_timestamp_t & ts) {
    if ((!item.IsArrayOfSize(2)) || (!item.m_items[0].IsUint()) || (!item.m_items[1].IsUint())) {
        return false;
    }
    ts.millisecondsSinceStartOfYear2000 = item.m_items[0].m_value;
    ts.sequenceNumber = item.m_items[1].m_value;
    return true;
}

//Each primary block SHALL be represented as a CBOR array; the number
//of elements in the array SHALL be 8 (if the bundle is not a fragment
//and the block has no CRC), 9 (if the block has a CRC and the bundle
//is not a fragment), 10 (if the bundle is a fragment and the block
//has no CRC), or 11 (if the bundle is a fragment and the block has a
//CRC).
void Bpv7PrimaryBlock::AppendSerialization(std::vector<uint8_t> & serialization) const {
    const std::size_t blockStartIndex = serialization.size();
    const unsigned int crcSize = Bpv7Crc::GetCrcSizeBytes(m_crcType);

    CborItem block = CborItem::Array();
    block.Append(CborItem::Uint(BPV7_VERSION));
    block.Append(CborItem::Uint(static_cast<uint64_t>(m_bundleProcessingControlFlags)));
    block.Append(CborItem::Uint(static_cast<uint64_t>(m_crcType)));
    block.Append(m_destinationEid.ToCbor());
    block.Append(m_sourceNodeId.ToCbor());
    block.Append(m_reportToEid.ToCbor());
    block.Append(CreationTimestampToCbor(m_creationTimestamp));
    block.Append(CborItem::Uint(m_lifetimeMilliseconds));
    if (IsFragment()) {
        block.Append(CborItem::Uint(m_fragmentOffset));
        block.Append(CborItem::Uint(m_totalApplicationDataUnitLength));
    }
    if (crcSize) {
        block.Append(CborItem::ByteString(std::vector<uint8_t>(crcSize, 0)));
    }
    Cbor::Encode(block, serialization);
    if (crcSize) {
        Bpv7Crc::ComputeAndPatchBlockCrc(&serialization[blockStartIndex], serialization.size() - blockStartIndex, m_crcType);
    }
}

bool Bpv7PrimaryBlock::Deserialize(const uint8_t * serialization, uint64_t bufferSize,
    uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode)
{
    CborItem block;
    if (!Cbor::Decode(serialization, bufferSize, block, numBytesTakenToDecode, errorCode)) {
        LOG_ERROR(subprocess) << "primary block is not well formed cbor: " << errorCode;
        return false;
    }
    const std::size_t arraySize = block.m_items.size();
    if ((!block.IsArray()) || (arraySize < 8) || (arraySize > 11)) {
        LOG_ERROR(subprocess) << "primary block must be an array of 8 to 11 elements";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    const std::vector<CborItem> & fields = block.m_items;
    for (std::size_t i = 0; i < 3; ++i) {
        if (!fields[i].IsUint()) {
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
    }
    if (!Bpv7Crc::IsValidCrcType(fields[2].m_value)) {
        LOG_ERROR(subprocess) << "primary block has invalid crc type " << fields[2].m_value;
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    m_crcType = static_cast<BPV7_CRC_TYPE>(fields[2].m_value);
    const unsigned int crcSize = Bpv7Crc::GetCrcSizeBytes(m_crcType);
    //check integrity before interpreting any other field
    if (crcSize) {
        const CborItem & crcField = fields[arraySize - 1];
        if ((!crcField.IsByteString()) || (crcField.m_bytes.size() != crcSize)) {
            LOG_ERROR(subprocess) << "primary block crc field has the wrong size";
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        if (!Bpv7Crc::VerifyBlockCrc(serialization, numBytesTakenToDecode, block.m_isIndefiniteLength, m_crcType, errorCode)) {
            return false;
        }
    }
    if (fields[0].m_value != BPV7_VERSION) {
        LOG_ERROR(subprocess) << "unsupported bundle protocol version " << fields[0].m_value;
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if ((fields[1].m_value & (~BPV7_BUNDLEFLAG_ALL_KNOWN_FLAGS_MASK)) != 0) {
        LOG_ERROR(subprocess) << "primary block has invalid bundle processing control flags " << fields[1].m_value;
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    m_bundleProcessingControlFlags = static_cast<BPV7_BUNDLEFLAG>(fields[1].m_value);
    const bool isFragment = IsFragment();
    const std::size_t expectedArraySize = 8 + ((crcSize) ? 1 : 0) + ((isFragment) ? 2 : 0);
    if (arraySize != expectedArraySize) {
        LOG_ERROR(subprocess) << "primary block has " << arraySize << " elements but " << expectedArraySize << " are expected";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if ((!EndpointId::FromCbor(fields[3], m_destinationEid, errorCode))
        || (!EndpointId::FromCbor(fields[4], m_sourceNodeId, errorCode))
        || (!EndpointId::FromCbor(fields[5], m_reportToEid, errorCode)))
    {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if ((!CreationTimestampFromCbor(fields[6], m_creationTimestamp)) || (!fields[7].IsUint())) {
        LOG_ERROR(subprocess) << "primary block has an invalid creation timestamp or lifetime";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if (fields[7].m_value == 0) {
        LOG_ERROR(subprocess) << "primary block has a lifetime of zero";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    m_lifetimeMilliseconds = fields[7].m_value;
    if (isFragment) {
        if ((!fields[8].IsUint()) || (!fields[9].IsUint())) {
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        m_fragmentOffset = fields[8].m_value;
        m_totalApplicationDataUnitLength = fields[9].m_value;
    }
    else {
        m_fragmentOffset = 0;
        m_totalApplicationDataUnitLength = 0;
    }
    return true;
}
