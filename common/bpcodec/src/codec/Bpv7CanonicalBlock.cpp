/**
 * @file Bpv7CanonicalBlock.cpp
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
#include <boost/format.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::codec;

Bpv7CanonicalBlock::Bpv7CanonicalBlock() { //a default constructor: X()
    SetZero();
}
Bpv7CanonicalBlock::Bpv7CanonicalBlock(BPV7_BLOCK_TYPE_CODE blockTypeCode, uint64_t blockNumber,
    BPV7_BLOCKFLAG flags, BPV7_CRC_TYPE crcType, std::vector<uint8_t> && blockTypeSpecificData) :
    m_blockTypeCode(blockTypeCode),
    m_blockNumber(blockNumber),
    m_blockProcessingControlFlags(flags),
    m_crcType(crcType),
    m_blockTypeSpecificData(std::move(blockTypeSpecificData)) { }
Bpv7CanonicalBlock::~Bpv7CanonicalBlock() { } //a destructor: ~X()
Bpv7CanonicalBlock::Bpv7CanonicalBlock(const Bpv7CanonicalBlock& o) :
    m_blockTypeCode(o.m_blockTypeCode),
    m_blockNumber(o.m_blockNumber),
    m_blockProcessingControlFlags(o.m_blockProcessingControlFlags),
    m_crcType(o.m_crcType),
    m_blockTypeSpecificData(o.m_blockTypeSpecificData) { } //a copy constructor: X(const X&)
Bpv7CanonicalBlock::Bpv7CanonicalBlock(Bpv7CanonicalBlock&& o) :
    m_blockTypeCode(o.m_blockTypeCode),
    m_blockNumber(o.m_blockNumber),
    m_blockProcessingControlFlags(o.m_blockProcessingControlFlags),
    m_crcType(o.m_crcType),
    m_blockTypeSpecificData(std::move(o.m_blockTypeSpecificData)) { } //a move constructor: X(X&&)
Bpv7CanonicalBlock& Bpv7CanonicalBlock::operator=(const Bpv7CanonicalBlock& o) { //a copy assignment: operator=(const X&)
    m_blockTypeCode = o.m_blockTypeCode;
    m_blockNumber = o.m_blockNumber;
    m_blockProcessingControlFlags = o.m_blockProcessingControlFlags;
    m_crcType = o.m_crcType;
    m_blockTypeSpecificData = o.m_blockTypeSpecificData;
    return *this;
}
Bpv7CanonicalBlock& Bpv7CanonicalBlock::operator=(Bpv7CanonicalBlock && o) { //a move assignment: operator=(X&&)
    m_blockTypeCode = o.m_blockTypeCode;
    m_blockNumber = o.m_blockNumber;
    m_blockProcessingControlFlags = o.m_blockProcessingControlFlags;
    m_crcType = o.m_crcType;
    m_blockTypeSpecificData = std::move(o.m_blockTypeSpecificData);
    return *this;
}
bool Bpv7CanonicalBlock::operator==(const Bpv7CanonicalBlock & o) const {
    return (m_blockTypeCode == o.m_blockTypeCode)
        && (m_blockNumber == o.m_blockNumber)
        && (m_blockProcessingControlFlags == o.m_blockProcessingControlFlags)
        && (m_crcType == o.m_crcType)
        && (m_blockTypeSpecificData == o.m_blockTypeSpecificData);
}
bool Bpv7CanonicalBlock::operator!=(const Bpv7CanonicalBlock & o) const {
    return !(*this == o);
}
std::ostream& operator<<(std::ostream& os, const Bpv7CanonicalBlock& o) {
    os << boost::format("canonical block: type=%d number=%d flags=0x%x crcType=%d dataLength=%d")
        % static_cast<uint64_t>(o.m_blockTypeCode)
        % o.m_blockNumber
        % static_cast<uint64_t>(o.m_blockProcessingControlFlags)
        % static_cast<unsigned int>(o.m_crcType)
        % o.m_blockTypeSpecificData.size();
    return os;
}
void Bpv7CanonicalBlock::SetZero() {
    m_blockTypeCode = BPV7_BLOCK_TYPE_CODE::PRIMARY_IMPLICIT_ZERO;
    m_blockNumber = 0;
    m_blockProcessingControlFlags = BPV7_BLOCKFLAG::NO_FLAGS_SET;
    m_crcType = BPV7_CRC_TYPE::NONE;
    m_blockTypeSpecificData.clear();
}

bool Bpv7CanonicalBlock::IsPayloadBlock() const {
    return (m_blockTypeCode == BPV7_BLOCK_TYPE_CODE::PAYLOAD);
}
bool Bpv7CanonicalBlock::HasFlag(BPV7_BLOCKFLAG flag) const {
    return ::HasFlag(m_blockProcessingControlFlags, flag);
}

//Every block other than the primary block (all such blocks are termed
//"canonical" blocks) SHALL be represented as a CBOR array; the number
//of elements in the array SHALL be 5 (if CRC type is zero) or 6
//(otherwise).
void Bpv7CanonicalBlock::AppendSerialization(std::vector<uint8_t> & serialization) const {
    const std::size_t blockStartIndex = serialization.size();
    const unsigned int crcSize = Bpv7Crc::GetCrcSizeBytes(m_crcType);
    serialization.reserve(blockStartIndex + m_blockTypeSpecificData.size() + 32);

    //encode the head and fixed fields directly to avoid copying the (possibly large) data
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::ARRAY, (crcSize) ? 6 : 5, serialization);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, static_cast<uint64_t>(m_blockTypeCode), serialization);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, m_blockNumber, serialization);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, static_cast<uint64_t>(m_blockProcessingControlFlags), serialization);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, static_cast<uint64_t>(m_crcType), serialization);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::BYTE_STRING, m_blockTypeSpecificData.size(), serialization);
    serialization.insert(serialization.end(), m_blockTypeSpecificData.begin(), m_blockTypeSpecificData.end());
    if (crcSize) {
        Cbor::EncodeHead(CBOR_MAJOR_TYPE::BYTE_STRING, crcSize, serialization);
        serialization.insert(serialization.end(), crcSize, 0);
        Bpv7Crc::ComputeAndPatchBlockCrc(&serialization[blockStartIndex], serialization.size() - blockStartIndex, m_crcType);
    }
}

bool Bpv7CanonicalBlock::Deserialize(const uint8_t * serialization, uint64_t bufferSize,
    uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode)
{
    CborItem block;
    if (!Cbor::Decode(serialization, bufferSize, block, numBytesTakenToDecode, errorCode)) {
        LOG_ERROR(subprocess) << "canonical block is not well formed cbor: " << errorCode;
        return false;
    }
    const std::size_t arraySize = block.m_items.size();
    if ((!block.IsArray()) || (arraySize < 5) || (arraySize > 6)) {
        LOG_ERROR(subprocess) << "canonical block must be an array of 5 or 6 elements";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    std::vector<CborItem> & fields = block.m_items;
    for (std::size_t i = 0; i < 4; ++i) {
        if (!fields[i].IsUint()) {
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
    }
    if ((!Bpv7Crc::IsValidCrcType(fields[3].m_value)) || (!fields[4].IsByteString())) {
        LOG_ERROR(subprocess) << "canonical block has an invalid crc type or block data";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    m_crcType = static_cast<BPV7_CRC_TYPE>(fields[3].m_value);
    const unsigned int crcSize = Bpv7Crc::GetCrcSizeBytes(m_crcType);
    if (arraySize != ((crcSize) ? 6u : 5u)) {
        LOG_ERROR(subprocess) << "canonical block with crc type " << m_crcType << " has " << arraySize << " elements";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if (crcSize) {
        const CborItem & crcField = fields[5];
        if ((!crcField.IsByteString()) || (crcField.m_bytes.size() != crcSize)) {
            LOG_ERROR(subprocess) << "canonical block crc field has the wrong size";
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        if (!Bpv7Crc::VerifyBlockCrc(serialization, numBytesTakenToDecode, block.m_isIndefiniteLength, m_crcType, errorCode)) {
            return false;
        }
    }
    if (fields[0].m_value == static_cast<uint64_t>(BPV7_BLOCK_TYPE_CODE::PRIMARY_IMPLICIT_ZERO)) {
        LOG_ERROR(subprocess) << "canonical block cannot have block type code 0";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if (fields[1].m_value == 0) {
        LOG_ERROR(subprocess) << "block number 0 is reserved for the primary block";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if ((fields[2].m_value & (~BPV7_BLOCKFLAG_ALL_KNOWN_FLAGS_MASK)) != 0) {
        LOG_ERROR(subprocess) << "canonical block has invalid block processing control flags " << fields[2].m_value;
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    m_blockTypeCode = static_cast<BPV7_BLOCK_TYPE_CODE>(fields[0].m_value);
    m_blockNumber = fields[1].m_value;
    m_blockProcessingControlFlags = static_cast<BPV7_BLOCKFLAG>(fields[2].m_value);
    m_blockTypeSpecificData = std::move(fields[4].m_bytes);
    return true;
}
