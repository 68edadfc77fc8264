/**
 * @file BundleV7.cpp
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

#include "codec/BundleV7.h"
#include "Logger.h"
#include <set>
#include <sstream>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::bundle;

static constexpr uint64_t PAYLOAD_BLOCK_NUMBER = 1;

Bpv7BundleId::Bpv7BundleId() :
    m_isFragment(false),
    m_fragmentOffset(0) { }
Bpv7BundleId::Bpv7BundleId(const EndpointId & sourceEid, const TimestampUtil::bpv7_creation_timestamp_t & creationTimestamp,
    bool isFragment, uint64_t fragmentOffset) :
    m_sourceEid(sourceEid),
    m_creationTimestamp(creationTimestamp),
    m_isFragment(isFragment),
    m_fragmentOffset((isFragment) ? fragmentOffset : 0) { }
bool Bpv7BundleId::operator==(const Bpv7BundleId & o) const {
    return (m_sourceEid == o.m_sourceEid)
        && (m_creationTimestamp == o.m_creationTimestamp)
        && (m_isFragment == o.m_isFragment)
        && (m_fragmentOffset == o.m_fragmentOffset);
}
bool Bpv7BundleId::operator!=(const Bpv7BundleId & o) const {
    return !(*this == o);
}
bool Bpv7BundleId::operator<(const Bpv7BundleId & o) const {
    if (m_sourceEid != o.m_sourceEid) {
        return (m_sourceEid < o.m_sourceEid);
    }
    if (m_creationTimestamp != o.m_creationTimestamp) {
        return (m_creationTimestamp < o.m_creationTimestamp);
    }
    if (m_isFragment != o.m_isFragment) {
        return (m_isFragment < o.m_isFragment);
    }
    return (m_fragmentOffset < o.m_fragmentOffset);
}
std::string Bpv7BundleId::ToString() const {
    std::ostringstream oss;
    oss << m_sourceEid.ToString() << "/" << m_creationTimestamp.millisecondsSinceStartOfYear2000
        << "/" << m_creationTimestamp.sequenceNumber;
    if (m_isFragment) {
        oss << "/" << m_fragmentOffset;
    }
    return oss.str();
}
std::ostream& operator<<(std::ostream& os, const Bpv7BundleId& o) {
    os << o.ToString();
    return os;
}

Bpv7Bundle::Bpv7Bundle() { } //a default constructor: X()
Bpv7Bundle::~Bpv7Bundle() { } //a destructor: ~X()
Bpv7Bundle::Bpv7Bundle(const Bpv7Bundle& o) :
    m_primaryBlock(o.m_primaryBlock),
    m_canonicalBlocks(o.m_canonicalBlocks) { } //a copy constructor: X(const X&)
Bpv7Bundle::Bpv7Bundle(Bpv7Bundle&& o) :
    m_primaryBlock(std::move(o.m_primaryBlock)),
    m_canonicalBlocks(std::move(o.m_canonicalBlocks)) { } //a move constructor: X(X&&)
Bpv7Bundle& Bpv7Bundle::operator=(const Bpv7Bundle& o) { //a copy assignment: operator=(const X&)
    m_primaryBlock = o.m_primaryBlock;
    m_canonicalBlocks = o.m_canonicalBlocks;
    return *this;
}
Bpv7Bundle& Bpv7Bundle::operator=(Bpv7Bundle && o) { //a move assignment: operator=(X&&)
    m_primaryBlock = std::move(o.m_primaryBlock);
    m_canonicalBlocks = std::move(o.m_canonicalBlocks);
    return *this;
}
bool Bpv7Bundle::operator==(const Bpv7Bundle & o) const {
    return (m_primaryBlock == o.m_primaryBlock)
        && (m_canonicalBlocks == o.m_canonicalBlocks);
}
bool Bpv7Bundle::operator!=(const Bpv7Bundle & o) const {
    return !(*this == o);
}
std::ostream& operator<<(std::ostream& os, const Bpv7Bundle& o) {
    os << o.m_primaryBlock;
    for (std::size_t i = 0; i < o.m_canonicalBlocks.size(); ++i) {
        os << "\n" << o.m_canonicalBlocks[i];
    }
    return os;
}

bool Bpv7Bundle::Create(const EndpointId & sourceNodeId, const EndpointId & destinationEid,
    const EndpointId & reportToEid, const std::vector<uint8_t> & payload, int64_t lifetimeMilliseconds,
    BPV7_BUNDLEFLAG flags, Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode,
    TimestampUtil::Bpv7CreationTimestampGenerator * timestampGenerator,
    BPV7_CRC_TYPE crcType)
{
    if (lifetimeMilliseconds <= 0) {
        LOG_ERROR(subprocess) << "cannot create a bundle with a lifetime of " << lifetimeMilliseconds << "ms";
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    if ((static_cast<uint64_t>(flags) & (~BPV7_BUNDLEFLAG_ALL_KNOWN_FLAGS_MASK)) != 0) {
        LOG_ERROR(subprocess) << "cannot create a bundle with unknown bundle processing control flags " << flags;
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    if (!Bpv7Crc::IsValidCrcType(static_cast<uint64_t>(crcType))) {
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    //fragment fields are set by the fragmenter only
    flags &= ~BPV7_BUNDLEFLAG::ISFRAGMENT;

    Bpv7PrimaryBlock & primary = bundle.m_primaryBlock;
    primary.SetZero();
    primary.m_bundleProcessingControlFlags = flags;
    primary.m_destinationEid = destinationEid;
    primary.m_sourceNodeId = sourceNodeId;
    primary.m_reportToEid = reportToEid;
    //If the bundle's source node is omitted (i.e., the source node ID is
    //the ID of the null endpoint), the creation timestamp's sequence number
    //and time SHALL be zero.
    if (!sourceNodeId.IsNull()) {
        TimestampUtil::Bpv7CreationTimestampGenerator & generator = (timestampGenerator) ?
            *timestampGenerator : TimestampUtil::Bpv7CreationTimestampGenerator::GetProcessWideInstance();
        primary.m_creationTimestamp = generator.GenerateNow();
    }
    primary.m_lifetimeMilliseconds = static_cast<uint64_t>(lifetimeMilliseconds);
    primary.m_crcType = crcType;

    bundle.m_canonicalBlocks.clear();
    bundle.m_canonicalBlocks.emplace_back(BPV7_BLOCK_TYPE_CODE::PAYLOAD, PAYLOAD_BLOCK_NUMBER,
        BPV7_BLOCKFLAG::NO_FLAGS_SET, crcType, std::vector<uint8_t>(payload));
    return true;
}

uint64_t Bpv7Bundle::GetNextFreeBlockNumber() const {
    uint64_t maxBlockNumber = PAYLOAD_BLOCK_NUMBER;
    for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
        if (m_canonicalBlocks[i].m_blockNumber > maxBlockNumber) {
            maxBlockNumber = m_canonicalBlocks[i].m_blockNumber;
        }
    }
    return maxBlockNumber + 1;
}

bool Bpv7Bundle::AddExtensionBlock(Bpv7CanonicalBlock && block, BP7_ERROR_CODE & errorCode) {
    if ((block.IsPayloadBlock()) || (block.m_blockTypeCode == BPV7_BLOCK_TYPE_CODE::PRIMARY_IMPLICIT_ZERO)) {
        LOG_ERROR(subprocess) << "AddExtensionBlock: block type " << block.m_blockTypeCode << " is not an extension block";
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    if (block.m_blockNumber == 0) {
        block.m_blockNumber = GetNextFreeBlockNumber();
    }
    else if (block.m_blockNumber == PAYLOAD_BLOCK_NUMBER) {
        LOG_ERROR(subprocess) << "AddExtensionBlock: block number 1 is reserved for the payload block";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    else {
        for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
            if (m_canonicalBlocks[i].m_blockNumber == block.m_blockNumber) {
                LOG_ERROR(subprocess) << "AddExtensionBlock: block number " << block.m_blockNumber << " is already in use";
                errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
                return false;
            }
        }
    }
    //keep the payload block last
    std::vector<Bpv7CanonicalBlock>::iterator insertPosition = m_canonicalBlocks.end();
    if ((!m_canonicalBlocks.empty()) && (m_canonicalBlocks.back().IsPayloadBlock())) {
        --insertPosition;
    }
    m_canonicalBlocks.insert(insertPosition, std::move(block));
    return true;
}

Bpv7CanonicalBlock * Bpv7Bundle::GetPayloadBlock() {
    for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
        if (m_canonicalBlocks[i].IsPayloadBlock()) {
            return &m_canonicalBlocks[i];
        }
    }
    return NULL;
}
const Bpv7CanonicalBlock * Bpv7Bundle::GetPayloadBlock() const {
    for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
        if (m_canonicalBlocks[i].IsPayloadBlock()) {
            return &m_canonicalBlocks[i];
        }
    }
    return NULL;
}
std::vector<const Bpv7CanonicalBlock *> Bpv7Bundle::GetCanonicalBlocksByType(BPV7_BLOCK_TYPE_CODE blockTypeCode) const {
    std::vector<const Bpv7CanonicalBlock *> blocks;
    for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
        if (m_canonicalBlocks[i].m_blockTypeCode == blockTypeCode) {
            blocks.push_back(&m_canonicalBlocks[i]);
        }
    }
    return blocks;
}
uint64_t Bpv7Bundle::GetPayloadLength() const {
    const Bpv7CanonicalBlock * payloadBlock = GetPayloadBlock();
    return (payloadBlock) ? payloadBlock->m_blockTypeSpecificData.size() : 0;
}

Bpv7BundleId Bpv7Bundle::GetBundleId() const {
    return Bpv7BundleId(m_primaryBlock.m_sourceNodeId, m_primaryBlock.m_creationTimestamp,
        m_primaryBlock.IsFragment(), m_primaryBlock.m_fragmentOffset);
}
bool Bpv7Bundle::HasExpired(uint64_t nowMillisecondsSinceDtnEpoch) const {
    return m_primaryBlock.HasExpired(nowMillisecondsSinceDtnEpoch);
}

void Bpv7Bundle::Serialize(std::vector<uint8_t> & serialization) const {
    serialization.push_back((static_cast<uint8_t>(CBOR_MAJOR_TYPE::ARRAY) << 5) | Cbor::INDEFINITE_LENGTH_ADDITIONAL_INFO); //0x9f
    m_primaryBlock.AppendSerialization(serialization);
    for (std::size_t i = 0; i < m_canonicalBlocks.size(); ++i) {
        m_canonicalBlocks[i].AppendSerialization(serialization);
    }
    serialization.push_back(Cbor::BREAK_STOP_CODE);
}
std::vector<uint8_t> Bpv7Bundle::Serialize() const {
    std::vector<uint8_t> serialization;
    Serialize(serialization);
    return serialization;
}

bool Bpv7Bundle::Deserialize(const std::vector<uint8_t> & serialization,
    Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode, const Bpv7BlockRegistry * blockRegistry)
{
    return Deserialize(serialization.data(), serialization.size(), bundle, errorCode, blockRegistry);
}

bool Bpv7Bundle::Deserialize(const uint8_t * serialization, uint64_t bufferSize,
    Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode, const Bpv7BlockRegistry * blockRegistry)
{
    const Bpv7BlockRegistry & registry = (blockRegistry) ? *blockRegistry : Bpv7BlockRegistry::GetDefaultRegistry();
    CBOR_MAJOR_TYPE majorType;
    uint8_t additionalInfo;
    uint64_t numBlocksDeclared;
    uint64_t numBytesTakenToDecode;
    if (!Cbor::DecodeHead(serialization, bufferSize, majorType, additionalInfo, numBlocksDeclared, numBytesTakenToDecode, errorCode)) {
        LOG_ERROR(subprocess) << "cannot decode the bundle array head: " << errorCode;
        return false;
    }
    if (majorType != CBOR_MAJOR_TYPE::ARRAY) {
        LOG_ERROR(subprocess) << "a bundle must be a cbor array";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    //a definite length outer array is not conformant but is accepted
    const bool isIndefinite = (additionalInfo == Cbor::INDEFINITE_LENGTH_ADDITIONAL_INFO);
    if ((!isIndefinite) && (numBlocksDeclared < 2)) {
        LOG_ERROR(subprocess) << "a bundle must have at least two blocks";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    serialization += numBytesTakenToDecode;
    bufferSize -= numBytesTakenToDecode;

    if (!bundle.m_primaryBlock.Deserialize(serialization, bufferSize, numBytesTakenToDecode, errorCode)) {
        return false;
    }
    serialization += numBytesTakenToDecode;
    bufferSize -= numBytesTakenToDecode;

    bundle.m_canonicalBlocks.clear();
    const uint64_t numCanonicalBlocksDeclared = (isIndefinite) ? 0 : (numBlocksDeclared - 1);
    while (true) {
        if (isIndefinite) {
            if (bufferSize == 0) {
                LOG_ERROR(subprocess) << "bundle ended without a break stop code";
                errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
                return false;
            }
            if (*serialization == Cbor::BREAK_STOP_CODE) {
                ++serialization;
                --bufferSize;
                break;
            }
        }
        else if (bundle.m_canonicalBlocks.size() == numCanonicalBlocksDeclared) {
            break;
        }
        bundle.m_canonicalBlocks.emplace_back();
        if (!bundle.m_canonicalBlocks.back().Deserialize(serialization, bufferSize, numBytesTakenToDecode, errorCode)) {
            return false;
        }
        serialization += numBytesTakenToDecode;
        bufferSize -= numBytesTakenToDecode;
    }
    if (bufferSize != 0) {
        LOG_ERROR(subprocess) << "bundle is followed by " << bufferSize << " unexpected bytes";
        errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
        return false;
    }

    //block structure
    std::set<uint64_t> blockNumbersInUse;
    unsigned int numPayloadBlocks = 0;
    for (std::size_t i = 0; i < bundle.m_canonicalBlocks.size(); ++i) {
        const Bpv7CanonicalBlock & block = bundle.m_canonicalBlocks[i];
        if (!blockNumbersInUse.insert(block.m_blockNumber).second) {
            LOG_ERROR(subprocess) << "duplicate block number " << block.m_blockNumber;
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        if (block.IsPayloadBlock()) {
            ++numPayloadBlocks;
            if (block.m_blockNumber != PAYLOAD_BLOCK_NUMBER) {
                LOG_ERROR(subprocess) << "payload block has block number " << block.m_blockNumber;
                errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
                return false;
            }
        }
        else if (!registry.Interpret(block, errorCode)) {
            return false;
        }
    }
    const bool isAdminRecord = bundle.m_primaryBlock.IsAdminRecord();
    if ((numPayloadBlocks > 1) || ((numPayloadBlocks == 0) && (!isAdminRecord))) {
        LOG_ERROR(subprocess) << "bundle has " << numPayloadBlocks << " payload blocks";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if (bundle.m_primaryBlock.IsFragment()) {
        const uint64_t fragmentEnd = bundle.m_primaryBlock.m_fragmentOffset + bundle.GetPayloadLength();
        if ((fragmentEnd < bundle.m_primaryBlock.m_fragmentOffset) //overflow
            || (fragmentEnd > bundle.m_primaryBlock.m_totalApplicationDataUnitLength))
        {
            LOG_ERROR(subprocess) << "fragment at offset " << bundle.m_primaryBlock.m_fragmentOffset
                << " extends past the total application data unit length " << bundle.m_primaryBlock.m_totalApplicationDataUnitLength;
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
    }
    return true;
}
