/**
 * @file bpv7.h
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * The bpv7.h file defines the blocks used for Bundle Protocol Version 7:
 * the primary block, the canonical block, the RFC 9171 extension block
 * interpreters, the block type registry, and the bundle status report
 * administrative record.
 */

#ifndef BPV7_H
#define BPV7_H 1
#include <cstdint>
#include <cstddef>
#include <map>
#include <vector>
#include <boost/function.hpp>
#include "TimestampUtil.h"
#include "EnumAsFlagsMacro.h"
#include "Bp7ErrorCodes.h"
#include "codec/Cbor.h"
#include "codec/Bpv7Crc.h"
#include "codec/EndpointId.h"
#include "bpcodec_export.h"

enum class BPV7_BUNDLEFLAG : uint64_t {
    NO_FLAGS_SET =                        0,
    ISFRAGMENT =                          1 << 0, //(0x0001)
    ADMINRECORD =                         1 << 1, //(0x0002)
    NOFRAGMENT =                          1 << 2, //(0x0004)
    USER_APP_ACK_REQUESTED =              1 << 5, //(0x0020)
    STATUSTIME_REQUESTED =                1 << 6, //(0x0040)
    RECEPTION_STATUS_REPORTS_REQUESTED =  1 << 14,//(0x4000)
    FORWARDING_STATUS_REPORTS_REQUESTED = 1 << 16,//(0x10000)
    DELIVERY_STATUS_REPORTS_REQUESTED =   1 << 17,//(0x20000)
    DELETION_STATUS_REPORTS_REQUESTED =   1 << 18 //(0x40000)
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(BPV7_BUNDLEFLAG);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_BUNDLEFLAG);
static constexpr uint64_t BPV7_BUNDLEFLAG_ALL_KNOWN_FLAGS_MASK = 0x74067;

enum class BPV7_BLOCKFLAG : uint64_t {
    NO_FLAGS_SET =                                       0,
    MUST_BE_REPLICATED =                                 1 << 0, //(0x01)
    STATUS_REPORT_REQUESTED_IF_BLOCK_CANT_BE_PROCESSED = 1 << 1, //(0x02)
    DELETE_BUNDLE_IF_BLOCK_CANT_BE_PROCESSED =           1 << 2, //(0x04)
    REMOVE_BLOCK_IF_IT_CANT_BE_PROCESSED =               1 << 4  //(0x10)
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(BPV7_BLOCKFLAG);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_BLOCKFLAG);
static constexpr uint64_t BPV7_BLOCKFLAG_ALL_KNOWN_FLAGS_MASK = 0x17;

// https://www.iana.org/assignments/bundle/bundle.xhtml#block-types
enum class BPV7_BLOCK_TYPE_CODE : uint64_t {
    PRIMARY_IMPLICIT_ZERO       = 0,
    PAYLOAD                     = 1,
    PREVIOUS_NODE               = 6,
    BUNDLE_AGE                  = 7,
    HOP_COUNT                   = 10,
    INTEGRITY                   = 11,
    CONFIDENTIALITY             = 12
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_BLOCK_TYPE_CODE);

enum class BPV7_ADMINISTRATIVE_RECORD_TYPE_CODE : uint64_t {
    UNUSED_ZERO                 = 0,
    BUNDLE_STATUS_REPORT        = 1
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_ADMINISTRATIVE_RECORD_TYPE_CODE);

enum class BPV7_STATUS_REPORT_REASON_CODE : uint64_t {
    NO_FURTHER_INFORMATION                    = 0,
    LIFETIME_EXPIRED                          = 1,
    FORWARDED_OVER_UNIDIRECTIONAL_LINK        = 2,
    TRANSMISSION_CANCELLED                    = 3,
    DEPLETED_STORAGE                          = 4,
    DESTINATION_EID_UNINTELLIGIBLE            = 5,
    NO_KNOWN_ROUTE_DESTINATION_FROM_HERE      = 6,
    NO_TIMELY_CONTACT_WITH_NEXT_NODE_ON_ROUTE = 7,
    BLOCK_UNINTELLIGIBLE                      = 8,
    HOP_LIMIT_EXCEEDED                        = 9,
    TRAFFIC_PARED                             = 10,
    BLOCK_UNSUPPORTED                         = 11
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_STATUS_REPORT_REASON_CODE);

class Bpv7PrimaryBlock {
public:
    static constexpr uint64_t BPV7_VERSION = 7;

    BPV7_BUNDLEFLAG m_bundleProcessingControlFlags;
    EndpointId m_destinationEid;
    EndpointId m_sourceNodeId;
    EndpointId m_reportToEid;
    TimestampUtil::bpv7_creation_timestamp_t m_creationTimestamp;
    uint64_t m_lifetimeMilliseconds;
    uint64_t m_fragmentOffset; //only serialized when ISFRAGMENT is set
    uint64_t m_totalApplicationDataUnitLength; //only serialized when ISFRAGMENT is set
    BPV7_CRC_TYPE m_crcType;

    BPCODEC_EXPORT Bpv7PrimaryBlock(); //a default constructor: X()
    BPCODEC_EXPORT ~Bpv7PrimaryBlock(); //a destructor: ~X()
    BPCODEC_EXPORT Bpv7PrimaryBlock(const Bpv7PrimaryBlock& o); //a copy constructor: X(const X&)
    BPCODEC_EXPORT Bpv7PrimaryBlock(Bpv7PrimaryBlock&& o); //a move constructor: X(X&&)
    BPCODEC_EXPORT Bpv7PrimaryBlock& operator=(const Bpv7PrimaryBlock& o); //a copy assignment: operator=(const X&)
    BPCODEC_EXPORT Bpv7PrimaryBlock& operator=(Bpv7PrimaryBlock&& o); //a move assignment: operator=(X&&)
    BPCODEC_EXPORT bool operator==(const Bpv7PrimaryBlock & o) const; //operator ==
    BPCODEC_EXPORT bool operator!=(const Bpv7PrimaryBlock & o) const; //operator !=
    BPCODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const Bpv7PrimaryBlock& o);
    BPCODEC_EXPORT void SetZero();

    BPCODEC_EXPORT bool IsFragment() const;
    BPCODEC_EXPORT bool IsAdminRecord() const;
    BPCODEC_EXPORT bool HasFlag(BPV7_BUNDLEFLAG flag) const;
    /// creation time plus lifetime, in milliseconds since the DTN epoch
    BPCODEC_EXPORT uint64_t GetExpirationMilliseconds() const;
    BPCODEC_EXPORT bool HasExpired(uint64_t nowMillisecondsSinceDtnEpoch) const;

    /// Append the block (with its CRC computed) to serialization.
    BPCODEC_EXPORT void AppendSerialization(std::vector<uint8_t> & serialization) const;

    /** Decode the primary block at the front of serialization and verify its CRC.
     *
     * @return True on success, or False with errorCode set to a codec error, MALFORMED_BLOCK, INVALID_EID or CRC_MISMATCH.
     */
    BPCODEC_EXPORT bool Deserialize(const uint8_t * serialization, uint64_t bufferSize,
        uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode);

    /// creation timestamp as [ms, seq]
    BPCODEC_EXPORT static CborItem CreationTimestampToCbor(const TimestampUtil::bpv7_creation_timestamp_t & ts);
    BPCODEC_EXPORT static bool CreationTimestampFromCbor(const CborItem & item, TimestampUtil::bpv7_creation_timestamp_t & ts);
};

class Bpv7CanonicalBlock {
public:
    BPV7_BLOCK_TYPE_CODE m_blockTypeCode;
    uint64_t m_blockNumber;
    BPV7_BLOCKFLAG m_blockProcessingControlFlags;
    BPV7_CRC_TYPE m_crcType;
    /// the raw application data for the payload block, otherwise the block-type-specific encoding
    std::vector<uint8_t> m_blockTypeSpecificData;

    BPCODEC_EXPORT Bpv7CanonicalBlock(); //a default constructor: X()
    BPCODEC_EXPORT Bpv7CanonicalBlock(BPV7_BLOCK_TYPE_CODE blockTypeCode, uint64_t blockNumber,
        BPV7_BLOCKFLAG flags, BPV7_CRC_TYPE crcType, std::vector<uint8_t> && blockTypeSpecificData);
    BPCODEC_EXPORT ~Bpv7CanonicalBlock(); //a destructor: ~X()
    BPCODEC_EXPORT Bpv7CanonicalBlock(const Bpv7CanonicalBlock& o); //a copy constructor: X(const X&)
    BPCODEC_EXPORT Bpv7CanonicalBlock(Bpv7CanonicalBlock&& o); //a move constructor: X(X&&)
    BPCODEC_EXPORT Bpv7CanonicalBlock& operator=(const Bpv7CanonicalBlock& o); //a copy assignment: operator=(const X&)
    BPCODEC_EXPORT Bpv7CanonicalBlock& operator=(Bpv7CanonicalBlock&& o); //a move assignment: operator=(X&&)
    BPCODEC_EXPORT bool operator==(const Bpv7CanonicalBlock & o) const; //operator ==
    BPCODEC_EXPORT bool operator!=(const Bpv7CanonicalBlock & o) const; //operator !=
    BPCODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const Bpv7CanonicalBlock& o);
    BPCODEC_EXPORT void SetZero();

    BPCODEC_EXPORT bool IsPayloadBlock() const;
    BPCODEC_EXPORT bool HasFlag(BPV7_BLOCKFLAG flag) const;

    BPCODEC_EXPORT void AppendSerialization(std::vector<uint8_t> & serialization) const;
    BPCODEC_EXPORT bool Deserialize(const uint8_t * serialization, uint64_t bufferSize,
        uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode);
};

/// Previous Node block (type 6): the node id of the node that forwarded the bundle.
struct Bpv7PreviousNodeBlockData {
    EndpointId m_previousNode;

    BPCODEC_EXPORT Bpv7PreviousNodeBlockData();
    BPCODEC_EXPORT explicit Bpv7PreviousNodeBlockData(const EndpointId & previousNode);
    BPCODEC_EXPORT bool operator==(const Bpv7PreviousNodeBlockData & o) const;
    BPCODEC_EXPORT Bpv7CanonicalBlock ToCanonicalBlock(BPV7_CRC_TYPE crcType = BPV7_CRC_TYPE::CRC16_X25) const;
    BPCODEC_EXPORT static bool FromCanonicalBlock(const Bpv7CanonicalBlock & block, Bpv7PreviousNodeBlockData & data, BP7_ERROR_CODE & errorCode);
};

/// Bundle Age block (type 7): milliseconds elapsed since creation, for nodes without an accurate clock.
struct Bpv7BundleAgeBlockData {
    uint64_t m_bundleAgeMilliseconds;

    BPCODEC_EXPORT Bpv7BundleAgeBlockData();
    BPCODEC_EXPORT explicit Bpv7BundleAgeBlockData(uint64_t bundleAgeMilliseconds);
    BPCODEC_EXPORT bool operator==(const Bpv7BundleAgeBlockData & o) const;
    BPCODEC_EXPORT Bpv7CanonicalBlock ToCanonicalBlock(BPV7_CRC_TYPE crcType = BPV7_CRC_TYPE::CRC16_X25) const;
    BPCODEC_EXPORT static bool FromCanonicalBlock(const Bpv7CanonicalBlock & block, Bpv7BundleAgeBlockData & data, BP7_ERROR_CODE & errorCode);
};

/// Hop Count block (type 10): [hop limit, hop count].
struct Bpv7HopCountBlockData {
    uint64_t m_hopLimit;
    uint64_t m_hopCount;

    BPCODEC_EXPORT Bpv7HopCountBlockData();
    BPCODEC_EXPORT Bpv7HopCountBlockData(uint64_t hopLimit, uint64_t hopCount);
    BPCODEC_EXPORT bool operator==(const Bpv7HopCountBlockData & o) const;
    BPCODEC_EXPORT bool HasExceededLimit() const;
    BPCODEC_EXPORT Bpv7CanonicalBlock ToCanonicalBlock(BPV7_CRC_TYPE crcType = BPV7_CRC_TYPE::CRC16_X25) const;
    BPCODEC_EXPORT static bool FromCanonicalBlock(const Bpv7CanonicalBlock & block, Bpv7HopCountBlockData & data, BP7_ERROR_CODE & errorCode);
};

/**
 * Maps a block type code to the function that validates its block-type-specific data.
 * Block types without a registered interpreter are carried as opaque data.
 * A default constructed registry knows the Previous Node, Bundle Age and Hop Count blocks.
 */
class Bpv7BlockRegistry {
public:
    typedef boost::function<bool(const Bpv7CanonicalBlock & block, BP7_ERROR_CODE & errorCode)> BlockInterpreterFunction_t;

    BPCODEC_EXPORT Bpv7BlockRegistry();
    BPCODEC_EXPORT void RegisterInterpreter(BPV7_BLOCK_TYPE_CODE blockTypeCode, const BlockInterpreterFunction_t & interpreter);
    BPCODEC_EXPORT bool HasInterpreter(BPV7_BLOCK_TYPE_CODE blockTypeCode) const;
    /// @return True if the block has no interpreter or its interpreter accepts it.
    BPCODEC_EXPORT bool Interpret(const Bpv7CanonicalBlock & block, BP7_ERROR_CODE & errorCode) const;
    BPCODEC_EXPORT static const Bpv7BlockRegistry & GetDefaultRegistry();
private:
    std::map<BPV7_BLOCK_TYPE_CODE, BlockInterpreterFunction_t> m_interpreters;
};

/**
 * Bundle status report administrative record (RFC 9171 section 6.1.1).
 * Carried in the payload of a bundle with the ADMINRECORD flag set as [1, report].
 */
class Bpv7BundleStatusReport {
public:
    enum class STATUS_INDEX : uint8_t {
        RECEIVED = 0,
        FORWARDED,
        DELIVERED,
        DELETED,
        NUM_STATUS_ASSERTIONS
    };
    struct status_assertion_t {
        bool asserted;
        bool hasTime; //only when STATUSTIME_REQUESTED
        uint64_t timeMillisecondsSinceDtnEpoch;
        BPCODEC_EXPORT status_assertion_t();
        BPCODEC_EXPORT bool operator==(const status_assertion_t & o) const;
    };

    status_assertion_t m_statusAssertions[static_cast<uint8_t>(STATUS_INDEX::NUM_STATUS_ASSERTIONS)];
    BPV7_STATUS_REPORT_REASON_CODE m_reasonCode;
    EndpointId m_subjectSourceNodeId;
    TimestampUtil::bpv7_creation_timestamp_t m_subjectCreationTimestamp;
    bool m_subjectIsFragment;
    uint64_t m_subjectFragmentOffset;
    uint64_t m_subjectPayloadLength;

    BPCODEC_EXPORT Bpv7BundleStatusReport();
    BPCODEC_EXPORT bool operator==(const Bpv7BundleStatusReport & o) const;
    BPCODEC_EXPORT bool operator!=(const Bpv7BundleStatusReport & o) const;
    BPCODEC_EXPORT void Assert(STATUS_INDEX statusIndex);
    BPCODEC_EXPORT void AssertWithTime(STATUS_INDEX statusIndex, uint64_t timeMillisecondsSinceDtnEpoch);
    BPCODEC_EXPORT bool IsAsserted(STATUS_INDEX statusIndex) const;

    /// The serialized administrative record, ready to become a payload.
    BPCODEC_EXPORT std::vector<uint8_t> SerializeAdministrativeRecord() const;
    BPCODEC_EXPORT bool DeserializeAdministrativeRecord(const std::vector<uint8_t> & adminRecordSerialization, BP7_ERROR_CODE & errorCode);
};

#endif //BPV7_H
