/**
 * @file BundleV7.h
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
 * The Bpv7Bundle class holds one primary block and the ordered canonical
 * blocks of a Bundle Protocol Version 7 bundle, and converts between that
 * in-memory form and the wire form.
 * The Bpv7BundleId struct is the de-duplication key of a bundle.
 */

#ifndef BUNDLE_V7_H
#define BUNDLE_V7_H 1

#include "codec/bpv7.h"
#include <cstdint>
#include <string>
#include <vector>
#include "bpcodec_export.h"

/*
Each bundle SHALL be a concatenated sequence of at least two blocks,
represented as a CBOR indefinite-length array.  The first block in
the sequence (the first item of the array) MUST be a primary bundle
block in CBOR representation as described below; the bundle MUST
have exactly one primary bundle block. The primary block MUST be
followed by one or more canonical bundle blocks (additional array
items) in CBOR representation as described in 4.3.2 below.  Every
block following the primary block SHALL be the CBOR representation
of a canonical block.  The last such block MUST be a payload block;
the bundle MUST have exactly one payload block.  The payload block
SHALL be followed by a CBOR "break" stop code, terminating the
array.

The block number of the primary block is implicitly zero; the block
numbers of all other blocks are explicitly stated in block headers.
The block number of the payload block is always 1.
*/

struct Bpv7BundleId {
    EndpointId m_sourceEid;
    TimestampUtil::bpv7_creation_timestamp_t m_creationTimestamp;
    bool m_isFragment;
    uint64_t m_fragmentOffset;

    BPCODEC_EXPORT Bpv7BundleId();
    BPCODEC_EXPORT Bpv7BundleId(const EndpointId & sourceEid, const TimestampUtil::bpv7_creation_timestamp_t & creationTimestamp,
        bool isFragment, uint64_t fragmentOffset);
    BPCODEC_EXPORT bool operator==(const Bpv7BundleId & o) const;
    BPCODEC_EXPORT bool operator!=(const Bpv7BundleId & o) const;
    BPCODEC_EXPORT bool operator<(const Bpv7BundleId & o) const; //operator < so it can be used as a map key
    /// "<src>/<ms>/<seq>" with "/<offset>" appended for fragments
    BPCODEC_EXPORT std::string ToString() const;
    BPCODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const Bpv7BundleId& o);
};

class Bpv7Bundle {
public:
    Bpv7PrimaryBlock m_primaryBlock;
    /// insertion order is preserved on the wire, payload block last
    std::vector<Bpv7CanonicalBlock> m_canonicalBlocks;

    BPCODEC_EXPORT Bpv7Bundle(); //a default constructor: X()
    BPCODEC_EXPORT ~Bpv7Bundle(); //a destructor: ~X()
    BPCODEC_EXPORT Bpv7Bundle(const Bpv7Bundle& o); //a copy constructor: X(const X&)
    BPCODEC_EXPORT Bpv7Bundle(Bpv7Bundle&& o); //a move constructor: X(X&&)
    BPCODEC_EXPORT Bpv7Bundle& operator=(const Bpv7Bundle& o); //a copy assignment: operator=(const X&)
    BPCODEC_EXPORT Bpv7Bundle& operator=(Bpv7Bundle&& o); //a move assignment: operator=(X&&)
    BPCODEC_EXPORT bool operator==(const Bpv7Bundle & o) const; //operator ==
    BPCODEC_EXPORT bool operator!=(const Bpv7Bundle & o) const; //operator !=
    BPCODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const Bpv7Bundle& o);

    /** Build a new bundle with a primary block stamped now and a payload block numbered 1.
     *
     * @param lifetimeMilliseconds Must be greater than zero.
     * @param timestampGenerator The source's generator, or NULL for the process wide one.
     * @return True on success, or False with errorCode set to INVALID_ARGUMENT.
     */
    BPCODEC_EXPORT static bool Create(const EndpointId & sourceNodeId, const EndpointId & destinationEid,
        const EndpointId & reportToEid, const std::vector<uint8_t> & payload, int64_t lifetimeMilliseconds,
        BPV7_BUNDLEFLAG flags, Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode,
        TimestampUtil::Bpv7CreationTimestampGenerator * timestampGenerator = NULL,
        BPV7_CRC_TYPE crcType = BPV7_CRC_TYPE::CRC16_X25);

    /** Insert an extension block ahead of the payload block.
     *
     * @param block A block number of 0 means assign the highest block number in use plus one.
     * @return True on success, or False with errorCode set to INVALID_ARGUMENT for a payload
     * block or MALFORMED_BLOCK for a duplicate block number.
     */
    BPCODEC_EXPORT bool AddExtensionBlock(Bpv7CanonicalBlock && block, BP7_ERROR_CODE & errorCode);
    BPCODEC_EXPORT uint64_t GetNextFreeBlockNumber() const;

    /// @return NULL if the bundle has no payload block
    BPCODEC_EXPORT Bpv7CanonicalBlock * GetPayloadBlock();
    BPCODEC_EXPORT const Bpv7CanonicalBlock * GetPayloadBlock() const;
    BPCODEC_EXPORT std::vector<const Bpv7CanonicalBlock *> GetCanonicalBlocksByType(BPV7_BLOCK_TYPE_CODE blockTypeCode) const;
    BPCODEC_EXPORT uint64_t GetPayloadLength() const;

    BPCODEC_EXPORT Bpv7BundleId GetBundleId() const;
    BPCODEC_EXPORT bool HasExpired(uint64_t nowMillisecondsSinceDtnEpoch) const;

    /// Serialize as an indefinite length array of blocks, primary block first.
    BPCODEC_EXPORT void Serialize(std::vector<uint8_t> & serialization) const;
    BPCODEC_EXPORT std::vector<uint8_t> Serialize() const;

    /** Decode a whole bundle and validate its block structure.
     *
     * @param blockRegistry Extension block interpreters to run, or NULL for the default registry.
     * @return True on success, or False with errorCode set to the codec, block or EID error that stopped decoding.
     */
    BPCODEC_EXPORT static bool Deserialize(const uint8_t * serialization, uint64_t bufferSize,
        Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode, const Bpv7BlockRegistry * blockRegistry = NULL);
    BPCODEC_EXPORT static bool Deserialize(const std::vector<uint8_t> & serialization,
        Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode, const Bpv7BlockRegistry * blockRegistry = NULL);
};

#endif //BUNDLE_V7_H
