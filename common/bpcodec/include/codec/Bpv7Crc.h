/**
 * @file Bpv7Crc.h
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
 * The Bpv7Crc.h file contains the CRC-16/X.25 and CRC-32C (Castagnoli)
 * checksums used by Bundle Protocol Version 7 blocks, along with the
 * CBOR byte string representation of a block CRC (RFC 9171 section 4.2.2).
 */

#ifndef BPV7_CRC_H
#define BPV7_CRC_H
#include <cstdint>
#include <cstddef>
#include <vector>
#include "Bp7ErrorCodes.h"
#include "EnumAsFlagsMacro.h"
#include "bpcodec_export.h"

enum class BPV7_CRC_TYPE : uint8_t {
    NONE       = 0,
    CRC16_X25  = 1,
    CRC32C     = 2
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(BPV7_CRC_TYPE);

class Bpv7Crc {
private:
    Bpv7Crc();
    ~Bpv7Crc();

public:
    BPCODEC_EXPORT static uint32_t Crc32C_Unaligned(const uint8_t* dataUnaligned, std::size_t length);
    BPCODEC_EXPORT static uint16_t Crc16_X25_Unaligned(const uint8_t* dataUnaligned, std::size_t length);
    
    /// Append the CBOR byte string (0x42 followed by two bytes msb first) to serialization.
    BPCODEC_EXPORT static void AppendCrc16ForBpv7(std::vector<uint8_t> & serialization, const uint16_t crc16);
    /// Append the CBOR byte string (0x44 followed by four bytes msb first) to serialization.
    BPCODEC_EXPORT static void AppendCrc32ForBpv7(std::vector<uint8_t> & serialization, const uint32_t crc32);
    BPCODEC_EXPORT static uint64_t SerializeCrc16ForBpv7(uint8_t * serialization, const uint16_t crc16);
    BPCODEC_EXPORT static uint64_t SerializeCrc32ForBpv7(uint8_t * serialization, const uint32_t crc32);
    BPCODEC_EXPORT static bool DeserializeCrc16ForBpv7(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint16_t & crc16);
    BPCODEC_EXPORT static bool DeserializeCrc32ForBpv7(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint32_t & crc32);

    /// @return 0, 2, or 4
    BPCODEC_EXPORT static unsigned int GetCrcSizeBytes(BPV7_CRC_TYPE crcType);
    /// @return false if crcTypeValue is not one of the BPV7_CRC_TYPE values
    BPCODEC_EXPORT static bool IsValidCrcType(uint64_t crcTypeValue);

    /** Compute the CRC of a block that was serialized (as a definite length array)
     * with a zeroed CRC byte string as its final element, and overwrite the zeroed bytes.
     *
     * @param blockSerialization The first byte of the serialized block.
     * @param blockSize The size of the serialized block including its CRC field.
     */
    BPCODEC_EXPORT static void ComputeAndPatchBlockCrc(uint8_t * blockSerialization, uint64_t blockSize, BPV7_CRC_TYPE crcType);

    /** Verify the CRC of a received block.  The CRC is recomputed over a copy of
     * the block in which the CRC value bytes are zeroed.
     *
     * @param isIndefiniteLengthArray True if the block ends with a break stop code following the CRC field.
     * @return True if the CRC matches, or False with errorCode set to MALFORMED_BLOCK or CRC_MISMATCH.
     */
    BPCODEC_EXPORT static bool VerifyBlockCrc(const uint8_t * blockSerialization, uint64_t blockSize,
        bool isIndefiniteLengthArray, BPV7_CRC_TYPE crcType, BP7_ERROR_CODE & errorCode);
};

/**
 * Accumulates a CRC-32C over data that arrives in order in more than one piece.
 */
class Crc32c_InOrderChunks {
public:
    BPCODEC_EXPORT Crc32c_InOrderChunks();
    BPCODEC_EXPORT ~Crc32c_InOrderChunks();
    BPCODEC_EXPORT void Reset();
    BPCODEC_EXPORT void AddUnalignedBytes(const uint8_t* dataUnaligned, std::size_t length);
    BPCODEC_EXPORT uint32_t FinalizeAndGet() const;
private:
    uint32_t m_crcRegister;
};
#endif //BPV7_CRC_H
