/**
 * @file Bpv7Crc.cpp
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

#include "codec/Bpv7Crc.h"
#include "Logger.h"
#include <boost/crc.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::codec;

//reflected in and out, init and final xor all ones
typedef boost::crc_optimal<32, 0x1EDC6F41, UINT32_MAX, UINT32_MAX, true, true> boost_crc32c_t;
typedef boost::crc_optimal<16, 0x1021, UINT16_MAX, UINT16_MAX, true, true> boost_crc16_x25_t;

static constexpr uint8_t CBOR_BYTE_STRING_LENGTH_2 = (2U << 5) | 2U; //major type 2, additional information 2
static constexpr uint8_t CBOR_BYTE_STRING_LENGTH_4 = (2U << 5) | 4U; //major type 2, additional information 4

uint32_t Bpv7Crc::Crc32C_Unaligned(const uint8_t* dataUnaligned, std::size_t length) {
    boost_crc32c_t crc;
    crc.process_bytes(dataUnaligned, length);
    return crc();
}

uint16_t Bpv7Crc::Crc16_X25_Unaligned(const uint8_t* dataUnaligned, std::size_t length) {
    boost_crc16_x25_t crc;
    crc.process_bytes(dataUnaligned, length);
    return crc();
}

//CRC SHALL be omitted from a block if and only if the block's CRC
//type code is zero.
//When not omitted, the CRC SHALL be represented as a CBOR byte string
//of two bytes (CRC type 1) or of four bytes (CRC type 2),
//in network byte order.
uint64_t Bpv7Crc::SerializeCrc16ForBpv7(uint8_t * serialization, const uint16_t crc16) {
    *serialization++ = CBOR_BYTE_STRING_LENGTH_2;
    *serialization++ = static_cast<uint8_t>(crc16 >> 8); //msb first
    *serialization = static_cast<uint8_t>(crc16); //lsb last
    return 3;
}

uint64_t Bpv7Crc::SerializeCrc32ForBpv7(uint8_t * serialization, const uint32_t crc32) {
    *serialization++ = CBOR_BYTE_STRING_LENGTH_4;
    *serialization++ = static_cast<uint8_t>(crc32 >> 24); //msb first
    *serialization++ = static_cast<uint8_t>(crc32 >> 16);
    *serialization++ = static_cast<uint8_t>(crc32 >> 8);
    *serialization = static_cast<uint8_t>(crc32); //lsb last
    return 5;
}

void Bpv7Crc::AppendCrc16ForBpv7(std::vector<uint8_t> & serialization, const uint16_t crc16) {
    const std::size_t startIndex = serialization.size();
    serialization.resize(startIndex + 3);
    SerializeCrc16ForBpv7(&serialization[startIndex], crc16);
}

void Bpv7Crc::AppendCrc32ForBpv7(std::vector<uint8_t> & serialization, const uint32_t crc32) {
    const std::size_t startIndex = serialization.size();
    serialization.resize(startIndex + 5);
    SerializeCrc32ForBpv7(&serialization[startIndex], crc32);
}

bool Bpv7Crc::DeserializeCrc16ForBpv7(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint16_t & crc16) {
    const uint8_t initialCborByte = *serialization++;
    if (initialCborByte != CBOR_BYTE_STRING_LENGTH_2) {
        return false;
    }
    crc16 = *serialization++; //msb first
    crc16 <<= 8;
    crc16 |= *serialization; //lsb last
    *numBytesTakenToDecode = 3;
    return true;
}

bool Bpv7Crc::DeserializeCrc32ForBpv7(const uint8_t * serialization, uint8_t * numBytesTakenToDecode, uint32_t & crc32) {
    const uint8_t initialCborByte = *serialization++;
    if (initialCborByte != CBOR_BYTE_STRING_LENGTH_4) {
        return false;
    }
    crc32 = *serialization++; //msb first
    for (unsigned int i = 0; i < 3; ++i) {
        crc32 <<= 8;
        crc32 |= *serialization++;
    }
    *numBytesTakenToDecode = 5;
    return true;
}

unsigned int Bpv7Crc::GetCrcSizeBytes(BPV7_CRC_TYPE crcType) {
    if (crcType == BPV7_CRC_TYPE::CRC16_X25) {
        return 2;
    }
    else if (crcType == BPV7_CRC_TYPE::CRC32C) {
        return 4;
    }
    return 0;
}

bool Bpv7Crc::IsValidCrcType(uint64_t crcTypeValue) {
    return (crcTypeValue <= static_cast<uint64_t>(BPV7_CRC_TYPE::CRC32C));
}

void Bpv7Crc::ComputeAndPatchBlockCrc(uint8_t * blockSerialization, uint64_t blockSize, BPV7_CRC_TYPE crcType) {
    //the crc value bytes are the last bytes of the block and must already be zero
    if (crcType == BPV7_CRC_TYPE::CRC16_X25) {
        const uint16_t crc16 = Crc16_X25_Unaligned(blockSerialization, blockSize);
        SerializeCrc16ForBpv7(blockSerialization + (blockSize - 3), crc16);
    }
    else if (crcType == BPV7_CRC_TYPE::CRC32C) {
        const uint32_t crc32 = Crc32C_Unaligned(blockSerialization, blockSize);
        SerializeCrc32ForBpv7(blockSerialization + (blockSize - 5), crc32);
    }
}

bool Bpv7Crc::VerifyBlockCrc(const uint8_t * blockSerialization, uint64_t blockSize,
    bool isIndefiniteLengthArray, BPV7_CRC_TYPE crcType, BP7_ERROR_CODE & errorCode)
{
    const unsigned int crcSize = GetCrcSizeBytes(crcType);
    if (crcSize == 0) {
        return true;
    }
    const uint64_t crcFieldEnd = blockSize - ((isIndefiniteLengthArray) ? 1 : 0);
    if (crcFieldEnd < (crcSize + 2)) { //at least an array head plus the crc byte string
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    const uint64_t crcFieldStart = crcFieldEnd - (crcSize + 1);
    std::vector<uint8_t> zeroedCopy(blockSerialization, blockSerialization + blockSize);
    uint8_t numBytesTakenToDecode;
    if (crcType == BPV7_CRC_TYPE::CRC16_X25) {
        uint16_t receivedCrc16;
        if (!DeserializeCrc16ForBpv7(blockSerialization + crcFieldStart, &numBytesTakenToDecode, receivedCrc16)) {
            LOG_ERROR(subprocess) << "block crc16 field is not a two byte byte string";
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        zeroedCopy[crcFieldStart + 1] = 0;
        zeroedCopy[crcFieldStart + 2] = 0;
        const uint16_t computedCrc16 = Crc16_X25_Unaligned(zeroedCopy.data(), zeroedCopy.size());
        if (computedCrc16 != receivedCrc16) {
            LOG_ERROR(subprocess) << "block crc16 mismatch: received " << receivedCrc16 << " computed " << computedCrc16;
            errorCode = BP7_ERROR_CODE::CRC_MISMATCH;
            return false;
        }
    }
    else {
        uint32_t receivedCrc32;
        if (!DeserializeCrc32ForBpv7(blockSerialization + crcFieldStart, &numBytesTakenToDecode, receivedCrc32)) {
            LOG_ERROR(subprocess) << "block crc32c field is not a four byte byte string";
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        for (unsigned int i = 1; i <= 4; ++i) {
            zeroedCopy[crcFieldStart + i] = 0;
        }
        const uint32_t computedCrc32 = Crc32C_Unaligned(zeroedCopy.data(), zeroedCopy.size());
        if (computedCrc32 != receivedCrc32) {
            LOG_ERROR(subprocess) << "block crc32c mismatch: received " << receivedCrc32 << " computed " << computedCrc32;
            errorCode = BP7_ERROR_CODE::CRC_MISMATCH;
            return false;
        }
    }
    return true;
}

Crc32c_InOrderChunks::Crc32c_InOrderChunks() {
    Reset();
}
Crc32c_InOrderChunks::~Crc32c_InOrderChunks() {}

void Crc32c_InOrderChunks::Reset() {
    m_crcRegister = boost_crc32c_t().get_interim_remainder();
}

void Crc32c_InOrderChunks::AddUnalignedBytes(const uint8_t* dataUnaligned, std::size_t length) {
    boost_crc32c_t crc(m_crcRegister);
    crc.process_bytes(dataUnaligned, length);
    m_crcRegister = crc.get_interim_remainder();
}

uint32_t Crc32c_InOrderChunks::FinalizeAndGet() const {
    boost_crc32c_t crc(m_crcRegister);
    return crc.checksum();
}
