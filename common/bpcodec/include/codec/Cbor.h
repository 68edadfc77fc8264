/**
 * @file Cbor.h
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
 * RFC 8949 CBOR items and the codec used by every BPv7 block and TCPCL message.
 * The encoder always produces the deterministic form (shortest heads, map keys
 * sorted bytewise by their encoded form).  The decoder accepts any well-formed
 * input including non-shortest heads and indefinite length strings, arrays and maps.
 * Floating point items are not supported.
 */

#ifndef CBOR_H
#define CBOR_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>
#include "Bp7ErrorCodes.h"
#include "bpcodec_export.h"

enum class CBOR_MAJOR_TYPE : uint8_t {
    UNSIGNED_INTEGER = 0,
    NEGATIVE_INTEGER = 1,
    BYTE_STRING = 2,
    TEXT_STRING = 3,
    ARRAY = 4,
    MAP = 5,
    TAG = 6,
    SIMPLE_VALUE = 7
};

enum class CBOR_SIMPLE_VALUE : uint8_t {
    FALSE_VALUE = 20,
    TRUE_VALUE = 21,
    NULL_VALUE = 22,
    UNDEFINED_VALUE = 23
};

class CborItem {
public:
    CBOR_MAJOR_TYPE m_majorType;
    /// unsigned value, negative integer argument n (value is -1-n), tag number, or simple value
    uint64_t m_value;
    /// byte string contents or utf-8 text string contents
    std::vector<uint8_t> m_bytes;
    /// array elements, map entries flattened as key0,value0,key1,value1..., or the single tagged item
    std::vector<CborItem> m_items;
    /// arrays only, emitted as 0x9f ... 0xff
    bool m_isIndefiniteLength;

    BPCODEC_EXPORT CborItem(); //a default constructor: X()
    BPCODEC_EXPORT ~CborItem(); //a destructor: ~X()
    BPCODEC_EXPORT CborItem(const CborItem& o); //a copy constructor: X(const X&)
    BPCODEC_EXPORT CborItem(CborItem&& o); //a move constructor: X(X&&)
    BPCODEC_EXPORT CborItem& operator=(const CborItem& o); //a copy assignment: operator=(const X&)
    BPCODEC_EXPORT CborItem& operator=(CborItem&& o); //a move assignment: operator=(X&&)
    BPCODEC_EXPORT bool operator==(const CborItem & o) const; //operator ==
    BPCODEC_EXPORT bool operator!=(const CborItem & o) const; //operator !=
    BPCODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const CborItem& o); //diagnostic notation

    BPCODEC_EXPORT static CborItem Uint(uint64_t value);
    BPCODEC_EXPORT static CborItem Int(int64_t value);
    BPCODEC_EXPORT static CborItem NegativeFromArgument(uint64_t argument);
    BPCODEC_EXPORT static CborItem ByteString(const uint8_t * data, std::size_t size);
    BPCODEC_EXPORT static CborItem ByteString(const std::vector<uint8_t> & data);
    BPCODEC_EXPORT static CborItem ByteString(std::vector<uint8_t> && data);
    BPCODEC_EXPORT static CborItem TextString(const std::string & text);
    BPCODEC_EXPORT static CborItem Array();
    BPCODEC_EXPORT static CborItem IndefiniteArray();
    BPCODEC_EXPORT static CborItem Map();
    BPCODEC_EXPORT static CborItem Tag(uint64_t tagNumber, CborItem && taggedItem);
    BPCODEC_EXPORT static CborItem Bool(bool value);
    BPCODEC_EXPORT static CborItem Null();
    BPCODEC_EXPORT static CborItem Undefined();
    BPCODEC_EXPORT static CborItem Simple(uint8_t simpleValue);

    /// append to an array
    BPCODEC_EXPORT CborItem & Append(CborItem && item);
    BPCODEC_EXPORT CborItem & Append(const CborItem & item);
    BPCODEC_EXPORT void AddMapEntry(CborItem && key, CborItem && value);

    BPCODEC_EXPORT bool IsUint() const;
    BPCODEC_EXPORT bool IsNegative() const;
    BPCODEC_EXPORT bool IsByteString() const;
    BPCODEC_EXPORT bool IsTextString() const;
    BPCODEC_EXPORT bool IsArray() const;
    BPCODEC_EXPORT bool IsMap() const;
    BPCODEC_EXPORT bool IsTag() const;
    BPCODEC_EXPORT bool IsBool() const;
    BPCODEC_EXPORT bool IsNull() const;
    BPCODEC_EXPORT bool IsArrayOfSize(std::size_t expectedSize) const;

    /// @return false if the item is not an integer or does not fit in an int64_t
    BPCODEC_EXPORT bool GetInt64(int64_t & value) const;
    BPCODEC_EXPORT std::string GetTextString() const;
    BPCODEC_EXPORT std::size_t GetMapSize() const;
};

class Cbor {
private:
    Cbor();
public:
    static constexpr unsigned int MAX_NESTING_DEPTH = 64;
    static constexpr uint8_t BREAK_STOP_CODE = 0xff;
    static constexpr uint8_t INDEFINITE_LENGTH_ADDITIONAL_INFO = 31;

    /// Append the deterministic encoding of item to serialization.
    BPCODEC_EXPORT static void Encode(const CborItem & item, std::vector<uint8_t> & serialization);
    BPCODEC_EXPORT static std::vector<uint8_t> Encode(const CborItem & item);

    /// Append the shortest head (initial byte plus argument) for a major type.
    BPCODEC_EXPORT static void EncodeHead(CBOR_MAJOR_TYPE majorType, uint64_t argument, std::vector<uint8_t> & serialization);
    BPCODEC_EXPORT static unsigned int GetHeadSize(uint64_t argument);

    /** Decode one head.
     *
     * @param additionalInfo Set to the low 5 bits of the initial byte; 31 means indefinite length or break.
     * @return True on success, or False with errorCode set to MALFORMED_ENCODING or TRUNCATED_INPUT.
     */
    BPCODEC_EXPORT static bool DecodeHead(const uint8_t * serialization, uint64_t bufferSize,
        CBOR_MAJOR_TYPE & majorType, uint8_t & additionalInfo, uint64_t & argument,
        uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode);

    /** Decode exactly one item from the front of the buffer.
     *
     * @return True on success with numBytesTakenToDecode set, or False with errorCode set.
     */
    BPCODEC_EXPORT static bool Decode(const uint8_t * serialization, uint64_t bufferSize,
        CborItem & item, uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode);
    BPCODEC_EXPORT static bool Decode(const std::vector<uint8_t> & serialization,
        CborItem & item, uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode);

    /// Decode consecutive items until the buffer is exhausted.
    BPCODEC_EXPORT static bool DecodeAll(const uint8_t * serialization, uint64_t bufferSize,
        std::vector<CborItem> & items, BP7_ERROR_CODE & errorCode);

private:
    static bool DecodeRecursive(const uint8_t * serialization, uint64_t bufferSize, CborItem & item,
        uint64_t & numBytesTakenToDecode, unsigned int depth, BP7_ERROR_CODE & errorCode);
    static bool DecodeIndefiniteString(const uint8_t * serialization, uint64_t bufferSize, CBOR_MAJOR_TYPE majorType,
        CborItem & item, uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode);
};

#endif //CBOR_H
