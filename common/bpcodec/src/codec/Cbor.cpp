/**
 * @file Cbor.cpp
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

#include "codec/Cbor.h"
#include "Logger.h"
#include <algorithm>
#include <limits>
#include <boost/endian/conversion.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::codec;

#define CBOR_ARGUMENT_UINT8_AI   (24)
#define CBOR_ARGUMENT_UINT16_AI  (25)
#define CBOR_ARGUMENT_UINT32_AI  (26)
#define CBOR_ARGUMENT_UINT64_AI  (27)

constexpr unsigned int Cbor::MAX_NESTING_DEPTH;
constexpr uint8_t Cbor::BREAK_STOP_CODE;
constexpr uint8_t Cbor::INDEFINITE_LENGTH_ADDITIONAL_INFO;

static std::vector<uint8_t> EncodeToNewVector(const CborItem & item) {
    std::vector<uint8_t> v;
    Cbor::Encode(item, v);
    return v;
}

CborItem::CborItem() :
    m_majorType(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER),
    m_value(0),
    m_isIndefiniteLength(false) { } //a default constructor: X()
CborItem::~CborItem() { } //a destructor: ~X()
CborItem::CborItem(const CborItem& o) :
    m_majorType(o.m_majorType),
    m_value(o.m_value),
    m_bytes(o.m_bytes),
    m_items(o.m_items),
    m_isIndefiniteLength(o.m_isIndefiniteLength) { } //a copy constructor: X(const X&)
CborItem::CborItem(CborItem&& o) :
    m_majorType(o.m_majorType),
    m_value(o.m_value),
    m_bytes(std::move(o.m_bytes)),
    m_items(std::move(o.m_items)),
    m_isIndefiniteLength(o.m_isIndefiniteLength) { } //a move constructor: X(X&&)
CborItem& CborItem::operator=(const CborItem& o) { //a copy assignment: operator=(const X&)
    m_majorType = o.m_majorType;
    m_value = o.m_value;
    m_bytes = o.m_bytes;
    m_items = o.m_items;
    m_isIndefiniteLength = o.m_isIndefiniteLength;
    return *this;
}
CborItem& CborItem::operator=(CborItem && o) { //a move assignment: operator=(X&&)
    m_majorType = o.m_majorType;
    m_value = o.m_value;
    m_bytes = std::move(o.m_bytes);
    m_items = std::move(o.m_items);
    m_isIndefiniteLength = o.m_isIndefiniteLength;
    return *this;
}
bool CborItem::operator==(const CborItem & o) const {
    return (m_majorType == o.m_majorType)
        && (m_value == o.m_value)
        && (m_bytes == o.m_bytes)
        && (m_items == o.m_items)
        && (m_isIndefiniteLength == o.m_isIndefiniteLength);
}
bool CborItem::operator!=(const CborItem & o) const {
    return !(*this == o);
}

std::ostream& operator<<(std::ostream& os, const CborItem& o) {
    switch (o.m_majorType) {
        case CBOR_MAJOR_TYPE::UNSIGNED_INTEGER:
            os << o.m_value;
            break;
        case CBOR_MAJOR_TYPE::NEGATIVE_INTEGER:
            if (o.m_value == std::numeric_limits<uint64_t>::max()) {
                os << "-18446744073709551616";
            }
            else {
                os << "-" << (o.m_value + 1);
            }
            break;
        case CBOR_MAJOR_TYPE::BYTE_STRING: {
            static const char * const hexDigits = "0123456789abcdef";
            os << "h'";
            for (std::size_t i = 0; i < o.m_bytes.size(); ++i) {
                os << hexDigits[o.m_bytes[i] >> 4] << hexDigits[o.m_bytes[i] & 0x0f];
            }
            os << "'";
            break;
        }
        case CBOR_MAJOR_TYPE::TEXT_STRING:
            os << "\"" << o.GetTextString() << "\"";
            break;
        case CBOR_MAJOR_TYPE::ARRAY:
            os << ((o.m_isIndefiniteLength) ? "[_ " : "[");
            for (std::size_t i = 0; i < o.m_items.size(); ++i) {
                if (i) {
                    os << ", ";
                }
                os << o.m_items[i];
            }
            os << "]";
            break;
        case CBOR_MAJOR_TYPE::MAP:
            os << "{";
            for (std::size_t i = 0; (i + 1) < o.m_items.size(); i += 2) {
                if (i) {
                    os << ", ";
                }
                os << o.m_items[i] << ": " << o.m_items[i + 1];
            }
            os << "}";
            break;
        case CBOR_MAJOR_TYPE::TAG:
            os << o.m_value << "(";
            if (!o.m_items.empty()) {
                os << o.m_items[0];
            }
            os << ")";
            break;
        case CBOR_MAJOR_TYPE::SIMPLE_VALUE:
            if (o.m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::FALSE_VALUE)) {
                os << "false";
            }
            else if (o.m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::TRUE_VALUE)) {
                os << "true";
            }
            else if (o.m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::NULL_VALUE)) {
                os << "null";
            }
            else if (o.m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::UNDEFINED_VALUE)) {
                os << "undefined";
            }
            else {
                os << "simple(" << o.m_value << ")";
            }
            break;
    }
    return os;
}

CborItem CborItem::Uint(uint64_t value) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::UNSIGNED_INTEGER;
    item.m_value = value;
    return item;
}
CborItem CborItem::Int(int64_t value) {
    if (value >= 0) {
        return Uint(static_cast<uint64_t>(value));
    }
    //-1 - value without signed overflow at INT64_MIN
    return NegativeFromArgument(static_cast<uint64_t>(-(value + 1)));
}
CborItem CborItem::NegativeFromArgument(uint64_t argument) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::NEGATIVE_INTEGER;
    item.m_value = argument;
    return item;
}
CborItem CborItem::ByteString(const uint8_t * data, std::size_t size) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::BYTE_STRING;
    item.m_bytes.assign(data, data + size);
    return item;
}
CborItem CborItem::ByteString(const std::vector<uint8_t> & data) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::BYTE_STRING;
    item.m_bytes = data;
    return item;
}
CborItem CborItem::ByteString(std::vector<uint8_t> && data) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::BYTE_STRING;
    item.m_bytes = std::move(data);
    return item;
}
CborItem CborItem::TextString(const std::string & text) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::TEXT_STRING;
    item.m_bytes.assign(text.begin(), text.end());
    return item;
}
CborItem CborItem::Array() {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::ARRAY;
    return item;
}
CborItem CborItem::IndefiniteArray() {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::ARRAY;
    item.m_isIndefiniteLength = true;
    return item;
}
CborItem CborItem::Map() {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::MAP;
    return item;
}
CborItem CborItem::Tag(uint64_t tagNumber, CborItem && taggedItem) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::TAG;
    item.m_value = tagNumber;
    item.m_items.push_back(std::move(taggedItem));
    return item;
}
CborItem CborItem::Bool(bool value) {
    return Simple(static_cast<uint8_t>((value) ? CBOR_SIMPLE_VALUE::TRUE_VALUE : CBOR_SIMPLE_VALUE::FALSE_VALUE));
}
CborItem CborItem::Null() {
    return Simple(static_cast<uint8_t>(CBOR_SIMPLE_VALUE::NULL_VALUE));
}
CborItem CborItem::Undefined() {
    return Simple(static_cast<uint8_t>(CBOR_SIMPLE_VALUE::UNDEFINED_VALUE));
}
CborItem CborItem::Simple(uint8_t simpleValue) {
    CborItem item;
    item.m_majorType = CBOR_MAJOR_TYPE::SIMPLE_VALUE;
    item.m_value = simpleValue;
    return item;
}

CborItem & CborItem::Append(CborItem && item) {
    m_items.push_back(std::move(item));
    return *this;
}
CborItem & CborItem::Append(const CborItem & item) {
    m_items.push_back(item);
    return *this;
}

//keeps entries ordered by the bytewise order of their encoded keys so that
//two maps holding the same entries compare equal regardless of insertion order
void CborItem::AddMapEntry(CborItem && key, CborItem && value) {
    const std::vector<uint8_t> encodedKey = EncodeToNewVector(key);
    //binary search for the first entry whose key sorts after the new one
    std::size_t lowEntry = 0;
    std::size_t highEntry = m_items.size() / 2;
    while (lowEntry < highEntry) {
        const std::size_t midEntry = lowEntry + ((highEntry - lowEntry) / 2);
        if (encodedKey < EncodeToNewVector(m_items[midEntry * 2])) {
            highEntry = midEntry;
        }
        else {
            lowEntry = midEntry + 1;
        }
    }
    const std::size_t insertIndex = lowEntry * 2;
    m_items.insert(m_items.begin() + insertIndex, std::move(key));
    m_items.insert(m_items.begin() + insertIndex + 1, std::move(value));
}

bool CborItem::IsUint() const { return m_majorType == CBOR_MAJOR_TYPE::UNSIGNED_INTEGER; }
bool CborItem::IsNegative() const { return m_majorType == CBOR_MAJOR_TYPE::NEGATIVE_INTEGER; }
bool CborItem::IsByteString() const { return m_majorType == CBOR_MAJOR_TYPE::BYTE_STRING; }
bool CborItem::IsTextString() const { return m_majorType == CBOR_MAJOR_TYPE::TEXT_STRING; }
bool CborItem::IsArray() const { return m_majorType == CBOR_MAJOR_TYPE::ARRAY; }
bool CborItem::IsMap() const { return m_majorType == CBOR_MAJOR_TYPE::MAP; }
bool CborItem::IsTag() const { return m_majorType == CBOR_MAJOR_TYPE::TAG; }
bool CborItem::IsBool() const {
    return (m_majorType == CBOR_MAJOR_TYPE::SIMPLE_VALUE)
        && ((m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::FALSE_VALUE)) || (m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::TRUE_VALUE)));
}
bool CborItem::IsNull() const {
    return (m_majorType == CBOR_MAJOR_TYPE::SIMPLE_VALUE) && (m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::NULL_VALUE));
}
bool CborItem::IsArrayOfSize(std::size_t expectedSize) const {
    return IsArray() && (m_items.size() == expectedSize);
}
bool CborItem::GetInt64(int64_t & value) const {
    if (m_value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    if (m_majorType == CBOR_MAJOR_TYPE::UNSIGNED_INTEGER) {
        value = static_cast<int64_t>(m_value);
        return true;
    }
    else if (m_majorType == CBOR_MAJOR_TYPE::NEGATIVE_INTEGER) {
        value = -1 - static_cast<int64_t>(m_value);
        return true;
    }
    return false;
}
std::string CborItem::GetTextString() const {
    return std::string(m_bytes.begin(), m_bytes.end());
}
std::size_t CborItem::GetMapSize() const {
    return m_items.size() / 2;
}

unsigned int Cbor::GetHeadSize(uint64_t argument) {
    if (argument < CBOR_ARGUMENT_UINT8_AI) {
        return 1;
    }
    else if (argument <= UINT8_MAX) {
        return 2;
    }
    else if (argument <= UINT16_MAX) {
        return 3;
    }
    else if (argument <= UINT32_MAX) {
        return 5;
    }
    return 9;
}

void Cbor::EncodeHead(CBOR_MAJOR_TYPE majorType, uint64_t argument, std::vector<uint8_t> & serialization) {
    const uint8_t majorTypeShifted = static_cast<uint8_t>(static_cast<uint8_t>(majorType) << 5);
    if (argument < CBOR_ARGUMENT_UINT8_AI) {
        serialization.push_back(majorTypeShifted | static_cast<uint8_t>(argument));
    }
    else if (argument <= UINT8_MAX) {
        serialization.push_back(majorTypeShifted | CBOR_ARGUMENT_UINT8_AI);
        serialization.push_back(static_cast<uint8_t>(argument));
    }
    else if (argument <= UINT16_MAX) {
        serialization.push_back(majorTypeShifted | CBOR_ARGUMENT_UINT16_AI);
        const uint16_t be16 = boost::endian::native_to_big(static_cast<uint16_t>(argument));
        const uint8_t * const be16As8Ptr = reinterpret_cast<const uint8_t*>(&be16);
        serialization.insert(serialization.end(), be16As8Ptr, be16As8Ptr + sizeof(be16));
    }
    else if (argument <= UINT32_MAX) {
        serialization.push_back(majorTypeShifted | CBOR_ARGUMENT_UINT32_AI);
        const uint32_t be32 = boost::endian::native_to_big(static_cast<uint32_t>(argument));
        const uint8_t * const be32As8Ptr = reinterpret_cast<const uint8_t*>(&be32);
        serialization.insert(serialization.end(), be32As8Ptr, be32As8Ptr + sizeof(be32));
    }
    else {
        serialization.push_back(majorTypeShifted | CBOR_ARGUMENT_UINT64_AI);
        const uint64_t be64 = boost::endian::native_to_big(argument);
        const uint8_t * const be64As8Ptr = reinterpret_cast<const uint8_t*>(&be64);
        serialization.insert(serialization.end(), be64As8Ptr, be64As8Ptr + sizeof(be64));
    }
}

void Cbor::Encode(const CborItem & item, std::vector<uint8_t> & serialization) {
    switch (item.m_majorType) {
        case CBOR_MAJOR_TYPE::UNSIGNED_INTEGER:
        case CBOR_MAJOR_TYPE::NEGATIVE_INTEGER:
        case CBOR_MAJOR_TYPE::SIMPLE_VALUE:
            EncodeHead(item.m_majorType, item.m_value, serialization);
            break;
        case CBOR_MAJOR_TYPE::BYTE_STRING:
        case CBOR_MAJOR_TYPE::TEXT_STRING:
            EncodeHead(item.m_majorType, item.m_bytes.size(), serialization);
            serialization.insert(serialization.end(), item.m_bytes.begin(), item.m_bytes.end());
            break;
        case CBOR_MAJOR_TYPE::ARRAY:
            if (item.m_isIndefiniteLength) {
                serialization.push_back((static_cast<uint8_t>(CBOR_MAJOR_TYPE::ARRAY) << 5) | INDEFINITE_LENGTH_ADDITIONAL_INFO);
            }
            else {
                EncodeHead(CBOR_MAJOR_TYPE::ARRAY, item.m_items.size(), serialization);
            }
            for (std::size_t i = 0; i < item.m_items.size(); ++i) {
                Encode(item.m_items[i], serialization);
            }
            if (item.m_isIndefiniteLength) {
                serialization.push_back(BREAK_STOP_CODE);
            }
            break;
        case CBOR_MAJOR_TYPE::MAP: {
            //deterministic encoding: entries sorted by the bytewise order of their encoded keys
            typedef std::pair<std::vector<uint8_t>, std::size_t> encoded_key_index_pair_t;
            const std::size_t numEntries = item.GetMapSize();
            std::vector<encoded_key_index_pair_t> encodedKeys;
            encodedKeys.reserve(numEntries);
            for (std::size_t i = 0; i < numEntries; ++i) {
                encodedKeys.emplace_back(EncodeToNewVector(item.m_items[i * 2]), i * 2);
            }
            std::stable_sort(encodedKeys.begin(), encodedKeys.end(),
                [](const encoded_key_index_pair_t & a, const encoded_key_index_pair_t & b) {
                    return a.first < b.first;
                });
            EncodeHead(CBOR_MAJOR_TYPE::MAP, numEntries, serialization);
            for (std::size_t i = 0; i < encodedKeys.size(); ++i) {
                serialization.insert(serialization.end(), encodedKeys[i].first.begin(), encodedKeys[i].first.end());
                Encode(item.m_items[encodedKeys[i].second + 1], serialization);
            }
            break;
        }
        case CBOR_MAJOR_TYPE::TAG:
            EncodeHead(CBOR_MAJOR_TYPE::TAG, item.m_value, serialization);
            if (item.m_items.empty()) {
                Encode(CborItem::Null(), serialization);
            }
            else {
                Encode(item.m_items[0], serialization);
            }
            break;
    }
}

std::vector<uint8_t> Cbor::Encode(const CborItem & item) {
    return EncodeToNewVector(item);
}

bool Cbor::DecodeHead(const uint8_t * serialization, uint64_t bufferSize,
    CBOR_MAJOR_TYPE & majorType, uint8_t & additionalInfo, uint64_t & argument,
    uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode)
{
    if (bufferSize == 0) {
        errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
        return false;
    }
    const uint8_t initialByte = serialization[0];
    majorType = static_cast<CBOR_MAJOR_TYPE>(initialByte >> 5);
    additionalInfo = initialByte & 0x1f;
    if (additionalInfo < CBOR_ARGUMENT_UINT8_AI) {
        argument = additionalInfo;
        numBytesTakenToDecode = 1;
        return true;
    }
    else if (additionalInfo == INDEFINITE_LENGTH_ADDITIONAL_INFO) {
        argument = 0;
        numBytesTakenToDecode = 1;
        return true;
    }
    else if (additionalInfo > CBOR_ARGUMENT_UINT64_AI) { //28..30 reserved
        errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
        return false;
    }
    if ((majorType == CBOR_MAJOR_TYPE::SIMPLE_VALUE) && (additionalInfo != CBOR_ARGUMENT_UINT8_AI)) {
        LOG_DEBUG(subprocess) << "floating point items are not supported";
        errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
        return false;
    }
    const unsigned int argumentSize = 1u << (additionalInfo - CBOR_ARGUMENT_UINT8_AI); //1, 2, 4, or 8
    if (bufferSize < (1u + argumentSize)) {
        errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
        return false;
    }
    const uint8_t * const argPtr = serialization + 1;
    if (argumentSize == 1) {
        argument = argPtr[0];
    }
    else if (argumentSize == 2) {
        uint16_t be16;
        std::copy(argPtr, argPtr + sizeof(be16), reinterpret_cast<uint8_t*>(&be16));
        argument = boost::endian::big_to_native(be16);
    }
    else if (argumentSize == 4) {
        uint32_t be32;
        std::copy(argPtr, argPtr + sizeof(be32), reinterpret_cast<uint8_t*>(&be32));
        argument = boost::endian::big_to_native(be32);
    }
    else {
        uint64_t be64;
        std::copy(argPtr, argPtr + sizeof(be64), reinterpret_cast<uint8_t*>(&be64));
        argument = boost::endian::big_to_native(be64);
    }
    if ((majorType == CBOR_MAJOR_TYPE::SIMPLE_VALUE) && (argument < 32)) {
        //two byte simple values below 32 are not well-formed
        errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
        return false;
    }
    numBytesTakenToDecode = 1 + argumentSize;
    return true;
}

bool Cbor::DecodeIndefiniteString(const uint8_t * serialization, uint64_t bufferSize, CBOR_MAJOR_TYPE majorType,
    CborItem & item, uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode)
{
    item = CborItem();
    item.m_majorType = majorType;
    uint64_t offset = 1; //initial byte already examined by caller
    while (true) {
        if (offset >= bufferSize) {
            errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
            return false;
        }
        if (serialization[offset] == BREAK_STOP_CODE) {
            ++offset;
            break;
        }
        CBOR_MAJOR_TYPE chunkMajorType;
        uint8_t chunkAi;
        uint64_t chunkLength;
        uint64_t chunkHeadSize;
        if (!DecodeHead(serialization + offset, bufferSize - offset, chunkMajorType, chunkAi, chunkLength, chunkHeadSize, errorCode)) {
            return false;
        }
        if ((chunkMajorType != majorType) || (chunkAi == INDEFINITE_LENGTH_ADDITIONAL_INFO)) {
            //chunks must be definite length strings of the same major type
            errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
            return false;
        }
        offset += chunkHeadSize;
        if (chunkLength > (bufferSize - offset)) {
            errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
            return false;
        }
        item.m_bytes.insert(item.m_bytes.end(), serialization + offset, serialization + offset + chunkLength);
        offset += chunkLength;
    }
    numBytesTakenToDecode = offset;
    return true;
}

bool Cbor::DecodeRecursive(const uint8_t * serialization, uint64_t bufferSize, CborItem & item,
    uint64_t & numBytesTakenToDecode, unsigned int depth, BP7_ERROR_CODE & errorCode)
{
    if (depth > MAX_NESTING_DEPTH) {
        LOG_DEBUG(subprocess) << "cbor nesting depth exceeds " << MAX_NESTING_DEPTH;
        errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
        return false;
    }
    CBOR_MAJOR_TYPE majorType;
    uint8_t additionalInfo;
    uint64_t argument;
    uint64_t headSize;
    if (!DecodeHead(serialization, bufferSize, majorType, additionalInfo, argument, headSize, errorCode)) {
        return false;
    }
    const bool isIndefinite = (additionalInfo == INDEFINITE_LENGTH_ADDITIONAL_INFO);
    uint64_t offset = headSize;
    const uint64_t remaining = bufferSize - headSize;

    switch (majorType) {
        case CBOR_MAJOR_TYPE::UNSIGNED_INTEGER:
        case CBOR_MAJOR_TYPE::NEGATIVE_INTEGER:
            if (isIndefinite) {
                errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
                return false;
            }
            item = CborItem();
            item.m_majorType = majorType;
            item.m_value = argument;
            break;
        case CBOR_MAJOR_TYPE::BYTE_STRING:
        case CBOR_MAJOR_TYPE::TEXT_STRING:
            if (isIndefinite) {
                return DecodeIndefiniteString(serialization, bufferSize, majorType, item, numBytesTakenToDecode, errorCode);
            }
            if (argument > remaining) {
                errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
                return false;
            }
            item = CborItem();
            item.m_majorType = majorType;
            item.m_bytes.assign(serialization + offset, serialization + offset + argument);
            offset += argument;
            break;
        case CBOR_MAJOR_TYPE::ARRAY:
            item = CborItem::Array();
            item.m_isIndefiniteLength = isIndefinite;
            if (isIndefinite) {
                while (true) {
                    if (offset >= bufferSize) {
                        errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
                        return false;
                    }
                    if (serialization[offset] == BREAK_STOP_CODE) {
                        ++offset;
                        break;
                    }
                    CborItem element;
                    uint64_t elementSize;
                    if (!DecodeRecursive(serialization + offset, bufferSize - offset, element, elementSize, depth + 1, errorCode)) {
                        return false;
                    }
                    item.m_items.push_back(std::move(element));
                    offset += elementSize;
                }
            }
            else {
                if (argument > remaining) { //every element takes at least one byte
                    errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
                    return false;
                }
                item.m_items.reserve(static_cast<std::size_t>(argument));
                for (uint64_t i = 0; i < argument; ++i) {
                    CborItem element;
                    uint64_t elementSize;
                    if (!DecodeRecursive(serialization + offset, bufferSize - offset, element, elementSize, depth + 1, errorCode)) {
                        return false;
                    }
                    item.m_items.push_back(std::move(element));
                    offset += elementSize;
                }
            }
            break;
        case CBOR_MAJOR_TYPE::MAP: {
            item = CborItem::Map();
            if ((!isIndefinite) && ((argument > remaining) || ((argument * 2) > remaining))) {
                errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
                return false;
            }
            //entries are sorted once after the whole map is read
            struct decoded_map_entry_t {
                std::vector<uint8_t> encodedKey;
                CborItem key;
                CborItem value;
            };
            std::vector<decoded_map_entry_t> entries;
            if (!isIndefinite) {
                entries.reserve(static_cast<std::size_t>(argument));
            }
            uint64_t entriesDecoded = 0;
            while (true) {
                if (isIndefinite) {
                    if (offset >= bufferSize) {
                        errorCode = BP7_ERROR_CODE::TRUNCATED_INPUT;
                        return false;
                    }
                    if (serialization[offset] == BREAK_STOP_CODE) {
                        ++offset;
                        break;
                    }
                }
                else if (entriesDecoded == argument) {
                    break;
                }
                entries.emplace_back();
                decoded_map_entry_t & entry = entries.back();
                uint64_t keySize;
                uint64_t valueSize;
                if (!DecodeRecursive(serialization + offset, bufferSize - offset, entry.key, keySize, depth + 1, errorCode)) {
                    return false;
                }
                offset += keySize;
                if (!DecodeRecursive(serialization + offset, bufferSize - offset, entry.value, valueSize, depth + 1, errorCode)) {
                    return false;
                }
                offset += valueSize;
                entry.encodedKey = EncodeToNewVector(entry.key);
                ++entriesDecoded;
            }
            //stable so that repeated keys keep their wire order
            std::stable_sort(entries.begin(), entries.end(), [](const decoded_map_entry_t & a, const decoded_map_entry_t & b) {
                return a.encodedKey < b.encodedKey;
            });
            item.m_items.reserve(entries.size() * 2);
            for (std::size_t i = 0; i < entries.size(); ++i) {
                item.m_items.push_back(std::move(entries[i].key));
                item.m_items.push_back(std::move(entries[i].value));
            }
            break;
        }
        case CBOR_MAJOR_TYPE::TAG: {
            if (isIndefinite) {
                errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
                return false;
            }
            CborItem taggedItem;
            uint64_t taggedItemSize;
            if (!DecodeRecursive(serialization + offset, bufferSize - offset, taggedItem, taggedItemSize, depth + 1, errorCode)) {
                return false;
            }
            offset += taggedItemSize;
            item = CborItem::Tag(argument, std::move(taggedItem));
            break;
        }
        case CBOR_MAJOR_TYPE::SIMPLE_VALUE:
            if (isIndefinite) { //break stop code outside of an indefinite length item
                errorCode = BP7_ERROR_CODE::MALFORMED_ENCODING;
                return false;
            }
            item = CborItem::Simple(static_cast<uint8_t>(argument));
            break;
    }
    numBytesTakenToDecode = offset;
    return true;
}

bool Cbor::Decode(const uint8_t * serialization, uint64_t bufferSize,
    CborItem & item, uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode)
{
    errorCode = BP7_ERROR_CODE::NONE;
    return DecodeRecursive(serialization, bufferSize, item, numBytesTakenToDecode, 0, errorCode);
}

bool Cbor::Decode(const std::vector<uint8_t> & serialization,
    CborItem & item, uint64_t & numBytesTakenToDecode, BP7_ERROR_CODE & errorCode)
{
    return Decode(serialization.data(), serialization.size(), item, numBytesTakenToDecode, errorCode);
}

bool Cbor::DecodeAll(const uint8_t * serialization, uint64_t bufferSize,
    std::vector<CborItem> & items, BP7_ERROR_CODE & errorCode)
{
    items.clear();
    uint64_t offset = 0;
    while (offset < bufferSize) {
        CborItem item;
        uint64_t itemSize;
        if (!Decode(serialization + offset, bufferSize - offset, item, itemSize, errorCode)) {
            return false;
        }
        items.push_back(std::move(item));
        offset += itemSize;
    }
    return true;
}
