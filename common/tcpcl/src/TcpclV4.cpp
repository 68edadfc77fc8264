/**
 * @file TcpclV4.cpp
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

#include "TcpclV4.h"
#include "Logger.h"
#include "codec/Cbor.h"
#include <algorithm>
#include <limits>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::tcpcl;

//default receive limit until the session configures one from its segment MRU
static constexpr uint64_t DEFAULT_MAX_RX_MESSAGE_BODY_SIZE_BYTES = 10000000;

constexpr uint8_t TcpclV4::PROTOCOL_VERSION;
constexpr std::size_t TcpclV4::CONTACT_HEADER_SIZE;
constexpr std::size_t TcpclV4::MESSAGE_HEADER_SIZE;
constexpr uint8_t TcpclV4::SESSION_TERMINATION_FLAG_REPLY;
constexpr uint64_t TcpclV4::MAX_DATA_SEGMENT_OVERHEAD_BYTES;

static bool GetUintFromArray(const CborItem & arr, std::size_t index, uint64_t maxValue, uint64_t & value) {
    const CborItem & item = arr.m_items[index];
    if ((!item.IsUint()) || (item.m_value > maxValue)) {
        return false;
    }
    value = item.m_value;
    return true;
}

TcpclV4::TcpclV4() :
    M_MAX_RX_MESSAGE_BODY_SIZE_BYTES(DEFAULT_MAX_RX_MESSAGE_BODY_SIZE_BYTES)
{
    InitRx();
}

TcpclV4::~TcpclV4() {

}

void TcpclV4::SetDataSegmentContentsReadCallback(const DataSegmentContentsReadCallback_t & callback) {
    m_dataSegmentContentsReadCallback = callback;
}
void TcpclV4::SetContactHeaderReadCallback(const ContactHeaderReadCallback_t & callback) {
    m_contactHeaderReadCallback = callback;
}
void TcpclV4::SetSessionInitReadCallback(const SessionInitCallback_t & callback) {
    m_sessionInitCallback = callback;
}
void TcpclV4::SetAckSegmentReadCallback(const AckSegmentReadCallback_t & callback) {
    m_ackSegmentReadCallback = callback;
}
void TcpclV4::SetBundleRefusalCallback(const BundleRefusalCallback_t & callback) {
    m_bundleRefusalCallback = callback;
}
void TcpclV4::SetMessageRejectCallback(const MessageRejectCallback_t & callback) {
    m_messageRejectCallback = callback;
}
void TcpclV4::SetKeepAliveCallback(const KeepAliveCallback_t & callback) {
    m_keepAliveCallback = callback;
}
void TcpclV4::SetSessionTerminationMessageCallback(const SessionTerminationMessageCallback_t & callback) {
    m_sessionTerminationMessageCallback = callback;
}
void TcpclV4::SetInvalidMessageCallback(const InvalidMessageCallback_t & callback) {
    m_invalidMessageCallback = callback;
}
void TcpclV4::SetMaxReceiveMessageBodySizeBytes(const uint64_t maxRxMessageBodySizeBytes) {
    M_MAX_RX_MESSAGE_BODY_SIZE_BYTES = maxRxMessageBodySizeBytes;
}

void TcpclV4::InitRx() {
    m_mainRxState = TCPCLV4_MAIN_RX_STATE::READ_CONTACT_HEADER;
    m_contactHeaderRxState = TCPCLV4_CONTACT_HEADER_RX_STATE::READ_SYNC_1;
    m_contactHeaderVersion = 0;
    m_contactHeaderFlags = 0;
    m_contactHeaderKeepAliveInterval = 0;
    m_messageTypeByte = 0;
    m_messageBodyLength = 0;
    m_messageBodyBytesRemaining = 0;
    m_readValueByteIndex = 0;
    m_messageBodyVec.clear();
}

bool TcpclV4::IsContactHeaderComplete() const {
    return (m_mainRxState != TCPCLV4_MAIN_RX_STATE::READ_CONTACT_HEADER) && (m_mainRxState != TCPCLV4_MAIN_RX_STATE::DISCARD_ALL);
}

void TcpclV4::HandleReceivedChar(const uint8_t rxVal) {
    HandleReceivedChars(&rxVal, 1);
}

void TcpclV4::HandleReceivedChars(const uint8_t * rxVals, std::size_t numChars) {
    while (numChars) {
        const TCPCLV4_MAIN_RX_STATE mainRxState = m_mainRxState; //const for optimization
        if (mainRxState == TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_BODY) {
            //bulk copy
            const std::size_t numToCopy = static_cast<std::size_t>(std::min<uint64_t>(numChars, m_messageBodyBytesRemaining));
            m_messageBodyVec.insert(m_messageBodyVec.end(), rxVals, rxVals + numToCopy);
            rxVals += numToCopy;
            numChars -= numToCopy;
            m_messageBodyBytesRemaining -= numToCopy;
            if (m_messageBodyBytesRemaining == 0) {
                m_mainRxState = TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_TYPE_BYTE;
                DispatchMessageBody();
            }
            continue;
        }
        else if (mainRxState == TCPCLV4_MAIN_RX_STATE::SKIP_MESSAGE_BODY) {
            const std::size_t numToSkip = static_cast<std::size_t>(std::min<uint64_t>(numChars, m_messageBodyBytesRemaining));
            rxVals += numToSkip;
            numChars -= numToSkip;
            m_messageBodyBytesRemaining -= numToSkip;
            if (m_messageBodyBytesRemaining == 0) {
                m_mainRxState = TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_TYPE_BYTE;
            }
            continue;
        }
        else if (mainRxState == TCPCLV4_MAIN_RX_STATE::DISCARD_ALL) {
            return;
        }

        --numChars;
        const uint8_t rxVal = *rxVals++;
        if (mainRxState == TCPCLV4_MAIN_RX_STATE::READ_CONTACT_HEADER) {
            const TCPCLV4_CONTACT_HEADER_RX_STATE contactHeaderRxState = m_contactHeaderRxState; //const for optimization
            //magic: the four bytes 0x64 0x74 0x6e 0x21, i.e. "dtn!" in US-ASCII.
            //The contact header is the first thing on the stream so any mismatch is fatal.
            static const uint8_t MAGIC[4] = { 0x64, 0x74, 0x6e, 0x21 };
            if (contactHeaderRxState <= TCPCLV4_CONTACT_HEADER_RX_STATE::READ_SYNC_4) {
                const unsigned int magicIndex = static_cast<unsigned int>(contactHeaderRxState);
                if (rxVal != MAGIC[magicIndex]) {
                    LOG_ERROR(subprocess) << "TcpclV4 contact header has invalid magic byte " << static_cast<unsigned int>(rxVal)
                        << " at index " << magicIndex;
                    m_mainRxState = TCPCLV4_MAIN_RX_STATE::DISCARD_ALL;
                    if (m_contactHeaderReadCallback) {
                        m_contactHeaderReadCallback(false, 0, 0, 0);
                    }
                    return;
                }
                m_contactHeaderRxState = static_cast<TCPCLV4_CONTACT_HEADER_RX_STATE>(magicIndex + 1);
            }
            else if (contactHeaderRxState == TCPCLV4_CONTACT_HEADER_RX_STATE::READ_VERSION) {
                m_contactHeaderVersion = rxVal; //validated by the session so it can report the mismatch
                m_contactHeaderRxState = TCPCLV4_CONTACT_HEADER_RX_STATE::READ_FLAGS;
            }
            else if (contactHeaderRxState == TCPCLV4_CONTACT_HEADER_RX_STATE::READ_FLAGS) {
                m_contactHeaderFlags = rxVal;
                m_contactHeaderRxState = TCPCLV4_CONTACT_HEADER_RX_STATE::READ_KEEPALIVE_INTERVAL_BYTE1;
            }
            else if (contactHeaderRxState == TCPCLV4_CONTACT_HEADER_RX_STATE::READ_KEEPALIVE_INTERVAL_BYTE1) {
                m_contactHeaderKeepAliveInterval = static_cast<uint16_t>(rxVal) << 8;
                m_contactHeaderRxState = TCPCLV4_CONTACT_HEADER_RX_STATE::READ_KEEPALIVE_INTERVAL_BYTE2;
            }
            else { //READ_KEEPALIVE_INTERVAL_BYTE2
                m_contactHeaderKeepAliveInterval |= rxVal;
                m_contactHeaderRxState = TCPCLV4_CONTACT_HEADER_RX_STATE::READ_SYNC_1;
                m_mainRxState = TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_TYPE_BYTE;
                if (m_contactHeaderReadCallback) {
                    m_contactHeaderReadCallback(true, m_contactHeaderVersion, m_contactHeaderFlags, m_contactHeaderKeepAliveInterval);
                }
            }
        }
        else if (mainRxState == TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_TYPE_BYTE) {
            m_messageTypeByte = rxVal;
            m_messageBodyLength = 0;
            m_readValueByteIndex = 0;
            m_mainRxState = TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_LENGTH_U32;
        }
        else if (mainRxState == TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_LENGTH_U32) {
            m_messageBodyLength = (m_messageBodyLength << 8) | rxVal; //big endian
            ++m_readValueByteIndex;
            if (m_readValueByteIndex == 4) {
                m_messageBodyBytesRemaining = m_messageBodyLength;
                m_messageBodyVec.clear();
                if (m_messageBodyLength > M_MAX_RX_MESSAGE_BODY_SIZE_BYTES) {
                    LOG_ERROR(subprocess) << "TcpclV4 message type " << static_cast<unsigned int>(m_messageTypeByte)
                        << " body length " << m_messageBodyLength << " exceeds the receive limit of " << M_MAX_RX_MESSAGE_BODY_SIZE_BYTES;
                    m_mainRxState = TCPCLV4_MAIN_RX_STATE::SKIP_MESSAGE_BODY;
                    if (m_invalidMessageCallback) {
                        m_invalidMessageCallback(m_messageTypeByte, TCPCLV4_MESSAGE_REJECT_REASON_CODES::MESSAGE_UNSUPPORTED);
                    }
                }
                else if (m_messageBodyLength == 0) {
                    m_mainRxState = TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_TYPE_BYTE;
                    DispatchMessageBody(); //every known message body is at least one byte
                }
                else {
                    m_messageBodyVec.reserve(m_messageBodyLength);
                    m_mainRxState = TCPCLV4_MAIN_RX_STATE::READ_MESSAGE_BODY;
                }
            }
        }
    }
}

void TcpclV4::DispatchMessageBody() {
    const uint8_t messageTypeByte = m_messageTypeByte;
    if ((messageTypeByte == static_cast<uint8_t>(TCPCLV4_MESSAGE_TYPE_BYTE_CODES::RESERVED))
        || (messageTypeByte > static_cast<uint8_t>(TCPCLV4_MESSAGE_TYPE_BYTE_CODES::SESS_INIT)))
    {
        LOG_WARNING(subprocess) << "TcpclV4 received unknown message type " << static_cast<unsigned int>(messageTypeByte);
        if (m_invalidMessageCallback) {
            m_invalidMessageCallback(messageTypeByte, TCPCLV4_MESSAGE_REJECT_REASON_CODES::MESSAGE_TYPE_UNKNOWN);
        }
        return;
    }
    const TCPCLV4_MESSAGE_TYPE_BYTE_CODES messageType = static_cast<TCPCLV4_MESSAGE_TYPE_BYTE_CODES>(messageTypeByte);

    CborItem body;
    uint64_t numBytesTakenToDecode = 0;
    BP7_ERROR_CODE errorCode = BP7_ERROR_CODE::NONE;
    bool valid = Cbor::Decode(m_messageBodyVec, body, numBytesTakenToDecode, errorCode)
        && (numBytesTakenToDecode == m_messageBodyVec.size())
        && body.IsArray();
    if (valid) {
        if (messageType == TCPCLV4_MESSAGE_TYPE_BYTE_CODES::XFER_SEGMENT) {
            uint64_t flags;
            uint64_t transferId;
            valid = body.IsArrayOfSize(3) && GetUintFromArray(body, 0, 0xff, flags) && GetUintFromArray(body, 1, UINT64_MAX, transferId)
                && body.m_items[2].IsByteString();
            if (valid) {
                std::vector<uint8_t> dataSegmentDataVec(std::move(body.m_items[2].m_bytes));
                const TCPCLV4_SEGMENT_FLAGS segmentFlags = static_cast<TCPCLV4_SEGMENT_FLAGS>(flags);
                if (m_dataSegmentContentsReadCallback) {
                    m_dataSegmentContentsReadCallback(dataSegmentDataVec,
                        HasFlag(segmentFlags, TCPCLV4_SEGMENT_FLAGS::START), HasFlag(segmentFlags, TCPCLV4_SEGMENT_FLAGS::END), transferId);
                }
            }
        }
        else if (messageType == TCPCLV4_MESSAGE_TYPE_BYTE_CODES::XFER_ACK) {
            uint64_t flags;
            uint64_t transferId;
            uint64_t ackLength;
            valid = body.IsArrayOfSize(3) && GetUintFromArray(body, 0, 0xff, flags) && GetUintFromArray(body, 1, UINT64_MAX, transferId)
                && GetUintFromArray(body, 2, UINT64_MAX, ackLength);
            if (valid && m_ackSegmentReadCallback) {
                const TCPCLV4_SEGMENT_FLAGS segmentFlags = static_cast<TCPCLV4_SEGMENT_FLAGS>(flags);
                m_ackSegmentReadCallback(HasFlag(segmentFlags, TCPCLV4_SEGMENT_FLAGS::START), HasFlag(segmentFlags, TCPCLV4_SEGMENT_FLAGS::END),
                    transferId, ackLength);
            }
        }
        else if (messageType == TCPCLV4_MESSAGE_TYPE_BYTE_CODES::XFER_REFUSE) {
            uint64_t reason;
            uint64_t transferId;
            valid = body.IsArrayOfSize(2) && GetUintFromArray(body, 0, 0xff, reason) && GetUintFromArray(body, 1, UINT64_MAX, transferId);
            if (valid && m_bundleRefusalCallback) {
                m_bundleRefusalCallback(static_cast<TCPCLV4_TRANSFER_REFUSE_REASON_CODES>(reason), transferId);
            }
        }
        else if (messageType == TCPCLV4_MESSAGE_TYPE_BYTE_CODES::KEEPALIVE) {
            valid = body.IsArrayOfSize(0);
            if (valid && m_keepAliveCallback) {
                m_keepAliveCallback();
            }
        }
        else if (messageType == TCPCLV4_MESSAGE_TYPE_BYTE_CODES::SESS_TERM) {
            uint64_t flags;
            uint64_t reason;
            valid = body.IsArrayOfSize(2) && GetUintFromArray(body, 0, 0xff, flags) && GetUintFromArray(body, 1, 0xff, reason);
            if (valid && m_sessionTerminationMessageCallback) {
                m_sessionTerminationMessageCallback(static_cast<TCPCLV4_SESSION_TERMINATION_REASON_CODES>(reason),
                    ((flags & SESSION_TERMINATION_FLAG_REPLY) != 0));
            }
        }
        else if (messageType == TCPCLV4_MESSAGE_TYPE_BYTE_CODES::MSG_REJECT) {
            uint64_t reason;
            uint64_t rejectedType;
            valid = body.IsArrayOfSize(2) && GetUintFromArray(body, 0, 0xff, reason) && GetUintFromArray(body, 1, 0xff, rejectedType);
            if (valid && m_messageRejectCallback) {
                m_messageRejectCallback(static_cast<TCPCLV4_MESSAGE_REJECT_REASON_CODES>(reason), static_cast<uint8_t>(rejectedType));
            }
        }
        else { //SESS_INIT
            uint64_t keepAlive;
            uint64_t segmentMru;
            uint64_t transferMru;
            valid = body.IsArrayOfSize(4) && GetUintFromArray(body, 0, 0xffff, keepAlive) && GetUintFromArray(body, 1, UINT64_MAX, segmentMru)
                && GetUintFromArray(body, 2, UINT64_MAX, transferMru) && body.m_items[3].IsTextString();
            if (valid && m_sessionInitCallback) {
                m_sessionInitCallback(static_cast<uint16_t>(keepAlive), segmentMru, transferMru, body.m_items[3].GetTextString());
            }
        }
    }
    if (!valid) {
        LOG_ERROR(subprocess) << "TcpclV4 received malformed " << messageType << " message body of " << m_messageBodyVec.size() << " bytes";
        if (m_invalidMessageCallback) {
            m_invalidMessageCallback(messageTypeByte, TCPCLV4_MESSAGE_REJECT_REASON_CODES::MESSAGE_UNSUPPORTED);
        }
    }
    m_messageBodyVec.clear();
}

void TcpclV4::AppendMessageHeader(std::vector<uint8_t> & msg, TCPCLV4_MESSAGE_TYPE_BYTE_CODES messageType, uint32_t bodyLength) {
    msg.push_back(static_cast<uint8_t>(messageType));
    msg.push_back(static_cast<uint8_t>(bodyLength >> 24));
    msg.push_back(static_cast<uint8_t>(bodyLength >> 16));
    msg.push_back(static_cast<uint8_t>(bodyLength >> 8));
    msg.push_back(static_cast<uint8_t>(bodyLength));
}

void TcpclV4::FinishMessage(std::vector<uint8_t> & msg, TCPCLV4_MESSAGE_TYPE_BYTE_CODES messageType, const std::vector<uint8_t> & body) {
    msg.clear();
    msg.reserve(MESSAGE_HEADER_SIZE + body.size());
    AppendMessageHeader(msg, messageType, static_cast<uint32_t>(body.size()));
    msg.insert(msg.end(), body.begin(), body.end());
}

void TcpclV4::GenerateContactHeader(std::vector<uint8_t> & hdr, uint16_t keepAliveIntervalSeconds, uint8_t version, uint8_t flags) {
    hdr.resize(CONTACT_HEADER_SIZE);
    hdr[0] = 'd';
    hdr[1] = 't';
    hdr[2] = 'n';
    hdr[3] = '!';
    hdr[4] = version;
    hdr[5] = flags;
    hdr[6] = static_cast<uint8_t>(keepAliveIntervalSeconds >> 8);
    hdr[7] = static_cast<uint8_t>(keepAliveIntervalSeconds);
}

void TcpclV4::GenerateSessionInitMessage(std::vector<uint8_t> & msg, uint16_t keepAliveIntervalSeconds, uint64_t segmentMru, uint64_t transferMru,
    const std::string & myNodeEidUri)
{
    CborItem body = CborItem::Array();
    body.Append(CborItem::Uint(keepAliveIntervalSeconds))
        .Append(CborItem::Uint(segmentMru))
        .Append(CborItem::Uint(transferMru))
        .Append(CborItem::TextString(myNodeEidUri));
    FinishMessage(msg, TCPCLV4_MESSAGE_TYPE_BYTE_CODES::SESS_INIT, Cbor::Encode(body));
}

void TcpclV4::GenerateDataSegmentHeaderOnly(std::vector<uint8_t> & dataSegmentHeaderDataVec, bool isStartSegment, bool isEndSegment, uint64_t transferId,
    uint64_t sizeContents)
{
    TCPCLV4_SEGMENT_FLAGS flags = TCPCLV4_SEGMENT_FLAGS::NONE;
    if (isStartSegment) {
        flags |= TCPCLV4_SEGMENT_FLAGS::START;
    }
    if (isEndSegment) {
        flags |= TCPCLV4_SEGMENT_FLAGS::END;
    }
    //[flags, transferId, h'contents'] where the byte string contents follow this header on the wire
    const uint64_t bodyLength = 1 + Cbor::GetHeadSize(static_cast<uint8_t>(flags)) + Cbor::GetHeadSize(transferId)
        + Cbor::GetHeadSize(sizeContents) + sizeContents;
    dataSegmentHeaderDataVec.clear();
    dataSegmentHeaderDataVec.reserve(MAX_DATA_SEGMENT_OVERHEAD_BYTES);
    AppendMessageHeader(dataSegmentHeaderDataVec, TCPCLV4_MESSAGE_TYPE_BYTE_CODES::XFER_SEGMENT, static_cast<uint32_t>(bodyLength));
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::ARRAY, 3, dataSegmentHeaderDataVec);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, static_cast<uint8_t>(flags), dataSegmentHeaderDataVec);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::UNSIGNED_INTEGER, transferId, dataSegmentHeaderDataVec);
    Cbor::EncodeHead(CBOR_MAJOR_TYPE::BYTE_STRING, sizeContents, dataSegmentHeaderDataVec);
}

void TcpclV4::GenerateDataSegment(std::vector<uint8_t> & dataSegment, bool isStartSegment, bool isEndSegment, uint64_t transferId,
    const uint8_t * contents, uint64_t sizeContents)
{
    GenerateDataSegmentHeaderOnly(dataSegment, isStartSegment, isEndSegment, transferId, sizeContents);
    dataSegment.insert(dataSegment.end(), contents, contents + sizeContents);
}

uint64_t TcpclV4::GetNumDataSegments(uint64_t sizeContents, uint64_t maxSegmentDataBytes) {
    if ((sizeContents == 0) || (maxSegmentDataBytes == 0)) {
        return 1;
    }
    return (sizeContents / maxSegmentDataBytes) + ((sizeContents % maxSegmentDataBytes) != 0);
}

void TcpclV4::GenerateDataSegments(std::vector<std::vector<uint8_t> > & dataSegmentsVec, uint64_t transferId,
    const uint8_t * contents, uint64_t sizeContents, uint64_t maxSegmentDataBytes)
{
    if (maxSegmentDataBytes == 0) {
        maxSegmentDataBytes = sizeContents;
    }
    const uint64_t numSegments = GetNumDataSegments(sizeContents, maxSegmentDataBytes);
    dataSegmentsVec.resize(numSegments);
    uint64_t offset = 0;
    for (uint64_t i = 0; i < numSegments; ++i) {
        const uint64_t thisSegmentSize = std::min(maxSegmentDataBytes, sizeContents - offset);
        GenerateDataSegment(dataSegmentsVec[i], (i == 0), (i == (numSegments - 1)), transferId, contents + offset, thisSegmentSize);
        offset += thisSegmentSize;
    }
}

void TcpclV4::GenerateAckSegment(std::vector<uint8_t> & ackSegment, bool isStartSegment, bool isEndSegment, uint64_t transferId, uint64_t totalBytesAcknowledged) {
    TCPCLV4_SEGMENT_FLAGS flags = TCPCLV4_SEGMENT_FLAGS::NONE;
    if (isStartSegment) {
        flags |= TCPCLV4_SEGMENT_FLAGS::START;
    }
    if (isEndSegment) {
        flags |= TCPCLV4_SEGMENT_FLAGS::END;
    }
    CborItem body = CborItem::Array();
    body.Append(CborItem::Uint(static_cast<uint8_t>(flags)))
        .Append(CborItem::Uint(transferId))
        .Append(CborItem::Uint(totalBytesAcknowledged));
    FinishMessage(ackSegment, TCPCLV4_MESSAGE_TYPE_BYTE_CODES::XFER_ACK, Cbor::Encode(body));
}

void TcpclV4::GenerateBundleRefusal(std::vector<uint8_t> & refusalMessage, TCPCLV4_TRANSFER_REFUSE_REASON_CODES refusalCode, uint64_t transferId) {
    CborItem body = CborItem::Array();
    body.Append(CborItem::Uint(static_cast<uint8_t>(refusalCode)))
        .Append(CborItem::Uint(transferId));
    FinishMessage(refusalMessage, TCPCLV4_MESSAGE_TYPE_BYTE_CODES::XFER_REFUSE, Cbor::Encode(body));
}

void TcpclV4::GenerateMessageRejection(std::vector<uint8_t> & rejectionMessage, TCPCLV4_MESSAGE_REJECT_REASON_CODES rejectionCode, uint8_t rejectedMessageType) {
    CborItem body = CborItem::Array();
    body.Append(CborItem::Uint(static_cast<uint8_t>(rejectionCode)))
        .Append(CborItem::Uint(rejectedMessageType));
    FinishMessage(rejectionMessage, TCPCLV4_MESSAGE_TYPE_BYTE_CODES::MSG_REJECT, Cbor::Encode(body));
}

void TcpclV4::GenerateKeepAliveMessage(std::vector<uint8_t> & keepAliveMessage) {
    FinishMessage(keepAliveMessage, TCPCLV4_MESSAGE_TYPE_BYTE_CODES::KEEPALIVE, Cbor::Encode(CborItem::Array()));
}

void TcpclV4::GenerateSessionTerminationMessage(std::vector<uint8_t> & sessionTerminationMessage,
    TCPCLV4_SESSION_TERMINATION_REASON_CODES sessionTerminationReasonCode, bool isAckOfAnEarlierSessionTerminationMessage)
{
    CborItem body = CborItem::Array();
    body.Append(CborItem::Uint(isAckOfAnEarlierSessionTerminationMessage ? SESSION_TERMINATION_FLAG_REPLY : 0))
        .Append(CborItem::Uint(static_cast<uint8_t>(sessionTerminationReasonCode)));
    FinishMessage(sessionTerminationMessage, TCPCLV4_MESSAGE_TYPE_BYTE_CODES::SESS_TERM, Cbor::Encode(body));
}
