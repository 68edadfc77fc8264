/**
 * @file TcpclV4.h
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
 * The TcpclV4 class is the TCP convergence layer version 4 framing codec.
 * The receive side is a byte oriented state machine fed from the socket
 * with HandleReceivedChars, so messages may be split across any number of reads.
 * It first reads the 8 byte Contact Header:
 *   "dtn!" | version (4) | flags | keepalive seconds (2 bytes, big-endian)
 * and then a stream of session messages, each framed as:
 *   message type (1 byte) | body length (4 bytes, big-endian) | body
 * where the body is a CBOR array of the message fields.
 * Decoded messages are delivered through the Set...Callback functions.
 * The static Generate... functions build the transmit side of every message.
 */

#ifndef TCPCLV4_H
#define TCPCLV4_H 1

#include <string>
#include <vector>
#include <cstdint>
#include <boost/function.hpp>
#include "EnumAsFlagsMacro.h"
#include "tcpcl_lib_export.h"

enum class TCPCLV4_MAIN_RX_STATE
{
    READ_CONTACT_HEADER = 0,
    READ_MESSAGE_TYPE_BYTE,
    READ_MESSAGE_LENGTH_U32,
    READ_MESSAGE_BODY,
    SKIP_MESSAGE_BODY,
    DISCARD_ALL
};

enum class TCPCLV4_CONTACT_HEADER_RX_STATE
{
    READ_SYNC_1 = 0,
    READ_SYNC_2,
    READ_SYNC_3,
    READ_SYNC_4,
    READ_VERSION,
    READ_FLAGS,
    READ_KEEPALIVE_INTERVAL_BYTE1,
    READ_KEEPALIVE_INTERVAL_BYTE2
};

enum class TCPCLV4_MESSAGE_TYPE_BYTE_CODES : uint8_t
{
    RESERVED = 0x0,
    XFER_SEGMENT = 0x1,
    XFER_ACK = 0x2,
    XFER_REFUSE = 0x3,
    KEEPALIVE = 0x4,
    SESS_TERM = 0x5,
    MSG_REJECT = 0x6,
    SESS_INIT = 0x7
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(TCPCLV4_MESSAGE_TYPE_BYTE_CODES);

enum class TCPCLV4_SESSION_TERMINATION_REASON_CODES : uint8_t
{
    UNKNOWN = 0x0, //A termination reason is not available.
    IDLE_TIMEOUT = 0x1, //The session is being terminated due to idleness.
    VERSION_MISMATCH = 0x2, //The entity cannot conform to the specified TCPCL protocol version.
    BUSY = 0x3, //The entity is too busy to handle the current session.
    CONTACT_FAILURE = 0x4, //The entity cannot interpret or negotiate a Contact Header or SESS_INIT option.
    RESOURCE_EXHAUSTION = 0x5 //The entity has run into some resource limit and cannot continue the session.
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(TCPCLV4_SESSION_TERMINATION_REASON_CODES);

enum class TCPCLV4_MESSAGE_REJECT_REASON_CODES : uint8_t
{
    MESSAGE_TYPE_UNKNOWN = 0x1, //A message was received with a Message Type code unknown to the TCPCL entity.
    MESSAGE_UNSUPPORTED = 0x2, //A message was received but the TCPCL entity cannot comply with the message contents.
    MESSAGE_UNEXPECTED = 0x3 //A message was received while the session is in a state in which the message is not expected.
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(TCPCLV4_MESSAGE_REJECT_REASON_CODES);

enum class TCPCLV4_TRANSFER_REFUSE_REASON_CODES : uint8_t
{
    REFUSAL_REASON_UNKNOWN = 0x0, //Reason for refusal is unknown or not specified. //REASON_UNKNOWN taken in windows.h
    REFUSAL_REASON_ALREADY_COMPLETED = 0x1, //The receiver already has the complete bundle.
    REFUSAL_REASON_NO_RESOURCES = 0x2, //The receiver's resources are exhausted.
    REFUSAL_REASON_RETRANSMIT = 0x3, //The receiver requires the bundle to be retransmitted in its entirety.
    REFUSAL_REASON_NOT_ACCEPTABLE = 0x4, //Some issue with the bundle data was encountered.
    REFUSAL_REASON_EXTENSION_FAILURE = 0x5, //A failure processing the Transfer Extension Items has occurred.
    REFUSAL_REASON_SESSION_TERMINATING = 0x6 //The receiving entity is in the process of terminating the session.
};
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(TCPCLV4_TRANSFER_REFUSE_REASON_CODES);

enum class TCPCLV4_SEGMENT_FLAGS : uint8_t
{
    NONE = 0,
    END = 0x01,
    START = 0x02
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(TCPCLV4_SEGMENT_FLAGS);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(TCPCLV4_SEGMENT_FLAGS);

class TcpclV4 {
public:
    static constexpr uint8_t PROTOCOL_VERSION = 4;
    static constexpr std::size_t CONTACT_HEADER_SIZE = 8;
    static constexpr std::size_t MESSAGE_HEADER_SIZE = 5; //type byte + 4 byte length
    static constexpr uint8_t SESSION_TERMINATION_FLAG_REPLY = 0x01;
    /// largest data segment framing overhead: header + 0x83 + flags + 9 byte transfer id + 9 byte string head
    static constexpr uint64_t MAX_DATA_SEGMENT_OVERHEAD_BYTES = MESSAGE_HEADER_SIZE + 1 + 1 + 9 + 9;

    typedef boost::function<void(std::vector<uint8_t> & dataSegmentDataVec, bool isStartFlag, bool isEndFlag,
        uint64_t transferId)> DataSegmentContentsReadCallback_t;
    typedef boost::function<void(bool isValidMagic, uint8_t version, uint8_t flags, uint16_t keepAliveIntervalSeconds)> ContactHeaderReadCallback_t;
    typedef boost::function<void(uint16_t keepAliveIntervalSeconds, uint64_t segmentMru, uint64_t transferMru,
        const std::string & remoteNodeEidUri)> SessionInitCallback_t;
    typedef boost::function<void(bool isStartSegment, bool isEndSegment, uint64_t transferId, uint64_t totalBytesAcknowledged)> AckSegmentReadCallback_t;
    typedef boost::function<void(TCPCLV4_MESSAGE_REJECT_REASON_CODES refusalCode, uint8_t rejectedMessageType)> MessageRejectCallback_t;
    typedef boost::function<void(TCPCLV4_TRANSFER_REFUSE_REASON_CODES refusalCode, uint64_t transferId)> BundleRefusalCallback_t;
    typedef boost::function<void()> KeepAliveCallback_t;
    typedef boost::function<void(TCPCLV4_SESSION_TERMINATION_REASON_CODES terminationReasonCode, bool isAckOfAnEarlierSessionTerminationMessage)> SessionTerminationMessageCallback_t;
    /// A framed message that could not be used: unknown type, malformed body or a body exceeding the receive limit.
    typedef boost::function<void(uint8_t messageTypeByte, TCPCLV4_MESSAGE_REJECT_REASON_CODES rejectReason)> InvalidMessageCallback_t;

    TCPCL_LIB_EXPORT TcpclV4();
    TCPCL_LIB_EXPORT ~TcpclV4();
    TCPCL_LIB_EXPORT void SetDataSegmentContentsReadCallback(const DataSegmentContentsReadCallback_t & callback);
    TCPCL_LIB_EXPORT void SetContactHeaderReadCallback(const ContactHeaderReadCallback_t & callback);
    TCPCL_LIB_EXPORT void SetSessionInitReadCallback(const SessionInitCallback_t & callback);
    TCPCL_LIB_EXPORT void SetAckSegmentReadCallback(const AckSegmentReadCallback_t & callback);
    TCPCL_LIB_EXPORT void SetBundleRefusalCallback(const BundleRefusalCallback_t & callback);
    TCPCL_LIB_EXPORT void SetMessageRejectCallback(const MessageRejectCallback_t & callback);
    TCPCL_LIB_EXPORT void SetKeepAliveCallback(const KeepAliveCallback_t & callback);
    TCPCL_LIB_EXPORT void SetSessionTerminationMessageCallback(const SessionTerminationMessageCallback_t & callback);
    TCPCL_LIB_EXPORT void SetInvalidMessageCallback(const InvalidMessageCallback_t & callback);
    /// Message bodies larger than this are skipped and reported through the InvalidMessageCallback.
    TCPCL_LIB_EXPORT void SetMaxReceiveMessageBodySizeBytes(const uint64_t maxRxMessageBodySizeBytes);

    TCPCL_LIB_EXPORT void InitRx();
    TCPCL_LIB_EXPORT void HandleReceivedChars(const uint8_t * rxVals, std::size_t numChars);
    TCPCL_LIB_EXPORT void HandleReceivedChar(const uint8_t rxVal);
    TCPCL_LIB_EXPORT bool IsContactHeaderComplete() const;

    TCPCL_LIB_EXPORT static void GenerateContactHeader(std::vector<uint8_t> & hdr, uint16_t keepAliveIntervalSeconds, uint8_t version = PROTOCOL_VERSION, uint8_t flags = 0);
    TCPCL_LIB_EXPORT static void GenerateSessionInitMessage(std::vector<uint8_t> & msg, uint16_t keepAliveIntervalSeconds, uint64_t segmentMru, uint64_t transferMru,
        const std::string & myNodeEidUri);

    /// Entire XFER_SEGMENT message including contents.
    TCPCL_LIB_EXPORT static void GenerateDataSegment(std::vector<uint8_t> & dataSegment, bool isStartSegment, bool isEndSegment, uint64_t transferId,
        const uint8_t * contents, uint64_t sizeContents);
    /// XFER_SEGMENT message up to (not including) the contents so the contents can be sent from the caller's buffer.
    TCPCL_LIB_EXPORT static void GenerateDataSegmentHeaderOnly(std::vector<uint8_t> & dataSegmentHeaderDataVec, bool isStartSegment, bool isEndSegment, uint64_t transferId,
        uint64_t sizeContents);

    /** Split contents into XFER_SEGMENT messages carrying at most maxSegmentDataBytes each,
     * START on the first and END on the last (both on a single segment, including an empty one).
     */
    TCPCL_LIB_EXPORT static void GenerateDataSegments(std::vector<std::vector<uint8_t> > & dataSegmentsVec, uint64_t transferId,
        const uint8_t * contents, uint64_t sizeContents, uint64_t maxSegmentDataBytes);
    TCPCL_LIB_EXPORT static uint64_t GetNumDataSegments(uint64_t sizeContents, uint64_t maxSegmentDataBytes);

    TCPCL_LIB_EXPORT static void GenerateAckSegment(std::vector<uint8_t> & ackSegment, bool isStartSegment, bool isEndSegment, uint64_t transferId, uint64_t totalBytesAcknowledged);
    TCPCL_LIB_EXPORT static void GenerateBundleRefusal(std::vector<uint8_t> & refusalMessage, TCPCLV4_TRANSFER_REFUSE_REASON_CODES refusalCode, uint64_t transferId);
    TCPCL_LIB_EXPORT static void GenerateMessageRejection(std::vector<uint8_t> & rejectionMessage, TCPCLV4_MESSAGE_REJECT_REASON_CODES rejectionCode, uint8_t rejectedMessageType);
    TCPCL_LIB_EXPORT static void GenerateKeepAliveMessage(std::vector<uint8_t> & keepAliveMessage);
    TCPCL_LIB_EXPORT static void GenerateSessionTerminationMessage(std::vector<uint8_t> & sessionTerminationMessage,
        TCPCLV4_SESSION_TERMINATION_REASON_CODES sessionTerminationReasonCode, bool isAckOfAnEarlierSessionTerminationMessage);

private:
    TCPCL_LIB_EXPORT void DispatchMessageBody();
    TCPCL_LIB_EXPORT static void AppendMessageHeader(std::vector<uint8_t> & msg, TCPCLV4_MESSAGE_TYPE_BYTE_CODES messageType, uint32_t bodyLength);
    TCPCL_LIB_EXPORT static void FinishMessage(std::vector<uint8_t> & msg, TCPCLV4_MESSAGE_TYPE_BYTE_CODES messageType, const std::vector<uint8_t> & body);

public:
    uint64_t M_MAX_RX_MESSAGE_BODY_SIZE_BYTES;
    TCPCLV4_MAIN_RX_STATE m_mainRxState;
    TCPCLV4_CONTACT_HEADER_RX_STATE m_contactHeaderRxState;

    //contact header
    uint8_t m_contactHeaderVersion;
    uint8_t m_contactHeaderFlags;
    uint16_t m_contactHeaderKeepAliveInterval;

    //message framing
    uint8_t m_messageTypeByte;
    uint32_t m_messageBodyLength;
    uint64_t m_messageBodyBytesRemaining;
    uint8_t m_readValueByteIndex;
    std::vector<uint8_t> m_messageBodyVec;

    //callback functions
    ContactHeaderReadCallback_t m_contactHeaderReadCallback;
    SessionInitCallback_t m_sessionInitCallback;
    DataSegmentContentsReadCallback_t m_dataSegmentContentsReadCallback;
    AckSegmentReadCallback_t m_ackSegmentReadCallback;
    MessageRejectCallback_t m_messageRejectCallback;
    BundleRefusalCallback_t m_bundleRefusalCallback;
    KeepAliveCallback_t m_keepAliveCallback;
    SessionTerminationMessageCallback_t m_sessionTerminationMessageCallback;
    InvalidMessageCallback_t m_invalidMessageCallback;
};

#endif // TCPCLV4_H
