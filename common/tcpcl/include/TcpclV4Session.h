/**
 * @file TcpclV4Session.h
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
 * The TcpclV4Session class is one TCPCLv4 connection and its state machine:
 *   IDLE -> CONNECTING -> CONTACT_NEGOTIATION -> ESTABLISHED <-> TRANSFERRING -> TERMINATING -> CLOSED_CLEAN
 * with CLOSED_ERROR reachable from any state on a TCP error, a contact header mismatch
 * or a keepalive timeout.
 * All socket I/O, timers and callbacks run on the io_service thread owned by the TcpclV4Agent.
 * SendBundle is the only blocking call: it is called from application threads (never the io_service thread),
 * and it waits while the unacknowledged segment window is full.
 * A dropped connection is hard loss: there is no transfer resumption, so unacknowledged
 * transfers are reported as failed when the session closes.
 */

#ifndef TCPCLV4_SESSION_H
#define TCPCLV4_SESSION_H 1

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <ostream>
#include <boost/asio.hpp>
#include <boost/function.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "TcpclV4.h"
#include "TcpAsyncSender.h"
#include "Bp7ErrorCodes.h"
#include "tcpcl_lib_export.h"

enum class TCPCLV4_SESSION_STATE : uint8_t
{
    IDLE = 0,
    CONNECTING,
    CONTACT_NEGOTIATION,
    ESTABLISHED,
    TRANSFERRING,
    TERMINATING,
    CLOSED_CLEAN,
    CLOSED_ERROR
};
TCPCL_LIB_EXPORT const char * TcpclV4SessionStateToString(TCPCLV4_SESSION_STATE state);
TCPCL_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const TCPCLV4_SESSION_STATE state);

struct TcpclV4SessionConfig {
    std::string m_localNodeEidUri;
    /// 0 disables keepalives
    uint16_t m_keepAliveIntervalSeconds;
    /// largest single segment data payload this entity will receive
    uint64_t m_segmentMru;
    /// largest whole bundle this entity will receive
    uint64_t m_transferMru;
    /// outbound XFER_SEGMENT messages allowed in flight without an XFER_ACK
    uint64_t m_maxUnackedSegments;
    uint32_t m_contactNegotiationTimeoutMilliseconds;
    uint32_t m_sessionTerminationAckTimeoutMilliseconds;

    TCPCL_LIB_EXPORT TcpclV4SessionConfig(); //a default constructor: X()
    TCPCL_LIB_EXPORT ~TcpclV4SessionConfig(); //a destructor: ~X()
    TCPCL_LIB_EXPORT TcpclV4SessionConfig(const TcpclV4SessionConfig& o); //a copy constructor: X(const X&)
    TCPCL_LIB_EXPORT TcpclV4SessionConfig(TcpclV4SessionConfig&& o); //a move constructor: X(X&&)
    TCPCL_LIB_EXPORT TcpclV4SessionConfig& operator=(const TcpclV4SessionConfig& o); //a copy assignment: operator=(const X&)
    TCPCL_LIB_EXPORT TcpclV4SessionConfig& operator=(TcpclV4SessionConfig&& o); //a move assignment: operator=(X&&)
};

struct TcpclV4SessionStats {
    uint64_t m_totalBytesSent;
    uint64_t m_totalBytesReceived;
    uint64_t m_totalSegmentsSent;
    uint64_t m_totalSegmentsAcked;
    uint64_t m_totalSegmentsReceived;
    uint64_t m_totalBundlesSent;
    uint64_t m_totalBundlesAcked;
    uint64_t m_totalBundlesReceived;
    uint64_t m_totalTransfersRefused;
    /// always 0, transfers are never resumed or retransmitted
    uint64_t m_totalRetransmissions;
    uint64_t m_totalMessagesRejected;
    uint64_t m_elapsedSessionMilliseconds;

    TCPCL_LIB_EXPORT TcpclV4SessionStats();
    TCPCL_LIB_EXPORT void SetZero();
    TCPCL_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const TcpclV4SessionStats& o);
};

class TcpclV4Session {
private:
    TcpclV4Session();
public:
    typedef boost::function<void(std::vector<uint8_t> & wholeBundleVec, TcpclV4Session & session)> WholeBundleReadyCallback_t;
    typedef boost::function<void(uint64_t transferId, bool wasAcked, TcpclV4Session & session)> OutboundTransferFinishedCallback_t;
    typedef boost::function<void(TCPCLV4_SESSION_STATE newState, TcpclV4Session & session)> SessionStateChangedCallback_t;

    TCPCL_LIB_EXPORT TcpclV4Session(boost::asio::io_service & ioServiceRef, const TcpclV4SessionConfig & config, uint64_t sessionId);
    TCPCL_LIB_EXPORT ~TcpclV4Session();

    /// Thread safe.  Resolve and connect as the active entity, which sends the first contact header.
    TCPCL_LIB_EXPORT void StartActive(const std::string & hostname, uint16_t port);
    /// Call from the io_service thread with a freshly accepted socket (passive entity).
    TCPCL_LIB_EXPORT void StartPassive(std::shared_ptr<boost::asio::ip::tcp::socket> & acceptedSocketPtr);

    /** Serialize-once send of a whole bundle.  Thread safe but blocking, never call from the io_service thread.
     *
     * @param transferId Set to the session scoped transfer id used for this bundle.
     * @return True once every segment is enqueued, or False with errorCode set to
     * SESSION_NOT_ESTABLISHED (state not ESTABLISHED/TRANSFERRING, or the session closed mid transfer)
     * or INVALID_ARGUMENT (bundle exceeds the peer's transfer MRU).
     */
    TCPCL_LIB_EXPORT bool SendBundle(const uint8_t * bundleData, std::size_t bundleSize, uint64_t & transferId, BP7_ERROR_CODE & errorCode);
    TCPCL_LIB_EXPORT bool SendBundle(const std::vector<uint8_t> & bundleVec, uint64_t & transferId, BP7_ERROR_CODE & errorCode);

    /// Thread safe.  Begin an orderly SESS_TERM exchange.
    TCPCL_LIB_EXPORT void Terminate(TCPCLV4_SESSION_TERMINATION_REASON_CODES reasonCode = TCPCLV4_SESSION_TERMINATION_REASON_CODES::UNKNOWN);
    /// Thread safe.  Close the socket immediately (clean).
    TCPCL_LIB_EXPORT void Close();

    /// Block until the state is one of CLOSED_CLEAN or CLOSED_ERROR, or the timeout expires.
    TCPCL_LIB_EXPORT bool WaitForClosed(const boost::posix_time::time_duration & timeout);
    /// Block until the state is ESTABLISHED (or TRANSFERRING), closed, or the timeout expires.
    TCPCL_LIB_EXPORT bool WaitForEstablished(const boost::posix_time::time_duration & timeout);
    /// Block until every outbound transfer is acknowledged, refused or failed.
    TCPCL_LIB_EXPORT bool WaitForAllTransfersFinished(const boost::posix_time::time_duration & timeout);

    TCPCL_LIB_EXPORT TCPCLV4_SESSION_STATE GetState() const;
    TCPCL_LIB_EXPORT bool IsEstablished() const;
    TCPCL_LIB_EXPORT bool IsClosed() const;
    TCPCL_LIB_EXPORT BP7_ERROR_CODE GetCloseErrorCode() const;
    TCPCL_LIB_EXPORT std::string GetRemoteNodeEidUri() const;
    TCPCL_LIB_EXPORT uint16_t GetNegotiatedKeepAliveIntervalSeconds() const;
    TCPCL_LIB_EXPORT uint64_t GetRemoteSegmentMru() const;
    TCPCL_LIB_EXPORT uint64_t GetRemoteTransferMru() const;
    TCPCL_LIB_EXPORT uint64_t GetSessionId() const;
    TCPCL_LIB_EXPORT bool IsActiveEntity() const;
    TCPCL_LIB_EXPORT TcpclV4SessionStats GetStats() const;

    TCPCL_LIB_EXPORT void SetWholeBundleReadyCallback(const WholeBundleReadyCallback_t & callback);
    TCPCL_LIB_EXPORT void SetOutboundTransferFinishedCallback(const OutboundTransferFinishedCallback_t & callback);
    TCPCL_LIB_EXPORT void SetSessionStateChangedCallback(const SessionStateChangedCallback_t & callback);

private:
    struct outbound_transfer_t {
        uint64_t totalLength;
        uint64_t bytesAcked;
        uint64_t numSegmentsUnacked;
    };

    TCPCL_LIB_EXPORT void OnResolve(const boost::system::error_code & ec, boost::asio::ip::tcp::resolver::results_type results);
    TCPCL_LIB_EXPORT void OnConnect(const boost::system::error_code & ec);
    TCPCL_LIB_EXPORT void OnSocketReady_NotThreadSafe();
    TCPCL_LIB_EXPORT void StartTcpReceive();
    TCPCL_LIB_EXPORT void HandleTcpReceiveSome(const boost::system::error_code & error, std::size_t bytesTransferred);
    TCPCL_LIB_EXPORT void HandleTcpSend(const boost::system::error_code& error, std::size_t bytes_transferred, TcpAsyncSenderElement * elPtr);
    TCPCL_LIB_EXPORT void HandleTcpSendSessionTerminationReply(const boost::system::error_code& error, std::size_t bytes_transferred, TcpAsyncSenderElement * elPtr);
    TCPCL_LIB_EXPORT void HandleTcpSendError(const boost::system::error_code& error, std::size_t numElementsDiscarded);
    TCPCL_LIB_EXPORT void SendMessage_NotThreadSafe(std::vector<uint8_t> && messageVec, TcpAsyncSenderElement::OnSuccessfulSendCallbackByIoServiceThread_t * callbackPtr);
    TCPCL_LIB_EXPORT void SendContactHeader_NotThreadSafe();
    TCPCL_LIB_EXPORT void SendSessionInit_NotThreadSafe();

    //rx state machine callbacks
    TCPCL_LIB_EXPORT void ContactHeaderCallback(bool isValidMagic, uint8_t version, uint8_t flags, uint16_t keepAliveIntervalSeconds);
    TCPCL_LIB_EXPORT void SessionInitCallback(uint16_t keepAliveIntervalSeconds, uint64_t segmentMru, uint64_t transferMru, const std::string & remoteNodeEidUri);
    TCPCL_LIB_EXPORT void DataSegmentCallback(std::vector<uint8_t> & dataSegmentDataVec, bool isStartFlag, bool isEndFlag, uint64_t transferId);
    TCPCL_LIB_EXPORT void AckCallback(bool isStartSegment, bool isEndSegment, uint64_t transferId, uint64_t totalBytesAcknowledged);
    TCPCL_LIB_EXPORT void BundleRefusalCallback(TCPCLV4_TRANSFER_REFUSE_REASON_CODES refusalCode, uint64_t transferId);
    TCPCL_LIB_EXPORT void MessageRejectCallback(TCPCLV4_MESSAGE_REJECT_REASON_CODES refusalCode, uint8_t rejectedMessageType);
    TCPCL_LIB_EXPORT void KeepAliveCallback();
    TCPCL_LIB_EXPORT void SessionTerminationMessageCallback(TCPCLV4_SESSION_TERMINATION_REASON_CODES terminationReasonCode, bool isAckOfAnEarlierSessionTerminationMessage);
    TCPCL_LIB_EXPORT void InvalidMessageCallback(uint8_t messageTypeByte, TCPCLV4_MESSAGE_REJECT_REASON_CODES rejectReason);

    TCPCL_LIB_EXPORT void RefuseInboundTransfer_NotThreadSafe(TCPCLV4_TRANSFER_REFUSE_REASON_CODES refusalCode, uint64_t transferId);
    TCPCL_LIB_EXPORT void SendMessageRejection_NotThreadSafe(TCPCLV4_MESSAGE_REJECT_REASON_CODES rejectionCode, uint8_t rejectedMessageType);

    //timers
    TCPCL_LIB_EXPORT void RestartNoKeepaliveReceivedTimer();
    TCPCL_LIB_EXPORT void OnNoKeepAlivePacketReceived_TimerExpired(const boost::system::error_code& e);
    TCPCL_LIB_EXPORT void RestartNeedToSendKeepAliveMessageTimer();
    TCPCL_LIB_EXPORT void OnNeedToSendKeepAliveMessage_TimerExpired(const boost::system::error_code& e);
    TCPCL_LIB_EXPORT void OnContactNegotiation_TimerExpired(const boost::system::error_code& e);
    TCPCL_LIB_EXPORT void OnWaitForSessionTerminationAckTimeout_TimerExpired(const boost::system::error_code& e);

    TCPCL_LIB_EXPORT void DoTerminate_NotThreadSafe(TCPCLV4_SESSION_TERMINATION_REASON_CODES reasonCode);
    TCPCL_LIB_EXPORT void DoClose_NotThreadSafe(BP7_ERROR_CODE closeErrorCode);
    /// Caller must hold m_mutex.  Returns true if the state changed.
    TCPCL_LIB_EXPORT bool SetState_Locked(TCPCLV4_SESSION_STATE newState);
    /// Move between ESTABLISHED and TRANSFERRING from the current transfer bookkeeping.  Caller must hold m_mutex.
    TCPCL_LIB_EXPORT bool UpdateTransferringState_Locked();
    TCPCL_LIB_EXPORT void NotifyStateChanged(TCPCLV4_SESSION_STATE newState);

    const TcpclV4SessionConfig M_CONFIG;
    const uint64_t M_SESSION_ID;
    boost::asio::io_service & m_ioServiceRef;
    boost::asio::ip::tcp::resolver m_resolver;
    std::shared_ptr<boost::asio::ip::tcp::socket> m_tcpSocketPtr;
    std::unique_ptr<TcpAsyncSender> m_tcpAsyncSenderPtr;
    boost::asio::deadline_timer m_needToSendKeepAliveMessageTimer;
    boost::asio::deadline_timer m_noKeepAlivePacketReceivedTimer;
    boost::asio::deadline_timer m_contactNegotiationTimer;
    boost::asio::deadline_timer m_waitForSessionTerminationAckTimeoutTimer;
    TcpclV4 m_tcpclV4RxStateMachine;
    std::vector<uint8_t> m_tcpReadSomeBufferVec;
    TcpAsyncSenderElement::OnSuccessfulSendCallbackByIoServiceThread_t m_handleTcpSendCallback;
    TcpAsyncSenderElement::OnSuccessfulSendCallbackByIoServiceThread_t m_handleTcpSendSessionTerminationReplyCallback;
    bool m_isActiveEntity;

    //guarded by m_mutex
    mutable boost::mutex m_mutex;
    boost::condition_variable m_cv;
    TCPCLV4_SESSION_STATE m_state;
    BP7_ERROR_CODE m_closeErrorCode;
    std::string m_remoteNodeEidUri;
    uint16_t m_negotiatedKeepAliveIntervalSeconds;
    uint64_t m_remoteSegmentMru;
    uint64_t m_remoteTransferMru;
    uint64_t m_nextTransferId;
    uint64_t m_numUnackedSegments;
    bool m_inboundTransferActive;
    std::map<uint64_t, outbound_transfer_t> m_outboundTransfersMap;
    TcpclV4SessionStats m_stats;
    boost::posix_time::ptime m_sessionStartTime;
    boost::posix_time::ptime m_sessionEndTime;

    //serializes SendBundle callers so segments of different transfers never interleave
    boost::mutex m_sendBundleMutex;

    //io_service thread only
    bool m_contactHeaderSent;
    bool m_sessionInitSent;
    bool m_sessionInitReceived;
    uint64_t m_inboundTransferId;
    std::vector<uint8_t> m_inboundBundleVec;
    bool m_hasRefusedInboundTransfer;
    uint64_t m_lastRefusedInboundTransferId;
    boost::posix_time::ptime m_lastDataReceivedTime;
    std::atomic<bool> m_dataSentServedAsKeepaliveSent;

    WholeBundleReadyCallback_t m_wholeBundleReadyCallback;
    OutboundTransferFinishedCallback_t m_outboundTransferFinishedCallback;
    SessionStateChangedCallback_t m_sessionStateChangedCallback;
};

#endif //TCPCLV4_SESSION_H
