/**
 * @file TcpclV4Session.cpp
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

#include "TcpclV4Session.h"
#include "Logger.h"
#include "codec/EndpointId.h"
#include <boost/bind/bind.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::tcpcl;

static const char * const SESSION_STATE_STRINGS[] = {
    "IDLE",
    "CONNECTING",
    "CONTACT_NEGOTIATION",
    "ESTABLISHED",
    "TRANSFERRING",
    "TERMINATING",
    "CLOSED_CLEAN",
    "CLOSED_ERROR"
};

const char * TcpclV4SessionStateToString(TCPCLV4_SESSION_STATE state) {
    const unsigned int index = static_cast<unsigned int>(state);
    if (index > static_cast<unsigned int>(TCPCLV4_SESSION_STATE::CLOSED_ERROR)) {
        return "INVALID_STATE";
    }
    return SESSION_STATE_STRINGS[index];
}

std::ostream& operator<<(std::ostream& os, const TCPCLV4_SESSION_STATE state) {
    os << TcpclV4SessionStateToString(state);
    return os;
}

static bool IsClosedState(const TCPCLV4_SESSION_STATE state) {
    return (state == TCPCLV4_SESSION_STATE::CLOSED_CLEAN) || (state == TCPCLV4_SESSION_STATE::CLOSED_ERROR);
}

static bool IsUsableState(const TCPCLV4_SESSION_STATE state) {
    return (state == TCPCLV4_SESSION_STATE::ESTABLISHED) || (state == TCPCLV4_SESSION_STATE::TRANSFERRING);
}

TcpclV4SessionConfig::TcpclV4SessionConfig() :
    m_localNodeEidUri(""),
    m_keepAliveIntervalSeconds(30),
    m_segmentMru(1000000),
    m_transferMru(100000000),
    m_maxUnackedSegments(64),
    m_contactNegotiationTimeoutMilliseconds(10000),
    m_sessionTerminationAckTimeoutMilliseconds(3000) {}
TcpclV4SessionConfig::~TcpclV4SessionConfig() {}
TcpclV4SessionConfig::TcpclV4SessionConfig(const TcpclV4SessionConfig& o) :
    m_localNodeEidUri(o.m_localNodeEidUri),
    m_keepAliveIntervalSeconds(o.m_keepAliveIntervalSeconds),
    m_segmentMru(o.m_segmentMru),
    m_transferMru(o.m_transferMru),
    m_maxUnackedSegments(o.m_maxUnackedSegments),
    m_contactNegotiationTimeoutMilliseconds(o.m_contactNegotiationTimeoutMilliseconds),
    m_sessionTerminationAckTimeoutMilliseconds(o.m_sessionTerminationAckTimeoutMilliseconds) {}
TcpclV4SessionConfig::TcpclV4SessionConfig(TcpclV4SessionConfig&& o) :
    m_localNodeEidUri(std::move(o.m_localNodeEidUri)),
    m_keepAliveIntervalSeconds(o.m_keepAliveIntervalSeconds),
    m_segmentMru(o.m_segmentMru),
    m_transferMru(o.m_transferMru),
    m_maxUnackedSegments(o.m_maxUnackedSegments),
    m_contactNegotiationTimeoutMilliseconds(o.m_contactNegotiationTimeoutMilliseconds),
    m_sessionTerminationAckTimeoutMilliseconds(o.m_sessionTerminationAckTimeoutMilliseconds) {}
TcpclV4SessionConfig& TcpclV4SessionConfig::operator=(const TcpclV4SessionConfig& o) {
    m_localNodeEidUri = o.m_localNodeEidUri;
    m_keepAliveIntervalSeconds = o.m_keepAliveIntervalSeconds;
    m_segmentMru = o.m_segmentMru;
    m_transferMru = o.m_transferMru;
    m_maxUnackedSegments = o.m_maxUnackedSegments;
    m_contactNegotiationTimeoutMilliseconds = o.m_contactNegotiationTimeoutMilliseconds;
    m_sessionTerminationAckTimeoutMilliseconds = o.m_sessionTerminationAckTimeoutMilliseconds;
    return *this;
}
TcpclV4SessionConfig& TcpclV4SessionConfig::operator=(TcpclV4SessionConfig&& o) {
    m_localNodeEidUri = std::move(o.m_localNodeEidUri);
    m_keepAliveIntervalSeconds = o.m_keepAliveIntervalSeconds;
    m_segmentMru = o.m_segmentMru;
    m_transferMru = o.m_transferMru;
    m_maxUnackedSegments = o.m_maxUnackedSegments;
    m_contactNegotiationTimeoutMilliseconds = o.m_contactNegotiationTimeoutMilliseconds;
    m_sessionTerminationAckTimeoutMilliseconds = o.m_sessionTerminationAckTimeoutMilliseconds;
    return *this;
}

TcpclV4SessionStats::TcpclV4SessionStats() {
    SetZero();
}
void TcpclV4SessionStats::SetZero() {
    m_totalBytesSent = 0;
    m_totalBytesReceived = 0;
    m_totalSegmentsSent = 0;
    m_totalSegmentsAcked = 0;
    m_totalSegmentsReceived = 0;
    m_totalBundlesSent = 0;
    m_totalBundlesAcked = 0;
    m_totalBundlesReceived = 0;
    m_totalTransfersRefused = 0;
    m_totalRetransmissions = 0;
    m_totalMessagesRejected = 0;
    m_elapsedSessionMilliseconds = 0;
}
std::ostream& operator<<(std::ostream& os, const TcpclV4SessionStats& o) {
    os << "bytesSent=" << o.m_totalBytesSent
        << " bytesReceived=" << o.m_totalBytesReceived
        << " segmentsSent=" << o.m_totalSegmentsSent
        << " segmentsAcked=" << o.m_totalSegmentsAcked
        << " segmentsReceived=" << o.m_totalSegmentsReceived
        << " bundlesSent=" << o.m_totalBundlesSent
        << " bundlesAcked=" << o.m_totalBundlesAcked
        << " bundlesReceived=" << o.m_totalBundlesReceived
        << " transfersRefused=" << o.m_totalTransfersRefused
        << " retransmissions=" << o.m_totalRetransmissions
        << " messagesRejected=" << o.m_totalMessagesRejected
        << " elapsedMs=" << o.m_elapsedSessionMilliseconds;
    return os;
}

TcpclV4Session::TcpclV4Session(boost::asio::io_service & ioServiceRef, const TcpclV4SessionConfig & config, uint64_t sessionId) :
    M_CONFIG(config),
    M_SESSION_ID(sessionId),
    m_ioServiceRef(ioServiceRef),
    m_resolver(ioServiceRef),
    m_needToSendKeepAliveMessageTimer(ioServiceRef),
    m_noKeepAlivePacketReceivedTimer(ioServiceRef),
    m_contactNegotiationTimer(ioServiceRef),
    m_waitForSessionTerminationAckTimeoutTimer(ioServiceRef),
    m_tcpReadSomeBufferVec(10000),
    m_isActiveEntity(false),
    m_state(TCPCLV4_SESSION_STATE::IDLE),
    m_closeErrorCode(BP7_ERROR_CODE::NONE),
    m_negotiatedKeepAliveIntervalSeconds(0),
    m_remoteSegmentMru(0),
    m_remoteTransferMru(0),
    m_nextTransferId(0),
    m_numUnackedSegments(0),
    m_inboundTransferActive(false),
    m_contactHeaderSent(false),
    m_sessionInitSent(false),
    m_sessionInitReceived(false),
    m_inboundTransferId(0),
    m_hasRefusedInboundTransfer(false),
    m_lastRefusedInboundTransferId(0),
    m_dataSentServedAsKeepaliveSent(false)
{
    m_handleTcpSendCallback = boost::bind(&TcpclV4Session::HandleTcpSend, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3);
    m_handleTcpSendSessionTerminationReplyCallback = boost::bind(&TcpclV4Session::HandleTcpSendSessionTerminationReply, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3);

    m_tcpclV4RxStateMachine.SetContactHeaderReadCallback(boost::bind(&TcpclV4Session::ContactHeaderCallback, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3, boost::placeholders::_4));
    m_tcpclV4RxStateMachine.SetSessionInitReadCallback(boost::bind(&TcpclV4Session::SessionInitCallback, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3, boost::placeholders::_4));
    m_tcpclV4RxStateMachine.SetDataSegmentContentsReadCallback(boost::bind(&TcpclV4Session::DataSegmentCallback, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3, boost::placeholders::_4));
    m_tcpclV4RxStateMachine.SetAckSegmentReadCallback(boost::bind(&TcpclV4Session::AckCallback, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3, boost::placeholders::_4));
    m_tcpclV4RxStateMachine.SetBundleRefusalCallback(boost::bind(&TcpclV4Session::BundleRefusalCallback, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_tcpclV4RxStateMachine.SetMessageRejectCallback(boost::bind(&TcpclV4Session::MessageRejectCallback, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_tcpclV4RxStateMachine.SetKeepAliveCallback(boost::bind(&TcpclV4Session::KeepAliveCallback, this));
    m_tcpclV4RxStateMachine.SetSessionTerminationMessageCallback(boost::bind(&TcpclV4Session::SessionTerminationMessageCallback, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_tcpclV4RxStateMachine.SetInvalidMessageCallback(boost::bind(&TcpclV4Session::InvalidMessageCallback, this,
        boost::placeholders::_1, boost::placeholders::_2));
    //until SESS_INIT is negotiated, nothing but a SESS_INIT sized body is expected
    m_tcpclV4RxStateMachine.SetMaxReceiveMessageBodySizeBytes(std::max<uint64_t>(M_CONFIG.m_segmentMru, 65536) + TcpclV4::MAX_DATA_SEGMENT_OVERHEAD_BYTES);
}

TcpclV4Session::~TcpclV4Session() {
    if (m_tcpSocketPtr && m_tcpSocketPtr->is_open()) {
        boost::system::error_code ec;
        m_tcpSocketPtr->close(ec);
    }
}

void TcpclV4Session::StartActive(const std::string & hostname, uint16_t port) {
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (m_state != TCPCLV4_SESSION_STATE::IDLE) {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " cannot start active from state " << m_state;
            return;
        }
        m_isActiveEntity = true;
        SetState_Locked(TCPCLV4_SESSION_STATE::CONNECTING);
    }
    LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " resolving " << hostname << ":" << port;
    const std::string portAsString = boost::lexical_cast<std::string>(port);
    boost::asio::post(m_ioServiceRef, [this, hostname, portAsString]() {
        NotifyStateChanged(TCPCLV4_SESSION_STATE::CONNECTING);
        m_resolver.async_resolve(hostname, portAsString,
            boost::bind(&TcpclV4Session::OnResolve, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::results));
    });
}

void TcpclV4Session::OnResolve(const boost::system::error_code & ec, boost::asio::ip::tcp::resolver::results_type results) {
    if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " error resolving: " << ec.message();
            DoClose_NotThreadSafe(BP7_ERROR_CODE::CONNECTION_LOST);
        }
        return;
    }
    if (IsClosed()) {
        return;
    }
    m_tcpSocketPtr = std::make_shared<boost::asio::ip::tcp::socket>(m_ioServiceRef);
    boost::asio::async_connect(
        *m_tcpSocketPtr,
        results,
        boost::bind(&TcpclV4Session::OnConnect, this,
            boost::asio::placeholders::error));
}

void TcpclV4Session::OnConnect(const boost::system::error_code & ec) {
    if (ec) {
        if (ec != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " error connecting: " << ec.message();
            DoClose_NotThreadSafe(BP7_ERROR_CODE::CONNECTION_LOST);
        }
        return;
    }
    boost::system::error_code endpointEc;
    LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " connected to " << m_tcpSocketPtr->remote_endpoint(endpointEc);
    OnSocketReady_NotThreadSafe();
}

void TcpclV4Session::StartPassive(std::shared_ptr<boost::asio::ip::tcp::socket> & acceptedSocketPtr) {
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (m_state != TCPCLV4_SESSION_STATE::IDLE) {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " cannot start passive from state " << m_state;
            return;
        }
        m_isActiveEntity = false;
    }
    m_tcpSocketPtr = acceptedSocketPtr;
    OnSocketReady_NotThreadSafe();
}

void TcpclV4Session::OnSocketReady_NotThreadSafe() {
    bool changed;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (IsClosedState(m_state)) {
            boost::system::error_code ec;
            m_tcpSocketPtr->close(ec);
            return;
        }
        changed = SetState_Locked(TCPCLV4_SESSION_STATE::CONTACT_NEGOTIATION);
        m_sessionStartTime = boost::posix_time::microsec_clock::universal_time();
    }
    if (changed) {
        NotifyStateChanged(TCPCLV4_SESSION_STATE::CONTACT_NEGOTIATION);
    }

    boost::system::error_code ec;
    m_tcpSocketPtr->set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " unable to set TCP_NODELAY: " << ec.message();
    }

    m_tcpAsyncSenderPtr = std::make_unique<TcpAsyncSender>(m_tcpSocketPtr, m_ioServiceRef);
    m_tcpAsyncSenderPtr->SetOnSendErrorCallback(boost::bind(&TcpclV4Session::HandleTcpSendError, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_tcpclV4RxStateMachine.InitRx();
    m_lastDataReceivedTime = boost::posix_time::microsec_clock::universal_time();

    if (m_isActiveEntity) {
        //the active entity speaks first
        SendContactHeader_NotThreadSafe();
    }
    if (M_CONFIG.m_contactNegotiationTimeoutMilliseconds) {
        m_contactNegotiationTimer.expires_from_now(boost::posix_time::milliseconds(M_CONFIG.m_contactNegotiationTimeoutMilliseconds));
        m_contactNegotiationTimer.async_wait(boost::bind(&TcpclV4Session::OnContactNegotiation_TimerExpired, this,
            boost::asio::placeholders::error));
    }
    StartTcpReceive();
}

void TcpclV4Session::StartTcpReceive() {
    m_tcpSocketPtr->async_read_some(
        boost::asio::buffer(m_tcpReadSomeBufferVec),
        boost::bind(&TcpclV4Session::HandleTcpReceiveSome, this,
            boost::asio::placeholders::error,
            boost::asio::placeholders::bytes_transferred));
}

void TcpclV4Session::HandleTcpReceiveSome(const boost::system::error_code & error, std::size_t bytesTransferred) {
    if (!error) {
        {
            boost::mutex::scoped_lock lock(m_mutex);
            m_stats.m_totalBytesReceived += bytesTransferred;
        }
        m_lastDataReceivedTime = boost::posix_time::microsec_clock::universal_time();
        //because TcpclV4 will not call the callbacks after the session closes (DISCARD_ALL), it is safe to feed all bytes
        m_tcpclV4RxStateMachine.HandleReceivedChars(m_tcpReadSomeBufferVec.data(), bytesTransferred);
        if (!IsClosed()) {
            StartTcpReceive(); //restart operation only if there was no error
        }
    }
    else if (error == boost::asio::error::operation_aborted) {
        //socket closed by this session
    }
    else {
        const bool terminating = (GetState() == TCPCLV4_SESSION_STATE::TERMINATING);
        if (error == boost::asio::error::eof) {
            LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " tcp connection closed cleanly by peer";
        }
        else {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " error in HandleTcpReceiveSome: " << error.message();
        }
        DoClose_NotThreadSafe(terminating ? BP7_ERROR_CODE::NONE : BP7_ERROR_CODE::CONNECTION_LOST);
    }
}

void TcpclV4Session::HandleTcpSend(const boost::system::error_code& error, std::size_t bytes_transferred, TcpAsyncSenderElement * elPtr) {
    if (error) {
        //the TcpAsyncSender error callback closes the session
        return;
    }
    const bool isDataSegment = !elPtr->m_underlyingDataVecBundle.empty();
    {
        boost::mutex::scoped_lock lock(m_mutex);
        m_stats.m_totalBytesSent += bytes_transferred;
        if (isDataSegment) {
            ++m_stats.m_totalSegmentsSent;
        }
    }
    m_dataSentServedAsKeepaliveSent = true;
}

void TcpclV4Session::HandleTcpSendSessionTerminationReply(const boost::system::error_code& error, std::size_t bytes_transferred, TcpAsyncSenderElement * elPtr) {
    HandleTcpSend(error, bytes_transferred, elPtr);
    if (!error) {
        LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " sent SESS_TERM reply, closing";
        DoClose_NotThreadSafe(BP7_ERROR_CODE::NONE);
    }
}

void TcpclV4Session::HandleTcpSendError(const boost::system::error_code& error, std::size_t numElementsDiscarded) {
    if (error == boost::asio::error::operation_aborted) {
        return;
    }
    const bool terminating = (GetState() == TCPCLV4_SESSION_STATE::TERMINATING);
    LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " send failed (" << error.message() << "), "
        << numElementsDiscarded << " queued messages discarded";
    DoClose_NotThreadSafe(terminating ? BP7_ERROR_CODE::NONE : BP7_ERROR_CODE::CONNECTION_LOST);
}

void TcpclV4Session::SendMessage_NotThreadSafe(std::vector<uint8_t> && messageVec, TcpAsyncSenderElement::OnSuccessfulSendCallbackByIoServiceThread_t * callbackPtr) {
    if (!m_tcpAsyncSenderPtr) {
        return;
    }
    TcpAsyncSenderElement * el = new TcpAsyncSenderElement();
    el->m_underlyingDataVecHeaders.resize(1);
    el->m_underlyingDataVecHeaders[0] = std::move(messageVec);
    el->m_constBufferVec.emplace_back(boost::asio::buffer(el->m_underlyingDataVecHeaders[0]));
    el->m_onSuccessfulSendCallbackByIoServiceThreadPtr = callbackPtr;
    m_tcpAsyncSenderPtr->AsyncSend_NotThreadSafe(el);
}

void TcpclV4Session::SendContactHeader_NotThreadSafe() {
    std::vector<uint8_t> contactHeader;
    TcpclV4::GenerateContactHeader(contactHeader, M_CONFIG.m_keepAliveIntervalSeconds);
    SendMessage_NotThreadSafe(std::move(contactHeader), &m_handleTcpSendCallback);
    m_contactHeaderSent = true;
}

void TcpclV4Session::SendSessionInit_NotThreadSafe() {
    std::vector<uint8_t> sessionInit;
    TcpclV4::GenerateSessionInitMessage(sessionInit, M_CONFIG.m_keepAliveIntervalSeconds,
        M_CONFIG.m_segmentMru, M_CONFIG.m_transferMru, M_CONFIG.m_localNodeEidUri);
    SendMessage_NotThreadSafe(std::move(sessionInit), &m_handleTcpSendCallback);
    m_sessionInitSent = true;
}

void TcpclV4Session::ContactHeaderCallback(bool isValidMagic, uint8_t version, uint8_t flags, uint16_t keepAliveIntervalSeconds) {
    if (!isValidMagic) {
        LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received contact header with invalid magic";
        DoClose_NotThreadSafe(BP7_ERROR_CODE::CONTACT_HEADER_MISMATCH);
        return;
    }
    if (version != TcpclV4::PROTOCOL_VERSION) {
        LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received contact header for TCPCL version "
            << static_cast<unsigned int>(version) << " but only version " << static_cast<unsigned int>(TcpclV4::PROTOCOL_VERSION) << " is supported";
        DoClose_NotThreadSafe(BP7_ERROR_CODE::CONTACT_HEADER_MISMATCH);
        return;
    }
    LOG_DEBUG(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received valid contact header: flags="
        << static_cast<unsigned int>(flags) << " keepalive=" << keepAliveIntervalSeconds;
    if (!m_contactHeaderSent) {
        SendContactHeader_NotThreadSafe();
    }
    if (!m_sessionInitSent) {
        SendSessionInit_NotThreadSafe();
    }
}

void TcpclV4Session::SessionInitCallback(uint16_t keepAliveIntervalSeconds, uint64_t segmentMru, uint64_t transferMru, const std::string & remoteNodeEidUri) {
    if (m_sessionInitReceived) {
        LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received a second SESS_INIT";
        SendMessageRejection_NotThreadSafe(TCPCLV4_MESSAGE_REJECT_REASON_CODES::MESSAGE_UNEXPECTED,
            static_cast<uint8_t>(TCPCLV4_MESSAGE_TYPE_BYTE_CODES::SESS_INIT));
        return;
    }
    m_sessionInitReceived = true;
    EndpointId remoteEid;
    BP7_ERROR_CODE errorCode;
    if ((segmentMru == 0) || (transferMru == 0) || (!EndpointId::Parse(remoteNodeEidUri, remoteEid, errorCode))) {
        LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received unacceptable SESS_INIT: segmentMru=" << segmentMru
            << " transferMru=" << transferMru << " nodeId=" << remoteNodeEidUri;
        DoClose_NotThreadSafe(BP7_ERROR_CODE::CONTACT_HEADER_MISMATCH);
        return;
    }
    const uint16_t negotiatedKeepAlive = std::min(M_CONFIG.m_keepAliveIntervalSeconds, keepAliveIntervalSeconds);
    m_tcpclV4RxStateMachine.SetMaxReceiveMessageBodySizeBytes(M_CONFIG.m_segmentMru + TcpclV4::MAX_DATA_SEGMENT_OVERHEAD_BYTES);
    m_contactNegotiationTimer.cancel();

    bool changed;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        m_remoteNodeEidUri = remoteNodeEidUri;
        m_negotiatedKeepAliveIntervalSeconds = negotiatedKeepAlive;
        m_remoteSegmentMru = segmentMru;
        m_remoteTransferMru = transferMru;
        changed = SetState_Locked(TCPCLV4_SESSION_STATE::ESTABLISHED);
    }
    LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " established with " << remoteNodeEidUri
        << " (keepalive " << negotiatedKeepAlive << "s, remote segment MRU " << segmentMru
        << ", remote transfer MRU " << transferMru << ")";
    if (negotiatedKeepAlive) {
        RestartNoKeepaliveReceivedTimer();
        RestartNeedToSendKeepAliveMessageTimer();
    }
    if (changed) {
        NotifyStateChanged(TCPCLV4_SESSION_STATE::ESTABLISHED);
    }
}

void TcpclV4Session::DataSegmentCallback(std::vector<uint8_t> & dataSegmentDataVec, bool isStartFlag, bool isEndFlag, uint64_t transferId) {
    TCPCLV4_SESSION_STATE state;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        ++m_stats.m_totalSegmentsReceived;
        state = m_state;
    }
    if (!m_sessionInitReceived) {
        LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received XFER_SEGMENT before SESS_INIT";
        SendMessageRejection_NotThreadSafe(TCPCLV4_MESSAGE_REJECT_REASON_CODES::MESSAGE_UNEXPECTED,
            static_cast<uint8_t>(TCPCLV4_MESSAGE_TYPE_BYTE_CODES::XFER_SEGMENT));
        return;
    }
    if (isStartFlag) {
        if (state == TCPCLV4_SESSION_STATE::TERMINATING) {
            RefuseInboundTransfer_NotThreadSafe(TCPCLV4_TRANSFER_REFUSE_REASON_CODES::REFUSAL_REASON_SESSION_TERMINATING, transferId);
            return;
        }
        bool wasActive;
        {
            boost::mutex::scoped_lock lock(m_mutex);
            wasActive = m_inboundTransferActive;
            m_inboundTransferActive = true;
        }
        if (wasActive) {
            LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " transfer " << transferId
                << " started before transfer " << m_inboundTransferId << " ended, discarding the partial bundle";
        }
        m_inboundTransferId = transferId;
        m_inboundBundleVec.swap(dataSegmentDataVec);
    }
    else {
        bool active;
        {
            boost::mutex::scoped_lock lock(m_mutex);
            active = m_inboundTransferActive;
        }
        if ((!active) || (transferId != m_inboundTransferId)) {
            if (m_hasRefusedInboundTransfer && (transferId == m_lastRefusedInboundTransferId)) {
                //remainder of a transfer already refused
                return;
            }
            LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received continuation segment for unknown transfer " << transferId;
            RefuseInboundTransfer_NotThreadSafe(TCPCLV4_TRANSFER_REFUSE_REASON_CODES::REFUSAL_REASON_NOT_ACCEPTABLE, transferId);
            return;
        }
        m_inboundBundleVec.insert(m_inboundBundleVec.end(), dataSegmentDataVec.begin(), dataSegmentDataVec.end());
    }

    if (m_inboundBundleVec.size() > M_CONFIG.m_transferMru) {
        LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " transfer " << transferId
            << " exceeds the transfer MRU of " << M_CONFIG.m_transferMru << " bytes";
        RefuseInboundTransfer_NotThreadSafe(TCPCLV4_TRANSFER_REFUSE_REASON_CODES::REFUSAL_REASON_NO_RESOURCES, transferId);
        m_inboundBundleVec.clear();
        m_inboundBundleVec.shrink_to_fit();
        return;
    }

    std::vector<uint8_t> ackVec;
    TcpclV4::GenerateAckSegment(ackVec, isStartFlag, isEndFlag, transferId, m_inboundBundleVec.size());
    SendMessage_NotThreadSafe(std::move(ackVec), &m_handleTcpSendCallback);

    bool changed;
    TCPCLV4_SESSION_STATE newState;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (isEndFlag) {
            m_inboundTransferActive = false;
            ++m_stats.m_totalBundlesReceived;
        }
        changed = UpdateTransferringState_Locked();
        newState = m_state;
    }
    if (changed) {
        NotifyStateChanged(newState);
    }
    if (isEndFlag) {
        std::vector<uint8_t> wholeBundleVec;
        wholeBundleVec.swap(m_inboundBundleVec);
        if (m_wholeBundleReadyCallback) {
            m_wholeBundleReadyCallback(wholeBundleVec, *this);
        }
    }
}

void TcpclV4Session::AckCallback(bool isStartSegment, bool isEndSegment, uint64_t transferId, uint64_t totalBytesAcknowledged) {
    (void)isStartSegment;
    bool found;
    bool finished = false;
    bool wasAcked = false;
    bool changed = false;
    TCPCLV4_SESSION_STATE newState;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        std::map<uint64_t, outbound_transfer_t>::iterator it = m_outboundTransfersMap.find(transferId);
        found = (it != m_outboundTransfersMap.end());
        if (found) {
            ++m_stats.m_totalSegmentsAcked;
            outbound_transfer_t & transfer = it->second;
            if (transfer.numSegmentsUnacked) {
                --transfer.numSegmentsUnacked;
                --m_numUnackedSegments;
            }
            transfer.bytesAcked = totalBytesAcknowledged;
            if (isEndSegment) {
                finished = true;
                wasAcked = (totalBytesAcknowledged == transfer.totalLength);
                m_numUnackedSegments -= transfer.numSegmentsUnacked;
                m_outboundTransfersMap.erase(it);
                if (wasAcked) {
                    ++m_stats.m_totalBundlesAcked;
                }
                changed = UpdateTransferringState_Locked();
            }
        }
        newState = m_state;
    }
    m_cv.notify_all();
    if (!found) {
        LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received XFER_ACK for unknown transfer " << transferId;
        return;
    }
    if (finished) {
        if (!wasAcked) {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " final XFER_ACK for transfer " << transferId
                << " acknowledged " << totalBytesAcknowledged << " bytes, not the full length";
        }
        if (m_outboundTransferFinishedCallback) {
            m_outboundTransferFinishedCallback(transferId, wasAcked, *this);
        }
    }
    if (changed) {
        NotifyStateChanged(newState);
    }
}

void TcpclV4Session::BundleRefusalCallback(TCPCLV4_TRANSFER_REFUSE_REASON_CODES refusalCode, uint64_t transferId) {
    bool found;
    bool changed = false;
    TCPCLV4_SESSION_STATE newState;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        std::map<uint64_t, outbound_transfer_t>::iterator it = m_outboundTransfersMap.find(transferId);
        found = (it != m_outboundTransfersMap.end());
        if (found) {
            m_numUnackedSegments -= it->second.numSegmentsUnacked;
            m_outboundTransfersMap.erase(it);
            ++m_stats.m_totalTransfersRefused;
            changed = UpdateTransferringState_Locked();
        }
        newState = m_state;
    }
    m_cv.notify_all();
    if (!found) {
        LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received XFER_REFUSE for unknown transfer " << transferId;
        return;
    }
    LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " peer refused transfer " << transferId << " with reason " << refusalCode;
    if (m_outboundTransferFinishedCallback) {
        m_outboundTransferFinishedCallback(transferId, false, *this);
    }
    if (changed) {
        NotifyStateChanged(newState);
    }
}

void TcpclV4Session::MessageRejectCallback(TCPCLV4_MESSAGE_REJECT_REASON_CODES refusalCode, uint8_t rejectedMessageType) {
    {
        boost::mutex::scoped_lock lock(m_mutex);
        ++m_stats.m_totalMessagesRejected;
    }
    LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " peer rejected message type "
        << static_cast<unsigned int>(rejectedMessageType) << " with reason " << refusalCode;
}

void TcpclV4Session::KeepAliveCallback() {
    LOG_DEBUG(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received keepalive";
}

void TcpclV4Session::SessionTerminationMessageCallback(TCPCLV4_SESSION_TERMINATION_REASON_CODES terminationReasonCode, bool isAckOfAnEarlierSessionTerminationMessage) {
    if (isAckOfAnEarlierSessionTerminationMessage) {
        LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " received SESS_TERM reply (reason " << terminationReasonCode << ")";
        DoClose_NotThreadSafe(BP7_ERROR_CODE::NONE);
        return;
    }
    LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " peer is terminating the session (reason " << terminationReasonCode << ")";
    bool changed;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (IsClosedState(m_state)) {
            return;
        }
        changed = SetState_Locked(TCPCLV4_SESSION_STATE::TERMINATING);
    }
    m_needToSendKeepAliveMessageTimer.cancel();
    m_noKeepAlivePacketReceivedTimer.cancel();
    std::vector<uint8_t> replyVec;
    TcpclV4::GenerateSessionTerminationMessage(replyVec, terminationReasonCode, true);
    SendMessage_NotThreadSafe(std::move(replyVec), &m_handleTcpSendSessionTerminationReplyCallback);
    if (changed) {
        NotifyStateChanged(TCPCLV4_SESSION_STATE::TERMINATING);
    }
}

void TcpclV4Session::InvalidMessageCallback(uint8_t messageTypeByte, TCPCLV4_MESSAGE_REJECT_REASON_CODES rejectReason) {
    SendMessageRejection_NotThreadSafe(rejectReason, messageTypeByte);
}

void TcpclV4Session::RefuseInboundTransfer_NotThreadSafe(TCPCLV4_TRANSFER_REFUSE_REASON_CODES refusalCode, uint64_t transferId) {
    m_hasRefusedInboundTransfer = true;
    m_lastRefusedInboundTransferId = transferId;
    bool changed;
    TCPCLV4_SESSION_STATE newState;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        ++m_stats.m_totalTransfersRefused;
        if (transferId == m_inboundTransferId) {
            m_inboundTransferActive = false;
        }
        changed = UpdateTransferringState_Locked();
        newState = m_state;
    }
    LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " refusing inbound transfer " << transferId << " with reason " << refusalCode;
    std::vector<uint8_t> refusalVec;
    TcpclV4::GenerateBundleRefusal(refusalVec, refusalCode, transferId);
    SendMessage_NotThreadSafe(std::move(refusalVec), &m_handleTcpSendCallback);
    if (changed) {
        NotifyStateChanged(newState);
    }
}

void TcpclV4Session::SendMessageRejection_NotThreadSafe(TCPCLV4_MESSAGE_REJECT_REASON_CODES rejectionCode, uint8_t rejectedMessageType) {
    LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " rejecting message type "
        << static_cast<unsigned int>(rejectedMessageType) << " with reason " << rejectionCode;
    std::vector<uint8_t> rejectionVec;
    TcpclV4::GenerateMessageRejection(rejectionVec, rejectionCode, rejectedMessageType);
    SendMessage_NotThreadSafe(std::move(rejectionVec), &m_handleTcpSendCallback);
}

bool TcpclV4Session::SendBundle(const std::vector<uint8_t> & bundleVec, uint64_t & transferId, BP7_ERROR_CODE & errorCode) {
    return SendBundle(bundleVec.data(), bundleVec.size(), transferId, errorCode);
}

bool TcpclV4Session::SendBundle(const uint8_t * bundleData, std::size_t bundleSize, uint64_t & transferId, BP7_ERROR_CODE & errorCode) {
    boost::mutex::scoped_lock sendLock(m_sendBundleMutex);
    uint64_t maxSegmentDataBytes;
    bool changed;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (!IsUsableState(m_state)) {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " cannot send a bundle in state " << m_state;
            errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
            return false;
        }
        if (bundleSize > m_remoteTransferMru) {
            LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " bundle of " << bundleSize
                << " bytes exceeds the peer's transfer MRU of " << m_remoteTransferMru << " bytes";
            errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
            return false;
        }
        transferId = m_nextTransferId++;
        outbound_transfer_t & transfer = m_outboundTransfersMap[transferId];
        transfer.totalLength = bundleSize;
        transfer.bytesAcked = 0;
        transfer.numSegmentsUnacked = 0;
        ++m_stats.m_totalBundlesSent;
        maxSegmentDataBytes = m_remoteSegmentMru;
        changed = UpdateTransferringState_Locked();
    }
    if (changed) {
        boost::asio::post(m_ioServiceRef, boost::bind(&TcpclV4Session::NotifyStateChanged, this, TCPCLV4_SESSION_STATE::TRANSFERRING));
    }

    std::vector<std::vector<uint8_t> > dataSegmentsVec;
    TcpclV4::GenerateDataSegments(dataSegmentsVec, transferId, bundleData, bundleSize, maxSegmentDataBytes);
    const uint64_t windowSize = std::max<uint64_t>(M_CONFIG.m_maxUnackedSegments, 1);
    for (std::size_t i = 0; i < dataSegmentsVec.size(); ++i) {
        {
            boost::mutex::scoped_lock lock(m_mutex);
            while ((m_numUnackedSegments >= windowSize) && IsUsableState(m_state)) {
                m_cv.wait(lock);
            }
            if (!IsUsableState(m_state)) {
                LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " session left the established state during transfer " << transferId;
                errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
                return false;
            }
            std::map<uint64_t, outbound_transfer_t>::iterator it = m_outboundTransfersMap.find(transferId);
            if (it == m_outboundTransfersMap.end()) {
                //refused by the peer part way through, already reported through the finished callback
                LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " stopped sending refused transfer " << transferId;
                return true;
            }
            ++it->second.numSegmentsUnacked;
            ++m_numUnackedSegments;
        }
        TcpAsyncSenderElement * el = new TcpAsyncSenderElement();
        el->m_underlyingDataVecBundle = std::move(dataSegmentsVec[i]);
        el->m_constBufferVec.emplace_back(boost::asio::buffer(el->m_underlyingDataVecBundle));
        el->m_onSuccessfulSendCallbackByIoServiceThreadPtr = &m_handleTcpSendCallback;
        m_tcpAsyncSenderPtr->AsyncSend_ThreadSafe(el);
    }
    errorCode = BP7_ERROR_CODE::NONE;
    return true;
}

void TcpclV4Session::RestartNoKeepaliveReceivedTimer() {
    //the peer must send something (data or KEEPALIVE) at least every negotiated interval
    const boost::posix_time::time_duration allowedSilence = boost::posix_time::seconds(2 * static_cast<long>(m_negotiatedKeepAliveIntervalSeconds));
    const boost::posix_time::ptime expiry = m_lastDataReceivedTime + allowedSilence;
    m_noKeepAlivePacketReceivedTimer.expires_at(expiry);
    m_noKeepAlivePacketReceivedTimer.async_wait(boost::bind(&TcpclV4Session::OnNoKeepAlivePacketReceived_TimerExpired, this,
        boost::asio::placeholders::error));
}

void TcpclV4Session::OnNoKeepAlivePacketReceived_TimerExpired(const boost::system::error_code& e) {
    if (e == boost::asio::error::operation_aborted) {
        // Timer was cancelled
        return;
    }
    if (GetState() == TCPCLV4_SESSION_STATE::TERMINATING || IsClosed()) {
        return;
    }
    const boost::posix_time::time_duration allowedSilence = boost::posix_time::seconds(2 * static_cast<long>(m_negotiatedKeepAliveIntervalSeconds));
    const boost::posix_time::ptime nowTime = boost::posix_time::microsec_clock::universal_time();
    if ((nowTime - m_lastDataReceivedTime) < allowedSilence) {
        RestartNoKeepaliveReceivedTimer();
    }
    else {
        LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " nothing received for " << allowedSilence.total_seconds()
            << " seconds, closing the session";
        DoClose_NotThreadSafe(BP7_ERROR_CODE::KEEPALIVE_TIMEOUT);
    }
}

void TcpclV4Session::RestartNeedToSendKeepAliveMessageTimer() {
    m_needToSendKeepAliveMessageTimer.expires_from_now(boost::posix_time::seconds(m_negotiatedKeepAliveIntervalSeconds));
    m_needToSendKeepAliveMessageTimer.async_wait(boost::bind(&TcpclV4Session::OnNeedToSendKeepAliveMessage_TimerExpired, this,
        boost::asio::placeholders::error));
}

void TcpclV4Session::OnNeedToSendKeepAliveMessage_TimerExpired(const boost::system::error_code& e) {
    if (e == boost::asio::error::operation_aborted) {
        // Timer was cancelled
        return;
    }
    if (!IsUsableState(GetState())) {
        return;
    }
    //a data segment sent within the last interval already counts as a keepalive
    if (!m_dataSentServedAsKeepaliveSent.exchange(false)) {
        LOG_DEBUG(subprocess) << "TcpclV4Session " << M_SESSION_ID << " sending keepalive";
        std::vector<uint8_t> keepAliveVec;
        TcpclV4::GenerateKeepAliveMessage(keepAliveVec);
        SendMessage_NotThreadSafe(std::move(keepAliveVec), &m_handleTcpSendCallback);
    }
    RestartNeedToSendKeepAliveMessageTimer();
}

void TcpclV4Session::OnContactNegotiation_TimerExpired(const boost::system::error_code& e) {
    if (e == boost::asio::error::operation_aborted) {
        // Timer was cancelled
        return;
    }
    if (GetState() == TCPCLV4_SESSION_STATE::CONTACT_NEGOTIATION) {
        LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " contact negotiation did not complete within "
            << M_CONFIG.m_contactNegotiationTimeoutMilliseconds << " ms";
        DoClose_NotThreadSafe(BP7_ERROR_CODE::CONTACT_HEADER_MISMATCH);
    }
}

void TcpclV4Session::OnWaitForSessionTerminationAckTimeout_TimerExpired(const boost::system::error_code& e) {
    if (e == boost::asio::error::operation_aborted) {
        // Timer was cancelled
        return;
    }
    LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " no SESS_TERM reply received within "
        << M_CONFIG.m_sessionTerminationAckTimeoutMilliseconds << " ms, closing";
    DoClose_NotThreadSafe(BP7_ERROR_CODE::NONE);
}

void TcpclV4Session::Terminate(TCPCLV4_SESSION_TERMINATION_REASON_CODES reasonCode) {
    boost::asio::post(m_ioServiceRef, boost::bind(&TcpclV4Session::DoTerminate_NotThreadSafe, this, reasonCode));
}

void TcpclV4Session::Close() {
    boost::asio::post(m_ioServiceRef, boost::bind(&TcpclV4Session::DoClose_NotThreadSafe, this, BP7_ERROR_CODE::NONE));
}

void TcpclV4Session::DoTerminate_NotThreadSafe(TCPCLV4_SESSION_TERMINATION_REASON_CODES reasonCode) {
    TCPCLV4_SESSION_STATE state;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        state = m_state;
        if (IsUsableState(state)) {
            SetState_Locked(TCPCLV4_SESSION_STATE::TERMINATING);
        }
    }
    if (IsClosedState(state) || (state == TCPCLV4_SESSION_STATE::TERMINATING)) {
        return;
    }
    if (!IsUsableState(state)) {
        //nothing negotiated yet, there is no session to terminate
        DoClose_NotThreadSafe(BP7_ERROR_CODE::NONE);
        return;
    }
    LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " terminating session (reason " << reasonCode << ")";
    m_needToSendKeepAliveMessageTimer.cancel();
    m_noKeepAlivePacketReceivedTimer.cancel();
    std::vector<uint8_t> sessTermVec;
    TcpclV4::GenerateSessionTerminationMessage(sessTermVec, reasonCode, false);
    SendMessage_NotThreadSafe(std::move(sessTermVec), &m_handleTcpSendCallback);
    m_waitForSessionTerminationAckTimeoutTimer.expires_from_now(boost::posix_time::milliseconds(M_CONFIG.m_sessionTerminationAckTimeoutMilliseconds));
    m_waitForSessionTerminationAckTimeoutTimer.async_wait(boost::bind(&TcpclV4Session::OnWaitForSessionTerminationAckTimeout_TimerExpired, this,
        boost::asio::placeholders::error));
    NotifyStateChanged(TCPCLV4_SESSION_STATE::TERMINATING);
}

void TcpclV4Session::DoClose_NotThreadSafe(BP7_ERROR_CODE closeErrorCode) {
    std::map<uint64_t, outbound_transfer_t> failedTransfersMap;
    TCPCLV4_SESSION_STATE newState;
    {
        boost::mutex::scoped_lock lock(m_mutex);
        if (IsClosedState(m_state)) {
            return;
        }
        m_closeErrorCode = closeErrorCode;
        newState = (closeErrorCode == BP7_ERROR_CODE::NONE) ? TCPCLV4_SESSION_STATE::CLOSED_CLEAN : TCPCLV4_SESSION_STATE::CLOSED_ERROR;
        SetState_Locked(newState);
        failedTransfersMap.swap(m_outboundTransfersMap);
        m_numUnackedSegments = 0;
        m_inboundTransferActive = false;
        m_sessionEndTime = boost::posix_time::microsec_clock::universal_time();
    }

    //stop the rx state machine from calling back for bytes remaining in the current read
    m_tcpclV4RxStateMachine.m_mainRxState = TCPCLV4_MAIN_RX_STATE::DISCARD_ALL;
    m_inboundBundleVec.clear();

    boost::system::error_code ec;
    m_needToSendKeepAliveMessageTimer.cancel(ec);
    m_noKeepAlivePacketReceivedTimer.cancel(ec);
    m_contactNegotiationTimer.cancel(ec);
    m_waitForSessionTerminationAckTimeoutTimer.cancel(ec);
    m_resolver.cancel();
    if (m_tcpSocketPtr && m_tcpSocketPtr->is_open()) {
        m_tcpSocketPtr->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        if (ec) {
            LOG_DEBUG(subprocess) << "TcpclV4Session " << M_SESSION_ID << " shutdown: " << ec.message();
        }
        m_tcpSocketPtr->close(ec);
        if (ec) {
            LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " error closing socket: " << ec.message();
        }
    }

    if (closeErrorCode == BP7_ERROR_CODE::NONE) {
        LOG_INFO(subprocess) << "TcpclV4Session " << M_SESSION_ID << " closed cleanly";
    }
    else {
        LOG_ERROR(subprocess) << "TcpclV4Session " << M_SESSION_ID << " closed with error " << closeErrorCode;
    }

    for (std::map<uint64_t, outbound_transfer_t>::const_iterator it = failedTransfersMap.cbegin(); it != failedTransfersMap.cend(); ++it) {
        LOG_WARNING(subprocess) << "TcpclV4Session " << M_SESSION_ID << " transfer " << it->first << " failed, "
            << it->second.bytesAcked << " of " << it->second.totalLength << " bytes acknowledged";
        if (m_outboundTransferFinishedCallback) {
            m_outboundTransferFinishedCallback(it->first, false, *this);
        }
    }
    NotifyStateChanged(newState);
}

bool TcpclV4Session::SetState_Locked(TCPCLV4_SESSION_STATE newState) {
    if (m_state == newState) {
        return false;
    }
    LOG_DEBUG(subprocess) << "TcpclV4Session " << M_SESSION_ID << " state " << m_state << " -> " << newState;
    m_state = newState;
    m_cv.notify_all();
    return true;
}

bool TcpclV4Session::UpdateTransferringState_Locked() {
    const bool busy = m_inboundTransferActive || (!m_outboundTransfersMap.empty());
    if ((m_state == TCPCLV4_SESSION_STATE::ESTABLISHED) && busy) {
        return SetState_Locked(TCPCLV4_SESSION_STATE::TRANSFERRING);
    }
    if ((m_state == TCPCLV4_SESSION_STATE::TRANSFERRING) && (!busy)) {
        return SetState_Locked(TCPCLV4_SESSION_STATE::ESTABLISHED);
    }
    return false;
}

void TcpclV4Session::NotifyStateChanged(TCPCLV4_SESSION_STATE newState) {
    if (m_sessionStateChangedCallback) {
        m_sessionStateChangedCallback(newState, *this);
    }
}

bool TcpclV4Session::WaitForClosed(const boost::posix_time::time_duration & timeout) {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_cv.timed_wait(lock, timeout, [this]() { return IsClosedState(m_state); });
}

bool TcpclV4Session::WaitForEstablished(const boost::posix_time::time_duration & timeout) {
    boost::mutex::scoped_lock lock(m_mutex);
    m_cv.timed_wait(lock, timeout, [this]() { return IsUsableState(m_state) || IsClosedState(m_state); });
    return IsUsableState(m_state);
}

bool TcpclV4Session::WaitForAllTransfersFinished(const boost::posix_time::time_duration & timeout) {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_cv.timed_wait(lock, timeout, [this]() { return m_outboundTransfersMap.empty() || IsClosedState(m_state); });
}

TCPCLV4_SESSION_STATE TcpclV4Session::GetState() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_state;
}
bool TcpclV4Session::IsEstablished() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return IsUsableState(m_state);
}
bool TcpclV4Session::IsClosed() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return IsClosedState(m_state);
}
BP7_ERROR_CODE TcpclV4Session::GetCloseErrorCode() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_closeErrorCode;
}
std::string TcpclV4Session::GetRemoteNodeEidUri() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_remoteNodeEidUri;
}
uint16_t TcpclV4Session::GetNegotiatedKeepAliveIntervalSeconds() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_negotiatedKeepAliveIntervalSeconds;
}
uint64_t TcpclV4Session::GetRemoteSegmentMru() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_remoteSegmentMru;
}
uint64_t TcpclV4Session::GetRemoteTransferMru() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_remoteTransferMru;
}
uint64_t TcpclV4Session::GetSessionId() const {
    return M_SESSION_ID;
}
bool TcpclV4Session::IsActiveEntity() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_isActiveEntity;
}
TcpclV4SessionStats TcpclV4Session::GetStats() const {
    boost::mutex::scoped_lock lock(m_mutex);
    TcpclV4SessionStats stats(m_stats);
    if (!m_sessionStartTime.is_not_a_date_time()) {
        const boost::posix_time::ptime endTime = IsClosedState(m_state) ?
            m_sessionEndTime : boost::posix_time::microsec_clock::universal_time();
        stats.m_elapsedSessionMilliseconds = static_cast<uint64_t>((endTime - m_sessionStartTime).total_milliseconds());
    }
    return stats;
}

void TcpclV4Session::SetWholeBundleReadyCallback(const WholeBundleReadyCallback_t & callback) {
    m_wholeBundleReadyCallback = callback;
}
void TcpclV4Session::SetOutboundTransferFinishedCallback(const OutboundTransferFinishedCallback_t & callback) {
    m_outboundTransferFinishedCallback = callback;
}
void TcpclV4Session::SetSessionStateChangedCallback(const SessionStateChangedCallback_t & callback) {
    m_sessionStateChangedCallback = callback;
}
