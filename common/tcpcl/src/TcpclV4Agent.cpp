/**
 * @file TcpclV4Agent.cpp
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

#include "TcpclV4Agent.h"
#include "Logger.h"
#include "codec/EndpointId.h"
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::tcpcl;

constexpr uint16_t TcpclV4Agent::DEFAULT_PORT;

TcpclV4Agent::TcpclV4Agent(const TcpclV4SessionConfig & sessionConfig) :
    M_SESSION_CONFIG(sessionConfig),
    m_tcpAcceptor(m_ioService),
    m_boundPort(0),
    m_running(false),
    m_nextSessionId(0)
{
}

TcpclV4Agent::~TcpclV4Agent() {
    Stop();
}

bool TcpclV4Agent::Start(bool doListen, uint16_t listenPort, BP7_ERROR_CODE & errorCode) {
    if (m_running) {
        LOG_ERROR(subprocess) << "TcpclV4Agent already started";
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    if (doListen) {
        const boost::asio::ip::tcp::endpoint listenEndpoint(boost::asio::ip::tcp::v4(), listenPort);
        boost::system::error_code ec;
        m_tcpAcceptor.open(listenEndpoint.protocol(), ec);
        if (!ec) {
            m_tcpAcceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
        }
        if (!ec) {
            m_tcpAcceptor.bind(listenEndpoint, ec);
        }
        if (!ec) {
            m_tcpAcceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
        }
        if (!ec) {
            m_boundPort = m_tcpAcceptor.local_endpoint(ec).port();
        }
        if (ec) {
            LOG_ERROR(subprocess) << "TcpclV4Agent unable to listen on port " << listenPort << ": " << ec.message();
            boost::system::error_code ecClose;
            m_tcpAcceptor.close(ecClose);
            errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
            return false;
        }
        StartTcpAccept();
    }
    m_workPtr = boost::make_unique<boost::asio::io_service::work>(m_ioService);
    m_ioServiceThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService));
    m_running = true;
    errorCode = BP7_ERROR_CODE::NONE;
    return true;
}

void TcpclV4Agent::Stop() {
    if (!m_running) {
        return;
    }
    m_running = false;
    const std::vector<std::shared_ptr<TcpclV4Session> > sessions = GetSessions();
    for (std::size_t i = 0; i < sessions.size(); ++i) {
        sessions[i]->Terminate();
    }
    const boost::posix_time::time_duration terminateTimeout =
        boost::posix_time::milliseconds(M_SESSION_CONFIG.m_sessionTerminationAckTimeoutMilliseconds + 1000);
    for (std::size_t i = 0; i < sessions.size(); ++i) {
        if (!sessions[i]->WaitForClosed(terminateTimeout)) {
            LOG_WARNING(subprocess) << "TcpclV4Agent session " << sessions[i]->GetSessionId() << " did not terminate, closing it";
            sessions[i]->Close();
            sessions[i]->WaitForClosed(boost::posix_time::seconds(1));
        }
    }
    boost::asio::post(m_ioService, [this]() {
        if (m_tcpAcceptor.is_open()) {
            boost::system::error_code ec;
            m_tcpAcceptor.close(ec);
            if (ec) {
                LOG_ERROR(subprocess) << "TcpclV4Agent error closing the acceptor: " << ec.message();
            }
        }
    });
    m_workPtr.reset();
    if (m_ioServiceThreadPtr) {
        m_ioServiceThreadPtr->join();
        m_ioServiceThreadPtr.reset(); //delete it
    }
    //io_service thread is gone, so no handler can reference a session any more
    {
        boost::mutex::scoped_lock lock(m_sessionsMutex);
        m_sessionsList.clear();
    }
    m_ioService.restart();
    LOG_INFO(subprocess) << "TcpclV4Agent stopped";
}

void TcpclV4Agent::StartTcpAccept() {
    LOG_INFO(subprocess) << "waiting for tcpclv4 tcp connections on port " << m_boundPort;
    std::shared_ptr<boost::asio::ip::tcp::socket> newTcpSocketPtr = std::make_shared<boost::asio::ip::tcp::socket>(m_ioService);
    m_tcpAcceptor.async_accept(*newTcpSocketPtr,
        boost::bind(&TcpclV4Agent::HandleTcpAccept, this, newTcpSocketPtr, boost::asio::placeholders::error));
}

void TcpclV4Agent::HandleTcpAccept(std::shared_ptr<boost::asio::ip::tcp::socket> & newTcpSocketPtr, const boost::system::error_code & error) {
    if (!error) {
        boost::system::error_code ec;
        const boost::asio::ip::tcp::endpoint remoteEndpoint = newTcpSocketPtr->remote_endpoint(ec);
        LOG_INFO(subprocess) << "tcpclv4 tcp connection: " << remoteEndpoint.address() << ":" << remoteEndpoint.port();
        std::shared_ptr<TcpclV4Session> sessionPtr = CreateSession();
        sessionPtr->StartPassive(newTcpSocketPtr);
        StartTcpAccept(); //only accept if there was no error
    }
    else if (error != boost::asio::error::operation_aborted) {
        LOG_ERROR(subprocess) << "tcp accept error: " << error.message();
    }
}

std::shared_ptr<TcpclV4Session> TcpclV4Agent::CreateSession() {
    boost::mutex::scoped_lock lock(m_sessionsMutex);
    std::shared_ptr<TcpclV4Session> sessionPtr = std::make_shared<TcpclV4Session>(m_ioService, M_SESSION_CONFIG, m_nextSessionId++);
    sessionPtr->SetWholeBundleReadyCallback(boost::bind(&TcpclV4Agent::OnWholeBundleReady, this,
        boost::placeholders::_1, boost::placeholders::_2));
    sessionPtr->SetOutboundTransferFinishedCallback(boost::bind(&TcpclV4Agent::OnOutboundTransferFinished, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3));
    sessionPtr->SetSessionStateChangedCallback(boost::bind(&TcpclV4Agent::OnSessionStateChanged, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_sessionsList.push_back(sessionPtr);
    return sessionPtr;
}

std::shared_ptr<TcpclV4Session> TcpclV4Agent::Connect(const std::string & hostname, uint16_t port) {
    if (!m_running) {
        LOG_ERROR(subprocess) << "TcpclV4Agent::Connect called before Start";
        return std::shared_ptr<TcpclV4Session>();
    }
    std::shared_ptr<TcpclV4Session> sessionPtr = CreateSession();
    sessionPtr->StartActive(hostname, port);
    return sessionPtr;
}

std::shared_ptr<TcpclV4Session> TcpclV4Agent::GetEstablishedSessionToNode(const std::string & nodeEidUri) const {
    EndpointId wantedEid;
    BP7_ERROR_CODE errorCode;
    if (!EndpointId::Parse(nodeEidUri, wantedEid, errorCode)) {
        LOG_ERROR(subprocess) << "TcpclV4Agent cannot look up a session for invalid node id " << nodeEidUri;
        return std::shared_ptr<TcpclV4Session>();
    }
    boost::mutex::scoped_lock lock(m_sessionsMutex);
    for (std::list<std::shared_ptr<TcpclV4Session> >::const_iterator it = m_sessionsList.cbegin(); it != m_sessionsList.cend(); ++it) {
        if (!(*it)->IsEstablished()) {
            continue;
        }
        EndpointId remoteEid;
        if (EndpointId::Parse((*it)->GetRemoteNodeEidUri(), remoteEid, errorCode) && remoteEid.IsSameNode(wantedEid)) {
            return *it;
        }
    }
    return std::shared_ptr<TcpclV4Session>();
}

std::vector<std::shared_ptr<TcpclV4Session> > TcpclV4Agent::GetSessions() const {
    boost::mutex::scoped_lock lock(m_sessionsMutex);
    return std::vector<std::shared_ptr<TcpclV4Session> >(m_sessionsList.cbegin(), m_sessionsList.cend());
}

std::size_t TcpclV4Agent::GetNumSessions() const {
    boost::mutex::scoped_lock lock(m_sessionsMutex);
    return m_sessionsList.size();
}

std::size_t TcpclV4Agent::RemoveClosedSessions() {
    std::list<std::shared_ptr<TcpclV4Session> > removedSessions;
    {
        boost::mutex::scoped_lock lock(m_sessionsMutex);
        for (std::list<std::shared_ptr<TcpclV4Session> >::iterator it = m_sessionsList.begin(); it != m_sessionsList.end(); ) {
            if ((*it)->IsClosed()) {
                std::list<std::shared_ptr<TcpclV4Session> >::iterator itNext = std::next(it);
                removedSessions.splice(removedSessions.end(), m_sessionsList, it);
                it = itNext;
            }
            else {
                ++it;
            }
        }
    }
    const std::size_t numRemoved = removedSessions.size();
    if (numRemoved && m_running) {
        //a closed session may still have an aborted handler queued, so release it from the io_service thread
        boost::asio::post(m_ioService, [removedSessions]() {});
    }
    return numRemoved;
}

uint16_t TcpclV4Agent::GetBoundPort() const {
    return m_boundPort;
}

const TcpclV4SessionConfig & TcpclV4Agent::GetSessionConfig() const {
    return M_SESSION_CONFIG;
}

void TcpclV4Agent::SetWholeBundleReadyCallback(const TcpclV4Session::WholeBundleReadyCallback_t & callback) {
    m_wholeBundleReadyCallback = callback;
}
void TcpclV4Agent::SetOutboundTransferFinishedCallback(const TcpclV4Session::OutboundTransferFinishedCallback_t & callback) {
    m_outboundTransferFinishedCallback = callback;
}
void TcpclV4Agent::SetSessionStateChangedCallback(const TcpclV4Session::SessionStateChangedCallback_t & callback) {
    m_sessionStateChangedCallback = callback;
}

void TcpclV4Agent::OnWholeBundleReady(std::vector<uint8_t> & wholeBundleVec, TcpclV4Session & session) {
    if (m_wholeBundleReadyCallback) {
        m_wholeBundleReadyCallback(wholeBundleVec, session);
    }
    else {
        LOG_WARNING(subprocess) << "TcpclV4Agent dropping a " << wholeBundleVec.size() << " byte bundle, no receiver";
    }
}

void TcpclV4Agent::OnOutboundTransferFinished(uint64_t transferId, bool wasAcked, TcpclV4Session & session) {
    if (m_outboundTransferFinishedCallback) {
        m_outboundTransferFinishedCallback(transferId, wasAcked, session);
    }
}

void TcpclV4Agent::OnSessionStateChanged(TCPCLV4_SESSION_STATE newState, TcpclV4Session & session) {
    LOG_INFO(subprocess) << "TcpclV4Agent session " << session.GetSessionId() << " is now " << newState;
    if (m_sessionStateChangedCallback) {
        m_sessionStateChangedCallback(newState, session);
    }
}
