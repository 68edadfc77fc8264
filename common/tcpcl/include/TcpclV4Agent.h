/**
 * @file TcpclV4Agent.h
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
 * The TcpclV4Agent class owns the io_service thread, the optional listening acceptor
 * and every TcpclV4Session of a node, both the ones it accepted (passive) and the ones it
 * opened with Connect (active).  Session callbacks are forwarded to the agent's callbacks
 * and always run on the agent's io_service thread.
 */

#ifndef TCPCLV4_AGENT_H
#define TCPCLV4_AGENT_H 1

#include <string>
#include <vector>
#include <list>
#include <memory>
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include "TcpclV4Session.h"
#include "Bp7ErrorCodes.h"
#include "tcpcl_lib_export.h"

class TcpclV4Agent {
private:
    TcpclV4Agent();
public:
    static constexpr uint16_t DEFAULT_PORT = 4556;

    TCPCL_LIB_EXPORT TcpclV4Agent(const TcpclV4SessionConfig & sessionConfig);
    TCPCL_LIB_EXPORT ~TcpclV4Agent();

    /** Start the io_service thread.
     *
     * @param doListen When true, accept passive sessions on listenPort (0 picks an ephemeral port, see GetBoundPort).
     * @return True on success, or False with errorCode set to INVALID_ARGUMENT if the port could not be bound.
     */
    TCPCL_LIB_EXPORT bool Start(bool doListen, uint16_t listenPort, BP7_ERROR_CODE & errorCode);
    /// Terminate every session, then stop and join the io_service thread.  Safe to call more than once.
    TCPCL_LIB_EXPORT void Stop();

    /// Open an active session.  The returned session is still connecting; use WaitForEstablished.
    TCPCL_LIB_EXPORT std::shared_ptr<TcpclV4Session> Connect(const std::string & hostname, uint16_t port);

    /// The first established session whose peer node id belongs to the same node as nodeEidUri, or null.
    TCPCL_LIB_EXPORT std::shared_ptr<TcpclV4Session> GetEstablishedSessionToNode(const std::string & nodeEidUri) const;
    TCPCL_LIB_EXPORT std::vector<std::shared_ptr<TcpclV4Session> > GetSessions() const;
    TCPCL_LIB_EXPORT std::size_t GetNumSessions() const;
    /// Forget sessions that reached CLOSED_CLEAN or CLOSED_ERROR.
    TCPCL_LIB_EXPORT std::size_t RemoveClosedSessions();

    TCPCL_LIB_EXPORT uint16_t GetBoundPort() const;
    TCPCL_LIB_EXPORT const TcpclV4SessionConfig & GetSessionConfig() const;

    TCPCL_LIB_EXPORT void SetWholeBundleReadyCallback(const TcpclV4Session::WholeBundleReadyCallback_t & callback);
    TCPCL_LIB_EXPORT void SetOutboundTransferFinishedCallback(const TcpclV4Session::OutboundTransferFinishedCallback_t & callback);
    TCPCL_LIB_EXPORT void SetSessionStateChangedCallback(const TcpclV4Session::SessionStateChangedCallback_t & callback);

private:
    TCPCL_LIB_EXPORT void StartTcpAccept();
    TCPCL_LIB_EXPORT void HandleTcpAccept(std::shared_ptr<boost::asio::ip::tcp::socket> & newTcpSocketPtr, const boost::system::error_code & error);
    TCPCL_LIB_EXPORT std::shared_ptr<TcpclV4Session> CreateSession();
    TCPCL_LIB_EXPORT void OnWholeBundleReady(std::vector<uint8_t> & wholeBundleVec, TcpclV4Session & session);
    TCPCL_LIB_EXPORT void OnOutboundTransferFinished(uint64_t transferId, bool wasAcked, TcpclV4Session & session);
    TCPCL_LIB_EXPORT void OnSessionStateChanged(TCPCLV4_SESSION_STATE newState, TcpclV4Session & session);

    const TcpclV4SessionConfig M_SESSION_CONFIG;
    boost::asio::io_service m_ioService;
    boost::asio::ip::tcp::acceptor m_tcpAcceptor;
    std::unique_ptr<boost::asio::io_service::work> m_workPtr;
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    uint16_t m_boundPort;
    bool m_running;

    mutable boost::mutex m_sessionsMutex;
    std::list<std::shared_ptr<TcpclV4Session> > m_sessionsList;
    uint64_t m_nextSessionId;

    TcpclV4Session::WholeBundleReadyCallback_t m_wholeBundleReadyCallback;
    TcpclV4Session::OutboundTransferFinishedCallback_t m_outboundTransferFinishedCallback;
    TcpclV4Session::SessionStateChangedCallback_t m_sessionStateChangedCallback;
};

#endif //TCPCLV4_AGENT_H
