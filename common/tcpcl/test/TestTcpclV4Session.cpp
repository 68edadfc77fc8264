/**
 * @file TestTcpclV4Session.cpp
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

#include <boost/test/unit_test.hpp>
#include "TcpclV4Agent.h"
#include "TcpclV4.h"
#include <boost/thread.hpp>
#include <boost/bind/bind.hpp>
#include <string>
#include <vector>

static const boost::posix_time::time_duration WAIT_TIMEOUT = boost::posix_time::seconds(5);

struct ReceivedBundles {
    boost::mutex m_mutex;
    boost::condition_variable m_cv;
    std::vector<std::vector<uint8_t> > m_bundles;
    std::vector<std::pair<uint64_t, bool> > m_finishedTransfers;

    void OnWholeBundleReady(std::vector<uint8_t> & wholeBundleVec, TcpclV4Session &) {
        boost::mutex::scoped_lock lock(m_mutex);
        m_bundles.push_back(std::move(wholeBundleVec));
        m_cv.notify_all();
    }
    void OnOutboundTransferFinished(uint64_t transferId, bool wasAcked, TcpclV4Session &) {
        boost::mutex::scoped_lock lock(m_mutex);
        m_finishedTransfers.emplace_back(transferId, wasAcked);
        m_cv.notify_all();
    }
    bool WaitForBundles(std::size_t count) {
        boost::mutex::scoped_lock lock(m_mutex);
        return m_cv.timed_wait(lock, WAIT_TIMEOUT, [this, count]() { return m_bundles.size() >= count; });
    }
    bool WaitForFinishedTransfers(std::size_t count) {
        boost::mutex::scoped_lock lock(m_mutex);
        return m_cv.timed_wait(lock, WAIT_TIMEOUT, [this, count]() { return m_finishedTransfers.size() >= count; });
    }
};

static TcpclV4SessionConfig MakeConfig(const std::string & nodeEidUri) {
    TcpclV4SessionConfig config;
    config.m_localNodeEidUri = nodeEidUri;
    config.m_keepAliveIntervalSeconds = 5;
    config.m_sessionTerminationAckTimeoutMilliseconds = 1000;
    return config;
}

/// A hand driven TCPCLv4 peer on a plain blocking socket, used to provoke protocol errors.
struct RawTcpclPeer {
    boost::asio::io_service m_ioService;
    boost::asio::ip::tcp::acceptor m_acceptor;
    boost::asio::ip::tcp::socket m_socket;
    TcpclV4 m_rx;
    bool m_contactHeaderReceived;
    bool m_sessionInitReceived;
    std::vector<std::pair<TCPCLV4_TRANSFER_REFUSE_REASON_CODES, uint64_t> > m_refusals;
    std::vector<std::pair<TCPCLV4_SESSION_TERMINATION_REASON_CODES, bool> > m_sessionTerminations;
    std::vector<std::pair<uint64_t, uint64_t> > m_acks;
    unsigned int m_numKeepAlives;

    RawTcpclPeer() :
        m_acceptor(m_ioService, boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)),
        m_socket(m_ioService),
        m_contactHeaderReceived(false),
        m_sessionInitReceived(false),
        m_numKeepAlives(0)
    {
        m_rx.SetContactHeaderReadCallback([this](bool isValidMagic, uint8_t version, uint8_t, uint16_t) {
            BOOST_REQUIRE(isValidMagic);
            BOOST_REQUIRE_EQUAL(version, 4);
            m_contactHeaderReceived = true;
        });
        m_rx.SetSessionInitReadCallback([this](uint16_t, uint64_t, uint64_t, const std::string &) {
            m_sessionInitReceived = true;
        });
        m_rx.SetBundleRefusalCallback([this](TCPCLV4_TRANSFER_REFUSE_REASON_CODES reason, uint64_t transferId) {
            m_refusals.emplace_back(reason, transferId);
        });
        m_rx.SetSessionTerminationMessageCallback([this](TCPCLV4_SESSION_TERMINATION_REASON_CODES reason, bool isReply) {
            m_sessionTerminations.emplace_back(reason, isReply);
        });
        m_rx.SetAckSegmentReadCallback([this](bool, bool, uint64_t transferId, uint64_t length) {
            m_acks.emplace_back(transferId, length);
        });
        m_rx.SetKeepAliveCallback([this]() { ++m_numKeepAlives; });
    }
    ~RawTcpclPeer() {
        boost::system::error_code ec;
        m_socket.close(ec);
    }
    uint16_t GetPort() const {
        return m_acceptor.local_endpoint().port();
    }
    void Accept() {
        m_acceptor.accept(m_socket);
    }
    void Write(const std::vector<uint8_t> & data) {
        boost::asio::write(m_socket, boost::asio::buffer(data));
    }
    /// Read and parse until the predicate holds. Returns false on eof or error.
    template <typename Predicate>
    bool ReadUntil(Predicate pred) {
        std::vector<uint8_t> buf(2000);
        while (!pred()) {
            boost::system::error_code ec;
            const std::size_t n = m_socket.read_some(boost::asio::buffer(buf), ec);
            if (ec) {
                return false;
            }
            m_rx.HandleReceivedChars(buf.data(), n);
        }
        return true;
    }
    /// Read until the peer closes the connection.
    void ReadUntilEof() {
        ReadUntil([]() { return false; });
    }
    void Handshake(uint16_t keepAliveSeconds, uint64_t segmentMru, uint64_t transferMru) {
        Accept();
        BOOST_REQUIRE(ReadUntil([this]() { return m_contactHeaderReceived; }));
        std::vector<uint8_t> msg;
        TcpclV4::GenerateContactHeader(msg, keepAliveSeconds);
        Write(msg);
        BOOST_REQUIRE(ReadUntil([this]() { return m_sessionInitReceived; }));
        TcpclV4::GenerateSessionInitMessage(msg, keepAliveSeconds, segmentMru, transferMru, "ipn:99.0");
        Write(msg);
    }
};

BOOST_AUTO_TEST_CASE(TcpclV4SessionLoopbackTestCase)
{
    ReceivedBundles receiverSide;
    ReceivedBundles senderSide;
    TcpclV4Agent receiverAgent(MakeConfig("ipn:1.0"));
    TcpclV4Agent senderAgent(MakeConfig("ipn:2.0"));
    receiverAgent.SetWholeBundleReadyCallback(boost::bind(&ReceivedBundles::OnWholeBundleReady, &receiverSide,
        boost::placeholders::_1, boost::placeholders::_2));
    senderAgent.SetOutboundTransferFinishedCallback(boost::bind(&ReceivedBundles::OnOutboundTransferFinished, &senderSide,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3));

    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(receiverAgent.Start(true, 0, errorCode));
    BOOST_REQUIRE_NE(receiverAgent.GetBoundPort(), 0);
    BOOST_REQUIRE(senderAgent.Start(false, 0, errorCode));

    std::shared_ptr<TcpclV4Session> sessionPtr = senderAgent.Connect("127.0.0.1", receiverAgent.GetBoundPort());
    BOOST_REQUIRE(sessionPtr);
    BOOST_REQUIRE(sessionPtr->WaitForEstablished(WAIT_TIMEOUT));
    BOOST_REQUIRE(sessionPtr->IsActiveEntity());
    BOOST_REQUIRE_EQUAL(sessionPtr->GetRemoteNodeEidUri(), "ipn:1.0");
    BOOST_REQUIRE_EQUAL(sessionPtr->GetNegotiatedKeepAliveIntervalSeconds(), 5);
    BOOST_REQUIRE(senderAgent.GetEstablishedSessionToNode("ipn:1.0") == sessionPtr);
    BOOST_REQUIRE(!senderAgent.GetEstablishedSessionToNode("ipn:3.0"));

    const std::string helloStr("Hello, DTN!");
    const std::vector<uint8_t> hello(helloStr.begin(), helloStr.end());
    uint64_t transferId = 1000;
    BOOST_REQUIRE(sessionPtr->SendBundle(hello, transferId, errorCode));
    BOOST_REQUIRE(errorCode == BP7_ERROR_CODE::NONE);
    BOOST_REQUIRE_EQUAL(transferId, 0);
    BOOST_REQUIRE(receiverSide.WaitForBundles(1));
    BOOST_REQUIRE(receiverSide.m_bundles[0] == hello);
    BOOST_REQUIRE(senderSide.WaitForFinishedTransfers(1));
    BOOST_REQUIRE_EQUAL(senderSide.m_finishedTransfers[0].first, 0);
    BOOST_REQUIRE(senderSide.m_finishedTransfers[0].second);
    BOOST_REQUIRE(sessionPtr->WaitForAllTransfersFinished(WAIT_TIMEOUT));

    //transfer ids increase within a session
    BOOST_REQUIRE(sessionPtr->SendBundle(hello, transferId, errorCode));
    BOOST_REQUIRE_EQUAL(transferId, 1);
    BOOST_REQUIRE(receiverSide.WaitForBundles(2));
    BOOST_REQUIRE(sessionPtr->WaitForAllTransfersFinished(WAIT_TIMEOUT));

    const TcpclV4SessionStats stats = sessionPtr->GetStats();
    BOOST_REQUIRE_EQUAL(stats.m_totalBundlesSent, 2);
    BOOST_REQUIRE_EQUAL(stats.m_totalBundlesAcked, 2);
    BOOST_REQUIRE_EQUAL(stats.m_totalSegmentsSent, 2);
    BOOST_REQUIRE_EQUAL(stats.m_totalSegmentsAcked, 2);
    BOOST_REQUIRE_EQUAL(stats.m_totalRetransmissions, 0);
    BOOST_REQUIRE_GT(stats.m_totalBytesSent, 2 * hello.size());
    BOOST_REQUIRE_GT(stats.m_totalBytesReceived, 0);

    std::vector<std::shared_ptr<TcpclV4Session> > passiveSessions = receiverAgent.GetSessions();
    BOOST_REQUIRE_EQUAL(passiveSessions.size(), 1);
    BOOST_REQUIRE(!passiveSessions[0]->IsActiveEntity());
    BOOST_REQUIRE_EQUAL(passiveSessions[0]->GetRemoteNodeEidUri(), "ipn:2.0");
    BOOST_REQUIRE_EQUAL(passiveSessions[0]->GetStats().m_totalBundlesReceived, 2);

    //orderly SESS_TERM exchange closes both ends cleanly
    sessionPtr->Terminate();
    BOOST_REQUIRE(sessionPtr->WaitForClosed(WAIT_TIMEOUT));
    BOOST_REQUIRE(sessionPtr->GetState() == TCPCLV4_SESSION_STATE::CLOSED_CLEAN);
    BOOST_REQUIRE(sessionPtr->GetCloseErrorCode() == BP7_ERROR_CODE::NONE);
    BOOST_REQUIRE(passiveSessions[0]->WaitForClosed(WAIT_TIMEOUT));
    BOOST_REQUIRE(passiveSessions[0]->GetState() == TCPCLV4_SESSION_STATE::CLOSED_CLEAN);

    BOOST_REQUIRE(!sessionPtr->SendBundle(hello, transferId, errorCode));
    BOOST_REQUIRE(errorCode == BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED);
    BOOST_REQUIRE_EQUAL(senderAgent.RemoveClosedSessions(), 1);
    BOOST_REQUIRE_EQUAL(senderAgent.GetNumSessions(), 0);
    passiveSessions.clear();

    senderAgent.Stop();
    receiverAgent.Stop();
}

BOOST_AUTO_TEST_CASE(TcpclV4SessionSegmentationTestCase)
{
    ReceivedBundles receiverSide;
    TcpclV4SessionConfig receiverConfig = MakeConfig("ipn:1.0");
    receiverConfig.m_segmentMru = 1000;
    receiverConfig.m_transferMru = 10000;
    TcpclV4Agent receiverAgent(receiverConfig);
    TcpclV4Agent senderAgent(MakeConfig("ipn:2.0"));
    receiverAgent.SetWholeBundleReadyCallback(boost::bind(&ReceivedBundles::OnWholeBundleReady, &receiverSide,
        boost::placeholders::_1, boost::placeholders::_2));
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(receiverAgent.Start(true, 0, errorCode));
    BOOST_REQUIRE(senderAgent.Start(false, 0, errorCode));

    std::shared_ptr<TcpclV4Session> sessionPtr = senderAgent.Connect("127.0.0.1", receiverAgent.GetBoundPort());
    BOOST_REQUIRE(sessionPtr->WaitForEstablished(WAIT_TIMEOUT));
    BOOST_REQUIRE_EQUAL(sessionPtr->GetRemoteSegmentMru(), 1000);

    //2.5 times the segment MRU
    std::vector<uint8_t> bundle(2500);
    for (std::size_t i = 0; i < bundle.size(); ++i) {
        bundle[i] = static_cast<uint8_t>(i * 7);
    }
    uint64_t transferId;
    BOOST_REQUIRE(sessionPtr->SendBundle(bundle, transferId, errorCode));
    BOOST_REQUIRE(receiverSide.WaitForBundles(1));
    BOOST_REQUIRE(receiverSide.m_bundles[0] == bundle);
    BOOST_REQUIRE(sessionPtr->WaitForAllTransfersFinished(WAIT_TIMEOUT));
    BOOST_REQUIRE_EQUAL(sessionPtr->GetStats().m_totalSegmentsSent, 3);
    BOOST_REQUIRE_EQUAL(sessionPtr->GetStats().m_totalSegmentsAcked, 3);
    BOOST_REQUIRE_EQUAL(receiverAgent.GetSessions()[0]->GetStats().m_totalSegmentsReceived, 3);

    //larger than the peer's transfer MRU is refused locally
    const std::vector<uint8_t> tooBig(static_cast<std::size_t>(sessionPtr->GetRemoteTransferMru() + 1));
    BOOST_REQUIRE(!sessionPtr->SendBundle(tooBig, transferId, errorCode));
    BOOST_REQUIRE(errorCode == BP7_ERROR_CODE::INVALID_ARGUMENT);
    BOOST_REQUIRE(sessionPtr->IsEstablished());

    senderAgent.Stop();
    receiverAgent.Stop();
}

BOOST_AUTO_TEST_CASE(TcpclV4SessionVersionMismatchTestCase)
{
    RawTcpclPeer rawPeer;
    TcpclV4Agent agent(MakeConfig("ipn:2.0"));
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(agent.Start(false, 0, errorCode));
    std::shared_ptr<TcpclV4Session> sessionPtr = agent.Connect("127.0.0.1", rawPeer.GetPort());
    rawPeer.Accept();
    BOOST_REQUIRE(rawPeer.ReadUntil([&rawPeer]() { return rawPeer.m_contactHeaderReceived; }));
    std::vector<uint8_t> hdr;
    TcpclV4::GenerateContactHeader(hdr, 5, 3, 0); //a TCPCL version 3 peer
    rawPeer.Write(hdr);

    BOOST_REQUIRE(sessionPtr->WaitForClosed(WAIT_TIMEOUT));
    BOOST_REQUIRE(sessionPtr->GetState() == TCPCLV4_SESSION_STATE::CLOSED_ERROR);
    BOOST_REQUIRE(sessionPtr->GetCloseErrorCode() == BP7_ERROR_CODE::CONTACT_HEADER_MISMATCH);
    BOOST_REQUIRE(!rawPeer.m_sessionInitReceived);
    BOOST_REQUIRE_EQUAL(sessionPtr->GetStats().m_totalSegmentsSent, 0);

    uint64_t transferId;
    BOOST_REQUIRE(!sessionPtr->SendBundle(hdr, transferId, errorCode));
    BOOST_REQUIRE(errorCode == BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED);
    agent.Stop();
}

BOOST_AUTO_TEST_CASE(TcpclV4SessionConnectionRefusedTestCase)
{
    uint16_t unusedPort;
    {
        RawTcpclPeer closedPeer;
        unusedPort = closedPeer.GetPort();
    }
    TcpclV4Agent agent(MakeConfig("ipn:2.0"));
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(agent.Start(false, 0, errorCode));
    std::shared_ptr<TcpclV4Session> sessionPtr = agent.Connect("127.0.0.1", unusedPort);
    BOOST_REQUIRE(!sessionPtr->WaitForEstablished(WAIT_TIMEOUT));
    BOOST_REQUIRE(sessionPtr->WaitForClosed(WAIT_TIMEOUT));
    BOOST_REQUIRE(sessionPtr->GetCloseErrorCode() == BP7_ERROR_CODE::CONNECTION_LOST);
    agent.Stop();
}

BOOST_AUTO_TEST_CASE(TcpclV4SessionKeepAliveTimeoutTestCase)
{
    RawTcpclPeer rawPeer;
    TcpclV4SessionConfig config = MakeConfig("ipn:2.0");
    config.m_keepAliveIntervalSeconds = 1;
    TcpclV4Agent agent(config);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(agent.Start(false, 0, errorCode));
    std::shared_ptr<TcpclV4Session> sessionPtr = agent.Connect("127.0.0.1", rawPeer.GetPort());
    rawPeer.Handshake(1, 100000, 1000000);
    BOOST_REQUIRE(sessionPtr->WaitForEstablished(WAIT_TIMEOUT));
    BOOST_REQUIRE_EQUAL(sessionPtr->GetNegotiatedKeepAliveIntervalSeconds(), 1);

    //the raw peer never sends anything again
    BOOST_REQUIRE(sessionPtr->WaitForClosed(WAIT_TIMEOUT));
    BOOST_REQUIRE(sessionPtr->GetState() == TCPCLV4_SESSION_STATE::CLOSED_ERROR);
    BOOST_REQUIRE(sessionPtr->GetCloseErrorCode() == BP7_ERROR_CODE::KEEPALIVE_TIMEOUT);
    rawPeer.ReadUntilEof();
    agent.Stop();
}

BOOST_AUTO_TEST_CASE(TcpclV4SessionTerminationReplyTestCase)
{
    RawTcpclPeer rawPeer;
    TcpclV4Agent agent(MakeConfig("ipn:2.0"));
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(agent.Start(false, 0, errorCode));
    std::shared_ptr<TcpclV4Session> sessionPtr = agent.Connect("127.0.0.1", rawPeer.GetPort());
    rawPeer.Handshake(0, 100000, 1000000);
    BOOST_REQUIRE(sessionPtr->WaitForEstablished(WAIT_TIMEOUT));
    BOOST_REQUIRE_EQUAL(sessionPtr->GetNegotiatedKeepAliveIntervalSeconds(), 0);

    std::vector<uint8_t> sessTerm;
    TcpclV4::GenerateSessionTerminationMessage(sessTerm, TCPCLV4_SESSION_TERMINATION_REASON_CODES::IDLE_TIMEOUT, false);
    rawPeer.Write(sessTerm);
    BOOST_REQUIRE(rawPeer.ReadUntil([&rawPeer]() { return !rawPeer.m_sessionTerminations.empty(); }));
    BOOST_REQUIRE(rawPeer.m_sessionTerminations[0].first == TCPCLV4_SESSION_TERMINATION_REASON_CODES::IDLE_TIMEOUT);
    BOOST_REQUIRE(rawPeer.m_sessionTerminations[0].second); //reply flag
    BOOST_REQUIRE(sessionPtr->WaitForClosed(WAIT_TIMEOUT));
    BOOST_REQUIRE(sessionPtr->GetState() == TCPCLV4_SESSION_STATE::CLOSED_CLEAN);
    agent.Stop();
}

BOOST_AUTO_TEST_CASE(TcpclV4SessionRefuseTransferTestCase)
{
    RawTcpclPeer rawPeer;
    ReceivedBundles receiverSide;
    TcpclV4SessionConfig config = MakeConfig("ipn:2.0");
    config.m_keepAliveIntervalSeconds = 0;
    config.m_transferMru = 100;
    TcpclV4Agent agent(config);
    agent.SetWholeBundleReadyCallback(boost::bind(&ReceivedBundles::OnWholeBundleReady, &receiverSide,
        boost::placeholders::_1, boost::placeholders::_2));
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(agent.Start(false, 0, errorCode));
    std::shared_ptr<TcpclV4Session> sessionPtr = agent.Connect("127.0.0.1", rawPeer.GetPort());
    rawPeer.Handshake(0, 100000, 1000000);
    BOOST_REQUIRE(sessionPtr->WaitForEstablished(WAIT_TIMEOUT));

    //over the transfer MRU
    std::vector<uint8_t> segment;
    const std::vector<uint8_t> contents(200, 0x55);
    TcpclV4::GenerateDataSegment(segment, true, true, 42, contents.data(), contents.size());
    rawPeer.Write(segment);
    BOOST_REQUIRE(rawPeer.ReadUntil([&rawPeer]() { return !rawPeer.m_refusals.empty(); }));
    BOOST_REQUIRE(rawPeer.m_refusals[0].first == TCPCLV4_TRANSFER_REFUSE_REASON_CODES::REFUSAL_REASON_NO_RESOURCES);
    BOOST_REQUIRE_EQUAL(rawPeer.m_refusals[0].second, 42);

    //continuation of a transfer that was never started
    TcpclV4::GenerateDataSegment(segment, false, true, 43, contents.data(), 10);
    rawPeer.Write(segment);
    BOOST_REQUIRE(rawPeer.ReadUntil([&rawPeer]() { return rawPeer.m_refusals.size() == 2; }));
    BOOST_REQUIRE(rawPeer.m_refusals[1].first == TCPCLV4_TRANSFER_REFUSE_REASON_CODES::REFUSAL_REASON_NOT_ACCEPTABLE);

    //an acceptable transfer in two segments gets a cumulative ack per segment
    TcpclV4::GenerateDataSegment(segment, true, false, 44, contents.data(), 30);
    rawPeer.Write(segment);
    TcpclV4::GenerateDataSegment(segment, false, true, 44, contents.data(), 20);
    rawPeer.Write(segment);
    BOOST_REQUIRE(rawPeer.ReadUntil([&rawPeer]() { return rawPeer.m_acks.size() == 2; }));
    BOOST_REQUIRE_EQUAL(rawPeer.m_acks[0].first, 44);
    BOOST_REQUIRE_EQUAL(rawPeer.m_acks[0].second, 30);
    BOOST_REQUIRE_EQUAL(rawPeer.m_acks[1].second, 50);
    BOOST_REQUIRE(receiverSide.WaitForBundles(1));
    BOOST_REQUIRE_EQUAL(receiverSide.m_bundles[0].size(), 50);

    const TcpclV4SessionStats stats = sessionPtr->GetStats();
    BOOST_REQUIRE_EQUAL(stats.m_totalTransfersRefused, 2);
    BOOST_REQUIRE_EQUAL(stats.m_totalBundlesReceived, 1);
    BOOST_REQUIRE_EQUAL(stats.m_totalSegmentsReceived, 4);
    BOOST_REQUIRE(sessionPtr->IsEstablished());
    agent.Stop();
}
