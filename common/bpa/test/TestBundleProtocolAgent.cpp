/**
 * @file TestBundleProtocolAgent.cpp
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
#include "BundleProtocolAgent.h"
#include "TcpclV4Agent.h"
#include "TimestampUtil.h"
#include <boost/thread.hpp>
#include <boost/bind/bind.hpp>
#include <boost/asio.hpp>
#include <string>
#include <vector>

static const boost::posix_time::time_duration WAIT_TIMEOUT = boost::posix_time::seconds(5);
static constexpr uint16_t PORT_NODE1 = 24556;
static constexpr uint16_t PORT_NODE2 = 24557;
static constexpr uint16_t PORT_NODE3 = 24558;
static constexpr uint16_t PORT_NOBODY_LISTENING = 24559;
static constexpr uint16_t PORT_SILENT_LISTENER = 24560;
static constexpr uint16_t PORT_NODE4 = 24561;

static NodeConfig MakeNodeConfig(const std::string & nodeId, uint16_t listenPort) {
    NodeConfig nodeConfig;
    nodeConfig.m_nodeConfigName = "test " + nodeId;
    nodeConfig.m_nodeId = nodeId;
    nodeConfig.m_listenPort = listenPort;
    nodeConfig.m_keepAliveIntervalSeconds = 5;
    nodeConfig.m_statusReportsEnabled = true;
    return nodeConfig;
}

static route_config_t MakeRoute(const std::string & destinationNodeId, const std::string & nextHopNodeId, uint16_t port) {
    route_config_t route;
    route.destinationNodeId = destinationNodeId;
    route.nextHopNodeId = nextHopNodeId;
    route.remoteHostname = "127.0.0.1";
    route.remotePort = port;
    return route;
}

static std::vector<uint8_t> StringToBytes(const std::string & s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static bool WaitForStatus(BundleProtocolAgent & bpa, const Bpv7BundleId & bundleId, BPA_BUNDLE_STATUS expectedStatus) {
    const boost::posix_time::ptime timeoutExpiry = boost::posix_time::microsec_clock::universal_time() + WAIT_TIMEOUT;
    while (boost::posix_time::microsec_clock::universal_time() < timeoutExpiry) {
        if (bpa.Status(bundleId) == expectedStatus) {
            return true;
        }
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    return (bpa.Status(bundleId) == expectedStatus);
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentSendReceiveTestCase)
{
    NodeConfig config1 = MakeNodeConfig("ipn:1.0", PORT_NODE1);
    config1.m_routeVector.push_back(MakeRoute("ipn:2.0", "ipn:2.0", PORT_NODE2));
    NodeConfig config2 = MakeNodeConfig("ipn:2.0", PORT_NODE2);
    config2.m_routeVector.push_back(MakeRoute("ipn:1.0", "ipn:1.0", PORT_NODE1));

    BundleProtocolAgent node1(config1);
    BundleProtocolAgent node2(config2);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(node2.Start(errorCode));
    BOOST_REQUIRE(node1.Start(errorCode));
    BOOST_REQUIRE_EQUAL(node2.GetBoundPort(), PORT_NODE2);

    Bpv7BundleId bundleId;
    BOOST_REQUIRE(node1.Send("ipn:2.1", StringToBytes("Hello DTN"), 60000, bundleId, errorCode,
        BPV7_BUNDLEFLAG::DELIVERY_STATUS_REPORTS_REQUESTED));
    BOOST_REQUIRE_EQUAL(bundleId.m_sourceEid, EndpointId::Ipn(1, 0));
    BOOST_REQUIRE(node1.Status(bundleId) != BPA_BUNDLE_STATUS::UNKNOWN);

    Bpv7Bundle received;
    BOOST_REQUIRE(node2.Receive(received, WAIT_TIMEOUT));
    BOOST_REQUIRE_EQUAL(received.m_primaryBlock.m_sourceNodeId, EndpointId::Ipn(1, 0));
    BOOST_REQUIRE_EQUAL(received.m_primaryBlock.m_destinationEid, EndpointId::Ipn(2, 1));
    const Bpv7CanonicalBlock * payloadBlock = received.GetPayloadBlock();
    BOOST_REQUIRE(payloadBlock != NULL);
    BOOST_REQUIRE(payloadBlock->m_blockTypeSpecificData == StringToBytes("Hello DTN"));
    BOOST_REQUIRE(received.GetBundleId() == bundleId);

    //the delivery report travels back on the session node1 opened
    BOOST_REQUIRE(WaitForStatus(node1, bundleId, BPA_BUNDLE_STATUS::DELIVERED));

    //reply without a report request, which stops at SENT
    Bpv7BundleId replyId;
    BOOST_REQUIRE(node2.Send("ipn:1.0", StringToBytes("reply"), 60000, replyId, errorCode));
    BOOST_REQUIRE(node1.Receive(received, WAIT_TIMEOUT));
    BOOST_REQUIRE(received.GetPayloadBlock()->m_blockTypeSpecificData == StringToBytes("reply"));
    BOOST_REQUIRE(WaitForStatus(node2, replyId, BPA_BUNDLE_STATUS::SENT));

    //nothing else is waiting, and the status report was consumed by node1
    BOOST_REQUIRE(!node1.Receive(received, boost::posix_time::milliseconds(50)));
    BOOST_REQUIRE_EQUAL(node1.GetNumBundlesAwaitingReceive(), 0);
    BOOST_REQUIRE_EQUAL(node1.GetStats().m_totalStatusReportsReceived, 1);
    BOOST_REQUIRE_EQUAL(node2.GetStats().m_totalStatusReportsSent, 1);
    BOOST_REQUIRE_EQUAL(node1.GetSessionStats().size(), 1);

    node1.Stop();
    node2.Stop();
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentFragmentationTestCase)
{
    NodeConfig config1 = MakeNodeConfig("ipn:1.0", PORT_NODE1);
    config1.m_routeVector.push_back(MakeRoute("ipn:2.0", "ipn:2.0", PORT_NODE2));
    NodeConfig config2 = MakeNodeConfig("ipn:2.0", PORT_NODE2);
    config2.m_transferMruBytes = 2000;

    BundleProtocolAgent node1(config1);
    BundleProtocolAgent node2(config2);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(node2.Start(errorCode));
    BOOST_REQUIRE(node1.Start(errorCode));

    std::vector<uint8_t> payload(5000);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<uint8_t>(i);
    }
    Bpv7BundleId bundleId;
    BOOST_REQUIRE(node1.Send("ipn:2.0", payload, 60000, bundleId, errorCode));
    BOOST_REQUIRE_GE(node1.GetStats().m_totalFragmentsSent, 3);

    Bpv7Bundle received;
    BOOST_REQUIRE(node2.Receive(received, WAIT_TIMEOUT));
    BOOST_REQUIRE(!received.m_primaryBlock.IsFragment());
    BOOST_REQUIRE(received.GetPayloadBlock()->m_blockTypeSpecificData == payload);
    BOOST_REQUIRE(received.GetBundleId() == bundleId);
    BOOST_REQUIRE_EQUAL(node2.GetNumPendingReassemblies(), 0);
    BOOST_REQUIRE_EQUAL(node2.GetStats().m_totalFragmentsReceived, node1.GetStats().m_totalFragmentsSent);
    BOOST_REQUIRE(WaitForStatus(node1, bundleId, BPA_BUNDLE_STATUS::SENT));

    //a bundle that must not be fragmented cannot reach node2
    Bpv7BundleId noFragmentId;
    BOOST_REQUIRE(!node1.Send("ipn:2.0", payload, 60000, noFragmentId, errorCode, BPV7_BUNDLEFLAG::NOFRAGMENT));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_ARGUMENT);
    BOOST_REQUIRE_EQUAL(node1.Status(noFragmentId), BPA_BUNDLE_STATUS::UNKNOWN);
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentLocalDeliveryAndErrorsTestCase)
{
    NodeConfig config1 = MakeNodeConfig("ipn:1.0", 0);
    config1.m_routeVector.push_back(MakeRoute("ipn:9.0", "ipn:9.0", PORT_NOBODY_LISTENING));
    BundleProtocolAgent node1(config1);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(node1.Start(errorCode));

    //another service on this node
    Bpv7BundleId bundleId;
    BOOST_REQUIRE(node1.Send("ipn:1.5", StringToBytes("local"), 60000, bundleId, errorCode));
    BOOST_REQUIRE_EQUAL(node1.Status(bundleId), BPA_BUNDLE_STATUS::DELIVERED);
    Bpv7Bundle received;
    BOOST_REQUIRE(node1.Receive(received, WAIT_TIMEOUT));
    BOOST_REQUIRE_EQUAL(received.m_primaryBlock.m_destinationEid, EndpointId::Ipn(1, 5));

    //no route
    Bpv7BundleId noRouteId;
    BOOST_REQUIRE(!node1.Send("ipn:4.0", StringToBytes("x"), 60000, noRouteId, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_ARGUMENT);

    //unknown id
    Bpv7BundleId neverSent(EndpointId::Ipn(1, 0), TimestampUtil::bpv7_creation_timestamp_t(12345, 6), false, 0);
    BOOST_REQUIRE_EQUAL(node1.Status(neverSent), BPA_BUNDLE_STATUS::UNKNOWN);

    //next hop down
    Bpv7BundleId downId;
    BOOST_REQUIRE(!node1.Send("ipn:9.0", StringToBytes("x"), 60000, downId, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED);
    BOOST_REQUIRE_EQUAL(node1.Status(downId), BPA_BUNDLE_STATUS::UNKNOWN);

    //bad lifetime
    Bpv7BundleId badLifetimeId;
    BOOST_REQUIRE(!node1.Send("ipn:1.5", StringToBytes("x"), 0, badLifetimeId, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_ARGUMENT);

    //bad destination
    Bpv7BundleId badEidId;
    BOOST_REQUIRE(!node1.Send("ipn:1", StringToBytes("x"), 60000, badEidId, errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_EID);

    //routes can change at runtime
    BOOST_REQUIRE(node1.RemoveRoute("ipn:9.0"));
    BOOST_REQUIRE(!node1.RemoveRoute("ipn:9.0"));
    route_config_t route;
    BOOST_REQUIRE(!node1.GetRoute(EndpointId::Ipn(9, 0), route));
    node1.AddRoute(MakeRoute("ipn:7.0", "ipn:8.0", PORT_NOBODY_LISTENING));
    BOOST_REQUIRE(node1.GetRoute(EndpointId::Ipn(7, 3), route));
    BOOST_REQUIRE_EQUAL(route.nextHopNodeId, "ipn:8.0");
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentInvalidNodeIdTestCase)
{
    NodeConfig config = MakeNodeConfig("ipn:1.0", 0);
    config.m_nodeId = "dtn:none";
    BundleProtocolAgent node(config);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(!node.Start(errorCode));
    BOOST_REQUIRE_EQUAL(errorCode, BP7_ERROR_CODE::INVALID_EID);
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentForwardingTestCase)
{
    NodeConfig config1 = MakeNodeConfig("ipn:1.0", PORT_NODE1);
    config1.m_routeVector.push_back(MakeRoute("ipn:3.0", "ipn:2.0", PORT_NODE2));
    NodeConfig config2 = MakeNodeConfig("ipn:2.0", PORT_NODE2);
    config2.m_routeVector.push_back(MakeRoute("ipn:3.0", "ipn:3.0", PORT_NODE3));
    NodeConfig config3 = MakeNodeConfig("ipn:3.0", PORT_NODE3);

    BundleProtocolAgent node1(config1);
    BundleProtocolAgent node2(config2);
    BundleProtocolAgent node3(config3);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(node3.Start(errorCode));
    BOOST_REQUIRE(node2.Start(errorCode));
    BOOST_REQUIRE(node1.Start(errorCode));

    Bpv7BundleId bundleId;
    BOOST_REQUIRE(node1.Send("ipn:3.1", StringToBytes("two hops"), 60000, bundleId, errorCode));

    Bpv7Bundle received;
    BOOST_REQUIRE(node3.Receive(received, WAIT_TIMEOUT));
    BOOST_REQUIRE(received.GetPayloadBlock()->m_blockTypeSpecificData == StringToBytes("two hops"));
    BOOST_REQUIRE_EQUAL(received.m_primaryBlock.m_sourceNodeId, EndpointId::Ipn(1, 0));

    std::vector<const Bpv7CanonicalBlock *> previousNodeBlocks = received.GetCanonicalBlocksByType(BPV7_BLOCK_TYPE_CODE::PREVIOUS_NODE);
    BOOST_REQUIRE_EQUAL(previousNodeBlocks.size(), 1);
    Bpv7PreviousNodeBlockData previousNode;
    BOOST_REQUIRE(Bpv7PreviousNodeBlockData::FromCanonicalBlock(*previousNodeBlocks[0], previousNode, errorCode));
    BOOST_REQUIRE_EQUAL(previousNode.m_previousNode, EndpointId::Ipn(2, 0));

    //node2 counts the forward once its send returns, which can trail node3's delivery
    const boost::posix_time::ptime timeoutExpiry = boost::posix_time::microsec_clock::universal_time() + WAIT_TIMEOUT;
    while ((node2.GetStats().m_totalBundlesForwarded == 0) && (boost::posix_time::microsec_clock::universal_time() < timeoutExpiry)) {
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    BOOST_REQUIRE_EQUAL(node2.GetStats().m_totalBundlesForwarded, 1);
    BOOST_REQUIRE_EQUAL(node2.GetStats().m_totalBundlesDelivered, 0);
    BOOST_REQUIRE_EQUAL(node2.GetNumBundlesAwaitingReceive(), 0);
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentBundleExpiryTestCase)
{
    NodeConfig config1 = MakeNodeConfig("ipn:1.0", PORT_NODE1);
    config1.m_routeVector.push_back(MakeRoute("ipn:2.0", "ipn:2.0", PORT_NODE2));
    NodeConfig config2 = MakeNodeConfig("ipn:2.0", PORT_NODE2);

    BundleProtocolAgent node1(config1);
    BundleProtocolAgent node2(config2);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(node2.Start(errorCode));
    BOOST_REQUIRE(node1.Start(errorCode));

    Bpv7BundleId bundleId;
    BOOST_REQUIRE(node1.Send("ipn:2.0", StringToBytes("short lived"), 1, bundleId, errorCode));
    boost::this_thread::sleep(boost::posix_time::milliseconds(20));
    BOOST_REQUIRE_EQUAL(node1.Status(bundleId), BPA_BUNDLE_STATUS::EXPIRED);
    //terminal
    BOOST_REQUIRE_EQUAL(node1.Status(bundleId), BPA_BUNDLE_STATUS::EXPIRED);

    //node2 discards it on arrival instead of delivering
    Bpv7Bundle received;
    BOOST_REQUIRE(!node2.Receive(received, boost::posix_time::milliseconds(200)));
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentReassemblyExpiryTestCase)
{
    //a bare convergence layer agent stands in for node 1 so a lone fragment can be injected
    TcpclV4SessionConfig rawConfig;
    rawConfig.m_localNodeEidUri = "ipn:1.0";
    rawConfig.m_keepAliveIntervalSeconds = 5;
    TcpclV4Agent rawAgent(rawConfig);
    boost::mutex receivedMutex;
    boost::condition_variable receivedCv;
    std::vector<std::vector<uint8_t> > receivedBundles;
    rawAgent.SetWholeBundleReadyCallback([&](std::vector<uint8_t> & wholeBundleVec, TcpclV4Session &) {
        boost::mutex::scoped_lock lock(receivedMutex);
        receivedBundles.push_back(std::move(wholeBundleVec));
        receivedCv.notify_all();
    });
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(rawAgent.Start(false, 0, errorCode));

    NodeConfig config2 = MakeNodeConfig("ipn:2.0", PORT_NODE2);
    config2.m_routeVector.push_back(MakeRoute("ipn:1.0", "ipn:1.0", PORT_NODE1));
    BundleProtocolAgent node2(config2);
    BOOST_REQUIRE(node2.Start(errorCode));

    std::vector<uint8_t> payload(1000, 0x5a);
    Bpv7Bundle bundle;
    BOOST_REQUIRE(Bpv7Bundle::Create(EndpointId::Ipn(1, 0), EndpointId::Ipn(2, 0), EndpointId::Ipn(1, 0),
        payload, 200, BPV7_BUNDLEFLAG::DELETION_STATUS_REPORTS_REQUESTED, bundle, errorCode));
    std::vector<Bpv7Bundle> fragments;
    BOOST_REQUIRE(Bpv7Fragmenter::Fragment(bundle, 400, fragments, errorCode));
    BOOST_REQUIRE_EQUAL(fragments.size(), 3);

    std::shared_ptr<TcpclV4Session> sessionPtr = rawAgent.Connect("127.0.0.1", PORT_NODE2);
    BOOST_REQUIRE(sessionPtr);
    BOOST_REQUIRE(sessionPtr->WaitForEstablished(WAIT_TIMEOUT));
    uint64_t transferId;
    BOOST_REQUIRE(sessionPtr->SendBundle(fragments[0].Serialize(), transferId, errorCode));
    BOOST_REQUIRE(sessionPtr->WaitForAllTransfersFinished(WAIT_TIMEOUT));

    const boost::posix_time::ptime timeoutExpiry = boost::posix_time::microsec_clock::universal_time() + WAIT_TIMEOUT;
    while ((node2.GetNumPendingReassemblies() == 0) && (boost::posix_time::microsec_clock::universal_time() < timeoutExpiry)) {
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    BOOST_REQUIRE_EQUAL(node2.GetNumPendingReassemblies(), 1);

    //Receive drives the reassembly lifetime check
    boost::this_thread::sleep(boost::posix_time::milliseconds(300));
    Bpv7Bundle received;
    BOOST_REQUIRE(!node2.Receive(received, boost::posix_time::milliseconds(100)));
    BOOST_REQUIRE_EQUAL(node2.GetNumPendingReassemblies(), 0);

    std::vector<uint8_t> reportSerialization;
    {
        boost::mutex::scoped_lock lock(receivedMutex);
        BOOST_REQUIRE(receivedCv.timed_wait(lock, WAIT_TIMEOUT, [&]() { return !receivedBundles.empty(); }));
        reportSerialization = receivedBundles[0];
    }
    Bpv7Bundle reportBundle;
    BOOST_REQUIRE(Bpv7Bundle::Deserialize(reportSerialization, reportBundle, errorCode));
    BOOST_REQUIRE(reportBundle.m_primaryBlock.IsAdminRecord());
    BOOST_REQUIRE_EQUAL(reportBundle.m_primaryBlock.m_destinationEid, EndpointId::Ipn(1, 0));
    BOOST_REQUIRE_EQUAL(reportBundle.m_primaryBlock.m_sourceNodeId, EndpointId::Ipn(2, 0));
    Bpv7BundleStatusReport report;
    BOOST_REQUIRE(report.DeserializeAdministrativeRecord(reportBundle.GetPayloadBlock()->m_blockTypeSpecificData, errorCode));
    BOOST_REQUIRE(report.IsAsserted(Bpv7BundleStatusReport::STATUS_INDEX::DELETED));
    BOOST_REQUIRE(!report.IsAsserted(Bpv7BundleStatusReport::STATUS_INDEX::DELIVERED));
    BOOST_REQUIRE_EQUAL(report.m_reasonCode, BPV7_STATUS_REPORT_REASON_CODE::LIFETIME_EXPIRED);
    BOOST_REQUIRE_EQUAL(report.m_subjectSourceNodeId, EndpointId::Ipn(1, 0));
    BOOST_REQUIRE(report.m_subjectCreationTimestamp == bundle.m_primaryBlock.m_creationTimestamp);
    BOOST_REQUIRE(!report.m_subjectIsFragment);

    node2.Stop();
    rawAgent.Stop();
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentTrackedStatusRetentionTestCase)
{
    NodeConfig config1 = MakeNodeConfig("ipn:1.0", 0);
    config1.m_bundleStatusRetentionMilliseconds = 0;
    BundleProtocolAgent node1(config1);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(node1.Start(errorCode));

    Bpv7BundleId shortLivedId;
    BOOST_REQUIRE(node1.Send("ipn:1.5", StringToBytes("short lived"), 50, shortLivedId, errorCode));
    Bpv7BundleId longLivedId;
    BOOST_REQUIRE(node1.Send("ipn:1.6", StringToBytes("long lived"), 60000, longLivedId, errorCode));
    BOOST_REQUIRE_EQUAL(node1.GetNumTrackedBundles(), 2);
    BOOST_REQUIRE_EQUAL(node1.Status(shortLivedId), BPA_BUNDLE_STATUS::DELIVERED);

    //each Receive wakes the expiry pass
    boost::this_thread::sleep(boost::posix_time::milliseconds(100));
    const boost::posix_time::ptime timeoutExpiry = boost::posix_time::microsec_clock::universal_time() + WAIT_TIMEOUT;
    Bpv7Bundle received;
    while ((node1.GetNumTrackedBundles() != 1) && (boost::posix_time::microsec_clock::universal_time() < timeoutExpiry)) {
        node1.Receive(received, boost::posix_time::milliseconds(10));
    }
    BOOST_REQUIRE_EQUAL(node1.GetNumTrackedBundles(), 1);
    BOOST_REQUIRE_EQUAL(node1.Status(shortLivedId), BPA_BUNDLE_STATUS::UNKNOWN);
    BOOST_REQUIRE_EQUAL(node1.Status(longLivedId), BPA_BUNDLE_STATUS::DELIVERED);
}

BOOST_AUTO_TEST_CASE(BundleProtocolAgentUnresponsiveNextHopTestCase)
{
    //accepts connections at the tcp level but never sends a contact header
    boost::asio::io_service ioService;
    boost::asio::ip::tcp::acceptor silentAcceptor(ioService,
        boost::asio::ip::tcp::endpoint(boost::asio::ip::address_v4::loopback(), PORT_SILENT_LISTENER));

    NodeConfig config1 = MakeNodeConfig("ipn:1.0", PORT_NODE1);
    config1.m_routeVector.push_back(MakeRoute("ipn:2.0", "ipn:2.0", PORT_NODE2));
    config1.m_routeVector.push_back(MakeRoute("ipn:3.0", "ipn:2.0", PORT_NODE2));
    config1.m_routeVector.push_back(MakeRoute("ipn:4.0", "ipn:2.0", PORT_NODE2));
    NodeConfig config2 = MakeNodeConfig("ipn:2.0", PORT_NODE2);
    config2.m_routeVector.push_back(MakeRoute("ipn:3.0", "ipn:3.0", PORT_SILENT_LISTENER));
    config2.m_routeVector.push_back(MakeRoute("ipn:4.0", "ipn:4.0", PORT_NODE4));
    NodeConfig config4 = MakeNodeConfig("ipn:4.0", PORT_NODE4);

    BundleProtocolAgent node1(config1);
    BundleProtocolAgent node2(config2);
    BundleProtocolAgent node4(config4);
    BP7_ERROR_CODE errorCode;
    BOOST_REQUIRE(node4.Start(errorCode));
    BOOST_REQUIRE(node2.Start(errorCode));
    BOOST_REQUIRE(node1.Start(errorCode));

    Bpv7BundleId stuckId;
    BOOST_REQUIRE(node1.Send("ipn:3.1", StringToBytes("to the silent peer"), 60000, stuckId, errorCode));
    Bpv7BundleId forwardedId;
    BOOST_REQUIRE(node1.Send("ipn:4.1", StringToBytes("to node 4"), 60000, forwardedId, errorCode));
    Bpv7BundleId localId;
    BOOST_REQUIRE(node1.Send("ipn:2.1", StringToBytes("to node 2"), 60000, localId, errorCode));

    //well inside the contact negotiation timeout node2 is still waiting out on the silent peer
    const boost::posix_time::time_duration shortWait = boost::posix_time::seconds(3);
    BOOST_REQUIRE_LT(static_cast<uint64_t>(shortWait.total_milliseconds()), TcpclV4SessionConfig().m_contactNegotiationTimeoutMilliseconds);
    Bpv7Bundle received;
    BOOST_REQUIRE(node4.Receive(received, shortWait));
    BOOST_REQUIRE(received.GetPayloadBlock()->m_blockTypeSpecificData == StringToBytes("to node 4"));
    BOOST_REQUIRE(node2.Receive(received, shortWait));
    BOOST_REQUIRE(received.GetPayloadBlock()->m_blockTypeSpecificData == StringToBytes("to node 2"));
    BOOST_REQUIRE_EQUAL(node2.GetNumBundlesQueuedForNextHop("ipn:4.0"), 0);
}
