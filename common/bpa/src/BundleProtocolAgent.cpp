/**
 * @file BundleProtocolAgent.cpp
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

#include "BundleProtocolAgent.h"
#include "Logger.h"
#include <limits>
#include <boost/bind/bind.hpp>
#include <boost/make_unique.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::bpa;

//room for the fragment offset and total length fields and a longer payload byte string head
static constexpr uint64_t FRAGMENT_HEADER_ALLOWANCE_BYTES = 32;
static constexpr uint64_t NO_TRANSFER_ID = UINT64_MAX;

const char * BpaBundleStatusToString(BPA_BUNDLE_STATUS status) {
    switch (status) {
        case BPA_BUNDLE_STATUS::UNKNOWN: return "Unknown";
        case BPA_BUNDLE_STATUS::IN_TRANSIT: return "InTransit";
        case BPA_BUNDLE_STATUS::SENT: return "Sent";
        case BPA_BUNDLE_STATUS::DELIVERED: return "Delivered";
        case BPA_BUNDLE_STATUS::EXPIRED: return "Expired";
        case BPA_BUNDLE_STATUS::DELETED: return "Deleted";
    }
    return "Invalid";
}
std::ostream& operator<<(std::ostream& os, const BPA_BUNDLE_STATUS status) {
    os << BpaBundleStatusToString(status);
    return os;
}

BundleProtocolAgentStats::BundleProtocolAgentStats() {
    SetZero();
}
void BundleProtocolAgentStats::SetZero() {
    m_totalBundlesOriginated = 0;
    m_totalBundlesReceived = 0;
    m_totalBundlesDelivered = 0;
    m_totalBundlesForwarded = 0;
    m_totalBundlesDeleted = 0;
    m_totalBundlesMalformed = 0;
    m_totalFragmentsReceived = 0;
    m_totalFragmentsSent = 0;
    m_totalStatusReportsSent = 0;
    m_totalStatusReportsReceived = 0;
}
std::ostream& operator<<(std::ostream& os, const BundleProtocolAgentStats& o) {
    os << "originated=" << o.m_totalBundlesOriginated
        << " received=" << o.m_totalBundlesReceived
        << " delivered=" << o.m_totalBundlesDelivered
        << " forwarded=" << o.m_totalBundlesForwarded
        << " deleted=" << o.m_totalBundlesDeleted
        << " malformed=" << o.m_totalBundlesMalformed
        << " fragmentsReceived=" << o.m_totalFragmentsReceived
        << " fragmentsSent=" << o.m_totalFragmentsSent
        << " statusReportsSent=" << o.m_totalStatusReportsSent
        << " statusReportsReceived=" << o.m_totalStatusReportsReceived;
    return os;
}

bool BundleProtocolAgent::transfer_key_t::operator<(const transfer_key_t & o) const {
    if (sessionId == o.sessionId) {
        return (transferId < o.transferId);
    }
    return (sessionId < o.sessionId);
}

TcpclV4SessionConfig BundleProtocolAgent::MakeSessionConfig(const NodeConfig & nodeConfig) {
    TcpclV4SessionConfig sessionConfig;
    sessionConfig.m_localNodeEidUri = nodeConfig.m_nodeId;
    sessionConfig.m_keepAliveIntervalSeconds = nodeConfig.m_keepAliveIntervalSeconds;
    sessionConfig.m_segmentMru = nodeConfig.m_segmentMruBytes;
    sessionConfig.m_transferMru = nodeConfig.m_transferMruBytes;
    sessionConfig.m_maxUnackedSegments = nodeConfig.m_maxUnackedSegments;
    return sessionConfig;
}

BundleProtocolAgent::BundleProtocolAgent(const NodeConfig & nodeConfig) :
    M_NODE_CONFIG(nodeConfig),
    m_tcpclAgent(MakeSessionConfig(nodeConfig)),
    m_started(false),
    m_routeVector(nodeConfig.m_routeVector),
    m_outductsAcceptingBundles(false),
    m_expiryCheckRequested(false),
    m_runningProcessingThread(false)
{
}

BundleProtocolAgent::~BundleProtocolAgent() {
    Stop();
}

bool BundleProtocolAgent::Start(BP7_ERROR_CODE & errorCode) {
    if (m_started) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent already started";
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    if ((!EndpointId::Parse(M_NODE_CONFIG.m_nodeId, m_nodeEid, errorCode)) || m_nodeEid.IsNull()) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent invalid node id " << M_NODE_CONFIG.m_nodeId;
        errorCode = BP7_ERROR_CODE::INVALID_EID;
        return false;
    }
    m_tcpclAgent.SetWholeBundleReadyCallback(boost::bind(&BundleProtocolAgent::OnWholeBundleReady, this,
        boost::placeholders::_1, boost::placeholders::_2));
    m_tcpclAgent.SetOutboundTransferFinishedCallback(boost::bind(&BundleProtocolAgent::OnOutboundTransferFinished, this,
        boost::placeholders::_1, boost::placeholders::_2, boost::placeholders::_3));

    {
        boost::mutex::scoped_lock lock(m_outductsMapMutex);
        m_outductsAcceptingBundles = true;
    }
    m_runningProcessingThread = true;
    m_processingThreadPtr = boost::make_unique<boost::thread>(
        boost::bind(&BundleProtocolAgent::ProcessingThreadFunc, this)); //create and start the worker thread

    if (!m_tcpclAgent.Start(M_NODE_CONFIG.m_listenPort != 0, M_NODE_CONFIG.m_listenPort, errorCode)) {
        m_started = true; //let Stop join the worker thread
        Stop();
        return false;
    }
    m_started = true;
    LOG_INFO(subprocess) << "BundleProtocolAgent " << m_nodeEid << " started"
        << ((M_NODE_CONFIG.m_listenPort != 0) ? (", listening on port " + std::to_string(m_tcpclAgent.GetBoundPort())) : std::string(""));
    errorCode = BP7_ERROR_CODE::NONE;
    return true;
}

void BundleProtocolAgent::Stop() {
    if (!m_started) {
        return;
    }
    m_started = false;

    m_runningProcessingThread = false; //thread stopping criteria
    //lock then unlock the mutex to prevent a missed notify after setting thread stopping criteria above
    m_receivedQueueMutex.lock();
    m_receivedQueueMutex.unlock();
    m_receivedQueueCv.notify_one();

    std::vector<std::shared_ptr<next_hop_outduct_t> > outducts;
    {
        boost::mutex::scoped_lock lock(m_outductsMapMutex);
        m_outductsAcceptingBundles = false;
        for (std::map<std::string, std::shared_ptr<next_hop_outduct_t> >::iterator it = m_outductsMap.begin(); it != m_outductsMap.end(); ++it) {
            outducts.push_back(it->second);
        }
        m_outductsMap.clear();
    }
    for (std::size_t i = 0; i < outducts.size(); ++i) {
        next_hop_outduct_t & outduct = *outducts[i];
        outduct.running = false;
        outduct.queueMutex.lock();
        outduct.queueMutex.unlock();
        outduct.queueCv.notify_one();
    }

    //closing the sessions also releases an outduct thread blocked in SendBundle or waiting on a session
    m_tcpclAgent.Stop();

    if (m_processingThreadPtr) {
        try {
            m_processingThreadPtr->join();
            m_processingThreadPtr.reset(); //delete it
        }
        catch (const boost::thread_resource_error&) {
            LOG_ERROR(subprocess) << "error stopping BundleProtocolAgent processing thread";
        }
    }
    for (std::size_t i = 0; i < outducts.size(); ++i) {
        next_hop_outduct_t & outduct = *outducts[i];
        if (outduct.threadPtr) {
            try {
                outduct.threadPtr->join();
                outduct.threadPtr.reset(); //delete it
            }
            catch (const boost::thread_resource_error&) {
                LOG_ERROR(subprocess) << "error stopping BundleProtocolAgent outduct thread for " << outduct.nextHopNodeId;
            }
        }
        if (!outduct.queue.empty()) {
            LOG_WARNING(subprocess) << "BundleProtocolAgent dropping " << outduct.queue.size()
                << " bundles still queued for next hop " << outduct.nextHopNodeId;
            outduct.queue.clear();
        }
    }
    m_deliveredQueueMutex.lock();
    m_deliveredQueueMutex.unlock();
    m_deliveredQueueCv.notify_all();

    LOG_INFO(subprocess) << "BundleProtocolAgent " << m_nodeEid << " stopped: " << GetStats();
}

bool BundleProtocolAgent::Send(const std::string & destinationEidUri, const std::vector<uint8_t> & payload,
    int64_t lifetimeMilliseconds, Bpv7BundleId & bundleId, BP7_ERROR_CODE & errorCode, BPV7_BUNDLEFLAG flags)
{
    if (!m_started) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent::Send called before Start";
        errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
        return false;
    }
    EndpointId destinationEid;
    if (!EndpointId::Parse(destinationEidUri, destinationEid, errorCode)) {
        return false; //prints message
    }
    if (destinationEid.IsNull()) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent cannot send to " << destinationEid;
        errorCode = BP7_ERROR_CODE::INVALID_EID;
        return false;
    }
    Bpv7Bundle bundle;
    if (!Bpv7Bundle::Create(m_nodeEid, destinationEid, m_nodeEid, payload, lifetimeMilliseconds,
        flags, bundle, errorCode, &m_timestampGenerator))
    {
        return false;
    }
    bundleId = bundle.GetBundleId();

    if (destinationEid.IsSameNode(m_nodeEid)) {
        {
            boost::mutex::scoped_lock lock(m_trackingMutex);
            tracked_bundle_t & tracked = m_trackedBundlesMap[bundleId];
            tracked.status = BPA_BUNDLE_STATUS::DELIVERED;
            tracked.expirationMilliseconds = bundle.m_primaryBlock.GetExpirationMilliseconds();
            tracked.numTransfersPending = 0;
            tracked.allTransfersEnqueued = true;
        }
        {
            boost::mutex::scoped_lock lock(m_statsMutex);
            ++m_stats.m_totalBundlesOriginated;
        }
        DeliverLocally(std::move(bundle));
        errorCode = BP7_ERROR_CODE::NONE;
        return true;
    }

    route_config_t route;
    if (!GetRoute(destinationEid, route)) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent has no route to " << destinationEid;
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }

    {
        boost::mutex::scoped_lock lock(m_trackingMutex);
        tracked_bundle_t & tracked = m_trackedBundlesMap[bundleId];
        tracked.status = BPA_BUNDLE_STATUS::IN_TRANSIT;
        tracked.expirationMilliseconds = bundle.m_primaryBlock.GetExpirationMilliseconds();
        tracked.numTransfersPending = 0;
        tracked.allTransfersEnqueued = false;
    }
    if (!SendToNextHop(bundle, &bundleId, errorCode)) {
        return false;
    }
    boost::mutex::scoped_lock lock(m_statsMutex);
    ++m_stats.m_totalBundlesOriginated;
    return true;
}

bool BundleProtocolAgent::Receive(Bpv7Bundle & bundle, const boost::posix_time::time_duration & timeout) {
    {
        boost::mutex::scoped_lock lock(m_receivedQueueMutex);
        m_expiryCheckRequested = true;
    }
    m_receivedQueueCv.notify_one();

    const boost::posix_time::ptime timeoutExpiry = boost::posix_time::microsec_clock::universal_time() + timeout;
    boost::mutex::scoped_lock lock(m_deliveredQueueMutex);
    while (true) {
        while (!m_deliveredQueue.empty()) {
            Bpv7Bundle & front = m_deliveredQueue.front();
            if (front.HasExpired(TimestampUtil::GetMillisecondsSinceEpochRfc5050())) {
                LOG_WARNING(subprocess) << "BundleProtocolAgent dropping expired undelivered bundle " << front.GetBundleId();
                m_deliveredQueue.pop_front();
                continue;
            }
            bundle = std::move(front);
            m_deliveredQueue.pop_front();
            return true;
        }
        if (!m_started) {
            return false;
        }
        //Returns: false if the call is returning because the time specified by abs_time was reached, true otherwise.
        if (!m_deliveredQueueCv.timed_wait(lock, timeoutExpiry)) {
            if (m_deliveredQueue.empty()) {
                return false;
            }
        }
    }
}

std::size_t BundleProtocolAgent::GetNumBundlesAwaitingReceive() {
    boost::mutex::scoped_lock lock(m_deliveredQueueMutex);
    return m_deliveredQueue.size();
}

BPA_BUNDLE_STATUS BundleProtocolAgent::Status(const Bpv7BundleId & bundleId) {
    boost::mutex::scoped_lock lock(m_trackingMutex);
    std::map<Bpv7BundleId, tracked_bundle_t>::iterator it = m_trackedBundlesMap.find(bundleId);
    if (it == m_trackedBundlesMap.end()) {
        return BPA_BUNDLE_STATUS::UNKNOWN;
    }
    tracked_bundle_t & tracked = it->second;
    if (((tracked.status == BPA_BUNDLE_STATUS::IN_TRANSIT) || (tracked.status == BPA_BUNDLE_STATUS::SENT))
        && (TimestampUtil::GetMillisecondsSinceEpochRfc5050() > tracked.expirationMilliseconds))
    {
        tracked.status = BPA_BUNDLE_STATUS::EXPIRED;
    }
    return tracked.status;
}

std::size_t BundleProtocolAgent::GetNumTrackedBundles() {
    boost::mutex::scoped_lock lock(m_trackingMutex);
    return m_trackedBundlesMap.size();
}

std::size_t BundleProtocolAgent::GetNumBundlesQueuedForNextHop(const std::string & nextHopNodeId) {
    std::shared_ptr<next_hop_outduct_t> outductPtr;
    {
        boost::mutex::scoped_lock lock(m_outductsMapMutex);
        std::map<std::string, std::shared_ptr<next_hop_outduct_t> >::const_iterator it = m_outductsMap.find(nextHopNodeId);
        if (it == m_outductsMap.cend()) {
            return 0;
        }
        outductPtr = it->second;
    }
    boost::mutex::scoped_lock lock(outductPtr->queueMutex);
    return outductPtr->queue.size();
}

void BundleProtocolAgent::AddRoute(const route_config_t & route) {
    boost::unique_lock<boost::shared_mutex> lock(m_routesSharedMutex);
    m_routeVector.push_back(route);
}

bool BundleProtocolAgent::RemoveRoute(const std::string & destinationNodeId) {
    boost::unique_lock<boost::shared_mutex> lock(m_routesSharedMutex);
    for (route_config_vector_t::iterator it = m_routeVector.begin(); it != m_routeVector.end(); ++it) {
        if (it->destinationNodeId == destinationNodeId) {
            m_routeVector.erase(it);
            return true;
        }
    }
    return false;
}

bool BundleProtocolAgent::GetRoute(const EndpointId & destinationEid, route_config_t & route) const {
    boost::shared_lock<boost::shared_mutex> lock(m_routesSharedMutex);
    for (route_config_vector_t::const_iterator it = m_routeVector.cbegin(); it != m_routeVector.cend(); ++it) {
        EndpointId routeDestinationEid;
        BP7_ERROR_CODE errorCode;
        if (EndpointId::Parse(it->destinationNodeId, routeDestinationEid, errorCode) && routeDestinationEid.IsSameNode(destinationEid)) {
            route = *it;
            return true;
        }
    }
    return false;
}

const EndpointId & BundleProtocolAgent::GetNodeEid() const {
    return m_nodeEid;
}

uint16_t BundleProtocolAgent::GetBoundPort() const {
    return m_tcpclAgent.GetBoundPort();
}

BundleProtocolAgentStats BundleProtocolAgent::GetStats() {
    boost::mutex::scoped_lock lock(m_statsMutex);
    return m_stats;
}

std::vector<TcpclV4SessionStats> BundleProtocolAgent::GetSessionStats() const {
    const std::vector<std::shared_ptr<TcpclV4Session> > sessions = m_tcpclAgent.GetSessions();
    std::vector<TcpclV4SessionStats> statsVec;
    statsVec.reserve(sessions.size());
    for (std::size_t i = 0; i < sessions.size(); ++i) {
        statsVec.push_back(sessions[i]->GetStats());
    }
    return statsVec;
}

std::size_t BundleProtocolAgent::GetNumPendingReassemblies() {
    return m_fragmentManager.GetNumPendingReassemblies();
}

//called by the tcpcl io_service thread, must not block
void BundleProtocolAgent::OnWholeBundleReady(std::vector<uint8_t> & wholeBundleVec, TcpclV4Session & session) {
    received_bundle_t received;
    received.serialization = std::move(wholeBundleVec);
    received.previousHopNodeEidUri = session.GetRemoteNodeEidUri();
    received.receivedTime = boost::posix_time::microsec_clock::universal_time();
    m_receivedQueueMutex.lock();
    m_receivedQueue.push_back(std::move(received));
    m_receivedQueueMutex.unlock();
    m_receivedQueueCv.notify_one();
}

//called by the tcpcl io_service thread, must not block
void BundleProtocolAgent::OnOutboundTransferFinished(uint64_t transferId, bool wasAcked, TcpclV4Session & session) {
    transfer_key_t key;
    key.sessionId = session.GetSessionId();
    key.transferId = transferId;
    boost::mutex::scoped_lock lock(m_trackingMutex);
    std::map<transfer_key_t, transfer_owner_t>::iterator it = m_transferOwnersMap.find(key);
    if (it == m_transferOwnersMap.end()) {
        m_earlyFinishedTransfersMap[key] = wasAcked;
        return;
    }
    if (it->second.isTracked) {
        const Bpv7BundleId bundleId = it->second.bundleId;
        m_transferOwnersMap.erase(it);
        ApplyTransferResult_Locked(bundleId, wasAcked);
    }
    else {
        if (!wasAcked) {
            LOG_WARNING(subprocess) << "BundleProtocolAgent forwarded transfer " << transferId << " on session " << key.sessionId << " was not acknowledged";
        }
        m_transferOwnersMap.erase(it);
    }
}

void BundleProtocolAgent::RegisterTransfer(uint64_t sessionId, uint64_t transferId, const Bpv7BundleId * trackedBundleIdPtr) {
    transfer_key_t key;
    key.sessionId = sessionId;
    key.transferId = transferId;
    boost::mutex::scoped_lock lock(m_trackingMutex);
    std::map<transfer_key_t, bool>::iterator earlyIt = m_earlyFinishedTransfersMap.find(key);
    if (earlyIt != m_earlyFinishedTransfersMap.end()) {
        const bool wasAcked = earlyIt->second;
        m_earlyFinishedTransfersMap.erase(earlyIt);
        if (trackedBundleIdPtr) {
            ++m_trackedBundlesMap[*trackedBundleIdPtr].numTransfersPending;
            ApplyTransferResult_Locked(*trackedBundleIdPtr, wasAcked);
        }
        return;
    }
    transfer_owner_t & owner = m_transferOwnersMap[key];
    owner.isTracked = (trackedBundleIdPtr != NULL);
    if (trackedBundleIdPtr) {
        owner.bundleId = *trackedBundleIdPtr;
        ++m_trackedBundlesMap[*trackedBundleIdPtr].numTransfersPending;
    }
}

void BundleProtocolAgent::ApplyTransferResult_Locked(const Bpv7BundleId & bundleId, bool wasAcked) {
    std::map<Bpv7BundleId, tracked_bundle_t>::iterator it = m_trackedBundlesMap.find(bundleId);
    if (it == m_trackedBundlesMap.end()) {
        return;
    }
    tracked_bundle_t & tracked = it->second;
    if (tracked.numTransfersPending) {
        --tracked.numTransfersPending;
    }
    if (tracked.status != BPA_BUNDLE_STATUS::IN_TRANSIT) {
        return;
    }
    if (!wasAcked) {
        LOG_WARNING(subprocess) << "BundleProtocolAgent bundle " << bundleId << " was not accepted by the next hop";
        tracked.status = BPA_BUNDLE_STATUS::DELETED;
    }
    else if (tracked.allTransfersEnqueued && (tracked.numTransfersPending == 0)) {
        tracked.status = BPA_BUNDLE_STATUS::SENT;
    }
}

void BundleProtocolAgent::SetTrackedStatus(const Bpv7BundleId & bundleId, BPA_BUNDLE_STATUS newStatus) {
    boost::mutex::scoped_lock lock(m_trackingMutex);
    std::map<Bpv7BundleId, tracked_bundle_t>::iterator it = m_trackedBundlesMap.find(bundleId);
    if (it == m_trackedBundlesMap.end()) {
        LOG_DEBUG(subprocess) << "BundleProtocolAgent status report for untracked bundle " << bundleId;
        return;
    }
    if (it->second.status != BPA_BUNDLE_STATUS::DELIVERED) {
        it->second.status = newStatus;
    }
}

//returns NULL once stopping
std::shared_ptr<BundleProtocolAgent::next_hop_outduct_t> BundleProtocolAgent::GetOrCreateOutduct(const std::string & nextHopNodeId) {
    boost::mutex::scoped_lock lock(m_outductsMapMutex);
    if (!m_outductsAcceptingBundles) {
        return std::shared_ptr<next_hop_outduct_t>();
    }
    std::shared_ptr<next_hop_outduct_t> & outductPtr = m_outductsMap[nextHopNodeId];
    if (!outductPtr) {
        outductPtr = std::make_shared<next_hop_outduct_t>();
        outductPtr->nextHopNodeId = nextHopNodeId;
        outductPtr->running = true;
        outductPtr->threadPtr = boost::make_unique<boost::thread>(
            boost::bind(&BundleProtocolAgent::OutductThreadFunc, this, outductPtr.get())); //create and start the worker thread
        LOG_INFO(subprocess) << "BundleProtocolAgent created outduct for next hop " << nextHopNodeId;
    }
    return outductPtr;
}

bool BundleProtocolAgent::EnqueueToNextHop(Bpv7Bundle & bundle, uint64_t payloadLength, bool isStatusReport, BP7_ERROR_CODE & errorCode) {
    route_config_t route;
    if (!GetRoute(bundle.m_primaryBlock.m_destinationEid, route)) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent has no route to " << bundle.m_primaryBlock.m_destinationEid;
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    std::shared_ptr<next_hop_outduct_t> outductPtr = GetOrCreateOutduct(route.nextHopNodeId);
    if (!outductPtr) {
        errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
        return false;
    }
    {
        boost::mutex::scoped_lock lock(outductPtr->queueMutex);
        if (outductPtr->queue.size() >= M_NODE_CONFIG.m_maxQueuedBundlesPerNextHop) {
            LOG_WARNING(subprocess) << "BundleProtocolAgent outduct for next hop " << route.nextHopNodeId
                << " already holds " << outductPtr->queue.size() << " bundles";
            errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
            return false;
        }
        outductPtr->queue.emplace_back();
        outbound_bundle_t & outbound = outductPtr->queue.back();
        outbound.bundle = std::move(bundle);
        outbound.payloadLength = payloadLength;
        outbound.isStatusReport = isStatusReport;
    }
    outductPtr->queueCv.notify_one();
    errorCode = BP7_ERROR_CODE::NONE;
    return true;
}

void BundleProtocolAgent::OutductThreadFunc(next_hop_outduct_t * outductPtr) {
    next_hop_outduct_t & outduct = *outductPtr;
    while (outduct.running) {
        outbound_bundle_t outbound;
        {
            boost::mutex::scoped_lock lock(outduct.queueMutex);
            if (outduct.running && outduct.queue.empty()) { //lock mutex (above) before checking flag
                outduct.queueCv.wait(lock); // call lock.unlock() and blocks the current thread
            }
            if ((!outduct.running) || outduct.queue.empty()) {
                continue;
            }
            outbound = std::move(outduct.queue.front());
            outduct.queue.pop_front();
        }
        BP7_ERROR_CODE errorCode;
        if (SendToNextHop(outbound.bundle, NULL, errorCode)) {
            if (!outbound.isStatusReport) {
                {
                    boost::mutex::scoped_lock lock(m_statsMutex);
                    ++m_stats.m_totalBundlesForwarded;
                }
                SendStatusReportIfRequested(outbound.bundle.m_primaryBlock, outbound.payloadLength,
                    Bpv7BundleStatusReport::STATUS_INDEX::FORWARDED, BPV7_STATUS_REPORT_REASON_CODE::NO_FURTHER_INFORMATION);
            }
        }
        else if (outbound.isStatusReport) {
            LOG_WARNING(subprocess) << "BundleProtocolAgent could not send a status report to "
                << outbound.bundle.m_primaryBlock.m_destinationEid << ": " << errorCode;
        }
        else {
            const BPV7_STATUS_REPORT_REASON_CODE reasonCode = (errorCode == BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED) ?
                BPV7_STATUS_REPORT_REASON_CODE::NO_TIMELY_CONTACT_WITH_NEXT_NODE_ON_ROUTE :
                BPV7_STATUS_REPORT_REASON_CODE::NO_KNOWN_ROUTE_DESTINATION_FROM_HERE;
            DeleteBundle(outbound.bundle.m_primaryBlock, outbound.payloadLength, reasonCode);
        }
    }
    LOG_INFO(subprocess) << "BundleProtocolAgent::OutductThreadFunc thread for " << outduct.nextHopNodeId << " exiting";
}

std::shared_ptr<TcpclV4Session> BundleProtocolAgent::GetOrConnectSession(const route_config_t & route, BP7_ERROR_CODE & errorCode) {
    std::shared_ptr<TcpclV4Session> sessionPtr = m_tcpclAgent.GetEstablishedSessionToNode(route.nextHopNodeId);
    if (sessionPtr) {
        return sessionPtr;
    }
    std::shared_ptr<next_hop_outduct_t> outductPtr = GetOrCreateOutduct(route.nextHopNodeId);
    if (!outductPtr) {
        errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
        return sessionPtr;
    }
    boost::mutex::scoped_lock lock(outductPtr->connectMutex);
    //another thread may have connected while this one waited
    sessionPtr = m_tcpclAgent.GetEstablishedSessionToNode(route.nextHopNodeId);
    if (sessionPtr) {
        return sessionPtr;
    }
    m_tcpclAgent.RemoveClosedSessions();
    LOG_INFO(subprocess) << "BundleProtocolAgent connecting to next hop " << route.nextHopNodeId
        << " at " << route.remoteHostname << ":" << route.remotePort;
    sessionPtr = m_tcpclAgent.Connect(route.remoteHostname, route.remotePort);
    if (!sessionPtr) {
        errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
        return sessionPtr;
    }
    const TcpclV4SessionConfig & sessionConfig = m_tcpclAgent.GetSessionConfig();
    if (!sessionPtr->WaitForEstablished(boost::posix_time::milliseconds(sessionConfig.m_contactNegotiationTimeoutMilliseconds + 1000))) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent could not establish a session with next hop " << route.nextHopNodeId
            << ": " << sessionPtr->GetCloseErrorCode();
        sessionPtr->Close();
        errorCode = BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED;
        return std::shared_ptr<TcpclV4Session>();
    }
    EndpointId nextHopEid;
    EndpointId remoteEid;
    if ((!EndpointId::Parse(route.nextHopNodeId, nextHopEid, errorCode))
        || (!EndpointId::Parse(sessionPtr->GetRemoteNodeEidUri(), remoteEid, errorCode))
        || (!remoteEid.IsSameNode(nextHopEid)))
    {
        LOG_WARNING(subprocess) << "BundleProtocolAgent next hop " << route.nextHopNodeId << " at "
            << route.remoteHostname << ":" << route.remotePort << " identified itself as " << sessionPtr->GetRemoteNodeEidUri();
    }
    return sessionPtr;
}

bool BundleProtocolAgent::SendToNextHop(const Bpv7Bundle & bundle, const Bpv7BundleId * trackedBundleIdPtr, BP7_ERROR_CODE & errorCode) {
    route_config_t route;
    if (!GetRoute(bundle.m_primaryBlock.m_destinationEid, route)) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent has no route to " << bundle.m_primaryBlock.m_destinationEid;
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        if (trackedBundleIdPtr) {
            boost::mutex::scoped_lock lock(m_trackingMutex);
            m_trackedBundlesMap.erase(*trackedBundleIdPtr);
        }
        return false;
    }
    std::shared_ptr<TcpclV4Session> sessionPtr = GetOrConnectSession(route, errorCode);
    if (!sessionPtr) {
        if (trackedBundleIdPtr) {
            boost::mutex::scoped_lock lock(m_trackingMutex);
            m_trackedBundlesMap.erase(*trackedBundleIdPtr);
        }
        return false;
    }

    std::vector<std::vector<uint8_t> > serializations(1);
    bundle.Serialize(serializations[0]);
    const uint64_t remoteTransferMru = sessionPtr->GetRemoteTransferMru();
    if (serializations[0].size() > remoteTransferMru) {
        const uint64_t payloadLength = bundle.GetPayloadLength();
        const uint64_t overheadBytes = (serializations[0].size() - payloadLength) + FRAGMENT_HEADER_ALLOWANCE_BYTES;
        std::vector<Bpv7Bundle> fragments;
        if ((overheadBytes >= remoteTransferMru)
            || (!Bpv7Fragmenter::Fragment(bundle, remoteTransferMru - overheadBytes, fragments, errorCode)))
        {
            LOG_ERROR(subprocess) << "BundleProtocolAgent bundle of " << serializations[0].size()
                << " bytes cannot be fragmented to fit the next hop's transfer MRU of " << remoteTransferMru << " bytes";
            errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
            if (trackedBundleIdPtr) {
                boost::mutex::scoped_lock lock(m_trackingMutex);
                m_trackedBundlesMap.erase(*trackedBundleIdPtr);
            }
            return false;
        }
        LOG_INFO(subprocess) << "BundleProtocolAgent sending bundle " << bundle.GetBundleId() << " as " << fragments.size() << " fragments";
        serializations.resize(fragments.size());
        for (std::size_t i = 0; i < fragments.size(); ++i) {
            serializations[i].clear();
            fragments[i].Serialize(serializations[i]);
        }
        boost::mutex::scoped_lock lock(m_statsMutex);
        m_stats.m_totalFragmentsSent += fragments.size();
    }

    const uint64_t sessionId = sessionPtr->GetSessionId();
    std::size_t numEnqueued = 0;
    for (std::size_t i = 0; i < serializations.size(); ++i) {
        uint64_t transferId = NO_TRANSFER_ID;
        const bool success = sessionPtr->SendBundle(serializations[i], transferId, errorCode);
        if (transferId != NO_TRANSFER_ID) {
            //a failed transfer that got an id is reported through the finished callback when the session closes
            RegisterTransfer(sessionId, transferId, trackedBundleIdPtr);
            ++numEnqueued;
        }
        if (!success) {
            LOG_ERROR(subprocess) << "BundleProtocolAgent failed to send to next hop " << route.nextHopNodeId << ": " << errorCode;
            if (trackedBundleIdPtr) {
                boost::mutex::scoped_lock lock(m_trackingMutex);
                if (numEnqueued == 0) {
                    m_trackedBundlesMap.erase(*trackedBundleIdPtr);
                }
                else {
                    tracked_bundle_t & tracked = m_trackedBundlesMap[*trackedBundleIdPtr];
                    tracked.allTransfersEnqueued = true;
                    tracked.status = BPA_BUNDLE_STATUS::DELETED;
                }
            }
            return false;
        }
    }
    if (trackedBundleIdPtr) {
        boost::mutex::scoped_lock lock(m_trackingMutex);
        tracked_bundle_t & tracked = m_trackedBundlesMap[*trackedBundleIdPtr];
        tracked.allTransfersEnqueued = true;
        if ((tracked.status == BPA_BUNDLE_STATUS::IN_TRANSIT) && (tracked.numTransfersPending == 0)) {
            tracked.status = BPA_BUNDLE_STATUS::SENT;
        }
    }
    errorCode = BP7_ERROR_CODE::NONE;
    return true;
}

void BundleProtocolAgent::ProcessingThreadFunc() {
    while (m_runningProcessingThread) {
        received_bundle_t received;
        bool haveBundle = false;
        bool doExpiryCheck = false;
        {
            boost::mutex::scoped_lock lock(m_receivedQueueMutex);
            if (m_runningProcessingThread && m_receivedQueue.empty() && (!m_expiryCheckRequested)) { //lock mutex (above) before checking flag
                m_receivedQueueCv.wait(lock); // call lock.unlock() and blocks the current thread
            }
            //thread is now unblocked, and the lock is reacquired by invoking lock.lock()
            if (!m_receivedQueue.empty()) {
                received = std::move(m_receivedQueue.front());
                m_receivedQueue.pop_front();
                haveBundle = true;
            }
            doExpiryCheck = m_expiryCheckRequested || haveBundle;
            m_expiryCheckRequested = false;
        }
        if (!m_runningProcessingThread) {
            break;
        }
        if (doExpiryCheck) {
            RemoveExpiredReassemblies();
            RemoveStaleTrackedBundles();
        }
        if (haveBundle) {
            ProcessReceivedBundle(received);
        }
    }
    LOG_INFO(subprocess) << "BundleProtocolAgent::ProcessingThreadFunc thread exiting";
}

void BundleProtocolAgent::ProcessReceivedBundle(received_bundle_t & received) {
    Bpv7Bundle bundle;
    BP7_ERROR_CODE errorCode;
    if (!Bpv7Bundle::Deserialize(received.serialization, bundle, errorCode)) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent discarding a " << received.serialization.size()
            << " byte bundle from " << received.previousHopNodeEidUri << ": " << errorCode;
        boost::mutex::scoped_lock lock(m_statsMutex);
        ++m_stats.m_totalBundlesMalformed;
        return;
    }
    {
        boost::mutex::scoped_lock lock(m_statsMutex);
        ++m_stats.m_totalBundlesReceived;
    }
    const Bpv7PrimaryBlock & primary = bundle.m_primaryBlock;
    LOG_DEBUG(subprocess) << "BundleProtocolAgent received bundle " << bundle.GetBundleId() << " for "
        << primary.m_destinationEid << " from " << received.previousHopNodeEidUri;

    SendStatusReportIfRequested(primary, bundle.GetPayloadLength(), Bpv7BundleStatusReport::STATUS_INDEX::RECEIVED,
        BPV7_STATUS_REPORT_REASON_CODE::NO_FURTHER_INFORMATION);

    if (bundle.HasExpired(TimestampUtil::GetMillisecondsSinceEpochRfc5050())) {
        LOG_WARNING(subprocess) << "BundleProtocolAgent bundle " << bundle.GetBundleId() << " arrived after its lifetime expired";
        DeleteBundle(primary, bundle.GetPayloadLength(), BPV7_STATUS_REPORT_REASON_CODE::LIFETIME_EXPIRED);
        return;
    }

    if (!primary.m_destinationEid.IsSameNode(m_nodeEid)) {
        Forward(bundle, received.receivedTime);
        return;
    }

    if (primary.IsFragment()) {
        {
            boost::mutex::scoped_lock lock(m_statsMutex);
            ++m_stats.m_totalFragmentsReceived;
        }
        Bpv7Bundle assembled;
        if (!m_fragmentManager.AddFragmentAndGetComplete(std::move(bundle), assembled, errorCode)) {
            if (errorCode != BP7_ERROR_CODE::INCOMPLETE) {
                LOG_ERROR(subprocess) << "BundleProtocolAgent rejected a fragment: " << errorCode;
                boost::mutex::scoped_lock lock(m_statsMutex);
                ++m_stats.m_totalBundlesDeleted;
            }
            return;
        }
        LOG_INFO(subprocess) << "BundleProtocolAgent reassembled bundle " << assembled.GetBundleId();
        bundle = std::move(assembled);
    }

    if (bundle.m_primaryBlock.IsAdminRecord()) {
        ProcessAdministrativeRecord(bundle);
        return;
    }
    SendStatusReportIfRequested(bundle.m_primaryBlock, bundle.GetPayloadLength(), Bpv7BundleStatusReport::STATUS_INDEX::DELIVERED,
        BPV7_STATUS_REPORT_REASON_CODE::NO_FURTHER_INFORMATION);
    DeliverLocally(std::move(bundle));
}

void BundleProtocolAgent::DeliverLocally(Bpv7Bundle && bundle) {
    {
        boost::mutex::scoped_lock lock(m_statsMutex);
        ++m_stats.m_totalBundlesDelivered;
    }
    m_deliveredQueueMutex.lock();
    m_deliveredQueue.push_back(std::move(bundle));
    m_deliveredQueueMutex.unlock();
    m_deliveredQueueCv.notify_all();
}

void BundleProtocolAgent::ProcessAdministrativeRecord(const Bpv7Bundle & bundle) {
    const Bpv7CanonicalBlock * payloadBlock = bundle.GetPayloadBlock();
    Bpv7BundleStatusReport report;
    BP7_ERROR_CODE errorCode;
    if ((payloadBlock == NULL) || (!report.DeserializeAdministrativeRecord(payloadBlock->m_blockTypeSpecificData, errorCode))) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent discarding an unreadable administrative record from " << bundle.m_primaryBlock.m_sourceNodeId;
        boost::mutex::scoped_lock lock(m_statsMutex);
        ++m_stats.m_totalBundlesMalformed;
        return;
    }
    {
        boost::mutex::scoped_lock lock(m_statsMutex);
        ++m_stats.m_totalStatusReportsReceived;
    }
    //status is tracked per originated bundle, not per fragment
    const Bpv7BundleId subjectId(report.m_subjectSourceNodeId, report.m_subjectCreationTimestamp, false, 0);
    LOG_INFO(subprocess) << "BundleProtocolAgent status report from " << bundle.m_primaryBlock.m_sourceNodeId
        << " for bundle " << subjectId << " reason " << report.m_reasonCode;
    if (report.IsAsserted(Bpv7BundleStatusReport::STATUS_INDEX::DELETED)) {
        SetTrackedStatus(subjectId, BPA_BUNDLE_STATUS::DELETED);
    }
    else if (report.IsAsserted(Bpv7BundleStatusReport::STATUS_INDEX::DELIVERED) && (!report.m_subjectIsFragment)) {
        SetTrackedStatus(subjectId, BPA_BUNDLE_STATUS::DELIVERED);
    }
}

void BundleProtocolAgent::Forward(Bpv7Bundle & bundle, const boost::posix_time::ptime & receivedTime) {
    BP7_ERROR_CODE errorCode;
    const uint64_t payloadLength = bundle.GetPayloadLength();

    //hop count
    for (std::size_t i = 0; i < bundle.m_canonicalBlocks.size(); ++i) {
        Bpv7CanonicalBlock & block = bundle.m_canonicalBlocks[i];
        if (block.m_blockTypeCode != BPV7_BLOCK_TYPE_CODE::HOP_COUNT) {
            continue;
        }
        Bpv7HopCountBlockData hopCount;
        if (!Bpv7HopCountBlockData::FromCanonicalBlock(block, hopCount, errorCode)) {
            DeleteBundle(bundle.m_primaryBlock, payloadLength, BPV7_STATUS_REPORT_REASON_CODE::BLOCK_UNINTELLIGIBLE);
            return;
        }
        ++hopCount.m_hopCount;
        if (hopCount.HasExceededLimit()) {
            LOG_WARNING(subprocess) << "BundleProtocolAgent bundle " << bundle.GetBundleId() << " exceeded its hop limit of " << hopCount.m_hopLimit;
            DeleteBundle(bundle.m_primaryBlock, payloadLength, BPV7_STATUS_REPORT_REASON_CODE::HOP_LIMIT_EXCEEDED);
            return;
        }
        block.m_blockTypeSpecificData = std::move(hopCount.ToCanonicalBlock(block.m_crcType).m_blockTypeSpecificData);
    }

    //bundle age accumulates the time spent at this node
    const uint64_t residenceMilliseconds = static_cast<uint64_t>(
        (boost::posix_time::microsec_clock::universal_time() - receivedTime).total_milliseconds());
    for (std::size_t i = 0; i < bundle.m_canonicalBlocks.size(); ++i) {
        Bpv7CanonicalBlock & block = bundle.m_canonicalBlocks[i];
        if (block.m_blockTypeCode != BPV7_BLOCK_TYPE_CODE::BUNDLE_AGE) {
            continue;
        }
        Bpv7BundleAgeBlockData bundleAge;
        if (Bpv7BundleAgeBlockData::FromCanonicalBlock(block, bundleAge, errorCode)) {
            bundleAge.m_bundleAgeMilliseconds += residenceMilliseconds;
            block.m_blockTypeSpecificData = std::move(bundleAge.ToCanonicalBlock(block.m_crcType).m_blockTypeSpecificData);
        }
    }

    //replace any previous node block with this node
    for (std::vector<Bpv7CanonicalBlock>::iterator it = bundle.m_canonicalBlocks.begin(); it != bundle.m_canonicalBlocks.end(); ) {
        if (it->m_blockTypeCode == BPV7_BLOCK_TYPE_CODE::PREVIOUS_NODE) {
            it = bundle.m_canonicalBlocks.erase(it);
        }
        else {
            ++it;
        }
    }
    if (!bundle.AddExtensionBlock(Bpv7PreviousNodeBlockData(m_nodeEid).ToCanonicalBlock(), errorCode)) {
        LOG_ERROR(subprocess) << "BundleProtocolAgent could not add a previous node block: " << errorCode;
    }

    //the outduct thread counts the bundle as forwarded once its session takes it
    if (!EnqueueToNextHop(bundle, payloadLength, false, errorCode)) {
        const BPV7_STATUS_REPORT_REASON_CODE reasonCode = (errorCode == BP7_ERROR_CODE::SESSION_NOT_ESTABLISHED) ?
            BPV7_STATUS_REPORT_REASON_CODE::NO_TIMELY_CONTACT_WITH_NEXT_NODE_ON_ROUTE :
            BPV7_STATUS_REPORT_REASON_CODE::NO_KNOWN_ROUTE_DESTINATION_FROM_HERE;
        DeleteBundle(bundle.m_primaryBlock, payloadLength, reasonCode);
    }
}

void BundleProtocolAgent::RemoveExpiredReassemblies() {
    std::vector<Bpv7Bundle> expiredFragments;
    const std::size_t numRemoved = m_fragmentManager.RemoveExpired(TimestampUtil::GetMillisecondsSinceEpochRfc5050(), expiredFragments);
    if (numRemoved == 0) {
        return;
    }
    LOG_WARNING(subprocess) << "BundleProtocolAgent dropped " << numRemoved << " expired partial reassemblies";
    for (std::size_t i = 0; i < expiredFragments.size(); ++i) {
        //the report is about the whole application data unit, not the fragment that happened to be kept
        Bpv7PrimaryBlock primary = expiredFragments[i].m_primaryBlock;
        primary.m_bundleProcessingControlFlags &= (~BPV7_BUNDLEFLAG::ISFRAGMENT);
        DeleteBundle(primary, primary.m_totalApplicationDataUnitLength, BPV7_STATUS_REPORT_REASON_CODE::LIFETIME_EXPIRED);
    }
}

void BundleProtocolAgent::RemoveStaleTrackedBundles() {
    const uint64_t nowMilliseconds = TimestampUtil::GetMillisecondsSinceEpochRfc5050();
    const uint64_t retentionMilliseconds = M_NODE_CONFIG.m_bundleStatusRetentionMilliseconds;
    std::size_t numRemoved = 0;
    boost::mutex::scoped_lock lock(m_trackingMutex);
    for (std::map<Bpv7BundleId, tracked_bundle_t>::iterator it = m_trackedBundlesMap.begin(); it != m_trackedBundlesMap.end(); ) {
        const uint64_t expirationMilliseconds = it->second.expirationMilliseconds;
        const uint64_t retainUntilMilliseconds = (retentionMilliseconds > (UINT64_MAX - expirationMilliseconds)) ?
            UINT64_MAX : (expirationMilliseconds + retentionMilliseconds);
        if (nowMilliseconds > retainUntilMilliseconds) {
            it = m_trackedBundlesMap.erase(it);
            ++numRemoved;
        }
        else {
            ++it;
        }
    }
    if (numRemoved) {
        LOG_DEBUG(subprocess) << "BundleProtocolAgent dropped the status of " << numRemoved << " expired bundles";
    }
}

void BundleProtocolAgent::DeleteBundle(const Bpv7PrimaryBlock & primary, uint64_t payloadLength, BPV7_STATUS_REPORT_REASON_CODE reasonCode) {
    {
        boost::mutex::scoped_lock lock(m_statsMutex);
        ++m_stats.m_totalBundlesDeleted;
    }
    SendStatusReportIfRequested(primary, payloadLength, Bpv7BundleStatusReport::STATUS_INDEX::DELETED, reasonCode);
}

void BundleProtocolAgent::SendStatusReportIfRequested(const Bpv7PrimaryBlock & primary, uint64_t payloadLength,
    Bpv7BundleStatusReport::STATUS_INDEX statusIndex, BPV7_STATUS_REPORT_REASON_CODE reasonCode)
{
    static const BPV7_BUNDLEFLAG REQUEST_FLAGS[static_cast<uint8_t>(Bpv7BundleStatusReport::STATUS_INDEX::NUM_STATUS_ASSERTIONS)] = {
        BPV7_BUNDLEFLAG::RECEPTION_STATUS_REPORTS_REQUESTED,
        BPV7_BUNDLEFLAG::FORWARDING_STATUS_REPORTS_REQUESTED,
        BPV7_BUNDLEFLAG::DELIVERY_STATUS_REPORTS_REQUESTED,
        BPV7_BUNDLEFLAG::DELETION_STATUS_REPORTS_REQUESTED
    };
    //never report on a status report
    if ((!M_NODE_CONFIG.m_statusReportsEnabled)
        || primary.IsAdminRecord()
        || (!primary.HasFlag(REQUEST_FLAGS[static_cast<uint8_t>(statusIndex)]))
        || primary.m_reportToEid.IsNull())
    {
        return;
    }

    Bpv7BundleStatusReport report;
    if (primary.HasFlag(BPV7_BUNDLEFLAG::STATUSTIME_REQUESTED)) {
        report.AssertWithTime(statusIndex, TimestampUtil::GetMillisecondsSinceEpochRfc5050());
    }
    else {
        report.Assert(statusIndex);
    }
    report.m_reasonCode = reasonCode;
    report.m_subjectSourceNodeId = primary.m_sourceNodeId;
    report.m_subjectCreationTimestamp = primary.m_creationTimestamp;
    report.m_subjectIsFragment = primary.IsFragment();
    report.m_subjectFragmentOffset = primary.IsFragment() ? primary.m_fragmentOffset : 0;
    report.m_subjectPayloadLength = primary.IsFragment() ? payloadLength : 0;

    Bpv7Bundle reportBundle;
    BP7_ERROR_CODE errorCode;
    if (!Bpv7Bundle::Create(m_nodeEid, primary.m_reportToEid, EndpointId::DtnNone(), report.SerializeAdministrativeRecord(),
        static_cast<int64_t>(M_NODE_CONFIG.m_defaultLifetimeMilliseconds), BPV7_BUNDLEFLAG::ADMINRECORD,
        reportBundle, errorCode, &m_timestampGenerator))
    {
        LOG_ERROR(subprocess) << "BundleProtocolAgent could not build a status report: " << errorCode;
        return;
    }
    {
        boost::mutex::scoped_lock lock(m_statsMutex);
        ++m_stats.m_totalStatusReportsSent;
    }
    if (primary.m_reportToEid.IsSameNode(m_nodeEid)) {
        ProcessAdministrativeRecord(reportBundle);
    }
    else if (!EnqueueToNextHop(reportBundle, 0, true, errorCode)) {
        LOG_WARNING(subprocess) << "BundleProtocolAgent could not send a status report to " << primary.m_reportToEid << ": " << errorCode;
    }
}
