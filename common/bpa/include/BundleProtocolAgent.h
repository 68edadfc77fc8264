/**
 * @file BundleProtocolAgent.h
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
 * The BundleProtocolAgent class is the node-local front door of a bundle protocol node.
 * Applications Send payloads to a destination endpoint, Receive bundles addressed
 * to this node, and query the Status of the bundles they sent.
 * Outbound bundles leave on a TCPCLv4 session to the next hop named by the static
 * route table, fragmenting when a bundle exceeds the peer's transfer MRU.
 * Received bundles are processed on a dedicated thread: they are delivered locally
 * (after reassembly when fragmented), consumed as administrative records, or
 * handed to the outduct of their next hop.  Each next hop has its own outduct thread and queue
 * for forwarded bundles and status reports, so connecting to or waiting on one peer never
 * holds up the processing thread or another peer.  Bundle and reassembly lifetimes are checked lazily,
 * there is no expiry timer.
 */

#ifndef BUNDLE_PROTOCOL_AGENT_H
#define BUNDLE_PROTOCOL_AGENT_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <ostream>
#include <boost/thread.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "codec/BundleV7.h"
#include "codec/Bpv7Fragment.h"
#include "TcpclV4Agent.h"
#include "NodeConfig.h"
#include "Bp7ErrorCodes.h"
#include "bpa_lib_export.h"

enum class BPA_BUNDLE_STATUS : uint8_t
{
    UNKNOWN = 0,
    /// enqueued on a session, not yet acknowledged in full by the next hop
    IN_TRANSIT,
    /// every transfer acknowledged by the next hop
    SENT,
    /// a delivery status report came back, or the destination was this node
    DELIVERED,
    /// lifetime passed before a delivery report arrived
    EXPIRED,
    /// refused, lost with its session, or reported deleted
    DELETED
};
BPA_LIB_EXPORT const char * BpaBundleStatusToString(BPA_BUNDLE_STATUS status);
BPA_LIB_EXPORT std::ostream& operator<<(std::ostream& os, const BPA_BUNDLE_STATUS status);

struct BundleProtocolAgentStats {
    uint64_t m_totalBundlesOriginated;
    uint64_t m_totalBundlesReceived;
    uint64_t m_totalBundlesDelivered;
    uint64_t m_totalBundlesForwarded;
    uint64_t m_totalBundlesDeleted;
    uint64_t m_totalBundlesMalformed;
    uint64_t m_totalFragmentsReceived;
    uint64_t m_totalFragmentsSent;
    uint64_t m_totalStatusReportsSent;
    uint64_t m_totalStatusReportsReceived;

    BPA_LIB_EXPORT BundleProtocolAgentStats();
    BPA_LIB_EXPORT void SetZero();
    BPA_LIB_EXPORT friend std::ostream& operator<<(std::ostream& os, const BundleProtocolAgentStats& o);
};

class BundleProtocolAgent {
private:
    BundleProtocolAgent();
public:
    BPA_LIB_EXPORT BundleProtocolAgent(const NodeConfig & nodeConfig);
    BPA_LIB_EXPORT ~BundleProtocolAgent();

    /** Start the convergence layer (listening when the config's listen port is non-zero) and the processing thread.
     *
     * @return True on success, or False with errorCode set to INVALID_EID for a bad node id
     * or INVALID_ARGUMENT if the listen port could not be bound.
     */
    BPA_LIB_EXPORT bool Start(BP7_ERROR_CODE & errorCode);
    /// Terminate every session and join the processing thread.  Safe to call more than once.
    BPA_LIB_EXPORT void Stop();

    /** Originate a bundle from this node.  Blocks while the bundle is enqueued on the next hop session.
     *
     * @param lifetimeMilliseconds Must be greater than zero.
     * @param bundleId Set to the id to use with Status.
     * @return True once the bundle is on its way (or delivered locally), or False with errorCode set to
     * INVALID_EID, INVALID_ARGUMENT (bad lifetime, no route, or a must-not-fragment bundle too large for the next hop)
     * or SESSION_NOT_ESTABLISHED (the next hop could not be reached).
     */
    BPA_LIB_EXPORT bool Send(const std::string & destinationEidUri, const std::vector<uint8_t> & payload,
        int64_t lifetimeMilliseconds, Bpv7BundleId & bundleId, BP7_ERROR_CODE & errorCode,
        BPV7_BUNDLEFLAG flags = BPV7_BUNDLEFLAG::NO_FLAGS_SET);

    /// Wait up to timeout for the next bundle delivered to this node.  Also drops expired partial reassemblies.
    BPA_LIB_EXPORT bool Receive(Bpv7Bundle & bundle, const boost::posix_time::time_duration & timeout);
    BPA_LIB_EXPORT std::size_t GetNumBundlesAwaitingReceive();

    /// UNKNOWN for ids this node never originated, or whose status was dropped after the retention period.
    BPA_LIB_EXPORT BPA_BUNDLE_STATUS Status(const Bpv7BundleId & bundleId);
    BPA_LIB_EXPORT std::size_t GetNumTrackedBundles();
    /// Bundles queued on the outduct of the given next hop but not yet handed to its session.
    BPA_LIB_EXPORT std::size_t GetNumBundlesQueuedForNextHop(const std::string & nextHopNodeId);

    BPA_LIB_EXPORT void AddRoute(const route_config_t & route);
    BPA_LIB_EXPORT bool RemoveRoute(const std::string & destinationNodeId);
    BPA_LIB_EXPORT bool GetRoute(const EndpointId & destinationEid, route_config_t & route) const;

    BPA_LIB_EXPORT const EndpointId & GetNodeEid() const;
    BPA_LIB_EXPORT uint16_t GetBoundPort() const;
    BPA_LIB_EXPORT BundleProtocolAgentStats GetStats();
    BPA_LIB_EXPORT std::vector<TcpclV4SessionStats> GetSessionStats() const;
    BPA_LIB_EXPORT std::size_t GetNumPendingReassemblies();

private:
    struct received_bundle_t {
        std::vector<uint8_t> serialization;
        std::string previousHopNodeEidUri;
        boost::posix_time::ptime receivedTime;
    };
    struct tracked_bundle_t {
        BPA_BUNDLE_STATUS status;
        uint64_t expirationMilliseconds;
        uint64_t numTransfersPending;
        bool allTransfersEnqueued;
    };
    struct transfer_key_t {
        uint64_t sessionId;
        uint64_t transferId;
        bool operator<(const transfer_key_t & o) const;
    };
    struct transfer_owner_t {
        bool isTracked;
        Bpv7BundleId bundleId;
    };
    struct outbound_bundle_t {
        Bpv7Bundle bundle;
        /// payload length as received, for the status reports about a forwarded bundle
        uint64_t payloadLength;
        bool isStatusReport;
    };
    struct next_hop_outduct_t {
        std::string nextHopNodeId;
        /// one connection attempt at a time to this next hop
        boost::mutex connectMutex;
        boost::mutex queueMutex;
        boost::condition_variable queueCv;
        std::deque<outbound_bundle_t> queue;
        volatile bool running;
        std::unique_ptr<boost::thread> threadPtr;
    };

    BPA_LIB_EXPORT static TcpclV4SessionConfig MakeSessionConfig(const NodeConfig & nodeConfig);

    BPA_LIB_EXPORT void OnWholeBundleReady(std::vector<uint8_t> & wholeBundleVec, TcpclV4Session & session);
    BPA_LIB_EXPORT void OnOutboundTransferFinished(uint64_t transferId, bool wasAcked, TcpclV4Session & session);
    BPA_LIB_EXPORT void ProcessingThreadFunc();
    BPA_LIB_EXPORT void ProcessReceivedBundle(received_bundle_t & received);
    BPA_LIB_EXPORT void DeliverLocally(Bpv7Bundle && bundle);
    BPA_LIB_EXPORT void ProcessAdministrativeRecord(const Bpv7Bundle & bundle);
    BPA_LIB_EXPORT void Forward(Bpv7Bundle & bundle, const boost::posix_time::ptime & receivedTime);
    BPA_LIB_EXPORT void RemoveExpiredReassemblies();
    BPA_LIB_EXPORT void RemoveStaleTrackedBundles();
    BPA_LIB_EXPORT void DeleteBundle(const Bpv7PrimaryBlock & primary, uint64_t payloadLength, BPV7_STATUS_REPORT_REASON_CODE reasonCode);
    BPA_LIB_EXPORT void SendStatusReportIfRequested(const Bpv7PrimaryBlock & primary, uint64_t payloadLength,
        Bpv7BundleStatusReport::STATUS_INDEX statusIndex, BPV7_STATUS_REPORT_REASON_CODE reasonCode);

    BPA_LIB_EXPORT std::shared_ptr<next_hop_outduct_t> GetOrCreateOutduct(const std::string & nextHopNodeId);
    BPA_LIB_EXPORT void OutductThreadFunc(next_hop_outduct_t * outductPtr);
    BPA_LIB_EXPORT bool EnqueueToNextHop(Bpv7Bundle & bundle, uint64_t payloadLength, bool isStatusReport, BP7_ERROR_CODE & errorCode);
    BPA_LIB_EXPORT std::shared_ptr<TcpclV4Session> GetOrConnectSession(const route_config_t & route, BP7_ERROR_CODE & errorCode);
    BPA_LIB_EXPORT bool SendToNextHop(const Bpv7Bundle & bundle, const Bpv7BundleId * trackedBundleIdPtr, BP7_ERROR_CODE & errorCode);
    BPA_LIB_EXPORT void RegisterTransfer(uint64_t sessionId, uint64_t transferId, const Bpv7BundleId * trackedBundleIdPtr);
    BPA_LIB_EXPORT void ApplyTransferResult_Locked(const Bpv7BundleId & bundleId, bool wasAcked);
    BPA_LIB_EXPORT void SetTrackedStatus(const Bpv7BundleId & bundleId, BPA_BUNDLE_STATUS newStatus);

    const NodeConfig M_NODE_CONFIG;
    EndpointId m_nodeEid;
    TimestampUtil::Bpv7CreationTimestampGenerator m_timestampGenerator;
    Bpv7FragmentManager m_fragmentManager;
    TcpclV4Agent m_tcpclAgent;
    bool m_started;

    //read-mostly route table
    mutable boost::shared_mutex m_routesSharedMutex;
    route_config_vector_t m_routeVector;

    boost::mutex m_outductsMapMutex;
    std::map<std::string, std::shared_ptr<next_hop_outduct_t> > m_outductsMap;
    bool m_outductsAcceptingBundles;

    boost::mutex m_receivedQueueMutex;
    boost::condition_variable m_receivedQueueCv;
    std::deque<received_bundle_t> m_receivedQueue;
    bool m_expiryCheckRequested;
    volatile bool m_runningProcessingThread;
    std::unique_ptr<boost::thread> m_processingThreadPtr;

    boost::mutex m_deliveredQueueMutex;
    boost::condition_variable m_deliveredQueueCv;
    std::deque<Bpv7Bundle> m_deliveredQueue;

    boost::mutex m_trackingMutex;
    std::map<Bpv7BundleId, tracked_bundle_t> m_trackedBundlesMap;
    std::map<transfer_key_t, transfer_owner_t> m_transferOwnersMap;
    /// transfers that finished before SendBundle returned their id
    std::map<transfer_key_t, bool> m_earlyFinishedTransfersMap;

    boost::mutex m_statsMutex;
    BundleProtocolAgentStats m_stats;
};

#endif //BUNDLE_PROTOCOL_AGENT_H
