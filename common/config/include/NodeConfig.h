/**
 * @file NodeConfig.h
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
 * The NodeConfig class holds the configuration of one bundle protocol node:
 * its node id, the TCPCLv4 session parameters it advertises, the bundle
 * protocol agent defaults, and the static route table that maps a destination
 * node to a next hop and the TCP address of that next hop.
 * It is loaded from and saved to JSON through JsonSerializable.
 */

#ifndef NODE_CONFIG_H
#define NODE_CONFIG_H 1

#include <string>
#include <memory>
#include <vector>
#include <cstdint>
#include <boost/filesystem/path.hpp>
#include "JsonSerializable.h"
#include "config_lib_export.h"

struct route_config_t {
    /// any endpoint of the destination node, matched by node (ipn node number or dtn authority)
    std::string destinationNodeId;
    std::string nextHopNodeId;
    std::string remoteHostname;
    uint16_t remotePort;

    CONFIG_LIB_EXPORT route_config_t();
    CONFIG_LIB_EXPORT ~route_config_t();

    CONFIG_LIB_EXPORT bool operator==(const route_config_t & o) const;

    //a copy constructor: X(const X&)
    CONFIG_LIB_EXPORT route_config_t(const route_config_t& o);

    //a move constructor: X(X&&)
    CONFIG_LIB_EXPORT route_config_t(route_config_t&& o) noexcept;

    //a copy assignment: operator=(const X&)
    CONFIG_LIB_EXPORT route_config_t& operator=(const route_config_t& o);

    //a move assignment: operator=(X&&)
    CONFIG_LIB_EXPORT route_config_t& operator=(route_config_t&& o) noexcept;
};

typedef std::vector<route_config_t> route_config_vector_t;


class NodeConfig;
typedef std::shared_ptr<NodeConfig> NodeConfig_ptr;

class NodeConfig : public JsonSerializable {


public:
    CONFIG_LIB_EXPORT NodeConfig();
    CONFIG_LIB_EXPORT ~NodeConfig();

    //a copy constructor: X(const X&)
    CONFIG_LIB_EXPORT NodeConfig(const NodeConfig& o);

    //a move constructor: X(X&&)
    CONFIG_LIB_EXPORT NodeConfig(NodeConfig&& o) noexcept;

    //a copy assignment: operator=(const X&)
    CONFIG_LIB_EXPORT NodeConfig& operator=(const NodeConfig& o);

    //a move assignment: operator=(X&&)
    CONFIG_LIB_EXPORT NodeConfig& operator=(NodeConfig&& o) noexcept;

    CONFIG_LIB_EXPORT bool operator==(const NodeConfig & other) const;

    CONFIG_LIB_EXPORT static NodeConfig_ptr CreateFromPtree(const boost::property_tree::ptree & pt);
    CONFIG_LIB_EXPORT static NodeConfig_ptr CreateFromJson(const std::string& jsonString, bool verifyNoUnusedJsonKeys = true);
    CONFIG_LIB_EXPORT static NodeConfig_ptr CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys = true);
    CONFIG_LIB_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;
    CONFIG_LIB_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override;

    /// The first route whose destination is the same node as destinationEidUri, or NULL.
    CONFIG_LIB_EXPORT const route_config_t * FindRoute(const std::string & destinationEidUri) const;

public:

    std::string m_nodeConfigName;
    /// endpoint id of this node, also sent as the TCPCLv4 SESS_INIT node id
    std::string m_nodeId;
    /// 0 disables listening for passive sessions
    uint16_t m_listenPort;
    uint16_t m_keepAliveIntervalSeconds;
    uint64_t m_segmentMruBytes;
    uint64_t m_transferMruBytes;
    uint64_t m_maxUnackedSegments;
    bool m_statusReportsEnabled;
    uint64_t m_defaultLifetimeMilliseconds;
    /// how long after its expiration the status of an originated bundle stays queryable
    uint64_t m_bundleStatusRetentionMilliseconds;
    /// bundles waiting on one next hop beyond this are deleted instead of queued
    uint64_t m_maxQueuedBundlesPerNextHop;
    route_config_vector_t m_routeVector;
};

#endif // NODE_CONFIG_H
