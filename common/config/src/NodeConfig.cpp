/**
 * @file NodeConfig.cpp
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

#include "NodeConfig.h"
#include "Logger.h"
#include "codec/EndpointId.h"
#include <memory>
#include <limits>
#include <boost/foreach.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::config;

static bool IsValidEidString(const std::string & eidUri) {
    EndpointId eid;
    BP7_ERROR_CODE errorCode;
    return EndpointId::Parse(eidUri, eid, errorCode);
}

route_config_t::route_config_t() :
    destinationNodeId(""),
    nextHopNodeId(""),
    remoteHostname(""),
    remotePort(0) {}

route_config_t::~route_config_t() {}


//a copy constructor: X(const X&)
route_config_t::route_config_t(const route_config_t& o) :
    destinationNodeId(o.destinationNodeId),
    nextHopNodeId(o.nextHopNodeId),
    remoteHostname(o.remoteHostname),
    remotePort(o.remotePort) { }

//a move constructor: X(X&&)
route_config_t::route_config_t(route_config_t&& o) noexcept :
    destinationNodeId(std::move(o.destinationNodeId)),
    nextHopNodeId(std::move(o.nextHopNodeId)),
    remoteHostname(std::move(o.remoteHostname)),
    remotePort(o.remotePort) { }

//a copy assignment: operator=(const X&)
route_config_t& route_config_t::operator=(const route_config_t& o) {
    destinationNodeId = o.destinationNodeId;
    nextHopNodeId = o.nextHopNodeId;
    remoteHostname = o.remoteHostname;
    remotePort = o.remotePort;
    return *this;
}

//a move assignment: operator=(X&&)
route_config_t& route_config_t::operator=(route_config_t&& o) noexcept {
    destinationNodeId = std::move(o.destinationNodeId);
    nextHopNodeId = std::move(o.nextHopNodeId);
    remoteHostname = std::move(o.remoteHostname);
    remotePort = o.remotePort;
    return *this;
}

bool route_config_t::operator==(const route_config_t & o) const {
    return (destinationNodeId == o.destinationNodeId) &&
        (nextHopNodeId == o.nextHopNodeId) &&
        (remoteHostname == o.remoteHostname) &&
        (remotePort == o.remotePort);
}

NodeConfig::NodeConfig() :
    m_nodeConfigName("unnamed node config"),
    m_nodeId("ipn:1.0"),
    m_listenPort(4556),
    m_keepAliveIntervalSeconds(30),
    m_segmentMruBytes(1000000),
    m_transferMruBytes(100000000),
    m_maxUnackedSegments(64),
    m_statusReportsEnabled(false),
    m_defaultLifetimeMilliseconds(3600000),
    m_bundleStatusRetentionMilliseconds(60000),
    m_maxQueuedBundlesPerNextHop(1000),
    m_routeVector() {}

NodeConfig::~NodeConfig() {
}

//a copy constructor: X(const X&)
NodeConfig::NodeConfig(const NodeConfig& o) :
    m_nodeConfigName(o.m_nodeConfigName),
    m_nodeId(o.m_nodeId),
    m_listenPort(o.m_listenPort),
    m_keepAliveIntervalSeconds(o.m_keepAliveIntervalSeconds),
    m_segmentMruBytes(o.m_segmentMruBytes),
    m_transferMruBytes(o.m_transferMruBytes),
    m_maxUnackedSegments(o.m_maxUnackedSegments),
    m_statusReportsEnabled(o.m_statusReportsEnabled),
    m_defaultLifetimeMilliseconds(o.m_defaultLifetimeMilliseconds),
    m_bundleStatusRetentionMilliseconds(o.m_bundleStatusRetentionMilliseconds),
    m_maxQueuedBundlesPerNextHop(o.m_maxQueuedBundlesPerNextHop),
    m_routeVector(o.m_routeVector) { }

//a move constructor: X(X&&)
NodeConfig::NodeConfig(NodeConfig&& o) noexcept :
    m_nodeConfigName(std::move(o.m_nodeConfigName)),
    m_nodeId(std::move(o.m_nodeId)),
    m_listenPort(o.m_listenPort),
    m_keepAliveIntervalSeconds(o.m_keepAliveIntervalSeconds),
    m_segmentMruBytes(o.m_segmentMruBytes),
    m_transferMruBytes(o.m_transferMruBytes),
    m_maxUnackedSegments(o.m_maxUnackedSegments),
    m_statusReportsEnabled(o.m_statusReportsEnabled),
    m_defaultLifetimeMilliseconds(o.m_defaultLifetimeMilliseconds),
    m_bundleStatusRetentionMilliseconds(o.m_bundleStatusRetentionMilliseconds),
    m_maxQueuedBundlesPerNextHop(o.m_maxQueuedBundlesPerNextHop),
    m_routeVector(std::move(o.m_routeVector)) { }

//a copy assignment: operator=(const X&)
NodeConfig& NodeConfig::operator=(const NodeConfig& o) {
    m_nodeConfigName = o.m_nodeConfigName;
    m_nodeId = o.m_nodeId;
    m_listenPort = o.m_listenPort;
    m_keepAliveIntervalSeconds = o.m_keepAliveIntervalSeconds;
    m_segmentMruBytes = o.m_segmentMruBytes;
    m_transferMruBytes = o.m_transferMruBytes;
    m_maxUnackedSegments = o.m_maxUnackedSegments;
    m_statusReportsEnabled = o.m_statusReportsEnabled;
    m_defaultLifetimeMilliseconds = o.m_defaultLifetimeMilliseconds;
    m_bundleStatusRetentionMilliseconds = o.m_bundleStatusRetentionMilliseconds;
    m_maxQueuedBundlesPerNextHop = o.m_maxQueuedBundlesPerNextHop;
    m_routeVector = o.m_routeVector;
    return *this;
}

//a move assignment: operator=(X&&)
NodeConfig& NodeConfig::operator=(NodeConfig&& o) noexcept {
    m_nodeConfigName = std::move(o.m_nodeConfigName);
    m_nodeId = std::move(o.m_nodeId);
    m_listenPort = o.m_listenPort;
    m_keepAliveIntervalSeconds = o.m_keepAliveIntervalSeconds;
    m_segmentMruBytes = o.m_segmentMruBytes;
    m_transferMruBytes = o.m_transferMruBytes;
    m_maxUnackedSegments = o.m_maxUnackedSegments;
    m_statusReportsEnabled = o.m_statusReportsEnabled;
    m_defaultLifetimeMilliseconds = o.m_defaultLifetimeMilliseconds;
    m_bundleStatusRetentionMilliseconds = o.m_bundleStatusRetentionMilliseconds;
    m_maxQueuedBundlesPerNextHop = o.m_maxQueuedBundlesPerNextHop;
    m_routeVector = std::move(o.m_routeVector);
    return *this;
}

bool NodeConfig::operator==(const NodeConfig & o) const {
    return (m_nodeConfigName == o.m_nodeConfigName) &&
        (m_nodeId == o.m_nodeId) &&
        (m_listenPort == o.m_listenPort) &&
        (m_keepAliveIntervalSeconds == o.m_keepAliveIntervalSeconds) &&
        (m_segmentMruBytes == o.m_segmentMruBytes) &&
        (m_transferMruBytes == o.m_transferMruBytes) &&
        (m_maxUnackedSegments == o.m_maxUnackedSegments) &&
        (m_statusReportsEnabled == o.m_statusReportsEnabled) &&
        (m_defaultLifetimeMilliseconds == o.m_defaultLifetimeMilliseconds) &&
        (m_bundleStatusRetentionMilliseconds == o.m_bundleStatusRetentionMilliseconds) &&
        (m_maxQueuedBundlesPerNextHop == o.m_maxQueuedBundlesPerNextHop) &&
        (m_routeVector == o.m_routeVector);
}

bool NodeConfig::SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
    try {
        m_nodeConfigName = pt.get<std::string>("nodeConfigName");
        m_nodeId = pt.get<std::string>("nodeId");
        m_listenPort = pt.get<uint16_t>("listenPort");
        m_keepAliveIntervalSeconds = pt.get<uint16_t>("keepAliveIntervalSeconds");
        m_segmentMruBytes = pt.get<uint64_t>("segmentMruBytes");
        m_transferMruBytes = pt.get<uint64_t>("transferMruBytes");
        m_maxUnackedSegments = pt.get<uint64_t>("maxUnackedSegments", 64); //optional
        m_statusReportsEnabled = pt.get<bool>("statusReportsEnabled");
        m_defaultLifetimeMilliseconds = pt.get<uint64_t>("defaultLifetimeMilliseconds");
        m_bundleStatusRetentionMilliseconds = pt.get<uint64_t>("bundleStatusRetentionMilliseconds", 60000); //optional
        m_maxQueuedBundlesPerNextHop = pt.get<uint64_t>("maxQueuedBundlesPerNextHop", 1000); //optional
    }
    catch (const boost::property_tree::ptree_error & e) {
        LOG_ERROR(subprocess) << "parsing JSON node config: " << e.what();
        return false;
    }
    if (m_nodeConfigName == "") {
        LOG_ERROR(subprocess) << "nodeConfigName must be defined and not empty string";
        return false;
    }
    {
        EndpointId nodeEid;
        BP7_ERROR_CODE errorCode;
        if ((!EndpointId::Parse(m_nodeId, nodeEid, errorCode)) || nodeEid.IsNull()) {
            LOG_ERROR(subprocess) << "invalid nodeId " << m_nodeId << ", must be a valid ipn or dtn endpoint id other than dtn:none";
            return false;
        }
    }
    if (m_segmentMruBytes == 0) {
        LOG_ERROR(subprocess) << "segmentMruBytes must be non-zero";
        return false;
    }
    if (m_transferMruBytes == 0) {
        LOG_ERROR(subprocess) << "transferMruBytes must be non-zero";
        return false;
    }
    if (m_maxUnackedSegments == 0) {
        LOG_ERROR(subprocess) << "maxUnackedSegments must be non-zero";
        return false;
    }
    if (m_defaultLifetimeMilliseconds == 0) {
        LOG_ERROR(subprocess) << "defaultLifetimeMilliseconds must be non-zero";
        return false;
    }
    if (m_defaultLifetimeMilliseconds > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        LOG_ERROR(subprocess) << "defaultLifetimeMilliseconds is too large";
        return false;
    }
    if (m_maxQueuedBundlesPerNextHop == 0) {
        LOG_ERROR(subprocess) << "maxQueuedBundlesPerNextHop must be non-zero";
        return false;
    }

    //for non-throw versions of get_child which return a reference to the second parameter
    static const boost::property_tree::ptree EMPTY_PTREE;

    const boost::property_tree::ptree & routeVectorPt = pt.get_child("routeVector", EMPTY_PTREE); //non-throw version
    m_routeVector.resize(routeVectorPt.size());
    unsigned int vectorIndex = 0;
    BOOST_FOREACH(const boost::property_tree::ptree::value_type & routePt, routeVectorPt) {
        route_config_t & routeConfig = m_routeVector[vectorIndex++];
        try {
            routeConfig.destinationNodeId = routePt.second.get<std::string>("destinationNodeId");
            routeConfig.nextHopNodeId = routePt.second.get<std::string>("nextHopNodeId");
            routeConfig.remoteHostname = routePt.second.get<std::string>("remoteHostname");
            routeConfig.remotePort = routePt.second.get<uint16_t>("remotePort");
        }
        catch (const boost::property_tree::ptree_error & e) {
            LOG_ERROR(subprocess) << "error parsing JSON routeVector[" << (vectorIndex - 1) << "]: " << e.what();
            return false;
        }
        if (!IsValidEidString(routeConfig.destinationNodeId)) {
            LOG_ERROR(subprocess) << "error parsing JSON routeVector[" << (vectorIndex - 1) << "]: invalid destinationNodeId " << routeConfig.destinationNodeId;
            return false;
        }
        if (!IsValidEidString(routeConfig.nextHopNodeId)) {
            LOG_ERROR(subprocess) << "error parsing JSON routeVector[" << (vectorIndex - 1) << "]: invalid nextHopNodeId " << routeConfig.nextHopNodeId;
            return false;
        }
        if (routeConfig.remoteHostname == "") {
            LOG_ERROR(subprocess) << "error parsing JSON routeVector[" << (vectorIndex - 1) << "]: invalid remoteHostname, must not be empty";
            return false;
        }
        if (routeConfig.remotePort == 0) {
            LOG_ERROR(subprocess) << "error parsing JSON routeVector[" << (vectorIndex - 1) << "]: invalid remotePort, must be non-zero";
            return false;
        }
    }

    return true;
}

NodeConfig_ptr NodeConfig::CreateFromJson(const std::string& jsonString, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    NodeConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonString(jsonString, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        //verify that there are no unused variables within the original json
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInString(*config, jsonString, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

NodeConfig_ptr NodeConfig::CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    NodeConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonFilePath(jsonFilePath, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        //verify that there are no unused variables within the original json
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInFilePath(*config, jsonFilePath, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

NodeConfig_ptr NodeConfig::CreateFromPtree(const boost::property_tree::ptree & pt) {

    NodeConfig_ptr ptrNodeConfig = std::make_shared<NodeConfig>();
    if (!ptrNodeConfig->SetValuesFromPropertyTree(pt)) {
        ptrNodeConfig = NodeConfig_ptr(); //failed, so delete and set it NULL
    }
    return ptrNodeConfig;
}

boost::property_tree::ptree NodeConfig::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("nodeConfigName", m_nodeConfigName);
    pt.put("nodeId", m_nodeId);
    pt.put("listenPort", m_listenPort);
    pt.put("keepAliveIntervalSeconds", m_keepAliveIntervalSeconds);
    pt.put("segmentMruBytes", m_segmentMruBytes);
    pt.put("transferMruBytes", m_transferMruBytes);
    pt.put("maxUnackedSegments", m_maxUnackedSegments);
    pt.put("statusReportsEnabled", m_statusReportsEnabled);
    pt.put("defaultLifetimeMilliseconds", m_defaultLifetimeMilliseconds);
    pt.put("bundleStatusRetentionMilliseconds", m_bundleStatusRetentionMilliseconds);
    pt.put("maxQueuedBundlesPerNextHop", m_maxQueuedBundlesPerNextHop);
    boost::property_tree::ptree & routeVectorPt = pt.put_child("routeVector", m_routeVector.empty() ? boost::property_tree::ptree("[]") : boost::property_tree::ptree());
    for (route_config_vector_t::const_iterator it = m_routeVector.cbegin(); it != m_routeVector.cend(); ++it) {
        const route_config_t & routeConfig = *it;
        boost::property_tree::ptree & routePt = (routeVectorPt.push_back(std::make_pair("", boost::property_tree::ptree())))->second; //using "" as key creates json array
        routePt.put("destinationNodeId", routeConfig.destinationNodeId);
        routePt.put("nextHopNodeId", routeConfig.nextHopNodeId);
        routePt.put("remoteHostname", routeConfig.remoteHostname);
        routePt.put("remotePort", routeConfig.remotePort);
    }
    return pt;
}

const route_config_t * NodeConfig::FindRoute(const std::string & destinationEidUri) const {
    EndpointId destinationEid;
    BP7_ERROR_CODE errorCode;
    if (!EndpointId::Parse(destinationEidUri, destinationEid, errorCode)) {
        return NULL;
    }
    for (route_config_vector_t::const_iterator it = m_routeVector.cbegin(); it != m_routeVector.cend(); ++it) {
        EndpointId routeDestinationEid;
        if (EndpointId::Parse(it->destinationNodeId, routeDestinationEid, errorCode) && routeDestinationEid.IsSameNode(destinationEid)) {
            return &(*it);
        }
    }
    return NULL;
}
