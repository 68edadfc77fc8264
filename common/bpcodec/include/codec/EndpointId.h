/**
 * @file EndpointId.h
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
 * Bundle Protocol Version 7 endpoint identifiers (RFC 9171 section 4.2.5.1).
 * An EndpointId is an immutable value in either the "dtn" scheme
 * (a scheme specific part string, or the null endpoint dtn:none)
 * or the "ipn" scheme (a node number and a service number).
 * The CBOR representation is [1, 0] for dtn:none, [1, "ssp"] for other dtn
 * endpoints and [2, [node, service]] for ipn endpoints.
 */

#ifndef ENDPOINT_ID_H
#define ENDPOINT_ID_H 1

#include <cstdint>
#include <string>
#include <ostream>
#include "codec/Cbor.h"
#include "Bp7ErrorCodes.h"
#include "bpcodec_export.h"

enum class EID_SCHEME : uint8_t {
    DTN = 1,
    IPN = 2
};

class EndpointId {
public:
    BPCODEC_EXPORT EndpointId(); //a default constructor: X() (dtn:none)
    BPCODEC_EXPORT ~EndpointId(); //a destructor: ~X()
    BPCODEC_EXPORT EndpointId(const EndpointId& o); //a copy constructor: X(const X&)
    BPCODEC_EXPORT EndpointId(EndpointId&& o); //a move constructor: X(X&&)
    BPCODEC_EXPORT EndpointId& operator=(const EndpointId& o); //a copy assignment: operator=(const X&)
    BPCODEC_EXPORT EndpointId& operator=(EndpointId&& o); //a move assignment: operator=(X&&)
    BPCODEC_EXPORT bool operator==(const EndpointId & o) const; //operator ==
    BPCODEC_EXPORT bool operator!=(const EndpointId & o) const; //operator !=
    BPCODEC_EXPORT bool operator<(const EndpointId & o) const; //operator < so it can be used as a map key
    BPCODEC_EXPORT friend std::ostream& operator<<(std::ostream& os, const EndpointId& o);

    BPCODEC_EXPORT static EndpointId DtnNone();
    BPCODEC_EXPORT static EndpointId Ipn(uint64_t nodeNumber, uint64_t serviceNumber);
    /// @param ssp The text following "dtn:", for example "//node1/inbox".  Must not be empty.
    BPCODEC_EXPORT static bool Dtn(const std::string & ssp, EndpointId & eid, BP7_ERROR_CODE & errorCode);

    /** Parse a "dtn:none", "dtn:<ssp>" or "ipn:<node>.<service>" uri.
     *
     * @return True on success, or False with errorCode set to INVALID_EID.
     */
    BPCODEC_EXPORT static bool Parse(const std::string & uri, EndpointId & eid, BP7_ERROR_CODE & errorCode);
    BPCODEC_EXPORT std::string ToString() const;

    BPCODEC_EXPORT CborItem ToCbor() const;
    BPCODEC_EXPORT static bool FromCbor(const CborItem & item, EndpointId & eid, BP7_ERROR_CODE & errorCode);

    BPCODEC_EXPORT EID_SCHEME GetScheme() const;
    BPCODEC_EXPORT bool IsNull() const;
    BPCODEC_EXPORT bool IsIpn() const;
    BPCODEC_EXPORT bool IsDtn() const;
    BPCODEC_EXPORT bool IsSingleton() const;
    BPCODEC_EXPORT uint64_t GetIpnNodeNumber() const;
    BPCODEC_EXPORT uint64_t GetIpnServiceNumber() const;
    BPCODEC_EXPORT const std::string & GetDtnSsp() const;

    /** The node that owns this endpoint: "ipn:N.S" belongs to node N and
     * "dtn://name/demux" belongs to the authority "name".
     * Used by the bundle protocol agent to match local endpoints and routes.
     */
    BPCODEC_EXPORT bool IsSameNode(const EndpointId & o) const;

private:
    EID_SCHEME m_scheme;
    std::string m_dtnSsp; //empty for dtn:none
    uint64_t m_ipnNodeNumber;
    uint64_t m_ipnServiceNumber;
};

#endif //ENDPOINT_ID_H
