/**
 * @file EndpointId.cpp
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

#include "codec/EndpointId.h"
#include "Logger.h"
#include <boost/lexical_cast.hpp>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::codec;

static const std::string DTN_NONE_STRING("dtn:none");

//boost::lexical_cast<uint64_t> accepts a leading '-' or '+', so only digits are allowed through
static bool ParseDecimalUint64(const char * data, std::size_t length, uint64_t & value) {
    if (length == 0) {
        return false;
    }
    for (std::size_t i = 0; i < length; ++i) {
        if ((data[i] < '0') || (data[i] > '9')) {
            return false;
        }
    }
    try {
        value = boost::lexical_cast<uint64_t>(data, length);
    }
    catch (boost::bad_lexical_cast&) { //overflow
        return false;
    }
    return true;
}

//"//name/demux" -> "name"
static std::string GetDtnAuthority(const std::string & ssp) {
    if ((ssp.size() < 2) || (ssp[0] != '/') || (ssp[1] != '/')) {
        return ssp;
    }
    const std::size_t slashPos = ssp.find('/', 2);
    return (slashPos == std::string::npos) ? ssp.substr(2) : ssp.substr(2, slashPos - 2);
}

EndpointId::EndpointId() :
    m_scheme(EID_SCHEME::DTN),
    m_ipnNodeNumber(0),
    m_ipnServiceNumber(0) { } //a default constructor: X()
EndpointId::~EndpointId() { } //a destructor: ~X()
EndpointId::EndpointId(const EndpointId& o) :
    m_scheme(o.m_scheme),
    m_dtnSsp(o.m_dtnSsp),
    m_ipnNodeNumber(o.m_ipnNodeNumber),
    m_ipnServiceNumber(o.m_ipnServiceNumber) { } //a copy constructor: X(const X&)
EndpointId::EndpointId(EndpointId&& o) :
    m_scheme(o.m_scheme),
    m_dtnSsp(std::move(o.m_dtnSsp)),
    m_ipnNodeNumber(o.m_ipnNodeNumber),
    m_ipnServiceNumber(o.m_ipnServiceNumber) { } //a move constructor: X(X&&)
EndpointId& EndpointId::operator=(const EndpointId& o) { //a copy assignment: operator=(const X&)
    m_scheme = o.m_scheme;
    m_dtnSsp = o.m_dtnSsp;
    m_ipnNodeNumber = o.m_ipnNodeNumber;
    m_ipnServiceNumber = o.m_ipnServiceNumber;
    return *this;
}
EndpointId& EndpointId::operator=(EndpointId && o) { //a move assignment: operator=(X&&)
    m_scheme = o.m_scheme;
    m_dtnSsp = std::move(o.m_dtnSsp);
    m_ipnNodeNumber = o.m_ipnNodeNumber;
    m_ipnServiceNumber = o.m_ipnServiceNumber;
    return *this;
}
bool EndpointId::operator==(const EndpointId & o) const {
    return (m_scheme == o.m_scheme)
        && (m_dtnSsp == o.m_dtnSsp)
        && (m_ipnNodeNumber == o.m_ipnNodeNumber)
        && (m_ipnServiceNumber == o.m_ipnServiceNumber);
}
bool EndpointId::operator!=(const EndpointId & o) const {
    return !(*this == o);
}
bool EndpointId::operator<(const EndpointId & o) const {
    if (m_scheme != o.m_scheme) {
        return (m_scheme < o.m_scheme);
    }
    if (m_scheme == EID_SCHEME::DTN) {
        return (m_dtnSsp < o.m_dtnSsp);
    }
    if (m_ipnNodeNumber == o.m_ipnNodeNumber) {
        return (m_ipnServiceNumber < o.m_ipnServiceNumber);
    }
    return (m_ipnNodeNumber < o.m_ipnNodeNumber);
}
std::ostream& operator<<(std::ostream& os, const EndpointId& o) {
    os << o.ToString();
    return os;
}

EndpointId EndpointId::DtnNone() {
    return EndpointId();
}

EndpointId EndpointId::Ipn(uint64_t nodeNumber, uint64_t serviceNumber) {
    EndpointId eid;
    eid.m_scheme = EID_SCHEME::IPN;
    eid.m_ipnNodeNumber = nodeNumber;
    eid.m_ipnServiceNumber = serviceNumber;
    return eid;
}

bool EndpointId::Dtn(const std::string & ssp, EndpointId & eid, BP7_ERROR_CODE & errorCode) {
    if (ssp.empty()) {
        LOG_ERROR(subprocess) << "dtn scheme specific part cannot be empty";
        errorCode = BP7_ERROR_CODE::INVALID_EID;
        return false;
    }
    if (ssp == "none") {
        eid = EndpointId();
        return true;
    }
    for (std::size_t i = 0; i < ssp.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(ssp[i]);
        if ((c <= ' ') || (c == 0x7f)) {
            LOG_ERROR(subprocess) << "dtn scheme specific part contains whitespace or control characters";
            errorCode = BP7_ERROR_CODE::INVALID_EID;
            return false;
        }
    }
    eid = EndpointId();
    eid.m_dtnSsp = ssp;
    return true;
}

bool EndpointId::Parse(const std::string & uri, EndpointId & eid, BP7_ERROR_CODE & errorCode) {
    if (uri.compare(0, 4, "dtn:") == 0) {
        return Dtn(uri.substr(4), eid, errorCode);
    }
    else if (uri.compare(0, 4, "ipn:") == 0) {
        const char * const ssp = uri.data() + 4;
        const std::size_t sspLength = uri.size() - 4;
        const std::size_t dotPos = uri.find('.', 4);
        uint64_t nodeNumber;
        uint64_t serviceNumber;
        if ((dotPos == std::string::npos)
            || (!ParseDecimalUint64(ssp, dotPos - 4, nodeNumber))
            || (!ParseDecimalUint64(uri.data() + dotPos + 1, sspLength - (dotPos - 4) - 1, serviceNumber)))
        {
            LOG_ERROR(subprocess) << "invalid ipn uri " << uri;
            errorCode = BP7_ERROR_CODE::INVALID_EID;
            return false;
        }
        eid = Ipn(nodeNumber, serviceNumber);
        return true;
    }
    LOG_ERROR(subprocess) << "unrecognized eid scheme in " << uri;
    errorCode = BP7_ERROR_CODE::INVALID_EID;
    return false;
}

std::string EndpointId::ToString() const {
    if (m_scheme == EID_SCHEME::IPN) {
        return "ipn:" + boost::lexical_cast<std::string>(m_ipnNodeNumber) + "." + boost::lexical_cast<std::string>(m_ipnServiceNumber);
    }
    else if (m_dtnSsp.empty()) {
        return DTN_NONE_STRING;
    }
    return "dtn:" + m_dtnSsp;
}

CborItem EndpointId::ToCbor() const {
    CborItem eidArray = CborItem::Array();
    eidArray.Append(CborItem::Uint(static_cast<uint64_t>(m_scheme)));
    if (m_scheme == EID_SCHEME::IPN) {
        CborItem sspArray = CborItem::Array();
        sspArray.Append(CborItem::Uint(m_ipnNodeNumber));
        sspArray.Append(CborItem::Uint(m_ipnServiceNumber));
        eidArray.Append(std::move(sspArray));
    }
    else if (m_dtnSsp.empty()) {
        eidArray.Append(CborItem::Uint(0));
    }
    else {
        eidArray.Append(CborItem::TextString(m_dtnSsp));
    }
    return eidArray;
}

bool EndpointId::FromCbor(const CborItem & item, EndpointId & eid, BP7_ERROR_CODE & errorCode) {
    if ((!item.IsArrayOfSize(2)) || (!item.m_items[0].IsUint())) {
        LOG_ERROR(subprocess) << "eid must be a two element array beginning with a scheme code";
        errorCode = BP7_ERROR_CODE::INVALID_EID;
        return false;
    }
    const uint64_t schemeCode = item.m_items[0].m_value;
    const CborItem & ssp = item.m_items[1];
    if (schemeCode == static_cast<uint64_t>(EID_SCHEME::DTN)) {
        if (ssp.IsUint() && (ssp.m_value == 0)) {
            eid = EndpointId();
            return true;
        }
        else if (ssp.IsTextString() && (!ssp.m_bytes.empty()) && (ssp.GetTextString() != "none")) {
            return Dtn(ssp.GetTextString(), eid, errorCode);
        }
    }
    else if (schemeCode == static_cast<uint64_t>(EID_SCHEME::IPN)) {
        if (ssp.IsArrayOfSize(2) && ssp.m_items[0].IsUint() && ssp.m_items[1].IsUint()) {
            eid = Ipn(ssp.m_items[0].m_value, ssp.m_items[1].m_value);
            return true;
        }
    }
    LOG_ERROR(subprocess) << "invalid eid encoding " << item;
    errorCode = BP7_ERROR_CODE::INVALID_EID;
    return false;
}

EID_SCHEME EndpointId::GetScheme() const {
    return m_scheme;
}
bool EndpointId::IsNull() const {
    return (m_scheme == EID_SCHEME::DTN) && m_dtnSsp.empty();
}
bool EndpointId::IsIpn() const {
    return (m_scheme == EID_SCHEME::IPN);
}
bool EndpointId::IsDtn() const {
    return (m_scheme == EID_SCHEME::DTN);
}
//ipn endpoints are always singletons, dtn endpoints unless the authority begins with '~'
bool EndpointId::IsSingleton() const {
    return IsIpn() || (m_dtnSsp.compare(0, 3, "//~") != 0);
}
uint64_t EndpointId::GetIpnNodeNumber() const {
    return m_ipnNodeNumber;
}
uint64_t EndpointId::GetIpnServiceNumber() const {
    return m_ipnServiceNumber;
}
const std::string & EndpointId::GetDtnSsp() const {
    return m_dtnSsp;
}

bool EndpointId::IsSameNode(const EndpointId & o) const {
    if ((m_scheme != o.m_scheme) || IsNull() || o.IsNull()) {
        return false;
    }
    if (m_scheme == EID_SCHEME::IPN) {
        return (m_ipnNodeNumber == o.m_ipnNodeNumber);
    }
    return (GetDtnAuthority(m_dtnSsp) == GetDtnAuthority(o.m_dtnSsp));
}
