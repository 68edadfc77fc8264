/**
 * @file Bpv7AdministrativeRecords.cpp
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

#include "codec/bpv7.h"
#include "Logger.h"

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::codec;

Bpv7BundleStatusReport::status_assertion_t::status_assertion_t() :
    asserted(false),
    hasTime(false),
    timeMillisecondsSinceDtnEpoch(0) { }
bool Bpv7BundleStatusReport::status_assertion_t::operator==(const status_assertion_t & o) const {
    return (asserted == o.asserted)
        && (hasTime == o.hasTime)
        && (timeMillisecondsSinceDtnEpoch == o.timeMillisecondsSinceDtnEpoch);
}

Bpv7BundleStatusReport::Bpv7BundleStatusReport() :
    m_reasonCode(BPV7_STATUS_REPORT_REASON_CODE::NO_FURTHER_INFORMATION),
    m_subjectSourceNodeId(EndpointId::DtnNone()),
    m_subjectIsFragment(false),
    m_subjectFragmentOffset(0),
    m_subjectPayloadLength(0)
{
    m_subjectCreationTimestamp.SetZero();
}
bool Bpv7BundleStatusReport::operator==(const Bpv7BundleStatusReport & o) const {
    for (uint8_t i = 0; i < static_cast<uint8_t>(STATUS_INDEX::NUM_STATUS_ASSERTIONS); ++i) {
        if (!(m_statusAssertions[i] == o.m_statusAssertions[i])) {
            return false;
        }
    }
    return (m_reasonCode == o.m_reasonCode)
        && (m_subjectSourceNodeId == o.m_subjectSourceNodeId)
        && (m_subjectCreationTimestamp == o.m_subjectCreationTimestamp)
        && (m_subjectIsFragment == o.m_subjectIsFragment)
        && (m_subjectFragmentOffset == o.m_subjectFragmentOffset)
        && (m_subjectPayloadLength == o.m_subjectPayloadLength);
}
bool Bpv7BundleStatusReport::operator!=(const Bpv7BundleStatusReport & o) const {
    return !(*this == o);
}
void Bpv7BundleStatusReport::Assert(STATUS_INDEX statusIndex) {
    status_assertion_t & sa = m_statusAssertions[static_cast<uint8_t>(statusIndex)];
    sa.asserted = true;
    sa.hasTime = false;
    sa.timeMillisecondsSinceDtnEpoch = 0;
}
void Bpv7BundleStatusReport::AssertWithTime(STATUS_INDEX statusIndex, uint64_t timeMillisecondsSinceDtnEpoch) {
    status_assertion_t & sa = m_statusAssertions[static_cast<uint8_t>(statusIndex)];
    sa.asserted = true;
    sa.hasTime = true;
    sa.timeMillisecondsSinceDtnEpoch = timeMillisecondsSinceDtnEpoch;
}
bool Bpv7BundleStatusReport::IsAsserted(STATUS_INDEX statusIndex) const {
    return m_statusAssertions[static_cast<uint8_t>(statusIndex)].asserted;
}

// admin-record-structure = [
//  record-type-code: uint,
//  record-content: any
// ]
//The bundle status report SHALL be represented as a CBOR array.  The
//number of elements in the array SHALL be either 6 (if the subject
//bundle is a fragment) or 4 (otherwise).
std::vector<uint8_t> Bpv7BundleStatusReport::SerializeAdministrativeRecord() const {
    CborItem statusInfo = CborItem::Array();
    for (uint8_t i = 0; i < static_cast<uint8_t>(STATUS_INDEX::NUM_STATUS_ASSERTIONS); ++i) {
        //Each item of the bundle status information array SHALL be a bundle
        //status item represented as a CBOR array; the number of elements in
        //each such array SHALL be either 2 (if the value of the first item of
        //this bundle status item is 1 AND the "Report status time" flag was
        //set to 1 in the bundle processing flags of the bundle whose status is
        //being reported) or 1 (otherwise).
        const status_assertion_t & sa = m_statusAssertions[i];
        CborItem statusItem = CborItem::Array();
        statusItem.Append(CborItem::Bool(sa.asserted));
        if (sa.asserted && sa.hasTime) {
            statusItem.Append(CborItem::Uint(sa.timeMillisecondsSinceDtnEpoch));
        }
        statusInfo.Append(std::move(statusItem));
    }
    CborItem report = CborItem::Array();
    report.Append(std::move(statusInfo));
    report.Append(CborItem::Uint(static_cast<uint64_t>(m_reasonCode)));
    report.Append(m_subjectSourceNodeId.ToCbor());
    report.Append(Bpv7PrimaryBlock::CreationTimestampToCbor(m_subjectCreationTimestamp));
    if (m_subjectIsFragment) {
        report.Append(CborItem::Uint(m_subjectFragmentOffset));
        report.Append(CborItem::Uint(m_subjectPayloadLength));
    }

    CborItem adminRecord = CborItem::Array();
    adminRecord.Append(CborItem::Uint(static_cast<uint64_t>(BPV7_ADMINISTRATIVE_RECORD_TYPE_CODE::BUNDLE_STATUS_REPORT)));
    adminRecord.Append(std::move(report));
    return Cbor::Encode(adminRecord);
}

bool Bpv7BundleStatusReport::DeserializeAdministrativeRecord(const std::vector<uint8_t> & adminRecordSerialization, BP7_ERROR_CODE & errorCode) {
    CborItem adminRecord;
    uint64_t numBytesTakenToDecode;
    if (!Cbor::Decode(adminRecordSerialization, adminRecord, numBytesTakenToDecode, errorCode)) {
        LOG_ERROR(subprocess) << "administrative record is not well formed cbor: " << errorCode;
        return false;
    }
    if ((numBytesTakenToDecode != adminRecordSerialization.size())
        || (!adminRecord.IsArrayOfSize(2))
        || (!adminRecord.m_items[0].IsUint()))
    {
        LOG_ERROR(subprocess) << "administrative record must be a cbor array of [record-type-code, record-content]";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if (adminRecord.m_items[0].m_value != static_cast<uint64_t>(BPV7_ADMINISTRATIVE_RECORD_TYPE_CODE::BUNDLE_STATUS_REPORT)) {
        LOG_ERROR(subprocess) << "unsupported administrative record type code " << adminRecord.m_items[0].m_value;
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    const CborItem & report = adminRecord.m_items[1];
    const std::size_t reportSize = report.m_items.size();
    if ((!report.IsArray()) || ((reportSize != 4) && (reportSize != 6))) {
        LOG_ERROR(subprocess) << "bundle status report must be an array of 4 or 6 elements";
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    const CborItem & statusInfo = report.m_items[0];
    if (!statusInfo.IsArrayOfSize(static_cast<std::size_t>(STATUS_INDEX::NUM_STATUS_ASSERTIONS))) {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    for (uint8_t i = 0; i < static_cast<uint8_t>(STATUS_INDEX::NUM_STATUS_ASSERTIONS); ++i) {
        const CborItem & statusItem = statusInfo.m_items[i];
        const std::size_t statusItemSize = statusItem.m_items.size();
        if ((!statusItem.IsArray()) || (statusItemSize < 1) || (statusItemSize > 2) || (!statusItem.m_items[0].IsBool())) {
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        status_assertion_t & sa = m_statusAssertions[i];
        sa.asserted = (statusItem.m_items[0].m_value == static_cast<uint64_t>(CBOR_SIMPLE_VALUE::TRUE_VALUE));
        sa.hasTime = (statusItemSize == 2);
        sa.timeMillisecondsSinceDtnEpoch = 0;
        if (sa.hasTime) {
            if ((!sa.asserted) || (!statusItem.m_items[1].IsUint())) {
                errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
                return false;
            }
            sa.timeMillisecondsSinceDtnEpoch = statusItem.m_items[1].m_value;
        }
    }
    if (!report.m_items[1].IsUint()) {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    m_reasonCode = static_cast<BPV7_STATUS_REPORT_REASON_CODE>(report.m_items[1].m_value);
    if (!EndpointId::FromCbor(report.m_items[2], m_subjectSourceNodeId, errorCode)) {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    if (!Bpv7PrimaryBlock::CreationTimestampFromCbor(report.m_items[3], m_subjectCreationTimestamp)) {
        errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
        return false;
    }
    m_subjectIsFragment = (reportSize == 6);
    m_subjectFragmentOffset = 0;
    m_subjectPayloadLength = 0;
    if (m_subjectIsFragment) {
        if ((!report.m_items[4].IsUint()) || (!report.m_items[5].IsUint())) {
            errorCode = BP7_ERROR_CODE::MALFORMED_BLOCK;
            return false;
        }
        m_subjectFragmentOffset = report.m_items[4].m_value;
        m_subjectPayloadLength = report.m_items[5].m_value;
    }
    return true;
}
