/**
 * @file TimestampUtil.cpp
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

#include "TimestampUtil.h"
#include <atomic>
#include <sstream>

static const boost::posix_time::ptime EPOCH_START_TIME_RFC5050(boost::gregorian::date(2000, 1, 1));
static const boost::posix_time::ptime EPOCH_START_TIME_UNIX(boost::gregorian::date(1970, 1, 1));

static std::atomic<uint64_t> s_lastMonotonicMilliseconds(0);

const boost::posix_time::ptime & TimestampUtil::GetRfc5050Epoch() {
    return EPOCH_START_TIME_RFC5050;
}

const boost::posix_time::ptime & TimestampUtil::GetUnixEpoch() {
    return EPOCH_START_TIME_UNIX;
}

uint64_t TimestampUtil::GetMillisecondsSinceEpoch(const boost::posix_time::ptime & posixTimeValue, const boost::posix_time::ptime & epochStartTime) {
    const boost::posix_time::time_duration diff = posixTimeValue - epochStartTime;
    return static_cast<uint64_t>(diff.total_milliseconds());
}

uint64_t TimestampUtil::GetMillisecondsSinceEpochRfc5050() {
    return GetMillisecondsSinceEpochRfc5050(boost::posix_time::microsec_clock::universal_time());
}

uint64_t TimestampUtil::GetMillisecondsSinceEpochRfc5050(const boost::posix_time::ptime & posixTimeValue) {
    return GetMillisecondsSinceEpoch(posixTimeValue, EPOCH_START_TIME_RFC5050);
}

uint64_t TimestampUtil::GetMonotonicMillisecondsSinceEpochRfc5050() {
    const uint64_t wallClockMs = GetMillisecondsSinceEpochRfc5050();
    uint64_t last = s_lastMonotonicMilliseconds.load(std::memory_order_acquire);
    while (wallClockMs > last) {
        if (s_lastMonotonicMilliseconds.compare_exchange_weak(last, wallClockMs, std::memory_order_acq_rel)) {
            return wallClockMs;
        }
    }
    return last;
}

uint64_t TimestampUtil::GetSecondsSinceEpochUnix() {
    const boost::posix_time::time_duration diff = boost::posix_time::microsec_clock::universal_time() - EPOCH_START_TIME_UNIX;
    return static_cast<uint64_t>(diff.total_seconds());
}

std::string TimestampUtil::GetUtcTimestampStringNow(bool forFileName) {
    return GetUtcTimestampStringFromPtime(boost::posix_time::microsec_clock::universal_time(), forFileName);
}

//"2020-02-06T20:25:11.493000Z"
std::string TimestampUtil::GetUtcTimestampStringFromPtime(const boost::posix_time::ptime & posixTimeValue, bool forFileName) {
    static const std::locale DATE_TIME_FORMAT_OUT_UTC = std::locale(std::locale::classic(), new boost::posix_time::time_facet("%Y-%m-%dT%H:%M:%sZ"));
    static const std::locale DATE_TIME_FORMAT_OUT_UTC_FILENAME = std::locale(std::locale::classic(), new boost::posix_time::time_facet("%Y_%m_%dT%H_%M_%sZ"));
    std::ostringstream os;
    os.imbue((forFileName) ? DATE_TIME_FORMAT_OUT_UTC_FILENAME : DATE_TIME_FORMAT_OUT_UTC);
    os << posixTimeValue;
    return os.str();
}

bool TimestampUtil::SetPtimeFromUtcTimestampString(const std::string & stringvalue, boost::posix_time::ptime & pt) {
    static const std::locale DATE_TIME_FORMAT_IN = std::locale(std::locale::classic(), new boost::posix_time::time_input_facet("%Y-%m-%dT%H:%M:%sZ"));
    std::istringstream is(stringvalue);
    is.imbue(DATE_TIME_FORMAT_IN);
    is >> pt;
    return (pt != boost::posix_time::ptime());
}

TimestampUtil::bpv7_creation_timestamp_t TimestampUtil::GenerateBpv7CreationTimestampNow() {
    return Bpv7CreationTimestampGenerator::GetProcessWideInstance().GenerateNow();
}

TimestampUtil::bpv7_creation_timestamp_t::bpv7_creation_timestamp_t() : millisecondsSinceStartOfYear2000(0), sequenceNumber(0) { } //a default constructor: X()
TimestampUtil::bpv7_creation_timestamp_t::bpv7_creation_timestamp_t(uint64_t paramMillisecondsSinceStartOfYear2000, uint64_t paramSequenceNumber) :
    millisecondsSinceStartOfYear2000(paramMillisecondsSinceStartOfYear2000), sequenceNumber(paramSequenceNumber) { }
TimestampUtil::bpv7_creation_timestamp_t::~bpv7_creation_timestamp_t() { } //a destructor: ~X()
TimestampUtil::bpv7_creation_timestamp_t::bpv7_creation_timestamp_t(const bpv7_creation_timestamp_t& o) :
    millisecondsSinceStartOfYear2000(o.millisecondsSinceStartOfYear2000), sequenceNumber(o.sequenceNumber) { } //a copy constructor: X(const X&)
TimestampUtil::bpv7_creation_timestamp_t::bpv7_creation_timestamp_t(bpv7_creation_timestamp_t&& o) :
    millisecondsSinceStartOfYear2000(o.millisecondsSinceStartOfYear2000), sequenceNumber(o.sequenceNumber) { } //a move constructor: X(X&&)
TimestampUtil::bpv7_creation_timestamp_t& TimestampUtil::bpv7_creation_timestamp_t::operator=(const bpv7_creation_timestamp_t& o) { //a copy assignment: operator=(const X&)
    millisecondsSinceStartOfYear2000 = o.millisecondsSinceStartOfYear2000;
    sequenceNumber = o.sequenceNumber;
    return *this;
}
TimestampUtil::bpv7_creation_timestamp_t& TimestampUtil::bpv7_creation_timestamp_t::operator=(bpv7_creation_timestamp_t && o) { //a move assignment: operator=(X&&)
    millisecondsSinceStartOfYear2000 = o.millisecondsSinceStartOfYear2000;
    sequenceNumber = o.sequenceNumber;
    return *this;
}
bool TimestampUtil::bpv7_creation_timestamp_t::operator==(const bpv7_creation_timestamp_t & o) const {
    return (millisecondsSinceStartOfYear2000 == o.millisecondsSinceStartOfYear2000) && (sequenceNumber == o.sequenceNumber);
}
bool TimestampUtil::bpv7_creation_timestamp_t::operator!=(const bpv7_creation_timestamp_t & o) const {
    return !(*this == o);
}
bool TimestampUtil::bpv7_creation_timestamp_t::operator<(const bpv7_creation_timestamp_t & o) const {
    return Compare(*this, o) < 0;
}
int TimestampUtil::bpv7_creation_timestamp_t::Compare(const bpv7_creation_timestamp_t & a, const bpv7_creation_timestamp_t & b) {
    if (a.millisecondsSinceStartOfYear2000 != b.millisecondsSinceStartOfYear2000) {
        return (a.millisecondsSinceStartOfYear2000 < b.millisecondsSinceStartOfYear2000) ? -1 : 1;
    }
    if (a.sequenceNumber != b.sequenceNumber) {
        return (a.sequenceNumber < b.sequenceNumber) ? -1 : 1;
    }
    return 0;
}
std::ostream& operator<<(std::ostream& os, const TimestampUtil::bpv7_creation_timestamp_t & o) {
    os << "millisecondsSinceStartOfYear2000: " << o.millisecondsSinceStartOfYear2000 << ", sequenceNumber: " << o.sequenceNumber;
    return os;
}
void TimestampUtil::bpv7_creation_timestamp_t::SetZero() {
    millisecondsSinceStartOfYear2000 = 0;
    sequenceNumber = 0;
}
boost::posix_time::ptime TimestampUtil::bpv7_creation_timestamp_t::GetPtime() const {
    return TimestampUtil::GetRfc5050Epoch() + boost::posix_time::milliseconds(millisecondsSinceStartOfYear2000);
}
void TimestampUtil::bpv7_creation_timestamp_t::SetFromPtime(const boost::posix_time::ptime & posixTimeValue) {
    millisecondsSinceStartOfYear2000 = TimestampUtil::GetMillisecondsSinceEpochRfc5050(posixTimeValue);
}
std::string TimestampUtil::bpv7_creation_timestamp_t::GetUtcTimestampString(bool forFileName) const {
    return TimestampUtil::GetUtcTimestampStringFromPtime(GetPtime(), forFileName);
}

TimestampUtil::Bpv7CreationTimestampGenerator::Bpv7CreationTimestampGenerator() {}

TimestampUtil::bpv7_creation_timestamp_t TimestampUtil::Bpv7CreationTimestampGenerator::GenerateNow() {
    const uint64_t nowMs = TimestampUtil::GetMonotonicMillisecondsSinceEpochRfc5050();
    boost::mutex::scoped_lock lock(m_mutex);
    if (nowMs > m_lastTimestamp.millisecondsSinceStartOfYear2000) {
        m_lastTimestamp.millisecondsSinceStartOfYear2000 = nowMs;
        m_lastTimestamp.sequenceNumber = 0;
    }
    else {
        ++m_lastTimestamp.sequenceNumber;
    }
    return m_lastTimestamp;
}

TimestampUtil::Bpv7CreationTimestampGenerator & TimestampUtil::Bpv7CreationTimestampGenerator::GetProcessWideInstance() {
    static Bpv7CreationTimestampGenerator processWideGenerator;
    return processWideGenerator;
}
