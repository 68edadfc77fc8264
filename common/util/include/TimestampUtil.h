/**
 * @file TimestampUtil.h
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
 * DTN time (milliseconds since 2000-01-01T00:00:00Z) and the BPv7 creation timestamp,
 * plus the generator that hands out strictly increasing creation timestamps for one source.
 */

#ifndef TIMESTAMP_UTIL_H
#define TIMESTAMP_UTIL_H 1

#include <string>
#include <ostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/thread/mutex.hpp>
#include "bp7_util_export.h"

class BP7_UTIL_EXPORT TimestampUtil {
private:
    TimestampUtil();
public:
    //Bpv7:
    //4.2.6. DTN Time
    //A DTN time is an unsigned integer indicating the number of
    //milliseconds that have elapsed since the DTN Epoch, 2000-01-01
    //00:00:00 +0000 (UTC).  DTN time is not affected by leap seconds.
    //The DTN time value zero indicates that the time is unknown.
    //
    //4.2.7. Creation Timestamp
    //A creation timestamp is the DTN time at which the transmission request
    //was received followed by a sequence number.  The sequence counter MAY be
    //reset to zero whenever the current time advances by one millisecond.
    struct bpv7_creation_timestamp_t {
        uint64_t millisecondsSinceStartOfYear2000;
        uint64_t sequenceNumber;

        BP7_UTIL_EXPORT bpv7_creation_timestamp_t(); //a default constructor: X()
        BP7_UTIL_EXPORT bpv7_creation_timestamp_t(uint64_t paramMillisecondsSinceStartOfYear2000, uint64_t paramSequenceNumber);
        BP7_UTIL_EXPORT ~bpv7_creation_timestamp_t(); //a destructor: ~X()
        BP7_UTIL_EXPORT bpv7_creation_timestamp_t(const bpv7_creation_timestamp_t& o); //a copy constructor: X(const X&)
        BP7_UTIL_EXPORT bpv7_creation_timestamp_t(bpv7_creation_timestamp_t&& o); //a move constructor: X(X&&)
        BP7_UTIL_EXPORT bpv7_creation_timestamp_t& operator=(const bpv7_creation_timestamp_t& o); //a copy assignment: operator=(const X&)
        BP7_UTIL_EXPORT bpv7_creation_timestamp_t& operator=(bpv7_creation_timestamp_t&& o); //a move assignment: operator=(X&&)
        BP7_UTIL_EXPORT bool operator==(const bpv7_creation_timestamp_t & o) const; //operator ==
        BP7_UTIL_EXPORT bool operator!=(const bpv7_creation_timestamp_t & o) const; //operator !=
        BP7_UTIL_EXPORT bool operator<(const bpv7_creation_timestamp_t & o) const; //operator < so it can be used as a map key
        BP7_UTIL_EXPORT friend std::ostream& operator<<(std::ostream& os, const bpv7_creation_timestamp_t& o);
        /// Lexicographic on (milliseconds, sequence): negative if a < b, zero if equal, positive if a > b.
        BP7_UTIL_EXPORT static int Compare(const bpv7_creation_timestamp_t & a, const bpv7_creation_timestamp_t & b);
        BP7_UTIL_EXPORT void SetZero();
        BP7_UTIL_EXPORT boost::posix_time::ptime GetPtime() const;
        BP7_UTIL_EXPORT void SetFromPtime(const boost::posix_time::ptime & posixTimeValue);
        BP7_UTIL_EXPORT std::string GetUtcTimestampString(bool forFileName) const;
    };

    /**
     * Hands out strictly increasing creation timestamps for one source (one bundle protocol agent).
     * Thread safe.
     */
    class BP7_UTIL_EXPORT Bpv7CreationTimestampGenerator {
    public:
        Bpv7CreationTimestampGenerator();
        bpv7_creation_timestamp_t GenerateNow();
        /// Process wide generator used when a caller has no generator of its own.
        static Bpv7CreationTimestampGenerator & GetProcessWideInstance();
    private:
        boost::mutex m_mutex;
        bpv7_creation_timestamp_t m_lastTimestamp;
    };

    static const boost::posix_time::ptime & GetRfc5050Epoch(); //DTN epoch 2000-01-01
    static const boost::posix_time::ptime & GetUnixEpoch();
    static uint64_t GetMillisecondsSinceEpoch(const boost::posix_time::ptime & posixTimeValue, const boost::posix_time::ptime & epochStartTime);
    static uint64_t GetMillisecondsSinceEpochRfc5050();
    static uint64_t GetMillisecondsSinceEpochRfc5050(const boost::posix_time::ptime & posixTimeValue);
    /**
     * Milliseconds since the DTN epoch that never decrease within this process,
     * even if the system clock is stepped backwards.
     */
    static uint64_t GetMonotonicMillisecondsSinceEpochRfc5050();
    static uint64_t GetSecondsSinceEpochUnix();
    static std::string GetUtcTimestampStringNow(bool forFileName);
    static std::string GetUtcTimestampStringFromPtime(const boost::posix_time::ptime & posixTimeValue, bool forFileName);
    static bool SetPtimeFromUtcTimestampString(const std::string & stringvalue, boost::posix_time::ptime & pt);
    static bpv7_creation_timestamp_t GenerateBpv7CreationTimestampNow();
};

#endif //TIMESTAMP_UTIL_H
