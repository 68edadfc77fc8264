/**
 * @file TestTimestampUtil.cpp
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
#include <boost/thread.hpp>
#include "TimestampUtil.h"
#include <set>
#include <string>
#include <vector>

BOOST_AUTO_TEST_CASE(TimestampUtilTestCase)
{
    //PtimeUtcString
    {
        const std::string startingTimestampStr("2020-02-06T20:25:11.493000Z");
        boost::posix_time::ptime pt;
        BOOST_REQUIRE(TimestampUtil::SetPtimeFromUtcTimestampString(startingTimestampStr, pt));
        const std::string timeOut = TimestampUtil::GetUtcTimestampStringFromPtime(pt, false);
        BOOST_REQUIRE_EQUAL(startingTimestampStr, timeOut);
    }

    //Epoch
    {
        const std::string expectedTimestampStr("2000-01-01T00:00:00.000000Z");
        const std::string timestampStr = TimestampUtil::GetUtcTimestampStringFromPtime(TimestampUtil::GetRfc5050Epoch(), false);
        BOOST_REQUIRE_EQUAL(expectedTimestampStr, timestampStr);
        BOOST_REQUIRE_EQUAL(TimestampUtil::GetMillisecondsSinceEpochRfc5050(TimestampUtil::GetRfc5050Epoch()), 0);
        //2000-01-01 is 946684800 seconds after the unix epoch
        BOOST_REQUIRE_EQUAL(TimestampUtil::GetMillisecondsSinceEpoch(TimestampUtil::GetRfc5050Epoch(), TimestampUtil::GetUnixEpoch()), 946684800000ULL);
    }

    //ptime conversion of a creation timestamp
    {
        const boost::posix_time::ptime pt = boost::posix_time::ptime(boost::gregorian::date(2019, 1, 1)) + boost::posix_time::seconds(50) + boost::posix_time::milliseconds(7);
        TimestampUtil::bpv7_creation_timestamp_t ts;
        ts.SetFromPtime(pt);
        BOOST_REQUIRE_EQUAL(ts.millisecondsSinceStartOfYear2000, 599616050007ULL);
        BOOST_REQUIRE_EQUAL(ts.sequenceNumber, 0);
        BOOST_REQUIRE(ts.GetPtime() == pt);
        BOOST_REQUIRE_EQUAL(ts.GetUtcTimestampString(false), "2019-01-01T00:00:50.007000Z");
    }
}

BOOST_AUTO_TEST_CASE(Bpv7CreationTimestampOrderingTestCase)
{
    typedef TimestampUtil::bpv7_creation_timestamp_t ts_t;
    //lexicographic on (timestamp, sequence)
    BOOST_REQUIRE(ts_t(5, 9) < ts_t(6, 0));
    BOOST_REQUIRE(ts_t(5, 0) < ts_t(5, 1));
    BOOST_REQUIRE(!(ts_t(5, 1) < ts_t(5, 1)));
    BOOST_REQUIRE_EQUAL(ts_t::Compare(ts_t(5, 1), ts_t(5, 1)), 0);
    BOOST_REQUIRE_LT(ts_t::Compare(ts_t(4, 100), ts_t(5, 0)), 0);
    BOOST_REQUIRE_GT(ts_t::Compare(ts_t(5, 2), ts_t(5, 1)), 0);
    BOOST_REQUIRE_EQUAL(ts_t(5, 1), ts_t(5, 1));
    BOOST_REQUIRE_NE(ts_t(5, 1), ts_t(5, 2));

    ts_t zeroed(5, 1);
    zeroed.SetZero();
    BOOST_REQUIRE_EQUAL(zeroed, ts_t(0, 0));
}

BOOST_AUTO_TEST_CASE(Bpv7CreationTimestampGeneratorTestCase)
{
    //a single generator never repeats and never goes backwards, even many calls within one millisecond
    {
        TimestampUtil::Bpv7CreationTimestampGenerator generator;
        TimestampUtil::bpv7_creation_timestamp_t prev = generator.GenerateNow();
        const uint64_t nowMs = TimestampUtil::GetMillisecondsSinceEpochRfc5050();
        BOOST_REQUIRE_LE(prev.millisecondsSinceStartOfYear2000, nowMs + 1);
        bool sawSequenceIncrement = false;
        for (unsigned int i = 0; i < 10000; ++i) {
            const TimestampUtil::bpv7_creation_timestamp_t next = generator.GenerateNow();
            BOOST_REQUIRE_LT(prev, next);
            if (next.millisecondsSinceStartOfYear2000 == prev.millisecondsSinceStartOfYear2000) {
                BOOST_REQUIRE_EQUAL(next.sequenceNumber, prev.sequenceNumber + 1);
                sawSequenceIncrement = true;
            }
            else {
                BOOST_REQUIRE_EQUAL(next.sequenceNumber, 0);
            }
            prev = next;
        }
        BOOST_REQUIRE(sawSequenceIncrement);
    }

    //the sequence resets once the clock advances
    {
        TimestampUtil::Bpv7CreationTimestampGenerator generator;
        const TimestampUtil::bpv7_creation_timestamp_t t1 = generator.GenerateNow();
        boost::this_thread::sleep(boost::posix_time::milliseconds(3));
        const TimestampUtil::bpv7_creation_timestamp_t t2 = generator.GenerateNow();
        BOOST_REQUIRE_GT(t2.millisecondsSinceStartOfYear2000, t1.millisecondsSinceStartOfYear2000);
        BOOST_REQUIRE_EQUAL(t2.sequenceNumber, 0);
    }

    //unique across threads sharing the process wide generator
    {
        static const unsigned int NUM_THREADS = 4;
        static const unsigned int NUM_PER_THREAD = 2000;
        std::vector<std::vector<TimestampUtil::bpv7_creation_timestamp_t> > results(NUM_THREADS);
        boost::thread_group threads;
        for (unsigned int t = 0; t < NUM_THREADS; ++t) {
            std::vector<TimestampUtil::bpv7_creation_timestamp_t> * resultPtr = &results[t];
            threads.create_thread([resultPtr]() {
                for (unsigned int i = 0; i < NUM_PER_THREAD; ++i) {
                    resultPtr->push_back(TimestampUtil::GenerateBpv7CreationTimestampNow());
                }
            });
        }
        threads.join_all();
        std::set<TimestampUtil::bpv7_creation_timestamp_t> uniqueSet;
        for (unsigned int t = 0; t < NUM_THREADS; ++t) {
            for (std::size_t i = 1; i < results[t].size(); ++i) {
                BOOST_REQUIRE_LT(results[t][i - 1], results[t][i]);
            }
            uniqueSet.insert(results[t].begin(), results[t].end());
        }
        BOOST_REQUIRE_EQUAL(uniqueSet.size(), NUM_THREADS * NUM_PER_THREAD);
    }
}
