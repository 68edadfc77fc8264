/**
 * @file TestEnumAsFlagsMacro.cpp
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
#include "EnumAsFlagsMacro.h"
#include <sstream>

//same layout as the TCPCLv4 XFER_SEGMENT and SESS_TERM flag fields
enum class SEGMENT_FLAGS : uint8_t {
    NONE = 0,
    END = 1 << 0,
    START = 1 << 1
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(SEGMENT_FLAGS);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(SEGMENT_FLAGS);

//sparse 64 bit flags like the bundle processing control flags
enum class PROCESSING_FLAGS : uint64_t {
    NONE = 0,
    IS_FRAGMENT = 1 << 0,
    STATUS_TIME = 1 << 6,
    RECEPTION_REPORT = 1 << 14,
    DELETION_REPORT = 1 << 18,
    HIGH_BIT = 1ULL << 63
};
MAKE_ENUM_SUPPORT_FLAG_OPERATORS(PROCESSING_FLAGS);
MAKE_ENUM_SUPPORT_OSTREAM_OPERATOR(PROCESSING_FLAGS);

BOOST_AUTO_TEST_CASE(EnumAsFlagsSegmentFlagsTestCase)
{
    BOOST_REQUIRE_EQUAL(sizeof(std::underlying_type<SEGMENT_FLAGS>::type), 1);
    SEGMENT_FLAGS f = SEGMENT_FLAGS::START | SEGMENT_FLAGS::END;
    BOOST_REQUIRE_EQUAL(static_cast<uint8_t>(f), 0x03);
    BOOST_REQUIRE(HasFlag(f, SEGMENT_FLAGS::START));
    BOOST_REQUIRE(HasFlag(f, SEGMENT_FLAGS::END));
    f &= ~SEGMENT_FLAGS::END;
    BOOST_REQUIRE_EQUAL(f, SEGMENT_FLAGS::START);
    BOOST_REQUIRE(!HasFlag(f, SEGMENT_FLAGS::END));
    //a multi-bit flag is only present when every bit is
    BOOST_REQUIRE(!HasFlag(f, SEGMENT_FLAGS::START | SEGMENT_FLAGS::END));
    f ^= SEGMENT_FLAGS::START;
    BOOST_REQUIRE_EQUAL(f, SEGMENT_FLAGS::NONE);
    //every value has the NONE "flag"
    BOOST_REQUIRE(HasFlag(f, SEGMENT_FLAGS::NONE));
}

BOOST_AUTO_TEST_CASE(EnumAsFlagsProcessingFlagsTestCase)
{
    BOOST_REQUIRE_EQUAL(sizeof(std::underlying_type<PROCESSING_FLAGS>::type), 8);

    PROCESSING_FLAGS f = PROCESSING_FLAGS::NONE;
    f |= PROCESSING_FLAGS::DELETION_REPORT;
    f |= PROCESSING_FLAGS::HIGH_BIT;
    BOOST_REQUIRE_EQUAL(static_cast<uint64_t>(f), 0x8000000000040000ULL);
    BOOST_REQUIRE(HasFlag(f, PROCESSING_FLAGS::HIGH_BIT));
    BOOST_REQUIRE(!HasFlag(f, PROCESSING_FLAGS::RECEPTION_REPORT));
    BOOST_REQUIRE_EQUAL(f & PROCESSING_FLAGS::DELETION_REPORT, PROCESSING_FLAGS::DELETION_REPORT);
    BOOST_REQUIRE_EQUAL(f & PROCESSING_FLAGS::STATUS_TIME, PROCESSING_FLAGS::NONE);

    //clearing the fragment flag leaves the others alone
    f |= PROCESSING_FLAGS::IS_FRAGMENT;
    f &= ~PROCESSING_FLAGS::IS_FRAGMENT;
    BOOST_REQUIRE_EQUAL(f, PROCESSING_FLAGS::DELETION_REPORT | PROCESSING_FLAGS::HIGH_BIT);
    BOOST_REQUIRE_EQUAL(PROCESSING_FLAGS::STATUS_TIME ^ PROCESSING_FLAGS::STATUS_TIME, PROCESSING_FLAGS::NONE);

    std::ostringstream oss;
    oss << (PROCESSING_FLAGS::RECEPTION_REPORT | PROCESSING_FLAGS::IS_FRAGMENT);
    BOOST_REQUIRE_EQUAL(oss.str(), "0x4001");
    //hex formatting does not leak into later output
    oss << " " << 10;
    BOOST_REQUIRE_EQUAL(oss.str(), "0x4001 10");
}
