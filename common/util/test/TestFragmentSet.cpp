/**
 * @file TestFragmentSet.cpp
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
#include "FragmentSet.h"

typedef FragmentSet::data_fragment_t df_t;

BOOST_AUTO_TEST_CASE(FragmentSetInsertTestCase)
{
    FragmentSet::data_fragment_set_t fragmentSet;
    BOOST_REQUIRE(FragmentSet::InsertFragment(fragmentSet, df_t(100, 199)));
    BOOST_REQUIRE(FragmentSet::InsertFragment(fragmentSet, df_t(300, 399)));
    BOOST_REQUIRE_EQUAL(fragmentSet.size(), 2);

    //entirely contained, no change
    BOOST_REQUIRE(!FragmentSet::InsertFragment(fragmentSet, df_t(120, 150)));
    BOOST_REQUIRE_EQUAL(fragmentSet.size(), 2);

    //abuts the first on the left
    BOOST_REQUIRE(FragmentSet::InsertFragment(fragmentSet, df_t(0, 99)));
    BOOST_REQUIRE_EQUAL(fragmentSet.size(), 2);
    BOOST_REQUIRE_EQUAL(*fragmentSet.begin(), df_t(0, 199));

    //bridges both
    BOOST_REQUIRE(FragmentSet::InsertFragment(fragmentSet, df_t(150, 350)));
    BOOST_REQUIRE_EQUAL(fragmentSet.size(), 1);
    BOOST_REQUIRE_EQUAL(*fragmentSet.begin(), df_t(0, 399));

    BOOST_REQUIRE(FragmentSet::ContainsFragmentEntirely(fragmentSet, df_t(0, 399)));
    BOOST_REQUIRE(FragmentSet::ContainsFragmentEntirely(fragmentSet, df_t(10, 20)));
    BOOST_REQUIRE(!FragmentSet::ContainsFragmentEntirely(fragmentSet, df_t(390, 400)));
    BOOST_REQUIRE(!FragmentSet::ContainsFragmentEntirely(fragmentSet, df_t(500, 600)));
}

BOOST_AUTO_TEST_CASE(FragmentSetBoundsMinusFragmentsTestCase)
{
    FragmentSet::data_fragment_set_t fragmentSet;
    FragmentSet::data_fragment_set_t missing;

    //empty set: everything missing
    FragmentSet::GetBoundsMinusFragments(df_t(0, 999), fragmentSet, missing);
    BOOST_REQUIRE_EQUAL(missing.size(), 1);
    BOOST_REQUIRE_EQUAL(*missing.begin(), df_t(0, 999));

    FragmentSet::InsertFragment(fragmentSet, df_t(0, 299));
    FragmentSet::InsertFragment(fragmentSet, df_t(600, 899));
    FragmentSet::GetBoundsMinusFragments(df_t(0, 999), fragmentSet, missing);
    BOOST_REQUIRE_EQUAL(missing.size(), 2);
    FragmentSet::data_fragment_set_t::const_iterator it = missing.cbegin();
    BOOST_REQUIRE_EQUAL(*it, df_t(300, 599));
    ++it;
    BOOST_REQUIRE_EQUAL(*it, df_t(900, 999));

    FragmentSet::InsertFragment(fragmentSet, df_t(300, 599));
    FragmentSet::InsertFragment(fragmentSet, df_t(900, 999));
    FragmentSet::GetBoundsMinusFragments(df_t(0, 999), fragmentSet, missing);
    BOOST_REQUIRE(missing.empty());
    BOOST_REQUIRE_EQUAL(fragmentSet.size(), 1);
}
