/**
 * @file FragmentSet.h
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
 * This FragmentSet static class tracks which byte ranges of an application data unit
 * have been received, using an std::set<data_fragment_t> of inclusive
 * [beginIndex, endIndex] ranges.  Overlapping or abutting ranges are always merged,
 * so a fully received ADU of length N is the single range [0, N-1].
 */

#ifndef FRAGMENT_SET_H
#define FRAGMENT_SET_H 1

#include <cstdint>
#include <set>
#include <ostream>
#include "bp7_util_export.h"

class BP7_UTIL_EXPORT FragmentSet {
public:
    /// Data fragment, does NOT allow overlap AND does NOT allow abut fragments
    struct BP7_UTIL_EXPORT data_fragment_t {
        uint64_t beginIndex;
        uint64_t endIndex; //inclusive

        data_fragment_t(); //a default constructor: X()
        data_fragment_t(uint64_t paramBeginIndex, uint64_t paramEndIndex);
        ~data_fragment_t(); //a destructor: ~X()
        data_fragment_t(const data_fragment_t& o); //a copy constructor: X(const X&)
        data_fragment_t(data_fragment_t&& o); //a move constructor: X(X&&)
        data_fragment_t& operator=(const data_fragment_t& o); //a copy assignment: operator=(const X&)
        data_fragment_t& operator=(data_fragment_t&& o); //a move assignment: operator=(X&&)
        bool operator==(const data_fragment_t & o) const; //operator ==
        bool operator!=(const data_fragment_t & o) const; //operator !=
        /// (endIndex + 1) < o.beginIndex, so overlapping or abutting keys compare equal in a set
        bool operator<(const data_fragment_t & o) const;
        BP7_UTIL_EXPORT friend std::ostream& operator<<(std::ostream& os, const data_fragment_t& o);
    };
    typedef std::set<data_fragment_t> data_fragment_set_t;

    /** Insert a fragment, merging it with every overlapping or abutting fragment already in the set.
     *
     * @return True if the set was modified, or False if the key was already entirely contained.
     */
    static bool InsertFragment(data_fragment_set_t & fragmentSet, data_fragment_t key);

    /// @return True if key lies entirely within one fragment of the set.
    static bool ContainsFragmentEntirely(const data_fragment_set_t& fragmentSet, const data_fragment_t& key);

    /** Compute the gaps of fragmentSet within bounds.
     *
     * @post missingFragmentsSet is overwritten with the ranges of bounds not covered by fragmentSet.
     */
    static void GetBoundsMinusFragments(const data_fragment_t & bounds, const data_fragment_set_t& fragmentSet, data_fragment_set_t& missingFragmentsSet);

    BP7_UTIL_EXPORT friend std::ostream& operator<<(std::ostream& os, const data_fragment_set_t& fragmentSet);
};

#endif //FRAGMENT_SET_H
