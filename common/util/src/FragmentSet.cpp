/**
 * @file FragmentSet.cpp
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

#include "FragmentSet.h"
#include <algorithm>

FragmentSet::data_fragment_t::data_fragment_t() : beginIndex(0), endIndex(0) { } //a default constructor: X()
FragmentSet::data_fragment_t::data_fragment_t(uint64_t paramBeginIndex, uint64_t paramEndIndex) :
    beginIndex(paramBeginIndex), endIndex(paramEndIndex) { }
FragmentSet::data_fragment_t::~data_fragment_t() { } //a destructor: ~X()
FragmentSet::data_fragment_t::data_fragment_t(const data_fragment_t& o) : beginIndex(o.beginIndex), endIndex(o.endIndex) { } //a copy constructor: X(const X&)
FragmentSet::data_fragment_t::data_fragment_t(data_fragment_t&& o) : beginIndex(o.beginIndex), endIndex(o.endIndex) { } //a move constructor: X(X&&)
FragmentSet::data_fragment_t& FragmentSet::data_fragment_t::operator=(const data_fragment_t& o) { //a copy assignment: operator=(const X&)
    beginIndex = o.beginIndex;
    endIndex = o.endIndex;
    return *this;
}
FragmentSet::data_fragment_t& FragmentSet::data_fragment_t::operator=(data_fragment_t && o) { //a move assignment: operator=(X&&)
    beginIndex = o.beginIndex;
    endIndex = o.endIndex;
    return *this;
}
bool FragmentSet::data_fragment_t::operator==(const data_fragment_t & o) const {
    return (beginIndex == o.beginIndex) && (endIndex == o.endIndex);
}
bool FragmentSet::data_fragment_t::operator!=(const data_fragment_t & o) const {
    return !(*this == o);
}
bool FragmentSet::data_fragment_t::operator<(const data_fragment_t & o) const {
    return ((endIndex + 1) < o.beginIndex);
}
std::ostream& operator<<(std::ostream& os, const FragmentSet::data_fragment_t& o) {
    os << "(" << o.beginIndex << "," << o.endIndex << ")";
    return os;
}

bool FragmentSet::InsertFragment(data_fragment_set_t & fragmentSet, data_fragment_t key) {
    bool modified = false;
    while (true) {
        std::pair<data_fragment_set_t::iterator, bool> res = fragmentSet.insert(key);
        if (res.second) { //no overlap nor abut with anything in the set
            return true;
        }
        //res.first overlaps or abuts the key: grow the key to the union and try again
        const data_fragment_t existing = *res.first;
        if ((key.beginIndex >= existing.beginIndex) && (key.endIndex <= existing.endIndex)) {
            return modified;
        }
        key.beginIndex = std::min(key.beginIndex, existing.beginIndex);
        key.endIndex = std::max(key.endIndex, existing.endIndex);
        fragmentSet.erase(res.first);
        modified = true;
    }
}

bool FragmentSet::ContainsFragmentEntirely(const data_fragment_set_t & fragmentSet, const data_fragment_t & key) {
    data_fragment_set_t::const_iterator res = fragmentSet.find(key);
    if (res == fragmentSet.cend()) {
        return false;
    }
    return ((key.beginIndex >= res->beginIndex) && (key.endIndex <= res->endIndex));
}

void FragmentSet::GetBoundsMinusFragments(const data_fragment_t & bounds, const data_fragment_set_t& fragmentSet, data_fragment_set_t& missingFragmentsSet) {
    missingFragmentsSet.clear();
    uint64_t nextMissingBegin = bounds.beginIndex;
    for (data_fragment_set_t::const_iterator it = fragmentSet.cbegin(); it != fragmentSet.cend(); ++it) {
        if (it->endIndex < nextMissingBegin) {
            continue;
        }
        if (it->beginIndex > bounds.endIndex) {
            break;
        }
        if (it->beginIndex > nextMissingBegin) {
            missingFragmentsSet.emplace_hint(missingFragmentsSet.end(), nextMissingBegin, it->beginIndex - 1);
        }
        if (it->endIndex >= bounds.endIndex) {
            return;
        }
        nextMissingBegin = it->endIndex + 1;
    }
    missingFragmentsSet.emplace_hint(missingFragmentsSet.end(), nextMissingBegin, bounds.endIndex);
}

std::ostream& operator<<(std::ostream& os, const FragmentSet::data_fragment_set_t& fragmentSet) {
    for (FragmentSet::data_fragment_set_t::const_iterator it = fragmentSet.cbegin(); it != fragmentSet.cend(); ++it) {
        os << *it << " ";
    }
    return os;
}
