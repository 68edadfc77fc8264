/**
 * @file Bpv7Fragment.h
 *
 * @copyright Copyright (c) 2023 United States Government as represented by
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
 * Fragment Bpv7Bundles, and collect fragments until the whole
 * application data unit is present.
 */
#ifndef BPV7_FRAGMENT_H
#define BPV7_FRAGMENT_H 1

#include "codec/BundleV7.h"
#include "FragmentSet.h"
#include <map>
#include <vector>
#include <boost/thread/mutex.hpp>
#include "bpcodec_export.h"

/** Fragment and assemble Bpv7 bundles */
class Bpv7Fragmenter {
public:
    /** Fragment bundle into multiple fragments with payloads of at most maxPayloadSizeBytes per RFC9171 section 5.8
     *
     * @param orig              The bundle to fragment (may itself be a fragment)
     * @param maxPayloadSizeBytes The max payload size for each fragment
     * @param fragments[out]    The fragments if successful
     * @param errorCode[out]    INVALID_ARGUMENT for a size of zero or a must-not-fragment bundle that does not fit
     *
     * @returns true if able to fragment, false otherwise
     *
     * The original bundle is not modified. A bundle whose payload already fits
     * is returned as the only element of fragments.
     * Extension blocks with the MUST_BE_REPLICATED flag are copied into every
     * fragment; all other extension blocks go into the first fragment only.
     */
    BPCODEC_EXPORT static bool Fragment(const Bpv7Bundle & orig, uint64_t maxPayloadSizeBytes,
        std::vector<Bpv7Bundle> & fragments, BP7_ERROR_CODE & errorCode);

    /** Assemble fragments of one application data unit into a non-fragmented bundle
     *
     * @param fragments         The fragments to assemble, in any order, possibly overlapping
     * @param bundle[out]       The assembled bundle
     * @param errorCode[out]    INCOMPLETE if [0, total) is not covered, INCONSISTENT_FRAGMENTS
     *                          if the fragments disagree on identity or total length
     *
     * @returns true if successfully assembled, false otherwise
     */
    BPCODEC_EXPORT static bool Assemble(const std::vector<Bpv7Bundle> & fragments, Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode);
};

/** Collect fragments and assemble when all are present.  Thread safe. */
class Bpv7FragmentManager {
public:
    BPCODEC_EXPORT Bpv7FragmentManager();
    BPCODEC_EXPORT ~Bpv7FragmentManager();

    /** Add fragment to collection, if final fragment then return completed bundle
     *
     * @param fragment          The decoded fragment bundle
     * @param assembled[out]    If complete, populated with the assembled bundle
     * @param errorCode[out]    INCOMPLETE if the fragment was stored, or only repeated data already held, and more are needed,
     *                          INCONSISTENT_FRAGMENTS if the fragment disagrees with the ones already held,
     *                          INVALID_ARGUMENT if the bundle is not a fragment
     *
     * Upon successfully assembling the non-fragmented bundle, the fragments are deleted
     * from the manager.
     *
     * @returns true only when the fragment completed the bundle
     */
    BPCODEC_EXPORT bool AddFragmentAndGetComplete(Bpv7Bundle && fragment, Bpv7Bundle & assembled, BP7_ERROR_CODE & errorCode);

    /** Drop partial reassemblies whose lifetime has passed.
     *
     * @param expiredFragments[out] One held fragment of every dropped reassembly, for status reporting.
     * @returns the number of reassemblies dropped
     */
    BPCODEC_EXPORT std::size_t RemoveExpired(uint64_t nowMillisecondsSinceDtnEpoch, std::vector<Bpv7Bundle> & expiredFragments);
    BPCODEC_EXPORT std::size_t GetNumPendingReassemblies();
    BPCODEC_EXPORT std::size_t GetNumHeldFragments();

private:
    struct Bpv7ReassemblyId {
        EndpointId src;
        TimestampUtil::bpv7_creation_timestamp_t ts;
        bool operator<(const Bpv7ReassemblyId & o) const;
    };

    struct FragmentInfo {
        std::vector<Bpv7Bundle> bundles;
        FragmentSet::data_fragment_set_t fragmentSet;
        uint64_t totalApplicationDataUnitLength;
    };

    std::map<Bpv7ReassemblyId, FragmentInfo> m_idToFrags;
    boost::mutex m_mutex;
};

#endif //BPV7_FRAGMENT_H
