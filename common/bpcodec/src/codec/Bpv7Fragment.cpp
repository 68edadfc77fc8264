/**
 * @file Bpv7Fragment.cpp
 *
 * @copyright Copyright (c) 2023 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */
#include "codec/Bpv7Fragment.h"
#include "Logger.h"
#include <algorithm>

static constexpr bp7::Logger::SubProcess subprocess = bp7::Logger::SubProcess::bundle;

bool Bpv7Fragmenter::Fragment(const Bpv7Bundle & orig, uint64_t maxPayloadSizeBytes,
    std::vector<Bpv7Bundle> & fragments, BP7_ERROR_CODE & errorCode)
{
    fragments.clear();
    if (maxPayloadSizeBytes == 0) {
        LOG_ERROR(subprocess) << "cannot fragment with a max payload size of zero";
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    const Bpv7CanonicalBlock * const origPayloadBlock = orig.GetPayloadBlock();
    const uint64_t payloadLength = (origPayloadBlock) ? origPayloadBlock->m_blockTypeSpecificData.size() : 0;
    if (payloadLength <= maxPayloadSizeBytes) {
        fragments.push_back(orig);
        return true;
    }
    if (orig.m_primaryBlock.HasFlag(BPV7_BUNDLEFLAG::NOFRAGMENT)) {
        LOG_ERROR(subprocess) << "bundle " << orig.GetBundleId() << " must not be fragmented but its payload of "
            << payloadLength << " bytes exceeds " << maxPayloadSizeBytes;
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }

    //fragmenting a fragment keeps offsets relative to the original application data unit
    const bool origIsFragment = orig.m_primaryBlock.IsFragment();
    const uint64_t baseOffset = (origIsFragment) ? orig.m_primaryBlock.m_fragmentOffset : 0;
    const uint64_t totalAduLength = (origIsFragment) ? orig.m_primaryBlock.m_totalApplicationDataUnitLength : payloadLength;
    const std::vector<uint8_t> & payload = origPayloadBlock->m_blockTypeSpecificData;

    const uint64_t numFragments = (payloadLength + maxPayloadSizeBytes - 1) / maxPayloadSizeBytes;
    fragments.reserve(numFragments);
    for (uint64_t i = 0; i < numFragments; ++i) {
        const uint64_t chunkBegin = i * maxPayloadSizeBytes;
        const uint64_t chunkSize = std::min(maxPayloadSizeBytes, payloadLength - chunkBegin);
        const bool isFirst = (i == 0);

        fragments.emplace_back();
        Bpv7Bundle & frag = fragments.back();
        frag.m_primaryBlock = orig.m_primaryBlock;
        frag.m_primaryBlock.m_bundleProcessingControlFlags |= BPV7_BUNDLEFLAG::ISFRAGMENT;
        frag.m_primaryBlock.m_fragmentOffset = baseOffset + chunkBegin;
        frag.m_primaryBlock.m_totalApplicationDataUnitLength = totalAduLength;

        for (std::size_t j = 0; j < orig.m_canonicalBlocks.size(); ++j) {
            const Bpv7CanonicalBlock & block = orig.m_canonicalBlocks[j];
            if (block.IsPayloadBlock()) {
                frag.m_canonicalBlocks.emplace_back(block.m_blockTypeCode, block.m_blockNumber,
                    block.m_blockProcessingControlFlags, block.m_crcType,
                    std::vector<uint8_t>(payload.begin() + chunkBegin, payload.begin() + chunkBegin + chunkSize));
            }
            else if (isFirst || block.HasFlag(BPV7_BLOCKFLAG::MUST_BE_REPLICATED)) {
                frag.m_canonicalBlocks.push_back(block);
            }
        }
    }
    return true;
}

bool Bpv7Fragmenter::Assemble(const std::vector<Bpv7Bundle> & fragments, Bpv7Bundle & bundle, BP7_ERROR_CODE & errorCode) {
    if (fragments.empty()) {
        errorCode = BP7_ERROR_CODE::INCOMPLETE;
        return false;
    }
    const Bpv7PrimaryBlock & firstPrimary = fragments[0].m_primaryBlock;
    const uint64_t totalAduLength = firstPrimary.m_totalApplicationDataUnitLength;
    FragmentSet::data_fragment_set_t fragmentSet;
    const Bpv7Bundle * firstFragment = NULL; //the one at offset zero
    for (std::size_t i = 0; i < fragments.size(); ++i) {
        const Bpv7Bundle & frag = fragments[i];
        const Bpv7PrimaryBlock & primary = frag.m_primaryBlock;
        if ((!primary.IsFragment())
            || (primary.m_sourceNodeId != firstPrimary.m_sourceNodeId)
            || (primary.m_creationTimestamp != firstPrimary.m_creationTimestamp)
            || (primary.m_totalApplicationDataUnitLength != totalAduLength))
        {
            LOG_ERROR(subprocess) << "fragment " << frag.GetBundleId() << " does not belong with " << fragments[0].GetBundleId();
            errorCode = BP7_ERROR_CODE::INCONSISTENT_FRAGMENTS;
            return false;
        }
        const uint64_t payloadLength = frag.GetPayloadLength();
        if ((primary.m_fragmentOffset > totalAduLength) || (payloadLength > (totalAduLength - primary.m_fragmentOffset))) {
            LOG_ERROR(subprocess) << "fragment " << frag.GetBundleId() << " extends past the total length " << totalAduLength;
            errorCode = BP7_ERROR_CODE::INCONSISTENT_FRAGMENTS;
            return false;
        }
        if (payloadLength) {
            FragmentSet::InsertFragment(fragmentSet,
                FragmentSet::data_fragment_t(primary.m_fragmentOffset, primary.m_fragmentOffset + payloadLength - 1));
        }
        if ((primary.m_fragmentOffset == 0) && (firstFragment == NULL)) {
            firstFragment = &frag;
        }
    }
    if ((totalAduLength) && (!FragmentSet::ContainsFragmentEntirely(fragmentSet, FragmentSet::data_fragment_t(0, totalAduLength - 1)))) {
        errorCode = BP7_ERROR_CODE::INCOMPLETE;
        return false;
    }
    if (firstFragment == NULL) {
        errorCode = BP7_ERROR_CODE::INCOMPLETE;
        return false;
    }

    std::vector<uint8_t> adu(totalAduLength);
    for (std::size_t i = 0; i < fragments.size(); ++i) {
        const Bpv7CanonicalBlock * const payloadBlock = fragments[i].GetPayloadBlock();
        if (payloadBlock) {
            std::copy(payloadBlock->m_blockTypeSpecificData.begin(), payloadBlock->m_blockTypeSpecificData.end(),
                adu.begin() + fragments[i].m_primaryBlock.m_fragmentOffset);
        }
    }

    //the first fragment carries every extension block of the original bundle
    bundle = *firstFragment;
    bundle.m_primaryBlock.m_bundleProcessingControlFlags &= ~BPV7_BUNDLEFLAG::ISFRAGMENT;
    bundle.m_primaryBlock.m_fragmentOffset = 0;
    bundle.m_primaryBlock.m_totalApplicationDataUnitLength = 0;
    Bpv7CanonicalBlock * const payloadBlock = bundle.GetPayloadBlock();
    if (payloadBlock == NULL) {
        LOG_ERROR(subprocess) << "first fragment of " << bundle.GetBundleId() << " has no payload block";
        errorCode = BP7_ERROR_CODE::INCONSISTENT_FRAGMENTS;
        return false;
    }
    payloadBlock->m_blockTypeSpecificData = std::move(adu);
    return true;
}

Bpv7FragmentManager::Bpv7FragmentManager() { }
Bpv7FragmentManager::~Bpv7FragmentManager() { }

bool Bpv7FragmentManager::AddFragmentAndGetComplete(Bpv7Bundle && fragment, Bpv7Bundle & assembled, BP7_ERROR_CODE & errorCode) {
    const Bpv7PrimaryBlock & primary = fragment.m_primaryBlock;
    if (!primary.IsFragment()) {
        LOG_ERROR(subprocess) << "Not a fragment";
        errorCode = BP7_ERROR_CODE::INVALID_ARGUMENT;
        return false;
    }
    const uint64_t payloadLength = fragment.GetPayloadLength();
    const uint64_t totalAduLength = primary.m_totalApplicationDataUnitLength;
    if ((primary.m_fragmentOffset > totalAduLength) || (payloadLength > (totalAduLength - primary.m_fragmentOffset))) {
        LOG_ERROR(subprocess) << "fragment " << fragment.GetBundleId() << " extends past the total length " << totalAduLength;
        errorCode = BP7_ERROR_CODE::INCONSISTENT_FRAGMENTS;
        return false;
    }

    Bpv7ReassemblyId id;
    id.src = primary.m_sourceNodeId;
    id.ts = primary.m_creationTimestamp;

    boost::mutex::scoped_lock lock(m_mutex);
    std::map<Bpv7ReassemblyId, FragmentInfo>::iterator it = m_idToFrags.find(id);
    if (it == m_idToFrags.end()) {
        it = m_idToFrags.emplace(id, FragmentInfo()).first;
        it->second.totalApplicationDataUnitLength = totalAduLength;
    }
    else if (it->second.totalApplicationDataUnitLength != totalAduLength) {
        LOG_ERROR(subprocess) << "fragment " << fragment.GetBundleId() << " has total length " << totalAduLength
            << " but earlier fragments have " << it->second.totalApplicationDataUnitLength;
        errorCode = BP7_ERROR_CODE::INCONSISTENT_FRAGMENTS;
        return false;
    }
    FragmentInfo & info = it->second;
    if (payloadLength) {
        const FragmentSet::data_fragment_t range(primary.m_fragmentOffset, primary.m_fragmentOffset + payloadLength - 1);
        if (FragmentSet::ContainsFragmentEntirely(info.fragmentSet, range)) {
            //every byte is already held (and an incomplete entry is never left in the map)
            LOG_DEBUG(subprocess) << "dropping duplicate fragment " << fragment.GetBundleId();
            errorCode = BP7_ERROR_CODE::INCOMPLETE;
            return false;
        }
        FragmentSet::InsertFragment(info.fragmentSet, range);
    }
    info.bundles.push_back(std::move(fragment));

    if ((totalAduLength) && (!FragmentSet::ContainsFragmentEntirely(info.fragmentSet, FragmentSet::data_fragment_t(0, totalAduLength - 1)))) {
        // We've saved the fragment
        errorCode = BP7_ERROR_CODE::INCOMPLETE;
        return false;
    }

    const bool success = Bpv7Fragmenter::Assemble(info.bundles, assembled, errorCode);
    if (success || (errorCode != BP7_ERROR_CODE::INCOMPLETE)) {
        m_idToFrags.erase(it);
    }
    return success;
}

std::size_t Bpv7FragmentManager::RemoveExpired(uint64_t nowMillisecondsSinceDtnEpoch, std::vector<Bpv7Bundle> & expiredFragments) {
    std::size_t numRemoved = 0;
    boost::mutex::scoped_lock lock(m_mutex);
    for (std::map<Bpv7ReassemblyId, FragmentInfo>::iterator it = m_idToFrags.begin(); it != m_idToFrags.end(); ) {
        const Bpv7Bundle & anyFragment = it->second.bundles.front();
        if (anyFragment.HasExpired(nowMillisecondsSinceDtnEpoch)) {
            LOG_INFO(subprocess) << "dropping expired partial reassembly of " << anyFragment.GetBundleId()
                << " (" << it->second.bundles.size() << " fragments held)";
            expiredFragments.push_back(std::move(it->second.bundles.front()));
            it = m_idToFrags.erase(it);
            ++numRemoved;
        }
        else {
            ++it;
        }
    }
    return numRemoved;
}

std::size_t Bpv7FragmentManager::GetNumPendingReassemblies() {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_idToFrags.size();
}

std::size_t Bpv7FragmentManager::GetNumHeldFragments() {
    std::size_t numHeld = 0;
    boost::mutex::scoped_lock lock(m_mutex);
    for (std::map<Bpv7ReassemblyId, FragmentInfo>::const_iterator it = m_idToFrags.cbegin(); it != m_idToFrags.cend(); ++it) {
        numHeld += it->second.bundles.size();
    }
    return numHeld;
}

bool Bpv7FragmentManager::Bpv7ReassemblyId::operator<(const Bpv7ReassemblyId & o) const {
    if (src == o.src) {
        return ts < o.ts;
    }
    return src < o.src;
}
