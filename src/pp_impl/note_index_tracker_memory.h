// Copyright (c) 2025, The Monero Project
//
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

// In-memory note index tracker.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_crypto/keccak.h"
#include "pp_main/note_index_tracker.h"
#include "wipeable_string.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <map>

//forward declarations


namespace pp
{

////
// NoteIndexTrackerMemory
// - tracks the highest used note index per (account key, pool)
// - entries are keyed by keccak256(domain || account key || pool) so account keys are never stored
// - thread-safe: reserve_next_note_index() is an atomic read-increment-write
///
class NoteIndexTrackerMemory final : public NoteIndexTracker
{
public:
//member functions
    /// reserve the next unused index (last used + 1, or 0 if nothing was used yet)
    std::uint64_t reserve_next_note_index(const epee::wipeable_string &account_key,
        const Address &pool_address) override;

    /// record an index found in use (e.g. by scanning for the account's notes); the last used index never decreases
    void record_used_note_index(const epee::wipeable_string &account_key,
        const Address &pool_address,
        const std::uint64_t note_index);
    /// get the last used index, if any
    boost::optional<std::uint64_t> last_used_note_index(const epee::wipeable_string &account_key,
        const Address &pool_address) const;
    /// number of (account key, pool) pairs tracked
    std::size_t num_tracked_accounts() const;

private:
    /// storage key of an (account key, pool) pair
    static bytes32_t tracker_key(const epee::wipeable_string &account_key, const Address &pool_address);

//member variables
    mutable boost::shared_mutex m_tracker_mutex;

    /// [ tracker key : last used index ]
    std::map<bytes32_t, std::uint64_t> m_last_used_indices;
};

} //namespace pp
