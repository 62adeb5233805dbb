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

//paired header
#include "note_index_tracker_memory.h"

//local headers
#include "memwipe.h"
#include "misc_log_ex.h"
#include "pp_core/address_utils.h"
#include "pp_crypto/keccak.h"
#include "pp_main/withdrawal_errors.h"
#include "privacy_pool_config.h"
#include "span.h"
#include "wipeable_string.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <cstring>
#include <limits>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_impl"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t NoteIndexTrackerMemory::reserve_next_note_index(const epee::wipeable_string &account_key,
    const Address &pool_address)
{
    const bytes32_t key{tracker_key(account_key, pool_address)};

    boost::unique_lock<boost::shared_mutex> lock{m_tracker_mutex};

    // 1. nothing used yet: start at 0
    const auto last_used_it = m_last_used_indices.find(key);
    if (last_used_it == m_last_used_indices.end())
    {
        m_last_used_indices[key] = 0;
        return 0;
    }

    // 2. otherwise one past the last used index
    THROW_WITHDRAWAL_EXCEPTION_IF(last_used_it->second == std::numeric_limits<std::uint64_t>::max(),
        error::index_tracker_error,
        "note index space exhausted for this account and pool");

    return ++(last_used_it->second);
}
//-------------------------------------------------------------------------------------------------------------------
void NoteIndexTrackerMemory::record_used_note_index(const epee::wipeable_string &account_key,
    const Address &pool_address,
    const std::uint64_t note_index)
{
    const bytes32_t key{tracker_key(account_key, pool_address)};

    boost::unique_lock<boost::shared_mutex> lock{m_tracker_mutex};

    const auto last_used_it = m_last_used_indices.find(key);
    if (last_used_it == m_last_used_indices.end())
        m_last_used_indices[key] = note_index;
    else if (last_used_it->second < note_index)
        last_used_it->second = note_index;
}
//-------------------------------------------------------------------------------------------------------------------
boost::optional<std::uint64_t> NoteIndexTrackerMemory::last_used_note_index(const epee::wipeable_string &account_key,
    const Address &pool_address) const
{
    const bytes32_t key{tracker_key(account_key, pool_address)};

    boost::shared_lock<boost::shared_mutex> lock{m_tracker_mutex};

    const auto last_used_it = m_last_used_indices.find(key);
    if (last_used_it == m_last_used_indices.end())
        return boost::none;

    return last_used_it->second;
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t NoteIndexTrackerMemory::num_tracked_accounts() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_tracker_mutex};
    return m_last_used_indices.size();
}
//-------------------------------------------------------------------------------------------------------------------
bytes32_t NoteIndexTrackerMemory::tracker_key(const epee::wipeable_string &account_key, const Address &pool_address)
{
    // domain || account key || pool
    const std::size_t domain_size{sizeof(config::HASH_KEY_NOTE_INDEX_TRACKER) - 1};
    bytes_t transcript(domain_size + account_key.size() + pool_address.bytes.size());

    std::memcpy(transcript.data(), config::HASH_KEY_NOTE_INDEX_TRACKER, domain_size);
    std::memcpy(transcript.data() + domain_size, account_key.data(), account_key.size());
    std::memcpy(transcript.data() + domain_size + account_key.size(),
        pool_address.bytes.data(),
        pool_address.bytes.size());

    const bytes32_t key{keccak256(epee::to_span(transcript))};
    memwipe(transcript.data(), transcript.size());

    return key;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
