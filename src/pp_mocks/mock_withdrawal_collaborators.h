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

// NOT FOR PRODUCTION

// Mock key restoration, index tracking and event recording, plus setup helpers for withdrawal tests.

#pragma once

//local headers
#include "mock_pool_ledger.h"
#include "pp_core/address_utils.h"
#include "pp_main/mnemonic_key_restorer.h"
#include "pp_main/note_index_tracker.h"
#include "pp_main/withdrawal_event_types.h"
#include "pp_main/withdrawal_types.h"
#include "wipeable_string.h"

//third party headers

//standard headers
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

//forward declarations


namespace pp
{
namespace mocks
{

////
// MockMnemonicKeyRestorer
// - accepts 12 or 24 words; key = 0x + hex(keccak256(words joined by single spaces))
///
class MockMnemonicKeyRestorer final : public MnemonicKeyRestorer
{
public:
//member functions
    epee::wipeable_string restore_private_key(const mnemonic_words_t &mnemonic_words) const override;
};

/// index tracker whose backing store is unreachable
class NoteIndexTrackerMockUnavailable final : public NoteIndexTracker
{
public:
//member functions
    std::uint64_t reserve_next_note_index(const epee::wipeable_string&, const Address&) override;

    std::size_t num_reserve_attempts() const { return m_num_reserve_attempts; }

private:
//member variables
    std::size_t m_num_reserve_attempts{0};
};

/// records every event it receives
class WithdrawalEventRecorderMock final : public WithdrawalEventSink
{
public:
//member functions
    void on_event(const WithdrawalEvent &event) override { m_events.emplace_back(event); }

    const std::vector<WithdrawalEvent>& events() const { return m_events; }

private:
//member variables
    std::vector<WithdrawalEvent> m_events;
};

/// address with all bytes set to 'fill'
Address make_mock_address(const unsigned char fill);

/**
* brief: add_mock_deposit - put a note in the mock ledger
*   - the commitment is appended to the state tree
*   - the note's label is approved by the ASP if 'approve_label' is set
* param: amount - decimal note balance
* param: note_index - derivation index of the note
* param: approve_label -
* inoutparam: ledger_inout -
* return: the deposited note
*/
PoolNoteV1 add_mock_deposit(const std::string &amount,
    const std::uint64_t note_index,
    const bool approve_label,
    MockPoolLedger &ledger_inout);

} //namespace mocks
} //namespace pp
