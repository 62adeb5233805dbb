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

//paired header
#include "mock_withdrawal_collaborators.h"

//local headers
#include "hex.h"
#include "misc_log_ex.h"
#include "mock_pool_ledger.h"
#include "mock_withdrawal_prover.h"
#include "pp_core/amount_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "span.h"
#include "wipeable_string.h"

//third party headers

//standard headers
#include <stdexcept>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_mocks"

namespace pp
{
namespace mocks
{
//-------------------------------------------------------------------------------------------------------------------
epee::wipeable_string MockMnemonicKeyRestorer::restore_private_key(const mnemonic_words_t &mnemonic_words) const
{
    if (mnemonic_words.size() != 12 && mnemonic_words.size() != 24)
        throw std::invalid_argument("mock mnemonic restorer: expected 12 or 24 words");

    epee::wipeable_string joined;
    for (const epee::wipeable_string &word : mnemonic_words)
    {
        if (!joined.empty())
            joined.push_back(' ');
        joined += word;
    }

    const bytes32_t key_bytes{
            keccak256(epee::span<const std::uint8_t>{
                reinterpret_cast<const std::uint8_t*>(joined.data()),
                joined.size()
            })
        };

    return epee::wipeable_string{"0x" + epee::to_hex::string(epee::to_span(key_bytes))};
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t NoteIndexTrackerMockUnavailable::reserve_next_note_index(const epee::wipeable_string&, const Address&)
{
    ++m_num_reserve_attempts;
    throw std::runtime_error("mock note index tracker: storage unreachable");
}
//-------------------------------------------------------------------------------------------------------------------
Address make_mock_address(const unsigned char fill)
{
    Address address;
    address.bytes.fill(fill);
    return address;
}
//-------------------------------------------------------------------------------------------------------------------
PoolNoteV1 add_mock_deposit(const std::string &amount,
    const std::uint64_t note_index,
    const bool approve_label,
    MockPoolLedger &ledger_inout)
{
    // mock deposit secrets
    const scalar_t label{hash_to_field(epee::strspan<std::uint8_t>("mock label " + std::to_string(note_index)))};
    const scalar_t nullifier{hash_to_field(epee::strspan<std::uint8_t>("mock nullifier " + amount))};
    const scalar_t secret{hash_to_field(epee::strspan<std::uint8_t>("mock secret " + amount))};
    const scalar_t commitment{mock_note_commitment(parse_ether(amount), label, nullifier, secret)};

    ledger_inout.add_commitment(commitment);
    if (approve_label)
        ledger_inout.approve_label(label);

    PoolNoteV1 note;
    note.commitment = scalar_to_decimal(commitment);
    note.amount     = amount;
    note.label      = scalar_to_decimal(label);
    note.note_index = note_index;

    return note;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace pp
