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

// Compute the withdrawal context and derive the note secrets of a withdrawal.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_crypto/field_utils.h"
#include "withdrawal_config.h"
#include "withdrawal_types.h"
#include "wipeable_string.h"

//third party headers

//standard headers
#include <cstdint>

//forward declarations
namespace pp
{
    class MnemonicKeyRestorer;
    class NoteIndexTracker;
    class NoteSecretDeriver;
}

namespace pp
{

/**
* brief: make_withdrawal_data_v1 - make the on-chain withdrawal struct
*   - processor: the relay processor
*   - data: abi.encode(address recipient, address fee_recipient, uint256 relay_fee_bps)
* param: recipient -
* param: config -
* return: withdrawal data
*/
WithdrawalDataV1 make_withdrawal_data_v1(const Address &recipient, const WithdrawalConfigV1 &config);
/**
* brief: compute_withdrawal_context - context = keccak256(abi.encode((address, bytes) withdrawal, uint256 scope)) mod p
* param: withdrawal_data -
* param: pool_scope -
* return: the withdrawal context scalar
*/
scalar_t compute_withdrawal_context(const WithdrawalDataV1 &withdrawal_data, const scalar_t &pool_scope);

/**
* brief: reserve_note_index - reserve the next note index from the tracker
*   - any failure is reported as error::index_tracker_error
* param: account_key -
* param: pool_address -
* inoutparam: index_tracker_inout -
* return: the reserved index
*/
std::uint64_t reserve_note_index(const epee::wipeable_string &account_key,
    const Address &pool_address,
    NoteIndexTracker &index_tracker_inout);

/**
* brief: calculate_withdrawal_context_v1 - build the withdrawal context of a request
*   1. withdrawal data and context scalar (recomputed every call)
*   2. resolve the account key
*   3. reserve the next note index (exactly once)
*   4. derive the new note's nullifier/secret at the reserved index, and the spent note's at its own index
* param: request -
* param: fetched_data -
* param: config -
* param: mnemonic_key_restorer -
* inoutparam: index_tracker_inout -
* param: secret_deriver -
* return: the withdrawal context
*/
WithdrawalContextV1 calculate_withdrawal_context_v1(const WithdrawalRequestV1 &request,
    const FetchedWithdrawalDataV1 &fetched_data,
    const WithdrawalConfigV1 &config,
    const MnemonicKeyRestorer &mnemonic_key_restorer,
    NoteIndexTracker &index_tracker_inout,
    const NoteSecretDeriver &secret_deriver);

} //namespace pp
