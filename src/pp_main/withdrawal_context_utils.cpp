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
#include "withdrawal_context_utils.h"

//local headers
#include "account_key_utils.h"
#include "misc_log_ex.h"
#include "note_index_tracker.h"
#include "note_secret_deriver.h"
#include "pp_core/abi_encoding.h"
#include "pp_core/address_utils.h"
#include "pp_crypto/field_utils.h"
#include "span.h"
#include "withdrawal_config.h"
#include "withdrawal_errors.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <exception>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
WithdrawalDataV1 make_withdrawal_data_v1(const Address &recipient, const WithdrawalConfigV1 &config)
{
    WithdrawalDataV1 withdrawal_data;
    withdrawal_data.processor = config.relay_processor;
    withdrawal_data.data      = abi_encode_relay_data(recipient, config.fee_recipient, config.relay_fee_bps);

    return withdrawal_data;
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t compute_withdrawal_context(const WithdrawalDataV1 &withdrawal_data, const scalar_t &pool_scope)
{
    const bytes_t encoding{
            abi_encode_withdrawal_context(withdrawal_data.processor,
                epee::to_span(withdrawal_data.data),
                pool_scope)
        };

    return hash_to_field(epee::to_span(encoding));
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t reserve_note_index(const epee::wipeable_string &account_key,
    const Address &pool_address,
    NoteIndexTracker &index_tracker_inout)
{
    try
    {
        return index_tracker_inout.reserve_next_note_index(account_key, pool_address);
    }
    catch (const error::index_tracker_error&)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        THROW_WITHDRAWAL_EXCEPTION(error::index_tracker_error,
            std::string{"note index tracker failed: "} + e.what());
    }
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalContextV1 calculate_withdrawal_context_v1(const WithdrawalRequestV1 &request,
    const FetchedWithdrawalDataV1 &fetched_data,
    const WithdrawalConfigV1 &config,
    const MnemonicKeyRestorer &mnemonic_key_restorer,
    NoteIndexTracker &index_tracker_inout,
    const NoteSecretDeriver &secret_deriver)
{
    Address recipient;
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_address(request.recipient_address, recipient),
        error::invalid_recipient_error,
        "invalid recipient address: " + request.recipient_address);

    WithdrawalContextV1 withdrawal_context;
    withdrawal_context.fetched_data = fetched_data;

    // 1. withdrawal data and context
    withdrawal_context.withdrawal_data = make_withdrawal_data_v1(recipient, config);
    withdrawal_context.context = compute_withdrawal_context(withdrawal_context.withdrawal_data,
        fetched_data.pool_scope);

    // 2. account key
    const epee::wipeable_string account_key{resolve_account_key(request.credential, mnemonic_key_restorer)};

    // 3. next note index (reserved after the key is known, right before deriving with it)
    withdrawal_context.next_note_index = reserve_note_index(account_key, config.pool_address, index_tracker_inout);

    // the new note must never reuse the spent note's derivation index
    THROW_WITHDRAWAL_EXCEPTION_IF(withdrawal_context.next_note_index <= request.note.note_index,
        error::index_tracker_error,
        "reserved note index " + std::to_string(withdrawal_context.next_note_index)
            + " is not above the spent note's index " + std::to_string(request.note.note_index));

    // 4. new note secrets
    withdrawal_context.new_nullifier =
        secret_deriver.derive_nullifier(account_key, config.pool_address, withdrawal_context.next_note_index);
    withdrawal_context.new_secret =
        secret_deriver.derive_secret(account_key, config.pool_address, withdrawal_context.next_note_index);

    // 5. existing note secrets
    withdrawal_context.existing_nullifier =
        secret_deriver.derive_nullifier(account_key, config.pool_address, request.note.note_index);
    withdrawal_context.existing_secret =
        secret_deriver.derive_secret(account_key, config.pool_address, request.note.note_index);

    return withdrawal_context;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
