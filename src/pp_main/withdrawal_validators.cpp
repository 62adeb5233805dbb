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
#include "withdrawal_validators.h"

//local headers
#include "account_key_utils.h"
#include "misc_log_ex.h"
#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "pp_crypto/field_utils.h"
#include "withdrawal_errors.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
void validate_withdrawal_request_v1(const WithdrawalRequestV1 &request,
    amount_t &withdraw_amount_out,
    Address &recipient_out)
{
    // 1. note
    scalar_t temp_scalar;
    THROW_WITHDRAWAL_EXCEPTION_IF(request.note.commitment.empty(),
        error::invalid_note_error,
        "note commitment is missing");
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_scalar(request.note.commitment, temp_scalar),
        error::invalid_note_error,
        "note commitment is not a scalar: " + request.note.commitment);
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_scalar(request.note.label, temp_scalar),
        error::invalid_note_error,
        "note label is not a scalar: " + request.note.label);

    // 2. withdraw amount
    amount_t withdraw_amount;
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_ether(request.withdraw_amount, withdraw_amount),
        error::invalid_amount_error,
        "withdraw amount is not a decimal amount: " + request.withdraw_amount);
    THROW_WITHDRAWAL_EXCEPTION_IF(withdraw_amount == 0,
        error::invalid_amount_error,
        "withdraw amount must be positive");

    // 3. note balance
    amount_t note_balance;
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_ether(request.note.amount, note_balance),
        error::invalid_note_error,
        "note amount is not a decimal amount: " + request.note.amount);
    THROW_WITHDRAWAL_EXCEPTION_IF(withdraw_amount > note_balance,
        error::invalid_amount_error,
        "withdraw amount " + request.withdraw_amount + " exceeds the note balance " + request.note.amount);

    // 4. recipient
    Address recipient;
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_address(request.recipient_address, recipient),
        error::invalid_recipient_error,
        "invalid recipient address: " + request.recipient_address);

    // 5. credential
    THROW_WITHDRAWAL_EXCEPTION_IF(!has_account_credential(request.credential),
        error::missing_credential_error,
        "either a mnemonic or a private key is required");

    withdraw_amount_out = withdraw_amount;
    recipient_out       = recipient;
}
//-------------------------------------------------------------------------------------------------------------------
void validate_withdrawal_request_v1(const WithdrawalRequestV1 &request)
{
    amount_t dummy_withdraw_amount;
    Address dummy_recipient;
    validate_withdrawal_request_v1(request, dummy_withdraw_amount, dummy_recipient);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
