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

// Local validation of a withdrawal request.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "withdrawal_types.h"

//third party headers

//standard headers

//forward declarations


namespace pp
{

/**
* brief: validate_withdrawal_request_v1 - check a request before any fetch or derivation
*   - no side effects; throws the first failure found, in this order:
*     - missing/unparsable commitment or label -> error::invalid_note_error
*     - withdraw amount not a positive decimal -> error::invalid_amount_error
*     - unparsable note balance -> error::invalid_note_error
*     - withdraw amount above the note balance (compared in base units) -> error::invalid_amount_error
*     - malformed recipient address -> error::invalid_recipient_error
*     - no private key and no mnemonic -> error::missing_credential_error
* param: request -
* outparam: withdraw_amount_out - the withdraw amount in base units
* outparam: recipient_out - the parsed recipient
*/
void validate_withdrawal_request_v1(const WithdrawalRequestV1 &request,
    amount_t &withdraw_amount_out,
    Address &recipient_out);
void validate_withdrawal_request_v1(const WithdrawalRequestV1 &request);

} //namespace pp
