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

// Format a withdrawal proof for the chain and build the operation that relays it.

#pragma once

//local headers
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <memory>
#include <string>

//forward declarations
namespace pp
{
    class WithdrawalAccount;
    class WithdrawalAccountLayer;
}

namespace pp
{

////
// WithdrawalTransactionV1
// - an unsigned relay operation and the account that will submit it
///
struct WithdrawalTransactionV1 final
{
    /// entrypoint relay call
    bytes_t relay_call_data;
    WithdrawalOperationVariant operation;
    std::shared_ptr<const WithdrawalAccount> account;
};

/**
* brief: format_proof_for_contract_v1 - convert a prover-layout proof to the verifier's layout
*   - pA = pi_a[0..1], pC = pi_c[0..1]
*   - pB = [[pi_b[0][1], pi_b[0][0]], [pi_b[1][1], pi_b[1][0]]] (Fq2 coordinate order of the verifier)
*   - throws error::encoding_error if the proof does not carry exactly 8 public signals
* param: proof -
* return: formatted proof
*/
FormattedWithdrawProofV1 format_proof_for_contract_v1(const WithdrawalProofV1 &proof);
/**
* brief: encode_relay_call_data_v1 - encode the entrypoint call relay(withdrawal, proof, scope)
* param: withdrawal_data -
* param: formatted_proof -
* param: pool_scope -
* return: selector + ABI-encoded arguments
*/
bytes_t encode_relay_call_data_v1(const WithdrawalDataV1 &withdrawal_data,
    const FormattedWithdrawProofV1 &formatted_proof,
    const scalar_t &pool_scope);
/**
* brief: prepare_withdrawal_transaction_v1 - build the unsigned relay operation for a proven withdrawal
*   - throws error::encoding_error (proof formatting, call data encoding) or error::account_setup_error (account layer)
* param: withdrawal_context -
* param: proof -
* inoutparam: account_layer_inout -
* return: the relay operation and its account
*/
WithdrawalTransactionV1 prepare_withdrawal_transaction_v1(const WithdrawalContextV1 &withdrawal_context,
    const WithdrawalProofV1 &proof,
    WithdrawalAccountLayer &account_layer_inout);
/**
* brief: execute_withdrawal_v1 - submit a prepared withdrawal
*   - throws error::execution_error on failure
* param: prepared_withdrawal -
* inoutparam: account_layer_inout -
* return: transaction id
*/
std::string execute_withdrawal_v1(const PreparedWithdrawalV1 &prepared_withdrawal,
    WithdrawalAccountLayer &account_layer_inout);

} //namespace pp
