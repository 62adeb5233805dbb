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
#include "withdrawal_tx_utils.h"

//local headers
#include "misc_log_ex.h"
#include "pp_core/abi_encoding.h"
#include "pp_core/address_utils.h"
#include "pp_crypto/field_utils.h"
#include "privacy_pool_config.h"
#include "span.h"
#include "withdrawal_account_layer.h"
#include "withdrawal_errors.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <array>
#include <exception>
#include <memory>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{

/// number of words in the static withdraw proof tuple: pA[2], pB[2][2], pC[2], pubSignals[8]
constexpr std::size_t WITHDRAW_PROOF_NUM_WORDS{2 + 4 + 2 + config::WITHDRAW_PROOF_NUM_PUBLIC_SIGNALS};

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void append_abi_withdraw_proof(const FormattedWithdrawProofV1 &formatted_proof, bytes_t &encoding_inout)
{
    for (const scalar_t &element : formatted_proof.p_a)
        append_abi_uint256(element, encoding_inout);
    for (const std::array<scalar_t, 2> &element_pair : formatted_proof.p_b)
    {
        append_abi_uint256(element_pair[0], encoding_inout);
        append_abi_uint256(element_pair[1], encoding_inout);
    }
    for (const scalar_t &element : formatted_proof.p_c)
        append_abi_uint256(element, encoding_inout);
    for (const scalar_t &signal : formatted_proof.pub_signals)
        append_abi_uint256(signal, encoding_inout);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
FormattedWithdrawProofV1 format_proof_for_contract_v1(const WithdrawalProofV1 &proof)
{
    THROW_WITHDRAWAL_EXCEPTION_IF(proof.public_signals.size() != config::WITHDRAW_PROOF_NUM_PUBLIC_SIGNALS,
        error::encoding_error,
        "cannot format a proof with " + std::to_string(proof.public_signals.size()) + " public signals");

    FormattedWithdrawProofV1 formatted_proof;

    formatted_proof.p_a = {proof.pi_a[0], proof.pi_a[1]};
    formatted_proof.p_b[0] = {proof.pi_b[0][1], proof.pi_b[0][0]};
    formatted_proof.p_b[1] = {proof.pi_b[1][1], proof.pi_b[1][0]};
    formatted_proof.p_c = {proof.pi_c[0], proof.pi_c[1]};

    for (std::size_t signal_index{0}; signal_index < formatted_proof.pub_signals.size(); ++signal_index)
        formatted_proof.pub_signals[signal_index] = proof.public_signals[signal_index];

    return formatted_proof;
}
//-------------------------------------------------------------------------------------------------------------------
bytes_t encode_relay_call_data_v1(const WithdrawalDataV1 &withdrawal_data,
    const FormattedWithdrawProofV1 &formatted_proof,
    const scalar_t &pool_scope)
{
    const abi_selector_t selector{abi_function_selector(config::RELAY_FUNCTION_SIGNATURE)};

    bytes_t call_data(selector.begin(), selector.end());
    const std::size_t args_start{call_data.size()};

    // 1. head: offset of the dynamic withdrawal tuple, the static proof tuple (inline), the scope
    const std::size_t head_num_words{1 + WITHDRAW_PROOF_NUM_WORDS + 1};
    append_abi_uint256(scalar_t{head_num_words*ABI_WORD_SIZE}, call_data);
    append_abi_withdraw_proof(formatted_proof, call_data);
    append_abi_uint256(pool_scope, call_data);

    THROW_WITHDRAWAL_EXCEPTION_IF(call_data.size() - args_start != head_num_words*ABI_WORD_SIZE,
        error::encoding_error,
        "relay call head has an unexpected size");

    // 2. tail: the withdrawal tuple
    append_abi_withdrawal_tuple(withdrawal_data.processor, epee::to_span(withdrawal_data.data), call_data);

    return call_data;
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalTransactionV1 prepare_withdrawal_transaction_v1(const WithdrawalContextV1 &withdrawal_context,
    const WithdrawalProofV1 &proof,
    WithdrawalAccountLayer &account_layer_inout)
{
    WithdrawalTransactionV1 withdrawal_tx;

    // 1. proof and relay call
    const FormattedWithdrawProofV1 formatted_proof{format_proof_for_contract_v1(proof)};
    withdrawal_tx.relay_call_data = encode_relay_call_data_v1(withdrawal_context.withdrawal_data,
        formatted_proof,
        withdrawal_context.fetched_data.pool_scope);

    // 2. account
    try
    {
        withdrawal_tx.account = account_layer_inout.create_withdrawal_account();
    }
    catch (const error::withdrawal_error&)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        THROW_WITHDRAWAL_EXCEPTION(error::account_setup_error,
            std::string{"failed to create the withdrawal account: "} + e.what());
    }
    THROW_WITHDRAWAL_EXCEPTION_IF(!withdrawal_tx.account,
        error::account_setup_error,
        "the account layer returned no withdrawal account");

    // 3. unsigned operation
    try
    {
        withdrawal_tx.operation =
            account_layer_inout.prepare_withdrawal_operation(*withdrawal_tx.account, withdrawal_tx.relay_call_data);
    }
    catch (const error::withdrawal_error&)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        THROW_WITHDRAWAL_EXCEPTION(error::account_setup_error,
            std::string{"failed to prepare the withdrawal operation: "} + e.what());
    }
    THROW_WITHDRAWAL_EXCEPTION_IF(sender_ref(withdrawal_tx.operation) != withdrawal_tx.account->address(),
        error::account_setup_error,
        "the withdrawal operation's sender is not the withdrawal account");
    THROW_WITHDRAWAL_EXCEPTION_IF(
            entry_point_version(withdrawal_tx.operation) != withdrawal_tx.account->entry_point_version(),
        error::account_setup_error,
        "the withdrawal operation does not target the account's entry point version");

    return withdrawal_tx;
}
//-------------------------------------------------------------------------------------------------------------------
std::string execute_withdrawal_v1(const PreparedWithdrawalV1 &prepared_withdrawal,
    WithdrawalAccountLayer &account_layer_inout)
{
    THROW_WITHDRAWAL_EXCEPTION_IF(!prepared_withdrawal.account,
        error::execution_error,
        "the prepared withdrawal has no account");

    std::string transaction_id;
    try
    {
        transaction_id = account_layer_inout.execute_withdrawal_operation(*prepared_withdrawal.account,
            prepared_withdrawal.operation);
    }
    catch (const error::execution_error&)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        THROW_WITHDRAWAL_EXCEPTION(error::execution_error,
            std::string{"failed to execute the withdrawal operation: "} + e.what());
    }
    THROW_WITHDRAWAL_EXCEPTION_IF(transaction_id.empty(),
        error::execution_error,
        "the account layer returned an empty transaction id");

    return transaction_id;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
