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
#include "withdrawal_proof_utils.h"

//local headers
#include "misc_log_ex.h"
#include "pp_core/amount_utils.h"
#include "pp_crypto/field_utils.h"
#include "privacy_pool_config.h"
#include "withdrawal_errors.h"
#include "withdrawal_prover.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <array>
#include <exception>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool proof_elements_in_field(const WithdrawalProofV1 &proof)
{
    // curve point coordinates are base field elements
    for (const scalar_t &element : proof.pi_a)
    {
        if (!is_in_base_field(element))
            return false;
    }
    for (const std::array<scalar_t, 2> &element_pair : proof.pi_b)
    {
        if (!is_in_base_field(element_pair[0]) || !is_in_base_field(element_pair[1]))
            return false;
    }
    for (const scalar_t &element : proof.pi_c)
    {
        if (!is_in_base_field(element))
            return false;
    }

    // public signals are circuit scalars
    for (const scalar_t &signal : proof.public_signals)
    {
        if (!is_in_scalar_field(signal))
            return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
WithdrawalProofInputsV1 make_withdrawal_proof_inputs_v1(const WithdrawalRequestV1 &request,
    const WithdrawalContextV1 &withdrawal_context)
{
    WithdrawalProofInputsV1 proof_inputs;

    // 1. spent note
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_scalar(request.note.commitment, proof_inputs.existing_commitment),
        error::invalid_note_error,
        "note commitment is not a scalar: " + request.note.commitment);
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_ether(request.note.amount, proof_inputs.existing_value),
        error::invalid_note_error,
        "note amount is not a decimal amount: " + request.note.amount);
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_scalar(request.note.label, proof_inputs.label),
        error::invalid_note_error,
        "note label is not a scalar: " + request.note.label);
    proof_inputs.existing_nullifier = withdrawal_context.existing_nullifier;
    proof_inputs.existing_secret    = withdrawal_context.existing_secret;

    // 2. withdrawal
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_ether(request.withdraw_amount, proof_inputs.withdrawn_value),
        error::invalid_amount_error,
        "withdraw amount is not a decimal amount: " + request.withdraw_amount);
    proof_inputs.context = withdrawal_context.context;

    // 3. new note
    proof_inputs.new_nullifier = withdrawal_context.new_nullifier;
    proof_inputs.new_secret    = withdrawal_context.new_secret;

    // 4. anchors
    proof_inputs.state_tree_commitments.reserve(withdrawal_context.fetched_data.state_tree_leaves.size());
    for (const StateTreeLeafV1 &leaf : withdrawal_context.fetched_data.state_tree_leaves)
        proof_inputs.state_tree_commitments.emplace_back(leaf.leaf_value);

    proof_inputs.asp_tree_labels = withdrawal_context.fetched_data.asp_data.approved_labels;

    return proof_inputs;
}
//-------------------------------------------------------------------------------------------------------------------
void check_withdrawal_proof_semantics_v1(const WithdrawalProofV1 &proof, const WithdrawalProofInputsV1 &proof_inputs)
{
    THROW_WITHDRAWAL_EXCEPTION_IF(proof.public_signals.size() != config::WITHDRAW_PROOF_NUM_PUBLIC_SIGNALS,
        error::proof_generation_error,
        error::proof_generation_error::kind::PROVER_FAILURE,
        "prover returned " + std::to_string(proof.public_signals.size()) + " public signals, expected " +
            std::to_string(config::WITHDRAW_PROOF_NUM_PUBLIC_SIGNALS));
    THROW_WITHDRAWAL_EXCEPTION_IF(!proof_elements_in_field(proof),
        error::proof_generation_error,
        error::proof_generation_error::kind::PROVER_FAILURE,
        "prover returned a proof element outside the scalar field");
    THROW_WITHDRAWAL_EXCEPTION_IF(
            proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_WITHDRAWN_VALUE] != proof_inputs.withdrawn_value,
        error::proof_generation_error,
        error::proof_generation_error::kind::PROVER_FAILURE,
        "proof's withdrawn value does not match the requested withdrawal");
    THROW_WITHDRAWAL_EXCEPTION_IF(proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_CONTEXT] != proof_inputs.context,
        error::proof_generation_error,
        error::proof_generation_error::kind::PROVER_FAILURE,
        "proof's context does not match the withdrawal context");
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalProofV1 generate_withdrawal_proof_v1(const WithdrawalRequestV1 &request,
    const WithdrawalContextV1 &withdrawal_context,
    WithdrawalProver &prover_inout)
{
    // 1. circuit inputs
    const WithdrawalProofInputsV1 proof_inputs{make_withdrawal_proof_inputs_v1(request, withdrawal_context)};

    // 2. prove (once)
    WithdrawalProofV1 proof;
    try
    {
        proof = prover_inout.generate_withdrawal_proof(proof_inputs);
    }
    catch (const error::proof_generation_error&)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        THROW_WITHDRAWAL_EXCEPTION(error::proof_generation_error,
            error::proof_generation_error::kind::PROVER_FAILURE,
            std::string{"prover failed: "} + e.what());
    }

    // 3. sanity check the prover's output
    check_withdrawal_proof_semantics_v1(proof, proof_inputs);

    return proof;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
