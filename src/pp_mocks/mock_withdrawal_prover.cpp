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
#include "mock_withdrawal_prover.h"

//local headers
#include "misc_log_ex.h"
#include "mock_pool_ledger.h"
#include "pp_core/abi_encoding.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "pp_main/withdrawal_errors.h"
#include "pp_main/withdrawal_types.h"
#include "privacy_pool_config.h"
#include "span.h"

//third party headers

//standard headers
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_mocks"

namespace pp
{
namespace mocks
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool contains(const std::vector<scalar_t> &values, const scalar_t &value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static scalar_t mock_proof_element(const std::vector<scalar_t> &public_signals, const std::uint64_t element_tag)
{
    bytes_t transcript;
    for (const scalar_t &signal : public_signals)
        append_abi_uint256(signal, transcript);
    append_abi_uint256(scalar_t{element_tag}, transcript);

    return hash_to_field(epee::to_span(transcript));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
scalar_t mock_note_commitment(const amount_t &value,
    const scalar_t &label,
    const scalar_t &nullifier,
    const scalar_t &secret)
{
    bytes_t transcript;
    append_abi_uint256(value, transcript);
    append_abi_uint256(label, transcript);
    append_abi_uint256(nullifier, transcript);
    append_abi_uint256(secret, transcript);

    return hash_to_field(epee::to_span(transcript));
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t mock_nullifier_hash(const scalar_t &nullifier)
{
    bytes_t transcript;
    append_abi_uint256(nullifier, transcript);

    return hash_to_field(epee::to_span(transcript));
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalProofV1 MockWithdrawalProver::generate_withdrawal_proof(const WithdrawalProofInputsV1 &proof_inputs)
{
    ++m_num_invocations;
    m_last_proof_inputs = proof_inputs;

    if (m_mode == Mode::UNAVAILABLE)
        throw std::runtime_error("mock prover: proving service unavailable");

    // 1. witness checks
    using error::proof_generation_error;

    THROW_WITHDRAWAL_EXCEPTION_IF(!contains(proof_inputs.state_tree_commitments, proof_inputs.existing_commitment),
        proof_generation_error,
        proof_generation_error::kind::INVALID_WITNESS,
        "existing commitment is not in the state tree");
    THROW_WITHDRAWAL_EXCEPTION_IF(!contains(proof_inputs.asp_tree_labels, proof_inputs.label),
        proof_generation_error,
        proof_generation_error::kind::INVALID_WITNESS,
        "label is not approved by the ASP");
    THROW_WITHDRAWAL_EXCEPTION_IF(proof_inputs.withdrawn_value > proof_inputs.existing_value,
        proof_generation_error,
        proof_generation_error::kind::INVALID_WITNESS,
        "withdrawn value exceeds the existing value");
    THROW_WITHDRAWAL_EXCEPTION_IF(!is_in_scalar_field(proof_inputs.context) ||
            !is_in_scalar_field(proof_inputs.existing_nullifier) ||
            !is_in_scalar_field(proof_inputs.existing_secret) ||
            !is_in_scalar_field(proof_inputs.new_nullifier) ||
            !is_in_scalar_field(proof_inputs.new_secret),
        proof_generation_error,
        proof_generation_error::kind::INVALID_WITNESS,
        "circuit input is not a field element");

    // 2. public signals
    WithdrawalProofV1 proof;
    proof.public_signals.resize(config::WITHDRAW_PROOF_NUM_PUBLIC_SIGNALS);

    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_NEW_COMMITMENT] =
        mock_note_commitment(proof_inputs.existing_value - proof_inputs.withdrawn_value,
            proof_inputs.label,
            proof_inputs.new_nullifier,
            proof_inputs.new_secret);
    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_EXISTING_NULLIFIER_HASH] =
        mock_nullifier_hash(proof_inputs.existing_nullifier);
    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_WITHDRAWN_VALUE] = proof_inputs.withdrawn_value;
    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_STATE_ROOT] =
        mock_set_root(proof_inputs.state_tree_commitments);
    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_STATE_TREE_DEPTH] =
        mock_tree_depth(proof_inputs.state_tree_commitments.size());
    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_ASP_ROOT] = mock_set_root(proof_inputs.asp_tree_labels);
    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_ASP_TREE_DEPTH] =
        mock_tree_depth(proof_inputs.asp_tree_labels.size());
    proof.public_signals[config::WITHDRAW_PROOF_SIGNAL_CONTEXT] = proof_inputs.context;

    // 3. group elements (projective coordinate = 1, as snarkjs reports them)
    const std::vector<scalar_t> &signals{proof.public_signals};
    proof.pi_a    = {mock_proof_element(signals, 0), mock_proof_element(signals, 1), scalar_t{1}};
    proof.pi_b[0] = {mock_proof_element(signals, 2), mock_proof_element(signals, 3)};
    proof.pi_b[1] = {mock_proof_element(signals, 4), mock_proof_element(signals, 5)};
    proof.pi_b[2] = {scalar_t{1}, scalar_t{0}};
    proof.pi_c    = {mock_proof_element(signals, 6), mock_proof_element(signals, 7), scalar_t{1}};

    if (m_mode == Mode::MALFORMED_OUTPUT)
        proof.public_signals.pop_back();

    return proof;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace pp
