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

// Mock withdraw circuit prover.
// - checks the witness the way the circuit constrains it (membership, approval, balance)
// - outputs are deterministic hashes, not a real Groth16 proof

#pragma once

//local headers
#include "pp_crypto/field_utils.h"
#include "pp_main/withdrawal_prover.h"
#include "pp_main/withdrawal_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstddef>
#include <vector>

//forward declarations


namespace pp
{
namespace mocks
{

/// mock commitment of a note: keccak256(uint256 value, label, nullifier, secret) mod p
scalar_t mock_note_commitment(const amount_t &value,
    const scalar_t &label,
    const scalar_t &nullifier,
    const scalar_t &secret);
/// mock nullifier hash: keccak256(uint256 nullifier) mod p
scalar_t mock_nullifier_hash(const scalar_t &nullifier);

////
// MockWithdrawalProver
///
class MockWithdrawalProver final : public WithdrawalProver
{
public:
    enum class Mode : unsigned char
    {
        /// prove if the witness is valid
        HONEST,
        /// throw a generic exception (e.g. prover service down)
        UNAVAILABLE,
        /// return a proof with a missing public signal
        MALFORMED_OUTPUT
    };

//member functions
    /**
    * brief: generate_withdrawal_proof - prove the withdraw circuit
    *   - throws error::proof_generation_error (INVALID_WITNESS) if:
    *     - the existing commitment is not in the state tree
    *     - the label is not approved
    *     - the withdrawn value exceeds the existing value
    *     - a circuit input is not a field element
    * param: proof_inputs -
    * return: mock proof
    */
    WithdrawalProofV1 generate_withdrawal_proof(const WithdrawalProofInputsV1 &proof_inputs) override;

    void set_mode(const Mode mode) { m_mode = mode; }

    /// number of times the prover was invoked
    std::size_t num_invocations() const { return m_num_invocations; }
    /// inputs of the last invocation
    const boost::optional<WithdrawalProofInputsV1>& last_proof_inputs() const { return m_last_proof_inputs; }

private:
//member variables
    Mode m_mode{Mode::HONEST};
    std::size_t m_num_invocations{0};
    boost::optional<WithdrawalProofInputsV1> m_last_proof_inputs;
};

} //namespace mocks
} //namespace pp
