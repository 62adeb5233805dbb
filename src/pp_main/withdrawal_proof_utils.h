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

// Assemble withdraw circuit inputs and obtain a proof from the prover.

#pragma once

//local headers
#include "withdrawal_types.h"

//third party headers

//standard headers

//forward declarations
namespace pp
{
    class WithdrawalProver;
}

namespace pp
{

/**
* brief: make_withdrawal_proof_inputs_v1 - map a request and its context onto the withdraw circuit's inputs
*   - note amount and withdraw amount are converted to base units
* param: request -
* param: withdrawal_context -
* return: circuit inputs
*/
WithdrawalProofInputsV1 make_withdrawal_proof_inputs_v1(const WithdrawalRequestV1 &request,
    const WithdrawalContextV1 &withdrawal_context);
/**
* brief: check_withdrawal_proof_semantics_v1 - check that a proof returned by the prover matches its inputs
*   - exactly WITHDRAW_PROOF_NUM_PUBLIC_SIGNALS public signals
*   - the withdrawn value and context signals equal the inputs
*   - every proof element and signal is in the scalar field
*   - throws error::proof_generation_error (PROVER_FAILURE) on mismatch
* param: proof -
* param: proof_inputs -
*/
void check_withdrawal_proof_semantics_v1(const WithdrawalProofV1 &proof, const WithdrawalProofInputsV1 &proof_inputs);
/**
* brief: generate_withdrawal_proof_v1 - prove a withdrawal
*   - the prover is invoked exactly once
*   - typed prover errors propagate; other prover exceptions become error::proof_generation_error (PROVER_FAILURE)
* param: request -
* param: withdrawal_context -
* inoutparam: prover_inout -
* return: the proof
*/
WithdrawalProofV1 generate_withdrawal_proof_v1(const WithdrawalRequestV1 &request,
    const WithdrawalContextV1 &withdrawal_context,
    WithdrawalProver &prover_inout);

} //namespace pp
