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

// State machine that prepares a withdrawal one step at a time.

#pragma once

//local headers
#include "withdrawal_event_types.h"
#include "withdrawal_machine_types.h"
#include "withdrawal_types.h"

//third party headers

//standard headers

//forward declarations


namespace pp
{

/**
* brief: try_advance_withdrawal_machine - advance the withdrawal machine to the next state
*   - Start -> Validated -> DataFetched -> ContextReady -> ProofReady -> TransactionReady
*   - a failed step throws and leaves the state unchanged
* param: request -
* inoutparam: collaborators_inout -
* inoutparam: state_inout -
* return: true if the machine was advanced to a new state, false if the machine is in its terminal state
*/
bool try_advance_withdrawal_machine(const WithdrawalRequestV1 &request,
    WithdrawalMachineCollaborators &collaborators_inout,
    WithdrawalMachineState &state_inout);
/// true if the machine is in its terminal state
bool withdrawal_machine_is_terminal(const WithdrawalMachineState &state);
/// the stage the machine will run when it is next advanced from 'state'
WithdrawalStage next_withdrawal_stage(const WithdrawalMachineState &state);

} //namespace pp
