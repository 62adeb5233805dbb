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
#include "withdrawal_machine.h"

//local headers
#include "misc_log_ex.h"
#include "withdrawal_account_layer.h"
#include "withdrawal_context_utils.h"
#include "withdrawal_data_fetch.h"
#include "withdrawal_event_types.h"
#include "withdrawal_machine_types.h"
#include "withdrawal_proof_utils.h"
#include "withdrawal_tx_utils.h"
#include "withdrawal_types.h"
#include "withdrawal_validators.h"

//third party headers
#include <boost/variant.hpp>

//standard headers
#include <utility>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void notify(WithdrawalEventSink *event_sink, const WithdrawalEvent &event)
{
    if (event_sink)
        event_sink->on_event(event);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static WithdrawalMachineState handle_start(const WithdrawalRequestV1 &request,
    WithdrawalMachineCollaborators &collaborators_inout)
{
    WithdrawalMachineValidated validated;
    validate_withdrawal_request_v1(request, validated.withdraw_amount, validated.recipient);

    notify(collaborators_inout.event_sink,
        WithdrawalRequestValidated{validated.withdraw_amount, validated.recipient});

    return validated;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static WithdrawalMachineState handle_validated(WithdrawalMachineCollaborators &collaborators_inout)
{
    WithdrawalMachineDataFetched data_fetched;
    data_fetched.fetched_data = fetch_withdrawal_data(collaborators_inout.data_source);

    notify(collaborators_inout.event_sink,
        WithdrawalDataFetched{
                data_fetched.fetched_data.state_tree_leaves.size(),
                data_fetched.fetched_data.asp_data.approved_labels.size(),
                data_fetched.fetched_data.asp_data.asp_root,
                data_fetched.fetched_data.pool_scope
            });

    return data_fetched;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static WithdrawalMachineState handle_data_fetched(const WithdrawalRequestV1 &request,
    const WithdrawalMachineDataFetched &data_fetched,
    WithdrawalMachineCollaborators &collaborators_inout)
{
    WithdrawalMachineContextReady context_ready;
    context_ready.withdrawal_context = calculate_withdrawal_context_v1(request,
        data_fetched.fetched_data,
        collaborators_inout.config,
        collaborators_inout.mnemonic_key_restorer,
        collaborators_inout.index_tracker,
        collaborators_inout.secret_deriver);

    notify(collaborators_inout.event_sink,
        WithdrawalContextCalculated{
                context_ready.withdrawal_context.context,
                context_ready.withdrawal_context.next_note_index
            });

    return context_ready;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static WithdrawalMachineState handle_context_ready(const WithdrawalRequestV1 &request,
    const WithdrawalMachineContextReady &context_ready,
    WithdrawalMachineCollaborators &collaborators_inout)
{
    WithdrawalMachineProofReady proof_ready;
    proof_ready.proof =
        generate_withdrawal_proof_v1(request, context_ready.withdrawal_context, collaborators_inout.prover);
    proof_ready.withdrawal_context = context_ready.withdrawal_context;

    notify(collaborators_inout.event_sink, WithdrawalProofGenerated{proof_ready.proof.public_signals.size()});

    return proof_ready;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static WithdrawalMachineState handle_proof_ready(const WithdrawalMachineProofReady &proof_ready,
    WithdrawalMachineCollaborators &collaborators_inout)
{
    WithdrawalTransactionV1 withdrawal_tx{
            prepare_withdrawal_transaction_v1(proof_ready.withdrawal_context,
                proof_ready.proof,
                collaborators_inout.account_layer)
        };

    WithdrawalMachineTransactionReady transaction_ready;
    PreparedWithdrawalV1 &prepared_withdrawal{transaction_ready.prepared_withdrawal};
    prepared_withdrawal.context         = proof_ready.withdrawal_context;
    prepared_withdrawal.proof           = proof_ready.proof;
    prepared_withdrawal.relay_call_data = std::move(withdrawal_tx.relay_call_data);
    prepared_withdrawal.operation       = std::move(withdrawal_tx.operation);
    prepared_withdrawal.account         = std::move(withdrawal_tx.account);

    notify(collaborators_inout.event_sink,
        WithdrawalTransactionPrepared{
                prepared_withdrawal.account->address(),
                entry_point_version(prepared_withdrawal.operation),
                prepared_withdrawal.relay_call_data.size()
            });

    return transaction_ready;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
bool withdrawal_machine_is_terminal(const WithdrawalMachineState &state)
{
    return boost::get<WithdrawalMachineTransactionReady>(&state) != nullptr;
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalStage next_withdrawal_stage(const WithdrawalMachineState &state)
{
    struct visitor final : public boost::static_visitor<WithdrawalStage>
    {
        WithdrawalStage operator()(const WithdrawalMachineStart&) const
        { return WithdrawalStage::VALIDATION; }
        WithdrawalStage operator()(const WithdrawalMachineValidated&) const
        { return WithdrawalStage::DATA_FETCH; }
        WithdrawalStage operator()(const WithdrawalMachineDataFetched&) const
        { return WithdrawalStage::CONTEXT_CALCULATION; }
        WithdrawalStage operator()(const WithdrawalMachineContextReady&) const
        { return WithdrawalStage::PROOF_GENERATION; }
        WithdrawalStage operator()(const WithdrawalMachineProofReady&) const
        { return WithdrawalStage::TRANSACTION_PREPARATION; }
        WithdrawalStage operator()(const WithdrawalMachineTransactionReady&) const
        { return WithdrawalStage::EXECUTION; }
    };

    return boost::apply_visitor(visitor{}, state);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_advance_withdrawal_machine(const WithdrawalRequestV1 &request,
    WithdrawalMachineCollaborators &collaborators_inout,
    WithdrawalMachineState &state_inout)
{
    // TRANSACTION_READY
    if (withdrawal_machine_is_terminal(state_inout))
        return false;

    // START
    if (boost::get<WithdrawalMachineStart>(&state_inout))
    {
        state_inout = handle_start(request, collaborators_inout);
        return true;
    }

    // VALIDATED
    if (boost::get<WithdrawalMachineValidated>(&state_inout))
    {
        state_inout = handle_validated(collaborators_inout);
        return true;
    }

    // DATA_FETCHED
    if (const WithdrawalMachineDataFetched *data_fetched{boost::get<WithdrawalMachineDataFetched>(&state_inout)})
    {
        state_inout = handle_data_fetched(request, *data_fetched, collaborators_inout);
        return true;
    }

    // CONTEXT_READY
    if (const WithdrawalMachineContextReady *context_ready{boost::get<WithdrawalMachineContextReady>(&state_inout)})
    {
        state_inout = handle_context_ready(request, *context_ready, collaborators_inout);
        return true;
    }

    // PROOF_READY
    if (const WithdrawalMachineProofReady *proof_ready{boost::get<WithdrawalMachineProofReady>(&state_inout)})
    {
        state_inout = handle_proof_ready(*proof_ready, collaborators_inout);
        return true;
    }

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
