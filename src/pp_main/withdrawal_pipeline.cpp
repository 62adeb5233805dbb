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
#include "withdrawal_pipeline.h"

//local headers
#include "misc_log_ex.h"
#include "withdrawal_account_layer.h"
#include "withdrawal_config.h"
#include "withdrawal_event_types.h"
#include "withdrawal_machine.h"
#include "withdrawal_machine_types.h"
#include "withdrawal_tx_utils.h"
#include "withdrawal_types.h"

//third party headers
#include <boost/variant.hpp>

//standard headers
#include <exception>
#include <string>
#include <utility>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void report_failure(WithdrawalEventSink *event_sink, const WithdrawalStage stage, const std::exception &e)
{
    MERROR("withdrawal pipeline: " << withdrawal_stage_name(stage) << " failed: " << e.what());

    if (!event_sink)
        return;

    // the caller must see the pipeline's error, not the sink's
    try
    {
        event_sink->on_event(WithdrawalFailed{stage, e.what()});
    }
    catch (const std::exception &sink_error)
    {
        MERROR("withdrawal pipeline: event sink failed while reporting a failure: " << sink_error.what());
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
WithdrawalPipeline::WithdrawalPipeline(const WithdrawalConfigV1 &config,
    const WithdrawalDataSource &data_source,
    const MnemonicKeyRestorer &mnemonic_key_restorer,
    NoteIndexTracker &index_tracker,
    const NoteSecretDeriver &secret_deriver,
    WithdrawalProver &prover,
    WithdrawalAccountLayer &account_layer,
    WithdrawalEventSink *event_sink) :
        m_config{config},
        m_data_source{data_source},
        m_mnemonic_key_restorer{mnemonic_key_restorer},
        m_index_tracker{index_tracker},
        m_secret_deriver{secret_deriver},
        m_prover{prover},
        m_account_layer{account_layer},
        m_event_sink{event_sink}
{
    check_withdrawal_config_v1(m_config);
}
//-------------------------------------------------------------------------------------------------------------------
PreparedWithdrawalV1 WithdrawalPipeline::prepare_withdrawal(const WithdrawalRequestV1 &request)
{
    WithdrawalMachineCollaborators collaborators{
            m_config,
            m_data_source,
            m_mnemonic_key_restorer,
            m_index_tracker,
            m_secret_deriver,
            m_prover,
            m_account_layer,
            m_event_sink
        };

    // 1. run the machine to its terminal state
    WithdrawalMachineState state{WithdrawalMachineStart{}};
    try
    {
        while (try_advance_withdrawal_machine(request, collaborators, state)) {}
    }
    catch (const std::exception &e)
    {
        report_failure(m_event_sink, next_withdrawal_stage(state), e);
        throw;
    }

    // 2. extract the prepared withdrawal
    WithdrawalMachineTransactionReady *const transaction_ready{boost::get<WithdrawalMachineTransactionReady>(&state)};
    CHECK_AND_ASSERT_THROW_MES(transaction_ready,
        "withdrawal pipeline (prepare withdrawal): machine stopped before its terminal state (bug).");

    MINFO("withdrawal pipeline: prepared withdrawal with note index "
        << transaction_ready->prepared_withdrawal.context.next_note_index);

    return std::move(transaction_ready->prepared_withdrawal);
}
//-------------------------------------------------------------------------------------------------------------------
PreparedWithdrawalV1 WithdrawalPipeline::process_withdrawal(const WithdrawalRequestV1 &request)
{
    return this->prepare_withdrawal(request);
}
//-------------------------------------------------------------------------------------------------------------------
std::string WithdrawalPipeline::execute_withdrawal(const PreparedWithdrawalV1 &prepared_withdrawal)
{
    std::string transaction_id;
    try
    {
        transaction_id = execute_withdrawal_v1(prepared_withdrawal, m_account_layer);
    }
    catch (const std::exception &e)
    {
        report_failure(m_event_sink, WithdrawalStage::EXECUTION, e);
        throw;
    }

    if (m_event_sink)
        m_event_sink->on_event(WithdrawalExecuted{transaction_id});

    MINFO("withdrawal pipeline: executed withdrawal, transaction id " << transaction_id);

    return transaction_id;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
