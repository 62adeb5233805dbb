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

// Orchestrates withdrawal preparation and (explicit) execution.

#pragma once

//local headers
#include "withdrawal_config.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <string>

//forward declarations
namespace pp
{
    class MnemonicKeyRestorer;
    class NoteIndexTracker;
    class NoteSecretDeriver;
    class WithdrawalAccountLayer;
    class WithdrawalDataSource;
    class WithdrawalEventSink;
    class WithdrawalProver;
}

namespace pp
{

////
// WithdrawalPipeline
// - prepares withdrawals: validate -> fetch -> context -> proof -> transaction, strictly in order
// - the first failure aborts preparation; it is logged, reported to the event sink, then rethrown unchanged
// - preparation never executes anything on-chain; execution is a separate explicit call
// - collaborators are not owned and must outlive the pipeline
///
class WithdrawalPipeline final
{
public:
//constructors
    WithdrawalPipeline(const WithdrawalConfigV1 &config,
        const WithdrawalDataSource &data_source,
        const MnemonicKeyRestorer &mnemonic_key_restorer,
        NoteIndexTracker &index_tracker,
        const NoteSecretDeriver &secret_deriver,
        WithdrawalProver &prover,
        WithdrawalAccountLayer &account_layer,
        WithdrawalEventSink *event_sink = nullptr);

//overloaded operators
    /// disable copy/move
    WithdrawalPipeline& operator=(WithdrawalPipeline&&) = delete;

//member functions
    /// prepare a withdrawal (proof plus unsigned operation)
    PreparedWithdrawalV1 prepare_withdrawal(const WithdrawalRequestV1 &request);
    /// same as prepare_withdrawal()
    PreparedWithdrawalV1 process_withdrawal(const WithdrawalRequestV1 &request);
    /// submit a prepared withdrawal; returns the transaction id
    std::string execute_withdrawal(const PreparedWithdrawalV1 &prepared_withdrawal);

    const WithdrawalConfigV1& config() const { return m_config; }

private:
//member variables
    const WithdrawalConfigV1 m_config;

    /// collaborators
    const WithdrawalDataSource &m_data_source;
    const MnemonicKeyRestorer &m_mnemonic_key_restorer;
    NoteIndexTracker &m_index_tracker;
    const NoteSecretDeriver &m_secret_deriver;
    WithdrawalProver &m_prover;
    WithdrawalAccountLayer &m_account_layer;
    WithdrawalEventSink *m_event_sink;
};

} //namespace pp
