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

// Helper types for the withdrawal state machine.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "withdrawal_config.h"
#include "withdrawal_types.h"

//third party headers
#include <boost/variant.hpp>

//standard headers

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
// WithdrawalMachineCollaborators
// - everything the withdrawal state machine calls out to
// - the event sink is optional
///
struct WithdrawalMachineCollaborators final
{
    const WithdrawalConfigV1 &config;
    const WithdrawalDataSource &data_source;
    const MnemonicKeyRestorer &mnemonic_key_restorer;
    NoteIndexTracker &index_tracker;
    const NoteSecretDeriver &secret_deriver;
    WithdrawalProver &prover;
    WithdrawalAccountLayer &account_layer;
    WithdrawalEventSink *event_sink;
};

////
// WithdrawalMachineStart
// - the request has not been looked at yet
///
struct WithdrawalMachineStart final
{};

////
// WithdrawalMachineValidated
// - the request passed local validation
///
struct WithdrawalMachineValidated final
{
    amount_t withdraw_amount;
    Address recipient;
};

////
// WithdrawalMachineDataFetched
// - the proof's anchor data is available
///
struct WithdrawalMachineDataFetched final
{
    FetchedWithdrawalDataV1 fetched_data;
};

////
// WithdrawalMachineContextReady
// - context computed, note index reserved, note secrets derived
///
struct WithdrawalMachineContextReady final
{
    WithdrawalContextV1 withdrawal_context;
};

////
// WithdrawalMachineProofReady
// - the withdrawal is proven
///
struct WithdrawalMachineProofReady final
{
    WithdrawalContextV1 withdrawal_context;
    WithdrawalProofV1 proof;
};

////
// WithdrawalMachineTransactionReady
// - terminal state: the withdrawal is prepared and can be executed
///
struct WithdrawalMachineTransactionReady final
{
    PreparedWithdrawalV1 prepared_withdrawal;
};

/// variant of withdrawal machine states
using WithdrawalMachineState =
    boost::variant<
        WithdrawalMachineStart,
        WithdrawalMachineValidated,
        WithdrawalMachineDataFetched,
        WithdrawalMachineContextReady,
        WithdrawalMachineProofReady,
        WithdrawalMachineTransactionReady
    >;

} //namespace pp
