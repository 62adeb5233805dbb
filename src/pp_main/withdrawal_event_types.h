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

// Events reported while preparing and executing a withdrawal.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "pp_crypto/field_utils.h"
#include "withdrawal_types.h"

//third party headers
#include <boost/variant.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <string>

//forward declarations


namespace pp
{

////
// WithdrawalStage
// - steps of withdrawal preparation, then execution
///
enum class WithdrawalStage : unsigned char
{
    VALIDATION,
    DATA_FETCH,
    CONTEXT_CALCULATION,
    PROOF_GENERATION,
    TRANSACTION_PREPARATION,
    EXECUTION
};

/// human-readable stage name
const char* withdrawal_stage_name(const WithdrawalStage stage);

/// the request passed local validation
struct WithdrawalRequestValidated final
{
    amount_t withdraw_amount;
    Address recipient;
};

/// the proof's anchor data was fetched
struct WithdrawalDataFetched final
{
    std::size_t num_state_tree_leaves;
    std::size_t num_approved_labels;
    scalar_t asp_root;
    scalar_t pool_scope;
};

/// the withdrawal context was computed and a note index was reserved
struct WithdrawalContextCalculated final
{
    scalar_t context;
    std::uint64_t next_note_index;
};

/// the prover returned a proof
struct WithdrawalProofGenerated final
{
    std::size_t num_public_signals;
};

/// an unsigned operation is ready for execution
struct WithdrawalTransactionPrepared final
{
    Address account_address;
    EntryPointVersion entry_point_version;
    std::size_t relay_call_data_size;
};

/// the operation was submitted
struct WithdrawalExecuted final
{
    std::string transaction_id;
};

/// a stage failed; the withdrawal was aborted
struct WithdrawalFailed final
{
    WithdrawalStage stage;
    std::string error_message;
};

/// an event of the withdrawal pipeline
using WithdrawalEvent =
    boost::variant<
        WithdrawalRequestValidated,
        WithdrawalDataFetched,
        WithdrawalContextCalculated,
        WithdrawalProofGenerated,
        WithdrawalTransactionPrepared,
        WithdrawalExecuted,
        WithdrawalFailed
    >;

////
// WithdrawalEventSink
// - receives pipeline events (e.g. to log them or report progress)
// - events never carry account keys, mnemonics, nullifiers or secrets
///
class WithdrawalEventSink
{
public:
//destructor
    virtual ~WithdrawalEventSink() = default;

//overloaded operators
    /// disable copy/move (this is a virtual base class)
    WithdrawalEventSink& operator=(WithdrawalEventSink&&) = delete;

//member functions
    virtual void on_event(const WithdrawalEvent &event) = 0;
};

} //namespace pp
