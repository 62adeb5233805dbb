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
#include "withdrawal_event_logger.h"

//local headers
#include "misc_log_ex.h"
#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_main/withdrawal_event_types.h"

//third party headers
#include <boost/variant.hpp>

//standard headers

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_impl"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static const char* entry_point_version_name(const EntryPointVersion version)
{
    return version == EntryPointVersion::V06 ? "v0.6" : "v0.7";
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void WithdrawalEventLogger::on_event(const WithdrawalEvent &event)
{
    struct visitor final : public boost::static_visitor<void>
    {
        void operator()(const WithdrawalRequestValidated &validated) const
        {
            MINFO("Withdrawal request validated: " << format_ether(validated.withdraw_amount) << " to "
                << address_to_checksum_string(validated.recipient));
        }
        void operator()(const WithdrawalDataFetched &fetched) const
        {
            MINFO("Withdrawal data fetched: " << fetched.num_state_tree_leaves << " state tree leaves, "
                << fetched.num_approved_labels << " approved labels, ASP root " << scalar_to_decimal(fetched.asp_root)
                << ", pool scope " << scalar_to_decimal(fetched.pool_scope));
        }
        void operator()(const WithdrawalContextCalculated &calculated) const
        {
            MINFO("Withdrawal context calculated: context " << scalar_to_decimal(calculated.context)
                << ", next note index " << calculated.next_note_index);
        }
        void operator()(const WithdrawalProofGenerated &generated) const
        {
            MINFO("Withdrawal proof generated with " << generated.num_public_signals << " public signals");
        }
        void operator()(const WithdrawalTransactionPrepared &prepared) const
        {
            MINFO("Withdrawal transaction prepared: account " << address_to_checksum_string(prepared.account_address)
                << ", entry point " << entry_point_version_name(prepared.entry_point_version)
                << ", relay call data " << prepared.relay_call_data_size << " bytes");
        }
        void operator()(const WithdrawalExecuted &executed) const
        {
            MINFO("Withdrawal executed: transaction " << executed.transaction_id);
        }
        void operator()(const WithdrawalFailed &failed) const
        {
            MWARNING("Withdrawal failed during " << withdrawal_stage_name(failed.stage) << ": "
                << failed.error_message);
        }
    };

    boost::apply_visitor(visitor{}, event);
    ++m_num_events_logged;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
