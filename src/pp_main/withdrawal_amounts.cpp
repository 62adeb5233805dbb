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
#include "withdrawal_amounts.h"

//local headers
#include "misc_log_ex.h"
#include "pp_core/amount_utils.h"
#include "privacy_pool_config.h"
#include "withdrawal_errors.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>

//standard headers
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
amount_t calculate_relay_fee(const amount_t &withdraw_amount, const std::uint64_t relay_fee_bps)
{
    CHECK_AND_ASSERT_THROW_MES(relay_fee_bps <= config::RELAY_FEE_BPS_DENOMINATOR,
        "calculate relay fee: relay fee exceeds 100%.");

    // the product may not fit in 256 bits
    const boost::multiprecision::uint512_t fee{
            boost::multiprecision::uint512_t{withdraw_amount} * relay_fee_bps / config::RELAY_FEE_BPS_DENOMINATOR
        };

    return static_cast<amount_t>(fee);
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalAmountsV1 make_withdrawal_amounts_v1(const amount_t &withdraw_amount, const std::uint64_t relay_fee_bps)
{
    WithdrawalAmountsV1 amounts;
    amounts.withdraw_amount = withdraw_amount;
    amounts.execution_fee   = calculate_relay_fee(withdraw_amount, relay_fee_bps);
    amounts.you_receive     = withdraw_amount - amounts.execution_fee;
    amounts.relay_fee_bps   = relay_fee_bps;

    return amounts;
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalAmountsV1 calculate_withdrawal_amounts(const std::string &withdraw_amount)
{
    amount_t withdraw_amount_base;
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_ether(withdraw_amount, withdraw_amount_base),
        error::invalid_amount_error,
        "withdraw amount is not a decimal amount: " + withdraw_amount);

    return make_withdrawal_amounts_v1(withdraw_amount_base, config::DEFAULT_RELAY_FEE_BPS);
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalAmountsV1 calculate_withdrawal_amounts(const std::string &withdraw_amount, const std::string &note_balance)
{
    amount_t note_balance_base;
    THROW_WITHDRAWAL_EXCEPTION_IF(!try_parse_ether(note_balance, note_balance_base),
        error::invalid_note_error,
        "note balance is not a decimal amount: " + note_balance);

    WithdrawalAmountsV1 amounts{calculate_withdrawal_amounts(withdraw_amount)};
    THROW_WITHDRAWAL_EXCEPTION_IF(amounts.withdraw_amount > note_balance_base,
        error::invalid_amount_error,
        "withdraw amount exceeds the note balance");

    amounts.remaining_in_note = note_balance_base - amounts.withdraw_amount;

    return amounts;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
