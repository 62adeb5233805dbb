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

// Relay fee and payout amounts of a withdrawal.

#pragma once

//local headers
#include "pp_core/amount_utils.h"
#include "privacy_pool_config.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>
#include <string>

//forward declarations


namespace pp
{

////
// WithdrawalAmountsV1
// - amounts in base units
// - execution_fee = withdraw_amount * relay_fee_bps / 10000 (floor, as the pool contract computes it)
// - you_receive = withdraw_amount - execution_fee
///
struct WithdrawalAmountsV1 final
{
    amount_t withdraw_amount;
    amount_t execution_fee;
    amount_t you_receive;
    std::uint64_t relay_fee_bps;
    /// note balance left after the withdrawal (only if the note balance was provided)
    boost::optional<amount_t> remaining_in_note;
};

/// relay fee of a withdrawal: floor(withdraw_amount * relay_fee_bps / 10000)
amount_t calculate_relay_fee(const amount_t &withdraw_amount, const std::uint64_t relay_fee_bps);

/**
* brief: make_withdrawal_amounts_v1 - compute fee and payout of a withdrawal in base units
* param: withdraw_amount -
* param: relay_fee_bps - must not exceed 10000
* return: withdrawal amounts (without remaining_in_note)
*/
WithdrawalAmountsV1 make_withdrawal_amounts_v1(const amount_t &withdraw_amount,
    const std::uint64_t relay_fee_bps = config::DEFAULT_RELAY_FEE_BPS);

/**
* brief: calculate_withdrawal_amounts - fee preview for a decimal withdraw amount with the protocol relay fee
*   - throws error::invalid_amount_error if the amount is not a decimal
* param: withdraw_amount - decimal amount in whole native asset units
* return: withdrawal amounts
*/
WithdrawalAmountsV1 calculate_withdrawal_amounts(const std::string &withdraw_amount);
/**
* brief: calculate_withdrawal_amounts - fee preview that also reports the note balance left after the withdrawal
*   - throws error::invalid_note_error if the note balance is not a decimal
*   - throws error::invalid_amount_error if the amount is not a decimal or exceeds the note balance
* param: withdraw_amount -
* param: note_balance -
* return: withdrawal amounts (with remaining_in_note)
*/
WithdrawalAmountsV1 calculate_withdrawal_amounts(const std::string &withdraw_amount, const std::string &note_balance);

} //namespace pp
