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

#include "pp_core/amount_utils.h"
#include "pp_main/withdrawal_amounts.h"
#include "pp_main/withdrawal_errors.h"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_amounts, protocol_fee)
{
    const pp::WithdrawalAmountsV1 amounts{pp::calculate_withdrawal_amounts("100")};

    EXPECT_EQ(amounts.relay_fee_bps, 1000);
    EXPECT_EQ(pp::format_ether(amounts.withdraw_amount), "100");
    EXPECT_EQ(pp::format_ether(amounts.execution_fee), "10");
    EXPECT_EQ(pp::format_ether(amounts.you_receive), "90");
    EXPECT_FALSE(amounts.remaining_in_note);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_amounts, fee_rounds_down)
{
    // 9 wei * 10% = 0.9 wei -> 0
    pp::WithdrawalAmountsV1 amounts{pp::make_withdrawal_amounts_v1(9)};
    EXPECT_EQ(amounts.execution_fee, 0);
    EXPECT_EQ(amounts.you_receive, 9);

    // 19 wei * 10% = 1.9 wei -> 1
    amounts = pp::make_withdrawal_amounts_v1(19);
    EXPECT_EQ(amounts.execution_fee, 1);
    EXPECT_EQ(amounts.you_receive, 18);

    EXPECT_EQ(pp::calculate_relay_fee(pp::parse_ether("0.123456789012345678"), 1000),
        pp::parse_ether("0.012345678901234567"));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_amounts, fee_bounds)
{
    EXPECT_EQ(pp::calculate_relay_fee(12345, 0), 0);
    EXPECT_EQ(pp::calculate_relay_fee(12345, 10000), 12345);
    EXPECT_THROW(pp::calculate_relay_fee(12345, 10001), std::runtime_error);

    // no overflow for the largest amount
    const pp::amount_t max_amount{std::numeric_limits<pp::amount_t>::max()};
    EXPECT_EQ(pp::calculate_relay_fee(max_amount, 10000), max_amount);
    EXPECT_EQ(pp::calculate_relay_fee(max_amount, 5000), max_amount / 2);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_amounts, remaining_in_note)
{
    const pp::WithdrawalAmountsV1 amounts{pp::calculate_withdrawal_amounts("0.5", "1.0")};

    ASSERT_TRUE(amounts.remaining_in_note);
    EXPECT_EQ(pp::format_ether(*amounts.remaining_in_note), "0.5");
    EXPECT_EQ(pp::format_ether(amounts.execution_fee), "0.05");
    EXPECT_EQ(pp::format_ether(amounts.you_receive), "0.45");

    const pp::WithdrawalAmountsV1 full_amounts{pp::calculate_withdrawal_amounts("1", "1.0")};
    ASSERT_TRUE(full_amounts.remaining_in_note);
    EXPECT_EQ(*full_amounts.remaining_in_note, 0);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_amounts, invalid_inputs)
{
    EXPECT_THROW(pp::calculate_withdrawal_amounts("ten"), pp::error::invalid_amount_error);
    EXPECT_THROW(pp::calculate_withdrawal_amounts("-1"), pp::error::invalid_amount_error);
    EXPECT_THROW(pp::calculate_withdrawal_amounts("1", "one"), pp::error::invalid_note_error);
    EXPECT_THROW(pp::calculate_withdrawal_amounts("1.5", "1.0"), pp::error::invalid_amount_error);

    // typed errors are validation errors
    EXPECT_THROW(pp::calculate_withdrawal_amounts(""), pp::error::validation_error);
}
//-------------------------------------------------------------------------------------------------------------------
