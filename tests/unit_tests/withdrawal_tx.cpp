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

#include "pp_core/abi_encoding.h"
#include "pp_core/address_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_main/withdrawal_account_layer.h"
#include "pp_main/withdrawal_config.h"
#include "pp_main/withdrawal_context_utils.h"
#include "pp_main/withdrawal_errors.h"
#include "pp_main/withdrawal_proof_utils.h"
#include "pp_main/withdrawal_tx_utils.h"
#include "pp_main/withdrawal_types.h"
#include "pp_mocks/mock_account_layer.h"
#include "pp_mocks/mock_withdrawal_collaborators.h"
#include "pp_mocks/mock_withdrawal_prover.h"

#include "hex.h"
#include "span.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::WithdrawalProofV1 make_test_proof()
{
    pp::WithdrawalProofV1 proof;
    proof.pi_a    = {pp::scalar_t{1}, pp::scalar_t{2}, pp::scalar_t{1}};
    proof.pi_b[0] = {pp::scalar_t{3}, pp::scalar_t{4}};
    proof.pi_b[1] = {pp::scalar_t{5}, pp::scalar_t{6}};
    proof.pi_b[2] = {pp::scalar_t{1}, pp::scalar_t{0}};
    proof.pi_c    = {pp::scalar_t{7}, pp::scalar_t{8}, pp::scalar_t{1}};

    for (unsigned int signal_index{0}; signal_index < 8; ++signal_index)
        proof.public_signals.emplace_back(100 + signal_index);

    return proof;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::WithdrawalContextV1 make_test_context()
{
    const pp::WithdrawalConfigV1 config{
            pp::make_withdrawal_config_v1(pp::mocks::make_mock_address(0xaa),
                pp::mocks::make_mock_address(0xbb),
                pp::mocks::make_mock_address(0xcc))
        };

    pp::WithdrawalContextV1 withdrawal_context;
    withdrawal_context.fetched_data.pool_scope = 12345;
    withdrawal_context.withdrawal_data =
        pp::make_withdrawal_data_v1(pp::parse_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"), config);
    withdrawal_context.context = pp::compute_withdrawal_context(withdrawal_context.withdrawal_data, 12345);
    withdrawal_context.next_note_index = 0;

    return withdrawal_context;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::scalar_t read_word(const pp::bytes_t &encoding, const std::size_t offset, const std::size_t word_index)
{
    pp::bytes32_t word;
    std::copy(encoding.begin() + offset + word_index*32,
        encoding.begin() + offset + (word_index + 1)*32,
        word.begin());
    return pp::scalar_from_bytes_be(word);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------

//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_tx, format_proof_for_contract)
{
    const pp::FormattedWithdrawProofV1 formatted_proof{pp::format_proof_for_contract_v1(make_test_proof())};

    EXPECT_EQ(formatted_proof.p_a[0], 1);
    EXPECT_EQ(formatted_proof.p_a[1], 2);

    // Fq2 coordinates are swapped
    EXPECT_EQ(formatted_proof.p_b[0][0], 4);
    EXPECT_EQ(formatted_proof.p_b[0][1], 3);
    EXPECT_EQ(formatted_proof.p_b[1][0], 6);
    EXPECT_EQ(formatted_proof.p_b[1][1], 5);

    EXPECT_EQ(formatted_proof.p_c[0], 7);
    EXPECT_EQ(formatted_proof.p_c[1], 8);

    for (std::size_t signal_index{0}; signal_index < formatted_proof.pub_signals.size(); ++signal_index)
        EXPECT_EQ(formatted_proof.pub_signals[signal_index], 100 + signal_index);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_tx, format_proof_wrong_signal_count)
{
    pp::WithdrawalProofV1 proof{make_test_proof()};

    proof.public_signals.pop_back();
    EXPECT_THROW(pp::format_proof_for_contract_v1(proof), pp::error::encoding_error);

    proof.public_signals.emplace_back(0);
    proof.public_signals.emplace_back(0);
    EXPECT_THROW(pp::format_proof_for_contract_v1(proof), pp::error::encoding_error);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_tx, encode_relay_call_data)
{
    const pp::WithdrawalContextV1 withdrawal_context{make_test_context()};
    const pp::bytes_t call_data{
            pp::encode_relay_call_data_v1(withdrawal_context.withdrawal_data,
                pp::format_proof_for_contract_v1(make_test_proof()),
                withdrawal_context.fetched_data.pool_scope)
        };

    // selector | head (withdrawal offset, 16 proof words, scope) | withdrawal tuple (processor, offset, len, data)
    ASSERT_EQ(call_data.size(), 4 + 18*32 + 4*32 + 96);
    EXPECT_EQ(epee::to_hex::string(epee::span<const std::uint8_t>{call_data.data(), 4}), "8a44121e");

    const std::size_t args{4};
    EXPECT_EQ(read_word(call_data, args, 0), 0x240);
    EXPECT_EQ(read_word(call_data, args, 1), 1);
    EXPECT_EQ(read_word(call_data, args, 2), 2);
    EXPECT_EQ(read_word(call_data, args, 3), 4);
    EXPECT_EQ(read_word(call_data, args, 4), 3);
    EXPECT_EQ(read_word(call_data, args, 5), 6);
    EXPECT_EQ(read_word(call_data, args, 6), 5);
    EXPECT_EQ(read_word(call_data, args, 7), 7);
    EXPECT_EQ(read_word(call_data, args, 8), 8);
    EXPECT_EQ(read_word(call_data, args, 9), 100);
    EXPECT_EQ(read_word(call_data, args, 16), 107);
    EXPECT_EQ(read_word(call_data, args, 17), 12345);

    // the tuple starts where the head's offset points
    const std::size_t tuple{args + 0x240};
    EXPECT_TRUE(std::all_of(call_data.begin() + tuple, call_data.begin() + tuple + 12,
        [](const std::uint8_t b){ return b == 0; }));
    EXPECT_TRUE(std::all_of(call_data.begin() + tuple + 12, call_data.begin() + tuple + 32,
        [](const std::uint8_t b){ return b == 0xbb; }));
    EXPECT_EQ(read_word(call_data, tuple, 1), 0x40);
    EXPECT_EQ(read_word(call_data, tuple, 2), 96);
    EXPECT_TRUE(std::equal(withdrawal_context.withdrawal_data.data.begin(),
        withdrawal_context.withdrawal_data.data.end(),
        call_data.begin() + tuple + 3*32));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_tx, prepare_withdrawal_transaction)
{
    const pp::WithdrawalContextV1 withdrawal_context{make_test_context()};
    const pp::Address account_address{pp::mocks::make_mock_address(0xdd)};

    for (const pp::EntryPointVersion version : {pp::EntryPointVersion::V06, pp::EntryPointVersion::V07})
    {
        pp::mocks::MockWithdrawalAccountLayer account_layer{account_address, version};

        const pp::WithdrawalTransactionV1 withdrawal_tx{
                pp::prepare_withdrawal_transaction_v1(withdrawal_context, make_test_proof(), account_layer)
            };

        ASSERT_TRUE(withdrawal_tx.account);
        EXPECT_EQ(withdrawal_tx.account->address(), account_address);
        EXPECT_EQ(pp::sender_ref(withdrawal_tx.operation), account_address);
        EXPECT_EQ(pp::entry_point_version(withdrawal_tx.operation), version);
        EXPECT_EQ(pp::call_data_ref(withdrawal_tx.operation), withdrawal_tx.relay_call_data);
        EXPECT_EQ(withdrawal_tx.relay_call_data.size(), 772);

        // nothing is submitted while preparing
        EXPECT_EQ(account_layer.num_accounts_created(), 1);
        EXPECT_EQ(account_layer.num_operations_prepared(), 1);
        EXPECT_TRUE(account_layer.executed_operations().empty());
    }
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_tx, account_setup_failure)
{
    pp::mocks::MockWithdrawalAccountLayer account_layer{pp::mocks::make_mock_address(0xdd),
        pp::EntryPointVersion::V07};
    account_layer.set_fail_account_creation(true);

    EXPECT_THROW(pp::prepare_withdrawal_transaction_v1(make_test_context(), make_test_proof(), account_layer),
        pp::error::account_setup_error);
    EXPECT_EQ(account_layer.num_operations_prepared(), 0);

    // a malformed proof fails before the account layer is touched
    pp::WithdrawalProofV1 malformed_proof{make_test_proof()};
    malformed_proof.public_signals.pop_back();
    account_layer.set_fail_account_creation(false);
    EXPECT_THROW(pp::prepare_withdrawal_transaction_v1(make_test_context(), malformed_proof, account_layer),
        pp::error::encoding_error);
    EXPECT_EQ(account_layer.num_accounts_created(), 0);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_tx, execute_withdrawal)
{
    pp::mocks::MockWithdrawalAccountLayer account_layer{pp::mocks::make_mock_address(0xdd),
        pp::EntryPointVersion::V07};

    const pp::WithdrawalContextV1 withdrawal_context{make_test_context()};
    pp::WithdrawalTransactionV1 withdrawal_tx{
            pp::prepare_withdrawal_transaction_v1(withdrawal_context, make_test_proof(), account_layer)
        };

    pp::PreparedWithdrawalV1 prepared_withdrawal;
    prepared_withdrawal.context         = withdrawal_context;
    prepared_withdrawal.proof           = make_test_proof();
    prepared_withdrawal.relay_call_data = withdrawal_tx.relay_call_data;
    prepared_withdrawal.operation       = withdrawal_tx.operation;
    prepared_withdrawal.account         = withdrawal_tx.account;

    const std::string transaction_id{pp::execute_withdrawal_v1(prepared_withdrawal, account_layer)};
    EXPECT_EQ(transaction_id.size(), 2 + 64);
    EXPECT_EQ(transaction_id.substr(0, 2), "0x");
    ASSERT_EQ(account_layer.executed_operations().size(), 1);

    // submission failures are execution errors
    account_layer.set_fail_execution(true);
    EXPECT_THROW(pp::execute_withdrawal_v1(prepared_withdrawal, account_layer), pp::error::execution_error);

    prepared_withdrawal.account.reset();
    account_layer.set_fail_execution(false);
    EXPECT_THROW(pp::execute_withdrawal_v1(prepared_withdrawal, account_layer), pp::error::execution_error);
    EXPECT_EQ(account_layer.executed_operations().size(), 1);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_tx, proof_semantics)
{
    pp::WithdrawalProofInputsV1 proof_inputs;
    proof_inputs.withdrawn_value = 102;
    proof_inputs.context         = 107;

    const pp::WithdrawalProofV1 proof{make_test_proof()};
    EXPECT_NO_THROW(pp::check_withdrawal_proof_semantics_v1(proof, proof_inputs));

    // context mismatch
    proof_inputs.context = 106;
    EXPECT_THROW(pp::check_withdrawal_proof_semantics_v1(proof, proof_inputs), pp::error::proof_generation_error);
    proof_inputs.context = 107;

    // withdrawn value mismatch
    proof_inputs.withdrawn_value = 1;
    EXPECT_THROW(pp::check_withdrawal_proof_semantics_v1(proof, proof_inputs), pp::error::proof_generation_error);
    proof_inputs.withdrawn_value = 102;

    // coordinates between the scalar and base field primes are valid
    pp::WithdrawalProofV1 wide_coordinate_proof{make_test_proof()};
    wide_coordinate_proof.pi_a[0]    = pp::snark_scalar_field();
    wide_coordinate_proof.pi_b[1][1] = pp::bn254_base_field() - 1;
    EXPECT_NO_THROW(pp::check_withdrawal_proof_semantics_v1(wide_coordinate_proof, proof_inputs));

    // a public signal outside the scalar field
    pp::WithdrawalProofV1 bad_signal_proof{make_test_proof()};
    bad_signal_proof.public_signals[0] = pp::snark_scalar_field();
    EXPECT_THROW(pp::check_withdrawal_proof_semantics_v1(bad_signal_proof, proof_inputs),
        pp::error::proof_generation_error);

    // coordinate outside the base field
    pp::WithdrawalProofV1 bad_proof{make_test_proof()};
    bad_proof.pi_c[0] = pp::bn254_base_field();
    try
    {
        pp::check_withdrawal_proof_semantics_v1(bad_proof, proof_inputs);
        FAIL() << "expected a proof generation error";
    }
    catch (const pp::error::proof_generation_error &e)
    {
        EXPECT_EQ(e.failure_kind(), pp::error::proof_generation_error::kind::PROVER_FAILURE);
    }
}
//-------------------------------------------------------------------------------------------------------------------
