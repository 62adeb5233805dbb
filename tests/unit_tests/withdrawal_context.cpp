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
#include "pp_impl/note_index_tracker_memory.h"
#include "pp_impl/note_secret_deriver_keccak.h"
#include "pp_main/account_key_utils.h"
#include "pp_main/withdrawal_config.h"
#include "pp_main/withdrawal_context_utils.h"
#include "pp_main/withdrawal_data_fetch.h"
#include "pp_main/withdrawal_errors.h"
#include "pp_main/withdrawal_types.h"
#include "pp_mocks/mock_pool_ledger.h"
#include "pp_mocks/mock_withdrawal_collaborators.h"
#include "wipeable_string.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::WithdrawalConfigV1 make_test_config()
{
    return pp::make_withdrawal_config_v1(pp::mocks::make_mock_address(0xaa),
        pp::mocks::make_mock_address(0xbb),
        pp::mocks::make_mock_address(0xcc));
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::WithdrawalRequestV1 make_test_request(const pp::PoolNoteV1 &note)
{
    pp::WithdrawalRequestV1 request;
    request.note                   = note;
    request.withdraw_amount        = "0.5";
    request.recipient_address      = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    request.credential.private_key = epee::wipeable_string{"0x0123456789abcdef"};

    return request;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------

//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, known_context)
{
    const pp::WithdrawalConfigV1 config{make_test_config()};

    // context = keccak256(abi.encode((processor, abi.encode(recipient, fee recipient, bps)), scope)) mod p
    const pp::WithdrawalDataV1 withdrawal_data{
            pp::make_withdrawal_data_v1(pp::parse_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"), config)
        };
    EXPECT_EQ(withdrawal_data.processor, config.relay_processor);
    EXPECT_EQ(withdrawal_data.data.size(), 3*pp::ABI_WORD_SIZE);

    EXPECT_EQ(pp::compute_withdrawal_context(withdrawal_data, 12345),
        pp::parse_scalar("21540533104870064008399633473977935389655397499382594281781854666235441606482"));

    const pp::WithdrawalDataV1 other_withdrawal_data{
            pp::make_withdrawal_data_v1(pp::parse_address("0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359"), config)
        };
    EXPECT_EQ(pp::compute_withdrawal_context(other_withdrawal_data, 12345),
        pp::parse_scalar("8236229091831185191959025534050517981367804209681096932371625864441319631821"));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, context_binds_inputs)
{
    const pp::WithdrawalConfigV1 config{make_test_config()};
    const pp::Address recipient{pp::mocks::make_mock_address(0x11)};
    const pp::scalar_t base_context{
            pp::compute_withdrawal_context(pp::make_withdrawal_data_v1(recipient, config), 12345)
        };

    EXPECT_TRUE(pp::is_in_scalar_field(base_context));

    // scope
    EXPECT_NE(pp::compute_withdrawal_context(pp::make_withdrawal_data_v1(recipient, config), 12346), base_context);

    // fee
    pp::WithdrawalConfigV1 other_fee_config{config};
    other_fee_config.relay_fee_bps = 500;
    EXPECT_NE(pp::compute_withdrawal_context(pp::make_withdrawal_data_v1(recipient, other_fee_config), 12345),
        base_context);

    // processor
    pp::WithdrawalConfigV1 other_processor_config{config};
    other_processor_config.relay_processor = pp::mocks::make_mock_address(0xbc);
    EXPECT_NE(pp::compute_withdrawal_context(pp::make_withdrawal_data_v1(recipient, other_processor_config), 12345),
        base_context);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, fetch_withdrawal_data)
{
    pp::mocks::MockPoolLedger ledger{12345};
    pp::mocks::add_mock_deposit("1.0", 0, true, ledger);
    pp::mocks::add_mock_deposit("2.0", 1, false, ledger);
    pp::mocks::MockWithdrawalDataSource data_source{ledger};

    const pp::FetchedWithdrawalDataV1 fetched_data{pp::fetch_withdrawal_data(data_source)};
    EXPECT_EQ(fetched_data.state_tree_leaves.size(), 2);
    EXPECT_EQ(fetched_data.asp_data.approved_labels.size(), 1);
    EXPECT_EQ(fetched_data.pool_scope, 12345);

    EXPECT_EQ(data_source.num_state_tree_fetches(), 1);
    EXPECT_EQ(data_source.num_asp_data_fetches(), 1);
    EXPECT_EQ(data_source.num_pool_scope_fetches(), 1);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, fetch_failure)
{
    pp::mocks::MockPoolLedger ledger{12345};
    pp::mocks::MockWithdrawalDataSource data_source{ledger};

    data_source.set_failure(pp::mocks::MockWithdrawalDataSource::Failure::ASP_DATA);
    try
    {
        pp::fetch_withdrawal_data(data_source);
        FAIL() << "expected a data fetch error";
    }
    catch (const pp::error::data_fetch_error &e)
    {
        EXPECT_EQ(e.failed_source(), pp::error::data_fetch_error::source::ASP_DATA);
    }

    // all calls are joined even if one fails
    EXPECT_EQ(data_source.num_state_tree_fetches(), 1);
    EXPECT_EQ(data_source.num_asp_data_fetches(), 1);
    EXPECT_EQ(data_source.num_pool_scope_fetches(), 1);

    data_source.set_failure(pp::mocks::MockWithdrawalDataSource::Failure::POOL_SCOPE);
    EXPECT_THROW(pp::fetch_withdrawal_data(data_source), pp::error::data_fetch_error);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, calculate_withdrawal_context)
{
    const pp::WithdrawalConfigV1 config{make_test_config()};
    pp::mocks::MockPoolLedger ledger{12345};
    const pp::PoolNoteV1 note{pp::mocks::add_mock_deposit("1.0", 0, true, ledger)};
    pp::mocks::MockWithdrawalDataSource data_source{ledger};
    const pp::mocks::MockMnemonicKeyRestorer restorer;
    const pp::NoteSecretDeriverKeccak deriver;
    pp::NoteIndexTrackerMemory tracker;

    const pp::WithdrawalRequestV1 request{make_test_request(note)};
    const epee::wipeable_string &account_key{*request.credential.private_key};
    tracker.record_used_note_index(account_key, config.pool_address, 0);

    const pp::FetchedWithdrawalDataV1 fetched_data{pp::fetch_withdrawal_data(data_source)};
    const pp::WithdrawalContextV1 withdrawal_context{
            pp::calculate_withdrawal_context_v1(request, fetched_data, config, restorer, tracker, deriver)
        };

    // known context
    EXPECT_EQ(withdrawal_context.context,
        pp::parse_scalar("21540533104870064008399633473977935389655397499382594281781854666235441606482"));

    // one index reserved past the last used one
    EXPECT_EQ(withdrawal_context.next_note_index, 1);
    EXPECT_EQ(*tracker.last_used_note_index(account_key, config.pool_address), 1);

    // secrets at the reserved index (new note) and at the note's own index (existing note)
    EXPECT_EQ(withdrawal_context.new_nullifier, deriver.derive_nullifier(account_key, config.pool_address, 1));
    EXPECT_EQ(withdrawal_context.new_secret, deriver.derive_secret(account_key, config.pool_address, 1));
    EXPECT_EQ(withdrawal_context.existing_nullifier, deriver.derive_nullifier(account_key, config.pool_address, 0));
    EXPECT_EQ(withdrawal_context.existing_secret, deriver.derive_secret(account_key, config.pool_address, 0));
    EXPECT_GT(withdrawal_context.next_note_index, note.note_index);
    EXPECT_NE(withdrawal_context.new_nullifier, withdrawal_context.existing_nullifier);

    // a second request gets the same context but a new index
    const pp::WithdrawalContextV1 second_withdrawal_context{
            pp::calculate_withdrawal_context_v1(request, fetched_data, config, restorer, tracker, deriver)
        };
    EXPECT_EQ(second_withdrawal_context.context, withdrawal_context.context);
    EXPECT_EQ(second_withdrawal_context.next_note_index, 2);
    EXPECT_NE(second_withdrawal_context.new_nullifier, withdrawal_context.new_nullifier);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, index_tracker_failure)
{
    const pp::WithdrawalConfigV1 config{make_test_config()};
    pp::mocks::MockPoolLedger ledger{12345};
    const pp::PoolNoteV1 note{pp::mocks::add_mock_deposit("1.0", 0, true, ledger)};
    pp::mocks::MockWithdrawalDataSource data_source{ledger};
    const pp::mocks::MockMnemonicKeyRestorer restorer;
    const pp::NoteSecretDeriverKeccak deriver;
    pp::mocks::NoteIndexTrackerMockUnavailable tracker;

    const pp::FetchedWithdrawalDataV1 fetched_data{pp::fetch_withdrawal_data(data_source)};
    EXPECT_THROW(
            pp::calculate_withdrawal_context_v1(make_test_request(note),
                fetched_data,
                config,
                restorer,
                tracker,
                deriver),
            pp::error::index_tracker_error
        );
    EXPECT_EQ(tracker.num_reserve_attempts(), 1);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, new_note_index_above_spent_note)
{
    const pp::WithdrawalConfigV1 config{make_test_config()};
    pp::mocks::MockPoolLedger ledger{12345};
    const pp::PoolNoteV1 note{pp::mocks::add_mock_deposit("1.0", 3, true, ledger)};
    pp::mocks::MockWithdrawalDataSource data_source{ledger};
    const pp::mocks::MockMnemonicKeyRestorer restorer;
    const pp::NoteSecretDeriverKeccak deriver;
    pp::NoteIndexTrackerMemory tracker;

    const pp::FetchedWithdrawalDataV1 fetched_data{pp::fetch_withdrawal_data(data_source)};
    const pp::WithdrawalRequestV1 request{make_test_request(note)};

    // the tracker has no record of the spent note, so indices 0..3 are reserved and refused
    for (std::uint64_t attempt{0}; attempt <= note.note_index; ++attempt)
    {
        EXPECT_THROW(pp::calculate_withdrawal_context_v1(request, fetched_data, config, restorer, tracker, deriver),
            pp::error::index_tracker_error);
    }

    // the first index above the spent note is accepted and never collides with it
    const pp::WithdrawalContextV1 withdrawal_context{
            pp::calculate_withdrawal_context_v1(request, fetched_data, config, restorer, tracker, deriver)
        };
    EXPECT_EQ(withdrawal_context.next_note_index, 4);
    EXPECT_GT(withdrawal_context.next_note_index, note.note_index);
    EXPECT_NE(withdrawal_context.new_nullifier, withdrawal_context.existing_nullifier);
    EXPECT_NE(withdrawal_context.new_secret, withdrawal_context.existing_secret);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_context, mnemonic_credential)
{
    const pp::WithdrawalConfigV1 config{make_test_config()};
    pp::mocks::MockPoolLedger ledger{12345};
    const pp::PoolNoteV1 note{pp::mocks::add_mock_deposit("1.0", 0, true, ledger)};
    pp::mocks::MockWithdrawalDataSource data_source{ledger};
    const pp::mocks::MockMnemonicKeyRestorer restorer;
    const pp::NoteSecretDeriverKeccak deriver;
    pp::NoteIndexTrackerMemory tracker;

    pp::WithdrawalRequestV1 request{make_test_request(note)};
    request.credential.private_key = boost::none;
    request.credential.mnemonic =
        pp::MnemonicVariant{epee::wipeable_string{"test test test test test test test test test test test junk"}};

    // the spent note's index is recorded under the restored key
    const epee::wipeable_string restored_key{
            restorer.restore_private_key(pp::get_mnemonic_words(*request.credential.mnemonic))
        };
    tracker.record_used_note_index(restored_key, config.pool_address, note.note_index);

    const pp::FetchedWithdrawalDataV1 fetched_data{pp::fetch_withdrawal_data(data_source)};
    const pp::WithdrawalContextV1 withdrawal_context{
            pp::calculate_withdrawal_context_v1(request, fetched_data, config, restorer, tracker, deriver)
        };

    // the index is tracked under the restored key
    EXPECT_EQ(withdrawal_context.next_note_index, 1);
    ASSERT_TRUE(tracker.last_used_note_index(restored_key, config.pool_address));
    EXPECT_EQ(*tracker.last_used_note_index(restored_key, config.pool_address), 1);
    EXPECT_EQ(withdrawal_context.new_secret, deriver.derive_secret(restored_key, config.pool_address, 1));

    // a bad mnemonic never reaches the tracker
    request.credential.mnemonic = pp::MnemonicVariant{epee::wipeable_string{"only three words"}};
    EXPECT_THROW(pp::calculate_withdrawal_context_v1(request, fetched_data, config, restorer, tracker, deriver),
        pp::error::missing_credential_error);
    EXPECT_EQ(tracker.num_tracked_accounts(), 1);
}
//-------------------------------------------------------------------------------------------------------------------
