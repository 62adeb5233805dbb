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

#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "pp_main/account_key_utils.h"
#include "pp_main/withdrawal_errors.h"
#include "pp_main/withdrawal_types.h"
#include "pp_main/withdrawal_validators.h"
#include "pp_mocks/mock_withdrawal_collaborators.h"
#include "wipeable_string.h"

#include <gtest/gtest.h>

#include <string>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static const char TEST_MNEMONIC[] =
    "test test test test test test test test test test test junk";
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::WithdrawalRequestV1 make_valid_request()
{
    pp::WithdrawalRequestV1 request;
    request.note.commitment         = "12345678901234567890";
    request.note.amount             = "1.0";
    request.note.label              = "0x2a";
    request.note.note_index         = 3;
    request.withdraw_amount         = "0.5";
    request.recipient_address       = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    request.credential.private_key  = epee::wipeable_string{"0x0123456789abcdef"};

    return request;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------

//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, valid_request)
{
    const pp::WithdrawalRequestV1 request{make_valid_request()};

    pp::amount_t withdraw_amount;
    pp::Address recipient;
    ASSERT_NO_THROW(pp::validate_withdrawal_request_v1(request, withdraw_amount, recipient));
    EXPECT_EQ(withdraw_amount, pp::parse_ether("0.5"));
    EXPECT_EQ(recipient, pp::parse_address(request.recipient_address));

    // withdrawing the full note balance is allowed
    pp::WithdrawalRequestV1 full_request{make_valid_request()};
    full_request.withdraw_amount = "1";
    EXPECT_NO_THROW(pp::validate_withdrawal_request_v1(full_request));

    // a mnemonic can replace the private key
    pp::WithdrawalRequestV1 mnemonic_request{make_valid_request()};
    mnemonic_request.credential.private_key = boost::none;
    mnemonic_request.credential.mnemonic = pp::MnemonicVariant{epee::wipeable_string{TEST_MNEMONIC}};
    EXPECT_NO_THROW(pp::validate_withdrawal_request_v1(mnemonic_request));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, invalid_note)
{
    pp::WithdrawalRequestV1 request{make_valid_request()};

    request.note.commitment = "";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_note_error);

    request.note.commitment = "not a commitment";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_note_error);

    request = make_valid_request();
    request.note.label = "";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_note_error);

    request = make_valid_request();
    request.note.amount = "lots";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_note_error);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, invalid_amount)
{
    pp::WithdrawalRequestV1 request{make_valid_request()};

    request.withdraw_amount = "0";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_amount_error);

    request.withdraw_amount = "0.0";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_amount_error);

    request.withdraw_amount = "-0.5";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_amount_error);

    request.withdraw_amount = "half";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_amount_error);

    // compared in base units, not as strings
    request.withdraw_amount = "1.000000000000000001";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_amount_error);

    request.withdraw_amount = "10";
    request.note.amount = "9.5";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_amount_error);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, invalid_recipient)
{
    pp::WithdrawalRequestV1 request{make_valid_request()};

    request.recipient_address = "not-an-address";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_recipient_error);

    request.recipient_address = "0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_recipient_error);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, missing_credential)
{
    pp::WithdrawalRequestV1 request{make_valid_request()};

    request.credential.private_key = boost::none;
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::missing_credential_error);

    // empty values are absent
    request.credential.private_key = epee::wipeable_string{};
    request.credential.mnemonic = pp::MnemonicVariant{epee::wipeable_string{"   "}};
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::missing_credential_error);

    request.credential.mnemonic = pp::MnemonicVariant{pp::mnemonic_words_t{}};
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::missing_credential_error);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, failure_order)
{
    // everything is wrong: the note is reported first
    pp::WithdrawalRequestV1 request;
    request.withdraw_amount   = "-1";
    request.recipient_address = "nowhere";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_note_error);

    // then the amount
    request.note = make_valid_request().note;
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_amount_error);

    // then the recipient
    request.withdraw_amount = "0.1";
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::invalid_recipient_error);

    // then the credential
    request.recipient_address = make_valid_request().recipient_address;
    EXPECT_THROW(pp::validate_withdrawal_request_v1(request), pp::error::missing_credential_error);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, mnemonic_words)
{
    const pp::mnemonic_words_t phrase_words{
            pp::get_mnemonic_words(pp::MnemonicVariant{epee::wipeable_string{"  alpha beta\tgamma \n"}})
        };
    ASSERT_EQ(phrase_words.size(), 3);
    EXPECT_TRUE(phrase_words[0] == epee::wipeable_string{"alpha"});
    EXPECT_TRUE(phrase_words[2] == epee::wipeable_string{"gamma"});

    pp::mnemonic_words_t word_list;
    word_list.emplace_back("alpha");
    word_list.emplace_back("");
    word_list.emplace_back("beta");
    EXPECT_EQ(pp::get_mnemonic_words(pp::MnemonicVariant{word_list}).size(), 2);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(withdrawal_validation, resolve_account_key)
{
    const pp::mocks::MockMnemonicKeyRestorer restorer;

    // a private key is used as is, even if a mnemonic is present
    pp::AccountCredentialV1 credential;
    credential.private_key = epee::wipeable_string{"0xabc"};
    credential.mnemonic    = pp::MnemonicVariant{epee::wipeable_string{TEST_MNEMONIC}};
    EXPECT_TRUE(pp::resolve_account_key(credential, restorer) == epee::wipeable_string{"0xabc"});

    // the same mnemonic restores the same key, as a phrase or a word list
    credential.private_key = boost::none;
    const epee::wipeable_string phrase_key{pp::resolve_account_key(credential, restorer)};
    EXPECT_FALSE(phrase_key.empty());

    credential.mnemonic = pp::MnemonicVariant{pp::get_mnemonic_words(*credential.mnemonic)};
    EXPECT_TRUE(pp::resolve_account_key(credential, restorer) == phrase_key);

    // restoration failures are credential failures
    credential.mnemonic = pp::MnemonicVariant{epee::wipeable_string{"too few words"}};
    EXPECT_THROW(pp::resolve_account_key(credential, restorer), pp::error::missing_credential_error);

    credential.mnemonic = boost::none;
    EXPECT_THROW(pp::resolve_account_key(credential, restorer), pp::error::missing_credential_error);
}
//-------------------------------------------------------------------------------------------------------------------
