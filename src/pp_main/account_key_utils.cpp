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
#include "account_key_utils.h"

//local headers
#include "misc_log_ex.h"
#include "mnemonic_key_restorer.h"
#include "withdrawal_errors.h"
#include "withdrawal_types.h"
#include "wipeable_string.h"

//third party headers
#include <boost/variant.hpp>

//standard headers
#include <exception>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
bool has_private_key(const AccountCredentialV1 &credential)
{
    return credential.private_key && !credential.private_key->empty();
}
//-------------------------------------------------------------------------------------------------------------------
bool has_mnemonic(const AccountCredentialV1 &credential)
{
    return credential.mnemonic && !get_mnemonic_words(*credential.mnemonic).empty();
}
//-------------------------------------------------------------------------------------------------------------------
bool has_account_credential(const AccountCredentialV1 &credential)
{
    return has_private_key(credential) || has_mnemonic(credential);
}
//-------------------------------------------------------------------------------------------------------------------
mnemonic_words_t get_mnemonic_words(const MnemonicVariant &mnemonic)
{
    struct visitor final : public boost::static_visitor<mnemonic_words_t>
    {
        mnemonic_words_t operator()(const epee::wipeable_string &phrase) const
        {
            mnemonic_words_t words;
            phrase.split(words);
            return words;
        }
        mnemonic_words_t operator()(const mnemonic_words_t &word_list) const
        {
            mnemonic_words_t words;
            words.reserve(word_list.size());

            for (const epee::wipeable_string &word : word_list)
            {
                if (!word.empty())
                    words.emplace_back(word);
            }

            return words;
        }
    };

    return boost::apply_visitor(visitor{}, mnemonic);
}
//-------------------------------------------------------------------------------------------------------------------
epee::wipeable_string resolve_account_key(const AccountCredentialV1 &credential,
    const MnemonicKeyRestorer &mnemonic_key_restorer)
{
    // 1. a direct key wins
    if (has_private_key(credential))
        return *credential.private_key;

    // 2. restore from the mnemonic
    THROW_WITHDRAWAL_EXCEPTION_IF(!credential.mnemonic,
        error::missing_credential_error,
        "either a mnemonic or a private key is required");

    const mnemonic_words_t mnemonic_words{get_mnemonic_words(*credential.mnemonic)};
    THROW_WITHDRAWAL_EXCEPTION_IF(mnemonic_words.empty(),
        error::missing_credential_error,
        "either a mnemonic or a private key is required");

    epee::wipeable_string account_key;
    try
    {
        account_key = mnemonic_key_restorer.restore_private_key(mnemonic_words);
    }
    catch (const std::exception &e)
    {
        THROW_WITHDRAWAL_EXCEPTION(error::missing_credential_error,
            std::string{"could not restore an account key from the mnemonic: "} + e.what());
    }

    THROW_WITHDRAWAL_EXCEPTION_IF(account_key.empty(),
        error::missing_credential_error,
        "the mnemonic restored an empty account key");

    return account_key;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
