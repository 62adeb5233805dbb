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

// Resolve the account key used for note derivation from an account credential.

#pragma once

//local headers
#include "withdrawal_types.h"
#include "wipeable_string.h"

//third party headers

//standard headers

//forward declarations
namespace pp
{
    class MnemonicKeyRestorer;
}

namespace pp
{

/// true if the credential carries a non-empty private key
bool has_private_key(const AccountCredentialV1 &credential);
/// true if the credential carries at least one mnemonic word
bool has_mnemonic(const AccountCredentialV1 &credential);
/// true if either credential form is present
bool has_account_credential(const AccountCredentialV1 &credential);

/**
* brief: get_mnemonic_words - normalize a mnemonic into a word list
*   - a phrase is split on whitespace; empty entries of a word list are dropped
* param: mnemonic -
* return: mnemonic words
*/
mnemonic_words_t get_mnemonic_words(const MnemonicVariant &mnemonic);

/**
* brief: resolve_account_key - get the account key from a credential
*   - a private key is returned verbatim and takes precedence over a mnemonic
*   - otherwise the key is restored from the mnemonic
*   - the key must never be logged or persisted
* param: credential -
* param: mnemonic_key_restorer -
* return: the account key
*/
epee::wipeable_string resolve_account_key(const AccountCredentialV1 &credential,
    const MnemonicKeyRestorer &mnemonic_key_restorer);

} //namespace pp
