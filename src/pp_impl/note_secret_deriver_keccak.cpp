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
#include "note_secret_deriver_keccak.h"

//local headers
#include "memwipe.h"
#include "misc_log_ex.h"
#include "pp_core/abi_encoding.h"
#include "pp_core/address_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "privacy_pool_config.h"
#include "span.h"
#include "wipeable_string.h"

//third party headers

//standard headers
#include <cstring>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_impl"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static scalar_t derive_note_scalar(const char *domain_separator,
    const epee::wipeable_string &account_key,
    const Address &pool_address,
    const std::uint64_t note_index)
{
    // domain || account key || pool || uint256(index)
    bytes_t transcript;
    transcript.reserve(std::strlen(domain_separator) + account_key.size() + pool_address.bytes.size() + ABI_WORD_SIZE);

    transcript.insert(transcript.end(), domain_separator, domain_separator + std::strlen(domain_separator));
    transcript.insert(transcript.end(), account_key.data(), account_key.data() + account_key.size());
    transcript.insert(transcript.end(), pool_address.bytes.begin(), pool_address.bytes.end());
    append_abi_uint256(scalar_t{note_index}, transcript);

    const scalar_t derived{hash_to_field(epee::to_span(transcript))};
    memwipe(transcript.data(), transcript.size());

    return derived;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
scalar_t NoteSecretDeriverKeccak::derive_nullifier(const epee::wipeable_string &account_key,
    const Address &pool_address,
    const std::uint64_t note_index) const
{
    return derive_note_scalar(config::HASH_KEY_NOTE_NULLIFIER, account_key, pool_address, note_index);
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t NoteSecretDeriverKeccak::derive_secret(const epee::wipeable_string &account_key,
    const Address &pool_address,
    const std::uint64_t note_index) const
{
    return derive_note_scalar(config::HASH_KEY_NOTE_SECRET, account_key, pool_address, note_index);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
