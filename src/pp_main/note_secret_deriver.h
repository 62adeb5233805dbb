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

// Interface for deriving note nullifiers and secrets.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_crypto/field_utils.h"
#include "wipeable_string.h"

//third party headers

//standard headers
#include <cstdint>

//forward declarations


namespace pp
{

////
// NoteSecretDeriver
// - deterministic: the same (account key, pool, index) always gives the same scalars, across process restarts
// - outputs are elements of the scalar field
///
class NoteSecretDeriver
{
public:
//destructor
    virtual ~NoteSecretDeriver() = default;

//overloaded operators
    /// disable copy/move (this is a virtual base class)
    NoteSecretDeriver& operator=(NoteSecretDeriver&&) = delete;

//member functions
    virtual scalar_t derive_nullifier(const epee::wipeable_string &account_key,
        const Address &pool_address,
        const std::uint64_t note_index) const = 0;
    virtual scalar_t derive_secret(const epee::wipeable_string &account_key,
        const Address &pool_address,
        const std::uint64_t note_index) const = 0;
};

} //namespace pp
