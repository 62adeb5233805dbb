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

// Interface for reserving note derivation indices.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "wipeable_string.h"

//third party headers

//standard headers
#include <cstdint>

//forward declarations


namespace pp
{

////
// NoteIndexTracker
// - tracks which note derivation indices have been used for each (account key, pool) pair
// - reserve_next_note_index() must be atomic: concurrent callers for the same pair never get the same index
// - implementations report failures with error::index_tracker_error
///
class NoteIndexTracker
{
public:
//destructor
    virtual ~NoteIndexTracker() = default;

//overloaded operators
    /// disable copy/move (this is a virtual base class)
    NoteIndexTracker& operator=(NoteIndexTracker&&) = delete;

//member functions
    /// reserve the next unused index (one past the highest used index, or 0 if none has been used)
    virtual std::uint64_t reserve_next_note_index(const epee::wipeable_string &account_key,
        const Address &pool_address) = 0;
};

} //namespace pp
