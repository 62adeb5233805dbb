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

// Interface for obtaining the on-chain state a withdrawal proof is anchored to.

#pragma once

//local headers
#include "pp_crypto/field_utils.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <vector>

//forward declarations


namespace pp
{

////
// WithdrawalDataSource
// - source of state tree leaves, ASP data and the pool scope (an indexer and the pool contract)
// - all member functions may be called concurrently from different threads
///
class WithdrawalDataSource
{
public:
//destructor
    virtual ~WithdrawalDataSource() = default;

//overloaded operators
    /// disable copy/move (this is a virtual base class)
    WithdrawalDataSource& operator=(WithdrawalDataSource&&) = delete;

//member functions
    /// get all leaves of the pool's state tree, in leaf order
    virtual std::vector<StateTreeLeafV1> fetch_state_tree_leaves() const = 0;
    /// get the ASP's approved labels and root
    virtual AspDataV1 fetch_asp_data() const = 0;
    /// get the pool's scope
    virtual scalar_t fetch_pool_scope() const = 0;
};

} //namespace pp
