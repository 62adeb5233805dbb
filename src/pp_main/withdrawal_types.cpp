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
#include "withdrawal_types.h"

//local headers
#include "pp_core/address_utils.h"
#include "pp_crypto/keccak.h"

//third party headers
#include <boost/variant.hpp>

//standard headers

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
const bytes_t& call_data_ref(const WithdrawalOperationVariant &operation)
{
    struct visitor final : public boost::static_visitor<const bytes_t&>
    {
        const bytes_t& operator()(const UserOperationV06 &op) const { return op.call_data; }
        const bytes_t& operator()(const UserOperationV07 &op) const { return op.call_data; }
    };

    return boost::apply_visitor(visitor{}, operation);
}
//-------------------------------------------------------------------------------------------------------------------
const Address& sender_ref(const WithdrawalOperationVariant &operation)
{
    struct visitor final : public boost::static_visitor<const Address&>
    {
        const Address& operator()(const UserOperationV06 &op) const { return op.sender; }
        const Address& operator()(const UserOperationV07 &op) const { return op.sender; }
    };

    return boost::apply_visitor(visitor{}, operation);
}
//-------------------------------------------------------------------------------------------------------------------
EntryPointVersion entry_point_version(const WithdrawalOperationVariant &operation)
{
    return boost::get<UserOperationV06>(&operation) != nullptr ? EntryPointVersion::V06 : EntryPointVersion::V07;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
