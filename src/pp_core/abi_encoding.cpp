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
#include "abi_encoding.h"

//local headers
#include "address_utils.h"
#include "misc_log_ex.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "span.h"

//third party headers

//standard headers
#include <algorithm>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_core"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
void append_abi_uint256(const scalar_t &value, bytes_t &encoding_inout)
{
    const bytes32_t word{scalar_to_bytes_be(value)};
    encoding_inout.insert(encoding_inout.end(), word.begin(), word.end());
}
//-------------------------------------------------------------------------------------------------------------------
void append_abi_address(const Address &address, bytes_t &encoding_inout)
{
    encoding_inout.insert(encoding_inout.end(), ABI_WORD_SIZE - address.bytes.size(), 0);
    encoding_inout.insert(encoding_inout.end(), address.bytes.begin(), address.bytes.end());
}
//-------------------------------------------------------------------------------------------------------------------
void append_abi_bytes(const epee::span<const std::uint8_t> data, bytes_t &encoding_inout)
{
    append_abi_uint256(scalar_t{data.size()}, encoding_inout);
    encoding_inout.insert(encoding_inout.end(), data.begin(), data.end());

    const std::size_t remainder{data.size() % ABI_WORD_SIZE};
    if (remainder != 0)
        encoding_inout.insert(encoding_inout.end(), ABI_WORD_SIZE - remainder, 0);
}
//-------------------------------------------------------------------------------------------------------------------
abi_selector_t abi_function_selector(const std::string &function_signature)
{
    const bytes32_t hash{keccak256(function_signature)};

    abi_selector_t selector;
    std::copy(hash.begin(), hash.begin() + selector.size(), selector.begin());
    return selector;
}
//-------------------------------------------------------------------------------------------------------------------
bytes_t abi_encode_relay_data(const Address &recipient,
    const Address &fee_recipient,
    const std::uint64_t relay_fee_bps)
{
    bytes_t encoding;
    encoding.reserve(3*ABI_WORD_SIZE);

    append_abi_address(recipient, encoding);
    append_abi_address(fee_recipient, encoding);
    append_abi_uint256(scalar_t{relay_fee_bps}, encoding);

    return encoding;
}
//-------------------------------------------------------------------------------------------------------------------
void append_abi_withdrawal_tuple(const Address &processor,
    const epee::span<const std::uint8_t> data,
    bytes_t &encoding_inout)
{
    const std::size_t tuple_start{encoding_inout.size()};

    // head: processor, offset of 'data' relative to the start of the tuple
    append_abi_address(processor, encoding_inout);
    append_abi_uint256(scalar_t{2*ABI_WORD_SIZE}, encoding_inout);

    // tail
    append_abi_bytes(data, encoding_inout);

    CHECK_AND_ASSERT_THROW_MES((encoding_inout.size() - tuple_start) % ABI_WORD_SIZE == 0,
        "append abi withdrawal tuple: encoding is not word aligned (bug).");
}
//-------------------------------------------------------------------------------------------------------------------
bytes_t abi_encode_withdrawal_context(const Address &processor,
    const epee::span<const std::uint8_t> data,
    const scalar_t &scope)
{
    bytes_t encoding;

    // head: offset of the dynamic tuple, then the static scope
    append_abi_uint256(scalar_t{2*ABI_WORD_SIZE}, encoding);
    append_abi_uint256(scope, encoding);

    // tail
    append_abi_withdrawal_tuple(processor, data, encoding);

    return encoding;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
