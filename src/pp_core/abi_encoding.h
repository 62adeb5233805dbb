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

// Solidity ABI encoding for the withdrawal data, withdrawal context and relay call.

#pragma once

//local headers
#include "address_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "span.h"

//third party headers

//standard headers
#include <array>
#include <cstdint>
#include <string>

//forward declarations


namespace pp
{

/// size of one ABI head/tail slot
constexpr std::size_t ABI_WORD_SIZE{32};

using abi_selector_t = std::array<std::uint8_t, 4>;

/// append a uint256 word (big-endian)
void append_abi_uint256(const scalar_t &value, bytes_t &encoding_inout);
/// append an address word (left-padded with zeros)
void append_abi_address(const Address &address, bytes_t &encoding_inout);
/// append the tail of a dynamic 'bytes' value: length word + data right-padded to a word boundary
void append_abi_bytes(const epee::span<const std::uint8_t> data, bytes_t &encoding_inout);

/// first 4 bytes of keccak256(canonical function signature)
abi_selector_t abi_function_selector(const std::string &function_signature);

/**
* brief: abi_encode_relay_data - encode the relay payload carried in the withdrawal data
*   - abi.encode(address recipient, address fee_recipient, uint256 relay_fee_bps)
* param: recipient -
* param: fee_recipient -
* param: relay_fee_bps -
* return: the encoded payload (3 words)
*/
bytes_t abi_encode_relay_data(const Address &recipient,
    const Address &fee_recipient,
    const std::uint64_t relay_fee_bps);

/**
* brief: append_abi_withdrawal_tuple - append the encoding of a dynamic (address, bytes) tuple
*   - [processor][offset of data = 0x40][data length][data padded]
* param: processor -
* param: data -
* inoutparam: encoding_inout -
*/
void append_abi_withdrawal_tuple(const Address &processor,
    const epee::span<const std::uint8_t> data,
    bytes_t &encoding_inout);

/**
* brief: abi_encode_withdrawal_context - abi.encode((address, bytes) withdrawal, uint256 scope)
* param: processor -
* param: data -
* param: scope -
* return: the encoding hashed to obtain the withdrawal context
*/
bytes_t abi_encode_withdrawal_context(const Address &processor,
    const epee::span<const std::uint8_t> data,
    const scalar_t &scope);

} //namespace pp
