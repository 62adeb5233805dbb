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

// Scalar field helpers: conversions between bytes, text and SNARK scalar field elements.

#pragma once

//local headers
#include "keccak.h"
#include "span.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/utility/string_ref.hpp>

//standard headers
#include <string>

//forward declarations


namespace pp
{

/// unsigned 256-bit integer; circuit-bound values live in [0, SNARK_SCALAR_FIELD)
using scalar_t = boost::multiprecision::uint256_t;

/// the scalar field prime of the withdrawal circuit
const scalar_t& snark_scalar_field();
bool is_in_scalar_field(const scalar_t &scalar);
/// the base field prime of the curve (proof point coordinates)
const scalar_t& bn254_base_field();
bool is_in_base_field(const scalar_t &element);

/// big-endian conversions
scalar_t scalar_from_bytes_be(const bytes32_t &bytes);
bytes32_t scalar_to_bytes_be(const scalar_t &scalar);

/**
* brief: reduce_to_field - interpret a 32-byte digest as a big-endian integer and reduce it into the scalar field
* param: digest -
* return: digest mod SNARK_SCALAR_FIELD
*/
scalar_t reduce_to_field(const bytes32_t &digest);
/**
* brief: hash_to_field - keccak256 then reduce into the scalar field
* param: data -
* return: keccak256(data) mod SNARK_SCALAR_FIELD
*/
scalar_t hash_to_field(const epee::span<const std::uint8_t> data);

/**
* brief: try_parse_scalar - parse a scalar from decimal text or 0x-prefixed hex text
*   - surrounding whitespace is ignored
*   - fails on empty input, bad digits, or values that don't fit in 256 bits
* param: text -
* outparam: scalar_out -
* return: true if parsing succeeded
*/
bool try_parse_scalar(const boost::string_ref text, scalar_t &scalar_out);
/// parse a scalar (throws std::invalid_argument on failure)
scalar_t parse_scalar(const boost::string_ref text);

/// render as base-10 text
std::string scalar_to_decimal(const scalar_t &scalar);
/// render as 0x-prefixed, zero-padded 64-digit hex
std::string scalar_to_hex(const scalar_t &scalar);

} //namespace pp
