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

// Chain addresses: parsing, validation and EIP-55 checksum rendering.

#pragma once

//local headers

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <array>
#include <cstdint>
#include <string>

//forward declarations


namespace pp
{

////
// Address
// - a 20-byte account or contract address
///
struct Address final
{
    std::array<std::uint8_t, 20> bytes;
};

/// equality operators
bool operator==(const Address &a, const Address &b);
inline bool operator!=(const Address &a, const Address &b) { return !(a == b); }
/// ordering (for use as a map key)
bool operator<(const Address &a, const Address &b);

/**
* brief: try_parse_address - parse '0x' + 40 hex digits
*   - all-lowercase text is accepted as-is
*   - any other casing must match the EIP-55 checksum exactly
* param: text -
* outparam: address_out -
* return: true if the text is a well-formed address
*/
bool try_parse_address(const boost::string_ref text, Address &address_out);
/// check if text is a well-formed address (see try_parse_address())
bool is_address(const boost::string_ref text);
/// parse an address (throws std::invalid_argument on failure)
Address parse_address(const boost::string_ref text);

/// render with EIP-55 mixed-case checksum
std::string address_to_checksum_string(const Address &address);
/// render as lowercase hex
std::string address_to_lower_string(const Address &address);

} //namespace pp
