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
#include "address_utils.h"

//local headers
#include "hex.h"
#include "pp_crypto/keccak.h"
#include "span.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_core"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool is_hex_char(const char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string apply_checksum_casing(const std::string &lowercase_hex)
{
    // EIP-55: uppercase the i-th letter if the i-th nibble of keccak256(lowercase hex) is >= 8
    const bytes32_t hash{keccak256(lowercase_hex)};

    std::string checksummed{lowercase_hex};
    for (std::size_t i{0}; i < checksummed.size(); ++i)
    {
        if (checksummed[i] < 'a' || checksummed[i] > 'f')
            continue;

        const std::uint8_t nibble{
                static_cast<std::uint8_t>(i % 2 == 0 ? hash[i / 2] >> 4 : hash[i / 2] & 0x0f)
            };
        if (nibble >= 8)
            checksummed[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(checksummed[i])));
    }

    return checksummed;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const Address &a, const Address &b)
{
    return a.bytes == b.bytes;
}
//-------------------------------------------------------------------------------------------------------------------
bool operator<(const Address &a, const Address &b)
{
    return a.bytes < b.bytes;
}
//-------------------------------------------------------------------------------------------------------------------
bool try_parse_address(const boost::string_ref text, Address &address_out)
{
    // 1. shape: 0x + 40 hex digits
    if (text.size() != 42 || text[0] != '0' || text[1] != 'x')
        return false;

    const boost::string_ref digits{text.substr(2)};
    if (!std::all_of(digits.begin(), digits.end(), is_hex_char))
        return false;

    // 2. mixed or upper casing must carry a valid checksum
    const std::string original{digits.begin(), digits.end()};
    std::string lowercase{original};
    std::transform(lowercase.begin(), lowercase.end(), lowercase.begin(),
        [](const char c) -> char { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });

    if (lowercase != original && apply_checksum_casing(lowercase) != original)
        return false;

    // 3. decode
    Address address;
    if (!epee::from_hex::to_buffer(epee::to_mut_span(address.bytes), lowercase))
        return false;

    address_out = address;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool is_address(const boost::string_ref text)
{
    Address dummy;
    return try_parse_address(text, dummy);
}
//-------------------------------------------------------------------------------------------------------------------
Address parse_address(const boost::string_ref text)
{
    Address address;
    if (!try_parse_address(text, address))
        throw std::invalid_argument("not a well-formed address: " + std::string{text.data(), text.size()});
    return address;
}
//-------------------------------------------------------------------------------------------------------------------
std::string address_to_checksum_string(const Address &address)
{
    return "0x" + apply_checksum_casing(epee::to_hex::string(epee::to_span(address.bytes)));
}
//-------------------------------------------------------------------------------------------------------------------
std::string address_to_lower_string(const Address &address)
{
    return "0x" + epee::to_hex::string(epee::to_span(address.bytes));
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
