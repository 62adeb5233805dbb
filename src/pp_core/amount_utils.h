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

// Conversions between human-readable decimal amounts and integer base units.

#pragma once

//local headers
#include "pp_crypto/field_utils.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <string>

//forward declarations


namespace pp
{

/// amount in base units (wei for the native asset)
using amount_t = scalar_t;

/**
* brief: try_parse_units - convert a non-negative decimal string into base units
*   - accepted forms: "1", "1.", ".5", "0.50"; no sign, exponent or whitespace
*   - fraction digits beyond 'decimals' are rounded half-up at the first dropped digit
* param: decimal_text -
* param: decimals - number of base-unit decimals of the asset
* outparam: amount_out -
* return: true if the text is a valid decimal that fits in 256 bits
*/
bool try_parse_units(const boost::string_ref decimal_text, const unsigned int decimals, amount_t &amount_out);
/// try_parse_units() with the native asset's decimals
bool try_parse_ether(const boost::string_ref decimal_text, amount_t &amount_out);
/// parse a native asset amount (throws std::invalid_argument on failure)
amount_t parse_ether(const boost::string_ref decimal_text);

/**
* brief: format_units - render base units as a minimal decimal string ("1.5", "10", "0.000001")
* param: amount -
* param: decimals -
* return: decimal text
*/
std::string format_units(const amount_t &amount, const unsigned int decimals);
/// format_units() with the native asset's decimals
std::string format_ether(const amount_t &amount);

} //namespace pp
