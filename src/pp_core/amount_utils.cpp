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
#include "amount_utils.h"

//local headers
#include "misc_log_ex.h"
#include "pp_crypto/field_utils.h"
#include "privacy_pool_config.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <limits>
#include <stdexcept>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_core"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_append_decimal_digit(const char c, amount_t &value_inout)
{
    if (c < '0' || c > '9')
        return false;

    const unsigned int digit{static_cast<unsigned int>(c - '0')};
    if (value_inout > (std::numeric_limits<amount_t>::max() - digit) / 10)
        return false;

    value_inout = value_inout * 10 + digit;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_increment(amount_t &value_inout)
{
    if (value_inout == std::numeric_limits<amount_t>::max())
        return false;
    ++value_inout;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
bool try_parse_units(const boost::string_ref decimal_text, const unsigned int decimals, amount_t &amount_out)
{
    // 1. split integer and fraction parts
    const std::size_t point_pos{decimal_text.find('.')};
    const boost::string_ref integer_part{decimal_text.substr(0, point_pos)};
    const boost::string_ref fraction_part{
            point_pos == boost::string_ref::npos
            ? boost::string_ref{}
            : decimal_text.substr(point_pos + 1)
        };

    if (integer_part.empty() && fraction_part.empty())
        return false;
    if (fraction_part.find('.') != boost::string_ref::npos)
        return false;

    // 2. integer digits
    amount_t value{0};
    for (const char c : integer_part)
    {
        if (!try_append_decimal_digit(c, value))
            return false;
    }

    // 3. fraction digits up to the asset's precision (right-padded with zeros)
    for (std::size_t i{0}; i < decimals; ++i)
    {
        const char c{i < fraction_part.size() ? fraction_part[i] : '0'};
        if (!try_append_decimal_digit(c, value))
            return false;
    }

    // 4. excess fraction digits: validate, then round on the first dropped digit
    if (fraction_part.size() > decimals)
    {
        for (std::size_t i{decimals}; i < fraction_part.size(); ++i)
        {
            if (fraction_part[i] < '0' || fraction_part[i] > '9')
                return false;
        }

        if (fraction_part[decimals] >= '5' && !try_increment(value))
            return false;
    }

    amount_out = value;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool try_parse_ether(const boost::string_ref decimal_text, amount_t &amount_out)
{
    return try_parse_units(decimal_text, config::NATIVE_ASSET_DECIMALS, amount_out);
}
//-------------------------------------------------------------------------------------------------------------------
amount_t parse_ether(const boost::string_ref decimal_text)
{
    amount_t amount;
    if (!try_parse_ether(decimal_text, amount))
    {
        throw std::invalid_argument("not a valid decimal amount: " +
            std::string{decimal_text.data(), decimal_text.size()});
    }
    return amount;
}
//-------------------------------------------------------------------------------------------------------------------
std::string format_units(const amount_t &amount, const unsigned int decimals)
{
    std::string digits{amount.str()};
    if (decimals == 0)
        return digits;

    // left-pad so there is at least one integer digit
    if (digits.size() <= decimals)
        digits.insert(0, decimals + 1 - digits.size(), '0');

    const std::size_t integer_size{digits.size() - decimals};
    std::string integer_part{digits.substr(0, integer_size)};
    std::string fraction_part{digits.substr(integer_size)};

    // trim trailing zeros of the fraction
    const std::size_t last_nonzero{fraction_part.find_last_not_of('0')};
    if (last_nonzero == std::string::npos)
        return integer_part;
    fraction_part.erase(last_nonzero + 1);

    return integer_part + "." + fraction_part;
}
//-------------------------------------------------------------------------------------------------------------------
std::string format_ether(const amount_t &amount)
{
    return format_units(amount, config::NATIVE_ASSET_DECIMALS);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
