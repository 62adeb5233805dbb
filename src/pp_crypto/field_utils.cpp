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
#include "field_utils.h"

//local headers
#include "hex.h"
#include "keccak.h"
#include "misc_log_ex.h"
#include "privacy_pool_config.h"

//third party headers
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/utility/string_ref.hpp>

//standard headers
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_crypto"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
const scalar_t& snark_scalar_field()
{
    static const scalar_t field_prime{config::SNARK_SCALAR_FIELD};
    return field_prime;
}
//-------------------------------------------------------------------------------------------------------------------
bool is_in_scalar_field(const scalar_t &scalar)
{
    return scalar < snark_scalar_field();
}
//-------------------------------------------------------------------------------------------------------------------
const scalar_t& bn254_base_field()
{
    static const scalar_t field_prime{config::BN254_BASE_FIELD};
    return field_prime;
}
//-------------------------------------------------------------------------------------------------------------------
bool is_in_base_field(const scalar_t &element)
{
    return element < bn254_base_field();
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t scalar_from_bytes_be(const bytes32_t &bytes)
{
    scalar_t result;
    boost::multiprecision::import_bits(result, bytes.begin(), bytes.end());
    return result;
}
//-------------------------------------------------------------------------------------------------------------------
bytes32_t scalar_to_bytes_be(const scalar_t &scalar)
{
    std::vector<std::uint8_t> minimal_bytes;
    boost::multiprecision::export_bits(scalar, std::back_inserter(minimal_bytes), 8);

    CHECK_AND_ASSERT_THROW_MES(minimal_bytes.size() <= 32,
        "scalar to bytes: exported scalar is wider than 256 bits (bug).");

    bytes32_t result;
    result.fill(0);
    std::copy(minimal_bytes.begin(), minimal_bytes.end(), result.end() - minimal_bytes.size());
    return result;
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t reduce_to_field(const bytes32_t &digest)
{
    return scalar_from_bytes_be(digest) % snark_scalar_field();
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t hash_to_field(const epee::span<const std::uint8_t> data)
{
    return reduce_to_field(keccak256(data));
}
//-------------------------------------------------------------------------------------------------------------------
bool try_parse_scalar(const boost::string_ref text, scalar_t &scalar_out)
{
    std::string trimmed{text.data(), text.size()};
    boost::algorithm::trim(trimmed);

    // cpp_int reads a leading '0' as octal, so only accept plain decimal or 0x-prefixed hex
    const bool is_hex{boost::algorithm::istarts_with(trimmed, "0x")};
    const std::size_t digits_begin{is_hex ? std::size_t{2} : std::size_t{0}};
    if (trimmed.size() <= digits_begin)
        return false;
    if (!std::all_of(trimmed.begin() + digits_begin, trimmed.end(),
            [is_hex](const char c) -> bool
            {
                return is_hex
                    ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                    : std::isdigit(static_cast<unsigned char>(c)) != 0;
            }))
        return false;

    // drop leading zeros; a 512-bit intermediate then cannot wrap
    const std::size_t first_significant{trimmed.find_first_not_of('0', digits_begin)};
    if (first_significant == std::string::npos)
    {
        scalar_out = 0;
        return true;
    }
    const std::size_t significant_digits{trimmed.size() - first_significant};
    if (significant_digits > (is_hex ? 64 : 78))
        return false;

    boost::multiprecision::uint512_t wide_value;
    try
    {
        wide_value = boost::multiprecision::uint512_t{
                (is_hex ? std::string{"0x"} : std::string{}) + trimmed.substr(first_significant)
            };
    }
    catch (const std::runtime_error &e)
    {
        LOG_PRINT_L2("scalar parse: " << e.what());
        return false;
    }

    if (wide_value > boost::multiprecision::uint512_t{std::numeric_limits<scalar_t>::max()})
        return false;

    scalar_out = static_cast<scalar_t>(wide_value);
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t parse_scalar(const boost::string_ref text)
{
    scalar_t scalar;
    if (!try_parse_scalar(text, scalar))
        throw std::invalid_argument("not a valid 256-bit scalar: " + std::string{text.data(), text.size()});
    return scalar;
}
//-------------------------------------------------------------------------------------------------------------------
std::string scalar_to_decimal(const scalar_t &scalar)
{
    return scalar.str();
}
//-------------------------------------------------------------------------------------------------------------------
std::string scalar_to_hex(const scalar_t &scalar)
{
    const bytes32_t bytes{scalar_to_bytes_be(scalar)};
    return "0x" + epee::to_hex::string(epee::to_span(bytes));
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
