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

#include "pp_core/abi_encoding.h"
#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"

#include "hex.h"
#include "span.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::amount_t ether(const unsigned int whole)
{
    return pp::amount_t{whole} * pp::parse_scalar("1000000000000000000");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::scalar_t read_word(const pp::bytes_t &encoding, const std::size_t word_index, const std::size_t offset = 0)
{
    pp::bytes32_t word;
    std::copy(encoding.begin() + offset + word_index*32,
        encoding.begin() + offset + (word_index + 1)*32,
        word.begin());
    return pp::scalar_from_bytes_be(word);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static pp::scalar_t address_as_scalar(const pp::Address &address)
{
    pp::bytes32_t word{};
    std::copy(address.bytes.begin(), address.bytes.end(), word.begin() + 12);
    return pp::scalar_from_bytes_be(word);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------

//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, parse_ether)
{
    pp::amount_t amount;

    ASSERT_TRUE(pp::try_parse_ether("1", amount));
    EXPECT_EQ(amount, ether(1));
    ASSERT_TRUE(pp::try_parse_ether("1.0", amount));
    EXPECT_EQ(amount, ether(1));
    ASSERT_TRUE(pp::try_parse_ether("1.", amount));
    EXPECT_EQ(amount, ether(1));
    ASSERT_TRUE(pp::try_parse_ether(".5", amount));
    EXPECT_EQ(amount, ether(1) / 2);
    ASSERT_TRUE(pp::try_parse_ether("0.000000000000000001", amount));
    EXPECT_EQ(amount, 1);
    ASSERT_TRUE(pp::try_parse_ether("100", amount));
    EXPECT_EQ(amount, ether(100));

    // excess precision rounds half up at the first dropped digit
    ASSERT_TRUE(pp::try_parse_ether("0.0000000000000000015", amount));
    EXPECT_EQ(amount, 2);
    ASSERT_TRUE(pp::try_parse_ether("0.0000000000000000014999", amount));
    EXPECT_EQ(amount, 1);

    EXPECT_FALSE(pp::try_parse_ether("", amount));
    EXPECT_FALSE(pp::try_parse_ether(".", amount));
    EXPECT_FALSE(pp::try_parse_ether("-1", amount));
    EXPECT_FALSE(pp::try_parse_ether("+1", amount));
    EXPECT_FALSE(pp::try_parse_ether("1e3", amount));
    EXPECT_FALSE(pp::try_parse_ether("1.2.3", amount));
    EXPECT_FALSE(pp::try_parse_ether(" 1", amount));
    EXPECT_FALSE(pp::try_parse_ether("abc", amount));
    EXPECT_FALSE(pp::try_parse_ether("0.0000000000000000001x", amount));

    EXPECT_THROW(pp::parse_ether("one"), std::invalid_argument);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, parse_units_overflow)
{
    pp::amount_t amount;

    // 2^256 - 1 base units is the largest amount
    ASSERT_TRUE(pp::try_parse_units(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935", 0, amount));
    EXPECT_FALSE(pp::try_parse_units(
        "115792089237316195423570985008687907853269984665640564039457584007913129639936", 0, amount));
    EXPECT_FALSE(pp::try_parse_units(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935.5", 0, amount));

    // whole units scaled by decimals
    ASSERT_TRUE(pp::try_parse_units("1.5", 6, amount));
    EXPECT_EQ(amount, 1500000);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, format_ether)
{
    EXPECT_EQ(pp::format_ether(0), "0");
    EXPECT_EQ(pp::format_ether(1), "0.000000000000000001");
    EXPECT_EQ(pp::format_ether(ether(1) / 10), "0.1");
    EXPECT_EQ(pp::format_ether(ether(3) / 2), "1.5");
    EXPECT_EQ(pp::format_ether(ether(10)), "10");
    EXPECT_EQ(pp::format_ether(ether(1234) + 5), "1234.000000000000000005");

    EXPECT_EQ(pp::format_units(1500000, 6), "1.5");
    EXPECT_EQ(pp::format_units(42, 0), "42");

    EXPECT_EQ(pp::format_ether(pp::parse_ether("0.25")), "0.25");
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, parse_address)
{
    pp::Address address;

    // EIP-55 checksummed
    ASSERT_TRUE(pp::try_parse_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed", address));
    EXPECT_EQ(address.bytes[0], 0x5a);
    EXPECT_EQ(address.bytes[19], 0xed);
    EXPECT_TRUE(pp::is_address("0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359"));

    // lowercase is accepted without a checksum
    EXPECT_TRUE(pp::is_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));

    // bad checksum
    EXPECT_FALSE(pp::is_address("0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    EXPECT_FALSE(pp::is_address("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED"));

    // malformed
    EXPECT_FALSE(pp::is_address("not-an-address"));
    EXPECT_FALSE(pp::is_address(""));
    EXPECT_FALSE(pp::is_address("5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    EXPECT_FALSE(pp::is_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1bea"));
    EXPECT_FALSE(pp::is_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed00"));
    EXPECT_FALSE(pp::is_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beagg"));

    EXPECT_THROW(pp::parse_address("0x1234"), std::invalid_argument);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, address_rendering)
{
    const pp::Address address{pp::parse_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed")};

    EXPECT_EQ(pp::address_to_checksum_string(address), "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    EXPECT_EQ(pp::address_to_lower_string(address), "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
    EXPECT_EQ(pp::parse_address(pp::address_to_checksum_string(address)), address);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, abi_function_selector)
{
    const pp::abi_selector_t transfer_selector{pp::abi_function_selector("transfer(address,uint256)")};
    EXPECT_EQ(epee::to_hex::string(epee::to_span(transfer_selector)), "a9059cbb");

    const pp::abi_selector_t relay_selector{
            pp::abi_function_selector(
                "relay((address,bytes),(uint256[2],uint256[2][2],uint256[2],uint256[8]),uint256)")
        };
    EXPECT_EQ(epee::to_hex::string(epee::to_span(relay_selector)), "8a44121e");
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, abi_encode_relay_data)
{
    const pp::Address recipient{pp::parse_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed")};
    pp::Address fee_recipient;
    fee_recipient.bytes.fill(0xcc);

    const pp::bytes_t encoding{pp::abi_encode_relay_data(recipient, fee_recipient, 1000)};
    ASSERT_EQ(encoding.size(), 3*32);

    // addresses are left-padded
    for (std::size_t i{0}; i < 12; ++i)
    {
        EXPECT_EQ(encoding[i], 0);
        EXPECT_EQ(encoding[32 + i], 0);
    }
    EXPECT_EQ(read_word(encoding, 0), address_as_scalar(recipient));
    EXPECT_EQ(read_word(encoding, 1), address_as_scalar(fee_recipient));
    EXPECT_EQ(read_word(encoding, 2), 1000);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, abi_bytes_padding)
{
    pp::bytes_t encoding;

    pp::append_abi_bytes(epee::span<const std::uint8_t>{}, encoding);
    EXPECT_EQ(encoding.size(), 32);
    EXPECT_EQ(read_word(encoding, 0), 0);

    encoding.clear();
    const pp::bytes_t data(33, 0x01);
    pp::append_abi_bytes(epee::to_span(data), encoding);
    ASSERT_EQ(encoding.size(), 32 + 64);
    EXPECT_EQ(read_word(encoding, 0), 33);
    EXPECT_EQ(encoding[32 + 32], 0x01);
    EXPECT_EQ(encoding[32 + 33], 0x00);
    EXPECT_EQ(encoding.back(), 0x00);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(pp_core, abi_encode_withdrawal_context)
{
    pp::Address processor;
    processor.bytes.fill(0xbb);
    const pp::bytes_t data(96, 0x07);

    const pp::bytes_t encoding{pp::abi_encode_withdrawal_context(processor, epee::to_span(data), 12345)};
    ASSERT_EQ(encoding.size(), 2*32 + 3*32 + 96);

    // head
    EXPECT_EQ(read_word(encoding, 0), 0x40);
    EXPECT_EQ(read_word(encoding, 1), 12345);

    // tuple: processor, offset of data within the tuple, length, data
    EXPECT_EQ(read_word(encoding, 2), address_as_scalar(processor));
    EXPECT_EQ(read_word(encoding, 3), 0x40);
    EXPECT_EQ(read_word(encoding, 4), 96);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), encoding.begin() + 5*32));
}
//-------------------------------------------------------------------------------------------------------------------
