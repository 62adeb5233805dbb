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
#include "withdrawal_config.h"

//local headers
#include "misc_log_ex.h"
#include "pp_core/address_utils.h"
#include "privacy_pool_config.h"

//third party headers

//standard headers

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool is_zero_address(const Address &address)
{
    return address == Address{};
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
WithdrawalConfigV1 make_withdrawal_config_v1(const Address &pool_address,
    const Address &relay_processor,
    const Address &fee_recipient)
{
    WithdrawalConfigV1 withdrawal_config;
    withdrawal_config.pool_address    = pool_address;
    withdrawal_config.relay_processor = relay_processor;
    withdrawal_config.fee_recipient   = fee_recipient;
    withdrawal_config.relay_fee_bps   = config::DEFAULT_RELAY_FEE_BPS;

    return withdrawal_config;
}
//-------------------------------------------------------------------------------------------------------------------
void check_withdrawal_config_v1(const WithdrawalConfigV1 &withdrawal_config)
{
    CHECK_AND_ASSERT_THROW_MES(!is_zero_address(withdrawal_config.pool_address),
        "check withdrawal config v1: pool address is not set.");
    CHECK_AND_ASSERT_THROW_MES(!is_zero_address(withdrawal_config.relay_processor),
        "check withdrawal config v1: relay processor is not set.");
    CHECK_AND_ASSERT_THROW_MES(!is_zero_address(withdrawal_config.fee_recipient),
        "check withdrawal config v1: fee recipient is not set.");
    CHECK_AND_ASSERT_THROW_MES(withdrawal_config.relay_fee_bps <= config::RELAY_FEE_BPS_DENOMINATOR,
        "check withdrawal config v1: relay fee exceeds 100%.");
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
