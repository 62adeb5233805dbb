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

// Runtime configuration of the withdrawal pipeline.

#pragma once

//local headers
#include "pp_core/address_utils.h"

//third party headers

//standard headers
#include <cstdint>

//forward declarations


namespace pp
{

////
// WithdrawalConfigV1
// - deployment-specific addresses and the relay fee applied to withdrawals
///
struct WithdrawalConfigV1 final
{
    /// the privacy pool the notes belong to (key for note index tracking and secret derivation)
    Address pool_address;
    /// the entrypoint that processes relayed withdrawals
    Address relay_processor;
    /// receiver of the relay fee
    Address fee_recipient;
    /// relay fee in basis points
    std::uint64_t relay_fee_bps;
};

/**
* brief: make_withdrawal_config_v1 - make a config that charges the protocol relay fee
* param: pool_address -
* param: relay_processor -
* param: fee_recipient -
* return: config with relay_fee_bps = config::DEFAULT_RELAY_FEE_BPS
*/
WithdrawalConfigV1 make_withdrawal_config_v1(const Address &pool_address,
    const Address &relay_processor,
    const Address &fee_recipient);
/// throws if the config is unusable (zero addresses, fee above 100%)
void check_withdrawal_config_v1(const WithdrawalConfigV1 &config);

} //namespace pp
