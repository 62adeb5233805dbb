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

// Protocol constants for privacy pool withdrawals.

#pragma once

//local headers

//third party headers

//standard headers
#include <cstddef>
#include <cstdint>


namespace config
{
    /// BN254 scalar field; every value fed to the withdrawal circuit must be reduced into it
    const constexpr char SNARK_SCALAR_FIELD[] =
        "21888242871839275222246405745257275088548364400416034343698204186575808495617";
    /// BN254 base field; Groth16 proof point coordinates live here
    const constexpr char BN254_BASE_FIELD[] =
        "21888242871839275222246405745257275088696311157297823662689037894645226208583";

    /// relay fee charged on withdrawals (protocol-wide, never user-supplied)
    std::uint64_t const DEFAULT_RELAY_FEE_BPS = 1000;
    std::uint64_t const RELAY_FEE_BPS_DENOMINATOR = 10000;

    /// native asset amounts are handled in base units (wei)
    unsigned int const NATIVE_ASSET_DECIMALS = 18;

    /// withdraw circuit public signals:
    /// [new commitment, existing nullifier hash, withdrawn value, state root, state tree depth, ASP root,
    ///  ASP tree depth, context]
    std::size_t const WITHDRAW_PROOF_NUM_PUBLIC_SIGNALS = 8;
    std::size_t const WITHDRAW_PROOF_SIGNAL_NEW_COMMITMENT = 0;
    std::size_t const WITHDRAW_PROOF_SIGNAL_EXISTING_NULLIFIER_HASH = 1;
    std::size_t const WITHDRAW_PROOF_SIGNAL_WITHDRAWN_VALUE = 2;
    std::size_t const WITHDRAW_PROOF_SIGNAL_STATE_ROOT = 3;
    std::size_t const WITHDRAW_PROOF_SIGNAL_STATE_TREE_DEPTH = 4;
    std::size_t const WITHDRAW_PROOF_SIGNAL_ASP_ROOT = 5;
    std::size_t const WITHDRAW_PROOF_SIGNAL_ASP_TREE_DEPTH = 6;
    std::size_t const WITHDRAW_PROOF_SIGNAL_CONTEXT = 7;

    /// entrypoint relay call
    const constexpr char RELAY_FUNCTION_SIGNATURE[] =
        "relay((address,bytes),(uint256[2],uint256[2][2],uint256[2],uint256[8]),uint256)";

    /// domain separators
    const constexpr char HASH_KEY_NOTE_NULLIFIER[] = "privacy_pool_note_nullifier";
    const constexpr char HASH_KEY_NOTE_SECRET[] = "privacy_pool_note_secret";
    const constexpr char HASH_KEY_NOTE_INDEX_TRACKER[] = "privacy_pool_note_index_tracker";
}
