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
#include "keccak.h"

//local headers
#include "crypto/hash.h"
#include "span.h"

//third party headers

//standard headers
#include <cstdint>
#include <cstring>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_crypto"

namespace pp
{

static_assert(sizeof(crypto::hash) == sizeof(bytes32_t), "keccak256 digest size mismatch");

//-------------------------------------------------------------------------------------------------------------------
bytes32_t keccak256(const epee::span<const std::uint8_t> data)
{
    // cn_fast_hash is keccak-1600 with the original 0x01 padding truncated to 32 bytes
    const crypto::hash digest{crypto::cn_fast_hash(data.data(), data.size())};

    bytes32_t result;
    std::memcpy(result.data(), digest.data, result.size());
    return result;
}
//-------------------------------------------------------------------------------------------------------------------
bytes32_t keccak256(const std::string &data)
{
    return keccak256(epee::strspan<std::uint8_t>(data));
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
