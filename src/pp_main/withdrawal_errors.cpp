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
#include "withdrawal_errors.h"

//local headers

//third party headers

//standard headers
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
namespace error
{
//-------------------------------------------------------------------------------------------------------------------
data_fetch_error::data_fetch_error(const source failed_source, const std::string &message) :
    withdrawal_error{std::string{"failed to fetch "} + data_source_name(failed_source) + ": " + message},
    m_failed_source{failed_source}
{}
//-------------------------------------------------------------------------------------------------------------------
const char* data_source_name(const data_fetch_error::source data_source)
{
    switch (data_source)
    {
        case data_fetch_error::source::STATE_TREE_LEAVES: return "state tree leaves";
        case data_fetch_error::source::ASP_DATA:          return "ASP data";
        case data_fetch_error::source::POOL_SCOPE:        return "pool scope";
        default:                                          return "unknown data source";
    }
}
//-------------------------------------------------------------------------------------------------------------------
proof_generation_error::proof_generation_error(const kind failure_kind, const std::string &message) :
    withdrawal_error{message},
    m_failure_kind{failure_kind}
{}
//-------------------------------------------------------------------------------------------------------------------
} //namespace error
} //namespace pp
