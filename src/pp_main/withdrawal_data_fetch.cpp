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
#include "withdrawal_data_fetch.h"

//local headers
#include "misc_log_ex.h"
#include "withdrawal_data_source.h"
#include "withdrawal_errors.h"
#include "withdrawal_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <exception>
#include <future>
#include <string>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_main"

namespace pp
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
template <typename ResultT>
static void collect_fetch_result(std::future<ResultT> &pending_result,
    const error::data_fetch_error::source data_source,
    ResultT &result_out,
    boost::optional<error::data_fetch_error> &first_failure_inout)
{
    try
    {
        result_out = pending_result.get();
    }
    catch (const std::exception &e)
    {
        MERROR("fetch withdrawal data: " << error::data_source_name(data_source) << " failed: " << e.what());
        if (!first_failure_inout)
            first_failure_inout = error::data_fetch_error{data_source, e.what()};
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
FetchedWithdrawalDataV1 fetch_withdrawal_data(const WithdrawalDataSource &data_source)
{
    // 1. launch the fetches
    std::future<std::vector<StateTreeLeafV1>> pending_leaves{
            std::async(std::launch::async, [&data_source]() { return data_source.fetch_state_tree_leaves(); })
        };
    std::future<AspDataV1> pending_asp_data{
            std::async(std::launch::async, [&data_source]() { return data_source.fetch_asp_data(); })
        };
    std::future<scalar_t> pending_scope{
            std::async(std::launch::async, [&data_source]() { return data_source.fetch_pool_scope(); })
        };

    // 2. join all of them (each get() blocks until its fetch completes, even if an earlier one failed)
    FetchedWithdrawalDataV1 fetched_data;
    boost::optional<error::data_fetch_error> first_failure;

    collect_fetch_result(pending_leaves,
        error::data_fetch_error::source::STATE_TREE_LEAVES,
        fetched_data.state_tree_leaves,
        first_failure);
    collect_fetch_result(pending_asp_data,
        error::data_fetch_error::source::ASP_DATA,
        fetched_data.asp_data,
        first_failure);
    collect_fetch_result(pending_scope,
        error::data_fetch_error::source::POOL_SCOPE,
        fetched_data.pool_scope,
        first_failure);

    // 3. all or nothing
    if (first_failure)
        throw *first_failure;

    return fetched_data;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace pp
