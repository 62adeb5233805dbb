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

// NOT FOR PRODUCTION

//paired header
#include "mock_pool_ledger.h"

//local headers
#include "misc_log_ex.h"
#include "pp_core/abi_encoding.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "pp_main/withdrawal_types.h"
#include "span.h"

//third party headers
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <stdexcept>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_mocks"

namespace pp
{
namespace mocks
{
//-------------------------------------------------------------------------------------------------------------------
scalar_t mock_set_root(const std::vector<scalar_t> &values)
{
    if (values.empty())
        return 0;

    bytes_t transcript;
    transcript.reserve(values.size()*ABI_WORD_SIZE);
    for (const scalar_t &value : values)
        append_abi_uint256(value, transcript);

    return hash_to_field(epee::to_span(transcript));
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t mock_tree_depth(const std::size_t num_leaves)
{
    std::uint64_t depth{0};
    while ((std::size_t{1} << depth) < num_leaves)
        ++depth;
    return depth;
}
//-------------------------------------------------------------------------------------------------------------------
MockPoolLedger::MockPoolLedger(const scalar_t &pool_scope) :
    m_pool_scope{pool_scope}
{
    CHECK_AND_ASSERT_THROW_MES(is_in_scalar_field(m_pool_scope),
        "mock pool ledger: pool scope is not a field element.");
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockPoolLedger::add_commitment(const scalar_t &commitment)
{
    CHECK_AND_ASSERT_THROW_MES(is_in_scalar_field(commitment),
        "mock pool ledger (add commitment): commitment is not a field element.");

    boost::unique_lock<boost::shared_mutex> lock{m_ledger_mutex};
    m_state_tree_commitments.emplace_back(commitment);
    return m_state_tree_commitments.size() - 1;
}
//-------------------------------------------------------------------------------------------------------------------
void MockPoolLedger::approve_label(const scalar_t &label)
{
    CHECK_AND_ASSERT_THROW_MES(is_in_scalar_field(label),
        "mock pool ledger (approve label): label is not a field element.");

    boost::unique_lock<boost::shared_mutex> lock{m_ledger_mutex};
    m_approved_labels.emplace_back(label);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<StateTreeLeafV1> MockPoolLedger::state_tree_leaves() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_ledger_mutex};

    std::vector<StateTreeLeafV1> leaves;
    leaves.reserve(m_state_tree_commitments.size());
    for (std::size_t leaf_index{0}; leaf_index < m_state_tree_commitments.size(); ++leaf_index)
    {
        leaves.emplace_back(
                StateTreeLeafV1{static_cast<std::uint64_t>(leaf_index), m_state_tree_commitments[leaf_index]}
            );
    }

    return leaves;
}
//-------------------------------------------------------------------------------------------------------------------
AspDataV1 MockPoolLedger::asp_data() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_ledger_mutex};

    AspDataV1 asp_data;
    asp_data.approved_labels = m_approved_labels;
    asp_data.asp_root = mock_set_root(m_approved_labels);

    return asp_data;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<StateTreeLeafV1> MockWithdrawalDataSource::fetch_state_tree_leaves() const
{
    ++m_num_state_tree_fetches;
    if (m_failure == Failure::STATE_TREE_LEAVES)
        throw std::runtime_error("mock indexer: state tree leaves unavailable");

    return m_ledger.state_tree_leaves();
}
//-------------------------------------------------------------------------------------------------------------------
AspDataV1 MockWithdrawalDataSource::fetch_asp_data() const
{
    ++m_num_asp_data_fetches;
    if (m_failure == Failure::ASP_DATA)
        throw std::runtime_error("mock indexer: ASP data unavailable");

    return m_ledger.asp_data();
}
//-------------------------------------------------------------------------------------------------------------------
scalar_t MockWithdrawalDataSource::fetch_pool_scope() const
{
    ++m_num_pool_scope_fetches;
    if (m_failure == Failure::POOL_SCOPE)
        throw std::runtime_error("mock pool contract: scope unavailable");

    return m_ledger.pool_scope();
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace pp
