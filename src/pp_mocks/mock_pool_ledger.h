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

// Mock pool ledger and indexer.
// WARNING: roots are plain hashes of the tree contents, not merkle roots

#pragma once

//local headers
#include "pp_crypto/field_utils.h"
#include "pp_main/withdrawal_data_source.h"
#include "pp_main/withdrawal_types.h"

//third party headers
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

//forward declarations


namespace pp
{
namespace mocks
{

/// mock root of an ordered set of scalars: keccak256(uint256 values...) mod p, or 0 for an empty set
scalar_t mock_set_root(const std::vector<scalar_t> &values);
/// depth of a binary tree with 'num_leaves' leaves
std::uint64_t mock_tree_depth(const std::size_t num_leaves);

////
// MockPoolLedger
// - the pool's state tree (deposit commitments) and the ASP's approved labels
// - thread-safe
///
class MockPoolLedger final
{
public:
//constructors
    explicit MockPoolLedger(const scalar_t &pool_scope);

//member functions
    /// append a commitment to the state tree; returns its leaf index
    std::uint64_t add_commitment(const scalar_t &commitment);
    /// add a label to the ASP's approved set
    void approve_label(const scalar_t &label);

    std::vector<StateTreeLeafV1> state_tree_leaves() const;
    AspDataV1 asp_data() const;
    const scalar_t& pool_scope() const { return m_pool_scope; }

private:
//member variables
    mutable boost::shared_mutex m_ledger_mutex;

    const scalar_t m_pool_scope;
    std::vector<scalar_t> m_state_tree_commitments;
    std::vector<scalar_t> m_approved_labels;
};

////
// MockWithdrawalDataSource
// - serves a mock pool ledger; one of its calls can be made to fail
///
class MockWithdrawalDataSource final : public WithdrawalDataSource
{
public:
    enum class Failure : unsigned char
    {
        NONE,
        STATE_TREE_LEAVES,
        ASP_DATA,
        POOL_SCOPE
    };

//constructors
    explicit MockWithdrawalDataSource(const MockPoolLedger &ledger) : m_ledger{ledger} {}

//member functions
    std::vector<StateTreeLeafV1> fetch_state_tree_leaves() const override;
    AspDataV1 fetch_asp_data() const override;
    scalar_t fetch_pool_scope() const override;

    /// make a fetch call throw
    void set_failure(const Failure failure) { m_failure = failure; }

    /// number of calls of each kind so far
    std::size_t num_state_tree_fetches() const { return m_num_state_tree_fetches; }
    std::size_t num_asp_data_fetches() const { return m_num_asp_data_fetches; }
    std::size_t num_pool_scope_fetches() const { return m_num_pool_scope_fetches; }

private:
//member variables
    const MockPoolLedger &m_ledger;
    std::atomic<Failure> m_failure{Failure::NONE};

    mutable std::atomic<std::size_t> m_num_state_tree_fetches{0};
    mutable std::atomic<std::size_t> m_num_asp_data_fetches{0};
    mutable std::atomic<std::size_t> m_num_pool_scope_fetches{0};
};

} //namespace mocks
} //namespace pp
