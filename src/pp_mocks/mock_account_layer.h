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

// Mock account abstraction layer (smart account + bundler).

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_crypto/keccak.h"
#include "pp_main/withdrawal_account_layer.h"
#include "pp_main/withdrawal_types.h"

//third party headers

//standard headers
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

//forward declarations


namespace pp
{
namespace mocks
{

/// smart account handle
class MockWithdrawalAccount final : public WithdrawalAccount
{
public:
//constructors
    MockWithdrawalAccount(const Address &address, const EntryPointVersion version) :
        m_address{address},
        m_entry_point_version{version}
    {}

//member functions
    const Address& address() const override { return m_address; }
    EntryPointVersion entry_point_version() const override { return m_entry_point_version; }

private:
//member variables
    const Address m_address;
    const EntryPointVersion m_entry_point_version;
};

////
// MockWithdrawalAccountLayer
// - hands out one account; operations call the entrypoint directly with the relay call data
// - transaction id = 0x + hex(keccak256(sender || nonce || call data))
///
class MockWithdrawalAccountLayer final : public WithdrawalAccountLayer
{
public:
//constructors
    MockWithdrawalAccountLayer(const Address &account_address, const EntryPointVersion version);

//member functions
    std::shared_ptr<const WithdrawalAccount> create_withdrawal_account() override;
    WithdrawalOperationVariant prepare_withdrawal_operation(const WithdrawalAccount &account,
        const bytes_t &call_data) override;
    std::string execute_withdrawal_operation(const WithdrawalAccount &account,
        const WithdrawalOperationVariant &operation) override;

    /// failure injection
    void set_fail_account_creation(const bool fail) { m_fail_account_creation = fail; }
    void set_fail_execution(const bool fail) { m_fail_execution = fail; }

    std::size_t num_accounts_created() const { return m_num_accounts_created; }
    std::size_t num_operations_prepared() const { return m_num_operations_prepared; }
    /// operations submitted so far
    const std::vector<WithdrawalOperationVariant>& executed_operations() const { return m_executed_operations; }

private:
//member variables
    const std::shared_ptr<const MockWithdrawalAccount> m_account;

    bool m_fail_account_creation{false};
    bool m_fail_execution{false};

    std::size_t m_num_accounts_created{0};
    std::size_t m_num_operations_prepared{0};
    std::vector<WithdrawalOperationVariant> m_executed_operations;
};

} //namespace mocks
} //namespace pp
