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
#include "mock_account_layer.h"

//local headers
#include "hex.h"
#include "misc_log_ex.h"
#include "pp_core/abi_encoding.h"
#include "pp_core/address_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "pp_main/withdrawal_types.h"
#include "span.h"

//third party headers

//standard headers
#include <memory>
#include <stdexcept>
#include <string>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "pp_mocks"

namespace pp
{
namespace mocks
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static UserOperationV06 make_mock_user_operation_v06(const Address &sender,
    const std::size_t nonce,
    const bytes_t &call_data)
{
    UserOperationV06 operation;
    operation.sender                   = sender;
    operation.nonce                    = nonce;
    operation.call_data                = call_data;
    operation.call_gas_limit           = 500000;
    operation.verification_gas_limit   = 200000;
    operation.pre_verification_gas     = 50000;
    operation.max_fee_per_gas          = 2000000000;
    operation.max_priority_fee_per_gas = 1000000000;

    return operation;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static UserOperationV07 make_mock_user_operation_v07(const Address &sender,
    const std::size_t nonce,
    const bytes_t &call_data)
{
    UserOperationV07 operation;
    operation.sender                           = sender;
    operation.nonce                            = nonce;
    operation.call_data                        = call_data;
    operation.call_gas_limit                   = 500000;
    operation.verification_gas_limit           = 200000;
    operation.pre_verification_gas             = 50000;
    operation.max_fee_per_gas                  = 2000000000;
    operation.max_priority_fee_per_gas         = 1000000000;
    operation.paymaster_verification_gas_limit = 100000;
    operation.paymaster_post_op_gas_limit      = 50000;

    return operation;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
MockWithdrawalAccountLayer::MockWithdrawalAccountLayer(const Address &account_address,
    const EntryPointVersion version) :
        m_account{std::make_shared<const MockWithdrawalAccount>(account_address, version)}
{}
//-------------------------------------------------------------------------------------------------------------------
std::shared_ptr<const WithdrawalAccount> MockWithdrawalAccountLayer::create_withdrawal_account()
{
    if (m_fail_account_creation)
        throw std::runtime_error("mock account layer: smart account deployment failed");

    ++m_num_accounts_created;
    return m_account;
}
//-------------------------------------------------------------------------------------------------------------------
WithdrawalOperationVariant MockWithdrawalAccountLayer::prepare_withdrawal_operation(const WithdrawalAccount &account,
    const bytes_t &call_data)
{
    const std::size_t nonce{m_num_operations_prepared++};

    if (account.entry_point_version() == EntryPointVersion::V06)
        return make_mock_user_operation_v06(account.address(), nonce, call_data);
    return make_mock_user_operation_v07(account.address(), nonce, call_data);
}
//-------------------------------------------------------------------------------------------------------------------
std::string MockWithdrawalAccountLayer::execute_withdrawal_operation(const WithdrawalAccount &account,
    const WithdrawalOperationVariant &operation)
{
    if (m_fail_execution)
        throw std::runtime_error("mock bundler: user operation rejected");

    CHECK_AND_ASSERT_THROW_MES(sender_ref(operation) == account.address(),
        "mock account layer (execute): operation sender does not match the account.");

    // tx id = keccak256(sender || nonce || call data)
    const bytes_t &call_data{call_data_ref(operation)};
    const scalar_t nonce{
            entry_point_version(operation) == EntryPointVersion::V06
            ? boost::get<UserOperationV06>(operation).nonce
            : boost::get<UserOperationV07>(operation).nonce
        };

    bytes_t transcript;
    transcript.insert(transcript.end(), account.address().bytes.begin(), account.address().bytes.end());
    append_abi_uint256(nonce, transcript);
    transcript.insert(transcript.end(), call_data.begin(), call_data.end());

    m_executed_operations.emplace_back(operation);

    return "0x" + epee::to_hex::string(epee::to_span(keccak256(epee::to_span(transcript))));
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace pp
