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

// Interfaces for the account abstraction layer that submits withdrawals.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_crypto/keccak.h"
#include "withdrawal_types.h"

//third party headers

//standard headers
#include <memory>
#include <string>

//forward declarations


namespace pp
{

////
// WithdrawalAccount
// - handle to the smart account that submits a withdrawal operation
///
class WithdrawalAccount
{
public:
//destructor
    virtual ~WithdrawalAccount() = default;

//overloaded operators
    /// disable copy/move (this is a virtual base class)
    WithdrawalAccount& operator=(WithdrawalAccount&&) = delete;

//member functions
    /// the account's address (sender of its operations)
    virtual const Address& address() const = 0;
    /// the entry point version the account's operations target
    virtual EntryPointVersion entry_point_version() const = 0;
};

////
// WithdrawalAccountLayer
// - constructs, prepares and submits withdrawal operations
///
class WithdrawalAccountLayer
{
public:
//destructor
    virtual ~WithdrawalAccountLayer() = default;

//overloaded operators
    /// disable copy/move (this is a virtual base class)
    WithdrawalAccountLayer& operator=(WithdrawalAccountLayer&&) = delete;

//member functions
    /// acquire or construct the account that will submit the withdrawal
    virtual std::shared_ptr<const WithdrawalAccount> create_withdrawal_account() = 0;
    /// make an unsigned operation for the account that calls the entrypoint with 'call_data'
    virtual WithdrawalOperationVariant prepare_withdrawal_operation(const WithdrawalAccount &account,
        const bytes_t &call_data) = 0;
    /// sign and submit an operation; returns the transaction id
    virtual std::string execute_withdrawal_operation(const WithdrawalAccount &account,
        const WithdrawalOperationVariant &operation) = 0;
};

} //namespace pp
