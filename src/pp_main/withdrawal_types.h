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

// Types used to prepare and execute a privacy pool withdrawal.

#pragma once

//local headers
#include "pp_core/address_utils.h"
#include "pp_core/amount_utils.h"
#include "pp_crypto/field_utils.h"
#include "pp_crypto/keccak.h"
#include "wipeable_string.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/variant.hpp>

//standard headers
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

//forward declarations
namespace pp
{
    class WithdrawalAccount;
}


namespace pp
{

////
// PoolNoteV1
// - a previously discovered, unspent note in the pool
// - commitment and label are scalar strings (decimal or 0x-hex) as reported by the indexer
// - amount is a decimal string in whole native asset units (e.g. "1.5")
///
struct PoolNoteV1 final
{
    std::string commitment;
    std::string amount;
    std::string label;
    /// derivation index the note was created at
    std::uint64_t note_index;
};

/// a mnemonic phrase or a pre-split word list
using mnemonic_words_t = std::vector<epee::wipeable_string>;
using MnemonicVariant = boost::variant<epee::wipeable_string, mnemonic_words_t>;

////
// AccountCredentialV1
// - the account key, or a mnemonic the key can be restored from
// - empty strings and empty word lists are treated as absent
///
struct AccountCredentialV1 final
{
    boost::optional<epee::wipeable_string> private_key;
    boost::optional<MnemonicVariant> mnemonic;
};

////
// WithdrawalRequestV1
// - one withdrawal attempt; consumed once
///
struct WithdrawalRequestV1 final
{
    /// the note being spent
    PoolNoteV1 note;
    /// decimal amount to withdraw (in whole native asset units)
    std::string withdraw_amount;
    /// destination of the withdrawn funds
    std::string recipient_address;
    /// account credential
    AccountCredentialV1 credential;
};

/// state tree leaf (the pool's commitment tree)
struct StateTreeLeafV1 final
{
    std::uint64_t leaf_index;
    scalar_t leaf_value;
};

/// association set provider data
struct AspDataV1 final
{
    /// labels approved by the ASP, in tree order
    std::vector<scalar_t> approved_labels;
    scalar_t asp_root;
};

/// everything the proof is anchored to
struct FetchedWithdrawalDataV1 final
{
    std::vector<StateTreeLeafV1> state_tree_leaves;
    AspDataV1 asp_data;
    scalar_t pool_scope;
};

////
// WithdrawalDataV1
// - the on-chain withdrawal struct: the processor that may consume the proof, and its opaque payload
///
struct WithdrawalDataV1 final
{
    Address processor;
    bytes_t data;
};

////
// WithdrawalContextV1
// - fetched data plus the values derived for one withdrawal request
// - 'context' binds recipient, fee and scope; it is computed per request and never reused
// - 'next_note_index' is reserved from the index tracker exactly once per request
///
struct WithdrawalContextV1 final
{
    FetchedWithdrawalDataV1 fetched_data;
    WithdrawalDataV1 withdrawal_data;

    /// keccak256(abi.encode(withdrawal_data, pool_scope)) mod SNARK_SCALAR_FIELD
    scalar_t context;

    /// new note (change output)
    scalar_t new_nullifier;
    scalar_t new_secret;
    /// note being spent
    scalar_t existing_nullifier;
    scalar_t existing_secret;

    std::uint64_t next_note_index;
};

/// inputs of the withdraw circuit
struct WithdrawalProofInputsV1 final
{
    scalar_t existing_commitment;
    amount_t existing_value;
    scalar_t existing_nullifier;
    scalar_t existing_secret;
    amount_t withdrawn_value;
    scalar_t context;
    scalar_t label;
    scalar_t new_nullifier;
    scalar_t new_secret;
    /// ordered state tree leaf values
    std::vector<scalar_t> state_tree_commitments;
    /// approved labels
    std::vector<scalar_t> asp_tree_labels;
};

////
// WithdrawalProofV1
// - a Groth16 proof in prover (snarkjs) layout, including the projective coordinate
///
struct WithdrawalProofV1 final
{
    std::array<scalar_t, 3> pi_a;
    std::array<std::array<scalar_t, 2>, 3> pi_b;
    std::array<scalar_t, 3> pi_c;
    std::vector<scalar_t> public_signals;
};

////
// FormattedWithdrawProofV1
// - a proof in the layout of the on-chain verifier
// - pB has its Fq2 coordinates swapped relative to the prover layout
///
struct FormattedWithdrawProofV1 final
{
    std::array<scalar_t, 2> p_a;
    std::array<std::array<scalar_t, 2>, 2> p_b;
    std::array<scalar_t, 2> p_c;
    std::array<scalar_t, 8> pub_signals;
};

/// ERC-4337 entry point versions
enum class EntryPointVersion : unsigned char
{
    V06,
    V07
};

////
// UserOperationV06
// - unsigned user operation for entry point v0.6
///
struct UserOperationV06 final
{
    Address sender;
    scalar_t nonce;
    bytes_t init_code;
    bytes_t call_data;
    scalar_t call_gas_limit;
    scalar_t verification_gas_limit;
    scalar_t pre_verification_gas;
    scalar_t max_fee_per_gas;
    scalar_t max_priority_fee_per_gas;
    bytes_t paymaster_and_data;
    bytes_t signature;
};

////
// UserOperationV07
// - unsigned user operation for entry point v0.7 (unpacked form)
///
struct UserOperationV07 final
{
    Address sender;
    scalar_t nonce;
    boost::optional<Address> factory;
    bytes_t factory_data;
    bytes_t call_data;
    scalar_t call_gas_limit;
    scalar_t verification_gas_limit;
    scalar_t pre_verification_gas;
    scalar_t max_fee_per_gas;
    scalar_t max_priority_fee_per_gas;
    boost::optional<Address> paymaster;
    scalar_t paymaster_verification_gas_limit;
    scalar_t paymaster_post_op_gas_limit;
    bytes_t paymaster_data;
    bytes_t signature;
};

/// an unsigned withdrawal operation
using WithdrawalOperationVariant = boost::variant<UserOperationV06, UserOperationV07>;

/// operation accessors
const bytes_t& call_data_ref(const WithdrawalOperationVariant &operation);
const Address& sender_ref(const WithdrawalOperationVariant &operation);
EntryPointVersion entry_point_version(const WithdrawalOperationVariant &operation);

////
// PreparedWithdrawalV1
// - the terminal artifact of withdrawal preparation; ready for explicit execution
///
struct PreparedWithdrawalV1 final
{
    WithdrawalContextV1 context;
    WithdrawalProofV1 proof;
    /// encoded entrypoint relay call carried by the operation
    bytes_t relay_call_data;
    WithdrawalOperationVariant operation;
    /// the account that will submit the operation
    std::shared_ptr<const WithdrawalAccount> account;
};

} //namespace pp
