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

// Exceptions thrown by the withdrawal pipeline.

#pragma once

//local headers
#include "misc_log_ex.h"

//third party headers

//standard headers
#include <stdexcept>
#include <string>

//forward declarations


namespace pp
{
namespace error
{

// withdrawal_error
//   validation_error
//     invalid_note_error
//     invalid_amount_error
//     invalid_recipient_error
//     missing_credential_error
//   data_fetch_error
//   index_tracker_error
//   proof_generation_error
//   encoding_error
//   account_setup_error
//   execution_error

struct withdrawal_error : public std::runtime_error
{
    explicit withdrawal_error(const std::string &message) : std::runtime_error{message} {}
};
//-------------------------------------------------------------------------------------------------------------------
struct validation_error : public withdrawal_error
{
    explicit validation_error(const std::string &message) : withdrawal_error{message} {}
};

struct invalid_note_error : public validation_error
{
    explicit invalid_note_error(const std::string &message) : validation_error{message} {}
};

struct invalid_amount_error : public validation_error
{
    explicit invalid_amount_error(const std::string &message) : validation_error{message} {}
};

struct invalid_recipient_error : public validation_error
{
    explicit invalid_recipient_error(const std::string &message) : validation_error{message} {}
};

struct missing_credential_error : public validation_error
{
    explicit missing_credential_error(const std::string &message) : validation_error{message} {}
};
//-------------------------------------------------------------------------------------------------------------------
struct data_fetch_error : public withdrawal_error
{
    enum class source : unsigned char
    {
        STATE_TREE_LEAVES,
        ASP_DATA,
        POOL_SCOPE
    };

    data_fetch_error(const source failed_source, const std::string &message);

    /// the data source whose call failed
    source failed_source() const { return m_failed_source; }

private:
    source m_failed_source;
};

/// human-readable name of a data source
const char* data_source_name(const data_fetch_error::source data_source);
//-------------------------------------------------------------------------------------------------------------------
struct index_tracker_error : public withdrawal_error
{
    explicit index_tracker_error(const std::string &message) : withdrawal_error{message} {}
};
//-------------------------------------------------------------------------------------------------------------------
struct proof_generation_error : public withdrawal_error
{
    enum class kind : unsigned char
    {
        /// the witness does not satisfy the circuit (e.g. commitment not in the state tree, label not approved)
        INVALID_WITNESS,
        /// the prover itself failed or returned a malformed proof
        PROVER_FAILURE
    };

    proof_generation_error(const kind failure_kind, const std::string &message);

    kind failure_kind() const { return m_failure_kind; }

private:
    kind m_failure_kind;
};
//-------------------------------------------------------------------------------------------------------------------
struct encoding_error : public withdrawal_error
{
    explicit encoding_error(const std::string &message) : withdrawal_error{message} {}
};

struct account_setup_error : public withdrawal_error
{
    explicit account_setup_error(const std::string &message) : withdrawal_error{message} {}
};

struct execution_error : public withdrawal_error
{
    explicit execution_error(const std::string &message) : withdrawal_error{message} {}
};
//-------------------------------------------------------------------------------------------------------------------
} //namespace error
} //namespace pp

#define THROW_WITHDRAWAL_EXCEPTION(err_type, ...)                                         \
  do {                                                                                    \
    LOG_ERROR("THROW EXCEPTION: " << #err_type);                                          \
    throw err_type(__VA_ARGS__);                                                          \
  } while(0)

#define THROW_WITHDRAWAL_EXCEPTION_IF(cond, err_type, ...)                                \
  if (cond)                                                                               \
  {                                                                                       \
    LOG_ERROR(#cond << ". THROW EXCEPTION: " << #err_type);                               \
    throw err_type(__VA_ARGS__);                                                          \
  }
