// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <disperse/core/byte_string.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/core/result.hpp>
#include <disperse/execution/core/address.hpp>

#include <cstdint>

DISPERSE_NAMESPACE_BEGIN

class Host;

/**
 * Calls an ERC-20 token on behalf of a native contract.
 *
 * A transfer counts as successful when the token call succeeds and either
 * returns nothing or returns an ABI encoded `true`. A revert, a `false`
 * return, return data that does not decode as a bool, or a token address
 * without code are failures.
 *
 * Each call forwards `max_call_gas` of the budget passed in and deducts what
 * the token consumed from it.
 */
class SafeErc20
{
    Host &host_;
    Address const token_;
    Address const caller_;
    int32_t const depth_;

    Result<byte_string> call(byte_string_view input, int64_t &gas_left);

    Result<void> call_returning_bool(byte_string_view input, int64_t &gas_left);

public:
    // `depth` is the depth of the message the caller is executing.
    SafeErc20(
        Host &, Address const &token, Address const &caller, int32_t depth);

    Result<void>
    transfer(Address const &to, uint256_t const &amount, int64_t &gas_left);

    Result<void> transfer_from(
        Address const &from, Address const &to, uint256_t const &amount,
        int64_t &gas_left);

    Result<uint256_t> balance_of(Address const &account, int64_t &gas_left);
};

DISPERSE_NAMESPACE_END
