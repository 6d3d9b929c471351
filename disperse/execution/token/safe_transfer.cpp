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

#include <disperse/core/byte_string.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/core/likely.h>
#include <disperse/core/result.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_decode.hpp>
#include <disperse/execution/core/contract/abi_encode.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/token/erc20.hpp>
#include <disperse/execution/token/safe_transfer.hpp>
#include <disperse/execution/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>

DISPERSE_NAMESPACE_BEGIN

SafeErc20::SafeErc20(
    Host &host, Address const &token, Address const &caller,
    int32_t const depth)
    : host_{host}
    , token_{token}
    , caller_{caller}
    , depth_{depth}
{
}

Result<byte_string>
SafeErc20::call(byte_string_view const input, int64_t &gas_left)
{
    if (DISPERSE_UNLIKELY(!host_.has_code(token_))) {
        return TokenError::NoCode;
    }

    int64_t const gas = max_call_gas(gas_left);

    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.depth = depth_ + 1;
    msg.gas = gas;
    msg.recipient = token_;
    msg.sender = caller_;
    msg.input_data = input.data();
    msg.input_size = input.size();
    msg.code_address = token_;

    evmc::Result const result = host_.call(msg);
    gas_left -= gas - result.gas_left;
    if (DISPERSE_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        return TokenError::CallFailed;
    }
    return byte_string{result.output_data, result.output_size};
}

Result<void>
SafeErc20::call_returning_bool(byte_string_view const input, int64_t &gas_left)
{
    BOOST_OUTCOME_TRY(auto const output, call(input, gas_left));
    if (output.empty()) {
        return outcome::success();
    }

    byte_string_view view{output};
    auto const ok = abi_decode_fixed<bool>(view);
    if (DISPERSE_UNLIKELY(ok.has_error())) {
        return TokenError::MalformedReturn;
    }
    if (DISPERSE_UNLIKELY(!ok.value())) {
        return TokenError::ReturnedFalse;
    }
    return outcome::success();
}

Result<void> SafeErc20::transfer(
    Address const &to, uint256_t const &amount, int64_t &gas_left)
{
    auto const input = abi_encode_call(
        ERC20_TRANSFER_SELECTOR,
        AbiEncoder{}.add_address(to).add_uint(amount).encode_final());
    return call_returning_bool(input, gas_left);
}

Result<void> SafeErc20::transfer_from(
    Address const &from, Address const &to, uint256_t const &amount,
    int64_t &gas_left)
{
    auto const input = abi_encode_call(
        ERC20_TRANSFER_FROM_SELECTOR,
        AbiEncoder{}
            .add_address(from)
            .add_address(to)
            .add_uint(amount)
            .encode_final());
    return call_returning_bool(input, gas_left);
}

Result<uint256_t>
SafeErc20::balance_of(Address const &account, int64_t &gas_left)
{
    auto const input = abi_encode_call(
        ERC20_BALANCE_OF_SELECTOR,
        AbiEncoder{}.add_address(account).encode_final());
    BOOST_OUTCOME_TRY(auto const output, call(input, gas_left));

    byte_string_view view{output};
    auto const balance = abi_decode_fixed<uint256_t>(view);
    if (DISPERSE_UNLIKELY(balance.has_error())) {
        return TokenError::MalformedReturn;
    }
    return balance.value();
}

DISPERSE_NAMESPACE_END
