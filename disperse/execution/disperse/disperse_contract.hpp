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

#include <evmc/evmc.h>

#include <cstdint>
#include <span>
#include <utility>

DISPERSE_NAMESPACE_BEGIN

class Host;
class State;

inline constexpr Address DISPERSE_CA = Address{0x1100};

// clang-format off
// Morally, this precompile is equivalent to the following Solidity contract:
//
// contract Disperse {
//   function sendNative(address[] recipients, uint256[] amounts)
//       external payable {
//     require(recipients.length == amounts.length);
//     for (uint256 i = 0; i < recipients.length; i++) {
//       (bool ok, ) = recipients[i].call{value: amounts[i]}("");
//       require(ok);
//     }
//     uint256 balance = address(this).balance;
//     if (balance > 0) {
//       (bool ok, ) = msg.sender.call{value: balance}("");
//       require(ok);
//     }
//   }
//
//   function sendToken(IERC20 token, address[] recipients, uint256[] amounts)
//       external {
//     require(recipients.length == amounts.length);
//     for (uint256 i = 0; i < recipients.length; i++) {
//       token.safeTransferFrom(msg.sender, recipients[i], amounts[i]);
//     }
//   }
//
//   function rescueToken(IERC20 token) external {
//     token.safeTransfer(msg.sender, token.balanceOf(address(this)));
//   }
//
//   function rescueNative() external returns (bool ok) {
//     (ok, ) = msg.sender.call{value: address(this).balance}("");
//   }
// }
//
// A failed leg reverts the whole call; the host undoes every earlier leg.
// Every method is also guarded as `nonReentrant`.
// clang-format on
class DisperseContract
{
    Host &host_;
    State &state_;
    int64_t gas_left_;
    int32_t const depth_;

    Result<void> charge(uint64_t cost);

    // Value call from the contract, forwarding all but 1/64 of the gas.
    bool push_native(Address const &to, uint256_t const &amount);

public:
    // `gas` is what remains of the message after the method cost.
    DisperseContract(Host &, int64_t gas, int32_t depth);

    int64_t gas_left() const noexcept
    {
        return gas_left_;
    }

    // Marks the contract as executing for the duration of one call. A
    // recipient or token the contract calls out to cannot call back in
    // until `exit()`.
    Result<void> enter();
    void exit();

    Result<void> send_native(
        Address const &caller, std::span<Address const> recipients,
        std::span<uint256_t const> amounts);

    Result<void> send_token(
        Address const &caller, Address const &token,
        std::span<Address const> recipients,
        std::span<uint256_t const> amounts);

    Result<void> rescue_token(Address const &caller, Address const &token);

    // Best effort. Fails with `RescueNativeFailed` when the push is
    // rejected, in which case the balance stays with the contract.
    Result<void> rescue_native(Address const &caller);

    using PrecompileFunc = Result<byte_string> (DisperseContract::*)(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    //
    // Precompile methods
    //
    static std::pair<PrecompileFunc, uint64_t>
    precompile_dispatch(byte_string_view &);

    Result<byte_string> precompile_send_native(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    Result<byte_string> precompile_send_token(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    Result<byte_string> precompile_rescue_token(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    Result<byte_string> precompile_rescue_native(
        byte_string_view, evmc_address const &, evmc_uint256be const &);

    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_uint256be const &);
};

DISPERSE_NAMESPACE_END
