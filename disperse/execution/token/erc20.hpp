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

#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/execution/code.hpp>
#include <disperse/execution/core/address.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>

DISPERSE_NAMESPACE_BEGIN

class Host;
class State;

inline constexpr uint32_t ERC20_BALANCE_OF_SELECTOR = 0x70a08231;
inline constexpr uint32_t ERC20_ALLOWANCE_SELECTOR = 0xdd62ed3e;
inline constexpr uint32_t ERC20_APPROVE_SELECTOR = 0x095ea7b3;
inline constexpr uint32_t ERC20_TRANSFER_SELECTOR = 0xa9059cbb;
inline constexpr uint32_t ERC20_TRANSFER_FROM_SELECTOR = 0x23b872dd;

// clang-format off
// A fungible token bound to the address it is installed at. Morally
// equivalent to:
//
// contract Erc20 {
//   mapping(address => uint256) balanceOf;                      // slot 0
//   mapping(address => mapping(address => uint256)) allowance;  // slot 1
//   uint256 totalSupply;                                        // slot 2
//
//   function approve(address spender, uint256 amount) returns (bool);
//   function transfer(address to, uint256 amount) returns (bool);
//   function transferFrom(address from, address to, uint256 amount)
//       returns (bool);
// }
//
// An allowance of type(uint256).max is never decreased.
// clang-format on
class Erc20 final : public Code
{
public:
    evmc::Result execute(Host &, evmc_message const &) override;

    // Host-side issuance. Not reachable through messages.
    static void mint(
        State &, Address const &token, Address const &to,
        uint256_t const &amount);

    static uint256_t
    balance_of(State &, Address const &token, Address const &account);

    static uint256_t allowance(
        State &, Address const &token, Address const &owner,
        Address const &spender);

    static uint256_t total_supply(State &, Address const &token);
};

DISPERSE_NAMESPACE_END
