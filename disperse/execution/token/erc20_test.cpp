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
#include <disperse/core/int.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_encode.hpp>
#include <disperse/execution/core/contract/abi_signatures.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/state/state.hpp>
#include <disperse/execution/test/test_contracts.hpp>
#include <disperse/execution/token/erc20.hpp>
#include <disperse/execution/token/safe_transfer.hpp>
#include <disperse/execution/token/token_error.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <string_view>

using namespace disperse;
using namespace evmc::literals;

namespace
{
    constexpr auto token = 0x00000000000000000000000000000000000070ce_address;
    constexpr auto alice = 0x00000000000000000000000000000000000a11ce_address;
    constexpr auto bob = 0x0000000000000000000000000000000000000b0b_address;
    constexpr auto carol = 0x00000000000000000000000000000000000ca201_address;

    std::string_view revert_message(evmc::Result const &result)
    {
        return {
            reinterpret_cast<char const *>(result.output_data),
            result.output_size};
    }
}

TEST(Erc20Selectors, match_signatures)
{
    EXPECT_EQ(
        abi_encode_selector("balanceOf(address)"), ERC20_BALANCE_OF_SELECTOR);
    EXPECT_EQ(
        abi_encode_selector("allowance(address,address)"),
        ERC20_ALLOWANCE_SELECTOR);
    EXPECT_EQ(
        abi_encode_selector("approve(address,uint256)"),
        ERC20_APPROVE_SELECTOR);
    EXPECT_EQ(
        abi_encode_selector("transfer(address,uint256)"),
        ERC20_TRANSFER_SELECTOR);
    EXPECT_EQ(
        abi_encode_selector("transferFrom(address,address,uint256)"),
        ERC20_TRANSFER_FROM_SELECTOR);
}

struct Erc20Test : public ::testing::Test
{
    State state;
    Host host{state};

    void SetUp() override
    {
        host.set_code(token, std::make_shared<Erc20>());
        Erc20::mint(state, token, alice, 1'000);
    }

    evmc::Result call(
        Address const &sender, byte_string const &input,
        int64_t const gas = 100'000)
    {
        return host.call(evmc_message{
            .gas = gas,
            .recipient = token,
            .sender = sender,
            .input_data = input.data(),
            .input_size = input.size(),
            .code_address = token,
        });
    }
};

TEST_F(Erc20Test, mint)
{
    EXPECT_EQ(Erc20::balance_of(state, token, alice), 1'000);
    EXPECT_EQ(Erc20::total_supply(state, token), 1'000);
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].address, token);
    EXPECT_EQ(state.logs()[0].topics[1], abi_encode_address(Address{}));
}

TEST_F(Erc20Test, balance_of)
{
    auto const result = call(
        bob,
        abi_encode_call(
            ERC20_BALANCE_OF_SELECTOR,
            AbiEncoder{}.add_address(alice).encode_final()));
    ASSERT_EQ(result.status_code, EVMC_SUCCESS);
    ASSERT_EQ(result.output_size, 32);
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(result.output_data), 1'000);
}

TEST_F(Erc20Test, transfer)
{
    auto const result = call(
        alice,
        abi_encode_call(
            ERC20_TRANSFER_SELECTOR,
            AbiEncoder{}.add_address(bob).add_uint(300).encode_final()));
    ASSERT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(result.gas_left, 100'000 - 35'000);
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(result.output_data), 1);
    EXPECT_EQ(Erc20::balance_of(state, token, alice), 700);
    EXPECT_EQ(Erc20::balance_of(state, token, bob), 300);

    auto const &log = state.logs().back();
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(
        log.topics[0],
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);
    EXPECT_EQ(log.topics[1], abi_encode_address(alice));
    EXPECT_EQ(log.topics[2], abi_encode_address(bob));
    EXPECT_EQ(log.data, byte_string{to_byte_string_view(abi_encode_uint(300).bytes)});
}

TEST_F(Erc20Test, self_transfer)
{
    auto const result = call(
        alice,
        abi_encode_call(
            ERC20_TRANSFER_SELECTOR,
            AbiEncoder{}.add_address(alice).add_uint(1'000).encode_final()));
    ASSERT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(Erc20::balance_of(state, token, alice), 1'000);
}

TEST_F(Erc20Test, transfer_insufficient_balance)
{
    auto const result = call(
        bob,
        abi_encode_call(
            ERC20_TRANSFER_SELECTOR,
            AbiEncoder{}.add_address(alice).add_uint(1).encode_final()));
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(revert_message(result), "insufficient balance");
    EXPECT_EQ(Erc20::balance_of(state, token, alice), 1'000);
}

TEST_F(Erc20Test, approve_and_transfer_from)
{
    auto const approve = call(
        alice,
        abi_encode_call(
            ERC20_APPROVE_SELECTOR,
            AbiEncoder{}.add_address(bob).add_uint(500).encode_final()));
    ASSERT_EQ(approve.status_code, EVMC_SUCCESS);
    EXPECT_EQ(Erc20::allowance(state, token, alice, bob), 500);
    EXPECT_EQ(
        state.logs().back().topics[0],
        0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32);

    auto const input = abi_encode_call(
        ERC20_TRANSFER_FROM_SELECTOR,
        AbiEncoder{}
            .add_address(alice)
            .add_address(carol)
            .add_uint(200)
            .encode_final());
    auto const result = call(bob, input);
    ASSERT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(Erc20::allowance(state, token, alice, bob), 300);
    EXPECT_EQ(Erc20::balance_of(state, token, alice), 800);
    EXPECT_EQ(Erc20::balance_of(state, token, carol), 200);

    auto const allowance = call(
        carol,
        abi_encode_call(
            ERC20_ALLOWANCE_SELECTOR,
            AbiEncoder{}.add_address(alice).add_address(bob).encode_final()));
    ASSERT_EQ(allowance.status_code, EVMC_SUCCESS);
    EXPECT_EQ(intx::be::unsafe::load<uint256_t>(allowance.output_data), 300);
}

TEST_F(Erc20Test, transfer_from_insufficient_allowance)
{
    auto const result = call(
        bob,
        abi_encode_call(
            ERC20_TRANSFER_FROM_SELECTOR,
            AbiEncoder{}
                .add_address(alice)
                .add_address(bob)
                .add_uint(1)
                .encode_final()));
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(revert_message(result), "insufficient allowance");
    EXPECT_EQ(Erc20::balance_of(state, token, bob), 0);
}

TEST_F(Erc20Test, infinite_allowance_not_decreased)
{
    auto const max = std::numeric_limits<uint256_t>::max();
    ASSERT_EQ(
        call(
            alice,
            abi_encode_call(
                ERC20_APPROVE_SELECTOR,
                AbiEncoder{}.add_address(bob).add_uint(max).encode_final()))
            .status_code,
        EVMC_SUCCESS);

    auto const result = call(
        bob,
        abi_encode_call(
            ERC20_TRANSFER_FROM_SELECTOR,
            AbiEncoder{}
                .add_address(alice)
                .add_address(bob)
                .add_uint(10)
                .encode_final()));
    ASSERT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(Erc20::allowance(state, token, alice, bob), max);
}

TEST_F(Erc20Test, value_rejected)
{
    state.add_to_balance(alice, 1);
    auto const input = abi_encode_call(
        ERC20_BALANCE_OF_SELECTOR,
        AbiEncoder{}.add_address(alice).encode_final());
    auto const result = host.call(evmc_message{
        .gas = 100'000,
        .recipient = token,
        .sender = alice,
        .input_data = input.data(),
        .input_size = input.size(),
        .value = intx::be::store<evmc_uint256be>(uint256_t{1}),
        .code_address = token,
    });
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(revert_message(result), "value is nonzero");
    EXPECT_EQ(state.get_balance(alice), 1);
}

TEST_F(Erc20Test, unknown_selector)
{
    auto const result = call(alice, byte_string{0x01, 0x02, 0x03, 0x04});
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(revert_message(result), "method not supported");
}

TEST_F(Erc20Test, out_of_gas)
{
    auto const result = call(
        alice,
        abi_encode_call(
            ERC20_TRANSFER_SELECTOR,
            AbiEncoder{}.add_address(bob).add_uint(1).encode_final()),
        34'999);
    EXPECT_EQ(result.status_code, EVMC_OUT_OF_GAS);
    EXPECT_EQ(Erc20::balance_of(state, token, bob), 0);
}

struct SafeErc20Test : public Erc20Test
{
    int64_t gas{1'000'000};
};

TEST_F(SafeErc20Test, transfer_and_balance)
{
    SafeErc20 erc20{host, token, alice, 0};

    auto const res = erc20.transfer(bob, 250, gas);
    ASSERT_TRUE(res.has_value());
    EXPECT_LT(gas, 1'000'000);

    auto const balance = erc20.balance_of(bob, gas);
    ASSERT_TRUE(balance.has_value());
    EXPECT_EQ(balance.value(), 250);
}

TEST_F(SafeErc20Test, revert_is_failure)
{
    SafeErc20 erc20{host, token, bob, 0};
    auto const res = erc20.transfer(alice, 1, gas);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::CallFailed);
}

TEST_F(SafeErc20Test, transfer_from_without_allowance_fails)
{
    SafeErc20 erc20{host, token, bob, 0};
    auto const res = erc20.transfer_from(alice, bob, 1, gas);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::CallFailed);
    EXPECT_EQ(Erc20::balance_of(state, token, alice), 1'000);
}

TEST_F(SafeErc20Test, no_code)
{
    SafeErc20 erc20{host, carol, alice, 0};
    auto const res = erc20.transfer(bob, 1, gas);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::NoCode);
    EXPECT_EQ(gas, 1'000'000);
}

TEST_F(SafeErc20Test, empty_return_accepted)
{
    constexpr auto quiet = 0x0000000000000000000000000000000000009e7e_address;
    host.set_code(quiet, std::make_shared<test::NoReturnToken>());
    Erc20::mint(state, quiet, alice, 10);

    SafeErc20 erc20{host, quiet, alice, 0};
    ASSERT_TRUE(erc20.transfer(bob, 4, gas).has_value());
    EXPECT_EQ(Erc20::balance_of(state, quiet, bob), 4);

    // but a balance query needs a value back
    auto const balance = erc20.balance_of(bob, gas);
    ASSERT_TRUE(balance.has_error());
    EXPECT_EQ(balance.assume_error(), TokenError::MalformedReturn);
}

TEST_F(SafeErc20Test, false_return_rejected)
{
    constexpr auto liar = 0x000000000000000000000000000000000000f41e_address;
    host.set_code(
        liar, std::make_shared<test::StaticReturnToken>(test::false_return()));

    SafeErc20 erc20{host, liar, alice, 0};
    auto const res = erc20.transfer(bob, 1, gas);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::ReturnedFalse);
}

TEST_F(SafeErc20Test, malformed_return_rejected)
{
    constexpr auto odd = 0x0000000000000000000000000000000000000dd0_address;
    host.set_code(
        odd, std::make_shared<test::StaticReturnToken>(byte_string{0x01}));

    SafeErc20 erc20{host, odd, alice, 0};
    auto const res = erc20.transfer(bob, 1, gas);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TokenError::MalformedReturn);
}
