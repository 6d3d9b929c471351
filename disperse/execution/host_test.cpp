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

#include <disperse/core/int.hpp>
#include <disperse/execution/code.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/disperse/disperse_contract.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/state/state.hpp>
#include <disperse/execution/test/test_contracts.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <utility>

using namespace disperse;
using namespace evmc::literals;

namespace
{
    constexpr auto alice = 0x00000000000000000000000000000000000a11ce_address;
    constexpr auto bob = 0x0000000000000000000000000000000000000b0b_address;

    // Writes a storage slot then defers to `inner`.
    class Recorder final : public Code
    {
        std::shared_ptr<Code> inner_;

    public:
        explicit Recorder(std::shared_ptr<Code> inner)
            : inner_{std::move(inner)}
        {
        }

        evmc::Result execute(Host &host, evmc_message const &msg) override
        {
            host.state().set_storage(msg.recipient, bytes32_t{1}, bytes32_t{1});
            return inner_->execute(host, msg);
        }
    };

    class Recurse final : public Code
    {
    public:
        evmc::Result execute(Host &host, evmc_message const &msg) override
        {
            auto next = msg;
            next.depth = msg.depth + 1;
            return host.call(next);
        }
    };
}

struct HostTest : public ::testing::Test
{
    State state;
    Host host{state};

    evmc::Result transfer(
        Address const &from, Address const &to, uint256_t const &value,
        int64_t const gas = 100'000)
    {
        return host.call(evmc_message{
            .gas = gas,
            .recipient = to,
            .sender = from,
            .value = intx::be::store<evmc_uint256be>(value),
            .code_address = to,
        });
    }
};

TEST_F(HostTest, plain_transfer_returns_all_gas)
{
    state.add_to_balance(alice, 10);

    auto const result = transfer(alice, bob, 4, 5'000);
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(result.gas_left, 5'000);
    EXPECT_EQ(state.get_balance(alice), 6);
    EXPECT_EQ(state.get_balance(bob), 4);
    EXPECT_EQ(state.depth(), 0);
}

TEST_F(HostTest, insufficient_balance)
{
    state.add_to_balance(alice, 3);

    auto const result = transfer(alice, bob, 4, 5'000);
    EXPECT_EQ(result.status_code, EVMC_INSUFFICIENT_BALANCE);
    EXPECT_EQ(result.gas_left, 5'000);
    EXPECT_EQ(state.get_balance(alice), 3);
    EXPECT_EQ(state.get_balance(bob), 0);
}

TEST_F(HostTest, failed_callee_reverts_value_and_storage)
{
    state.add_to_balance(alice, 10);
    host.set_code(
        bob,
        std::make_shared<Recorder>(std::make_shared<test::RejectingReceiver>()));

    auto const result = transfer(alice, bob, 4);
    EXPECT_EQ(result.status_code, EVMC_REVERT);
    EXPECT_EQ(result.gas_left, 0);
    EXPECT_EQ(state.get_balance(alice), 10);
    EXPECT_EQ(state.get_balance(bob), 0);
    EXPECT_EQ(state.get_storage(bob, bytes32_t{1}), bytes32_t{});
}

TEST_F(HostTest, successful_callee_commits)
{
    state.add_to_balance(alice, 10);
    host.set_code(
        bob, std::make_shared<Recorder>(std::make_shared<test::GasBurner>(100)));

    auto const result = transfer(alice, bob, 4, 1'000);
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(result.gas_left, 900);
    EXPECT_EQ(state.get_balance(bob), 4);
    EXPECT_EQ(state.get_storage(bob, bytes32_t{1}), bytes32_t{1});
}

TEST_F(HostTest, call_depth_limit)
{
    host.set_code(bob, std::make_shared<Recurse>());

    auto const result = transfer(alice, bob, 0);
    EXPECT_EQ(result.status_code, EVMC_CALL_DEPTH_EXCEEDED);
    EXPECT_EQ(state.depth(), 0);
}

TEST_F(HostTest, has_code)
{
    EXPECT_TRUE(host.has_code(DISPERSE_CA));
    EXPECT_FALSE(host.has_code(bob));
    host.set_code(bob, std::make_shared<test::RejectingReceiver>());
    EXPECT_TRUE(host.has_code(bob));
}

TEST(MaxCallGas, keeps_one_64th)
{
    EXPECT_EQ(max_call_gas(0), 0);
    EXPECT_EQ(max_call_gas(63), 63);
    EXPECT_EQ(max_call_gas(64), 63);
    EXPECT_EQ(max_call_gas(6'400), 6'300);
}
