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
#include <disperse/core/bytes.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/disperse_exception.hpp>
#include <disperse/core/int.hpp>
#include <disperse/core/likely.h>
#include <disperse/core/result.hpp>
#include <disperse/execution/code.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_decode.hpp>
#include <disperse/execution/core/contract/abi_encode.hpp>
#include <disperse/execution/core/contract/abi_signatures.hpp>
#include <disperse/execution/core/contract/mapping.hpp>
#include <disperse/execution/core/contract/storage_variable.hpp>
#include <disperse/execution/core/log.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/state/state.hpp>
#include <disperse/execution/token/erc20.hpp>
#include <disperse/execution/token/token_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>

DISPERSE_ANONYMOUS_NAMESPACE_BEGIN

//
// Storage layout
//

constexpr bytes32_t BALANCES_SLOT{};
constexpr bytes32_t ALLOWANCES_SLOT{1};
constexpr bytes32_t TOTAL_SUPPLY_SLOT{2};

//
// Gas Costs
//

constexpr uint64_t BALANCE_OF_COST = 2'600;
constexpr uint64_t ALLOWANCE_COST = 2'600;
constexpr uint64_t APPROVE_COST = 25'000;
constexpr uint64_t TRANSFER_COST = 35'000;
constexpr uint64_t TRANSFER_FROM_COST = 45'000;
constexpr uint64_t FALLBACK_COST = 40'000;

using Method = Result<byte_string> (*)(
    State &, Address const &token, Address const &sender, byte_string_view);

StorageVariable<uint256_t>
balance_var(State &state, Address const &token, Address const &account)
{
    return {state, token, mapping(BALANCES_SLOT, account)};
}

StorageVariable<uint256_t> allowance_var(
    State &state, Address const &token, Address const &owner,
    Address const &spender)
{
    return {state, token, mapping(ALLOWANCES_SLOT, owner, spender)};
}

byte_string encode_bool(bool const value)
{
    return byte_string{to_byte_string_view(abi_encode_bool(value).bytes)};
}

// event Transfer(address indexed from, address indexed to, uint256 value)
void emit_transfer_event(
    State &state, Address const &token, Address const &from,
    Address const &to, uint256_t const &amount)
{
    static bytes32_t const signature =
        abi_encode_event_signature("Transfer(address,address,uint256)");

    state.store_log(Log{
        .data = byte_string{to_byte_string_view(abi_encode_uint(amount).bytes)},
        .topics = {signature, abi_encode_address(from), abi_encode_address(to)},
        .address = token});
}

// event Approval(address indexed owner, address indexed spender,
//                uint256 value)
void emit_approval_event(
    State &state, Address const &token, Address const &owner,
    Address const &spender, uint256_t const &amount)
{
    static bytes32_t const signature =
        abi_encode_event_signature("Approval(address,address,uint256)");

    state.store_log(Log{
        .data = byte_string{to_byte_string_view(abi_encode_uint(amount).bytes)},
        .topics =
            {signature, abi_encode_address(owner), abi_encode_address(spender)},
        .address = token});
}

Result<void> move_balance(
    State &state, Address const &token, Address const &from,
    Address const &to, uint256_t const &amount)
{
    auto from_balance = balance_var(state, token, from);
    uint256_t const available = from_balance.load();
    if (DISPERSE_UNLIKELY(available < amount)) {
        return TokenError::InsufficientBalance;
    }
    from_balance.store(available - amount);

    // Credit after debit so that a self transfer nets to zero. Balances are
    // bounded by the total supply so the credit cannot overflow.
    auto to_balance = balance_var(state, token, to);
    to_balance.store(to_balance.load() + amount);

    emit_transfer_event(state, token, from, to, amount);
    return outcome::success();
}

Result<byte_string> erc20_balance_of(
    State &state, Address const &token, Address const &,
    byte_string_view const input)
{
    AbiDecoder decoder{input};
    BOOST_OUTCOME_TRY(auto const account, decoder.decode_fixed<Address>());
    BOOST_OUTCOME_TRY(decoder.finish());

    return byte_string{to_byte_string_view(
        abi_encode_uint(balance_var(state, token, account).load()).bytes)};
}

Result<byte_string> erc20_allowance(
    State &state, Address const &token, Address const &,
    byte_string_view const input)
{
    AbiDecoder decoder{input};
    BOOST_OUTCOME_TRY(auto const owner, decoder.decode_fixed<Address>());
    BOOST_OUTCOME_TRY(auto const spender, decoder.decode_fixed<Address>());
    BOOST_OUTCOME_TRY(decoder.finish());

    return byte_string{to_byte_string_view(
        abi_encode_uint(allowance_var(state, token, owner, spender).load())
            .bytes)};
}

Result<byte_string> erc20_approve(
    State &state, Address const &token, Address const &sender,
    byte_string_view const input)
{
    AbiDecoder decoder{input};
    BOOST_OUTCOME_TRY(auto const spender, decoder.decode_fixed<Address>());
    BOOST_OUTCOME_TRY(auto const amount, decoder.decode_fixed<uint256_t>());
    BOOST_OUTCOME_TRY(decoder.finish());

    allowance_var(state, token, sender, spender).store(amount);
    emit_approval_event(state, token, sender, spender, amount);
    return encode_bool(true);
}

Result<byte_string> erc20_transfer(
    State &state, Address const &token, Address const &sender,
    byte_string_view const input)
{
    AbiDecoder decoder{input};
    BOOST_OUTCOME_TRY(auto const to, decoder.decode_fixed<Address>());
    BOOST_OUTCOME_TRY(auto const amount, decoder.decode_fixed<uint256_t>());
    BOOST_OUTCOME_TRY(decoder.finish());

    BOOST_OUTCOME_TRY(move_balance(state, token, sender, to, amount));
    return encode_bool(true);
}

Result<byte_string> erc20_transfer_from(
    State &state, Address const &token, Address const &sender,
    byte_string_view const input)
{
    AbiDecoder decoder{input};
    BOOST_OUTCOME_TRY(auto const from, decoder.decode_fixed<Address>());
    BOOST_OUTCOME_TRY(auto const to, decoder.decode_fixed<Address>());
    BOOST_OUTCOME_TRY(auto const amount, decoder.decode_fixed<uint256_t>());
    BOOST_OUTCOME_TRY(decoder.finish());

    auto allowance = allowance_var(state, token, from, sender);
    uint256_t const approved = allowance.load();
    if (DISPERSE_UNLIKELY(approved < amount)) {
        return TokenError::InsufficientAllowance;
    }
    if (approved != std::numeric_limits<uint256_t>::max()) {
        allowance.store(approved - amount);
    }

    BOOST_OUTCOME_TRY(move_balance(state, token, from, to, amount));
    return encode_bool(true);
}

Result<byte_string> erc20_fallback(
    State &, Address const &, Address const &, byte_string_view)
{
    return TokenError::MethodNotSupported;
}

std::pair<Method, uint64_t> dispatch(byte_string_view &input)
{
    if (DISPERSE_UNLIKELY(input.size() < 4)) {
        return {&erc20_fallback, FALLBACK_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case ERC20_BALANCE_OF_SELECTOR:
        return {&erc20_balance_of, BALANCE_OF_COST};
    case ERC20_ALLOWANCE_SELECTOR:
        return {&erc20_allowance, ALLOWANCE_COST};
    case ERC20_APPROVE_SELECTOR:
        return {&erc20_approve, APPROVE_COST};
    case ERC20_TRANSFER_SELECTOR:
        return {&erc20_transfer, TRANSFER_COST};
    case ERC20_TRANSFER_FROM_SELECTOR:
        return {&erc20_transfer_from, TRANSFER_FROM_COST};
    default:
        return {&erc20_fallback, FALLBACK_COST};
    }
}

DISPERSE_ANONYMOUS_NAMESPACE_END

DISPERSE_NAMESPACE_BEGIN

evmc::Result Erc20::execute(Host &host, evmc_message const &msg)
{
    byte_string_view input{msg.input_data, msg.input_size};
    auto const [method, cost] = dispatch(input);
    if (DISPERSE_UNLIKELY(std::cmp_less(msg.gas, cost))) {
        return make_failure_result(EVMC_OUT_OF_GAS);
    }

    auto const output = [&]() -> Result<byte_string> {
        if (DISPERSE_UNLIKELY(intx::be::load<uint256_t>(msg.value) != 0)) {
            return TokenError::ValueNonZero;
        }
        return method(host.state(), msg.recipient, msg.sender, input);
    }();
    if (DISPERSE_LIKELY(output.has_value())) {
        return make_success_result(
            msg.gas - static_cast<int64_t>(cost), output.value());
    }

    auto const message = output.error().message();
    return make_failure_result(
        EVMC_REVERT, std::string_view{message.data(), message.size()});
}

void Erc20::mint(
    State &state, Address const &token, Address const &to,
    uint256_t const &amount)
{
    StorageVariable<uint256_t> supply{state, token, TOTAL_SUPPLY_SLOT};
    uint256_t const current = supply.load();
    DISPERSE_ASSERT_THROW(
        std::numeric_limits<uint256_t>::max() - amount >= current,
        "total supply overflow");
    supply.store(current + amount);

    auto balance = balance_var(state, token, to);
    balance.store(balance.load() + amount);
    emit_transfer_event(state, token, Address{}, to, amount);
}

uint256_t
Erc20::balance_of(State &state, Address const &token, Address const &account)
{
    return balance_var(state, token, account).load();
}

uint256_t Erc20::allowance(
    State &state, Address const &token, Address const &owner,
    Address const &spender)
{
    return allowance_var(state, token, owner, spender).load();
}

uint256_t Erc20::total_supply(State &state, Address const &token)
{
    return StorageVariable<uint256_t>{state, token, TOTAL_SUPPLY_SLOT}.load();
}

DISPERSE_NAMESPACE_END
