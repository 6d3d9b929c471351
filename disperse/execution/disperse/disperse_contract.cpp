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

#include <disperse/core/assert.h>
#include <disperse/core/byte_string.hpp>
#include <disperse/core/bytes.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/core/likely.h>
#include <disperse/core/result.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_decode.hpp>
#include <disperse/execution/core/contract/abi_encode.hpp>
#include <disperse/execution/core/contract/storage_variable.hpp>
#include <disperse/execution/disperse/disperse_contract.hpp>
#include <disperse/execution/disperse/disperse_error.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/state/state.hpp>
#include <disperse/execution/token/safe_transfer.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

DISPERSE_ANONYMOUS_NAMESPACE_BEGIN

//
// ABI
//

constexpr uint32_t SEND_NATIVE_SELECTOR = 0x318adb8b;
constexpr uint32_t SEND_TOKEN_SELECTOR = 0x0a333a0f;
constexpr uint32_t RESCUE_TOKEN_SELECTOR = 0x4460d3cf;
constexpr uint32_t RESCUE_NATIVE_SELECTOR = 0xfc82f084;

//
// Gas Costs
//

// Batches pay a base cost up front and a cost per leg as the loop reaches
// it. Whatever the callee of a leg consumes is charged on top.
constexpr uint64_t SEND_BASE_COST = 21'000;
constexpr uint64_t NATIVE_LEG_COST = 9'000;
constexpr uint64_t TOKEN_LEG_COST = 12'000;
constexpr uint64_t RESCUE_COST = 30'000;
constexpr uint64_t FALLBACK_COST = 40'000;

//
// Storage
//

// Nonzero while a call into the contract is executing.
constexpr bytes32_t ENTERED_SLOT{};

struct Batch
{
    std::vector<Address> recipients;
    std::vector<uint256_t> amounts;
};

Result<Batch> decode_batch(AbiDecoder &decoder)
{
    BOOST_OUTCOME_TRY(auto recipients, decoder.decode_address_array());
    BOOST_OUTCOME_TRY(auto amounts, decoder.decode_uint_array());
    BOOST_OUTCOME_TRY(decoder.finish());
    return Batch{std::move(recipients), std::move(amounts)};
}

Result<void> function_not_payable(evmc_uint256be const &value)
{
    if (DISPERSE_UNLIKELY(intx::be::load<uint256_t>(value) != 0)) {
        return DisperseError::ValueNonZero;
    }

    return outcome::success();
}

byte_string encode_bool(bool const value)
{
    return byte_string{to_byte_string_view(abi_encode_bool(value).bytes)};
}

DISPERSE_ANONYMOUS_NAMESPACE_END

DISPERSE_NAMESPACE_BEGIN

DisperseContract::DisperseContract(
    Host &host, int64_t const gas, int32_t const depth)
    : host_{host}
    , state_{host.state()}
    , gas_left_{gas}
    , depth_{depth}
{
}

Result<void> DisperseContract::enter()
{
    StorageVariable<uint256_t> entered{state_, DISPERSE_CA, ENTERED_SLOT};
    if (DISPERSE_UNLIKELY(entered.load() != 0)) {
        return DisperseError::ReentrantCall;
    }
    entered.store(1);
    return outcome::success();
}

void DisperseContract::exit()
{
    StorageVariable<uint256_t>{state_, DISPERSE_CA, ENTERED_SLOT}.store(0);
}

Result<void> DisperseContract::charge(uint64_t const cost)
{
    if (DISPERSE_UNLIKELY(std::cmp_less(gas_left_, cost))) {
        return DisperseError::OutOfGas;
    }
    gas_left_ -= static_cast<int64_t>(cost);
    return outcome::success();
}

bool DisperseContract::push_native(Address const &to, uint256_t const &amount)
{
    int64_t const gas = max_call_gas(gas_left_);

    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.depth = depth_ + 1;
    msg.gas = gas;
    msg.recipient = to;
    msg.sender = DISPERSE_CA;
    msg.value = intx::be::store<evmc_uint256be>(amount);
    msg.code_address = to;

    evmc::Result const result = host_.call(msg);
    gas_left_ -= gas - result.gas_left;
    return result.status_code == EVMC_SUCCESS;
}

Result<void> DisperseContract::send_native(
    Address const &caller, std::span<Address const> const recipients,
    std::span<uint256_t const> const amounts)
{
    if (DISPERSE_UNLIKELY(recipients.size() != amounts.size())) {
        return DisperseError::ShapeMismatch;
    }

    for (size_t i = 0; i < recipients.size(); ++i) {
        BOOST_OUTCOME_TRY(charge(NATIVE_LEG_COST));
        if (DISPERSE_UNLIKELY(!push_native(recipients[i], amounts[i]))) {
            LOG_DEBUG(
                "sendNative from {}: leg {} of {} to {} failed",
                to_string(caller),
                i,
                recipients.size(),
                to_string(recipients[i]));
            return DisperseError::LegTransferFailed;
        }
    }

    // Attached value beyond the sum of the legs, plus anything stranded
    // here before the call, goes back to the caller.
    uint256_t const residual = state_.get_balance(DISPERSE_CA);
    if (residual != 0 && DISPERSE_UNLIKELY(!push_native(caller, residual))) {
        LOG_DEBUG("sendNative: refund to {} failed", to_string(caller));
        return DisperseError::RefundFailed;
    }

    return outcome::success();
}

Result<void> DisperseContract::send_token(
    Address const &caller, Address const &token,
    std::span<Address const> const recipients,
    std::span<uint256_t const> const amounts)
{
    if (DISPERSE_UNLIKELY(recipients.size() != amounts.size())) {
        return DisperseError::ShapeMismatch;
    }

    SafeErc20 erc20{host_, token, DISPERSE_CA, depth_};
    for (size_t i = 0; i < recipients.size(); ++i) {
        BOOST_OUTCOME_TRY(charge(TOKEN_LEG_COST));
        auto const res =
            erc20.transfer_from(caller, recipients[i], amounts[i], gas_left_);
        if (DISPERSE_UNLIKELY(res.has_error())) {
            LOG_DEBUG(
                "sendToken {} from {}: leg {} of {} to {} failed: {}",
                to_string(token),
                to_string(caller),
                i,
                recipients.size(),
                to_string(recipients[i]),
                res.error().message().c_str());
            return DisperseError::LegTransferFailed;
        }
    }

    return outcome::success();
}

Result<void>
DisperseContract::rescue_token(Address const &caller, Address const &token)
{
    SafeErc20 erc20{host_, token, DISPERSE_CA, depth_};

    auto const balance = erc20.balance_of(DISPERSE_CA, gas_left_);
    if (DISPERSE_UNLIKELY(balance.has_error())) {
        return DisperseError::TokenCallFailed;
    }
    if (DISPERSE_UNLIKELY(
            erc20.transfer(caller, balance.value(), gas_left_).has_error())) {
        return DisperseError::TokenCallFailed;
    }

    if (balance.value() != 0) {
        LOG_INFO(
            "rescued {} of token {} to {}",
            intx::to_string(balance.value()),
            to_string(token),
            to_string(caller));
    }
    return outcome::success();
}

Result<void> DisperseContract::rescue_native(Address const &caller)
{
    uint256_t const balance = state_.get_balance(DISPERSE_CA);
    if (balance == 0) {
        return outcome::success();
    }

    if (DISPERSE_UNLIKELY(!push_native(caller, balance))) {
        LOG_WARNING(
            "native rescue of {} to {} failed, balance kept",
            intx::to_string(balance),
            to_string(caller));
        return DisperseError::RescueNativeFailed;
    }

    LOG_INFO(
        "rescued {} native to {}", intx::to_string(balance), to_string(caller));
    return outcome::success();
}

std::pair<DisperseContract::PrecompileFunc, uint64_t>
DisperseContract::precompile_dispatch(byte_string_view &input)
{
    if (DISPERSE_UNLIKELY(input.size() < 4)) {
        return {&DisperseContract::precompile_fallback, FALLBACK_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case SEND_NATIVE_SELECTOR:
        return {&DisperseContract::precompile_send_native, SEND_BASE_COST};
    case SEND_TOKEN_SELECTOR:
        return {&DisperseContract::precompile_send_token, SEND_BASE_COST};
    case RESCUE_TOKEN_SELECTOR:
        return {&DisperseContract::precompile_rescue_token, RESCUE_COST};
    case RESCUE_NATIVE_SELECTOR:
        return {&DisperseContract::precompile_rescue_native, RESCUE_COST};
    default:
        return {&DisperseContract::precompile_fallback, FALLBACK_COST};
    }
}

Result<byte_string> DisperseContract::precompile_send_native(
    byte_string_view const input, evmc_address const &sender,
    evmc_uint256be const &)
{
    AbiDecoder decoder{input};
    auto const batch = decode_batch(decoder);
    if (DISPERSE_UNLIKELY(batch.has_error())) {
        return DisperseError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(send_native(
        sender, batch.value().recipients, batch.value().amounts));
    return encode_bool(true);
}

Result<byte_string> DisperseContract::precompile_send_token(
    byte_string_view const input, evmc_address const &sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    AbiDecoder decoder{input};
    auto const token = decoder.decode_fixed<Address>();
    if (DISPERSE_UNLIKELY(token.has_error())) {
        return DisperseError::InvalidInput;
    }
    auto const batch = decode_batch(decoder);
    if (DISPERSE_UNLIKELY(batch.has_error())) {
        return DisperseError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(send_token(
        sender,
        token.value(),
        batch.value().recipients,
        batch.value().amounts));
    return encode_bool(true);
}

Result<byte_string> DisperseContract::precompile_rescue_token(
    byte_string_view const input, evmc_address const &sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    AbiDecoder decoder{input};
    auto const token = decoder.decode_fixed<Address>();
    if (DISPERSE_UNLIKELY(token.has_error() || decoder.finish().has_error())) {
        return DisperseError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(rescue_token(sender, token.value()));
    return encode_bool(true);
}

Result<byte_string> DisperseContract::precompile_rescue_native(
    byte_string_view const input, evmc_address const &sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    if (DISPERSE_UNLIKELY(!input.empty())) {
        return DisperseError::InvalidInput;
    }

    auto const rescued = rescue_native(sender);
    if (DISPERSE_UNLIKELY(rescued.has_error())) {
        DISPERSE_ASSERT(
            rescued.assume_error() == DisperseError::RescueNativeFailed);
        return encode_bool(false);
    }
    return encode_bool(true);
}

Result<byte_string> DisperseContract::precompile_fallback(
    byte_string_view, evmc_address const &, evmc_uint256be const &)
{
    return DisperseError::MethodNotSupported;
}

DISPERSE_NAMESPACE_END
