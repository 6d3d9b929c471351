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
#include <disperse/core/likely.h>
#include <disperse/core/result.hpp>
#include <disperse/execution/code.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/disperse/disperse_contract.hpp>
#include <disperse/execution/disperse/disperse_error.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/precompiles.hpp>

#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <optional>
#include <string_view>
#include <utility>

DISPERSE_NAMESPACE_BEGIN

bool is_precompile(Address const &address)
{
    return address == DISPERSE_CA;
}

std::optional<evmc::Result>
check_call_precompile(Host &host, evmc_message const &msg)
{
    if (msg.code_address != DISPERSE_CA) {
        return std::nullopt;
    }

    byte_string_view input{msg.input_data, msg.input_size};
    auto const [method, cost] = DisperseContract::precompile_dispatch(input);
    if (DISPERSE_UNLIKELY(std::cmp_less(msg.gas, cost))) {
        return make_failure_result(EVMC_OUT_OF_GAS);
    }

    DisperseContract contract{
        host, msg.gas - static_cast<int64_t>(cost), msg.depth};
    auto const output = [&]() -> Result<byte_string> {
        BOOST_OUTCOME_TRY(contract.enter());
        auto res = (contract.*method)(input, msg.sender, msg.value);
        contract.exit();
        return res;
    }();
    if (DISPERSE_LIKELY(output.has_value())) {
        return make_success_result(contract.gas_left(), output.value());
    }

    if (output.error() == DisperseError::OutOfGas) {
        return make_failure_result(EVMC_OUT_OF_GAS);
    }
    auto const message = output.error().message();
    return make_failure_result(
        EVMC_REVERT, std::string_view{message.data(), message.size()});
}

DISPERSE_NAMESPACE_END
