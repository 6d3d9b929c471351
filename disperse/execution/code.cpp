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
#include <disperse/execution/code.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>
#include <string_view>

DISPERSE_NAMESPACE_BEGIN

evmc::Result
make_success_result(int64_t const gas_left, byte_string_view const output)
{
    return evmc::Result{
        EVMC_SUCCESS, gas_left, 0, output.data(), output.size()};
}

evmc::Result make_failure_result(
    evmc_status_code const status, std::string_view const message)
{
    return evmc::Result{
        status,
        0 /* gas left */,
        0 /* gas refund */,
        reinterpret_cast<uint8_t const *>(message.data()),
        message.size()};
}

DISPERSE_NAMESPACE_END
