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

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>
#include <string_view>

DISPERSE_NAMESPACE_BEGIN

class Host;

// Executable logic bound to an account. Accounts without code accept value
// and return all gas.
class Code
{
public:
    virtual ~Code() = default;

    virtual evmc::Result execute(Host &, evmc_message const &) = 0;
};

evmc::Result make_success_result(int64_t gas_left, byte_string_view output);

// Failed calls return all gas to nobody; the message is the revert output.
evmc::Result
make_failure_result(evmc_status_code, std::string_view message = {});

DISPERSE_NAMESPACE_END
