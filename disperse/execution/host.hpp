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
#include <disperse/core/unordered_map.hpp>
#include <disperse/execution/code.hpp>
#include <disperse/execution/core/address.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>
#include <memory>

DISPERSE_NAMESPACE_BEGIN

class State;

/**
 * Executes messages against a `State`. Every call runs inside its own state
 * checkpoint: the value transfer and everything the callee does is kept when
 * the callee succeeds and discarded otherwise. Nested calls nest checkpoints,
 * so a failure at any depth unwinds exactly the failing subtree.
 */
class Host
{
    State &state_;
    unordered_dense_map<Address, std::shared_ptr<Code>> code_;

public:
    static constexpr int32_t MAX_CALL_DEPTH = 1024;

    explicit Host(State &);

    State &state() noexcept
    {
        return state_;
    }

    void set_code(Address const &, std::shared_ptr<Code>);

    bool has_code(Address const &) const;

    evmc::Result call(evmc_message const &);
};

// All but one 64th of the remaining gas may be forwarded to a callee.
inline int64_t max_call_gas(int64_t const gas_left) noexcept
{
    return gas_left - gas_left / 64;
}

DISPERSE_NAMESPACE_END
