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

#include <disperse/core/bytes.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <utility>

DISPERSE_NAMESPACE_BEGIN

template <typename T>
class StorageVariable;

// A uint256 held big endian in a single storage slot of a native contract.
template <>
class StorageVariable<uint256_t>
{
    State &state_;
    Address const address_;
    bytes32_t const key_;

public:
    StorageVariable(State &state, Address const &address, bytes32_t key)
        : state_{state}
        , address_{address}
        , key_{std::move(key)}
    {
    }

    uint256_t load() const
    {
        return intx::be::load<uint256_t>(state_.get_storage(address_, key_));
    }

    void store(uint256_t const &value)
    {
        state_.set_storage(address_, key_, intx::be::store<bytes32_t>(value));
    }
};

DISPERSE_NAMESPACE_END
