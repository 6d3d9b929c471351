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
#include <disperse/core/bytes.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/execution/core/address.hpp>

#include <cstdint>
#include <span>
#include <vector>

DISPERSE_NAMESPACE_BEGIN

bytes32_t abi_encode_address(Address const &);
bytes32_t abi_encode_uint(uint256_t const &);
bytes32_t abi_encode_bool(bool);

// Builds the argument section of a call or return value using the standard
// head/tail layout. Dynamic arrays place an offset in the head and their
// length-prefixed elements in the tail.
class AbiEncoder
{
    struct Entry
    {
        bytes32_t head;
        byte_string tail;
        bool dynamic;
    };

    std::vector<Entry> entries_;

public:
    AbiEncoder &add_address(Address const &);
    AbiEncoder &add_uint(uint256_t const &);
    AbiEncoder &add_bool(bool);
    AbiEncoder &add_address_array(std::span<Address const>);
    AbiEncoder &add_uint_array(std::span<uint256_t const>);

    byte_string encode_final() const;
};

// selector || args
byte_string abi_encode_call(uint32_t selector, byte_string_view args);

DISPERSE_NAMESPACE_END
