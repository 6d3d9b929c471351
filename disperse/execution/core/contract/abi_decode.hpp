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
#include <disperse/core/result.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_decode_error.hpp>

#include <cstddef>
#include <vector>

DISPERSE_NAMESPACE_BEGIN

Result<bytes32_t> abi_decode_word(byte_string_view &);

// Consumes one head word from the front of the input.
template <typename T>
Result<T> abi_decode_fixed(byte_string_view &);

template <>
Result<uint256_t> abi_decode_fixed<uint256_t>(byte_string_view &);

template <>
Result<Address> abi_decode_fixed<Address>(byte_string_view &);

template <>
Result<bool> abi_decode_fixed<bool>(byte_string_view &);

// Walks the argument section of a call. Static values are read from the head
// in order; dynamic arrays are reached through the offset stored in the head.
// `finish` rejects input that carries bytes no argument accounts for.
class AbiDecoder
{
    byte_string_view const args_;
    byte_string_view head_;
    size_t end_;

    template <typename T>
    Result<std::vector<T>> decode_array();

public:
    explicit AbiDecoder(byte_string_view args);

    template <typename T>
    Result<T> decode_fixed();

    Result<std::vector<Address>> decode_address_array();
    Result<std::vector<uint256_t>> decode_uint_array();

    Result<void> finish() const;
};

DISPERSE_NAMESPACE_END
