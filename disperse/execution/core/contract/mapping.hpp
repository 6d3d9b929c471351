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
#include <disperse/core/keccak.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_encode.hpp>

DISPERSE_NAMESPACE_BEGIN

// Solidity storage layout: the slot of `m[k]` for a mapping `m` declared at
// `slot` is keccak256(pad32(k) . slot). Nested mappings fold left, so
// `mapping(s, a, b)` addresses `m[a][b]`.
inline bytes32_t mapping(bytes32_t const &slot, Address const &key)
{
    byte_string preimage;
    preimage += to_byte_string_view(abi_encode_address(key).bytes);
    preimage += to_byte_string_view(slot.bytes);
    return keccak256(preimage);
}

template <typename... Rest>
bytes32_t
mapping(bytes32_t const &slot, Address const &key, Rest const &...rest)
{
    return mapping(mapping(slot, key), rest...);
}

DISPERSE_NAMESPACE_END
