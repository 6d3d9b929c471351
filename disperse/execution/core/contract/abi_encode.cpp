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
#include <disperse/core/int.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_encode.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstring>
#include <span>

DISPERSE_NAMESPACE_BEGIN

bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(
        output.bytes + sizeof(bytes32_t) - sizeof(Address),
        address.bytes,
        sizeof(Address));
    return output;
}

bytes32_t abi_encode_uint(uint256_t const &value)
{
    return intx::be::store<bytes32_t>(value);
}

bytes32_t abi_encode_bool(bool const value)
{
    bytes32_t output{};
    output.bytes[31] = value ? 1 : 0;
    return output;
}

AbiEncoder &AbiEncoder::add_address(Address const &address)
{
    entries_.push_back(
        {.head = abi_encode_address(address), .tail = {}, .dynamic = false});
    return *this;
}

AbiEncoder &AbiEncoder::add_uint(uint256_t const &value)
{
    entries_.push_back(
        {.head = abi_encode_uint(value), .tail = {}, .dynamic = false});
    return *this;
}

AbiEncoder &AbiEncoder::add_bool(bool const value)
{
    entries_.push_back(
        {.head = abi_encode_bool(value), .tail = {}, .dynamic = false});
    return *this;
}

AbiEncoder &AbiEncoder::add_address_array(std::span<Address const> const values)
{
    byte_string tail;
    tail.reserve(sizeof(bytes32_t) * (values.size() + 1));
    tail += to_byte_string_view(abi_encode_uint(values.size()).bytes);
    for (auto const &value : values) {
        tail += to_byte_string_view(abi_encode_address(value).bytes);
    }
    entries_.push_back({.head = {}, .tail = std::move(tail), .dynamic = true});
    return *this;
}

AbiEncoder &AbiEncoder::add_uint_array(std::span<uint256_t const> const values)
{
    byte_string tail;
    tail.reserve(sizeof(bytes32_t) * (values.size() + 1));
    tail += to_byte_string_view(abi_encode_uint(values.size()).bytes);
    for (auto const &value : values) {
        tail += to_byte_string_view(abi_encode_uint(value).bytes);
    }
    entries_.push_back({.head = {}, .tail = std::move(tail), .dynamic = true});
    return *this;
}

byte_string AbiEncoder::encode_final() const
{
    byte_string head;
    byte_string tail;
    size_t const head_size = entries_.size() * sizeof(bytes32_t);
    for (auto const &entry : entries_) {
        if (entry.dynamic) {
            head += to_byte_string_view(
                abi_encode_uint(head_size + tail.size()).bytes);
            tail += entry.tail;
        }
        else {
            head += to_byte_string_view(entry.head.bytes);
        }
    }
    return head + tail;
}

byte_string abi_encode_call(uint32_t const selector, byte_string_view const args)
{
    byte_string output(sizeof(uint32_t), 0);
    intx::be::unsafe::store(output.data(), selector);
    output += args;
    return output;
}

DISPERSE_NAMESPACE_END
