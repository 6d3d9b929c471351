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
#include <disperse/core/likely.h>
#include <disperse/core/result.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_decode.hpp>
#include <disperse/execution/core/contract/abi_decode_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <vector>

DISPERSE_NAMESPACE_BEGIN

Result<bytes32_t> abi_decode_word(byte_string_view &enc)
{
    if (DISPERSE_UNLIKELY(enc.size() < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }
    bytes32_t word;
    std::memcpy(word.bytes, enc.data(), sizeof(bytes32_t));
    enc.remove_prefix(sizeof(bytes32_t));
    return word;
}

template <>
Result<uint256_t> abi_decode_fixed<uint256_t>(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const word, abi_decode_word(enc));
    return intx::be::load<uint256_t>(word);
}

template <>
Result<Address> abi_decode_fixed<Address>(byte_string_view &enc)
{
    constexpr size_t PADDING = sizeof(bytes32_t) - sizeof(Address);

    BOOST_OUTCOME_TRY(auto const word, abi_decode_word(enc));
    if (DISPERSE_UNLIKELY(!std::all_of(
            word.bytes, word.bytes + PADDING, [](uint8_t const b) {
                return b == 0;
            }))) {
        return AbiDecodeError::DirtyHighBits;
    }
    Address address;
    std::memcpy(address.bytes, word.bytes + PADDING, sizeof(Address));
    return address;
}

template <>
Result<bool> abi_decode_fixed<bool>(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const value, abi_decode_fixed<uint256_t>(enc));
    if (DISPERSE_UNLIKELY(value > 1)) {
        return AbiDecodeError::DirtyHighBits;
    }
    return value == 1;
}

AbiDecoder::AbiDecoder(byte_string_view const args)
    : args_{args}
    , head_{args}
    , end_{0}
{
}

template <typename T>
Result<T> AbiDecoder::decode_fixed()
{
    BOOST_OUTCOME_TRY(auto const value, abi_decode_fixed<T>(head_));
    end_ = std::max(end_, args_.size() - head_.size());
    return value;
}

template Result<uint256_t> AbiDecoder::decode_fixed<uint256_t>();
template Result<Address> AbiDecoder::decode_fixed<Address>();
template Result<bool> AbiDecoder::decode_fixed<bool>();

template <typename T>
Result<std::vector<T>> AbiDecoder::decode_array()
{
    BOOST_OUTCOME_TRY(auto const offset, decode_fixed<uint256_t>());
    if (DISPERSE_UNLIKELY(offset >= args_.size())) {
        return AbiDecodeError::InvalidOffset;
    }

    byte_string_view tail = args_.substr(static_cast<size_t>(offset));
    BOOST_OUTCOME_TRY(auto const length, abi_decode_fixed<uint256_t>(tail));
    if (DISPERSE_UNLIKELY(length > tail.size() / sizeof(bytes32_t))) {
        return AbiDecodeError::InvalidLength;
    }

    auto const n = static_cast<size_t>(length);
    std::vector<T> values;
    values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        BOOST_OUTCOME_TRY(auto const value, abi_decode_fixed<T>(tail));
        values.push_back(value);
    }
    end_ = std::max(end_, args_.size() - tail.size());
    return values;
}

Result<std::vector<Address>> AbiDecoder::decode_address_array()
{
    return decode_array<Address>();
}

Result<std::vector<uint256_t>> AbiDecoder::decode_uint_array()
{
    return decode_array<uint256_t>();
}

Result<void> AbiDecoder::finish() const
{
    if (DISPERSE_UNLIKELY(end_ != args_.size())) {
        return AbiDecodeError::TrailingBytes;
    }
    return outcome::success();
}

DISPERSE_NAMESPACE_END
