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
#include <disperse/core/keccak.hpp>
#include <disperse/execution/core/contract/abi_signatures.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <string_view>

DISPERSE_NAMESPACE_BEGIN

uint32_t abi_encode_selector(std::string_view const signature)
{
    bytes32_t const hash = keccak256(byte_string_view{
        reinterpret_cast<unsigned char const *>(signature.data()),
        signature.size()});
    return intx::be::unsafe::load<uint32_t>(hash.bytes);
}

bytes32_t abi_encode_event_signature(std::string_view const signature)
{
    return keccak256(byte_string_view{
        reinterpret_cast<unsigned char const *>(signature.data()),
        signature.size()});
}

DISPERSE_NAMESPACE_END
