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

#include <cstdint>
#include <string_view>

DISPERSE_NAMESPACE_BEGIN

// First four bytes of keccak256(signature), read big endian.
uint32_t abi_encode_selector(std::string_view signature);

bytes32_t abi_encode_event_signature(std::string_view signature);

DISPERSE_NAMESPACE_END
