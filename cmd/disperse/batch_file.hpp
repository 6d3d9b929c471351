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
#include <disperse/core/int.hpp>
#include <disperse/execution/core/address.hpp>

#include <filesystem>
#include <istream>
#include <vector>

DISPERSE_NAMESPACE_BEGIN

struct BatchFile
{
    std::vector<Address> recipients;
    std::vector<uint256_t> amounts;
};

// One leg per line as `0x<address>,<amount>`. The amount is decimal or
// 0x-prefixed hex. Blank lines and lines starting with `#` are skipped.
// Throws std::runtime_error naming the offending line.
BatchFile parse_batch(std::istream &);

BatchFile read_batch_file(std::filesystem::path const &);

DISPERSE_NAMESPACE_END
