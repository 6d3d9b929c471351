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

#include "batch_file.hpp"

#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/execution/core/address.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

DISPERSE_ANONYMOUS_NAMESPACE_BEGIN

std::string_view trim(std::string_view s)
{
    constexpr std::string_view whitespace{" \t\r"};
    auto const begin = s.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto const end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

[[noreturn]] void
bad_line(std::size_t const line_number, std::string const &reason)
{
    throw std::runtime_error(
        "batch line " + std::to_string(line_number) + ": " + reason);
}

DISPERSE_ANONYMOUS_NAMESPACE_END

DISPERSE_NAMESPACE_BEGIN

BatchFile parse_batch(std::istream &is)
{
    BatchFile batch;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(is, line)) {
        ++line_number;
        auto const content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }

        auto const comma = content.find(',');
        if (comma == std::string_view::npos) {
            bad_line(line_number, "expected <address>,<amount>");
        }

        auto const address =
            evmc::from_hex<Address>(trim(content.substr(0, comma)));
        if (!address.has_value()) {
            bad_line(line_number, "invalid address");
        }

        uint256_t amount;
        try {
            amount = intx::from_string<uint256_t>(
                std::string{trim(content.substr(comma + 1))});
        }
        catch (std::exception const &e) {
            bad_line(line_number, std::string{"invalid amount: "} + e.what());
        }

        batch.recipients.push_back(address.value());
        batch.amounts.push_back(amount);
    }
    return batch;
}

BatchFile read_batch_file(std::filesystem::path const &path)
{
    std::ifstream is{path};
    if (!is) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return parse_batch(is);
}

DISPERSE_NAMESPACE_END
