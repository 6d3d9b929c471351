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
#include <disperse/core/likely.h>

#include <source_location>
#include <stdexcept>

DISPERSE_NAMESPACE_BEGIN

class DisperseException : public std::runtime_error
{
    std::source_location location_;

public:
    explicit DisperseException(
        char const *message,
        std::source_location location = std::source_location::current());

    std::source_location const &location() const noexcept
    {
        return location_;
    }
};

DISPERSE_NAMESPACE_END

#define DISPERSE_ASSERT_THROW(expr, message)                                   \
    if (DISPERSE_LIKELY(expr)) {                                               \
    }                                                                          \
    else {                                                                     \
        throw ::disperse::DisperseException{message};                          \
    }
