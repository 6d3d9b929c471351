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
#include <disperse/core/int.hpp>
#include <disperse/core/unordered_map.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/log.hpp>

#include <cstddef>
#include <variant>
#include <vector>

DISPERSE_NAMESPACE_BEGIN

/**
 * In-memory world state: native balances, contract storage and emitted logs.
 *
 * Every mutation is journaled so that a call can be undone as a unit.
 *
 * Invariants (enforced by the host executing calls against the state):
 * - Each call to `push()` is followed by exactly one call to `pop_accept()`
 *   or to `pop_reject()`
 * - A `State` is used by one execution context at a time
 */
class State
{
    struct BalanceChange
    {
        Address address;
        uint256_t previous;
    };

    struct StorageChange
    {
        Address address;
        bytes32_t key;
        bytes32_t previous;
    };

    struct LogAppended
    {
    };

    using JournalEntry = std::variant<BalanceChange, StorageChange, LogAppended>;

    std::vector<JournalEntry> journal_{};

    std::vector<std::size_t> checkpoints_{};

    unordered_dense_map<Address, uint256_t> balances_{};

    unordered_dense_map<Address, unordered_dense_map<bytes32_t, bytes32_t>>
        storage_{};

    std::vector<Log> logs_{};

    void set_balance(Address const &, uint256_t const &);

public:
    State() = default;

    State(State &&) = default;
    State &operator=(State &&) = default;
    State(State const &) = delete;
    State &operator=(State const &) = delete;

    uint256_t get_balance(Address const &) const;

    // Throws on overflow.
    void add_to_balance(Address const &, uint256_t const &delta);

    // Throws on underflow.
    void subtract_from_balance(Address const &, uint256_t const &delta);

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void
    set_storage(Address const &, bytes32_t const &key, bytes32_t const &value);

    void store_log(Log);

    std::vector<Log> const &logs() const
    {
        return logs_;
    }

    /**
     * Open a checkpoint at the current journal position. Changes made after
     * this point can be discarded as a unit with `pop_reject()`.
     */
    void push();

    /**
     * Keep every change made since the matching `push()`. The changes stay
     * revertible by any enclosing checkpoint.
     */
    void pop_accept();

    /**
     * Undo every change made since the matching `push()`, most recent first.
     */
    void pop_reject();

    std::size_t depth() const noexcept
    {
        return checkpoints_.size();
    }
};

DISPERSE_NAMESPACE_END
