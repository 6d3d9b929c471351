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

#include <disperse/core/assert.h>
#include <disperse/core/bytes.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/disperse_exception.hpp>
#include <disperse/core/int.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/log.hpp>
#include <disperse/execution/state/state.hpp>

#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <variant>

DISPERSE_NAMESPACE_BEGIN

uint256_t State::get_balance(Address const &address) const
{
    auto const it = balances_.find(address);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

void State::set_balance(Address const &address, uint256_t const &balance)
{
    auto &current = balances_[address];
    journal_.emplace_back(BalanceChange{address, current});
    current = balance;
}

void State::add_to_balance(Address const &address, uint256_t const &delta)
{
    uint256_t const balance = get_balance(address);
    DISPERSE_ASSERT_THROW(
        std::numeric_limits<uint256_t>::max() - delta >= balance,
        "balance overflow");
    set_balance(address, balance + delta);
}

void State::subtract_from_balance(Address const &address, uint256_t const &delta)
{
    uint256_t const balance = get_balance(address);
    DISPERSE_ASSERT_THROW(delta <= balance, "balance underflow");
    set_balance(address, balance - delta);
}

bytes32_t State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const addr_it = storage_.find(address);
    if (addr_it == storage_.end()) {
        return {};
    }

    auto const value_it = addr_it->second.find(key);
    if (value_it == addr_it->second.end()) {
        return {};
    }

    return value_it->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    auto &current = storage_[address][key];
    journal_.emplace_back(StorageChange{address, key, current});
    current = value;
}

void State::store_log(Log log)
{
    journal_.emplace_back(LogAppended{});
    logs_.push_back(std::move(log));
}

void State::push()
{
    checkpoints_.push_back(journal_.size());
}

void State::pop_accept()
{
    DISPERSE_ASSERT(!checkpoints_.empty());

    checkpoints_.pop_back();
    if (checkpoints_.empty()) {
        journal_.clear();
    }
}

void State::pop_reject()
{
    DISPERSE_ASSERT(!checkpoints_.empty());

    auto const last_checkpoint = checkpoints_.back();
    checkpoints_.pop_back();

    auto const n_since_last_checkpoint =
        static_cast<int64_t>(journal_.size() - last_checkpoint);

    auto const begin = journal_.rbegin();
    auto const end = journal_.rbegin() + n_since_last_checkpoint;

    for (auto it = begin; it != end; ++it) {
        std::visit(
            [this](auto const &entry) {
                using T = std::decay_t<decltype(entry)>;
                if constexpr (std::is_same_v<T, BalanceChange>) {
                    balances_[entry.address] = entry.previous;
                }
                else if constexpr (std::is_same_v<T, StorageChange>) {
                    storage_[entry.address][entry.key] = entry.previous;
                }
                else {
                    DISPERSE_ASSERT(!logs_.empty());
                    logs_.pop_back();
                }
            },
            *it);
    }

    journal_.erase(
        journal_.begin() + static_cast<int64_t>(last_checkpoint),
        journal_.end());
}

DISPERSE_NAMESPACE_END
