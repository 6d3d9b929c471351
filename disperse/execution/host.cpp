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

#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/core/likely.h>
#include <disperse/execution/code.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/precompiles.hpp>
#include <disperse/execution/state/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <memory>
#include <optional>
#include <utility>

DISPERSE_NAMESPACE_BEGIN

Host::Host(State &state)
    : state_{state}
{
}

void Host::set_code(Address const &address, std::shared_ptr<Code> code)
{
    code_[address] = std::move(code);
}

bool Host::has_code(Address const &address) const
{
    return is_precompile(address) || code_.contains(address);
}

evmc::Result Host::call(evmc_message const &msg)
{
    if (DISPERSE_UNLIKELY(msg.depth > MAX_CALL_DEPTH)) {
        return make_failure_result(EVMC_CALL_DEPTH_EXCEEDED);
    }

    uint256_t const value = intx::be::load<uint256_t>(msg.value);
    if (DISPERSE_UNLIKELY(state_.get_balance(msg.sender) < value)) {
        return evmc::Result{EVMC_INSUFFICIENT_BALANCE, msg.gas, 0, nullptr, 0};
    }

    state_.push();
    try {
        state_.subtract_from_balance(msg.sender, value);
        state_.add_to_balance(msg.recipient, value);

        evmc::Result result = [&] {
            if (auto result = check_call_precompile(*this, msg);
                result.has_value()) {
                return std::move(result).value();
            }
            if (auto const it = code_.find(msg.code_address);
                it != code_.end()) {
                return it->second->execute(*this, msg);
            }
            return make_success_result(msg.gas, {});
        }();

        if (result.status_code == EVMC_SUCCESS) {
            state_.pop_accept();
        }
        else {
            state_.pop_reject();
        }
        return result;
    }
    catch (...) {
        state_.pop_reject();
        throw;
    }
}

DISPERSE_NAMESPACE_END
