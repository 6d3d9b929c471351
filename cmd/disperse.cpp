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

#include "disperse/batch_file.hpp"

#include <disperse/core/byte_string.hpp>
#include <disperse/core/config.hpp>
#include <disperse/core/int.hpp>
#include <disperse/core/log_level_map.hpp>
#include <disperse/execution/core/address.hpp>
#include <disperse/execution/core/contract/abi_encode.hpp>
#include <disperse/execution/core/contract/abi_signatures.hpp>
#include <disperse/execution/disperse/disperse_contract.hpp>
#include <disperse/execution/host.hpp>
#include <disperse/execution/state/state.hpp>
#include <disperse/execution/token/erc20.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

using namespace disperse;
namespace fs = std::filesystem;

namespace
{
    constexpr Address TOKEN_ADDRESS{0x2000};

    enum class Mode
    {
        Native,
        Token,
    };

    char const *status_name(evmc_status_code const status)
    {
        switch (status) {
        case EVMC_SUCCESS:
            return "success";
        case EVMC_REVERT:
            return "revert";
        case EVMC_OUT_OF_GAS:
            return "out of gas";
        case EVMC_INSUFFICIENT_BALANCE:
            return "insufficient balance";
        case EVMC_CALL_DEPTH_EXCEEDED:
            return "call depth exceeded";
        default:
            return "failure";
        }
    }

    evmc::Result call(
        Host &host, Address const &sender, Address const &to,
        byte_string const &input, uint256_t const &value, int64_t const gas)
    {
        return host.call(evmc_message{
            .gas = gas,
            .recipient = to,
            .sender = sender,
            .input_data = input.data(),
            .input_size = input.size(),
            .value = intx::be::store<evmc_uint256be>(value),
            .code_address = to,
        });
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"disperse"};
    cli.option_defaults()->always_capture_default();

    Mode mode = Mode::Native;
    fs::path batch_path;
    std::string sender_hex{"0x00000000000000000000000000000000000a11ce"};
    std::string funds{"0"};
    std::string value{"0"};
    std::string allowance{"0"};
    int64_t gas = 10'000'000;
    auto log_level = quill::LogLevel::Info;

    std::map<std::string, Mode> const MODE_MAP = {
        {"native", Mode::Native}, {"token", Mode::Token}};

    cli.add_option("--mode", mode, "asset to disburse")
        ->transform(CLI::CheckedTransformer(MODE_MAP, CLI::ignore_case));
    cli.add_option(
           "--batch", batch_path, "file of `<address>,<amount>` lines")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--sender", sender_hex, "address of the payer");
    cli.add_option(
        "--funds", funds, "starting native or token balance of the payer");
    cli.add_option("--value", value, "native value attached to the call");
    cli.add_option(
        "--allowance",
        allowance,
        "token allowance the payer grants the contract");
    cli.add_option("--gas", gas, "gas limit of the call");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const sender = evmc::from_hex<Address>(sender_hex);
    if (!sender.has_value()) {
        LOG_ERROR("invalid sender address '{}'", sender_hex);
        return EXIT_FAILURE;
    }

    BatchFile batch;
    uint256_t funds_amount;
    uint256_t value_amount;
    uint256_t allowance_amount;
    try {
        batch = read_batch_file(batch_path);
        funds_amount = intx::from_string<uint256_t>(funds);
        value_amount = intx::from_string<uint256_t>(value);
        allowance_amount = intx::from_string<uint256_t>(allowance);
    }
    catch (std::exception const &e) {
        LOG_ERROR("{}", e.what());
        return EXIT_FAILURE;
    }

    LOG_INFO(
        "disbursing to {} recipients from {}",
        batch.recipients.size(),
        to_string(sender.value()));

    State state;
    Host host{state};

    evmc::Result result = [&] {
        if (mode == Mode::Native) {
            state.add_to_balance(sender.value(), funds_amount);
            auto const input = abi_encode_call(
                abi_encode_selector("sendNative(address[],uint256[])"),
                AbiEncoder{}
                    .add_address_array(batch.recipients)
                    .add_uint_array(batch.amounts)
                    .encode_final());
            return call(
                host, sender.value(), DISPERSE_CA, input, value_amount, gas);
        }

        host.set_code(TOKEN_ADDRESS, std::make_shared<Erc20>());
        Erc20::mint(state, TOKEN_ADDRESS, sender.value(), funds_amount);
        // funds for the attached value only; the token leg ignores it
        state.add_to_balance(sender.value(), value_amount);

        auto const approve = call(
            host,
            sender.value(),
            TOKEN_ADDRESS,
            abi_encode_call(
                ERC20_APPROVE_SELECTOR,
                AbiEncoder{}
                    .add_address(DISPERSE_CA)
                    .add_uint(allowance_amount)
                    .encode_final()),
            0,
            gas);
        LOG_DEBUG("approve: {}", status_name(approve.status_code));

        auto const input = abi_encode_call(
            abi_encode_selector("sendToken(address,address[],uint256[])"),
            AbiEncoder{}
                .add_address(TOKEN_ADDRESS)
                .add_address_array(batch.recipients)
                .add_uint_array(batch.amounts)
                .encode_final());
        return call(host, sender.value(), DISPERSE_CA, input, value_amount, gas);
    }();

    if (result.status_code == EVMC_SUCCESS) {
        LOG_INFO("call succeeded, gas used = {}", gas - result.gas_left);
    }
    else {
        LOG_INFO(
            "call failed: {} '{}'",
            status_name(result.status_code),
            std::string{
                reinterpret_cast<char const *>(result.output_data),
                result.output_size});
    }

    auto const balance_of = [&](Address const &account) {
        if (mode == Mode::Native) {
            return state.get_balance(account);
        }
        return Erc20::balance_of(state, TOKEN_ADDRESS, account);
    };

    LOG_INFO(
        "sender {} balance = {}",
        to_string(sender.value()),
        intx::to_string(balance_of(sender.value())));
    for (auto const &recipient : batch.recipients) {
        LOG_INFO(
            "recipient {} balance = {}",
            to_string(recipient),
            intx::to_string(balance_of(recipient)));
    }
    LOG_INFO(
        "contract {} balance = {}",
        to_string(DISPERSE_CA),
        intx::to_string(balance_of(DISPERSE_CA)));

    return result.status_code == EVMC_SUCCESS ? EXIT_SUCCESS : EXIT_FAILURE;
}
