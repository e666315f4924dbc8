//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_CLI_CLI_ARGS_HPP_INCLUDED
#define DTUI_CLI_CLI_ARGS_HPP_INCLUDED

#include <dtui/sdk/bus_client.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace dtui
{
namespace cli
{

/// Command line options; an empty optional means "not given".
///
/// `SPDLOG_LEVEL=...` and `SPDLOG_FLUSH_LEVEL=...` arguments are left to the logging setup.
///
struct CliArgs
{
    cetl::optional<sdk::BusAddress::Kind>     bus_kind;
    cetl::optional<std::string>               address;
    cetl::optional<std::string>               filter;
    cetl::optional<std::string>               config_file;
    cetl::optional<std::chrono::milliseconds> timeout;
    cetl::optional<std::size_t>               max_in_flight;
    bool                                      all_names{false};
    bool                                      list_only{false};
    bool                                      show_help{false};

    struct ParseResult
    {
        using Success = CliArgs;
        using Failure = std::string;  ///< Description of the problem.
        using Var     = cetl::variant<Success, Failure>;
    };
    static ParseResult::Var parse(const int argc, const char* const* const argv);

    static const char* usage() noexcept;
};

}  // namespace cli
}  // namespace dtui

#endif  // DTUI_CLI_CLI_ARGS_HPP_INCLUDED
