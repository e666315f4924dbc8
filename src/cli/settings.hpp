//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_CLI_SETTINGS_HPP_INCLUDED
#define DTUI_CLI_SETTINGS_HPP_INCLUDED

#include "cli_args.hpp"
#include "config.hpp"
#include "session.hpp"

#include <dtui/sdk/bus_client.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace dtui
{
namespace cli
{

/// Effective settings: command line options override the configuration file,
/// which overrides the defaults (system bus, 5 s timeout, 4 requests in flight per service).
///
struct Settings
{
    sdk::BusAddress          bus_address;
    engine::Session::Options session;

    struct ResolveResult
    {
        using Success = Settings;
        using Failure = std::string;
        using Var     = cetl::variant<Success, Failure>;
    };
    static ResolveResult::Var resolve(const CliArgs& args, const Config& config);

    std::string describeBus() const;
};

}  // namespace cli
}  // namespace dtui

#endif  // DTUI_CLI_SETTINGS_HPP_INCLUDED
