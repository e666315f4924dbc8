//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "settings.hpp"

#include "cli_args.hpp"
#include "config.hpp"

#include <dtui/sdk/bus_client.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstddef>
#include <string>

namespace dtui
{
namespace cli
{

Settings::ResolveResult::Var Settings::resolve(const CliArgs& args, const Config& config)
{
    Settings settings{{sdk::BusAddress::Kind::System, {}}, {}};

    if (args.address)
    {
        settings.bus_address = {sdk::BusAddress::Kind::Custom, *args.address};
    }
    else if (args.bus_kind)
    {
        settings.bus_address.kind = *args.bus_kind;
    }
    else if (const auto address = config.getBusAddress())
    {
        settings.bus_address = {sdk::BusAddress::Kind::Custom, *address};
    }
    else if (const auto kind = config.getBusKind())
    {
        if (*kind == "session")
        {
            settings.bus_address.kind = sdk::BusAddress::Kind::Session;
        }
        else if (*kind != "system")
        {
            return fmt::format("invalid 'bus.kind' value '{}' (expected 'system' or 'session')", *kind);
        }
    }

    auto& session             = settings.session;
    session.filter            = args.filter ? *args.filter : config.getServicesFilter().value_or("");
    session.show_unique_names = args.all_names || config.getServicesShowUniqueNames().value_or(false);

    if (args.timeout)
    {
        session.calls.timeout = *args.timeout;
    }
    else if (const auto timeout_ms = config.getCallsTimeoutMs())
    {
        if (*timeout_ms <= 0)
        {
            return fmt::format("invalid 'calls.timeout_ms' value {} (expected a positive number)", *timeout_ms);
        }
        session.calls.timeout = std::chrono::milliseconds{*timeout_ms};
    }

    if (args.max_in_flight)
    {
        session.calls.max_in_flight_per_service = *args.max_in_flight;
    }
    else if (const auto max_in_flight = config.getCallsMaxInFlightPerService())
    {
        if (*max_in_flight <= 0)
        {
            return fmt::format("invalid 'calls.max_in_flight_per_service' value {} (expected a positive number)",
                               *max_in_flight);
        }
        session.calls.max_in_flight_per_service = static_cast<std::size_t>(*max_in_flight);
    }

    return settings;
}

std::string Settings::describeBus() const
{
    switch (bus_address.kind)
    {
    case sdk::BusAddress::Kind::System:
        return "system bus";
    case sdk::BusAddress::Kind::Session:
        return "session bus";
    case sdk::BusAddress::Kind::Custom:
        break;
    }
    return fmt::format("bus at '{}'", bus_address.address);
}

}  // namespace cli
}  // namespace dtui
