//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_args.hpp"

#include <dtui/sdk/bus_client.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>

namespace dtui
{
namespace cli
{
namespace
{

bool startsWith(const std::string& str, const char* const prefix)
{
    return str.rfind(prefix, 0) == 0;
}

/// Parses a positive decimal number; empty on garbage, zero or overflow.
///
cetl::optional<std::size_t> parsePositive(const std::string& text)
{
    if (text.empty() || (text.front() < '0') || (text.front() > '9'))
    {
        return cetl::nullopt;
    }

    char* end = nullptr;
    errno     = 0;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
    const auto value = std::strtoull(text.c_str(), &end, 10);
    if ((errno != 0) || (end == nullptr) || (*end != '\0') || (value == 0))
    {
        return cetl::nullopt;
    }
    return static_cast<std::size_t>(value);
}

}  // namespace

CliArgs::ParseResult::Var CliArgs::parse(const int argc, const char* const* const argv)
{
    CliArgs args;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        const auto next_value = [argc, argv, &i, &arg]() -> cetl::optional<std::string> {
            //
            if ((i + 1) >= argc)
            {
                return cetl::nullopt;
            }
            ++i;
            return std::string{argv[i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        };

        if (startsWith(arg, "SPDLOG_LEVEL=") || startsWith(arg, "SPDLOG_FLUSH_LEVEL="))
        {
            continue;
        }
        if ((arg == "-h") || (arg == "--help"))
        {
            args.show_help = true;
        }
        else if ((arg == "system") || (arg == "session"))
        {
            if (args.bus_kind)
            {
                return fmt::format("bus is given twice ('{}')", arg);
            }
            args.bus_kind = (arg == "system") ? sdk::BusAddress::Kind::System : sdk::BusAddress::Kind::Session;
        }
        else if ((arg == "--address") || (arg == "--filter") || (arg == "--config"))
        {
            auto value = next_value();
            if (!value || value->empty())
            {
                return fmt::format("option '{}' requires a value", arg);
            }
            auto& target = (arg == "--address") ? args.address : ((arg == "--filter") ? args.filter : args.config_file);
            target       = std::move(*value);
        }
        else if ((arg == "--timeout") || (arg == "--max-in-flight"))
        {
            const auto value  = next_value();
            const auto number = value ? parsePositive(*value) : cetl::nullopt;
            if (!number)
            {
                return fmt::format("option '{}' requires a positive number", arg);
            }
            if (arg == "--timeout")
            {
                args.timeout = std::chrono::milliseconds{*number};
            }
            else
            {
                args.max_in_flight = *number;
            }
        }
        else if (arg == "--all-names")
        {
            args.all_names = true;
        }
        else if (arg == "--list")
        {
            args.list_only = true;
        }
        else
        {
            return fmt::format("unknown argument '{}'", arg);
        }
    }

    return args;
}

const char* CliArgs::usage() noexcept
{
    return "Usage: dtui [system|session] [--address ADDR] [--filter TEXT] [--all-names]\n"
           "            [--timeout MS] [--max-in-flight N] [--config FILE] [--list]\n"
           "            [SPDLOG_LEVEL=...] [SPDLOG_FLUSH_LEVEL=...]\n"
           "\n"
           "  system|session     bus to connect to (default: system)\n"
           "  --address ADDR     connect to a D-Bus address instead (like 'unix:path=/run/bus')\n"
           "  --filter TEXT      list only names containing TEXT\n"
           "  --all-names        list unique connection names (like ':1.42') too\n"
           "  --timeout MS       reply timeout of bus operations (default: 5000)\n"
           "  --max-in-flight N  concurrent operations per service (default: 4)\n"
           "  --config FILE      TOML configuration file\n"
           "  --list             print the service names and exit\n";
}

}  // namespace cli
}  // namespace dtui
