//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine_types.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <string>

namespace dtui
{
namespace engine
{

CallOutcome::Var CallOutcome::fromBusError(const sdk::BusError& bus_error)
{
    switch (bus_error.kind)
    {
    case sdk::BusError::Kind::Remote:
        return RemoteError{bus_error.name, bus_error.message};
    case sdk::BusError::Kind::Timeout:
        return LocalFailure{LocalFailure::Kind::Timeout, bus_error.message};
    case sdk::BusError::Kind::Transport:
    case sdk::BusError::Kind::Disconnected:
        break;
    }
    return LocalFailure{LocalFailure::Kind::Transport, bus_error.message};
}

std::string CallOutcome::describe(const Var& outcome)
{
    return cetl::visit(cetl::make_overloaded(
                           [](const Ok& ok) {
                               //
                               return fmt::format("ok: [{}]", sdk::renderValues(ok.values));
                           },
                           [](const RemoteError& remote) {
                               //
                               return fmt::format("error {}: {}", remote.name, remote.message);
                           },
                           [](const LocalFailure& local) {
                               //
                               const char* const kind_str =
                                   (local.kind == LocalFailure::Kind::Timeout) ? "timed out" : "transport failure";
                               return local.message.empty() ? std::string{kind_str}
                                                            : fmt::format("{}: {}", kind_str, local.message);
                           }),
                       outcome);
}

const char* toString(const Rejection::Kind kind) noexcept
{
    switch (kind)
    {
    case Rejection::Kind::UnknownMember:
        return "UnknownMember";
    case Rejection::Kind::ArityMismatch:
        return "ArityMismatch";
    case Rejection::Kind::TypeMismatch:
        return "TypeMismatch";
    case Rejection::Kind::NotWritable:
        return "NotWritable";
    case Rejection::Kind::NotReadable:
        return "NotReadable";
    }
    return "?";
}

}  // namespace engine
}  // namespace dtui
