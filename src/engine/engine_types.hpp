//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_ENGINE_TYPES_HPP_INCLUDED
#define DTUI_ENGINE_TYPES_HPP_INCLUDED

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace dtui
{
namespace engine
{

/// Identifies an accepted request; never reused within a session.
///
using RequestId = std::uint64_t;

struct CallRequest
{
    std::string             service;
    std::string             path;
    std::string             interface;
    std::string             member;
    std::vector<sdk::Value> args;
};

/// Resolution of a request, as seen by the presentation.
///
struct CallOutcome
{
    struct Ok
    {
        std::vector<sdk::Value> values;
    };
    struct RemoteError
    {
        std::string name;
        std::string message;
    };
    struct LocalFailure
    {
        enum class Kind : std::uint8_t
        {
            Transport,
            Timeout,
        };

        Kind        kind;
        std::string message;
    };

    using Var = cetl::variant<Ok, RemoteError, LocalFailure>;

    static Var fromBusError(const sdk::BusError& bus_error);

    static std::string describe(const Var& outcome);

};  // CallOutcome

/// Pre-dispatch refusal of a request; nothing is sent on the bus.
///
struct Rejection
{
    enum class Kind : std::uint8_t
    {
        UnknownMember,
        ArityMismatch,
        TypeMismatch,
        NotWritable,
        NotReadable,
    };

    Kind        kind;
    std::string message;
};

const char* toString(const Rejection::Kind kind) noexcept;

}  // namespace engine
}  // namespace dtui

#endif  // DTUI_ENGINE_TYPES_HPP_INCLUDED
