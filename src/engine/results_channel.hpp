//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_ENGINE_RESULTS_CHANNEL_HPP_INCLUDED
#define DTUI_ENGINE_RESULTS_CHANNEL_HPP_INCLUDED

#include "engine_types.hpp"

#include <dtui/sdk/bus_client.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <deque>
#include <utility>

namespace dtui
{
namespace engine
{

/// Results of bus operations, one alternative per operation kind.
///
using Payload = cetl::variant<sdk::BusClient::ListNames::Result,
                              sdk::BusClient::Introspect::Result,
                              sdk::BusClient::Call::Result,
                              sdk::BusClient::GetProperty::Result,
                              sdk::BusClient::SetProperty::Result,
                              sdk::BusClient::GetAllProperties::Result,
                              sdk::BusClient::Subscribe::Result>;

struct ResultsMessage
{
    struct Completed
    {
        RequestId id;
        Payload   payload;
    };
    struct TimedOut
    {
        RequestId id;
    };
    struct SignalArrived
    {
        RequestId        subscription_id;
        sdk::SignalEvent event;
    };

    using Var = cetl::variant<Completed, TimedOut, SignalArrived>;
};

/// FIFO between bus completions (writers) and the session (the only reader).
///
/// Writers only ever append; all state mutation happens on the reading side.
///
class ResultsChannel final
{
public:
    void post(ResultsMessage::Var&& message)
    {
        messages_.push_back(std::move(message));
    }

    /// Takes the oldest message, if any. Never blocks.
    ///
    cetl::optional<ResultsMessage::Var> tryReceive()
    {
        if (messages_.empty())
        {
            return cetl::nullopt;
        }
        auto message = std::move(messages_.front());
        messages_.pop_front();
        return cetl::optional<ResultsMessage::Var>{std::move(message)};
    }

    bool empty() const noexcept
    {
        return messages_.empty();
    }

    std::size_t size() const noexcept
    {
        return messages_.size();
    }

private:
    std::deque<ResultsMessage::Var> messages_;

};  // ResultsChannel

}  // namespace engine
}  // namespace dtui

#endif  // DTUI_ENGINE_RESULTS_CHANNEL_HPP_INCLUDED
