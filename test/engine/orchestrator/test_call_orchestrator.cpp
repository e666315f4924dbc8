//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "orchestrator/call_orchestrator.hpp"

#include "bus_client_mock.hpp"
#include "dbus_gtest_helpers.hpp"  // NOLINT(misc-include-cleaner)
#include "engine_types.hpp"
#include "results_channel.hpp"
#include "virtual_time_scheduler.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace dtui::engine;  // NOLINT This our main concern here in the unit tests.

using dtui::sdk::BusClient;
using dtui::sdk::BusError;
using dtui::sdk::MemberRef;
using dtui::sdk::SignalEvent;
using dtui::sdk::SignalMatch;
using dtui::sdk::Value;

using testing::_;
using testing::Eq;
using testing::SizeIs;
using testing::NotNull;
using testing::StrictMock;
using testing::ElementsAre;
using testing::VariantWith;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestCallOrchestrator : public testing::Test
{
protected:
    using Call = BusClient::Call;

    std::unique_ptr<CallOrchestrator> makeOrchestrator(const CallOrchestrator::Options& options)
    {
        EXPECT_CALL(bus_client_mock_, deinit()).Times(1);
        return std::make_unique<CallOrchestrator>(scheduler_,
                                                  BusClientMock::Wrapper::make(bus_client_mock_),
                                                  channel_,
                                                  options);
    }

    /// Every method call gets a stubbed sender; slots are collected in the order of calls.
    ///
    void expectCalls()
    {
        EXPECT_CALL(bus_client_mock_, callMethod(_, _))
            .WillRepeatedly([this](const MemberRef& method, const std::vector<Value>&) {
                //
                called_.push_back(method);
                auto sender_and_slot = makeStubbedSender<Call::Result>();
                call_slots_.push_back(sender_and_slot.second);
                return std::move(sender_and_slot.first);
            });
    }

    static CallRequest makeCall(const std::string& service, const std::string& member)
    {
        return CallRequest{service, "/", "com.example.Demo", member, {}};
    }

    /// Takes the next message, expecting it to be a completed call.
    ///
    cetl::optional<std::pair<RequestId, Call::Result>> receiveCallResult()
    {
        auto message = channel_.tryReceive();
        if (!message)
        {
            ADD_FAILURE() << "No message in the channel.";
            return cetl::nullopt;
        }
        auto* const completed = cetl::get_if<ResultsMessage::Completed>(&*message);
        if (completed == nullptr)
        {
            ADD_FAILURE() << "Not a completion.";
            return cetl::nullopt;
        }
        auto* const result = cetl::get_if<Call::Result>(&completed->payload);
        if (result == nullptr)
        {
            ADD_FAILURE() << "Not a call result.";
            return cetl::nullopt;
        }
        return std::make_pair(completed->id, std::move(*result));
    }

    // MARK: Data members:

    // NOLINTBEGIN
    dtui::VirtualTimeScheduler                scheduler_{};
    StrictMock<BusClientMock>                 bus_client_mock_;
    ResultsChannel                            channel_;
    std::vector<MemberRef>                    called_;
    std::vector<ReplySlot<Call::Result>::Ptr> call_slots_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestCallOrchestrator, call_completes_once)
{
    auto orchestrator = makeOrchestrator({});
    expectCalls();

    const auto id = orchestrator->call(CallRequest{"com.example.Demo",
                                                   "/com/example/Demo",
                                                   "com.example.Demo",
                                                   "Add",
                                                   {Value::makeInt32(2), Value::makeInt32(3)}});
    ASSERT_THAT(call_slots_, SizeIs(1));
    EXPECT_THAT(called_[0].path, Eq("/com/example/Demo"));
    EXPECT_THAT(called_[0].member, Eq("Add"));
    EXPECT_TRUE(call_slots_[0]->isSubmitted());
    EXPECT_TRUE(orchestrator->isPending(id));
    EXPECT_THAT(orchestrator->inFlight("com.example.Demo"), Eq(1U));
    EXPECT_TRUE(channel_.empty());

    call_slots_[0]->complete(std::vector<Value>{Value::makeInt32(5)});
    const auto received = receiveCallResult();
    ASSERT_TRUE(received);
    EXPECT_THAT(received->first, Eq(id));
    EXPECT_THAT(received->second, VariantWith<std::vector<Value>>(ElementsAre(Value::makeInt32(5))));

    EXPECT_TRUE(orchestrator->finish(id));
    EXPECT_TRUE(call_slots_[0]->is_dropped);
    EXPECT_FALSE(orchestrator->isPending(id));
    EXPECT_THAT(orchestrator->inFlight("com.example.Demo"), Eq(0U));

    // The timeout is gone together with the request.
    scheduler_.spinFor(10s);
    EXPECT_TRUE(channel_.empty());
    EXPECT_FALSE(orchestrator->finish(id));
}

TEST_F(TestCallOrchestrator, request_ids_are_unique)
{
    auto orchestrator = makeOrchestrator({});
    expectCalls();

    const auto id1 = orchestrator->call(makeCall("a.b", "M"));
    const auto id2 = orchestrator->call(makeCall("a.b", "M"));
    EXPECT_THAT(id1, testing::Ne(id2));
    EXPECT_TRUE(orchestrator->cancel(id1));
    EXPECT_THAT(orchestrator->call(makeCall("a.b", "M")), testing::AllOf(testing::Ne(id1), testing::Ne(id2)));
}

TEST_F(TestCallOrchestrator, timeout)
{
    auto orchestrator = makeOrchestrator({250ms, 4});
    expectCalls();

    const auto id = orchestrator->call(makeCall("a.b", "Slow"));

    scheduler_.spinFor(249ms);
    EXPECT_TRUE(channel_.empty());

    scheduler_.spinFor(1ms);
    auto message = channel_.tryReceive();
    ASSERT_TRUE(message);
    EXPECT_THAT(*message, VariantWith<ResultsMessage::TimedOut>(testing::Field(&ResultsMessage::TimedOut::id, id)));

    // Releasing a timed out request cancels its operation.
    EXPECT_TRUE(orchestrator->finish(id));
    EXPECT_TRUE(call_slots_[0]->is_dropped);

    // A reply racing with the timeout still lands in the channel, but the request is already unknown.
    call_slots_[0]->complete(std::vector<Value>{});
    const auto late = receiveCallResult();
    ASSERT_TRUE(late);
    EXPECT_FALSE(orchestrator->finish(late->first));
}

TEST_F(TestCallOrchestrator, timeout_starts_on_dispatch)
{
    auto orchestrator = makeOrchestrator({1s, 1});
    expectCalls();

    const auto first  = orchestrator->call(makeCall("a.b", "First"));
    const auto second = orchestrator->call(makeCall("a.b", "Second"));
    ASSERT_THAT(call_slots_, SizeIs(1));

    scheduler_.spinFor(600ms);
    call_slots_[0]->complete(std::vector<Value>{});
    const auto received = receiveCallResult();
    ASSERT_TRUE(received);
    EXPECT_THAT(received->first, Eq(first));
    EXPECT_TRUE(orchestrator->finish(first));
    ASSERT_THAT(call_slots_, SizeIs(2));

    // 1s since enqueue, but only 400ms since dispatch.
    scheduler_.spinFor(400ms);
    EXPECT_TRUE(channel_.empty());

    scheduler_.spinFor(600ms);
    auto message = channel_.tryReceive();
    ASSERT_TRUE(message);
    EXPECT_THAT(*message,
                VariantWith<ResultsMessage::TimedOut>(testing::Field(&ResultsMessage::TimedOut::id, second)));
}

TEST_F(TestCallOrchestrator, in_flight_cap_is_per_service_and_fifo)
{
    auto orchestrator = makeOrchestrator({5s, 2});
    expectCalls();

    std::vector<RequestId> ids;
    for (int index = 0; index < 5; ++index)
    {
        ids.push_back(orchestrator->call(makeCall("a.b", "M" + std::to_string(index))));
    }
    const auto other_id = orchestrator->call(makeCall("c.d", "Other"));

    // Two for `a.b` plus one for `c.d`.
    ASSERT_THAT(call_slots_, SizeIs(3));
    EXPECT_THAT(called_[0].member, Eq("M0"));
    EXPECT_THAT(called_[1].member, Eq("M1"));
    EXPECT_THAT(called_[2].member, Eq("Other"));
    EXPECT_THAT(orchestrator->inFlight("a.b"), Eq(2U));
    EXPECT_THAT(orchestrator->queued("a.b"), Eq(3U));
    EXPECT_THAT(orchestrator->inFlight("c.d"), Eq(1U));
    EXPECT_THAT(orchestrator->queued("c.d"), Eq(0U));

    // Completion alone doesn't release the slot; finishing does.
    call_slots_[1]->complete(std::vector<Value>{});
    EXPECT_THAT(call_slots_, SizeIs(3));
    EXPECT_TRUE(orchestrator->finish(ids[1]));
    ASSERT_THAT(call_slots_, SizeIs(4));
    EXPECT_THAT(called_[3].member, Eq("M2"));

    // A cancelled queued request is never dispatched.
    EXPECT_TRUE(orchestrator->cancel(ids[3]));
    EXPECT_FALSE(orchestrator->isPending(ids[3]));
    EXPECT_THAT(orchestrator->queued("a.b"), Eq(1U));

    EXPECT_TRUE(orchestrator->finish(ids[0]));
    ASSERT_THAT(call_slots_, SizeIs(5));
    EXPECT_THAT(called_[4].member, Eq("M4"));
    EXPECT_THAT(orchestrator->queued("a.b"), Eq(0U));
    EXPECT_THAT(orchestrator->inFlight("a.b"), Eq(2U));

    EXPECT_TRUE(orchestrator->cancel(other_id));
    EXPECT_THAT(orchestrator->inFlight("c.d"), Eq(0U));
}

TEST_F(TestCallOrchestrator, idle_destinations_are_forgotten)
{
    auto orchestrator = makeOrchestrator({5s, 2});
    expectCalls();

    for (int index = 0; index < 10; ++index)
    {
        const auto service = "com.example.Peer" + std::to_string(index);
        const auto first   = orchestrator->call(makeCall(service, "First"));
        const auto second  = orchestrator->call(makeCall(service, "Second"));
        EXPECT_THAT(orchestrator->busyDestinations(), Eq(1U));

        EXPECT_TRUE(orchestrator->finish(first));
        EXPECT_THAT(orchestrator->inFlight(service), Eq(1U));
        EXPECT_THAT(orchestrator->busyDestinations(), Eq(1U));

        EXPECT_TRUE(orchestrator->cancel(second));
        EXPECT_THAT(orchestrator->inFlight(service), Eq(0U));
        EXPECT_THAT(orchestrator->busyDestinations(), Eq(0U));
    }
    EXPECT_THAT(call_slots_, SizeIs(20));

    // A destination which went idle takes new requests as usual.
    (void) orchestrator->call(makeCall("com.example.Peer0", "Again"));
    EXPECT_THAT(orchestrator->inFlight("com.example.Peer0"), Eq(1U));
    EXPECT_THAT(orchestrator->busyDestinations(), Eq(1U));
}

TEST_F(TestCallOrchestrator, zero_cap_is_treated_as_one)
{
    auto orchestrator = makeOrchestrator({5s, 0});
    expectCalls();

    EXPECT_THAT(orchestrator->options().max_in_flight_per_service, Eq(1U));
    (void) orchestrator->call(makeCall("a.b", "M0"));
    (void) orchestrator->call(makeCall("a.b", "M1"));
    EXPECT_THAT(call_slots_, SizeIs(1));
    EXPECT_THAT(orchestrator->queued("a.b"), Eq(1U));
}

TEST_F(TestCallOrchestrator, cancel_in_flight)
{
    auto orchestrator = makeOrchestrator({5s, 1});
    expectCalls();

    const auto first  = orchestrator->call(makeCall("a.b", "First"));
    const auto second = orchestrator->call(makeCall("a.b", "Second"));
    ASSERT_THAT(call_slots_, SizeIs(1));

    EXPECT_TRUE(orchestrator->cancel(first));
    EXPECT_TRUE(call_slots_[0]->is_dropped);
    EXPECT_FALSE(orchestrator->isPending(first));
    EXPECT_FALSE(orchestrator->cancel(first));

    // The freed slot goes to the next one.
    ASSERT_THAT(call_slots_, SizeIs(2));
    EXPECT_TRUE(orchestrator->isPending(second));

    // The cancelled request never times out.
    scheduler_.spinFor(4s);
    EXPECT_TRUE(channel_.empty());
    scheduler_.spinFor(1s);
    auto message = channel_.tryReceive();
    ASSERT_TRUE(message);
    EXPECT_THAT(*message,
                VariantWith<ResultsMessage::TimedOut>(testing::Field(&ResultsMessage::TimedOut::id, second)));
    EXPECT_TRUE(channel_.empty());
}

TEST_F(TestCallOrchestrator, bus_daemon_operations)
{
    auto orchestrator = makeOrchestrator({});

    auto names = makeStubbedSender<BusClient::ListNames::Result>();
    EXPECT_CALL(bus_client_mock_, listNames()).WillOnce([&names] { return std::move(names.first); });
    const auto list_id = orchestrator->listNames();
    EXPECT_THAT(orchestrator->inFlight("org.freedesktop.DBus"), Eq(1U));

    auto xml = makeStubbedSender<BusClient::Introspect::Result>();
    EXPECT_CALL(bus_client_mock_, introspect("com.example.Demo", "/com")).WillOnce([&xml](auto&&...) {
        //
        return std::move(xml.first);
    });
    const auto introspect_id = orchestrator->introspect("com.example.Demo", "/com");
    EXPECT_THAT(orchestrator->inFlight("com.example.Demo"), Eq(1U));

    names.second->complete(BusError{BusError::Kind::Disconnected, "", "gone"});
    xml.second->complete(std::string{"<node/>"});

    auto first = channel_.tryReceive();
    ASSERT_TRUE(first);
    const auto* const listed = cetl::get_if<ResultsMessage::Completed>(&*first);
    ASSERT_THAT(listed, NotNull());
    EXPECT_THAT(listed->id, Eq(list_id));
    EXPECT_THAT(listed->payload, VariantWith<BusClient::ListNames::Result>(VariantWith<BusError>(testing::_)));

    auto second = channel_.tryReceive();
    ASSERT_TRUE(second);
    const auto* const introspected = cetl::get_if<ResultsMessage::Completed>(&*second);
    ASSERT_THAT(introspected, NotNull());
    EXPECT_THAT(introspected->id, Eq(introspect_id));
    EXPECT_THAT(introspected->payload,
                VariantWith<BusClient::Introspect::Result>(VariantWith<std::string>(Eq("<node/>"))));
}

TEST_F(TestCallOrchestrator, subscription_lifecycle)
{
    auto orchestrator = makeOrchestrator({});

    auto subscribe  = makeStubbedSender<BusClient::Subscribe::Result>();
    auto is_removed = std::make_shared<bool>(false);
    EXPECT_CALL(bus_client_mock_, subscribeSignal(testing::Field(&SignalMatch::member, "Changed"), _))
        .WillOnce([&subscribe](auto&&...) { return std::move(subscribe.first); });

    const auto id = orchestrator->subscribe(SignalMatch{"com.example.Demo", "", "com.example.Demo", "Changed"});
    EXPECT_THAT(orchestrator->inFlight("org.freedesktop.DBus"), Eq(1U));
    EXPECT_FALSE(orchestrator->isSubscribed(id));

    subscribe.second->complete(BusClient::Subscription::Ptr{std::make_unique<SubscriptionStub>(is_removed)});
    auto message = channel_.tryReceive();
    ASSERT_TRUE(message);
    auto* const completed = cetl::get_if<ResultsMessage::Completed>(&*message);
    ASSERT_THAT(completed, NotNull());
    auto* const result = cetl::get_if<BusClient::Subscribe::Result>(&completed->payload);
    ASSERT_THAT(result, NotNull());
    auto* const subscription = cetl::get_if<BusClient::Subscription::Ptr>(result);
    ASSERT_THAT(subscription, NotNull());

    EXPECT_TRUE(orchestrator->finish(id));
    orchestrator->adoptSubscription(id, std::move(*subscription));
    EXPECT_TRUE(orchestrator->isSubscribed(id));
    EXPECT_FALSE(*is_removed);

    ASSERT_TRUE(bus_client_mock_.signal_handler_);
    bus_client_mock_.signal_handler_(SignalEvent{":1.7", "/", "com.example.Demo", "Changed", {Value::makeInt32(1)}});
    auto signal = channel_.tryReceive();
    ASSERT_TRUE(signal);
    const auto* const arrived = cetl::get_if<ResultsMessage::SignalArrived>(&*signal);
    ASSERT_THAT(arrived, NotNull());
    EXPECT_THAT(arrived->subscription_id, Eq(id));
    EXPECT_THAT(arrived->event.args, ElementsAre(Value::makeInt32(1)));

    EXPECT_TRUE(orchestrator->cancel(id));
    EXPECT_TRUE(*is_removed);
    EXPECT_FALSE(orchestrator->isSubscribed(id));
}

TEST_F(TestCallOrchestrator, destruction_cancels_everything)
{
    auto orchestrator = makeOrchestrator({5s, 1});
    expectCalls();

    (void) orchestrator->call(makeCall("a.b", "First"));
    (void) orchestrator->call(makeCall("a.b", "Second"));
    ASSERT_THAT(call_slots_, SizeIs(1));

    orchestrator.reset();
    EXPECT_TRUE(call_slots_[0]->is_dropped);
    EXPECT_THAT(call_slots_, SizeIs(1));

    scheduler_.spinFor(10s);
    EXPECT_TRUE(channel_.empty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
