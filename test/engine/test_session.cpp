//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session.hpp"

#include "dbus/value_parser.hpp"
#include "dbus_gtest_helpers.hpp"
#include "demo_bus_client.hpp"
#include "engine_types.hpp"
#include "topology/topology_tree.hpp"
#include "virtual_time_scheduler.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace
{

using namespace dtui::engine;  // NOLINT This our main concern here in the unit tests.

using dtui::common::dbus::ValueParser;
using dtui::sdk::BusClient;
using dtui::sdk::BusError;
using dtui::sdk::MemberRef;
using dtui::sdk::SignalEvent;
using dtui::sdk::Value;
using dtui::sdk::RendersAs;

using testing::Eq;
using testing::IsEmpty;
using testing::NotNull;
using testing::SizeIs;
using testing::HasSubstr;
using testing::ElementsAre;

using std::literals::chrono_literals::operator""ms;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

constexpr const char* Demo     = "com.example.Demo";
constexpr const char* Wide     = "com.example.Wide";
constexpr const char* CalcPath = "/calc";
constexpr const char* Calc     = "com.example.Calc";

constexpr const char* RootXml = R"(<node><node name="calc"/></node>)";

constexpr const char* CalcXml = R"(<node>
  <interface name="com.example.Calc">
    <method name="Add">
      <arg name="a" type="i" direction="in"/>
      <arg name="b" type="i" direction="in"/>
      <arg name="sum" type="i" direction="out"/>
    </method>
    <method name="Fail"/>
    <method name="Slow"/>
    <property name="Volume" type="d" access="readwrite"/>
    <property name="Serial" type="s" access="read"/>
    <property name="Secret" type="s" access="write"/>
    <signal name="Changed">
      <arg name="what" type="s"/>
    </signal>
  </interface>
</node>)";

class TestSession : public testing::Test
{
protected:
    void SetUp() override
    {
        bus_ = std::make_shared<DemoBusClient>(scheduler_);
        bus_->names = {Wide, ":1.7", Demo, "org.freedesktop.DBus", Demo};

        bus_->documents[{Demo, "/"}]      = RootXml;
        bus_->documents[{Demo, CalcPath}] = CalcXml;

        bus_->methods[std::make_tuple(Demo, Calc, "Add")] = [](const std::vector<Value>& args) {
            //
            const auto* const lhs = args.at(0).getIf<Value::Int>();
            const auto* const rhs = args.at(1).getIf<Value::Int>();
            return BusClient::Call::Result{BusClient::Call::Success{
                Value::makeInt32(static_cast<std::int32_t>(lhs->signed_value + rhs->signed_value))}};
        };
        bus_->methods[std::make_tuple(Demo, Calc, "Fail")] = [](const std::vector<Value>&) {
            //
            return BusClient::Call::Result{BusError{BusError::Kind::Remote, "com.example.Error.Nope", "nope"}};
        };
        bus_->stalled_members.insert("Slow");

        bus_->properties.emplace(std::make_tuple(Demo, Calc, "Volume"), Value::makeDouble(0.5));
        bus_->properties.emplace(std::make_tuple(Demo, Calc, "Serial"), Value::makeString("SN-1"));

        std::string wide_root = "<node>";
        for (int index = 0; index < 10; ++index)
        {
            const auto segment = "n" + std::to_string(index);
            wide_root += "<node name=\"" + segment + "\"/>";
            if (index != 3)
            {
                bus_->documents[{Wide, "/" + segment}] = "<node/>";
            }
        }
        bus_->documents[{Wide, "/"}] = wide_root + "</node>";
    }

    Session& makeSession(Session::Options options = {})
    {
        options.calls.timeout = 250ms;
        session_              = std::make_unique<Session>(scheduler_, bus_, options);
        return *session_;
    }

    std::vector<Event::Var> spinAndPoll()
    {
        scheduler_.spin();
        return session_->poll();
    }

    /// Spins until nothing is pending, which also lets queued requests through the in-flight cap.
    std::vector<Event::Var> drain()
    {
        std::vector<Event::Var> all_events;
        for (int attempt = 0; (attempt < 100) && (session_->pendingCount() > 0); ++attempt)
        {
            auto events = spinAndPoll();
            std::move(events.begin(), events.end(), std::back_inserter(all_events));
        }
        return all_events;
    }

    void listServices()
    {
        (void) session_->refreshServices();
        const auto events = spinAndPoll();
        ASSERT_THAT(events, SizeIs(1));
        const auto* const listed = cetl::get_if<Event::ServicesListed>(&events.front());
        ASSERT_THAT(listed, NotNull());
        ASSERT_FALSE(listed->error);
    }

    void populate(const std::string& service, const std::string& path)
    {
        ASSERT_TRUE(session_->expand(service, path));
        const auto events = spinAndPoll();
        ASSERT_THAT(events, SizeIs(1));
        ASSERT_THAT(stateOf(service, path), Eq(FetchState::Populated));
    }

    void populateDemo()
    {
        listServices();
        populate(Demo, "/");
        populate(Demo, CalcPath);
    }

    FetchState stateOf(const std::string& service, const std::string& path) const
    {
        const auto* const node = session_->topology().findNode(service, path);
        EXPECT_THAT(node, NotNull()) << service << " " << path;
        return (node != nullptr) ? node->state : FetchState::Errored;
    }

    static RequestId accepted(const Session::Submit::Var& submitted)
    {
        const auto* const request_id = cetl::get_if<RequestId>(&submitted);
        EXPECT_THAT(request_id, NotNull());
        return (request_id != nullptr) ? *request_id : 0;
    }

    static Rejection::Kind rejected(const Session::Submit::Var& submitted)
    {
        const auto* const rejection = cetl::get_if<Rejection>(&submitted);
        EXPECT_THAT(rejection, NotNull());
        return (rejection != nullptr) ? rejection->kind : Rejection::Kind::UnknownMember;
    }

    /// Expects exactly one `OperationCompleted` event for the given request, and returns its outcome.
    static CallOutcome::Var outcomeOf(const std::vector<Event::Var>& events, const RequestId request_id)
    {
        EXPECT_THAT(events, SizeIs(1));
        for (const auto& event : events)
        {
            if (const auto* const completed = cetl::get_if<Event::OperationCompleted>(&event))
            {
                EXPECT_THAT(completed->id, Eq(request_id));
                return completed->outcome;
            }
        }
        ADD_FAILURE() << "No outcome of request #" << request_id;
        return CallOutcome::LocalFailure{CallOutcome::LocalFailure::Kind::Transport, "missing"};
    }

    static MemberRef calcMember(const char* const member)
    {
        return MemberRef{Demo, CalcPath, Calc, member};
    }

    // MARK: Data members:

    // NOLINTBEGIN
    dtui::VirtualTimeScheduler     scheduler_{};
    std::shared_ptr<DemoBusClient> bus_;
    std::unique_ptr<Session>       session_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestSession, listing_hides_unique_names_then_sorts_and_deduplicates)
{
    auto& session = makeSession();
    EXPECT_THAT(session.services(), IsEmpty());

    listServices();
    EXPECT_THAT(session.services(), ElementsAre(Demo, Wide, "org.freedesktop.DBus"));
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Unfetched));
    EXPECT_THAT(session.pendingCount(), Eq(0U));
}

TEST_F(TestSession, listing_filter_and_unique_names)
{
    Session::Options options;
    options.filter            = "example";
    auto& session             = makeSession(options);
    listServices();
    EXPECT_THAT(session.services(), ElementsAre(Demo, Wide));

    options.filter            = "";
    options.show_unique_names = true;
    auto& other               = makeSession(options);
    listServices();
    EXPECT_THAT(other.services(), ElementsAre(":1.7", Demo, Wide, "org.freedesktop.DBus"));
}

TEST_F(TestSession, listing_failures_keep_old_services)
{
    auto& session = makeSession();
    listServices();

    bus_->is_listing_stalled = true;
    const auto request_id    = session.refreshServices();
    EXPECT_TRUE(session.isPending(request_id));

    scheduler_.spinFor(250ms);
    const auto events = session.poll();
    ASSERT_THAT(events, SizeIs(1));
    const auto* const listed = cetl::get_if<Event::ServicesListed>(&events.front());
    ASSERT_THAT(listed, NotNull());
    ASSERT_TRUE(listed->error);
    EXPECT_THAT(listed->error->kind, Eq(BusError::Kind::Timeout));
    EXPECT_THAT(listed->error->message, Eq("no reply within 250 ms"));

    EXPECT_THAT(session.services(), SizeIs(3));
    EXPECT_FALSE(session.isPending(request_id));
}

TEST_F(TestSession, nodes_stay_unfetched_until_expanded)
{
    auto& session = makeSession();
    listServices();
    EXPECT_THAT(bus_->introspect_counts, IsEmpty());

    EXPECT_TRUE(session.expand(Demo, "/"));
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Fetching));

    // Double expand produces exactly one introspection.
    EXPECT_FALSE(session.expand(Demo, "/"));

    const auto events = spinAndPoll();
    ASSERT_THAT(events, SizeIs(1));
    const auto* const changed = cetl::get_if<Event::NodeChanged>(&events.front());
    ASSERT_THAT(changed, NotNull());
    EXPECT_THAT(changed->service, Eq(Demo));
    EXPECT_THAT(changed->path, Eq("/"));

    EXPECT_THAT(bus_->introspect_counts.at({Demo, "/"}), Eq(1U));
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Populated));
    EXPECT_THAT(stateOf(Demo, CalcPath), Eq(FetchState::Unfetched));
    EXPECT_THAT(bus_->introspect_counts.count({Demo, CalcPath}), Eq(0U));

    // Expanding a populated node is a no-op; refreshing re-fetches it.
    EXPECT_FALSE(session.expand(Demo, "/"));
    EXPECT_TRUE(session.refresh(Demo, "/"));
    EXPECT_FALSE(session.refresh(Demo, "/"));
    EXPECT_THAT(spinAndPoll(), SizeIs(1));
    EXPECT_THAT(bus_->introspect_counts.at({Demo, "/"}), Eq(2U));

    EXPECT_FALSE(session.expand(Demo, "/nowhere"));
    EXPECT_FALSE(session.expand("com.example.Missing", "/"));
}

TEST_F(TestSession, failure_of_one_node_leaves_siblings_intact)
{
    auto& session = makeSession();
    listServices();
    populate(Wide, "/");

    const auto children = session.topology().childrenOf(Wide, "/");
    ASSERT_THAT(children, SizeIs(10));
    for (const auto* const child : children)
    {
        EXPECT_TRUE(session.expand(Wide, child->path));
    }
    EXPECT_THAT(drain(), SizeIs(10));

    std::size_t populated = 0;
    for (const auto* const child : session.topology().childrenOf(Wide, "/"))
    {
        if (child->path == "/n3")
        {
            EXPECT_THAT(child->state, Eq(FetchState::Errored));
            EXPECT_THAT(child->error, HasSubstr("org.freedesktop.DBus.Error.UnknownObject"));
            continue;
        }
        EXPECT_THAT(child->state, Eq(FetchState::Populated)) << child->path;
        ++populated;
    }
    EXPECT_THAT(populated, Eq(9U));
    EXPECT_THAT(stateOf(Wide, "/"), Eq(FetchState::Populated));

    // The errored node can be retried.
    bus_->documents[{Wide, "/n3"}] = "<node/>";
    EXPECT_TRUE(session.refresh(Wide, "/n3"));
    EXPECT_THAT(spinAndPoll(), SizeIs(1));
    EXPECT_THAT(stateOf(Wide, "/n3"), Eq(FetchState::Populated));
}

TEST_F(TestSession, bad_introspection_marks_node_errored)
{
    auto& session                 = makeSession();
    bus_->documents[{Demo, "/"}]  = R"(<node><interface name="i.X"><method name="M"><arg type="(("/></method></interface></node>)";
    listServices();

    EXPECT_TRUE(session.expand(Demo, "/"));
    EXPECT_THAT(spinAndPoll(), SizeIs(1));
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Errored));
    EXPECT_THAT(session.topology().findNode(Demo, "/")->error, HasSubstr("bad introspection data"));
}

TEST_F(TestSession, fetch_timeout_marks_node_errored)
{
    auto& session = makeSession();
    listServices();
    bus_->stalled_paths.insert({Demo, "/"});

    EXPECT_TRUE(session.expand(Demo, "/"));
    scheduler_.spinFor(249ms);
    EXPECT_THAT(session.poll(), IsEmpty());

    scheduler_.spinFor(1ms);
    EXPECT_THAT(session.poll(), SizeIs(1));
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Errored));
    EXPECT_THAT(session.topology().findNode(Demo, "/")->error, Eq("timed out: no reply within 250 ms"));
}

TEST_F(TestSession, cancelled_fetch_restores_previous_state)
{
    auto& session = makeSession();
    listServices();
    bus_->stalled_paths.insert({Demo, "/"});

    EXPECT_FALSE(session.cancelFetch(Demo, "/"));
    EXPECT_TRUE(session.expand(Demo, "/"));
    EXPECT_TRUE(session.cancelFetch(Demo, "/"));
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Unfetched));
    EXPECT_THAT(session.pendingCount(), Eq(0U));

    // No timeout is reported for the cancelled fetch.
    scheduler_.spinFor(1000ms);
    EXPECT_THAT(session.poll(), IsEmpty());

    bus_->stalled_paths.clear();
    populate(Demo, "/");
}

TEST_F(TestSession, stale_fetch_reply_is_dropped_after_cancel)
{
    auto& session = makeSession();
    listServices();

    // The reply is already queued for the session when its fetch is cancelled.
    EXPECT_TRUE(session.expand(Demo, "/"));
    scheduler_.spin();
    EXPECT_TRUE(session.cancelFetch(Demo, "/"));

    bus_->documents[{Demo, "/"}] = R"(<node><node name="calc"/><node name="extra"/></node>)";
    bus_->stalled_paths.insert({Demo, "/"});
    EXPECT_TRUE(session.expand(Demo, "/"));

    EXPECT_THAT(session.poll(), IsEmpty());
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Fetching));
    EXPECT_THAT(session.topology().findNode(Demo, "/")->children, IsEmpty());
    EXPECT_THAT(session.pendingCount(), Eq(1U));

    EXPECT_TRUE(session.cancelFetch(Demo, "/"));
    bus_->stalled_paths.clear();
    populate(Demo, "/");
    EXPECT_THAT(session.topology().findNode(Demo, "/")->children, ElementsAre("calc", "extra"));
    EXPECT_THAT((bus_->introspect_counts[{Demo, "/"}]), Eq(3U));
}

TEST_F(TestSession, relisting_is_a_full_refresh)
{
    auto& session = makeSession();
    populateDemo();
    bus_->stalled_paths.insert({Wide, "/"});
    EXPECT_TRUE(session.expand(Wide, "/"));

    listServices();
    EXPECT_THAT(session.pendingCount(), Eq(0U));
    EXPECT_THAT(stateOf(Demo, "/"), Eq(FetchState::Unfetched));
    EXPECT_THAT(stateOf(Wide, "/"), Eq(FetchState::Unfetched));
    EXPECT_THAT(session.topology().findNode(Demo, CalcPath), testing::IsNull());
}

TEST_F(TestSession, demo_call_end_to_end)
{
    auto& session = makeSession();
    populateDemo();

    const auto* const method = session.findMethod(calcMember("Add"));
    ASSERT_THAT(method, NotNull());

    auto parsed = ValueParser::parseArguments("(2,3)", method->inSignatures());
    auto* const args = cetl::get_if<ValueParser::ArgumentsResult::Success>(&parsed);
    ASSERT_THAT(args, NotNull());

    const auto request_id = accepted(session.submitCall({Demo, CalcPath, Calc, "Add", *args}));
    EXPECT_TRUE(session.isPending(request_id));

    const auto outcome = outcomeOf(spinAndPoll(), request_id);
    const auto* const ok = cetl::get_if<CallOutcome::Ok>(&outcome);
    ASSERT_THAT(ok, NotNull());
    EXPECT_THAT(ok->values, ElementsAre(Value::makeInt32(5)));
    EXPECT_THAT(CallOutcome::describe(outcome), Eq("ok: [5]"));
    EXPECT_FALSE(session.isPending(request_id));

    // Exactly one outcome.
    scheduler_.spinFor(1000ms);
    EXPECT_THAT(session.poll(), IsEmpty());
}

TEST_F(TestSession, remote_errors_are_reported_as_such)
{
    auto& session = makeSession();
    populateDemo();

    const auto request_id = accepted(session.submitCall({Demo, CalcPath, Calc, "Fail", {}}));

    const auto outcome = outcomeOf(spinAndPoll(), request_id);
    const auto* const error = cetl::get_if<CallOutcome::RemoteError>(&outcome);
    ASSERT_THAT(error, NotNull());
    EXPECT_THAT(error->name, Eq("com.example.Error.Nope"));
    EXPECT_THAT(error->message, Eq("nope"));
}

TEST_F(TestSession, calls_are_validated_before_dispatch)
{
    auto& session = makeSession();
    listServices();

    // Not introspected yet.
    const auto two_ints = std::vector<Value>{Value::makeInt32(2), Value::makeInt32(3)};
    EXPECT_THAT(rejected(session.submitCall({Demo, CalcPath, Calc, "Add", two_ints})),
                Eq(Rejection::Kind::UnknownMember));

    populate(Demo, "/");
    populate(Demo, CalcPath);

    EXPECT_THAT(rejected(session.submitCall({Demo, CalcPath, Calc, "Sub", two_ints})),
                Eq(Rejection::Kind::UnknownMember));
    EXPECT_THAT(rejected(session.submitCall({Demo, CalcPath, "com.example.Other", "Add", two_ints})),
                Eq(Rejection::Kind::UnknownMember));
    EXPECT_THAT(rejected(session.submitCall({Demo, CalcPath, Calc, "Add", {Value::makeInt32(2)}})),
                Eq(Rejection::Kind::ArityMismatch));
    EXPECT_THAT(rejected(session.submitCall({Demo, CalcPath, Calc, "Add", {Value::makeInt32(2), Value::makeString("3")}})),
                Eq(Rejection::Kind::TypeMismatch));
    EXPECT_THAT(rejected(session.submitCall({Demo, CalcPath, Calc, "Add", {Value::makeInt32(2), Value::makeInt64(3)}})),
                Eq(Rejection::Kind::TypeMismatch));

    const auto submitted = session.submitCall({Demo, CalcPath, Calc, "Add", {Value::makeInt32(2)}});
    const auto* const rejection = cetl::get_if<Rejection>(&submitted);
    ASSERT_THAT(rejection, NotNull());
    EXPECT_THAT(rejection->message, HasSubstr("takes 2 argument(s), 1 given"));

    EXPECT_THAT(bus_->calls_count, Eq(0U));
    EXPECT_THAT(session.pendingCount(), Eq(0U));
    EXPECT_THAT(spinAndPoll(), IsEmpty());
}

TEST_F(TestSession, cancelled_call_never_completes)
{
    auto& session = makeSession();
    populateDemo();

    const std::vector<Value> args{Value::makeInt32(2), Value::makeInt32(3)};

    // Cancelled before the transport completes.
    const auto early_id = accepted(session.submitCall({Demo, CalcPath, Calc, "Add", args}));
    EXPECT_TRUE(session.cancel(early_id));
    EXPECT_FALSE(session.isPending(early_id));
    EXPECT_THAT(spinAndPoll(), IsEmpty());

    // Cancelled after the transport has completed, but before the result is applied.
    const auto late_id = accepted(session.submitCall({Demo, CalcPath, Calc, "Add", args}));
    scheduler_.spin();
    EXPECT_TRUE(session.cancel(late_id));
    EXPECT_THAT(session.poll(), IsEmpty());

    // Cancelled ids stay cancelled.
    EXPECT_FALSE(session.cancel(late_id));
    EXPECT_FALSE(session.cancel(12345));
    scheduler_.spinFor(1000ms);
    EXPECT_THAT(session.poll(), IsEmpty());
    EXPECT_THAT(session.pendingCount(), Eq(0U));
}

TEST_F(TestSession, call_timeout)
{
    auto& session = makeSession();
    populateDemo();

    const auto request_id = accepted(session.submitCall({Demo, CalcPath, Calc, "Slow", {}}));
    scheduler_.spinFor(249ms);
    EXPECT_THAT(session.poll(), IsEmpty());
    EXPECT_TRUE(session.isPending(request_id));

    scheduler_.spinFor(1ms);
    const auto outcome = outcomeOf(session.poll(), request_id);
    const auto* const failure = cetl::get_if<CallOutcome::LocalFailure>(&outcome);
    ASSERT_THAT(failure, NotNull());
    EXPECT_THAT(failure->kind, Eq(CallOutcome::LocalFailure::Kind::Timeout));
    EXPECT_THAT(CallOutcome::describe(outcome), Eq("timed out: no reply within 250 ms"));
    EXPECT_FALSE(session.isPending(request_id));
}

TEST_F(TestSession, in_flight_cap_queues_excess_calls)
{
    Session::Options options;
    options.calls.max_in_flight_per_service = 2;
    auto& session                           = makeSession(options);
    populateDemo();

    const auto slow1 = accepted(session.submitCall({Demo, CalcPath, Calc, "Slow", {}}));
    const auto slow2 = accepted(session.submitCall({Demo, CalcPath, Calc, "Slow", {}}));
    const auto fast  = accepted(session.submitCall({Demo, CalcPath, Calc, "Fail", {}}));
    EXPECT_THAT(bus_->calls_count, Eq(2U));
    EXPECT_THAT(spinAndPoll(), IsEmpty());

    // A freed slot dispatches the queued call.
    EXPECT_TRUE(session.cancel(slow1));
    EXPECT_THAT(bus_->calls_count, Eq(3U));
    const auto outcome = outcomeOf(spinAndPoll(), fast);
    EXPECT_THAT(cetl::get_if<CallOutcome::RemoteError>(&outcome), NotNull());
    EXPECT_TRUE(session.isPending(slow2));
}

TEST_F(TestSession, properties)
{
    auto& session = makeSession();
    populateDemo();

    const auto get_id  = accepted(session.getProperty(calcMember("Volume")));
    const auto outcome = outcomeOf(spinAndPoll(), get_id);
    const auto* ok     = cetl::get_if<CallOutcome::Ok>(&outcome);
    ASSERT_THAT(ok, NotNull());
    EXPECT_THAT(ok->values, ElementsAre(Value::makeDouble(0.5)));

    const auto set_id     = accepted(session.setProperty(calcMember("Volume"), Value::makeDouble(0.75)));
    const auto set_result = outcomeOf(spinAndPoll(), set_id);
    ok                    = cetl::get_if<CallOutcome::Ok>(&set_result);
    ASSERT_THAT(ok, NotNull());
    EXPECT_THAT(ok->values, IsEmpty());
    EXPECT_THAT(bus_->properties.at(std::make_tuple(Demo, Calc, "Volume")), Eq(Value::makeDouble(0.75)));

    const auto all_id     = accepted(session.getAllProperties(Demo, CalcPath, Calc));
    const auto all_result = outcomeOf(spinAndPoll(), all_id);
    ok                    = cetl::get_if<CallOutcome::Ok>(&all_result);
    ASSERT_THAT(ok, NotNull());
    ASSERT_THAT(ok->values, SizeIs(1));
    EXPECT_THAT(ok->values.front().signature(), RendersAs("a{sv}"));
    EXPECT_THAT(ok->values.front(), RendersAs(R"({"Serial": <s>"SN-1", "Volume": <d>0.75})"));
}

TEST_F(TestSession, properties_are_validated_before_dispatch)
{
    auto& session = makeSession();
    populateDemo();

    EXPECT_THAT(rejected(session.getProperty(calcMember("Missing"))), Eq(Rejection::Kind::UnknownMember));
    EXPECT_THAT(rejected(session.getProperty(calcMember("Secret"))), Eq(Rejection::Kind::NotReadable));
    EXPECT_THAT(rejected(session.setProperty(calcMember("Serial"), Value::makeString("x"))),
                Eq(Rejection::Kind::NotWritable));
    EXPECT_THAT(rejected(session.setProperty(calcMember("Volume"), Value::makeString("loud"))),
                Eq(Rejection::Kind::TypeMismatch));
    EXPECT_THAT(rejected(session.setProperty(calcMember("Missing"), Value::makeDouble(1.0))),
                Eq(Rejection::Kind::UnknownMember));
    EXPECT_THAT(rejected(session.getAllProperties(Demo, CalcPath, "com.example.Other")),
                Eq(Rejection::Kind::UnknownMember));

    // Strings have to be valid UTF-8 to be sent at all.
    EXPECT_THAT(rejected(session.setProperty(calcMember("Secret"), Value::makeString("\xFF\xFE"))),
                Eq(Rejection::Kind::TypeMismatch));

    // Write-only properties can still be written.
    (void) accepted(session.setProperty(calcMember("Secret"), Value::makeString("x")));
    EXPECT_THAT(bus_->calls_count, Eq(1U));
}

TEST_F(TestSession, signals_are_delivered_until_unsubscribed)
{
    auto& session = makeSession();
    populateDemo();

    EXPECT_THAT(rejected(session.subscribe({Demo, CalcPath, Calc, "Missing"})), Eq(Rejection::Kind::UnknownMember));

    const auto subscription_id = accepted(session.subscribe({Demo, CalcPath, Calc, "Changed"}));
    const auto outcome         = outcomeOf(spinAndPoll(), subscription_id);
    EXPECT_THAT(cetl::get_if<CallOutcome::Ok>(&outcome), NotNull());
    EXPECT_THAT(*bus_->active_subscriptions, Eq(1U));

    bus_->emit(SignalEvent{":1.9", CalcPath, Calc, "Changed", {Value::makeString("volume")}});
    bus_->emit(SignalEvent{":1.9", CalcPath, Calc, "Other", {}});
    auto events = session.poll();
    ASSERT_THAT(events, SizeIs(1));
    const auto* const received = cetl::get_if<Event::SignalReceived>(&events.front());
    ASSERT_THAT(received, NotNull());
    EXPECT_THAT(received->subscription_id, Eq(subscription_id));
    EXPECT_THAT(received->event.member, Eq("Changed"));
    EXPECT_THAT(received->event.args, ElementsAre(Value::makeString("volume")));

    // Signals queued before unsubscribing are dropped too.
    bus_->emit(SignalEvent{":1.9", CalcPath, Calc, "Changed", {Value::makeString("late")}});
    EXPECT_TRUE(session.unsubscribe(subscription_id));
    EXPECT_THAT(*bus_->active_subscriptions, Eq(0U));
    EXPECT_THAT(session.poll(), IsEmpty());
    EXPECT_FALSE(session.unsubscribe(subscription_id));
}

TEST_F(TestSession, subscribing_to_unintrospected_signals_is_up_to_the_bus)
{
    auto& session = makeSession();
    listServices();

    const auto any_id = accepted(session.subscribe({"", "", "", ""}));
    const auto outcome = outcomeOf(spinAndPoll(), any_id);
    EXPECT_THAT(cetl::get_if<CallOutcome::Ok>(&outcome), NotNull());
    EXPECT_FALSE(session.unsubscribe(any_id + 1));

    // Destroying the session removes every subscription.
    session_.reset();
    EXPECT_THAT(*bus_->active_subscriptions, Eq(0U));
}

TEST_F(TestSession, rejection_kind_names)
{
    EXPECT_THAT(dtui::engine::toString(Rejection::Kind::NotWritable), testing::StrEq("NotWritable"));
    EXPECT_THAT(CallOutcome::describe(CallOutcome::RemoteError{"a.B", "c"}), Eq("error a.B: c"));
    EXPECT_THAT(CallOutcome::describe(
                    CallOutcome::LocalFailure{CallOutcome::LocalFailure::Kind::Transport, "gone"}),
                Eq("transport failure: gone"));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
