//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_SDK_BUS_CLIENT_HPP_INCLUDED
#define DTUI_SDK_BUS_CLIENT_HPP_INCLUDED

#include "execution.hpp"
#include "value.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace sdk
{

/// Which bus to connect to.
///
struct BusAddress
{
    enum class Kind : std::uint8_t
    {
        System,
        Session,
        Custom,  ///< See `address`.
    };

    Kind        kind;
    std::string address;  ///< D-Bus address string, like `unix:path=/run/user/1000/bus`; only for `Custom`.
};

/// Failure of a bus operation.
///
struct BusError
{
    enum class Kind : std::uint8_t
    {
        Remote,        ///< The peer replied with an error message.
        Transport,     ///< Local failure: connection, encoding, decoding or resources.
        Timeout,       ///< No reply in time.
        Disconnected,  ///< The bus connection is gone.
    };

    Kind        kind;
    std::string name;     ///< D-Bus error name, like `org.freedesktop.DBus.Error.UnknownMethod`.
    std::string message;  ///< Human readable text.
};

/// Completion of an operation which has no payload.
///
struct Done
{};

/// Addresses a member (method, property or signal) of an interface at an object path of a service.
///
struct MemberRef
{
    std::string service;
    std::string path;
    std::string interface;
    std::string member;
};

/// Signal match rule; empty fields match anything.
///
struct SignalMatch
{
    std::string service;
    std::string path;
    std::string interface;
    std::string member;

    /// The rule in the bus daemon's `AddMatch` syntax.
    std::string toRule() const;
};

struct SignalEvent
{
    std::string        sender;  ///< Unique name of the emitting connection.
    std::string        path;
    std::string        interface;
    std::string        member;
    std::vector<Value> args;
};

/// Abstract interface of the asynchronous bus capabilities.
///
/// Every operation is represented by a sender; destroying the sender cancels the operation.
/// All callbacks are invoked from the executor the client was made with.
///
class BusClient
{
public:
    using Ptr = std::shared_ptr<BusClient>;

    struct MakeResult
    {
        using Success = Ptr;
        using Failure = BusError;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Connects to the bus, and registers on it.
    ///
    /// The executor has to support `platform::IPosixExecutorExtension`.
    ///
    CETL_NODISCARD static MakeResult::Var make(libcyphal::IExecutor& executor, const BusAddress& address);

    BusClient(BusClient&&)                 = delete;
    BusClient(const BusClient&)            = delete;
    BusClient& operator=(BusClient&&)      = delete;
    BusClient& operator=(const BusClient&) = delete;

    virtual ~BusClient() = default;

    /// Unique name of this connection on the bus, like `:1.42`.
    ///
    virtual std::string uniqueName() const = 0;

    struct ListNames
    {
        using Success = std::vector<std::string>;
        using Failure = BusError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual SenderOf<ListNames::Result>::Ptr listNames() = 0;

    struct Introspect
    {
        using Success = std::string;  ///< Introspection XML document.
        using Failure = BusError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual SenderOf<Introspect::Result>::Ptr introspect(const std::string& service,
                                                                        const std::string& path) = 0;

    struct Call
    {
        using Success = std::vector<Value>;  ///< Reply body.
        using Failure = BusError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual SenderOf<Call::Result>::Ptr callMethod(const MemberRef& method, std::vector<Value> args) = 0;

    struct GetProperty
    {
        using Success = Value;  ///< Already unwrapped from its variant.
        using Failure = BusError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual SenderOf<GetProperty::Result>::Ptr getProperty(const MemberRef& property) = 0;

    struct SetProperty
    {
        using Success = Done;
        using Failure = BusError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual SenderOf<SetProperty::Result>::Ptr setProperty(const MemberRef& property, Value value) = 0;

    struct GetAllProperties
    {
        using Success = std::vector<std::pair<std::string, Value>>;
        using Failure = BusError;
        using Result  = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD virtual SenderOf<GetAllProperties::Result>::Ptr getAllProperties(const std::string& service,
                                                                                    const std::string& path,
                                                                                    const std::string& interface) = 0;

    /// Established signal subscription; destroying it removes the match rule.
    ///
    class Subscription
    {
    public:
        using Ptr = std::unique_ptr<Subscription>;

        Subscription(Subscription&&)                 = delete;
        Subscription(const Subscription&)            = delete;
        Subscription& operator=(Subscription&&)      = delete;
        Subscription& operator=(const Subscription&) = delete;

        virtual ~Subscription() = default;

    protected:
        Subscription() = default;

    };  // Subscription

    struct Subscribe
    {
        using Success = Subscription::Ptr;
        using Failure = BusError;
        using Result  = cetl::variant<Success, Failure>;
    };
    using SignalHandler = std::function<void(SignalEvent&&)>;
    CETL_NODISCARD virtual SenderOf<Subscribe::Result>::Ptr subscribeSignal(const SignalMatch& match,
                                                                            SignalHandler      handler) = 0;

protected:
    BusClient() = default;

};  // BusClient

}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_SDK_BUS_CLIENT_HPP_INCLUDED
