//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_SDK_DBUS_MESSAGE_CODEC_HPP_INCLUDED
#define DTUI_SDK_DBUS_MESSAGE_CODEC_HPP_INCLUDED

#include "dtui/sdk/value.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <dbus/dbus.h>

#include <string>
#include <vector>

namespace dtui
{
namespace sdk
{
namespace dbus
{

/// Appends values to the body of a message.
///
/// @return Empty on success, otherwise description of the failure (the message should be discarded then).
///
CETL_NODISCARD cetl::optional<std::string> appendValues(DBusMessage& message, const std::vector<Value>& values);

struct DecodeResult
{
    using Success = std::vector<Value>;
    using Failure = std::string;
    using Var     = cetl::variant<Success, Failure>;
};
/// Decodes the whole body of a message.
///
/// Unix file descriptors can't be represented as values, so bodies with them fail to decode.
///
CETL_NODISCARD DecodeResult::Var decodeBody(DBusMessage& message);

}  // namespace dbus
}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_SDK_DBUS_MESSAGE_CODEC_HPP_INCLUDED
