//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_COMMON_DBUS_INTROSPECTION_PARSER_HPP_INCLUDED
#define DTUI_COMMON_DBUS_INTROSPECTION_PARSER_HPP_INCLUDED

#include "dtui/sdk/introspection.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace dtui
{
namespace common
{
namespace dbus
{

/// Parses documents of the `org.freedesktop.DBus.Introspectable.Introspect` method.
///
/// Parsing is permissive: unknown elements and attributes are skipped, and so is
/// everything nested inside child `<node>` elements (only their names are collected).
/// Args default to `in` direction for methods; properties default to `read` access.
/// An invalid type signature anywhere fails the whole document.
///
class IntrospectionParser final
{
public:
    struct Result
    {
        using Success = sdk::IntrospectionData;
        using Failure = std::string;  ///< Description of the problem.
        using Var     = cetl::variant<Success, Failure>;
    };
    static Result::Var parse(const cetl::string_view xml);

};  // IntrospectionParser

}  // namespace dbus
}  // namespace common
}  // namespace dtui

#endif  // DTUI_COMMON_DBUS_INTROSPECTION_PARSER_HPP_INCLUDED
