//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_DBUS_GTEST_HELPERS_HPP_INCLUDED
#define DTUI_DBUS_GTEST_HELPERS_HPP_INCLUDED

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/signature.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest-matchers.h>
#include <gtest/gtest-printers.h>

#include <ostream>
#include <string>

namespace dtui
{
namespace sdk
{

// MARK: - GTest Printers:

inline void PrintTo(const TypeSignature& signature, std::ostream* os)
{
    *os << "TypeSignature{'" << signature.render() << "'}";
}

inline void PrintTo(const Value& value, std::ostream* os)
{
    *os << "Value{" << value.render() << " : '" << value.signature().render() << "'}";
}

inline void PrintTo(const BusError& error, std::ostream* os)
{
    *os << "BusError{kind=" << static_cast<int>(error.kind) << ", name='" << error.name << "', msg='"
        << error.message << "'}";
}

inline void PrintTo(const SignatureError& error, std::ostream* os)
{
    *os << "SignatureError{kind=" << static_cast<int>(error.kind) << ", offset=" << error.offset << ", msg='"
        << error.message << "'}";
}

// MARK: - GTest Matchers:

/// Matches a value (or a signature) by its rendered text form.
///
MATCHER_P(RendersAs, text, std::string(negation ? "doesn't render" : "renders") + " as '" + text + "'")
{
    return arg.render() == text;
}

}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_DBUS_GTEST_HELPERS_HPP_INCLUDED
