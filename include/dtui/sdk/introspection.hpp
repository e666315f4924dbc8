//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_SDK_INTROSPECTION_HPP_INCLUDED
#define DTUI_SDK_INTROSPECTION_HPP_INCLUDED

#include "signature.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace dtui
{
namespace sdk
{

struct ArgDescriptor
{
    std::string   name;  ///< Might be empty - argument names are optional.
    TypeSignature signature;
};

struct MethodDescriptor
{
    std::string                name;
    std::vector<ArgDescriptor> in_args;
    std::vector<ArgDescriptor> out_args;

    std::vector<TypeSignature> inSignatures() const;
    std::vector<TypeSignature> outSignatures() const;

    /// Human readable form, like `Add(a: i, b: i) => sum: i`.
    std::string label() const;
};

enum class PropertyAccess : std::uint8_t
{
    Read,
    Write,
    ReadWrite,
};

struct PropertyDescriptor
{
    std::string    name;
    TypeSignature  signature;
    PropertyAccess access;

    bool isReadable() const noexcept
    {
        return access != PropertyAccess::Write;
    }
    bool isWritable() const noexcept
    {
        return access != PropertyAccess::Read;
    }

    /// Human readable form, like `Volume: d (readwrite)`.
    std::string label() const;
};

struct SignalDescriptor
{
    std::string                name;
    std::vector<ArgDescriptor> args;

    /// Human readable form, like `Changed(name: s, value: v)`.
    std::string label() const;
};

struct InterfaceDescriptor
{
    std::string                     name;
    std::vector<MethodDescriptor>   methods;
    std::vector<PropertyDescriptor> properties;
    std::vector<SignalDescriptor>   signals;

    const MethodDescriptor*   findMethod(const cetl::string_view method_name) const;
    const PropertyDescriptor* findProperty(const cetl::string_view property_name) const;
    const SignalDescriptor*   findSignal(const cetl::string_view signal_name) const;
};

/// Everything one introspection of an object path reveals.
///
struct IntrospectionData
{
    /// Direct child path segments, in document order.
    std::vector<std::string>         children;
    std::vector<InterfaceDescriptor> interfaces;
};

}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_SDK_INTROSPECTION_HPP_INCLUDED
