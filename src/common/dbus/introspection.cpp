//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dtui/sdk/introspection.hpp"

#include "common_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <string>
#include <vector>

namespace dtui
{
namespace sdk
{
namespace
{

std::vector<TypeSignature> signaturesOf(const std::vector<ArgDescriptor>& args)
{
    std::vector<TypeSignature> signatures;
    signatures.reserve(args.size());
    for (const auto& arg : args)
    {
        signatures.push_back(arg.signature);
    }
    return signatures;
}

std::string argsLabel(const std::vector<ArgDescriptor>& args)
{
    return common::joinAsStrings(args, ", ", [](const ArgDescriptor& arg) {
        //
        if (arg.name.empty())
        {
            return arg.signature.render();
        }
        return fmt::format("{}: {}", arg.name, arg.signature.render());
    });
}

template <typename Descriptor>
const Descriptor* findByName(const std::vector<Descriptor>& descriptors, const cetl::string_view name)
{
    const auto it = std::find_if(descriptors.cbegin(), descriptors.cend(), [name](const Descriptor& descriptor) {
        //
        return descriptor.name == name;
    });
    return (it != descriptors.cend()) ? &*it : nullptr;
}

}  // namespace

std::vector<TypeSignature> MethodDescriptor::inSignatures() const
{
    return signaturesOf(in_args);
}

std::vector<TypeSignature> MethodDescriptor::outSignatures() const
{
    return signaturesOf(out_args);
}

std::string MethodDescriptor::label() const
{
    if (out_args.empty())
    {
        return fmt::format("{}({})", name, argsLabel(in_args));
    }
    return fmt::format("{}({}) => {}", name, argsLabel(in_args), argsLabel(out_args));
}

std::string PropertyDescriptor::label() const
{
    const char* access_str = "readwrite";
    switch (access)
    {
    case PropertyAccess::Read:
        access_str = "read";
        break;
    case PropertyAccess::Write:
        access_str = "write";
        break;
    case PropertyAccess::ReadWrite:
        break;
    }
    return fmt::format("{}: {} ({})", name, signature.render(), access_str);
}

std::string SignalDescriptor::label() const
{
    return fmt::format("{}({})", name, argsLabel(args));
}

const MethodDescriptor* InterfaceDescriptor::findMethod(const cetl::string_view method_name) const
{
    return findByName(methods, method_name);
}

const PropertyDescriptor* InterfaceDescriptor::findProperty(const cetl::string_view property_name) const
{
    return findByName(properties, property_name);
}

const SignalDescriptor* InterfaceDescriptor::findSignal(const cetl::string_view signal_name) const
{
    return findByName(signals, signal_name);
}

}  // namespace sdk
}  // namespace dtui
