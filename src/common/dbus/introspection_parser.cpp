//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "introspection_parser.hpp"

#include "common_helpers.hpp"
#include "dtui/sdk/introspection.hpp"
#include "dtui/sdk/signature.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <expat.h>
#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace dtui
{
namespace common
{
namespace dbus
{
namespace
{

/// SAX style builder of `IntrospectionData` out of expat callbacks.
///
class DocumentBuilder final
{
public:
    static void XMLCALL onStartElement(void* const user_data, const XML_Char* const name, const XML_Char** const attrs)
    {
        auto* const self = static_cast<DocumentBuilder*>(user_data);
        if (!performWithoutThrowing([self, name, attrs] {
                //
                self->startElement(name, attrs);
            }))
        {
            self->fail("internal failure while handling an element");
        }
    }

    static void XMLCALL onEndElement(void* const user_data, const XML_Char* const name)
    {
        auto* const self = static_cast<DocumentBuilder*>(user_data);
        (void) name;
        self->endElement();
    }

    bool hasFailed() const noexcept
    {
        return !failure_.empty();
    }

    const std::string& failure() const noexcept
    {
        return failure_;
    }

    sdk::IntrospectionData takeData()
    {
        return std::move(data_);
    }

    void fail(std::string message)
    {
        if (failure_.empty())
        {
            failure_ = std::move(message);
        }
    }

private:
    enum class Scope : std::uint8_t
    {
        Root,       // outside of any element
        Node,       // the introspected (top level) node
        ChildNode,  // a child node and everything within it
        Interface,
        Method,
        Signal,
        Property,
        Ignored,  // unknown element (and everything within it)
    };

    static const char* findAttr(const XML_Char** const attrs, const char* const attr_name)
    {
        for (const XML_Char** attr = attrs; (attr != nullptr) && (*attr != nullptr); attr += 2)
        {
            if (std::strcmp(attr[0], attr_name) == 0)
            {
                return attr[1];
            }
        }
        return nullptr;
    }

    static std::string attrOrEmpty(const XML_Char** const attrs, const char* const attr_name)
    {
        const char* const value = findAttr(attrs, attr_name);
        return (value != nullptr) ? std::string{value} : std::string{};
    }

    Scope currentScope() const noexcept
    {
        return scopes_.empty() ? Scope::Root : scopes_.back();
    }

    cetl::optional<sdk::TypeSignature> parseTypeAttr(const XML_Char** const attrs, const char* const owner)
    {
        const std::string type = attrOrEmpty(attrs, "type");

        auto parsed = sdk::TypeSignature::parse(type);
        if (const auto* const sig_error = cetl::get_if<sdk::SignatureError>(&parsed))
        {
            fail(fmt::format("invalid type '{}' of {}: {}", type, owner, sig_error->message));
            return cetl::nullopt;
        }
        return cetl::get<sdk::TypeSignature>(std::move(parsed));
    }

    void startElement(const char* const name, const XML_Char** const attrs)
    {
        if (hasFailed())
        {
            scopes_.push_back(Scope::Ignored);
            return;
        }

        const auto scope = currentScope();
        if ((scope == Scope::ChildNode) || (scope == Scope::Ignored))
        {
            scopes_.push_back(scope);
            return;
        }

        const cetl::string_view element{name};
        switch (scope)
        {
        case Scope::Root:
            scopes_.push_back((element == "node") ? Scope::Node : Scope::Ignored);
            break;

        case Scope::Node:
            if (element == "node")
            {
                auto child = attrOrEmpty(attrs, "name");
                if (!child.empty())
                {
                    data_.children.push_back(std::move(child));
                }
                scopes_.push_back(Scope::ChildNode);
            }
            else if (element == "interface")
            {
                data_.interfaces.push_back(sdk::InterfaceDescriptor{attrOrEmpty(attrs, "name"), {}, {}, {}});
                scopes_.push_back(Scope::Interface);
            }
            else
            {
                scopes_.push_back(Scope::Ignored);
            }
            break;

        case Scope::Interface:
            startInterfaceMember(element, attrs);
            break;

        case Scope::Method:
        case Scope::Signal:
            if (element == "arg")
            {
                addArg(scope, attrs);
            }
            scopes_.push_back(Scope::Ignored);
            break;

        default:
            scopes_.push_back(Scope::Ignored);
            break;
        }
    }

    void startInterfaceMember(const cetl::string_view element, const XML_Char** const attrs)
    {
        auto& interface = data_.interfaces.back();
        if (element == "method")
        {
            interface.methods.push_back(sdk::MethodDescriptor{attrOrEmpty(attrs, "name"), {}, {}});
            scopes_.push_back(Scope::Method);
        }
        else if (element == "signal")
        {
            interface.signals.push_back(sdk::SignalDescriptor{attrOrEmpty(attrs, "name"), {}});
            scopes_.push_back(Scope::Signal);
        }
        else if (element == "property")
        {
            auto property_name = attrOrEmpty(attrs, "name");
            auto signature     = parseTypeAttr(attrs, fmt::format("property '{}'", property_name).c_str());
            if (signature)
            {
                const auto access_str = attrOrEmpty(attrs, "access");

                auto access = sdk::PropertyAccess::Read;
                if (access_str == "write")
                {
                    access = sdk::PropertyAccess::Write;
                }
                else if (access_str == "readwrite")
                {
                    access = sdk::PropertyAccess::ReadWrite;
                }
                interface.properties.push_back(
                    sdk::PropertyDescriptor{std::move(property_name), std::move(*signature), access});
            }
            scopes_.push_back(Scope::Property);
        }
        else
        {
            scopes_.push_back(Scope::Ignored);
        }
    }

    void addArg(const Scope scope, const XML_Char** const attrs)
    {
        auto& interface = data_.interfaces.back();
        auto  arg_name  = attrOrEmpty(attrs, "name");
        auto  signature = parseTypeAttr(attrs, fmt::format("argument '{}'", arg_name).c_str());
        if (!signature)
        {
            return;
        }

        sdk::ArgDescriptor arg{std::move(arg_name), std::move(*signature)};
        if (scope == Scope::Signal)
        {
            interface.signals.back().args.push_back(std::move(arg));
            return;
        }

        auto& method = interface.methods.back();
        if (attrOrEmpty(attrs, "direction") == "out")
        {
            method.out_args.push_back(std::move(arg));
        }
        else
        {
            method.in_args.push_back(std::move(arg));
        }
    }

    void endElement()
    {
        if (!scopes_.empty())
        {
            scopes_.pop_back();
        }
    }

    std::vector<Scope>     scopes_;
    sdk::IntrospectionData data_;
    std::string            failure_;

};  // DocumentBuilder

struct ParserDeleter
{
    void operator()(XML_Parser parser) const noexcept
    {
        XML_ParserFree(parser);
    }
};
using ParserPtr = std::unique_ptr<std::remove_pointer_t<XML_Parser>, ParserDeleter>;

}  // namespace

IntrospectionParser::Result::Var IntrospectionParser::parse(const cetl::string_view xml)
{
    const ParserPtr parser{XML_ParserCreate(nullptr)};
    if (!parser)
    {
        return std::string{"can't create XML parser"};
    }

    DocumentBuilder builder;
    XML_SetUserData(parser.get(), &builder);
    XML_SetElementHandler(parser.get(), &DocumentBuilder::onStartElement, &DocumentBuilder::onEndElement);

    const auto status = XML_Parse(parser.get(), xml.data(), static_cast<int>(xml.size()), XML_TRUE);
    if (status != XML_STATUS_OK)
    {
        return fmt::format("XML error at line {}: {}",
                           XML_GetCurrentLineNumber(parser.get()),
                           XML_ErrorString(XML_GetErrorCode(parser.get())));
    }
    if (builder.hasFailed())
    {
        return builder.failure();
    }
    return builder.takeData();
}

}  // namespace dbus
}  // namespace common
}  // namespace dtui
