//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dtui/sdk/value.hpp"

#include "common_helpers.hpp"
#include "dtui/sdk/signature.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace sdk
{
namespace
{

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

Value::Int makeSignedRaw(const std::uint8_t width, const std::int64_t value)
{
    return Value::Int{width, true, value, 0};
}

Value::Int makeUnsignedRaw(const std::uint8_t width, const std::uint64_t value)
{
    return Value::Int{width, false, 0, value};
}

bool fitsSigned(const std::uint8_t width, const std::int64_t value)
{
    if (width >= 64)
    {
        return true;
    }
    const std::int64_t max = (std::int64_t{1} << (width - 1U)) - 1;
    return (value >= (-max - 1)) && (value <= max);
}

bool fitsUnsigned(const std::uint8_t width, const std::uint64_t value)
{
    if (width >= 64)
    {
        return true;
    }
    return value <= ((std::uint64_t{1} << width) - 1U);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

void appendQuoted(const std::string& text, std::string& out)
{
    out += '"';
    for (const char ch : text)
    {
        switch (ch)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20)  // NOLINT(*-magic-numbers)
            {
                out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(ch)));
            }
            else
            {
                out += ch;
            }
            break;
        }
    }
    out += '"';
}

void renderTo(const Value& value, std::string& out)
{
    cetl::visit(cetl::make_overloaded(
                    [&out](const Value::Bool& boolean) {
                        //
                        out += boolean.value ? "true" : "false";
                    },
                    [&out](const Value::Int& integer) {
                        //
                        out += integer.is_signed ? std::to_string(integer.signed_value)
                                                 : std::to_string(integer.unsigned_value);
                    },
                    [&out](const Value::Double& real) {
                        //
                        out += fmt::format("{}", real.value);
                    },
                    [&out](const Value::Str& str) { appendQuoted(str.value, out); },
                    [&out](const Value::ObjectPath& path) { appendQuoted(path.value, out); },
                    [&out](const Value::Signature& signature) { appendQuoted(signature.value, out); },
                    [&out](const Value::Array& array) {
                        //
                        out += '[';
                        out += common::joinAsStrings(array.items, ", ", [](const Value& item) { return item.render(); });
                        out += ']';
                    },
                    [&out](const Value::Struct& structure) {
                        //
                        out += '(';
                        out += common::joinAsStrings(structure.fields, ", ", [](const Value& f) { return f.render(); });
                        out += ')';
                    },
                    [&out](const Value::Dict& dict) {
                        //
                        out += '{';
                        out += common::joinAsStrings(dict.entries, ", ", [](const std::pair<Value, Value>& entry) {
                            //
                            return entry.first.render() + ": " + entry.second.render();
                        });
                        out += '}';
                    },
                    [&out](const Value::Variant& variant) {
                        //
                        out += '<';
                        out += variant.inner->signature().render();
                        out += '>';
                        renderTo(*variant.inner, out);
                    }),
                value.kind());
}

bool conformsBasic(const Value& value, const BasicType basic_type)
{
    switch (basic_type)
    {
    case BasicType::Boolean:
        return value.getIf<Value::Bool>() != nullptr;
    case BasicType::Double:
        return value.getIf<Value::Double>() != nullptr;
    case BasicType::String: {
        const auto* const str = value.getIf<Value::Str>();
        return (str != nullptr) && isValidString(str->value);
    }
    case BasicType::ObjectPath:
        return value.getIf<Value::ObjectPath>() != nullptr;
    case BasicType::Signature:
        return value.getIf<Value::Signature>() != nullptr;
    case BasicType::UnixFd:
        return false;
    default:
        break;
    }

    const auto* const integer = value.getIf<Value::Int>();
    const auto        traits  = integerTraitsOf(basic_type);
    if ((integer == nullptr) || !traits)
    {
        return false;
    }
    if ((integer->width != traits->width) || (integer->is_signed != traits->is_signed))
    {
        return false;
    }
    return integer->is_signed ? fitsSigned(integer->width, integer->signed_value)
                              : fitsUnsigned(integer->width, integer->unsigned_value);
}

}  // namespace

Value Value::makeBool(const bool value)
{
    return Value{Bool{value}};
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

Value Value::makeByte(const std::uint8_t value)
{
    return Value{makeUnsignedRaw(8, value)};
}

Value Value::makeInt16(const std::int16_t value)
{
    return Value{makeSignedRaw(16, value)};
}

Value Value::makeUint16(const std::uint16_t value)
{
    return Value{makeUnsignedRaw(16, value)};
}

Value Value::makeInt32(const std::int32_t value)
{
    return Value{makeSignedRaw(32, value)};
}

Value Value::makeUint32(const std::uint32_t value)
{
    return Value{makeUnsignedRaw(32, value)};
}

Value Value::makeInt64(const std::int64_t value)
{
    return Value{makeSignedRaw(64, value)};
}

Value Value::makeUint64(const std::uint64_t value)
{
    return Value{makeUnsignedRaw(64, value)};
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

Value Value::makeDouble(const double value)
{
    return Value{Double{value}};
}

Value Value::makeString(std::string value)
{
    return Value{Str{std::move(value)}};
}

Value Value::makeVariant(Value inner)
{
    return Value{Variant{std::make_shared<const Value>(std::move(inner))}};
}

cetl::optional<Value> Value::makeSignedInt(const BasicType code, const std::int64_t value)
{
    const auto traits = integerTraitsOf(code);
    if (!traits || !traits->is_signed || !fitsSigned(traits->width, value))
    {
        return cetl::nullopt;
    }
    return Value{makeSignedRaw(traits->width, value)};
}

cetl::optional<Value> Value::makeUnsignedInt(const BasicType code, const std::uint64_t value)
{
    const auto traits = integerTraitsOf(code);
    if (!traits || traits->is_signed || !fitsUnsigned(traits->width, value))
    {
        return cetl::nullopt;
    }
    return Value{makeUnsignedRaw(traits->width, value)};
}

cetl::optional<Value> Value::makeObjectPath(std::string path)
{
    if (!isValidObjectPath(path))
    {
        return cetl::nullopt;
    }
    return Value{ObjectPath{std::move(path)}};
}

cetl::optional<Value> Value::makeSignature(std::string signature)
{
    const auto parsed = TypeSignature::parseList(signature);
    if (cetl::get_if<TypeSignature::ParseListResult::Failure>(&parsed) != nullptr)
    {
        return cetl::nullopt;
    }
    return Value{Signature{std::move(signature)}};
}

cetl::optional<Value> Value::makeArray(TypeSignature element, std::vector<Value> items)
{
    if (element.getIf<TypeSignature::DictEntry>() != nullptr)
    {
        return cetl::nullopt;
    }
    for (const auto& item : items)
    {
        if (!conforms(item, element))
        {
            return cetl::nullopt;
        }
    }
    return Value{Array{std::move(element), std::move(items)}};
}

cetl::optional<Value> Value::makeStruct(std::vector<Value> fields)
{
    if (fields.empty())
    {
        return cetl::nullopt;
    }
    return Value{Struct{std::move(fields)}};
}

cetl::optional<Value> Value::makeDict(TypeSignature key, TypeSignature value, std::vector<std::pair<Value, Value>> entries)
{
    if (!key.isBasic())
    {
        return cetl::nullopt;
    }
    for (const auto& entry : entries)
    {
        if (!conforms(entry.first, key) || !conforms(entry.second, value))
        {
            return cetl::nullopt;
        }
    }
    return Value{Dict{std::move(key), std::move(value), std::move(entries)}};
}

TypeSignature Value::signature() const
{
    return cetl::visit(cetl::make_overloaded(
                           [](const Bool&) { return TypeSignature::makeBasic(BasicType::Boolean); },
                           [](const Int& integer) {
                               //
                               // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
                               switch (integer.width)
                               {
                               case 8:
                                   return TypeSignature::makeBasic(BasicType::Byte);
                               case 16:
                                   return TypeSignature::makeBasic(integer.is_signed ? BasicType::Int16
                                                                                     : BasicType::Uint16);
                               case 32:
                                   return TypeSignature::makeBasic(integer.is_signed ? BasicType::Int32
                                                                                     : BasicType::Uint32);
                               default:
                                   return TypeSignature::makeBasic(integer.is_signed ? BasicType::Int64
                                                                                     : BasicType::Uint64);
                               }
                               // NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
                           },
                           [](const Double&) { return TypeSignature::makeBasic(BasicType::Double); },
                           [](const Str&) { return TypeSignature::makeBasic(BasicType::String); },
                           [](const ObjectPath&) { return TypeSignature::makeBasic(BasicType::ObjectPath); },
                           [](const Signature&) { return TypeSignature::makeBasic(BasicType::Signature); },
                           [](const Array& array) { return TypeSignature::makeArray(array.element); },
                           [](const Struct& structure) {
                               //
                               std::vector<TypeSignature> fields;
                               fields.reserve(structure.fields.size());
                               for (const auto& field : structure.fields)
                               {
                                   fields.push_back(field.signature());
                               }
                               return TypeSignature::makeStruct(std::move(fields));
                           },
                           [](const Dict& dict) { return TypeSignature::makeDict(dict.key, dict.value); },
                           [](const Variant&) { return TypeSignature::makeVariant(); }),
                       kind_);
}

std::string Value::render() const
{
    std::string out;
    renderTo(*this, out);
    return out;
}

bool operator==(const Value& lhs, const Value& rhs)
{
    if (lhs.kind_.index() != rhs.kind_.index())
    {
        return false;
    }

    return cetl::visit(cetl::make_overloaded(
                           [&rhs](const Value::Bool& boolean) {
                               //
                               return boolean.value == rhs.getIf<Value::Bool>()->value;
                           },
                           [&rhs](const Value::Int& integer) {
                               //
                               const auto& other = *rhs.getIf<Value::Int>();
                               return (integer.width == other.width) && (integer.is_signed == other.is_signed) &&
                                      (integer.signed_value == other.signed_value) &&
                                      (integer.unsigned_value == other.unsigned_value);
                           },
                           [&rhs](const Value::Double& real) {
                               //
                               return real.value == rhs.getIf<Value::Double>()->value;
                           },
                           [&rhs](const Value::Str& str) {
                               //
                               return str.value == rhs.getIf<Value::Str>()->value;
                           },
                           [&rhs](const Value::ObjectPath& path) {
                               //
                               return path.value == rhs.getIf<Value::ObjectPath>()->value;
                           },
                           [&rhs](const Value::Signature& signature) {
                               //
                               return signature.value == rhs.getIf<Value::Signature>()->value;
                           },
                           [&rhs](const Value::Array& array) {
                               //
                               const auto& other = *rhs.getIf<Value::Array>();
                               return (array.element == other.element) && (array.items == other.items);
                           },
                           [&rhs](const Value::Struct& structure) {
                               //
                               return structure.fields == rhs.getIf<Value::Struct>()->fields;
                           },
                           [&rhs](const Value::Dict& dict) {
                               //
                               const auto& other = *rhs.getIf<Value::Dict>();
                               return (dict.key == other.key) && (dict.value == other.value) &&
                                      (dict.entries == other.entries);
                           },
                           [&rhs](const Value::Variant& variant) {
                               //
                               return *variant.inner == *rhs.getIf<Value::Variant>()->inner;
                           }),
                       lhs.kind_);
}

bool conforms(const Value& value, const TypeSignature& signature)
{
    return cetl::visit(cetl::make_overloaded(
                           [&value](const TypeSignature::Basic& basic) { return conformsBasic(value, basic.code); },
                           [&value](const TypeSignature::Array& array) {
                               //
                               if (const auto* const entry = array.element->getIf<TypeSignature::DictEntry>())
                               {
                                   const auto* const dict = value.getIf<Value::Dict>();
                                   if ((dict == nullptr) || (dict->key != *entry->key) ||
                                       (dict->value != *entry->value))
                                   {
                                       return false;
                                   }
                                   for (const auto& kv : dict->entries)
                                   {
                                       if (!conforms(kv.first, *entry->key) || !conforms(kv.second, *entry->value))
                                       {
                                           return false;
                                       }
                                   }
                                   return true;
                               }

                               const auto* const items = value.getIf<Value::Array>();
                               if ((items == nullptr) || (items->element != *array.element))
                               {
                                   return false;
                               }
                               for (const auto& item : items->items)
                               {
                                   if (!conforms(item, *array.element))
                                   {
                                       return false;
                                   }
                               }
                               return true;
                           },
                           [&value](const TypeSignature::Struct& structure) {
                               //
                               const auto* const fields = value.getIf<Value::Struct>();
                               if ((fields == nullptr) || (fields->fields.size() != structure.fields.size()))
                               {
                                   return false;
                               }
                               for (std::size_t index = 0; index < structure.fields.size(); ++index)
                               {
                                   if (!conforms(fields->fields[index], structure.fields[index]))
                                   {
                                       return false;
                                   }
                               }
                               return true;
                           },
                           // A bare dict entry is never a value on its own.
                           [](const TypeSignature::DictEntry&) { return false; },
                           [&value](const TypeSignature::Variant&) {
                               //
                               const auto* const variant = value.getIf<Value::Variant>();
                               return (variant != nullptr) && (variant->inner != nullptr) &&
                                      conforms(*variant->inner, variant->inner->signature());
                           }),
                       signature.kind());
}

bool conforms(const std::vector<Value>& values, const std::vector<TypeSignature>& signatures)
{
    if (values.size() != signatures.size())
    {
        return false;
    }
    for (std::size_t index = 0; index < values.size(); ++index)
    {
        if (!conforms(values[index], signatures[index]))
        {
            return false;
        }
    }
    return true;
}

std::string renderValues(const std::vector<Value>& values)
{
    return common::joinAsStrings(values, ", ", [](const Value& value) { return value.render(); });
}

bool isValidObjectPath(const cetl::string_view path) noexcept
{
    if (path.empty() || (path.front() != '/'))
    {
        return false;
    }
    if (path.size() == 1)
    {
        return true;
    }
    if (path.back() == '/')
    {
        return false;
    }

    bool prev_is_slash = true;
    for (std::size_t index = 1; index < path.size(); ++index)
    {
        const char ch = path[index];
        if (ch == '/')
        {
            if (prev_is_slash)
            {
                return false;
            }
            prev_is_slash = true;
            continue;
        }

        const bool is_allowed = ((ch >= 'A') && (ch <= 'Z')) || ((ch >= 'a') && (ch <= 'z')) ||
                                ((ch >= '0') && (ch <= '9')) || (ch == '_');
        if (!is_allowed)
        {
            return false;
        }
        prev_is_slash = false;
    }
    return true;
}

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

std::size_t utf8SequenceLength(const cetl::string_view text) noexcept
{
    if (text.empty())
    {
        return 0;
    }

    const auto byteAt = [text](const std::size_t index) {
        //
        return static_cast<std::uint8_t>(text[index]);
    };
    const auto lead = byteAt(0);
    if (lead == 0)
    {
        return 0;
    }
    if (lead < 0x80U)
    {
        return 1;
    }

    // The second byte range is narrowed for leads which would allow overlong forms,
    // surrogates (ED A0..BF) or code points above U+10FFFF.
    std::size_t  length     = 0;
    std::uint8_t second_min = 0x80U;
    std::uint8_t second_max = 0xBFU;
    if ((lead >= 0xC2U) && (lead <= 0xDFU))
    {
        length = 2;
    }
    else if ((lead >= 0xE0U) && (lead <= 0xEFU))
    {
        length     = 3;
        second_min = (lead == 0xE0U) ? 0xA0U : 0x80U;
        second_max = (lead == 0xEDU) ? 0x9FU : 0xBFU;
    }
    else if ((lead >= 0xF0U) && (lead <= 0xF4U))
    {
        length     = 4;
        second_min = (lead == 0xF0U) ? 0x90U : 0x80U;
        second_max = (lead == 0xF4U) ? 0x8FU : 0xBFU;
    }
    else
    {
        return 0;
    }

    if (text.size() < length)
    {
        return 0;
    }
    if ((byteAt(1) < second_min) || (byteAt(1) > second_max))
    {
        return 0;
    }
    for (std::size_t index = 2; index < length; ++index)
    {
        if ((byteAt(index) & 0xC0U) != 0x80U)
        {
            return 0;
        }
    }
    return length;
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

bool isValidString(const cetl::string_view text) noexcept
{
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const auto length = utf8SequenceLength(text.substr(pos));
        if (length == 0)
        {
            return false;
        }
        pos += length;
    }
    return true;
}

}  // namespace sdk
}  // namespace dtui
