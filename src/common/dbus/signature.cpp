//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dtui/sdk/signature.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstddef>
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

/// Recursive descent over a signature string.
///
/// Depth counts nested containers: an array, a struct and a dict entry each add one level.
///
class SignatureParser final
{
public:
    using Var = TypeSignature::ParseResult::Var;

    explicit SignatureParser(const cetl::string_view text)
        : text_{text}
        , pos_{0}
    {
    }

    bool atEnd() const noexcept
    {
        return pos_ >= text_.size();
    }

    std::size_t pos() const noexcept
    {
        return pos_;
    }

    Var parseCompleteType(const std::size_t depth)
    {
        if (atEnd())
        {
            return malformed(pos_, "unexpected end of signature");
        }

        const char code = text_[pos_];
        if (const auto basic_type = basicTypeFromCode(code))
        {
            ++pos_;
            return TypeSignature::makeBasic(*basic_type);
        }

        switch (code)
        {
        case 'v':
            ++pos_;
            return TypeSignature::makeVariant();
        case 'a':
            return parseArray(depth);
        case '(':
            return parseStruct(depth);
        case '{':
            return malformed(pos_, "dict entry is allowed only as an array element");
        case ')':
        case '}':
            return malformed(pos_, fmt::format("unexpected '{}'", code));
        default:
            return malformed(pos_, fmt::format("unknown type code '{}'", code));
        }
    }

    static SignatureError malformed(const std::size_t offset, std::string message)
    {
        return SignatureError{SignatureError::Kind::Malformed, offset, std::move(message)};
    }

private:
    static SignatureError tooDeep(const std::size_t offset)
    {
        return SignatureError{SignatureError::Kind::TooDeep,
                              offset,
                              fmt::format("containers are nested deeper than {} levels", TypeSignature::MaxDepth)};
    }

    Var parseArray(const std::size_t depth)
    {
        const auto array_pos = pos_;
        if (depth + 1 > TypeSignature::MaxDepth)
        {
            return tooDeep(array_pos);
        }
        ++pos_;

        if (atEnd())
        {
            return malformed(array_pos, "array is missing its element type");
        }
        if (text_[pos_] == '{')
        {
            return parseDictEntry(depth + 1);
        }

        auto element = parseCompleteType(depth + 1);
        if (auto* const element_sig = cetl::get_if<TypeSignature>(&element))
        {
            return TypeSignature::makeArray(std::move(*element_sig));
        }
        return element;
    }

    Var parseDictEntry(const std::size_t depth)
    {
        const auto entry_pos = pos_;
        if (depth + 1 > TypeSignature::MaxDepth)
        {
            return tooDeep(entry_pos);
        }
        ++pos_;

        const auto key_pos = pos_;
        auto       key     = parseCompleteType(depth + 1);
        if (cetl::get_if<SignatureError>(&key) != nullptr)
        {
            return key;
        }
        auto key_sig = cetl::get<TypeSignature>(std::move(key));
        if (!key_sig.isBasic())
        {
            return malformed(key_pos, "dict entry key must be a basic type");
        }

        if (atEnd() || (text_[pos_] == '}'))
        {
            return malformed(entry_pos, "dict entry must have a key and a value type");
        }
        auto value = parseCompleteType(depth + 1);
        if (cetl::get_if<SignatureError>(&value) != nullptr)
        {
            return value;
        }

        if (atEnd() || (text_[pos_] != '}'))
        {
            return malformed(entry_pos, "dict entry must have exactly two types");
        }
        ++pos_;

        return TypeSignature::makeDict(std::move(key_sig), cetl::get<TypeSignature>(std::move(value)));
    }

    Var parseStruct(const std::size_t depth)
    {
        const auto struct_pos = pos_;
        if (depth + 1 > TypeSignature::MaxDepth)
        {
            return tooDeep(struct_pos);
        }
        ++pos_;

        std::vector<TypeSignature> fields;
        while (true)
        {
            if (atEnd())
            {
                return malformed(struct_pos, "unterminated struct");
            }
            if (text_[pos_] == ')')
            {
                break;
            }

            auto field = parseCompleteType(depth + 1);
            if (cetl::get_if<SignatureError>(&field) != nullptr)
            {
                return field;
            }
            fields.push_back(cetl::get<TypeSignature>(std::move(field)));
        }
        ++pos_;

        if (fields.empty())
        {
            return malformed(struct_pos, "struct must have at least one field");
        }
        return TypeSignature::makeStruct(std::move(fields));
    }

    cetl::string_view text_;
    std::size_t       pos_;

};  // SignatureParser

cetl::optional<SignatureError> checkLength(const cetl::string_view text)
{
    if (text.size() > TypeSignature::MaxLength)
    {
        return SignatureParser::malformed(TypeSignature::MaxLength,
                                          fmt::format("signature is longer than {} bytes", TypeSignature::MaxLength));
    }
    return cetl::nullopt;
}

void renderTo(const TypeSignature& signature, std::string& out)
{
    cetl::visit(cetl::make_overloaded(
                    [&out](const TypeSignature::Basic& basic) {
                        //
                        out += static_cast<char>(basic.code);
                    },
                    [&out](const TypeSignature::Array& array) {
                        //
                        out += 'a';
                        renderTo(*array.element, out);
                    },
                    [&out](const TypeSignature::Struct& structure) {
                        //
                        out += '(';
                        for (const auto& field : structure.fields)
                        {
                            renderTo(field, out);
                        }
                        out += ')';
                    },
                    [&out](const TypeSignature::DictEntry& entry) {
                        //
                        out += '{';
                        renderTo(*entry.key, out);
                        renderTo(*entry.value, out);
                        out += '}';
                    },
                    [&out](const TypeSignature::Variant&) {
                        //
                        out += 'v';
                    }),
                signature.kind());
}

}  // namespace

cetl::optional<BasicType> basicTypeFromCode(const char code) noexcept
{
    switch (code)
    {
    case 'y':
    case 'b':
    case 'n':
    case 'q':
    case 'i':
    case 'u':
    case 'x':
    case 't':
    case 'd':
    case 's':
    case 'o':
    case 'g':
    case 'h':
        return static_cast<BasicType>(code);
    default:
        return cetl::nullopt;
    }
}

cetl::optional<IntegerTraits> integerTraitsOf(const BasicType basic_type) noexcept
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
    switch (basic_type)
    {
    case BasicType::Byte:
        return IntegerTraits{8, false};
    case BasicType::Int16:
        return IntegerTraits{16, true};
    case BasicType::Uint16:
        return IntegerTraits{16, false};
    case BasicType::Int32:
        return IntegerTraits{32, true};
    case BasicType::Uint32:
        return IntegerTraits{32, false};
    case BasicType::Int64:
        return IntegerTraits{64, true};
    case BasicType::Uint64:
        return IntegerTraits{64, false};
    default:
        return cetl::nullopt;
    }
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
}

TypeSignature::ParseResult::Var TypeSignature::parse(const cetl::string_view text)
{
    if (text.empty())
    {
        return SignatureParser::malformed(0, "empty signature");
    }
    if (auto length_error = checkLength(text))
    {
        return std::move(*length_error);
    }

    SignatureParser parser{text};
    auto            result = parser.parseCompleteType(0);
    if ((cetl::get_if<TypeSignature>(&result) != nullptr) && !parser.atEnd())
    {
        return SignatureParser::malformed(parser.pos(), "unexpected characters after a complete type");
    }
    return result;
}

TypeSignature::ParseListResult::Var TypeSignature::parseList(const cetl::string_view text)
{
    if (auto length_error = checkLength(text))
    {
        return std::move(*length_error);
    }

    std::vector<TypeSignature> signatures;

    SignatureParser parser{text};
    while (!parser.atEnd())
    {
        auto result = parser.parseCompleteType(0);
        if (auto* const failure = cetl::get_if<SignatureError>(&result))
        {
            return std::move(*failure);
        }
        signatures.push_back(cetl::get<TypeSignature>(std::move(result)));
    }
    return signatures;
}

TypeSignature TypeSignature::makeBasic(const BasicType code)
{
    return TypeSignature{Basic{code}};
}

TypeSignature TypeSignature::makeArray(TypeSignature element)
{
    return TypeSignature{Array{std::make_shared<const TypeSignature>(std::move(element))}};
}

TypeSignature TypeSignature::makeStruct(std::vector<TypeSignature> fields)
{
    CETL_DEBUG_ASSERT(!fields.empty(), "Empty structs are not allowed.");
    return TypeSignature{Struct{std::move(fields)}};
}

TypeSignature TypeSignature::makeDict(TypeSignature key, TypeSignature value)
{
    CETL_DEBUG_ASSERT(key.isBasic(), "Dict keys must be basic.");
    TypeSignature entry{DictEntry{std::make_shared<const TypeSignature>(std::move(key)),
                                  std::make_shared<const TypeSignature>(std::move(value))}};
    return makeArray(std::move(entry));
}

TypeSignature TypeSignature::makeVariant()
{
    return TypeSignature{Variant{}};
}

cetl::optional<BasicType> TypeSignature::basicType() const noexcept
{
    if (const auto* const basic = getIf<Basic>())
    {
        return basic->code;
    }
    return cetl::nullopt;
}

bool TypeSignature::isDict() const noexcept
{
    if (const auto* const array = getIf<Array>())
    {
        return array->element->getIf<DictEntry>() != nullptr;
    }
    return false;
}

std::string TypeSignature::render() const
{
    std::string out;
    renderTo(*this, out);
    return out;
}

bool operator==(const TypeSignature& lhs, const TypeSignature& rhs)
{
    if (lhs.kind_.index() != rhs.kind_.index())
    {
        return false;
    }

    return cetl::visit(cetl::make_overloaded(
                           [&rhs](const TypeSignature::Basic& basic) {
                               //
                               return basic.code == rhs.getIf<TypeSignature::Basic>()->code;
                           },
                           [&rhs](const TypeSignature::Array& array) {
                               //
                               return *array.element == *rhs.getIf<TypeSignature::Array>()->element;
                           },
                           [&rhs](const TypeSignature::Struct& structure) {
                               //
                               return structure.fields == rhs.getIf<TypeSignature::Struct>()->fields;
                           },
                           [&rhs](const TypeSignature::DictEntry& entry) {
                               //
                               const auto* const other = rhs.getIf<TypeSignature::DictEntry>();
                               return (*entry.key == *other->key) && (*entry.value == *other->value);
                           },
                           [](const TypeSignature::Variant&) { return true; }),
                       lhs.kind_);
}

std::string renderSignatureList(const std::vector<TypeSignature>& signatures)
{
    std::string out;
    for (const auto& signature : signatures)
    {
        renderTo(signature, out);
    }
    return out;
}

}  // namespace sdk
}  // namespace dtui
