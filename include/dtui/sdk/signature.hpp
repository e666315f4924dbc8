//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_SDK_SIGNATURE_HPP_INCLUDED
#define DTUI_SDK_SIGNATURE_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace sdk
{

/// Basic (non-container) D-Bus type codes.
///
enum class BasicType : char
{
    Byte       = 'y',
    Boolean    = 'b',
    Int16      = 'n',
    Uint16     = 'q',
    Int32      = 'i',
    Uint32     = 'u',
    Int64      = 'x',
    Uint64     = 't',
    Double     = 'd',
    String     = 's',
    ObjectPath = 'o',
    Signature  = 'g',
    UnixFd     = 'h',

};  // BasicType

/// Parses a basic type code.
///
CETL_NODISCARD cetl::optional<BasicType> basicTypeFromCode(const char code) noexcept;

/// Width (in bits) and signedness of an integer type code; empty for non-integer types.
///
struct IntegerTraits
{
    std::uint8_t width;
    bool         is_signed;
};
CETL_NODISCARD cetl::optional<IntegerTraits> integerTraitsOf(const BasicType basic_type) noexcept;

struct SignatureError
{
    enum class Kind : std::uint8_t
    {
        Malformed,
        TooDeep,
    };

    Kind        kind;
    std::size_t offset;
    std::string message;

};  // SignatureError

/// Immutable description of a single complete D-Bus type.
///
class TypeSignature final
{
public:
    /// Maximum nesting of containers (arrays, structs and dict entries).
    static constexpr std::size_t MaxDepth = 32;

    /// Maximum length of a signature string.
    static constexpr std::size_t MaxLength = 255;

    struct Basic
    {
        BasicType code;
    };
    struct Array
    {
        std::shared_ptr<const TypeSignature> element;
    };
    struct Struct
    {
        std::vector<TypeSignature> fields;
    };
    struct DictEntry
    {
        std::shared_ptr<const TypeSignature> key;
        std::shared_ptr<const TypeSignature> value;
    };
    struct Variant
    {};

    using Kind = cetl::variant<Basic, Array, Struct, DictEntry, Variant>;

    struct ParseResult
    {
        using Success = TypeSignature;
        using Failure = SignatureError;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Parses exactly one complete type.
    static ParseResult::Var parse(const cetl::string_view text);

    struct ParseListResult
    {
        using Success = std::vector<TypeSignature>;
        using Failure = SignatureError;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Parses a sequence of zero or more complete types (like a method's argument list).
    static ParseListResult::Var parseList(const cetl::string_view text);

    static TypeSignature makeBasic(const BasicType code);
    static TypeSignature makeArray(TypeSignature element);
    static TypeSignature makeStruct(std::vector<TypeSignature> fields);
    static TypeSignature makeDict(TypeSignature key, TypeSignature value);
    static TypeSignature makeVariant();

    const Kind& kind() const noexcept
    {
        return kind_;
    }

    template <typename T>
    const T* getIf() const noexcept
    {
        return cetl::get_if<T>(&kind_);
    }

    CETL_NODISCARD bool isBasic() const noexcept
    {
        return getIf<Basic>() != nullptr;
    }

    CETL_NODISCARD cetl::optional<BasicType> basicType() const noexcept;

    /// True for `a{..}`, aka an array of dict entries.
    CETL_NODISCARD bool isDict() const noexcept;

    /// Renders the type back to its canonical signature string.
    CETL_NODISCARD std::string render() const;

    friend bool operator==(const TypeSignature& lhs, const TypeSignature& rhs);
    friend bool operator!=(const TypeSignature& lhs, const TypeSignature& rhs)
    {
        return !(lhs == rhs);
    }

private:
    explicit TypeSignature(Kind kind)
        : kind_{std::move(kind)}
    {
    }

    Kind kind_;

};  // TypeSignature

/// Renders a list of types as one signature string.
///
std::string renderSignatureList(const std::vector<TypeSignature>& signatures);

}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_SDK_SIGNATURE_HPP_INCLUDED
