//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_SDK_VALUE_HPP_INCLUDED
#define DTUI_SDK_VALUE_HPP_INCLUDED

#include "signature.hpp"

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

/// Tagged D-Bus value.
///
/// Values are built only through the factories below. Scalar factories are total;
/// factories of containers and of validated strings check their input and return
/// an empty optional if the result would not conform to a single `TypeSignature`.
///
class Value final
{
public:
    struct Bool
    {
        bool value;
    };
    struct Int
    {
        std::uint8_t  width;
        bool          is_signed;
        std::int64_t  signed_value;    ///< Valid if `is_signed`.
        std::uint64_t unsigned_value;  ///< Valid if not `is_signed`.
    };
    struct Double
    {
        double value;
    };
    struct Str
    {
        std::string value;
    };
    struct ObjectPath
    {
        std::string value;
    };
    struct Signature
    {
        std::string value;
    };
    struct Array
    {
        TypeSignature      element;
        std::vector<Value> items;
    };
    struct Struct
    {
        std::vector<Value> fields;
    };
    struct Dict
    {
        TypeSignature                       key;
        TypeSignature                       value;
        std::vector<std::pair<Value, Value>> entries;
    };
    struct Variant
    {
        std::shared_ptr<const Value> inner;
    };

    using Kind = cetl::variant<Bool, Int, Double, Str, ObjectPath, Signature, Array, Struct, Dict, Variant>;

    static Value makeBool(const bool value);
    static Value makeByte(const std::uint8_t value);
    static Value makeInt16(const std::int16_t value);
    static Value makeUint16(const std::uint16_t value);
    static Value makeInt32(const std::int32_t value);
    static Value makeUint32(const std::uint32_t value);
    static Value makeInt64(const std::int64_t value);
    static Value makeUint64(const std::uint64_t value);
    static Value makeDouble(const double value);
    static Value makeString(std::string value);
    static Value makeVariant(Value inner);

    /// Makes an integer of the given integer type code; empty if the code is not an integer one,
    /// or the number does not fit into it.
    static cetl::optional<Value> makeSignedInt(const BasicType code, const std::int64_t value);
    static cetl::optional<Value> makeUnsignedInt(const BasicType code, const std::uint64_t value);

    static cetl::optional<Value> makeObjectPath(std::string path);
    static cetl::optional<Value> makeSignature(std::string signature);
    static cetl::optional<Value> makeArray(TypeSignature element, std::vector<Value> items);
    static cetl::optional<Value> makeStruct(std::vector<Value> fields);
    static cetl::optional<Value> makeDict(TypeSignature key, TypeSignature value, std::vector<std::pair<Value, Value>> entries);

    const Kind& kind() const noexcept
    {
        return kind_;
    }

    template <typename T>
    const T* getIf() const noexcept
    {
        return cetl::get_if<T>(&kind_);
    }

    /// The exact type of this value.
    CETL_NODISCARD TypeSignature signature() const;

    /// Renders the value in the textual grammar accepted by `ValueParser`.
    CETL_NODISCARD std::string render() const;

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs)
    {
        return !(lhs == rhs);
    }

private:
    explicit Value(Kind kind)
        : kind_{std::move(kind)}
    {
    }

    Kind kind_;

};  // Value

/// Checks that the value has exactly the shape described by the signature.
///
CETL_NODISCARD bool conforms(const Value& value, const TypeSignature& signature);

/// Checks a sequence of values against a sequence of signatures (same count, each conforming).
///
CETL_NODISCARD bool conforms(const std::vector<Value>& values, const std::vector<TypeSignature>& signatures);

/// Renders values as a comma separated list.
///
std::string renderValues(const std::vector<Value>& values);

/// Validates an object path: `/`, or `/`-separated non-empty segments of `[A-Za-z0-9_]`.
///
CETL_NODISCARD bool isValidObjectPath(const cetl::string_view path) noexcept;

/// Byte length of the well-formed UTF-8 character which starts `text`.
///
/// Returns 0 for an empty text, a NUL, a malformed or truncated sequence,
/// an overlong encoding, a surrogate or a code point above U+10FFFF.
///
CETL_NODISCARD std::size_t utf8SequenceLength(const cetl::string_view text) noexcept;

/// Validates content of a `s` value: well-formed UTF-8 without NUL characters.
///
CETL_NODISCARD bool isValidString(const cetl::string_view text) noexcept;

}  // namespace sdk
}  // namespace dtui

#endif  // DTUI_SDK_VALUE_HPP_INCLUDED
