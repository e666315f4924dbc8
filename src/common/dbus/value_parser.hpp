//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_COMMON_DBUS_VALUE_PARSER_HPP_INCLUDED
#define DTUI_COMMON_DBUS_VALUE_PARSER_HPP_INCLUDED

#include "dtui/sdk/signature.hpp"
#include "dtui/sdk/value.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dtui
{
namespace common
{
namespace dbus
{

struct ValueParseError
{
    enum class Kind : std::uint8_t
    {
        Syntax,
        IntegerOutOfRange,
        DoubleOutOfRange,
        ArityMismatch,
        TrailingInput,
        MalformedSignature,
        SignatureTooDeep,
        InvalidObjectPath,
        UnsupportedType,
    };

    Kind        kind;
    std::size_t offset;    ///< Byte offset in the input text.
    std::string expected;  ///< Description of the type which was expected at `offset`.
    std::string message;

    /// Renders like `at 3: expected int32: integer is out of range`.
    std::string describe() const;
};

const char* toString(const ValueParseError::Kind kind) noexcept;

/// Signature-directed parser of operator-typed values.
///
/// The input grammar is driven by the target signature, and whitespace is allowed around any token:
///
///   b       `true` | `false`
///   y n q i u x t
///           `[+-]digits` (decimal), range checked against the width and signedness
///   d       decimal number with optional fraction and exponent, or `inf` / `nan` with optional sign;
///           a finite number which overflows a double is out of range
///   s       `"text"` with JSON escapes: \" \\ \/ \b \f \n \r \t \uXXXX
///   o       `"/object/path"`
///   g       `"signature"` (zero or more complete types)
///   aT      `[` T `,` T ... `]`, possibly empty
///   a{KV}   `{` K `:` V `,` ... `}`, possibly empty
///   (T...)  `(` T1 `,` T2 ... `)`, exactly as many fields as the struct has
///   v       `<signature>` followed by a value of that (single complete) type, like `<i>42`
///   h       not supported
///
/// Parsing never has side effects: on failure no value is produced at all.
///
class ValueParser final
{
public:
    /// Bound of nesting (including variants) while parsing a single value.
    static constexpr std::size_t MaxTotalDepth = 64;

    struct Result
    {
        using Success = sdk::Value;
        using Failure = ValueParseError;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Parses the whole text as one value of the given type.
    ///
    static Result::Var parse(const cetl::string_view text, const sdk::TypeSignature& signature);

    struct ArgumentsResult
    {
        using Success = std::vector<sdk::Value>;
        using Failure = ValueParseError;
        using Var     = cetl::variant<Success, Failure>;
    };
    /// Parses arguments of a method call.
    ///
    /// The text is a struct literal with one field per argument, f.e. `(2, 3)` for `ii`.
    /// For methods without arguments the text has to be blank or `()`.
    ///
    static ArgumentsResult::Var parseArguments(const cetl::string_view               text,
                                               const std::vector<sdk::TypeSignature>& in_signatures);

    /// Human readable name of a type, like `int32` or `array 'as'`.
    ///
    static std::string describeType(const sdk::TypeSignature& signature);

};  // ValueParser

}  // namespace dbus
}  // namespace common
}  // namespace dtui

#endif  // DTUI_COMMON_DBUS_VALUE_PARSER_HPP_INCLUDED
