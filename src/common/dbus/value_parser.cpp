//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "value_parser.hpp"

#include "dtui/sdk/signature.hpp"
#include "dtui/sdk/value.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
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

using sdk::BasicType;
using sdk::TypeSignature;
using sdk::Value;

class ParserImpl final
{
public:
    using Var = ValueParser::Result::Var;

    explicit ParserImpl(const cetl::string_view text)
        : text_{text}
        , pos_{0}
    {
    }

    std::size_t pos() const noexcept
    {
        return pos_;
    }

    bool atEnd() const noexcept
    {
        return pos_ >= text_.size();
    }

    void skipWhitespace() noexcept
    {
        while (!atEnd() && isWhitespace(text_[pos_]))
        {
            ++pos_;
        }
    }

    Var parseValue(const TypeSignature& signature, const std::size_t depth)
    {
        skipWhitespace();

        if (depth > ValueParser::MaxTotalDepth)
        {
            return error(ValueParseError::Kind::SignatureTooDeep,
                         pos_,
                         signature,
                         fmt::format("values are nested deeper than {} levels", ValueParser::MaxTotalDepth));
        }

        return cetl::visit(cetl::make_overloaded(
                               [this, &signature](const TypeSignature::Basic& basic) {
                                   //
                                   return parseBasic(basic.code, signature);
                               },
                               [this, &signature, depth](const TypeSignature::Array& array) {
                                   //
                                   if (const auto* const entry = array.element->getIf<TypeSignature::DictEntry>())
                                   {
                                       return parseDict(*entry, signature, depth + 1);
                                   }
                                   return parseArray(*array.element, signature, depth + 1);
                               },
                               [this, &signature, depth](const TypeSignature::Struct& structure) {
                                   //
                                   return parseStruct(structure, signature, depth + 1);
                               },
                               [this, &signature](const TypeSignature::DictEntry&) {
                                   //
                                   return Var{error(ValueParseError::Kind::UnsupportedType,
                                                    pos_,
                                                    signature,
                                                    "dict entry is not a standalone type")};
                               },
                               [this, &signature, depth](const TypeSignature::Variant&) {
                                   //
                                   return parseVariant(signature, depth + 1);
                               }),
                           signature.kind());
    }

    static ValueParseError error(const ValueParseError::Kind kind,
                                 const std::size_t           offset,
                                 const TypeSignature&        expected,
                                 std::string                 message)
    {
        return ValueParseError{kind, offset, ValueParser::describeType(expected), std::move(message)};
    }

private:
    using StringResult = cetl::variant<std::string, ValueParseError>;

    static bool isWhitespace(const char ch) noexcept
    {
        return (ch == ' ') || (ch == '\t') || (ch == '\n') || (ch == '\r');
    }

    static bool isDigit(const char ch) noexcept
    {
        return (ch >= '0') && (ch <= '9');
    }

    bool tryConsume(const char ch) noexcept
    {
        skipWhitespace();
        if (!atEnd() && (text_[pos_] == ch))
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool tryConsumeWord(const cetl::string_view word) noexcept
    {
        if (text_.substr(pos_, word.size()) == word)
        {
            pos_ += word.size();
            return true;
        }
        return false;
    }

    ValueParseError syntax(const TypeSignature& expected, std::string message) const
    {
        return error(ValueParseError::Kind::Syntax, pos_, expected, std::move(message));
    }

    Var parseBasic(const BasicType basic_type, const TypeSignature& signature)
    {
        switch (basic_type)
        {
        case BasicType::Boolean:
            return parseBool(signature);
        case BasicType::Double:
            return parseDouble(signature);
        case BasicType::String:
            return parseStringValue(signature);
        case BasicType::ObjectPath:
            return parseObjectPath(signature);
        case BasicType::Signature:
            return parseSignatureValue(signature);
        case BasicType::UnixFd:
            return error(ValueParseError::Kind::UnsupportedType, pos_, signature, "unix file descriptors can't be entered");
        default:
            return parseInteger(basic_type, signature);
        }
    }

    Var parseBool(const TypeSignature& signature)
    {
        if (tryConsumeWord("true"))
        {
            return Value::makeBool(true);
        }
        if (tryConsumeWord("false"))
        {
            return Value::makeBool(false);
        }
        return syntax(signature, "expected `true` or `false`");
    }

    Var parseInteger(const BasicType basic_type, const TypeSignature& signature)
    {
        const auto traits = sdk::integerTraitsOf(basic_type);
        CETL_DEBUG_ASSERT(traits, "");

        const auto start       = pos_;
        bool       is_negative = false;
        if (!atEnd() && ((text_[pos_] == '-') || (text_[pos_] == '+')))
        {
            is_negative = text_[pos_] == '-';
            ++pos_;
        }
        if (atEnd() || !isDigit(text_[pos_]))
        {
            pos_ = start;
            return syntax(signature, "expected a decimal integer");
        }

        constexpr std::uint64_t Base      = 10;
        std::uint64_t           magnitude = 0;
        bool                    overflow  = false;
        while (!atEnd() && isDigit(text_[pos_]))
        {
            const auto digit = static_cast<std::uint64_t>(text_[pos_] - '0');
            if (magnitude > ((std::numeric_limits<std::uint64_t>::max() - digit) / Base))
            {
                overflow = true;
            }
            else
            {
                magnitude = (magnitude * Base) + digit;
            }
            ++pos_;
        }

        const auto out_of_range = [&] {
            //
            return error(ValueParseError::Kind::IntegerOutOfRange,
                         start,
                         signature,
                         fmt::format("'{}' does not fit into {}",
                                     std::string{text_.substr(start, pos_ - start)},
                                     ValueParser::describeType(signature)));
        };
        if (overflow)
        {
            return out_of_range();
        }

        if (!traits->is_signed)
        {
            if (is_negative && (magnitude != 0))
            {
                return out_of_range();
            }
            if (auto value = Value::makeUnsignedInt(basic_type, magnitude))
            {
                return std::move(*value);
            }
            return out_of_range();
        }

        // The most negative value has a magnitude one greater than the most positive one.
        constexpr auto MaxPositive = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (magnitude > (is_negative ? (MaxPositive + 1U) : MaxPositive))
        {
            return out_of_range();
        }
        const std::int64_t number = is_negative ? static_cast<std::int64_t>(0U - magnitude)
                                                : static_cast<std::int64_t>(magnitude);
        if (auto value = Value::makeSignedInt(basic_type, number))
        {
            return std::move(*value);
        }
        return out_of_range();
    }

    Var parseDouble(const TypeSignature& signature)
    {
        const auto start = pos_;

        bool is_negative = false;
        if (!atEnd() && ((text_[pos_] == '-') || (text_[pos_] == '+')))
        {
            is_negative = text_[pos_] == '-';
            ++pos_;
        }
        if (tryConsumeWord("inf"))
        {
            const auto inf = std::numeric_limits<double>::infinity();
            return Value::makeDouble(is_negative ? -inf : inf);
        }
        if (tryConsumeWord("nan"))
        {
            return Value::makeDouble(std::numeric_limits<double>::quiet_NaN());
        }

        std::string token{text_.substr(start, pos_ - start)};
        bool        has_digits = false;
        while (!atEnd())
        {
            const char ch = text_[pos_];
            if (isDigit(ch))
            {
                has_digits = true;
            }
            else if ((ch == '.') || (ch == 'e') || (ch == 'E'))
            {
                // Part of the number.
            }
            else if (((ch == '-') || (ch == '+')) && !token.empty() &&
                     ((token.back() == 'e') || (token.back() == 'E')))
            {
                // Exponent sign.
            }
            else
            {
                break;
            }
            token += ch;
            ++pos_;
        }
        if (!has_digits)
        {
            pos_ = start;
            return syntax(signature, "expected a number");
        }

        char* end_ptr = nullptr;
        errno         = 0;
        const double number = std::strtod(token.c_str(), &end_ptr);
        if (end_ptr != (token.c_str() + token.size()))
        {
            pos_ = start;
            return syntax(signature, fmt::format("'{}' is not a valid double", token));
        }
        if ((errno == ERANGE) && std::isinf(number))
        {
            return error(ValueParseError::Kind::DoubleOutOfRange,
                         start,
                         signature,
                         fmt::format("'{}' is too large for a double", token));
        }
        return Value::makeDouble(number);
    }

    StringResult parseQuoted(const TypeSignature& signature)
    {
        const auto start = pos_;
        if (atEnd() || (text_[pos_] != '"'))
        {
            return syntax(signature, "expected a double-quoted string");
        }
        ++pos_;

        std::string result;
        while (true)
        {
            if (atEnd())
            {
                return error(ValueParseError::Kind::Syntax, start, signature, "unterminated string");
            }

            const char ch = text_[pos_++];
            if (ch == '"')
            {
                break;
            }
            if (ch != '\\')
            {
                const auto char_pos = pos_ - 1;
                const auto length   = sdk::utf8SequenceLength(text_.substr(char_pos));
                if (length == 0)
                {
                    return error(ValueParseError::Kind::Syntax,
                                 char_pos,
                                 signature,
                                 (ch == '\0') ? "NUL characters are not allowed in strings"
                                              : "string is not valid UTF-8");
                }
                result.append(text_.substr(char_pos, length).data(), length);
                pos_ = char_pos + length;
                continue;
            }

            if (atEnd())
            {
                return error(ValueParseError::Kind::Syntax, start, signature, "unterminated string");
            }
            const auto escape_pos = pos_ - 1;
            const char escaped    = text_[pos_++];
            switch (escaped)
            {
            case '"':
            case '\\':
            case '/':
                result += escaped;
                break;
            case 'b':
                result += '\b';
                break;
            case 'f':
                result += '\f';
                break;
            case 'n':
                result += '\n';
                break;
            case 'r':
                result += '\r';
                break;
            case 't':
                result += '\t';
                break;
            case 'u': {
                if (auto failure = parseUnicodeEscape(escape_pos, signature, result))
                {
                    return std::move(*failure);
                }
                break;
            }
            default:
                return error(ValueParseError::Kind::Syntax,
                             escape_pos,
                             signature,
                             fmt::format("unknown escape sequence '\\{}'", escaped));
            }
        }
        return result;
    }

    cetl::optional<std::uint32_t> readHex4() noexcept
    {
        constexpr std::size_t HexDigits = 4;
        if ((pos_ + HexDigits) > text_.size())
        {
            return cetl::nullopt;
        }

        std::uint32_t code = 0;
        for (std::size_t index = 0; index < HexDigits; ++index)
        {
            const char ch = text_[pos_ + index];
            code <<= 4U;
            if (isDigit(ch))
            {
                code |= static_cast<std::uint32_t>(ch - '0');
            }
            else if ((ch >= 'a') && (ch <= 'f'))
            {
                code |= static_cast<std::uint32_t>(ch - 'a' + 10);  // NOLINT(*-magic-numbers)
            }
            else if ((ch >= 'A') && (ch <= 'F'))
            {
                code |= static_cast<std::uint32_t>(ch - 'A' + 10);  // NOLINT(*-magic-numbers)
            }
            else
            {
                return cetl::nullopt;
            }
        }
        pos_ += HexDigits;
        return code;
    }

    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

    cetl::optional<ValueParseError> parseUnicodeEscape(const std::size_t   escape_pos,
                                                        const TypeSignature& signature,
                                                        std::string&         out)
    {
        const auto invalid = [&](const char* const what) {
            //
            return error(ValueParseError::Kind::Syntax, escape_pos, signature, what);
        };

        auto code = readHex4();
        if (!code)
        {
            return invalid("expected four hex digits after '\\u'");
        }

        std::uint32_t code_point = *code;
        if ((code_point >= 0xD800U) && (code_point <= 0xDBFFU))
        {
            if (!tryConsumeWord("\\u"))
            {
                return invalid("unpaired high surrogate");
            }
            const auto low = readHex4();
            if (!low || (*low < 0xDC00U) || (*low > 0xDFFFU))
            {
                return invalid("invalid low surrogate");
            }
            code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (*low - 0xDC00U);
        }
        else if ((code_point >= 0xDC00U) && (code_point <= 0xDFFFU))
        {
            return invalid("unpaired low surrogate");
        }
        if (code_point == 0)
        {
            return invalid("NUL characters are not allowed in strings");
        }

        // UTF-8 encoding.
        if (code_point < 0x80U)
        {
            out += static_cast<char>(code_point);
        }
        else if (code_point < 0x800U)
        {
            out += static_cast<char>(0xC0U | (code_point >> 6U));
            out += static_cast<char>(0x80U | (code_point & 0x3FU));
        }
        else if (code_point < 0x10000U)
        {
            out += static_cast<char>(0xE0U | (code_point >> 12U));
            out += static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU));
            out += static_cast<char>(0x80U | (code_point & 0x3FU));
        }
        else
        {
            out += static_cast<char>(0xF0U | (code_point >> 18U));
            out += static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU));
            out += static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU));
            out += static_cast<char>(0x80U | (code_point & 0x3FU));
        }
        return cetl::nullopt;
    }

    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

    Var parseStringValue(const TypeSignature& signature)
    {
        auto quoted = parseQuoted(signature);
        if (auto* const failure = cetl::get_if<ValueParseError>(&quoted))
        {
            return std::move(*failure);
        }
        return Value::makeString(cetl::get<std::string>(std::move(quoted)));
    }

    Var parseObjectPath(const TypeSignature& signature)
    {
        const auto start  = pos_;
        auto       quoted = parseQuoted(signature);
        if (auto* const failure = cetl::get_if<ValueParseError>(&quoted))
        {
            return std::move(*failure);
        }

        auto path = cetl::get<std::string>(std::move(quoted));
        if (auto value = Value::makeObjectPath(path))
        {
            return std::move(*value);
        }
        return error(ValueParseError::Kind::InvalidObjectPath,
                     start,
                     signature,
                     fmt::format("'{}' is not a valid object path", path));
    }

    static ValueParseError fromSignatureError(const sdk::SignatureError& sig_error,
                                              const std::size_t          base_offset,
                                              const TypeSignature&       signature)
    {
        const auto kind = (sig_error.kind == sdk::SignatureError::Kind::TooDeep)
                              ? ValueParseError::Kind::SignatureTooDeep
                              : ValueParseError::Kind::MalformedSignature;
        return error(kind, base_offset + sig_error.offset, signature, sig_error.message);
    }

    Var parseSignatureValue(const TypeSignature& signature)
    {
        const auto start  = pos_;
        auto       quoted = parseQuoted(signature);
        if (auto* const failure = cetl::get_if<ValueParseError>(&quoted))
        {
            return std::move(*failure);
        }

        auto text   = cetl::get<std::string>(std::move(quoted));
        auto parsed = TypeSignature::parseList(text);
        if (const auto* const sig_error = cetl::get_if<sdk::SignatureError>(&parsed))
        {
            return fromSignatureError(*sig_error, start + 1, signature);
        }
        if (auto value = Value::makeSignature(std::move(text)))
        {
            return std::move(*value);
        }
        return error(ValueParseError::Kind::MalformedSignature, start, signature, "invalid signature");
    }

    Var parseVariant(const TypeSignature& signature, const std::size_t depth)
    {
        const auto start = pos_;
        if (!tryConsume('<'))
        {
            return syntax(signature, "expected '<signature>' in front of a variant value");
        }
        const auto sig_start = pos_;
        const auto sig_end   = text_.find('>', sig_start);
        if (sig_end == cetl::string_view::npos)
        {
            return error(ValueParseError::Kind::Syntax, start, signature, "unterminated variant signature");
        }

        auto inner_sig = TypeSignature::parse(text_.substr(sig_start, sig_end - sig_start));
        if (const auto* const sig_error = cetl::get_if<sdk::SignatureError>(&inner_sig))
        {
            return fromSignatureError(*sig_error, sig_start, signature);
        }
        pos_ = sig_end + 1;

        auto inner = parseValue(cetl::get<TypeSignature>(inner_sig), depth);
        if (auto* const inner_value = cetl::get_if<Value>(&inner))
        {
            return Value::makeVariant(std::move(*inner_value));
        }
        return inner;
    }

    Var parseArray(const TypeSignature& element, const TypeSignature& signature, const std::size_t depth)
    {
        const auto start = pos_;
        if (!tryConsume('['))
        {
            return syntax(signature, "expected '['");
        }

        std::vector<Value> items;
        if (!tryConsume(']'))
        {
            while (true)
            {
                auto item = parseValue(element, depth);
                if (auto* const item_value = cetl::get_if<Value>(&item))
                {
                    items.push_back(std::move(*item_value));
                }
                else
                {
                    return item;
                }

                if (tryConsume(','))
                {
                    continue;
                }
                if (tryConsume(']'))
                {
                    break;
                }
                return syntax(signature, "expected ',' or ']'");
            }
        }

        if (auto value = Value::makeArray(element, std::move(items)))
        {
            return std::move(*value);
        }
        return error(ValueParseError::Kind::UnsupportedType, start, signature, "array can't be constructed");
    }

    Var parseDict(const TypeSignature::DictEntry& entry, const TypeSignature& signature, const std::size_t depth)
    {
        const auto start = pos_;
        if (!tryConsume('{'))
        {
            return syntax(signature, "expected '{'");
        }

        std::vector<std::pair<Value, Value>> entries;
        if (!tryConsume('}'))
        {
            while (true)
            {
                auto key = parseValue(*entry.key, depth);
                if (cetl::get_if<ValueParseError>(&key) != nullptr)
                {
                    return key;
                }
                if (!tryConsume(':'))
                {
                    return syntax(signature, "expected ':' between a key and its value");
                }
                auto value = parseValue(*entry.value, depth);
                if (cetl::get_if<ValueParseError>(&value) != nullptr)
                {
                    return value;
                }
                entries.emplace_back(cetl::get<Value>(std::move(key)), cetl::get<Value>(std::move(value)));

                if (tryConsume(','))
                {
                    continue;
                }
                if (tryConsume('}'))
                {
                    break;
                }
                return syntax(signature, "expected ',' or '}'");
            }
        }

        if (auto value = Value::makeDict(*entry.key, *entry.value, std::move(entries)))
        {
            return std::move(*value);
        }
        return error(ValueParseError::Kind::UnsupportedType, start, signature, "dict can't be constructed");
    }

    Var parseStruct(const TypeSignature::Struct& structure, const TypeSignature& signature, const std::size_t depth)
    {
        const auto start = pos_;
        if (!tryConsume('('))
        {
            return syntax(signature, "expected '('");
        }

        const auto arity_mismatch = [&](const std::size_t offset, const char* const actual) {
            //
            return error(ValueParseError::Kind::ArityMismatch,
                         offset,
                         signature,
                         fmt::format("struct has {} field(s), got {}", structure.fields.size(), actual));
        };

        std::vector<Value> fields;
        fields.reserve(structure.fields.size());
        for (const auto& field_sig : structure.fields)
        {
            if (!fields.empty())
            {
                if (tryConsume(')'))
                {
                    return arity_mismatch(start, std::to_string(fields.size()).c_str());
                }
                if (!tryConsume(','))
                {
                    return syntax(signature, "expected ',' or ')'");
                }
            }
            else if (tryConsume(')'))
            {
                return arity_mismatch(start, "none");
            }

            auto field = parseValue(field_sig, depth);
            if (auto* const field_value = cetl::get_if<Value>(&field))
            {
                fields.push_back(std::move(*field_value));
            }
            else
            {
                return field;
            }
        }

        if (tryConsume(','))
        {
            return arity_mismatch(start, "more");
        }
        if (!tryConsume(')'))
        {
            return syntax(signature, "expected ')'");
        }

        if (auto value = Value::makeStruct(std::move(fields)))
        {
            return std::move(*value);
        }
        return error(ValueParseError::Kind::UnsupportedType, start, signature, "struct can't be constructed");
    }

    cetl::string_view text_;
    std::size_t       pos_;

};  // ParserImpl

bool isBlank(const cetl::string_view text)
{
    for (const char ch : text)
    {
        if ((ch != ' ') && (ch != '\t') && (ch != '\n') && (ch != '\r'))
        {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string ValueParseError::describe() const
{
    return fmt::format("at {}: expected {}: {} ({})", offset, expected, message, toString(kind));
}

const char* toString(const ValueParseError::Kind kind) noexcept
{
    switch (kind)
    {
    case ValueParseError::Kind::Syntax:
        return "Syntax";
    case ValueParseError::Kind::IntegerOutOfRange:
        return "IntegerOutOfRange";
    case ValueParseError::Kind::DoubleOutOfRange:
        return "DoubleOutOfRange";
    case ValueParseError::Kind::ArityMismatch:
        return "ArityMismatch";
    case ValueParseError::Kind::TrailingInput:
        return "TrailingInput";
    case ValueParseError::Kind::MalformedSignature:
        return "MalformedSignature";
    case ValueParseError::Kind::SignatureTooDeep:
        return "SignatureTooDeep";
    case ValueParseError::Kind::InvalidObjectPath:
        return "InvalidObjectPath";
    case ValueParseError::Kind::UnsupportedType:
        return "UnsupportedType";
    }
    return "?";
}

ValueParser::Result::Var ValueParser::parse(const cetl::string_view text, const TypeSignature& signature)
{
    ParserImpl parser{text};

    auto result = parser.parseValue(signature, 0);
    if (cetl::get_if<Value>(&result) != nullptr)
    {
        parser.skipWhitespace();
        if (!parser.atEnd())
        {
            return ParserImpl::error(ValueParseError::Kind::TrailingInput,
                                     parser.pos(),
                                     signature,
                                     "unexpected input after a complete value");
        }
    }
    return result;
}

ValueParser::ArgumentsResult::Var ValueParser::parseArguments(const cetl::string_view           text,
                                                              const std::vector<TypeSignature>& in_signatures)
{
    if (in_signatures.empty())
    {
        ParserImpl parser{text};
        parser.skipWhitespace();
        const auto start = parser.pos();
        if (isBlank(text))
        {
            return std::vector<Value>{};
        }

        const auto failure = [](const ValueParseError::Kind kind, const std::size_t offset, std::string message) {
            //
            return ValueParseError{kind, offset, "no arguments", std::move(message)};
        };

        if (text[start] != '(')
        {
            return failure(ValueParseError::Kind::Syntax, start, "expected '('");
        }
        const auto close = text.find(')', start);
        if (close == cetl::string_view::npos)
        {
            return failure(ValueParseError::Kind::Syntax, text.size(), "expected ')'");
        }
        if (!isBlank(text.substr(start + 1, close - start - 1)))
        {
            return failure(ValueParseError::Kind::ArityMismatch, start, "method takes no arguments");
        }
        if (!isBlank(text.substr(close + 1)))
        {
            return failure(ValueParseError::Kind::TrailingInput, close + 1, "unexpected input after '()'");
        }
        return std::vector<Value>{};
    }

    auto result = parse(text, TypeSignature::makeStruct(in_signatures));
    if (auto* const failure = cetl::get_if<ValueParseError>(&result))
    {
        return std::move(*failure);
    }

    const auto value = cetl::get<Value>(std::move(result));
    return value.getIf<Value::Struct>()->fields;
}

std::string ValueParser::describeType(const TypeSignature& signature)
{
    if (const auto basic_type = signature.basicType())
    {
        switch (*basic_type)
        {
        case BasicType::Byte:
            return "byte";
        case BasicType::Boolean:
            return "boolean";
        case BasicType::Int16:
            return "int16";
        case BasicType::Uint16:
            return "uint16";
        case BasicType::Int32:
            return "int32";
        case BasicType::Uint32:
            return "uint32";
        case BasicType::Int64:
            return "int64";
        case BasicType::Uint64:
            return "uint64";
        case BasicType::Double:
            return "double";
        case BasicType::String:
            return "string";
        case BasicType::ObjectPath:
            return "object path";
        case BasicType::Signature:
            return "signature";
        case BasicType::UnixFd:
            return "unix fd";
        }
    }
    if (signature.isDict())
    {
        return fmt::format("dict '{}'", signature.render());
    }
    if (signature.getIf<TypeSignature::Array>() != nullptr)
    {
        return fmt::format("array '{}'", signature.render());
    }
    if (signature.getIf<TypeSignature::Struct>() != nullptr)
    {
        return fmt::format("struct '{}'", signature.render());
    }
    if (signature.getIf<TypeSignature::Variant>() != nullptr)
    {
        return "variant";
    }
    return fmt::format("'{}'", signature.render());
}

}  // namespace dbus
}  // namespace common
}  // namespace dtui
