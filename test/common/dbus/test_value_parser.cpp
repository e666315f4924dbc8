//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dbus/value_parser.hpp"

#include "dbus_gtest_helpers.hpp"  // NOLINT(misc-include-cleaner)

#include <dtui/sdk/signature.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace dtui::sdk;  // NOLINT This our main concern here in the unit tests.

using dtui::common::dbus::ValueParser;
using dtui::common::dbus::ValueParseError;

using testing::Eq;
using testing::Field;
using testing::IsEmpty;
using testing::HasSubstr;
using testing::ElementsAre;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestValueParser : public testing::Test
{
protected:
    static TypeSignature sig(const std::string& text)
    {
        return cetl::get<TypeSignature>(TypeSignature::parse(text));
    }

    static Value parseOk(const std::string& text, const std::string& signature)
    {
        const auto target = sig(signature);
        auto       result = ValueParser::parse(text, target);
        if (const auto* const failure = cetl::get_if<ValueParseError>(&result))
        {
            ADD_FAILURE() << "'" << text << "' as '" << signature << "': " << failure->describe();
            return Value::makeBool(false);
        }
        auto value = cetl::get<Value>(std::move(result));
        EXPECT_TRUE(conforms(value, target)) << value.render();
        return value;
    }

    static ValueParseError parseError(const std::string& text, const std::string& signature)
    {
        auto result = ValueParser::parse(text, sig(signature));
        if (auto* const failure = cetl::get_if<ValueParseError>(&result))
        {
            return *failure;
        }
        ADD_FAILURE() << "'" << text << "' as '" << signature << "' unexpectedly parsed.";
        return ValueParseError{};
    }
};

// MARK: - Tests:

TEST_F(TestValueParser, basic_values)
{
    EXPECT_THAT(parseOk("true", "b"), Eq(Value::makeBool(true)));
    EXPECT_THAT(parseOk(" false ", "b"), Eq(Value::makeBool(false)));
    EXPECT_THAT(parseOk("255", "y"), RendersAs("255"));
    EXPECT_THAT(parseOk("-32768", "n"), Eq(Value::makeInt16(-32768)));
    EXPECT_THAT(parseOk("+7", "u"), Eq(Value::makeUint32(7)));
    EXPECT_THAT(parseOk("-0", "t"), Eq(Value::makeUint64(0)));
    EXPECT_THAT(parseOk("-9223372036854775808", "x"), RendersAs("-9223372036854775808"));
    EXPECT_THAT(parseOk("18446744073709551615", "t"), RendersAs("18446744073709551615"));
    EXPECT_THAT(parseOk("1.5", "d"), Eq(Value::makeDouble(1.5)));
    EXPECT_THAT(parseOk("-2e3", "d"), Eq(Value::makeDouble(-2000.0)));
    EXPECT_THAT(parseOk("42", "d"), Eq(Value::makeDouble(42.0)));
    EXPECT_THAT(parseOk("-inf", "d"), Eq(Value::makeDouble(-INFINITY)));
    EXPECT_THAT(parseError("1e400", "d").kind, Eq(ValueParseError::Kind::DoubleOutOfRange));
    EXPECT_THAT(parseError("1e", "d").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseOk(R"("/org/example")", "o"), Eq(*Value::makeObjectPath("/org/example")));
    EXPECT_THAT(parseOk(R"("a{sv}as")", "g"), Eq(*Value::makeSignature("a{sv}as")));
}

TEST_F(TestValueParser, integer_ranges)
{
    EXPECT_THAT(parseError("256", "y").kind, Eq(ValueParseError::Kind::IntegerOutOfRange));
    EXPECT_THAT(parseError("-1", "y").kind, Eq(ValueParseError::Kind::IntegerOutOfRange));
    EXPECT_THAT(parseError("32768", "n").kind, Eq(ValueParseError::Kind::IntegerOutOfRange));
    EXPECT_THAT(parseError("-2147483649", "i").kind, Eq(ValueParseError::Kind::IntegerOutOfRange));
    EXPECT_THAT(parseError("9223372036854775808", "x").kind, Eq(ValueParseError::Kind::IntegerOutOfRange));
    EXPECT_THAT(parseError("18446744073709551616", "t").kind, Eq(ValueParseError::Kind::IntegerOutOfRange));
    EXPECT_THAT(parseError("99999999999999999999999", "t").kind, Eq(ValueParseError::Kind::IntegerOutOfRange));

    const auto error = parseError("  300", "y");
    EXPECT_THAT(error.offset, Eq(2U));
    EXPECT_THAT(error.expected, Eq("byte"));
    EXPECT_THAT(error.describe(), HasSubstr("IntegerOutOfRange"));

    EXPECT_THAT(parseError("1.5", "i").kind, Eq(ValueParseError::Kind::TrailingInput));
    EXPECT_THAT(parseError("x", "i").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError("-", "i").kind, Eq(ValueParseError::Kind::Syntax));
}

TEST_F(TestValueParser, strings)
{
    EXPECT_THAT(parseOk(R"("")", "s"), Eq(Value::makeString("")));
    EXPECT_THAT(parseOk(R"("a\"b\\c\/d\n\t")", "s"), Eq(Value::makeString("a\"b\\c/d\n\t")));
    EXPECT_THAT(parseOk(R"("\u00e9")", "s"), Eq(Value::makeString("\xC3\xA9")));
    EXPECT_THAT(parseOk(R"("\ud83d\ude00")", "s"), Eq(Value::makeString("\xF0\x9F\x98\x80")));

    EXPECT_THAT(parseError(R"("abc)", "s").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError(R"("\q")", "s").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError(R"("\u12")", "s").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError(R"("\ud83d")", "s").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError("abc", "s").kind, Eq(ValueParseError::Kind::Syntax));

    // Raw text has to be valid UTF-8; the error points at the first bad byte.
    EXPECT_THAT(parseOk("\"caf\xC3\xA9\"", "s"), Eq(Value::makeString("caf\xC3\xA9")));
    const auto not_utf8 = parseError("\"\xFF\xFE\"", "s");
    EXPECT_THAT(not_utf8.kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(not_utf8.offset, Eq(1U));
    EXPECT_THAT(not_utf8.message, HasSubstr("UTF-8"));
    EXPECT_THAT(parseError("\"ok\xC3\"", "s").offset, Eq(3U));
    EXPECT_THAT(parseError("\"\xED\xA0\x80\"", "s").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError("\"\xC0\xAF\"", "s").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError(std::string{"\"a\0b\"", 5}, "s").message, HasSubstr("NUL"));
    EXPECT_THAT(parseError(R"("\u0000")", "s").message, HasSubstr("NUL"));

    EXPECT_THAT(parseError(R"("org/x")", "o").kind, Eq(ValueParseError::Kind::InvalidObjectPath));
    EXPECT_THAT(parseError(R"("/x/")", "o").kind, Eq(ValueParseError::Kind::InvalidObjectPath));
    EXPECT_THAT(parseError(R"("a{")", "g").kind, Eq(ValueParseError::Kind::MalformedSignature));
}

TEST_F(TestValueParser, containers)
{
    EXPECT_THAT(parseOk("[]", "ai"), RendersAs("[]"));
    EXPECT_THAT(parseOk("[1, 2 ,3]", "ai"), RendersAs("[1, 2, 3]"));
    EXPECT_THAT(parseOk(R"([["a"], []])", "aas"), RendersAs(R"([["a"], []])"));
    EXPECT_THAT(parseOk("{}", "a{sv}"), RendersAs("{}"));
    EXPECT_THAT(parseOk(R"({"k": <i>1, "z": <as>["x"]})", "a{sv}"), RendersAs(R"({"k": <i>1, "z": <as>["x"]})"));
    EXPECT_THAT(parseOk(R"({1: "one"})", "a{ys}"), RendersAs(R"({1: "one"})"));
    EXPECT_THAT(parseOk(R"((1, "s", [true]))", "(isab)"), RendersAs(R"((1, "s", [true]))"));

    EXPECT_THAT(parseError("[1 2]", "ai").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError("[1,]", "ai").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError(R"({"k" 1})", "a{si}").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError("[1] x", "ai").kind, Eq(ValueParseError::Kind::TrailingInput));
}

TEST_F(TestValueParser, struct_arity)
{
    EXPECT_THAT(parseOk("(1,2,3)", "(iii)"), RendersAs("(1, 2, 3)"));

    const auto fewer = parseError("(1,2)", "(iii)");
    EXPECT_THAT(fewer.kind, Eq(ValueParseError::Kind::ArityMismatch));
    EXPECT_THAT(fewer.offset, Eq(0U));

    EXPECT_THAT(parseError("(1,2,3,4)", "(iii)").kind, Eq(ValueParseError::Kind::ArityMismatch));
    EXPECT_THAT(parseError("()", "(i)").kind, Eq(ValueParseError::Kind::ArityMismatch));
}

TEST_F(TestValueParser, variants)
{
    EXPECT_THAT(parseOk("<i>42", "v"), Eq(Value::makeVariant(Value::makeInt32(42))));
    EXPECT_THAT(parseOk("<v> <s>\"x\"", "v"), RendersAs(R"(<v><s>"x")"));
    EXPECT_THAT(parseOk("<(is)>(1, \"a\")", "v"), RendersAs(R"(<(is)>(1, "a"))"));

    EXPECT_THAT(parseError("42", "v").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError("<i", "v").kind, Eq(ValueParseError::Kind::Syntax));
    EXPECT_THAT(parseError("<()>()", "v").kind, Eq(ValueParseError::Kind::MalformedSignature));
    EXPECT_THAT(parseError("<ii>1", "v").kind, Eq(ValueParseError::Kind::MalformedSignature));
    EXPECT_THAT(parseError("<i>\"x\"", "v").kind, Eq(ValueParseError::Kind::Syntax));

    const auto too_deep_sig = std::string(33, 'a') + "i";
    EXPECT_THAT(parseError("<" + too_deep_sig + ">[]", "v").kind, Eq(ValueParseError::Kind::SignatureTooDeep));
}

TEST_F(TestValueParser, total_depth_limit)
{
    // Each variant adds a level, so nesting variants runs into the total depth bound.
    std::string text;
    for (std::size_t level = 0; level <= ValueParser::MaxTotalDepth; ++level)
    {
        text += "<v>";
    }
    text += "<i>1";
    EXPECT_THAT(parseError(text, "v").kind, Eq(ValueParseError::Kind::SignatureTooDeep));

    std::string shallow;
    for (std::size_t level = 0; level < 10; ++level)
    {
        shallow += "<v>";
    }
    shallow += "<i>1";
    parseOk(shallow, "v");
}

TEST_F(TestValueParser, unsupported_unix_fd)
{
    EXPECT_THAT(parseError("3", "h").kind, Eq(ValueParseError::Kind::UnsupportedType));
    EXPECT_THAT(parseError("[3]", "ah").kind, Eq(ValueParseError::Kind::UnsupportedType));
}

TEST_F(TestValueParser, parseArguments)
{
    const std::vector<TypeSignature> two_ints{sig("i"), sig("i")};
    EXPECT_THAT(ValueParser::parseArguments("(2, 3)", two_ints),
                VariantWith<std::vector<Value>>(ElementsAre(Value::makeInt32(2), Value::makeInt32(3))));
    EXPECT_THAT(ValueParser::parseArguments("(2)", two_ints),
                VariantWith<ValueParseError>(Field(&ValueParseError::kind, ValueParseError::Kind::ArityMismatch)));
    EXPECT_THAT(ValueParser::parseArguments("(2, \"3\")", two_ints),
                VariantWith<ValueParseError>(Field(&ValueParseError::kind, ValueParseError::Kind::Syntax)));

    EXPECT_THAT(ValueParser::parseArguments("(\"x\")", {sig("s")}),
                VariantWith<std::vector<Value>>(ElementsAre(Value::makeString("x"))));

    EXPECT_THAT(ValueParser::parseArguments("", {}), VariantWith<std::vector<Value>>(IsEmpty()));
    EXPECT_THAT(ValueParser::parseArguments("  ", {}), VariantWith<std::vector<Value>>(IsEmpty()));
    EXPECT_THAT(ValueParser::parseArguments(" ( ) ", {}), VariantWith<std::vector<Value>>(IsEmpty()));
    EXPECT_THAT(ValueParser::parseArguments("(1)", {}),
                VariantWith<ValueParseError>(Field(&ValueParseError::kind, ValueParseError::Kind::ArityMismatch)));
    EXPECT_THAT(ValueParser::parseArguments("( ) junk", {}),
                VariantWith<ValueParseError>(Field(&ValueParseError::kind, ValueParseError::Kind::TrailingInput)));
    EXPECT_THAT(ValueParser::parseArguments("(", {}),
                VariantWith<ValueParseError>(Field(&ValueParseError::kind, ValueParseError::Kind::Syntax)));
    EXPECT_THAT(ValueParser::parseArguments("1", {}),
                VariantWith<ValueParseError>(Field(&ValueParseError::kind, ValueParseError::Kind::Syntax)));
}

TEST_F(TestValueParser, describeType)
{
    EXPECT_THAT(ValueParser::describeType(sig("q")), Eq("uint16"));
    EXPECT_THAT(ValueParser::describeType(sig("as")), Eq("array 'as'"));
    EXPECT_THAT(ValueParser::describeType(sig("a{sv}")), Eq("dict 'a{sv}'"));
    EXPECT_THAT(ValueParser::describeType(sig("(ii)")), Eq("struct '(ii)'"));
    EXPECT_THAT(ValueParser::describeType(sig("v")), Eq("variant"));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
