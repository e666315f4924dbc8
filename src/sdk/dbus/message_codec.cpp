//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "message_codec.hpp"

#include "dtui/sdk/signature.hpp"
#include "dtui/sdk/value.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <dbus/dbus.h>
#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace sdk
{
namespace dbus
{
namespace
{

using Failure = cetl::optional<std::string>;

struct FreeDeleter
{
    void operator()(char* const ptr) const noexcept
    {
        dbus_free(ptr);
    }
};

Failure appendValue(DBusMessageIter& iter, const Value& value);

Failure appendBasic(DBusMessageIter& iter, const int type_code, const DBusBasicValue& basic)
{
    if (dbus_message_iter_append_basic(&iter, type_code, &basic) == FALSE)
    {
        return fmt::format("can't append value of type '{}'", static_cast<char>(type_code));
    }
    return cetl::nullopt;
}

Failure appendString(DBusMessageIter& iter, const int type_code, const std::string& text)
{
    // libdbus treats invalid strings as programming errors, so they are validated upfront.
    if (text.find('\0') != std::string::npos)
    {
        return std::string{"strings can't contain NUL characters"};
    }
    if (dbus_validate_utf8(text.c_str(), nullptr) == FALSE)
    {
        return fmt::format("'{}' is not a valid UTF-8 string", text);
    }

    DBusBasicValue basic{};
    basic.str = const_cast<char*>(text.c_str());  // NOLINT(cppcoreguidelines-pro-type-const-cast)
    return appendBasic(iter, type_code, basic);
}

template <typename Action>
Failure appendContainer(DBusMessageIter& iter, const int type_code, const char* const contained_sig, Action&& action)
{
    DBusMessageIter sub{};
    if (dbus_message_iter_open_container(&iter, type_code, contained_sig, &sub) == FALSE)
    {
        return fmt::format("can't open container of type '{}'", static_cast<char>(type_code));
    }
    if (auto failure = std::forward<Action>(action)(sub))
    {
        dbus_message_iter_abandon_container(&iter, &sub);
        return failure;
    }
    if (dbus_message_iter_close_container(&iter, &sub) == FALSE)
    {
        return fmt::format("can't close container of type '{}'", static_cast<char>(type_code));
    }
    return cetl::nullopt;
}

Failure appendItems(DBusMessageIter& iter, const std::vector<Value>& items)
{
    for (const auto& item : items)
    {
        if (auto failure = appendValue(iter, item))
        {
            return failure;
        }
    }
    return cetl::nullopt;
}

Failure appendValue(DBusMessageIter& iter, const Value& value)
{
    return cetl::visit(  //
        cetl::make_overloaded(
            [&iter](const Value::Bool& boolean) {
                //
                DBusBasicValue basic{};
                basic.bool_val = boolean.value ? TRUE : FALSE;
                return appendBasic(iter, DBUS_TYPE_BOOLEAN, basic);
            },
            [&iter, &value](const Value::Int& integer) {
                //
                const auto code = value.signature().basicType();
                CETL_DEBUG_ASSERT(code, "");

                DBusBasicValue basic{};
                if (integer.is_signed)
                {
                    basic.i64 = integer.signed_value;
                }
                else
                {
                    basic.u64 = integer.unsigned_value;
                }
                // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
                switch (integer.width)
                {
                case 8:
                    basic.byt = static_cast<unsigned char>(integer.unsigned_value);
                    break;
                case 16:
                    if (integer.is_signed)
                    {
                        basic.i16 = static_cast<dbus_int16_t>(integer.signed_value);
                    }
                    else
                    {
                        basic.u16 = static_cast<dbus_uint16_t>(integer.unsigned_value);
                    }
                    break;
                case 32:
                    if (integer.is_signed)
                    {
                        basic.i32 = static_cast<dbus_int32_t>(integer.signed_value);
                    }
                    else
                    {
                        basic.u32 = static_cast<dbus_uint32_t>(integer.unsigned_value);
                    }
                    break;
                default:
                    break;
                }
                // NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
                return appendBasic(iter, static_cast<int>(*code), basic);
            },
            [&iter](const Value::Double& number) {
                //
                DBusBasicValue basic{};
                basic.dbl = number.value;
                return appendBasic(iter, DBUS_TYPE_DOUBLE, basic);
            },
            [&iter](const Value::Str& str) {
                //
                return appendString(iter, DBUS_TYPE_STRING, str.value);
            },
            [&iter](const Value::ObjectPath& path) {
                //
                return appendString(iter, DBUS_TYPE_OBJECT_PATH, path.value);
            },
            [&iter](const Value::Signature& signature) {
                //
                return appendString(iter, DBUS_TYPE_SIGNATURE, signature.value);
            },
            [&iter](const Value::Array& array) {
                //
                const auto element_sig = array.element.render();
                return appendContainer(iter, DBUS_TYPE_ARRAY, element_sig.c_str(), [&array](DBusMessageIter& sub) {
                    //
                    return appendItems(sub, array.items);
                });
            },
            [&iter](const Value::Struct& structure) {
                //
                return appendContainer(iter, DBUS_TYPE_STRUCT, nullptr, [&structure](DBusMessageIter& sub) {
                    //
                    return appendItems(sub, structure.fields);
                });
            },
            [&iter](const Value::Dict& dict) {
                //
                const auto entry_sig = fmt::format("{{{}{}}}", dict.key.render(), dict.value.render());
                return appendContainer(iter, DBUS_TYPE_ARRAY, entry_sig.c_str(), [&dict](DBusMessageIter& sub) {
                    //
                    for (const auto& entry : dict.entries)
                    {
                        auto failure =
                            appendContainer(sub, DBUS_TYPE_DICT_ENTRY, nullptr, [&entry](DBusMessageIter& entry_iter) {
                                //
                                if (auto key_failure = appendValue(entry_iter, entry.first))
                                {
                                    return key_failure;
                                }
                                return appendValue(entry_iter, entry.second);
                            });
                        if (failure)
                        {
                            return failure;
                        }
                    }
                    return Failure{};
                });
            },
            [&iter](const Value::Variant& variant) {
                //
                const auto inner_sig = variant.inner->signature().render();
                return appendContainer(iter, DBUS_TYPE_VARIANT, inner_sig.c_str(), [&variant](DBusMessageIter& sub) {
                    //
                    return appendValue(sub, *variant.inner);
                });
            }),
        value.kind());
}

using DecodeValueResult = cetl::variant<Value, std::string>;

DecodeValueResult decodeValue(DBusMessageIter& iter);

/// Collects all values of a container iterator (or of a message body).
///
cetl::variant<std::vector<Value>, std::string> decodeItems(DBusMessageIter& iter)
{
    std::vector<Value> items;
    while (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_INVALID)
    {
        auto item = decodeValue(iter);
        if (auto* const failure = cetl::get_if<std::string>(&item))
        {
            return std::move(*failure);
        }
        items.push_back(cetl::get<Value>(std::move(item)));
        dbus_message_iter_next(&iter);
    }
    return items;
}

cetl::optional<TypeSignature> currentSignature(DBusMessageIter& iter)
{
    const std::unique_ptr<char, FreeDeleter> raw_sig{dbus_message_iter_get_signature(&iter)};
    if (!raw_sig)
    {
        return cetl::nullopt;
    }
    auto parsed = TypeSignature::parse(raw_sig.get());
    if (auto* const signature = cetl::get_if<TypeSignature>(&parsed))
    {
        return std::move(*signature);
    }
    return cetl::nullopt;
}

DecodeValueResult decodeArray(DBusMessageIter& iter)
{
    auto signature = currentSignature(iter);
    if (!signature)
    {
        return std::string{"can't get signature of an array"};
    }
    const auto* const array = signature->getIf<TypeSignature::Array>();
    CETL_DEBUG_ASSERT(array != nullptr, "");

    DBusMessageIter sub{};
    dbus_message_iter_recurse(&iter, &sub);

    if (const auto* const entry = array->element->getIf<TypeSignature::DictEntry>())
    {
        std::vector<std::pair<Value, Value>> entries;
        while (dbus_message_iter_get_arg_type(&sub) == DBUS_TYPE_DICT_ENTRY)
        {
            DBusMessageIter entry_iter{};
            dbus_message_iter_recurse(&sub, &entry_iter);

            auto key = decodeValue(entry_iter);
            if (auto* const failure = cetl::get_if<std::string>(&key))
            {
                return std::move(*failure);
            }
            dbus_message_iter_next(&entry_iter);
            auto value = decodeValue(entry_iter);
            if (auto* const failure = cetl::get_if<std::string>(&value))
            {
                return std::move(*failure);
            }
            entries.emplace_back(cetl::get<Value>(std::move(key)), cetl::get<Value>(std::move(value)));
            dbus_message_iter_next(&sub);
        }
        if (auto dict = Value::makeDict(*entry->key, *entry->value, std::move(entries)))
        {
            return std::move(*dict);
        }
        return fmt::format("malformed dict '{}'", signature->render());
    }

    auto items = decodeItems(sub);
    if (auto* const failure = cetl::get_if<std::string>(&items))
    {
        return std::move(*failure);
    }
    if (auto array_value = Value::makeArray(*array->element, cetl::get<std::vector<Value>>(std::move(items))))
    {
        return std::move(*array_value);
    }
    return fmt::format("malformed array '{}'", signature->render());
}

DecodeValueResult decodeString(DBusMessageIter& iter, const int type_code)
{
    DBusBasicValue basic{};
    dbus_message_iter_get_basic(&iter, &basic);
    std::string text{(basic.str != nullptr) ? basic.str : ""};

    switch (type_code)
    {
    case DBUS_TYPE_OBJECT_PATH:
        if (auto path = Value::makeObjectPath(std::move(text)))
        {
            return std::move(*path);
        }
        return std::string{"malformed object path"};
    case DBUS_TYPE_SIGNATURE:
        if (auto signature = Value::makeSignature(std::move(text)))
        {
            return std::move(*signature);
        }
        return std::string{"malformed signature"};
    default:
        return Value::makeString(std::move(text));
    }
}

DecodeValueResult decodeValue(DBusMessageIter& iter)
{
    const int type_code = dbus_message_iter_get_arg_type(&iter);

    DBusBasicValue basic{};
    switch (type_code)
    {
    case DBUS_TYPE_BOOLEAN:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeBool(basic.bool_val != FALSE);
    case DBUS_TYPE_BYTE:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeByte(basic.byt);
    case DBUS_TYPE_INT16:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeInt16(basic.i16);
    case DBUS_TYPE_UINT16:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeUint16(basic.u16);
    case DBUS_TYPE_INT32:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeInt32(basic.i32);
    case DBUS_TYPE_UINT32:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeUint32(basic.u32);
    case DBUS_TYPE_INT64:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeInt64(basic.i64);
    case DBUS_TYPE_UINT64:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeUint64(basic.u64);
    case DBUS_TYPE_DOUBLE:
        dbus_message_iter_get_basic(&iter, &basic);
        return Value::makeDouble(basic.dbl);
    case DBUS_TYPE_STRING:
    case DBUS_TYPE_OBJECT_PATH:
    case DBUS_TYPE_SIGNATURE:
        return decodeString(iter, type_code);
    case DBUS_TYPE_UNIX_FD:
        return std::string{"unix file descriptors are not supported"};
    case DBUS_TYPE_ARRAY:
        return decodeArray(iter);
    case DBUS_TYPE_STRUCT: {
        DBusMessageIter sub{};
        dbus_message_iter_recurse(&iter, &sub);
        auto fields = decodeItems(sub);
        if (auto* const failure = cetl::get_if<std::string>(&fields))
        {
            return std::move(*failure);
        }
        if (auto structure = Value::makeStruct(cetl::get<std::vector<Value>>(std::move(fields))))
        {
            return std::move(*structure);
        }
        return std::string{"malformed struct"};
    }
    case DBUS_TYPE_VARIANT: {
        DBusMessageIter sub{};
        dbus_message_iter_recurse(&iter, &sub);
        auto inner = decodeValue(sub);
        if (auto* const inner_value = cetl::get_if<Value>(&inner))
        {
            return Value::makeVariant(std::move(*inner_value));
        }
        return inner;
    }
    default:
        return fmt::format("unexpected type code '{}'", static_cast<char>(type_code));
    }
}

}  // namespace

cetl::optional<std::string> appendValues(DBusMessage& message, const std::vector<Value>& values)
{
    DBusMessageIter iter{};
    dbus_message_iter_init_append(&message, &iter);
    return appendItems(iter, values);
}

DecodeResult::Var decodeBody(DBusMessage& message)
{
    DBusMessageIter iter{};
    if (dbus_message_iter_init(&message, &iter) == FALSE)
    {
        // Empty body.
        return std::vector<Value>{};
    }

    auto items = decodeItems(iter);
    if (auto* const failure = cetl::get_if<std::string>(&items))
    {
        return std::move(*failure);
    }
    return cetl::get<std::vector<Value>>(std::move(items));
}

}  // namespace dbus
}  // namespace sdk
}  // namespace dtui
