//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_COMMON_HELPERS_HPP_INCLUDED
#define DTUI_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace dtui
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// Used at the boundaries with C libraries (libdbus & expat callbacks), where an escaping exception
/// would unwind through foreign stack frames.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

/// Joins string representations of the items with the given separator.
///
template <typename Container, typename ToString>
std::string joinAsStrings(const Container& items, const char* const separator, ToString&& to_string)
{
    std::string result;
    bool        is_first = true;
    for (const auto& item : items)
    {
        if (!is_first)
        {
            result += separator;
        }
        is_first = false;
        result += to_string(item);
    }
    return result;
}

}  // namespace common
}  // namespace dtui

#endif  // DTUI_COMMON_HELPERS_HPP_INCLUDED
