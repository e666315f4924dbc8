//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_CLI_CONFIG_MOCK_HPP_INCLUDED
#define DTUI_CLI_CONFIG_MOCK_HPP_INCLUDED

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <cstdint>
#include <string>

namespace dtui
{
namespace cli
{

class ConfigMock : public Config
{
public:
    ConfigMock()
    {
        using testing::Return;

        ON_CALL(*this, getBusKind()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getBusAddress()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getServicesFilter()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getServicesShowUniqueNames()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getCallsTimeoutMs()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getCallsMaxInFlightPerService()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getLoggingFile()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getLoggingLevel()).WillByDefault(Return(cetl::nullopt));
        ON_CALL(*this, getLoggingFlushLevel()).WillByDefault(Return(cetl::nullopt));
    }

    MOCK_METHOD(cetl::optional<std::string>, getBusKind, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getBusAddress, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getServicesFilter, (), (const, override));
    MOCK_METHOD(cetl::optional<bool>, getServicesShowUniqueNames, (), (const, override));
    MOCK_METHOD(cetl::optional<std::int64_t>, getCallsTimeoutMs, (), (const, override));
    MOCK_METHOD(cetl::optional<std::int64_t>, getCallsMaxInFlightPerService, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFile, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingLevel, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFlushLevel, (), (const, override));

};  // ConfigMock

}  // namespace cli
}  // namespace dtui

#endif  // DTUI_CLI_CONFIG_MOCK_HPP_INCLUDED
