//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace dtui
{
namespace cli
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // Config

    auto getBusKind() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("bus", "kind");
    }

    auto getBusAddress() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("bus", "address");
    }

    auto getServicesFilter() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("services", "filter");
    }

    auto getServicesShowUniqueNames() const -> cetl::optional<bool> override
    {
        return findImpl<bool>("services", "show_unique_names");
    }

    auto getCallsTimeoutMs() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("calls", "timeout_ms");
    }

    auto getCallsMaxInFlightPerService() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("calls", "max_in_flight_per_service");
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception& ex)
        {
            // Absent keys and values of unexpected types are not an error - the default applies.
            common::getLogger("cli")->trace("Config key is not available: {}", ex.what());
            return cetl::nullopt;
        }
    }

    TomlValue root_;

};  // ConfigImpl

}  // namespace

Config::MakeResult::Var Config::make(const std::string& file_path)
{
    try
    {
        auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
        return std::make_shared<ConfigImpl>(std::move(root));

    } catch (const std::exception& ex)
    {
        return std::string{ex.what()};
    }
}

Config::Ptr Config::makeEmpty()
{
    return std::make_shared<ConfigImpl>(ConfigImpl::TomlValue{ConfigImpl::TomlValue::table_type{}});
}

}  // namespace cli
}  // namespace dtui
