//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_CLI_CONFIG_HPP_INCLUDED
#define DTUI_CLI_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace dtui
{
namespace cli
{

/// Read-only view of the TOML configuration file.
///
/// Getters return an empty optional for keys which are absent (or of a wrong type).
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    struct MakeResult
    {
        using Success = Ptr;
        using Failure = std::string;  ///< Description of the problem (f.e. a TOML syntax error).
        using Var     = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static MakeResult::Var make(const std::string& file_path);

    /// Configuration with all keys absent.
    ///
    CETL_NODISCARD static Ptr makeEmpty();

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getBusKind() const -> cetl::optional<std::string>                   = 0;
    CETL_NODISCARD virtual auto getBusAddress() const -> cetl::optional<std::string>                = 0;
    CETL_NODISCARD virtual auto getServicesFilter() const -> cetl::optional<std::string>            = 0;
    CETL_NODISCARD virtual auto getServicesShowUniqueNames() const -> cetl::optional<bool>          = 0;
    CETL_NODISCARD virtual auto getCallsTimeoutMs() const -> cetl::optional<std::int64_t>           = 0;
    CETL_NODISCARD virtual auto getCallsMaxInFlightPerService() const -> cetl::optional<std::int64_t> = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>               = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>              = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string>         = 0;

protected:
    Config() = default;

};  // Config

}  // namespace cli
}  // namespace dtui

#endif  // DTUI_CLI_CONFIG_HPP_INCLUDED
