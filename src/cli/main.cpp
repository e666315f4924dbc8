//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "cli_args.hpp"
#include "config.hpp"
#include "console.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "setup_logging.hpp"

#include <dtui/platform/defines.hpp>
#include <dtui/platform/posix_executor_extension.hpp>
#include <dtui/sdk/bus_client.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

/// Feeds console commands from the standard input, a line at a time.
///
class StdinReader final
{
public:
    explicit StdinReader(dtui::cli::Console& console)
        : console_{console}
        , is_open_{true}
    {
    }

    bool isOpen() const noexcept
    {
        return is_open_;
    }

    bool start(libcyphal::IExecutor& executor)
    {
        auto* const posix_executor_ext = cetl::rtti_cast<dtui::platform::IPosixExecutorExtension*>(&executor);
        if (posix_executor_ext == nullptr)
        {
            return false;
        }

        callback_ = posix_executor_ext->registerAwaitableCallback(  //
            [this](const auto&) {
                //
                handleReadable();
            },
            dtui::platform::IPosixExecutorExtension::Trigger::Readable{STDIN_FILENO});
        return true;
    }

private:
    void handleReadable()
    {
        constexpr std::size_t chunk_size = 1024;

        std::array<char, chunk_size> chunk{};
        const auto                   read_size = ::read(STDIN_FILENO, chunk.data(), chunk.size());
        if (read_size < 0)
        {
            const int error_code = errno;
            if ((error_code == EINTR) || (error_code == EAGAIN))
            {
                return;
            }
            spdlog::error("Failed to read stdin: {}.", std::strerror(error_code));
            close();
            return;
        }
        if (read_size == 0)
        {
            spdlog::debug("End of stdin.");
            close();
            return;
        }

        buffer_.append(chunk.data(), static_cast<std::size_t>(read_size));
        std::size_t line_end = 0;
        while (is_open_ && ((line_end = buffer_.find('\n')) != std::string::npos))
        {
            const auto line = buffer_.substr(0, line_end);
            buffer_.erase(0, line_end + 1);
            if (!console_.execute(line))
            {
                close();
            }
        }
        if (is_open_)
        {
            console_.prompt();
        }
    }

    void close()
    {
        is_open_ = false;
        callback_.reset();
    }

    dtui::cli::Console&                 console_;
    bool                                is_open_;
    std::string                         buffer_;
    libcyphal::IExecutor::Callback::Any callback_;

};  // StdinReader

template <typename Executor>
int listServicesOnce(Executor& executor, dtui::engine::Session& session)
{
    session.refreshServices();

    cetl::optional<dtui::engine::Event::ServicesListed> listed;
    dtui::platform::waitPollingUntil(executor, [&session, &listed] {
        //
        for (auto& event : session.poll())
        {
            if (auto* const services_listed = cetl::get_if<dtui::engine::Event::ServicesListed>(&event))
            {
                listed = std::move(*services_listed);
            }
        }
        return listed.has_value() || (g_running == 0);
    });

    if (!listed)
    {
        return EXIT_FAILURE;
    }
    if (listed->error)
    {
        std::cerr << "Failed to list services: " << listed->error->message << '\n';
        return EXIT_FAILURE;
    }
    for (const auto& service : session.services())
    {
        std::cout << service << '\n';
    }
    return EXIT_SUCCESS;
}

template <typename Executor>
int runConsole(Executor& executor, dtui::engine::Session& session)
{
    using std::chrono_literals::operator""ms;

    dtui::cli::Console console{session, std::cout};
    StdinReader        stdin_reader{console};
    if (!stdin_reader.start(executor))
    {
        spdlog::critical("Executor can't await stdin.");
        return EXIT_FAILURE;
    }

    session.refreshServices();
    std::cout << "Type 'help' for the list of commands.\n";
    console.prompt();

    while ((g_running != 0) && stdin_reader.isOpen())
    {
        dtui::platform::spinAndPoll(executor, 250ms);

        const auto events = session.poll();
        if (!events.empty())
        {
            std::cout << '\n';
            console.report(events);
            console.prompt();
        }
    }

    if (g_running == 0)
    {
        spdlog::debug("Received termination signal.");
    }
    std::cout << '\n';
    return EXIT_SUCCESS;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using dtui::cli::CliArgs;
    using dtui::cli::Config;
    using dtui::cli::Settings;
    using Executor = dtui::platform::SingleThreadedExecutor;

    auto args_result = CliArgs::parse(argc, argv);
    if (const auto* const problem = cetl::get_if<CliArgs::ParseResult::Failure>(&args_result))
    {
        std::cerr << "dtui: " << *problem << "\n\n" << CliArgs::usage();
        return EXIT_FAILURE;
    }
    const auto args = cetl::get<CliArgs::ParseResult::Success>(std::move(args_result));
    if (args.show_help)
    {
        std::cout << CliArgs::usage();
        return EXIT_SUCCESS;
    }

    auto config = Config::makeEmpty();
    if (args.config_file)
    {
        auto config_result = Config::make(*args.config_file);
        if (const auto* const problem = cetl::get_if<Config::MakeResult::Failure>(&config_result))
        {
            std::cerr << "dtui: failed to load config '" << *args.config_file << "': " << *problem << '\n';
            return EXIT_FAILURE;
        }
        config = cetl::get<Config::MakeResult::Success>(std::move(config_result));
    }

    auto settings_result = Settings::resolve(args, *config);
    if (const auto* const problem = cetl::get_if<Settings::ResolveResult::Failure>(&settings_result))
    {
        std::cerr << "dtui: " << *problem << '\n';
        return EXIT_FAILURE;
    }
    const auto settings = cetl::get<Settings::ResolveResult::Success>(std::move(settings_result));

    setupSignalHandlers();
    dtui::cli::setupLogging(argc, argv, *config);

    spdlog::info("dtui started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        Executor executor;

        auto client_result = dtui::sdk::BusClient::make(executor, settings.bus_address);
        if (const auto* const failure = cetl::get_if<dtui::sdk::BusClient::MakeResult::Failure>(&client_result))
        {
            spdlog::critical("Failed to connect to the {}: {}", settings.describeBus(), failure->message);
            std::cerr << "dtui: failed to connect to the " << settings.describeBus() << ": " << failure->message
                      << '\n';
            return EXIT_FAILURE;
        }
        auto bus_client = cetl::get<dtui::sdk::BusClient::MakeResult::Success>(std::move(client_result));
        spdlog::info("Connected to the {} (unique_name='{}').", settings.describeBus(), bus_client->uniqueName());

        dtui::engine::Session session{executor, std::move(bus_client), settings.session};

        result = args.list_only ? listServicesOnce(executor, session) : runConsole(executor, session);

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("dtui terminated.");

    return result;
}
