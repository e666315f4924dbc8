//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "console.hpp"

#include "dbus/value_parser.hpp"
#include "engine_types.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "topology/topology_tree.hpp"

#include <dtui/sdk/bus_client.hpp>
#include <dtui/sdk/introspection.hpp>
#include <dtui/sdk/value.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/fmt/fmt.h>

#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace dtui
{
namespace cli
{
namespace
{

constexpr const char* HelpText =
    "Commands:\n"
    "  list                                      re-list services (refreshes the whole topology)\n"
    "  services                                  print listed services\n"
    "  tree SERVICE [PATH]                       print the known object tree\n"
    "  expand SERVICE [PATH]                     introspect an unfetched node (default path '/')\n"
    "  refresh SERVICE [PATH]                    introspect a node again\n"
    "  call SERVICE PATH IFACE.METHOD [ARGS]     call a method; ARGS like (1, \"text\", [true])\n"
    "  get SERVICE PATH IFACE.PROPERTY           read a property\n"
    "  set SERVICE PATH IFACE.PROPERTY VALUE     write a property\n"
    "  getall SERVICE PATH IFACE                 read all properties of an interface\n"
    "  watch [SERVICE|*] [PATH|*] [IFACE[.SIGNAL]|*]\n"
    "                                            subscribe to signals\n"
    "  unwatch ID                                drop a subscription\n"
    "  cancel ID                                 cancel a pending request\n"
    "  cancel SERVICE [PATH]                     cancel fetching of a node (default path '/')\n"
    "  pending                                   print pending requests and subscriptions\n"
    "  help                                      print this text\n"
    "  quit                                      exit\n";

/// Splits a line into at most `max_words` whitespace separated words;
/// the last one takes the (trimmed) rest of the line.
///
std::vector<std::string> splitWords(const std::string& line, const std::size_t max_words)
{
    std::vector<std::string> words;

    const auto is_space = [](const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };

    std::size_t pos = 0;
    while (words.size() < max_words)
    {
        while ((pos < line.size()) && is_space(line[pos]))
        {
            ++pos;
        }
        if (pos >= line.size())
        {
            break;
        }

        if ((words.size() + 1) == max_words)
        {
            auto end = line.size();
            while ((end > pos) && is_space(line[end - 1]))
            {
                --end;
            }
            words.emplace_back(line.substr(pos, end - pos));
            break;
        }

        const auto begin = pos;
        while ((pos < line.size()) && !is_space(line[pos]))
        {
            ++pos;
        }
        words.emplace_back(line.substr(begin, pos - begin));
    }
    return words;
}

/// Splits `interface.member` at its last dot.
///
cetl::optional<std::pair<std::string, std::string>> splitMember(const std::string& qualified)
{
    const auto dot = qualified.rfind('.');
    if ((dot == std::string::npos) || (dot == 0) || ((dot + 1) == qualified.size()))
    {
        return cetl::nullopt;
    }
    return std::make_pair(qualified.substr(0, dot), qualified.substr(dot + 1));
}

cetl::optional<engine::RequestId> parseRequestId(const std::string& text)
{
    const auto digits = (!text.empty() && (text.front() == '#')) ? text.substr(1) : text;
    if (digits.empty() || (std::isdigit(static_cast<unsigned char>(digits.front())) == 0))
    {
        return cetl::nullopt;
    }

    char* end = nullptr;
    errno     = 0;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
    const auto value = std::strtoull(digits.c_str(), &end, 10);
    if ((errno != 0) || (end == nullptr) || (*end != '\0'))
    {
        return cetl::nullopt;
    }
    return static_cast<engine::RequestId>(value);
}

std::string wildcardToEmpty(const std::string& word)
{
    return (word == "*") ? std::string{} : word;
}

}  // namespace

Console::Console(engine::Session& session, std::ostream& output)
    : session_{session}
    , output_{output}
    , logger_{common::getLogger("cli")}
{
}

void Console::prompt()
{
    output_ << "dtui> " << std::flush;
}

bool Console::execute(const std::string& line)
{
    const auto head = splitWords(line, 2);
    if (head.empty())
    {
        return true;
    }
    const auto& command = head.front();
    logger_->debug("Command: {}", line);

    if ((command == "quit") || (command == "exit"))
    {
        return false;
    }
    if (command == "help")
    {
        output_ << HelpText;
    }
    else if (command == "list")
    {
        listServices();
    }
    else if (command == "services")
    {
        printServices();
    }
    else if (command == "tree")
    {
        printTree(splitWords(line, 3));
    }
    else if ((command == "expand") || (command == "refresh"))
    {
        expand(splitWords(line, 3), command == "refresh");
    }
    else if (command == "call")
    {
        call(splitWords(line, 5));
    }
    else if (command == "get")
    {
        getProperty(splitWords(line, 4));
    }
    else if (command == "set")
    {
        setProperty(splitWords(line, 5));
    }
    else if (command == "getall")
    {
        getAllProperties(splitWords(line, 4));
    }
    else if (command == "watch")
    {
        watch(splitWords(line, 4));
    }
    else if (command == "unwatch")
    {
        unwatch(splitWords(line, 2));
    }
    else if (command == "cancel")
    {
        cancel(splitWords(line, 3));
    }
    else if (command == "pending")
    {
        printPending();
    }
    else
    {
        output_ << "Unknown command '" << command << "' (try 'help').\n";
    }
    return true;
}

void Console::listServices()
{
    const auto request_id = session_.refreshServices();
    output_ << "#" << request_id << " listing services...\n";
}

void Console::printServices()
{
    const auto& services = session_.services();
    output_ << services.size() << " service(s):\n";
    for (const auto& service : services)
    {
        output_ << "  " << service << "\n";
    }
}

void Console::printTree(const Words& words)
{
    if (words.size() < 2)
    {
        output_ << "Usage: tree SERVICE [PATH]\n";
        return;
    }
    const auto& service = words[1];
    const auto  path    = (words.size() > 2) ? words[2] : std::string{engine::TopologyTree::RootPath};

    const auto* const node = session_.topology().findNode(service, path);
    if (node == nullptr)
    {
        output_ << "No node '" << path << "' of '" << service << "'.\n";
        return;
    }
    output_ << service << "\n";
    printNode(service, *node, 1);
}

void Console::printNode(const std::string& service, const engine::ObjectNode& node, const std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    output_ << indent << node.path << " [" << engine::toString(node.state) << "]";
    if (node.state == engine::FetchState::Errored)
    {
        output_ << " " << node.error;
    }
    output_ << "\n";

    for (const auto& interface : node.interfaces)
    {
        output_ << indent << "  " << interface.name << "\n";
        for (const auto& method : interface.methods)
        {
            output_ << indent << "    method " << method.label() << "\n";
        }
        for (const auto& property : interface.properties)
        {
            output_ << indent << "    property " << property.label() << "\n";
        }
        for (const auto& signal : interface.signals)
        {
            output_ << indent << "    signal " << signal.label() << "\n";
        }
    }

    for (const auto* const child : session_.topology().childrenOf(service, node.path))
    {
        printNode(service, *child, depth + 1);
    }
}

void Console::expand(const Words& words, const bool is_refresh)
{
    if (words.size() < 2)
    {
        output_ << "Usage: " << (is_refresh ? "refresh" : "expand") << " SERVICE [PATH]\n";
        return;
    }
    const auto& service = words[1];
    const auto  path    = (words.size() > 2) ? words[2] : std::string{engine::TopologyTree::RootPath};

    const bool started = is_refresh ? session_.refresh(service, path) : session_.expand(service, path);
    if (started)
    {
        output_ << "Fetching '" << path << "' of '" << service << "'...\n";
        return;
    }

    const auto* const node = session_.topology().findNode(service, path);
    if (node == nullptr)
    {
        output_ << "No node '" << path << "' of '" << service << "' (try 'list' or expanding its parent).\n";
    }
    else
    {
        output_ << "Node '" << path << "' is " << engine::toString(node->state) << ".\n";
    }
}

void Console::call(const Words& words)
{
    const auto member = (words.size() >= 4) ? splitMember(words[3]) : cetl::nullopt;
    if (!member)
    {
        output_ << "Usage: call SERVICE PATH IFACE.METHOD [ARGS]\n";
        return;
    }

    engine::CallRequest request{words[1], words[2], member->first, member->second, {}};
    const auto          label = fmt::format("call {}.{}", request.interface, request.member);

    if (const auto* const method = session_.findMethod({request.service, request.path, request.interface, request.member}))
    {
        const auto args_text = (words.size() > 4) ? words[4] : std::string{};
        auto       parsed    = common::dbus::ValueParser::parseArguments(args_text, method->inSignatures());
        if (const auto* const error = cetl::get_if<common::dbus::ValueParser::ArgumentsResult::Failure>(&parsed))
        {
            output_ << "Bad arguments of " << method->label() << ": " << error->describe() << "\n";
            return;
        }
        request.args = std::move(cetl::get<common::dbus::ValueParser::ArgumentsResult::Success>(parsed));
    }

    accept(session_.submitCall(request), label);
}

void Console::getProperty(const Words& words)
{
    const auto member = (words.size() >= 4) ? splitMember(words[3]) : cetl::nullopt;
    if (!member)
    {
        output_ << "Usage: get SERVICE PATH IFACE.PROPERTY\n";
        return;
    }

    const sdk::MemberRef property{words[1], words[2], member->first, member->second};
    accept(session_.getProperty(property), fmt::format("get {}.{}", property.interface, property.member));
}

void Console::setProperty(const Words& words)
{
    const auto member = (words.size() >= 5) ? splitMember(words[3]) : cetl::nullopt;
    if (!member)
    {
        output_ << "Usage: set SERVICE PATH IFACE.PROPERTY VALUE\n";
        return;
    }

    const sdk::MemberRef property{words[1], words[2], member->first, member->second};
    const auto* const    descriptor = session_.findProperty(property);
    if (descriptor == nullptr)
    {
        output_ << "Rejected (" << engine::toString(engine::Rejection::Kind::UnknownMember)
                << "): unknown property '" << words[3] << "' (is the node expanded?)\n";
        return;
    }

    auto parsed = common::dbus::ValueParser::parse(words[4], descriptor->signature);
    if (const auto* const error = cetl::get_if<common::dbus::ValueParser::Result::Failure>(&parsed))
    {
        output_ << "Bad value of " << descriptor->label() << ": " << error->describe() << "\n";
        return;
    }
    const auto& value = cetl::get<common::dbus::ValueParser::Result::Success>(parsed);

    accept(session_.setProperty(property, value), fmt::format("set {}.{}", property.interface, property.member));
}

void Console::getAllProperties(const Words& words)
{
    if (words.size() < 4)
    {
        output_ << "Usage: getall SERVICE PATH IFACE\n";
        return;
    }
    accept(session_.getAllProperties(words[1], words[2], words[3]), fmt::format("getall {}", words[3]));
}

void Console::watch(const Words& words)
{
    sdk::SignalMatch match;
    if (words.size() > 1)
    {
        match.service = wildcardToEmpty(words[1]);
    }
    if (words.size() > 2)
    {
        match.path = wildcardToEmpty(words[2]);
    }
    if (words.size() > 3)
    {
        const auto& qualified = words[3];
        if (qualified != "*")
        {
            // `IFACE.SIGNAL` if the last segment is capitalized (as member names conventionally are).
            const auto member = splitMember(qualified);
            if (member && (std::isupper(static_cast<unsigned char>(member->second.front())) != 0))
            {
                match.interface = member->first;
                match.member    = member->second;
            }
            else
            {
                match.interface = qualified;
            }
        }
    }

    const auto rule      = match.toRule();
    const auto submitted = session_.subscribe(match);
    if (const auto* const request_id = cetl::get_if<engine::Session::Submit::Success>(&submitted))
    {
        subscriptions_.emplace(*request_id, rule);
    }
    accept(submitted, "watch " + rule);
}

void Console::unwatch(const Words& words)
{
    const auto request_id = (words.size() > 1) ? parseRequestId(words[1]) : cetl::nullopt;
    if (!request_id)
    {
        output_ << "Usage: unwatch ID\n";
        return;
    }

    if ((subscriptions_.find(*request_id) != subscriptions_.end()) &&
        (session_.unsubscribe(*request_id) || session_.cancel(*request_id)))
    {
        subscriptions_.erase(*request_id);
        labels_.erase(*request_id);
        output_ << "#" << *request_id << " unsubscribed.\n";
        return;
    }
    output_ << "#" << *request_id << " is not a subscription.\n";
}

void Console::cancel(const Words& words)
{
    if (words.size() < 2)
    {
        output_ << "Usage: cancel ID | cancel SERVICE [PATH]\n";
        return;
    }
    const auto request_id = parseRequestId(words[1]);
    if (!request_id)
    {
        const auto& service = words[1];
        const auto  path    = (words.size() > 2) ? words[2] : std::string{"/"};
        if (session_.cancelFetch(service, path))
        {
            output_ << "Fetch of '" << path << "' of '" << service << "' cancelled.\n";
            return;
        }
        output_ << "'" << path << "' of '" << service << "' is not being fetched.\n";
        return;
    }

    if (session_.cancel(*request_id))
    {
        subscriptions_.erase(*request_id);
        labels_.erase(*request_id);
        output_ << "#" << *request_id << " cancelled.\n";
        return;
    }
    output_ << "#" << *request_id << " is not pending.\n";
}

void Console::printPending()
{
    output_ << labels_.size() << " pending request(s):\n";
    for (const auto& id_label : labels_)
    {
        output_ << "  #" << id_label.first << " " << id_label.second << "\n";
    }
    output_ << subscriptions_.size() << " subscription(s):\n";
    for (const auto& id_rule : subscriptions_)
    {
        output_ << "  #" << id_rule.first << " " << id_rule.second << "\n";
    }
}

void Console::accept(const engine::Session::Submit::Var& submitted, std::string label)
{
    cetl::visit(cetl::make_overloaded(
                    [this, &label](const engine::RequestId request_id) {
                        //
                        output_ << "#" << request_id << " " << label << "...\n";
                        labels_.emplace(request_id, std::move(label));
                    },
                    [this](const engine::Rejection& rejection) {
                        //
                        output_ << "Rejected (" << engine::toString(rejection.kind) << "): " << rejection.message
                                << "\n";
                    }),
                submitted);
}

void Console::report(const std::vector<engine::Event::Var>& events)
{
    for (const auto& event : events)
    {
        cetl::visit(
            cetl::make_overloaded(
                [this](const engine::Event::ServicesListed& listed) {
                    //
                    if (listed.error)
                    {
                        output_ << "Listing failed: " << listed.error->message << "\n";
                        return;
                    }
                    printServices();
                },
                [this](const engine::Event::NodeChanged& changed) {
                    //
                    const auto* const node = session_.topology().findNode(changed.service, changed.path);
                    if (node == nullptr)
                    {
                        return;
                    }
                    output_ << changed.service << " " << changed.path << ": " << engine::toString(node->state);
                    if (node->state == engine::FetchState::Errored)
                    {
                        output_ << " (" << node->error << ")";
                    }
                    else
                    {
                        output_ << " (" << node->interfaces.size() << " interface(s), " << node->children.size()
                                << " child(ren))";
                    }
                    output_ << "\n";
                },
                [this](const engine::Event::OperationCompleted& completed) {
                    //
                    const auto label_it = labels_.find(completed.id);
                    const auto label    = (label_it != labels_.end()) ? label_it->second : std::string{};
                    if (label_it != labels_.end())
                    {
                        labels_.erase(label_it);
                    }
                    if (cetl::get_if<engine::CallOutcome::Ok>(&completed.outcome) == nullptr)
                    {
                        subscriptions_.erase(completed.id);
                    }
                    output_ << "#" << completed.id << " " << label << ": "
                            << engine::CallOutcome::describe(completed.outcome) << "\n";
                },
                [this](const engine::Event::SignalReceived& received) {
                    //
                    const auto& signal = received.event;
                    output_ << "#" << received.subscription_id << " signal " << signal.interface << "."
                            << signal.member << " from " << signal.sender << " at " << signal.path << ": ["
                            << sdk::renderValues(signal.args) << "]\n";
                }),
            event);
    }
}

}  // namespace cli
}  // namespace dtui
