//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DTUI_CLI_CONSOLE_HPP_INCLUDED
#define DTUI_CLI_CONSOLE_HPP_INCLUDED

#include "engine_types.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "topology/topology_tree.hpp"

#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace dtui
{
namespace cli
{

/// Line oriented front end of a session.
///
/// Each input line is one command (see `help`); results are printed as the session reports them.
///
class Console final
{
public:
    Console(engine::Session& session, std::ostream& output);

    Console(Console&&)                 = delete;
    Console(const Console&)            = delete;
    Console& operator=(Console&&)      = delete;
    Console& operator=(const Console&) = delete;

    ~Console() = default;

    /// @return `false` if the console should be closed.
    ///
    bool execute(const std::string& line);

    void report(const std::vector<engine::Event::Var>& events);

    void prompt();

private:
    using Words = std::vector<std::string>;

    void listServices();
    void printServices();
    void printTree(const Words& words);
    void printNode(const std::string& service, const engine::ObjectNode& node, const std::size_t depth);
    void expand(const Words& words, const bool is_refresh);
    void call(const Words& words);
    void getProperty(const Words& words);
    void setProperty(const Words& words);
    void getAllProperties(const Words& words);
    void watch(const Words& words);
    void unwatch(const Words& words);
    void cancel(const Words& words);
    void printPending();

    void accept(const engine::Session::Submit::Var& submitted, std::string label);

    // MARK: Data members:

    engine::Session&                         session_;
    std::ostream&                            output_;
    common::LoggerPtr                        logger_;
    std::map<engine::RequestId, std::string> labels_;
    std::map<engine::RequestId, std::string> subscriptions_;

};  // Console

}  // namespace cli
}  // namespace dtui

#endif  // DTUI_CLI_CONSOLE_HPP_INCLUDED
