#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include "core/errors/bridge_errors.hpp"
#include "runtime/query_runner.hpp"
#include "session/protocol_session.hpp"

namespace sqlbridge::app {

// "Error [<kind>]: <message>", plus the hint on its own line when present.
std::string format_error(const core::errors::BridgeError& error);

// Prompt loop over a Ready session. A failed query is reported and the loop
// keeps going; only exit/quit or end of input stop it.
class InteractiveShell {
public:
    InteractiveShell(session::ProtocolSession& session, const runtime::QueryRunner& runner,
                     std::istream& in, std::ostream& out);

    // Returns the number of queries that completed without error.
    std::size_t run();

    // false once the user asked to leave
    bool handle_line(const std::string& line);

private:
    void print_tools();
    void print_debug();
    void print_help();

    session::ProtocolSession& session_;
    const runtime::QueryRunner& runner_;
    std::istream& in_;
    std::ostream& out_;
    std::size_t succeeded_ = 0;
};

}  // namespace sqlbridge::app
