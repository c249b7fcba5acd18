#include "app/interactive_shell.hpp"

#include <algorithm>
#include <cctype>
#include "core/logging/logger.hpp"

namespace sqlbridge::app {

namespace {

std::string trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
    const auto last = std::find_if_not(text.rbegin(), text.rend(), [](const unsigned char c) {
                          return std::isspace(c) != 0;
                      }).base();
    return first < last ? std::string(first, last) : std::string();
}

}  // namespace

std::string format_error(const core::errors::BridgeError& error) {
    std::string out = "Error [" + core::errors::to_string(error.category) + "]: " + error.message;
    if (!error.hint.empty()) {
        out += "\n  Hint: " + error.hint;
    }
    return out;
}

InteractiveShell::InteractiveShell(session::ProtocolSession& session,
                                   const runtime::QueryRunner& runner, std::istream& in,
                                   std::ostream& out)
    : session_(session), runner_(runner), in_(in), out_(out) {}

std::size_t InteractiveShell::run() {
    out_ << "SQL bridge ready. Type 'help' for commands, 'exit' to quit.\n";
    std::string line;
    while (true) {
        out_ << "\n> " << std::flush;
        if (!std::getline(in_, line)) {
            out_ << "\n";
            break;
        }
        if (!handle_line(line)) {
            break;
        }
    }
    out_ << "Goodbye!\n";
    return succeeded_;
}

bool InteractiveShell::handle_line(const std::string& line) {
    const std::string input = trim(line);
    if (input.empty()) {
        return true;
    }

    std::string command = input;
    std::transform(command.begin(), command.end(), command.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (command == "exit" || command == "quit") {
        return false;
    }
    if (command == "tools") {
        print_tools();
        return true;
    }
    if (command == "debug") {
        print_debug();
        return true;
    }
    if (command == "help") {
        print_help();
        return true;
    }

    auto outcome = runner_.run(input);
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        LOG_DEBUG("Query failed [" + error.code + "]: " + error.message);
        out_ << format_error(error) << "\n";
        return true;
    }
    out_ << runtime::render_outcome(core::errors::get_value(outcome));
    ++succeeded_;
    return true;
}

void InteractiveShell::print_tools() {
    const auto& tools = session_.tools();
    if (tools.empty()) {
        out_ << "No tools available.\n";
        return;
    }
    out_ << "Available tools (" << tools.size() << "):\n";
    for (const auto& tool : tools) {
        out_ << "  " << tool.name;
        if (!tool.description.empty()) {
            out_ << ": " << tool.description;
        }
        out_ << "\n";
    }
}

void InteractiveShell::print_debug() {
    const auto alive = session_.process_alive();
    out_ << "Session state: " << session::to_string(session_.state()) << "\n";
    out_ << "Server process: "
         << (alive ? (*alive ? "running" : "exited") : "not managed") << "\n";
    out_ << "Tools discovered: " << session_.tools().size() << "\n";
    out_ << "Pending requests: " << session_.pending_requests() << "\n";
}

void InteractiveShell::print_help() {
    out_ << "Commands:\n"
         << "  tools   list the tools the server offers\n"
         << "  debug   show session and server status\n"
         << "  help    show this message\n"
         << "  exit    leave (also: quit)\n"
         << "Anything else is treated as a question, e.g. \"show top 5 customers from texas\".\n";
}

}  // namespace sqlbridge::app
