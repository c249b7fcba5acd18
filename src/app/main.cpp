#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include "analysis/intent_analyzer.hpp"
#include "app/cli_parser.hpp"
#include "app/interactive_shell.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/intent_contract.hpp"
#include "protocol/json_rpc.hpp"
#include "runtime/query_runner.hpp"
#include "session/protocol_session.hpp"

namespace {

sigset_t shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR1);  // wakes the watcher for a normal exit
    return set;
}

// Waits for SIGINT/SIGTERM on its own thread. Every other thread must have
// these signals blocked, so block_shutdown_signals() runs before any spawn.
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void(int)> on_signal)
        : thread_([on_signal = std::move(on_signal)] {
              const sigset_t set = shutdown_signals();
              int signal_number = 0;
              while (sigwait(&set, &signal_number) == 0) {
                  if (signal_number == SIGUSR1) {
                      return;
                  }
                  on_signal(signal_number);
              }
          }) {}

    ~SignalWatcher() {
        static_cast<void>(pthread_kill(thread_.native_handle(), SIGUSR1));
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    std::thread thread_;
};

void block_shutdown_signals() {
    const sigset_t set = shutdown_signals();
    static_cast<void>(pthread_sigmask(SIG_BLOCK, &set, nullptr));
}

void report(const sqlbridge::core::errors::BridgeError& err) {
    std::cerr << sqlbridge::app::format_error(err) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    using sqlbridge::app::cli::Command;
    namespace errors = sqlbridge::core::errors;

    // 1. Logs go to stderr so query results on stdout stay clean
    auto& logger = sqlbridge::core::logging::Logger::get();
    logger.set_stream(std::cerr);
    logger.set_tag("sqlbridge");

    // 2. Parse CLI input and return normalized input errors
    auto parsed = sqlbridge::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            std::cerr << err.hint << std::endl;
        }
        return 2;
    }
    const auto& options = errors::get_value(parsed);
    if (options.verbose) {
        logger.set_min_level(sqlbridge::core::logging::LogLevel::DEBUG);
    }

    const sqlbridge::analysis::IntentAnalyzer analyzer(options.config.entities);
    if (options.command == Command::Analyze) {
        const auto intent = analyzer.analyze(*options.query);
        std::cout << sqlbridge::protocol::display_json(sqlbridge::protocol::to_json(intent), 2)
                  << std::endl;
        return 0;
    }

    // 3. Start the server and run the handshake
    block_shutdown_signals();
    auto launched = sqlbridge::session::ProtocolSession::launch(options.config);
    if (errors::is_error(launched)) {
        report(errors::get_error(launched));
        return 3;
    }
    std::unique_ptr<sqlbridge::session::ProtocolSession> session =
        std::move(errors::get_value(launched));

    sqlbridge::session::ProtocolSession* active = session.get();
    SignalWatcher watcher([active](const int signal_number) {
        LOG_WARN("Received signal " + std::to_string(signal_number) + ", shutting down");
        active->interrupt();
        std::error_code ec;
        std::filesystem::remove(active->artifact_path(), ec);
        std::cout << std::flush;
        std::_Exit(128 + signal_number);
    });

    auto initialized = session->initialize();
    if (errors::is_error(initialized)) {
        report(errors::get_error(initialized));
        session->close();
        return 3;
    }

    // 4. Run the requested command
    int exit_code = 0;
    const sqlbridge::runtime::QueryRunner runner(*session, analyzer);
    switch (options.command) {
        case Command::Tools: {
            sqlbridge::app::InteractiveShell shell(*session, runner, std::cin, std::cout);
            static_cast<void>(shell.handle_line("tools"));
            break;
        }
        case Command::Ask: {
            auto outcome = runner.run(*options.query);
            if (errors::is_error(outcome)) {
                report(errors::get_error(outcome));
                exit_code = 1;
            } else {
                std::cout << sqlbridge::runtime::render_outcome(errors::get_value(outcome));
            }
            break;
        }
        case Command::Chat:
        default: {
            sqlbridge::app::InteractiveShell shell(*session, runner, std::cin, std::cout);
            const auto answered = shell.run();
            LOG_INFO("Answered " + std::to_string(answered) + " queries");
            break;
        }
    }

    session->close();
    return exit_code;
}
