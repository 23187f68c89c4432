/**
 * @file main.cpp
 * @brief Entry point for the MouseLink daemon and CLI
 * 
 * Supports multiple modes:
 * - Daemon mode (--daemon): Run the input server lifecycle and the control port
 * - Interactive CLI mode (--interactive): Talk to a running daemon
 * - Auto mode (default): Auto-detect based on daemon availability
 * 
 * Components:
 * - ConfigManager: Loads ~/.mouselink/config.json
 * - AuditLogger: Tracks all daemon actions
 * - InputInjector: uinput devices, or a logging dry run
 * - LifecycleController: Owns the input server (listener, sessions, token)
 * - ControlHandler: Processes control commands
 * - ControlServer: Listens for control clients on localhost
 * - InteractiveCLI / Daemonizer: CLI control surface
 * 
 * The daemon runs until killed with SIGTERM/SIGINT.
 */

#include <iostream>
#include <csignal>
#include <memory>

#include "mlink/arg_parser.hpp"
#include "mlink/audit_logger.hpp"
#include "mlink/config_manager.hpp"
#include "mlink/control_handler.hpp"
#include "mlink/control_server.hpp"
#include "mlink/daemonizer.hpp"
#include "mlink/errors.hpp"
#include "mlink/input_injector.hpp"
#include "mlink/interactive_cli.hpp"
#include "mlink/lifecycle_controller.hpp"
#include "mlink/uinput_injector.hpp"
#include "mlink/utils.hpp"

using namespace mlink;

/**
 * @brief Global pointer to the control server for signal handling
 * 
 * Signal handlers must be plain functions. The handler only interrupts
 * the accept loop; the actual shutdown runs on the main thread.
 */
static ControlServer* g_server = nullptr;

void signal_handler(int sig) {
    (void)sig;
    if (g_server) {
        g_server->interrupt();
    }
}

/**
 * @brief Picks the injector named in the settings
 * 
 * Falls back to the logging injector when uinput is unavailable so the
 * daemon still serves pairing and status.
 */
static std::unique_ptr<InputInjector> make_injector(const Settings& settings, AuditLogger& audit_logger) {
    if (settings.injector == "log") {
        audit_logger.log_info("Using logging injector (dry run)");
        return std::make_unique<LoggingInjector>(std::cout);
    }

    try {
        auto injector = std::make_unique<UinputInjector>(settings.screen_width, settings.screen_height);
        audit_logger.log_success("uinput devices created");
        return injector;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        std::cerr << "Falling back to logging injector, no input will be injected" << std::endl;
        audit_logger.log_error(e.what(), "injector");
        return std::make_unique<LoggingInjector>(std::cout);
    }
}

/**
 * @brief Run daemon mode
 * 
 * @param args Parsed command line, overriding the config file
 * @return int Exit code (0 for success)
 */
int run_daemon_mode(const ParsedArgs& args) {
    // Ignore SIGPIPE to prevent crashes when clients disconnect
    signal(SIGPIPE, SIG_IGN);
    
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    
    std::cout << "========================================" << std::endl;
    std::cout << "MouseLink Daemon" << std::endl;
    std::cout << "========================================" << std::endl;
    
    try {
        ConfigManager config_manager(args.config_path ? expand_tilde(*args.config_path)
                                                      : ConfigManager::default_config_path());
        Settings settings = config_manager.load();
        if (args.control_port) {
            settings.control_port = *args.control_port;
        }
        if (args.listen_port) {
            settings.listen_port = *args.listen_port;
        }
        if (args.auto_start) {
            settings.auto_start = true;
        }

        AuditLogger audit_logger(AuditLogger::default_logs_dir(), settings.audit_log);
        audit_logger.log_info("Starting daemon mode");
        AuditSessionObserver observer(audit_logger);

        auto injector = make_injector(settings, audit_logger);

        ControllerOptions options;
        options.token_bytes = settings.token_bytes;
        options.advertise_host = settings.advertise_host;
        options.sensitivity = settings.sensitivity;

        LifecycleController controller(*injector, options, &observer);
        controller.on_state_change([&audit_logger](ServerState from, ServerState to) {
            audit_logger.log_state_transition(state_to_string(from), state_to_string(to));
            std::cout << "[MouseLink] " << state_to_string(from) << " -> " << state_to_string(to) << std::endl;
        });

        ControlHandler control_handler(controller, settings.listen_port);

        ControlServer server([&control_handler, &audit_logger](const std::string& cmd) {
            audit_logger.log_command(cmd, "control_client");
            
            auto result = control_handler.execute(cmd);
            
            if (result.contains("error") && !result["error"].is_null()) {
                audit_logger.log_error(result["error"].get<std::string>(), "command_execution");
            } else {
                audit_logger.log_success("Command executed successfully", cmd);
            }
            
            return result;
        }, settings.control_port);

        server.open();
        g_server = &server;

        if (settings.auto_start) {
            try {
                auto descriptor = controller.start(settings.listen_port);
                std::cout << "Pairing payload: " << descriptor.to_payload() << std::endl;
                std::cout << "Pairing URI:     " << descriptor.to_uri() << std::endl;
            } catch (const ServerError& e) {
                std::cerr << "ERROR: Failed to start input server: " << e.what() << std::endl;
                audit_logger.log_error(e.what(), "auto_start");
            }
        }
        
        std::cout << "Daemon initialized successfully" << std::endl;
        std::cout << "========================================" << std::endl;
        audit_logger.log_info("Daemon initialized and serving control port " + std::to_string(server.get_port()));
        
        // Blocks until a signal interrupts it
        server.serve();

        std::cout << "\nShutting down..." << std::endl;
        g_server = nullptr;
        server.stop();
        controller.stop();
        audit_logger.log_info("Daemon stopped");
        
    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}

int run_interactive_mode(const std::string& host, int port) {
    InteractiveCLI cli(host, port);
    cli.run();
    
    return 0;
}

/**
 * @brief Run auto mode
 * 
 * Tries to connect to existing daemon. The CLI is started either way;
 * without a daemon it offers the daemonize command.
 */
int run_auto_mode(int port) {
    Daemonizer daemonizer("127.0.0.1", port);
    
    std::cout << "Checking if daemon is running on port " << port << "..." << std::endl;
    
    if (daemonizer.is_daemon_running()) {
        std::cout << "Daemon is running. Connecting to interactive CLI..." << std::endl;
    } else {
        std::cout << "No daemon found on port " << port << "." << std::endl;
        std::cout << "Use 'daemonize' command to start the daemon." << std::endl;
        std::cout << std::endl;
    }
    return run_interactive_mode("127.0.0.1", port);
}

int main(int argc, char* argv[]) {
    ParsedArgs args = ArgParser::parse(argc, argv);
    
    if (args.show_help) {
        std::cout << ArgParser::get_help_message() << std::endl;
        return 0;
    }
    
    if (args.show_version) {
        std::cout << ArgParser::get_version_string() << std::endl;
        return 0;
    }

    int control_port = args.control_port.value_or(DEFAULT_CONTROL_PORT);
    if (!args.control_port && args.mode != RunMode::DAEMON) {
        ConfigManager config_manager(args.config_path ? expand_tilde(*args.config_path)
                                                      : ConfigManager::default_config_path());
        control_port = config_manager.load().control_port;
    }
    
    switch (args.mode) {
        case RunMode::DAEMON:
            return run_daemon_mode(args);
            
        case RunMode::INTERACTIVE:
            return run_interactive_mode("127.0.0.1", control_port);
            
        case RunMode::AUTO:
        default:
            return run_auto_mode(control_port);
    }
}
