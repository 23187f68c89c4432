//
// Created by opencode on 18/10/2026.
//

#include "mlink/arg_parser.hpp"
#include <iostream>

namespace mlink {

    ParsedArgs ArgParser::parse(int argc, char* argv[]) {
        ParsedArgs args;
        
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            
            if (arg == "--daemon" || arg == "-d") {
                args.mode = RunMode::DAEMON;
            } else if (arg == "--interactive" || arg == "-i") {
                args.mode = RunMode::INTERACTIVE;
            } else if (arg == "--help" || arg == "-h") {
                args.show_help = true;
            } else if (arg == "--version" || arg == "-v") {
                args.show_version = true;
            } else if (arg == "--start" || arg == "-s") {
                args.auto_start = true;
            } else if (arg == "--port" || arg == "-p" || arg == "--listen-port" || arg == "-l") {
                if (i + 1 >= argc) {
                    std::cerr << "Warning: " << arg << " requires a value" << std::endl;
                    continue;
                }
                std::string value = argv[++i];
                auto port = parse_port(value);
                if (!port) {
                    std::cerr << "Warning: Invalid port number '" << value << "', using configured port" << std::endl;
                } else if (arg == "--port" || arg == "-p") {
                    args.control_port = port;
                } else {
                    args.listen_port = port;
                }
            } else if (arg == "--config" || arg == "-c") {
                if (i + 1 < argc) {
                    args.config_path = std::string(argv[++i]);
                } else {
                    std::cerr << "Warning: " << arg << " requires a path" << std::endl;
                }
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Warning: Unknown option: " << arg << std::endl;
            } else {
                args.positional_args.push_back(arg);
            }
        }
        
        return args;
    }

    std::optional<uint16_t> ArgParser::parse_port(const std::string& value) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        try {
            unsigned long port = std::stoul(value);
            if (port > 65535) {
                return std::nullopt;
            }
            return static_cast<uint16_t>(port);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    std::string ArgParser::get_help_message() {
        return R"(MouseLink - use a phone as mouse and keyboard

Usage: MouseLink [OPTIONS]

Options:
  -d, --daemon              Run the daemon (input server + control port)
  -i, --interactive         Start interactive CLI mode
  -p, --port <port>         Control port (default: 23890)
  -l, --listen-port <port>  Port for mobile controllers (default: 8080)
  -c, --config <path>       Config file (default: ~/.mouselink/config.json)
  -s, --start               Start the input server when the daemon starts
  -h, --help                Show this help message
  -v, --version             Show version information

Modes:
  (no args)                 Auto-detect: connect to existing daemon or start CLI
  --daemon                  Run as daemon only
  --interactive             Start interactive CLI client

Interactive CLI Commands:
  status                    Show server state and controller
  start [port]              Start the input server
  stop                      Stop the input server
  restart [port]            Restart with a fresh pairing token
  pairing                   Show the pairing payload to scan
  logs [n]                  Show last n lines of audit log (default: 50)
  daemonize                 Start daemon and detach (spawns background process)
  help                      Show CLI commands
  quit, exit                Exit interactive mode

Examples:
  MouseLink                       # Auto mode - try to connect or start CLI
  MouseLink --daemon --start      # Run daemon and accept a controller right away
  MouseLink --daemon -l 9000      # Listen for controllers on port 9000
  MouseLink --interactive         # Start interactive CLI
)";
    }

    std::string ArgParser::get_version_string() {
        return std::string("MouseLink version ") + MLINK_VERSION + " (C++)";
    }

} // namespace mlink
