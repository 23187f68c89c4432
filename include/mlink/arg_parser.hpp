/**
 * @file arg_parser.hpp
 * @brief Command-line argument parser for MouseLink
 * 
 * Parses command-line arguments to determine run mode:
 * - --daemon / -d: Run the daemon (input server + control server)
 * - --interactive / -i: Start interactive CLI
 * - (no args): Try to connect to existing daemon, start CLI if not found
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mlink/config_manager.hpp"

namespace mlink {

    /**
     * @brief Run modes for MouseLink
     */
    enum class RunMode {
        DAEMON,      // Run as daemon
        INTERACTIVE, // Start interactive CLI
        AUTO         // Auto-detect (default)
    };

    /**
     * @brief Parsed command-line arguments
     * 
     * Optional fields are only set when given on the command line; they
     * override the values loaded from the config file.
     */
    struct ParsedArgs {
        RunMode mode = RunMode::AUTO;
        std::vector<std::string> positional_args;
        bool show_help = false;
        bool show_version = false;
        std::optional<uint16_t> control_port;   // --port
        std::optional<uint16_t> listen_port;    // --listen-port
        std::optional<std::string> config_path; // --config
        bool auto_start = false;                // --start
    };

    /**
     * @brief Command-line argument parser
     * 
     * Supports:
     *   --daemon, -d            Run as daemon
     *   --interactive, -i       Start interactive CLI
     *   --port, -p <port>       Control port (default: 23890)
     *   --listen-port, -l <p>   Port for mobile controllers (default: 8080)
     *   --config, -c <path>     Config file path
     *   --start, -s             Start the input server with the daemon
     *   --help, -h              Show help
     *   --version, -v           Show version
     */
    class ArgParser {
    public:
        /**
         * @brief Parse command-line arguments
         * 
         * Invalid values are reported on stderr and ignored.
         * 
         * @param argc Argument count
         * @param argv Argument values
         * @return ParsedArgs Parsed arguments structure
         */
        static ParsedArgs parse(int argc, char* argv[]);

        static std::string get_help_message();

        static std::string get_version_string();

        /**
         * @brief Parse a TCP port number (0-65535)
         * 
         * @return std::optional<uint16_t> Empty if not a valid port
         */
        static std::optional<uint16_t> parse_port(const std::string& value);
    };

} // namespace mlink
