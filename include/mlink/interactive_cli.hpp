/**
 * @file interactive_cli.hpp
 * @brief Interactive CLI client for the MouseLink daemon
 * 
 * The CLI is a control surface like a tray icon: it never touches
 * sockets or sessions of the input server, it only sends control
 * commands to the daemon and shows the answers.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "mlink/config_manager.hpp"

namespace mlink {

    /**
     * @brief TCP client for the control protocol
     */
    class DaemonClient {
    public:
        /**
         * @param host Host to connect to (default: 127.0.0.1)
         * @param port Control port
         */
        DaemonClient(const std::string& host = "127.0.0.1", int port = DEFAULT_CONTROL_PORT);
        
        ~DaemonClient();

        /**
         * @brief Check if the daemon answers whoami
         */
        bool is_daemon_running();

        /**
         * @brief Send command to daemon and get response
         * 
         * @param command Command string to send ("status:", "start:8080", ...)
         * @return nlohmann::json JSON response, or null on error
         */
        nlohmann::json send_command(const std::string& command);

        [[nodiscard]] std::string get_last_error() const { return last_error_; }

    private:
        std::string host_;
        int port_;
        std::string last_error_;
    };

    /**
     * @brief Interactive CLI for the MouseLink daemon
     * 
     * Provides commands:
     * - status: Show server state and controller session
     * - start [port]: Start the input server
     * - stop: Stop the input server
     * - restart [port]: Restart with a fresh pairing token
     * - pairing: Show the pairing payload to scan
     * - logs [n]: Show last n lines of audit log
     * - daemonize: Start daemon and detach
     * - help: Show commands
     * - quit/exit: Exit CLI (the daemon keeps running)
     */
    class InteractiveCLI {
    public:
        /**
         * @param host Daemon host
         * @param port Daemon control port
         */
        InteractiveCLI(const std::string& host = "127.0.0.1", int port = DEFAULT_CONTROL_PORT);

        /**
         * @brief Enters command loop until user exits
         */
        void run();

        /**
         * @brief Run single command (for testing)
         * 
         * @return true to continue, false if the command asked to exit
         */
        bool run_command(const std::string& command);

    private:
        DaemonClient client_;
        int port_;
        bool running_ = false;

        void print_welcome();
        void print_prompt();

        /**
         * @brief Parse and execute command
         * 
         * @param input User input line
         * @return true to continue, false to exit
         */
        bool execute_command(const std::string& input);

        void cmd_status();
        void cmd_start(const std::string& port);
        void cmd_stop();
        void cmd_restart(const std::string& port);
        void cmd_pairing();
        void cmd_logs(const std::string& args);
        void cmd_daemonize();
        void cmd_help();

        /**
         * @brief Sends a command, printing transport and daemon errors
         * 
         * @return nlohmann::json The result object, or null on any error
         */
        nlohmann::json request(const std::string& command);

        static void print_pairing(const nlohmann::json& pairing);

        [[nodiscard]] static std::string trim(const std::string& str);
        [[nodiscard]] static std::vector<std::string> split(const std::string& str, char delim);
    };

} // namespace mlink
