/**
 * @file control_handler.hpp
 * @brief Handles control commands for the MouseLink daemon
 * 
 * Control surfaces (interactive CLI, tray helper, scripts) drive a
 * detached daemon through these commands:
 * 
 * 1. start:[port]     - Start the input server (default: configured port)
 * 2. stop:            - Stop the input server
 * 3. restart:[port]   - Stop and start again with a fresh token
 * 4. status:          - Lifecycle state, session and uptime
 * 5. pairing:         - Current connection descriptor / pairing payload
 * 6. whoami:          - Daemon identification
 * 
 * Protocol format:
 *   Request:  CMD:ARG1,ARG2,ARG3...\n
 *   Response: {"CMD": "cmd", "result": {...}, "error": null}\n
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mlink {

    class LifecycleController;
    struct ConnectionDescriptor;

    /**
     * @brief Handles control commands and returns JSON responses
     * 
     * Every exception raised by the controller is turned into an
     * {"error": "..."} response; execute() itself does not throw.
     */
    class ControlHandler {
    public:
        /**
         * @param controller Lifecycle controller to drive
         * @param default_port Port used by start/restart without argument
         */
        ControlHandler(LifecycleController& controller, uint16_t default_port);

        /**
         * @brief Executes a command and returns JSON response
         * 
         * @param command Full command string (e.g., "start:8080\n")
         * @return nlohmann::json {"CMD": ..., "result": ... | null, "error": null | "..."}
         */
        nlohmann::json execute(const std::string& command);

        /**
         * @brief JSON form of a descriptor, including pairing payload and URI
         */
        static nlohmann::json descriptor_to_json(const ConnectionDescriptor& descriptor);

    private:
        LifecycleController& controller_;
        uint16_t default_port_;

        nlohmann::json handle_start(const std::vector<std::string>& args);
        nlohmann::json handle_stop();
        nlohmann::json handle_restart(const std::vector<std::string>& args);
        nlohmann::json handle_status();
        nlohmann::json handle_pairing();
        nlohmann::json handle_whoami();

        /**
         * @brief Reads an optional port argument
         * 
         * @throws std::invalid_argument if the argument is not a port number
         */
        uint16_t port_arg(const std::vector<std::string>& args) const;

        static nlohmann::json error_response(const std::string& cmd, const std::string& error);
    };

} // namespace mlink
