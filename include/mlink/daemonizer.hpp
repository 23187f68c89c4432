/**
 * @file daemonizer.hpp
 * @brief Daemonization utilities for MouseLink
 * 
 * Provides functionality to:
 * - Check if a daemon is already running on the control port
 * - Spawn a detached daemon process (Unix double-fork)
 * - Wait for the daemon to be ready
 * 
 * A detached daemon keeps the input server alive after the window or
 * CLI that started it has gone away.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>

#include "mlink/config_manager.hpp"

namespace mlink {

    /**
     * @brief Handles spawning and probing the background daemon
     */
    class Daemonizer {
    public:
        /**
         * @param host Host to check (default: 127.0.0.1)
         * @param port Control port to check
         */
        Daemonizer(const std::string& host = "127.0.0.1", int port = DEFAULT_CONTROL_PORT);

        /**
         * @brief Check if a daemon answers whoami on the control port
         */
        bool is_daemon_running();

        /**
         * @brief Spawn daemon process
         * 
         * Forks and execs the binary with --daemon --port <port> plus any
         * extra arguments. The child detaches via setsid + second fork.
         * 
         * @param daemon_binary_path Path to the MouseLink binary
         * @param extra_args Additional arguments (e.g. --start, --config <path>)
         * @return true if spawn succeeded
         */
        bool spawn_daemon(const std::string& daemon_binary_path,
                          const std::vector<std::string>& extra_args = {});

        /**
         * @brief Polls whoami until the daemon responds or timeout is reached
         */
        bool wait_for_daemon(std::chrono::seconds timeout = std::chrono::seconds(10));

        [[nodiscard]] std::string get_last_error() const { return last_error_; }

        /**
         * @brief Get the binary path of current executable
         * 
         * @return std::string Path, or empty if it cannot be determined
         */
        static std::string get_executable_path();

    private:
        std::string host_;
        int port_;
        std::string last_error_;
    };

} // namespace mlink
