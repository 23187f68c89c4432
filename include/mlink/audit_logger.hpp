/**
 * @file audit_logger.hpp
 * @brief Audit logging system for MouseLink
 * 
 * Tracks control commands, lifecycle transitions, pairing attempts and
 * session events. Logs are written to ~/.mouselink/logs/audit.log
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

#include "mlink/session.hpp"

namespace mlink {

    /**
     * @brief Categories of audit log entries
     */
    enum class AuditCategory {
        CMD,        // Control command received
        STATE,      // Lifecycle transition
        ACTION,     // Action performed
        ERROR,      // Error occurred
        SUCCESS,    // Successful operation
        INFO        // General information
    };

    /**
     * @brief Thread-safe audit logger
     * 
     * Records all significant events including:
     * - Control commands received (with source)
     * - Lifecycle transitions
     * - Pairing attempts and session open/close
     * - Errors and exceptions
     */
    class AuditLogger {
    public:
        /**
         * @brief Constructs audit logger
         * 
         * Creates the log directory if needed and opens audit.log in
         * append mode.
         * 
         * @param logs_dir Directory for audit.log (default ~/.mouselink/logs)
         * @param enabled When false nothing is written
         */
        explicit AuditLogger(std::filesystem::path logs_dir = default_logs_dir(), bool enabled = true);
        
        /**
         * @brief Destructor - closes log file
         */
        ~AuditLogger();

        /**
         * @brief Log a command received
         * 
         * @param command The command string received
         * @param source Source of command (e.g., "control" or "interactive")
         */
        void log_command(const std::string& command, const std::string& source);

        /**
         * @brief Log a state transition
         */
        void log_state_transition(const std::string& from_state, const std::string& to_state);

        void log_action(const std::string& action, const std::string& details = "");

        void log_error(const std::string& error, const std::string& context = "");

        void log_success(const std::string& operation, const std::string& details = "");

        void log_info(const std::string& message);

        [[nodiscard]] std::filesystem::path get_log_path() const { return audit_log_path_; }

        /**
         * @brief Get last N lines of the audit log
         * 
         * @param n Number of lines to retrieve
         * @return std::string The last N lines
         */
        [[nodiscard]] std::string get_last_lines(size_t n = 50) const;

        /**
         * @brief Last N lines of any log file, without opening a logger
         * 
         * Used by the CLI, which reads the daemon's log from outside.
         * 
         * @return std::string The lines, empty if the file cannot be read
         */
        [[nodiscard]] static std::string read_last_lines(const std::filesystem::path& path, size_t n = 50);

        /**
         * @brief ~/.mouselink/logs
         */
        static std::filesystem::path default_logs_dir();

    private:
        std::filesystem::path logs_dir_;
        std::filesystem::path audit_log_path_;
        std::ofstream log_file_;
        bool enabled_;
        mutable std::mutex mutex_;

        /**
         * @brief Get current timestamp string
         * 
         * @return std::string Formatted timestamp [YYYY-MM-DD HH:MM:SS]
         */
        [[nodiscard]] static std::string get_timestamp();

        [[nodiscard]] static std::string category_to_string(AuditCategory category);

        void write_log(AuditCategory category, const std::string& message);

        void ensure_open();
    };

    /**
     * @brief Forwards session and pairing events to an AuditLogger
     */
    class AuditSessionObserver : public SessionObserver {
    public:
        explicit AuditSessionObserver(AuditLogger& logger) : logger_(logger) {}

        void on_pairing_rejected(const std::string& peer, const std::string& reason) override;
        void on_session_opened(const std::string& peer) override;
        void on_session_closed(const std::string& peer, const std::string& reason) override;
        void on_malformed_message(const std::string& peer, const std::string& error) override;
        void on_injection_failed(const std::string& peer, const std::string& event) override;

    private:
        AuditLogger& logger_;
    };

} // namespace mlink
