//
// Created by opencode on 18/10/2026.
//

#include "mlink/audit_logger.hpp"
#include "mlink/utils.hpp"
#include <iostream>
#include <deque>

namespace mlink {

    AuditLogger::AuditLogger(std::filesystem::path logs_dir, bool enabled)
        : logs_dir_(std::move(logs_dir))
        , enabled_(enabled) {
        audit_log_path_ = logs_dir_ / "audit.log";

        if (!enabled_) {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(logs_dir_, ec);
        if (ec) {
            std::cerr << "[AuditLogger] Failed to create " << logs_dir_ << ": " << ec.message() << std::endl;
        }
        
        log_file_.open(audit_log_path_, std::ios::app);
        
        if (log_file_.is_open()) {
            write_log(AuditCategory::INFO, "Audit logger initialized");
        } else {
            std::cerr << "[AuditLogger] Failed to open audit log: " << audit_log_path_ << std::endl;
        }
    }

    AuditLogger::~AuditLogger() {
        if (log_file_.is_open()) {
            write_log(AuditCategory::INFO, "Audit logger shutting down");
            log_file_.close();
        }
    }

    std::filesystem::path AuditLogger::default_logs_dir() {
        return get_mouselink_dir() / "logs";
    }

    void AuditLogger::log_command(const std::string& command, const std::string& source) {
        std::string message = "Command received: " + command;
        if (!source.empty()) {
            message += " from " + source;
        }
        write_log(AuditCategory::CMD, message);
    }

    void AuditLogger::log_state_transition(const std::string& from_state, const std::string& to_state) {
        write_log(AuditCategory::STATE, from_state + " -> " + to_state);
    }

    void AuditLogger::log_action(const std::string& action, const std::string& details) {
        std::string message = action;
        if (!details.empty()) {
            message += ": " + details;
        }
        write_log(AuditCategory::ACTION, message);
    }

    void AuditLogger::log_error(const std::string& error, const std::string& context) {
        std::string message = error;
        if (!context.empty()) {
            message = "[" + context + "] " + error;
        }
        write_log(AuditCategory::ERROR, message);
    }

    void AuditLogger::log_success(const std::string& operation, const std::string& details) {
        std::string message = operation;
        if (!details.empty()) {
            message += ": " + details;
        }
        write_log(AuditCategory::SUCCESS, message);
    }

    void AuditLogger::log_info(const std::string& message) {
        write_log(AuditCategory::INFO, message);
    }

    std::string AuditLogger::get_last_lines(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return read_last_lines(audit_log_path_, n);
    }

    std::string AuditLogger::read_last_lines(const std::filesystem::path& path, size_t n) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return "";
        }

        std::deque<std::string> lines;
        std::string line;
        
        while (std::getline(file, line)) {
            lines.push_back(line);
            if (lines.size() > n) {
                lines.pop_front();
            }
        }
        
        std::string result;
        for (const auto& l : lines) {
            result += l + "\n";
        }
        
        return result;
    }

    std::string AuditLogger::get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        
        std::tm local_time{};
        localtime_r(&time, &local_time);

        std::stringstream ss;
        ss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string AuditLogger::category_to_string(AuditCategory category) {
        switch (category) {
            case AuditCategory::CMD:     return "[CMD]";
            case AuditCategory::STATE:   return "[STATE]";
            case AuditCategory::ACTION:  return "[ACTION]";
            case AuditCategory::ERROR:   return "[ERROR]";
            case AuditCategory::SUCCESS: return "[SUCCESS]";
            case AuditCategory::INFO:    return "[INFO]";
            default:                     return "[UNKNOWN]";
        }
    }

    void AuditLogger::write_log(AuditCategory category, const std::string& message) {
        if (!enabled_) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        
        ensure_open();
        
        if (log_file_.is_open()) {
            log_file_ << "[" << get_timestamp() << "] "
                     << category_to_string(category) << " "
                     << message << std::endl;
        }
    }

    void AuditLogger::ensure_open() {
        if (!log_file_.is_open()) {
            log_file_.open(audit_log_path_, std::ios::app);
        }
    }

    //=========================================================================
    // AuditSessionObserver
    //=========================================================================

    void AuditSessionObserver::on_pairing_rejected(const std::string& peer, const std::string& reason) {
        logger_.log_error("Pairing rejected for " + peer + ": " + reason, "pairing");
    }

    void AuditSessionObserver::on_session_opened(const std::string& peer) {
        logger_.log_success("Controller paired", peer);
    }

    void AuditSessionObserver::on_session_closed(const std::string& peer, const std::string& reason) {
        logger_.log_action("Controller session closed", peer + " (" + reason + ")");
    }

    void AuditSessionObserver::on_malformed_message(const std::string& peer, const std::string& error) {
        logger_.log_error("Malformed message from " + peer + ": " + error, "session");
    }

    void AuditSessionObserver::on_injection_failed(const std::string& peer, const std::string& event) {
        logger_.log_error("Injection failed for " + event + " from " + peer, "injector");
    }

} // namespace mlink
