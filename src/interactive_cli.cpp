//
// Created by opencode on 18/10/2026.
//

#include "mlink/interactive_cli.hpp"
#include "mlink/audit_logger.hpp"
#include "mlink/daemonizer.hpp"
#include <iostream>
#include <sstream>
#include <thread>
#include <chrono>
#include <filesystem>
#include <sockpp/tcp_connector.h>
#include <sockpp/tcp_socket.h>
#include <sockpp/inet_address.h>

namespace mlink {

    //=========================================================================
    // DaemonClient Implementation
    //=========================================================================

    DaemonClient::DaemonClient(const std::string& host, int port)
        : host_(host)
        , port_(port) {}

    DaemonClient::~DaemonClient() = default;

    bool DaemonClient::is_daemon_running() {
        auto response = send_command("whoami:");
        if (response == nullptr || !response.contains("result") || !response["result"].is_object()) {
            return false;
        }
        return response["result"].contains("version");
    }

    nlohmann::json DaemonClient::send_command(const std::string& command) {
        try {
            sockpp::tcp_connector conn;
            sockpp::inet_address addr(host_, static_cast<in_port_t>(port_));
            
            if (!conn.connect(addr, std::chrono::milliseconds(2000))) {
                last_error_ = "Failed to connect to daemon";
                return nullptr;
            }
            
            std::string cmd = command;
            if (cmd.empty() || cmd.back() != '\n') {
                cmd += '\n';
            }
            
            auto write_result = conn.write(cmd);
            if (!write_result.is_ok()) {
                last_error_ = "Failed to send command: " + write_result.error_message();
                conn.close();
                return nullptr;
            }
            
            // stop/restart wait for sessions to close, allow for that
            conn.read_timeout(std::chrono::milliseconds(10000));

            std::string response_str;
            char buffer[4096];
            while (response_str.find('\n') == std::string::npos) {
                auto read_result = conn.read(buffer, sizeof(buffer));
                if (!read_result.is_ok()) {
                    last_error_ = "Failed to read response: " + read_result.error_message();
                    conn.close();
                    return nullptr;
                }
                if (read_result.value() == 0) {
                    break;
                }
                response_str.append(buffer, read_result.value());
            }
            conn.close();

            if (response_str.empty()) {
                last_error_ = "No response from daemon";
                return nullptr;
            }
            
            try {
                return nlohmann::json::parse(response_str.substr(0, response_str.find('\n')));
            } catch (const std::exception& e) {
                last_error_ = std::string("Failed to parse response: ") + e.what();
                return nullptr;
            }
            
        } catch (const std::exception& e) {
            last_error_ = std::string("Exception: ") + e.what();
            return nullptr;
        }
    }

    //=========================================================================
    // InteractiveCLI Implementation
    //=========================================================================

    InteractiveCLI::InteractiveCLI(const std::string& host, int port)
        : client_(host, port)
        , port_(port) {}

    void InteractiveCLI::run() {
        print_welcome();
        
        running_ = true;
        std::string input;
        
        while (running_) {
            print_prompt();
            
            if (!std::getline(std::cin, input)) {
                std::cout << std::endl;
                break;
            }
            
            if (!execute_command(input)) {
                break;
            }
        }
        
        std::cout << "Goodbye! (the daemon keeps running)" << std::endl;
    }

    bool InteractiveCLI::run_command(const std::string& command) {
        return execute_command(command);
    }

    void InteractiveCLI::print_welcome() {
        std::cout << "========================================" << std::endl;
        std::cout << "  MouseLink CLI" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;
        
        if (client_.is_daemon_running()) {
            std::cout << "Connected to daemon on port " << port_ << std::endl;
            
            auto response = client_.send_command("status:");
            if (response != nullptr && response["error"].is_null()) {
                auto result = response["result"];
                if (result["running"].get<bool>()) {
                    std::cout << "Status: Running on port " << result["port"] << std::endl;
                } else {
                    std::cout << "Status: " << result["state"].get<std::string>() << std::endl;
                }
            }
        } else {
            std::cout << "WARNING: Daemon is not running!" << std::endl;
            std::cout << "Use 'daemonize' command to start the daemon." << std::endl;
        }
        
        std::cout << std::endl;
        std::cout << "Type 'help' for available commands." << std::endl;
        std::cout << std::endl;
    }

    void InteractiveCLI::print_prompt() {
        std::cout << "mouselink> ";
        std::cout.flush();
    }

    bool InteractiveCLI::execute_command(const std::string& input) {
        std::string trimmed = trim(input);
        
        if (trimmed.empty()) {
            return true;
        }
        
        auto parts = split(trimmed, ' ');
        if (parts.empty()) {
            return true;
        }
        
        std::string cmd = parts[0];
        std::string args;
        size_t space_pos = trimmed.find(' ');
        if (space_pos != std::string::npos) {
            args = trim(trimmed.substr(space_pos + 1));
        }
        
        if (cmd == "quit" || cmd == "exit") {
            return false;
        } else if (cmd == "status") {
            cmd_status();
        } else if (cmd == "start") {
            cmd_start(args);
        } else if (cmd == "stop") {
            cmd_stop();
        } else if (cmd == "restart") {
            cmd_restart(args);
        } else if (cmd == "pairing") {
            cmd_pairing();
        } else if (cmd == "logs") {
            cmd_logs(args);
        } else if (cmd == "daemonize") {
            cmd_daemonize();
        } else if (cmd == "help") {
            cmd_help();
        } else {
            std::cout << "Unknown command: " << cmd << std::endl;
            std::cout << "Type 'help' for available commands." << std::endl;
        }
        
        return true;
    }

    nlohmann::json InteractiveCLI::request(const std::string& command) {
        auto response = client_.send_command(command);
        if (response == nullptr) {
            std::cout << "Error: " << client_.get_last_error() << std::endl;
            std::cout << "Is the daemon running? Use 'daemonize' to start it." << std::endl;
            return nullptr;
        }
        
        if (response.contains("error") && !response["error"].is_null()) {
            std::cout << "Error: " << response["error"].get<std::string>() << std::endl;
            return nullptr;
        }
        
        return response["result"];
    }

    void InteractiveCLI::cmd_status() {
        auto result = request("status:");
        if (result == nullptr) {
            return;
        }
        
        std::cout << "Server Status:" << std::endl;
        std::cout << "  State: " << result["state"].get<std::string>() << std::endl;
        
        if (result["running"].get<bool>()) {
            std::cout << "  Address: " << result["host"].get<std::string>() << ":" << result["port"] << std::endl;
            std::cout << "  Uptime: " << result["uptime"].get<std::string>() << std::endl;
            if (result["session"].is_null()) {
                std::cout << "  Controller: none (waiting for pairing)" << std::endl;
            } else {
                std::cout << "  Controller: " << result["session"]["peer"].get<std::string>()
                          << " (idle " << result["session"]["idle_ms"] << " ms)" << std::endl;
            }
        }
    }

    void InteractiveCLI::cmd_start(const std::string& port) {
        std::cout << "Starting input server..." << std::endl;
        
        auto result = request("start:" + port);
        if (result == nullptr) {
            return;
        }
        
        std::cout << "Success! Server is running." << std::endl;
        print_pairing(result["pairing"]);
    }

    void InteractiveCLI::cmd_stop() {
        auto result = request("stop:");
        if (result == nullptr) {
            return;
        }
        
        if (result["was_running"].get<bool>()) {
            std::cout << "Server stopped." << std::endl;
        } else {
            std::cout << "Server was not running." << std::endl;
        }
    }

    void InteractiveCLI::cmd_restart(const std::string& port) {
        std::cout << "Restarting input server..." << std::endl;

        auto result = request("restart:" + port);
        if (result == nullptr) {
            return;
        }

        std::cout << "Success! Server restarted with a new pairing token." << std::endl;
        print_pairing(result["pairing"]);
    }

    void InteractiveCLI::cmd_pairing() {
        auto result = request("pairing:");
        if (result == nullptr) {
            return;
        }
        print_pairing(result);
    }

    void InteractiveCLI::print_pairing(const nlohmann::json& pairing) {
        std::cout << "  Address: " << pairing["host"].get<std::string>() << ":" << pairing["port"] << std::endl;
        std::cout << "  Token:   " << pairing["token"].get<std::string>() << std::endl;
        std::cout << "  URI:     " << pairing["uri"].get<std::string>() << std::endl;
        std::cout << "  Scan payload:" << std::endl;
        std::cout << "  " << pairing["payload"].get<std::string>() << std::endl;
    }

    void InteractiveCLI::cmd_logs(const std::string& args) {
        std::filesystem::path audit_log = AuditLogger::default_logs_dir() / "audit.log";
        
        if (!std::filesystem::exists(audit_log)) {
            std::cout << "No audit log found." << std::endl;
            return;
        }
        
        size_t num_lines = 50;
        if (!args.empty()) {
            try {
                num_lines = std::stoul(args);
            } catch (const std::exception&) {
                std::cout << "Invalid line count '" << args << "', showing 50" << std::endl;
            }
        }
        
        std::string tail = AuditLogger::read_last_lines(audit_log, num_lines);
        if (tail.empty()) {
            std::cout << "Audit log is empty or unreadable." << std::endl;
            return;
        }
        
        std::cout << "Last " << num_lines << " lines of audit log:" << std::endl;
        std::cout << "----------------------------------------" << std::endl;
        std::cout << tail;
    }

    void InteractiveCLI::cmd_daemonize() {
        if (client_.is_daemon_running()) {
            std::cout << "Daemon is already running!" << std::endl;
            return;
        }

        std::cout << "Starting daemon..." << std::endl;

        Daemonizer daemonizer("127.0.0.1", port_);
        std::string binary_path = Daemonizer::get_executable_path();

        if (binary_path.empty()) {
            binary_path = "./MouseLink";
        }

        std::cout << "Spawning daemon from: " << binary_path << std::endl;

        if (!daemonizer.spawn_daemon(binary_path)) {
            std::cout << "ERROR: Failed to spawn daemon: " << daemonizer.get_last_error() << std::endl;
            return;
        }

        std::cout << "Daemon spawned. Waiting for it to be ready..." << std::endl;

        if (!daemonizer.wait_for_daemon(std::chrono::seconds(10))) {
            std::cout << "ERROR: " << daemonizer.get_last_error() << std::endl;
            std::cout << "Daemon may have failed to start. Check logs for details." << std::endl;
            return;
        }

        std::cout << "SUCCESS! Daemon is now running." << std::endl;
        std::cout << "Use 'start' to begin accepting a mobile controller." << std::endl;
    }

    void InteractiveCLI::cmd_help() {
        std::cout << "Available commands:" << std::endl;
        std::cout << std::endl;
        std::cout << "  status               Show server state and controller" << std::endl;
        std::cout << "  start [port]         Start the input server (default: configured port)" << std::endl;
        std::cout << "  stop                 Stop the input server" << std::endl;
        std::cout << "  restart [port]       Restart with a fresh pairing token" << std::endl;
        std::cout << "  pairing              Show the pairing payload to scan" << std::endl;
        std::cout << "  logs [n]             Show last n lines of audit log (default: 50)" << std::endl;
        std::cout << "  daemonize            Start the daemon in the background" << std::endl;
        std::cout << "  help                 Show this help" << std::endl;
        std::cout << "  quit, exit           Exit interactive mode" << std::endl;
        std::cout << std::endl;
        std::cout << "Note: Most commands require the daemon to be running." << std::endl;
    }

    std::string InteractiveCLI::trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) {
            return "";
        }
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, last - first + 1);
    }

    std::vector<std::string> InteractiveCLI::split(const std::string& str, char delim) {
        std::vector<std::string> parts;
        std::stringstream ss(str);
        std::string part;
        while (std::getline(ss, part, delim)) {
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
        return parts;
    }

} // namespace mlink
