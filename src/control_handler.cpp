//
// Created by opencode on 18/10/2026.
//

#include "mlink/control_handler.hpp"
#include "mlink/errors.hpp"
#include "mlink/lifecycle_controller.hpp"
#include "mlink/utils.hpp"
#include <sstream>
#include <stdexcept>

namespace mlink {

    ControlHandler::ControlHandler(LifecycleController& controller, uint16_t default_port)
        : controller_(controller)
        , default_port_(default_port) {}

    nlohmann::json ControlHandler::execute(const std::string& command) {
        // Format: CMD:ARG1,ARG2,...\n
        size_t colon_pos = command.find(':');
        if (colon_pos == std::string::npos) {
            return error_response("unknown", "Parsing error: colon not found");
        }

        std::string cmd = command.substr(0, colon_pos);
        std::vector<std::string> args;

        if (colon_pos + 1 < command.length()) {
            std::string args_str = command.substr(colon_pos + 1);
            while (!args_str.empty() && (args_str.back() == '\n' || args_str.back() == '\r')) {
                args_str.pop_back();
            }

            std::stringstream ss(args_str);
            std::string arg;
            while (std::getline(ss, arg, ',')) {
                arg.erase(0, arg.find_first_not_of(" \t"));
                arg.erase(arg.find_last_not_of(" \t") + 1);
                if (!arg.empty()) {
                    args.push_back(arg);
                }
            }
        }

        try {
            if (cmd == "start") {
                return handle_start(args);
            } else if (cmd == "stop") {
                return handle_stop();
            } else if (cmd == "restart") {
                return handle_restart(args);
            } else if (cmd == "status") {
                return handle_status();
            } else if (cmd == "pairing") {
                return handle_pairing();
            } else if (cmd == "whoami") {
                return handle_whoami();
            } else {
                return error_response(cmd, "Unknown command: " + cmd);
            }
        } catch (const ServerError& e) {
            nlohmann::json response = error_response(cmd, e.what());
            response["code"] = error_code_to_string(e.code());
            return response;
        } catch (const std::exception& e) {
            return error_response(cmd, e.what());
        }
    }

    nlohmann::json ControlHandler::descriptor_to_json(const ConnectionDescriptor& descriptor) {
        return {
            {"host", descriptor.host},
            {"port", descriptor.port},
            {"token", descriptor.token},
            {"payload", descriptor.to_payload()},
            {"uri", descriptor.to_uri()}
        };
    }

    nlohmann::json ControlHandler::handle_start(const std::vector<std::string>& args) {
        ConnectionDescriptor descriptor = controller_.start(port_arg(args));
        return {
            {"CMD", "start"},
            {"result", {
                {"status", "running"},
                {"pairing", descriptor_to_json(descriptor)}
            }},
            {"error", nullptr}
        };
    }

    nlohmann::json ControlHandler::handle_stop() {
        bool was_running = controller_.stop();
        return {
            {"CMD", "stop"},
            {"result", {
                {"status", "stopped"},
                {"was_running", was_running}
            }},
            {"error", nullptr}
        };
    }

    nlohmann::json ControlHandler::handle_restart(const std::vector<std::string>& args) {
        ConnectionDescriptor descriptor = controller_.restart(port_arg(args));
        return {
            {"CMD", "restart"},
            {"result", {
                {"status", "running"},
                {"pairing", descriptor_to_json(descriptor)}
            }},
            {"error", nullptr}
        };
    }

    nlohmann::json ControlHandler::handle_status() {
        ServerStatus status = controller_.snapshot();

        nlohmann::json session = nullptr;
        if (status.session_active) {
            session = {
                {"peer", status.session_peer},
                {"idle_ms", status.session_idle.count()}
            };
        }

        return {
            {"CMD", "status"},
            {"result", {
                {"state", state_to_string(status.state)},
                {"running", status.state == ServerState::RUNNING},
                {"port", status.descriptor ? nlohmann::json(status.descriptor->port) : nlohmann::json(nullptr)},
                {"host", status.descriptor ? nlohmann::json(status.descriptor->host) : nlohmann::json(nullptr)},
                {"uptime", status.descriptor ? nlohmann::json(format_uptime(status.uptime)) : nlohmann::json(nullptr)},
                {"session", session}
            }},
            {"error", nullptr}
        };
    }

    nlohmann::json ControlHandler::handle_pairing() {
        ServerStatus status = controller_.snapshot();
        if (!status.descriptor) {
            nlohmann::json response = error_response("pairing", "Server is not running");
            response["code"] = error_code_to_string(ErrorCode::NOT_RUNNING);
            return response;
        }
        return {
            {"CMD", "pairing"},
            {"result", descriptor_to_json(*status.descriptor)},
            {"error", nullptr}
        };
    }

    nlohmann::json ControlHandler::handle_whoami() {
        return {
            {"CMD", "whoami"},
            {"result", {
                {"version", MLINK_VERSION},
                {"implementation", "C++"}
            }},
            {"error", nullptr}
        };
    }

    uint16_t ControlHandler::port_arg(const std::vector<std::string>& args) const {
        if (args.empty()) {
            return default_port_;
        }
        size_t consumed = 0;
        int port = 0;
        try {
            port = std::stoi(args[0], &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port: " + args[0]);
        }
        if (consumed != args[0].size() || port < 0 || port > 65535) {
            throw std::invalid_argument("Invalid port: " + args[0]);
        }
        return static_cast<uint16_t>(port);
    }

    nlohmann::json ControlHandler::error_response(const std::string& cmd, const std::string& error) {
        return {
            {"CMD", cmd},
            {"result", nullptr},
            {"error", error}
        };
    }

} // namespace mlink
