//
// Created by opencode on 18/10/2026.
//

#include "mlink/config_manager.hpp"
#include "mlink/token_issuer.hpp"
#include "mlink/utils.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace mlink {

    namespace {

        uint16_t read_port(const nlohmann::json& j, const char* key, uint16_t fallback) {
            int value = j.value(key, static_cast<int>(fallback));
            if (value < 0 || value > 65535) {
                throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(value));
            }
            return static_cast<uint16_t>(value);
        }

    } // namespace

    void to_json(nlohmann::json& j, const Settings& s) {
        j = nlohmann::json{
            {"listen_port", s.listen_port},
            {"control_port", s.control_port},
            {"auto_start", s.auto_start},
            {"sensitivity", s.sensitivity},
            {"injector", s.injector},
            {"screen_width", s.screen_width},
            {"screen_height", s.screen_height},
            {"advertise_host", s.advertise_host},
            {"token_bytes", s.token_bytes},
            {"audit_log", s.audit_log}
        };
    }

    void from_json(const nlohmann::json& j, Settings& s) {
        Settings defaults;
        s.listen_port = read_port(j, "listen_port", defaults.listen_port);
        s.control_port = read_port(j, "control_port", defaults.control_port);
        s.auto_start = j.value("auto_start", defaults.auto_start);
        s.sensitivity = j.value("sensitivity", defaults.sensitivity);
        s.injector = j.value("injector", defaults.injector);
        s.screen_width = j.value("screen_width", defaults.screen_width);
        s.screen_height = j.value("screen_height", defaults.screen_height);
        s.advertise_host = j.value("advertise_host", defaults.advertise_host);
        auto token_bytes = j.value("token_bytes", static_cast<int64_t>(defaults.token_bytes));
        if (token_bytes < 0) {
            throw std::invalid_argument("token_bytes must not be negative: " + std::to_string(token_bytes));
        }
        s.token_bytes = static_cast<size_t>(token_bytes);
        s.audit_log = j.value("audit_log", defaults.audit_log);
    }

    ConfigManager::ConfigManager(std::filesystem::path config_path)
        : config_path_(std::move(config_path)) {}

    std::filesystem::path ConfigManager::default_config_path() {
        return get_mouselink_dir() / "config.json";
    }

    Settings ConfigManager::load() const {
        if (!std::filesystem::exists(config_path_)) {
            return Settings{};
        }

        std::ifstream file(config_path_);
        if (!file.is_open()) {
            std::cerr << "[Config] Failed to open " << config_path_ << ", using defaults" << std::endl;
            return Settings{};
        }

        try {
            Settings settings = nlohmann::json::parse(file).get<Settings>();
            std::string problem = validate(settings);
            if (!problem.empty()) {
                std::cerr << "[Config] Invalid settings in " << config_path_ << ": " << problem
                          << ", using defaults" << std::endl;
                return Settings{};
            }
            return settings;
        } catch (const std::exception& e) {
            std::cerr << "[Config] Failed to parse " << config_path_ << ": " << e.what()
                      << ", using defaults" << std::endl;
            return Settings{};
        }
    }

    bool ConfigManager::save(const Settings& settings) const {
        std::error_code ec;
        if (config_path_.has_parent_path()) {
            std::filesystem::create_directories(config_path_.parent_path(), ec);
        }
        if (ec) {
            std::cerr << "[Config] Failed to create " << config_path_.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }

        std::ofstream file(config_path_, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[Config] Failed to write " << config_path_ << std::endl;
            return false;
        }

        file << nlohmann::json(settings).dump(2) << std::endl;
        return file.good();
    }

    std::string ConfigManager::validate(const Settings& settings) {
        if (!(settings.sensitivity > 0.0) || settings.sensitivity > MAX_SENSITIVITY) {
            return "sensitivity must be in (0, " + std::to_string(static_cast<int>(MAX_SENSITIVITY)) + "]";
        }
        if (settings.injector != "uinput" && settings.injector != "log") {
            return "injector must be \"uinput\" or \"log\"";
        }
        if (settings.screen_width <= 0 || settings.screen_height <= 0) {
            return "screen size must be positive";
        }
        if (settings.token_bytes < MIN_TOKEN_BYTES || settings.token_bytes > MAX_TOKEN_BYTES) {
            return "token_bytes must be between " + std::to_string(MIN_TOKEN_BYTES) + " and " +
                   std::to_string(MAX_TOKEN_BYTES);
        }
        if (settings.control_port == 0) {
            return "control_port must not be 0";
        }
        return "";
    }

} // namespace mlink
