/**
 * @file config_manager.hpp
 * @brief Persistent MouseLink settings
 * 
 * Settings live in ~/.mouselink/config.json:
 * 
 *   {
 *     "listen_port": 8080,
 *     "control_port": 23890,
 *     "auto_start": false,
 *     "sensitivity": 1.0,
 *     "injector": "uinput",
 *     "screen_width": 1920,
 *     "screen_height": 1080,
 *     "advertise_host": "",
 *     "token_bytes": 16,
 *     "audit_log": true
 *   }
 * 
 * Missing keys keep their defaults. A file that cannot be read or
 * parsed is reported and ignored; the daemon still starts.
 */

#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace mlink {

    constexpr uint16_t DEFAULT_CONTROL_PORT = 23890;

    /**
     * @brief Largest accepted relative move multiplier
     */
    constexpr double MAX_SENSITIVITY = 100.0;

    /**
     * @brief Daemon settings with their defaults
     */
    struct Settings {
        uint16_t listen_port = 8080;            ///< Port for mobile clients (0 = ephemeral)
        uint16_t control_port = DEFAULT_CONTROL_PORT;  ///< Localhost control protocol port
        bool auto_start = false;                ///< Start the input server with the daemon
        double sensitivity = 1.0;               ///< Relative move multiplier
        std::string injector = "uinput";        ///< "uinput" or "log"
        int screen_width = 1920;                ///< Absolute move range
        int screen_height = 1080;
        std::string advertise_host;             ///< Empty: detect local address
        size_t token_bytes = 16;                ///< Random bytes per pairing token
        bool audit_log = true;                  ///< Write ~/.mouselink/logs/audit.log
    };

    void to_json(nlohmann::json& j, const Settings& s);
    void from_json(const nlohmann::json& j, Settings& s);

    /**
     * @brief Loads and saves Settings as JSON
     * 
     * Usage:
     *   ConfigManager cm;                 // ~/.mouselink/config.json
     *   Settings s = cm.load();
     *   s.listen_port = 9000;
     *   cm.save(s);
     */
    class ConfigManager {
    public:
        /**
         * @brief Constructs ConfigManager for a config file
         * 
         * @param config_path Path to config.json (default ~/.mouselink/config.json)
         */
        explicit ConfigManager(std::filesystem::path config_path = default_config_path());

        /**
         * @brief Reads the config file
         * 
         * @return Settings Loaded settings, defaults for anything missing
         *                  or invalid
         */
        [[nodiscard]] Settings load() const;

        /**
         * @brief Writes settings to the config file (pretty-printed)
         * 
         * @return true if the file was written
         */
        bool save(const Settings& settings) const;

        /**
         * @brief Rejects values the daemon cannot run with
         * 
         * @return std::string Empty if valid, otherwise the first problem
         */
        [[nodiscard]] static std::string validate(const Settings& settings);

        [[nodiscard]] std::filesystem::path get_config_path() const { return config_path_; }

        /**
         * @brief ~/.mouselink/config.json
         */
        static std::filesystem::path default_config_path();

    private:
        std::filesystem::path config_path_;
    };

} // namespace mlink
