/**
 * @file utils.hpp
 * @brief Utility functions for paths and display formatting
 * 
 * This header provides helper functions for:
 * - Expanding tilde (~) to user's home directory
 * - Locating the MouseLink data directory
 * - Formatting durations for status output
 */

#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include <cstdlib>
#include <iostream>

namespace mlink {

    /**
     * @brief Expands a tilde (~) in a path to the user's home directory
     * 
     * Examples:
     *   "~/.mouselink"   → "/home/username/.mouselink"
     *   "/absolute/path" → "/absolute/path" (unchanged)
     *   "relative/path"  → "relative/path" (unchanged)
     * 
     * @param path The path string that may contain a tilde
     * @return std::filesystem::path The expanded path
     * 
     * @note If HOME environment variable is not set, returns the original path
     */
    inline std::filesystem::path expand_tilde(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }

        const char* home = std::getenv("HOME");
        if (!home) {
            std::cerr << "HOME environment variable not set" << std::endl;
            return path;
        }

        // Skip "~/" to avoid treating the rest as an absolute path
        std::string rest = path.substr(1);
        if (!rest.empty() && rest[0] == '/') {
            rest = rest.substr(1);
        }

        return std::filesystem::path(home) / rest;
    }

    /**
     * @brief Gets the MouseLink data directory
     * 
     * Returns ~/.mouselink which holds config.json and logs/.
     * Falls back to the temp directory when HOME is not set.
     */
    inline std::filesystem::path get_mouselink_dir() {
        if (!std::getenv("HOME")) {
            return std::filesystem::temp_directory_path() / "mouselink";
        }
        return expand_tilde("~/.mouselink");
    }

    /**
     * @brief Formats a duration as "Xh Ym Zs"
     */
    inline std::string format_uptime(std::chrono::seconds uptime) {
        auto total = uptime.count();
        if (total < 0) {
            total = 0;
        }
        auto hours = total / 3600;
        auto minutes = (total % 3600) / 60;
        auto seconds = total % 60;
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
               std::to_string(seconds) + "s";
    }

} // namespace mlink
