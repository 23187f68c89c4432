/**
 * @file errors.hpp
 * @brief Error taxonomy for the MouseLink server
 *
 * Only start/stop outcomes reach the caller synchronously. Per-connection
 * and per-message errors (PAIRING_REJECTED, MALFORMED_MESSAGE,
 * INJECTION_FAILED) are absorbed by the listener and session and only
 * show up in the logs.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace mlink {

    /**
     * @brief Error categories reported by the server
     */
    enum class ErrorCode {
        BIND_FAILED,            ///< Listen port unavailable
        NO_NETWORK_INTERFACE,   ///< No local IPv4 address to advertise
        PAIRING_REJECTED,       ///< Wrong/missing token, timeout or slot taken
        MALFORMED_MESSAGE,      ///< Frame could not be decoded
        INJECTION_FAILED,       ///< OS refused an input action
        ALREADY_RUNNING,        ///< start() while not STOPPED
        NOT_RUNNING             ///< stop() while STOPPED
    };

    inline std::string error_code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::BIND_FAILED:          return "BindFailed";
            case ErrorCode::NO_NETWORK_INTERFACE: return "NoNetworkInterface";
            case ErrorCode::PAIRING_REJECTED:     return "PairingRejected";
            case ErrorCode::MALFORMED_MESSAGE:    return "MalformedMessage";
            case ErrorCode::INJECTION_FAILED:     return "InjectionFailed";
            case ErrorCode::ALREADY_RUNNING:      return "AlreadyRunning";
            case ErrorCode::NOT_RUNNING:          return "NotRunning";
            default:                              return "Unknown";
        }
    }

    /**
     * @brief Exception thrown by lifecycle operations
     *
     * what() carries a human-readable message, code() the category so
     * control surfaces can react without parsing text.
     */
    class ServerError : public std::runtime_error {
    public:
        ServerError(ErrorCode code, const std::string& message)
            : std::runtime_error(message)
            , code_(code) {}

        [[nodiscard]] ErrorCode code() const { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace mlink
