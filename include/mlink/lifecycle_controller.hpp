/**
 * @file lifecycle_controller.hpp
 * @brief Owns the input server's start/stop lifecycle
 * 
 * This is the only surface control clients (CLI, tray, window, control
 * server) use. It guarantees that at most one listener is bound and at
 * most one session is active, whatever thread calls in.
 * 
 * Thread safety:
 * - start/stop/restart are serialized by one operation mutex
 * - status() and snapshot() never wait for a running operation
 * - State-change listeners run on the thread performing the transition,
 *   outside internal locks; they must not call start/stop/restart
 *   synchronously
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "mlink/state_machine.hpp"
#include "mlink/token_issuer.hpp"

namespace mlink {

    class InputInjector;
    class ConnectionListener;
    class SessionObserver;

    constexpr uint16_t DEFAULT_LISTEN_PORT = 8080;

    /**
     * @brief Tunables for a controller
     */
    struct ControllerOptions {
        size_t token_bytes = MIN_TOKEN_BYTES;       ///< Random bytes per pairing token
        std::string advertise_host;                 ///< Empty: detect local address
        AddressProvider addresses = local_ipv4_addresses;
        double sensitivity = 1.0;                   ///< Relative move multiplier
    };

    /**
     * @brief Point-in-time view for control surfaces
     */
    struct ServerStatus {
        ServerState state = ServerState::STOPPED;
        std::optional<ConnectionDescriptor> descriptor;  ///< Set while RUNNING
        bool session_active = false;
        std::string session_peer;
        std::chrono::milliseconds session_idle{0};
        std::chrono::seconds uptime{0};
    };

    class LifecycleController {
    public:
        /**
         * @param injector Receives decoded events; must outlive the controller
         * @param options Token, address and sensitivity settings
         * @param observer Optional per-connection log hook
         */
        explicit LifecycleController(InputInjector& injector,
                                     ControllerOptions options = {},
                                     SessionObserver* observer = nullptr);

        /**
         * @brief Destructor
         * 
         * Stops the server if it is still running.
         */
        ~LifecycleController();

        LifecycleController(const LifecycleController&) = delete;
        LifecycleController& operator=(const LifecycleController&) = delete;

        /**
         * @brief Starts listening for pairing attempts
         * 
         * STOPPED → STARTING → RUNNING. On failure returns to STOPPED.
         * 
         * @param port Port to bind on all interfaces, 0 for ephemeral
         * @return ConnectionDescriptor Fresh descriptor for the pairing display
         * @throws ServerError ALREADY_RUNNING, BIND_FAILED or NO_NETWORK_INTERFACE
         */
        ConnectionDescriptor start(uint16_t port = DEFAULT_LISTEN_PORT);

        /**
         * @brief Stops the server
         * 
         * RUNNING → STOPPING → STOPPED. Closes the active session (even
         * while it is blocked reading), pending connections and the
         * listener, and revokes the token.
         * 
         * @return true if the server was running, false if it was a no-op
         */
        bool stop();

        /**
         * @brief stop() followed by start() as one operation
         * 
         * Always issues a new token; the previous one stops working.
         * 
         * @throws ServerError BIND_FAILED or NO_NETWORK_INTERFACE
         */
        ConnectionDescriptor restart(uint16_t port = DEFAULT_LISTEN_PORT);

        /**
         * @brief Current lifecycle state (non-blocking)
         */
        [[nodiscard]] ServerState status() const { return state_machine_.get_state(); }

        /**
         * @brief Detailed status for display (non-blocking)
         */
        [[nodiscard]] ServerStatus snapshot() const;

        /**
         * @brief Registers a state-change notification
         * 
         * @param listener Called with (from, to) after every transition
         */
        void on_state_change(StateListener listener);

    private:
        InputInjector& injector_;
        ControllerOptions options_;
        SessionObserver* observer_;

        StateMachine state_machine_;
        TokenIssuer issuer_;

        mutable std::mutex op_mutex_;       ///< Serializes start/stop/restart

        mutable std::mutex info_mutex_;     ///< Guards the fields below
        std::shared_ptr<ConnectionListener> listener_;
        std::optional<ConnectionDescriptor> descriptor_;
        std::chrono::steady_clock::time_point started_at_;

        ConnectionDescriptor start_locked(uint16_t port);
        bool stop_locked();
    };

} // namespace mlink
