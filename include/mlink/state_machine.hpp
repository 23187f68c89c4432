/**
 * @file state_machine.hpp
 * @brief State machine for the server lifecycle
 * 
 * The states transition as follows:
 * 
 * STOPPED → STARTING → RUNNING → STOPPING → STOPPED
 *   ↑          |
 *   └──────────┘ (bind failure / no network interface)
 * 
 * The state machine is thread-safe. The lifecycle controller writes it,
 * control surfaces (CLI, tray, control server) read it.
 */

#pragma once

#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <functional>

namespace mlink {

    /**
     * @brief Lifecycle states of the input server
     * 
     * STOPPED:  No listener bound, no token valid
     * STARTING: Listener being bound, token being issued
     * RUNNING:  Listener accepting pairing attempts
     * STOPPING: Sessions and listener being torn down
     */
    enum class ServerState {
        STOPPED,    ///< Nothing bound, ready to start
        STARTING,   ///< start() in progress
        RUNNING,    ///< Accepting connections
        STOPPING    ///< stop() in progress
    };

    /**
     * @brief Converts a ServerState enum to human-readable string
     * 
     * @param state The state to convert
     * @return std::string String representation ("STOPPED", "RUNNING", etc.)
     */
    inline std::string state_to_string(ServerState state) {
        switch (state) {
            case ServerState::STOPPED:  return "STOPPED";
            case ServerState::STARTING: return "STARTING";
            case ServerState::RUNNING:  return "RUNNING";
            case ServerState::STOPPING: return "STOPPING";
            default:                    return "UNKNOWN";
        }
    }

    /**
     * @brief Callback invoked after a successful transition (from, to)
     */
    using StateListener = std::function<void(ServerState, ServerState)>;

    /**
     * @brief Thread-safe state machine for the server lifecycle
     * 
     * All state changes are validated and protected by a mutex. Reads are
     * lock-free so a UI can poll get_state() without ever blocking.
     * 
     * Registered listeners are called after the state changed, with the
     * internal mutex released, on the thread that performed the
     * transition.
     * 
     * Usage:
     *   StateMachine sm;
     *   sm.add_listener([](ServerState from, ServerState to) { ... });
     *   sm.transition_to(ServerState::STARTING);  // From STOPPED only
     *   auto current = sm.get_state();
     */
    class StateMachine {
    public:
        /**
         * @brief Constructs a state machine initialized to STOPPED
         */
        StateMachine() : current_state_(ServerState::STOPPED) {}

        /**
         * @brief Gets the current state (thread-safe, lock-free)
         * 
         * @return ServerState The current state
         */
        ServerState get_state() const {
            return current_state_.load();
        }

        /**
         * @brief Attempts to transition to a new state
         * 
         * Valid transitions:
         * - STOPPED → STARTING (start)
         * - STARTING → RUNNING (listener bound)
         * - STARTING → STOPPED (bind failure)
         * - RUNNING → STOPPING (stop)
         * - STOPPING → STOPPED (teardown complete)
         * 
         * @param new_state The desired new state
         * @return true if transition was successful
         * @return false if transition is invalid
         */
        bool transition_to(ServerState new_state);

        /**
         * @brief Checks if a state transition is valid without performing it
         */
        static bool is_valid_transition(ServerState from, ServerState to);

        /**
         * @brief Registers a listener for state transitions
         * 
         * @param listener Called with (from, to) after every transition
         */
        void add_listener(StateListener listener);

    private:
        /** @brief Atomic state storage for lock-free reads */
        std::atomic<ServerState> current_state_;
        
        /** @brief Mutex for state change validation and listener list */
        mutable std::mutex mutex_;

        std::vector<StateListener> listeners_;
    };

} // namespace mlink
