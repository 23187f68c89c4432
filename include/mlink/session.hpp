/**
 * @file session.hpp
 * @brief One accepted client connection and its message loop
 * 
 * A session walks through:
 * 
 *   VALIDATING → ACTIVE → CLOSED
 *        └──────────────────┘ (bad token, timeout, slot taken)
 * 
 * While VALIDATING it waits for the token frame. Once the listener
 * promotes it, run() reads frames, decodes them into InputEvents and
 * hands them to the injector until the peer disconnects, three frames
 * in a row fail to decode, or close() is called from another thread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <sockpp/tcp_socket.h>

#include "mlink/protocol.hpp"

namespace mlink {

    class InputInjector;
    class TokenIssuer;

    /**
     * @brief Time a new connection gets to present its token
     */
    constexpr std::chrono::seconds PAIRING_TIMEOUT{5};

    /**
     * @brief Consecutive decode failures that close a session
     */
    constexpr int MAX_CONSECUTIVE_DECODE_FAILURES = 3;

    /**
     * @brief Largest token frame accepted during pairing
     */
    constexpr size_t MAX_TOKEN_FRAME = 1024;

    enum class SessionState {
        VALIDATING,
        ACTIVE,
        CLOSED
    };

    inline std::string session_state_to_string(SessionState state) {
        switch (state) {
            case SessionState::VALIDATING: return "VALIDATING";
            case SessionState::ACTIVE:     return "ACTIVE";
            case SessionState::CLOSED:     return "CLOSED";
            default:                       return "UNKNOWN";
        }
    }

    /**
     * @brief Receives per-connection events for logging
     * 
     * Called from connection worker threads. Implementations must be
     * thread-safe. All hooks default to no-ops.
     */
    class SessionObserver {
    public:
        virtual ~SessionObserver() = default;

        virtual void on_pairing_rejected(const std::string& /* peer */, const std::string& /* reason */) {}
        virtual void on_session_opened(const std::string& /* peer */) {}
        virtual void on_session_closed(const std::string& /* peer */, const std::string& /* reason */) {}
        virtual void on_malformed_message(const std::string& /* peer */, const std::string& /* error */) {}
        virtual void on_injection_failed(const std::string& /* peer */, const std::string& /* event */) {}
    };

    class Session {
    public:
        /**
         * @param socket Accepted connection, owned by the session
         * @param peer Peer address for logs ("ip:port")
         * @param sensitivity Multiplier for relative cursor moves
         */
        Session(sockpp::tcp_socket socket, std::string peer, double sensitivity = 1.0);

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        /**
         * @brief Waits for the token frame and checks it
         * 
         * The whole token frame must arrive within PAIRING_TIMEOUT of the
         * call; a client trickling bytes is cut off at that deadline.
         * 
         * @param issuer Holder of the currently valid token
         * @param reason Receives why validation failed
         * @return true if the first frame is exactly the current token
         */
        bool validate(const TokenIssuer& issuer, std::string& reason);

        /**
         * @brief Sends the pairing reply frame
         */
        bool send_pairing_reply(bool accepted);

        /**
         * @brief Marks the session ACTIVE; called by the listener under its lock
         * 
         * @return false if the session was closed while validating
         */
        bool activate();

        /**
         * @brief Runs the message loop until the session closes
         * 
         * @param injector Target for decoded events
         * @param observer Optional log hook
         * @return std::string Reason the loop ended
         */
        std::string run(InputInjector& injector, SessionObserver* observer);

        /**
         * @brief Closes the session, interrupting a blocked read
         * 
         * Safe to call from any thread, any number of times.
         */
        void close();

        /**
         * @brief Forwards one decoded event to the injector
         * 
         * @return true if the injector accepted the action
         */
        bool dispatch(const InputEvent& event, InputInjector& injector) const;

        [[nodiscard]] SessionState state() const { return state_.load(); }
        [[nodiscard]] const std::string& peer() const { return peer_; }

        /**
         * @brief Time since the last frame was received
         */
        [[nodiscard]] std::chrono::milliseconds idle_time() const;

    private:
        sockpp::tcp_socket socket_;
        std::string peer_;
        double sensitivity_;
        std::atomic<SessionState> state_{SessionState::VALIDATING};
        std::atomic<bool> close_requested_{false};
        std::atomic<std::chrono::steady_clock::rep> last_activity_;

        /**
         * @brief Reads one frame
         * 
         * @param payload Receives the frame payload
         * @return false on end-of-stream, timeout or I/O error
         */
        bool read_frame(std::string& payload);

        /**
         * @brief Reads exactly n bytes before an absolute deadline
         * 
         * @return false on end-of-stream, I/O error or once the deadline passes
         */
        bool read_until(char* buf, size_t n, std::chrono::steady_clock::time_point deadline);

        void touch();
        [[nodiscard]] int32_t scale(int16_t delta) const;
    };

} // namespace mlink
