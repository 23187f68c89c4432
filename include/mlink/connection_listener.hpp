/**
 * @file connection_listener.hpp
 * @brief TCP listener that pairs mobile clients and owns their sessions
 * 
 * The listener:
 * - Binds 0.0.0.0:<port> (port 0 picks an ephemeral port)
 * - Accepts connections on a dedicated thread
 * - Runs every connection on its own worker thread
 * - Validates the token frame within PAIRING_TIMEOUT
 * - Promotes the first validated connection to the active session;
 *   later ones get PAIRING_REJECTED while a session is active
 * 
 * At most MAX_PENDING_PAIRINGS connections may be validating at once;
 * further ones are rejected without a worker thread.
 * 
 * A failure on one connection never stops the accept loop. Only close()
 * does, and it also interrupts every pending and active session.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <sockpp/tcp_acceptor.h>

#include "mlink/session.hpp"

namespace mlink {

    class InputInjector;
    class TokenIssuer;

    /**
     * @brief Connections allowed to sit in VALIDATING at the same time
     */
    constexpr size_t MAX_PENDING_PAIRINGS = 8;

    /**
     * @brief How often the accept loop wakes to reap finished workers
     */
    constexpr std::chrono::milliseconds REAP_INTERVAL{500};

    class ConnectionListener {
    public:
        /**
         * @param issuer Holder of the valid token, checked on every pairing
         * @param injector Receives the active session's events
         * @param observer Optional log hook, may be nullptr
         * @param sensitivity Relative move multiplier for sessions
         */
        ConnectionListener(const TokenIssuer& issuer,
                           InputInjector& injector,
                           SessionObserver* observer = nullptr,
                           double sensitivity = 1.0);

        /**
         * @brief Destructor
         * 
         * Closes the listener and joins all threads.
         */
        ~ConnectionListener();

        ConnectionListener(const ConnectionListener&) = delete;
        ConnectionListener& operator=(const ConnectionListener&) = delete;

        /**
         * @brief Binds the listening socket
         * 
         * @param port Port to bind on all interfaces, 0 for ephemeral
         * @return uint16_t The port actually bound
         * @throws ServerError(BIND_FAILED) if the port is unavailable
         */
        uint16_t open(uint16_t port);

        /**
         * @brief Starts the accept thread; open() must have succeeded
         */
        void start_accepting();

        /**
         * @brief Stops accepting, closes every session, joins all threads
         * 
         * Idempotent. Must not be called from a worker thread.
         */
        void close();

        /**
         * @brief Currently active session, or nullptr
         */
        [[nodiscard]] std::shared_ptr<Session> active_session() const;

        /**
         * @brief Number of ACTIVE sessions (0 or 1)
         */
        [[nodiscard]] size_t active_session_count() const;

        [[nodiscard]] uint16_t port() const { return port_; }

    private:
        struct Worker {
            std::shared_ptr<Session> session;
            std::thread thread;
        };

        const TokenIssuer& issuer_;
        InputInjector& injector_;
        SessionObserver* observer_;
        double sensitivity_;

        sockpp::tcp_acceptor acceptor_;
        uint16_t port_ = 0;
        std::thread accept_thread_;
        std::atomic<bool> stopping_{false};
        std::atomic<bool> closed_{false};

        mutable std::mutex mutex_;              ///< Guards workers_ and active_
        std::list<Worker> workers_;
        std::shared_ptr<Session> active_;

        void accept_loop();

        /**
         * @brief Worker body: validate, promote, run, release
         */
        void handle_connection(std::shared_ptr<Session> session);

        /**
         * @brief Claims the active slot for a validated session
         * 
         * @return false if another session holds it or the listener is closing
         */
        bool promote(const std::shared_ptr<Session>& session);

        /**
         * @brief Frees the active slot if this session holds it
         */
        void release(const std::shared_ptr<Session>& session);

        /**
         * @brief Joins workers whose session has finished
         */
        void reap_finished();

        /**
         * @brief Number of sessions still validating; caller holds mutex_
         */
        [[nodiscard]] size_t pending_count() const;
    };

} // namespace mlink
