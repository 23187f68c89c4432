/**
 * @file control_server.hpp
 * @brief Localhost TCP server for the control protocol
 * 
 * This header provides a TCP server that:
 * - Listens on 127.0.0.1:<control_port> (default 23890)
 * - Accepts control clients (CLI, tray helper)
 * - Reads one command per line (CMD:ARGS\n format)
 * - Dispatches to a handler callback
 * - Returns one JSON line per command
 * 
 * Each client runs on its own thread. Threads are tracked and joined on
 * stop(), and client reads time out so a silent client cannot hold
 * shutdown up.
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <atomic>
#include <list>
#include <mutex>
#include <thread>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_socket.h>
#include <nlohmann/json.hpp>

#include "mlink/config_manager.hpp"

namespace mlink {

    /**
     * @brief Longest accepted command line
     */
    constexpr size_t MAX_CONTROL_LINE = 4096;

    /**
     * @brief TCP server for the control protocol
     * 
     * Usage:
     *   ControlServer server(handler, 23890);
     *   server.start();  // Blocks until stop()
     */
    class ControlServer {
    public:
        /**
         * @param command_handler Receives each command line, returns the JSON response
         * @param port Port on 127.0.0.1, 0 for ephemeral
         */
        ControlServer(std::function<nlohmann::json(const std::string&)> command_handler,
                      uint16_t port = DEFAULT_CONTROL_PORT);

        /**
         * @brief Destructor
         * 
         * Stops the server and joins client threads.
         */
        ~ControlServer();

        /**
         * @brief Binds the control port
         * 
         * @throws std::runtime_error if socket binding fails
         */
        void open();

        /**
         * @brief Accepts control clients until stop() is called
         */
        void serve();

        /**
         * @brief open() followed by serve()
         * 
         * @throws std::runtime_error if socket binding fails
         */
        void start();

        /**
         * @brief Stops accepting and joins client threads
         * 
         * Idempotent. Must not be called from a client thread.
         */
        void stop();

        /**
         * @brief Makes serve() return without joining anything
         * 
         * Only flips the running flag and shuts the listening socket down,
         * so it can be called from a signal handler. Call stop() afterwards.
         */
        void interrupt();

        /**
         * @brief Gets the bound port (valid after open())
         */
        [[nodiscard]] uint16_t get_port() const { return port_; }

    private:
        struct ClientThread {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        uint16_t port_;
        std::unique_ptr<sockpp::tcp_acceptor> acceptor_;
        std::function<nlohmann::json(const std::string&)> on_recv_;
        std::atomic<bool> running_{false};

        std::mutex clients_mutex_;
        std::list<ClientThread> clients_;

        /**
         * @brief Serves one control connection until it closes
         */
        void process_client(sockpp::tcp_socket client, std::shared_ptr<std::atomic<bool>> done);

        /**
         * @brief Extracts the first complete line from a buffer
         * 
         * @param buffer Accumulated bytes; the line is removed on success
         * @return std::pair<std::string, bool> (line including '\n', found)
         */
        static std::pair<std::string, bool> take_line(std::string& buffer);

        void reap_clients();
    };

} // namespace mlink
