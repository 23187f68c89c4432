//
// Created by opencode on 18/10/2026.
//

#include "mlink/connection_listener.hpp"
#include "mlink/errors.hpp"
#include "mlink/input_injector.hpp"
#include "mlink/token_issuer.hpp"
#include <chrono>
#include <iostream>
#include <sockpp/inet_address.h>
#include <sys/socket.h>
#include <poll.h>

namespace mlink {

    ConnectionListener::ConnectionListener(const TokenIssuer& issuer,
                                           InputInjector& injector,
                                           SessionObserver* observer,
                                           double sensitivity)
        : issuer_(issuer)
        , injector_(injector)
        , observer_(observer)
        , sensitivity_(sensitivity) {}

    ConnectionListener::~ConnectionListener() {
        close();
    }

    uint16_t ConnectionListener::open(uint16_t port) {
        sockpp::inet_address addr(port);

        // SO_REUSEADDR only: a second server on the same port must fail to bind
        auto result = acceptor_.open(addr, 16, SO_REUSEADDR);
        if (!result.is_ok()) {
            throw ServerError(ErrorCode::BIND_FAILED,
                              "Failed to bind to port " + std::to_string(port) + ": " +
                              result.error_message());
        }

        port_ = sockpp::inet_address(acceptor_.address()).port();
        std::cout << "[Listener] Listening on 0.0.0.0:" << port_ << std::endl;
        return port_;
    }

    void ConnectionListener::start_accepting() {
        accept_thread_ = std::thread(&ConnectionListener::accept_loop, this);
    }

    void ConnectionListener::close() {
        if (closed_.exchange(true)) {
            return;
        }
        stopping_ = true;

        // shutdown() makes a blocked accept() return on Linux
        if (acceptor_.is_open()) {
            acceptor_.shutdown(SHUT_RDWR);
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& worker : workers_) {
                worker.session->close();
            }
            workers.swap(workers_);
        }

        // Workers take mutex_ in release(), so join without holding it
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_.reset();
        }

        if (acceptor_.is_open()) {
            acceptor_.close();
        }
        std::cout << "[Listener] Closed port " << port_ << std::endl;
    }

    std::shared_ptr<Session> ConnectionListener::active_session() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    size_t ConnectionListener::active_session_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return (active_ && active_->state() == SessionState::ACTIVE) ? 1 : 0;
    }

    void ConnectionListener::accept_loop() {
        while (!stopping_) {
            // Wake up periodically so finished workers are joined even
            // when no new connection arrives
            pollfd pfd{acceptor_.handle(), POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(REAP_INTERVAL.count()));
            if (stopping_) {
                break;
            }
            if (ready <= 0) {
                std::lock_guard<std::mutex> lock(mutex_);
                reap_finished();
                continue;
            }

            sockpp::inet_address peer_addr;
            auto client = acceptor_.accept(&peer_addr);

            if (!client.is_ok()) {
                if (stopping_) {
                    break;
                }
                std::cerr << "[Listener] Failed to accept client: " << client.error_message() << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }

            auto session = std::make_shared<Session>(client.release(), peer_addr.to_string(), sensitivity_);

            std::lock_guard<std::mutex> lock(mutex_);
            reap_finished();
            if (stopping_) {
                session->close();
                break;
            }
            if (pending_count() >= MAX_PENDING_PAIRINGS) {
                session->send_pairing_reply(false);
                session->close();
                std::cerr << "[Listener] Pairing rejected for " << session->peer()
                          << ": too many pending connections" << std::endl;
                if (observer_) {
                    observer_->on_pairing_rejected(session->peer(), "too many pending connections");
                }
                continue;
            }
            workers_.push_back(Worker{session, std::thread()});
            workers_.back().thread = std::thread(&ConnectionListener::handle_connection, this, session);
        }
    }

    void ConnectionListener::handle_connection(std::shared_ptr<Session> session) {
        std::string reason;
        if (!session->validate(issuer_, reason)) {
            session->send_pairing_reply(false);
            session->close();
            std::cerr << "[Listener] Pairing rejected for " << session->peer() << ": " << reason << std::endl;
            if (observer_) {
                observer_->on_pairing_rejected(session->peer(), reason);
            }
            return;
        }

        if (!promote(session)) {
            session->send_pairing_reply(false);
            session->close();
            std::cerr << "[Listener] Pairing rejected for " << session->peer()
                      << ": another controller is active" << std::endl;
            if (observer_) {
                observer_->on_pairing_rejected(session->peer(), "another controller is active");
            }
            return;
        }

        if (!session->send_pairing_reply(true)) {
            session->close();
            release(session);
            if (observer_) {
                observer_->on_session_closed(session->peer(), "failed to send pairing reply");
            }
            return;
        }

        std::cout << "[Listener] Controller connected: " << session->peer() << std::endl;
        if (observer_) {
            observer_->on_session_opened(session->peer());
        }

        std::string close_reason = session->run(injector_, observer_);
        release(session);

        std::cout << "[Listener] Controller disconnected: " << session->peer()
                  << " (" << close_reason << ")" << std::endl;
        if (observer_) {
            observer_->on_session_closed(session->peer(), close_reason);
        }
    }

    bool ConnectionListener::promote(const std::shared_ptr<Session>& session) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (active_ && active_->state() != SessionState::CLOSED) {
            return false;
        }
        if (!session->activate()) {
            return false;
        }
        active_ = session;
        return true;
    }

    void ConnectionListener::release(const std::shared_ptr<Session>& session) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ == session) {
            active_.reset();
        }
    }

    size_t ConnectionListener::pending_count() const {
        size_t pending = 0;
        for (const auto& worker : workers_) {
            if (worker.session->state() == SessionState::VALIDATING) {
                ++pending;
            }
        }
        return pending;
    }

    void ConnectionListener::reap_finished() {
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->session->state() == SessionState::CLOSED && it->session != active_) {
                if (it->thread.joinable()) {
                    it->thread.join();
                }
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

} // namespace mlink
