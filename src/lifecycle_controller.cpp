//
// Created by opencode on 18/10/2026.
//

#include "mlink/lifecycle_controller.hpp"
#include "mlink/connection_listener.hpp"
#include "mlink/errors.hpp"
#include "mlink/input_injector.hpp"
#include <iostream>

namespace mlink {

    LifecycleController::LifecycleController(InputInjector& injector,
                                             ControllerOptions options,
                                             SessionObserver* observer)
        : injector_(injector)
        , options_(std::move(options))
        , observer_(observer)
        , issuer_(options_.token_bytes, options_.advertise_host, options_.addresses) {}

    LifecycleController::~LifecycleController() {
        stop();
    }

    ConnectionDescriptor LifecycleController::start(uint16_t port) {
        std::lock_guard<std::mutex> lock(op_mutex_);
        return start_locked(port);
    }

    bool LifecycleController::stop() {
        std::lock_guard<std::mutex> lock(op_mutex_);
        return stop_locked();
    }

    ConnectionDescriptor LifecycleController::restart(uint16_t port) {
        std::lock_guard<std::mutex> lock(op_mutex_);
        stop_locked();
        return start_locked(port);
    }

    ServerStatus LifecycleController::snapshot() const {
        ServerStatus status;
        status.state = state_machine_.get_state();

        std::shared_ptr<ConnectionListener> listener;
        {
            std::lock_guard<std::mutex> lock(info_mutex_);
            listener = listener_;
            status.descriptor = descriptor_;
            if (listener) {
                status.uptime = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::steady_clock::now() - started_at_);
            }
        }

        if (listener) {
            auto session = listener->active_session();
            if (session && session->state() == SessionState::ACTIVE) {
                status.session_active = true;
                status.session_peer = session->peer();
                status.session_idle = session->idle_time();
            }
        }
        return status;
    }

    void LifecycleController::on_state_change(StateListener listener) {
        state_machine_.add_listener(std::move(listener));
    }

    ConnectionDescriptor LifecycleController::start_locked(uint16_t port) {
        ServerState current = state_machine_.get_state();
        if (current != ServerState::STOPPED) {
            throw ServerError(ErrorCode::ALREADY_RUNNING,
                              "Server is already running (state: " + state_to_string(current) + ")");
        }

        state_machine_.transition_to(ServerState::STARTING);

        auto listener = std::make_shared<ConnectionListener>(issuer_, injector_, observer_, options_.sensitivity);
        ConnectionDescriptor descriptor;
        try {
            uint16_t bound = listener->open(port);
            descriptor = issuer_.issue(bound);
        } catch (const std::exception& e) {
            std::cerr << "[Lifecycle] Start failed: " << e.what() << std::endl;
            listener->close();
            issuer_.revoke();
            state_machine_.transition_to(ServerState::STOPPED);
            throw;
        }

        listener->start_accepting();

        {
            std::lock_guard<std::mutex> lock(info_mutex_);
            listener_ = listener;
            descriptor_ = descriptor;
            started_at_ = std::chrono::steady_clock::now();
        }

        state_machine_.transition_to(ServerState::RUNNING);
        std::cout << "[Lifecycle] Server running on " << descriptor.host << ":" << descriptor.port << std::endl;
        return descriptor;
    }

    bool LifecycleController::stop_locked() {
        if (state_machine_.get_state() == ServerState::STOPPED) {
            return false;
        }

        state_machine_.transition_to(ServerState::STOPPING);

        // Revoke first so nothing validates while sessions are torn down
        issuer_.revoke();

        std::shared_ptr<ConnectionListener> listener;
        {
            std::lock_guard<std::mutex> lock(info_mutex_);
            listener = listener_;
        }
        if (listener) {
            listener->close();
        }

        {
            std::lock_guard<std::mutex> lock(info_mutex_);
            listener_.reset();
            descriptor_.reset();
        }

        state_machine_.transition_to(ServerState::STOPPED);
        std::cout << "[Lifecycle] Server stopped" << std::endl;
        return true;
    }

} // namespace mlink
