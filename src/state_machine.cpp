//
// Created by opencode on 18/10/2026.
//

#include "mlink/state_machine.hpp"

namespace mlink {

    bool StateMachine::is_valid_transition(ServerState from, ServerState to) {
        switch (from) {
            case ServerState::STOPPED:
                return to == ServerState::STARTING;
                
            case ServerState::STARTING:
                // RUNNING on success, STOPPED when the bind fails
                return to == ServerState::RUNNING || to == ServerState::STOPPED;
                
            case ServerState::RUNNING:
                return to == ServerState::STOPPING;
                
            case ServerState::STOPPING:
                return to == ServerState::STOPPED;
                
            default:
                return false;
        }
    }

    bool StateMachine::transition_to(ServerState new_state) {
        ServerState current;
        std::vector<StateListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            
            current = current_state_.load();
            
            if (!is_valid_transition(current, new_state)) {
                return false;
            }
            
            current_state_.store(new_state);
            listeners = listeners_;
        }

        for (const auto& listener : listeners) {
            listener(current, new_state);
        }
        return true;
    }

    void StateMachine::add_listener(StateListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

} // namespace mlink
