//
// Created by opencode on 18/10/2026.
//

#include "mlink/input_injector.hpp"

namespace mlink {

    LoggingInjector::LoggingInjector(std::ostream& out)
        : out_(out) {}

    bool LoggingInjector::move_cursor(int32_t dx, int32_t dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[Injector] move " << dx << "," << dy << std::endl;
        return true;
    }

    bool LoggingInjector::set_cursor_absolute(int32_t x, int32_t y) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[Injector] position " << x << "," << y << std::endl;
        return true;
    }

    bool LoggingInjector::click(MouseButton button, PressState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[Injector] " << button_to_string(button) << " button "
             << press_state_to_string(state) << std::endl;
        return true;
    }

    bool LoggingInjector::scroll(int32_t dx, int32_t dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[Injector] scroll " << dx << "," << dy << std::endl;
        return true;
    }

    bool LoggingInjector::key_event(const std::string& code, PressState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[Injector] key '" << code << "' " << press_state_to_string(state) << std::endl;
        return true;
    }

} // namespace mlink
