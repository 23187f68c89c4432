/**
 * @file input_injector.hpp
 * @brief OS input-injection capability consumed by sessions
 * 
 * The session layer only talks to this interface. Concrete injectors:
 * - UinputInjector: Linux virtual devices through /dev/uinput
 * - LoggingInjector: prints actions, used for dry runs
 * 
 * Calls are synchronous and are expected to return quickly. A false
 * return means the OS refused the action; the caller logs it and carries
 * on.
 */

#pragma once

#include <cstdint>
#include <string>
#include <mutex>
#include <ostream>

#include "mlink/protocol.hpp"

namespace mlink {

    /**
     * @brief Interface for synthesizing pointer and keyboard input
     */
    class InputInjector {
    public:
        virtual ~InputInjector() = default;

        /**
         * @brief Moves the cursor by a relative offset in pixels
         */
        virtual bool move_cursor(int32_t dx, int32_t dy) = 0;

        /**
         * @brief Places the cursor at an absolute screen position
         */
        virtual bool set_cursor_absolute(int32_t x, int32_t y) = 0;

        /**
         * @brief Presses, releases or clicks a mouse button
         */
        virtual bool click(MouseButton button, PressState state) = 0;

        /**
         * @brief Scrolls the wheel; positive dy scrolls up, positive dx right
         */
        virtual bool scroll(int32_t dx, int32_t dy) = 0;

        /**
         * @brief Presses, releases or taps a named key
         * 
         * @param code Key name, e.g. "a", "enter", "ctrl", "f5"
         */
        virtual bool key_event(const std::string& code, PressState state) = 0;
    };

    /**
     * @brief Injector that only reports what it would do
     */
    class LoggingInjector : public InputInjector {
    public:
        explicit LoggingInjector(std::ostream& out);

        bool move_cursor(int32_t dx, int32_t dy) override;
        bool set_cursor_absolute(int32_t x, int32_t y) override;
        bool click(MouseButton button, PressState state) override;
        bool scroll(int32_t dx, int32_t dy) override;
        bool key_event(const std::string& code, PressState state) override;

    private:
        std::ostream& out_;
        std::mutex mutex_;
    };

} // namespace mlink
