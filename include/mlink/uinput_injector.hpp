/**
 * @file uinput_injector.hpp
 * @brief Linux input injector backed by /dev/uinput
 * 
 * Creates two virtual devices:
 * - a relative pointer + keyboard (REL_X/REL_Y, wheels, buttons, keys)
 * - an absolute pointer scaled to the configured screen size
 * 
 * Two devices are needed because libinput classifies a device that
 * reports both REL and ABS axes as a tablet and ignores its relative
 * motion.
 * 
 * Requires write access to /dev/uinput (root or the input group).
 */

#pragma once

#include <string>
#include <mutex>

#include "mlink/input_injector.hpp"

namespace mlink {

    class UinputInjector : public InputInjector {
    public:
        /**
         * @brief Opens /dev/uinput and creates the virtual devices
         * 
         * @param screen_width Width used to scale absolute positions
         * @param screen_height Height used to scale absolute positions
         * @throws std::runtime_error if uinput is unavailable
         */
        UinputInjector(int screen_width, int screen_height);

        /**
         * @brief Destroys the virtual devices
         */
        ~UinputInjector() override;

        UinputInjector(const UinputInjector&) = delete;
        UinputInjector& operator=(const UinputInjector&) = delete;

        bool move_cursor(int32_t dx, int32_t dy) override;
        bool set_cursor_absolute(int32_t x, int32_t y) override;
        bool click(MouseButton button, PressState state) override;
        bool scroll(int32_t dx, int32_t dy) override;
        bool key_event(const std::string& code, PressState state) override;

        /**
         * @brief Maps a key name to an evdev key code
         * 
         * Names are case-insensitive: letters, digits, "enter", "space",
         * "backspace", "tab", "esc", modifiers, arrows, "f1".."f12",
         * punctuation and media keys.
         * 
         * @return int evdev KEY_* code, or -1 if the name is unknown
         */
        [[nodiscard]] static int key_code_for(const std::string& name);

    private:
        int rel_fd_ = -1;
        int abs_fd_ = -1;
        int screen_width_;
        int screen_height_;
        std::mutex mutex_;

        bool emit(int fd, uint16_t type, uint16_t code, int32_t value);
        bool sync(int fd);
        bool press_release(int code, PressState state);
    };

} // namespace mlink
