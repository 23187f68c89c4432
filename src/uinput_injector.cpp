//
// Created by opencode on 18/10/2026.
//

#include "mlink/uinput_injector.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <unordered_map>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/input.h>
#include <linux/uinput.h>

namespace mlink {

    namespace {

        constexpr uint16_t VENDOR_ID = 0x1d6b;
        constexpr uint16_t PRODUCT_ID = 0x4d4c;

        const std::unordered_map<std::string, int>& key_table() {
            static const std::unordered_map<std::string, int> table = {
                {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E},
                {"f", KEY_F}, {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J},
                {"k", KEY_K}, {"l", KEY_L}, {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O},
                {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R}, {"s", KEY_S}, {"t", KEY_T},
                {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X}, {"y", KEY_Y},
                {"z", KEY_Z},
                {"0", KEY_0}, {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4},
                {"5", KEY_5}, {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9},
                {"enter", KEY_ENTER}, {"return", KEY_ENTER}, {"space", KEY_SPACE},
                {"backspace", KEY_BACKSPACE}, {"tab", KEY_TAB}, {"esc", KEY_ESC},
                {"escape", KEY_ESC}, {"delete", KEY_DELETE}, {"insert", KEY_INSERT},
                {"home", KEY_HOME}, {"end", KEY_END}, {"pageup", KEY_PAGEUP},
                {"pagedown", KEY_PAGEDOWN}, {"capslock", KEY_CAPSLOCK},
                {"up", KEY_UP}, {"down", KEY_DOWN}, {"left", KEY_LEFT}, {"right", KEY_RIGHT},
                {"shift", KEY_LEFTSHIFT}, {"rshift", KEY_RIGHTSHIFT},
                {"ctrl", KEY_LEFTCTRL}, {"rctrl", KEY_RIGHTCTRL},
                {"alt", KEY_LEFTALT}, {"altgr", KEY_RIGHTALT},
                {"super", KEY_LEFTMETA}, {"meta", KEY_LEFTMETA},
                {"f1", KEY_F1}, {"f2", KEY_F2}, {"f3", KEY_F3}, {"f4", KEY_F4},
                {"f5", KEY_F5}, {"f6", KEY_F6}, {"f7", KEY_F7}, {"f8", KEY_F8},
                {"f9", KEY_F9}, {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
                {"minus", KEY_MINUS}, {"-", KEY_MINUS}, {"equal", KEY_EQUAL}, {"=", KEY_EQUAL},
                {"comma", KEY_COMMA}, {",", KEY_COMMA}, {"dot", KEY_DOT}, {".", KEY_DOT},
                {"slash", KEY_SLASH}, {"/", KEY_SLASH}, {"semicolon", KEY_SEMICOLON},
                {";", KEY_SEMICOLON}, {"apostrophe", KEY_APOSTROPHE}, {"'", KEY_APOSTROPHE},
                {"grave", KEY_GRAVE}, {"`", KEY_GRAVE}, {"backslash", KEY_BACKSLASH},
                {"\\", KEY_BACKSLASH}, {"leftbrace", KEY_LEFTBRACE}, {"[", KEY_LEFTBRACE},
                {"rightbrace", KEY_RIGHTBRACE}, {"]", KEY_RIGHTBRACE},
                {"volumeup", KEY_VOLUMEUP}, {"volumedown", KEY_VOLUMEDOWN},
                {"mute", KEY_MUTE}, {"playpause", KEY_PLAYPAUSE},
                {"nextsong", KEY_NEXTSONG}, {"previoussong", KEY_PREVIOUSSONG}
            };
            return table;
        }

        void require_ioctl(int fd, unsigned long request, int value, const char* what) {
            if (ioctl(fd, request, value) < 0) {
                throw std::runtime_error(std::string("uinput ioctl failed: ") + what +
                                         ": " + std::strerror(errno));
            }
        }

        int create_device(uinput_user_dev& uidev, int fd) {
            if (write(fd, &uidev, sizeof(uidev)) < 0) {
                throw std::runtime_error(std::string("Failed to write uinput device: ") + std::strerror(errno));
            }
            if (ioctl(fd, UI_DEV_CREATE) < 0) {
                throw std::runtime_error(std::string("UI_DEV_CREATE failed: ") + std::strerror(errno));
            }
            return fd;
        }

        int open_uinput() {
            int fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
            if (fd < 0) {
                throw std::runtime_error(std::string("Failed to open /dev/uinput: ") + std::strerror(errno));
            }
            return fd;
        }

        void destroy_device(int fd) {
            if (fd >= 0) {
                ioctl(fd, UI_DEV_DESTROY);
                close(fd);
            }
        }

        int button_code(MouseButton button) {
            switch (button) {
                case MouseButton::RIGHT:  return BTN_RIGHT;
                case MouseButton::MIDDLE: return BTN_MIDDLE;
                case MouseButton::LEFT:
                default:                  return BTN_LEFT;
            }
        }

    } // namespace

    UinputInjector::UinputInjector(int screen_width, int screen_height)
        : screen_width_(std::max(1, screen_width))
        , screen_height_(std::max(1, screen_height)) {
        rel_fd_ = open_uinput();
        try {
            require_ioctl(rel_fd_, UI_SET_EVBIT, EV_KEY, "EV_KEY");
            require_ioctl(rel_fd_, UI_SET_KEYBIT, BTN_LEFT, "BTN_LEFT");
            require_ioctl(rel_fd_, UI_SET_KEYBIT, BTN_RIGHT, "BTN_RIGHT");
            require_ioctl(rel_fd_, UI_SET_KEYBIT, BTN_MIDDLE, "BTN_MIDDLE");
            for (const auto& entry : key_table()) {
                require_ioctl(rel_fd_, UI_SET_KEYBIT, entry.second, "KEYBIT");
            }
            require_ioctl(rel_fd_, UI_SET_EVBIT, EV_REL, "EV_REL");
            require_ioctl(rel_fd_, UI_SET_RELBIT, REL_X, "REL_X");
            require_ioctl(rel_fd_, UI_SET_RELBIT, REL_Y, "REL_Y");
            require_ioctl(rel_fd_, UI_SET_RELBIT, REL_WHEEL, "REL_WHEEL");
            require_ioctl(rel_fd_, UI_SET_RELBIT, REL_HWHEEL, "REL_HWHEEL");

            uinput_user_dev rel_dev{};
            std::snprintf(rel_dev.name, UINPUT_MAX_NAME_SIZE, "MouseLink Virtual Pointer");
            rel_dev.id.bustype = BUS_VIRTUAL;
            rel_dev.id.vendor = VENDOR_ID;
            rel_dev.id.product = PRODUCT_ID;
            rel_dev.id.version = 1;
            create_device(rel_dev, rel_fd_);

            abs_fd_ = open_uinput();
            require_ioctl(abs_fd_, UI_SET_EVBIT, EV_KEY, "EV_KEY");
            require_ioctl(abs_fd_, UI_SET_KEYBIT, BTN_LEFT, "BTN_LEFT");
            require_ioctl(abs_fd_, UI_SET_EVBIT, EV_ABS, "EV_ABS");
            require_ioctl(abs_fd_, UI_SET_ABSBIT, ABS_X, "ABS_X");
            require_ioctl(abs_fd_, UI_SET_ABSBIT, ABS_Y, "ABS_Y");

            uinput_user_dev abs_dev{};
            std::snprintf(abs_dev.name, UINPUT_MAX_NAME_SIZE, "MouseLink Virtual Tablet");
            abs_dev.id.bustype = BUS_VIRTUAL;
            abs_dev.id.vendor = VENDOR_ID;
            abs_dev.id.product = PRODUCT_ID + 1;
            abs_dev.id.version = 1;
            abs_dev.absmin[ABS_X] = 0;
            abs_dev.absmax[ABS_X] = screen_width_ - 1;
            abs_dev.absmin[ABS_Y] = 0;
            abs_dev.absmax[ABS_Y] = screen_height_ - 1;
            create_device(abs_dev, abs_fd_);
        } catch (...) {
            destroy_device(abs_fd_);
            destroy_device(rel_fd_);
            throw;
        }
    }

    UinputInjector::~UinputInjector() {
        destroy_device(abs_fd_);
        destroy_device(rel_fd_);
    }

    bool UinputInjector::emit(int fd, uint16_t type, uint16_t code, int32_t value) {
        input_event ev{};
        ev.type = type;
        ev.code = code;
        ev.value = value;
        return write(fd, &ev, sizeof(ev)) == static_cast<ssize_t>(sizeof(ev));
    }

    bool UinputInjector::sync(int fd) {
        return emit(fd, EV_SYN, SYN_REPORT, 0);
    }

    bool UinputInjector::press_release(int code, PressState state) {
        bool ok = true;
        if (state == PressState::PRESS || state == PressState::CLICK) {
            ok = emit(rel_fd_, EV_KEY, static_cast<uint16_t>(code), 1) && sync(rel_fd_);
        }
        if (ok && (state == PressState::RELEASE || state == PressState::CLICK)) {
            ok = emit(rel_fd_, EV_KEY, static_cast<uint16_t>(code), 0) && sync(rel_fd_);
        }
        return ok;
    }

    bool UinputInjector::move_cursor(int32_t dx, int32_t dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        return emit(rel_fd_, EV_REL, REL_X, dx) &&
               emit(rel_fd_, EV_REL, REL_Y, dy) &&
               sync(rel_fd_);
    }

    bool UinputInjector::set_cursor_absolute(int32_t x, int32_t y) {
        std::lock_guard<std::mutex> lock(mutex_);
        x = std::clamp(x, 0, screen_width_ - 1);
        y = std::clamp(y, 0, screen_height_ - 1);
        return emit(abs_fd_, EV_ABS, ABS_X, x) &&
               emit(abs_fd_, EV_ABS, ABS_Y, y) &&
               sync(abs_fd_);
    }

    bool UinputInjector::click(MouseButton button, PressState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        return press_release(button_code(button), state);
    }

    bool UinputInjector::scroll(int32_t dx, int32_t dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool ok = true;
        if (dy != 0) {
            ok = emit(rel_fd_, EV_REL, REL_WHEEL, dy);
        }
        if (ok && dx != 0) {
            ok = emit(rel_fd_, EV_REL, REL_HWHEEL, dx);
        }
        return ok && sync(rel_fd_);
    }

    bool UinputInjector::key_event(const std::string& code, PressState state) {
        int key = key_code_for(code);
        if (key < 0) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return press_release(key, state);
    }

    int UinputInjector::key_code_for(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = key_table().find(lower);
        if (it == key_table().end()) {
            return -1;
        }
        return it->second;
    }

} // namespace mlink
