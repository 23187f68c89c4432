//
// Created by opencode on 18/10/2026.
//

#include "mlink/protocol.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mlink {

    namespace {

        void put_u8(std::string& out, uint8_t v) {
            out.push_back(static_cast<char>(v));
        }

        void put_u16(std::string& out, uint16_t v) {
            out.push_back(static_cast<char>((v >> 8) & 0xFF));
            out.push_back(static_cast<char>(v & 0xFF));
        }

        void put_u32(std::string& out, uint32_t v) {
            out.push_back(static_cast<char>((v >> 24) & 0xFF));
            out.push_back(static_cast<char>((v >> 16) & 0xFF));
            out.push_back(static_cast<char>((v >> 8) & 0xFF));
            out.push_back(static_cast<char>(v & 0xFF));
        }

        uint8_t get_u8(const std::string& in, size_t pos) {
            return static_cast<uint8_t>(in[pos]);
        }

        uint16_t get_u16(const std::string& in, size_t pos) {
            return static_cast<uint16_t>((get_u8(in, pos) << 8) | get_u8(in, pos + 1));
        }

        uint32_t get_u32(const std::string& in, size_t pos) {
            return (static_cast<uint32_t>(get_u8(in, pos)) << 24)
                 | (static_cast<uint32_t>(get_u8(in, pos + 1)) << 16)
                 | (static_cast<uint32_t>(get_u8(in, pos + 2)) << 8)
                 | static_cast<uint32_t>(get_u8(in, pos + 3));
        }

        bool valid_button(uint8_t v) {
            return v >= static_cast<uint8_t>(MouseButton::LEFT) &&
                   v <= static_cast<uint8_t>(MouseButton::MIDDLE);
        }

        bool valid_state(uint8_t v) {
            return v <= static_cast<uint8_t>(PressState::CLICK);
        }

        // Overload set for std::visit
        template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    } // namespace

    std::string button_to_string(MouseButton button) {
        switch (button) {
            case MouseButton::LEFT:   return "left";
            case MouseButton::RIGHT:  return "right";
            case MouseButton::MIDDLE: return "middle";
            default:                  return "unknown";
        }
    }

    std::string press_state_to_string(PressState state) {
        switch (state) {
            case PressState::RELEASE: return "release";
            case PressState::PRESS:   return "press";
            case PressState::CLICK:   return "click";
            default:                  return "unknown";
        }
    }

    std::string describe_event(const InputEvent& event) {
        std::ostringstream ss;
        std::visit(overloaded {
            [&ss](const MoveRelative& e) { ss << "move_relative(" << e.dx << "," << e.dy << ")"; },
            [&ss](const MoveAbsolute& e) { ss << "move_absolute(" << e.x << "," << e.y << ")"; },
            [&ss](const Click& e) {
                ss << "click(" << button_to_string(e.button) << "," << press_state_to_string(e.state) << ")";
            },
            [&ss](const Scroll& e) { ss << "scroll(" << e.dx << "," << e.dy << ")"; },
            [&ss](const Key& e) { ss << "key(\"" << e.code << "\"," << press_state_to_string(e.state) << ")"; }
        }, event);
        return ss.str();
    }

    std::string encode_frame(const std::string& payload) {
        if (payload.size() > MAX_FRAME_PAYLOAD) {
            throw std::length_error("Frame payload too large: " + std::to_string(payload.size()));
        }
        std::string frame;
        frame.reserve(FRAME_HEADER_SIZE + payload.size());
        put_u16(frame, static_cast<uint16_t>(payload.size()));
        frame += payload;
        return frame;
    }

    size_t decode_frame_length(const unsigned char header[FRAME_HEADER_SIZE]) {
        return (static_cast<size_t>(header[0]) << 8) | static_cast<size_t>(header[1]);
    }

    std::string encode_event(const InputEvent& event) {
        std::string out;
        put_u8(out, PROTOCOL_VERSION);

        std::visit(overloaded {
            [&out](const MoveRelative& e) {
                put_u8(out, static_cast<uint8_t>(MessageTag::MOVE_RELATIVE));
                put_u16(out, static_cast<uint16_t>(e.dx));
                put_u16(out, static_cast<uint16_t>(e.dy));
            },
            [&out](const MoveAbsolute& e) {
                put_u8(out, static_cast<uint8_t>(MessageTag::MOVE_ABSOLUTE));
                put_u32(out, static_cast<uint32_t>(e.x));
                put_u32(out, static_cast<uint32_t>(e.y));
            },
            [&out](const Click& e) {
                put_u8(out, static_cast<uint8_t>(MessageTag::CLICK));
                put_u8(out, static_cast<uint8_t>(e.button));
                put_u8(out, static_cast<uint8_t>(e.state));
            },
            [&out](const Scroll& e) {
                put_u8(out, static_cast<uint8_t>(MessageTag::SCROLL));
                put_u16(out, static_cast<uint16_t>(e.dx));
                put_u16(out, static_cast<uint16_t>(e.dy));
            },
            [&out](const Key& e) {
                if (e.code.size() > 0xFF) {
                    throw std::length_error("Key code too long: " + std::to_string(e.code.size()));
                }
                put_u8(out, static_cast<uint8_t>(MessageTag::KEY));
                put_u8(out, static_cast<uint8_t>(e.state));
                put_u8(out, static_cast<uint8_t>(e.code.size()));
                out += e.code;
            }
        }, event);

        return out;
    }

    bool decode_event(const std::string& payload, InputEvent& event, std::string& error) {
        if (payload.size() < 2) {
            error = "payload too short (" + std::to_string(payload.size()) + " bytes)";
            return false;
        }

        uint8_t version = get_u8(payload, 0);
        if (version != PROTOCOL_VERSION) {
            error = "unsupported protocol version " + std::to_string(version);
            return false;
        }

        uint8_t tag = get_u8(payload, 1);
        const size_t body = payload.size() - 2;

        auto expect_size = [&](size_t wanted, const char* name) {
            if (body != wanted) {
                error = std::string(name) + " expects " + std::to_string(wanted) +
                        " bytes, got " + std::to_string(body);
                return false;
            }
            return true;
        };

        switch (static_cast<MessageTag>(tag)) {
            case MessageTag::MOVE_RELATIVE: {
                if (!expect_size(4, "move_relative")) return false;
                event = MoveRelative{static_cast<int16_t>(get_u16(payload, 2)),
                                     static_cast<int16_t>(get_u16(payload, 4))};
                return true;
            }
            case MessageTag::MOVE_ABSOLUTE: {
                if (!expect_size(8, "move_absolute")) return false;
                event = MoveAbsolute{static_cast<int32_t>(get_u32(payload, 2)),
                                     static_cast<int32_t>(get_u32(payload, 6))};
                return true;
            }
            case MessageTag::CLICK: {
                if (!expect_size(2, "click")) return false;
                uint8_t button = get_u8(payload, 2);
                uint8_t state = get_u8(payload, 3);
                if (!valid_button(button)) {
                    error = "unknown mouse button " + std::to_string(button);
                    return false;
                }
                if (!valid_state(state)) {
                    error = "unknown press state " + std::to_string(state);
                    return false;
                }
                event = Click{static_cast<MouseButton>(button), static_cast<PressState>(state)};
                return true;
            }
            case MessageTag::SCROLL: {
                if (!expect_size(4, "scroll")) return false;
                event = Scroll{static_cast<int16_t>(get_u16(payload, 2)),
                               static_cast<int16_t>(get_u16(payload, 4))};
                return true;
            }
            case MessageTag::KEY: {
                if (body < 2) {
                    error = "key payload truncated";
                    return false;
                }
                uint8_t state = get_u8(payload, 2);
                size_t len = get_u8(payload, 3);
                if (!expect_size(2 + len, "key")) return false;
                if (!valid_state(state)) {
                    error = "unknown press state " + std::to_string(state);
                    return false;
                }
                event = Key{payload.substr(4, len), static_cast<PressState>(state)};
                return true;
            }
            default:
                error = "unknown tag " + std::to_string(tag);
                return false;
        }
    }

    std::string encode_pairing_reply(bool accepted) {
        std::string out;
        put_u8(out, PROTOCOL_VERSION);
        put_u8(out, static_cast<uint8_t>(accepted ? MessageTag::PAIRING_ACCEPTED
                                                  : MessageTag::PAIRING_REJECTED));
        return out;
    }

    std::pair<bool, bool> decode_pairing_reply(const std::string& payload) {
        if (payload.size() != 2 || get_u8(payload, 0) != PROTOCOL_VERSION) {
            return {false, false};
        }
        auto tag = static_cast<MessageTag>(get_u8(payload, 1));
        if (tag == MessageTag::PAIRING_ACCEPTED) {
            return {true, true};
        }
        if (tag == MessageTag::PAIRING_REJECTED) {
            return {false, true};
        }
        return {false, false};
    }

} // namespace mlink
