/**
 * @file protocol.hpp
 * @brief Wire format between the mobile client and the input server
 * 
 * Every message travels in a frame:
 * 
 *   +----------------+---------------------------+
 *   | u16 length (BE)| length bytes of payload   |
 *   +----------------+---------------------------+
 * 
 * The first client frame on a connection carries the raw pairing token.
 * The server answers it with a pairing reply frame:
 * 
 *   [0x01, 0x80]  pairing accepted
 *   [0x01, 0x81]  pairing rejected (connection is closed afterwards)
 * 
 * Every later client frame carries one input event:
 * 
 *   u8 version (=1) | u8 tag | fields (big-endian)
 * 
 *   0x01 MOVE_RELATIVE   i16 dx, i16 dy
 *   0x02 MOVE_ABSOLUTE   i32 x,  i32 y
 *   0x03 CLICK           u8 button (1 left, 2 right, 3 middle), u8 state
 *   0x04 SCROLL          i16 dx, i16 dy (positive dy scrolls up)
 *   0x05 KEY             u8 state, u8 len, len bytes key name
 * 
 *   state: 0 release, 1 press, 2 click (press followed by release)
 * 
 * A payload whose version, tag, enum values or length do not match the
 * layout above is malformed. Since the length prefix is always honoured,
 * a malformed frame is skipped as a whole and the stream stays in sync.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace mlink {

    constexpr uint8_t PROTOCOL_VERSION = 1;
    constexpr size_t FRAME_HEADER_SIZE = 2;
    constexpr size_t MAX_FRAME_PAYLOAD = 0xFFFF;

    /**
     * @brief Payload tags for input events and server replies
     */
    enum class MessageTag : uint8_t {
        MOVE_RELATIVE = 0x01,
        MOVE_ABSOLUTE = 0x02,
        CLICK = 0x03,
        SCROLL = 0x04,
        KEY = 0x05,
        PAIRING_ACCEPTED = 0x80,
        PAIRING_REJECTED = 0x81
    };

    enum class MouseButton : uint8_t {
        LEFT = 1,
        RIGHT = 2,
        MIDDLE = 3
    };

    /**
     * @brief Press state shared by mouse buttons and keys
     */
    enum class PressState : uint8_t {
        RELEASE = 0,
        PRESS = 1,
        CLICK = 2
    };

    struct MoveRelative {
        int16_t dx = 0;
        int16_t dy = 0;
        bool operator==(const MoveRelative& o) const { return dx == o.dx && dy == o.dy; }
    };

    struct MoveAbsolute {
        int32_t x = 0;
        int32_t y = 0;
        bool operator==(const MoveAbsolute& o) const { return x == o.x && y == o.y; }
    };

    struct Click {
        MouseButton button = MouseButton::LEFT;
        PressState state = PressState::CLICK;
        bool operator==(const Click& o) const { return button == o.button && state == o.state; }
    };

    struct Scroll {
        int16_t dx = 0;
        int16_t dy = 0;
        bool operator==(const Scroll& o) const { return dx == o.dx && dy == o.dy; }
    };

    struct Key {
        std::string code;
        PressState state = PressState::CLICK;
        bool operator==(const Key& o) const { return code == o.code && state == o.state; }
    };

    /**
     * @brief One decoded input event. Built per frame, dispatched, dropped.
     */
    using InputEvent = std::variant<MoveRelative, MoveAbsolute, Click, Scroll, Key>;

    std::string button_to_string(MouseButton button);
    std::string press_state_to_string(PressState state);

    /**
     * @brief Human-readable form of an event, for logs
     */
    std::string describe_event(const InputEvent& event);

    /**
     * @brief Wraps a payload into a length-prefixed frame
     * 
     * @throws std::length_error if payload exceeds MAX_FRAME_PAYLOAD
     */
    std::string encode_frame(const std::string& payload);

    /**
     * @brief Reads the payload length from a 2-byte frame header
     */
    size_t decode_frame_length(const unsigned char header[FRAME_HEADER_SIZE]);

    /**
     * @brief Serializes an event into a payload (without frame header)
     * 
     * @throws std::length_error if a key code is longer than 255 bytes
     */
    std::string encode_event(const InputEvent& event);

    /**
     * @brief Parses an event payload
     * 
     * @param payload Frame payload (without header)
     * @param event Receives the decoded event on success
     * @param error Receives a description of the defect on failure
     * @return true if the payload is a well-formed event
     */
    bool decode_event(const std::string& payload, InputEvent& event, std::string& error);

    /**
     * @brief Builds the pairing reply payload sent after the token frame
     */
    std::string encode_pairing_reply(bool accepted);

    /**
     * @brief Parses a pairing reply payload
     * 
     * @return std::pair<bool, bool> (accepted, well-formed)
     */
    std::pair<bool, bool> decode_pairing_reply(const std::string& payload);

} // namespace mlink
