//
// Created by opencode on 18/10/2026.
//

#include "mlink/session.hpp"
#include "mlink/input_injector.hpp"
#include "mlink/token_issuer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <iostream>
#include <sys/socket.h>

namespace mlink {

    Session::Session(sockpp::tcp_socket socket, std::string peer, double sensitivity)
        : socket_(std::move(socket))
        , peer_(std::move(peer))
        , sensitivity_(sensitivity)
        , last_activity_(std::chrono::steady_clock::now().time_since_epoch().count()) {}

    bool Session::validate(const TokenIssuer& issuer, std::string& reason) {
        const auto deadline = std::chrono::steady_clock::now() + PAIRING_TIMEOUT;

        unsigned char header[FRAME_HEADER_SIZE];
        if (!read_until(reinterpret_cast<char*>(header), sizeof(header), deadline)) {
            reason = close_requested_ ? "server stopping" : "no token before timeout";
            return false;
        }

        size_t length = decode_frame_length(header);
        if (length == 0 || length > MAX_TOKEN_FRAME) {
            reason = "token frame of " + std::to_string(length) + " bytes";
            return false;
        }

        std::string token(length, '\0');
        if (!read_until(&token[0], length, deadline)) {
            reason = close_requested_ ? "server stopping" : "no token before timeout";
            return false;
        }

        if (!issuer.matches(token)) {
            reason = "token mismatch";
            return false;
        }

        // Active sessions block on reads until the peer or close() ends them
        if (!socket_.read_timeout(std::chrono::microseconds(0)).is_ok()) {
            reason = "could not clear read timeout";
            return false;
        }
        return true;
    }

    bool Session::send_pairing_reply(bool accepted) {
        auto result = socket_.write(encode_frame(encode_pairing_reply(accepted)));
        return result.is_ok();
    }

    bool Session::activate() {
        SessionState expected = SessionState::VALIDATING;
        if (!state_.compare_exchange_strong(expected, SessionState::ACTIVE)) {
            return false;
        }
        touch();
        return true;
    }

    std::string Session::run(InputInjector& injector, SessionObserver* observer) {
        int consecutive_failures = 0;
        std::string reason = "peer disconnected";

        while (state_ == SessionState::ACTIVE) {
            std::string payload;
            if (!read_frame(payload)) {
                if (close_requested_) {
                    reason = "closed by server";
                }
                break;
            }
            touch();

            InputEvent event;
            std::string error;
            if (!decode_event(payload, event, error)) {
                ++consecutive_failures;
                if (observer) {
                    observer->on_malformed_message(peer_, error);
                }
                if (consecutive_failures >= MAX_CONSECUTIVE_DECODE_FAILURES) {
                    reason = "too many malformed messages";
                    break;
                }
                continue;
            }
            consecutive_failures = 0;

            if (!dispatch(event, injector) && observer) {
                observer->on_injection_failed(peer_, describe_event(event));
            }
        }

        state_ = SessionState::CLOSED;
        socket_.shutdown(SHUT_RDWR);
        return reason;
    }

    void Session::close() {
        close_requested_ = true;
        state_ = SessionState::CLOSED;
        // shutdown() wakes a thread blocked in read; the fd itself is
        // released when the session is destroyed
        socket_.shutdown(SHUT_RDWR);
    }

    bool Session::dispatch(const InputEvent& event, InputInjector& injector) const {
        try {
            if (auto* move = std::get_if<MoveRelative>(&event)) {
                return injector.move_cursor(scale(move->dx), scale(move->dy));
            }
            if (auto* pos = std::get_if<MoveAbsolute>(&event)) {
                return injector.set_cursor_absolute(pos->x, pos->y);
            }
            if (auto* click = std::get_if<Click>(&event)) {
                return injector.click(click->button, click->state);
            }
            if (auto* scroll = std::get_if<Scroll>(&event)) {
                return injector.scroll(scroll->dx, scroll->dy);
            }
            if (auto* key = std::get_if<Key>(&event)) {
                return injector.key_event(key->code, key->state);
            }
        } catch (const std::exception& e) {
            std::cerr << "[Session " << peer_ << "] Injector threw: " << e.what() << std::endl;
        }
        return false;
    }

    std::chrono::milliseconds Session::idle_time() const {
        auto last = std::chrono::steady_clock::time_point(
            std::chrono::steady_clock::duration(last_activity_.load()));
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - last);
    }

    bool Session::read_frame(std::string& payload) {
        unsigned char header[FRAME_HEADER_SIZE];
        auto header_result = socket_.read_n(header, sizeof(header));
        if (!header_result.is_ok() || header_result.value() != sizeof(header)) {
            return false;
        }

        size_t length = decode_frame_length(header);
        payload.assign(length, '\0');
        if (length == 0) {
            return true;
        }

        auto body_result = socket_.read_n(&payload[0], length);
        return body_result.is_ok() && body_result.value() == length;
    }

    bool Session::read_until(char* buf, size_t n, std::chrono::steady_clock::time_point deadline) {
        size_t got = 0;
        while (got < n) {
            // SO_RCVTIMEO bounds a single recv, so re-arm it with what is left
            auto left = std::chrono::duration_cast<std::chrono::microseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return false;
            }
            if (!socket_.read_timeout(left).is_ok()) {
                return false;
            }

            auto result = socket_.read(buf + got, n - got);
            if (!result.is_ok() || result.value() == 0) {
                return false;
            }
            got += result.value();
        }
        return true;
    }

    void Session::touch() {
        last_activity_ = std::chrono::steady_clock::now().time_since_epoch().count();
    }

    int32_t Session::scale(int16_t delta) const {
        if (sensitivity_ == 1.0) {
            return delta;
        }
        double scaled = std::round(delta * sensitivity_);
        scaled = std::clamp(scaled,
                            static_cast<double>(std::numeric_limits<int32_t>::min()),
                            static_cast<double>(std::numeric_limits<int32_t>::max()));
        return static_cast<int32_t>(scaled);
    }

} // namespace mlink
