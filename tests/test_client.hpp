#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <sockpp/inet_address.h>
#include <sockpp/tcp_connector.h>

#include "mlink/protocol.hpp"

namespace mlink {

// Minimal mobile controller speaking the framed protocol over loopback.
class TestClient {
public:
  bool connect(uint16_t port) {
    return conn_.connect(sockpp::inet_address("127.0.0.1", port)).is_ok();
  }

  bool send_frame(const std::string& payload) {
    return conn_.write(encode_frame(payload)).is_ok();
  }

  // Writes bytes as-is, without a frame header.
  bool send_raw(const std::string& bytes) { return conn_.write(bytes).is_ok(); }

  bool send_event(const InputEvent& event) { return send_frame(encode_event(event)); }

  bool read_frame(std::string& payload,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    conn_.read_timeout(timeout);
    unsigned char header[FRAME_HEADER_SIZE];
    auto h = conn_.read_n(header, sizeof(header));
    if (!h.is_ok() || h.value() != sizeof(header)) return false;
    size_t len = decode_frame_length(header);
    payload.assign(len, '\0');
    if (len == 0) return true;
    auto b = conn_.read_n(&payload[0], len);
    return b.is_ok() && b.value() == len;
  }

  // Sends the token and reads the reply. Returns {accepted, got_reply}.
  std::pair<bool, bool> pair(const std::string& token,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    if (!send_frame(token)) return {false, false};
    return await_reply(timeout);
  }

  std::pair<bool, bool> await_reply(std::chrono::milliseconds timeout) {
    std::string reply;
    if (!read_frame(reply, timeout)) return {false, false};
    return decode_pairing_reply(reply);
  }

  // True once the server has closed its side of the connection.
  bool wait_closed(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    conn_.read_timeout(timeout);
    char buf[64];
    for (;;) {
      auto r = conn_.read(buf, sizeof(buf));
      if (!r.is_ok()) {
        // a timeout means the connection is still open
        return r.error() != std::errc::resource_unavailable_try_again &&
               r.error() != std::errc::operation_would_block &&
               r.error() != std::errc::timed_out;
      }
      if (r.value() == 0) return true;
    }
  }

  void close() { conn_.close(); }

private:
  sockpp::tcp_connector conn_;
};

} // namespace mlink
