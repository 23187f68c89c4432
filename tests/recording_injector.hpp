#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

#include "mlink/input_injector.hpp"

namespace mlink {

// Records every injected action as a short string, e.g. "move(5,-3)".
class RecordingInjector : public InputInjector {
public:
  bool move_cursor(int32_t dx, int32_t dy) override {
    return record("move(" + std::to_string(dx) + "," + std::to_string(dy) + ")");
  }
  bool set_cursor_absolute(int32_t x, int32_t y) override {
    return record("abs(" + std::to_string(x) + "," + std::to_string(y) + ")");
  }
  bool click(MouseButton button, PressState state) override {
    return record("click(" + button_to_string(button) + "," + press_state_to_string(state) + ")");
  }
  bool scroll(int32_t dx, int32_t dy) override {
    return record("scroll(" + std::to_string(dx) + "," + std::to_string(dy) + ")");
  }
  bool key_event(const std::string& code, PressState state) override {
    return record("key(" + code + "," + press_state_to_string(state) + ")");
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }

  // Waits until at least n actions were recorded.
  bool wait_for(size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return calls_.size() >= n; });
  }

  std::atomic<bool> fail{false};

private:
  bool record(std::string call) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(std::move(call));
    }
    cv_.notify_all();
    return !fail;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> calls_;
};

} // namespace mlink
