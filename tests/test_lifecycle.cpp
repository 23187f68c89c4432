#include "doctest/doctest.h"
#include "mlink/connection_listener.hpp"
#include "mlink/errors.hpp"
#include "mlink/lifecycle_controller.hpp"
#include "mlink/session.hpp"
#include "recording_injector.hpp"
#include "test_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <sockpp/tcp_acceptor.h>

using namespace mlink;
using namespace std::chrono_literals;

namespace {

ControllerOptions loopback_options() {
  ControllerOptions options;
  options.advertise_host = "127.0.0.1";
  return options;
}

// Polls until pred() holds or the timeout passes.
template <class Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return pred();
}

struct CountingObserver : SessionObserver {
  std::atomic<int> rejected{0};
  std::atomic<int> opened{0};
  std::atomic<int> closed{0};
  std::atomic<int> malformed{0};
  std::mutex mutex;
  std::string last_close_reason;

  void on_pairing_rejected(const std::string&, const std::string&) override { ++rejected; }
  void on_session_opened(const std::string&) override { ++opened; }
  void on_session_closed(const std::string&, const std::string& reason) override {
    std::lock_guard<std::mutex> lock(mutex);
    last_close_reason = reason;
    ++closed;
  }
  void on_malformed_message(const std::string&, const std::string&) override { ++malformed; }
};

} // namespace

DOCTEST_TEST_CASE("start issues a descriptor for the bound port and reports transitions") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());

  std::vector<std::string> transitions;
  std::mutex m;
  controller.on_state_change([&](ServerState from, ServerState to) {
    std::lock_guard<std::mutex> lock(m);
    transitions.push_back(state_to_string(from) + ">" + state_to_string(to));
  });

  ConnectionDescriptor d = controller.start(0);
  DOCTEST_CHECK_NE(d.port, 0);
  DOCTEST_CHECK_EQ(d.host, "127.0.0.1");
  DOCTEST_CHECK_EQ(d.token.size(), 22u);
  DOCTEST_CHECK(controller.status() == ServerState::RUNNING);

  ServerStatus st = controller.snapshot();
  DOCTEST_REQUIRE(st.descriptor.has_value());
  DOCTEST_CHECK(*st.descriptor == d);
  DOCTEST_CHECK_FALSE(st.session_active);

  DOCTEST_CHECK(controller.stop());
  DOCTEST_CHECK(controller.status() == ServerState::STOPPED);
  DOCTEST_CHECK_FALSE(controller.snapshot().descriptor.has_value());

  std::vector<std::string> expected = {
    "STOPPED>STARTING", "STARTING>RUNNING", "RUNNING>STOPPING", "STOPPING>STOPPED"};
  std::lock_guard<std::mutex> lock(m);
  DOCTEST_CHECK(transitions == expected);
}

DOCTEST_TEST_CASE("paired controller drives the injector") {
  RecordingInjector injector;
  CountingObserver observer;
  LifecycleController controller(injector, loopback_options(), &observer);
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  auto reply = client.pair(d.token);
  DOCTEST_REQUIRE(reply.second);
  DOCTEST_REQUIRE(reply.first);

  DOCTEST_CHECK(eventually([&] { return controller.snapshot().session_active; }));
  DOCTEST_CHECK_EQ(observer.opened.load(), 1);

  DOCTEST_REQUIRE(client.send_event(MoveRelative{5, -3}));
  DOCTEST_REQUIRE(injector.wait_for(1));
  std::this_thread::sleep_for(100ms);
  DOCTEST_CHECK(injector.calls() == std::vector<std::string>{"move(5,-3)"});

  DOCTEST_REQUIRE(client.send_event(Click{MouseButton::RIGHT, PressState::CLICK}));
  DOCTEST_REQUIRE(client.send_event(Scroll{0, -2}));
  DOCTEST_REQUIRE(client.send_event(Key{"enter", PressState::PRESS}));
  DOCTEST_REQUIRE(client.send_event(MoveAbsolute{100, 200}));
  DOCTEST_REQUIRE(injector.wait_for(5));
  std::vector<std::string> expected = {
    "move(5,-3)", "click(right,click)", "scroll(0,-2)", "key(enter,press)", "abs(100,200)"};
  DOCTEST_CHECK(injector.calls() == expected);

  client.close();
  DOCTEST_CHECK(eventually([&] { return !controller.snapshot().session_active; }));
  DOCTEST_CHECK(eventually([&] { return observer.closed.load() == 1; }));
  controller.stop();
}

DOCTEST_TEST_CASE("relative moves are scaled by sensitivity") {
  RecordingInjector injector;
  ControllerOptions options = loopback_options();
  options.sensitivity = 2.0;
  LifecycleController controller(injector, options);
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  DOCTEST_REQUIRE(client.pair(d.token).first);
  DOCTEST_REQUIRE(client.send_event(MoveRelative{5, -3}));
  DOCTEST_REQUIRE(injector.wait_for(1));
  DOCTEST_CHECK_EQ(injector.calls()[0], "move(10,-6)");
  controller.stop();
}

DOCTEST_TEST_CASE("wrong token is rejected and closed") {
  RecordingInjector injector;
  CountingObserver observer;
  LifecycleController controller(injector, loopback_options(), &observer);
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  auto reply = client.pair(d.token + "nope");
  DOCTEST_CHECK(reply.second);
  DOCTEST_CHECK_FALSE(reply.first);
  DOCTEST_CHECK(client.wait_closed());
  DOCTEST_CHECK_FALSE(controller.snapshot().session_active);
  DOCTEST_CHECK(eventually([&] { return observer.rejected.load() == 1; }));

  // listener keeps accepting
  TestClient good;
  DOCTEST_REQUIRE(good.connect(d.port));
  DOCTEST_CHECK(good.pair(d.token).first);
  controller.stop();
}

DOCTEST_TEST_CASE("silent client is dropped after the pairing timeout") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  auto begin = std::chrono::steady_clock::now();
  auto reply = client.await_reply(PAIRING_TIMEOUT + 3s);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  DOCTEST_CHECK(reply.second);
  DOCTEST_CHECK_FALSE(reply.first);
  DOCTEST_CHECK(elapsed >= PAIRING_TIMEOUT - 500ms);
  DOCTEST_CHECK(client.wait_closed());
  DOCTEST_CHECK_FALSE(controller.snapshot().session_active);
  controller.stop();
}

DOCTEST_TEST_CASE("concurrent pairing yields exactly one active controller") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ConnectionDescriptor d = controller.start(0);

  const int n = 8;
  std::vector<std::unique_ptr<TestClient>> clients;
  for (int i = 0; i < n; ++i) {
    clients.push_back(std::make_unique<TestClient>());
    DOCTEST_REQUIRE(clients.back()->connect(d.port));
  }

  std::atomic<int> accepted{0};
  std::atomic<int> replied{0};
  std::vector<std::thread> threads;
  for (auto& c : clients) {
    threads.emplace_back([&, client = c.get()] {
      auto reply = client->pair(d.token);
      if (reply.second) ++replied;
      if (reply.first) ++accepted;
    });
  }
  for (auto& t : threads) t.join();

  DOCTEST_CHECK_EQ(replied.load(), n);
  DOCTEST_CHECK_EQ(accepted.load(), 1);
  DOCTEST_CHECK(controller.snapshot().session_active);
  controller.stop();
}

DOCTEST_TEST_CASE("second controller is turned away while one is active") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ConnectionDescriptor d = controller.start(0);

  TestClient first;
  DOCTEST_REQUIRE(first.connect(d.port));
  DOCTEST_REQUIRE(first.pair(d.token).first);

  TestClient second;
  DOCTEST_REQUIRE(second.connect(d.port));
  DOCTEST_CHECK_FALSE(second.pair(d.token).first);

  // once the first leaves, the slot is free again
  first.close();
  DOCTEST_REQUIRE(eventually([&] { return !controller.snapshot().session_active; }));
  TestClient third;
  DOCTEST_REQUIRE(third.connect(d.port));
  DOCTEST_CHECK(third.pair(d.token).first);
  controller.stop();
}

DOCTEST_TEST_CASE("start while running fails with ALREADY_RUNNING and changes nothing") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  DOCTEST_REQUIRE(client.pair(d.token).first);

  try {
    controller.start(0);
    DOCTEST_FAIL("expected ServerError");
  } catch (const ServerError& e) {
    DOCTEST_CHECK(e.code() == ErrorCode::ALREADY_RUNNING);
  }

  DOCTEST_CHECK(controller.status() == ServerState::RUNNING);
  DOCTEST_CHECK(*controller.snapshot().descriptor == d);
  DOCTEST_REQUIRE(client.send_event(MoveRelative{1, 1}));
  DOCTEST_CHECK(injector.wait_for(1));
  controller.stop();
}

DOCTEST_TEST_CASE("stop is idempotent") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  DOCTEST_CHECK_FALSE(controller.stop());

  controller.start(0);
  DOCTEST_CHECK(controller.stop());
  DOCTEST_CHECK_FALSE(controller.stop());
  DOCTEST_CHECK(controller.status() == ServerState::STOPPED);
}

DOCTEST_TEST_CASE("bind conflict fails with BIND_FAILED and leaves the server stopped") {
  sockpp::tcp_acceptor blocker;
  DOCTEST_REQUIRE(blocker.open(sockpp::inet_address(0)).is_ok());
  uint16_t taken = sockpp::inet_address(blocker.address()).port();

  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  std::vector<ServerState> seen;
  controller.on_state_change([&](ServerState, ServerState to) { seen.push_back(to); });

  try {
    controller.start(taken);
    DOCTEST_FAIL("expected ServerError");
  } catch (const ServerError& e) {
    DOCTEST_CHECK(e.code() == ErrorCode::BIND_FAILED);
  }
  DOCTEST_CHECK(controller.status() == ServerState::STOPPED);
  DOCTEST_CHECK(seen == std::vector<ServerState>{ServerState::STARTING, ServerState::STOPPED});

  // a later start on a free port works
  DOCTEST_CHECK_NOTHROW(controller.start(0));
  controller.stop();
}

DOCTEST_TEST_CASE("no network interface fails start") {
  RecordingInjector injector;
  ControllerOptions options;
  options.addresses = [] { return std::vector<std::string>{}; };
  LifecycleController controller(injector, options);

  try {
    controller.start(0);
    DOCTEST_FAIL("expected ServerError");
  } catch (const ServerError& e) {
    DOCTEST_CHECK(e.code() == ErrorCode::NO_NETWORK_INTERFACE);
  }
  DOCTEST_CHECK(controller.status() == ServerState::STOPPED);
}

DOCTEST_TEST_CASE("malformed frames close the session but not the listener") {
  RecordingInjector injector;
  CountingObserver observer;
  LifecycleController controller(injector, loopback_options(), &observer);
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  DOCTEST_REQUIRE(client.pair(d.token).first);

  // two bad frames then a good one resets the count
  DOCTEST_REQUIRE(client.send_frame("\x01\x7f"));
  DOCTEST_REQUIRE(client.send_frame("garbage"));
  DOCTEST_REQUIRE(client.send_event(MoveRelative{1, 2}));
  DOCTEST_REQUIRE(injector.wait_for(1));

  DOCTEST_REQUIRE(client.send_frame("\x01\x7f"));
  DOCTEST_REQUIRE(client.send_frame("\x09"));
  DOCTEST_REQUIRE(client.send_frame(std::string("\x01\x01\x00", 3)));
  DOCTEST_CHECK(client.wait_closed());
  DOCTEST_CHECK(eventually([&] { return !controller.snapshot().session_active; }));
  DOCTEST_CHECK_EQ(observer.malformed.load(), 5);
  {
    std::lock_guard<std::mutex> lock(observer.mutex);
    DOCTEST_CHECK_EQ(observer.last_close_reason, "too many malformed messages");
  }
  DOCTEST_CHECK(injector.calls() == std::vector<std::string>{"move(1,2)"});

  TestClient again;
  DOCTEST_REQUIRE(again.connect(d.port));
  DOCTEST_CHECK(again.pair(d.token).first);
  controller.stop();
}

DOCTEST_TEST_CASE("stop closes an active session") {
  RecordingInjector injector;
  CountingObserver observer;
  LifecycleController controller(injector, loopback_options(), &observer);
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  DOCTEST_REQUIRE(client.pair(d.token).first);
  DOCTEST_REQUIRE(eventually([&] { return controller.snapshot().session_active; }));

  auto begin = std::chrono::steady_clock::now();
  DOCTEST_CHECK(controller.stop());
  DOCTEST_CHECK(std::chrono::steady_clock::now() - begin < 2s);

  DOCTEST_CHECK(client.wait_closed());
  DOCTEST_CHECK_EQ(observer.closed.load(), 1);
  std::lock_guard<std::mutex> lock(observer.mutex);
  DOCTEST_CHECK_EQ(observer.last_close_reason, "closed by server");
}

DOCTEST_TEST_CASE("restart issues a new token and the old one stops working") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ConnectionDescriptor first = controller.start(0);
  ConnectionDescriptor second = controller.restart(0);

  DOCTEST_CHECK_NE(first.token, second.token);
  DOCTEST_CHECK(controller.status() == ServerState::RUNNING);

  TestClient stale;
  DOCTEST_REQUIRE(stale.connect(second.port));
  DOCTEST_CHECK_FALSE(stale.pair(first.token).first);

  TestClient fresh;
  DOCTEST_REQUIRE(fresh.connect(second.port));
  DOCTEST_CHECK(fresh.pair(second.token).first);
  controller.stop();
}

DOCTEST_TEST_CASE("injector failures keep the session open") {
  RecordingInjector injector;
  injector.fail = true;
  LifecycleController controller(injector, loopback_options());
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  DOCTEST_REQUIRE(client.pair(d.token).first);
  DOCTEST_REQUIRE(client.send_event(MoveRelative{1, 1}));
  DOCTEST_REQUIRE(client.send_event(MoveRelative{2, 2}));
  DOCTEST_REQUIRE(injector.wait_for(2));
  DOCTEST_CHECK(controller.snapshot().session_active);
  controller.stop();
}

DOCTEST_TEST_CASE("token trickled in past the pairing deadline is rejected") {
  RecordingInjector injector;
  CountingObserver observer;
  LifecycleController controller(injector, loopback_options(), &observer);
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));

  // one byte every 300 ms: each gap is far below the timeout, the total is not
  std::string frame = encode_frame(d.token);
  std::pair<bool, bool> reply{false, false};
  auto begin = std::chrono::steady_clock::now();
  for (char c : frame) {
    if (!client.send_raw(std::string(1, c))) break;
    reply = client.await_reply(300ms);
    if (reply.second) break;
  }
  if (!reply.second) reply = client.await_reply(3s);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  DOCTEST_CHECK(reply.second);
  DOCTEST_CHECK_FALSE(reply.first);
  DOCTEST_CHECK(elapsed >= PAIRING_TIMEOUT - 500ms);
  DOCTEST_CHECK(elapsed < PAIRING_TIMEOUT + 2s);
  DOCTEST_CHECK_EQ(observer.opened.load(), 0);
  DOCTEST_CHECK(eventually([&] { return observer.rejected.load() == 1; }));
  DOCTEST_CHECK_FALSE(controller.snapshot().session_active);
  controller.stop();
}

DOCTEST_TEST_CASE("token with surrounding whitespace does not pair") {
  RecordingInjector injector;
  CountingObserver observer;
  LifecycleController controller(injector, loopback_options(), &observer);
  ConnectionDescriptor d = controller.start(0);

  for (const std::string& candidate : {d.token + "\n", d.token + " ", " " + d.token, d.token + "\r\n"}) {
    TestClient client;
    DOCTEST_REQUIRE(client.connect(d.port));
    auto reply = client.pair(candidate);
    DOCTEST_CHECK(reply.second);
    DOCTEST_CHECK_FALSE(reply.first);
    DOCTEST_CHECK(client.wait_closed());
  }

  DOCTEST_CHECK_EQ(observer.opened.load(), 0);
  DOCTEST_CHECK(eventually([&] { return observer.rejected.load() == 4; }));
  DOCTEST_CHECK_FALSE(controller.snapshot().session_active);
  controller.stop();
}

DOCTEST_TEST_CASE("connections beyond the pending limit are turned away at once") {
  RecordingInjector injector;
  CountingObserver observer;
  LifecycleController controller(injector, loopback_options(), &observer);
  ConnectionDescriptor d = controller.start(0);

  std::vector<std::unique_ptr<TestClient>> silent;
  for (size_t i = 0; i < MAX_PENDING_PAIRINGS; ++i) {
    silent.push_back(std::make_unique<TestClient>());
    DOCTEST_REQUIRE(silent.back()->connect(d.port));
  }

  TestClient extra;
  DOCTEST_REQUIRE(extra.connect(d.port));
  auto begin = std::chrono::steady_clock::now();
  auto reply = extra.await_reply(3s);
  DOCTEST_CHECK(reply.second);
  DOCTEST_CHECK_FALSE(reply.first);
  DOCTEST_CHECK(std::chrono::steady_clock::now() - begin < PAIRING_TIMEOUT);
  DOCTEST_CHECK(extra.wait_closed());

  // once the silent ones hang up, pairing works again
  for (auto& c : silent) c->close();
  bool paired = eventually([&] {
    TestClient client;
    return client.connect(d.port) && client.pair(d.token, 1000ms).first;
  }, 3000ms);
  DOCTEST_CHECK(paired);
  controller.stop();
}

DOCTEST_TEST_CASE("huge sensitivity saturates instead of wrapping") {
  RecordingInjector injector;
  ControllerOptions options = loopback_options();
  options.sensitivity = 1e9;
  LifecycleController controller(injector, options);
  ConnectionDescriptor d = controller.start(0);

  TestClient client;
  DOCTEST_REQUIRE(client.connect(d.port));
  DOCTEST_REQUIRE(client.pair(d.token).first);
  DOCTEST_REQUIRE(client.send_event(MoveRelative{5, -3}));
  DOCTEST_REQUIRE(injector.wait_for(1));
  DOCTEST_CHECK_EQ(injector.calls()[0], "move(2147483647,-2147483648)");
  controller.stop();
}
