#include "doctest/doctest.h"
#include "mlink/arg_parser.hpp"
#include "mlink/control_handler.hpp"
#include "mlink/control_server.hpp"
#include "mlink/interactive_cli.hpp"
#include "mlink/lifecycle_controller.hpp"
#include "recording_injector.hpp"

#include <thread>

using namespace mlink;

namespace {

ControllerOptions loopback_options() {
  ControllerOptions options;
  options.advertise_host = "127.0.0.1";
  return options;
}

} // namespace

DOCTEST_TEST_CASE("control handler drives the lifecycle") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ControlHandler handler(controller, 0);

  auto status = handler.execute("status:\n");
  DOCTEST_REQUIRE(status["error"].is_null());
  DOCTEST_CHECK_EQ(status["result"]["state"].get<std::string>(), "STOPPED");
  DOCTEST_CHECK_FALSE(status["result"]["running"].get<bool>());

  auto pairing = handler.execute("pairing:");
  DOCTEST_CHECK_EQ(pairing["code"].get<std::string>(), "NotRunning");

  auto start = handler.execute("start:");
  DOCTEST_REQUIRE(start["error"].is_null());
  auto p = start["result"]["pairing"];
  DOCTEST_CHECK_EQ(p["host"].get<std::string>(), "127.0.0.1");
  DOCTEST_CHECK_NE(p["port"].get<int>(), 0);
  DOCTEST_CHECK_EQ(p["token"].get<std::string>().size(), 22u);
  auto parsed = ConnectionDescriptor::from_payload(p["payload"].get<std::string>());
  DOCTEST_CHECK_EQ(parsed.token, p["token"].get<std::string>());

  status = handler.execute("status:");
  DOCTEST_CHECK_EQ(status["result"]["state"].get<std::string>(), "RUNNING");
  DOCTEST_CHECK_EQ(status["result"]["port"].get<int>(), p["port"].get<int>());
  DOCTEST_CHECK(status["result"]["session"].is_null());

  auto again = handler.execute("start:");
  DOCTEST_CHECK_EQ(again["code"].get<std::string>(), "AlreadyRunning");

  pairing = handler.execute("pairing:");
  DOCTEST_REQUIRE(pairing["error"].is_null());
  DOCTEST_CHECK_EQ(pairing["result"]["token"], p["token"]);

  auto restart = handler.execute("restart:");
  DOCTEST_REQUIRE(restart["error"].is_null());
  DOCTEST_CHECK_NE(restart["result"]["pairing"]["token"], p["token"]);

  auto stop = handler.execute("stop:");
  DOCTEST_CHECK(stop["result"]["was_running"].get<bool>());
  stop = handler.execute("stop:");
  DOCTEST_CHECK(stop["error"].is_null());
  DOCTEST_CHECK_FALSE(stop["result"]["was_running"].get<bool>());
}

DOCTEST_TEST_CASE("control handler reports bad input as errors") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ControlHandler handler(controller, 0);

  DOCTEST_CHECK_FALSE(handler.execute("status")["error"].is_null());
  DOCTEST_CHECK_FALSE(handler.execute("bogus:")["error"].is_null());
  DOCTEST_CHECK_FALSE(handler.execute("start:99999")["error"].is_null());
  DOCTEST_CHECK_FALSE(handler.execute("start:abc")["error"].is_null());
  DOCTEST_CHECK(controller.status() == ServerState::STOPPED);

  auto who = handler.execute("whoami:");
  DOCTEST_CHECK_EQ(who["result"]["version"].get<std::string>(), MLINK_VERSION);
}

DOCTEST_TEST_CASE("control server answers over localhost") {
  RecordingInjector injector;
  LifecycleController controller(injector, loopback_options());
  ControlHandler handler(controller, 0);

  ControlServer server([&handler](const std::string& cmd) { return handler.execute(cmd); }, 0);
  server.open();
  DOCTEST_REQUIRE_NE(server.get_port(), 0);
  std::thread serve([&server] { server.serve(); });

  DaemonClient client("127.0.0.1", server.get_port());
  DOCTEST_CHECK(client.is_daemon_running());

  auto start = client.send_command("start:0");
  DOCTEST_REQUIRE(start != nullptr);
  DOCTEST_CHECK(start["error"].is_null());
  DOCTEST_CHECK(controller.status() == ServerState::RUNNING);

  auto stop = client.send_command("stop:");
  DOCTEST_REQUIRE(stop != nullptr);
  DOCTEST_CHECK(stop["result"]["was_running"].get<bool>());

  server.interrupt();
  serve.join();
  server.stop();

  DOCTEST_CHECK_FALSE(DaemonClient("127.0.0.1", server.get_port()).is_daemon_running());
}

DOCTEST_TEST_CASE("argument parser") {
  const char* argv[] = {"MouseLink", "--daemon", "-p", "24000", "--listen-port", "9000",
                        "--config", "/tmp/c.json", "--start"};
  ParsedArgs args = ArgParser::parse(9, const_cast<char**>(argv));
  DOCTEST_CHECK(args.mode == RunMode::DAEMON);
  DOCTEST_CHECK(args.control_port == std::optional<uint16_t>(24000));
  DOCTEST_CHECK(args.listen_port == std::optional<uint16_t>(9000));
  DOCTEST_CHECK(args.config_path == std::optional<std::string>("/tmp/c.json"));
  DOCTEST_CHECK(args.auto_start);

  const char* bad[] = {"MouseLink", "-i", "--port", "70000"};
  args = ArgParser::parse(4, const_cast<char**>(bad));
  DOCTEST_CHECK(args.mode == RunMode::INTERACTIVE);
  DOCTEST_CHECK_FALSE(args.control_port.has_value());

  DOCTEST_CHECK_FALSE(ArgParser::parse_port("-1").has_value());
  DOCTEST_CHECK_FALSE(ArgParser::parse_port("").has_value());
  DOCTEST_CHECK(ArgParser::parse_port("0") == std::optional<uint16_t>(0));
}
