#include "doctest/doctest.h"
#include "mlink/input_injector.hpp"
#include "mlink/uinput_injector.hpp"

#include <linux/input.h>
#include <sstream>

using namespace mlink;

DOCTEST_TEST_CASE("logging injector prints each action") {
  std::ostringstream out;
  LoggingInjector injector(out);

  DOCTEST_CHECK(injector.move_cursor(5, -3));
  DOCTEST_CHECK(injector.click(MouseButton::MIDDLE, PressState::RELEASE));
  DOCTEST_CHECK(injector.key_event("enter", PressState::CLICK));

  std::string text = out.str();
  DOCTEST_CHECK(text.find("[Injector] move 5,-3") != std::string::npos);
  DOCTEST_CHECK(text.find("[Injector] middle button release") != std::string::npos);
  DOCTEST_CHECK(text.find("[Injector] key 'enter' click") != std::string::npos);
}

DOCTEST_TEST_CASE("key names map to evdev codes") {
  DOCTEST_CHECK_EQ(UinputInjector::key_code_for("a"), KEY_A);
  DOCTEST_CHECK_EQ(UinputInjector::key_code_for("A"), KEY_A);
  DOCTEST_CHECK_EQ(UinputInjector::key_code_for("Enter"), KEY_ENTER);
  DOCTEST_CHECK_EQ(UinputInjector::key_code_for("return"), KEY_ENTER);
  DOCTEST_CHECK_EQ(UinputInjector::key_code_for("F12"), KEY_F12);
  DOCTEST_CHECK_EQ(UinputInjector::key_code_for("no-such-key"), -1);
  DOCTEST_CHECK_EQ(UinputInjector::key_code_for(""), -1);
}
