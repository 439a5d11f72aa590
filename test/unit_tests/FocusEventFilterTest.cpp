#include "FocusEventFilter.hpp"
#include "TestHeaders.hpp"

using namespace ptyhost;

TEST_CASE("Focus sequences are removed", "[FocusEventFilter]") {
  REQUIRE(FocusEventFilter::filter("a\x1b[?1004hb\x1b[?1004lc") == "abc");
  REQUIRE(FocusEventFilter::filter("\x1b[I\x1b[O") == "");
  REQUIRE(FocusEventFilter::filter("prompt$ \x1b[Iready") == "prompt$ ready");
}

TEST_CASE("Other output is untouched", "[FocusEventFilter]") {
  REQUIRE(FocusEventFilter::filter("") == "");
  REQUIRE(FocusEventFilter::filter("hello world\r\n") == "hello world\r\n");
  string colors = "\x1b[31mred\x1b[0m\x1b[?25h\x1b[?1049h";
  REQUIRE(FocusEventFilter::filter(colors) == colors);
  // Not a focus report, only a prefix of one
  REQUIRE(FocusEventFilter::filter("\x1b[?100") == "\x1b[?100");
}
