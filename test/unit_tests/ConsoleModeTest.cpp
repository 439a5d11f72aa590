#ifndef WIN32
#include "ConsoleMode.hpp"

#include "TestHeaders.hpp"

using namespace ptyhost;

TEST_CASE("Pipes are left alone", "[ConsoleMode]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  {
    ConsoleMode mode(fds[0]);
    mode.setup();
    REQUIRE_FALSE(mode.isActive());
    mode.teardown();
  }
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("Terminals go raw and come back", "[ConsoleMode]") {
  int master, slave;
  REQUIRE(openpty(&master, &slave, NULL, NULL, NULL) == 0);

  termios before;
  REQUIRE(tcgetattr(slave, &before) == 0);
  REQUIRE((before.c_lflag & ICANON) != 0);

  {
    ConsoleMode mode(slave);
    mode.setup();
    REQUIRE(mode.isActive());

    termios raw;
    REQUIRE(tcgetattr(slave, &raw) == 0);
    REQUIRE((raw.c_lflag & ICANON) == 0);
    REQUIRE((raw.c_lflag & ECHO) == 0);
    // The destructor restores the saved mode
  }

  termios after;
  REQUIRE(tcgetattr(slave, &after) == 0);
  REQUIRE(after.c_lflag == before.c_lflag);
  REQUIRE(after.c_iflag == before.c_iflag);

  ::close(slave);
  ::close(master);
}
#endif
