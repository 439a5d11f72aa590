#ifndef __PTYHOST_CONSOLE_MODE_HPP__
#define __PTYHOST_CONSOLE_MODE_HPP__

#include "Headers.hpp"

namespace ptyhost {
/**
 * @brief Puts an interactive stdin into raw mode for the life of a session
 * and restores it afterwards.
 *
 * Embedders normally talk to ptyhost over pipes, in which case this does
 * nothing.  It matters when ptyhost is run by hand from a terminal.
 */
class ConsoleMode {
 public:
  explicit ConsoleMode(int _fd);
  virtual ~ConsoleMode();

  /** @brief Switches the descriptor to raw mode if it is a terminal. */
  void setup();

  /** @brief Restores the saved mode.  Does nothing if setup() did nothing. */
  void teardown();

  bool isActive() const { return active; }

 protected:
  int fd;
  bool active;
#ifdef WIN32
  DWORD inputMode;
#else
  termios terminalBackup;
#endif
};
}  // namespace ptyhost

#endif  // __PTYHOST_CONSOLE_MODE_HPP__
