#include "ConsoleMode.hpp"

namespace ptyhost {
ConsoleMode::ConsoleMode(int _fd) : fd(_fd), active(false) {}

ConsoleMode::~ConsoleMode() { teardown(); }

void ConsoleMode::setup() {
  if (active) {
    return;
  }
#ifdef WIN32
  HANDLE h = (HANDLE)_get_osfhandle(fd);
  if (h == INVALID_HANDLE_VALUE || !GetConsoleMode(h, &inputMode)) {
    return;
  }
  SetConsoleMode(h, ENABLE_VIRTUAL_TERMINAL_INPUT);
#else
  if (!isatty(fd)) {
    return;
  }
  if (tcgetattr(fd, &terminalBackup) == -1) {
    LOG(WARNING) << "Cannot read terminal mode: " << strerror(errno);
    return;
  }
  termios terminalLocal;
  memcpy(&terminalLocal, &terminalBackup, sizeof(struct termios));
  cfmakeraw(&terminalLocal);
  FATAL_FAIL(tcsetattr(fd, TCSANOW, &terminalLocal));
#endif
  VLOG(1) << "Switched fd " << fd << " to raw mode";
  active = true;
}

void ConsoleMode::teardown() {
  if (!active) {
    return;
  }
#ifdef WIN32
  SetConsoleMode((HANDLE)_get_osfhandle(fd), inputMode);
#else
  if (tcsetattr(fd, TCSANOW, &terminalBackup) == -1) {
    LOG(WARNING) << "Cannot restore terminal mode: " << strerror(errno);
  }
#endif
  active = false;
}
}  // namespace ptyhost
