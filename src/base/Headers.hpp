#ifndef __PTYHOST_HEADERS__
#define __PTYHOST_HEADERS__

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#elif defined(_MSC_VER)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <signal.h>
#include <windows.h>
#include <winerror.h>
#else
#include <pty.h>
#include <signal.h>
#endif

#ifdef WIN32
#else
#include <paths.h>
#include <pthread.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "easylogging++.h"
#include "ust.hpp"

#if defined(_MSC_VER)
/* ssize_t is not defined on Windows */
#include <BaseTsd.h>
#define ssize_t SSIZE_T
#endif

using namespace std;
namespace fs = std::filesystem;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() {
#ifdef WIN32
  return (int)GetLastError();
#else
  return errno;
#endif
}

#ifdef WIN32
inline string WinErrnoToString() {
  const int BUFSIZE = 4096;
  char buf[BUFSIZE];
  auto charsWritten = FormatMessageA(
      FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL,
      GetLastError(), MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), buf, BUFSIZE,
      NULL);
  if (charsWritten) {
    string s(buf, charsWritten);
    return s;
  }
  return "Unknown Error";
}

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#define STDIN_FILENO _fileno(stdin)
#define STDOUT_FILENO _fileno(stdout)

#else
#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());
#endif

#ifndef PTYHOST_VERSION
#define PTYHOST_VERSION "unknown"
#endif

namespace ptyhost {
inline int replaceAll(std::string &str, const std::string &from,
                      const std::string &to) {
  if (from.empty()) return 0;
  int retval = 0;
  size_t start_pos = 0;
  while ((start_pos = str.find(from, start_pos)) != std::string::npos) {
    retval++;
    str.replace(start_pos, from.length(), to);
    start_pos += to.length();  // In case 'to' contains 'from', like replacing
                               // 'x' with 'yx'
  }
  return retval;
}

inline string GetTempDirectory() {
#ifdef WIN32
  char buf[MAX_PATH + 1];
  DWORD retval = GetTempPathA(MAX_PATH + 1, buf);
  return string(buf, retval);
#else
  string tmpDir = _PATH_TMP;
  return tmpDir;
#endif
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace ptyhost

#endif  // __PTYHOST_HEADERS__
