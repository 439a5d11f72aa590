#ifndef __PTYHOST_POSIX_PTY_BACKEND_HPP__
#define __PTYHOST_POSIX_PTY_BACKEND_HPP__

#include "Headers.hpp"
#include "ProcessSupervisor.hpp"
#include "PtyBackend.hpp"

namespace ptyhost {
/**
 * @brief Native pseudo-terminal backend: forkpty(3), TIOCSWINSZ and SIGWINCH.
 */
class PosixPtyBackend : public PtyBackend {
 public:
  PosixPtyBackend();
  virtual ~PosixPtyBackend();

  virtual int64_t allocate(const TerminalSize& size,
                           const vector<string>& command);
  virtual int read(char* buf, int count);
  virtual void write(const string& data);
  virtual int writeSome(const char* buf, int count);
  virtual void resize(const TerminalSize& newSize);
  virtual TerminalSize getSize();
  virtual bool isAlive();
  virtual void terminate();
  virtual void close();
  virtual int getFd() { return masterFd; }
  virtual bool filtersFocusEvents() const { return false; }
  virtual int exitCode();

 protected:
  /**
   * @brief Runs in the forked child: resets signal state and execs the
   * command.  On failure the errno is written to `statusFd`.
   */
  [[noreturn]] static void runChild(const vector<string>& command,
                                    int statusFd);

  /** @brief Master pty descriptor, -1 when closed. */
  int masterFd;
  TerminalSize size;
  unique_ptr<ProcessSupervisor> supervisor;
  /** @brief Serializes resizes and guards `size`. */
  std::mutex resizeMutex;
};
}  // namespace ptyhost

#endif  // __PTYHOST_POSIX_PTY_BACKEND_HPP__
