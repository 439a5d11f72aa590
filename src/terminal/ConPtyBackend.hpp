#ifndef __PTYHOST_CON_PTY_BACKEND_HPP__
#define __PTYHOST_CON_PTY_BACKEND_HPP__

#ifdef WIN32
#include "Headers.hpp"
#include "ProcessSupervisor.hpp"
#include "PtyBackend.hpp"

namespace ptyhost {
/**
 * @brief Windows pseudo console backend (CreatePseudoConsole, Windows 10
 * 1809 and later).
 *
 * Output is only available through blocking ReadFile calls, so getFd()
 * returns -1 and the session runs a dedicated output thread.  ConPTY echoes
 * focus reporting sequences, so output is filtered.
 */
class ConPtyBackend : public PtyBackend {
 public:
  ConPtyBackend();
  virtual ~ConPtyBackend();

  virtual int64_t allocate(const TerminalSize& size,
                           const vector<string>& command);
  virtual int read(char* buf, int count);
  virtual void write(const string& data);
  virtual void resize(const TerminalSize& newSize);
  virtual TerminalSize getSize();
  virtual bool isAlive();
  virtual void terminate();
  virtual void close();
  virtual int getFd() { return -1; }
  virtual bool filtersFocusEvents() const { return true; }
  virtual int exitCode();

  /**
   * @brief Builds a CreateProcess command line, quoting arguments the way
   * CommandLineToArgvW splits them.
   */
  static string buildCommandLine(const vector<string>& command);

 protected:
  /** @brief Closes every handle, including the output read side. */
  void releaseHandles();

  HPCON pseudoConsole;
  /** @brief Our end of the child's input pipe. */
  HANDLE inputWriteSide;
  /** @brief Our end of the child's output pipe. */
  HANDLE outputReadSide;
  TerminalSize size;
  unique_ptr<ProcessSupervisor> supervisor;
  /** @brief Serializes resizes against each other and against close(). */
  std::mutex resizeMutex;
};
}  // namespace ptyhost
#endif

#endif  // __PTYHOST_CON_PTY_BACKEND_HPP__
