#ifndef __PTYHOST_PROCESS_SUPERVISOR_HPP__
#define __PTYHOST_PROCESS_SUPERVISOR_HPP__

#include "Headers.hpp"

namespace ptyhost {
/**
 * @brief Tracks one child process without ever blocking on it.
 */
class ProcessSupervisor {
 public:
#ifdef WIN32
  /** @brief Takes ownership of the process handle. */
  ProcessSupervisor(HANDLE _process, DWORD _pid);
#else
  explicit ProcessSupervisor(pid_t _pid);
#endif
  virtual ~ProcessSupervisor();

  /**
   * @brief Non-blocking liveness check.  Reaps the child the first time it
   * is seen dead and records its exit status.
   */
  bool isAlive();

  /**
   * @brief Asks a live child to terminate.  Does not wait for it.
   */
  void terminate();

  /**
   * @brief Exit status of the reaped child: the exit code, or 128 plus the
   * signal number for a signalled child.  -1 until the child is reaped.
   */
  int exitCode() const { return exitStatus; }

  bool hasExited() const { return exited; }

  int64_t getPid() const { return (int64_t)pid; }

 protected:
#ifdef WIN32
  HANDLE process;
  DWORD pid;
#else
  pid_t pid;
#endif
  bool exited;
  int exitStatus;
};
}  // namespace ptyhost

#endif  // __PTYHOST_PROCESS_SUPERVISOR_HPP__
