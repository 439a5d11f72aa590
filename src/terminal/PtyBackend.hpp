#ifndef __PTYHOST_PTY_BACKEND_HPP__
#define __PTYHOST_PTY_BACKEND_HPP__

#include "Errors.hpp"
#include "Headers.hpp"
#include "TerminalSize.hpp"

namespace ptyhost {
/**
 * @brief A pseudo-terminal pair with a child attached to its subordinate
 * side.  The session only ever talks to the master side through this
 * interface.
 */
class PtyBackend {
 public:
  virtual ~PtyBackend() {}

  /**
   * @brief Creates the pseudo-terminal and spawns `command` on it.
   * @param size Initial window size, applied before the child runs.
   * @param command Program followed by its arguments.
   * @returns The child's process id.
   * @throws AllocationError when the pty or the child cannot be created.
   */
  virtual int64_t allocate(const TerminalSize& size,
                           const vector<string>& command) = 0;

  /**
   * @brief Reads child output from the master side.
   * @returns Bytes read, 0 on end-of-stream, -1 on error with errno set.
   */
  virtual int read(char* buf, int count) = 0;

  /**
   * @brief Writes all of `data` to the master side.
   * @throws std::runtime_error when the master is gone.
   */
  virtual void write(const string& data) = 0;

  /**
   * @brief Writes as much of `buf` as the master takes without blocking.
   * Backends without a pollable master fall back to a blocking write().
   * @returns Bytes written, or -1 with errno set (EAGAIN when full).
   */
  virtual int writeSome(const char* buf, int count) {
    write(string(buf, count));
    return count;
  }

  /**
   * @brief Changes the window size and makes the child observe it.
   * @throws ResizeError on invalid dimensions or after close().
   */
  virtual void resize(const TerminalSize& size) = 0;

  /** @brief Last size successfully applied. */
  virtual TerminalSize getSize() = 0;

  /** @brief Non-blocking liveness check; never throws. */
  virtual bool isAlive() = 0;

  /** @brief Best-effort request for a live child to exit. */
  virtual void terminate() = 0;

  /** @brief Releases the master side.  Safe to call more than once. */
  virtual void close() = 0;

  /**
   * @brief Descriptor that can be passed to select() for child output, or -1
   * when reads are only available as blocking calls.
   */
  virtual int getFd() = 0;

  /** @brief True when child output must go through FocusEventFilter. */
  virtual bool filtersFocusEvents() const = 0;

  /** @brief Exit status of the child once reaped, -1 before that. */
  virtual int exitCode() = 0;
};
}  // namespace ptyhost

#endif  // __PTYHOST_PTY_BACKEND_HPP__
